// Copyright 2026 DeepMind Technologies Limited
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "xml/xml_util.h"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>
#include "tinyxml2.h"

namespace urdf2mjcf {

using tinyxml2::XMLAttribute;

// error string copy
void CopyError(char* dst, const char* src, int maxlen) {
  if (dst && maxlen > 0) {
    std::strncpy(dst, src, maxlen);
    dst[maxlen - 1] = 0;
  }
}



//---------------------------------- class XError implementation -----------------------------------

XError::XError(const XMLElement* elem, std::string_view msg, std::string_view str) {
  // construct error message
  message_ = "XML Error";
  if (!msg.empty()) {
    absl::StrAppend(&message_, ": ", msg);
    if (!str.empty()) {
      absl::StrAppend(&message_, " '", str, "'");
    }
  }

  // append element, line numbers
  if (elem) {
    absl::StrAppendFormat(&message_, "\nElement '%s', line %d\n",
                          elem->Name(), elem->GetLineNum());
  }
}



//---------------------------------- attribute lists -----------------------------------------------

bool SetAttr(AttrList& attrs, std::string_view name, std::string_view value) {
  for (auto& [key, val] : attrs) {
    if (key == name) {
      val = std::string(value);
      return true;
    }
  }
  attrs.emplace_back(std::string(name), std::string(value));
  return false;
}



std::optional<std::string> FindAttr(const AttrList& attrs, std::string_view name) {
  for (const auto& [key, value] : attrs) {
    if (key == name) {
      return value;
    }
  }
  return std::nullopt;
}



std::string FormatAttrs(const AttrList& attrs) {
  return absl::StrJoin(attrs, ", ", [](std::string* out, const auto& attr) {
    absl::StrAppend(out, attr.first, "='", attr.second, "'");
  });
}



//---------------------------------- element helpers -----------------------------------------------

AttrList GetAttributes(const XMLElement* elem) {
  AttrList attrs;
  for (const XMLAttribute* a = elem->FirstAttribute(); a; a = a->Next()) {
    attrs.emplace_back(a->Name(), a->Value());
  }
  return attrs;
}



std::string FormatElement(const XMLElement* elem) {
  AttrList attrs = GetAttributes(elem);
  if (attrs.empty()) {
    return absl::StrCat("<", elem->Name(), ">");
  }
  return absl::StrCat("<", elem->Name(), " ", FormatAttrs(attrs), ">");
}



std::string TrimmedText(const XMLElement* elem) {
  const char* text = elem->GetText();
  if (!text) {
    return "";
  }
  return std::string(absl::StripAsciiWhitespace(text));
}



bool SameAttributes(const XMLElement* a, const XMLElement* b) {
  int count = 0;
  for (const XMLAttribute* attr = a->FirstAttribute(); attr; attr = attr->Next()) {
    const char* other = b->Attribute(attr->Name());
    if (!other || std::strcmp(other, attr->Value())) {
      return false;
    }
    count++;
  }

  // names are unique, so equal counts mean equal sets
  for (const XMLAttribute* attr = b->FirstAttribute(); attr; attr = attr->Next()) {
    count--;
  }
  return count == 0;
}



bool HasChildElements(const XMLElement* elem) {
  return elem->FirstChildElement() != nullptr;
}



std::vector<XMLElement*> ChildElements(XMLElement* elem, const char* name) {
  std::vector<XMLElement*> children;
  for (XMLElement* child = elem->FirstChildElement(name); child;
       child = child->NextSiblingElement(name)) {
    children.push_back(child);
  }
  return children;
}



std::vector<const XMLElement*> ChildElements(const XMLElement* elem, const char* name) {
  std::vector<const XMLElement*> children;
  for (const XMLElement* child = elem->FirstChildElement(name); child;
       child = child->NextSiblingElement(name)) {
    children.push_back(child);
  }
  return children;
}



// if attribute is present, return attribute as a string
std::optional<std::string> ReadAttrStr(const XMLElement* elem, const char* attr,
                                       bool required) {
  const char* value = elem->Attribute(attr);
  if (!value) {
    if (required) {
      throw XError(elem, "required attribute missing", attr);
    }
    return std::nullopt;
  }
  return std::string(value);
}



XMLElement* AppendCopy(XMLElement* parent, const XMLElement* src) {
  tinyxml2::XMLNode* copy = src->DeepClone(parent->GetDocument());
  parent->InsertEndChild(copy);
  return copy->ToElement();
}



// insert end child with given name, return child
XMLElement* InsertEnd(XMLElement* parent, const char* name) {
  XMLElement* result = parent->GetDocument()->NewElement(name);
  parent->InsertEndChild(result);

  return result;
}



XMLElement* InsertEnd(XMLElement* parent, const char* name, const AttrList& attrs) {
  XMLElement* result = InsertEnd(parent, name);
  for (const auto& [key, value] : attrs) {
    result->SetAttribute(key.c_str(), value.c_str());
  }
  return result;
}



std::string FormatNumber(double value) {
  if (std::isnan(value)) {
    return "nan";
  }
  if (std::isinf(value)) {
    return value > 0 ? "inf" : "-inf";
  }

  // fewest significant digits that read back exactly
  int precision = 1;
  std::string digits = absl::StrFormat("%.0e", value);
  for (; precision < 17; precision++) {
    double readback;
    if (absl::SimpleAtod(digits, &readback) && readback == value) {
      break;
    }
    digits = absl::StrFormat("%.*e", precision, value);
  }

  // decimal exponent of the leading digit
  int exponent = 0;
  if (!absl::SimpleAtoi(digits.substr(digits.find('e') + 1), &exponent)) {
    return digits;
  }

  // positional notation unless the exponent is outside [-4, 16)
  if (exponent < -4 || exponent >= 16) {
    return absl::StrFormat("%.*g", precision, value);
  }
  std::string text = absl::StrFormat("%.*f", std::max(precision - 1 - exponent, 0), value);
  if (text.find('.') == std::string::npos) {
    text += ".0";
  }
  return text;
}

}  // namespace urdf2mjcf
