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

#include "xml/xml_document.h"

#include <string>
#include <string_view>

#include "tinyxml2.h"
#include "util/util_log.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {

using tinyxml2::XMLNode;
using tinyxml2::XMLPrinter;

const char* SectionName(Section section) {
  switch (section) {
    case Section::kCompiler:
      return "compiler";
    case Section::kOption:
      return "option";
    case Section::kExtension:
      return "extension";
    case Section::kAsset:
      return "asset";
    case Section::kWorldbody:
      return "worldbody";
    case Section::kActuator:
      return "actuator";
    case Section::kCount:
      break;
  }
  return "";
}



//---------------------------------- class Document ------------------------------------------------

Document::Document(std::string_view xml) {
  if (doc_.Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
    throw XError(nullptr, "could not parse target document", doc_.ErrorStr());
  }

  root_ = doc_.RootElement();
  if (!root_) {
    throw XError(nullptr, "target document has no root element");
  }

  if (!doc_.FirstChild()->ToDeclaration()) {
    doc_.InsertFirstChild(doc_.NewDeclaration());
  }

  // register the first instance of every canonical section
  for (XMLElement* child = root_->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    Cache(child);
  }
}



void Document::Cache(XMLElement* elem) {
  for (int i = 0; i < static_cast<int>(Section::kCount); i++) {
    if (!sections_[i] && std::string_view(SectionName(static_cast<Section>(i))) == elem->Name()) {
      sections_[i] = elem;
      return;
    }
  }
}



XMLElement* Document::FindSection(std::string_view tag) const {
  for (int i = 0; i < static_cast<int>(Section::kCount); i++) {
    if (tag == SectionName(static_cast<Section>(i))) {
      return sections_[i];
    }
  }

  for (XMLElement* child = root_->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    if (tag == child->Name()) {
      return child;
    }
  }
  return nullptr;
}



XMLElement* Document::EnsureSection(std::string_view tag) {
  XMLElement* section = FindSection(tag);
  if (section) {
    return section;
  }

  std::string name(tag);
  section = InsertCanonical(doc_.NewElement(name.c_str()));
  Debug("Created new <%s> section", name);
  return section;
}



XMLElement* Document::InsertCanonical(XMLElement* elem) {
  std::string_view tag = elem->Name();
  XMLElement* compiler = Find(Section::kCompiler);
  XMLElement* worldbody = Find(Section::kWorldbody);

  if (tag == "compiler") {
    root_->InsertFirstChild(elem);
  } else if (tag == "option") {
    if (compiler) {
      InsertAfter(elem, compiler);
    } else {
      root_->InsertFirstChild(elem);
    }
  } else if (tag == "extension") {
    if (compiler) {
      InsertAfter(elem, compiler);
    } else if (worldbody) {
      InsertBefore(elem, worldbody);
    } else {
      root_->InsertEndChild(elem);
    }
  } else if (tag == "actuator") {
    if (worldbody) {
      InsertAfter(elem, worldbody);
    } else {
      root_->InsertEndChild(elem);
    }
  } else if (worldbody) {
    InsertBefore(elem, worldbody);
  } else {
    root_->InsertEndChild(elem);
  }

  Cache(elem);
  return elem;
}



void Document::InsertBefore(XMLElement* elem, XMLElement* anchor) {
  XMLNode* previous = anchor->PreviousSibling();
  if (previous) {
    root_->InsertAfterChild(previous, elem);
  } else {
    root_->InsertFirstChild(elem);
  }
}



void Document::InsertAfter(XMLElement* elem, XMLElement* anchor) {
  root_->InsertAfterChild(anchor, elem);
}



std::string Document::Write() const {
  XMLPrinter printer;
  doc_.Print(&printer);
  return std::string(printer.CStr());
}

}  // namespace urdf2mjcf
