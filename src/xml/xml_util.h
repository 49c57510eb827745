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

#ifndef URDF2MJCF_SRC_XML_XML_UTIL_H_
#define URDF2MJCF_SRC_XML_XML_UTIL_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "tinyxml2.h"

namespace urdf2mjcf {

using tinyxml2::XMLElement;

// error string copy
void CopyError(char* dst, const char* src, int maxlen);

// XML error info; thrown for conditions that abort a conversion
class [[nodiscard]] XError {
 public:
  explicit XError(const XMLElement* elem = nullptr,
                  std::string_view msg = {},
                  std::string_view str = {});
  ~XError() = default;

  const std::string& message() const { return message_; }

 private:
  std::string message_;
};

// ordered attribute list with unique names
using AttrList = std::vector<std::pair<std::string, std::string>>;

// set name to value, overwriting an existing entry in place
// returns true if an entry with this name already existed
bool SetAttr(AttrList& attrs, std::string_view name, std::string_view value);

// return value of name, or nullopt if absent
std::optional<std::string> FindAttr(const AttrList& attrs, std::string_view name);

// "k1='v1', k2='v2'" for log messages
std::string FormatAttrs(const AttrList& attrs);

// element helpers
AttrList GetAttributes(const XMLElement* elem);
std::string FormatElement(const XMLElement* elem);  // "<tag k1='v1'>"
std::string TrimmedText(const XMLElement* elem);
bool SameAttributes(const XMLElement* a, const XMLElement* b);  // order-insensitive
bool HasChildElements(const XMLElement* elem);
std::vector<XMLElement*> ChildElements(XMLElement* elem, const char* name = nullptr);
std::vector<const XMLElement*> ChildElements(const XMLElement* elem, const char* name = nullptr);

// if attribute is present, return attribute as a string
std::optional<std::string> ReadAttrStr(const XMLElement* elem, const char* attr,
                                       bool required = false);

// deep copy src and append it to parent, return the copy
XMLElement* AppendCopy(XMLElement* parent, const XMLElement* src);

// insert end child with given name, return child
XMLElement* InsertEnd(XMLElement* parent, const char* name);

// insert end child with given name and attributes, return child
XMLElement* InsertEnd(XMLElement* parent, const char* name, const AttrList& attrs);

// shortest decimal form that reads back as the same double, always with a
// decimal point or exponent: 500 -> "500.0", 0.1 -> "0.1"
std::string FormatNumber(double value);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_XML_XML_UTIL_H_
