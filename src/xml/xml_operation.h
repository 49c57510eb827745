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

#ifndef URDF2MJCF_SRC_XML_XML_OPERATION_H_
#define URDF2MJCF_SRC_XML_XML_OPERATION_H_

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "xml/xml_util.h"

namespace urdf2mjcf {

// reserved attribute names carrying operations
inline constexpr char kInjectAttr[] = "inject_attr";          // inject, space separated
inline constexpr char kInjectAttrs[] = "inject_attrs";        // inject, semicolon separated
inline constexpr char kReplaceAttrs[] = "replace_attrs";      // replace or conditional replace
inline constexpr char kInjectChildren[] = "inject_children";  // child injection

// set every attribute, overwriting existing values
struct InjectOp {
  AttrList attrs;
};

// set only attributes that already exist on the target
struct ReplaceOp {
  AttrList attrs;
};

// if every condition holds: remove the condition attributes, then set the replacements
struct ConditionalReplaceOp {
  AttrList conditions;
  AttrList replacements;
};

// copy the annotation's children into every element matching these attributes
struct InjectChildrenOp {
  AttrList match;
};

using Operation = std::variant<InjectOp, ReplaceOp, ConditionalReplaceOp, InjectChildrenOp>;

// "inject", "replace", "conditional_replace", "inject_children"
const char* OperationName(const Operation& op);

bool IsReservedAttribute(std::string_view name);

// Decode repeated `key='value'` or `key:='value'` groups. Keys are runs of
// [A-Za-z0-9_], values are delimited by a matching ' or " and may contain
// separators. Text between groups is ignored. A repeated key keeps its last
// value and logs a warning. Returns nullopt (and logs a warning) if the text
// holds no group.
std::optional<AttrList> ParseAttrString(std::string_view text);

// Split "conditions:replacements" at the first ':' that is outside quotes and
// not part of ":=". Returns nullopt if there is no such separator.
std::optional<std::pair<std::string_view, std::string_view>>
    SplitConditional(std::string_view text);

// Decode the reserved attributes of elem, in the order inject, replace (or
// conditional replace), inject children. Malformed values are dropped with a
// warning. At most one operation of each kind is returned.
std::vector<Operation> ParseOperations(const XMLElement* elem);

// true if elem carries at least one reserved attribute
bool HasOperations(const XMLElement* elem);

// attributes of elem excluding the reserved names
AttrList MatchAttributes(const XMLElement* elem);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_XML_XML_OPERATION_H_
