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

#ifndef URDF2MJCF_SRC_XML_XML_MERGE_H_
#define URDF2MJCF_SRC_XML_XML_MERGE_H_

#include <vector>

#include "tinyxml2.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {

// same tag, same attribute set (in any order) and same trimmed text
bool Equivalent(const XMLElement* a, const XMLElement* b);

// fold the child elements of `from` into `into`: equivalent children are
// merged recursively, all others are deep-copied and appended
void MergeChildren(XMLElement* into, const XMLElement* from);

// Merge fragments sharing a root tag into a new element owned by `owner`.
// The result is not linked into owner's tree. With a single fragment the
// result is a deep copy. Returns nullptr if fragments is empty.
XMLElement* MergeFragments(const std::vector<const XMLElement*>& fragments,
                           tinyxml2::XMLDocument* owner);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_XML_XML_MERGE_H_
