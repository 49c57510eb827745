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

#ifndef URDF2MJCF_SRC_XML_XML_APPLY_H_
#define URDF2MJCF_SRC_XML_XML_APPLY_H_

#include "xml/xml_operation.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {

// what one operation changed on one target
struct ApplyResult {
  int set = 0;            // attributes written
  int removed = 0;        // attributes deleted (conditional replace)
  int skipped = 0;        // replace attributes absent on the target
  int children = 0;       // child elements appended (inject children)
  bool matched = true;    // false if conditional replace conditions failed
};

// Apply op to target. `annotation` is the element that declared the
// operation; InjectChildren appends deep copies of its child elements.
// Children are appended on every call: applying the same annotation twice
// injects its children twice.
ApplyResult ApplyOperation(XMLElement* target, const Operation& op,
                           const XMLElement* annotation = nullptr);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_XML_XML_APPLY_H_
