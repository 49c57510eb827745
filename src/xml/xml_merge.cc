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

#include "xml/xml_merge.h"

#include <cstring>
#include <vector>

#include "tinyxml2.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {

bool Equivalent(const XMLElement* a, const XMLElement* b) {
  return !std::strcmp(a->Name(), b->Name()) &&
         SameAttributes(a, b) &&
         TrimmedText(a) == TrimmedText(b);
}



void MergeChildren(XMLElement* into, const XMLElement* from) {
  for (const XMLElement* child = from->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    // find equivalent child among the accumulated ones
    XMLElement* equivalent = into->FirstChildElement();
    while (equivalent && !Equivalent(equivalent, child)) {
      equivalent = equivalent->NextSiblingElement();
    }

    if (!equivalent) {
      AppendCopy(into, child);
    } else if (HasChildElements(equivalent) || HasChildElements(child)) {
      MergeChildren(equivalent, child);
    }
  }
}



XMLElement* MergeFragments(const std::vector<const XMLElement*>& fragments,
                           tinyxml2::XMLDocument* owner) {
  if (fragments.empty()) {
    return nullptr;
  }

  XMLElement* merged = fragments[0]->DeepClone(owner)->ToElement();
  for (int i = 1; i < static_cast<int>(fragments.size()); i++) {
    MergeChildren(merged, fragments[i]);
  }
  return merged;
}

}  // namespace urdf2mjcf
