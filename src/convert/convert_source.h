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

#ifndef URDF2MJCF_SRC_CONVERT_CONVERT_SOURCE_H_
#define URDF2MJCF_SRC_CONVERT_CONVERT_SOURCE_H_

#include <memory>
#include <vector>

#include "tinyxml2.h"
#include <urdf2mjcf/u2moptions.h>
#include "convert/convert_actuator.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {

// what a conversion needs from the source URDF
struct SourceModel {
  // owns the elements below, detached from the URDF
  std::unique_ptr<tinyxml2::XMLDocument> store;

  std::vector<const XMLElement*> annotations;   // children of <mujoco> to inject
  std::vector<const XMLElement*> plugins;       // URDF-style <plugin> children of <mujoco>
  AttrList compiler;                            // final <compiler> attributes
  MimicMap mimic;
  JointInterfaceMap interfaces;
};

// Merge the <mujoco> blocks of the robot into one block placed first, set the
// final compiler attributes on its <compiler> child and move every other child
// out of the block. The URDF is left ready for import by the physics compiler.
// Throws XError if the document has no root element.
SourceModel InspectSource(tinyxml2::XMLDocument* urdf, const ConvertOptions& options);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_CONVERT_CONVERT_SOURCE_H_
