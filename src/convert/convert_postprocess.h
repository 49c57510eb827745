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

#ifndef URDF2MJCF_SRC_CONVERT_CONVERT_POSTPROCESS_H_
#define URDF2MJCF_SRC_CONVERT_CONVERT_POSTPROCESS_H_

#include <optional>
#include <string>

#include "xml/xml_document.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {

// Passes over the compiled MJCF document. A pass that cannot do its work
// logs a warning and leaves the document unchanged.

// multiply the damping of every joint by factor
void ScaleJointDamping(Document* doc, double factor);

// URDF-style <plugin filename=... name=...> with one child per parameter
// becomes <extension><plugin plugin=...><instance name=...><config .../>
void AddCustomPlugin(Document* doc, const XMLElement* urdf_plugin);

// set compiler attributes on the <compiler> section, created first if missing
void ApplyCompilerOptions(Document* doc, const AttrList& attrs);

// default light above the origin
void AddLight(Document* doc);

// checker floor plane with its texture and material; no-op if a geom named
// "floor" exists
void AddFloor(Document* doc);

// MujocoRosUtils plugins
void AddClockPublisher(Document* doc);
void AddRos2Control(Document* doc, const std::string& instance,
                    const std::optional<std::string>& config_file);

// move MujocoRosUtils::* extension plugins after all other extension plugins,
// keeping their relative order
void GroupRosUtilsPlugins(Document* doc);

// free joint on the first body of worldbody, positioned at height if unset
void MakeBaseFloating(Document* doc, double height);

// gravcomp="1" on every body
void EnableGravityCompensation(Document* doc);

// armature on every joint
void SetJointArmature(Document* doc, double armature);

// solver and integrator on the <option> section, created after <compiler>
void SetSimulationOptions(Document* doc, const std::optional<std::string>& solver,
                          const std::optional<std::string>& integrator);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_CONVERT_CONVERT_POSTPROCESS_H_
