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

#ifndef URDF2MJCF_SRC_CONVERT_CONVERT_ACTUATOR_H_
#define URDF2MJCF_SRC_CONVERT_CONVERT_ACTUATOR_H_

#include <map>
#include <optional>
#include <set>
#include <string>

#include <urdf2mjcf/u2moptions.h>
#include "xml/xml_document.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {

inline constexpr char kActuatorCommandPlugin[] = "MujocoRosUtils::ActuatorCommand";
inline constexpr char kMimicJointPlugin[] = "MujocoRosUtils::MimicJoint";

// joint name -> requested control interfaces ("position", "velocity", ...)
using JointInterfaceMap = std::map<std::string, std::set<std::string>>;

// follower joint relation; values are written to the output verbatim
struct MimicJoint {
  std::string joint;                 // leader joint
  std::string multiplier = "1.0";
  std::string offset = "0.0";
};

// follower joint name -> relation
using MimicMap = std::map<std::string, MimicJoint>;

// declare plugin under <extension> unless already declared, optionally with an
// <instance name=...>; returns the declaration
XMLElement* DeclareExtensionPlugin(Document* doc, const char* plugin,
                                   const std::optional<std::string>& instance = std::nullopt);

// Create position/velocity actuators for the non-free joints under <worldbody>
// listed in joint_map. Returns the number of actuators created.
int AddActuators(Document* doc, const JointInterfaceMap& joint_map, const MimicMap& mimic,
                 const ConvertOptions& options);

// Declare the mimic joint plugin, make sure every follower joint has a
// position actuator and add one follower plugin per joint. Returns the number
// of follower plugins added.
int AddMimicPlugins(Document* doc, const MimicMap& mimic, const ActuatorGains& gains);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_CONVERT_CONVERT_ACTUATOR_H_
