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

#include "convert/convert_actuator.h"

#include <cstring>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include <urdf2mjcf/u2moptions.h>
#include "util/util_log.h"
#include "xml/xml_document.h"
#include "xml/xml_match.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {
namespace {

// range -> ctrlrange, actuatorfrcrange -> forcelimited + forcerange
void CopyJointLimits(XMLElement* actuator, const XMLElement* joint) {
  if (const char* range = joint->Attribute("range")) {
    actuator->SetAttribute("ctrlrange", range);
  }
  if (const char* force = joint->Attribute("actuatorfrcrange")) {
    actuator->SetAttribute("forcelimited", "true");
    actuator->SetAttribute("forcerange", force);
  }
}

// append <position> or <velocity> actuator; joint may be null
XMLElement* AddActuator(XMLElement* section, const char* kind, const std::string& name,
                        const std::string& joint_name, const XMLElement* joint,
                        const ActuatorGains& gains) {
  AttrList attrs = {{"name", name}, {"joint", joint_name}};
  if (!std::strcmp(kind, "position")) {
    attrs.emplace_back("kp", FormatNumber(gains.kp));
    if (gains.dampratio.has_value()) {
      attrs.emplace_back("dampratio", FormatNumber(*gains.dampratio));
    }
  } else {
    attrs.emplace_back("kv", FormatNumber(gains.kv));
  }

  XMLElement* actuator = InsertEnd(section, kind, attrs);
  if (joint) {
    CopyJointLimits(actuator, joint);
  }
  return actuator;
}

}  // namespace

XMLElement* DeclareExtensionPlugin(Document* doc, const char* plugin,
                                   const std::optional<std::string>& instance) {
  XMLElement* extension = doc->EnsureSection(Section::kExtension);
  for (XMLElement* declared : ChildElements(extension, "plugin")) {
    if (declared->Attribute("plugin", plugin)) {
      return declared;
    }
  }

  XMLElement* elem = InsertEnd(extension, "plugin", {{"plugin", plugin}});
  if (instance.has_value()) {
    InsertEnd(elem, "instance", {{"name", *instance}});
  }
  Info("-> Added '%s' extension plugin.", plugin);
  return elem;
}



int AddActuators(Document* doc, const JointInterfaceMap& joint_map, const MimicMap& mimic,
                 const ConvertOptions& options) {
  XMLElement* worldbody = doc->Find(Section::kWorldbody);
  if (!worldbody) {
    Warning("No <worldbody> found in the model. Cannot add actuators.");
    return 0;
  }
  if (joint_map.empty()) {
    Info("-> No ros2_control joints found; skipping actuator generation.");
    return 0;
  }

  // non-free joints listed in the interface map, in document order
  std::vector<XMLElement*> joints;
  for (XMLElement* joint : FindMatches(worldbody, "joint", {})) {
    const char* name = joint->Attribute("name");
    if (name && !joint->Attribute("type", "free") && joint_map.count(name)) {
      joints.push_back(joint);
    }
  }
  if (joints.empty()) {
    Info("-> No actuatable joints found to create actuators for.");
    return 0;
  }

  XMLElement* section = doc->EnsureSection(Section::kActuator);
  if (options.add_ros_plugins) {
    DeclareExtensionPlugin(doc, kActuatorCommandPlugin, options.ros2_control_instance);
  }

  int count = 0;
  std::vector<std::string> actuated;
  std::vector<std::string> commanded;
  for (const XMLElement* joint : joints) {
    std::string name = joint->Attribute("name");
    const std::set<std::string>& requested = joint_map.at(name);

    std::vector<const char*> kinds;
    for (const char* kind : {"position", "velocity"}) {
      if (requested.count(kind)) {
        kinds.push_back(kind);
      }
    }
    if (kinds.empty()) {
      continue;
    }

    bool suffix = kinds.size() > 1 || options.force_actuator_suffix;
    for (const char* kind : kinds) {
      std::string actuator = suffix ? absl::StrCat(name, "_", kind) : name;
      AddActuator(section, kind, actuator, name, joint, options.actuator_gains);
      Debug("-> Added '%s' actuator for joint: %s", kind, name);
      count++;
    }
    actuated.push_back(name);

    if (options.add_ros_plugins && !mimic.count(name)) {
      InsertEnd(section, "plugin", {{"plugin", kActuatorCommandPlugin},
                                    {"joint", name},
                                    {"instance", options.ros2_control_instance}});
      commanded.push_back(name);
    }
  }

  if (!actuated.empty()) {
    Info("-> Added actuators for joints: %s", absl::StrJoin(actuated, ", "));
  }
  if (!commanded.empty()) {
    Info("-> Added ROS plugin actuators for joints: %s", absl::StrJoin(commanded, ", "));
  }
  return count;
}



int AddMimicPlugins(Document* doc, const MimicMap& mimic, const ActuatorGains& gains) {
  if (mimic.empty()) {
    return 0;
  }

  DeclareExtensionPlugin(doc, kMimicJointPlugin);
  XMLElement* section = doc->EnsureSection(Section::kActuator);

  std::set<std::string> names;
  for (const XMLElement* actuator : ChildElements(section)) {
    if (const char* name = actuator->Attribute("name")) {
      names.insert(name);
    }
  }

  std::vector<std::string> created;
  std::vector<std::string> followers;
  for (const auto& [name, relation] : mimic) {
    // a follower needs a controllable position actuator
    bool has_position = false;
    for (const XMLElement* actuator : ChildElements(section, "position")) {
      has_position = has_position || actuator->Attribute("joint", name.c_str());
    }
    if (!has_position) {
      std::string actuator = names.count(name) ? absl::StrCat(name, "_position") : name;
      std::vector<XMLElement*> joint = FindMatches(doc->Root(), "joint", {{"name", name}});
      AddActuator(section, "position", actuator, name,
                  joint.empty() ? nullptr : joint.front(), gains);
      names.insert(actuator);
      created.push_back(name);
      Debug("-> Added 'position' actuator for mimic joint: '%s'.", name);
    }

    XMLElement* plugin = InsertEnd(section, "plugin", {{"plugin", kMimicJointPlugin},
                                                       {"joint", name}});
    InsertEnd(plugin, "config", {{"key", "mimic_joint"}, {"value", relation.joint}});
    InsertEnd(plugin, "config", {{"key", "gear"}, {"value", relation.multiplier}});

    double offset;
    if (!absl::SimpleAtod(relation.offset, &offset)) {
      Warning("Mimic offset '%s' of joint '%s' is not a number, keeping it as is",
              relation.offset, name);
      InsertEnd(plugin, "config", {{"key", "offset"}, {"value", relation.offset}});
    } else if (offset != 0) {
      InsertEnd(plugin, "config", {{"key", "offset"}, {"value", relation.offset}});
    }
    followers.push_back(name);
  }

  if (!created.empty()) {
    Info("-> Created missing position actuators for mimic joints: %s",
         absl::StrJoin(created, ", "));
  }
  Info("-> Added ROS mimic joint plugins for joints: %s", absl::StrJoin(followers, ", "));
  return static_cast<int>(followers.size());
}

}  // namespace urdf2mjcf
