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

#include "convert/convert_postprocess.h"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <absl/strings/match.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include "convert/convert_actuator.h"
#include "util/util_log.h"
#include "xml/xml_document.h"
#include "xml/xml_match.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {
namespace {

constexpr char kClockPublisherPlugin[] = "MujocoRosUtils::ClockPublisher";
constexpr char kRos2ControlPlugin[] = "MujocoRosUtils::Ros2Control";
constexpr std::string_view kRosUtilsPrefix = "MujocoRosUtils::";

// worldbody, or warning naming the pass that needed it
XMLElement* RequireWorldbody(Document* doc, std::string_view what) {
  XMLElement* worldbody = doc->Find(Section::kWorldbody);
  if (!worldbody) {
    Warning("No <worldbody> found in the model. Cannot %s.", what);
  }
  return worldbody;
}

}  // namespace

void ScaleJointDamping(Document* doc, double factor) {
  for (XMLElement* joint : FindMatches(doc->Root(), "joint", {})) {
    const char* damping = joint->Attribute("damping");
    if (!damping) {
      continue;
    }

    double value;
    if (!absl::SimpleAtod(damping, &value)) {
      Warning("Joint damping '%s' is not a number, leaving it unchanged", damping);
      continue;
    }
    joint->SetAttribute("damping", FormatNumber(value * factor).c_str());
  }
  Info("-> Multiplied joint damping by a factor of %s.", FormatNumber(factor));
}



void AddCustomPlugin(Document* doc, const XMLElement* urdf_plugin) {
  const char* filename = urdf_plugin->Attribute("filename");
  if (!filename || !filename[0]) {
    Warning("Skipping custom <plugin> tag with no 'filename' attribute.");
    return;
  }
  const char* name = urdf_plugin->Attribute("name");

  XMLElement* extension = doc->EnsureSection(Section::kExtension);
  XMLElement* plugin = InsertEnd(extension, "plugin", {{"plugin", filename}});
  XMLElement* instance = InsertEnd(plugin, "instance", {{"name", name ? name : filename}});

  int count = 0;
  for (const XMLElement* param : ChildElements(urdf_plugin)) {
    std::string value = TrimmedText(param);
    if (value.empty()) {
      Warning("Empty value for plugin parameter '%s'. Skipping this parameter.", param->Name());
      continue;
    }
    InsertEnd(instance, "config", {{"key", param->Name()}, {"value", value}});
    count++;
  }

  if (count) {
    Info("-> Transformed and added custom plugin '%s' with %d parameters.", filename, count);
  } else {
    Info("-> Transformed and added custom plugin '%s'.", filename);
  }
}



void ApplyCompilerOptions(Document* doc, const AttrList& attrs) {
  XMLElement* compiler = doc->EnsureSection(Section::kCompiler);
  for (const auto& [key, value] : attrs) {
    compiler->SetAttribute(key.c_str(), value.c_str());
  }
  Info("-> Applied post-processing to <compiler> tag with attributes: %s", FormatAttrs(attrs));
}



void AddLight(Document* doc) {
  XMLElement* worldbody = RequireWorldbody(doc, "add a light");
  if (!worldbody) {
    return;
  }

  InsertEnd(worldbody, "light", {{"diffuse", ".8 .8 .8"}, {"pos", "0 0 5"}, {"dir", "0 0 -1"}});
  Info("-> Added a default light to the model.");
}



void AddFloor(Document* doc) {
  if (!FindMatches(doc->Root(), "geom", {{"name", "floor"}}).empty()) {
    Info("-> Floor plane already exists in the model; skipping addition.");
    return;
  }
  XMLElement* worldbody = RequireWorldbody(doc, "add a floor");
  if (!worldbody) {
    return;
  }

  XMLElement* asset = doc->EnsureSection(Section::kAsset);
  InsertEnd(asset, "texture", {
    {"name", "floor"},
    {"type", "2d"},
    {"builtin", "checker"},
    {"rgb1", "0.1 0.2 0.3"},
    {"rgb2", "0.2 0.3 0.4"},
    {"width", "300"},
    {"height", "300"},
    {"mark", "edge"},
    {"markrgb", "0.2 0.3 0.4"},
  });
  InsertEnd(asset, "material", {
    {"name", "floor"},
    {"texture", "floor"},
    {"texrepeat", "10 10"},
    {"texuniform", "true"},
  });
  InsertEnd(worldbody, "geom", {
    {"name", "floor"},
    {"type", "plane"},
    {"size", "20 20 0.1"},
    {"material", "floor"},
  });
  Info("-> Added a floor plane to the model.");
}



void AddClockPublisher(Document* doc) {
  DeclareExtensionPlugin(doc, kClockPublisherPlugin);
  XMLElement* worldbody = RequireWorldbody(doc, "add clock publisher plugin");
  if (!worldbody) {
    return;
  }

  XMLElement* plugin = InsertEnd(worldbody, "plugin", {{"plugin", kClockPublisherPlugin}});
  InsertEnd(plugin, "config", {{"key", "topic_name"}, {"value", "/clock"}});
  InsertEnd(plugin, "config", {{"key", "publish_rate"}, {"value", "100"}});
  InsertEnd(plugin, "config", {{"key", "use_sim_time"}, {"value", "true"}});
  Info("-> Added '%s' plugin to the model.", kClockPublisherPlugin);
}



void AddRos2Control(Document* doc, const std::string& instance,
                    const std::optional<std::string>& config_file) {
  XMLElement* plugin = DeclareExtensionPlugin(doc, kRos2ControlPlugin);
  XMLElement* node = nullptr;
  for (XMLElement* existing : ChildElements(plugin, "instance")) {
    if (existing->Attribute("name", instance.c_str())) {
      node = existing;
    }
  }
  if (!node) {
    node = InsertEnd(plugin, "instance", {{"name", instance}});
  }

  if (config_file.has_value()) {
    InsertEnd(node, "config", {{"key", "config_file"}, {"value", *config_file}});
  } else {
    Warning("Adding ROS2 control WITHOUT a config file! Ros2Control plugin will use "
            "default config file and it may not work as expected.");
  }
  Info("-> Added '%s' plugin to the model.", kRos2ControlPlugin);
}



void GroupRosUtilsPlugins(Document* doc) {
  XMLElement* extension = doc->Find(Section::kExtension);
  if (!extension) {
    return;
  }

  std::vector<XMLElement*> plugins;
  for (XMLElement* plugin : ChildElements(extension, "plugin")) {
    const char* name = plugin->Attribute("plugin");
    if (name && absl::StartsWith(name, kRosUtilsPrefix)) {
      plugins.push_back(plugin);
    }
  }

  // re-inserting a linked node moves it
  for (XMLElement* plugin : plugins) {
    extension->InsertEndChild(plugin);
  }
}



void MakeBaseFloating(Document* doc, double height) {
  XMLElement* worldbody = RequireWorldbody(doc, "make the base floating");
  if (!worldbody) {
    return;
  }
  XMLElement* base = worldbody->FirstChildElement("body");
  if (!base) {
    Warning("No base body found in <worldbody>. Cannot make the base floating.");
    return;
  }

  bool floating = false;
  for (const XMLElement* joint : ChildElements(base, "joint")) {
    floating = floating || joint->Attribute("type", "free");
  }
  if (!floating) {
    InsertEnd(base, "joint", {{"name", "root"}, {"type", "free"}});
    Info("-> Made the base link '%s' floating with a free joint.",
         base->Attribute("name") ? base->Attribute("name") : "");
  }

  if (!base->Attribute("pos")) {
    base->SetAttribute("pos", absl::StrCat("0 0 ", FormatNumber(height)).c_str());
  }
}



void EnableGravityCompensation(Document* doc) {
  XMLElement* worldbody = RequireWorldbody(doc, "enable gravity compensation");
  if (!worldbody) {
    return;
  }

  std::vector<XMLElement*> bodies = FindMatches(worldbody, "body", {});
  for (XMLElement* body : bodies) {
    body->SetAttribute("gravcomp", "1");
  }
  Info("-> Enabled gravity compensation for %d bodies.", bodies.size());
}



void SetJointArmature(Document* doc, double armature) {
  XMLElement* worldbody = RequireWorldbody(doc, "set joint armature");
  if (!worldbody) {
    return;
  }

  std::string value = FormatNumber(armature);
  std::vector<XMLElement*> joints = FindMatches(worldbody, "joint", {});
  for (XMLElement* joint : joints) {
    joint->SetAttribute("armature", value.c_str());
  }
  Info("-> Set armature to '%s' for %d joints.", value, joints.size());
}



void SetSimulationOptions(Document* doc, const std::optional<std::string>& solver,
                          const std::optional<std::string>& integrator) {
  if (!solver.has_value() && !integrator.has_value()) {
    return;
  }

  XMLElement* option = doc->EnsureSection(Section::kOption);
  std::vector<std::string> changes;
  if (solver.has_value()) {
    option->SetAttribute("solver", solver->c_str());
    changes.push_back(absl::StrCat("solver='", *solver, "'"));
  }
  if (integrator.has_value()) {
    option->SetAttribute("integrator", integrator->c_str());
    changes.push_back(absl::StrCat("integrator='", *integrator, "'"));
  }
  Info("-> Set simulation options: %s", absl::StrJoin(changes, ", "));
}

}  // namespace urdf2mjcf
