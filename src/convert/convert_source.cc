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

#include "convert/convert_source.h"

#include <cstddef>
#include <cstring>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

#include <absl/strings/str_join.h>
#include "tinyxml2.h"
#include <urdf2mjcf/u2moptions.h>
#include "convert/convert_actuator.h"
#include "util/util_log.h"
#include "xml/xml_merge.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {
namespace {

using tinyxml2::XMLDocument;

// merge all <mujoco> children of root into a single block inserted first
XMLElement* MergeMujocoBlocks(XMLDocument* urdf, XMLElement* root) {
  std::vector<XMLElement*> blocks = ChildElements(root, "mujoco");
  if (blocks.empty()) {
    Warning("No <mujoco> tag found in URDF. Creating one.");
    XMLElement* block = urdf->NewElement("mujoco");
    root->InsertFirstChild(block);
    return block;
  }

  Info("-> Found %d <mujoco> tags in URDF. Merging them.", blocks.size());
  std::vector<const XMLElement*> fragments(blocks.begin(), blocks.end());
  XMLElement* merged = MergeFragments(fragments, urdf);
  for (XMLElement* block : blocks) {
    root->DeleteChild(block);
  }
  root->InsertFirstChild(merged);
  return merged;
}

// defaults, then the URDF's own compiler attributes, then KEY=VALUE overrides
AttrList CompilerAttributes(const XMLElement* compiler, const ConvertOptions& options) {
  AttrList attrs = {
    {"meshdir", options.mesh_dir},
    {"balanceinertia", "false"},
    {"discardvisual", "false"},
    {"fusestatic", "false"},
    {"inertiafromgeom", "false"},
  };
  for (const auto& [key, value] : GetAttributes(compiler)) {
    SetAttr(attrs, key, value);
  }

  for (const std::string& option : options.compiler_options) {
    std::size_t eq = option.find('=');
    if (eq == std::string::npos || eq == 0) {
      Warning("Malformed compiler option '%s'. Should be in KEY=VALUE format. Skipping.", option);
      continue;
    }
    SetAttr(attrs, option.substr(0, eq), option.substr(eq + 1));
  }
  return attrs;
}

// <mimic> relations of every <joint>, in any depth
void ReadMimicJoints(const XMLElement* elem, MimicMap& mimic) {
  for (const XMLElement* child = elem->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    if (!std::strcmp(child->Name(), "joint")) {
      const XMLElement* relation = child->FirstChildElement("mimic");
      const char* name = child->Attribute("name");
      const char* leader = relation ? relation->Attribute("joint") : nullptr;
      if (name && leader) {
        MimicJoint& joint = mimic[name];
        joint.joint = leader;
        if (const char* multiplier = relation->Attribute("multiplier")) {
          joint.multiplier = multiplier;
        }
        if (const char* offset = relation->Attribute("offset")) {
          joint.offset = offset;
        }
      }
    }
    ReadMimicJoints(child, mimic);
  }
}

// command interfaces of the joints of every <ros2_control> element
void ReadInterfaces(const XMLElement* elem, JointInterfaceMap& interfaces) {
  for (const XMLElement* child = elem->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    if (std::strcmp(child->Name(), "ros2_control")) {
      ReadInterfaces(child, interfaces);
      continue;
    }

    for (const XMLElement* joint : ChildElements(child, "joint")) {
      const char* name = joint->Attribute("name");
      if (!name) {
        continue;
      }

      std::set<std::string> kinds;
      for (const XMLElement* command : ChildElements(joint, "command_interface")) {
        std::string kind = ReadAttrStr(command, "name").value_or(TrimmedText(command));
        if (!kind.empty()) {
          kinds.insert(kind);
        }
      }
      if (!kinds.empty()) {
        interfaces[name].insert(kinds.begin(), kinds.end());
        Debug("-> Joint '%s' has command interfaces: %s", name, absl::StrJoin(kinds, ", "));
      }
    }
  }
}

}  // namespace

SourceModel InspectSource(XMLDocument* urdf, const ConvertOptions& options) {
  XMLElement* root = urdf->RootElement();
  if (!root) {
    throw XError(nullptr, "URDF document has no root element");
  }

  SourceModel model;
  model.store = std::make_unique<XMLDocument>();
  XMLElement* holder = model.store->NewElement("mujoco");
  model.store->InsertEndChild(holder);

  // merged <mujoco> block with a <compiler> child
  XMLElement* block = MergeMujocoBlocks(urdf, root);
  XMLElement* compiler = block->FirstChildElement("compiler");
  if (!compiler) {
    compiler = InsertEnd(block, "compiler");
  }

  // everything but the compiler leaves the block
  std::vector<std::string> tags;
  for (XMLElement* child : ChildElements(block)) {
    if (!std::strcmp(child->Name(), "compiler")) {
      continue;
    }
    XMLElement* copy = AppendCopy(holder, child);
    if (!std::strcmp(child->Name(), "plugin")) {
      model.plugins.push_back(copy);
    } else {
      model.annotations.push_back(copy);
      tags.push_back(child->Name());
    }
    block->DeleteChild(child);
  }
  if (!tags.empty()) {
    Info("-> Found %d custom MuJoCo elements to inject: %s",
         tags.size(), absl::StrJoin(tags, ", "));
  }
  for (const XMLElement* annotation : model.annotations) {
    Debug("   Element %s", FormatElement(annotation));
  }

  model.compiler = CompilerAttributes(compiler, options);
  for (const auto& [key, value] : model.compiler) {
    compiler->SetAttribute(key.c_str(), value.c_str());
  }
  Info("-> Set <compiler> tag attributes to: %s", FormatAttrs(model.compiler));

  ReadMimicJoints(root, model.mimic);
  if (!model.mimic.empty()) {
    std::vector<std::string> names;
    for (const auto& entry : model.mimic) {
      names.push_back(entry.first);
    }
    Info("-> Found mimic joints: %s", absl::StrJoin(names, ", "));
  }

  ReadInterfaces(root, model.interfaces);
  return model;
}

}  // namespace urdf2mjcf
