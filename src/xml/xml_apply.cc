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

#include "xml/xml_apply.h"

#include <string>
#include <variant>
#include <vector>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include "util/util_log.h"
#include "xml/xml_operation.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {
namespace {

// applies one alternative of Operation to a target
class Applier {
 public:
  Applier(XMLElement* target, const XMLElement* annotation)
      : target_(target), annotation_(annotation) {}

  ApplyResult operator()(const InjectOp& op) {
    ApplyResult result;
    for (const auto& [name, value] : op.attrs) {
      const char* old = target_->Attribute(name.c_str());
      if (old) {
        Debug("Injected attribute %s='%s' (overwrote '%s') into <%s>",
              name, value, old, target_->Name());
      } else {
        Debug("Injected attribute %s='%s' into <%s>", name, value, target_->Name());
      }
      target_->SetAttribute(name.c_str(), value.c_str());
      result.set++;
    }
    return result;
  }

  ApplyResult operator()(const ReplaceOp& op) {
    ApplyResult result;
    for (const auto& [name, value] : op.attrs) {
      const char* old = target_->Attribute(name.c_str());
      if (!old) {
        Warning("Cannot replace non-existent attribute '%s' in <%s>. "
                "Use inject_attr(s) to add new attributes.", name, target_->Name());
        result.skipped++;
        continue;
      }
      Debug("Replaced attribute %s='%s' with '%s' in <%s>", name, old, value, target_->Name());
      target_->SetAttribute(name.c_str(), value.c_str());
      result.set++;
    }
    return result;
  }

  ApplyResult operator()(const ConditionalReplaceOp& op) {
    ApplyResult result;

    // every condition must hold before anything changes
    for (const auto& [name, value] : op.conditions) {
      const char* current = target_->Attribute(name.c_str());
      if (!current || value != current) {
        Debug("Conditional replacement conditions not met for <%s>", target_->Name());
        result.matched = false;
        return result;
      }
    }

    std::vector<std::string> changes;
    for (const auto& condition : op.conditions) {
      const char* old = target_->Attribute(condition.first.c_str());
      if (old) {
        changes.push_back(absl::StrCat("removed ", condition.first, "='", old, "'"));
        target_->DeleteAttribute(condition.first.c_str());
        result.removed++;
      }
    }
    for (const auto& [name, value] : op.replacements) {
      const char* old = target_->Attribute(name.c_str());
      if (old) {
        changes.push_back(absl::StrCat("set ", name, "='", value, "' (overwrote '", old, "')"));
      } else {
        changes.push_back(absl::StrCat("set ", name, "='", value, "'"));
      }
      target_->SetAttribute(name.c_str(), value.c_str());
      result.set++;
    }

    Debug("Conditional replacement applied to <%s>: %s",
          target_->Name(), absl::StrJoin(changes, ", "));
    return result;
  }

  // targets were resolved from the op's match attributes by the caller
  ApplyResult operator()(const InjectChildrenOp&) {
    ApplyResult result;
    if (!annotation_) {
      Warning("inject_children on <%s> has no template element", target_->Name());
      return result;
    }

    for (const XMLElement* child = annotation_->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
      XMLElement* copy = AppendCopy(target_, child);
      Confirm("  -> Injected %s into matching <%s>", FormatElement(copy), target_->Name());
      result.children++;
    }
    return result;
  }

 private:
  XMLElement* target_;
  const XMLElement* annotation_;
};

}  // namespace

ApplyResult ApplyOperation(XMLElement* target, const Operation& op,
                           const XMLElement* annotation) {
  return std::visit(Applier(target, annotation), op);
}

}  // namespace urdf2mjcf
