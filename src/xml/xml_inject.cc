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

#include "xml/xml_inject.h"

#include <algorithm>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_join.h>
#include "util/util_log.h"
#include "xml/xml_apply.h"
#include "xml/xml_document.h"
#include "xml/xml_match.h"
#include "xml/xml_operation.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {
namespace {

std::string ScopeName(const XMLElement* context) {
  return context ? absl::StrCat("within ", context->Name()) : "globally";
}

// copy attributes whose values are literal; wildcard values were patterns
void CopyLiteralAttributes(XMLElement* dst, const AttrList& attrs) {
  for (const auto& [name, value] : attrs) {
    if (!HasWildcard(value)) {
      dst->SetAttribute(name.c_str(), value.c_str());
    }
  }
}

// every attribute present with exactly this value
bool HasAttributes(const XMLElement* elem, const AttrList& attrs) {
  for (const auto& [name, value] : attrs) {
    if (!elem->Attribute(name.c_str(), value.c_str())) {
      return false;
    }
  }
  return true;
}

}  // namespace

bool SubtreeHasOperations(const XMLElement* elem) {
  for (const XMLElement* child = elem->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    if (HasOperations(child) || SubtreeHasOperations(child)) {
      return true;
    }
  }
  return false;
}



//---------------------------------- class Injector ------------------------------------------------

void Injector::Inject(const std::vector<const XMLElement*>& fragments) {
  if (fragments.empty()) {
    Warning("No custom MJCF elements found to inject.");
    return;
  }

  std::vector<std::string> names;
  for (const XMLElement* fragment : fragments) {
    names.push_back(FormatElement(fragment));
  }
  Info("-> Injecting custom MJCF elements: %s", absl::StrJoin(names, ", "));

  for (const XMLElement* fragment : fragments) {
    stats_.fragments++;
    Process(fragment, nullptr);
  }
}



void Injector::Process(const XMLElement* fragment, XMLElement* context) {
  DispatchStep step = Visit(fragment, context);

  if (const auto* consumed = std::get_if<Consumed>(&step)) {
    if (consumed->descend) {
      for (const XMLElement* child = fragment->FirstChildElement(); child;
           child = child->NextSiblingElement()) {
        Process(child, context);
      }
    }
  } else if (const auto* recurse = std::get_if<Recurse>(&step)) {
    for (XMLElement* parent : recurse->parents) {
      for (const XMLElement* child = fragment->FirstChildElement(); child;
           child = child->NextSiblingElement()) {
        if (HasOperations(child) || SubtreeHasOperations(child)) {
          Process(child, parent);
        } else {
          AppendCopy(parent, child);
          stats_.copied++;
          Debug("Injected regular child <%s> into existing <%s>.", child->Name(), parent->Name());
        }
      }
    }
  } else {
    InjectPlain(fragment, context);
  }
}



DispatchStep Injector::Visit(const XMLElement* fragment, XMLElement* context) {
  std::string_view tag = fragment->Name();

  // no operations on this element: children decide
  if (!HasOperations(fragment)) {
    if (!SubtreeHasOperations(fragment)) {
      return Fallback{};
    }

    std::vector<XMLElement*> parents = Resolve(tag, GetAttributes(fragment), context);
    if (parents.empty()) {
      Warning("No matching parent element found for %s %s - cannot apply child operations",
              FormatElement(fragment), ScopeName(context));
      stats_.unmatched++;
    }
    return Recurse{std::move(parents)};
  }

  std::vector<Operation> operations = ParseOperations(fragment);
  if (operations.empty()) {
    Warning("Dropping %s: none of its operations could be parsed", FormatElement(fragment));
    stats_.dropped++;
    return Consumed{true};
  }

  std::vector<std::string> names;
  for (const Operation& op : operations) {
    names.push_back(OperationName(op));
  }
  Debug("Processing %s with operations: [%s]", FormatElement(fragment), absl::StrJoin(names, ", "));

  // inject_children consumes the element entirely
  for (const Operation& op : operations) {
    const auto* inject_children = std::get_if<InjectChildrenOp>(&op);
    if (!inject_children) {
      continue;
    }
    if (operations.size() > 1) {
      Warning("Ignoring other operations on %s: inject_children consumes the element",
              FormatElement(fragment));
    }

    // equality only: inject_children attributes are not patterns
    std::vector<XMLElement*> targets = FindTargets(tag, inject_children->match, context);
    targets.erase(std::remove_if(targets.begin(), targets.end(),
                                 [&](const XMLElement* target) {
                                   return !HasAttributes(target, inject_children->match);
                                 }),
                  targets.end());
    if (targets.empty()) {
      Warning("No matching <%s> elements found with attributes [%s] %s",
              tag, FormatAttrs(inject_children->match), ScopeName(context));
      stats_.unmatched++;
    }
    for (XMLElement* target : targets) {
      Info("Injecting child elements into %s", FormatElement(target));
      ApplyOperation(target, op, fragment);
      stats_.operations++;
    }
    return Consumed{false};
  }

  // attribute operations on every element matching the remaining attributes
  AttrList match = MatchAttributes(fragment);
  std::vector<XMLElement*> targets = FindTargets(tag, match, context);
  if (targets.empty()) {
    bool inject = std::any_of(operations.begin(), operations.end(), [](const Operation& op) {
      return std::holds_alternative<InjectOp>(op);
    });
    if (!inject) {
      Warning("No matching elements found for custom operations pattern <%s %s> %s",
              tag, FormatAttrs(match), ScopeName(context));
      stats_.unmatched++;
      return Consumed{true};
    }

    targets.push_back(Create(tag, match, context));
    Info("No existing element matches <%s %s> %s; created a new one",
         tag, FormatAttrs(match), ScopeName(context));
  }

  for (XMLElement* target : targets) {
    for (const Operation& op : operations) {
      ApplyOperation(target, op, fragment);
      stats_.operations++;
    }
    Debug("Applied custom operations to element: %s", FormatElement(target));
  }
  return Consumed{true};
}



std::vector<XMLElement*> Injector::FindTargets(std::string_view tag, const AttrList& attrs,
                                               XMLElement* context) {
  return FindMatches(context ? context : doc_->Root(), tag, attrs);
}



std::vector<XMLElement*> Injector::Resolve(std::string_view tag, const AttrList& attrs,
                                           XMLElement* context) {
  if (!attrs.empty()) {
    return FindTargets(tag, attrs, context);
  }

  // no attributes: the section with this tag
  std::vector<XMLElement*> targets;
  if (!context) {
    if (XMLElement* section = doc_->FindSection(tag)) {
      targets.push_back(section);
    }
    return targets;
  }

  std::string name(tag);
  if (XMLElement* child = context->FirstChildElement(name.c_str())) {
    targets.push_back(child);
  }
  return targets;
}



XMLElement* Injector::Create(std::string_view tag, const AttrList& attrs, XMLElement* context) {
  std::string name(tag);
  XMLElement* elem;
  if (context) {
    elem = InsertEnd(context, name.c_str());
  } else {
    elem = doc_->InsertCanonical(doc_->NewElement(name.c_str()));
  }

  CopyLiteralAttributes(elem, attrs);
  stats_.created++;
  Debug("Created new <%s> tag in MJCF.", name);
  return elem;
}



void Injector::InjectPlain(const XMLElement* fragment, XMLElement* context) {
  AttrList attrs = GetAttributes(fragment);
  std::vector<XMLElement*> targets = Resolve(fragment->Name(), attrs, context);

  if (targets.empty()) {
    targets.push_back(Create(fragment->Name(), attrs, context));
  }

  for (XMLElement* target : targets) {
    Info("Injecting element %s into existing element: %s",
         FormatElement(fragment), FormatElement(target));
    CopyLiteralAttributes(target, attrs);

    for (const XMLElement* child = fragment->FirstChildElement(); child;
         child = child->NextSiblingElement()) {
      AppendCopy(target, child);
      stats_.copied++;
      Debug("Injected <%s> into existing <%s>.", child->Name(), target->Name());
    }
  }
}

}  // namespace urdf2mjcf
