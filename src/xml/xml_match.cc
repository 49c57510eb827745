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

#include "xml/xml_match.h"

#include <fnmatch.h>

#include <string>
#include <string_view>
#include <vector>

#include <absl/strings/str_cat.h>
#include "util/util_log.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {
namespace {

void Collect(XMLElement* elem, std::string_view tag, const AttrList& constraints,
             std::vector<XMLElement*>& matches) {
  for (XMLElement* child = elem->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    if (MatchElement(child, tag, constraints)) {
      matches.push_back(child);
    }
    Collect(child, tag, constraints, matches);
  }
}

}  // namespace

bool HasWildcard(std::string_view pattern) {
  return pattern.find('*') != std::string_view::npos;
}



bool Glob(const char* value, const char* pattern) {
  // backslash is an ordinary character in attribute patterns
  return fnmatch(pattern, value, FNM_NOESCAPE) == 0;
}



bool MatchValue(const char* value, const std::string& pattern) {
  if (HasWildcard(pattern)) {
    return Glob(value, pattern.c_str());
  }
  return pattern == value;
}



bool MatchElement(const XMLElement* elem, std::string_view tag, const AttrList& constraints) {
  if (tag != elem->Name()) {
    return false;
  }

  for (const auto& [name, pattern] : constraints) {
    const char* value = elem->Attribute(name.c_str());
    if (!value || !MatchValue(value, pattern)) {
      return false;
    }
  }
  return true;
}



std::vector<XMLElement*> FindMatches(XMLElement* context, std::string_view tag,
                                     const AttrList& constraints) {
  std::vector<XMLElement*> matches;
  Collect(context, tag, constraints, matches);

  bool wildcard = false;
  for (const auto& constraint : constraints) {
    wildcard = wildcard || HasWildcard(constraint.second);
  }

  std::string pattern = constraints.empty() ?
      std::string(tag) : absl::StrCat(tag, " ", FormatAttrs(constraints));
  if (!wildcard) {
    Debug("Found %d matching elements for pattern <%s>", matches.size(), pattern);
  } else if (matches.empty()) {
    Warning("No matching elements found for pattern <%s>", pattern);
  } else {
    for (const XMLElement* match : matches) {
      Debug("Matched pattern <%s> with wildcard found: %s", pattern, FormatElement(match));
    }
    Info("Found %d matching elements for pattern <%s>", matches.size(), pattern);
  }

  return matches;
}

}  // namespace urdf2mjcf
