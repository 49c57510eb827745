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

#ifndef URDF2MJCF_SRC_XML_XML_MATCH_H_
#define URDF2MJCF_SRC_XML_XML_MATCH_H_

#include <string_view>
#include <vector>

#include "xml/xml_util.h"

namespace urdf2mjcf {

// true if the pattern contains the wildcard glyph '*'
bool HasWildcard(std::string_view pattern);

// shell-style match of value against pattern ('*', '?', '[seq]'), case-sensitive
bool Glob(const char* value, const char* pattern);

// exact comparison for literal patterns, glob comparison for wildcard patterns
bool MatchValue(const char* value, const std::string& pattern);

// true if elem has the given tag and satisfies every constraint
bool MatchElement(const XMLElement* elem, std::string_view tag, const AttrList& constraints);

// All descendants of context (not context itself), in document order, whose
// tag is `tag` and whose attributes satisfy every constraint. An empty
// constraint list matches every element with the tag. No match is not an error.
std::vector<XMLElement*> FindMatches(XMLElement* context, std::string_view tag,
                                     const AttrList& constraints);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_XML_XML_MATCH_H_
