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

#ifndef URDF2MJCF_SRC_XML_XML_INJECT_H_
#define URDF2MJCF_SRC_XML_XML_INJECT_H_

#include <string_view>
#include <variant>
#include <vector>

#include "xml/xml_document.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {

//---------------------------------- dispatch steps ------------------------------------------------

// the fragment's operations were applied; if descend is set, its children are
// processed next with the same context
struct Consumed {
  bool descend = true;
};

// the fragment only locates parents for its children
struct Recurse {
  std::vector<XMLElement*> parents;
};

// no operations in the subtree: standard injection of the whole fragment
struct Fallback {};

using DispatchStep = std::variant<Consumed, Recurse, Fallback>;

// true if any descendant of elem (not elem itself) carries operations
bool SubtreeHasOperations(const XMLElement* elem);

struct InjectStats {
  int fragments = 0;          // top-level fragments processed
  int operations = 0;         // operations applied, counted per target
  int created = 0;            // elements created because nothing matched
  int copied = 0;             // child elements deep-copied into the target
  int unmatched = 0;          // patterns that matched nothing
  int dropped = 0;            // annotations whose operations could not be parsed
};

// Applies annotation fragments to a target document. Fragments are read-only;
// the document is mutated in place, so fragments are order-sensitive.
class Injector {
 public:
  explicit Injector(Document* doc) : doc_(doc) {}

  // process top-level fragments in order
  void Inject(const std::vector<const XMLElement*>& fragments);

  // process one fragment; context limits matching to its subtree, global if null
  void Process(const XMLElement* fragment, XMLElement* context = nullptr);

  // one recursion step: apply the fragment's own operations, or decide how its
  // children should be handled
  DispatchStep Visit(const XMLElement* fragment, XMLElement* context);

  const InjectStats& stats() const { return stats_; }

 private:
  // targets of a fragment's operations: every element with this tag in the
  // subtree of context (root if null) satisfying the attribute patterns
  std::vector<XMLElement*> FindTargets(std::string_view tag, const AttrList& attrs,
                                       XMLElement* context);

  // elements a structural fragment extends: as FindTargets, except that
  // without attributes it is the first direct child with that tag
  std::vector<XMLElement*> Resolve(std::string_view tag, const AttrList& attrs,
                                   XMLElement* context);

  // new element for an unmatched pattern: in context, or at the canonical
  // insertion point of the root
  XMLElement* Create(std::string_view tag, const AttrList& attrs, XMLElement* context);

  // standard injection of a fragment without operations
  void InjectPlain(const XMLElement* fragment, XMLElement* context);

  Document* doc_;
  InjectStats stats_;
};

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_XML_XML_INJECT_H_
