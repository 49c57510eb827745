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

#ifndef URDF2MJCF_SRC_XML_XML_DOCUMENT_H_
#define URDF2MJCF_SRC_XML_XML_DOCUMENT_H_

#include <array>
#include <string>
#include <string_view>

#include "tinyxml2.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {

// top-level MJCF sections with a cached lookup
enum class Section {
  kCompiler = 0,
  kOption,
  kExtension,
  kAsset,
  kWorldbody,
  kActuator,
  kCount
};

// tag of a canonical section
const char* SectionName(Section section);

// Target MJCF document. Owns the DOM for one conversion run; all changes to
// the list of top-level sections go through InsertCanonical/EnsureSection so
// that the section cache stays valid.
class Document {
 public:
  // parse xml, throw XError if malformed or empty
  explicit Document(std::string_view xml);
  Document(const Document&) = delete;
  Document& operator=(const Document&) = delete;

  XMLElement* Root() { return root_; }
  const XMLElement* Root() const { return root_; }
  tinyxml2::XMLDocument* Doc() { return &doc_; }

  // cached section, nullptr if absent
  XMLElement* Find(Section section) const {
    return sections_[static_cast<int>(section)];
  }

  // first direct child of the root with the given tag, nullptr if absent
  XMLElement* FindSection(std::string_view tag) const;

  // return existing top-level section with this tag, or create it at its
  // canonical insertion point
  XMLElement* EnsureSection(std::string_view tag);
  XMLElement* EnsureSection(Section section) {
    return EnsureSection(SectionName(section));
  }

  // link an unlinked element into the root at the canonical position for its tag:
  //   compiler:   first
  //   option:     after compiler, else first
  //   extension:  after compiler, else before worldbody, else last
  //   actuator:   after worldbody, else last
  //   otherwise:  before worldbody, else last
  XMLElement* InsertCanonical(XMLElement* elem);

  // new unlinked element owned by this document
  XMLElement* NewElement(const char* tag) { return doc_.NewElement(tag); }

  // serialize with declaration and indentation
  std::string Write() const;

 private:
  void InsertBefore(XMLElement* elem, XMLElement* anchor);
  void InsertAfter(XMLElement* elem, XMLElement* anchor);
  void Cache(XMLElement* elem);

  tinyxml2::XMLDocument doc_;
  XMLElement* root_ = nullptr;
  std::array<XMLElement*, static_cast<int>(Section::kCount)> sections_{};
};

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_XML_XML_DOCUMENT_H_
