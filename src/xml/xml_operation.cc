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

#include "xml/xml_operation.h"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include <absl/strings/ascii.h>
#include "util/util_log.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {
namespace {

bool IsKeyChar(char c) {
  return absl::ascii_isalnum(static_cast<unsigned char>(c)) || c == '_';
}

bool IsQuote(char c) {
  return c == '\'' || c == '"';
}

// one key/value group of an attribute string
struct Group {
  std::string_view key;
  std::string_view value;
};

// Read a group whose key starts at `pos`. On success return the group and set
// *next past the closing quote; otherwise set *next past the key.
std::optional<Group> ReadGroup(std::string_view text, std::size_t pos, std::size_t* next) {
  std::size_t n = text.size();
  std::size_t key_end = pos;
  while (key_end < n && IsKeyChar(text[key_end])) {
    key_end++;
  }
  *next = key_end;

  // assignment: '=' or ':='
  std::size_t p = key_end;
  if (p < n && text[p] == ':') {
    p++;
  }
  if (p + 1 >= n || text[p] != '=' || !IsQuote(text[p + 1])) {
    return std::nullopt;
  }

  // quoted value, up to the next identical quote
  char quote = text[p + 1];
  std::size_t open = p + 2;
  std::size_t close = text.find(quote, open);
  if (close == std::string_view::npos) {
    return std::nullopt;
  }

  *next = close + 1;
  return Group{text.substr(pos, key_end - pos), text.substr(open, close - open)};
}

std::optional<AttrList> ParseReserved(const XMLElement* elem, const char* name) {
  const char* value = elem->Attribute(name);
  if (!value || !value[0]) {
    return std::nullopt;
  }
  return ParseAttrString(value);
}

}  // namespace

const char* OperationName(const Operation& op) {
  if (std::holds_alternative<InjectOp>(op)) {
    return "inject";
  } else if (std::holds_alternative<ReplaceOp>(op)) {
    return "replace";
  } else if (std::holds_alternative<ConditionalReplaceOp>(op)) {
    return "conditional_replace";
  }
  return "inject_children";
}



bool IsReservedAttribute(std::string_view name) {
  return name == kInjectAttr || name == kInjectAttrs ||
         name == kReplaceAttrs || name == kInjectChildren;
}



std::optional<AttrList> ParseAttrString(std::string_view text) {
  AttrList attrs;

  std::size_t pos = 0;
  while (pos < text.size()) {
    if (!IsKeyChar(text[pos])) {
      pos++;
      continue;
    }

    std::size_t next;
    std::optional<Group> group = ReadGroup(text, pos, &next);
    if (group.has_value() && SetAttr(attrs, group->key, group->value)) {
      Warning("Duplicate attribute '%s' found in '%s'. Using last value: '%s'",
              group->key, text, group->value);
    }
    pos = next;
  }

  if (attrs.empty()) {
    Warning("Could not parse attribute string: '%s'. Expected format like "
            "key1='value1' key2='value2' or key:='value'", text);
    return std::nullopt;
  }
  return attrs;
}



std::optional<std::pair<std::string_view, std::string_view>>
    SplitConditional(std::string_view text) {
  char quote = 0;
  for (std::size_t i = 0; i < text.size(); i++) {
    char c = text[i];
    if (quote) {
      if (c == quote) {
        quote = 0;
      }
    } else if (IsQuote(c)) {
      quote = c;
    } else if (c == ':' && (i + 1 == text.size() || text[i + 1] != '=')) {
      return std::make_pair(text.substr(0, i), text.substr(i + 1));
    }
  }
  return std::nullopt;
}



std::vector<Operation> ParseOperations(const XMLElement* elem) {
  std::vector<Operation> operations;

  // inject_attr and inject_attrs fold into a single inject
  std::optional<AttrList> inject = ParseReserved(elem, kInjectAttr);
  std::optional<AttrList> inject_more = ParseReserved(elem, kInjectAttrs);
  if (inject.has_value() && inject_more.has_value()) {
    for (const auto& [key, value] : *inject_more) {
      if (SetAttr(*inject, key, value)) {
        Warning("Attribute '%s' is injected by both %s and %s. Using '%s'",
                key, kInjectAttr, kInjectAttrs, value);
      }
    }
  } else if (inject_more.has_value()) {
    inject = std::move(inject_more);
  }
  if (inject.has_value()) {
    operations.push_back(InjectOp{std::move(*inject)});
  }

  // replace_attrs: conditional if it holds a top-level ':'
  const char* replace = elem->Attribute(kReplaceAttrs);
  if (replace && replace[0]) {
    auto split = SplitConditional(replace);
    if (split.has_value()) {
      std::optional<AttrList> conditions = ParseAttrString(split->first);
      std::optional<AttrList> replacements = ParseAttrString(split->second);
      if (!conditions.has_value()) {
        Warning("No valid conditions found in conditional replacement: %s", replace);
      } else if (!replacements.has_value()) {
        Warning("No valid replacements found in conditional replacement: %s", replace);
      } else {
        operations.push_back(
            ConditionalReplaceOp{std::move(*conditions), std::move(*replacements)});
      }
    } else {
      std::optional<AttrList> attrs = ParseAttrString(replace);
      if (attrs.has_value()) {
        operations.push_back(ReplaceOp{std::move(*attrs)});
      }
    }
  }

  std::optional<AttrList> match = ParseReserved(elem, kInjectChildren);
  if (match.has_value()) {
    operations.push_back(InjectChildrenOp{std::move(*match)});
  }

  return operations;
}



bool HasOperations(const XMLElement* elem) {
  return elem->Attribute(kInjectAttr) || elem->Attribute(kInjectAttrs) ||
         elem->Attribute(kReplaceAttrs) || elem->Attribute(kInjectChildren);
}



AttrList MatchAttributes(const XMLElement* elem) {
  AttrList attrs;
  for (auto& attr : GetAttributes(elem)) {
    if (!IsReservedAttribute(attr.first)) {
      attrs.push_back(std::move(attr));
    }
  }
  return attrs;
}

}  // namespace urdf2mjcf
