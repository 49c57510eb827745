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

#include "test/fixture.h"

#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>
#include <absl/base/attributes.h>
#include <absl/base/const_init.h>
#include <absl/base/thread_annotations.h>
#include <absl/strings/match.h>
#include <absl/synchronization/mutex.h>
#include "tinyxml2.h"
#include <urdf2mjcf/u2mlog.h>

namespace urdf2mjcf {
namespace {

ABSL_CONST_INIT static absl::Mutex log_mutex(absl::kConstInit);
static bool capture_active ABSL_GUARDED_BY(log_mutex) = false;
static std::vector<LogEvent> recorded ABSL_GUARDED_BY(log_mutex);

void record_log_handler(const LogEvent& event) {
  absl::MutexLock lock(&log_mutex);
  if (capture_active) {
    recorded.push_back(event);
  }
}

}  // namespace

LogCapture::LogCapture() {
  absl::MutexLock lock(&log_mutex);
  if (capture_active) {
    ADD_FAILURE() << "LogCapture is already active";
  }
  capture_active = true;
  recorded.clear();
  previous_ = u2m_user_log;
  u2m_user_log = record_log_handler;
}

LogCapture::~LogCapture() {
  absl::MutexLock lock(&log_mutex);
  u2m_user_log = previous_;
  capture_active = false;
  recorded.clear();
}

std::vector<LogEvent> LogCapture::Events() const {
  absl::MutexLock lock(&log_mutex);
  return recorded;
}

std::vector<std::string> LogCapture::Messages(LogLevel level) const {
  std::vector<std::string> messages;
  for (const LogEvent& event : Events()) {
    if (event.level == level) {
      messages.push_back(event.message);
    }
  }
  return messages;
}

bool LogCapture::Contains(LogLevel level, std::string_view text) const {
  for (const std::string& message : Messages(level)) {
    if (absl::StrContains(message, text)) {
      return true;
    }
  }
  return false;
}

void LogCapture::Clear() {
  absl::MutexLock lock(&log_mutex);
  recorded.clear();
}

Urdf2MjcfTest::~Urdf2MjcfTest() {
  for (const std::string& message : log_.Messages(LogLevel::kError)) {
    ADD_FAILURE() << "error logged: " << message;
  }
}

tinyxml2::XMLElement* ParseElement(tinyxml2::XMLDocument* doc, std::string_view xml) {
  if (doc->Parse(xml.data(), xml.size()) != tinyxml2::XML_SUCCESS) {
    ADD_FAILURE() << "could not parse test xml: " << doc->ErrorStr();
    return nullptr;
  }
  return doc->RootElement();
}

std::string PrintElement(const tinyxml2::XMLElement* elem) {
  tinyxml2::XMLPrinter printer(nullptr, /*compact=*/true);
  elem->Accept(&printer);
  return printer.CStr();
}

std::vector<std::string> ChildTags(const tinyxml2::XMLElement* elem) {
  std::vector<std::string> tags;
  for (const tinyxml2::XMLElement* child = elem->FirstChildElement(); child;
       child = child->NextSiblingElement()) {
    tags.push_back(child->Name());
  }
  return tags;
}

}  // namespace urdf2mjcf
