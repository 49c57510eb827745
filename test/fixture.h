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

#ifndef URDF2MJCF_TEST_FIXTURE_H_
#define URDF2MJCF_TEST_FIXTURE_H_

#include <string>
#include <string_view>
#include <vector>

#include <gtest/gtest.h>
#include "tinyxml2.h"
#include <urdf2mjcf/u2mlog.h>

namespace urdf2mjcf {

// Installs a log handler that records every event for the lifetime of the
// object, and restores the previous handler afterwards. Only one capture may
// be active at a time.
class LogCapture {
 public:
  LogCapture();
  ~LogCapture();

  LogCapture(const LogCapture&) = delete;
  LogCapture& operator=(const LogCapture&) = delete;

  // all recorded events, in order
  std::vector<LogEvent> Events() const;

  // messages recorded at exactly this level
  std::vector<std::string> Messages(LogLevel level) const;

  // true if a message at this level contains text
  bool Contains(LogLevel level, std::string_view text) const;

  // forget recorded events
  void Clear();

 private:
  void (*previous_)(const LogEvent&);
};

// A test fixture which records the log events of the code under test.
// By default, any event at error level triggers a test failure.
class Urdf2MjcfTest : public ::testing::Test {
 public:
  ~Urdf2MjcfTest() override;

 protected:
  int WarningCount() const {
    return static_cast<int>(log_.Messages(LogLevel::kWarning).size());
  }

  LogCapture log_;
};

// Parses xml into doc and returns its root element. Adds a test failure and
// returns nullptr if xml is malformed.
tinyxml2::XMLElement* ParseElement(tinyxml2::XMLDocument* doc, std::string_view xml);

// Returns the compact serialization of elem, e.g. <geom a="1"/>.
std::string PrintElement(const tinyxml2::XMLElement* elem);

// Returns the tags of the child elements of elem, in order.
std::vector<std::string> ChildTags(const tinyxml2::XMLElement* elem);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_TEST_FIXTURE_H_
