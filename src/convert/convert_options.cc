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

#include "convert/convert_options.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include <absl/strings/ascii.h>
#include <absl/strings/numbers.h>
#include <absl/strings/str_cat.h>
#include <absl/strings/str_split.h>
#include <urdf2mjcf/u2moptions.h>
#include "xml/xml_util.h"

namespace urdf2mjcf {

ActuatorGains ReadActuatorGains(std::string_view text) {
  // separators are commas or whitespace; whitespace around '=' is dropped
  std::string normalized;
  for (char c : text) {
    if (c == ',' || absl::ascii_isspace(static_cast<unsigned char>(c))) {
      c = ' ';
    }
    if (c == '=') {
      while (!normalized.empty() && normalized.back() == ' ') {
        normalized.pop_back();
      }
    } else if (c == ' ' && !normalized.empty() && normalized.back() == '=') {
      continue;
    }
    normalized.push_back(c);
  }

  ActuatorGains gains;
  int count = 0;
  for (std::string_view token : absl::StrSplit(normalized, ' ', absl::SkipEmpty())) {
    std::size_t eq = token.find('=');
    if (eq == std::string_view::npos) {
      throw XError(nullptr, "actuator gain must be key=value", token);
    }

    std::string_view key = token.substr(0, eq);
    std::string_view value = token.substr(eq + 1);
    double number;
    if (!absl::SimpleAtod(value, &number)) {
      throw XError(nullptr, absl::StrCat("invalid value for actuator gain ", key), value);
    }

    if (key == "kp") {
      gains.kp = number;
    } else if (key == "kv") {
      gains.kv = number;
    } else if (key == "dampratio") {
      gains.dampratio = number;
    } else {
      throw XError(nullptr, "unknown actuator gain, expected kp, kv or dampratio", key);
    }
    count++;
  }

  if (!count) {
    throw XError(nullptr, "no actuator gains given", text);
  }
  return gains;
}



ActuatorGains ReadActuatorGains(const std::vector<double>& values) {
  if (values.size() != 2) {
    throw XError(nullptr, "actuator gains must be given as two values [kp, kv]");
  }

  ActuatorGains gains;
  gains.kp = values[0];
  gains.kv = values[1];
  return gains;
}



bool ParseActuatorGains(std::string_view text, ActuatorGains* gains,
                        char* error, int error_sz) {
  if (error) {
    error[0] = 0;
  }

  try {
    *gains = ReadActuatorGains(text);
  } catch (const XError& e) {
    CopyError(error, e.message().c_str(), error_sz);
    return false;
  }
  return true;
}



bool ParseActuatorGains(const std::vector<double>& values, ActuatorGains* gains,
                        char* error, int error_sz) {
  if (error) {
    error[0] = 0;
  }

  try {
    *gains = ReadActuatorGains(values);
  } catch (const XError& e) {
    CopyError(error, e.message().c_str(), error_sz);
    return false;
  }
  return true;
}

}  // namespace urdf2mjcf
