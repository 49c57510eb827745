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

#ifndef URDF2MJCF_SRC_CONVERT_CONVERT_OPTIONS_H_
#define URDF2MJCF_SRC_CONVERT_CONVERT_OPTIONS_H_

#include <string_view>
#include <vector>

#include <urdf2mjcf/u2moptions.h>

namespace urdf2mjcf {

// kp, kv and dampratio as key=value pairs separated by commas or whitespace,
// last duplicate wins; throws XError on malformed input
ActuatorGains ReadActuatorGains(std::string_view text);

// [kp, kv]; throws XError unless exactly two values are given
ActuatorGains ReadActuatorGains(const std::vector<double>& values);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_CONVERT_CONVERT_OPTIONS_H_
