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

#ifndef URDF2MJCF_INCLUDE_URDF2MJCF_H_
#define URDF2MJCF_INCLUDE_URDF2MJCF_H_

#include <string>
#include <string_view>

#include <urdf2mjcf/u2mlog.h>
#include <urdf2mjcf/u2moptions.h>

// this is a C++ API
#define URDF2MJCF_VERSION_HEADER 100

namespace urdf2mjcf {

//---------------------------------- conversion ----------------------------------------------------

// Prepare a URDF for import by the physics compiler: merge its <mujoco> blocks
// into one, set the final <compiler> attributes and strip every other child of
// the block. Returns false and fills error on malformed input.
bool PreprocessString(std::string_view urdf, const ConvertOptions& options,
                      std::string* result, char* error, int error_sz);

// Apply the post-processing passes, actuator synthesis and the <mujoco>
// annotations of urdf to baseline_mjcf, the model produced by the physics
// compiler from the preprocessed URDF. Returns false and fills error on
// malformed input; all other problems are reported through the log handler.
bool ConvertString(std::string_view urdf, std::string_view baseline_mjcf,
                   const ConvertOptions& options, std::string* mjcf,
                   char* error, int error_sz);

// version number of the library
int Version();

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_INCLUDE_URDF2MJCF_H_
