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

#ifndef URDF2MJCF_INCLUDE_U2MOPTIONS_H_
#define URDF2MJCF_INCLUDE_U2MOPTIONS_H_

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace urdf2mjcf {

//---------------------------------- actuator gains ------------------------------------------------

struct ActuatorGains {
  double kp = 500.0;                     // position actuator gain
  double kv = 1.0;                       // velocity actuator gain
  std::optional<double> dampratio;       // position actuator damping ratio
};

// parse "kp=500, kv=1 dampratio=0.5" into gains; return false and fill error
// on malformed input
bool ParseActuatorGains(std::string_view text, ActuatorGains* gains,
                        char* error, int error_sz);

// legacy form [kp, kv]; return false unless exactly two values are given
bool ParseActuatorGains(const std::vector<double>& values, ActuatorGains* gains,
                        char* error, int error_sz);

//---------------------------------- conversion options --------------------------------------------

struct ConvertOptions {
  // model layout
  bool add_floor = false;                // checker floor plane and its assets
  bool floating_base = false;            // free joint on the first body
  double height_above_floor = 0;         // base position when floating

  // actuation
  bool no_actuators = false;             // skip actuator synthesis
  bool add_mimic_joints = false;         // mimic follower plugins
  bool force_actuator_suffix = false;    // always name actuators {joint}_{kind}
  ActuatorGains actuator_gains;

  // joint physics
  std::optional<double> armature;        // set on every joint when present
  double damping_multiplier = 1.0;       // scales every joint damping
  bool gravity_compensation = false;     // gravcomp on every body

  // MujocoRosUtils plugins
  bool add_ros_plugins = false;          // actuator command plugins
  bool add_ros2_control = false;         // Ros2Control extension plugin
  bool add_clock_publisher = false;      // ClockPublisher plugin
  std::optional<std::string> ros2_control_config;  // config_file of Ros2Control
  std::string ros2_control_instance = "ros2_control";

  // simulation options
  std::optional<std::string> solver;
  std::optional<std::string> integrator;

  // compiler
  std::vector<std::string> compiler_options;  // KEY=VALUE overrides
  std::string mesh_dir = "assets/";
};

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_INCLUDE_U2MOPTIONS_H_
