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

#include <cstddef>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

#include <absl/strings/numbers.h>
#include <urdf2mjcf/urdf2mjcf.h>

// help
static constexpr char helpstring[] =
  "\n Usage:  convert [options] infile.urdf baseline.xml outfile.xml\n"
  "         convert --preprocess [options] infile.urdf outfile.urdf\n\n"
  "   baseline.xml is the model saved by the physics compiler from the\n"
  "   preprocessed URDF\n\n"
  " Options:\n"
  "   --floor                      add a floor plane\n"
  "   --floating-base[=HEIGHT]     add a free joint to the base body\n"
  "   --no-actuators               do not generate actuators\n"
  "   --gains=kp=500,kv=1          actuator gains, also dampratio\n"
  "   --suffix                     always name actuators {joint}_{kind}\n"
  "   --mimic                      add mimic joint plugins\n"
  "   --ros-plugins                add actuator command plugins\n"
  "   --ros2-control[=CONFIG]      add the Ros2Control plugin\n"
  "   --clock                      add the clock publisher plugin\n"
  "   --damping=FACTOR             multiply joint damping\n"
  "   --armature=VALUE             set armature on every joint\n"
  "   --gravcomp                   enable gravity compensation\n"
  "   --solver=NAME                simulation solver\n"
  "   --integrator=NAME            simulation integrator\n"
  "   --compiler=KEY=VALUE         compiler attribute, repeatable\n"
  "   --meshdir=DIR                compiler meshdir (default assets/)\n"
  "   --verbose                    print debug messages\n\n"
  " Example: convert --floor --mimic robot.urdf robot_base.xml robot.xml\n";

// print message, return code
int finish(const char* msg = 0, int code = 0) {
  if (msg) {
    std::cout << msg << std::endl;
  }
  return code;
}



// read file into string
bool readfile(const char* filename, std::string* text) {
  std::ifstream file(filename);
  if (!file) {
    return false;
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  *text = buffer.str();
  return true;
}



// value of --name=value, or nullptr if arg is not this option
const char* optionvalue(const char* arg, const char* name) {
  std::size_t len = std::strlen(name);
  if (std::strncmp(arg, name, len) || arg[len] != '=') {
    return nullptr;
  }
  return arg + len + 1;
}



// parse number or report failure
bool parsenumber(const char* text, double* value) {
  if (!absl::SimpleAtod(text, value)) {
    std::cout << "Invalid number '" << text << "'" << std::endl;
    return false;
  }
  return true;
}



// main function
int main(int argc, char** argv) {
  urdf2mjcf::ConvertOptions options;
  bool preprocess = false;
  std::vector<const char*> files;

  // parse options
  for (int i = 1; i < argc; i++) {
    const char* arg = argv[i];
    const char* value;
    double number;

    if (std::strncmp(arg, "--", 2)) {
      files.push_back(arg);
    } else if (!std::strcmp(arg, "--preprocess")) {
      preprocess = true;
    } else if (!std::strcmp(arg, "--floor")) {
      options.add_floor = true;
    } else if (!std::strcmp(arg, "--floating-base")) {
      options.floating_base = true;
    } else if ((value = optionvalue(arg, "--floating-base"))) {
      if (!parsenumber(value, &options.height_above_floor)) {
        return finish(0, 1);
      }
      options.floating_base = true;
    } else if (!std::strcmp(arg, "--no-actuators")) {
      options.no_actuators = true;
    } else if ((value = optionvalue(arg, "--gains"))) {
      char error[1000];
      if (!urdf2mjcf::ParseActuatorGains(value, &options.actuator_gains,
                                         error, sizeof(error))) {
        return finish(error, 1);
      }
    } else if (!std::strcmp(arg, "--suffix")) {
      options.force_actuator_suffix = true;
    } else if (!std::strcmp(arg, "--mimic")) {
      options.add_mimic_joints = true;
    } else if (!std::strcmp(arg, "--ros-plugins")) {
      options.add_ros_plugins = true;
    } else if (!std::strcmp(arg, "--ros2-control")) {
      options.add_ros2_control = true;
    } else if ((value = optionvalue(arg, "--ros2-control"))) {
      options.add_ros2_control = true;
      options.ros2_control_config = value;
    } else if (!std::strcmp(arg, "--clock")) {
      options.add_clock_publisher = true;
    } else if ((value = optionvalue(arg, "--damping"))) {
      if (!parsenumber(value, &options.damping_multiplier)) {
        return finish(0, 1);
      }
    } else if ((value = optionvalue(arg, "--armature"))) {
      if (!parsenumber(value, &number)) {
        return finish(0, 1);
      }
      options.armature = number;
    } else if (!std::strcmp(arg, "--gravcomp")) {
      options.gravity_compensation = true;
    } else if ((value = optionvalue(arg, "--solver"))) {
      options.solver = value;
    } else if ((value = optionvalue(arg, "--integrator"))) {
      options.integrator = value;
    } else if ((value = optionvalue(arg, "--compiler"))) {
      options.compiler_options.push_back(value);
    } else if ((value = optionvalue(arg, "--meshdir"))) {
      options.mesh_dir = value;
    } else if (!std::strcmp(arg, "--verbose")) {
      urdf2mjcf::SetLogLevel(urdf2mjcf::LogLevel::kDebug);
    } else {
      std::cout << "Unknown option " << arg << std::endl;
      return finish(helpstring, 1);
    }
  }

  // print help if arguments are missing
  std::size_t nfiles = preprocess ? 2 : 3;
  if (files.size() != nfiles) {
    return finish(helpstring);
  }

  // read inputs
  std::string urdf, baseline;
  if (!readfile(files[0], &urdf)) {
    return finish("Could not read URDF file", 1);
  }
  if (!preprocess && !readfile(files[1], &baseline)) {
    return finish("Could not read baseline MJCF file", 1);
  }

  // convert
  std::string result;
  char error[1000];
  bool success = preprocess ?
      urdf2mjcf::PreprocessString(urdf, options, &result, error, sizeof(error)) :
      urdf2mjcf::ConvertString(urdf, baseline, options, &result, error, sizeof(error));
  if (!success) {
    return finish(error, 1);
  }

  // save result
  const char* outfile = files.back();
  std::ofstream file(outfile);
  if (!file || !(file << result)) {
    return finish("Could not write output file", 1);
  }

  char msg[1000];
  std::snprintf(msg, sizeof(msg), "Done. Output saved to: %s", outfile);
  return finish(msg);
}
