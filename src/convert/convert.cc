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

#include <urdf2mjcf/urdf2mjcf.h>

#include <string>
#include <string_view>

#include "tinyxml2.h"
#include <urdf2mjcf/u2moptions.h>
#include "convert/convert_actuator.h"
#include "convert/convert_postprocess.h"
#include "convert/convert_source.h"
#include "util/util_log.h"
#include "xml/xml_document.h"
#include "xml/xml_inject.h"
#include "xml/xml_util.h"

namespace urdf2mjcf {
namespace {

using tinyxml2::XMLDocument;
using tinyxml2::XMLPrinter;

// parse the source URDF, throw XError if malformed
void ParseSource(XMLDocument* urdf, std::string_view text) {
  if (urdf->Parse(text.data(), text.size()) != tinyxml2::XML_SUCCESS) {
    throw XError(nullptr, "could not parse URDF", urdf->ErrorStr());
  }
}

// every pass, in pipeline order
void Postprocess(Document* doc, const SourceModel& model, const ConvertOptions& options) {
  if (options.damping_multiplier != 1.0) {
    ScaleJointDamping(doc, options.damping_multiplier);
  }

  for (const XMLElement* plugin : model.plugins) {
    AddCustomPlugin(doc, plugin);
  }
  ApplyCompilerOptions(doc, model.compiler);
  AddLight(doc);

  if (options.add_clock_publisher) {
    AddClockPublisher(doc);
  }
  if (options.add_ros2_control) {
    AddRos2Control(doc, options.ros2_control_instance, options.ros2_control_config);
  }
  GroupRosUtilsPlugins(doc);

  if (options.floating_base) {
    MakeBaseFloating(doc, options.height_above_floor);
  }
  if (options.add_floor) {
    AddFloor(doc);
  }

  if (!options.no_actuators) {
    AddActuators(doc, model.interfaces, model.mimic, options);
    if (options.add_mimic_joints) {
      AddMimicPlugins(doc, model.mimic, options.actuator_gains);
    }
    GroupRosUtilsPlugins(doc);
  }

  if (options.gravity_compensation) {
    EnableGravityCompensation(doc);
  }
  if (options.armature.has_value()) {
    SetJointArmature(doc, *options.armature);
  }
  SetSimulationOptions(doc, options.solver, options.integrator);

  // annotations apply to the fully generated model
  Injector injector(doc);
  injector.Inject(model.annotations);
  GroupRosUtilsPlugins(doc);
}

}  // namespace

bool PreprocessString(std::string_view urdf, const ConvertOptions& options,
                      std::string* result, char* error, int error_sz) {
  if (error) {
    error[0] = 0;
  }

  try {
    XMLDocument source;
    ParseSource(&source, urdf);
    InspectSource(&source, options);

    XMLPrinter printer;
    source.Print(&printer);
    *result = printer.CStr();
  } catch (const XError& e) {
    CopyError(error, e.message().c_str(), error_sz);
    return false;
  }
  return true;
}



bool ConvertString(std::string_view urdf, std::string_view baseline_mjcf,
                   const ConvertOptions& options, std::string* mjcf,
                   char* error, int error_sz) {
  if (error) {
    error[0] = 0;
  }

  try {
    XMLDocument source;
    ParseSource(&source, urdf);
    SourceModel model = InspectSource(&source, options);

    Document doc(baseline_mjcf);
    Confirm("Loaded URDF to MJCF successfully. Applying post-processing MJCF...");
    Postprocess(&doc, model, options);

    *mjcf = doc.Write();
  } catch (const XError& e) {
    CopyError(error, e.message().c_str(), error_sz);
    return false;
  }

  Confirm("Successfully converted URDF to MJCF.");
  return true;
}



int Version() {
  return URDF2MJCF_VERSION_HEADER;
}

}  // namespace urdf2mjcf
