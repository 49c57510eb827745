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

#ifndef URDF2MJCF_INCLUDE_U2MLOG_H_
#define URDF2MJCF_INCLUDE_U2MLOG_H_

#include <string>

namespace urdf2mjcf {

//---------------------------------- log events ----------------------------------------------------

// severity of a log event, ordered from least to most severe
enum class LogLevel {
  kDebug = 0,
  kInfo,
  kConfirm,                       // successful completion of a step
  kWarning,                       // recoverable condition, processing continues
  kError                          // the current conversion step failed
};

struct LogEvent {
  LogLevel level = LogLevel::kInfo;
  std::string message;
};

//---------------------------------- user handlers -------------------------------------------------

// receives every log event; when null, events at or above the log level are
// printed to stdout (debug, info, confirm) or stderr (warning, error)
extern void (*u2m_user_log)(const LogEvent& event);

// clear user handler; restore default processing
void ClearLogHandler();

// minimum level printed by the default handler (default: kInfo)
void SetLogLevel(LogLevel level);
LogLevel GetLogLevel();

// printable name of a level: "DEBUG", "INFO", "CONFIRM", "WARNING", "ERROR"
const char* LogLevelName(LogLevel level);

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_INCLUDE_U2MLOG_H_
