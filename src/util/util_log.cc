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

#include "util/util_log.h"

#include <cstdio>
#include <string>
#include <utility>

#include <urdf2mjcf/u2mlog.h>

namespace urdf2mjcf {

void (*u2m_user_log)(const LogEvent& event) = nullptr;

namespace {

LogLevel log_level = LogLevel::kInfo;

void DefaultLog(const LogEvent& event) {
  if (event.level < log_level) {
    return;
  }

  switch (event.level) {
    case LogLevel::kWarning:
    case LogLevel::kError:
      std::fprintf(stderr, "[%s] %s\n", LogLevelName(event.level), event.message.c_str());
      break;

    case LogLevel::kDebug:
      std::printf("[%s] %s\n", LogLevelName(event.level), event.message.c_str());
      break;

    default:
      std::printf("%s\n", event.message.c_str());
  }
}

}  // namespace

void ClearLogHandler() {
  u2m_user_log = nullptr;
}

void SetLogLevel(LogLevel level) {
  log_level = level;
}

LogLevel GetLogLevel() {
  return log_level;
}

const char* LogLevelName(LogLevel level) {
  switch (level) {
    case LogLevel::kDebug:
      return "DEBUG";
    case LogLevel::kInfo:
      return "INFO";
    case LogLevel::kConfirm:
      return "CONFIRM";
    case LogLevel::kWarning:
      return "WARNING";
    case LogLevel::kError:
      return "ERROR";
  }
  return "UNKNOWN";
}

void LogRaw(LogLevel level, std::string message) {
  LogEvent event;
  event.level = level;
  event.message = std::move(message);

  if (u2m_user_log) {
    u2m_user_log(event);
  } else {
    DefaultLog(event);
  }
}

}  // namespace urdf2mjcf
