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

#ifndef URDF2MJCF_SRC_UTIL_UTIL_LOG_H_
#define URDF2MJCF_SRC_UTIL_UTIL_LOG_H_

#include <string>

#include <absl/strings/str_format.h>
#include <urdf2mjcf/u2mlog.h>

namespace urdf2mjcf {

// deliver a preformatted message to the user handler or the default printer
void LogRaw(LogLevel level, std::string message);

template <typename... Args>
void Debug(const absl::FormatSpec<Args...>& format, const Args&... args) {
  LogRaw(LogLevel::kDebug, absl::StrFormat(format, args...));
}

template <typename... Args>
void Info(const absl::FormatSpec<Args...>& format, const Args&... args) {
  LogRaw(LogLevel::kInfo, absl::StrFormat(format, args...));
}

template <typename... Args>
void Confirm(const absl::FormatSpec<Args...>& format, const Args&... args) {
  LogRaw(LogLevel::kConfirm, absl::StrFormat(format, args...));
}

template <typename... Args>
void Warning(const absl::FormatSpec<Args...>& format, const Args&... args) {
  LogRaw(LogLevel::kWarning, absl::StrFormat(format, args...));
}

template <typename... Args>
void Error(const absl::FormatSpec<Args...>& format, const Args&... args) {
  LogRaw(LogLevel::kError, absl::StrFormat(format, args...));
}

}  // namespace urdf2mjcf

#endif  // URDF2MJCF_SRC_UTIL_UTIL_LOG_H_
