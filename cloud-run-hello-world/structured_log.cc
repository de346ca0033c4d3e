// Copyright 2024 Google LLC
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

#include "structured_log.h"
#include <iostream>
#include <utility>

namespace hello_service {

std::string SeverityName(Severity severity) {
  switch (severity) {
    case Severity::kDebug:
      return "DEBUG";
    case Severity::kInfo:
      return "INFO";
    case Severity::kWarning:
      return "WARNING";
    case Severity::kError:
      return "ERROR";
  }
  return "DEFAULT";
}

std::string FormatLogEntry(Severity severity, std::string const& message,
                           nlohmann::json labels) {
  if (not labels.is_object()) labels = nlohmann::json::object();
  // Cloud Logging only accepts string label values.
  for (auto& value : labels) {
    if (not value.is_string()) value = value.dump();
  }
  labels["component"] = "cloud_run_hello";
  auto entry = nlohmann::json{
      {"severity", SeverityName(severity)},
      {"message", message},
      {"logging.googleapis.com/labels", std::move(labels)},
  };
  // Invalid UTF-8 in the message (e.g. from NAME) must not throw here.
  return entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

void Log(Severity severity, std::string const& message,
         nlohmann::json labels) {
  auto& os = (severity == Severity::kWarning || severity == Severity::kError)
                 ? std::cerr
                 : std::cout;
  // One write per entry so concurrent lines do not interleave.
  os << FormatLogEntry(severity, message, std::move(labels)) + "\n"
     << std::flush;
}

}  // namespace hello_service
