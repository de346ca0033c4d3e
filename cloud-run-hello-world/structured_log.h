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

#ifndef HELLO_SERVICE_CLOUD_RUN_HELLO_WORLD_STRUCTURED_LOG_H
#define HELLO_SERVICE_CLOUD_RUN_HELLO_WORLD_STRUCTURED_LOG_H

#include <nlohmann/json.hpp>
#include <string>

namespace hello_service {

enum class Severity { kDebug, kInfo, kWarning, kError };

std::string SeverityName(Severity severity);

/**
 * Formats a single log entry as a one-line JSON object.
 *
 * Cloud Run forwards each line the container writes to Cloud Logging. Lines
 * that parse as JSON objects become structured entries, with `severity` and
 * `message` mapped to the corresponding LogEntry fields and the
 * `logging.googleapis.com/labels` object mapped to the entry labels.
 */
std::string FormatLogEntry(Severity severity, std::string const& message,
                           nlohmann::json labels = nlohmann::json::object());

// Writes the entry to std::cout (DEBUG, INFO) or std::cerr (WARNING, ERROR).
void Log(Severity severity, std::string const& message,
         nlohmann::json labels = nlohmann::json::object());

}  // namespace hello_service

#endif  // HELLO_SERVICE_CLOUD_RUN_HELLO_WORLD_STRUCTURED_LOG_H
