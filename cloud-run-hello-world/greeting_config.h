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

#ifndef HELLO_SERVICE_CLOUD_RUN_HELLO_WORLD_GREETING_CONFIG_H
#define HELLO_SERVICE_CLOUD_RUN_HELLO_WORLD_GREETING_CONFIG_H

#include <optional>
#include <string>

namespace hello_service {

auto constexpr kDefaultPort = 8080;
auto constexpr kMinPort = 1;
auto constexpr kMaxPort = 65535;
auto constexpr kDefaultName = "World";

// The service configuration, resolved once at startup.
struct ServiceConfig {
  int port = kDefaultPort;
  std::string name = kDefaultName;
  bool help = false;
};

/**
 * Resolves the service configuration from the command line and environment.
 *
 * The `--port` and `--name` flags take precedence over the `PORT` and `NAME`
 * environment variables. A missing or malformed port falls back to
 * `kDefaultPort` and logs a warning, a missing name falls back to
 * `kDefaultName`.
 *
 * @throws std::runtime_error if the command line contains unknown options.
 */
ServiceConfig ParseConfig(int argc, char const* const argv[]);

// Parses a decimal TCP port number in [kMinPort, kMaxPort].
std::optional<int> ParsePort(std::string const& text);

std::string Usage(std::string const& program);

}  // namespace hello_service

#endif  // HELLO_SERVICE_CLOUD_RUN_HELLO_WORLD_GREETING_CONFIG_H
