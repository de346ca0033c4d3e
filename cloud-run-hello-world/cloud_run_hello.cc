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

// [START cloudrun_helloworld_service]
#include "greeting_config.h"
#include "greeting_handler.h"
#include "structured_log.h"
#include <google/cloud/functions/framework.h>
#include <fmt/format.h>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace gcf = ::google::cloud::functions;
namespace hs = ::hello_service;

int main(int argc, char* argv[]) try {
  auto const config = hs::ParseConfig(argc, argv);
  if (config.help) {
    std::cout << hs::Usage(argv[0]);
    return 0;
  }

  // The framework also reads PORT, give it the resolved value so a malformed
  // variable cannot override the fallback.
  auto const port = std::to_string(config.port);
  if (::setenv("PORT", port.c_str(), 1) != 0) {
    throw std::runtime_error("Cannot set the PORT environment variable");
  }
  auto const port_flag = "--port=" + port;
  std::vector<char const*> args{argv[0], port_flag.c_str()};

  hs::Log(hs::Severity::kInfo,
          fmt::format("Binding 0.0.0.0:{}, greeting \"{}\"",
                      config.port, hs::Greeting(config.name)),
          {{"port", port}});
  auto const status = gcf::Run(static_cast<int>(args.size()), args.data(),
                               hs::MakeGreetingFunction(config.name));
  if (status != 0) {
    hs::Log(hs::Severity::kError,
            fmt::format("Server on port {} exited with status {}",
                        config.port, status),
            {{"port", port}});
  }
  return status;
} catch (std::exception const& ex) {
  std::cerr << "Standard exception thrown: " << ex.what() << "\n";
  return 1;
}
// [END cloudrun_helloworld_service]
