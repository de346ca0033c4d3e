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

#include "greeting_config.h"
#include "structured_log.h"
#include <boost/program_options.hpp>
#include <fmt/format.h>
#include <charconv>
#include <sstream>
#include <stdexcept>
#include <system_error>

namespace hello_service {
namespace {

namespace po = ::boost::program_options;

auto constexpr kDescription =
    "A Cloud Run service that answers GET / with a greeting";

void AddOptions(po::options_description& desc) {
  // The following empty line comments are for readability.
  desc.add_options()
      //
      ("help,h", "produce help message")
      //
      ("port", po::value<std::string>(),
       "the TCP port to listen on, overrides the PORT environment variable "
       "(default 8080)")
      //
      ("name", po::value<std::string>(),
       "the greeting subject, overrides the NAME environment variable "
       "(default World)");
}

std::string EnvironmentMapper(std::string const& variable) {
  if (variable == "PORT") return "port";
  if (variable == "NAME") return "name";
  return {};
}

int ResolvePort(po::variables_map const& vm) {
  if (vm.count("port") == 0) return kDefaultPort;
  auto const text = vm["port"].as<std::string>();
  auto port = ParsePort(text);
  if (port.has_value()) return *port;
  Log(Severity::kWarning,
      fmt::format("Ignoring invalid port value \"{}\", using default port {}",
                  text, kDefaultPort),
      {{"port", text}});
  return kDefaultPort;
}

}  // namespace

ServiceConfig ParseConfig(int argc, char const* const argv[]) {
  po::options_description desc(kDescription);
  AddOptions(desc);

  po::variables_map vm;
  try {
    po::store(po::command_line_parser(argc, argv).options(desc).run(), vm);
    // po::store() never overwrites a value that is already set, so flags
    // stored above take precedence over the environment.
    po::store(po::parse_environment(desc, EnvironmentMapper), vm);
    po::notify(vm);
  } catch (po::error const& ex) {
    throw std::runtime_error(std::string("Invalid command line: ") +
                             ex.what());
  }

  ServiceConfig config;
  config.help = vm.count("help") != 0;
  if (config.help) return config;
  config.port = ResolvePort(vm);
  if (vm.count("name") != 0) config.name = vm["name"].as<std::string>();
  return config;
}

std::optional<int> ParsePort(std::string const& text) {
  int port = 0;
  auto const* begin = text.data();
  auto const* end = begin + text.size();
  auto const [ptr, ec] = std::from_chars(begin, end, port);
  if (ec != std::errc{} || ptr != end || begin == end) return std::nullopt;
  if (port < kMinPort || port > kMaxPort) return std::nullopt;
  return port;
}

std::string Usage(std::string const& program) {
  po::options_description desc(kDescription);
  AddOptions(desc);
  std::ostringstream os;
  os << "Usage: " << program << " [--port <port>] [--name <name>]\n"
     << desc;
  return os.str();
}

}  // namespace hello_service
