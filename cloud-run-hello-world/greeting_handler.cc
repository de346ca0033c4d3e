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

#include "greeting_handler.h"
#include <utility>

namespace gcf = ::google::cloud::functions;

namespace hello_service {
namespace {

auto constexpr kOkay = 200;
auto constexpr kNotFound = 404;
auto constexpr kMethodNotAllowed = 405;
auto constexpr kTextPlain = "text/plain";

std::string RequestPath(std::string const& target) {
  return target.substr(0, target.find('?'));
}

gcf::HttpResponse TextResponse(int result, std::string payload) {
  return gcf::HttpResponse{}
      .set_result(result)
      .set_header("Content-Type", kTextPlain)
      .set_payload(std::move(payload));
}

}  // namespace

std::string Greeting(std::string const& name) {
  return "Hello " + name + "!";
}

gcf::HttpResponse HandleRequest(std::string const& name,
                                gcf::HttpRequest const& request) {
  if (RequestPath(request.target()) != "/") {
    return TextResponse(kNotFound, "Not Found\n");
  }
  auto const& verb = request.verb();
  if (verb == "GET") return TextResponse(kOkay, Greeting(name));
  if (verb == "HEAD") return TextResponse(kOkay, std::string{});
  return TextResponse(kMethodNotAllowed, "Method Not Allowed\n")
      .set_header("Allow", "GET, HEAD");
}

gcf::Function MakeGreetingFunction(std::string name) {
  return gcf::MakeFunction(
      [name = std::move(name)](gcf::HttpRequest const& request) {
        return HandleRequest(name, request);
      });
}

}  // namespace hello_service
