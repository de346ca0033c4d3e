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

#ifndef HELLO_SERVICE_CLOUD_RUN_HELLO_WORLD_GREETING_HANDLER_H
#define HELLO_SERVICE_CLOUD_RUN_HELLO_WORLD_GREETING_HANDLER_H

#include <google/cloud/functions/framework.h>
#include <google/cloud/functions/http_request.h>
#include <google/cloud/functions/http_response.h>
#include <string>

namespace hello_service {

// Returns the greeting body, "Hello {name}!", with no trailing newline.
std::string Greeting(std::string const& name);

/**
 * Maps a request to the service response.
 *
 * `GET /` and `HEAD /` return 200 with the greeting as `text/plain`, any other
 * method on `/` returns 405, and any other path returns 404. The query string
 * is ignored.
 */
::google::cloud::functions::HttpResponse HandleRequest(
    std::string const& name,
    ::google::cloud::functions::HttpRequest const& request);

// Wraps HandleRequest() for the Functions Framework, `name` is captured once.
::google::cloud::functions::Function MakeGreetingFunction(
    std::string name);

}  // namespace hello_service

#endif  // HELLO_SERVICE_CLOUD_RUN_HELLO_WORLD_GREETING_HANDLER_H
