#pragma once

#include "request.h"
#include "response.h"
#include "router.h"

namespace hellosvc {
namespace http {

constexpr const char* HELLO_PATH = "/hello";
constexpr const char* HELLO_BODY = "Hello world";

/**
 * GET /hello: 200, text/plain, "Hello world". Ignores the request.
 */
void hello_handler(const Request& request, Response& response);

/**
 * Register every route the service exposes.
 *
 * @return 0 on success, non-zero if the router rejected a route
 */
int register_hello_routes(Router& router);

} // namespace http
} // namespace hellosvc
