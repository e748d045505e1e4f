#include "hello_routes.h"

namespace hellosvc {
namespace http {

void hello_handler(const Request&, Response& response) {
    response.status(Response::Status::OK).text(HELLO_BODY);
}

int register_hello_routes(Router& router) {
    return router.add_route("GET", HELLO_PATH, hello_handler);
}

} // namespace http
} // namespace hellosvc
