#include "builtins.hpp"

#include "handlers.hpp"
#include "logging/logger.hpp"

namespace comserver {
namespace http {

const std::vector<BuiltinEndpoint> &builtin_endpoints() {
    static const std::vector<BuiltinEndpoint> endpoints = {
        {Method::POST, "/send", handle_post_send},
        {Method::GET, "/receive", handle_get_receive},
        {Method::POST, "/receive", handle_post_receive},
        {Method::GET, "/receive/all", handle_get_receive_all},
        {Method::POST, "/receive/all", handle_post_receive_all},
        {Method::GET, "/get", handle_get_get},
        {Method::POST, "/get", handle_post_get},
        {Method::POST, "/send/get_first", handle_post_send_get_first},
        {Method::POST, "/get/wait", handle_post_get_wait},
        {Method::POST, "/send/get", handle_post_send_get},
    };
    return endpoints;
}

bool register_builtins(HttpServer &server, std::string &error) {
    for (const auto &endpoint : builtin_endpoints()) {
        if (!server.add_endpoint(endpoint.method, endpoint.path, endpoint.handler, error)) {
            LOG_ERROR("[Builtins] Failed to register " << method_to_string(endpoint.method) << " " << endpoint.path
                                                       << ": " << error);
            return false;
        }
    }

    LOG_DEBUG("[Builtins] Registered " << builtin_endpoints().size() << " endpoints");
    return true;
}

}  // namespace http
}  // namespace comserver
