#pragma once

#include <string>
#include <vector>

#include "server.hpp"

namespace comserver {
namespace http {

using HandlerFn = void (*)(connection::IConnection &, const httplib::Request &, httplib::Response &);

struct BuiltinEndpoint {
    Method method;
    const char *path;
    HandlerFn handler;
};

/**
 * @brief Fixed table of builtin endpoints, one entry per (method, path)
 *
 * Every entry wraps exactly one IConnection method.
 */
const std::vector<BuiltinEndpoint> &builtin_endpoints();

/**
 * @brief Attach every builtin endpoint to the server
 *
 * Must be called before server.start(). Stops at the first entry the
 * server refuses (duplicate path, server already running) and reports it.
 */
bool register_builtins(HttpServer &server, std::string &error);

}  // namespace http
}  // namespace comserver
