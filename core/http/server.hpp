#pragma once

// Prevent Windows macro pollution (must be before httplib.h)
#ifdef _WIN32
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#endif

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include <httplib.h>

#include "connection/i_connection.hpp"
#include "runtime/config.hpp"

namespace comserver {
namespace http {

enum class Method { GET, POST };

std::string method_to_string(Method method);

/**
 * @brief Resource handler signature
 *
 * The shared connection is passed explicitly on every call instead of
 * being captured by the handler, so handlers stay stateless free functions.
 */
using EndpointHandler =
    std::function<void(connection::IConnection &, const httplib::Request &, httplib::Response &)>;

/**
 * @brief REST host for a single serial connection
 *
 * Owns the httplib::Server and the table of endpoints attached to it.
 * Endpoints are attached with add_endpoint() before start(); the server
 * injects its connection into each handler at dispatch time.
 *
 * Thread model:
 * - Server runs in its own thread (via httplib::Server::listen_after_bind)
 * - Request handlers execute in httplib's thread pool and may block on
 *   the connection for as long as the serial call takes
 * - No locking happens here; the connection serializes access to the line
 *
 * Lifecycle:
 * - start() binds to the configured address/port and spawns server thread
 * - stop() signals shutdown and joins server thread
 */
class HttpServer {
public:
    /**
     * @param config HTTP configuration (bind address, port, pool, CORS)
     * @param connection Serial connection shared by every endpoint; must
     *        outlive the server
     */
    HttpServer(const runtime::HttpConfig &config, connection::IConnection &connection);

    ~HttpServer();

    HttpServer(const HttpServer &) = delete;
    HttpServer &operator=(const HttpServer &) = delete;

    /**
     * @brief Attach a handler to (method, path)
     *
     * Fails if the pair is already taken or the server is running.
     */
    bool add_endpoint(Method method, const std::string &path, EndpointHandler handler, std::string &error);

    /**
     * @brief Start HTTP server
     *
     * Binds to configured address/port and starts server thread.
     * A configured port of 0 binds an ephemeral port (see get_port()).
     *
     * @param error Populated with error message on failure
     * @return true if server started
     */
    bool start(std::string &error);

    /**
     * @brief Stop HTTP server
     *
     * Safe to call multiple times.
     */
    void stop();

    bool is_running() const { return running_.load(); }

    // Port the server is listening on (valid after start())
    int get_port() const { return port_; }

    size_t endpoint_count() const { return endpoints_.size(); }

    bool has_endpoint(Method method, const std::string &path) const;

private:
    struct Endpoint {
        Method method;
        std::string path;
        EndpointHandler handler;
    };

    runtime::HttpConfig config_;
    int port_ = 0;

    connection::IConnection &connection_;
    std::vector<Endpoint> endpoints_;

    std::unique_ptr<httplib::Server> server_;
    std::unique_ptr<std::thread> server_thread_;
    std::atomic<bool> running_{false};

    void setup_routes();
    void dispatch(const Endpoint &endpoint, const httplib::Request &req, httplib::Response &res);
};

}  // namespace http
}  // namespace comserver
