#include "server.hpp"

#include <algorithm>
#include <map>
#include <set>

#include "errors.hpp"
#include "handlers/utils.hpp"
#include "logging/logger.hpp"

namespace comserver {
namespace http {

namespace {
constexpr int kDefaultTimeoutMilliseconds = 0;
constexpr int kStatusNoContent = 204;
constexpr int kStatusBadRequest = 400;
constexpr int kStatusNotFound = 404;
constexpr int kStatusInternal = 500;

bool origin_matches(const std::string &origin, const std::string &allowed) {
    if (allowed == "*") {
        return true;
    }

    const auto wildcard_pos = allowed.find('*');
    if (wildcard_pos == std::string::npos) {
        return allowed == origin;
    }

    const std::string prefix = allowed.substr(0, wildcard_pos);
    const std::string suffix = allowed.substr(wildcard_pos + 1);
    if (origin.size() < prefix.size() + suffix.size()) {
        return false;
    }

    const bool prefix_ok = origin.compare(0, prefix.size(), prefix) == 0;
    const bool suffix_ok = origin.compare(origin.size() - suffix.size(), suffix.size(), suffix) == 0;
    return prefix_ok && suffix_ok;
}
}  // namespace

std::string method_to_string(Method method) {
    switch (method) {
        case Method::GET:
            return "GET";
        case Method::POST:
            return "POST";
        default:
            return "UNKNOWN";
    }
}

HttpServer::HttpServer(const runtime::HttpConfig &config, connection::IConnection &connection)
    : config_(config), connection_(connection) {}

HttpServer::~HttpServer() { stop(); }

bool HttpServer::has_endpoint(Method method, const std::string &path) const {
    return std::any_of(endpoints_.begin(), endpoints_.end(),
                       [&](const Endpoint &e) { return e.method == method && e.path == path; });
}

bool HttpServer::add_endpoint(Method method, const std::string &path, EndpointHandler handler, std::string &error) {
    if (running_.load()) {
        error = "Cannot add endpoint " + method_to_string(method) + " " + path + " while server is running";
        return false;
    }
    if (path.empty() || path.front() != '/') {
        error = "Endpoint path must start with '/': " + path;
        return false;
    }
    if (!handler) {
        error = "Endpoint handler is empty: " + method_to_string(method) + " " + path;
        return false;
    }
    if (has_endpoint(method, path)) {
        error = "Endpoint already registered: " + method_to_string(method) + " " + path;
        return false;
    }

    endpoints_.push_back(Endpoint{method, path, std::move(handler)});
    return true;
}

bool HttpServer::start(std::string &error) {
    if (running_.load()) {
        error = "Server already running";
        return false;
    }

    LOG_INFO("[HTTP] Starting server on " << config_.bind << ":" << config_.port);

    server_ = std::make_unique<httplib::Server>();

    server_->set_read_timeout(config_.read_timeout_s, kDefaultTimeoutMilliseconds);
    server_->set_write_timeout(config_.write_timeout_s, kDefaultTimeoutMilliseconds);

    // Each worker may sit in a blocking serial call, so the pool bounds
    // the number of requests in flight against the connection
    const size_t pool_size = static_cast<size_t>(std::max(1, config_.thread_pool_size));
    server_->new_task_queue = [pool_size] { return new httplib::ThreadPool(pool_size); };

    // CORS headers on all responses (allowlist with wildcard support)
    const bool allow_credentials = config_.cors_allow_credentials;
    server_->set_post_routing_handler([allow_credentials, origins = config_.cors_allowed_origins](
                                          const httplib::Request &req, httplib::Response &res) {
        const auto origin_it = req.headers.find("Origin");
        if (origin_it == req.headers.end()) {
            return;
        }

        const std::string origin = origin_it->second;
        auto matched = std::find_if(origins.begin(), origins.end(),
                                    [&origin](const std::string &allowed) { return origin_matches(origin, allowed); });
        if (matched == origins.end()) {
            return;
        }

        const std::string response_origin = *matched == "*" ? "*" : origin;
        res.set_header("Access-Control-Allow-Origin", response_origin);
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
        if (allow_credentials) {
            res.set_header("Access-Control-Allow-Credentials", "true");
        }
    });

    setup_routes();

    // JSON bodies for errors httplib produces itself (unknown route, bad request)
    server_->set_error_handler([](const httplib::Request &req, httplib::Response &res) {
        if (!res.body.empty()) {
            return;
        }

        std::string message = "Internal server error";
        if (res.status == kStatusNotFound) {
            message = "Route not found: " + req.method + " " + req.path;
        } else if (res.status == kStatusBadRequest) {
            message = "Bad request";
        }

        res.set_content(to_json_text(make_message_response(message)), "application/json");
    });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep) {
        std::string msg = "Unknown error";
        try {
            std::rethrow_exception(std::move(ep));
        } catch (const std::exception &e) {
            msg = e.what();
            LOG_ERROR("[HTTP] Exception in " << req.method << " " << req.path << ": " << e.what());
        } catch (...) {
            msg = "Unknown exception";
            LOG_ERROR("[HTTP] Unknown exception in " << req.method << " " << req.path);
        }

        res.status = kStatusInternal;
        res.set_content(to_json_text(make_message_response(msg)), "application/json");
    });

    if (config_.port == 0) {
        port_ = server_->bind_to_any_port(config_.bind);
        if (port_ < 0) {
            port_ = 0;
            error = "Failed to bind to " + config_.bind + " on an ephemeral port";
            server_.reset();
            return false;
        }
    } else {
        if (!server_->bind_to_port(config_.bind, config_.port)) {
            error = "Failed to bind to " + config_.bind + ":" + std::to_string(config_.port);
            server_.reset();
            return false;
        }
        port_ = config_.port;
    }

    running_.store(true);
    server_thread_ = std::make_unique<std::thread>([this]() {
        LOG_INFO("[HTTP] Server thread started");
        server_->listen_after_bind();
        LOG_INFO("[HTTP] Server thread exiting");
    });

    LOG_INFO("[HTTP] Server listening on " << config_.bind << ":" << port_);
    return true;
}

void HttpServer::stop() {
    if (!running_.load()) {
        return;
    }

    LOG_INFO("[HTTP] Stopping server");
    running_.store(false);

    if (server_) {
        server_->stop();
    }

    if (server_thread_ && server_thread_->joinable()) {
        server_thread_->join();
    }

    server_thread_.reset();
    server_.reset();
    LOG_INFO("[HTTP] Server stopped");
}

void HttpServer::dispatch(const Endpoint &endpoint, const httplib::Request &req, httplib::Response &res) {
    LOG_DEBUG("[HTTP] " << req.method << " " << req.path);
    try {
        endpoint.handler(connection_, req, res);
    } catch (const connection::ConnectionError &e) {
        LOG_ERROR("[HTTP] Connection error in " << req.method << " " << req.path << ": " << e.what());
        send_json(res, StatusCode::BAD_GATEWAY, make_message_response(e.what()));
    }
}

void HttpServer::setup_routes() {
    std::map<std::string, std::set<Method>> methods_by_path;

    LOG_INFO("[HTTP] Routes configured:");
    for (const auto &endpoint : endpoints_) {
        auto route = [this, endpoint](const httplib::Request &req, httplib::Response &res) {
            dispatch(endpoint, req, res);
        };

        switch (endpoint.method) {
            case Method::GET:
                server_->Get(endpoint.path, route);
                break;
            case Method::POST:
                server_->Post(endpoint.path, route);
                break;
        }
        methods_by_path[endpoint.path].insert(endpoint.method);
        LOG_INFO("[HTTP]   " << method_to_string(endpoint.method) << (endpoint.method == Method::GET ? "  " : " ")
                             << endpoint.path);
    }

    // Known path, unsupported method -> 405 instead of "route not found"
    for (const auto &entry : methods_by_path) {
        std::string allow;
        for (Method method : entry.second) {
            allow += (allow.empty() ? "" : ", ") + method_to_string(method);
        }
        auto not_allowed = [allow](const httplib::Request &req, httplib::Response &res) {
            res.set_header("Allow", allow);
            send_json(res, StatusCode::METHOD_NOT_ALLOWED,
                      make_message_response("Method not allowed: " + req.method + " " + req.path));
        };
        if (entry.second.count(Method::GET) == 0) {
            server_->Get(entry.first, not_allowed);
        }
        if (entry.second.count(Method::POST) == 0) {
            server_->Post(entry.first, not_allowed);
        }
    }

    // CORS preflight for every route
    server_->Options(R"(/.*)", [](const httplib::Request &, httplib::Response &res) {
        res.status = kStatusNoContent;
        res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
        res.set_header("Access-Control-Allow-Headers", "Content-Type");
    });
}

}  // namespace http
}  // namespace comserver
