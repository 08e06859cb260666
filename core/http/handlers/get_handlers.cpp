#include "../../logging/logger.hpp"
#include "../handlers.hpp"
#include "utils.hpp"

namespace comserver {
namespace http {

namespace {

const RequestParser &get_parser() {
    static const RequestParser parser = [] {
        RequestParser p;
        add_receive_arguments(p);
        return p;
    }();
    return parser;
}

const RequestParser &wait_parser() {
    static const RequestParser parser = [] {
        RequestParser p;
        p.add_argument("response").required().help("Response the connection should wait for; is required");
        add_receive_arguments(p);
        return p;
    }();
    return parser;
}

void respond_with_received(const std::optional<std::string> &received, httplib::Response &res) {
    if (!received.has_value()) {
        LOG_WARN("[HTTP] /get: nothing received");
        send_json(res, StatusCode::BAD_GATEWAY, make_message_response("Nothing received"));
        return;
    }

    nlohmann::json response = make_ok_response();
    response["data"] = *received;
    send_json(res, StatusCode::OK, response);
}

}  // namespace

//=============================================================================
// GET /get
//=============================================================================
void handle_get_get(connection::IConnection &conn, const httplib::Request &, httplib::Response &res) {
    connection::ReceiveOptions options;
    options.strip = true;
    respond_with_received(conn.get(options), res);
}

//=============================================================================
// POST /get
//=============================================================================
void handle_post_get(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res) {
    nlohmann::json args;
    if (!parse_or_reject(get_parser(), req, res, args)) {
        return;
    }

    respond_with_received(conn.get(receive_options(args)), res);
}

//=============================================================================
// POST /get/wait
//=============================================================================
void handle_post_get_wait(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res) {
    nlohmann::json args;
    if (!parse_or_reject(wait_parser(), req, res, args)) {
        return;
    }

    const std::string expected = args.at("response").get<std::string>();
    if (!conn.wait_for_response(expected, receive_options(args))) {
        LOG_WARN("[HTTP] /get/wait: response '" << expected << "' not received");
        send_json(res, StatusCode::BAD_GATEWAY, make_message_response("Response not received"));
        return;
    }

    send_json(res, StatusCode::OK, make_ok_response());
}

}  // namespace http
}  // namespace comserver
