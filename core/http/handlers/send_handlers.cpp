#include "../../logging/logger.hpp"
#include "../handlers.hpp"
#include "utils.hpp"

namespace comserver {
namespace http {

namespace {

const RequestParser &send_parser() {
    static const RequestParser parser = [] {
        RequestParser p;
        add_payload_arguments(p);
        return p;
    }();
    return parser;
}

const RequestParser &send_get_first_parser() {
    static const RequestParser parser = [] {
        RequestParser p;
        add_payload_arguments(p);
        add_receive_arguments(p);
        return p;
    }();
    return parser;
}

const RequestParser &send_get_parser() {
    static const RequestParser parser = [] {
        RequestParser p;
        p.add_argument("response")
            .required()
            .help("Response that the connection should wait for after sending; is required");
        add_payload_arguments(p);
        add_receive_arguments(p);
        return p;
    }();
    return parser;
}

}  // namespace

//=============================================================================
// POST /send
//=============================================================================
void handle_post_send(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res) {
    nlohmann::json args;
    if (!parse_or_reject(send_parser(), req, res, args)) {
        return;
    }

    if (!conn.send(payload_from_args(args))) {
        LOG_WARN("[HTTP] /send: connection failed to send");
        send_json(res, StatusCode::BAD_GATEWAY, make_message_response("Failed to send"));
        return;
    }

    send_json(res, StatusCode::OK, make_ok_response());
}

//=============================================================================
// POST /send/get_first
//=============================================================================
void handle_post_send_get_first(connection::IConnection &conn, const httplib::Request &req,
                                httplib::Response &res) {
    nlohmann::json args;
    if (!parse_or_reject(send_get_first_parser(), req, res, args)) {
        return;
    }

    auto received = conn.get_first_response(payload_from_args(args), receive_options(args));
    if (!received.has_value()) {
        LOG_WARN("[HTTP] /send/get_first: nothing received");
        send_json(res, StatusCode::BAD_GATEWAY, make_message_response("Nothing received"));
        return;
    }

    nlohmann::json response = make_ok_response();
    response["data"] = *received;
    send_json(res, StatusCode::OK, response);
}

//=============================================================================
// POST /send/get
//=============================================================================
void handle_post_send_get(connection::IConnection &conn, const httplib::Request &req, httplib::Response &res) {
    nlohmann::json args;
    if (!parse_or_reject(send_get_parser(), req, res, args)) {
        return;
    }

    const std::string expected = args.at("response").get<std::string>();
    if (!conn.send_for_response(expected, payload_from_args(args), receive_options(args))) {
        LOG_WARN("[HTTP] /send/get: response '" << expected << "' not received");
        send_json(res, StatusCode::BAD_GATEWAY, make_message_response("Response not received"));
        return;
    }

    send_json(res, StatusCode::OK, make_ok_response());
}

}  // namespace http
}  // namespace comserver
