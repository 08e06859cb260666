#pragma once

#include <optional>
#include <string>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "../../connection/i_connection.hpp"
#include "../../connection/payload.hpp"
#include "../../logging/logger.hpp"
#include "../errors.hpp"
#include "../request_parser.hpp"

namespace comserver {
namespace http {

// Helper: Send JSON response
inline void send_json(httplib::Response &res, StatusCode code, const nlohmann::json &body) {
    res.status = status_code_to_http(code);
    res.set_content(to_json_text(body), "application/json");
}

// Helper: Read a nullable string argument produced by RequestParser
inline std::optional<std::string> optional_string(const nlohmann::json &args, const std::string &name) {
    auto it = args.find(name);
    if (it == args.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Helper: Build connection post-processing options from "read_until" / "strip"
inline connection::ReceiveOptions receive_options(const nlohmann::json &args) {
    connection::ReceiveOptions options;
    options.read_until = optional_string(args, "read_until");
    options.strip = args.value("strip", false);
    return options;
}

// Helper: {"message": "OK", "timestamp": ..., "data": ...} with nulls for no record
inline nlohmann::json make_record_response(const std::optional<connection::ReceiveRecord> &record) {
    nlohmann::json response = make_ok_response();
    if (record.has_value()) {
        response["timestamp"] = record->timestamp;
        response["data"] = record->data;
    } else {
        response["timestamp"] = nullptr;
        response["data"] = nullptr;
    }
    return response;
}

// Helper: Run the parser, answering 400 with the parser message on failure
inline bool parse_or_reject(const RequestParser &parser, const httplib::Request &req, httplib::Response &res,
                            nlohmann::json &args) {
    nlohmann::json error;
    if (!parser.parse_args(req, args, error)) {
        LOG_DEBUG("[HTTP] Rejected " << req.method << " " << req.path << ": " << to_json_text(error));
        send_json(res, StatusCode::INVALID_ARGUMENT, error);
        return false;
    }
    return true;
}

// "data" (required, repeated), "ending", "concatenate"
inline void add_payload_arguments(RequestParser &parser) {
    parser.add_argument("data")
        .required()
        .append()
        .help("Data the serial port should send; is required");
    parser.add_argument("ending")
        .default_value(connection::kDefaultEnding)
        .help("Ending that will be appended to the end of data before sending over serial port; "
              "default carriage return + newline");
    parser.add_argument("concatenate")
        .default_value(connection::kDefaultConcatenate)
        .help("What the strings in data should be concatenated by if list; by default a space");
}

// "read_until", "strip"
inline void add_receive_arguments(RequestParser &parser) {
    parser.add_argument("read_until")
        .nullable()
        .help("What character the string should read until");
    parser.add_argument("strip", ArgType::BOOL)
        .default_value(false)
        .help("If the string should be stripped of whitespaces and newlines before responding");
}

inline std::string payload_from_args(const nlohmann::json &args) {
    return connection::compose_payload(args.at("data").get<std::vector<std::string>>(),
                                       args.at("concatenate").get<std::string>(),
                                       args.at("ending").get<std::string>());
}

}  // namespace http
}  // namespace comserver
