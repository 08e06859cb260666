#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace comserver {
namespace http {

/**
 * @brief Response status model for the REST builtins
 *
 * - OK -> HTTP 200
 * - INVALID_ARGUMENT -> HTTP 400 (request rejected before reaching the connection)
 * - NOT_FOUND -> HTTP 404
 * - METHOD_NOT_ALLOWED -> HTTP 405
 * - INTERNAL -> HTTP 500
 * - BAD_GATEWAY -> HTTP 502 (the serial connection reported failure)
 */
enum class StatusCode { OK, INVALID_ARGUMENT, NOT_FOUND, METHOD_NOT_ALLOWED, INTERNAL, BAD_GATEWAY };

inline int status_code_to_http(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return 200;
        case StatusCode::INVALID_ARGUMENT:
            return 400;
        case StatusCode::NOT_FOUND:
            return 404;
        case StatusCode::METHOD_NOT_ALLOWED:
            return 405;
        case StatusCode::INTERNAL:
            return 500;
        case StatusCode::BAD_GATEWAY:
            return 502;
        default:
            return 500;
    }
}

inline std::string status_code_to_string(StatusCode code) {
    switch (code) {
        case StatusCode::OK:
            return "OK";
        case StatusCode::INVALID_ARGUMENT:
            return "INVALID_ARGUMENT";
        case StatusCode::NOT_FOUND:
            return "NOT_FOUND";
        case StatusCode::METHOD_NOT_ALLOWED:
            return "METHOD_NOT_ALLOWED";
        case StatusCode::INTERNAL:
            return "INTERNAL";
        case StatusCode::BAD_GATEWAY:
            return "BAD_GATEWAY";
        default:
            return "INTERNAL";
    }
}

/**
 * @brief Build a {"message": ...} response body
 *
 * Every builtin response, success or failure, carries a top-level
 * "message". It is a string except for argument errors, where it is an
 * object keyed by argument name.
 */
inline nlohmann::json make_message_response(const nlohmann::json &message) { return {{"message", message}}; }

/**
 * @brief Serialize a response body
 *
 * Received serial data is arbitrary bytes. Invalid UTF-8 is replaced
 * with U+FFFD instead of throwing, so a noisy line never turns a
 * response into a 500.
 */
inline std::string to_json_text(const nlohmann::json &body) {
    return body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// {"message": "OK"}
inline nlohmann::json make_ok_response() { return make_message_response(status_code_to_string(StatusCode::OK)); }

}  // namespace http
}  // namespace comserver
