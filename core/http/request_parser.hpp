#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <httplib.h>
#include <nlohmann/json.hpp>

namespace comserver {
namespace http {

enum class ArgType { STRING, INT, BOOL };

/**
 * @brief One declared request argument
 *
 * Declared fluently:
 * ```cpp
 * parser.add_argument("data").required().append().help("Data to send");
 * parser.add_argument("num_before", ArgType::INT).default_value(0).min_value(0);
 * ```
 */
class Argument {
public:
    Argument(std::string name, ArgType type) : name_(std::move(name)), type_(type) {}

    Argument &required(bool value = true) {
        required_ = value;
        return *this;
    }
    Argument &nullable(bool value = true) {
        nullable_ = value;
        return *this;
    }
    // Collect every occurrence (JSON array or repeated form/query/multipart key) into a list
    Argument &append(bool value = true) {
        append_ = value;
        return *this;
    }
    Argument &default_value(nlohmann::json value) {
        default_ = std::move(value);
        return *this;
    }
    Argument &min_value(int64_t value) {
        min_ = value;
        return *this;
    }
    Argument &help(std::string text) {
        help_ = std::move(text);
        return *this;
    }

    const std::string &name() const { return name_; }
    ArgType type() const { return type_; }
    bool is_required() const { return required_; }
    bool is_nullable() const { return nullable_; }
    bool is_append() const { return append_; }
    const nlohmann::json &get_default() const { return default_; }
    const std::optional<int64_t> &get_min() const { return min_; }
    const std::string &get_help() const { return help_; }

private:
    std::string name_;
    ArgType type_;
    bool required_ = false;
    bool nullable_ = false;
    bool append_ = false;
    nlohmann::json default_;  // null when the argument has no default
    std::optional<int64_t> min_;
    std::string help_;
};

/**
 * @brief Validates and normalizes request arguments for one endpoint
 *
 * Arguments are read from a JSON object body (Content-Type: application/json),
 * from req.params, which httplib fills from the query string and from
 * url-encoded form bodies, and from multipart/form-data fields (req.files).
 * A key present in the JSON body wins.
 *
 * On success `args` is a JSON object holding every declared argument, with
 * values converted to their declared type (or the default / null).
 * On failure `error` is a complete {"message": ...} response body and the
 * caller must answer 400 without touching the connection.
 */
class RequestParser {
public:
    Argument &add_argument(const std::string &name, ArgType type = ArgType::STRING);

    bool parse_args(const httplib::Request &req, nlohmann::json &args, nlohmann::json &error,
                    bool strict = true) const;

    const std::vector<Argument> &arguments() const { return arguments_; }

private:
    std::vector<Argument> arguments_;
};

// Conversion of a single raw value to `type`; returns false with a reason
bool convert_value(const nlohmann::json &raw, ArgType type, nlohmann::json &out, std::string &reason);

std::string arg_type_to_string(ArgType type);

}  // namespace http
}  // namespace comserver
