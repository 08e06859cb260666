#include "request_parser.hpp"

#include <algorithm>
#include <cctype>

namespace comserver {
namespace http {

namespace {

const char *kMissingDetail = "Missing required parameter in the JSON body or the post body or the query string";

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return std::tolower(c); });
    return s;
}

bool is_json_request(const httplib::Request &req) {
    const std::string content_type = to_lower(req.get_header_value("Content-Type"));
    return content_type.find("application/json") != std::string::npos;
}

bool parse_int(const std::string &text, int64_t &value) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t pos = 0;
        long long parsed = std::stoll(text, &pos, 10);
        if (pos != text.size()) {
            return false;
        }
        value = static_cast<int64_t>(parsed);
        return true;
    } catch (const std::exception &) {
        return false;
    }
}

std::string format_error(const Argument &arg, const std::string &detail) {
    if (arg.get_help().empty()) {
        return detail;
    }
    return arg.get_help() + " (" + detail + ")";
}

}  // namespace

std::string arg_type_to_string(ArgType type) {
    switch (type) {
        case ArgType::STRING:
            return "string";
        case ArgType::INT:
            return "integer";
        case ArgType::BOOL:
            return "boolean";
        default:
            return "unknown";
    }
}

bool convert_value(const nlohmann::json &raw, ArgType type, nlohmann::json &out, std::string &reason) {
    switch (type) {
        case ArgType::STRING:
            if (raw.is_string()) {
                out = raw;
                return true;
            }
            if (raw.is_number() || raw.is_boolean()) {
                out = raw.dump();
                return true;
            }
            reason = "expected a string";
            return false;

        case ArgType::INT: {
            if (raw.is_number_integer()) {
                out = raw.get<int64_t>();
                return true;
            }
            int64_t value = 0;
            if (raw.is_string() && parse_int(raw.get<std::string>(), value)) {
                out = value;
                return true;
            }
            reason = "expected an integer";
            return false;
        }

        case ArgType::BOOL: {
            if (raw.is_boolean()) {
                out = raw;
                return true;
            }
            if (raw.is_number_integer()) {
                const int64_t value = raw.get<int64_t>();
                if (value == 0 || value == 1) {
                    out = (value == 1);
                    return true;
                }
            }
            if (raw.is_string()) {
                const std::string s = to_lower(raw.get<std::string>());
                if (s == "true" || s == "1" || s == "yes" || s == "on") {
                    out = true;
                    return true;
                }
                if (s == "false" || s == "0" || s == "no" || s == "off") {
                    out = false;
                    return true;
                }
            }
            reason = "expected a boolean";
            return false;
        }

        default:
            reason = "unsupported argument type";
            return false;
    }
}

Argument &RequestParser::add_argument(const std::string &name, ArgType type) {
    arguments_.emplace_back(name, type);
    return arguments_.back();
}

bool RequestParser::parse_args(const httplib::Request &req, nlohmann::json &args, nlohmann::json &error,
                               bool strict) const {
    nlohmann::json body = nlohmann::json::object();
    if (is_json_request(req) && !req.body.empty()) {
        try {
            body = nlohmann::json::parse(req.body);
        } catch (const nlohmann::json::parse_error &e) {
            error = {{"message", std::string("Failed to decode JSON object: ") + e.what()}};
            return false;
        }
        if (!body.is_object()) {
            error = {{"message", "Failed to decode JSON object: body must be a JSON object"}};
            return false;
        }
    }

    args = nlohmann::json::object();

    for (const auto &arg : arguments_) {
        // Gather raw occurrences, JSON body first
        std::vector<nlohmann::json> raw_values;
        auto body_it = body.find(arg.name());
        if (body_it != body.end()) {
            if (arg.is_append() && body_it->is_array()) {
                for (const auto &item : *body_it) {
                    raw_values.push_back(item);
                }
            } else {
                raw_values.push_back(*body_it);
            }
        } else {
            auto range = req.params.equal_range(arg.name());
            for (auto it = range.first; it != range.second; ++it) {
                raw_values.emplace_back(it->second);
            }
            // multipart/form-data fields land in req.files, not req.params
            auto parts = req.files.equal_range(arg.name());
            for (auto it = parts.first; it != parts.second; ++it) {
                raw_values.emplace_back(it->second.content);
            }
        }

        if (raw_values.empty()) {
            if (arg.is_required()) {
                error = {{"message", {{arg.name(), format_error(arg, kMissingDetail)}}}};
                return false;
            }
            args[arg.name()] = arg.get_default();
            continue;
        }

        if (!arg.is_append() && arg.is_nullable() && raw_values.front().is_null()) {
            args[arg.name()] = nullptr;
            continue;
        }

        nlohmann::json converted_list = nlohmann::json::array();
        for (const auto &raw : raw_values) {
            nlohmann::json converted;
            std::string reason;
            if (raw.is_null()) {
                reason = "must not be null";
            }
            if (!reason.empty() || !convert_value(raw, arg.type(), converted, reason)) {
                error = {{"message", {{arg.name(), format_error(arg, reason)}}}};
                return false;
            }
            if (arg.get_min().has_value() && converted.is_number_integer() &&
                converted.get<int64_t>() < *arg.get_min()) {
                error = {{"message",
                          {{arg.name(), format_error(arg, "must be >= " + std::to_string(*arg.get_min()))}}}};
                return false;
            }
            converted_list.push_back(converted);
        }

        if (arg.is_append()) {
            args[arg.name()] = converted_list;
        } else {
            // Last occurrence wins for repeated scalar keys
            args[arg.name()] = converted_list.back();
        }
    }

    if (strict) {
        std::vector<std::string> unknown;
        auto is_declared = [this](const std::string &key) {
            return std::any_of(arguments_.begin(), arguments_.end(),
                               [&key](const Argument &arg) { return arg.name() == key; });
        };
        for (const auto &item : body.items()) {
            if (!is_declared(item.key())) {
                unknown.push_back(item.key());
            }
        }
        auto note_unknown = [&](const std::string &key) {
            if (!is_declared(key) && std::find(unknown.begin(), unknown.end(), key) == unknown.end()) {
                unknown.push_back(key);
            }
        };
        for (const auto &param : req.params) {
            note_unknown(param.first);
        }
        for (const auto &part : req.files) {
            note_unknown(part.first);
        }

        if (!unknown.empty()) {
            std::string joined;
            for (size_t i = 0; i < unknown.size(); ++i) {
                if (i > 0) {
                    joined += ", ";
                }
                joined += unknown[i];
            }
            error = {{"message", "Unknown arguments: " + joined}};
            return false;
        }
    }

    return true;
}

}  // namespace http
}  // namespace comserver
