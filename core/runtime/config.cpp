#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>

#include "../logging/logger.hpp"

namespace comserver {
namespace runtime {

bool validate_config(const ServerConfig &config, std::string &error) {
    // Validate HTTP settings
    if (config.http.bind.empty()) {
        error = "http.bind must not be empty";
        return false;
    }
    if (config.http.port < 1 || config.http.port > 65535) {
        error = "HTTP port must be between 1 and 65535";
        return false;
    }
    if (config.http.thread_pool_size < 1) {
        error = "HTTP thread_pool_size must be at least 1";
        return false;
    }
    if (config.http.read_timeout_s < 1 || config.http.write_timeout_s < 1) {
        error = "HTTP read_timeout_s and write_timeout_s must be at least 1";
        return false;
    }
    if (config.http.cors_allowed_origins.empty()) {
        error = "http.cors_allowed_origins must not be empty";
        return false;
    }

    // Validate Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error" && config.logging.level != "none") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, ServerConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        if (yaml.IsNull()) {
            // Empty file: defaults only
            return validate_config(config, error);
        }
        if (!yaml.IsMap()) {
            error = "Config root must be a mapping";
            return false;
        }

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"http", "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            if (std::find(valid_keys.begin(), valid_keys.end(), key) == valid_keys.end()) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        // Load HTTP config
        if (yaml["http"]) {
            const auto &http = yaml["http"];
            if (http["bind"]) {
                config.http.bind = http["bind"].as<std::string>();
            }
            if (http["port"]) {
                config.http.port = http["port"].as<int>();
            }
            if (http["thread_pool_size"]) {
                config.http.thread_pool_size = http["thread_pool_size"].as<int>();
            }
            if (http["read_timeout_s"]) {
                config.http.read_timeout_s = http["read_timeout_s"].as<int>();
            }
            if (http["write_timeout_s"]) {
                config.http.write_timeout_s = http["write_timeout_s"].as<int>();
            }

            // CORS allowlist (supports scalar or sequence)
            if (http["cors_allowed_origins"]) {
                const auto &origins_node = http["cors_allowed_origins"];
                config.http.cors_allowed_origins.clear();
                if (origins_node.IsSequence()) {
                    for (const auto &origin : origins_node) {
                        config.http.cors_allowed_origins.push_back(origin.as<std::string>());
                    }
                } else if (origins_node.IsScalar()) {
                    config.http.cors_allowed_origins.push_back(origins_node.as<std::string>());
                }
            }
            if (http["cors_allow_credentials"]) {
                config.http.cors_allow_credentials = http["cors_allow_credentials"].as<bool>();
            }
        }

        // Load logging config
        if (yaml["logging"]) {
            if (yaml["logging"]["level"]) {
                config.logging.level = yaml["logging"]["level"].as<std::string>();
            }
        }

    } catch (const YAML::BadFile &) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }

    return validate_config(config, error);
}

void apply_logging_config(const LoggingConfig &logging_config) {
    logging::Logger::set_level(logging::string_to_level(logging_config.level));
    LOG_INFO("[Config] Log level set to " << logging::level_to_string(logging::Logger::level()));
}

}  // namespace runtime
}  // namespace comserver
