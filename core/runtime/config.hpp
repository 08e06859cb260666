#pragma once

#include <string>
#include <vector>

namespace comserver {
namespace runtime {

struct HttpConfig {
    std::string bind = "127.0.0.1";                      // Bind address
    int port = 8080;                                     // HTTP port
    int thread_pool_size = 8;                            // Worker threads (each may block on the serial line)
    int read_timeout_s = 5;                              // Socket read timeout
    int write_timeout_s = 5;                             // Socket write timeout
    std::vector<std::string> cors_allowed_origins{"*"};  // CORS allowlist ("*" = allow all)
    bool cors_allow_credentials = false;                 // Whether to emit Access-Control-Allow-Credentials
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error, none
};

struct ServerConfig {
    HttpConfig http;
    LoggingConfig logging;
};

// Loads configuration from a YAML file; missing keys keep their defaults
bool load_config(const std::string &config_path, ServerConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const ServerConfig &config, std::string &error);

// Sets the process-wide log threshold from a validated logging section
void apply_logging_config(const LoggingConfig &logging_config);

}  // namespace runtime
}  // namespace comserver
