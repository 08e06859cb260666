#include "runtime/config.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>

#include "logging/logger.hpp"

namespace fs = std::filesystem;
using namespace comserver::runtime;

class ConfigTest : public ::testing::Test {
protected:
    fs::path temp_dir;

    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "comserver_config_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        if (fs::exists(temp_dir)) {
            fs::remove_all(temp_dir);
        }
    }

    std::string create_config_file(const std::string& name, const std::string& content) {
        fs::path config_path = temp_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }
};

TEST_F(ConfigTest, ValidFullConfig) {
    std::string config_content = R"(
http:
  bind: 0.0.0.0
  port: 9000
  thread_pool_size: 16
  read_timeout_s: 10
  write_timeout_s: 12
  cors_allowed_origins:
    - http://localhost:3000
    - https://*.example.com
  cors_allow_credentials: true

logging:
  level: debug
)";

    std::string config_path = create_config_file("full.yaml", config_content);
    ServerConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.http.bind, "0.0.0.0");
    EXPECT_EQ(config.http.port, 9000);
    EXPECT_EQ(config.http.thread_pool_size, 16);
    EXPECT_EQ(config.http.read_timeout_s, 10);
    EXPECT_EQ(config.http.write_timeout_s, 12);
    ASSERT_EQ(config.http.cors_allowed_origins.size(), 2);
    EXPECT_EQ(config.http.cors_allowed_origins[1], "https://*.example.com");
    EXPECT_TRUE(config.http.cors_allow_credentials);
    EXPECT_EQ(config.logging.level, "debug");
}

TEST_F(ConfigTest, MissingKeysKeepDefaults) {
    std::string config_path = create_config_file("partial.yaml", "http:\n  port: 8181\n");
    ServerConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.http.port, 8181);
    EXPECT_EQ(config.http.bind, "127.0.0.1");
    EXPECT_EQ(config.http.thread_pool_size, 8);
    ASSERT_EQ(config.http.cors_allowed_origins.size(), 1);
    EXPECT_EQ(config.http.cors_allowed_origins[0], "*");
    EXPECT_EQ(config.logging.level, "info");
}

TEST_F(ConfigTest, EmptyFileIsDefaults) {
    std::string config_path = create_config_file("empty.yaml", "");
    ServerConfig config;
    std::string error;

    EXPECT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.http.port, 8080);
}

TEST_F(ConfigTest, ScalarCorsOrigin) {
    std::string config_path =
        create_config_file("cors.yaml", "http:\n  cors_allowed_origins: http://localhost:5173\n");
    ServerConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    ASSERT_EQ(config.http.cors_allowed_origins.size(), 1);
    EXPECT_EQ(config.http.cors_allowed_origins[0], "http://localhost:5173");
}

TEST_F(ConfigTest, EmptyCorsListRejected) {
    std::string config_path = create_config_file("cors_empty.yaml", "http:\n  cors_allowed_origins: []\n");
    ServerConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("cors_allowed_origins"), std::string::npos);
}

TEST_F(ConfigTest, InvalidPort) {
    std::string config_path = create_config_file("port.yaml", "http:\n  port: 70000\n");
    ServerConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("port"), std::string::npos);
}

TEST_F(ConfigTest, InvalidThreadPoolSize) {
    std::string config_path = create_config_file("pool.yaml", "http:\n  thread_pool_size: 0\n");
    ServerConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("thread_pool_size"), std::string::npos);
}

TEST_F(ConfigTest, InvalidLogLevel) {
    std::string config_path = create_config_file("invalid_log.yaml", "logging:\n  level: INVALID_LEVEL\n");
    ServerConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("log level"), std::string::npos);
}

TEST_F(ConfigTest, NoneLogLevelAccepted) {
    std::string config_path = create_config_file("quiet.yaml", "logging:\n  level: none\n");
    ServerConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << error;
    EXPECT_EQ("none", config.logging.level);
}

TEST_F(ConfigTest, ApplyLoggingConfigSetsLoggerLevel) {
    using comserver::logging::Level;
    using comserver::logging::Logger;

    const Level saved = Logger::level();

    LoggingConfig logging_config;
    logging_config.level = "warn";
    apply_logging_config(logging_config);
    EXPECT_EQ(Level::LVL_WARN, Logger::level());

    logging_config.level = "none";
    apply_logging_config(logging_config);
    EXPECT_EQ(Level::LVL_NONE, Logger::level());

    Logger::set_level(saved);
}

TEST_F(ConfigTest, WrongValueTypeIsReported) {
    std::string config_path = create_config_file("bad_type.yaml", "http:\n  port: eighty\n");
    ServerConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("Config load error"), std::string::npos);
}

TEST_F(ConfigTest, MalformedYaml) {
    std::string config_path = create_config_file("malformed.yaml", "http: [unclosed\n");
    ServerConfig config;
    std::string error;

    EXPECT_FALSE(load_config(config_path, config, error));
    EXPECT_NE(error.find("YAML parse error"), std::string::npos);
}

TEST_F(ConfigTest, MissingFile) {
    ServerConfig config;
    std::string error;

    EXPECT_FALSE(load_config((temp_dir / "does_not_exist.yaml").string(), config, error));
    EXPECT_NE(error.find("Cannot open config file"), std::string::npos);
}

TEST_F(ConfigTest, UnknownTopLevelKeysAreIgnored) {
    std::string config_path = create_config_file("unknown.yaml", "serial:\n  port: /dev/ttyUSB0\nhttp:\n  port: 8081\n");
    ServerConfig config;
    std::string error;

    ASSERT_TRUE(load_config(config_path, config, error)) << "Error: " << error;
    EXPECT_EQ(config.http.port, 8081);
}

TEST(ConfigValidationTest, DefaultsAreValid) {
    ServerConfig config;
    std::string error;
    EXPECT_TRUE(validate_config(config, error)) << error;
}

TEST(ConfigValidationTest, RejectsZeroTimeouts) {
    ServerConfig config;
    config.http.write_timeout_s = 0;
    std::string error;
    EXPECT_FALSE(validate_config(config, error));
    EXPECT_NE(error.find("timeout"), std::string::npos);
}
