#include "core/Config.hpp"
#include "core/Errors.hpp"
#include <gtest/gtest.h>

using namespace gitea_mcp;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.base_url = "https://gitea.example.com";
        config.token = "secret";
    }

    std::string ValidationMessage() {
        try {
            config.validate();
        } catch (const ConfigError& e) {
            return e.what();
        }
        return {};
    }

    ServerConfig config;
};

TEST_F(ConfigTest, DefaultsAreValid) {
    EXPECT_NO_THROW(config.validate());
    EXPECT_EQ(config.log_level, "info");
    EXPECT_EQ(config.timeout_ms, 30000);
    EXPECT_EQ(config.max_message_bytes, kDefaultMaxMessageBytes);
    EXPECT_GE(kDefaultMaxMessageBytes, kMinMessageBytes);
}

TEST_F(ConfigTest, UrlAndTokenAreRequired) {
    config.base_url.clear();
    EXPECT_EQ(ValidationMessage(), "--url or GITEA_URL is required");

    config.base_url = "http://localhost:3000";
    config.token.clear();
    EXPECT_EQ(ValidationMessage(), "--token or GITEA_TOKEN is required");
}

TEST_F(ConfigTest, RejectsUrlWithoutScheme) {
    config.base_url = "gitea.example.com";
    EXPECT_THROW(config.validate(), ConfigError);
}

TEST_F(ConfigTest, LogLevels) {
    for (const char* level : {"trace", "debug", "info", "warn", "error", "critical", "off"}) {
        config.log_level = level;
        EXPECT_NO_THROW(config.validate()) << level;
    }

    config.log_level = "verbose";
    EXPECT_EQ(ValidationMessage(), "Invalid log level: verbose");
}

TEST_F(ConfigTest, RejectsNegativeTimeout) {
    config.timeout_ms = -1;
    EXPECT_THROW(config.validate(), ConfigError);

    config.timeout_ms = 0;
    EXPECT_NO_THROW(config.validate());
}

TEST_F(ConfigTest, RejectsTooSmallMessageLimit) {
    config.max_message_bytes = 1024;
    EXPECT_THROW(config.validate(), ConfigError);

    config.max_message_bytes = kMinMessageBytes;
    EXPECT_NO_THROW(config.validate());
}
