// ─────────────────────────────────────────────────────────────────────────────
// test_config.cpp  –  Config File Loader
// ─────────────────────────────────────────────────────────────────────────────

#include "config.h"

#include <gtest/gtest.h>

#include <cstdio>
#include <fstream>
#include <string>

namespace swing {
namespace {

class ConfigFileTest : public ::testing::Test {
protected:
    void TearDown() override {
        if (!path_.empty()) std::remove(path_.c_str());
    }

    const std::string& write(const std::string& body) {
        path_ = ::testing::TempDir() + "swing_config_test.json";
        std::ofstream out(path_);
        out << body;
        return path_;
    }

    std::string path_;
};

TEST(AppConfig, Defaults) {
    AppConfig cfg;
    EXPECT_EQ(cfg.source, "-");
    EXPECT_EQ(cfg.telemetry_port, 7001);
    EXPECT_EQ(cfg.api_port, 8080);
    EXPECT_DOUBLE_EQ(cfg.detector.sensitivity, 1.0);
    EXPECT_EQ(cfg.detector.buffer_capacity, 300u);
    EXPECT_EQ(cfg.detector.retained_samples, 200u);
    EXPECT_FALSE(cfg.show_gui);
}

TEST_F(ConfigFileTest, OverridesGivenKeysOnly) {
    const auto& path = write(
        "{\n"
        "  \"sensitivity\": 1.2,\n"
        "  \"buffer_capacity\": 400,\n"
        "  \"retained_samples\": 0,\n"
        "  \"hand_speed_factor\": 2,\n"
        "  \"source\": \"range_session.csv\",\n"
        "  \"telemetry_port\": 9000,\n"
        "  \"practice_mode\": 1,\n"
        "  \"verbose\": 0\n"
        "}\n");

    AppConfig cfg;
    ASSERT_TRUE(load_config_file(path, cfg));
    EXPECT_DOUBLE_EQ(cfg.detector.sensitivity, 1.2);
    EXPECT_EQ(cfg.detector.buffer_capacity, 400u);
    EXPECT_EQ(cfg.detector.retained_samples, 0u);
    EXPECT_DOUBLE_EQ(cfg.detector.hand_speed_factor, 2.0);
    EXPECT_EQ(cfg.source, "range_session.csv");
    EXPECT_EQ(cfg.telemetry_port, 9000);
    EXPECT_TRUE(cfg.practice_mode);
    EXPECT_FALSE(cfg.detector.log_events);

    // Untouched keys keep their defaults
    EXPECT_EQ(cfg.api_port, 8080);
    EXPECT_EQ(cfg.telemetry_host, "127.0.0.1");
    EXPECT_DOUBLE_EQ(cfg.detector.clubhead_factor, 4.0);
}

TEST_F(ConfigFileTest, OutOfRangeSensitivityIsClamped) {
    const auto& path = write("{ \"sensitivity\": 2.5 }\n");
    AppConfig cfg;
    ASSERT_TRUE(load_config_file(path, cfg));
    EXPECT_DOUBLE_EQ(cfg.detector.sensitivity, kMaxSensitivity);
}

TEST_F(ConfigFileTest, InvalidPortRejected) {
    const auto& path = write("{ \"api_port\": 70000, \"sensitivity\": 0.7 }\n");
    AppConfig cfg;
    EXPECT_FALSE(load_config_file(path, cfg));
    EXPECT_EQ(cfg.api_port, 8080);
    EXPECT_DOUBLE_EQ(cfg.detector.sensitivity, 1.0);
}

TEST_F(ConfigFileTest, NegativeCountRejected) {
    const auto& path = write("{ \"session_window\": -3 }\n");
    AppConfig cfg;
    EXPECT_FALSE(load_config_file(path, cfg));
    EXPECT_EQ(cfg.detector.session_window, 20u);
}

TEST_F(ConfigFileTest, ZeroBufferCapacityRejected) {
    const auto& path = write("{ \"buffer_capacity\": 0 }\n");
    AppConfig cfg;
    EXPECT_FALSE(load_config_file(path, cfg));
    EXPECT_EQ(cfg.detector.buffer_capacity, 300u);
}

TEST(ConfigFile, MissingFileRejected) {
    AppConfig cfg;
    EXPECT_FALSE(load_config_file(::testing::TempDir() + "no_such_config.json", cfg));
    EXPECT_EQ(cfg.source, "-");
}

}  // namespace
}  // namespace swing
