#include <gtest/gtest.h>
#include <docpipe/core/config.hpp>
#include <docpipe/processing/coordinator.hpp>
#include <cstdio>
#include <fstream>
#include <unistd.h>

using namespace docpipe;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = "/tmp/docpipe_config_test_" + std::to_string(getpid()) + ".json";
        std::ofstream out(path_.c_str());
        out << R"({
            "log_level": "debug",
            "pipeline": {
                "max_concurrent_jobs": 4,
                "extraction_timeout_ms": 1500,
                "temp_dir": "/tmp/docpipe_custom"
            },
            "cache": { "capacity": 7, "ttl_ms": 2500.0 },
            "tokens": { "default_model": "claude-3-haiku", "ratios": { "gpt-4": 1.0 } },
            "store": { "enabled": true }
        })";
    }

    void TearDown() override {
        std::remove(path_.c_str());
    }

    std::string path_;
};

TEST_F(ConfigTest, DottedKeys) {
    Config cfg;
    ASSERT_TRUE(cfg.load_file(path_));
    EXPECT_EQ(cfg.get_string("log_level", "info"), "debug");
    EXPECT_EQ(cfg.get_int("pipeline.max_concurrent_jobs", 10), 4);
    EXPECT_EQ(cfg.get_int("cache.ttl_ms", 0), 2500);
    EXPECT_TRUE(cfg.get_bool("store.enabled", false));
    ASSERT_NE(cfg.get_object("tokens.ratios"), nullptr);
    EXPECT_TRUE(cfg.get_object("tokens.ratios")->is_object());
}

TEST_F(ConfigTest, MissingOrMistypedKeysGiveDefaults) {
    Config cfg;
    ASSERT_TRUE(cfg.load_file(path_));
    EXPECT_EQ(cfg.get_int("pipeline.nope", 42), 42);
    EXPECT_EQ(cfg.get_int("log_level", 3), 3);
    EXPECT_EQ(cfg.get_string("pipeline.max_concurrent_jobs", "x"), "x");
    EXPECT_EQ(cfg.get_object("log_level.deeper"), nullptr);
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    Config cfg;
    EXPECT_TRUE(cfg.load_file("/tmp/docpipe_no_such_config.json"));
    EXPECT_EQ(cfg.get_int("pipeline.max_concurrent_jobs", 10), 10);
}

TEST_F(ConfigTest, MalformedJsonFails) {
    Config cfg;
    EXPECT_FALSE(cfg.load_string("{ not json"));
    EXPECT_FALSE(cfg.load_string("[1, 2, 3]"));
}

TEST_F(ConfigTest, SettersCreateNestedObjects) {
    Config cfg;
    cfg.set_int("pipeline.job_timeout_ms", 9000);
    cfg.set_string("pipeline.temp_dir", "/var/tmp/x");
    EXPECT_EQ(cfg.get_int("pipeline.job_timeout_ms", 0), 9000);
    EXPECT_EQ(cfg.get_string("pipeline.temp_dir", ""), "/var/tmp/x");
}

TEST_F(ConfigTest, PipelineConfigReadsKeys) {
    Config cfg;
    ASSERT_TRUE(cfg.load_file(path_));
    PipelineConfig pc = PipelineConfig::from_config(cfg);
    EXPECT_EQ(pc.max_concurrent_jobs, 4u);
    EXPECT_EQ(pc.extraction_timeout_ms, 1500);
    EXPECT_EQ(pc.chunking_timeout_ms, 30000);
    EXPECT_EQ(pc.temp_dir, "/tmp/docpipe_custom");
    EXPECT_EQ(pc.cache_capacity, 7u);
    EXPECT_EQ(pc.cache_ttl_ms, 2500);
    EXPECT_EQ(pc.default_model, "claude-3-haiku");
}
