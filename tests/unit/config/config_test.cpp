#include <gtest/gtest.h>
#include <kgrag/config/config.h>

#include <unistd.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>

using namespace kgrag;
using namespace kgrag::config;

namespace fs = std::filesystem;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        testHome_ = fs::temp_directory_path() / ("kgrag_config_test_" + std::to_string(::getpid()));
        fs::create_directories(testHome_ / "config" / "kgrag");
        fs::create_directories(testHome_ / "data");
        setenv("XDG_CONFIG_HOME", (testHome_ / "config").string().c_str(), 1);
        setenv("XDG_DATA_HOME", (testHome_ / "data").string().c_str(), 1);
        for (const char* name : {"KGRAG_CONFIG_PATH", "KGRAG_GRAPH_DB", "KGRAG_VECTOR_DB",
                                 "KGRAG_MAX_WORKERS", "KGRAG_LOG_LEVEL"})
            unsetenv(name);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(testHome_, ec);
        unsetenv("XDG_CONFIG_HOME");
        unsetenv("XDG_DATA_HOME");
        for (const char* name : {"KGRAG_CONFIG_PATH", "KGRAG_GRAPH_DB", "KGRAG_VECTOR_DB",
                                 "KGRAG_MAX_WORKERS", "KGRAG_LOG_LEVEL"})
            unsetenv(name);
    }

    fs::path writeConfig(const std::string& text) {
        auto path = testHome_ / "config" / "kgrag" / "config.json";
        std::ofstream(path) << text;
        return path;
    }

    fs::path testHome_;
};

TEST_F(ConfigTest, DefaultsWithoutAFile) {
    auto cfg = loadConfig();
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.retrieval.vector_top_k, 12u);
    EXPECT_EQ(c.retrieval.graph_top_k, 8u);
    EXPECT_EQ(c.retrieval.final_top_k, 4u);
    EXPECT_DOUBLE_EQ(c.thresholds.thetaAdd, 0.55);
    EXPECT_DOUBLE_EQ(c.thresholds.thetaShow, 0.60);
    EXPECT_EQ(c.chunking.chunk_size, 800u);
    EXPECT_EQ(c.chunking.overlap, 120u);
    EXPECT_EQ(c.orchestrator.max_workers, 16u);
    EXPECT_EQ(c.orchestrator.task_timeout, std::chrono::milliseconds(120000));
    EXPECT_EQ(c.storage.graph_db_path, (testHome_ / "data" / "kgrag" / "graph.db").string());
    EXPECT_EQ(c.storage.vector_db_path, (testHome_ / "data" / "kgrag" / "vectors.db").string());
}

TEST_F(ConfigTest, FileValuesOverrideDefaults) {
    writeConfig(R"({
        "log_level": "debug",
        "retrieval": {"final_top_k": 6, "alpha": 0.5, "beta": 0.5, "use_reranker": true},
        "orchestrator": {"max_workers": 2, "task_timeout_ms": 1000, "retry_backoff_ms": 10},
        "thresholds": {"theta_add": 0.5},
        "storage": {"graph_db_path": "/tmp/kg.db"},
        "unknown_section": {"x": 1}
    })");
    auto cfg = loadConfig();
    ASSERT_TRUE(cfg) << cfg.error().message;
    const auto& c = cfg.value();
    EXPECT_EQ(c.log_level, "debug");
    EXPECT_EQ(c.retrieval.final_top_k, 6u);
    EXPECT_TRUE(c.retrieval.use_reranker);
    EXPECT_EQ(c.retrieval.vector_top_k, 12u);
    EXPECT_EQ(c.orchestrator.max_workers, 2u);
    EXPECT_EQ(c.orchestrator.task_timeout, std::chrono::milliseconds(1000));
    EXPECT_EQ(c.orchestrator.retry_backoff, std::chrono::milliseconds(10));
    EXPECT_DOUBLE_EQ(c.thresholds.thetaAdd, 0.5);
    EXPECT_EQ(c.storage.graph_db_path, "/tmp/kg.db");
}

TEST_F(ConfigTest, EnvironmentOverridesFile) {
    writeConfig(R"({"orchestrator": {"max_workers": 2}})");
    setenv("KGRAG_MAX_WORKERS", "5", 1);
    setenv("KGRAG_GRAPH_DB", "/tmp/env_graph.db", 1);
    setenv("KGRAG_LOG_LEVEL", "warn", 1);
    auto cfg = loadConfig();
    ASSERT_TRUE(cfg) << cfg.error().message;
    EXPECT_EQ(cfg.value().orchestrator.max_workers, 5u);
    EXPECT_EQ(cfg.value().storage.graph_db_path, "/tmp/env_graph.db");
    EXPECT_EQ(cfg.value().log_level, "warn");
}

TEST_F(ConfigTest, BadEnvironmentValuesAreRejected) {
    setenv("KGRAG_MAX_WORKERS", "zero", 1);
    auto cfg = loadConfig();
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::ValidationError);

    setenv("KGRAG_MAX_WORKERS", "3", 1);
    setenv("KGRAG_LOG_LEVEL", "loud", 1);
    EXPECT_FALSE(loadConfig());
}

TEST_F(ConfigTest, ExplicitMissingPathIsAnError) {
    auto cfg = loadConfig((testHome_ / "missing.json").string());
    ASSERT_FALSE(cfg);
    EXPECT_EQ(cfg.error().code, ErrorCode::FileNotFound);

    setenv("KGRAG_CONFIG_PATH", (testHome_ / "also_missing.json").string().c_str(), 1);
    auto viaEnv = loadConfig();
    ASSERT_FALSE(viaEnv);
    EXPECT_EQ(viaEnv.error().code, ErrorCode::FileNotFound);
}

TEST_F(ConfigTest, MalformedFilesAreValidationErrors) {
    writeConfig("{ not json");
    auto broken = loadConfig();
    ASSERT_FALSE(broken);
    EXPECT_EQ(broken.error().code, ErrorCode::ValidationError);

    writeConfig(R"({"retrieval": {"final_top_k": "four"}})");
    auto wrongType = loadConfig();
    ASSERT_FALSE(wrongType);
    EXPECT_NE(wrongType.error().message.find("retrieval.final_top_k"), std::string::npos);

    writeConfig(R"({"chunking": {"chunk_size": 100, "overlap": 100}})");
    auto invalid = loadConfig();
    ASSERT_FALSE(invalid);
    EXPECT_NE(invalid.error().message.find("chunking"), std::string::npos);

    writeConfig(R"({"embedding": {"metric": "manhattan"}})");
    EXPECT_FALSE(loadConfig());

    writeConfig(R"({"storage": []})");
    EXPECT_FALSE(loadConfig());
}

TEST_F(ConfigTest, JsonRoundTripPreservesValues) {
    KgragConfig original;
    original.retrieval.alpha = 0.6;
    original.retrieval.beta = 0.4;
    original.orchestrator.retry_count = 1;
    original.embedding.metric = "dot";
    original.log_level = "error";

    auto parsed = fromJson(toJson(original));
    ASSERT_TRUE(parsed) << parsed.error().message;
    EXPECT_EQ(toJson(parsed.value()), toJson(original));
    EXPECT_EQ(parsed.value().embedding.metric, "dot");
}

TEST(ConfigPathTest, ExpandsTilde) {
    const char* home = std::getenv("HOME");
    if (!home)
        GTEST_SKIP() << "HOME is not set";
    EXPECT_EQ(expand_tilde("~/x/y.json").string(), (fs::path(home) / "x/y.json").string());
    EXPECT_EQ(expand_tilde("/abs/path").string(), "/abs/path");
    EXPECT_EQ(get_config_path("/explicit.json").string(), "/explicit.json");
    EXPECT_TRUE(isValidLogLevel("critical"));
    EXPECT_FALSE(isValidLogLevel("verbose"));
}
