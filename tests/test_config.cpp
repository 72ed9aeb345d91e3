#include <gtest/gtest.h>
#include "core/config.h"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>

using namespace tessera::core;
namespace fs = std::filesystem;

// ============================================================================
// Parsing
// ============================================================================

TEST(PipelineConfigTest, DefaultsMatchBuiltInTable) {
    PipelineConfig config;
    EXPECT_EQ(config.padding, 2);
    EXPECT_EQ(config.decode_timeout, std::chrono::milliseconds(2000));
    EXPECT_EQ(config.rolling_window, 2u);
    EXPECT_FALSE(config.tier_override.has_value());
    EXPECT_EQ(config.lod_table[7].resolution, 768);
}

TEST(PipelineConfigTest, ParsesAllSections) {
    std::istringstream input(
        "# pipeline tuning\n"
        "[pipeline]\n"
        "padding = 4\n"
        "decode_timeout_ms = 0\n"
        "rolling_window = 3\n"
        "log_level = debug\n"
        "\n"
        "; device facts\n"
        "[device]\n"
        "total_memory_mb = 8192\n"
        "max_texture_size = 8192\n"
        "tier = medium\n"
        "\n"
        "[lod 0]\n"
        "resolution = 48\n");
    PipelineConfig config;
    std::string error;
    ASSERT_TRUE(parse_pipeline_config(input, config, error)) << error;

    EXPECT_EQ(config.padding, 4);
    EXPECT_EQ(config.decode_timeout, std::chrono::milliseconds(0));
    EXPECT_EQ(config.rolling_window, 3u);
    ASSERT_TRUE(config.log_level.has_value());
    EXPECT_EQ(*config.log_level, LogLevel::Debug);
    EXPECT_EQ(config.device.total_memory_mb, 8192);
    EXPECT_EQ(config.device.max_texture_size, 8192);
    ASSERT_TRUE(config.tier_override.has_value());
    EXPECT_EQ(*config.tier_override, DeviceTier::MEDIUM);
    EXPECT_EQ(config.lod_table[0].resolution, 48);
    EXPECT_EQ(config.lod_table[1].resolution, 64);
}

TEST(PipelineConfigTest, EmptyInputKeepsDefaults) {
    std::istringstream input("\n# nothing\n");
    PipelineConfig config;
    std::string error;
    ASSERT_TRUE(parse_pipeline_config(input, config, error)) << error;
    EXPECT_EQ(config.padding, 2);
}

TEST(PipelineConfigTest, RejectsUnknownKeyWithLineNumber) {
    std::istringstream input("[pipeline]\npadding = 2\ncolour = red\n");
    PipelineConfig config;
    std::string error;
    EXPECT_FALSE(parse_pipeline_config(input, config, error));
    EXPECT_NE(error.find("unknown key 'colour'"), std::string::npos);
    EXPECT_NE(error.find("at line 3"), std::string::npos);
}

TEST(PipelineConfigTest, RejectsEntryOutsideSection) {
    std::istringstream input("padding = 2\n");
    PipelineConfig config;
    std::string error;
    EXPECT_FALSE(parse_pipeline_config(input, config, error));
    EXPECT_NE(error.find("at line 1"), std::string::npos);
}

TEST(PipelineConfigTest, RejectsOutOfRangeLodIndex) {
    std::istringstream input("[lod 8]\nresolution = 10\n");
    PipelineConfig config;
    std::string error;
    EXPECT_FALSE(parse_pipeline_config(input, config, error));
    EXPECT_NE(error.find("invalid lod index"), std::string::npos);
}

TEST(PipelineConfigTest, RejectsBadValues) {
    PipelineConfig config;
    std::string error;

    std::istringstream negative("[pipeline]\npadding = -1\n");
    EXPECT_FALSE(parse_pipeline_config(negative, config, error));

    std::istringstream zero_window("[pipeline]\nrolling_window = 0\n");
    EXPECT_FALSE(parse_pipeline_config(zero_window, config, error));

    std::istringstream tier("[device]\ntier = huge\n");
    EXPECT_FALSE(parse_pipeline_config(tier, config, error));

    std::istringstream section("[network]\n");
    EXPECT_FALSE(parse_pipeline_config(section, config, error));
}

TEST(PipelineConfigTest, RejectsBrokenLodTable) {
    std::istringstream input("[lod 3]\nzoom_min = 1.0\n");
    PipelineConfig config;
    std::string error;
    EXPECT_FALSE(parse_pipeline_config(input, config, error));
    EXPECT_EQ(error.rfind("invalid lod table: ", 0), 0u);
}

TEST(PipelineConfigTest, FailureLeavesOutputUntouched) {
    std::istringstream input("[pipeline]\npadding = 9\nbogus = 1\n");
    PipelineConfig config;
    std::string error;
    EXPECT_FALSE(parse_pipeline_config(input, config, error));
    EXPECT_EQ(config.padding, 2);
}

// ============================================================================
// Files
// ============================================================================

TEST(PipelineConfigTest, LoadsExplicitFile) {
    const fs::path path = fs::temp_directory_path() / "tessera_config_test.cfg";
    {
        std::ofstream out(path);
        out << "[pipeline]\npadding = 6\n";
    }
    PipelineConfig config;
    std::string error;
    ASSERT_TRUE(load_pipeline_config(path, config, error)) << error;
    EXPECT_EQ(config.padding, 6);

    std::error_code ec;
    fs::remove(path, ec);
}

TEST(PipelineConfigTest, MissingExplicitFileFails) {
    const fs::path path = fs::temp_directory_path() / "tessera_config_missing.cfg";
    std::error_code ec;
    fs::remove(path, ec);

    PipelineConfig config;
    std::string error;
    EXPECT_FALSE(load_pipeline_config(path, config, error));
    EXPECT_NE(error.find("failed to open"), std::string::npos);
}

TEST(PipelineConfigTest, ErrorsArePrefixedWithPath) {
    const fs::path path = fs::temp_directory_path() / "tessera_config_bad.cfg";
    {
        std::ofstream out(path);
        out << "[pipeline]\nnope = 1\n";
    }
    PipelineConfig config;
    std::string error;
    EXPECT_FALSE(load_pipeline_config_from_file(path, config, error));
    EXPECT_EQ(error.rfind(path.string() + ": ", 0), 0u);
    EXPECT_NE(error.find("at line 2"), std::string::npos);

    std::error_code ec;
    fs::remove(path, ec);
}

TEST(PipelineConfigTest, ExplicitPathWinsResolution) {
    const fs::path explicit_path = "/tmp/somewhere/tessera.cfg";
    const auto resolved = resolve_config_path(explicit_path);
    ASSERT_TRUE(resolved.has_value());
    EXPECT_EQ(*resolved, explicit_path);
}
