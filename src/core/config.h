#pragma once

#include "log.h"
#include "lod_policy.h"
#include "memory_budget.h"
#include "shelf_packer.h"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>

namespace tessera::core {

constexpr const char* k_config_env_var = "TESSERA_CONFIG";
constexpr const char* k_user_config_relpath = ".config/tessera/tessera.cfg";

struct PipelineConfig {
    int padding = k_default_padding;
    std::chrono::milliseconds decode_timeout{2000};  // zero waits without limit
    size_t rolling_window = 2;
    DeviceCapabilities device;
    std::optional<DeviceTier> tier_override;
    LodTable lod_table = default_lod_table();
    std::optional<LogLevel> log_level;
};

// Sections: [pipeline], [device], [lod N]. Errors name the offending line.
bool parse_pipeline_config(std::istream& input, PipelineConfig& out, std::string& error);
bool load_pipeline_config_from_file(const std::filesystem::path& path, PipelineConfig& out, std::string& error);

// Explicit path, then $TESSERA_CONFIG, then the per-user file if it exists.
std::optional<std::filesystem::path> resolve_config_path(const std::optional<std::filesystem::path>& explicit_path);

// Loads the resolved file, or keeps the built-in defaults when there is none.
bool load_pipeline_config(const std::optional<std::filesystem::path>& explicit_path,
                          PipelineConfig& out,
                          std::string& error);

} // namespace tessera::core
