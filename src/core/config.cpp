#include "config.h"

#include "text_parse.h"

#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace tessera::core {
namespace {

enum class Section { NONE, PIPELINE, DEVICE, LOD };

std::string at_line(size_t line_number) {
    return " at line " + std::to_string(line_number);
}

bool apply_pipeline_key(const std::string& key, const std::string& value, PipelineConfig& config, std::string& error) {
    if (key == "padding") {
        int parsed = 0;
        if (!parse_non_negative_int(value, parsed)) {
            error = "invalid padding '" + value + "'";
            return false;
        }
        config.padding = parsed;
    } else if (key == "decode_timeout_ms") {
        int parsed = 0;
        if (!parse_non_negative_int(value, parsed)) {
            error = "invalid decode_timeout_ms '" + value + "'";
            return false;
        }
        config.decode_timeout = std::chrono::milliseconds(parsed);
    } else if (key == "rolling_window") {
        int parsed = 0;
        if (!parse_positive_int(value, parsed)) {
            error = "invalid rolling_window '" + value + "'";
            return false;
        }
        config.rolling_window = static_cast<size_t>(parsed);
    } else if (key == "log_level") {
        LogLevel parsed = LogLevel::Warning;
        if (!parse_log_level(value, parsed, error)) {
            return false;
        }
        config.log_level = parsed;
    } else {
        error = "unknown key '" + key + "'";
        return false;
    }
    return true;
}

bool apply_device_key(const std::string& key, const std::string& value, PipelineConfig& config, std::string& error) {
    if (key == "total_memory_mb") {
        int parsed = 0;
        if (!parse_positive_int(value, parsed)) {
            error = "invalid total_memory_mb '" + value + "'";
            return false;
        }
        config.device.total_memory_mb = parsed;
    } else if (key == "max_texture_size") {
        int parsed = 0;
        if (!parse_positive_int(value, parsed)) {
            error = "invalid max_texture_size '" + value + "'";
            return false;
        }
        config.device.max_texture_size = parsed;
    } else if (key == "tier") {
        DeviceTier parsed = DeviceTier::LOW;
        if (!parse_device_tier(value, parsed, error)) {
            return false;
        }
        config.tier_override = parsed;
    } else {
        error = "unknown key '" + key + "'";
        return false;
    }
    return true;
}

bool apply_lod_key(const std::string& key, const std::string& value, LevelSpec& spec, std::string& error) {
    if (key == "resolution") {
        int parsed = 0;
        if (!parse_positive_int(value, parsed)) {
            error = "invalid resolution '" + value + "'";
            return false;
        }
        spec.resolution = parsed;
    } else if (key == "zoom_min" || key == "zoom_max") {
        double parsed = 0.0;
        if (!parse_non_negative_double(value, parsed)) {
            error = "invalid " + key + " '" + value + "'";
            return false;
        }
        (key == "zoom_min" ? spec.zoom_min : spec.zoom_max) = parsed;
    } else {
        error = "unknown key '" + key + "'";
        return false;
    }
    return true;
}

} // namespace

bool parse_pipeline_config(std::istream& input, PipelineConfig& out, std::string& error) {
    PipelineConfig config = out;
    Section section = Section::NONE;
    int lod_index = 0;
    std::string line;
    size_t line_number = 0;
    while (std::getline(input, line)) {
        ++line_number;
        std::string trimmed = trim_copy(line);
        if (trimmed.empty() || trimmed.front() == '#' || trimmed.front() == ';') {
            continue;
        }

        if (trimmed.front() == '[' && trimmed.back() == ']') {
            std::istringstream iss(trimmed.substr(1, trimmed.size() - 2));
            std::string section_type;
            if (!(iss >> section_type)) {
                error = "empty section header" + at_line(line_number);
                return false;
            }
            section_type = to_lower_copy(section_type);
            if (section_type == "pipeline") {
                section = Section::PIPELINE;
            } else if (section_type == "device") {
                section = Section::DEVICE;
            } else if (section_type == "lod") {
                std::string index_text;
                if (!(iss >> index_text) || !parse_non_negative_int(index_text, lod_index)
                    || lod_index >= k_detail_level_count) {
                    error = "invalid lod index" + at_line(line_number);
                    return false;
                }
                section = Section::LOD;
            } else {
                error = "unsupported section '" + section_type + "'" + at_line(line_number);
                return false;
            }
            std::string extra;
            if (iss >> extra) {
                error = "unexpected token '" + extra + "' in section header" + at_line(line_number);
                return false;
            }
            continue;
        }

        if (section == Section::NONE) {
            error = "entry outside of a section" + at_line(line_number);
            return false;
        }

        const size_t equals = trimmed.find('=');
        if (equals == std::string::npos) {
            error = "invalid line '" + trimmed + "'" + at_line(line_number);
            return false;
        }
        const std::string key = to_lower_copy(trim_copy(trimmed.substr(0, equals)));
        const std::string value = trim_copy(trimmed.substr(equals + 1));
        if (key.empty()) {
            error = "empty key" + at_line(line_number);
            return false;
        }
        if (value.empty()) {
            error = "empty value for key '" + key + "'" + at_line(line_number);
            return false;
        }

        bool applied = false;
        switch (section) {
            case Section::PIPELINE:
                applied = apply_pipeline_key(key, value, config, error);
                break;
            case Section::DEVICE:
                applied = apply_device_key(key, value, config, error);
                break;
            case Section::LOD:
                applied = apply_lod_key(key, value, config.lod_table[static_cast<size_t>(lod_index)], error);
                break;
            case Section::NONE:
                break;
        }
        if (!applied) {
            error += at_line(line_number);
            return false;
        }
    }

    if (!validate_lod_table(config.lod_table, error)) {
        error = "invalid lod table: " + error;
        return false;
    }
    out = config;
    return true;
}

bool load_pipeline_config_from_file(const fs::path& path, PipelineConfig& out, std::string& error) {
    std::ifstream input(path);
    if (!input) {
        error = "failed to open '" + path.string() + "'";
        return false;
    }
    if (!parse_pipeline_config(input, out, error)) {
        error = path.string() + ": " + error;
        return false;
    }
    return true;
}

std::optional<fs::path> resolve_config_path(const std::optional<fs::path>& explicit_path) {
    if (explicit_path) {
        return explicit_path;
    }
    if (const char* env = std::getenv(k_config_env_var); env != nullptr && env[0] != '\0') {
        return fs::path(env);
    }
    const char* home = std::getenv("HOME");
    if (home == nullptr || home[0] == '\0') {
        return std::nullopt;
    }
    const fs::path user_path = fs::path(home) / k_user_config_relpath;
    std::error_code ec;
    if (fs::exists(user_path, ec)) {
        return user_path;
    }
    return std::nullopt;
}

bool load_pipeline_config(const std::optional<fs::path>& explicit_path, PipelineConfig& out, std::string& error) {
    const std::optional<fs::path> path = resolve_config_path(explicit_path);
    if (!path) {
        return true;
    }
    return load_pipeline_config_from_file(*path, out, error);
}

} // namespace tessera::core
