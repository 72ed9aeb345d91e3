#pragma once

#include <array>
#include <cstddef>
#include <string>
#include <vector>

namespace tessera::core {

enum class DeviceTier { LOW, MEDIUM, HIGH };
enum class PressureLevel { NORMAL, MEDIUM, HIGH, CRITICAL };

constexpr std::array<int, 3> k_atlas_sizes = {2048, 4096, 8192};
constexpr size_t k_mebibyte = 1024 * 1024;

struct DeviceCapabilities {
    int total_memory_mb = 4096;
    int max_texture_size = 4096;
};

struct MemoryBudget {
    std::vector<int> allowed_sizes;  // ascending
    int parallelism = 1;
    size_t byte_ceiling = 0;
    bool degraded = false;

    int smallest_size() const;
    int largest_size() const;
};

DeviceTier classify_device(const DeviceCapabilities& capabilities);

// Pure table lookup; calling it repeatedly with the same arguments yields the same budget.
MemoryBudget compute_budget(DeviceTier tier, PressureLevel pressure);
// Same table, with sizes the device cannot sample dropped.
MemoryBudget compute_budget(const DeviceCapabilities& capabilities, PressureLevel pressure);

// Degrades an unusable budget (no sizes or no parallelism) to the smallest size, one worker.
MemoryBudget sanitize_budget(MemoryBudget budget);

PressureLevel pressure_for_usage(size_t used_bytes, size_t ceiling_bytes);

const char* tier_name(DeviceTier tier);
const char* pressure_name(PressureLevel pressure);
bool parse_device_tier(const std::string& value, DeviceTier& out, std::string& error);

} // namespace tessera::core
