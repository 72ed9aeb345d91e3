#include "memory_budget.h"

#include "text_parse.h"

#include <algorithm>
#include <utility>

namespace tessera::core {
namespace {

constexpr int k_high_tier_memory_mb = 6144;
constexpr int k_medium_tier_memory_mb = 3072;

struct TierRow {
    std::vector<int> sizes;
    int parallelism;
    size_t ceiling_mb;
};

TierRow tier_row(DeviceTier tier) {
    switch (tier) {
        case DeviceTier::HIGH: return {{2048, 4096, 8192}, 6, 400};
        case DeviceTier::MEDIUM: return {{2048, 4096}, 4, 300};
        case DeviceTier::LOW: return {{2048}, 2, 200};
    }
    return {{2048}, 2, 200};
}

double pressure_scale(PressureLevel pressure) {
    switch (pressure) {
        case PressureLevel::NORMAL: return 1.0;
        case PressureLevel::MEDIUM: return 0.75;
        case PressureLevel::HIGH: return 0.5;
        case PressureLevel::CRITICAL: return 0.25;
    }
    return 1.0;
}

MemoryBudget apply_pressure(std::vector<int> sizes, int parallelism, size_t ceiling_mb, PressureLevel pressure) {
    MemoryBudget budget;
    budget.allowed_sizes = std::move(sizes);
    std::sort(budget.allowed_sizes.begin(), budget.allowed_sizes.end());
    budget.parallelism = parallelism;
    budget.byte_ceiling = static_cast<size_t>(static_cast<double>(ceiling_mb * k_mebibyte) * pressure_scale(pressure));
    if (pressure == PressureLevel::HIGH) {
        budget.parallelism = std::max(1, parallelism / 2);
    } else if (pressure == PressureLevel::CRITICAL) {
        if (!budget.allowed_sizes.empty()) {
            budget.allowed_sizes.resize(1);
        }
        budget.parallelism = 1;
    }
    return budget;
}

} // namespace

int MemoryBudget::smallest_size() const {
    return allowed_sizes.empty() ? k_atlas_sizes.front() : allowed_sizes.front();
}

int MemoryBudget::largest_size() const {
    return allowed_sizes.empty() ? k_atlas_sizes.front() : allowed_sizes.back();
}

DeviceTier classify_device(const DeviceCapabilities& capabilities) {
    if (capabilities.total_memory_mb >= k_high_tier_memory_mb && capabilities.max_texture_size >= 8192) {
        return DeviceTier::HIGH;
    }
    if (capabilities.total_memory_mb >= k_medium_tier_memory_mb && capabilities.max_texture_size >= 4096) {
        return DeviceTier::MEDIUM;
    }
    return DeviceTier::LOW;
}

MemoryBudget compute_budget(DeviceTier tier, PressureLevel pressure) {
    TierRow row = tier_row(tier);
    return apply_pressure(std::move(row.sizes), row.parallelism, row.ceiling_mb, pressure);
}

MemoryBudget compute_budget(const DeviceCapabilities& capabilities, PressureLevel pressure) {
    TierRow row = tier_row(classify_device(capabilities));
    std::erase_if(row.sizes, [&](int size) { return size > capabilities.max_texture_size; });
    return apply_pressure(std::move(row.sizes), row.parallelism, row.ceiling_mb, pressure);
}

MemoryBudget sanitize_budget(MemoryBudget budget) {
    if (budget.allowed_sizes.empty() || budget.parallelism <= 0) {
        const int smallest = budget.allowed_sizes.empty() ? k_atlas_sizes.front() : budget.allowed_sizes.front();
        budget.allowed_sizes = {smallest};
        budget.parallelism = 1;
        budget.degraded = true;
    }
    return budget;
}

PressureLevel pressure_for_usage(size_t used_bytes, size_t ceiling_bytes) {
    if (ceiling_bytes == 0) {
        return used_bytes == 0 ? PressureLevel::NORMAL : PressureLevel::CRITICAL;
    }
    const double usage = static_cast<double>(used_bytes) / static_cast<double>(ceiling_bytes);
    if (usage >= 0.95) {
        return PressureLevel::CRITICAL;
    }
    if (usage >= 0.85) {
        return PressureLevel::HIGH;
    }
    if (usage >= 0.70) {
        return PressureLevel::MEDIUM;
    }
    return PressureLevel::NORMAL;
}

const char* tier_name(DeviceTier tier) {
    switch (tier) {
        case DeviceTier::LOW: return "low";
        case DeviceTier::MEDIUM: return "medium";
        case DeviceTier::HIGH: return "high";
    }
    return "unknown";
}

const char* pressure_name(PressureLevel pressure) {
    switch (pressure) {
        case PressureLevel::NORMAL: return "normal";
        case PressureLevel::MEDIUM: return "medium";
        case PressureLevel::HIGH: return "high";
        case PressureLevel::CRITICAL: return "critical";
    }
    return "unknown";
}

bool parse_device_tier(const std::string& value, DeviceTier& out, std::string& error) {
    const std::string lower = to_lower_copy(value);
    if (lower == "low") {
        out = DeviceTier::LOW;
    } else if (lower == "medium") {
        out = DeviceTier::MEDIUM;
    } else if (lower == "high") {
        out = DeviceTier::HIGH;
    } else {
        error = "invalid device tier '" + value + "'";
        return false;
    }
    return true;
}

} // namespace tessera::core
