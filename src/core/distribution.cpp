#include "distribution.h"

#include "log.h"

#include <algorithm>
#include <unordered_set>
#include <utility>

namespace tessera::core {
namespace {

constexpr DetailLevel k_large_first_level = DetailLevel::LEVEL_5;

struct Planner {
    const MemoryBudget& budget;
    int padding;
    DistributionPlan& plan;

    bool fits_empty(const PackInput& image, int size) const {
        const int extent = size - 2 * padding;
        return image.width > 0 && image.height > 0 && image.width <= extent && image.height <= extent;
    }

    void emit(int size, DetailLevel level, PriorityClass priority, std::vector<PackedRect> placed) {
        AtlasPlanEntry entry;
        entry.atlas_size = size;
        entry.level = level;
        entry.priority = priority;
        entry.member_ids.reserve(placed.size());
        for (const auto& rect : placed) {
            entry.member_ids.push_back(rect.id);
        }
        entry.placement = std::move(placed);
        plan.entries.push_back(std::move(entry));
    }

    static std::vector<PackInput> without(const std::vector<PackInput>& images, const std::vector<PackedRect>& placed) {
        std::unordered_set<std::string> taken;
        for (const auto& rect : placed) {
            taken.insert(rect.id);
        }
        std::vector<PackInput> rest;
        for (const auto& image : images) {
            if (taken.find(image.id) == taken.end()) {
                rest.push_back(image);
            }
        }
        return rest;
    }

    // Fills atlases of `size` one after another. An instance holding fewer than
    // `min_members` photos while others were rejected is dropped: the rejected photos
    // need a larger atlas anyway, so the stragglers follow them there.
    std::vector<PackInput> pack_instances(std::vector<PackInput> remaining, int size,
                                          DetailLevel level, PriorityClass priority, size_t min_members) {
        while (!remaining.empty()) {
            PackResult result = pack_shelves(remaining, size, padding);
            if (result.placed.empty()) {
                break;
            }
            if (result.placed.size() < min_members && result.placed.size() < remaining.size()) {
                break;
            }
            remaining = without(remaining, result.placed);
            emit(size, level, priority, std::move(result.placed));
        }
        return remaining;
    }

    std::vector<int> sizes_above(int size) const {
        std::vector<int> larger;
        for (int candidate : budget.allowed_sizes) {
            if (candidate > size) {
                larger.push_back(candidate);
            }
        }
        return larger;
    }

    // Retry at the next larger size, then one atlas per photo, then give up.
    void escalate(std::vector<PackInput> leftovers, int assigned_size, DetailLevel level, PriorityClass priority) {
        if (leftovers.empty()) {
            return;
        }
        const std::vector<int> larger = sizes_above(assigned_size);
        if (!larger.empty()) {
            leftovers = pack_instances(std::move(leftovers), larger.front(), level, priority, 1);
        }
        for (const auto& image : leftovers) {
            const auto size_it = std::find_if(budget.allowed_sizes.begin(), budget.allowed_sizes.end(),
                                              [&](int size) { return fits_empty(image, size); });
            if (size_it == budget.allowed_sizes.end()) {
                log_message(LogLevel::Warning, "distribution",
                            "'" + image.id + "' (" + std::to_string(image.width) + "x" +
                            std::to_string(image.height) + ") exceeds the largest atlas size");
                plan.permanently_failed.push_back(image.id);
                continue;
            }
            PackResult single = pack_shelves({image}, *size_it, padding);
            if (single.placed.empty()) {
                plan.permanently_failed.push_back(image.id);
                continue;
            }
            emit(*size_it, level, priority, std::move(single.placed));
        }
    }

    void single_size(std::vector<PackInput> images, DetailLevel level, PriorityClass priority) {
        const int size = budget.allowed_sizes.front();
        escalate(pack_instances(std::move(images), size, level, priority, 1), size, level, priority);
    }

    void multi_size(std::vector<PackInput> images, DetailLevel level, PriorityClass priority) {
        if (images.empty()) {
            return;
        }
        std::vector<int> order = budget.allowed_sizes;
        if (level_index(level) >= level_index(k_large_first_level)) {
            std::reverse(order.begin(), order.end());
        }
        const auto min_members = static_cast<size_t>(min_images_per_atlas(level));
        std::vector<PackInput> remaining = std::move(images);
        for (size_t i = 0; i < order.size() && !remaining.empty(); ++i) {
            const bool last = i + 1 == order.size();
            remaining = pack_instances(std::move(remaining), order[i], level, priority, last ? 1 : min_members);
        }
        escalate(std::move(remaining), order.back(), level, priority);
    }
};

} // namespace

const char* policy_name(DistributionPolicy policy) {
    switch (policy) {
        case DistributionPolicy::SINGLE_SIZE: return "single_size";
        case DistributionPolicy::PRIORITY_BASED: return "priority_based";
        case DistributionPolicy::MULTI_SIZE: return "multi_size";
    }
    return "unknown";
}

int min_images_per_atlas(DetailLevel level) {
    const int index = level_index(level);
    if (index >= 5) {
        return 1;
    }
    if (index == 4) {
        return 2;
    }
    if (index >= 2) {
        return 3;
    }
    return 4;
}

DistributionPlan plan_distribution(const DistributionRequest& request,
                                   const MemoryBudget& budget,
                                   const LodPolicy& lod) {
    DistributionPlan plan;
    const MemoryBudget usable = sanitize_budget(budget);
    Planner planner{usable, request.padding, plan};

    auto sized = [&](const Image& image, DetailLevel level) {
        if (!request.scale_to_level) {
            return PackInput{image.id, image.width, image.height};
        }
        const PixelSize size = lod.scaled_size(image.width, image.height, level);
        return PackInput{image.id, size.width, size.height};
    };

    std::unordered_set<std::string> seen;
    std::vector<PackInput> inputs;
    std::optional<PackInput> focused;
    const Image* focused_source = nullptr;
    for (const auto& image : request.images) {
        if (!seen.insert(image.id).second) {
            log_message(LogLevel::Warning, "distribution", "duplicate id '" + image.id + "' ignored");
            continue;
        }
        if (request.focused_id && image.id == *request.focused_id) {
            focused = sized(image, lod.focused_level());
            focused_source = &image;
            continue;
        }
        inputs.push_back(sized(image, request.level));
    }

    if (usable.allowed_sizes.size() == 1) {
        plan.policy = DistributionPolicy::SINGLE_SIZE;
        if (focused_source != nullptr) {
            inputs.insert(inputs.begin(), sized(*focused_source, request.level));
        }
        planner.single_size(std::move(inputs), request.level, request.priority);
        return plan;
    }

    if (request.focused_id) {
        plan.policy = DistributionPolicy::PRIORITY_BASED;
        if (focused) {
            const int largest = usable.largest_size();
            PackResult alone = pack_shelves({*focused}, largest, request.padding);
            if (alone.placed.empty()) {
                log_message(LogLevel::Warning, "distribution",
                            "focused photo '" + focused->id + "' does not fit the largest atlas");
                plan.permanently_failed.push_back(focused->id);
            } else {
                planner.emit(largest, lod.focused_level(), PriorityClass::FOCUSED, std::move(alone.placed));
            }
        } else {
            log_message(LogLevel::Debug, "distribution", "focused photo '" + *request.focused_id + "' not in request");
        }
        planner.multi_size(std::move(inputs), request.level, request.priority);
        return plan;
    }

    plan.policy = DistributionPolicy::MULTI_SIZE;
    planner.multi_size(std::move(inputs), request.level, request.priority);
    return plan;
}

} // namespace tessera::core
