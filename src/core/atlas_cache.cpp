#include "atlas_cache.h"

#include "log.h"

#include <algorithm>

namespace tessera::core {
namespace {

bool is_rolling(PriorityClass priority) {
    return priority == PriorityClass::VISIBLE || priority == PriorityClass::ACTIVE;
}

std::string key_name(const CacheKey& key) {
    return level_name(key.level) + "/" + priority_name(key.priority);
}

} // namespace

AtlasCache::AtlasCache(size_t rolling_window) : rolling_window_(std::max<size_t>(1, rolling_window)) {}

bool AtlasCache::replace(const CacheKey& key, std::vector<AtlasPtr> atlases, uint64_t sequence,
                         std::vector<CacheKey>* dropped) {
    std::scoped_lock lock(mutex_);
    auto it = entries_.find(key);
    if (it != entries_.end() && !it->second.invalidated && it->second.sequence > sequence) {
        return false;
    }
    if (is_rolling(key.priority)) {
        const auto ranked = ranked_rolling_levels_locked(&key, sequence, tick_ + 1);
        const auto window_end = ranked.begin() + static_cast<std::ptrdiff_t>(std::min(ranked.size(), rolling_window_));
        if (std::find(ranked.begin(), window_end, key.level) == window_end) {
            log_message(LogLevel::Debug, "cache", "refusing " + key_name(key) + " outside the rolling window");
            return false;
        }
    }
    Entry entry;
    entry.sequence = sequence;
    entry.last_used = ++tick_;
    for (const auto& atlas : atlases) {
        entry.bytes += atlas->byte_size();
    }
    entry.atlases = std::move(atlases);
    entries_[key] = std::move(entry);
    if (is_rolling(key.priority)) {
        auto evicted = enforce_rolling_window_locked();
        if (dropped != nullptr) {
            dropped->insert(dropped->end(), evicted.begin(), evicted.end());
        }
    }
    return true;
}

bool AtlasCache::erase(const CacheKey& key) {
    std::scoped_lock lock(mutex_);
    return entries_.erase(key) > 0;
}

void AtlasCache::clear_priority(PriorityClass priority) {
    std::scoped_lock lock(mutex_);
    std::erase_if(entries_, [&](const auto& item) { return item.first.priority == priority; });
}

void AtlasCache::mark_invalidated(DetailLevel level) {
    std::scoped_lock lock(mutex_);
    for (auto& [key, entry] : entries_) {
        if (key.level == level) {
            entry.invalidated = true;
        }
    }
}

void AtlasCache::mark_invalidated(const CacheKey& key) {
    std::scoped_lock lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        it->second.invalidated = true;
    }
}

void AtlasCache::clear_invalidated(const CacheKey& key) {
    std::scoped_lock lock(mutex_);
    if (auto it = entries_.find(key); it != entries_.end()) {
        it->second.invalidated = false;
    }
}

bool AtlasCache::has_invalidated() const {
    std::scoped_lock lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [](const auto& item) { return item.second.invalidated; });
}

bool AtlasCache::is_invalidated(const CacheKey& key) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(key);
    return it != entries_.end() && it->second.invalidated;
}

void AtlasCache::drop_invalidated() {
    std::scoped_lock lock(mutex_);
    std::erase_if(entries_, [](const auto& item) {
        return item.second.invalidated && item.first.priority != PriorityClass::PERSISTENT;
    });
}

bool AtlasCache::has_generated() const {
    std::scoped_lock lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [](const auto& item) {
        return item.first.priority != PriorityClass::PERSISTENT && !item.second.invalidated;
    });
}

std::vector<AtlasPtr> AtlasCache::atlases(const CacheKey& key) const {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return {};
    }
    return it->second.atlases;
}

std::vector<std::pair<CacheKey, std::vector<AtlasPtr>>> AtlasCache::snapshot() const {
    std::scoped_lock lock(mutex_);
    std::vector<std::pair<CacheKey, std::vector<AtlasPtr>>> out;
    out.reserve(entries_.size());
    for (const auto& [key, entry] : entries_) {
        out.emplace_back(key, entry.atlases);
    }
    return out;
}

std::optional<RegionLookup> AtlasCache::find_region(const std::string& id) const {
    std::scoped_lock lock(mutex_);
    // Reverse key order is level descending, then FOCUSED, ACTIVE, VISIBLE, PERSISTENT.
    const Entry* persistent = nullptr;
    for (auto it = entries_.rbegin(); it != entries_.rend(); ++it) {
        if (it->first.priority == PriorityClass::PERSISTENT) {
            persistent = &it->second;
            continue;
        }
        if (it->second.invalidated) {
            continue;
        }
        for (const auto& atlas : it->second.atlases) {
            if (const AtlasRegion* region = atlas->find_region(id)) {
                return RegionLookup{atlas, *region};
            }
        }
    }
    if (persistent != nullptr) {
        for (const auto& atlas : persistent->atlases) {
            if (const AtlasRegion* region = atlas->find_region(id)) {
                return RegionLookup{atlas, *region};
            }
        }
    }
    return std::nullopt;
}

size_t AtlasCache::total_bytes() const {
    std::scoped_lock lock(mutex_);
    size_t total = 0;
    for (const auto& [key, entry] : entries_) {
        total += entry.bytes;
    }
    return total;
}

std::vector<CacheKey> AtlasCache::evict_to(size_t byte_ceiling) {
    std::scoped_lock lock(mutex_);
    std::vector<CacheKey> evicted;
    size_t total = 0;
    for (const auto& [key, entry] : entries_) {
        total += entry.bytes;
    }
    while (total > byte_ceiling) {
        // Oldest rolling entry first; focused content goes last.
        auto victim = entries_.end();
        for (auto it = entries_.begin(); it != entries_.end(); ++it) {
            if (it->first.priority == PriorityClass::PERSISTENT) {
                continue;
            }
            if (victim == entries_.end()) {
                victim = it;
                continue;
            }
            const bool it_focused = it->first.priority == PriorityClass::FOCUSED;
            const bool victim_focused = victim->first.priority == PriorityClass::FOCUSED;
            if (it_focused != victim_focused) {
                if (!it_focused) {
                    victim = it;
                }
                continue;
            }
            if (it->second.last_used < victim->second.last_used) {
                victim = it;
            }
        }
        if (victim == entries_.end()) {
            break;
        }
        total -= victim->second.bytes;
        log_message(LogLevel::Info, "cache", "evicting " + key_name(victim->first) + " for the memory ceiling");
        evicted.push_back(victim->first);
        entries_.erase(victim);
    }
    return evicted;
}

void AtlasCache::set_rolling_window(size_t levels) {
    std::scoped_lock lock(mutex_);
    rolling_window_ = std::max<size_t>(1, levels);
    enforce_rolling_window_locked();
}

std::vector<DetailLevel> AtlasCache::ranked_rolling_levels_locked(const CacheKey* incoming, uint64_t sequence,
                                                                   uint64_t tick) const {
    using Rank = std::pair<uint64_t, uint64_t>;
    std::vector<std::pair<Rank, DetailLevel>> recency;
    auto note = [&](DetailLevel level, Rank rank) {
        auto found = std::find_if(recency.begin(), recency.end(), [&](const auto& r) { return r.second == level; });
        if (found == recency.end()) {
            recency.emplace_back(rank, level);
        } else {
            found->first = std::max(found->first, rank);
        }
    };
    for (const auto& [key, entry] : entries_) {
        if (!is_rolling(key.priority) || (incoming != nullptr && key == *incoming)) {
            continue;
        }
        note(key.level, Rank{entry.sequence, entry.last_used});
    }
    if (incoming != nullptr) {
        note(incoming->level, Rank{sequence, tick});
    }
    std::sort(recency.begin(), recency.end(), [](const auto& a, const auto& b) { return a.first > b.first; });
    std::vector<DetailLevel> levels;
    levels.reserve(recency.size());
    for (const auto& r : recency) {
        levels.push_back(r.second);
    }
    return levels;
}

std::vector<CacheKey> AtlasCache::enforce_rolling_window_locked() {
    std::vector<CacheKey> evicted;
    auto kept = ranked_rolling_levels_locked(nullptr, 0, 0);
    if (kept.size() <= rolling_window_) {
        return evicted;
    }
    kept.resize(rolling_window_);
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (is_rolling(it->first.priority) && std::find(kept.begin(), kept.end(), it->first.level) == kept.end()) {
            log_message(LogLevel::Debug, "cache", "rolling window drops " + key_name(it->first));
            evicted.push_back(it->first);
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
    return evicted;
}

} // namespace tessera::core
