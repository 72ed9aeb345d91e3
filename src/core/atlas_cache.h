#pragma once

#include "atlas.h"

#include <compare>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace tessera::core {

struct CacheKey {
    DetailLevel level = DetailLevel::LEVEL_0;
    PriorityClass priority = PriorityClass::VISIBLE;

    auto operator<=>(const CacheKey&) const = default;
};

struct RegionLookup {
    AtlasPtr atlas;
    AtlasRegion region;
};

// Atlas sets keyed by (level, priority class). Every mutation happens under one lock and
// swaps whole entries, so a reader holding an AtlasPtr never sees a partial update.
// The PERSISTENT entry is exempt from rolling-window and byte-ceiling eviction.
class AtlasCache {
public:
    explicit AtlasCache(size_t rolling_window = 2);

    // Refused (false) when the entry already holds a newer sequence, or when a rolling
    // entry ranks outside the rolling window. Entries the window drops are appended to
    // `dropped` when given.
    bool replace(const CacheKey& key, std::vector<AtlasPtr> atlases, uint64_t sequence,
                 std::vector<CacheKey>* dropped = nullptr);
    bool erase(const CacheKey& key);
    void clear_priority(PriorityClass priority);

    void mark_invalidated(DetailLevel level);
    void mark_invalidated(const CacheKey& key);
    // Keeps the buffer as a lookup fallback while its rebuild is in flight.
    void clear_invalidated(const CacheKey& key);
    bool has_invalidated() const;
    bool is_invalidated(const CacheKey& key) const;
    void drop_invalidated();

    bool has_generated() const;
    std::vector<AtlasPtr> atlases(const CacheKey& key) const;
    std::vector<std::pair<CacheKey, std::vector<AtlasPtr>>> snapshot() const;

    // Highest level first, then FOCUSED over ACTIVE over VISIBLE, then the persistent set.
    std::optional<RegionLookup> find_region(const std::string& id) const;

    size_t total_bytes() const;
    std::vector<CacheKey> evict_to(size_t byte_ceiling);
    void set_rolling_window(size_t levels);

private:
    struct Entry {
        std::vector<AtlasPtr> atlases;
        uint64_t sequence = 0;
        uint64_t last_used = 0;
        size_t bytes = 0;
        bool invalidated = false;
    };

    // Rolling levels ordered newest first by (sequence, last_used).
    std::vector<DetailLevel> ranked_rolling_levels_locked(const CacheKey* incoming, uint64_t sequence,
                                                          uint64_t tick) const;
    std::vector<CacheKey> enforce_rolling_window_locked();

    mutable std::mutex mutex_;
    std::map<CacheKey, Entry> entries_;
    uint64_t tick_ = 0;
    size_t rolling_window_;
};

} // namespace tessera::core
