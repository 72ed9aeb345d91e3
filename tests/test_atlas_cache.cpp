#include <gtest/gtest.h>
#include "core/atlas_cache.h"

#include <memory>
#include <string>
#include <vector>

using namespace tessera::core;

namespace {

AtlasPtr make_atlas(DetailLevel level, PriorityClass priority, const std::vector<std::string>& ids, int size = 16) {
    auto atlas = std::make_shared<Atlas>();
    atlas->size = size;
    atlas->level = level;
    atlas->priority = priority;
    atlas->pixels.assign(static_cast<size_t>(size) * static_cast<size_t>(size) * 4, 0);
    int x = 0;
    for (const auto& id : ids) {
        AtlasRegion region;
        region.id = id;
        region.x = x;
        region.width = 1;
        region.height = 1;
        region.level = level;
        atlas->regions.emplace(id, region);
        ++x;
    }
    return atlas;
}

} // namespace

TEST(AtlasCacheTest, ReplaceRefusesOlderSequence) {
    AtlasCache cache;
    const CacheKey key{DetailLevel::LEVEL_2, PriorityClass::VISIBLE};
    AtlasPtr newer = make_atlas(key.level, key.priority, {"a"});
    AtlasPtr older = make_atlas(key.level, key.priority, {"a"});

    EXPECT_TRUE(cache.replace(key, {newer}, 5));
    EXPECT_FALSE(cache.replace(key, {older}, 4));
    ASSERT_EQ(cache.atlases(key).size(), 1u);
    EXPECT_EQ(cache.atlases(key)[0], newer);
}

TEST(AtlasCacheTest, FindRegionPrefersHighestLevel) {
    AtlasCache cache(4);
    cache.replace({DetailLevel::LEVEL_0, PriorityClass::PERSISTENT},
                  {make_atlas(DetailLevel::LEVEL_0, PriorityClass::PERSISTENT, {"a", "b", "c"})}, 0);
    cache.replace({DetailLevel::LEVEL_2, PriorityClass::VISIBLE},
                  {make_atlas(DetailLevel::LEVEL_2, PriorityClass::VISIBLE, {"a", "b"})}, 1);
    cache.replace({DetailLevel::LEVEL_7, PriorityClass::FOCUSED},
                  {make_atlas(DetailLevel::LEVEL_7, PriorityClass::FOCUSED, {"a"})}, 1);

    auto a = cache.find_region("a");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(a->region.level, DetailLevel::LEVEL_7);

    auto b = cache.find_region("b");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(b->atlas->level, DetailLevel::LEVEL_2);

    auto c = cache.find_region("c");
    ASSERT_TRUE(c.has_value());
    EXPECT_EQ(c->atlas->priority, PriorityClass::PERSISTENT);

    EXPECT_FALSE(cache.find_region("zzz").has_value());
}

TEST(AtlasCacheTest, EvictionNeverTouchesPersistentEntry) {
    AtlasCache cache(4);
    const CacheKey persistent{DetailLevel::LEVEL_0, PriorityClass::PERSISTENT};
    cache.replace(persistent, {make_atlas(DetailLevel::LEVEL_0, PriorityClass::PERSISTENT, {"a"})}, 0);
    cache.replace({DetailLevel::LEVEL_2, PriorityClass::VISIBLE},
                  {make_atlas(DetailLevel::LEVEL_2, PriorityClass::VISIBLE, {"a"})}, 1);
    cache.replace({DetailLevel::LEVEL_7, PriorityClass::FOCUSED},
                  {make_atlas(DetailLevel::LEVEL_7, PriorityClass::FOCUSED, {"a"})}, 1);

    std::vector<CacheKey> evicted = cache.evict_to(0);

    EXPECT_EQ(evicted.size(), 2u);
    EXPECT_EQ(cache.atlases(persistent).size(), 1u);
    EXPECT_FALSE(cache.has_generated());
    EXPECT_TRUE(cache.find_region("a").has_value());
}

TEST(AtlasCacheTest, EvictsOldestRollingEntryBeforeFocused) {
    AtlasCache cache(4);
    const CacheKey focused{DetailLevel::LEVEL_7, PriorityClass::FOCUSED};
    const CacheKey old_visible{DetailLevel::LEVEL_1, PriorityClass::VISIBLE};
    const CacheKey new_visible{DetailLevel::LEVEL_2, PriorityClass::VISIBLE};
    cache.replace(focused, {make_atlas(focused.level, focused.priority, {"f"})}, 1);
    cache.replace(old_visible, {make_atlas(old_visible.level, old_visible.priority, {"a"})}, 1);
    cache.replace(new_visible, {make_atlas(new_visible.level, new_visible.priority, {"b"})}, 2);

    const size_t one_atlas = 16 * 16 * 4;
    std::vector<CacheKey> evicted = cache.evict_to(2 * one_atlas);

    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], old_visible);

    evicted = cache.evict_to(one_atlas);
    ASSERT_EQ(evicted.size(), 1u);
    EXPECT_EQ(evicted[0], new_visible);
    EXPECT_EQ(cache.atlases(focused).size(), 1u);
}

TEST(AtlasCacheTest, RollingWindowKeepsRecentLevels) {
    AtlasCache cache(2);
    cache.replace({DetailLevel::LEVEL_1, PriorityClass::VISIBLE},
                  {make_atlas(DetailLevel::LEVEL_1, PriorityClass::VISIBLE, {"a"})}, 1);
    cache.replace({DetailLevel::LEVEL_2, PriorityClass::VISIBLE},
                  {make_atlas(DetailLevel::LEVEL_2, PriorityClass::VISIBLE, {"a"})}, 2);
    cache.replace({DetailLevel::LEVEL_3, PriorityClass::ACTIVE},
                  {make_atlas(DetailLevel::LEVEL_3, PriorityClass::ACTIVE, {"a"})}, 3);

    EXPECT_TRUE(cache.atlases({DetailLevel::LEVEL_1, PriorityClass::VISIBLE}).empty());
    EXPECT_EQ(cache.atlases({DetailLevel::LEVEL_2, PriorityClass::VISIBLE}).size(), 1u);
    EXPECT_EQ(cache.atlases({DetailLevel::LEVEL_3, PriorityClass::ACTIVE}).size(), 1u);
}

TEST(AtlasCacheTest, RollingWindowRanksBySequence) {
    AtlasCache cache(2);
    EXPECT_TRUE(cache.replace({DetailLevel::LEVEL_3, PriorityClass::VISIBLE},
                              {make_atlas(DetailLevel::LEVEL_3, PriorityClass::VISIBLE, {"a"})}, 2));
    EXPECT_TRUE(cache.replace({DetailLevel::LEVEL_4, PriorityClass::ACTIVE},
                              {make_atlas(DetailLevel::LEVEL_4, PriorityClass::ACTIVE, {"b"})}, 2));

    // Committed last but requested earlier, so it falls outside the window.
    std::vector<CacheKey> dropped;
    EXPECT_FALSE(cache.replace({DetailLevel::LEVEL_2, PriorityClass::VISIBLE},
                               {make_atlas(DetailLevel::LEVEL_2, PriorityClass::VISIBLE, {"a"})}, 1, &dropped));
    EXPECT_TRUE(dropped.empty());
    EXPECT_TRUE(cache.atlases({DetailLevel::LEVEL_2, PriorityClass::VISIBLE}).empty());
    EXPECT_EQ(cache.atlases({DetailLevel::LEVEL_3, PriorityClass::VISIBLE}).size(), 1u);
    EXPECT_EQ(cache.find_region("a")->atlas->level, DetailLevel::LEVEL_3);

    // A newer request pushes out the oldest level and reports it.
    EXPECT_TRUE(cache.replace({DetailLevel::LEVEL_5, PriorityClass::VISIBLE},
                              {make_atlas(DetailLevel::LEVEL_5, PriorityClass::VISIBLE, {"c"})}, 3, &dropped));
    ASSERT_EQ(dropped.size(), 1u);
    EXPECT_EQ(dropped[0].level, DetailLevel::LEVEL_3);
}

TEST(AtlasCacheTest, ClearedInvalidationKeepsBufferAsFallback) {
    AtlasCache cache;
    const CacheKey key{DetailLevel::LEVEL_0, PriorityClass::PERSISTENT};
    cache.replace(key, {make_atlas(key.level, key.priority, {"a"})}, 0);

    cache.mark_invalidated(key);
    EXPECT_TRUE(cache.has_invalidated());
    cache.clear_invalidated(key);
    EXPECT_FALSE(cache.has_invalidated());
    EXPECT_FALSE(cache.is_invalidated(key));
    EXPECT_EQ(cache.find_region("a")->atlas->priority, PriorityClass::PERSISTENT);
}

TEST(AtlasCacheTest, InvalidatedEntriesAreSkippedAndDropped) {
    AtlasCache cache;
    const CacheKey key{DetailLevel::LEVEL_2, PriorityClass::VISIBLE};
    cache.replace({DetailLevel::LEVEL_0, PriorityClass::PERSISTENT},
                  {make_atlas(DetailLevel::LEVEL_0, PriorityClass::PERSISTENT, {"a"})}, 0);
    cache.replace(key, {make_atlas(key.level, key.priority, {"a"})}, 3);

    cache.mark_invalidated(DetailLevel::LEVEL_2);
    EXPECT_TRUE(cache.has_invalidated());
    EXPECT_TRUE(cache.is_invalidated(key));
    EXPECT_EQ(cache.find_region("a")->atlas->level, DetailLevel::LEVEL_0);

    // An invalidated entry accepts any sequence.
    EXPECT_TRUE(cache.replace(key, {make_atlas(key.level, key.priority, {"a"})}, 1));
    EXPECT_FALSE(cache.has_invalidated());

    cache.mark_invalidated(DetailLevel::LEVEL_2);
    cache.drop_invalidated();
    EXPECT_TRUE(cache.atlases(key).empty());
    EXPECT_FALSE(cache.has_invalidated());
}

TEST(AtlasCacheTest, ClearPriorityRemovesOnlyThatClass) {
    AtlasCache cache;
    cache.replace({DetailLevel::LEVEL_7, PriorityClass::FOCUSED},
                  {make_atlas(DetailLevel::LEVEL_7, PriorityClass::FOCUSED, {"f"})}, 1);
    cache.replace({DetailLevel::LEVEL_2, PriorityClass::VISIBLE},
                  {make_atlas(DetailLevel::LEVEL_2, PriorityClass::VISIBLE, {"v"})}, 1);

    cache.clear_priority(PriorityClass::FOCUSED);

    EXPECT_FALSE(cache.find_region("f").has_value());
    EXPECT_TRUE(cache.find_region("v").has_value());
    EXPECT_EQ(cache.total_bytes(), 16u * 16u * 4u);
}

TEST(AtlasCacheTest, SnapshotAndEraseReflectEntries) {
    AtlasCache cache;
    const CacheKey visible{DetailLevel::LEVEL_2, PriorityClass::VISIBLE};
    const CacheKey focused{DetailLevel::LEVEL_7, PriorityClass::FOCUSED};
    cache.replace(visible, {make_atlas(visible.level, visible.priority, {"a"})}, 1);
    cache.replace(focused, {make_atlas(focused.level, focused.priority, {"b"})}, 1);

    auto entries = cache.snapshot();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].first, visible);
    EXPECT_EQ(entries[1].first, focused);

    EXPECT_TRUE(cache.erase(visible));
    EXPECT_FALSE(cache.erase(visible));
    entries = cache.snapshot();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first, focused);
}

TEST(AtlasCacheTest, ShrinkingRollingWindowDropsOldestLevels) {
    AtlasCache cache(3);
    cache.replace({DetailLevel::LEVEL_1, PriorityClass::VISIBLE},
                  {make_atlas(DetailLevel::LEVEL_1, PriorityClass::VISIBLE, {"a"})}, 1);
    cache.replace({DetailLevel::LEVEL_2, PriorityClass::VISIBLE},
                  {make_atlas(DetailLevel::LEVEL_2, PriorityClass::VISIBLE, {"a"})}, 2);
    cache.replace({DetailLevel::LEVEL_3, PriorityClass::VISIBLE},
                  {make_atlas(DetailLevel::LEVEL_3, PriorityClass::VISIBLE, {"a"})}, 3);
    EXPECT_EQ(cache.snapshot().size(), 3u);

    cache.set_rolling_window(1);

    const auto entries = cache.snapshot();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].first.level, DetailLevel::LEVEL_3);
}
