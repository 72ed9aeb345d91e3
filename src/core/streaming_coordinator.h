#pragma once

#include "atlas_cache.h"
#include "config.h"
#include "distribution.h"
#include "image.h"
#include "photo_loader.h"
#include "regeneration.h"
#include "worker_gate.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace tessera::core {

enum class AtlasEventType { LOADING, PROGRESS, LEVEL_READY, LEVEL_FAILED, ALL_COMPLETE, ATLAS_REMOVED };

const char* event_name(AtlasEventType type);

struct AtlasEvent {
    AtlasEventType type = AtlasEventType::LOADING;
    uint64_t sequence = 0;
    DetailLevel level = DetailLevel::LEVEL_0;
    PriorityClass priority = PriorityClass::VISIBLE;
    double progress = 0.0;
    std::vector<AtlasPtr> atlases;
    std::vector<std::string> failed_ids;
    std::string reason;
};

using AtlasEventCallback = std::function<void(const AtlasEvent&)>;

struct ViewportSnapshot {
    double zoom = 1.0;
    std::vector<std::string> visible_ids;
    std::optional<std::string> focused_id;
    // Photos of the cell under the pointer; drawn one level above the visible level.
    std::vector<std::string> active_ids;
};

class ViewportSource {
public:
    virtual ~ViewportSource() = default;

    virtual double current_zoom() const = 0;
    virtual std::vector<std::string> visible_identifiers() const = 0;
    virtual std::optional<std::string> focused_identifier() const = 0;
    virtual std::vector<std::string> active_identifiers() const { return {}; }
};

ViewportSnapshot snapshot_viewport(const ViewportSource& source);

struct SubmitResult {
    uint64_t sequence = 0;
    RegenerationDecision decision = RegenerationDecision::NONE;
    size_t tasks_started = 0;
};

// Consumer-side ordering: keeps only LEVEL_READY events that are not older than one
// already accepted for the same level and priority class.
class LatestSequenceFilter {
public:
    bool accept(const AtlasEvent& event);

private:
    std::mutex mutex_;
    std::map<CacheKey, uint64_t> latest_;
};

// Owns the atlas cache and runs one generation task per requested level. Results are
// published as events as soon as each level finishes. Events are delivered on worker
// threads; callbacks must not call submit() or shutdown().
class StreamingCoordinator {
public:
    StreamingCoordinator(std::shared_ptr<PhotoLoader> loader, PipelineConfig config);
    ~StreamingCoordinator();

    StreamingCoordinator(const StreamingCoordinator&) = delete;
    StreamingCoordinator& operator=(const StreamingCoordinator&) = delete;

    // Builds the persistent lowest-level atlas set for the whole catalog.
    bool start(const std::vector<Image>& catalog, std::string& error);
    // Rebuilds the persistent set only when the set of ids changed.
    bool update_catalog(const std::vector<Image>& catalog, std::string& error);

    SubmitResult submit(const ViewportSnapshot& snapshot);
    SubmitResult submit_from(const ViewportSource& source);

    void set_memory_pressure(PressureLevel pressure);
    MemoryBudget current_budget() const;
    void report_reclaimed(DetailLevel level);

    std::optional<RegionLookup> find_region(const std::string& id) const;
    std::vector<AtlasPtr> atlases(DetailLevel level, PriorityClass priority) const;
    size_t cached_bytes() const;

    uint64_t subscribe(AtlasEventCallback callback);
    void unsubscribe(uint64_t subscription);

    // Blocks until every started task has finished.
    void wait_idle();
    // Cancels all work and joins every task thread and every timed decode thread.
    // Loaders must return once their cancel flag is set. Safe to call more than once.
    void shutdown();

    const LodPolicy& lod() const { return lod_; }

private:
    struct LevelTask {
        uint64_t sequence = 0;
        CacheKey key;
        std::vector<Image> images;
        std::optional<std::string> focused_id;
        std::shared_ptr<std::atomic<bool>> cancelled = std::make_shared<std::atomic<bool>>(false);
        std::thread thread;
        bool finished = false;
    };

    struct ViewState {
        std::set<std::string> visible;
        double zoom = 0.0;
        std::optional<std::string> focused;
    };

    struct DecodeThread {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    enum class BuildStatus { BUILT, CANCELLED, FAILED };

    BuildStatus build_level(const std::vector<Image>& images,
                            const CacheKey& key,
                            const std::optional<std::string>& focused_id,
                            const std::shared_ptr<std::atomic<bool>>& cancelled,
                            const MemoryBudget& budget,
                            const std::function<void(double)>& on_progress,
                            std::vector<AtlasPtr>& atlases,
                            std::vector<std::string>& failed,
                            std::string& reason);
    std::vector<DecodedRaster> decode_entry(const AtlasPlanEntry& entry,
                                            unsigned int workers,
                                            const std::shared_ptr<std::atomic<bool>>& cancelled);
    DecodeResult decode_photo(const std::string& id, int width, int height,
                              const std::shared_ptr<std::atomic<bool>>& cancelled);
    DecodeResult decode_with_timeout(const std::string& id, int width, int height,
                                     const std::shared_ptr<std::atomic<bool>>& cancelled);
    void track_decode_thread(std::thread thread, std::shared_ptr<std::atomic<bool>> done);
    bool build_persistent(const std::vector<Image>& images, uint64_t sequence, std::string& error);

    void run_task(const std::shared_ptr<LevelTask>& task);
    void execute_task(const LevelTask& task);
    void finish_task(const std::shared_ptr<LevelTask>& task);
    void launch_locked(const std::shared_ptr<LevelTask>& task);
    void cancel_superseded_locked(const CacheKey& key, uint64_t sequence);
    void reap_finished_locked(std::vector<std::thread>& out);
    bool has_running_locked() const;
    std::vector<Image> known_images_locked(const std::vector<std::string>& ids,
                                           const std::optional<std::string>& exclude) const;
    MemoryBudget budget_locked() const;

    void emit(const AtlasEvent& event);
    void emit_removed(const std::vector<CacheKey>& keys, uint64_t sequence);

    std::shared_ptr<PhotoLoader> loader_;
    PipelineConfig config_;
    LodPolicy lod_;
    AtlasCache cache_;
    WorkerGate gate_;

    mutable std::mutex state_mutex_;
    std::condition_variable idle_cv_;
    std::unordered_map<std::string, Image> catalog_;
    PressureLevel pressure_ = PressureLevel::NORMAL;
    uint64_t next_sequence_ = 1;
    std::optional<ViewState> last_view_;
    std::vector<std::shared_ptr<LevelTask>> tasks_;
    std::map<uint64_t, size_t> outstanding_;
    bool shut_down_ = false;

    // Serializes cache commits so one mutation is in flight at a time.
    std::mutex commit_mutex_;

    std::mutex decode_threads_mutex_;
    std::vector<DecodeThread> decode_threads_;

    std::mutex subscriber_mutex_;
    std::map<uint64_t, AtlasEventCallback> subscribers_;
    uint64_t next_subscription_ = 1;

    std::atomic<uint64_t> next_generation_{1};
};

} // namespace tessera::core
