#include "streaming_coordinator.h"

#include "atlas_assembler.h"
#include "log.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <future>
#include <unordered_set>
#include <utility>

namespace tessera::core {
namespace {

constexpr const char* k_tag = "coordinator";
constexpr std::chrono::milliseconds k_decode_poll{10};

DecodeResult call_loader(PhotoLoader& loader, const std::string& id, int width, int height,
                         const std::atomic<bool>& cancelled) {
    try {
        return loader.decode(id, width, height, cancelled);
    } catch (const std::exception& e) {
        return decode_failure("loader threw for '" + id + "': " + e.what(), false);
    }
}

std::string describe(const CacheKey& key) {
    return level_name(key.level) + "/" + priority_name(key.priority);
}

} // namespace

const char* event_name(AtlasEventType type) {
    switch (type) {
        case AtlasEventType::LOADING: return "loading";
        case AtlasEventType::PROGRESS: return "progress";
        case AtlasEventType::LEVEL_READY: return "level_ready";
        case AtlasEventType::LEVEL_FAILED: return "level_failed";
        case AtlasEventType::ALL_COMPLETE: return "all_complete";
        case AtlasEventType::ATLAS_REMOVED: return "atlas_removed";
    }
    return "unknown";
}

ViewportSnapshot snapshot_viewport(const ViewportSource& source) {
    ViewportSnapshot snapshot;
    snapshot.zoom = source.current_zoom();
    snapshot.visible_ids = source.visible_identifiers();
    snapshot.focused_id = source.focused_identifier();
    snapshot.active_ids = source.active_identifiers();
    return snapshot;
}

bool LatestSequenceFilter::accept(const AtlasEvent& event) {
    if (event.type != AtlasEventType::LEVEL_READY) {
        return true;
    }
    std::scoped_lock lock(mutex_);
    const CacheKey key{event.level, event.priority};
    auto it = latest_.find(key);
    if (it != latest_.end() && event.sequence < it->second) {
        return false;
    }
    latest_[key] = event.sequence;
    return true;
}

StreamingCoordinator::StreamingCoordinator(std::shared_ptr<PhotoLoader> loader, PipelineConfig config)
    : loader_(std::move(loader)),
      config_(std::move(config)),
      lod_(config_.lod_table),
      cache_(config_.rolling_window),
      gate_(1) {
    if (config_.log_level) {
        set_log_level(*config_.log_level);
    }
    std::string error;
    if (!validate_lod_table(config_.lod_table, error)) {
        log_message(LogLevel::Error, k_tag, "invalid lod table, using defaults: " + error);
        config_.lod_table = default_lod_table();
        lod_ = LodPolicy(config_.lod_table);
    }
    std::scoped_lock lock(state_mutex_);
    gate_.set_capacity(budget_locked().parallelism);
}

StreamingCoordinator::~StreamingCoordinator() {
    shutdown();
}

MemoryBudget StreamingCoordinator::budget_locked() const {
    MemoryBudget budget = config_.tier_override ? compute_budget(*config_.tier_override, pressure_)
                                                : compute_budget(config_.device, pressure_);
    budget = sanitize_budget(std::move(budget));
    if (budget.degraded) {
        log_message(LogLevel::Warning, k_tag, "no usable atlas budget, generating sequentially at the smallest size");
    }
    return budget;
}

MemoryBudget StreamingCoordinator::current_budget() const {
    std::scoped_lock lock(state_mutex_);
    return budget_locked();
}

bool StreamingCoordinator::start(const std::vector<Image>& catalog, std::string& error) {
    uint64_t sequence = 0;
    {
        std::scoped_lock lock(state_mutex_);
        if (shut_down_) {
            error = "coordinator is shut down";
            return false;
        }
        catalog_.clear();
        for (const auto& image : catalog) {
            catalog_.emplace(image.id, image);
        }
    }
    return build_persistent(catalog, sequence, error);
}

bool StreamingCoordinator::update_catalog(const std::vector<Image>& catalog, std::string& error) {
    uint64_t sequence = 0;
    {
        std::scoped_lock lock(state_mutex_);
        std::unordered_set<std::string> incoming;
        for (const auto& image : catalog) {
            incoming.insert(image.id);
        }
        bool same = incoming.size() == catalog_.size();
        for (const auto& id : incoming) {
            if (!same) {
                break;
            }
            same = catalog_.find(id) != catalog_.end();
        }
        if (same) {
            log_message(LogLevel::Debug, k_tag, "catalog unchanged, keeping persistent atlases");
            return true;
        }
        catalog_.clear();
        for (const auto& image : catalog) {
            catalog_.emplace(image.id, image);
        }
        sequence = next_sequence_++;
    }
    return build_persistent(catalog, sequence, error);
}

bool StreamingCoordinator::build_persistent(const std::vector<Image>& images, uint64_t sequence, std::string& error) {
    const CacheKey key{lod_.lowest_level(), PriorityClass::PERSISTENT};
    MemoryBudget budget = current_budget();
    auto cancelled = std::make_shared<std::atomic<bool>>(false);
    std::vector<AtlasPtr> atlases;
    std::vector<std::string> failed;
    std::string reason;

    AtlasEvent loading;
    loading.type = AtlasEventType::LOADING;
    loading.sequence = sequence;
    loading.level = key.level;
    loading.priority = key.priority;
    emit(loading);

    if (images.empty()) {
        atlases.clear();
    } else if (build_level(images, key, std::nullopt, cancelled, budget, {}, atlases, failed, reason)
               != BuildStatus::BUILT) {
        error = "persistent atlas: " + reason;
        AtlasEvent event;
        event.type = AtlasEventType::LEVEL_FAILED;
        event.sequence = sequence;
        event.level = key.level;
        event.priority = key.priority;
        event.reason = reason;
        emit(event);
        return false;
    }
    {
        std::scoped_lock commit_lock(commit_mutex_);
        cache_.replace(key, atlases, sequence);
    }
    log_message(LogLevel::Info, k_tag, "persistent set holds " + std::to_string(atlases.size()) + " atlases");

    AtlasEvent ready;
    ready.type = AtlasEventType::LEVEL_READY;
    ready.sequence = sequence;
    ready.level = key.level;
    ready.priority = key.priority;
    ready.atlases = std::move(atlases);
    ready.failed_ids = std::move(failed);
    emit(ready);
    return true;
}

std::vector<Image> StreamingCoordinator::known_images_locked(const std::vector<std::string>& ids,
                                                             const std::optional<std::string>& exclude) const {
    std::vector<Image> images;
    std::unordered_set<std::string> seen;
    for (const auto& id : ids) {
        if (exclude && id == *exclude) {
            continue;
        }
        if (!seen.insert(id).second) {
            continue;
        }
        const auto it = catalog_.find(id);
        if (it == catalog_.end()) {
            log_message(LogLevel::Warning, k_tag, "unknown photo id '" + id + "'");
            continue;
        }
        images.push_back(it->second);
    }
    return images;
}

SubmitResult StreamingCoordinator::submit_from(const ViewportSource& source) {
    return submit(snapshot_viewport(source));
}

SubmitResult StreamingCoordinator::submit(const ViewportSnapshot& snapshot) {
    SubmitResult result;
    std::vector<std::thread> reaped;
    std::vector<AtlasEvent> pending;
    {
        std::scoped_lock lock(state_mutex_);
        reap_finished_locked(reaped);
        if (shut_down_) {
            log_message(LogLevel::Warning, k_tag, "submit after shutdown ignored");
        } else {
            result.sequence = next_sequence_++;

            ViewState view;
            view.visible.insert(snapshot.visible_ids.begin(), snapshot.visible_ids.end());
            view.zoom = snapshot.zoom;
            view.focused = snapshot.focused_id;

            RegenerationState state;
            state.has_atlas = cache_.has_generated() || has_running_locked();
            state.atlas_invalidated = cache_.has_invalidated();
            if (last_view_) {
                state.visible_set_changed = last_view_->visible != view.visible;
                state.lod_boundary_crossed = lod_.crossed_boundary(last_view_->zoom, view.zoom).has_value();
                state.focus_changed = last_view_->focused != view.focused;
            } else {
                state.visible_set_changed = true;
                state.focus_changed = view.focused.has_value();
            }
            result.decision = decide_regeneration(state);
            last_view_ = view;
            log_message(LogLevel::Debug, k_tag,
                        "sequence " + std::to_string(result.sequence) + ": " + decision_name(result.decision));

            if (result.decision != RegenerationDecision::NONE) {
                std::vector<std::shared_ptr<LevelTask>> tasks;
                auto make_task = [&](CacheKey key, std::vector<Image> images, std::optional<std::string> focused) {
                    auto task = std::make_shared<LevelTask>();
                    task->sequence = result.sequence;
                    task->key = key;
                    task->images = std::move(images);
                    task->focused_id = std::move(focused);
                    tasks.push_back(std::move(task));
                };

                if (state.atlas_invalidated) {
                    const CacheKey persistent_key{lod_.lowest_level(), PriorityClass::PERSISTENT};
                    if (cache_.is_invalidated(persistent_key)) {
                        std::vector<Image> all;
                        all.reserve(catalog_.size());
                        for (const auto& [id, image] : catalog_) {
                            all.push_back(image);
                        }
                        std::sort(all.begin(), all.end(), [](const Image& a, const Image& b) { return a.id < b.id; });
                        make_task(persistent_key, std::move(all), std::nullopt);
                        cache_.clear_invalidated(persistent_key);
                    }
                    cache_.drop_invalidated();
                }

                const DetailLevel level = lod_.level_for(snapshot.zoom);
                if (result.decision == RegenerationDecision::FULL) {
                    std::vector<Image> visible = known_images_locked(snapshot.visible_ids, snapshot.focused_id);
                    if (!visible.empty()) {
                        make_task({level, PriorityClass::VISIBLE}, std::move(visible), std::nullopt);
                    }
                    const DetailLevel boosted = lod_.boosted_level(level);
                    std::vector<Image> active = known_images_locked(snapshot.active_ids, snapshot.focused_id);
                    if (boosted != level && !active.empty()) {
                        make_task({boosted, PriorityClass::ACTIVE}, std::move(active), std::nullopt);
                    }
                }

                std::optional<Image> focused;
                if (snapshot.focused_id) {
                    const auto it = catalog_.find(*snapshot.focused_id);
                    if (it != catalog_.end()) {
                        focused = it->second;
                    } else {
                        log_message(LogLevel::Warning, k_tag, "unknown focused id '" + *snapshot.focused_id + "'");
                    }
                }
                if (focused) {
                    make_task({lod_.focused_level(), PriorityClass::FOCUSED}, {*focused}, focused->id);
                } else if (state.focus_changed) {
                    for (auto& task : tasks_) {
                        if (!task->finished && task->key.priority == PriorityClass::FOCUSED) {
                            task->cancelled->store(true);
                        }
                    }
                    cache_.clear_priority(PriorityClass::FOCUSED);
                    AtlasEvent removed;
                    removed.type = AtlasEventType::ATLAS_REMOVED;
                    removed.sequence = result.sequence;
                    removed.level = lod_.focused_level();
                    removed.priority = PriorityClass::FOCUSED;
                    pending.push_back(std::move(removed));
                }

                result.tasks_started = tasks.size();
                if (tasks.empty()) {
                    AtlasEvent complete;
                    complete.type = AtlasEventType::ALL_COMPLETE;
                    complete.sequence = result.sequence;
                    pending.push_back(std::move(complete));
                } else {
                    outstanding_[result.sequence] = tasks.size();
                    for (const auto& task : tasks) {
                        cancel_superseded_locked(task->key, task->sequence);
                    }
                    gate_.wake_all();
                    for (const auto& task : tasks) {
                        launch_locked(task);
                    }
                }
            }
        }
    }
    for (auto& thread : reaped) {
        thread.join();
    }
    for (const auto& event : pending) {
        emit(event);
    }
    return result;
}

void StreamingCoordinator::cancel_superseded_locked(const CacheKey& key, uint64_t sequence) {
    for (auto& task : tasks_) {
        if (!task->finished && task->key == key && task->sequence < sequence) {
            log_message(LogLevel::Debug, k_tag,
                        "cancelling " + describe(key) + " of sequence " + std::to_string(task->sequence));
            task->cancelled->store(true);
        }
    }
}

void StreamingCoordinator::launch_locked(const std::shared_ptr<LevelTask>& task) {
    tasks_.push_back(task);
    task->thread = std::thread([this, task]() { run_task(task); });
}

bool StreamingCoordinator::has_running_locked() const {
    return std::any_of(tasks_.begin(), tasks_.end(), [](const auto& task) { return !task->finished; });
}

void StreamingCoordinator::reap_finished_locked(std::vector<std::thread>& out) {
    for (auto it = tasks_.begin(); it != tasks_.end();) {
        if ((*it)->finished) {
            if ((*it)->thread.joinable()) {
                out.push_back(std::move((*it)->thread));
            }
            it = tasks_.erase(it);
        } else {
            ++it;
        }
    }
}

void StreamingCoordinator::run_task(const std::shared_ptr<LevelTask>& task) {
    try {
        execute_task(*task);
    } catch (const std::exception& e) {
        log_message(LogLevel::Error, k_tag, describe(task->key) + " aborted: " + e.what());
        AtlasEvent event;
        event.type = AtlasEventType::LEVEL_FAILED;
        event.sequence = task->sequence;
        event.level = task->key.level;
        event.priority = task->key.priority;
        event.reason = e.what();
        emit(event);
    }
    finish_task(task);
}

void StreamingCoordinator::execute_task(const LevelTask& task) {
    const CacheKey key = task.key;
    const uint64_t sequence = task.sequence;
    WorkerSlot slot(gate_, *task.cancelled);
    if (!slot.acquired() || task.cancelled->load()) {
        return;
    }

    AtlasEvent loading;
    loading.type = AtlasEventType::LOADING;
    loading.sequence = sequence;
    loading.level = key.level;
    loading.priority = key.priority;
    emit(loading);

    MemoryBudget budget;
    {
        std::scoped_lock lock(state_mutex_);
        budget = budget_locked();
    }

    auto on_progress = [&](double fraction) {
        AtlasEvent progress;
        progress.type = AtlasEventType::PROGRESS;
        progress.sequence = sequence;
        progress.level = key.level;
        progress.priority = key.priority;
        progress.progress = fraction;
        emit(progress);
    };

    std::vector<AtlasPtr> atlases;
    std::vector<std::string> failed;
    std::string reason;
    const BuildStatus status = build_level(task.images, key, task.focused_id, task.cancelled, budget,
                                           on_progress, atlases, failed, reason);
    if (status == BuildStatus::CANCELLED) {
        log_message(LogLevel::Debug, k_tag, describe(key) + " of sequence " + std::to_string(sequence) + " cancelled");
        return;
    }
    if (status == BuildStatus::FAILED) {
        log_message(LogLevel::Warning, k_tag, describe(key) + " failed: " + reason);
        if (key.priority == PriorityClass::PERSISTENT) {
            // The old buffer stays as the fallback; the next submit schedules another rebuild.
            std::scoped_lock commit_lock(commit_mutex_);
            cache_.mark_invalidated(key);
        }
        AtlasEvent event;
        event.type = AtlasEventType::LEVEL_FAILED;
        event.sequence = sequence;
        event.level = key.level;
        event.priority = key.priority;
        event.reason = reason;
        event.failed_ids = std::move(failed);
        emit(event);
        return;
    }

    bool committed = false;
    bool evicted_on_commit = false;
    std::vector<CacheKey> removed;
    {
        std::scoped_lock commit_lock(commit_mutex_);
        if (!task.cancelled->load()) {
            committed = cache_.replace(key, atlases, sequence, &removed);
            if (committed) {
                for (const auto& evicted : cache_.evict_to(budget.byte_ceiling)) {
                    if (evicted == key) {
                        evicted_on_commit = true;
                    } else {
                        removed.push_back(evicted);
                    }
                }
            }
        }
    }
    emit_removed(removed, sequence);
    if (evicted_on_commit) {
        log_message(LogLevel::Warning, k_tag, describe(key) + " does not fit under the memory ceiling");
        AtlasEvent event;
        event.type = AtlasEventType::LEVEL_FAILED;
        event.sequence = sequence;
        event.level = key.level;
        event.priority = key.priority;
        event.reason = "evicted by the memory ceiling";
        emit(event);
        return;
    }
    if (!committed) {
        log_message(LogLevel::Debug, k_tag,
                    describe(key) + " of sequence " + std::to_string(sequence) + " superseded before commit");
        return;
    }

    AtlasEvent ready;
    ready.type = AtlasEventType::LEVEL_READY;
    ready.sequence = sequence;
    ready.level = key.level;
    ready.priority = key.priority;
    ready.progress = 1.0;
    ready.atlases = std::move(atlases);
    ready.failed_ids = std::move(failed);
    emit(ready);
}

void StreamingCoordinator::finish_task(const std::shared_ptr<LevelTask>& task) {
    bool sequence_done = false;
    {
        std::scoped_lock lock(state_mutex_);
        auto it = outstanding_.find(task->sequence);
        if (it != outstanding_.end()) {
            if (--it->second == 0) {
                outstanding_.erase(it);
                sequence_done = true;
            }
        }
    }
    if (sequence_done) {
        AtlasEvent complete;
        complete.type = AtlasEventType::ALL_COMPLETE;
        complete.sequence = task->sequence;
        emit(complete);
    }
    {
        std::scoped_lock lock(state_mutex_);
        task->finished = true;
    }
    idle_cv_.notify_all();
}

StreamingCoordinator::BuildStatus StreamingCoordinator::build_level(const std::vector<Image>& images,
                                                                    const CacheKey& key,
                                                                    const std::optional<std::string>& focused_id,
                                                                    const std::shared_ptr<std::atomic<bool>>& cancelled,
                                                                    const MemoryBudget& budget,
                                                                    const std::function<void(double)>& on_progress,
                                                                    std::vector<AtlasPtr>& atlases,
                                                                    std::vector<std::string>& failed,
                                                                    std::string& reason) {
    if (!loader_ || !loader_->available()) {
        reason = "photo loader unavailable";
        return BuildStatus::FAILED;
    }

    DistributionRequest request;
    request.images = images;
    request.level = key.level;
    request.focused_id = focused_id;
    request.priority = key.priority;
    request.padding = config_.padding;
    const DistributionPlan plan = plan_distribution(request, budget, lod_);
    failed = plan.permanently_failed;
    log_message(LogLevel::Debug, k_tag,
                describe(key) + ": " + policy_name(plan.policy) + " plan with " +
                    std::to_string(plan.entries.size()) + " atlases");
    if (plan.entries.empty()) {
        reason = "no photo could be placed";
        return BuildStatus::FAILED;
    }

    const auto workers = static_cast<unsigned int>(std::max(1, budget.parallelism));
    for (size_t i = 0; i < plan.entries.size(); ++i) {
        if (cancelled->load()) {
            return BuildStatus::CANCELLED;
        }
        const AtlasPlanEntry& entry = plan.entries[i];
        std::vector<DecodedRaster> rasters = decode_entry(entry, workers, cancelled);
        if (cancelled->load()) {
            return BuildStatus::CANCELLED;
        }

        AssemblyResult assembled;
        std::string error;
        if (!assemble_atlas(std::move(rasters), entry.placement, entry.atlas_size, entry.level, entry.priority,
                            next_generation_.fetch_add(1), assembled, error)) {
            log_message(LogLevel::Warning, k_tag, describe(key) + ": " + error);
            failed.insert(failed.end(), entry.member_ids.begin(), entry.member_ids.end());
            continue;
        }
        failed.insert(failed.end(), assembled.failed.begin(), assembled.failed.end());
        if (!assembled.atlas->regions.empty()) {
            atlases.push_back(std::move(assembled.atlas));
        }
        if (on_progress) {
            on_progress(static_cast<double>(i + 1) / static_cast<double>(plan.entries.size()));
        }
    }

    if (atlases.empty()) {
        reason = "no photo could be decoded";
        return BuildStatus::FAILED;
    }
    return BuildStatus::BUILT;
}

std::vector<DecodedRaster> StreamingCoordinator::decode_entry(const AtlasPlanEntry& entry,
                                                              unsigned int workers,
                                                              const std::shared_ptr<std::atomic<bool>>& cancelled) {
    std::vector<std::optional<DecodedRaster>> slots(entry.placement.size());
    run_parallel(entry.placement.size(), workers, [&](size_t index) {
        if (cancelled->load()) {
            return;
        }
        const PackedRect& rect = entry.placement[index];
        DecodeResult decoded = decode_photo(rect.id, rect.width, rect.height, cancelled);
        if (decoded.ok) {
            decoded.raster.id = rect.id;
            slots[index] = std::move(decoded.raster);
        } else if (!cancelled->load()) {
            log_message(LogLevel::Warning, k_tag, "decode failed for '" + rect.id + "': " + decoded.reason);
        }
    });

    std::vector<DecodedRaster> rasters;
    if (cancelled->load()) {
        return rasters;
    }
    rasters.reserve(slots.size());
    for (auto& slot : slots) {
        if (slot) {
            rasters.push_back(std::move(*slot));
        }
    }
    return rasters;
}

DecodeResult StreamingCoordinator::decode_photo(const std::string& id, int width, int height,
                                                const std::shared_ptr<std::atomic<bool>>& cancelled) {
    DecodeResult result = decode_with_timeout(id, width, height, cancelled);
    if (!result.ok && result.retryable && !cancelled->load()) {
        log_message(LogLevel::Info, k_tag, "retrying '" + id + "': " + result.reason);
        result = decode_with_timeout(id, width, height, cancelled);
    }
    return result;
}

DecodeResult StreamingCoordinator::decode_with_timeout(const std::string& id, int width, int height,
                                                       const std::shared_ptr<std::atomic<bool>>& cancelled) {
    if (config_.decode_timeout.count() <= 0) {
        return call_loader(*loader_, id, width, height, *cancelled);
    }
    // Each attempt gets its own flag, raised on timeout or task cancellation, so an
    // abandoned decode stops as soon as the loader checks it.
    auto attempt = std::make_shared<std::atomic<bool>>(false);
    auto done = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<DecodeResult>>();
    std::future<DecodeResult> future = promise->get_future();
    track_decode_thread(std::thread([loader = loader_, promise, attempt, done, id, width, height]() {
                            promise->set_value(call_loader(*loader, id, width, height, *attempt));
                            done->store(true);
                        }),
                        done);
    const auto deadline = std::chrono::steady_clock::now() + config_.decode_timeout;
    while (future.wait_for(k_decode_poll) != std::future_status::ready) {
        if (cancelled->load()) {
            attempt->store(true);
            return decode_failure("decode of '" + id + "' cancelled", false);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            attempt->store(true);
            return decode_failure("decode of '" + id + "' timed out", false);
        }
    }
    return future.get();
}

void StreamingCoordinator::track_decode_thread(std::thread thread, std::shared_ptr<std::atomic<bool>> done) {
    std::vector<std::thread> finished;
    {
        std::scoped_lock lock(decode_threads_mutex_);
        for (auto it = decode_threads_.begin(); it != decode_threads_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(it->thread));
                it = decode_threads_.erase(it);
            } else {
                ++it;
            }
        }
        decode_threads_.push_back({std::move(thread), std::move(done)});
    }
    for (auto& t : finished) {
        t.join();
    }
}

void StreamingCoordinator::set_memory_pressure(PressureLevel pressure) {
    MemoryBudget budget;
    uint64_t sequence = 0;
    {
        std::scoped_lock lock(state_mutex_);
        pressure_ = pressure;
        budget = budget_locked();
        sequence = next_sequence_ - 1;
    }
    log_message(LogLevel::Info, k_tag, std::string("memory pressure ") + pressure_name(pressure));
    gate_.set_capacity(budget.parallelism);
    std::vector<CacheKey> evicted;
    {
        std::scoped_lock commit_lock(commit_mutex_);
        evicted = cache_.evict_to(budget.byte_ceiling);
    }
    emit_removed(evicted, sequence);
}

void StreamingCoordinator::report_reclaimed(DetailLevel level) {
    log_message(LogLevel::Info, k_tag, "atlases of " + level_name(level) + " reclaimed");
    std::scoped_lock commit_lock(commit_mutex_);
    cache_.mark_invalidated(level);
}

std::optional<RegionLookup> StreamingCoordinator::find_region(const std::string& id) const {
    return cache_.find_region(id);
}

std::vector<AtlasPtr> StreamingCoordinator::atlases(DetailLevel level, PriorityClass priority) const {
    return cache_.atlases({level, priority});
}

size_t StreamingCoordinator::cached_bytes() const {
    return cache_.total_bytes();
}

uint64_t StreamingCoordinator::subscribe(AtlasEventCallback callback) {
    std::scoped_lock lock(subscriber_mutex_);
    const uint64_t id = next_subscription_++;
    subscribers_.emplace(id, std::move(callback));
    return id;
}

void StreamingCoordinator::unsubscribe(uint64_t subscription) {
    std::scoped_lock lock(subscriber_mutex_);
    subscribers_.erase(subscription);
}

void StreamingCoordinator::emit(const AtlasEvent& event) {
    std::vector<AtlasEventCallback> callbacks;
    {
        std::scoped_lock lock(subscriber_mutex_);
        callbacks.reserve(subscribers_.size());
        for (const auto& [id, callback] : subscribers_) {
            callbacks.push_back(callback);
        }
    }
    for (const auto& callback : callbacks) {
        callback(event);
    }
}

void StreamingCoordinator::emit_removed(const std::vector<CacheKey>& keys, uint64_t sequence) {
    for (const auto& key : keys) {
        AtlasEvent removed;
        removed.type = AtlasEventType::ATLAS_REMOVED;
        removed.sequence = sequence;
        removed.level = key.level;
        removed.priority = key.priority;
        emit(removed);
    }
}

void StreamingCoordinator::wait_idle() {
    while (true) {
        std::vector<std::thread> threads;
        {
            std::unique_lock lock(state_mutex_);
            idle_cv_.wait(lock, [&] { return !has_running_locked(); });
            if (tasks_.empty()) {
                return;
            }
            reap_finished_locked(threads);
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }
}

void StreamingCoordinator::shutdown() {
    std::vector<std::thread> threads;
    {
        std::scoped_lock lock(state_mutex_);
        shut_down_ = true;
        for (auto& task : tasks_) {
            task->cancelled->store(true);
            if (task->thread.joinable()) {
                threads.push_back(std::move(task->thread));
            }
        }
    }
    gate_.close();
    for (auto& thread : threads) {
        thread.join();
    }
    // Every waiter has returned and raised its attempt flag by now.
    std::vector<DecodeThread> decodes;
    {
        std::scoped_lock lock(decode_threads_mutex_);
        decodes.swap(decode_threads_);
    }
    for (auto& decode : decodes) {
        if (decode.thread.joinable()) {
            decode.thread.join();
        }
    }
    std::scoped_lock lock(state_mutex_);
    tasks_.clear();
}

} // namespace tessera::core
