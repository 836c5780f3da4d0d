#include "vidlift/client/progress_store.h"

#include <algorithm>

#include "vidlift/core/logger.h"

namespace vidlift::client {

namespace {

std::vector<UploadEntry> ToEntries(const std::map<std::string, UploadEntry>& registry) {
    std::vector<UploadEntry> entries;
    entries.reserve(registry.size());
    for (const auto& item : registry) {
        entries.push_back(item.second);
    }
    return entries;
}

// Forward-only status, non-decreasing counters.
bool MergeProgress(UploadProgress& current, const UploadProgress& incoming) {
    if (incoming.status != current.status && !CanTransition(current.status, incoming.status)) {
        return false;
    }
    UploadProgress next = incoming;
    if (next.file_name.empty()) {
        next.file_name = current.file_name;
    }
    next.total_bytes = std::max(current.total_bytes, incoming.total_bytes);
    next.total_parts = std::max(current.total_parts, incoming.total_parts);
    next.uploaded_bytes =
        std::min(std::max(current.uploaded_bytes, incoming.uploaded_bytes), next.total_bytes);
    next.completed_parts =
        std::min(std::max(current.completed_parts, incoming.completed_parts), next.total_parts);
    current = std::move(next);
    return true;
}

}  // namespace

CoordinatorFactory MakeCoordinatorFactory(std::shared_ptr<SessionNegotiator> negotiator,
                                          std::shared_ptr<PartTransport> transport,
                                          CoordinatorOptions options,
                                          std::shared_ptr<PostCompletionHook> hook) {
    return [negotiator, transport, options, hook](const VideoKey& video,
                                                  std::shared_ptr<const UploadSource> source,
                                                  UploadCallbacks callbacks, bool resume) {
        auto session_options = options;
        session_options.resume = session_options.resume || resume;
        return std::make_unique<UploadCoordinator>(video, std::move(source), negotiator, transport,
                                                   session_options, std::move(callbacks), hook);
    };
}

UploadStore::UploadStore(CoordinatorFactory factory, std::shared_ptr<ActiveUploadLedger> ledger)
    : factory_(std::move(factory)),
      ledger_(std::move(ledger)),
      registry_(std::make_shared<const Registry>()) {}

UploadStore::~UploadStore() {
    std::vector<std::shared_ptr<UploadCoordinator>> owned;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (auto& item : sessions_) {
            if (item.second.coordinator) {
                owned.push_back(item.second.coordinator);
            }
        }
        owned.insert(owned.end(), retired_.begin(), retired_.end());
    }
    for (auto& coordinator : owned) {
        coordinator->Shutdown();
    }
    for (auto& coordinator : owned) {
        coordinator->Join();
    }
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    sessions_.clear();
    retired_.clear();
}

core::Result<void> UploadStore::StartUpload(const std::string& organization_id,
                                            const std::string& video_id,
                                            std::shared_ptr<const UploadSource> source,
                                            UploadCallbacks callbacks, bool resume) {
    if (organization_id.empty() || video_id.empty()) {
        return core::Error{core::ErrorCode::kInvalidArgument, "organization and video are required"};
    }
    if (!source) {
        return core::Error{core::ErrorCode::kInvalidArgument, "upload source is required"};
    }

    std::uint64_t generation = 0;
    std::shared_ptr<UploadCoordinator> previous;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        generation = ++next_generation_;
        auto it = sessions_.find(video_id);
        if (it != sessions_.end()) {
            previous = it->second.coordinator;
        }
    }
    // One session per video: the old one must stop before the new one talks to the server.
    if (previous && !previous->finished()) {
        if (previous->Cancel()) {
            core::LogEvent("upload_superseded", {{"video_id", video_id},
                                                 {"session_id", previous->session_id()}});
        } else if (IsActive(previous->progress().status)) {
            return core::Error{core::ErrorCode::kFailedPrecondition,
                               "upload for video " + video_id + " is already completing"};
        }
        // A cancelled session may still be aborting on the server; a resume must not race it.
        previous->Join();
    }

    UploadCallbacks wrapped;
    wrapped.on_progress = [this, video_id, generation,
                           on_progress = callbacks.on_progress](const UploadProgress& progress) {
        OnProgress(video_id, generation, progress);
        if (on_progress) {
            on_progress(progress);
        }
    };
    wrapped.on_complete = callbacks.on_complete;
    wrapped.on_error = callbacks.on_error;

    std::shared_ptr<UploadCoordinator> coordinator =
        factory_(VideoKey{organization_id, video_id}, source, std::move(wrapped), resume);
    if (!coordinator) {
        return core::Error{core::ErrorCode::kInternal, "coordinator factory returned nothing"};
    }

    std::shared_ptr<UploadCoordinator> displaced;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto& slot = sessions_[video_id];
        if (slot.generation > generation) {
            return core::Error{core::ErrorCode::kConflict,
                               "a newer upload for video " + video_id + " was started"};
        }
        if (slot.coordinator) {
            displaced = slot.coordinator;
            retired_.push_back(slot.coordinator);
        }
        slot.coordinator = coordinator;
        slot.generation = generation;
        slot.callbacks = std::move(callbacks);
    }
    if (displaced && displaced != previous) {
        displaced->Cancel();
    }

    const auto initial = coordinator->progress();
    Update([&](Registry& registry) {
        auto& entry = registry[video_id];
        if (entry.generation > generation) {
            return false;
        }
        entry.video_id = video_id;
        entry.organization_id = organization_id;
        entry.source = source;
        entry.generation = generation;
        entry.progress = initial;
        return true;
    });

    ReapRetired();
    coordinator->Start();
    return core::Ok();
}

core::Result<void> UploadStore::CancelUpload(const std::string& organization_id,
                                             const std::string& video_id) {
    std::shared_ptr<UploadCoordinator> coordinator;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(video_id);
        if (it != sessions_.end() &&
            it->second.coordinator->video().organization_id == organization_id) {
            coordinator = it->second.coordinator;
        }
    }
    if (!coordinator) {
        auto entry = Find(video_id);
        if (entry && entry->organization_id == organization_id) {
            return core::Error{core::ErrorCode::kFailedPrecondition,
                               "upload for video " + video_id + " is not owned by this process"};
        }
        return core::Error{core::ErrorCode::kNotFound, "no upload for video " + video_id};
    }
    if (!coordinator->Cancel()) {
        return core::Error{core::ErrorCode::kFailedPrecondition,
                           std::string("upload is ") +
                               UploadStatusName(coordinator->progress().status) +
                               " and can no longer be cancelled"};
    }
    return core::Ok();
}

core::Result<void> UploadStore::RetryUpload(const std::string& video_id) {
    auto entry = Find(video_id);
    if (!entry) {
        return core::Error{core::ErrorCode::kNotFound, "no upload for video " + video_id};
    }
    if (!entry->has_source()) {
        return core::Error{core::ErrorCode::kFailedPrecondition,
                           "original file for video " + video_id + " is no longer available"};
    }
    if (entry->progress.status != UploadStatus::kFailed &&
        entry->progress.status != UploadStatus::kCancelled) {
        return core::Error{core::ErrorCode::kFailedPrecondition,
                           std::string("cannot retry an upload that is ") +
                               UploadStatusName(entry->progress.status)};
    }

    UploadCallbacks callbacks;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(video_id);
        if (it != sessions_.end()) {
            callbacks = it->second.callbacks;
        }
    }
    return StartUpload(entry->organization_id, video_id, entry->source, std::move(callbacks),
                       true);
}

core::Result<void> UploadStore::DismissUpload(const std::string& video_id) {
    core::Result<void> outcome = core::Ok();
    std::uint64_t generation = 0;
    Update([&](Registry& registry) {
        auto it = registry.find(video_id);
        if (it == registry.end()) {
            outcome = core::Error{core::ErrorCode::kNotFound, "no upload for video " + video_id};
            return false;
        }
        if (!IsTerminal(it->second.progress.status)) {
            outcome = core::Error{core::ErrorCode::kFailedPrecondition,
                                  std::string("cannot dismiss an upload that is ") +
                                      UploadStatusName(it->second.progress.status)};
            return false;
        }
        generation = it->second.generation;
        registry.erase(it);
        return true;
    });
    if (!outcome.ok()) {
        return outcome;
    }

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(video_id);
        if (it != sessions_.end() && it->second.generation == generation) {
            retired_.push_back(it->second.coordinator);
            sessions_.erase(it);
        }
    }
    ReapRetired();
    return core::Ok();
}

std::function<void()> UploadStore::Subscribe(StoreListener listener) {
    std::lock_guard<std::mutex> lock(notify_mutex_);
    const auto id = next_listener_id_++;
    listeners_.emplace(id, std::move(listener));
    return [this, id]() {
        std::lock_guard<std::mutex> unsubscribe_lock(notify_mutex_);
        listeners_.erase(id);
    };
}

std::vector<UploadEntry> UploadStore::Snapshot() const {
    RegistryPtr registry;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        registry = registry_;
    }
    return ToEntries(*registry);
}

std::optional<UploadEntry> UploadStore::Find(const std::string& video_id) const {
    RegistryPtr registry;
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        registry = registry_;
    }
    auto it = registry->find(video_id);
    if (it == registry->end()) {
        return std::nullopt;
    }
    return it->second;
}

bool UploadStore::ApplyExternalProgress(const std::string& organization_id,
                                        const UploadProgress& progress) {
    if (progress.video_id.empty()) {
        return false;
    }
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(progress.video_id);
        if (it != sessions_.end() && !it->second.coordinator->finished()) {
            return false;
        }
    }
    bool applied = false;
    Update([&](Registry& registry) {
        auto it = registry.find(progress.video_id);
        if (it == registry.end()) {
            UploadEntry entry;
            entry.video_id = progress.video_id;
            entry.organization_id = organization_id;
            entry.progress = progress;
            registry.emplace(progress.video_id, std::move(entry));
            applied = true;
            return true;
        }
        applied = MergeProgress(it->second.progress, progress);
        return applied;
    });
    return applied;
}

int UploadStore::ActiveCount() const {
    const auto entries = Snapshot();
    return static_cast<int>(std::count_if(entries.begin(), entries.end(), [](const UploadEntry& entry) {
        return IsActive(entry.progress.status);
    }));
}

void UploadStore::JoinUpload(const std::string& video_id) {
    std::shared_ptr<UploadCoordinator> coordinator;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(video_id);
        if (it != sessions_.end()) {
            coordinator = it->second.coordinator;
        }
    }
    if (coordinator) {
        coordinator->Join();
    }
}

void UploadStore::Update(const std::function<bool(Registry&)>& mutate) {
    {
        std::lock_guard<std::mutex> lock(registry_mutex_);
        auto next = std::make_shared<Registry>(*registry_);
        if (!mutate(*next)) {
            return;
        }
        registry_ = std::move(next);
        std::lock_guard<std::mutex> notify_lock(notify_mutex_);
        pending_.push_back(registry_);
    }
    Drain();
}

void UploadStore::Drain() {
    {
        std::lock_guard<std::mutex> lock(notify_mutex_);
        // Another thread is delivering; it will pick up what was just queued.
        if (draining_) {
            return;
        }
        draining_ = true;
    }
    for (;;) {
        RegistryPtr snapshot;
        std::vector<StoreListener> listeners;
        {
            std::lock_guard<std::mutex> lock(notify_mutex_);
            if (pending_.empty()) {
                draining_ = false;
                return;
            }
            snapshot = pending_.front();
            pending_.pop_front();
            listeners.reserve(listeners_.size());
            for (const auto& item : listeners_) {
                listeners.push_back(item.second);
            }
        }
        PersistActive(*snapshot);
        const auto entries = ToEntries(*snapshot);
        for (const auto& listener : listeners) {
            listener(entries);
        }
    }
}

void UploadStore::PersistActive(const Registry& registry) {
    if (!ledger_) {
        return;
    }
    std::vector<ActiveUpload> active;
    for (const auto& item : registry) {
        const auto status = item.second.progress.status;
        if (status == UploadStatus::kInitializing || status == UploadStatus::kUploading) {
            active.push_back(ActiveUpload{item.second.video_id, item.second.organization_id});
        }
    }
    if (active == last_persisted_) {
        return;
    }
    auto written = ledger_->Write(active);
    if (!written.ok()) {
        core::LogEvent("ledger_write_failed", {{"path", ledger_->path()},
                                               {"message", written.error().message}});
        return;
    }
    last_persisted_ = std::move(active);
}

void UploadStore::OnProgress(const std::string& video_id, std::uint64_t generation,
                             const UploadProgress& progress) {
    Update([&](Registry& registry) {
        auto it = registry.find(video_id);
        if (it == registry.end() || it->second.generation != generation) {
            return false;
        }
        return MergeProgress(it->second.progress, progress);
    });
}

void UploadStore::ReapRetired() {
    std::vector<std::shared_ptr<UploadCoordinator>> done;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto split = std::stable_partition(
            retired_.begin(), retired_.end(),
            [](const std::shared_ptr<UploadCoordinator>& coordinator) {
                return !coordinator->finished();
            });
        done.assign(split, retired_.end());
        retired_.erase(split, retired_.end());
    }
    // Finished coordinators are destroyed here, outside the store locks.
}

}  // namespace vidlift::client
