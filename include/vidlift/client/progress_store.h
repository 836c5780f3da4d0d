#pragma once

#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "vidlift/client/active_upload_ledger.h"
#include "vidlift/client/upload_coordinator.h"
#include "vidlift/core/result.h"

namespace vidlift::client {

/// @brief Registry record for one video.
struct UploadEntry {
    std::string video_id;
    std::string organization_id;
    /// Absent when the entry was rebuilt from an external progress event.
    std::shared_ptr<const UploadSource> source;
    UploadProgress progress;
    /// Session generation that owns the entry; 0 for external entries.
    std::uint64_t generation{0};

    bool has_source() const { return source != nullptr; }
};

using StoreListener = std::function<void(const std::vector<UploadEntry>&)>;

using CoordinatorFactory = std::function<std::unique_ptr<UploadCoordinator>(
    const VideoKey& video, std::shared_ptr<const UploadSource> source, UploadCallbacks callbacks,
    bool resume)>;

/// @brief Factory building coordinators that share one negotiator, transport and policy.
CoordinatorFactory MakeCoordinatorFactory(std::shared_ptr<SessionNegotiator> negotiator,
                                          std::shared_ptr<PartTransport> transport,
                                          CoordinatorOptions options,
                                          std::shared_ptr<PostCompletionHook> hook = nullptr);

/// @brief Process-wide upload registry shared by all observers.
///
/// Every mutation goes through one update path that swaps in a new immutable registry.
/// Listeners receive each snapshot in mutation order and may call back into the store.
/// At most one local session exists per video; starting another cancels the first.
class UploadStore {
public:
    explicit UploadStore(CoordinatorFactory factory,
                         std::shared_ptr<ActiveUploadLedger> ledger = nullptr);
    /// Cancels and joins every session still owned by the store.
    ~UploadStore();

    UploadStore(const UploadStore&) = delete;
    UploadStore& operator=(const UploadStore&) = delete;

    core::Result<void> StartUpload(const std::string& organization_id, const std::string& video_id,
                                   std::shared_ptr<const UploadSource> source,
                                   UploadCallbacks callbacks = {}, bool resume = false);
    core::Result<void> CancelUpload(const std::string& organization_id,
                                    const std::string& video_id);
    /// @brief Starts a new session from the retained source, resuming from server state.
    core::Result<void> RetryUpload(const std::string& video_id);
    /// @brief Removes a terminal entry.
    core::Result<void> DismissUpload(const std::string& video_id);

    /// @brief Registers `listener`; the returned function unsubscribes it.
    std::function<void()> Subscribe(StoreListener listener);
    std::vector<UploadEntry> Snapshot() const;
    std::optional<UploadEntry> Find(const std::string& video_id) const;
    /// @brief Folds progress observed elsewhere into the registry.
    /// @return False when ignored (live local session, stale or backward move).
    bool ApplyExternalProgress(const std::string& organization_id, const UploadProgress& progress);
    /// @brief Entries initializing, uploading or completing.
    int ActiveCount() const;
    /// @brief Blocks until the local session for `video_id` has returned.
    void JoinUpload(const std::string& video_id);

private:
    using Registry = std::map<std::string, UploadEntry>;
    using RegistryPtr = std::shared_ptr<const Registry>;

    struct Session {
        std::shared_ptr<UploadCoordinator> coordinator;
        std::uint64_t generation{0};
        UploadCallbacks callbacks;
    };

    void Update(const std::function<bool(Registry&)>& mutate);
    void Drain();
    void PersistActive(const Registry& registry);
    void OnProgress(const std::string& video_id, std::uint64_t generation,
                    const UploadProgress& progress);
    void ReapRetired();

    CoordinatorFactory factory_;
    std::shared_ptr<ActiveUploadLedger> ledger_;

    mutable std::mutex registry_mutex_;
    RegistryPtr registry_;

    std::mutex notify_mutex_;
    std::deque<RegistryPtr> pending_;
    bool draining_{false};
    std::map<std::uint64_t, StoreListener> listeners_;
    std::uint64_t next_listener_id_{1};
    std::vector<ActiveUpload> last_persisted_;

    std::mutex sessions_mutex_;
    std::map<std::string, Session> sessions_;
    std::vector<std::shared_ptr<UploadCoordinator>> retired_;
    std::uint64_t next_generation_{0};
};

}  // namespace vidlift::client
