#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "vidlift/client/cancellation.h"
#include "vidlift/client/part_transport.h"
#include "vidlift/client/post_completion_hook.h"
#include "vidlift/client/session_negotiator.h"
#include "vidlift/client/upload_source.h"
#include "vidlift/client/upload_types.h"
#include "vidlift/core/config.h"
#include "vidlift/core/result.h"

namespace vidlift::client {

/// @brief Scheduling and retry policy for one session.
struct CoordinatorOptions {
    std::uint64_t part_size{10ULL * 1024 * 1024};
    int max_parts{10000};
    /// In-flight part window; independent of the part count.
    int concurrency{4};
    /// Attempts per part (and per transient negotiation failure), including the first.
    int max_attempts{3};
    std::chrono::milliseconds retry_base_delay{1000};
    std::chrono::milliseconds retry_max_delay{30000};
    /// Consult the server's status to skip parts it already holds.
    bool resume{false};
    /// Ask the server to discard the session after a user cancel.
    bool abort_on_cancel{true};

    static CoordinatorOptions FromConfig(const core::ClientUploadConfig& config);
};

struct UploadCallbacks {
    std::function<void(const UploadProgress&)> on_progress;
    std::function<void(const std::string& video_id, const std::string& object_location)>
        on_complete;
    std::function<void(const std::string& video_id, const core::Error& error)> on_error;
};

/// @brief Drives one upload session end to end.
///
/// initializing -> uploading -> completing -> completed, with failed and cancelled as side
/// exits. A coordinator runs once; retries build a new coordinator. Progress callbacks are
/// serialized and their counters never decrease.
class UploadCoordinator {
public:
    UploadCoordinator(VideoKey video, std::shared_ptr<const UploadSource> source,
                      std::shared_ptr<SessionNegotiator> negotiator,
                      std::shared_ptr<PartTransport> transport, CoordinatorOptions options,
                      UploadCallbacks callbacks,
                      std::shared_ptr<PostCompletionHook> hook = nullptr);
    /// Shuts the coordinator down and joins its thread.
    ~UploadCoordinator();

    UploadCoordinator(const UploadCoordinator&) = delete;
    UploadCoordinator& operator=(const UploadCoordinator&) = delete;

    /// @brief Runs the session on a dedicated thread.
    void Start();
    /// @brief Runs the session on the calling thread.
    /// @return The finalized object location.
    core::Result<std::string> Run();
    /// @brief Requests cancellation. Accepted only while initializing or uploading.
    ///
    /// Returns once no further part report or finalize call can be issued.
    bool Cancel();
    /// @brief Cancels a running session and interrupts a post-completion hook in progress.
    ///
    /// The hook's outcome still never changes the upload status.
    void Shutdown();
    /// @brief Waits for the session thread. Safe from several threads; a no-op on any thread
    /// working for this coordinator.
    void Join();
    /// @brief True once the session thread has returned (or Run finished).
    bool finished() const { return finished_.load(); }

    UploadProgress progress() const;
    std::vector<PartDescriptor> parts() const;
    std::string session_id() const;
    const VideoKey& video() const { return video_; }

    /// @brief Backoff before retry number `attempt` (1-based): base * 2^(attempt-1), capped.
    static std::chrono::milliseconds BackoffDelay(int attempt, std::chrono::milliseconds base,
                                                  std::chrono::milliseconds max_delay);

private:
    core::Result<std::string> Execute();
    core::Result<SessionGrant> InitializeSession(std::vector<int>* server_completed);
    core::Result<void> RunParts();
    void WorkerLoop(const std::vector<int>& pending, std::atomic<std::size_t>* next);
    core::Result<void> UploadPart(int index);
    core::Result<void> ReportAndCommit(int index, const std::string& checksum);
    core::Result<FinalizeResult> FinalizeSession();

    template <typename T>
    core::Result<T> WithRetry(const std::string& what, const std::function<core::Result<T>()>& call);

    bool Transition(UploadStatus next);
    void Fail(const core::Error& error);
    void RecordFatal(const core::Error& error);
    bool StopRequested() const;
    core::Error CancelledError() const;
    void Emit();
    void SetPart(int index, PartState state, std::uint64_t uploaded_bytes);

    VideoKey video_;
    std::shared_ptr<const UploadSource> source_;
    std::shared_ptr<SessionNegotiator> negotiator_;
    std::shared_ptr<PartTransport> transport_;
    CoordinatorOptions options_;
    UploadCallbacks callbacks_;
    std::shared_ptr<PostCompletionHook> hook_;

    mutable std::mutex state_mutex_;
    UploadProgress progress_;
    std::vector<PartDescriptor> parts_;
    std::string session_id_;
    std::optional<core::Error> fatal_error_;

    // Serializes progress emission so observers see counters in snapshot order.
    std::recursive_mutex emit_mutex_;
    // Part reports hold it shared; Cancel takes it exclusively as a fence.
    std::shared_mutex fence_mutex_;
    std::atomic<bool> cancel_requested_{false};
    CancellationSource stop_source_;
    CancellationSource shutdown_source_;

    std::atomic<bool> started_{false};
    std::atomic<bool> finished_{false};
    std::mutex thread_mutex_;
    std::thread thread_;
};

}  // namespace vidlift::client
