#include "vidlift/client/upload_coordinator.h"

#include <algorithm>
#include <set>

#include "vidlift/core/logger.h"

namespace vidlift::client {

namespace {

std::string JoinIndexes(const std::vector<int>& indexes) {
    std::string out;
    for (const auto index : indexes) {
        if (!out.empty()) {
            out += ",";
        }
        out += std::to_string(index);
    }
    return out;
}

// Coordinator the current thread is working for, if any.
thread_local const UploadCoordinator* tls_current_coordinator = nullptr;

class ScopedCurrentCoordinator {
public:
    explicit ScopedCurrentCoordinator(const UploadCoordinator* coordinator)
        : previous_(tls_current_coordinator) {
        tls_current_coordinator = coordinator;
    }
    ~ScopedCurrentCoordinator() { tls_current_coordinator = previous_; }

private:
    const UploadCoordinator* previous_;
};

}  // namespace

CoordinatorOptions CoordinatorOptions::FromConfig(const core::ClientUploadConfig& config) {
    CoordinatorOptions options;
    options.part_size = config.part_size;
    options.max_parts = config.max_parts;
    options.concurrency = config.concurrency;
    options.max_attempts = config.max_attempts;
    options.retry_base_delay = std::chrono::milliseconds(config.retry_base_delay_ms);
    options.retry_max_delay = std::chrono::milliseconds(config.retry_max_delay_ms);
    options.resume = config.resume_on_start;
    options.abort_on_cancel = config.abort_on_cancel;
    return options;
}

UploadCoordinator::UploadCoordinator(VideoKey video, std::shared_ptr<const UploadSource> source,
                                     std::shared_ptr<SessionNegotiator> negotiator,
                                     std::shared_ptr<PartTransport> transport,
                                     CoordinatorOptions options, UploadCallbacks callbacks,
                                     std::shared_ptr<PostCompletionHook> hook)
    : video_(std::move(video)),
      source_(std::move(source)),
      negotiator_(std::move(negotiator)),
      transport_(std::move(transport)),
      options_(std::move(options)),
      callbacks_(std::move(callbacks)),
      hook_(std::move(hook)) {
    progress_.video_id = video_.video_id;
    if (source_) {
        progress_.file_name = source_->name();
        progress_.total_bytes = source_->size();
    }
    progress_.status = UploadStatus::kInitializing;
}

UploadCoordinator::~UploadCoordinator() {
    Shutdown();
    Join();
}

void UploadCoordinator::Start() {
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (thread_.joinable() || started_.load()) {
        return;
    }
    thread_ = std::thread([this]() {
        auto result = Run();
        if (!result.ok()) {
            core::LogDebug("upload " + video_.video_id + " ended: " + result.error().message);
        }
    });
}

void UploadCoordinator::Join() {
    // Callbacks may re-enter from the session or a part worker; those threads cannot wait on it.
    if (tls_current_coordinator == this) {
        return;
    }
    std::lock_guard<std::mutex> lock(thread_mutex_);
    if (thread_.joinable()) {
        thread_.join();
    }
}

void UploadCoordinator::Shutdown() {
    Cancel();
    shutdown_source_.Cancel();
}

core::Result<std::string> UploadCoordinator::Run() {
    if (started_.exchange(true)) {
        return core::Error{core::ErrorCode::kFailedPrecondition, "upload session already started"};
    }
    ScopedCurrentCoordinator current(this);
    if (!source_ || !negotiator_ || !transport_) {
        const core::Error error{core::ErrorCode::kInvalidArgument,
                                "upload coordinator is missing a collaborator"};
        Fail(error);
        finished_ = true;
        return error;
    }

    Emit();
    auto result = Execute();
    if (result.ok()) {
        core::LogEvent("upload_completed", {{"organization_id", video_.organization_id},
                                            {"video_id", video_.video_id},
                                            {"session_id", session_id()},
                                            {"object_location", result.value()}});
        if (hook_) {
            auto hooked = hook_->Run(video_, *source_, shutdown_source_.token());
            if (!hooked.ok()) {
                core::LogEvent("post_completion_failed",
                               {{"video_id", video_.video_id},
                                {"error_code", core::ErrorCodeName(hooked.error().code)},
                                {"message", hooked.error().message}});
            }
        }
        if (callbacks_.on_complete) {
            callbacks_.on_complete(video_.video_id, result.value());
        }
        finished_ = true;
        return result;
    }

    const auto error = result.error();
    if (cancel_requested_.load()) {
        const auto sid = session_id();
        core::LogEvent("upload_cancelled", {{"organization_id", video_.organization_id},
                                            {"video_id", video_.video_id},
                                            {"session_id", sid}});
        if (options_.abort_on_cancel && !sid.empty()) {
            // Best effort: a fresh token because the session's own token is already cancelled.
            auto aborted = negotiator_->Abort(video_, sid, CancellationToken());
            if (!aborted.ok()) {
                core::LogWarning("abort of session " + sid + " failed: " + aborted.error().message);
            }
        }
    } else {
        Fail(error);
    }
    finished_ = true;
    return error;
}

core::Result<std::string> UploadCoordinator::Execute() {
    std::vector<int> server_completed;
    auto grant = InitializeSession(&server_completed);
    if (!grant.ok()) {
        return grant.error();
    }
    if (StopRequested()) {
        return CancelledError();
    }

    const auto total_bytes = source_->size();
    auto ranges = SplitIntoParts(total_bytes, grant.value().part_size);
    if (!ranges.ok()) {
        return core::Error{core::ErrorCode::kProtocol, "server issued an invalid part size"};
    }
    const auto part_count = ranges.value().size();
    if (grant.value().parts.size() != part_count ||
        static_cast<std::size_t>(grant.value().total_parts) != part_count) {
        return core::Error{core::ErrorCode::kProtocol,
                           "server part layout disagrees with local chunking (" +
                               std::to_string(grant.value().parts.size()) + " destinations for " +
                               std::to_string(part_count) + " parts)"};
    }

    std::vector<PartDescriptor> parts(part_count);
    std::vector<bool> seen(part_count, false);
    for (const auto& destination : grant.value().parts) {
        if (destination.index < 0 || static_cast<std::size_t>(destination.index) >= part_count ||
            seen[static_cast<std::size_t>(destination.index)]) {
            return core::Error{core::ErrorCode::kProtocol,
                               "invalid destination index " + std::to_string(destination.index)};
        }
        const auto slot = static_cast<std::size_t>(destination.index);
        seen[slot] = true;
        parts[slot].index = destination.index;
        parts[slot].range = ranges.value()[slot];
        parts[slot].destination = destination;
    }

    int completed = 0;
    std::uint64_t completed_bytes = 0;
    for (const auto index : std::set<int>(server_completed.begin(), server_completed.end())) {
        if (index < 0 || static_cast<std::size_t>(index) >= part_count) {
            continue;
        }
        auto& part = parts[static_cast<std::size_t>(index)];
        part.state = PartState::kUploaded;
        part.uploaded_bytes = part.range.length;
        ++completed;
        completed_bytes += part.range.length;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        session_id_ = grant.value().session_id;
        parts_ = std::move(parts);
        progress_.total_parts = static_cast<int>(part_count);
        progress_.completed_parts = completed;
        progress_.uploaded_bytes = completed_bytes;
        if (!CanTransition(progress_.status, UploadStatus::kUploading)) {
            return CancelledError();
        }
        progress_.status = UploadStatus::kUploading;
    }
    core::LogEvent("session_initialized", {{"organization_id", video_.organization_id},
                                           {"video_id", video_.video_id},
                                           {"session_id", grant.value().session_id},
                                           {"total_parts", std::to_string(part_count)},
                                           {"resumed_parts", std::to_string(completed)}});
    Emit();

    auto uploaded = RunParts();
    if (!uploaded.ok()) {
        return uploaded.error();
    }
    if (!Transition(UploadStatus::kCompleting)) {
        return CancelledError();
    }
    Emit();

    auto finalized = FinalizeSession();
    if (!finalized.ok()) {
        return finalized.error();
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        progress_.uploaded_bytes = progress_.total_bytes;
        progress_.completed_parts = progress_.total_parts;
        progress_.status = UploadStatus::kCompleted;
    }
    Emit();
    return finalized.value().object_location;
}

core::Result<SessionGrant> UploadCoordinator::InitializeSession(std::vector<int>* server_completed) {
    const auto token = stop_source_.token();
    InitRequest request;
    request.video = video_;
    request.total_bytes = source_->size();
    request.file_name = source_->name();
    request.mime_type = source_->mime_type();

    auto part_size = ChoosePartSize(request.total_bytes, options_.part_size, options_.max_parts);
    if (!part_size.ok()) {
        return core::Error{core::ErrorCode::kSessionInit, part_size.error().message};
    }
    request.part_size = part_size.value();

    if (options_.resume) {
        // Only the server's record decides which parts can be skipped.
        auto status = WithRetry<SessionStatus>(
            "status query", [&]() { return negotiator_->QueryStatus(video_, token); });
        if (status.ok()) {
            if (status.value().total_bytes == request.total_bytes && status.value().part_size > 0) {
                request.resume_session_id = status.value().session_id;
                request.part_size = status.value().part_size;
                *server_completed = status.value().completed_part_indexes;
            }
        } else if (status.error().code == core::ErrorCode::kCancelled) {
            return CancelledError();
        } else if (status.error().code != core::ErrorCode::kNotFound) {
            core::LogWarning("resume status for video " + video_.video_id +
                             " unavailable, starting a fresh session: " + status.error().message);
        }
    }

    auto grant = WithRetry<SessionGrant>(
        "session initialization", [&]() { return negotiator_->Initialize(request, token); });
    if (!grant.ok()) {
        if (grant.error().code == core::ErrorCode::kCancelled ||
            grant.error().code == core::ErrorCode::kSessionInit) {
            return grant.error();
        }
        return core::Error{core::ErrorCode::kSessionInit,
                           "session initialization failed: " + grant.error().message};
    }
    if (grant.value().session_id != request.resume_session_id) {
        server_completed->clear();
    }
    return grant;
}

core::Result<void> UploadCoordinator::RunParts() {
    std::vector<int> pending;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (const auto& part : parts_) {
            if (part.state != PartState::kUploaded) {
                pending.push_back(part.index);
            }
        }
    }

    if (!pending.empty()) {
        const auto window = static_cast<std::size_t>(std::max(options_.concurrency, 1));
        const auto worker_count = std::min(window, pending.size());
        std::atomic<std::size_t> next{0};
        std::vector<std::thread> workers;
        workers.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i) {
            workers.emplace_back(&UploadCoordinator::WorkerLoop, this, std::cref(pending), &next);
        }
        for (auto& worker : workers) {
            worker.join();
        }
    }

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (fatal_error_) {
        return *fatal_error_;
    }
    if (cancel_requested_.load()) {
        return CancelledError();
    }
    for (const auto& part : parts_) {
        if (part.state != PartState::kUploaded) {
            return core::Error{core::ErrorCode::kInternal,
                               "part " + std::to_string(part.index) + " left unfinished"};
        }
    }
    return core::Ok();
}

void UploadCoordinator::WorkerLoop(const std::vector<int>& pending,
                                   std::atomic<std::size_t>* next) {
    ScopedCurrentCoordinator current(this);
    while (!StopRequested()) {
        const auto slot = next->fetch_add(1);
        if (slot >= pending.size()) {
            return;
        }
        auto result = UploadPart(pending[slot]);
        if (!result.ok()) {
            if (result.error().code != core::ErrorCode::kCancelled) {
                RecordFatal(result.error());
            }
            return;
        }
    }
}

core::Result<void> UploadCoordinator::UploadPart(int index) {
    const auto token = stop_source_.token();
    const auto slot = static_cast<std::size_t>(index);
    ByteRange range;
    PartDestination destination;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        range = parts_[slot].range;
        destination = parts_[slot].destination;
    }

    for (int attempt = 1;; ++attempt) {
        if (StopRequested()) {
            SetPart(index, PartState::kPending, 0);
            return CancelledError();
        }
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            auto& part = parts_[slot];
            part.state = PartState::kUploading;
            part.uploaded_bytes = 0;
            part.attempts = attempt;
        }

        auto sent = transport_->Send(
            destination, *source_, range,
            [this, slot](std::uint64_t bytes) {
                std::lock_guard<std::mutex> lock(state_mutex_);
                parts_[slot].uploaded_bytes = bytes;
            },
            token);
        if (sent.ok()) {
            return ReportAndCommit(index, sent.value());
        }

        const auto error = sent.error();
        if (error.code == core::ErrorCode::kCancelled || StopRequested()) {
            SetPart(index, PartState::kPending, 0);
            return CancelledError();
        }
        if (error.code != core::ErrorCode::kTransientNetwork) {
            SetPart(index, PartState::kFailed, 0);
            return error;
        }
        if (attempt >= options_.max_attempts) {
            SetPart(index, PartState::kFailed, 0);
            return core::Error{core::ErrorCode::kTransientNetwork,
                               "part " + std::to_string(index) + " failed after " +
                                   std::to_string(attempt) + " attempts: " + error.message};
        }

        SetPart(index, PartState::kPending, 0);
        core::LogEvent("part_retry", {{"video_id", video_.video_id},
                                      {"part_index", std::to_string(index)},
                                      {"attempt", std::to_string(attempt)},
                                      {"error", error.message}});
        if (!token.WaitFor(
                BackoffDelay(attempt, options_.retry_base_delay, options_.retry_max_delay))) {
            return CancelledError();
        }
    }
}

core::Result<void> UploadCoordinator::ReportAndCommit(int index, const std::string& checksum) {
    const auto token = stop_source_.token();
    const auto slot = static_cast<std::size_t>(index);
    const auto sid = session_id();

    for (int attempt = 1;; ++attempt) {
        core::Result<void> reported = core::Ok();
        {
            std::shared_lock<std::shared_mutex> fence(fence_mutex_);
            if (StopRequested()) {
                SetPart(index, PartState::kPending, 0);
                return CancelledError();
            }
            reported = negotiator_->ReportPartComplete(video_, sid, index, checksum, token);
            if (reported.ok()) {
                // Committed under the fence so a cancel cannot slip between report and commit.
                std::lock_guard<std::mutex> lock(state_mutex_);
                auto& part = parts_[slot];
                part.state = PartState::kUploaded;
                part.uploaded_bytes = part.range.length;
                part.checksum = checksum;
                progress_.completed_parts += 1;
                progress_.uploaded_bytes += part.range.length;
            }
        }
        if (reported.ok()) {
            Emit();
            return core::Ok();
        }

        const auto error = reported.error();
        if (error.code == core::ErrorCode::kCancelled || StopRequested()) {
            SetPart(index, PartState::kPending, 0);
            return CancelledError();
        }
        if (error.code != core::ErrorCode::kTransientNetwork || attempt >= options_.max_attempts) {
            SetPart(index, PartState::kFailed, 0);
            return error;
        }
        if (!token.WaitFor(
                BackoffDelay(attempt, options_.retry_base_delay, options_.retry_max_delay))) {
            SetPart(index, PartState::kPending, 0);
            return CancelledError();
        }
    }
}

core::Result<FinalizeResult> UploadCoordinator::FinalizeSession() {
    const auto token = stop_source_.token();
    const auto sid = session_id();
    std::vector<int> missing;
    auto result = WithRetry<FinalizeResult>("finalize", [&]() {
        missing.clear();
        return negotiator_->Finalize(video_, sid, &missing, token);
    });
    if (!result.ok() && result.error().code == core::ErrorCode::kIncompleteParts) {
        core::LogEvent("finalize_incomplete", {{"video_id", video_.video_id},
                                               {"session_id", sid},
                                               {"missing_part_indexes", JoinIndexes(missing)}});
        return core::Error{core::ErrorCode::kIncompleteParts,
                           result.error().message +
                               (missing.empty() ? "" : " (missing parts " + JoinIndexes(missing) + ")")};
    }
    return result;
}

template <typename T>
core::Result<T> UploadCoordinator::WithRetry(const std::string& what,
                                             const std::function<core::Result<T>()>& call) {
    const auto token = stop_source_.token();
    for (int attempt = 1;; ++attempt) {
        if (StopRequested()) {
            return CancelledError();
        }
        auto result = call();
        if (result.ok() || result.error().code != core::ErrorCode::kTransientNetwork ||
            attempt >= options_.max_attempts) {
            return result;
        }
        core::LogEvent("negotiation_retry", {{"video_id", video_.video_id},
                                             {"operation", what},
                                             {"attempt", std::to_string(attempt)},
                                             {"error", result.error().message}});
        if (!token.WaitFor(
                BackoffDelay(attempt, options_.retry_base_delay, options_.retry_max_delay))) {
            return CancelledError();
        }
    }
}

bool UploadCoordinator::Cancel() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (progress_.status != UploadStatus::kInitializing &&
            progress_.status != UploadStatus::kUploading) {
            return false;
        }
        progress_.status = UploadStatus::kCancelled;
        cancel_requested_ = true;
    }
    stop_source_.Cancel();
    {
        // Waits out any part report already on the wire.
        std::unique_lock<std::shared_mutex> fence(fence_mutex_);
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        for (auto& part : parts_) {
            if (part.state == PartState::kUploading) {
                part.state = PartState::kPending;
                part.uploaded_bytes = 0;
            }
        }
    }
    Emit();
    return true;
}

bool UploadCoordinator::Transition(UploadStatus next) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!CanTransition(progress_.status, next)) {
        return false;
    }
    progress_.status = next;
    return true;
}

void UploadCoordinator::Fail(const core::Error& error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!CanTransition(progress_.status, UploadStatus::kFailed)) {
            return;
        }
        progress_.status = UploadStatus::kFailed;
        progress_.error_code = error.code;
        progress_.error_message = error.message;
    }
    core::LogEvent("upload_failed", {{"organization_id", video_.organization_id},
                                     {"video_id", video_.video_id},
                                     {"session_id", session_id()},
                                     {"error_code", core::ErrorCodeName(error.code)},
                                     {"message", error.message}});
    Emit();
    if (callbacks_.on_error) {
        callbacks_.on_error(video_.video_id, error);
    }
}

void UploadCoordinator::RecordFatal(const core::Error& error) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!fatal_error_) {
            fatal_error_ = error;
        }
    }
    stop_source_.Cancel();
}

bool UploadCoordinator::StopRequested() const {
    return cancel_requested_.load() || stop_source_.IsCancelled();
}

core::Error UploadCoordinator::CancelledError() const {
    return core::Error{core::ErrorCode::kCancelled, "upload cancelled"};
}

void UploadCoordinator::Emit() {
    std::lock_guard<std::recursive_mutex> lock(emit_mutex_);
    const auto snapshot = progress();
    if (callbacks_.on_progress) {
        callbacks_.on_progress(snapshot);
    }
}

void UploadCoordinator::SetPart(int index, PartState state, std::uint64_t uploaded_bytes) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    const auto slot = static_cast<std::size_t>(index);
    if (slot >= parts_.size()) {
        return;
    }
    parts_[slot].state = state;
    parts_[slot].uploaded_bytes = uploaded_bytes;
}

UploadProgress UploadCoordinator::progress() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return progress_;
}

std::vector<PartDescriptor> UploadCoordinator::parts() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return parts_;
}

std::string UploadCoordinator::session_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return session_id_;
}

std::chrono::milliseconds UploadCoordinator::BackoffDelay(int attempt,
                                                          std::chrono::milliseconds base,
                                                          std::chrono::milliseconds max_delay) {
    long long delay = base.count();
    for (int i = 1; i < attempt && delay < max_delay.count(); ++i) {
        delay *= 2;
    }
    return std::chrono::milliseconds(std::min<long long>(delay, max_delay.count()));
}

}  // namespace vidlift::client
