#include <atomic>
#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <gtest/gtest.h>
#include <Poco/UUIDGenerator.h>

#include "unit/upload_fakes.h"
#include "vidlift/client/progress_store.h"

namespace {

using vidlift::client::CoordinatorOptions;
using vidlift::client::MemorySource;
using vidlift::client::UploadEntry;
using vidlift::client::UploadProgress;
using vidlift::client::UploadStatus;
using vidlift::client::UploadStore;
using vidlift::core::ErrorCode;
using vidlift::testing::FakeNegotiator;
using vidlift::testing::FakeTransport;
using vidlift::testing::WaitUntil;

constexpr std::uint64_t kPartSize = 4096;

CoordinatorOptions FastOptions() {
    CoordinatorOptions options;
    options.part_size = kPartSize;
    options.concurrency = 2;
    options.retry_base_delay = std::chrono::milliseconds(1);
    options.retry_max_delay = std::chrono::milliseconds(2);
    return options;
}

std::shared_ptr<const MemorySource> MakeSource(std::uint64_t size) {
    return std::make_shared<const MemorySource>("movie.webm", std::string(size, 'v'),
                                                "video/webm");
}

/// Builds coordinators that use the blocking transport for the first session only.
class ScriptedFactory {
public:
    ScriptedFactory() {
        blocking->block_until_cancelled = true;
    }

    vidlift::client::CoordinatorFactory Factory(bool block_first) {
        return [this, block_first](const vidlift::client::VideoKey& video,
                                   std::shared_ptr<const vidlift::client::UploadSource> source,
                                   vidlift::client::UploadCallbacks callbacks, bool resume) {
            const int n = ++created;
            auto options = FastOptions();
            options.resume = resume;
            std::shared_ptr<vidlift::client::PartTransport> transport =
                (block_first && n == 1) ? std::static_pointer_cast<vidlift::client::PartTransport>(blocking)
                                        : std::static_pointer_cast<vidlift::client::PartTransport>(fast);
            return std::make_unique<vidlift::client::UploadCoordinator>(
                video, std::move(source), negotiator, transport, options, std::move(callbacks));
        };
    }

    std::shared_ptr<FakeNegotiator> negotiator = std::make_shared<FakeNegotiator>();
    std::shared_ptr<FakeTransport> blocking = std::make_shared<FakeTransport>();
    std::shared_ptr<FakeTransport> fast = std::make_shared<FakeTransport>();
    std::atomic<int> created{0};
};

/// Upload API model: one active session per video, resume by id, abort by id after a delay.
class ServerModelNegotiator : public vidlift::client::SessionNegotiator {
public:
    vidlift::core::Result<vidlift::client::SessionGrant> Initialize(
        const vidlift::client::InitRequest& request,
        const vidlift::client::CancellationToken&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (request.resume_session_id.empty() || request.resume_session_id != active_) {
            active_ = "s" + std::to_string(++next_id_);
            reported_.clear();
        }
        auto ranges = vidlift::client::SplitIntoParts(request.total_bytes, request.part_size);
        if (!ranges.ok()) {
            return vidlift::core::Error{ErrorCode::kSessionInit, ranges.error().message};
        }
        total_bytes_ = request.total_bytes;
        part_size_ = request.part_size;
        total_parts_ = static_cast<int>(ranges.value().size());

        vidlift::client::SessionGrant grant;
        grant.session_id = active_;
        grant.part_size = part_size_;
        grant.total_parts = total_parts_;
        for (int i = 0; i < total_parts_; ++i) {
            vidlift::client::PartDestination destination;
            destination.index = i;
            destination.url = "http://parts.test/" + active_ + "/" + std::to_string(i);
            grant.parts.push_back(destination);
        }
        return grant;
    }

    vidlift::core::Result<void> ReportPartComplete(const vidlift::client::VideoKey&,
                                                   const std::string& session_id, int part_index,
                                                   const std::string&,
                                                   const vidlift::client::CancellationToken&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id != active_) {
            return vidlift::core::Error{ErrorCode::kConflict,
                                        "session " + session_id + " is not active"};
        }
        reported_.insert(part_index);
        return vidlift::core::Ok();
    }

    vidlift::core::Result<vidlift::client::FinalizeResult> Finalize(
        const vidlift::client::VideoKey& video, const std::string& session_id,
        std::vector<int>*, const vidlift::client::CancellationToken&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (session_id != active_) {
            return vidlift::core::Error{ErrorCode::kConflict,
                                        "session " + session_id + " is not active"};
        }
        if (static_cast<int>(reported_.size()) != total_parts_) {
            return vidlift::core::Error{ErrorCode::kIncompleteParts, "parts missing"};
        }
        finalized_session = active_;
        active_.clear();
        vidlift::client::FinalizeResult result;
        result.object_location = "orgs/" + video.organization_id + "/videos/" + video.video_id +
                                 "/original";
        return result;
    }

    vidlift::core::Result<vidlift::client::SessionStatus> QueryStatus(
        const vidlift::client::VideoKey&, const vidlift::client::CancellationToken&) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (active_.empty()) {
            return vidlift::core::Error{ErrorCode::kNotFound, "no upload session for video"};
        }
        vidlift::client::SessionStatus status;
        status.session_id = active_;
        status.completed_part_indexes.assign(reported_.begin(), reported_.end());
        status.part_size = part_size_;
        status.total_parts = total_parts_;
        status.total_bytes = total_bytes_;
        return status;
    }

    vidlift::core::Result<void> Abort(const vidlift::client::VideoKey&,
                                      const std::string& session_id,
                                      const vidlift::client::CancellationToken&) override {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        std::lock_guard<std::mutex> lock(mutex_);
        ++aborts;
        if (session_id != active_) {
            return vidlift::core::Error{ErrorCode::kNotFound, "no such session"};
        }
        active_.clear();
        reported_.clear();
        return vidlift::core::Ok();
    }

    std::atomic<int> aborts{0};
    std::string finalized_session;

private:
    std::mutex mutex_;
    std::string active_;
    int next_id_{0};
    std::set<int> reported_;
    std::uint64_t total_bytes_{0};
    std::uint64_t part_size_{0};
    int total_parts_{0};
};

std::filesystem::path MakeTempLedgerPath() {
    return std::filesystem::temp_directory_path() /
           ("vidlift_store_" + Poco::UUIDGenerator().createOne().toString()) / "state.json";
}

}  // namespace

TEST(UploadStore, CompletedUploadIsPublishedToListeners) {
    ScriptedFactory scripted;
    UploadStore store(scripted.Factory(false));

    std::mutex mutex;
    std::vector<std::vector<UploadEntry>> published;
    auto unsubscribe = store.Subscribe([&](const std::vector<UploadEntry>& entries) {
        std::lock_guard<std::mutex> lock(mutex);
        published.push_back(entries);
    });

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(3 * kPartSize)).ok());
    store.JoinUpload("vid-1");

    auto entry = store.Find("vid-1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->progress.status, UploadStatus::kCompleted);
    EXPECT_EQ(entry->progress.completed_parts, 3);
    EXPECT_EQ(entry->organization_id, "org-1");
    EXPECT_TRUE(entry->has_source());
    EXPECT_EQ(store.ActiveCount(), 0);

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_FALSE(published.empty());
    ASSERT_EQ(published.back().size(), 1u);
    EXPECT_EQ(published.back()[0].progress.status, UploadStatus::kCompleted);
    unsubscribe();
}

TEST(UploadStore, UnsubscribedListenerStopsReceivingSnapshots) {
    ScriptedFactory scripted;
    UploadStore store(scripted.Factory(false));
    std::atomic<int> calls{0};
    auto unsubscribe = store.Subscribe([&](const std::vector<UploadEntry>&) { ++calls; });
    unsubscribe();

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(kPartSize)).ok());
    store.JoinUpload("vid-1");
    EXPECT_EQ(calls.load(), 0);
}

TEST(UploadStore, StartingAgainSupersedesRunningSession) {
    ScriptedFactory scripted;
    UploadStore store(scripted.Factory(true));

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(2 * kPartSize)).ok());
    ASSERT_TRUE(WaitUntil([&]() { return scripted.blocking->calls.load() >= 1; }));
    EXPECT_EQ(store.ActiveCount(), 1);

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(2 * kPartSize)).ok());
    store.JoinUpload("vid-1");

    auto entry = store.Find("vid-1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->progress.status, UploadStatus::kCompleted);
    EXPECT_EQ(store.Snapshot().size(), 1u);
    EXPECT_EQ(scripted.created.load(), 2);
}

TEST(UploadStore, CancelUploadMarksEntryCancelled) {
    ScriptedFactory scripted;
    UploadStore store(scripted.Factory(true));

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(2 * kPartSize)).ok());
    ASSERT_TRUE(WaitUntil([&]() { return scripted.blocking->calls.load() >= 1; }));

    ASSERT_TRUE(store.CancelUpload("org-1", "vid-1").ok());
    store.JoinUpload("vid-1");

    auto entry = store.Find("vid-1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->progress.status, UploadStatus::kCancelled);
    EXPECT_EQ(scripted.negotiator->finalize_calls, 0);

    auto again = store.CancelUpload("org-1", "vid-1");
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code, ErrorCode::kFailedPrecondition);
}

TEST(UploadStore, DismissOnlyRemovesTerminalEntries) {
    ScriptedFactory scripted;
    UploadStore store(scripted.Factory(true));

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(2 * kPartSize)).ok());
    ASSERT_TRUE(WaitUntil([&]() { return scripted.blocking->calls.load() >= 1; }));

    auto running = store.DismissUpload("vid-1");
    ASSERT_FALSE(running.ok());
    EXPECT_EQ(running.error().code, ErrorCode::kFailedPrecondition);
    EXPECT_EQ(store.Snapshot().size(), 1u);

    ASSERT_TRUE(store.CancelUpload("org-1", "vid-1").ok());
    store.JoinUpload("vid-1");
    ASSERT_TRUE(store.DismissUpload("vid-1").ok());
    EXPECT_TRUE(store.Snapshot().empty());
    EXPECT_FALSE(store.Find("vid-1").has_value());

    auto unknown = store.DismissUpload("vid-1");
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, ErrorCode::kNotFound);
}

TEST(UploadStore, CancelUnknownVideoIsNotFound) {
    ScriptedFactory scripted;
    UploadStore store(scripted.Factory(false));
    auto result = store.CancelUpload("org-1", "nope");
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kNotFound);
}

TEST(UploadStore, RetryAfterFailureResumesFromServerState) {
    ScriptedFactory scripted;
    scripted.negotiator->init_failures_remaining = 1;
    UploadStore store(scripted.Factory(false));

    std::atomic<int> errors{0};
    vidlift::client::UploadCallbacks callbacks;
    callbacks.on_error = [&](const std::string&, const vidlift::core::Error&) { ++errors; };

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(kPartSize), callbacks).ok());
    store.JoinUpload("vid-1");
    ASSERT_EQ(store.Find("vid-1")->progress.status, UploadStatus::kFailed);
    EXPECT_EQ(store.Find("vid-1")->progress.error_code, ErrorCode::kSessionInit);
    EXPECT_EQ(errors.load(), 1);

    ASSERT_TRUE(store.RetryUpload("vid-1").ok());
    store.JoinUpload("vid-1");
    EXPECT_EQ(store.Find("vid-1")->progress.status, UploadStatus::kCompleted);
    EXPECT_GE(scripted.negotiator->status_calls, 1);
}

TEST(UploadStore, RetryRejectsEntriesThatAreNotFailedOrCancelled) {
    ScriptedFactory scripted;
    UploadStore store(scripted.Factory(false));

    auto unknown = store.RetryUpload("vid-1");
    ASSERT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.error().code, ErrorCode::kNotFound);

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(kPartSize)).ok());
    store.JoinUpload("vid-1");
    auto completed = store.RetryUpload("vid-1");
    ASSERT_FALSE(completed.ok());
    EXPECT_EQ(completed.error().code, ErrorCode::kFailedPrecondition);
}

TEST(UploadStore, ExternalProgressRebuildsEntryWithoutSource) {
    ScriptedFactory scripted;
    UploadStore store(scripted.Factory(false));

    UploadProgress progress;
    progress.video_id = "vid-9";
    progress.total_bytes = 1000;
    progress.uploaded_bytes = 500;
    progress.total_parts = 10;
    progress.completed_parts = 5;
    progress.status = UploadStatus::kUploading;
    ASSERT_TRUE(store.ApplyExternalProgress("org-1", progress));

    auto entry = store.Find("vid-9");
    ASSERT_TRUE(entry.has_value());
    EXPECT_FALSE(entry->has_source());
    EXPECT_EQ(store.ActiveCount(), 1);

    auto backwards = progress;
    backwards.status = UploadStatus::kInitializing;
    EXPECT_FALSE(store.ApplyExternalProgress("org-1", backwards));

    auto stale = progress;
    stale.uploaded_bytes = 100;
    stale.completed_parts = 1;
    EXPECT_TRUE(store.ApplyExternalProgress("org-1", stale));
    EXPECT_EQ(store.Find("vid-9")->progress.uploaded_bytes, 500u);
    EXPECT_EQ(store.Find("vid-9")->progress.completed_parts, 5);

    auto dismiss_active = store.DismissUpload("vid-9");
    ASSERT_FALSE(dismiss_active.ok());
    EXPECT_EQ(dismiss_active.error().code, ErrorCode::kFailedPrecondition);

    auto failed = progress;
    failed.status = UploadStatus::kFailed;
    EXPECT_TRUE(store.ApplyExternalProgress("org-1", failed));
    auto retry = store.RetryUpload("vid-9");
    ASSERT_FALSE(retry.ok());
    EXPECT_EQ(retry.error().code, ErrorCode::kFailedPrecondition);

    EXPECT_TRUE(store.DismissUpload("vid-9").ok());
    EXPECT_FALSE(store.Find("vid-9").has_value());
    EXPECT_EQ(store.DismissUpload("vid-9").error().code, ErrorCode::kNotFound);
}

TEST(UploadStore, ExternalProgressIgnoredForLiveLocalSession) {
    ScriptedFactory scripted;
    UploadStore store(scripted.Factory(true));

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(kPartSize)).ok());
    ASSERT_TRUE(WaitUntil([&]() { return scripted.blocking->calls.load() >= 1; }));

    UploadProgress progress;
    progress.video_id = "vid-1";
    progress.status = UploadStatus::kFailed;
    EXPECT_FALSE(store.ApplyExternalProgress("org-1", progress));
    EXPECT_EQ(store.Find("vid-1")->progress.status, UploadStatus::kUploading);

    ASSERT_TRUE(store.CancelUpload("org-1", "vid-1").ok());
    store.JoinUpload("vid-1");
}

TEST(UploadStore, LedgerTracksActiveUploads) {
    const auto ledger_path = MakeTempLedgerPath();
    auto ledger = std::make_shared<vidlift::client::ActiveUploadLedger>(ledger_path.string());
    ScriptedFactory scripted;
    {
        UploadStore store(scripted.Factory(true), ledger);
        ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(kPartSize)).ok());
        ASSERT_TRUE(WaitUntil([&]() { return scripted.blocking->calls.load() >= 1; }));

        auto recorded = ledger->Read();
        ASSERT_TRUE(recorded.ok());
        ASSERT_EQ(recorded.value().size(), 1u);
        EXPECT_EQ(recorded.value()[0].video_id, "vid-1");
        EXPECT_EQ(recorded.value()[0].organization_id, "org-1");

        ASSERT_TRUE(store.CancelUpload("org-1", "vid-1").ok());
        store.JoinUpload("vid-1");

        auto after = ledger->Read();
        ASSERT_TRUE(after.ok());
        EXPECT_TRUE(after.value().empty());
        EXPECT_FALSE(std::filesystem::exists(ledger_path));
    }
    std::filesystem::remove_all(ledger_path.parent_path());
}

TEST(UploadStore, RetryImmediatelyAfterCancelCompletes) {
    auto negotiator = std::make_shared<ServerModelNegotiator>();
    auto blocking = std::make_shared<FakeTransport>();
    blocking->block_until_cancelled = true;
    auto fast = std::make_shared<FakeTransport>();
    std::atomic<int> created{0};

    UploadStore store([&](const vidlift::client::VideoKey& video,
                          std::shared_ptr<const vidlift::client::UploadSource> source,
                          vidlift::client::UploadCallbacks callbacks, bool resume) {
        auto options = FastOptions();
        options.resume = resume;
        std::shared_ptr<vidlift::client::PartTransport> transport = blocking;
        if (++created > 1) {
            transport = fast;
        }
        return std::make_unique<vidlift::client::UploadCoordinator>(
            video, std::move(source), negotiator, transport, options, std::move(callbacks));
    });

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(4 * kPartSize)).ok());
    ASSERT_TRUE(WaitUntil([&]() { return blocking->calls.load() >= 1; }));

    ASSERT_TRUE(store.CancelUpload("org-1", "vid-1").ok());
    ASSERT_TRUE(store.RetryUpload("vid-1").ok());
    store.JoinUpload("vid-1");

    auto entry = store.Find("vid-1");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->progress.status, UploadStatus::kCompleted) << entry->progress.error_message;
    EXPECT_EQ(entry->progress.completed_parts, 4);
    EXPECT_EQ(negotiator->aborts.load(), 1);
    EXPECT_EQ(negotiator->finalized_session, "s2");
    EXPECT_EQ(created.load(), 2);
}

TEST(UploadStore, SubscribersSeeMonotonicProgressUnderRetries) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    transport->delay = std::chrono::milliseconds(2);
    transport->transient_failures[1] = 1;
    transport->transient_failures[5] = 2;
    transport->transient_failures[9] = 1;
    auto options = FastOptions();
    options.concurrency = 4;
    UploadStore store(vidlift::client::MakeCoordinatorFactory(negotiator, transport, options));

    std::mutex mutex;
    std::vector<UploadProgress> observed;
    auto unsubscribe = store.Subscribe([&](const std::vector<UploadEntry>& entries) {
        std::lock_guard<std::mutex> lock(mutex);
        for (const auto& entry : entries) {
            if (entry.video_id == "vid-1") {
                observed.push_back(entry.progress);
            }
        }
    });

    ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(12 * kPartSize)).ok());
    store.JoinUpload("vid-1");
    ASSERT_TRUE(WaitUntil([&]() {
        std::lock_guard<std::mutex> lock(mutex);
        return !observed.empty() && observed.back().status == UploadStatus::kCompleted;
    }));
    unsubscribe();

    std::lock_guard<std::mutex> lock(mutex);
    for (std::size_t i = 1; i < observed.size(); ++i) {
        EXPECT_GE(observed[i].uploaded_bytes, observed[i - 1].uploaded_bytes) << i;
        EXPECT_GE(observed[i].completed_parts, observed[i - 1].completed_parts) << i;
        EXPECT_LE(observed[i].uploaded_bytes, observed[i].total_bytes) << i;
    }
    EXPECT_EQ(observed.back().completed_parts, 12);
    EXPECT_EQ(observed.back().uploaded_bytes, 12 * kPartSize);
    EXPECT_GT(transport->calls.load(), 12);
}

TEST(UploadStore, DestructionInterruptsRunningHook) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    auto hook = std::make_shared<vidlift::testing::BlockingHook>();

    const auto begin = std::chrono::steady_clock::now();
    {
        UploadStore store(
            vidlift::client::MakeCoordinatorFactory(negotiator, transport, FastOptions(), hook));
        ASSERT_TRUE(store.StartUpload("org-1", "vid-1", MakeSource(kPartSize)).ok());
        ASSERT_TRUE(WaitUntil([&]() { return hook->entered.load(); }));
        EXPECT_EQ(store.Find("vid-1")->progress.status, UploadStatus::kCompleted);
    }
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));
    EXPECT_TRUE(hook->interrupted.load());
}
