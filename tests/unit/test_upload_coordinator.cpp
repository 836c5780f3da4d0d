#include <algorithm>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "unit/upload_fakes.h"
#include "vidlift/client/upload_coordinator.h"

namespace {

using vidlift::client::CoordinatorOptions;
using vidlift::client::MemorySource;
using vidlift::client::UploadCallbacks;
using vidlift::client::UploadCoordinator;
using vidlift::client::UploadProgress;
using vidlift::client::UploadStatus;
using vidlift::core::ErrorCode;
using vidlift::testing::FakeNegotiator;
using vidlift::testing::FakeTransport;

constexpr std::uint64_t kPartSize = 10 * 1024;

CoordinatorOptions FastOptions(int concurrency = 3) {
    CoordinatorOptions options;
    options.part_size = kPartSize;
    options.concurrency = concurrency;
    options.max_attempts = 3;
    options.retry_base_delay = std::chrono::milliseconds(1);
    options.retry_max_delay = std::chrono::milliseconds(4);
    return options;
}

std::shared_ptr<const MemorySource> MakeSource(std::uint64_t size) {
    std::string data(size, '\0');
    for (std::uint64_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>('a' + i % 26);
    }
    return std::make_shared<const MemorySource>("clip.mp4", std::move(data), "video/mp4");
}

struct Recorder {
    std::mutex mutex;
    std::vector<UploadProgress> snapshots;
    std::vector<std::string> completed;
    std::vector<vidlift::core::Error> errors;

    UploadCallbacks Callbacks() {
        UploadCallbacks callbacks;
        callbacks.on_progress = [this](const UploadProgress& progress) {
            std::lock_guard<std::mutex> lock(mutex);
            snapshots.push_back(progress);
        };
        callbacks.on_complete = [this](const std::string&, const std::string& location) {
            std::lock_guard<std::mutex> lock(mutex);
            completed.push_back(location);
        };
        callbacks.on_error = [this](const std::string&, const vidlift::core::Error& error) {
            std::lock_guard<std::mutex> lock(mutex);
            errors.push_back(error);
        };
        return callbacks;
    }
};

class CountingHook : public vidlift::client::PostCompletionHook {
public:
    vidlift::core::Result<void> Run(const vidlift::client::VideoKey&,
                                    const vidlift::client::UploadSource&,
                                    const vidlift::client::CancellationToken&) override {
        ++runs;
        return vidlift::core::Error{ErrorCode::kIoError, "no ffmpeg here"};
    }
    int runs{0};
};

}  // namespace

TEST(UploadCoordinator, UploadsEveryPartAndRetriesTransientFailure) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    transport->transient_failures[4] = 1;
    Recorder recorder;

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(10 * kPartSize), negotiator,
                                  transport, FastOptions(3), recorder.Callbacks());
    auto result = coordinator.Run();

    ASSERT_TRUE(result.ok()) << result.error().message;
    EXPECT_EQ(result.value(), "orgs/org-1/videos/vid-1/original");
    EXPECT_EQ(transport->calls.load(), 11);
    EXPECT_EQ(negotiator->ReportCount(), 10);
    EXPECT_EQ(negotiator->finalize_calls, 1);
    EXPECT_EQ(negotiator->reported[4], "sum-4");

    const auto progress = coordinator.progress();
    EXPECT_EQ(progress.status, UploadStatus::kCompleted);
    EXPECT_EQ(progress.completed_parts, 10);
    EXPECT_EQ(progress.total_parts, 10);
    EXPECT_EQ(progress.uploaded_bytes, 10 * kPartSize);
    ASSERT_EQ(recorder.completed.size(), 1u);
    EXPECT_TRUE(recorder.errors.empty());

    const auto parts = coordinator.parts();
    EXPECT_EQ(parts[4].attempts, 2);
    EXPECT_EQ(parts[0].attempts, 1);
}

TEST(UploadCoordinator, RespectsConcurrencyWindow) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    transport->delay = std::chrono::milliseconds(5);

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(12 * kPartSize), negotiator,
                                  transport, FastOptions(3), {});
    ASSERT_TRUE(coordinator.Run().ok());
    EXPECT_LE(transport->max_in_flight.load(), 3);
    EXPECT_EQ(transport->calls.load(), 12);
}

TEST(UploadCoordinator, InitFailureSendsNoParts) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    negotiator->init_failures_remaining = 1;
    auto transport = std::make_shared<FakeTransport>();
    Recorder recorder;

    UploadCoordinator coordinator({"org-1", "missing"}, MakeSource(3 * kPartSize), negotiator,
                                  transport, FastOptions(), recorder.Callbacks());
    auto result = coordinator.Run();

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kSessionInit);
    EXPECT_EQ(transport->calls.load(), 0);
    EXPECT_EQ(negotiator->finalize_calls, 0);
    EXPECT_EQ(coordinator.progress().status, UploadStatus::kFailed);
    EXPECT_EQ(coordinator.progress().error_code, ErrorCode::kSessionInit);
    ASSERT_EQ(recorder.errors.size(), 1u);
    EXPECT_EQ(recorder.errors[0].code, ErrorCode::kSessionInit);
}

TEST(UploadCoordinator, TransientInitFailureIsRetried) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    negotiator->init_failures_remaining = 2;
    negotiator->init_error = {ErrorCode::kTransientNetwork, "503"};
    auto transport = std::make_shared<FakeTransport>();

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(2 * kPartSize), negotiator,
                                  transport, FastOptions(), {});
    ASSERT_TRUE(coordinator.Run().ok());
    EXPECT_EQ(negotiator->init_calls, 3);
}

TEST(UploadCoordinator, FinalizeReportsMissingParts) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    negotiator->missing_on_finalize = {2};
    auto transport = std::make_shared<FakeTransport>();
    Recorder recorder;

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(4 * kPartSize), negotiator,
                                  transport, FastOptions(), recorder.Callbacks());
    auto result = coordinator.Run();

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kIncompleteParts);
    EXPECT_NE(result.error().message.find("2"), std::string::npos);
    EXPECT_EQ(coordinator.progress().status, UploadStatus::kFailed);
    EXPECT_TRUE(recorder.completed.empty());
    ASSERT_EQ(recorder.errors.size(), 1u);
}

TEST(UploadCoordinator, CancelStopsReportsAndFinalize) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    transport->block_until_cancelled = true;
    Recorder recorder;

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(5 * kPartSize), negotiator,
                                  transport, FastOptions(2), recorder.Callbacks());
    coordinator.Start();
    ASSERT_TRUE(vidlift::testing::WaitUntil([&]() { return transport->calls.load() >= 1; }));

    EXPECT_TRUE(coordinator.Cancel());
    const int reports_at_cancel = negotiator->ReportCount();
    coordinator.Join();

    EXPECT_EQ(coordinator.progress().status, UploadStatus::kCancelled);
    EXPECT_EQ(negotiator->ReportCount(), reports_at_cancel);
    EXPECT_EQ(negotiator->finalize_calls, 0);
    EXPECT_EQ(negotiator->abort_calls, 1);
    EXPECT_TRUE(recorder.errors.empty());
    EXPECT_TRUE(recorder.completed.empty());
    for (const auto& part : coordinator.parts()) {
        EXPECT_EQ(part.state, vidlift::client::PartState::kPending) << part.index;
    }
    EXPECT_FALSE(coordinator.Cancel());
}

TEST(UploadCoordinator, PartsFinishingAfterCancelAreNotCommitted) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    transport->held_parts = {3, 4, 5};
    transport->deliver_after_cancel = true;
    Recorder recorder;

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(6 * kPartSize), negotiator,
                                  transport, FastOptions(3), recorder.Callbacks());
    coordinator.Start();
    ASSERT_TRUE(vidlift::testing::WaitUntil([&]() {
        return negotiator->ReportCount() == 3 && transport->in_flight.load() == 3;
    }));

    EXPECT_TRUE(coordinator.Cancel());
    coordinator.Join();

    // The held transfers completed on the wire, but none of them may be reported or committed.
    auto sent = transport->SentIndexes();
    std::sort(sent.begin(), sent.end());
    EXPECT_EQ(sent, (std::vector<int>{0, 1, 2, 3, 4, 5}));
    EXPECT_EQ(negotiator->ReportCount(), 3);
    EXPECT_EQ(negotiator->finalize_calls, 0);

    const auto parts = coordinator.parts();
    ASSERT_EQ(parts.size(), 6u);
    for (const auto& part : parts) {
        if (part.index < 3) {
            EXPECT_EQ(part.state, vidlift::client::PartState::kUploaded) << part.index;
        } else {
            EXPECT_EQ(part.state, vidlift::client::PartState::kPending) << part.index;
            EXPECT_EQ(part.uploaded_bytes, 0u);
        }
    }
    const auto progress = coordinator.progress();
    EXPECT_EQ(progress.status, UploadStatus::kCancelled);
    EXPECT_EQ(progress.completed_parts, 3);
    EXPECT_EQ(progress.uploaded_bytes, 3 * kPartSize);
    EXPECT_TRUE(recorder.errors.empty());
}

TEST(UploadCoordinator, CancelAfterCompletionIsRefused) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(kPartSize), negotiator,
                                  transport, FastOptions(), {});
    ASSERT_TRUE(coordinator.Run().ok());
    EXPECT_FALSE(coordinator.Cancel());
    EXPECT_EQ(coordinator.progress().status, UploadStatus::kCompleted);
}

TEST(UploadCoordinator, ExpiredDestinationIsNotRetried) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    transport->hard_failures.emplace(
        0, vidlift::core::Error{ErrorCode::kPartAuthExpired, "HTTP 403"});

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(kPartSize), negotiator,
                                  transport, FastOptions(), {});
    auto result = coordinator.Run();

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kPartAuthExpired);
    EXPECT_EQ(transport->calls.load(), 1);
    EXPECT_EQ(coordinator.progress().error_code, ErrorCode::kPartAuthExpired);
    EXPECT_EQ(negotiator->finalize_calls, 0);
}

TEST(UploadCoordinator, ExhaustedRetriesFailWithTransientError) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    transport->transient_failures[0] = 10;

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(kPartSize), negotiator,
                                  transport, FastOptions(), {});
    auto result = coordinator.Run();

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kTransientNetwork);
    EXPECT_EQ(transport->calls.load(), 3);
}

TEST(UploadCoordinator, SupersededSessionFailsWithConflict) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    negotiator->report_error = vidlift::core::Error{ErrorCode::kConflict, "session superseded"};
    auto transport = std::make_shared<FakeTransport>();

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(3 * kPartSize), negotiator,
                                  transport, FastOptions(1), {});
    auto result = coordinator.Run();

    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, ErrorCode::kConflict);
    EXPECT_EQ(negotiator->finalize_calls, 0);
    EXPECT_EQ(coordinator.progress().completed_parts, 0);
}

TEST(UploadCoordinator, ProgressNeverMovesBackwards) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    transport->transient_failures[1] = 1;
    transport->transient_failures[6] = 2;
    Recorder recorder;

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(8 * kPartSize + 17), negotiator,
                                  transport, FastOptions(4), recorder.Callbacks());
    ASSERT_TRUE(coordinator.Run().ok());

    ASSERT_FALSE(recorder.snapshots.empty());
    for (std::size_t i = 1; i < recorder.snapshots.size(); ++i) {
        EXPECT_GE(recorder.snapshots[i].uploaded_bytes, recorder.snapshots[i - 1].uploaded_bytes);
        EXPECT_GE(recorder.snapshots[i].completed_parts,
                  recorder.snapshots[i - 1].completed_parts);
        EXPECT_LE(recorder.snapshots[i].uploaded_bytes, recorder.snapshots[i].total_bytes);
    }
    EXPECT_EQ(recorder.snapshots.front().status, UploadStatus::kInitializing);
    EXPECT_EQ(recorder.snapshots.back().status, UploadStatus::kCompleted);
    EXPECT_EQ(recorder.snapshots.back().total_parts, 9);
}

TEST(UploadCoordinator, ResumeSkipsPartsTheServerHolds) {
    const auto source = MakeSource(10 * kPartSize);
    auto negotiator = std::make_shared<FakeNegotiator>();
    negotiator->resumable_session_id = "ups_existing";
    vidlift::client::SessionStatus status;
    status.session_id = "ups_existing";
    status.completed_part_indexes = {0, 1, 2};
    status.part_size = kPartSize;
    status.total_parts = 10;
    status.total_bytes = source->size();
    negotiator->status = status;
    auto transport = std::make_shared<FakeTransport>();

    auto options = FastOptions();
    options.resume = true;
    UploadCoordinator coordinator({"org-1", "vid-1"}, source, negotiator, transport, options, {});
    ASSERT_TRUE(coordinator.Run().ok());

    EXPECT_EQ(negotiator->last_init.resume_session_id, "ups_existing");
    EXPECT_EQ(transport->calls.load(), 7);
    for (int index : transport->SentIndexes()) {
        EXPECT_GE(index, 3);
    }
    EXPECT_EQ(coordinator.progress().completed_parts, 10);
    EXPECT_EQ(coordinator.progress().uploaded_bytes, source->size());
}

TEST(UploadCoordinator, ResumeRejectedByServerUploadsEverything) {
    const auto source = MakeSource(4 * kPartSize);
    auto negotiator = std::make_shared<FakeNegotiator>();
    vidlift::client::SessionStatus status;
    status.session_id = "ups_expired";
    status.completed_part_indexes = {0, 1};
    status.part_size = kPartSize;
    status.total_bytes = source->size();
    negotiator->status = status;
    auto transport = std::make_shared<FakeTransport>();

    auto options = FastOptions();
    options.resume = true;
    UploadCoordinator coordinator({"org-1", "vid-1"}, source, negotiator, transport, options, {});
    ASSERT_TRUE(coordinator.Run().ok());
    EXPECT_EQ(transport->calls.load(), 4);
}

TEST(UploadCoordinator, EmptyFileUploadsOneZeroLengthPart) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(0), negotiator, transport,
                                  FastOptions(), {});
    ASSERT_TRUE(coordinator.Run().ok());
    EXPECT_EQ(transport->calls.load(), 1);
    EXPECT_EQ(coordinator.progress().total_parts, 1);
}

TEST(UploadCoordinator, HookFailureDoesNotFailUpload) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    auto hook = std::make_shared<CountingHook>();
    Recorder recorder;

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(kPartSize), negotiator,
                                  transport, FastOptions(), recorder.Callbacks(), hook);
    ASSERT_TRUE(coordinator.Run().ok());
    EXPECT_EQ(hook->runs, 1);
    EXPECT_EQ(coordinator.progress().status, UploadStatus::kCompleted);
    EXPECT_EQ(recorder.completed.size(), 1u);
    EXPECT_TRUE(recorder.errors.empty());
}

TEST(UploadCoordinator, ShutdownInterruptsRunningHook) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    auto hook = std::make_shared<vidlift::testing::BlockingHook>();
    Recorder recorder;

    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(2 * kPartSize), negotiator,
                                  transport, FastOptions(), recorder.Callbacks(), hook);
    coordinator.Start();
    ASSERT_TRUE(vidlift::testing::WaitUntil([&]() { return hook->entered.load(); }));
    EXPECT_EQ(coordinator.progress().status, UploadStatus::kCompleted);

    const auto begin = std::chrono::steady_clock::now();
    coordinator.Shutdown();
    coordinator.Join();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, std::chrono::seconds(10));

    EXPECT_TRUE(hook->interrupted.load());
    EXPECT_EQ(coordinator.progress().status, UploadStatus::kCompleted);
    EXPECT_EQ(negotiator->abort_calls, 0);
    std::lock_guard<std::mutex> lock(recorder.mutex);
    EXPECT_EQ(recorder.completed.size(), 1u);
    EXPECT_TRUE(recorder.errors.empty());
}

TEST(UploadCoordinator, RunsOnlyOnce) {
    auto negotiator = std::make_shared<FakeNegotiator>();
    auto transport = std::make_shared<FakeTransport>();
    UploadCoordinator coordinator({"org-1", "vid-1"}, MakeSource(kPartSize), negotiator,
                                  transport, FastOptions(), {});
    ASSERT_TRUE(coordinator.Run().ok());
    auto again = coordinator.Run();
    ASSERT_FALSE(again.ok());
    EXPECT_EQ(again.error().code, ErrorCode::kFailedPrecondition);
    EXPECT_EQ(negotiator->init_calls, 1);
}

TEST(UploadCoordinator, BackoffDoublesUpToCap) {
    using std::chrono::milliseconds;
    EXPECT_EQ(UploadCoordinator::BackoffDelay(1, milliseconds(1000), milliseconds(30000)),
              milliseconds(1000));
    EXPECT_EQ(UploadCoordinator::BackoffDelay(2, milliseconds(1000), milliseconds(30000)),
              milliseconds(2000));
    EXPECT_EQ(UploadCoordinator::BackoffDelay(3, milliseconds(1000), milliseconds(30000)),
              milliseconds(4000));
    EXPECT_EQ(UploadCoordinator::BackoffDelay(20, milliseconds(1000), milliseconds(30000)),
              milliseconds(30000));
}
