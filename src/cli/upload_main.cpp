#include <atomic>
#include <chrono>
#include <condition_variable>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "vidlift/client/active_upload_ledger.h"
#include "vidlift/client/api_client.h"
#include "vidlift/client/part_transport.h"
#include "vidlift/client/progress_store.h"
#include "vidlift/client/session_negotiator.h"
#include "vidlift/client/thumbnail_hook.h"
#include "vidlift/client/upload_source.h"
#include "vidlift/core/config.h"
#include "vidlift/core/logger.h"

namespace {

std::atomic<bool> g_interrupted{false};

void OnSignal(int) { g_interrupted.store(true); }

std::string GetArgValue(int argc, char** argv, const std::string& key,
                        const std::string& default_value) {
    for (int i = 1; i < argc - 1; ++i) {
        if (argv[i] == key) {
            return argv[i + 1];
        }
    }
    return default_value;
}

bool HasFlag(int argc, char** argv, const std::string& key) {
    for (int i = 1; i < argc; ++i) {
        if (argv[i] == key) {
            return true;
        }
    }
    return false;
}

void PrintUsage() {
    std::cerr << "usage: vidlift-upload --config <client.json> --org <id> --video <id> "
                 "--file <path> [--resume]\n"
                 "       vidlift-upload --config <client.json> --list-active\n";
}

int ListActive(const vidlift::core::ClientConfig& config) {
    vidlift::client::ActiveUploadLedger ledger(config.state.path);
    auto uploads = ledger.Read();
    if (!uploads.ok()) {
        std::cerr << "failed to read " << config.state.path << ": " << uploads.error().message
                  << std::endl;
        return 1;
    }
    for (const auto& upload : uploads.value()) {
        std::cout << upload.organization_id << "/" << upload.video_id << "\n";
    }
    return 0;
}

void PrintProgress(const vidlift::client::UploadProgress& progress) {
    const double percent =
        progress.total_bytes == 0
            ? 100.0
            : 100.0 * static_cast<double>(progress.uploaded_bytes) /
                  static_cast<double>(progress.total_bytes);
    std::cout << "[" << vidlift::client::UploadStatusName(progress.status) << "] "
              << progress.completed_parts << "/" << progress.total_parts << " parts, "
              << progress.uploaded_bytes << "/" << progress.total_bytes << " bytes ("
              << static_cast<int>(percent) << "%)" << std::endl;
}

}  // namespace

int main(int argc, char** argv) {
    const std::string config_path = GetArgValue(argc, argv, "--config", "config/client.json");

    vidlift::core::ClientConfig config;
    try {
        config = vidlift::core::LoadClientConfig(config_path);
    } catch (const std::exception& ex) {
        std::cerr << "vidlift-upload: invalid configuration: " << ex.what() << std::endl;
        return 2;
    }
    vidlift::core::InitLogging(config.observability.log_level);

    if (HasFlag(argc, argv, "--list-active")) {
        return ListActive(config);
    }

    const auto organization_id = GetArgValue(argc, argv, "--org", "");
    const auto video_id = GetArgValue(argc, argv, "--video", "");
    const auto file_path = GetArgValue(argc, argv, "--file", "");
    if (organization_id.empty() || video_id.empty() || file_path.empty()) {
        PrintUsage();
        return 2;
    }
    const bool resume = HasFlag(argc, argv, "--resume") || config.upload.resume_on_start;

    auto source = vidlift::client::FileSource::Open(file_path);
    if (!source.ok()) {
        std::cerr << "vidlift-upload: " << source.error().message << std::endl;
        return 2;
    }

    auto api = std::make_shared<const vidlift::client::ApiClient>(config.api);
    auto negotiator = std::make_shared<vidlift::client::HttpSessionNegotiator>(api);
    auto transport = std::make_shared<vidlift::client::HttpPartTransport>(api);
    std::shared_ptr<vidlift::client::PostCompletionHook> hook;
    if (config.thumbnail.enabled) {
        hook = std::make_shared<vidlift::client::ThumbnailHook>(
            std::make_shared<vidlift::client::FfmpegThumbnailExtractor>(config.thumbnail), api);
    }
    auto ledger = std::make_shared<vidlift::client::ActiveUploadLedger>(config.state.path);
    vidlift::client::UploadStore store(
        vidlift::client::MakeCoordinatorFactory(
            negotiator, transport,
            vidlift::client::CoordinatorOptions::FromConfig(config.upload), hook),
        ledger);

    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    std::string object_location;
    std::string failure;

    vidlift::client::UploadCallbacks callbacks;
    callbacks.on_progress = [&mutex](const vidlift::client::UploadProgress& progress) {
        std::lock_guard<std::mutex> lock(mutex);
        PrintProgress(progress);
    };
    callbacks.on_complete = [&](const std::string&, const std::string& location) {
        std::lock_guard<std::mutex> lock(mutex);
        object_location = location;
        done = true;
        done_cv.notify_all();
    };
    callbacks.on_error = [&](const std::string&, const vidlift::core::Error& error) {
        std::lock_guard<std::mutex> lock(mutex);
        failure = std::string(vidlift::core::ErrorCodeName(error.code)) + ": " + error.message;
        done = true;
        done_cv.notify_all();
    };

    std::signal(SIGINT, OnSignal);
    std::signal(SIGTERM, OnSignal);

    auto started = store.StartUpload(organization_id, video_id, source.value(), callbacks, resume);
    if (!started.ok()) {
        std::cerr << "vidlift-upload: " << started.error().message << std::endl;
        return 1;
    }

    bool cancel_sent = false;
    {
        std::unique_lock<std::mutex> lock(mutex);
        while (!done) {
            done_cv.wait_for(lock, std::chrono::milliseconds(200));
            if (done) {
                break;
            }
            if (g_interrupted.load() && !cancel_sent) {
                cancel_sent = true;
                lock.unlock();
                auto cancelled = store.CancelUpload(organization_id, video_id);
                if (!cancelled.ok()) {
                    vidlift::core::LogWarning("cancel refused: " + cancelled.error().message);
                }
                lock.lock();
            }
            if (cancel_sent) {
                auto entry = store.Find(video_id);
                if (!entry || vidlift::client::IsTerminal(entry->progress.status)) {
                    break;
                }
            }
        }
    }
    store.JoinUpload(video_id);

    auto entry = store.Find(video_id);
    if (entry && entry->progress.status == vidlift::client::UploadStatus::kCompleted) {
        std::cout << "uploaded " << file_path << " to " << object_location << std::endl;
        return 0;
    }
    if (entry && entry->progress.status == vidlift::client::UploadStatus::kCancelled) {
        std::cerr << "upload cancelled" << std::endl;
        return 130;
    }
    std::cerr << "upload failed: " << (failure.empty() ? "unknown error" : failure) << std::endl;
    return 1;
}
