#include "vidlift/client/thumbnail_hook.h"

#include <algorithm>
#include <fstream>

#include <Poco/Exception.h>
#include <Poco/JSON/Object.h>
#include <Poco/JSON/Parser.h>
#include <Poco/Net/HTMLForm.h>
#include <Poco/Net/HTTPRequest.h>
#include <Poco/Net/StringPartSource.h>
#include <Poco/Pipe.h>
#include <Poco/PipeStream.h>
#include <Poco/Process.h>
#include <Poco/StreamCopier.h>
#include <Poco/TemporaryFile.h>

#include "vidlift/client/session_negotiator.h"
#include "vidlift/core/logger.h"

namespace vidlift::client {

namespace {

constexpr std::uint64_t kCopyChunkBytes = 1024 * 1024;

}  // namespace

FfmpegThumbnailExtractor::FfmpegThumbnailExtractor(core::ThumbnailConfig config)
    : config_(std::move(config)) {}

std::vector<std::string> FfmpegThumbnailExtractor::BuildArguments(const std::string& input_path,
                                                                  int seek_seconds,
                                                                  int max_dimension) {
    const auto bound = std::to_string(max_dimension);
    std::vector<std::string> args{"-hide_banner", "-loglevel", "error"};
    if (seek_seconds > 0) {
        args.push_back("-ss");
        args.push_back(std::to_string(seek_seconds));
    }
    args.insert(args.end(),
                {"-i", input_path, "-frames:v", "1", "-vf",
                 "scale=w=min(" + bound + "\\,iw):h=min(" + bound +
                     "\\,ih):force_original_aspect_ratio=decrease",
                 "-f", "image2pipe", "-vcodec", "mjpeg", "pipe:1"});
    return args;
}

core::Result<std::string> FfmpegThumbnailExtractor::Extract(const UploadSource& source,
                                                           const CancellationToken& token) {
    const auto path = source.path();
    if (path) {
        return ExtractFromFile(*path, token);
    }

    // ffmpeg needs a seekable input; spill in-memory sources to a temp file.
    Poco::TemporaryFile spill;
    {
        std::ofstream out(spill.path(), std::ios::binary | std::ios::trunc);
        if (!out.is_open()) {
            return core::Error{core::ErrorCode::kIoError, "failed to open temp file"};
        }
        for (std::uint64_t offset = 0; offset < source.size(); offset += kCopyChunkBytes) {
            auto chunk = source.Read(offset, std::min(kCopyChunkBytes, source.size() - offset));
            if (!chunk.ok()) {
                return chunk.error();
            }
            out.write(chunk.value().data(), static_cast<std::streamsize>(chunk.value().size()));
        }
        out.flush();
        if (!out) {
            return core::Error{core::ErrorCode::kIoError, "failed to write temp file"};
        }
    }
    return ExtractFromFile(spill.path(), token);
}

core::Result<std::string> FfmpegThumbnailExtractor::ExtractFromFile(
    const std::string& path, const CancellationToken& token) {
    auto image = RunFfmpeg(BuildArguments(path, config_.seek_seconds, config_.max_dimension), token);
    if (!image.ok()) {
        return image;
    }
    if (image.value().empty() && config_.seek_seconds > 0) {
        // Clips shorter than the seek offset yield nothing; fall back to the first frame.
        image = RunFfmpeg(BuildArguments(path, 0, config_.max_dimension), token);
        if (!image.ok()) {
            return image;
        }
    }
    if (image.value().empty()) {
        return core::Error{core::ErrorCode::kIoError, "ffmpeg produced no frame for " + path};
    }
    return image;
}

core::Result<std::string> FfmpegThumbnailExtractor::RunFfmpeg(const std::vector<std::string>& args,
                                                             const CancellationToken& token) {
    if (token.IsCancelled()) {
        return core::Error{core::ErrorCode::kCancelled, "thumbnail extraction cancelled"};
    }
    try {
        Poco::Pipe out_pipe;
        Poco::Process::Args process_args(args.begin(), args.end());
        Poco::ProcessHandle handle =
            Poco::Process::launch(config_.ffmpeg_path, process_args, nullptr, &out_pipe, nullptr);
        std::string image;
        {
            CancellationRegistration kill_on_cancel(token, [&handle]() {
                try {
                    Poco::Process::kill(handle);
                } catch (const Poco::NotFoundException&) {
                    // Already exited.
                }
            });
            Poco::PipeInputStream istr(out_pipe);
            Poco::StreamCopier::copyToString(istr, image);
        }
        const int rc = handle.wait();
        if (token.IsCancelled()) {
            return core::Error{core::ErrorCode::kCancelled, "thumbnail extraction cancelled"};
        }
        if (rc != 0) {
            return core::Error{core::ErrorCode::kIoError,
                               "ffmpeg exited with status " + std::to_string(rc)};
        }
        return image;
    } catch (const Poco::Exception& ex) {
        return core::Error{core::ErrorCode::kIoError,
                           "failed to run " + config_.ffmpeg_path + ": " + ex.displayText()};
    }
}

ThumbnailHook::ThumbnailHook(std::shared_ptr<ThumbnailExtractor> extractor,
                             std::shared_ptr<const ApiClient> client)
    : extractor_(std::move(extractor)), client_(std::move(client)) {}

core::Result<void> ThumbnailHook::Run(const VideoKey& video, const UploadSource& source,
                                      const CancellationToken& token) {
    auto image = extractor_->Extract(source, token);
    if (!image.ok()) {
        return image.error();
    }
    auto uploaded = Upload(video, image.value(), token);
    if (!uploaded.ok()) {
        return uploaded.error();
    }
    core::LogEvent("thumbnail_uploaded", {{"organization_id", video.organization_id},
                                          {"video_id", video.video_id},
                                          {"thumbnail_key", uploaded.value()},
                                          {"bytes", std::to_string(image.value().size())}});
    return core::Ok();
}

core::Result<std::string> ThumbnailHook::Upload(const VideoKey& video, const std::string& image,
                                                const CancellationToken& token) {
    Poco::Net::HTMLForm form(Poco::Net::HTMLForm::ENCODING_MULTIPART);
    form.addPart("file", new Poco::Net::StringPartSource(image, "image/jpeg", "thumbnail.jpg"));

    ApiRequest request;
    request.method = Poco::Net::HTTPRequest::HTTP_POST;
    request.target = HttpSessionNegotiator::UploadPath(video, "/thumbnail");
    request.prepare = [&form](Poco::Net::HTTPRequest& req) { form.prepareSubmit(req); };
    request.write_body = [&form](std::ostream& os) -> core::Result<void> {
        form.write(os);
        return core::Ok();
    };

    auto response = client_->Send(request, token);
    if (!response.ok()) {
        return response.error();
    }
    const auto& res = response.value();
    if (res.status == 200 || res.status == 201) {
        std::string key;
        try {
            Poco::JSON::Parser parser;
            auto root = parser.parse(res.body).extract<Poco::JSON::Object::Ptr>();
            key = root->optValue<std::string>("thumbnailKey", "");
        } catch (const Poco::Exception& ex) {
            return core::Error{core::ErrorCode::kProtocol,
                               "invalid thumbnail response: " + ex.displayText()};
        }
        return key;
    }
    const auto detail = ApiClient::ParseErrorBody(res.body);
    const auto code = IsRetryableStatus(res.status) ? core::ErrorCode::kTransientNetwork
                                                    : core::ErrorCode::kProtocol;
    return core::Error{code, "thumbnail upload failed: HTTP " + std::to_string(res.status) + " " +
                                 detail.code + " " + detail.message};
}

}  // namespace vidlift::client
