#include <algorithm>

#include <gtest/gtest.h>

#include "vidlift/client/thumbnail_hook.h"
#include "vidlift/client/upload_source.h"

using vidlift::client::CancellationSource;
using vidlift::client::FfmpegThumbnailExtractor;
using vidlift::client::MemorySource;
using vidlift::client::ThumbnailExtractor;
using vidlift::client::ThumbnailHook;

namespace {

bool Contains(const std::vector<std::string>& args, const std::string& value) {
    return std::find(args.begin(), args.end(), value) != args.end();
}

class FailingExtractor : public ThumbnailExtractor {
public:
    vidlift::core::Result<std::string> Extract(const vidlift::client::UploadSource&,
                                              const vidlift::client::CancellationToken&) override {
        ++calls;
        return vidlift::core::Error{vidlift::core::ErrorCode::kIoError, "no frame"};
    }

    int calls{0};
};

}  // namespace

TEST(ThumbnailArguments, SeeksBeforeInputWhenOffsetIsPositive) {
    auto args = FfmpegThumbnailExtractor::BuildArguments("/tmp/in.mp4", 1, 640);
    auto seek = std::find(args.begin(), args.end(), "-ss");
    auto input = std::find(args.begin(), args.end(), "-i");
    ASSERT_NE(seek, args.end());
    ASSERT_NE(input, args.end());
    EXPECT_LT(seek, input);
    EXPECT_EQ(*(seek + 1), "1");
    EXPECT_EQ(*(input + 1), "/tmp/in.mp4");
    EXPECT_EQ(args.back(), "pipe:1");
    EXPECT_TRUE(Contains(args, "mjpeg"));
}

TEST(ThumbnailArguments, ZeroSeekReadsFirstFrame) {
    auto args = FfmpegThumbnailExtractor::BuildArguments("in.webm", 0, 320);
    EXPECT_FALSE(Contains(args, "-ss"));
    auto filter = std::find(args.begin(), args.end(), "-vf");
    ASSERT_NE(filter, args.end());
    EXPECT_NE((filter + 1)->find("min(320"), std::string::npos);
}

TEST(FfmpegThumbnailExtractor, MissingBinaryReportsIoError) {
    vidlift::core::ThumbnailConfig config;
    config.ffmpeg_path = "/nonexistent/vidlift-ffmpeg";
    FfmpegThumbnailExtractor extractor(config);
    MemorySource source("clip.mp4", "not really a video", "video/mp4");
    auto image = extractor.Extract(source, CancellationSource().token());
    ASSERT_FALSE(image.ok());
    EXPECT_EQ(image.error().code, vidlift::core::ErrorCode::kIoError);
}

TEST(FfmpegThumbnailExtractor, CancelledTokenSkipsExtraction) {
    FfmpegThumbnailExtractor extractor(vidlift::core::ThumbnailConfig{});
    MemorySource source("clip.mp4", "bytes", "video/mp4");
    CancellationSource cancel;
    cancel.Cancel();
    auto image = extractor.Extract(source, cancel.token());
    ASSERT_FALSE(image.ok());
    EXPECT_EQ(image.error().code, vidlift::core::ErrorCode::kCancelled);
}

TEST(ThumbnailHook, ExtractionFailureIsReturnedWithoutUpload) {
    auto extractor = std::make_shared<FailingExtractor>();
    vidlift::core::ApiConfig api;
    api.base_url = "http://127.0.0.1:1";
    ThumbnailHook hook(extractor, std::make_shared<const vidlift::client::ApiClient>(api));
    MemorySource source("clip.mp4", "bytes", "video/mp4");

    auto result = hook.Run({"org-1", "vid-1"}, source, CancellationSource().token());
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error().code, vidlift::core::ErrorCode::kIoError);
    EXPECT_EQ(extractor->calls, 1);
}
