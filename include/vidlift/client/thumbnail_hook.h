#pragma once

#include <memory>
#include <string>
#include <vector>

#include "vidlift/client/api_client.h"
#include "vidlift/client/post_completion_hook.h"
#include "vidlift/core/config.h"

namespace vidlift::client {

/// @brief Produces a still image from an uploaded video.
class ThumbnailExtractor {
public:
    virtual ~ThumbnailExtractor() = default;

    /// @return JPEG bytes.
    virtual core::Result<std::string> Extract(const UploadSource& source,
                                              const CancellationToken& token) = 0;
};

/// @brief Extracts one frame by running an external ffmpeg process.
class FfmpegThumbnailExtractor : public ThumbnailExtractor {
public:
    explicit FfmpegThumbnailExtractor(core::ThumbnailConfig config);

    core::Result<std::string> Extract(const UploadSource& source,
                                      const CancellationToken& token) override;

    /// @brief ffmpeg arguments writing one JPEG frame to stdout. Seek 0 reads the first frame.
    static std::vector<std::string> BuildArguments(const std::string& input_path, int seek_seconds,
                                                   int max_dimension);

private:
    core::Result<std::string> ExtractFromFile(const std::string& path,
                                              const CancellationToken& token);
    core::Result<std::string> RunFfmpeg(const std::vector<std::string>& args,
                                        const CancellationToken& token);

    core::ThumbnailConfig config_;
};

/// @brief Post-completion hook that uploads a thumbnail through the Upload API.
///
/// Runs after the upload is already complete; callers log its failures.
class ThumbnailHook : public PostCompletionHook {
public:
    ThumbnailHook(std::shared_ptr<ThumbnailExtractor> extractor,
                  std::shared_ptr<const ApiClient> client);

    core::Result<void> Run(const VideoKey& video, const UploadSource& source,
                           const CancellationToken& token) override;

    /// @brief Single-shot multipart upload of `image`.
    /// @return The stored thumbnail key.
    core::Result<std::string> Upload(const VideoKey& video, const std::string& image,
                                     const CancellationToken& token);

private:
    std::shared_ptr<ThumbnailExtractor> extractor_;
    std::shared_ptr<const ApiClient> client_;
};

}  // namespace vidlift::client
