#pragma once

#include <chatmedia/audio/decoder_locator.h>
#include <chatmedia/audio/mp3_encoder.h>
#include <chatmedia/audio/voice_blob_source.h>
#include <chatmedia/config/pipeline_config.h>
#include <chatmedia/core/file_utils.h>
#include <chatmedia/core/types.h>
#include <chatmedia/media/task_context.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

namespace chatmedia::media {
class WorkerPool;
}

namespace chatmedia::audio {

enum class TranscodeStage : uint8_t { FetchBlob, DecodeToPcm, EncodeToMp3, Done, Failed };

[[nodiscard]] std::string_view stageName(TranscodeStage stage) noexcept;

struct TranscodeRequest {
    std::string senderId;
    int64_t timestamp = 0;
    std::filesystem::path outputPath; ///< Where the MP3 is written
};

struct TranscodeResult {
    std::filesystem::path path;
    Duration duration{0};
    uint64_t bytes = 0;
};

/**
 * @brief SILK voice note to MP3 pipeline
 *
 * FetchBlob writes the payload to a temp file, DecodeToPcm runs the external decoder,
 * EncodeToMp3 feeds the PCM to the in-process encoder. Each external stage has its own
 * timeout; temp files are removed whatever the outcome.
 */
class SpeechTranscoder {
public:
    struct Options {
        config::VoiceSettings voice;
        std::filesystem::path tempDir;
    };

    SpeechTranscoder(Options options, std::shared_ptr<IVoiceBlobSource> source,
                     std::shared_ptr<DecoderLocator> locator);
    ~SpeechTranscoder();

    SpeechTranscoder(const SpeechTranscoder&) = delete;
    SpeechTranscoder& operator=(const SpeechTranscoder&) = delete;

    /**
     * @brief Run all stages for one voice message
     *
     * Errors: SourceMissing, DecodeFailed, EncodeFailed or Timeout. A failed call
     * leaves no partial MP3 at the output path.
     */
    Result<TranscodeResult> transcode(const TranscodeRequest& request,
                                      const media::TaskContext& ctx);

    /// FetchBlob and DecodeToPcm only; duration derived from the PCM size
    Result<Duration> measureDuration(const std::string& senderId, int64_t timestamp,
                                     const media::TaskContext& ctx);

    const Options& options() const noexcept { return options_; }

private:
    Result<ScopedTempFile> fetchBlob(const std::string& senderId, int64_t timestamp,
                                     const std::string& baseName);
    Result<ScopedTempFile> decodeToPcm(const std::filesystem::path& silkPath,
                                       const std::string& baseName, const media::TaskContext& ctx);
    Result<EncodeStats> encodeToMp3(const std::filesystem::path& pcmPath,
                                    const std::filesystem::path& mp3Path,
                                    const media::TaskContext& ctx);

    std::string nextBaseName(const std::string& senderId, int64_t timestamp);

    Options options_;
    std::shared_ptr<IVoiceBlobSource> source_;
    std::shared_ptr<DecoderLocator> locator_;
    Mp3Encoder encoder_;
    std::unique_ptr<media::WorkerPool> encoderPool_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace chatmedia::audio
