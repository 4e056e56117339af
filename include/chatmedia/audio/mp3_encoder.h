#pragma once

#include <chatmedia/core/types.h>

#include <cstdint>
#include <filesystem>
#include <functional>

namespace chatmedia::audio {

struct EncodeStats {
    uint64_t samples = 0;
    uint64_t bytesWritten = 0;
    Duration duration{0};
};

/**
 * @brief In-process PCM to MP3 encoder on libavcodec
 *
 * Input is signed 16-bit little-endian mono PCM. It is fed to the MP3 encoder one
 * encoder frame at a time; packets are appended to the output as a raw MPEG audio
 * stream.
 */
class Mp3Encoder {
public:
    struct Options {
        uint32_t sampleRate = 24000;
        uint32_t bitrate = 32000;
    };

    /// Polled between frames; returning true aborts the encode with OperationCancelled
    using StopPredicate = std::function<bool()>;

    Mp3Encoder() : Mp3Encoder(Options{}) {}
    explicit Mp3Encoder(Options options) : options_(options) {}

    /**
     * @brief Encode a PCM file into an MP3 file
     *
     * The output is removed on any failure. EncodeFailed covers encoder setup errors
     * and empty output.
     */
    Result<EncodeStats> encodeFile(const std::filesystem::path& pcmPath,
                                   const std::filesystem::path& mp3Path,
                                   const StopPredicate& shouldStop = {}) const;

    const Options& options() const noexcept { return options_; }

private:
    Options options_;
};

} // namespace chatmedia::audio
