#pragma once

#include <chatmedia/core/types.h>
#include <chatmedia/detection/image_signature.h>
#include <chatmedia/media/media_types.h>

#include <filesystem>
#include <mutex>
#include <unordered_set>

namespace chatmedia::media {

/**
 * @brief Confirms that produced files are usable and remembers the ones that are not
 *
 * Images are checked by signature and, when deep checking is enabled, by decoding the
 * first frame with libavcodec. Audio must look like MPEG audio and parse with TagLib.
 * Files that fail are kept in a per-session negative cache.
 */
class MediaValidator {
public:
    struct Options {
        bool deepImageCheck = true;
    };

    MediaValidator() : MediaValidator(Options{}) {}
    explicit MediaValidator(Options options);

    MediaValidator(const MediaValidator&) = delete;
    MediaValidator& operator=(const MediaValidator&) = delete;

    /**
     * @brief Validate a produced file for the given kind
     *
     * Blacklisted paths are rejected without touching the disk. A failing path is
     * blacklisted before returning.
     * @return true if the file can be handed to consumers
     */
    bool validate(const std::filesystem::path& path, MediaKind kind);

    /// Same as validate() but keeps the failure reason
    Result<void> check(const std::filesystem::path& path, MediaKind kind);

    Result<detection::ImageFormat> validateImage(const std::filesystem::path& path) const;
    Result<void> validateAudio(const std::filesystem::path& path) const;

    /// Decode the first frame of an in-memory image and discard it
    static Result<void> decodeImage(ByteSpan data, detection::ImageFormat format);

    /// Duration reported by TagLib for an MP3 file
    Result<Duration> readAudioDuration(const std::filesystem::path& path) const;

    void blacklist(const std::filesystem::path& path);
    bool isBlacklisted(const std::filesystem::path& path) const;
    /// Forget an earlier failure once a fresh file is committed at this path
    void markValid(const std::filesystem::path& path);
    std::size_t blacklistSize() const;

    const Options& options() const noexcept { return options_; }

private:
    static std::string key(const std::filesystem::path& path);

    Options options_;
    mutable std::mutex mutex_;
    std::unordered_set<std::string> negative_;
};

} // namespace chatmedia::media
