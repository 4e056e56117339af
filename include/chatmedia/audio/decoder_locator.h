#pragma once

#include <chatmedia/core/types.h>

#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace chatmedia::audio {

/**
 * @brief Finds the external speech decoder binary
 *
 * Search order: the CHATMEDIA_SILK_DECODER environment variable, each configured
 * directory, `<exe dir>/bin`, then the extraction directory. A binary that is found but
 * cannot be executed in place is copied into the extraction directory and marked
 * executable. The first successful lookup is cached.
 */
class DecoderLocator {
public:
    static constexpr const char* ENV_OVERRIDE = "CHATMEDIA_SILK_DECODER";

    struct Options {
        std::string binaryName = "silk_v3_decoder";
        std::vector<std::filesystem::path> searchDirs;
        std::filesystem::path extractDir;
    };

    explicit DecoderLocator(Options options);

    /// DecodeFailed when no candidate exists
    Result<std::filesystem::path> locate();

    /// Copy a bundled binary into the extraction dir with owner exec permission
    Result<std::filesystem::path> extract(const std::filesystem::path& source) const;

    [[nodiscard]] static bool isExecutable(const std::filesystem::path& path);

    /// Directory of the running executable, from /proc/self/exe
    [[nodiscard]] static std::optional<std::filesystem::path> executableDir();

    [[nodiscard]] std::vector<std::filesystem::path> searchPath() const;

private:
    Options options_;
    std::mutex mutex_;
    std::optional<std::filesystem::path> cached_;
};

} // namespace chatmedia::audio
