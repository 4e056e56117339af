#pragma once

#include <chatmedia/core/types.h>

#include <filesystem>

namespace chatmedia {

/// Read a whole file; empty files are reported as InvalidArgument
[[nodiscard]] Result<ByteVector> readFileToMemory(const std::filesystem::path& path);

/// Write bytes to a file, creating parent directories as needed
[[nodiscard]] Result<void> writeFile(const std::filesystem::path& path, ByteSpan data);

/// Rename over an existing destination
[[nodiscard]] Result<void> commitFile(const std::filesystem::path& from,
                                      const std::filesystem::path& to);

/// Remove a file if present; errors are logged, never returned
void removeQuietly(const std::filesystem::path& path) noexcept;

/**
 * @brief Deletes the named file when it goes out of scope unless released
 */
class ScopedTempFile {
public:
    ScopedTempFile() = default;
    explicit ScopedTempFile(std::filesystem::path path) : path_(std::move(path)) {}
    ~ScopedTempFile() { reset(); }

    ScopedTempFile(const ScopedTempFile&) = delete;
    ScopedTempFile& operator=(const ScopedTempFile&) = delete;
    ScopedTempFile(ScopedTempFile&& other) noexcept : path_(std::move(other.path_)) {
        other.path_.clear();
    }
    ScopedTempFile& operator=(ScopedTempFile&& other) noexcept {
        if (this != &other) {
            reset();
            path_ = std::move(other.path_);
            other.path_.clear();
        }
        return *this;
    }

    const std::filesystem::path& path() const noexcept { return path_; }

    /// Keep the file on disk
    std::filesystem::path release() noexcept {
        auto p = std::move(path_);
        path_.clear();
        return p;
    }

    void reset() noexcept {
        if (!path_.empty()) {
            removeQuietly(path_);
            path_.clear();
        }
    }

private:
    std::filesystem::path path_;
};

} // namespace chatmedia
