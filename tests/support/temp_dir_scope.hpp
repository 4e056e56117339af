#pragma once

#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>

#include <unistd.h>

namespace chatmedia::test_support {

/**
 * Scratch directory holding a pipeline's source, output and temp trees for one test.
 *
 * Directories are created under $CHATMEDIA_TEST_TMPDIR when set, else the system temp
 * directory. Setting CHATMEDIA_KEEP_TEST_DIRS leaves them behind for inspection.
 */
class TempDirScope {
public:
    explicit TempDirScope(std::filesystem::path root) : root_(std::move(root)) {}
    TempDirScope(const TempDirScope&) = delete;
    TempDirScope& operator=(const TempDirScope&) = delete;
    TempDirScope(TempDirScope&& other) noexcept : root_(std::move(other.root_)) { other.root_.clear(); }
    TempDirScope& operator=(TempDirScope&& other) = delete;

    ~TempDirScope() {
        if (root_.empty() || std::getenv("CHATMEDIA_KEEP_TEST_DIRS"))
            return;
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& path() const { return root_; }

    std::filesystem::path operator/(const std::filesystem::path& rel) const { return root_ / rel; }

    // <base>/<label>-<pid>-<n>; the pid keeps parallel ctest shards apart
    static TempDirScope unique_under(const std::string& label) {
        auto root = base() / (label + "-" + std::to_string(::getpid()) + "-" +
                              std::to_string(counter_.fetch_add(1, std::memory_order_relaxed)));
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
        std::filesystem::create_directories(root, ec);
        return TempDirScope(root);
    }

private:
    static std::filesystem::path base() {
        if (const char* dir = std::getenv("CHATMEDIA_TEST_TMPDIR"); dir && *dir)
            return dir;
        return std::filesystem::temp_directory_path();
    }

    std::filesystem::path root_;
    static inline std::atomic<uint64_t> counter_{0};
};

} // namespace chatmedia::test_support
