#pragma once

#include <chatmedia/core/types.h>
#include <chatmedia/media/media_types.h>

#include <filesystem>
#include <future>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>

namespace chatmedia::media {

/**
 * @brief Process-local map from content identifier to a finished output file
 *
 * Built lazily by scanning `<root>/{images,voices,emojis}`. Concurrent first callers
 * wait on one shared scan. Staging files are never indexed.
 */
class CacheIndex {
public:
    explicit CacheIndex(std::filesystem::path outputRoot);

    CacheIndex(const CacheIndex&) = delete;
    CacheIndex& operator=(const CacheIndex&) = delete;

    Result<void> ensureBuilt();
    [[nodiscard]] bool built() const;

    /// Drop the in-memory map and rescan the output tree
    Result<std::size_t> rebuild();

    [[nodiscard]] std::optional<CacheEntry> lookup(const ContentIdentifier& id) const;

    /// Insert if absent; returns false when an entry already existed
    bool record(CacheEntry entry);

    void invalidate(const ContentIdentifier& id);

    [[nodiscard]] std::filesystem::path directoryFor(MediaKind kind) const;

    /// Final location: `<root>/<kind dir>/<sanitized id><extension>`
    [[nodiscard]] std::filesystem::path outputPathFor(const ContentIdentifier& id,
                                                      std::string_view extension) const;

    /// Per-variant temporary: `<root>/<kind dir>/<sanitized id><suffix>.staging<extension>`
    [[nodiscard]] std::filesystem::path
    stagingPathFor(const ContentIdentifier& id, std::optional<AttachmentVariant> variant,
                   std::string_view extension) const;

    [[nodiscard]] static bool isStagingFile(const std::filesystem::path& path);

    [[nodiscard]] std::size_t size() const;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    std::size_t scanKind(MediaKind kind, std::unordered_map<ContentIdentifier, CacheEntry>& out);

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::unordered_map<ContentIdentifier, CacheEntry> entries_;
    std::shared_future<Result<void>> buildFuture_;
};

} // namespace chatmedia::media
