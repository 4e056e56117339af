#pragma once

#include <chatmedia/core/types.h>
#include <chatmedia/media/media_types.h>

#include <filesystem>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace chatmedia::media {

struct VariantCandidate {
    AttachmentVariant variant = AttachmentVariant::Original;
    std::filesystem::path path;
};

/**
 * @brief Maps content identifiers to the on-disk variants of an attachment
 *
 * The index is built by one recursive scan of the per-account source root. Callers
 * racing on the first lookup share the same scan.
 */
class VariantResolver {
public:
    explicit VariantResolver(std::filesystem::path sourceRoot);

    VariantResolver(const VariantResolver&) = delete;
    VariantResolver& operator=(const VariantResolver&) = delete;

    /// Lower-case, drop the extension and one trailing variant tag
    [[nodiscard]] static std::string normalize(std::string_view name);

    [[nodiscard]] static AttachmentVariant classify(std::string_view fileName);

    [[nodiscard]] static int rank(AttachmentVariant variant) noexcept { return variantRank(variant); }

    /// True for names this index tracks (.dat blobs and plain sticker images)
    [[nodiscard]] static bool isIndexable(const std::filesystem::path& path);

    /**
     * @brief Rebuild the index from disk
     * @return Number of indexed files, or IOError if the root cannot be walked
     */
    Result<std::size_t> scan();

    /// Build the index on first use; concurrent callers wait for the same scan
    Result<void> ensureScanned();

    [[nodiscard]] bool scanned() const;

    /// Add one file to the index without rescanning
    void observe(const std::filesystem::path& path);

    /// One path per observed variant, best rank first
    [[nodiscard]] std::vector<VariantCandidate> candidates(const ContentIdentifier& id) const;

    [[nodiscard]] std::size_t size() const;

    const std::filesystem::path& root() const noexcept { return root_; }

private:
    using VariantMap = std::map<AttachmentVariant, std::filesystem::path>;

    void insertLocked(std::unordered_map<std::string, VariantMap>& index,
                      const std::filesystem::path& path);

    std::filesystem::path root_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, VariantMap> index_;
    std::shared_future<Result<void>> scanFuture_;
};

} // namespace chatmedia::media
