#pragma once

#include <chatmedia/core/types.h>

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace chatmedia::media {

enum class MediaKind : uint8_t { Image, Voice, Sticker };

[[nodiscard]] std::string_view kindName(MediaKind kind) noexcept;

/// Output subdirectory owned by each kind
[[nodiscard]] std::string_view kindDirectory(MediaKind kind) noexcept;

[[nodiscard]] std::optional<MediaKind> parseKind(std::string_view name);

/**
 * @brief Stable key naming one logical attachment
 *
 * Used as the cache key and the in-flight dedup key. An empty value means the
 * reference could not be identified.
 */
struct ContentIdentifier {
    MediaKind kind = MediaKind::Image;
    std::string value;

    bool empty() const noexcept { return value.empty(); }

    bool operator==(const ContentIdentifier& other) const = default;

    std::string toString() const;
};

/**
 * @brief Caller-supplied attachment reference
 */
struct AttachmentReference {
    std::optional<std::string> contentHash;
    std::optional<std::string> fallbackName;
    MediaKind kind = MediaKind::Image;
    std::string senderId;
    int64_t timestamp = 0;
    int64_t localMessageId = 0;
};

/// Physical renditions of one attachment, declared in rank order
enum class AttachmentVariant : uint8_t { Other, Thumbnail, Cache, High, Original, Big };

[[nodiscard]] constexpr int variantRank(AttachmentVariant v) noexcept {
    switch (v) {
        case AttachmentVariant::Big:
            return 5;
        case AttachmentVariant::Original:
            return 4;
        case AttachmentVariant::High:
            return 3;
        case AttachmentVariant::Cache:
            return 2;
        case AttachmentVariant::Thumbnail:
            return 1;
        case AttachmentVariant::Other:
            return 0;
    }
    return 0;
}

[[nodiscard]] std::string_view variantName(AttachmentVariant v) noexcept;

/// File-name suffix for a variant ("" for Original)
[[nodiscard]] std::string_view variantSuffix(AttachmentVariant v) noexcept;

struct CacheEntry {
    ContentIdentifier id;
    MediaKind kind = MediaKind::Image;
    std::filesystem::path resolvedPath;
    bool validated = false;
};

struct ResolvedMedia {
    ContentIdentifier id;
    MediaKind kind = MediaKind::Image;
    std::filesystem::path path;
    std::optional<AttachmentVariant> variant;
    bool fromCache = false;
    bool degraded = false;
};

enum class TaskState : uint8_t { Pending, Running, Succeeded, Failed, TimedOut };

[[nodiscard]] std::string_view taskStateName(TaskState state) noexcept;

/// Coarse status for viewers deciding whether to offer on-demand decoding
enum class ResolutionState : uint8_t { Resolved, InProgress, NeedsDecode, Unresolvable };

[[nodiscard]] std::string_view resolutionStateName(ResolutionState state) noexcept;

/// Map a failed resolution to what a viewer should show
[[nodiscard]] ResolutionState resolutionStateFor(ErrorCode code) noexcept;

/// Replace every character outside [A-Za-z0-9_@.-] with '_'
[[nodiscard]] std::string sanitizeFileName(std::string_view name);

} // namespace chatmedia::media

template <> struct std::hash<chatmedia::media::ContentIdentifier> {
    std::size_t operator()(const chatmedia::media::ContentIdentifier& id) const noexcept {
        std::size_t h = std::hash<std::string>{}(id.value);
        return h ^ (static_cast<std::size_t>(id.kind) + 0x9e3779b97f4a7c15ULL + (h << 6) + (h >> 2));
    }
};
