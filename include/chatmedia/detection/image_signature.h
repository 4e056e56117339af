#pragma once

#include <chatmedia/core/types.h>

#include <array>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string_view>

namespace chatmedia::detection {

/**
 * @brief Image container formats the pipeline can emit
 */
enum class ImageFormat : uint8_t { Unknown, Jpeg, Png, Gif, WebP };

/**
 * @brief Magic byte signature anchored at a fixed offset
 *
 * Bytes are matched exactly; `length` bytes of `bytes` are significant.
 */
struct MagicSignature {
    std::array<uint8_t, 8> bytes;
    uint8_t length;
    uint16_t offset;
    ImageFormat format;
    std::string_view description;

    constexpr bool matches(std::span<const std::byte> data) const {
        if (data.size() < static_cast<size_t>(offset) + length)
            return false;
        for (size_t i = 0; i < length; ++i) {
            if (std::to_integer<uint8_t>(data[offset + i]) != bytes[i])
                return false;
        }
        return true;
    }
};

/**
 * @brief Detect the image format from the first bytes of a buffer
 * @param data At least 12 bytes are needed to recognize WebP
 * @return Detected format, ImageFormat::Unknown if nothing matched
 */
[[nodiscard]] ImageFormat detectImageFormat(std::span<const std::byte> data) noexcept;

/**
 * @brief Read a short prefix of a file and detect its image format
 */
[[nodiscard]] ImageFormat detectImageFormat(const std::filesystem::path& path);

[[nodiscard]] inline bool isImage(std::span<const std::byte> data) noexcept {
    return detectImageFormat(data) != ImageFormat::Unknown;
}

/**
 * @brief True if the buffer begins with an ID3v2 tag or an MPEG audio frame sync
 */
[[nodiscard]] bool looksLikeMpegAudio(std::span<const std::byte> data) noexcept;

/// File extension (with leading dot) used when writing an image of this format
[[nodiscard]] std::string_view extensionFor(ImageFormat format) noexcept;

[[nodiscard]] std::string_view formatName(ImageFormat format) noexcept;

/// Read up to `maxBytes` from the start of a file
[[nodiscard]] Result<ByteVector> readPrefix(const std::filesystem::path& path,
                                            std::size_t maxBytes = SIGNATURE_SNIFF_SIZE);

} // namespace chatmedia::detection
