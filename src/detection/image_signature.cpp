#include <chatmedia/detection/image_signature.h>

#include <fstream>

namespace chatmedia::detection {

namespace {

constexpr std::array<MagicSignature, 6> IMAGE_SIGNATURES{{
    {{0x89, 0x50, 0x4E, 0x47, 0x0D, 0x0A, 0x1A, 0x0A}, 8, 0, ImageFormat::Png,
     "Portable Network Graphics"},
    {{0xFF, 0xD8, 0xFF}, 3, 0, ImageFormat::Jpeg, "JPEG image"},
    {{0x47, 0x49, 0x46, 0x38, 0x37, 0x61}, 6, 0, ImageFormat::Gif, "GIF87a image"},
    {{0x47, 0x49, 0x46, 0x38, 0x39, 0x61}, 6, 0, ImageFormat::Gif, "GIF89a image"},
    {{0x52, 0x49, 0x46, 0x46}, 4, 0, ImageFormat::WebP, "RIFF container"},
    {{0x57, 0x45, 0x42, 0x50}, 4, 8, ImageFormat::WebP, "WebP form type"},
}};

// WebP needs both the RIFF tag and the WEBP form type
constexpr std::size_t WEBP_RIFF = 4;
constexpr std::size_t WEBP_FORM = 5;

} // namespace

ImageFormat detectImageFormat(std::span<const std::byte> data) noexcept {
    for (std::size_t i = 0; i < WEBP_RIFF; ++i) {
        if (IMAGE_SIGNATURES[i].matches(data))
            return IMAGE_SIGNATURES[i].format;
    }
    if (IMAGE_SIGNATURES[WEBP_RIFF].matches(data) && IMAGE_SIGNATURES[WEBP_FORM].matches(data))
        return ImageFormat::WebP;
    return ImageFormat::Unknown;
}

ImageFormat detectImageFormat(const std::filesystem::path& path) {
    auto prefix = readPrefix(path);
    if (!prefix)
        return ImageFormat::Unknown;
    return detectImageFormat(std::span<const std::byte>(prefix.value()));
}

bool looksLikeMpegAudio(std::span<const std::byte> data) noexcept {
    if (data.size() >= 3 && std::to_integer<uint8_t>(data[0]) == 'I' &&
        std::to_integer<uint8_t>(data[1]) == 'D' && std::to_integer<uint8_t>(data[2]) == '3') {
        return true;
    }
    if (data.size() < 2)
        return false;
    const auto b0 = std::to_integer<uint8_t>(data[0]);
    const auto b1 = std::to_integer<uint8_t>(data[1]);
    // 11-bit frame sync, layer bits must not be the reserved 00
    return b0 == 0xFF && (b1 & 0xE0) == 0xE0 && (b1 & 0x06) != 0x00;
}

std::string_view extensionFor(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::Jpeg:
            return ".jpg";
        case ImageFormat::Png:
            return ".png";
        case ImageFormat::Gif:
            return ".gif";
        case ImageFormat::WebP:
            return ".webp";
        case ImageFormat::Unknown:
            break;
    }
    return ".jpg";
}

std::string_view formatName(ImageFormat format) noexcept {
    switch (format) {
        case ImageFormat::Jpeg:
            return "jpeg";
        case ImageFormat::Png:
            return "png";
        case ImageFormat::Gif:
            return "gif";
        case ImageFormat::WebP:
            return "webp";
        case ImageFormat::Unknown:
            break;
    }
    return "unknown";
}

Result<ByteVector> readPrefix(const std::filesystem::path& path, std::size_t maxBytes) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return Error{ErrorCode::SourceMissing, "Cannot open file: " + path.string()};
    }
    ByteVector buffer(maxBytes);
    file.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(maxBytes));
    buffer.resize(static_cast<std::size_t>(file.gcount()));
    return buffer;
}

} // namespace chatmedia::detection
