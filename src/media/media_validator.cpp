#include <spdlog/spdlog.h>
#include <chatmedia/common/av_ptr.h>
#include <chatmedia/core/file_utils.h>
#include <chatmedia/media/media_validator.h>

#include <taglib/audioproperties.h>
#include <taglib/mpegfile.h>

#include <cstring>
#include <limits>

namespace chatmedia::media {

namespace {

AVCodecID codecFor(detection::ImageFormat format) {
    switch (format) {
        case detection::ImageFormat::Png:
            return AV_CODEC_ID_PNG;
        case detection::ImageFormat::Jpeg:
            return AV_CODEC_ID_MJPEG;
        case detection::ImageFormat::Gif:
            return AV_CODEC_ID_GIF;
        case detection::ImageFormat::WebP:
            return AV_CODEC_ID_WEBP;
        case detection::ImageFormat::Unknown:
            break;
    }
    return AV_CODEC_ID_NONE;
}

} // namespace

MediaValidator::MediaValidator(Options options) : options_(options) {
    av::quietLogging();
}

std::string MediaValidator::key(const std::filesystem::path& path) {
    return path.lexically_normal().string();
}

bool MediaValidator::validate(const std::filesystem::path& path, MediaKind kind) {
    return check(path, kind).has_value();
}

Result<void> MediaValidator::check(const std::filesystem::path& path, MediaKind kind) {
    if (isBlacklisted(path)) {
        return Error{ErrorCode::CorruptOutput, "Previously rejected: " + path.string()};
    }

    Result<void> verdict;
    if (kind == MediaKind::Voice) {
        verdict = validateAudio(path);
    } else {
        auto image = validateImage(path);
        if (!image)
            verdict = image.error();
    }

    if (!verdict) {
        spdlog::warn("MediaValidator: rejecting {}: {}", path.string(), verdict.error().message);
        blacklist(path);
    }
    return verdict;
}

Result<detection::ImageFormat> MediaValidator::validateImage(const std::filesystem::path& path) const {
    auto data = readFileToMemory(path);
    if (!data) {
        return Error{ErrorCode::CorruptOutput, data.error().message};
    }
    const auto format = detection::detectImageFormat(ByteSpan(data.value()));
    if (format == detection::ImageFormat::Unknown) {
        return Error{ErrorCode::CorruptOutput, "No image signature: " + path.string()};
    }
    if (options_.deepImageCheck) {
        if (auto decoded = decodeImage(data.value(), format); !decoded) {
            return decoded.error();
        }
    }
    return format;
}

Result<void> MediaValidator::decodeImage(ByteSpan data, detection::ImageFormat format) {
    if (data.empty() || data.size() > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return Error{ErrorCode::CorruptOutput, "Image size out of range"};
    }

    const AVCodec* codec = avcodec_find_decoder(codecFor(format));
    if (!codec) {
        // Signature check already passed; nothing more can be verified here
        spdlog::debug("MediaValidator: no libavcodec decoder for {}", detection::formatName(format));
        return {};
    }

    av::CodecContextPtr ctx(avcodec_alloc_context3(codec));
    if (!ctx) {
        return Error{ErrorCode::InternalError, "Decoder alloc failed"};
    }
    ctx->thread_count = 1;
    ctx->err_recognition |= AV_EF_EXPLODE;
    if (int rc = avcodec_open2(ctx.get(), codec, nullptr); rc < 0) {
        return Error{ErrorCode::InternalError, "Decoder open failed: " + av::errorString(rc)};
    }

    av::PacketPtr pkt(av_packet_alloc());
    av::FramePtr frame(av_frame_alloc());
    if (!pkt || !frame) {
        return Error{ErrorCode::InternalError, "Packet/frame alloc failed"};
    }
    if (av_new_packet(pkt.get(), static_cast<int>(data.size())) < 0) {
        return Error{ErrorCode::InternalError, "Packet buffer alloc failed"};
    }
    std::memcpy(pkt->data, data.data(), data.size());

    if (int rc = avcodec_send_packet(ctx.get(), pkt.get()); rc < 0) {
        return Error{ErrorCode::CorruptOutput, "Image rejected by decoder: " + av::errorString(rc)};
    }
    // Drain so single-packet decoders with delay still emit their frame
    if (int flush = avcodec_send_packet(ctx.get(), nullptr); flush < 0 && flush != AVERROR_EOF) {
        spdlog::debug("MediaValidator: decoder flush failed: {}", av::errorString(flush));
    }

    const int rc = avcodec_receive_frame(ctx.get(), frame.get());
    if (rc < 0) {
        return Error{ErrorCode::CorruptOutput, "No frame decoded: " + av::errorString(rc)};
    }
    if (frame->width <= 0 || frame->height <= 0) {
        return Error{ErrorCode::CorruptOutput, "Decoded frame has no dimensions"};
    }
    return {};
}

Result<void> MediaValidator::validateAudio(const std::filesystem::path& path) const {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec || size == 0) {
        return Error{ErrorCode::CorruptOutput, "Audio file missing or empty: " + path.string()};
    }

    auto prefix = detection::readPrefix(path);
    if (!prefix) {
        return Error{ErrorCode::CorruptOutput, prefix.error().message};
    }
    if (!detection::looksLikeMpegAudio(prefix.value())) {
        return Error{ErrorCode::CorruptOutput, "No MPEG frame sync: " + path.string()};
    }

    TagLib::MPEG::File file(path.c_str());
    const auto* props = file.isValid() ? file.audioProperties() : nullptr;
    if (!props || props->sampleRate() <= 0) {
        return Error{ErrorCode::CorruptOutput, "TagLib cannot read audio properties: " + path.string()};
    }
    return {};
}

Result<Duration> MediaValidator::readAudioDuration(const std::filesystem::path& path) const {
    TagLib::MPEG::File file(path.c_str());
    if (!file.isValid() || !file.audioProperties()) {
        return Error{ErrorCode::CorruptOutput, "Not an MPEG audio file: " + path.string()};
    }
    return Duration(file.audioProperties()->lengthInMilliseconds());
}

void MediaValidator::blacklist(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    negative_.insert(key(path));
}

bool MediaValidator::isBlacklisted(const std::filesystem::path& path) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return negative_.contains(key(path));
}

void MediaValidator::markValid(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    negative_.erase(key(path));
}

std::size_t MediaValidator::blacklistSize() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return negative_.size();
}

} // namespace chatmedia::media
