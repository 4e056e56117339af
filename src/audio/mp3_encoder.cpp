#include <spdlog/spdlog.h>
#include <chatmedia/audio/mp3_encoder.h>
#include <chatmedia/common/av_ptr.h>
#include <chatmedia/core/file_utils.h>

extern "C" {
#include <libavutil/channel_layout.h>
#include <libavutil/samplefmt.h>
}

#include <cstring>
#include <fstream>
#include <vector>

namespace chatmedia::audio {

namespace {

constexpr int BYTES_PER_SAMPLE = 2;

// Mono s16 and s16p share one memory layout, so either can take the PCM as is
AVSampleFormat pickSampleFormat(const AVCodec* codec) {
    if (!codec->sample_fmts)
        return AV_SAMPLE_FMT_S16P;
    AVSampleFormat fallback = AV_SAMPLE_FMT_NONE;
    for (const AVSampleFormat* fmt = codec->sample_fmts; *fmt != AV_SAMPLE_FMT_NONE; ++fmt) {
        if (*fmt == AV_SAMPLE_FMT_S16P)
            return *fmt;
        if (*fmt == AV_SAMPLE_FMT_S16)
            fallback = *fmt;
    }
    return fallback;
}

Result<void> drainPackets(AVCodecContext* ctx, AVPacket* pkt, std::ofstream& out,
                          EncodeStats& stats) {
    for (;;) {
        const int rc = avcodec_receive_packet(ctx, pkt);
        if (rc == AVERROR(EAGAIN) || rc == AVERROR_EOF) {
            return {};
        }
        if (rc < 0) {
            return Error{ErrorCode::EncodeFailed, "receive_packet failed: " + av::errorString(rc)};
        }
        if (pkt->data && pkt->size > 0) {
            out.write(reinterpret_cast<const char*>(pkt->data), pkt->size);
            stats.bytesWritten += static_cast<uint64_t>(pkt->size);
        }
        av_packet_unref(pkt);
        if (!out) {
            return Error{ErrorCode::IOError, "Write to MP3 output failed"};
        }
    }
}

} // namespace

Result<EncodeStats> Mp3Encoder::encodeFile(const std::filesystem::path& pcmPath,
                                           const std::filesystem::path& mp3Path,
                                           const StopPredicate& shouldStop) const {
    av::quietLogging();

    std::ifstream pcm(pcmPath, std::ios::binary);
    if (!pcm) {
        return Error{ErrorCode::EncodeFailed, "Cannot open PCM input: " + pcmPath.string()};
    }

    const AVCodec* codec = avcodec_find_encoder(AV_CODEC_ID_MP3);
    if (!codec) {
        return Error{ErrorCode::EncodeFailed, "MP3 encoder unavailable"};
    }
    const AVSampleFormat sampleFmt = pickSampleFormat(codec);
    if (sampleFmt == AV_SAMPLE_FMT_NONE) {
        return Error{ErrorCode::EncodeFailed,
                     std::string("Encoder ") + codec->name + " does not take 16-bit samples"};
    }

    av::CodecContextPtr ctx(avcodec_alloc_context3(codec));
    if (!ctx) {
        return Error{ErrorCode::EncodeFailed, "MP3 encoder alloc failed"};
    }
    ctx->sample_fmt = sampleFmt;
    ctx->sample_rate = static_cast<int>(options_.sampleRate);
    ctx->bit_rate = static_cast<int64_t>(options_.bitrate);
    ctx->time_base = AVRational{1, static_cast<int>(options_.sampleRate)};
    av_channel_layout_default(&ctx->ch_layout, 1);

    if (int rc = avcodec_open2(ctx.get(), codec, nullptr); rc < 0) {
        return Error{ErrorCode::EncodeFailed, "MP3 encoder open failed: " + av::errorString(rc)};
    }

    const int frameSize = ctx->frame_size > 0 ? ctx->frame_size : 1152;
    const bool smallLastFrame = (codec->capabilities & AV_CODEC_CAP_SMALL_LAST_FRAME) != 0;

    av::FramePtr frame(av_frame_alloc());
    av::PacketPtr pkt(av_packet_alloc());
    if (!frame || !pkt) {
        return Error{ErrorCode::EncodeFailed, "Frame/packet alloc failed"};
    }
    frame->format = ctx->sample_fmt;
    frame->sample_rate = ctx->sample_rate;
    frame->nb_samples = frameSize;
    if (av_channel_layout_copy(&frame->ch_layout, &ctx->ch_layout) < 0 ||
        av_frame_get_buffer(frame.get(), 0) < 0) {
        return Error{ErrorCode::EncodeFailed, "Frame buffer alloc failed"};
    }

    std::error_code ec;
    if (mp3Path.has_parent_path()) {
        std::filesystem::create_directories(mp3Path.parent_path(), ec);
    }
    ScopedTempFile partial(mp3Path);
    std::ofstream out(mp3Path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Error{ErrorCode::IOError, "Cannot open MP3 output: " + mp3Path.string()};
    }

    EncodeStats stats;
    std::vector<char> chunk(static_cast<std::size_t>(frameSize) * BYTES_PER_SAMPLE);
    int64_t pts = 0;

    for (;;) {
        if (shouldStop && shouldStop()) {
            return Error{ErrorCode::OperationCancelled, "MP3 encode cancelled"};
        }
        pcm.read(chunk.data(), static_cast<std::streamsize>(chunk.size()));
        const auto got = static_cast<std::size_t>(pcm.gcount());
        const int samples = static_cast<int>(got / BYTES_PER_SAMPLE);
        if (samples == 0)
            break;

        if (av_frame_make_writable(frame.get()) < 0) {
            return Error{ErrorCode::EncodeFailed, "Frame not writable"};
        }
        std::memcpy(frame->data[0], chunk.data(), static_cast<std::size_t>(samples) * BYTES_PER_SAMPLE);
        if (samples < frameSize) {
            if (smallLastFrame) {
                frame->nb_samples = samples;
            } else {
                std::memset(frame->data[0] + static_cast<std::size_t>(samples) * BYTES_PER_SAMPLE, 0,
                            static_cast<std::size_t>(frameSize - samples) * BYTES_PER_SAMPLE);
            }
        }
        frame->pts = pts;
        pts += frame->nb_samples;
        stats.samples += static_cast<uint64_t>(samples);

        if (int rc = avcodec_send_frame(ctx.get(), frame.get()); rc < 0) {
            return Error{ErrorCode::EncodeFailed, "send_frame failed: " + av::errorString(rc)};
        }
        if (auto r = drainPackets(ctx.get(), pkt.get(), out, stats); !r) {
            return r.error();
        }
        if (samples < frameSize)
            break;
    }

    // Flush delayed packets
    if (int rc = avcodec_send_frame(ctx.get(), nullptr); rc < 0 && rc != AVERROR_EOF) {
        return Error{ErrorCode::EncodeFailed, "Encoder flush failed: " + av::errorString(rc)};
    }
    if (auto r = drainPackets(ctx.get(), pkt.get(), out, stats); !r) {
        return r.error();
    }

    out.close();
    if (!out) {
        return Error{ErrorCode::IOError, "Failed to finish " + mp3Path.string()};
    }
    if (stats.bytesWritten == 0) {
        return Error{ErrorCode::EncodeFailed, "Encoder produced no output"};
    }

    stats.duration = Duration(static_cast<int64_t>(stats.samples * 1000 / options_.sampleRate));
    partial.release();
    spdlog::debug("Mp3Encoder: {} samples -> {} bytes ({} ms)", stats.samples, stats.bytesWritten,
                  stats.duration.count());
    return stats;
}

} // namespace chatmedia::audio
