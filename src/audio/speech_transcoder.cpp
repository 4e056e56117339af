#include <spdlog/spdlog.h>
#include <chatmedia/audio/decoder_process.h>
#include <chatmedia/audio/speech_transcoder.h>
#include <chatmedia/media/media_types.h>
#include <chatmedia/media/worker_pool.h>

#include <algorithm>
#include <future>
#include <thread>

namespace chatmedia::audio {

namespace {

using Clock = std::chrono::steady_clock;
using namespace std::chrono_literals;

constexpr auto POLL_SLICE = 100ms;
constexpr auto CANCEL_GRACE = 2s;

std::chrono::milliseconds boundedBy(std::chrono::milliseconds stage, const media::TaskContext& ctx) {
    return std::min(stage, ctx.remaining());
}

} // namespace

std::string_view stageName(TranscodeStage stage) noexcept {
    switch (stage) {
        case TranscodeStage::FetchBlob:
            return "fetch";
        case TranscodeStage::DecodeToPcm:
            return "decode";
        case TranscodeStage::EncodeToMp3:
            return "encode";
        case TranscodeStage::Done:
            return "done";
        case TranscodeStage::Failed:
            return "failed";
    }
    return "failed";
}

SpeechTranscoder::SpeechTranscoder(Options options, std::shared_ptr<IVoiceBlobSource> source,
                                   std::shared_ptr<DecoderLocator> locator)
    : options_(std::move(options)), source_(std::move(source)), locator_(std::move(locator)),
      encoder_(Mp3Encoder::Options{options_.voice.sampleRate, options_.voice.bitrate}) {
    if (!source_) {
        throw std::runtime_error("SpeechTranscoder requires a voice blob source");
    }
    if (!locator_) {
        throw std::runtime_error("SpeechTranscoder requires a decoder locator");
    }
    if (options_.voice.encoderMode == config::EncoderMode::Pooled) {
        encoderPool_ =
            std::make_unique<media::WorkerPool>(std::max<std::size_t>(1, options_.voice.encoderWorkers));
    }
}

SpeechTranscoder::~SpeechTranscoder() {
    if (encoderPool_) {
        encoderPool_->stop();
    }
}

std::string SpeechTranscoder::nextBaseName(const std::string& senderId, int64_t timestamp) {
    const auto n = sequence_.fetch_add(1, std::memory_order_relaxed);
    return "voice_" + std::to_string(timestamp) + "_" + media::sanitizeFileName(senderId) + "_" +
           std::to_string(n);
}

Result<ScopedTempFile> SpeechTranscoder::fetchBlob(const std::string& senderId, int64_t timestamp,
                                                   const std::string& baseName) {
    auto blob = source_->fetchVoice(senderId, timestamp);
    if (!blob) {
        return Error{ErrorCode::SourceMissing, blob.error().message};
    }
    if (blob.value().empty()) {
        return Error{ErrorCode::SourceMissing, "Empty voice payload"};
    }

    ScopedTempFile silk(options_.tempDir / (baseName + ".silk"));
    if (auto w = writeFile(silk.path(), blob.value()); !w) {
        return w.error();
    }
    return std::move(silk);
}

Result<ScopedTempFile> SpeechTranscoder::decodeToPcm(const std::filesystem::path& silkPath,
                                                     const std::string& baseName,
                                                     const media::TaskContext& ctx) {
    auto decoder = locator_->locate();
    if (!decoder) {
        return Error{ErrorCode::DecodeFailed, decoder.error().message};
    }

    ScopedTempFile pcm(options_.tempDir / (baseName + ".pcm"));
    DecoderProcessConfig config{
        .executable = decoder.value(),
        .args = {silkPath.string(), pcm.path().string(), "-Fs_API",
                 std::to_string(options_.voice.sampleRate)},
    };

    std::unique_ptr<DecoderProcess> process;
    try {
        process = std::make_unique<DecoderProcess>(std::move(config));
    } catch (const std::exception& e) {
        return Error{ErrorCode::DecodeFailed, std::string("Cannot start decoder: ") + e.what()};
    }

    const auto deadline = Clock::now() + boundedBy(options_.voice.decodeTimeout, ctx);
    while (!process->wait_for_exit(POLL_SLICE)) {
        if (Clock::now() >= deadline || ctx.cancelled()) {
            spdlog::warn("SpeechTranscoder: decoder pid={} exceeded its time limit", process->pid());
            process->terminate(CANCEL_GRACE);
            return Error{ErrorCode::Timeout, "Speech decode timed out"};
        }
    }

    const auto code = process->exit_code().value_or(-1);
    if (code != 0) {
        auto out = process->output();
        return Error{ErrorCode::DecodeFailed,
                     "Decoder exited with " + std::to_string(code) + (out.empty() ? "" : ": " + out)};
    }

    std::error_code ec;
    const auto size = std::filesystem::file_size(pcm.path(), ec);
    if (ec || size == 0) {
        return Error{ErrorCode::DecodeFailed, "Decoder produced no PCM"};
    }
    return std::move(pcm);
}

Result<EncodeStats> SpeechTranscoder::encodeToMp3(const std::filesystem::path& pcmPath,
                                                  const std::filesystem::path& mp3Path,
                                                  const media::TaskContext& ctx) {
    auto cancel = std::make_shared<std::atomic<bool>>(false);
    auto promise = std::make_shared<std::promise<Result<EncodeStats>>>();
    auto future = promise->get_future();

    auto job = [encoder = encoder_, pcmPath, mp3Path, cancel, ctx, promise]() {
        try {
            promise->set_value(encoder.encodeFile(
                pcmPath, mp3Path, [&] { return cancel->load(std::memory_order_acquire) || ctx.cancelled(); }));
        } catch (const std::exception& e) {
            promise->set_value(Error{ErrorCode::EncodeFailed, e.what()});
        }
    };

    std::jthread dedicated;
    if (encoderPool_) {
        if (!encoderPool_->post(std::move(job))) {
            return Error{ErrorCode::EncodeFailed, "Encoder pool is stopped"};
        }
    } else {
        dedicated = std::jthread(std::move(job));
    }

    const auto start = Clock::now();
    const auto deadline = start + boundedBy(options_.voice.encodeTimeout, ctx);
    const auto heartbeat = std::max<std::chrono::milliseconds>(options_.voice.heartbeat, 10ms);

    for (;;) {
        const auto now = Clock::now();
        const auto wait = std::min<Clock::duration>(heartbeat, std::max<Clock::duration>(deadline - now, 0ms));
        if (future.wait_for(wait) == std::future_status::ready) {
            break;
        }
        if (Clock::now() >= deadline || ctx.cancelled()) {
            cancel->store(true, std::memory_order_release);
            if (future.wait_for(CANCEL_GRACE) != std::future_status::ready) {
                spdlog::warn("SpeechTranscoder: encoder did not stop within grace period");
            }
            removeQuietly(mp3Path);
            return Error{ErrorCode::Timeout, "MP3 encode timed out"};
        }
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start);
        ctx.report(media::ProgressStage::Heartbeat, static_cast<uint64_t>(elapsed.count()),
                   static_cast<uint64_t>(options_.voice.encodeTimeout.count()), "encoding");
    }

    auto result = future.get();
    if (!result && result.error().code == ErrorCode::OperationCancelled) {
        return Error{ErrorCode::Timeout, "MP3 encode cancelled"};
    }
    return result;
}

Result<TranscodeResult> SpeechTranscoder::transcode(const TranscodeRequest& request,
                                                    const media::TaskContext& ctx) {
    const auto baseName = nextBaseName(request.senderId, request.timestamp);
    auto stage = TranscodeStage::FetchBlob;
    auto fail = [&](const Error& e) -> Result<TranscodeResult> {
        spdlog::warn("SpeechTranscoder: {} failed at {}: {}", baseName, stageName(stage), e.message);
        removeQuietly(request.outputPath);
        return e;
    };

    auto silk = fetchBlob(request.senderId, request.timestamp, baseName);
    if (!silk)
        return fail(silk.error());
    ScopedTempFile silkGuard = std::move(silk).value();
    if (ctx.shouldStop())
        return fail(Error{ErrorCode::Timeout, "Cancelled after fetch"});

    stage = TranscodeStage::DecodeToPcm;
    ctx.report(media::ProgressStage::Decoding, 0, 0, baseName);
    auto pcm = decodeToPcm(silkGuard.path(), baseName, ctx);
    if (!pcm)
        return fail(pcm.error());
    ScopedTempFile pcmGuard = std::move(pcm).value();
    silkGuard.reset();
    if (ctx.shouldStop())
        return fail(Error{ErrorCode::Timeout, "Cancelled after decode"});

    stage = TranscodeStage::EncodeToMp3;
    ctx.report(media::ProgressStage::Encoding, 0, 0, baseName);
    auto encoded = encodeToMp3(pcmGuard.path(), request.outputPath, ctx);
    if (!encoded)
        return fail(encoded.error());

    stage = TranscodeStage::Done;
    return TranscodeResult{request.outputPath, encoded.value().duration, encoded.value().bytesWritten};
}

Result<Duration> SpeechTranscoder::measureDuration(const std::string& senderId, int64_t timestamp,
                                                   const media::TaskContext& ctx) {
    const auto baseName = nextBaseName(senderId, timestamp);
    auto silk = fetchBlob(senderId, timestamp, baseName);
    if (!silk)
        return silk.error();
    ScopedTempFile silkGuard = std::move(silk).value();

    auto pcm = decodeToPcm(silkGuard.path(), baseName, ctx);
    if (!pcm)
        return pcm.error();
    ScopedTempFile pcmGuard = std::move(pcm).value();

    std::error_code ec;
    const auto bytes = std::filesystem::file_size(pcmGuard.path(), ec);
    if (ec) {
        return Error{ErrorCode::IOError, "Cannot stat PCM: " + ec.message()};
    }
    const uint64_t bytesPerSecond = static_cast<uint64_t>(options_.voice.sampleRate) * 2;
    return Duration(static_cast<int64_t>(bytes * 1000 / bytesPerSecond));
}

} // namespace chatmedia::audio
