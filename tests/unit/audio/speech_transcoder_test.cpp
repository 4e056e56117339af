#include <catch2/catch_test_macros.hpp>

#include <chatmedia/audio/speech_transcoder.h>
#include <chatmedia/media/media_validator.h>
#include "support/media_fixtures.hpp"
#include "support/temp_dir_scope.hpp"

#include <algorithm>
#include <map>
#include <mutex>
#include <thread>
#include <vector>

using namespace chatmedia;
using namespace chatmedia::audio;
using namespace std::chrono_literals;
namespace ts = chatmedia::test_support;
namespace fs = std::filesystem;

namespace {

class MemoryVoiceSource : public IVoiceBlobSource {
public:
    void put(const std::string& sender, int64_t timestamp, ByteVector blob) {
        std::lock_guard<std::mutex> lock(mutex_);
        blobs_[{sender, timestamp}] = std::move(blob);
    }

    Result<ByteVector> fetchVoice(const std::string& senderId, int64_t timestamp) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = blobs_.find({senderId, timestamp});
        if (it == blobs_.end())
            return Error{ErrorCode::SourceMissing, "no voice for " + senderId};
        return it->second;
    }

private:
    std::mutex mutex_;
    std::map<std::pair<std::string, int64_t>, ByteVector> blobs_;
};

struct TranscoderFixture {
    ts::TempDirScope dir = ts::TempDirScope::unique_under("chatmedia_transcoder");
    std::shared_ptr<MemoryVoiceSource> source = std::make_shared<MemoryVoiceSource>();
    config::VoiceSettings voice;

    TranscoderFixture() { source->put("alice", 1700000000, ts::bytesOf("#!SILK_V3 fake")); }

    std::unique_ptr<SpeechTranscoder> make() {
        auto locator = std::make_shared<DecoderLocator>(
            DecoderLocator::Options{voice.decoderName, {dir / "bin"}, dir / "extract"});
        return std::make_unique<SpeechTranscoder>(SpeechTranscoder::Options{voice, dir / "tmp"}, source,
                                                  locator);
    }

    bool tempDirEmpty() const {
        std::error_code ec;
        return !fs::exists(dir / "tmp", ec) || fs::is_empty(dir / "tmp", ec);
    }
};

} // namespace

TEST_CASE("SpeechTranscoder turns a 3 s voice note into a 3 s MP3", "[audio][transcoder]") {
    TranscoderFixture f;
    ts::writeThreeSecondDecoder(f.dir / "bin");

    SECTION("pooled encoder") {
        f.voice.encoderMode = config::EncoderMode::Pooled;
    }
    SECTION("dedicated encoder thread") {
        f.voice.encoderMode = config::EncoderMode::Dedicated;
    }

    auto transcoder = f.make();
    auto out = f.dir / "out" / "alice.mp3";
    media::TaskContext ctx(60s);
    auto result = transcoder->transcode(TranscodeRequest{"alice", 1700000000, out}, ctx);
    REQUIRE(result);
    CHECK(result.value().path == out);
    CHECK(result.value().bytes > 0);
    CHECK(result.value().duration >= 2800ms);
    CHECK(result.value().duration <= 3200ms);

    media::MediaValidator validator;
    CHECK(validator.validate(out, media::MediaKind::Voice));
    auto measured = validator.readAudioDuration(out);
    REQUIRE(measured);
    CHECK(measured.value() >= 2800ms);
    CHECK(measured.value() <= 3200ms);

    CHECK(f.tempDirEmpty());
}

TEST_CASE("SpeechTranscoder measures duration from the PCM size", "[audio][transcoder]") {
    TranscoderFixture f;
    ts::writeThreeSecondDecoder(f.dir / "bin");
    auto transcoder = f.make();

    media::TaskContext ctx(30s);
    auto duration = transcoder->measureDuration("alice", 1700000000, ctx);
    REQUIRE(duration);
    CHECK(duration.value() == 3000ms);
    CHECK(f.tempDirEmpty());
}

TEST_CASE("SpeechTranscoder stage failures", "[audio][transcoder]") {
    TranscoderFixture f;
    auto out = f.dir / "out" / "voice.mp3";

    SECTION("missing blob") {
        ts::writeThreeSecondDecoder(f.dir / "bin");
        auto transcoder = f.make();
        media::TaskContext ctx(10s);
        auto result = transcoder->transcode(TranscodeRequest{"bob", 1, out}, ctx);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::SourceMissing);
    }

    SECTION("decoder not installed") {
        auto transcoder = f.make();
        media::TaskContext ctx(10s);
        auto result = transcoder->transcode(TranscodeRequest{"alice", 1700000000, out}, ctx);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::DecodeFailed);
    }

    SECTION("decoder exits non-zero") {
        ts::writeFailingDecoder(f.dir / "bin");
        auto transcoder = f.make();
        media::TaskContext ctx(10s);
        auto result = transcoder->transcode(TranscodeRequest{"alice", 1700000000, out}, ctx);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::DecodeFailed);
        CHECK(result.error().message.find("bad silk header") != std::string::npos);
    }

    SECTION("decoder exceeds its time limit") {
        f.voice.decodeTimeout = 300ms;
        ts::writeHangingDecoder(f.dir / "bin");
        auto transcoder = f.make();
        media::TaskContext ctx(30s);

        const auto start = std::chrono::steady_clock::now();
        auto result = transcoder->transcode(TranscodeRequest{"alice", 1700000000, out}, ctx);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::Timeout);
        CHECK(std::chrono::steady_clock::now() - start < 3s);
    }

    SECTION("caller cancellation") {
        ts::writeHangingDecoder(f.dir / "bin");
        auto transcoder = f.make();
        media::TaskContext ctx(30s);
        std::jthread canceller([ctx] {
            std::this_thread::sleep_for(200ms);
            ctx.cancel();
        });
        auto result = transcoder->transcode(TranscodeRequest{"alice", 1700000000, out}, ctx);
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::Timeout);
    }

    CHECK_FALSE(fs::exists(out));
    CHECK(f.tempDirEmpty());
}

TEST_CASE("SpeechTranscoder encode stage time limit", "[audio][transcoder]") {
    TranscoderFixture f;
    ts::writeLongDecoder(f.dir / "bin", 300);
    f.voice.encodeTimeout = 1ms;

    SECTION("pooled encoder") {
        f.voice.encoderMode = config::EncoderMode::Pooled;
    }
    SECTION("dedicated encoder thread") {
        f.voice.encoderMode = config::EncoderMode::Dedicated;
    }

    auto transcoder = f.make();
    auto out = f.dir / "out" / "long.mp3";
    media::TaskContext ctx(60s);
    auto result = transcoder->transcode(TranscodeRequest{"alice", 1700000000, out}, ctx);
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::Timeout);
    CHECK_FALSE(fs::exists(out));
    CHECK(f.tempDirEmpty());
}

TEST_CASE("SpeechTranscoder reports heartbeats while encoding", "[audio][transcoder]") {
    TranscoderFixture f;
    ts::writeLongDecoder(f.dir / "bin", 300);
    f.voice.heartbeat = 10ms;
    auto transcoder = f.make();

    std::mutex mutex;
    std::vector<media::PipelineProgress> events;
    media::TaskContext ctx(120s, [&](const media::PipelineProgress& p) {
        std::lock_guard<std::mutex> lock(mutex);
        events.push_back(p);
    });

    auto out = f.dir / "out" / "long.mp3";
    auto result = transcoder->transcode(TranscodeRequest{"alice", 1700000000, out}, ctx);
    REQUIRE(result);
    CHECK(result.value().duration >= 299s);

    std::lock_guard<std::mutex> lock(mutex);
    const auto heartbeats = std::count_if(events.begin(), events.end(), [](const auto& e) {
        return e.stage == media::ProgressStage::Heartbeat;
    });
    CHECK(heartbeats >= 1);
    const bool sawEncoding = std::any_of(events.begin(), events.end(), [](const auto& e) {
        return e.stage == media::ProgressStage::Encoding;
    });
    CHECK(sawEncoding);
    CHECK(f.tempDirEmpty());
}

TEST_CASE("SpeechTranscoder requires its collaborators", "[audio][transcoder]") {
    auto locator = std::make_shared<DecoderLocator>(DecoderLocator::Options{});
    CHECK_THROWS_AS(SpeechTranscoder(SpeechTranscoder::Options{}, nullptr, locator), std::runtime_error);
    CHECK_THROWS_AS(SpeechTranscoder(SpeechTranscoder::Options{}, std::make_shared<MemoryVoiceSource>(),
                                     nullptr),
                    std::runtime_error);
}
