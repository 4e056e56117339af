#include <catch2/catch_test_macros.hpp>

#include <chatmedia/crypto/dat_decryptor.h>
#include <chatmedia/media/media_pipeline.h>
#include "support/media_fixtures.hpp"
#include "support/temp_dir_scope.hpp"

#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include <set>

using namespace chatmedia;
using namespace chatmedia::media;
using namespace std::chrono_literals;
namespace ts = chatmedia::test_support;

namespace {

constexpr uint8_t XOR_KEY = 0x37;

struct PipelineFixture {
    ts::TempDirScope dir = ts::TempDirScope::unique_under("chatmedia_pipeline");
    config::PipelineConfig cfg;

    PipelineFixture() {
        cfg.xorKey = "0x37";
        cfg.sourceRoot = dir / "source";
        cfg.outputRoot = dir / "output";
        cfg.tempDir = dir / "tmp";
        cfg.voiceRoot = dir / "voice";
        cfg.decoderDirs = {dir / "bin"};
        cfg.decoderExtractDir = dir / "extract";
        cfg.workers = 4;
        cfg.taskTimeout = 30s;
        cfg.voiceTaskTimeout = 60s;
        std::filesystem::create_directories(cfg.sourceRoot);
    }

    std::unique_ptr<MediaPipeline> open() {
        auto pipeline = MediaPipeline::create(cfg);
        if (!pipeline)
            throw std::runtime_error(pipeline.error().message);
        return std::move(pipeline).value();
    }

    void source(const std::string& name, const ByteVector& plain) {
        ts::writeBytes(cfg.sourceRoot / "2024-05" / "Img" / name, ts::xorWith(plain, XOR_KEY));
    }
};

AttachmentReference imageRef(const std::string& hash) {
    AttachmentReference ref;
    ref.kind = MediaKind::Image;
    ref.contentHash = hash;
    return ref;
}

AttachmentReference voiceRef(const std::string& sender, int64_t ts, int64_t localId) {
    AttachmentReference ref;
    ref.kind = MediaKind::Voice;
    ref.senderId = sender;
    ref.timestamp = ts;
    ref.localMessageId = localId;
    return ref;
}

} // namespace

TEST_CASE("MediaPipeline derives identifiers", "[media][pipeline]") {
    PipelineFixture f;
    auto pipeline = f.open();

    auto voice = pipeline->identify(voiceRef("wxid alice", 1700000000, 42));
    CHECK(voice.kind == MediaKind::Voice);
    CHECK(voice.value == "1700000000_42_wxid_alice");

    auto hashed = pipeline->identify(imageRef(" ABCDEF "));
    CHECK(hashed.value == "abcdef");

    AttachmentReference named;
    named.kind = MediaKind::Sticker;
    named.fallbackName = "Foo_T.dat";
    CHECK(pipeline->identify(named).value == "foo");

    CHECK(pipeline->identify(AttachmentReference{}).empty());
    CHECK(pipeline->identify(voiceRef("", 1, 1)).empty());
}

TEST_CASE("MediaPipeline decrypts an XOR image", "[media][pipeline]") {
    PipelineFixture f;
    f.source("abc_t.dat", ts::tinyPng());
    auto pipeline = f.open();

    auto result = pipeline->resolve(imageRef("ABC")).get();
    REQUIRE(result);
    const auto& media = result.value();
    CHECK(media.path == f.cfg.outputRoot / "images" / "abc.png");
    CHECK(media.variant == AttachmentVariant::Thumbnail);
    CHECK_FALSE(media.degraded);
    CHECK(ts::readBytes(media.path) == ts::tinyPng());
    CHECK(pipeline->resolutionState(imageRef("abc")) == ResolutionState::Resolved);
}

TEST_CASE("MediaPipeline prefers the best variant", "[media][pipeline]") {
    PipelineFixture f;
    f.source("abc_t.dat", ts::tinyPng());
    f.source("abc.dat", ts::tinyPng());
    f.source("abc_b.dat", ts::tinyPng());
    auto pipeline = f.open();

    auto result = pipeline->resolve(imageRef("abc")).get();
    REQUIRE(result);
    CHECK(result.value().variant == AttachmentVariant::Big);
    CHECK_FALSE(result.value().degraded);
}

TEST_CASE("MediaPipeline falls back when a variant is corrupt", "[media][pipeline]") {
    PipelineFixture f;
    f.source("abc_b.dat", ts::brokenPng());
    f.source("abc.dat", ts::tinyPng());
    auto pipeline = f.open();

    auto result = pipeline->resolve(imageRef("abc")).get();
    REQUIRE(result);
    CHECK(result.value().variant == AttachmentVariant::Original);
    CHECK(result.value().degraded);
    CHECK(pipeline->validator().isBlacklisted(
        pipeline->cache().stagingPathFor(pipeline->identify(imageRef("abc")), AttachmentVariant::Big, ".part")));

    // No staging leftovers next to the committed output
    for (const auto& entry : std::filesystem::directory_iterator(f.cfg.outputRoot / "images")) {
        CHECK_FALSE(CacheIndex::isStagingFile(entry.path()));
    }
}

TEST_CASE("MediaPipeline reports exhausted variants as unresolvable", "[media][pipeline]") {
    PipelineFixture f;
    f.source("bad_b.dat", ts::brokenPng());
    f.source("bad_t.dat", ts::bytesOf("not an image at all"));
    auto pipeline = f.open();

    auto result = pipeline->resolve(imageRef("bad")).get();
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::Unresolvable);
    CHECK(pipeline->resolutionState(imageRef("bad")) == ResolutionState::Unresolvable);
}

TEST_CASE("MediaPipeline source and key failures", "[media][pipeline]") {
    PipelineFixture f;

    SECTION("no source blob") {
        auto pipeline = f.open();
        auto result = pipeline->resolve(imageRef("nothing")).get();
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::SourceMissing);
        CHECK(pipeline->resolutionState(imageRef("nothing")) == ResolutionState::Unresolvable);
    }

    SECTION("encrypted blob without keys") {
        f.cfg.xorKey.clear();
        f.source("enc.dat", ts::tinyPng());
        auto pipeline = f.open();
        auto result = pipeline->resolve(imageRef("enc")).get();
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::KeyMissing);
        CHECK(pipeline->resolutionState(imageRef("enc")) == ResolutionState::NeedsDecode);
    }

    SECTION("plain blob needs no keys") {
        f.cfg.xorKey.clear();
        ts::writeBytes(f.cfg.sourceRoot / "plain.dat", ts::tinyPng());
        auto pipeline = f.open();
        auto result = pipeline->resolve(imageRef("plain")).get();
        REQUIRE(result);
    }

    SECTION("AES-V2 container with only the XOR key") {
        auto blob = ts::encryptV4(ts::tinyPng(), ts::aesKeyFrom("0123456789abcdef"), XOR_KEY,
                                  crypto::V4_SIGNATURE_V2, 32, 8);
        ts::writeBytes(f.cfg.sourceRoot / "v2.dat", blob);
        auto pipeline = f.open();
        auto result = pipeline->resolve(imageRef("v2")).get();
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::Unresolvable);
    }

    SECTION("AES-V2 container with the AES key") {
        f.cfg.aesKey = "0123456789abcdef";
        auto blob = ts::encryptV4(ts::tinyPng(), ts::aesKeyFrom("0123456789abcdef"), XOR_KEY,
                                  crypto::V4_SIGNATURE_V2, 32, 8);
        ts::writeBytes(f.cfg.sourceRoot / "v2.dat", blob);
        auto pipeline = f.open();
        auto result = pipeline->resolve(imageRef("v2")).get();
        REQUIRE(result);
        CHECK(ts::readBytes(result.value().path) == ts::tinyPng());
    }
}

TEST_CASE("MediaPipeline resolves stickers into their own directory", "[media][pipeline]") {
    PipelineFixture f;
    ts::writeBytes(f.cfg.sourceRoot / "emoji" / "smile.png", ts::tinyPng());
    auto pipeline = f.open();

    AttachmentReference ref;
    ref.kind = MediaKind::Sticker;
    ref.contentHash = "smile";
    auto result = pipeline->resolve(ref).get();
    REQUIRE(result);
    CHECK(result.value().path == f.cfg.outputRoot / "emojis" / "smile.png");
}

TEST_CASE("MediaPipeline repeat resolves hit the cache", "[media][pipeline]") {
    PipelineFixture f;
    f.source("abc.dat", ts::tinyPng());
    auto pipeline = f.open();

    auto first = pipeline->resolve(imageRef("abc")).get();
    auto second = pipeline->resolve(imageRef("abc")).get();
    REQUIRE(first);
    REQUIRE(second);
    CHECK(first.value().path == second.value().path);
    CHECK(second.value().fromCache);
    CHECK(pipeline->stats().coordinator.executions == 1);
}

TEST_CASE("MediaPipeline reuses outputs from an earlier session", "[media][pipeline]") {
    PipelineFixture f;
    f.source("abc.dat", ts::tinyPng());
    {
        auto pipeline = f.open();
        REQUIRE(pipeline->resolve(imageRef("abc")).get());
    }

    auto pipeline = f.open();
    auto result = pipeline->resolve(imageRef("abc")).get();
    REQUIRE(result);
    CHECK(result.value().fromCache);
    CHECK(pipeline->stats().coordinator.executions == 0);
}

TEST_CASE("MediaPipeline batch deduplicates identifiers", "[media][pipeline]") {
    PipelineFixture f;
    std::vector<AttachmentReference> refs;
    for (int i = 0; i < 45; ++i) {
        f.source("img" + std::to_string(i) + ".dat", ts::tinyPng());
        refs.push_back(imageRef("img" + std::to_string(i)));
    }
    // Five pairs: references 45..49 repeat the first five identifiers
    for (int i = 0; i < 5; ++i) {
        refs.push_back(imageRef("IMG" + std::to_string(i)));
    }
    REQUIRE(refs.size() == 50);

    auto pipeline = f.open();
    std::mutex mutex;
    std::vector<std::size_t> dones;
    std::size_t reportedTotal = 0;
    auto items = pipeline
                     ->resolveBatch(refs, 3,
                                    [&](std::size_t done, std::size_t total, const std::string&) {
                                        std::lock_guard<std::mutex> lock(mutex);
                                        dones.push_back(done);
                                        reportedTotal = total;
                                    })
                     .get();

    REQUIRE(items.size() == 50);
    for (std::size_t i = 0; i < items.size(); ++i) {
        REQUIRE(items[i].result);
        CHECK(items[i].id == pipeline->identify(refs[i]));
    }
    for (std::size_t i = 0; i < 5; ++i) {
        CHECK(items[45 + i].result.value().path == items[i].result.value().path);
    }

    CHECK(pipeline->stats().coordinator.executions == 45);
    CHECK(reportedTotal == 45);
    CHECK(dones.size() == 45);
    CHECK(dones.back() == 45);
}

TEST_CASE("MediaPipeline batch keeps lanes busy past a slow item", "[media][pipeline][voice]") {
    PipelineFixture f;
    f.cfg.voice.decodeTimeout = 3s;
    ts::writeHangingDecoder(f.dir / "bin");
    ts::writeBytes(f.cfg.voiceRoot / "bob" / "5.silk", ts::bytesOf("payload"));

    std::vector<AttachmentReference> refs{voiceRef("bob", 5, 9)};
    for (int i = 0; i < 10; ++i) {
        f.source("fast" + std::to_string(i) + ".dat", ts::tinyPng());
        refs.push_back(imageRef("fast" + std::to_string(i)));
    }
    auto pipeline = f.open();

    using Clock = std::chrono::steady_clock;
    std::mutex mutex;
    std::vector<std::pair<std::string, Clock::duration>> finished;
    const auto start = Clock::now();
    auto items = pipeline
                     ->resolveBatch(refs, 2,
                                    [&](std::size_t, std::size_t, const std::string& label) {
                                        std::lock_guard<std::mutex> lock(mutex);
                                        finished.emplace_back(label, Clock::now() - start);
                                    })
                     .get();

    REQUIRE(items.size() == 11);
    REQUIRE_FALSE(items[0].result);
    CHECK(items[0].result.error().code == ErrorCode::Timeout);
    for (std::size_t i = 1; i < items.size(); ++i) {
        CHECK(items[i].result);
    }

    REQUIRE(finished.size() == 11);
    // Every image completes on the second lane while the voice note is still decoding
    CHECK(finished.back().first == std::string(errorToString(ErrorCode::Timeout)) + ":5_9_bob");
    for (std::size_t i = 0; i + 1 < finished.size(); ++i) {
        CHECK(finished[i].first.rfind("completed:fast", 0) == 0);
        CHECK(finished[i].second < 2500ms);
    }
}

TEST_CASE("MediaPipeline transcodes a voice message", "[media][pipeline][voice]") {
    PipelineFixture f;
    ts::writeThreeSecondDecoder(f.dir / "bin");
    ts::writeBytes(f.cfg.voiceRoot / "wxid_alice" / "1700000000.silk", ts::bytesOf("#!SILK_V3 payload"));
    auto pipeline = f.open();

    auto ref = voiceRef("wxid_alice", 1700000000, 7);
    auto result = pipeline->resolve(ref).get();
    REQUIRE(result);
    CHECK(result.value().path == f.cfg.outputRoot / "voices" / "1700000000_7_wxid_alice.mp3");
    CHECK_FALSE(result.value().variant.has_value());

    auto duration = pipeline->validator().readAudioDuration(result.value().path);
    REQUIRE(duration);
    CHECK(duration.value() >= 2800ms);
    CHECK(duration.value() <= 3200ms);

    auto reported = pipeline->voiceDuration(ref);
    REQUIRE(reported);
    CHECK(reported.value() >= 2800ms);
    CHECK(reported.value() <= 3200ms);

    CHECK(pipeline->resolutionState(ref) == ResolutionState::Resolved);
}

TEST_CASE("MediaPipeline voice failures surface their stage error", "[media][pipeline][voice]") {
    PipelineFixture f;

    SECTION("missing blob") {
        ts::writeThreeSecondDecoder(f.dir / "bin");
        auto pipeline = f.open();
        auto result = pipeline->resolve(voiceRef("nobody", 1, 1)).get();
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::SourceMissing);
    }

    SECTION("decoder exceeds its time limit") {
        f.cfg.voice.decodeTimeout = 300ms;
        ts::writeHangingDecoder(f.dir / "bin");
        ts::writeBytes(f.cfg.voiceRoot / "bob" / "5.silk", ts::bytesOf("payload"));
        auto pipeline = f.open();

        const auto start = std::chrono::steady_clock::now();
        auto result = pipeline->resolve(voiceRef("bob", 5, 9)).get();
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::Timeout);
        CHECK(std::chrono::steady_clock::now() - start < 4s);

        CHECK_FALSE(std::filesystem::exists(f.cfg.outputRoot / "voices" / "5_9_bob.mp3"));
        std::error_code ec;
        for (const auto& entry : std::filesystem::directory_iterator(f.cfg.tempDir, ec)) {
            FAIL("leftover temp file " << entry.path());
        }
        CHECK(pipeline->resolutionState(voiceRef("bob", 5, 9)) == ResolutionState::NeedsDecode);
    }
}
