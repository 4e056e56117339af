#include <catch2/catch_test_macros.hpp>

#include <chatmedia/core/file_utils.h>
#include <chatmedia/media/concurrency_coordinator.h>
#include "support/media_fixtures.hpp"
#include "support/temp_dir_scope.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace chatmedia;
using namespace chatmedia::media;
using namespace std::chrono_literals;
namespace ts = chatmedia::test_support;

namespace {

struct CoordinatorFixture {
    ts::TempDirScope dir = ts::TempDirScope::unique_under("chatmedia_coord");
    CacheIndex cache{dir.path()};
    MediaValidator validator;
    std::atomic<int> calls{0};
    // Last so its workers stop before the members they touch
    ConcurrencyCoordinator coordinator{cache, validator, ConcurrencyCoordinator::Options{4}};

    // Writes a valid PNG for `img` after an optional delay
    ResolveWork pngWork(std::chrono::milliseconds delay = 0ms) {
        return pngWorkFor(ContentIdentifier{MediaKind::Image, "img"}, delay);
    }

    ResolveWork pngWorkFor(ContentIdentifier id, std::chrono::milliseconds delay = 0ms) {
        return [this, id, delay](const TaskContext& ctx) -> ResolveResult {
            calls.fetch_add(1);
            std::this_thread::sleep_for(delay);
            if (ctx.shouldStop())
                return Error{ErrorCode::Timeout, "stopped"};
            auto path = cache.outputPathFor(id, ".png");
            if (auto w = writeFile(path, ts::tinyPng()); !w)
                return w.error();
            ResolvedMedia media;
            media.id = id;
            media.path = path;
            return media;
        };
    }
};

const ContentIdentifier IMG{MediaKind::Image, "img"};

} // namespace

TEST_CASE("ConcurrencyCoordinator pool size follows hardware", "[media][coordinator]") {
    CHECK(ConcurrencyCoordinator::defaultPoolSize(0) == 2);
    CHECK(ConcurrencyCoordinator::defaultPoolSize(2) == 2);
    CHECK(ConcurrencyCoordinator::defaultPoolSize(8) == 4);
    CHECK(ConcurrencyCoordinator::defaultPoolSize(12) == 6);
    CHECK(ConcurrencyCoordinator::defaultPoolSize(64) == 6);
}

TEST_CASE("ConcurrencyCoordinator sequential resolves are idempotent", "[media][coordinator]") {
    CoordinatorFixture f;

    auto first = f.coordinator.resolve(IMG, f.pngWork(), 10s).get();
    REQUIRE(first);
    CHECK_FALSE(first.value().fromCache);

    auto second = f.coordinator.resolve(IMG, f.pngWork(), 10s).get();
    REQUIRE(second);
    CHECK(second.value().fromCache);
    CHECK(second.value().path == first.value().path);

    CHECK(f.calls.load() == 1);
    const auto stats = f.coordinator.stats();
    CHECK(stats.executions == 1);
    CHECK(stats.cacheHits == 1);
    CHECK(stats.inFlight == 0);
}

TEST_CASE("ConcurrencyCoordinator runs one task per identifier", "[media][coordinator]") {
    CoordinatorFixture f;
    constexpr int callers = 16;

    std::vector<ResolveFuture> futures(callers);
    std::vector<std::thread> threads;
    for (int i = 0; i < callers; ++i) {
        threads.emplace_back([&, i] { futures[i] = f.coordinator.resolve(IMG, f.pngWork(200ms), 10s); });
    }
    for (auto& t : threads)
        t.join();

    std::filesystem::path expected;
    for (auto& fut : futures) {
        auto result = fut.get();
        REQUIRE(result);
        if (expected.empty())
            expected = result.value().path;
        CHECK(result.value().path == expected);
    }
    CHECK(f.calls.load() == 1);
    CHECK(f.coordinator.stats().executions == 1);
}

TEST_CASE("ConcurrencyCoordinator enforces the task deadline", "[media][coordinator]") {
    CoordinatorFixture f;
    std::atomic<bool> sawCancel{false};

    auto work = [&](const TaskContext& ctx) -> ResolveResult {
        while (!ctx.cancelled()) {
            std::this_thread::sleep_for(10ms);
        }
        sawCancel = true;
        return Error{ErrorCode::Timeout, "gave up"};
    };

    const auto start = std::chrono::steady_clock::now();
    auto future = f.coordinator.resolve(IMG, work, 200ms);
    auto result = future.get();
    const auto elapsed = std::chrono::steady_clock::now() - start;

    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::Timeout);
    CHECK(elapsed < 2s);

    // The running work observes the cancel flag shortly after, then the entry goes away
    for (int i = 0; i < 100 && f.coordinator.inFlight(IMG); ++i)
        std::this_thread::sleep_for(10ms);
    CHECK(sawCancel.load());
    CHECK_FALSE(f.coordinator.inFlight(IMG));
    CHECK(f.coordinator.stats().timeouts == 1);
    CHECK(f.coordinator.stats().draining == 0);
}

TEST_CASE("ConcurrencyCoordinator retries right after a timeout run fresh work", "[media][coordinator]") {
    CoordinatorFixture f;
    auto stubborn = [](const TaskContext& ctx) -> ResolveResult {
        while (!ctx.cancelled())
            std::this_thread::sleep_for(1ms);
        return Error{ErrorCode::Timeout, "cancelled"};
    };

    for (int round = 0; round < 20; ++round) {
        const ContentIdentifier id{MediaKind::Image, "retry" + std::to_string(round)};
        auto first = f.coordinator.resolve(id, stubborn, 20ms).get();
        REQUIRE_FALSE(first);
        REQUIRE(first.error().code == ErrorCode::Timeout);

        auto second = f.coordinator.resolve(id, f.pngWorkFor(id), 5s).get();
        REQUIRE(second);
        CHECK_FALSE(second.value().fromCache);
    }
    CHECK(f.calls.load() == 20);
    CHECK(f.coordinator.stats().dedupJoins == 0);
}

TEST_CASE("ConcurrencyCoordinator never overlaps runs for one identifier", "[media][coordinator]") {
    CoordinatorFixture f;
    std::atomic<int> running{0};
    std::atomic<int> maxRunning{0};
    std::atomic<int> started{0};

    // Ignores cancellation, as a blocking decode would
    auto work = [&](const TaskContext&) -> ResolveResult {
        started.fetch_add(1);
        const int now = running.fetch_add(1) + 1;
        int seen = maxRunning.load();
        while (now > seen && !maxRunning.compare_exchange_weak(seen, now)) {
        }
        std::this_thread::sleep_for(600ms);
        running.fetch_sub(1);
        auto path = f.cache.outputPathFor(IMG, ".png");
        if (auto w = writeFile(path, ts::tinyPng()); !w)
            return w.error();
        ResolvedMedia media;
        media.id = IMG;
        media.path = path;
        return media;
    };

    auto first = f.coordinator.resolve(IMG, work, 100ms).get();
    REQUIRE_FALSE(first);
    CHECK(first.error().code == ErrorCode::Timeout);
    CHECK(f.coordinator.taskState(IMG) == TaskState::TimedOut);
    CHECK(f.coordinator.stats().draining == 1);

    // Queued behind the draining run, and joined by a second caller
    auto second = f.coordinator.resolve(IMG, work, 5s);
    auto joined = f.coordinator.resolve(IMG, work, 5s);
    auto result = second.get();
    REQUIRE(result);
    CHECK(joined.get());

    CHECK(maxRunning.load() == 1);
    CHECK(started.load() <= 2);
    CHECK_FALSE(f.coordinator.inFlight(IMG));
}

TEST_CASE("ConcurrencyCoordinator does not cache failures", "[media][coordinator]") {
    CoordinatorFixture f;
    auto failing = [&](const TaskContext&) -> ResolveResult {
        f.calls.fetch_add(1);
        return Error{ErrorCode::Unresolvable, "nothing worked"};
    };

    auto a = f.coordinator.resolve(IMG, failing, 5s).get();
    REQUIRE_FALSE(a);
    CHECK(a.error().code == ErrorCode::Unresolvable);

    auto b = f.coordinator.resolve(IMG, failing, 5s).get();
    REQUIRE_FALSE(b);
    CHECK(f.calls.load() == 2);
    CHECK(f.coordinator.stats().failures == 2);
}

TEST_CASE("ConcurrencyCoordinator converts thrown exceptions", "[media][coordinator]") {
    CoordinatorFixture f;
    auto throwing = [](const TaskContext&) -> ResolveResult { throw std::runtime_error("boom"); };

    auto result = f.coordinator.resolve(IMG, throwing, 5s).get();
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::InternalError);
    CHECK(result.error().message == "boom");
}

TEST_CASE("ConcurrencyCoordinator drops stale cache entries", "[media][coordinator]") {
    CoordinatorFixture f;
    auto stale = ts::writeBytes(f.dir / "images" / "img.png", ts::brokenPng());
    REQUIRE(f.cache.ensureBuilt());
    REQUIRE(f.cache.lookup(IMG));

    auto fresh = [&](const TaskContext&) -> ResolveResult {
        f.calls.fetch_add(1);
        auto path = f.dir / "images" / "img_fresh.png";
        if (auto w = writeFile(path, ts::tinyPng()); !w)
            return w.error();
        ResolvedMedia media;
        media.id = IMG;
        media.path = path;
        return media;
    };

    auto result = f.coordinator.resolve(IMG, fresh, 5s).get();
    REQUIRE(result);
    CHECK_FALSE(result.value().fromCache);
    CHECK(result.value().path.filename() == "img_fresh.png");
    CHECK(f.calls.load() == 1);
    CHECK(f.validator.isBlacklisted(stale));
}

TEST_CASE("ConcurrencyCoordinator rejects empty identifiers", "[media][coordinator]") {
    CoordinatorFixture f;
    auto result = f.coordinator.resolve(ContentIdentifier{}, f.pngWork(), 1s).get();
    REQUIRE_FALSE(result);
    CHECK(result.error().code == ErrorCode::InvalidArgument);
    CHECK(f.calls.load() == 0);
}

TEST_CASE("ConcurrencyCoordinator shutdown cancels outstanding work", "[media][coordinator]") {
    CoordinatorFixture f;
    auto slow = [](const TaskContext& ctx) -> ResolveResult {
        while (!ctx.cancelled())
            std::this_thread::sleep_for(5ms);
        return Error{ErrorCode::Timeout, "cancelled"};
    };

    std::vector<ResolveFuture> futures;
    for (int i = 0; i < 8; ++i) {
        futures.push_back(
            f.coordinator.resolve(ContentIdentifier{MediaKind::Image, "id" + std::to_string(i)}, slow, 60s));
    }
    f.coordinator.shutdown();

    for (auto& fut : futures) {
        REQUIRE(fut.wait_for(5s) == std::future_status::ready);
        auto result = fut.get();
        REQUIRE_FALSE(result);
        CHECK(result.error().code == ErrorCode::OperationCancelled);
    }

    auto late = f.coordinator.resolve(IMG, f.pngWork(), 1s).get();
    REQUIRE_FALSE(late);
    CHECK(late.error().code == ErrorCode::OperationCancelled);
}
