#pragma once

#include <chatmedia/core/types.h>
#include <chatmedia/media/cache_index.h>
#include <chatmedia/media/media_types.h>
#include <chatmedia/media/media_validator.h>
#include <chatmedia/media/task_context.h>
#include <chatmedia/media/worker_pool.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace chatmedia::media {

using ResolveResult = Result<ResolvedMedia>;
using ResolveFuture = std::shared_future<ResolveResult>;
using ResolveWork = std::function<ResolveResult(const TaskContext&)>;

struct CoordinatorStats {
    uint64_t executions = 0;
    uint64_t cacheHits = 0;
    uint64_t dedupJoins = 0;
    uint64_t failures = 0;
    uint64_t timeouts = 0;
    std::size_t inFlight = 0;
    std::size_t draining = 0; ///< Timed out but still running on a worker
    std::size_t poolSize = 0;
};

/**
 * @brief Runs at most one resolution per identifier on a bounded pool
 *
 * A cached, still-valid output short-circuits with a ready future. Concurrent callers
 * for an identifier that is already running share its future. Every admitted task has
 * a wall-clock deadline enforced by a watchdog timer; on expiry the future resolves to
 * Timeout and the task's cancel flag is raised. Nothing is retried automatically.
 *
 * A timed-out task stays registered until its work returns. A new request for that
 * identifier is queued behind it and posted only once the abandoned work has drained,
 * so two executions for one identifier never overlap.
 */
class ConcurrencyCoordinator {
public:
    struct Options {
        std::size_t workers = 0; ///< 0 derives the size from hardware_concurrency
    };

    /// max(2, min(6, hw / 2))
    [[nodiscard]] static std::size_t defaultPoolSize(unsigned hardwareThreads);
    [[nodiscard]] static std::size_t defaultPoolSize();

    ConcurrencyCoordinator(CacheIndex& cache, MediaValidator& validator, Options options);
    ~ConcurrencyCoordinator();

    ConcurrencyCoordinator(const ConcurrencyCoordinator&) = delete;
    ConcurrencyCoordinator& operator=(const ConcurrencyCoordinator&) = delete;

    /**
     * @brief Resolve `id`, running `work` at most once at a time for it
     * @param timeout Deadline for the whole task, measured from the moment it is posted
     */
    ResolveFuture resolve(const ContentIdentifier& id, ResolveWork work,
                          std::chrono::milliseconds timeout, ProgressCallback progress = {});

    /// Cache lookup with re-validation; a stale entry is invalidated and blacklisted
    std::optional<ResolvedMedia> cachedResult(const ContentIdentifier& id);

    /// True while a task for `id` is registered, including one draining after a timeout
    [[nodiscard]] bool inFlight(const ContentIdentifier& id) const;

    /// State of the registered task for `id`, if any
    [[nodiscard]] std::optional<TaskState> taskState(const ContentIdentifier& id) const;

    [[nodiscard]] CoordinatorStats stats() const;

    [[nodiscard]] std::size_t poolSize() const noexcept { return poolSize_; }

    /// Stop workers and the watchdog; every outstanding task resolves to OperationCancelled
    void shutdown();

private:
    struct Task;

    std::shared_ptr<Task> makeTask(const ContentIdentifier& id, ResolveWork work,
                                   std::chrono::milliseconds timeout, ProgressCallback progress);
    void start(const std::shared_ptr<Task>& task);
    void runTask(const std::shared_ptr<Task>& task);
    void complete(const std::shared_ptr<Task>& task, ResolveResult result);
    void armWatchdog(const std::shared_ptr<Task>& task);

    CacheIndex& cache_;
    MediaValidator& validator_;
    std::size_t poolSize_;

    mutable std::mutex mutex_;
    std::unordered_map<ContentIdentifier, std::shared_ptr<Task>> inflight_;
    bool stopped_ = false;

    std::atomic<uint64_t> executions_{0};
    std::atomic<uint64_t> cacheHits_{0};
    std::atomic<uint64_t> dedupJoins_{0};
    std::atomic<uint64_t> failures_{0};
    std::atomic<uint64_t> timeouts_{0};

    boost::asio::io_context watchdogIo_;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::unique_ptr<WorkGuard> watchdogGuard_;
    std::jthread watchdogThread_;

    // Declared last so workers stop before the state they touch goes away
    std::unique_ptr<WorkerPool> pool_;
};

} // namespace chatmedia::media
