#include <spdlog/spdlog.h>
#include <chatmedia/media/concurrency_coordinator.h>

#include <algorithm>
#include <vector>
#include <boost/asio/post.hpp>
#include <boost/asio/steady_timer.hpp>

namespace chatmedia::media {

namespace {

ResolveFuture readyFuture(ResolveResult result) {
    std::promise<ResolveResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future().share();
}

} // namespace

struct ConcurrencyCoordinator::Task {
    ContentIdentifier id;
    ResolveWork work;
    std::chrono::milliseconds timeout{0};
    ProgressCallback progress;
    TaskContext ctx;
    std::promise<ResolveResult> promise;
    ResolveFuture future;
    std::atomic<bool> settled{false};
    std::atomic<TaskState> state{TaskState::Pending};
    std::shared_ptr<boost::asio::steady_timer> timer;
    // Request that arrived while this task was draining; guarded by the coordinator mutex
    std::shared_ptr<Task> successor;

    // Fulfil the future once; later callers lose
    bool settle(ResolveResult result) {
        if (settled.exchange(true, std::memory_order_acq_rel))
            return false;
        promise.set_value(std::move(result));
        return true;
    }
};

std::size_t ConcurrencyCoordinator::defaultPoolSize(unsigned hardwareThreads) {
    return std::max<std::size_t>(2, std::min<std::size_t>(6, hardwareThreads / 2));
}

std::size_t ConcurrencyCoordinator::defaultPoolSize() {
    return defaultPoolSize(std::thread::hardware_concurrency());
}

ConcurrencyCoordinator::ConcurrencyCoordinator(CacheIndex& cache, MediaValidator& validator,
                                               Options options)
    : cache_(cache), validator_(validator),
      poolSize_(options.workers > 0 ? options.workers : defaultPoolSize()) {
    watchdogGuard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(watchdogIo_));
    watchdogThread_ = std::jthread([this] {
        try {
            watchdogIo_.run();
        } catch (const std::exception& e) {
            spdlog::error("ConcurrencyCoordinator: watchdog thread exited: {}", e.what());
        }
    });
    pool_ = std::make_unique<WorkerPool>(poolSize_);
    spdlog::debug("ConcurrencyCoordinator: pool of {} workers", poolSize_);
}

ConcurrencyCoordinator::~ConcurrencyCoordinator() {
    shutdown();
}

void ConcurrencyCoordinator::shutdown() {
    std::vector<std::shared_ptr<Task>> pending;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_)
            return;
        stopped_ = true;
        for (auto& [id, task] : inflight_) {
            pending.push_back(task);
            if (task->successor) {
                pending.push_back(std::move(task->successor));
            }
        }
        inflight_.clear();
    }

    // Settle before joining so running work cannot report its own cancellation first
    for (auto& task : pending) {
        if (task->settle(Error{ErrorCode::OperationCancelled, "Pipeline shut down"})) {
            task->state.store(TaskState::Failed, std::memory_order_release);
        }
        task->ctx.cancel();
    }
    if (pool_) {
        pool_->stop();
    }

    if (watchdogGuard_) {
        watchdogGuard_->reset();
        watchdogGuard_.reset();
    }
    watchdogIo_.stop();
    if (watchdogThread_.joinable()) {
        watchdogThread_.join();
    }
}

std::optional<ResolvedMedia> ConcurrencyCoordinator::cachedResult(const ContentIdentifier& id) {
    auto entry = cache_.lookup(id);
    if (!entry)
        return std::nullopt;

    std::error_code ec;
    bool usable = std::filesystem::is_regular_file(entry->resolvedPath, ec);
    // Entries recorded this session were validated at commit time
    if (usable && !entry->validated) {
        usable = validator_.validate(entry->resolvedPath, entry->kind);
        if (usable) {
            entry->validated = true;
            cache_.invalidate(id);
            cache_.record(*entry);
        }
    }
    if (!usable) {
        spdlog::info("CacheIndex: dropping stale entry {} -> {}", id.toString(),
                     entry->resolvedPath.string());
        cache_.invalidate(id);
        validator_.blacklist(entry->resolvedPath);
        return std::nullopt;
    }

    ResolvedMedia media;
    media.id = id;
    media.kind = entry->kind;
    media.path = entry->resolvedPath;
    media.fromCache = true;
    return media;
}

bool ConcurrencyCoordinator::inFlight(const ContentIdentifier& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return inflight_.contains(id);
}

std::optional<TaskState> ConcurrencyCoordinator::taskState(const ContentIdentifier& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = inflight_.find(id);
    if (it == inflight_.end())
        return std::nullopt;
    return it->second->state.load(std::memory_order_acquire);
}

std::shared_ptr<ConcurrencyCoordinator::Task>
ConcurrencyCoordinator::makeTask(const ContentIdentifier& id, ResolveWork work,
                                 std::chrono::milliseconds timeout, ProgressCallback progress) {
    auto task = std::make_shared<Task>();
    task->id = id;
    task->work = std::move(work);
    task->timeout = timeout;
    task->progress = std::move(progress);
    task->future = task->promise.get_future().share();
    return task;
}

ResolveFuture ConcurrencyCoordinator::resolve(const ContentIdentifier& id, ResolveWork work,
                                              std::chrono::milliseconds timeout,
                                              ProgressCallback progress) {
    if (id.empty()) {
        return readyFuture(Error{ErrorCode::InvalidArgument, "Empty content identifier"});
    }

    if (cache_.built()) {
        if (auto hit = cachedResult(id)) {
            cacheHits_.fetch_add(1, std::memory_order_relaxed);
            return readyFuture(std::move(*hit));
        }
    }

    std::shared_ptr<Task> task;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return readyFuture(Error{ErrorCode::OperationCancelled, "Pipeline shut down"});
        }
        if (auto it = inflight_.find(id); it != inflight_.end()) {
            auto& current = it->second;
            if (!current->settled.load(std::memory_order_acquire)) {
                dedupJoins_.fetch_add(1, std::memory_order_relaxed);
                spdlog::debug("ConcurrencyCoordinator: joining in-flight task for {}", id.toString());
                return current->future;
            }
            if (current->successor) {
                dedupJoins_.fetch_add(1, std::memory_order_relaxed);
                return current->successor->future;
            }
            // Timed out but its work has not returned yet; run after it drains
            current->successor = makeTask(id, std::move(work), timeout, std::move(progress));
            spdlog::debug("ConcurrencyCoordinator: {} queued behind a draining task", id.toString());
            return current->successor->future;
        }

        task = makeTask(id, std::move(work), timeout, std::move(progress));
        task->ctx = TaskContext(timeout, std::move(task->progress));
        inflight_.emplace(id, task);
    }

    start(task);
    return task->future;
}

void ConcurrencyCoordinator::start(const std::shared_ptr<Task>& task) {
    armWatchdog(task);
    if (!pool_->post([this, task] { runTask(task); })) {
        complete(task, Error{ErrorCode::OperationCancelled, "Worker pool stopped"});
    }
}

void ConcurrencyCoordinator::armWatchdog(const std::shared_ptr<Task>& task) {
    task->timer = std::make_shared<boost::asio::steady_timer>(watchdogIo_, task->timeout);
    std::weak_ptr<Task> weak = task;
    task->timer->async_wait([this, weak](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted)
            return;
        auto task = weak.lock();
        if (!task)
            return;
        {
            // Settled under the lock so a caller woken by this Timeout sees a draining entry
            std::lock_guard<std::mutex> lock(mutex_);
            if (!task->settle(
                    Error{ErrorCode::Timeout, "Task for " + task->id.toString() + " timed out"}))
                return;
            task->state.store(TaskState::TimedOut, std::memory_order_release);
        }
        timeouts_.fetch_add(1, std::memory_order_relaxed);
        spdlog::warn("ConcurrencyCoordinator: {} exceeded its deadline", task->id.toString());
        task->ctx.cancel();
    });
}

void ConcurrencyCoordinator::runTask(const std::shared_ptr<Task>& task) {
    if (task->settled.load(std::memory_order_acquire)) {
        // Timed out or cancelled while queued
        complete(task, Error{ErrorCode::Timeout, "Task expired before it ran"});
        return;
    }
    task->state.store(TaskState::Running, std::memory_order_release);

    if (auto built = cache_.ensureBuilt(); !built) {
        spdlog::warn("ConcurrencyCoordinator: cache index unavailable: {}", built.error().message);
    } else if (auto hit = cachedResult(task->id)) {
        // Another task committed this id between admission and now
        cacheHits_.fetch_add(1, std::memory_order_relaxed);
        complete(task, std::move(*hit));
        return;
    }

    executions_.fetch_add(1, std::memory_order_relaxed);
    ResolveResult result = Error{ErrorCode::InternalError, "Work did not run"};
    try {
        result = task->work(task->ctx);
    } catch (const std::exception& e) {
        spdlog::error("ConcurrencyCoordinator: work for {} threw: {}", task->id.toString(), e.what());
        result = Error{ErrorCode::InternalError, e.what()};
    }

    if (!result && !task->settled.load(std::memory_order_acquire)) {
        if (result.error().code == ErrorCode::Timeout) {
            timeouts_.fetch_add(1, std::memory_order_relaxed);
        } else {
            failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    complete(task, std::move(result));
}

void ConcurrencyCoordinator::complete(const std::shared_ptr<Task>& task, ResolveResult result) {
    const bool ok = result.has_value();
    const bool timedOut = !ok && result.error().code == ErrorCode::Timeout;
    std::shared_ptr<Task> next;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const bool live = !task->settled.load(std::memory_order_acquire);
        if (live && ok) {
            const auto& media = result.value();
            if (!media.fromCache) {
                cache_.record(CacheEntry{task->id, media.kind, media.path, true});
            }
        }
        if (task->settle(std::move(result))) {
            task->state.store(ok ? TaskState::Succeeded
                                 : (timedOut ? TaskState::TimedOut : TaskState::Failed),
                              std::memory_order_release);
        }
        auto it = inflight_.find(task->id);
        if (it != inflight_.end() && it->second == task) {
            next = std::move(task->successor);
            if (next && !stopped_) {
                // The deadline of a queued follow-up starts when it is posted
                next->ctx = TaskContext(next->timeout, std::move(next->progress));
                it->second = next;
            } else {
                next.reset();
                inflight_.erase(it);
            }
        }
    }
    spdlog::debug("ConcurrencyCoordinator: {} finished as {}", task->id.toString(),
                  taskStateName(task->state.load(std::memory_order_acquire)));

    if (auto timer = task->timer) {
        boost::asio::post(watchdogIo_, [timer] { timer->cancel(); });
    }
    if (next) {
        start(next);
    }
}

CoordinatorStats ConcurrencyCoordinator::stats() const {
    CoordinatorStats s;
    s.executions = executions_.load(std::memory_order_relaxed);
    s.cacheHits = cacheHits_.load(std::memory_order_relaxed);
    s.dedupJoins = dedupJoins_.load(std::memory_order_relaxed);
    s.failures = failures_.load(std::memory_order_relaxed);
    s.timeouts = timeouts_.load(std::memory_order_relaxed);
    s.poolSize = poolSize_;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        s.inFlight = inflight_.size();
        for (const auto& [id, task] : inflight_) {
            if (task->settled.load(std::memory_order_acquire))
                ++s.draining;
        }
    }
    return s;
}

} // namespace chatmedia::media
