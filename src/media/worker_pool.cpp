#include <chatmedia/media/worker_pool.h>

#include <spdlog/spdlog.h>
#include <chrono>
#include <system_error>

namespace chatmedia::media {

WorkerPool::WorkerPool(std::size_t threads) : io_(static_cast<int>(threads == 0 ? 1 : threads)) {
    if (threads == 0)
        threads = 1;
    guard_ = std::make_unique<WorkGuard>(boost::asio::make_work_guard(io_));
    threads_.reserve(threads);
    for (std::size_t i = 0; i < threads; ++i) {
        threads_.emplace_back([this](std::stop_token st) { run_thread(st); });
    }
    spdlog::debug("WorkerPool started with {} threads", threads_.size());
}

WorkerPool::~WorkerPool() {
    stop();
}

void WorkerPool::stop() {
    // Order is critical: first reset guard, then stop io_context
    if (guard_) {
        guard_->reset();
        guard_.reset();
    }
    if (!io_.stopped()) {
        io_.stop();
    }

    for (auto& t : threads_) {
        if (t.joinable())
            t.request_stop();
    }
    for (std::size_t i = 0; i < threads_.size(); ++i) {
        auto& t = threads_[i];
        if (t.joinable()) {
            try {
                t.join();
            } catch (const std::system_error& e) {
                spdlog::warn("WorkerPool::stop() thread {} join failed: {}", i, e.what());
            }
        }
    }
    if (!threads_.empty()) {
        spdlog::debug("WorkerPool: {} threads joined", threads_.size());
    }
    threads_.clear();
}

void WorkerPool::run_thread(std::stop_token st) {
    using namespace std::chrono_literals;
    try {
        while (!st.stop_requested() && !io_.stopped()) {
            // Bounded wait so a stop request is noticed even when idle
            io_.run_for(100ms);
        }
    } catch (const std::exception& e) {
        spdlog::warn("WorkerPool thread exited: {}", e.what());
    }
}

} // namespace chatmedia::media
