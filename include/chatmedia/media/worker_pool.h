#pragma once

#include <memory>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/post.hpp>

namespace chatmedia::media {

// Fixed-size pool of std::jthread workers driving one io_context.
class WorkerPool {
public:
    explicit WorkerPool(std::size_t threads = 1);
    ~WorkerPool();

    WorkerPool(const WorkerPool&) = delete;
    WorkerPool& operator=(const WorkerPool&) = delete;

    // False once stop() has run; the handler is not queued
    template <typename F> bool post(F&& fn) {
        if (io_.stopped())
            return false;
        boost::asio::post(io_, std::forward<F>(fn));
        return true;
    }

    // Drains nothing: handlers still queued are dropped
    void stop();

private:
    void run_thread(std::stop_token st);

    boost::asio::io_context io_;
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;
    std::unique_ptr<WorkGuard> guard_;
    std::vector<std::jthread> threads_;
};

} // namespace chatmedia::media
