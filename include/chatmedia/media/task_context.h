#pragma once

#include <chatmedia/media/progress.h>

#include <atomic>
#include <chrono>
#include <memory>

namespace chatmedia::media {

/**
 * @brief Per-task deadline, cancellation flag and progress channel
 *
 * Copies share the cancel flag, so the watchdog can stop work it handed to a worker.
 */
class TaskContext {
public:
    using Clock = std::chrono::steady_clock;

    TaskContext() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}
    explicit TaskContext(Clock::duration budget, ProgressCallback progress = {})
        : deadline_(Clock::now() + budget), cancelled_(std::make_shared<std::atomic<bool>>(false)),
          progress_(std::move(progress)) {}

    void cancel() const noexcept { cancelled_->store(true, std::memory_order_release); }

    bool cancelled() const noexcept { return cancelled_->load(std::memory_order_acquire); }

    bool expired() const noexcept { return Clock::now() >= deadline_; }

    /// True when work should stop: cancelled by the watchdog or past its deadline
    bool shouldStop() const noexcept { return cancelled() || expired(); }

    std::chrono::milliseconds remaining() const noexcept {
        auto left = deadline_ - Clock::now();
        if (left <= Clock::duration::zero())
            return std::chrono::milliseconds{0};
        return std::chrono::duration_cast<std::chrono::milliseconds>(left);
    }

    void report(ProgressStage stage, uint64_t current = 0, uint64_t total = 0,
                std::string detail = {}) const {
        if (progress_) {
            progress_(PipelineProgress{stage, current, total, std::move(detail)});
        }
    }

private:
    Clock::time_point deadline_ = Clock::time_point::max();
    std::shared_ptr<std::atomic<bool>> cancelled_;
    ProgressCallback progress_;
};

} // namespace chatmedia::media
