#include <chatmedia/audio/decoder_process.h>

#include <spdlog/spdlog.h>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <stdexcept>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

namespace chatmedia::audio {

namespace {

constexpr std::size_t MAX_CAPTURED_OUTPUT = 64 * 1024;

} // namespace

class DecoderProcess::Impl {
public:
    explicit Impl(DecoderProcessConfig config);
    ~Impl();

    Impl(const Impl&) = delete;
    Impl& operator=(const Impl&) = delete;

    [[nodiscard]] ProcessState state() const noexcept {
        return state_.load(std::memory_order_acquire);
    }
    [[nodiscard]] bool is_alive() const noexcept;
    void terminate(std::chrono::milliseconds grace);
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);
    [[nodiscard]] std::optional<int> exit_code() const noexcept { return exit_code_; }
    [[nodiscard]] std::string output() const;
    [[nodiscard]] int64_t pid() const noexcept { return static_cast<int64_t>(process_id_); }
    [[nodiscard]] std::chrono::milliseconds uptime() const noexcept {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time_);
    }

private:
    void spawn_process();
    void drain_output();
    bool reap(bool block);

    DecoderProcessConfig config_;
    std::atomic<ProcessState> state_{ProcessState::Unstarted};
    std::chrono::steady_clock::time_point start_time_;
    std::optional<int> exit_code_;

    mutable std::mutex output_mutex_;
    std::string output_;

    pid_t process_id_{-1};
    int output_fd_{-1};
};

DecoderProcess::Impl::Impl(DecoderProcessConfig config) : config_{std::move(config)} {
    spdlog::debug("DecoderProcess: spawning {}", config_.executable.string());

    // A decoder dying mid-write must not take the host process down
    signal(SIGPIPE, SIG_IGN);

    start_time_ = std::chrono::steady_clock::now();
    try {
        spawn_process();
        state_.store(ProcessState::Running, std::memory_order_release);
    } catch (...) {
        state_.store(ProcessState::Failed, std::memory_order_release);
        throw;
    }
}

DecoderProcess::Impl::~Impl() {
    if (is_alive()) {
        terminate(std::chrono::seconds{2});
    }
    if (output_fd_ >= 0) {
        close(output_fd_);
        output_fd_ = -1;
    }
}

void DecoderProcess::Impl::spawn_process() {
    // Everything the child needs is prepared before fork; only async-signal-safe
    // calls happen between fork and exec.
    std::string exe_str = config_.executable.string();
    std::vector<char*> argv;
    argv.reserve(config_.args.size() + 2);
    argv.push_back(exe_str.data());
    for (auto& arg : config_.args) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);
    std::string workdir = config_.workdir ? config_.workdir->string() : std::string{};

    int out_pipe[2] = {-1, -1};
    if (config_.capture_output) {
        if (pipe2(out_pipe, O_CLOEXEC) < 0) {
            throw std::runtime_error("Failed to create pipe: " + std::string(strerror(errno)));
        }
        fcntl(out_pipe[0], F_SETFL, O_NONBLOCK);
    }

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        if (out_pipe[0] >= 0) {
            close(out_pipe[0]);
            close(out_pipe[1]);
        }
        throw std::runtime_error("fork() failed: " + std::string(strerror(err)));
    }

    if (pid == 0) {
        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
        }
        if (out_pipe[1] >= 0) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(out_pipe[1], STDERR_FILENO);
        } else if (devnull >= 0) {
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
        }
        if (!workdir.empty() && chdir(workdir.c_str()) < 0) {
            _exit(127);
        }
        execvp(argv[0], argv.data());
        _exit(127);
    }

    process_id_ = pid;
    if (out_pipe[1] >= 0) {
        close(out_pipe[1]);
    }
    output_fd_ = out_pipe[0];

    spdlog::debug("DecoderProcess: spawned {} (pid={})", exe_str, process_id_);
}

void DecoderProcess::Impl::drain_output() {
    if (output_fd_ < 0)
        return;
    std::array<char, 4096> buffer;
    for (;;) {
        ssize_t n = read(output_fd_, buffer.data(), buffer.size());
        if (n > 0) {
            std::lock_guard lock{output_mutex_};
            if (output_.size() < MAX_CAPTURED_OUTPUT) {
                output_.append(buffer.data(), static_cast<std::size_t>(n));
            }
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        // EAGAIN (nothing buffered) or EOF
        break;
    }
}

bool DecoderProcess::Impl::reap(bool block) {
    if (process_id_ <= 0)
        return true;
    int status = 0;
    pid_t result = waitpid(process_id_, &status, block ? 0 : WNOHANG);
    if (result == process_id_) {
        if (WIFEXITED(status)) {
            exit_code_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_code_ = 128 + WTERMSIG(status);
        }
        state_.store(ProcessState::Exited, std::memory_order_release);
        return true;
    }
    if (result < 0 && errno == ECHILD) {
        state_.store(ProcessState::Exited, std::memory_order_release);
        return true;
    }
    return false;
}

bool DecoderProcess::Impl::is_alive() const noexcept {
    auto current = state();
    return current == ProcessState::Running || current == ProcessState::ShuttingDown;
}

bool DecoderProcess::Impl::wait_for_exit(std::chrono::milliseconds timeout) {
    if (!is_alive())
        return true;
    auto start = std::chrono::steady_clock::now();
    for (;;) {
        drain_output();
        if (reap(false)) {
            drain_output();
            return true;
        }
        if (std::chrono::steady_clock::now() - start >= timeout)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

void DecoderProcess::Impl::terminate(std::chrono::milliseconds grace) {
    if (!is_alive())
        return;
    if (process_id_ <= 0) {
        state_.store(ProcessState::Exited, std::memory_order_release);
        return;
    }

    spdlog::debug("DecoderProcess: terminating pid={}", process_id_);
    state_.store(ProcessState::ShuttingDown, std::memory_order_release);

    if (kill(process_id_, SIGTERM) == 0 && wait_for_exit(grace)) {
        return;
    }

    spdlog::warn("DecoderProcess: forcefully killing pid={}", process_id_);
    kill(process_id_, SIGKILL);
    if (!reap(true)) {
        spdlog::warn("DecoderProcess: pid={} could not be reaped", process_id_);
        state_.store(ProcessState::Exited, std::memory_order_release);
    }
}

std::string DecoderProcess::Impl::output() const {
    std::lock_guard lock{output_mutex_};
    return output_;
}

DecoderProcess::DecoderProcess(DecoderProcessConfig config)
    : impl_{std::make_unique<Impl>(std::move(config))} {}

DecoderProcess::~DecoderProcess() = default;
DecoderProcess::DecoderProcess(DecoderProcess&&) noexcept = default;
DecoderProcess& DecoderProcess::operator=(DecoderProcess&&) noexcept = default;

ProcessState DecoderProcess::state() const noexcept {
    return impl_ ? impl_->state() : ProcessState::Unstarted;
}

bool DecoderProcess::is_alive() const noexcept {
    return impl_ && impl_->is_alive();
}

void DecoderProcess::terminate(std::chrono::milliseconds grace) {
    if (impl_)
        impl_->terminate(grace);
}

bool DecoderProcess::wait_for_exit(std::chrono::milliseconds timeout) {
    return impl_ ? impl_->wait_for_exit(timeout) : true;
}

std::optional<int> DecoderProcess::exit_code() const noexcept {
    return impl_ ? impl_->exit_code() : std::nullopt;
}

std::string DecoderProcess::output() const {
    return impl_ ? impl_->output() : std::string{};
}

int64_t DecoderProcess::pid() const noexcept {
    return impl_ ? impl_->pid() : -1;
}

std::chrono::milliseconds DecoderProcess::uptime() const noexcept {
    return impl_ ? impl_->uptime() : std::chrono::milliseconds{0};
}

} // namespace chatmedia::audio
