#pragma once

#include <chatmedia/core/types.h>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace chatmedia::audio {

/**
 * @brief Lifecycle state of an external decoder process
 */
enum class ProcessState : uint8_t {
    Unstarted,    ///< Process not yet spawned
    Running,      ///< Child is executing
    ShuttingDown, ///< Termination requested
    Exited,       ///< Child has been reaped
    Failed        ///< Spawn failed
};

/**
 * @brief Configuration for spawning a decoder
 *
 * @code
 * DecoderProcessConfig config{
 *     .executable = "/opt/bin/silk_v3_decoder",
 *     .args = {"in.silk", "out.pcm", "-Fs_API", "24000"}
 * };
 * @endcode
 */
struct DecoderProcessConfig {
    std::filesystem::path executable;
    std::vector<std::string> args;
    std::optional<std::filesystem::path> workdir;
    bool capture_output{true}; ///< Collect stdout/stderr for diagnostics
};

/**
 * @brief RAII wrapper around a POSIX child process
 *
 * The child is spawned with fork/execvp. Its stdout and stderr share one non-blocking
 * pipe that is drained while waiting. Destruction terminates a child that is still
 * running (SIGTERM, then SIGKILL after a grace period).
 */
class DecoderProcess {
public:
    /**
     * @brief Spawn the process
     * @throws std::runtime_error if pipes or fork fail
     */
    explicit DecoderProcess(DecoderProcessConfig config);
    ~DecoderProcess();

    DecoderProcess(const DecoderProcess&) = delete;
    DecoderProcess& operator=(const DecoderProcess&) = delete;
    DecoderProcess(DecoderProcess&&) noexcept;
    DecoderProcess& operator=(DecoderProcess&&) noexcept;

    [[nodiscard]] ProcessState state() const noexcept;
    [[nodiscard]] bool is_alive() const noexcept;

    /// SIGTERM, wait up to `grace`, then SIGKILL
    void terminate(std::chrono::milliseconds grace = std::chrono::seconds{2});

    /**
     * @brief Poll for exit with waitpid(WNOHANG), draining output meanwhile
     * @return true if the process exited within the timeout
     */
    [[nodiscard]] bool wait_for_exit(std::chrono::milliseconds timeout);

    /// Exit status; 128 + signal number when killed by a signal
    [[nodiscard]] std::optional<int> exit_code() const noexcept;

    /// Output collected so far (stdout and stderr interleaved)
    [[nodiscard]] std::string output() const;

    [[nodiscard]] int64_t pid() const noexcept;
    [[nodiscard]] std::chrono::milliseconds uptime() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace chatmedia::audio
