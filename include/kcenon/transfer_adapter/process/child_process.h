/**
 * @file child_process.h
 * @brief External process launched with piped standard input and output
 */

#ifndef KCENON_TRANSFER_ADAPTER_PROCESS_CHILD_PROCESS_H
#define KCENON_TRANSFER_ADAPTER_PROCESS_CHILD_PROCESS_H

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

#include "kcenon/transfer_adapter/core/types.h"
#include "kcenon/transfer_adapter/process/pipe_stream.h"

namespace kcenon::transfer_adapter {

/**
 * @brief Split a configured argument string into argv words
 *
 * Words are separated by unquoted whitespace. Single quotes keep their
 * content literally, double quotes allow backslash escapes, and a backslash
 * outside quotes escapes the next character.
 *
 * @code
 * split_arguments(R"(--store "/tmp/lfs objects" -v)");
 * // {"--store", "/tmp/lfs objects", "-v"}
 * @endcode
 */
[[nodiscard]] auto split_arguments(std::string_view args) -> std::vector<std::string>;

/**
 * @brief A running child process with its stdin/stdout connected to pipes
 *
 * stderr is inherited from the host so agent diagnostics reach the user.
 * The pipe ends are handed out once via take_stdin()/take_stdout(); the
 * process handle stays here.
 *
 * @note kill() may be called from any thread; wait() and the destructor
 *       belong to the owning thread.
 */
class child_process {
public:
    /**
     * @brief Launch an executable
     * @param path Executable path; looked up in PATH when it has no '/'
     * @param args Arguments, not including argv[0]
     * @return The running process, or process_spawn_failed/pipe_setup_failed
     */
    [[nodiscard]] static auto spawn(const std::string& path,
                                    const std::vector<std::string>& args)
        -> result<std::unique_ptr<child_process>>;

    child_process(const child_process&) = delete;
    auto operator=(const child_process&) -> child_process& = delete;

    /**
     * @brief Kills and reaps the process if it is still running
     */
    ~child_process();

    [[nodiscard]] auto pid() const noexcept -> pid_t { return pid_; }

    [[nodiscard]] auto take_stdin() -> unique_fd { return std::move(stdin_); }
    [[nodiscard]] auto take_stdout() -> unique_fd { return std::move(stdout_); }

    /**
     * @brief Send SIGKILL; a no-op once the process has been reaped
     */
    void kill() noexcept;

    /**
     * @brief Wait for the process to exit and reap it
     * @return Success for exit status 0, process_exit_failure otherwise
     */
    [[nodiscard]] auto wait() -> result<void>;

    [[nodiscard]] auto reaped() const -> bool;

private:
    child_process(pid_t pid, unique_fd stdin_fd, unique_fd stdout_fd);

    pid_t pid_;
    unique_fd stdin_;
    unique_fd stdout_;

    bool reaped_ = false;
    mutable std::mutex mutex_;
};

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_PROCESS_CHILD_PROCESS_H
