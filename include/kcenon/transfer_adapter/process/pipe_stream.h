/**
 * @file pipe_stream.h
 * @brief Owned pipe ends and line-oriented I/O over them
 */

#ifndef KCENON_TRANSFER_ADAPTER_PROCESS_PIPE_STREAM_H
#define KCENON_TRANSFER_ADAPTER_PROCESS_PIPE_STREAM_H

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

#include "kcenon/transfer_adapter/core/types.h"

namespace kcenon::transfer_adapter {

/**
 * @brief Owning wrapper for a POSIX file descriptor
 */
class unique_fd {
public:
    unique_fd() noexcept = default;
    explicit unique_fd(int fd) noexcept : fd_(fd) {}

    unique_fd(const unique_fd&) = delete;
    auto operator=(const unique_fd&) -> unique_fd& = delete;

    unique_fd(unique_fd&& other) noexcept : fd_(other.release()) {}
    auto operator=(unique_fd&& other) noexcept -> unique_fd& {
        if (this != &other) {
            reset(other.release());
        }
        return *this;
    }

    ~unique_fd() { reset(); }

    [[nodiscard]] auto get() const noexcept -> int { return fd_; }
    [[nodiscard]] auto valid() const noexcept -> bool { return fd_ >= 0; }

    auto release() noexcept -> int {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    /**
     * @brief Close the current descriptor (if any) and take ownership of another
     * @return false if closing the previous descriptor reported an error
     */
    auto reset(int fd = -1) noexcept -> bool;

private:
    int fd_ = -1;
};

/**
 * @brief Write end of a pipe into a child process
 */
class pipe_writer {
public:
    pipe_writer() = default;
    explicit pipe_writer(unique_fd fd) : fd_(std::move(fd)) {}

    /**
     * @brief Write all bytes, retrying short writes and interrupted calls
     *
     * A closed reader (the process exited) yields protocol_io_error.
     */
    [[nodiscard]] auto write_all(std::string_view data) -> result<void>;

    /**
     * @brief Close the pipe, signalling end-of-input to the process
     */
    auto close() -> result<void>;

    [[nodiscard]] auto is_open() const noexcept -> bool { return fd_.valid(); }

private:
    unique_fd fd_;
};

/**
 * @brief Buffered line reader over the read end of a pipe
 *
 * Bytes past the returned line stay buffered for the next call, so a
 * process may write several messages in one burst.
 */
class pipe_line_reader {
public:
    pipe_line_reader() = default;
    explicit pipe_line_reader(unique_fd fd, std::size_t max_line = 1024 * 1024)
        : fd_(std::move(fd)), max_line_(max_line) {}

    /**
     * @brief Read one line, without its terminator
     * @param timeout Longest wait for the line; zero waits indefinitely
     * @return The line, or protocol_io_error (EOF/read failure),
     *         protocol_timeout, protocol_line_too_long
     */
    [[nodiscard]] auto read_line(std::chrono::milliseconds timeout = std::chrono::milliseconds{0})
        -> result<std::string>;

    auto close() -> result<void>;

    [[nodiscard]] auto is_open() const noexcept -> bool { return fd_.valid(); }

private:
    [[nodiscard]] auto take_buffered_line() -> std::optional<std::string>;
    [[nodiscard]] auto wait_readable(std::chrono::steady_clock::time_point deadline) -> result<void>;

    unique_fd fd_;
    std::size_t max_line_ = 1024 * 1024;
    std::string buffer_;
    std::size_t scanned_ = 0;
};

}  // namespace kcenon::transfer_adapter

#endif  // KCENON_TRANSFER_ADAPTER_PROCESS_PIPE_STREAM_H
