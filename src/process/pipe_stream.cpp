/**
 * @file pipe_stream.cpp
 * @brief Implementation of pipe I/O
 */

#include <kcenon/transfer_adapter/process/pipe_stream.h>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <limits>

#include <poll.h>
#include <unistd.h>

namespace kcenon::transfer_adapter {

namespace {

constexpr std::size_t READ_BLOCK = 64 * 1024;
constexpr std::chrono::milliseconds MAX_POLL_TIMEOUT{std::numeric_limits<int>::max()};

auto errno_message(std::string_view what) -> std::string {
    return std::string(what) + ": " + std::strerror(errno);
}

}  // namespace

auto unique_fd::reset(int fd) noexcept -> bool {
    bool ok = true;
    if (fd_ >= 0) {
        // POSIX leaves the descriptor state unspecified on EINTR; Linux has
        // already released it, so never retry the close.
        ok = ::close(fd_) == 0 || errno == EINTR;
    }
    fd_ = fd;
    return ok;
}

auto pipe_writer::write_all(std::string_view data) -> result<void> {
    if (!fd_.valid()) {
        return unexpected{error{error_code::protocol_io_error,
                                "write to transfer process: pipe is closed"}};
    }

    std::size_t written = 0;
    while (written < data.size()) {
        auto n = ::write(fd_.get(), data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return unexpected{error{error_code::protocol_io_error,
                                    errno_message("write to transfer process")}};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

auto pipe_writer::close() -> result<void> {
    if (!fd_.reset()) {
        return unexpected{error{error_code::protocol_io_error,
                                errno_message("close transfer process stdin")}};
    }
    return {};
}

auto pipe_line_reader::take_buffered_line() -> std::optional<std::string> {
    auto pos = buffer_.find('\n', scanned_);
    if (pos == std::string::npos) {
        scanned_ = buffer_.size();
        return std::nullopt;
    }
    std::string line = buffer_.substr(0, pos);
    buffer_.erase(0, pos + 1);
    scanned_ = 0;
    return line;
}

auto pipe_line_reader::wait_readable(std::chrono::steady_clock::time_point deadline)
    -> result<void> {
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            return unexpected{error{error_code::protocol_timeout,
                                    "no response from transfer process within timeout"}};
        }

        pollfd pfd{};
        pfd.fd = fd_.get();
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc > 0) {
            return {};
        }
        if (rc < 0 && errno != EINTR) {
            return unexpected{error{error_code::protocol_io_error,
                                    errno_message("poll transfer process stdout")}};
        }
    }
}

auto pipe_line_reader::read_line(std::chrono::milliseconds timeout) -> result<std::string> {
    // poll() takes an int of milliseconds
    const auto bounded = std::min(timeout, MAX_POLL_TIMEOUT);
    const auto deadline = std::chrono::steady_clock::now() + bounded;
    char block[READ_BLOCK];

    for (;;) {
        auto line = take_buffered_line();
        if ((line && line->size() > max_line_) || (!line && buffer_.size() > max_line_)) {
            return unexpected{error{error_code::protocol_line_too_long,
                                    "transfer process sent a line longer than " +
                                        std::to_string(max_line_) + " bytes"}};
        }
        if (line) {
            return std::move(*line);
        }
        if (!fd_.valid()) {
            return unexpected{error{error_code::protocol_io_error,
                                    "read from transfer process: pipe is closed"}};
        }

        if (bounded.count() > 0) {
            auto ready = wait_readable(deadline);
            if (!ready) {
                return unexpected{ready.error()};
            }
        }

        auto n = ::read(fd_.get(), block, sizeof(block));
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            return unexpected{error{error_code::protocol_io_error,
                                    errno_message("read from transfer process")}};
        }
        if (n == 0) {
            std::string message = "transfer process closed its output";
            if (!buffer_.empty()) {
                message += " in the middle of a line: \"" + buffer_ + "\"";
            }
            return unexpected{error{error_code::protocol_io_error, std::move(message)}};
        }
        buffer_.append(block, static_cast<std::size_t>(n));
    }
}

auto pipe_line_reader::close() -> result<void> {
    buffer_.clear();
    scanned_ = 0;
    if (!fd_.reset()) {
        return unexpected{error{error_code::protocol_io_error,
                                errno_message("close transfer process stdout")}};
    }
    return {};
}

}  // namespace kcenon::transfer_adapter
