/**
 * @file child_process.cpp
 * @brief POSIX implementation of child process management
 */

#include <kcenon/transfer_adapter/process/child_process.h>

#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace kcenon::transfer_adapter {

namespace {

// A process that exits while we write to it must surface as EPIPE, not
// terminate the host.
void ignore_sigpipe() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

auto make_pipe(unique_fd& read_end, unique_fd& write_end) -> bool {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) {
        return false;
    }
    read_end.reset(fds[0]);
    write_end.reset(fds[1]);
    return true;
}

auto describe_status(int status) -> std::string {
    if (WIFEXITED(status)) {
        return "exit status " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return std::string("killed by signal ") + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

}  // namespace

auto split_arguments(std::string_view args) -> std::vector<std::string> {
    std::vector<std::string> words;
    std::string current;
    bool in_word = false;
    char quote = '\0';

    for (std::size_t i = 0; i < args.size(); ++i) {
        char c = args[i];

        if (quote == '\'') {
            if (c == '\'') {
                quote = '\0';
            } else {
                current += c;
            }
            continue;
        }

        if (quote == '"') {
            if (c == '"') {
                quote = '\0';
            } else if (c == '\\' && i + 1 < args.size() &&
                       (args[i + 1] == '"' || args[i + 1] == '\\')) {
                current += args[++i];
            } else {
                current += c;
            }
            continue;
        }

        if (c == ' ' || c == '\t' || c == '\n') {
            if (in_word) {
                words.push_back(std::move(current));
                current.clear();
                in_word = false;
            }
            continue;
        }

        in_word = true;
        if (c == '\'' || c == '"') {
            quote = c;
        } else if (c == '\\' && i + 1 < args.size()) {
            current += args[++i];
        } else {
            current += c;
        }
    }

    if (in_word) {
        words.push_back(std::move(current));
    }
    return words;
}

child_process::child_process(pid_t pid, unique_fd stdin_fd, unique_fd stdout_fd)
    : pid_(pid), stdin_(std::move(stdin_fd)), stdout_(std::move(stdout_fd)) {}

auto child_process::spawn(const std::string& path, const std::vector<std::string>& args)
    -> result<std::unique_ptr<child_process>> {
    ignore_sigpipe();

    unique_fd child_stdin, parent_stdin;
    unique_fd parent_stdout, child_stdout;
    if (!make_pipe(child_stdin, parent_stdin) || !make_pipe(parent_stdout, child_stdout)) {
        return unexpected{error{error_code::pipe_setup_failed,
                                "Failed to create pipes for custom transfer command \"" +
                                    path + "\": " + std::strerror(errno)}};
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, child_stdin.get(), STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, child_stdout.get(), STDOUT_FILENO);

    // The agent should see SIGPIPE with its default disposition
    posix_spawnattr_t attr;
    posix_spawnattr_init(&attr);
    sigset_t defaults;
    sigemptyset(&defaults);
    sigaddset(&defaults, SIGPIPE);
    posix_spawnattr_setsigdefault(&attr, &defaults);
    posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGDEF);

    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(path.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = -1;
    int rc = posix_spawnp(&pid, path.c_str(), &actions, &attr, argv.data(), environ);

    posix_spawnattr_destroy(&attr);
    posix_spawn_file_actions_destroy(&actions);

    if (rc != 0) {
        return unexpected{error{error_code::process_spawn_failed,
                                "Failed to start custom transfer command \"" + path +
                                    "\": " + std::strerror(rc)}};
    }

    // child_stdin and child_stdout close here; only the child holds them now
    return std::unique_ptr<child_process>(
        new child_process(pid, std::move(parent_stdin), std::move(parent_stdout)));
}

child_process::~child_process() {
    if (!reaped()) {
        kill();
        (void)wait();
    }
}

void child_process::kill() noexcept {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!reaped_ && pid_ > 0) {
        ::kill(pid_, SIGKILL);
    }
}

auto child_process::reaped() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return reaped_;
}

auto child_process::wait() -> result<void> {
    if (reaped()) {
        return unexpected{error{error_code::process_not_running,
                                "process " + std::to_string(pid_) + " was already reaped"}};
    }

    // Block without reaping so kill() can never hit a recycled pid
    siginfo_t info{};
    while (::waitid(P_PID, static_cast<id_t>(pid_), &info, WEXITED | WNOWAIT) != 0) {
        if (errno != EINTR) {
            return unexpected{error{error_code::process_exit_failure,
                                    std::string("waitid: ") + std::strerror(errno)}};
        }
    }

    int status = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        while (::waitpid(pid_, &status, 0) < 0) {
            if (errno != EINTR) {
                reaped_ = true;
                return unexpected{error{error_code::process_exit_failure,
                                        std::string("waitpid: ") + std::strerror(errno)}};
            }
        }
        reaped_ = true;
    }

    if (WIFEXITED(status) && WEXITSTATUS(status) == 0) {
        return {};
    }
    return unexpected{error{error_code::process_exit_failure,
                            "transfer process " + std::to_string(pid_) + " ended with " +
                                describe_status(status)}};
}

}  // namespace kcenon::transfer_adapter
