#include <mcp_bridge/transport/child_process.hpp>
#include <mcp_bridge/core/log.hpp>

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace mcp_bridge {

namespace {

Error MakeSpawnError(const std::string& command, const std::string& message) {
    return Error{"Spawn", command, message, ErrorCategory::Transport};
}

Error MakeIoError(const char* operation, int pid, const std::string& message) {
    return Error{operation, "pid " + std::to_string(pid), message,
                 ErrorCategory::Transport};
}

std::string ErrnoText(int err) {
    return std::strerror(err);
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { ::signal(SIGPIPE, SIG_IGN); });
}

// Parent environment with `overrides` applied, as KEY=VALUE strings.
std::vector<std::string> BuildEnvironment(
    const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> result;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        std::string kv(*entry);
        auto eq = kv.find('=');
        auto key = kv.substr(0, eq);
        if (overrides.count(key) == 0) {
            result.push_back(std::move(kv));
        }
    }
    for (const auto& [key, value] : overrides) {
        result.push_back(key + "=" + value);
    }
    return result;
}

std::vector<char*> ToArgv(std::vector<std::string>& strings) {
    std::vector<char*> argv;
    argv.reserve(strings.size() + 1);
    for (auto& s : strings) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);
    return argv;
}

// Longest a writer holds the stdin lock between checks for CloseStdin().
constexpr std::chrono::milliseconds kWriteSlice{50};

bool PopLine(std::string& buffer, std::string& line) {
    auto nl = buffer.find('\n');
    if (nl == std::string::npos) {
        return false;
    }
    line = buffer.substr(0, nl);
    buffer.erase(0, nl + 1);
    if (!line.empty() && line.back() == '\r') {
        line.pop_back();
    }
    return true;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Spawn
// ---------------------------------------------------------------------------
Result<std::unique_ptr<ChildProcess>, Error> ChildProcess::Spawn(
    const std::string& command,
    const std::vector<std::string>& args,
    const std::map<std::string, std::string>& env) {
    using R = Result<std::unique_ptr<ChildProcess>, Error>;

    if (command.empty()) {
        return R::Err(MakeSpawnError(command, "Command must not be empty"));
    }

    IgnoreSigpipeOnce();

    // Everything the child needs is prepared before fork().
    std::vector<std::string> argv_strings;
    argv_strings.push_back(command);
    argv_strings.insert(argv_strings.end(), args.begin(), args.end());
    auto argv = ToArgv(argv_strings);

    auto env_strings = BuildEnvironment(env);
    auto envp = ToArgv(env_strings);

    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int status_pipe[2] = {-1, -1};

    auto close_all = [&] {
        for (int* p : {in_pipe, out_pipe, err_pipe, status_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    };

    if (::pipe2(in_pipe, O_CLOEXEC) != 0 || ::pipe2(out_pipe, O_CLOEXEC) != 0 ||
        ::pipe2(err_pipe, O_CLOEXEC) != 0 || ::pipe2(status_pipe, O_CLOEXEC) != 0) {
        auto err = errno;
        close_all();
        return R::Err(MakeSpawnError(command, "pipe() failed: " + ErrnoText(err)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        auto err = errno;
        close_all();
        return R::Err(MakeSpawnError(command, "fork() failed: " + ErrnoText(err)));
    }

    if (pid == 0) {
        // Child: dup2 clears close-on-exec on the standard descriptors.
        ::dup2(in_pipe[0], STDIN_FILENO);
        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(err_pipe[1], STDERR_FILENO);
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        auto written = ::write(status_pipe[1], &err, sizeof(err));
        (void)written;
        ::_exit(127);
    }

    // Parent
    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    CloseFd(status_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        close_all();
        return R::Err(MakeSpawnError(
            command, "Failed to execute '" + command + "': " + ErrnoText(child_errno)));
    }

    LogDebug("process", "Spawned '" + command + "' as pid " + std::to_string(pid));
    return R::Ok(std::unique_ptr<ChildProcess>(
        new ChildProcess(pid, in_pipe[1], out_pipe[0], err_pipe[0])));
}

ChildProcess::ChildProcess(int pid, int stdin_fd, int stdout_fd, int stderr_fd)
    : pid_(pid), stdin_fd_(stdin_fd) {
    stdout_.fd = stdout_fd;
    stderr_.fd = stderr_fd;
    // Only the parent's end; the child's read end is a separate description.
    int flags = ::fcntl(stdin_fd_, F_GETFL);
    if (flags < 0 || ::fcntl(stdin_fd_, F_SETFL, flags | O_NONBLOCK) != 0) {
        LogWarn("process", "pid " + std::to_string(pid_) +
                ": cannot make stdin non-blocking: " + ErrnoText(errno));
    }
}

ChildProcess::~ChildProcess() {
    CloseStdin();
    if (!TryReap()) {
        Kill();
        (void)WaitForExit(std::chrono::milliseconds(500));
    }
    CloseFd(stdout_.fd);
    CloseFd(stderr_.fd);
}

// ---------------------------------------------------------------------------
// Streams
// ---------------------------------------------------------------------------
Result<void, Error> ChildProcess::WriteLine(std::string_view line,
                                            std::chrono::milliseconds timeout) {
    using R = Result<void, Error>;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    std::lock_guard<std::mutex> lock(stdin_mutex_);
    if (stdin_fd_ < 0 || stdin_closing_) {
        return R::Err(MakeIoError("WriteLine", pid_, "stdin is closed"));
    }

    std::string data(line);
    data.push_back('\n');
    const char* p = data.data();
    size_t remaining = data.size();
    while (remaining > 0) {
        if (stdin_closing_) {
            return R::Err(MakeIoError("WriteLine", pid_, "stdin closed during write"));
        }

        auto n = ::write(stdin_fd_, p, remaining);
        if (n > 0) {
            p += n;
            remaining -= static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        if (n < 0 && errno != EAGAIN && errno != EWOULDBLOCK) {
            return R::Err(MakeIoError("WriteLine", pid_, "write failed: " + ErrnoText(errno)));
        }

        // Pipe is full: the provider is not reading its stdin.
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (left.count() <= 0) {
            const bool torn = remaining < data.size();
            if (torn) {
                // Half a line is already in the pipe; later writes would be garbage.
                LogWarn("process", "pid " + std::to_string(pid_) +
                        ": stdin stalled mid-line, closing it");
                stdin_closing_ = true;
                CloseFd(stdin_fd_);
            }
            return R::Err(Error{"WriteLine", "pid " + std::to_string(pid_),
                                "Provider did not read its stdin within " +
                                    std::to_string(timeout.count()) + "ms",
                                ErrorCategory::Timeout});
        }

        struct pollfd pfd {};
        pfd.fd = stdin_fd_;
        pfd.events = POLLOUT;
        int rc = ::poll(&pfd, 1, static_cast<int>(std::min(left, kWriteSlice).count()));
        if (rc < 0 && errno != EINTR) {
            return R::Err(MakeIoError("WriteLine", pid_, "poll on stdin failed: " +
                                                             ErrnoText(errno)));
        }
    }
    return R::Ok();
}

Result<PipeRead, Error> ChildProcess::ReadLine(std::chrono::milliseconds slice) {
    return ReadFrom(stdout_, slice, "stdout");
}

Result<PipeRead, Error> ChildProcess::ReadErrorLine(std::chrono::milliseconds slice) {
    return ReadFrom(stderr_, slice, "stderr");
}

Result<PipeRead, Error> ChildProcess::ReadFrom(LineReader& reader,
                                               std::chrono::milliseconds slice,
                                               const char* stream_name) {
    using R = Result<PipeRead, Error>;
    PipeRead out;

    if (PopLine(reader.buffer, out.line)) {
        out.status = PipeReadStatus::Line;
        return R::Ok(std::move(out));
    }
    if (reader.eof || reader.fd < 0) {
        // Flush a final unterminated line before reporting EOF.
        if (!reader.buffer.empty()) {
            out.status = PipeReadStatus::Line;
            out.line = std::move(reader.buffer);
            reader.buffer.clear();
            return R::Ok(std::move(out));
        }
        out.status = PipeReadStatus::Eof;
        return R::Ok(std::move(out));
    }

    const auto deadline = std::chrono::steady_clock::now() + slice;
    for (;;) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() < 0) {
            remaining = std::chrono::milliseconds(0);
        }

        struct pollfd pfd {};
        pfd.fd = reader.fd;
        pfd.events = POLLIN;
        int rc = ::poll(&pfd, 1, static_cast<int>(remaining.count()));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            return R::Err(MakeIoError("ReadLine", pid_,
                                      std::string("poll on ") + stream_name +
                                      " failed: " + ErrnoText(errno)));
        }
        if (rc == 0) {
            out.status = PipeReadStatus::Timeout;
            return R::Ok(std::move(out));
        }

        char chunk[4096];
        auto n = ::read(reader.fd, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                continue;
            }
            return R::Err(MakeIoError("ReadLine", pid_,
                                      std::string("read on ") + stream_name +
                                      " failed: " + ErrnoText(errno)));
        }
        if (n == 0) {
            reader.eof = true;
            if (!reader.buffer.empty()) {
                out.status = PipeReadStatus::Line;
                out.line = std::move(reader.buffer);
                reader.buffer.clear();
            } else {
                out.status = PipeReadStatus::Eof;
            }
            return R::Ok(std::move(out));
        }

        Consume(reader, chunk, static_cast<size_t>(n), stream_name);
        if (PopLine(reader.buffer, out.line)) {
            out.status = PipeReadStatus::Line;
            return R::Ok(std::move(out));
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            out.status = PipeReadStatus::Timeout;
            return R::Ok(std::move(out));
        }
    }
}

void ChildProcess::Consume(LineReader& reader, const char* data, std::size_t size,
                           const char* stream_name) {
    std::string_view incoming(data, size);
    if (reader.discarding) {
        auto nl = incoming.find('\n');
        if (nl == std::string_view::npos) {
            return;
        }
        reader.discarding = false;
        incoming.remove_prefix(nl + 1);
    }
    reader.buffer.append(incoming.data(), incoming.size());

    // Complete lines are fine; only the unterminated tail is bounded.
    auto last_nl = reader.buffer.rfind('\n');
    auto tail = last_nl == std::string::npos ? reader.buffer.size()
                                             : reader.buffer.size() - last_nl - 1;
    if (tail > max_line_length_) {
        LogWarn("process", "pid " + std::to_string(pid_) + ": " + stream_name +
                " line exceeds " + std::to_string(max_line_length_) +
                " bytes, discarding it");
        reader.buffer.erase(last_nl == std::string::npos ? 0 : last_nl + 1);
        reader.discarding = true;
    }
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
void ChildProcess::CloseStdin() {
    // Set first: a writer stuck on a full pipe sees it within one slice and
    // releases the lock.
    stdin_closing_ = true;
    std::lock_guard<std::mutex> lock(stdin_mutex_);
    CloseFd(stdin_fd_);
}

bool ChildProcess::TryReap() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (reaped_) {
        return true;
    }
    int status = 0;
    pid_t rc = ::waitpid(pid_, &status, WNOHANG);
    if (rc == pid_) {
        reaped_ = true;
        if (WIFEXITED(status)) {
            exit_status_ = WEXITSTATUS(status);
        } else if (WIFSIGNALED(status)) {
            exit_status_ = 128 + WTERMSIG(status);
        }
        return true;
    }
    if (rc < 0 && errno == ECHILD) {
        reaped_ = true;
        return true;
    }
    return false;
}

bool ChildProcess::WaitForExit(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        if (TryReap()) {
            return true;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}

void ChildProcess::Kill() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    if (!reaped_) {
        ::kill(pid_, SIGKILL);
    }
}

std::optional<int> ChildProcess::ExitStatus() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return exit_status_;
}

} // namespace mcp_bridge
