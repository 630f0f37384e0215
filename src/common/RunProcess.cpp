//===----------------------------------------------------------------------===//
//
// Part of the Fusion project, under the GNU GPL v3.
// See LICENSE for license information.
//
//===----------------------------------------------------------------------===//
//
// File: common/RunProcess.cpp
// Purpose: POSIX fork/exec launcher used by the subprocess executors.
// Key invariants:
//   - The child runs in its own process group so timeouts and cancellation
//     terminate compilers together with anything they spawned.
//   - Exec failures are reported through a close-on-exec status pipe and
//     surface as launch_failed with the errno text in err.
//   - Every pipe is close-on-exec; the child keeps only fds 0-2.
//   - SIGPIPE is blocked per thread while feeding stdin, never ignored
//     process-wide.
// Ownership/Lifetime: All descriptors are closed before returning.
// Links: docs/architecture.md
//
//===----------------------------------------------------------------------===//

#include "common/RunProcess.hpp"

#include <algorithm>
#include <array>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <string_view>

#include <fcntl.h>
#include <poll.h>
#include <pthread.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace fusion::common
{
namespace
{
constexpr int kPollSliceMs = 20;

/// @brief Owns a file descriptor and closes it on scope exit.
class ScopedFd
{
  public:
    ScopedFd() = default;

    explicit ScopedFd(int fd) : fd_(fd) {}

    ScopedFd(const ScopedFd &) = delete;
    ScopedFd &operator=(const ScopedFd &) = delete;

    ~ScopedFd()
    {
        reset();
    }

    int get() const
    {
        return fd_;
    }

    void reset(int fd = -1)
    {
        if (fd_ >= 0)
            ::close(fd_);
        fd_ = fd;
    }

    int release()
    {
        const int fd = fd_;
        fd_ = -1;
        return fd;
    }

  private:
    int fd_ = -1;
};

/// @brief Pipe pair with both ends owned.
struct Pipe
{
    ScopedFd read;
    ScopedFd write;

    bool open();
};

bool Pipe::open()
{
    int fds[2];
#if defined(__APPLE__)
    if (::pipe(fds) != 0)
        return false;
    for (int fd : fds)
        ::fcntl(fd, F_SETFD, ::fcntl(fd, F_GETFD) | FD_CLOEXEC);
#else
    if (::pipe2(fds, O_CLOEXEC) != 0)
        return false;
#endif
    read.reset(fds[0]);
    write.reset(fds[1]);
    return true;
}

/// @brief Blocks SIGPIPE for the calling thread and discards one raised by
///        a write to a closed pipe before restoring the previous mask.
class SigpipeGuard
{
  public:
    SigpipeGuard()
    {
        sigemptyset(&pipeSet_);
        sigaddset(&pipeSet_, SIGPIPE);
        sigset_t pending;
        sigemptyset(&pending);
        wasPending_ = ::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1;
        ::pthread_sigmask(SIG_BLOCK, &pipeSet_, &saved_);
    }

    SigpipeGuard(const SigpipeGuard &) = delete;
    SigpipeGuard &operator=(const SigpipeGuard &) = delete;

    ~SigpipeGuard()
    {
        if (brokenPipe_ && !wasPending_)
        {
            sigset_t pending;
            sigemptyset(&pending);
            int sig = 0;
            if (::sigpending(&pending) == 0 && sigismember(&pending, SIGPIPE) == 1)
                ::sigwait(&pipeSet_, &sig);
        }
        ::pthread_sigmask(SIG_SETMASK, &saved_, nullptr);
    }

    void noteBrokenPipe()
    {
        brokenPipe_ = true;
    }

  private:
    sigset_t pipeSet_;
    sigset_t saved_;
    bool wasPending_ = false;
    bool brokenPipe_ = false;
};

void setNonBlocking(int fd)
{
    const int flags = ::fcntl(fd, F_GETFL);
    if (flags >= 0)
        ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);
}

/// @brief Drain available bytes from @p fd into @p sink.
/// @return False once the writer side has closed.
bool drain(int fd, std::string &sink)
{
    std::array<char, 4096> buf{};
    while (true)
    {
        const ssize_t n = ::read(fd, buf.data(), buf.size());
        if (n > 0)
        {
            const size_t room = kMaxCapturedBytes > sink.size() ? kMaxCapturedBytes - sink.size() : 0;
            sink.append(buf.data(), std::min(static_cast<size_t>(n), room));
            continue;
        }
        if (n == 0)
            return false;
        if (errno == EINTR)
            continue;
        return errno == EAGAIN || errno == EWOULDBLOCK;
    }
}

/// @brief Write as much of @p data past @p written as the pipe accepts.
/// @return True while input remains and the reader is still there.
bool feed(int fd, std::string_view data, size_t &written)
{
    SigpipeGuard guard;
    while (written < data.size())
    {
        const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n > 0)
        {
            written += static_cast<size_t>(n);
            continue;
        }
        if (n < 0 && errno == EINTR)
            continue;
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK))
            return true;
        if (n < 0 && errno == EPIPE)
            guard.noteBrokenPipe();
        return false;
    }
    return false;
}

/// @brief Make @p fd the child's @p target descriptor across exec.
void redirect(int fd, int target)
{
    if (fd == target)
    {
        const int flags = ::fcntl(fd, F_GETFD);
        if (flags >= 0)
            ::fcntl(fd, F_SETFD, flags & ~FD_CLOEXEC);
        return;
    }
    ::dup2(fd, target);
}

int normaliseStatus(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

[[noreturn]] void execChild(const std::vector<std::string> &argv,
                            const RunOptions &options,
                            int inFd,
                            int outFd,
                            int errFd,
                            int statusFd)
{
    ::setpgid(0, 0);
    redirect(inFd, STDIN_FILENO);
    redirect(outFd, STDOUT_FILENO);
    redirect(errFd, STDERR_FILENO);

    if (options.cwd && ::chdir(options.cwd->c_str()) != 0)
    {
        const int code = errno;
        (void)!::write(statusFd, &code, sizeof(code));
        ::_exit(127);
    }
    for (const auto &[name, value] : options.env)
        ::setenv(name.c_str(), value.c_str(), 1);

    std::vector<char *> args;
    args.reserve(argv.size() + 1);
    for (const auto &a : argv)
        args.push_back(const_cast<char *>(a.c_str()));
    args.push_back(nullptr);

    ::execvp(args[0], args.data());
    const int code = errno;
    (void)!::write(statusFd, &code, sizeof(code));
    ::_exit(127);
}
} // namespace

RunResult run_process(const std::vector<std::string> &argv, const RunOptions &options)
{
    RunResult result;
    if (argv.empty())
    {
        result.launch_failed = true;
        result.err = "empty command line";
        return result;
    }

    Pipe in, out, err, status;
    if (!in.open() || !out.open() || !err.open() || !status.open())
    {
        result.launch_failed = true;
        result.err = std::string("pipe: ") + std::strerror(errno);
        return result;
    }

    const pid_t pid = ::fork();
    if (pid < 0)
    {
        result.launch_failed = true;
        result.err = std::string("fork: ") + std::strerror(errno);
        return result;
    }
    if (pid == 0)
    {
        execChild(argv, options, in.read.get(), out.write.get(), err.write.get(), status.write.get());
    }

    ::setpgid(pid, pid);
    in.read.reset();
    out.write.reset();
    err.write.reset();
    status.write.reset();

    int execErrno = 0;
    ssize_t got = 0;
    do
    {
        got = ::read(status.read.get(), &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(execErrno)))
    {
        int ignored = 0;
        ::waitpid(pid, &ignored, 0);
        result.launch_failed = true;
        result.err = argv[0] + ": " + std::strerror(execErrno);
        return result;
    }

    size_t written = 0;
    if (options.input.empty())
        in.write.reset();
    else
        setNonBlocking(in.write.get());

    setNonBlocking(out.read.get());
    setNonBlocking(err.read.get());

    const auto start = std::chrono::steady_clock::now();
    bool outOpen = true;
    bool errOpen = true;
    bool killed = false;

    while (outOpen || errOpen)
    {
        const bool feeding = in.write.get() >= 0;
        std::array<pollfd, 3> fds{};
        nfds_t count = 0;
        if (outOpen)
            fds[count++] = pollfd{out.read.get(), POLLIN, 0};
        if (errOpen)
            fds[count++] = pollfd{err.read.get(), POLLIN, 0};
        if (feeding)
            fds[count++] = pollfd{in.write.get(), POLLOUT, 0};

        const int ready = ::poll(fds.data(), count, kPollSliceMs);
        if (ready < 0 && errno != EINTR)
            break;

        if (feeding && !feed(in.write.get(), options.input, written))
            in.write.reset();
        if (outOpen)
            outOpen = drain(out.read.get(), result.out);
        if (errOpen)
            errOpen = drain(err.read.get(), result.err);

        if (isCancelled(options.cancel))
        {
            result.cancelled = true;
            killed = true;
        }
        else if (options.timeout.count() > 0 &&
                 std::chrono::steady_clock::now() - start >= options.timeout)
        {
            result.timed_out = true;
            killed = true;
        }
        if (killed)
        {
            ::kill(-pid, SIGKILL);
            break;
        }
    }

    in.write.reset();

    int wstatus = 0;
    while (!killed)
    {
        const pid_t r = ::waitpid(pid, &wstatus, WNOHANG);
        if (r == pid)
        {
            result.exit_code = normaliseStatus(wstatus);
            return result;
        }
        if (r < 0 && errno != EINTR)
            break;
        if (isCancelled(options.cancel))
            result.cancelled = killed = true;
        else if (options.timeout.count() > 0 &&
                 std::chrono::steady_clock::now() - start >= options.timeout)
            result.timed_out = killed = true;
        if (killed)
            ::kill(-pid, SIGKILL);
        else
            ::usleep(kPollSliceMs * 1000);
    }
    while (::waitpid(pid, &wstatus, 0) < 0 && errno == EINTR)
    {
    }
    if (killed)
    {
        drain(out.read.get(), result.out);
        drain(err.read.get(), result.err);
    }
    result.exit_code = normaliseStatus(wstatus);
    return result;
}

RunResult run_process(const std::vector<std::string> &argv,
                      std::optional<std::string> cwd,
                      const std::vector<std::pair<std::string, std::string>> &env)
{
    RunOptions options;
    options.cwd = std::move(cwd);
    options.env = env;
    return run_process(argv, options);
}

} // namespace fusion::common
