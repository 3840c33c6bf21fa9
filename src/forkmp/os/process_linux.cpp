#if defined(__linux__)

#include "forkmp/os/process.hpp"
#include "forkmp/config/constants.hpp"

#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include <fcntl.h>

#include <cerrno>
#include <utility>

namespace forkmp::os {

const char* to_string(ProcErr err) noexcept {
    switch (err) {
        case ProcErr::ForkFailed: return "fork failed";
        case ProcErr::WaitFailed: return "waitpid failed";
        case ProcErr::PipeFailed: return "pipe failed";
    }
    return "unknown process error";
}

forkmp_detail::expected<Pid, ProcErr> fork_process() noexcept {
    const pid_t pid = ::fork();
    if (pid < 0) return forkmp_detail::unexpected(ProcErr::ForkFailed);
    return static_cast<Pid>(pid);
}

forkmp_detail::expected<ExitInfo, ProcErr> wait_process(Pid pid) noexcept {
    int raw = 0;
    pid_t rc;
    do {
        rc = ::waitpid(pid, &raw, 0);
    } while (rc < 0 && errno == EINTR);
    if (rc < 0) return forkmp_detail::unexpected(ProcErr::WaitFailed);

    ExitInfo info;
    info.pid = pid;
    if (WIFEXITED(raw)) {
        info.exited = true;
        info.status = WEXITSTATUS(raw);
    } else if (WIFSIGNALED(raw)) {
        info.signal = WTERMSIG(raw);
    }
    return info;
}

bool kill_process(Pid pid) noexcept {
    return ::kill(pid, SIGKILL) == 0;
}

void terminate_process(int status) noexcept {
    ::_exit(status);
}

Pid current_pid() noexcept {
    return static_cast<Pid>(::getpid());
}

unsigned hardware_threads() noexcept {
    const long n = ::sysconf(_SC_NPROCESSORS_ONLN);
    return n > 0 ? static_cast<unsigned>(n) : config::constants::FALLBACK_THREAD_COUNT;
}

// ---------------- StartGate ----------------

forkmp_detail::expected<StartGate, ProcErr> StartGate::create() noexcept {
    int fds[2];
    if (::pipe2(fds, O_CLOEXEC) != 0) return forkmp_detail::unexpected(ProcErr::PipeFailed);
    StartGate g;
    g.read_fd_  = fds[0];
    g.write_fd_ = fds[1];
    return g;
}

StartGate::~StartGate() { close_all(); }

StartGate::StartGate(StartGate&& other) noexcept
    : read_fd_(std::exchange(other.read_fd_, -1)),
      write_fd_(std::exchange(other.write_fd_, -1)) {}

StartGate& StartGate::operator=(StartGate&& other) noexcept {
    if (this != &other) {
        close_all();
        read_fd_  = std::exchange(other.read_fd_, -1);
        write_fd_ = std::exchange(other.write_fd_, -1);
    }
    return *this;
}

bool StartGate::wait() noexcept {
    // The worker's copy of the write end must go, or EOF never arrives.
    if (write_fd_ >= 0) { ::close(write_fd_); write_fd_ = -1; }
    char token = 0;
    ssize_t n;
    do {
        n = ::read(read_fd_, &token, 1);
    } while (n < 0 && errno == EINTR);
    close_all();
    return n == 1;
}

void StartGate::release(unsigned workers) noexcept {
    const char token = 'g';
    for (unsigned i = 0; i < workers; ++i) {
        ssize_t n;
        do {
            n = ::write(write_fd_, &token, 1);
        } while (n < 0 && errno == EINTR);
        if (n != 1) break;
    }
    close_all();
}

void StartGate::abort() noexcept {
    close_all();
}

void StartGate::close_all() noexcept {
    if (read_fd_ >= 0)  { ::close(read_fd_);  read_fd_  = -1; }
    if (write_fd_ >= 0) { ::close(write_fd_); write_fd_ = -1; }
}

} // namespace forkmp::os
#endif
