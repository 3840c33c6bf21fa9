#pragma once
/**
 * @file process.hpp
 * @brief Minimal POSIX process helpers used by the region engine.
 * @note Linux only. The engine relies on fork() with copy-on-write semantics.
 */

#include <cstdint>

#include "forkmp/compat/expected.hpp"

namespace forkmp::os {

    using Pid = int;

    /// @brief Failure reported by the process helpers.
    enum class ProcErr : std::uint8_t {
        ForkFailed = 1,   ///< fork() returned -1 (EAGAIN/ENOMEM)
        WaitFailed,       ///< waitpid() failed for a reason other than EINTR
        PipeFailed        ///< pipe() for the start gate failed
    };

    const char* to_string(ProcErr err) noexcept;

    /// @brief How a waited-for child ended.
    struct ExitInfo {
        Pid  pid = 0;
        bool exited = false;  ///< Normal exit (status valid)
        int  status = 0;      ///< Exit status when exited
        int  signal = 0;      ///< Terminating signal otherwise

        bool ok() const noexcept { return exited && status == 0; }
    };

    /// @brief fork(). Returns 0 in the child, the child's pid in the parent.
    forkmp_detail::expected<Pid, ProcErr> fork_process() noexcept;

    /// @brief Block until @p pid terminates (retries on EINTR).
    forkmp_detail::expected<ExitInfo, ProcErr> wait_process(Pid pid) noexcept;

    /// @brief Send SIGKILL to @p pid. Best-effort.
    bool kill_process(Pid pid) noexcept;

    /// @brief Leave the process immediately: no atexit handlers, no static destructors.
    [[noreturn]] void terminate_process(int status) noexcept;

    /// @brief Current process id.
    Pid current_pid() noexcept;

    /// @brief Online CPUs, at least 1.
    unsigned hardware_threads() noexcept;

    /**
     * @class StartGate
     * @brief Holds freshly forked workers until the coordinator has forked them all.
     *
     * A pipe: the coordinator writes one byte per worker to release them, or
     * closes the write end without writing to abort. Workers that read EOF
     * leave without running the region body.
     */
    class StartGate {
    public:
        StartGate() noexcept = default;
        ~StartGate();

        StartGate(const StartGate&)            = delete;
        StartGate& operator=(const StartGate&) = delete;
        StartGate(StartGate&& other) noexcept;
        StartGate& operator=(StartGate&& other) noexcept;

        static forkmp_detail::expected<StartGate, ProcErr> create() noexcept;

        /// Worker side: wait for the coordinator's decision. true = run the body.
        bool wait() noexcept;

        /// Coordinator side: let @p workers children through.
        void release(unsigned workers) noexcept;

        /// Coordinator side: make every waiting child see EOF.
        void abort() noexcept;

    private:
        void close_all() noexcept;

        int read_fd_  = -1;
        int write_fd_ = -1;
    };

} // namespace forkmp::os
