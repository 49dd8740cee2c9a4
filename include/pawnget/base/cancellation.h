#pragma once

#include <atomic>
#include <chrono>

namespace pawnget
{
    // A cancel flag plus an optional deadline, polled by long running operations.
    // cancel() is async-signal-safe.
    struct CancellationToken
    {
        using clock = std::chrono::steady_clock;

        CancellationToken() = default;
        CancellationToken(const CancellationToken&) = delete;
        CancellationToken& operator=(const CancellationToken&) = delete;

        void cancel() noexcept { m_cancelled.store(true, std::memory_order_relaxed); }

        // Not thread safe; set the deadline before sharing the token.
        void set_deadline(clock::time_point deadline) noexcept
        {
            m_deadline = deadline;
            m_has_deadline = true;
        }
        void set_timeout(std::chrono::seconds timeout) { set_deadline(clock::now() + timeout); }

        bool cancel_requested() const noexcept { return m_cancelled.load(std::memory_order_relaxed); }
        bool deadline_passed() const noexcept;

        // Whether the operation should stop, for either reason.
        bool is_cancelled() const noexcept { return cancel_requested() || deadline_passed(); }

    private:
        std::atomic<bool> m_cancelled{false};
        bool m_has_deadline = false;
        clock::time_point m_deadline{};
    };

    // A token that is never cancelled.
    const CancellationToken& never_cancelled() noexcept;

    // The token the command line tool cancels on SIGINT.
    CancellationToken& global_cancellation_token() noexcept;
}
