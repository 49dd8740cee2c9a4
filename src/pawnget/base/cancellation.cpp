#include <pawnget/base/cancellation.h>

namespace
{
    // constant initialized, so safe to reach from a signal handler
    pawnget::CancellationToken g_cancellation_token;
}

namespace pawnget
{
    bool CancellationToken::deadline_passed() const noexcept { return m_has_deadline && clock::now() >= m_deadline; }

    const CancellationToken& never_cancelled() noexcept
    {
        static const CancellationToken token;
        return token;
    }

    CancellationToken& global_cancellation_token() noexcept { return g_cancellation_token; }
}
