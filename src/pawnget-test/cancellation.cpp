#include <pawnget-test/util.h>

#include <pawnget/base/cancellation.h>

#include <chrono>

using namespace pawnget;

TEST_CASE ("fresh tokens are not cancelled", "[cancellation]")
{
    CancellationToken token;
    CHECK(!token.cancel_requested());
    CHECK(!token.deadline_passed());
    CHECK(!token.is_cancelled());
    CHECK(!never_cancelled().is_cancelled());
}

TEST_CASE ("cancel is sticky", "[cancellation]")
{
    CancellationToken token;
    token.cancel();
    CHECK(token.cancel_requested());
    CHECK(!token.deadline_passed());
    CHECK(token.is_cancelled());
    token.cancel();
    CHECK(token.is_cancelled());
}

TEST_CASE ("deadlines", "[cancellation]")
{
    CancellationToken expired;
    expired.set_deadline(CancellationToken::clock::now() - std::chrono::seconds(1));
    CHECK(expired.deadline_passed());
    CHECK(!expired.cancel_requested());
    CHECK(expired.is_cancelled());

    CancellationToken distant;
    distant.set_timeout(std::chrono::seconds(3600));
    CHECK(!distant.deadline_passed());
    CHECK(!distant.is_cancelled());
}
