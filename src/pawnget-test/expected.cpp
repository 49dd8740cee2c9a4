#include <pawnget-test/util.h>

#include <pawnget/base/expected.h>

#include <memory>
#include <string>

using namespace pawnget;

namespace
{
    ExpectedL<int> parse_digit(char c)
    {
        if (c < '0' || c > '9')
        {
            return LocalizedString::from_raw(std::string("not a digit: ") + c);
        }

        return c - '0';
    }

    ExpectedL<int> halve(int value)
    {
        if (value % 2 != 0)
        {
            return LocalizedString::from_raw("odd");
        }

        return value / 2;
    }
}

TEST_CASE ("ExpectedL holds either a value or an error", "[expected]")
{
    auto good = parse_digit('7');
    REQUIRE(good.has_value());
    REQUIRE(static_cast<bool>(good));
    CHECK(*good.get() == 7);

    auto bad = parse_digit('x');
    REQUIRE(!bad.has_value());
    CHECK(bad.get() == nullptr);
    CHECK(bad.error() == LocalizedString::from_raw("not a digit: x"));
}

TEST_CASE ("ExpectedL map and then", "[expected]")
{
    auto doubled = parse_digit('4').map([](int value) { return value * 2; });
    REQUIRE(doubled.has_value());
    CHECK(*doubled.get() == 8);

    auto mapped_error = parse_digit('q').map([](int value) { return value * 2; });
    REQUIRE(!mapped_error.has_value());
    CHECK(mapped_error.error().data() == "not a digit: q");

    auto chained = parse_digit('8').then(halve);
    REQUIRE(chained.has_value());
    CHECK(*chained.get() == 4);

    auto chained_error = parse_digit('3').then(halve);
    REQUIRE(!chained_error.has_value());
    CHECK(chained_error.error().data() == "odd");

    auto first_error_wins = parse_digit('-').then(halve);
    REQUIRE(!first_error_wins.has_value());
    CHECK(first_error_wins.error().data() == "not a digit: -");
}

TEST_CASE ("ExpectedL map_error", "[expected]")
{
    auto prefixed = parse_digit('z').map_error(
        [](LocalizedString&& error) { return LocalizedString::from_raw("parse: ").append(error); });
    REQUIRE(!prefixed.has_value());
    CHECK(prefixed.error().data() == "parse: not a digit: z");

    auto untouched = parse_digit('1').map_error([](LocalizedString&& error) { return std::move(error); });
    REQUIRE(untouched.has_value());
    CHECK(*untouched.get() == 1);
}

TEST_CASE ("ExpectedL move only values", "[expected]")
{
    ExpectedL<std::unique_ptr<int>> holder = std::make_unique<int>(42);
    REQUIRE(holder.has_value());
    auto moved = std::move(holder).value_or_exit(PAWNGET_LINE_INFO);
    REQUIRE(moved);
    CHECK(*moved == 42);
}
