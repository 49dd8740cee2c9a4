#include <pawnget-test/util.h>

#include <pawnget/base/strings.h>

#include <string>
#include <vector>

using namespace pawnget;

TEST_CASE ("split by char", "[strings]")
{
    using Strings::split;
    using result_t = std::vector<std::string>;
    REQUIRE(split(",,,,,,", ',').empty());
    REQUIRE(split(",,a,,b,,", ',') == result_t{"a", "b"});
    REQUIRE(split("hello world", ' ') == result_t{"hello", "world"});
    REQUIRE(split("no delimiters", ',') == result_t{"no delimiters"});
}

TEST_CASE ("find_first_of", "[strings]")
{
    using Strings::find_first_of;
    StringView searched = "abcdefg";
    REQUIRE(find_first_of(searched, "hij") == searched.end());
    REQUIRE(find_first_of(searched, "a") == searched.begin());
    REQUIRE(find_first_of(searched, "gb") == searched.begin() + 1);
}

TEST_CASE ("case insensitive comparison", "[strings]")
{
    REQUIRE(Strings::case_insensitive_ascii_equals("Acquire", "acquire"));
    REQUIRE(Strings::case_insensitive_ascii_equals("", ""));
    REQUIRE(!Strings::case_insensitive_ascii_equals("acquire", "acquired"));
    REQUIRE(Strings::ascii_to_lowercase("PawnCC-3.10") == "pawncc-3.10");
}

TEST_CASE ("strto_unsigned", "[strings]")
{
    REQUIRE(Strings::strto_unsigned("0").value_or(1) == 0);
    REQUIRE(Strings::strto_unsigned("300").value_or(0) == 300);
    REQUIRE(Strings::strto_unsigned("18446744073709551615").value_or(0) == 18446744073709551615ull);
    REQUIRE(!Strings::strto_unsigned("18446744073709551616").has_value());
    REQUIRE(!Strings::strto_unsigned("").has_value());
    REQUIRE(!Strings::strto_unsigned("-1").has_value());
    REQUIRE(!Strings::strto_unsigned("12s").has_value());
}

TEST_CASE ("join and concat", "[strings]")
{
    std::vector<std::string> names{"darwin", "linux", "windows"};
    REQUIRE(Strings::join(", ", names) == "darwin, linux, windows");
    REQUIRE(Strings::join(", ", std::vector<std::string>{}) == "");
    REQUIRE(Strings::concat("pawnc-", StringView{"3.10.10"}, '-', 7) == "pawnc-3.10.10-7");
}
