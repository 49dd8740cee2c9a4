#include <pawnget-test/util.h>

#include <pawnget/versiontemplate.h>

using namespace pawnget;

TEST_CASE ("resolve a template with repeated placeholders", "[versiontemplate]")
{
    auto resolved = resolve_version_template(
        "https://github.com/Zeex/pawn/releases/download/v{version}/pawnc-{version}-linux.tar.gz", "3.10.10");
    REQUIRE(resolved.value_or_exit(PAWNGET_LINE_INFO) ==
            "https://github.com/Zeex/pawn/releases/download/v3.10.10/pawnc-3.10.10-linux.tar.gz");
}

TEST_CASE ("templates without placeholders resolve to themselves", "[versiontemplate]")
{
    REQUIRE(resolve_version_template("pawncc", "3.10.10").value_or_exit(PAWNGET_LINE_INFO) == "pawncc");
    REQUIRE(resolve_version_template("", "3.10.10").value_or_exit(PAWNGET_LINE_INFO) == "");
}

TEST_CASE ("parse_version_template segments", "[versiontemplate]")
{
    auto parsed = parse_version_template("v{version}/x-{version}").value_or_exit(PAWNGET_LINE_INFO);
    REQUIRE(parsed.segments.size() == 4);
    CHECK(!parsed.segments[0].is_placeholder);
    CHECK(parsed.segments[0].literal == "v");
    CHECK(parsed.segments[1].is_placeholder);
    CHECK(parsed.segments[2].literal == "/x-");
    CHECK(parsed.segments[3].is_placeholder);
    CHECK(parsed.placeholder_count() == 2);
    CHECK(parsed.resolve("1.0") == "v1.0/x-1.0");

    auto adjacent = parse_version_template("{version}{version}").value_or_exit(PAWNGET_LINE_INFO);
    CHECK(adjacent.segments.size() == 2);
    CHECK(adjacent.resolve("ab") == "abab");
}

TEST_CASE ("unknown placeholders are rejected", "[versiontemplate]")
{
    auto parsed = parse_version_template("pawnc-{release}.zip");
    REQUIRE(!parsed.has_value());
    CHECK(parsed.error() ==
          LocalizedString::from_raw("unknown placeholder 'release' in template 'pawnc-{release}.zip' at column 7; "
                                    "only {version} is supported"));

    REQUIRE_ERROR_CONTAINS(parse_version_template("{}"), "unknown placeholder ''");
    REQUIRE_ERROR_CONTAINS(parse_version_template("{Version}"), "unknown placeholder 'Version'");
}

TEST_CASE ("unbalanced braces are rejected", "[versiontemplate]")
{
    auto unclosed = parse_version_template("pawnc-{version");
    REQUIRE(!unclosed.has_value());
    CHECK(unclosed.error() ==
          LocalizedString::from_raw("unbalanced brace in template 'pawnc-{version' at column 7"));

    REQUIRE_ERROR_CONTAINS(parse_version_template("pawnc-version}"), "at column 14");
    REQUIRE_ERROR_CONTAINS(parse_version_template("{ver{version}}"), "at column 1");
}

TEST_CASE ("version validation", "[versiontemplate]")
{
    CHECK(is_valid_version("3.10.10"));
    CHECK(is_valid_version("3.10.10-rc1"));
    CHECK(is_valid_version("1.0+build_2"));
    CHECK(!is_valid_version(""));
    CHECK(!is_valid_version("."));
    CHECK(!is_valid_version(".."));
    CHECK(!is_valid_version("3.10/../../x"));
    CHECK(!is_valid_version("3.10 10"));
    CHECK(!is_valid_version("{version}"));

    REQUIRE_ERROR_CONTAINS(resolve_version_template("v{version}", "../x"), "'../x' is not a valid version");
}
