#include <pawnget-test/util.h>

#include <pawnget/base/downloads.h>
#include <pawnget/base/expected.h>

using namespace pawnget;

TEST_CASE ("parse_split_url_view", "[downloads]")
{
    {
        auto x = parse_split_url_view("https://github.com/Zeex/pawn");
        if (auto v = x.get())
        {
            REQUIRE(v->scheme == "https");
            REQUIRE(v->authority.value_or("") == "//github.com");
            REQUIRE(v->path_query_fragment == "/Zeex/pawn");
        }
        else
        {
            FAIL();
        }
    }
    {
        REQUIRE(!parse_split_url_view("").has_value());
        REQUIRE(!parse_split_url_view("hello").has_value());
        REQUIRE(!parse_split_url_view(":nothing").has_value());
    }
    {
        auto x = parse_split_url_view("file:path");
        if (auto y = x.get())
        {
            REQUIRE(y->scheme == "file");
            REQUIRE(!y->authority.has_value());
            REQUIRE(y->path_query_fragment == "path");
        }
        else
        {
            FAIL();
        }
    }
    {
        auto x = parse_split_url_view("https://example.com");
        if (auto y = x.get())
        {
            REQUIRE(y->authority.value_or("") == "//example.com");
            REQUIRE(y->path_query_fragment == "");
        }
        else
        {
            FAIL();
        }
    }
}

TEST_CASE ("url_filename", "[downloads]")
{
    auto filename_of = [](StringView url) {
        return url_filename(parse_split_url_view(url).value_or_exit(PAWNGET_LINE_INFO)).to_string();
    };

    CHECK(filename_of("https://github.com/Zeex/pawn/releases/download/v3.10.10/pawnc-3.10.10-linux.tar.gz") ==
          "pawnc-3.10.10-linux.tar.gz");
    CHECK(filename_of("https://example.com/a/pawnc.zip?token=abc#frag") == "pawnc.zip");
    CHECK(filename_of("https://example.com/a/") == "");
    CHECK(filename_of("https://example.com") == "");
}

TEST_CASE ("is_well_formed_download_url", "[downloads]")
{
    CHECK(is_well_formed_download_url("https://github.com/Zeex/pawn/releases/download/v1/pawnc-1-linux.tar.gz"));
    CHECK(is_well_formed_download_url("http://localhost:8080/pawnc.zip"));
    CHECK(!is_well_formed_download_url("pawnc.zip"));
    CHECK(!is_well_formed_download_url("https:///pawnc.zip"));
    CHECK(!is_well_formed_download_url("https://example.com/"));
    CHECK(!is_well_formed_download_url("https://exa mple.com/pawnc.zip"));
    CHECK(!is_well_formed_download_url("ht tp://example.com/pawnc.zip"));
}

#if !defined(_WIN32)
TEST_CASE ("download a file url", "[downloads]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("downloads-file");
    const auto source = base / "source.bin";
    std::string payload(100000, 'p');
    fs.write_contents(source, payload, PAWNGET_LINE_INFO);

    const auto target = base / "target.bin";
    {
        auto out = fs.open_for_write(target, PAWNGET_LINE_INFO);
        auto result = download_to_file_pointer("file://" + source.native(), out, never_cancelled());
        REQUIRE(result.has_value());
        CHECK(!out.close());
    }

    CHECK(fs.read_contents(target, PAWNGET_LINE_INFO) == payload);
}

TEST_CASE ("download a missing file url", "[downloads]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("downloads-missing");
    auto out = fs.open_for_write(base / "target.bin", PAWNGET_LINE_INFO);
    const auto url = "file://" + (base / "no-such-file").native();
    auto result = download_to_file_pointer(url, out, never_cancelled());
    REQUIRE(!result.has_value());
    CHECK_THAT(result.error().data(), Catch::StartsWith("failed to download " + url));
}
#endif

TEST_CASE ("cancelled downloads do not start", "[downloads]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("downloads-cancelled");
    auto out = fs.open_for_write(base / "target.bin", PAWNGET_LINE_INFO);

    CancellationToken cancel;
    cancel.cancel();
    auto cancelled = download_to_file_pointer("https://localhost.invalid/pawnc.zip", out, cancel);
    REQUIRE(!cancelled.has_value());
    CHECK(cancelled.error() ==
          LocalizedString::from_raw("the download of https://localhost.invalid/pawnc.zip was cancelled"));

    CancellationToken expired;
    expired.set_deadline(CancellationToken::clock::now() - std::chrono::seconds(1));
    auto timed_out = download_to_file_pointer("https://localhost.invalid/pawnc.zip", out, expired);
    REQUIRE(!timed_out.has_value());
    CHECK_THAT(timed_out.error().data(), Catch::Contains("the download timed out"));
}
