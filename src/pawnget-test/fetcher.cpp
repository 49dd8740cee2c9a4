#include <pawnget-test/util.h>

#include <pawnget/fetcher.h>

using namespace pawnget;

TEST_CASE ("fetch_artifact stores the download under its file name", "[fetcher]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("fetcher");
    fs.write_contents(base / "source.zip", "zip bytes", PAWNGET_LINE_INFO);
    fs.create_directories(base / "cache", PAWNGET_LINE_INFO);
    const ArtifactCache cache(fs, base / "cache");

    Test::FakeDownloader downloader(base / "source.zip");
    auto fetched =
        fetch_artifact(downloader, cache, "https://example.com/dl/pawnc.zip", "pawnc.zip", never_cancelled());
    REQUIRE(fetched.has_value());
    CHECK(*fetched.get() == base / "cache" / "pawnc.zip");
    CHECK(fs.read_contents(*fetched.get(), PAWNGET_LINE_INFO) == "zip bytes");
    CHECK(downloader.requested_urls() == std::vector<std::string>{"https://example.com/dl/pawnc.zip"});
}

TEST_CASE ("fetch_artifact failures leave the cache unchanged", "[fetcher]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("fetcher-failure");
    fs.write_contents(base / "source.zip", "zip bytes", PAWNGET_LINE_INFO);
    fs.create_directories(base / "cache", PAWNGET_LINE_INFO);
    const ArtifactCache cache(fs, base / "cache");

    Test::FakeDownloader truncating(base / "source.zip", Test::FakeDownloader::Mode::Truncate);
    auto truncated = fetch_artifact(truncating, cache, "https://example.com/pawnc.zip", "pawnc.zip", never_cancelled());
    REQUIRE(!truncated.has_value());
    CHECK(fs.get_regular_files_recursive(base / "cache", PAWNGET_LINE_INFO).empty());

    CancellationToken cancel;
    cancel.cancel();
    Test::FakeDownloader downloader(base / "source.zip");
    auto cancelled = fetch_artifact(downloader, cache, "https://example.com/pawnc.zip", "pawnc.zip", cancel);
    REQUIRE(!cancelled.has_value());
    CHECK(cancelled.error() == LocalizedString::from_raw("the download of https://example.com/pawnc.zip was cancelled"));
    CHECK(downloader.calls == 0);
    CHECK(!cache.has("pawnc.zip"));
}
