#include <pawnget-test/util.h>

#include <pawnget/base/system.h>

#include <pawnget/artifactcache.h>

using namespace pawnget;

namespace
{
    ResolvedPackage make_package()
    {
        ResolvedPackage package;
        package.platform = Platform::Linux;
        package.version = "1.0";
        package.url = "https://example.com/pawnc-1.0-linux.tar.gz";
        package.filename = "pawnc-1.0-linux.tar.gz";
        package.extraction = ExtractionType::TarGzip;
        package.path_map = {
            {"pawnc-1.0-linux/bin/pawncc", "pawncc"},
            {"pawnc-1.0-linux/lib/libpawnc.so", "libpawnc.so"},
        };
        return package;
    }

    ArtifactWriter write_text(std::string text)
    {
        return [text = std::move(text)](WriteFilePointer& out) -> ExpectedL<Unit> {
            if (out.write(text.data(), 1, text.size()) != text.size())
            {
                return LocalizedString::from_raw("short write");
            }

            return Unit{};
        };
    }

    // Nothing but finished entries in the cache directory
    void check_no_temporaries(const Filesystem& fs, const Path& root)
    {
        for (auto&& file : fs.get_regular_files_recursive(root, PAWNGET_LINE_INFO))
        {
            CHECK(!file.filename().ends_with(".part"));
            CHECK(file.native().find(".partial") == std::string::npos);
        }
    }
}

TEST_CASE ("cache entries are named by file name", "[artifactcache]")
{
    const auto& fs = real_filesystem;
    const auto root = Test::fresh_test_directory("cache-names");
    ArtifactCache cache(fs, root);
    CHECK(cache.root() == root);
    CHECK(cache.entry_path("pawnc-1.0-linux.tar.gz") == root / "pawnc-1.0-linux.tar.gz");
    CHECK(!cache.has("pawnc-1.0-linux.tar.gz"));
}

TEST_CASE ("store publishes a complete entry", "[artifactcache]")
{
    const auto& fs = real_filesystem;
    const auto root = Test::fresh_test_directory("cache-store");
    ArtifactCache cache(fs, root);
    auto stored = cache.store("pawnc-1.0-linux.tar.gz", write_text("archive bytes"));
    REQUIRE(stored.has_value());
    CHECK(*stored.get() == cache.entry_path("pawnc-1.0-linux.tar.gz"));
    CHECK(cache.has("pawnc-1.0-linux.tar.gz"));
    CHECK(fs.read_contents(*stored.get(), PAWNGET_LINE_INFO) == "archive bytes");
    check_no_temporaries(fs, root);

    // storing again replaces the entry
    REQUIRE(cache.store("pawnc-1.0-linux.tar.gz", write_text("newer bytes")).has_value());
    CHECK(fs.read_contents(*stored.get(), PAWNGET_LINE_INFO) == "newer bytes");
    check_no_temporaries(fs, root);
}

TEST_CASE ("a failed store leaves no entry behind", "[artifactcache]")
{
    const auto& fs = real_filesystem;
    const auto root = Test::fresh_test_directory("cache-store-failure");
    ArtifactCache cache(fs, root);
    auto failed = cache.store("pawnc-1.0-linux.tar.gz", [](WriteFilePointer& out) -> ExpectedL<Unit> {
        static constexpr char half[] = "half an arch";
        out.write(half, 1, sizeof(half) - 1);
        return LocalizedString::from_raw("connection reset");
    });

    REQUIRE(!failed.has_value());
    CHECK(failed.error() == LocalizedString::from_raw("connection reset"));
    CHECK(!cache.has("pawnc-1.0-linux.tar.gz"));
    CHECK(fs.get_regular_files_recursive(root, PAWNGET_LINE_INFO).empty());
}

TEST_CASE ("a failed store keeps the previous entry", "[artifactcache]")
{
    const auto& fs = real_filesystem;
    const auto root = Test::fresh_test_directory("cache-store-keeps");
    ArtifactCache cache(fs, root);
    REQUIRE(cache.store("pawnc-1.0-linux.tar.gz", write_text("good bytes")).has_value());
    auto failed = cache.store("pawnc-1.0-linux.tar.gz",
                              [](WriteFilePointer&) -> ExpectedL<Unit> { return LocalizedString::from_raw("nope"); });
    REQUIRE(!failed.has_value());
    CHECK(fs.read_contents(cache.entry_path("pawnc-1.0-linux.tar.gz"), PAWNGET_LINE_INFO) == "good bytes");
    check_no_temporaries(fs, root);
}

TEST_CASE ("store into a missing cache directory fails cleanly", "[artifactcache]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("cache-store-no-root");
    ArtifactCache cache(fs, base / "does-not-exist");
    auto failed = cache.store("pawnc-1.0-linux.tar.gz", write_text("bytes"));
    REQUIRE(!failed.has_value());
    CHECK_THAT(failed.error().data(), Catch::Contains("failed to store"));
}

TEST_CASE ("satisfy reports a miss without touching the destination", "[artifactcache]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("cache-miss");
    fs.create_directories(base / "cache", PAWNGET_LINE_INFO);
    fs.create_directories(base / "out", PAWNGET_LINE_INFO);
    ArtifactCache cache(fs, base / "cache");
    auto result = cache.satisfy(make_package(), base / "out", never_cancelled());
    REQUIRE(result.has_value());
    CHECK(!*result.get());
    CHECK(fs.get_regular_files_recursive(base / "out", PAWNGET_LINE_INFO).empty());

    // a directory in place of the entry is not an entry
    fs.create_directories(base / "cache" / "pawnc-1.0-linux.tar.gz", PAWNGET_LINE_INFO);
    auto directory_result = cache.satisfy(make_package(), base / "out", never_cancelled());
    REQUIRE(directory_result.has_value());
    CHECK(!*directory_result.get());
}

TEST_CASE ("satisfy installs from a usable entry", "[artifactcache]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("cache-hit");
    Test::write_files(fs,
                      base / "contents",
                      {{"pawnc-1.0-linux/bin/pawncc", "compiler"}, {"pawnc-1.0-linux/lib/libpawnc.so", "library"}});
    fs.create_directories(base / "cache", PAWNGET_LINE_INFO);
    Test::make_tar_gz(base / "contents", base / "cache" / "pawnc-1.0-linux.tar.gz");
    fs.create_directories(base / "out", PAWNGET_LINE_INFO);

    ArtifactCache cache(fs, base / "cache");
    auto result = cache.satisfy(make_package(), base / "out", never_cancelled());
    REQUIRE(result.has_value());
    CHECK(*result.get());
    CHECK(fs.read_contents(base / "out" / "pawncc", PAWNGET_LINE_INFO) == "compiler");
    CHECK(fs.read_contents(base / "out" / "libpawnc.so", PAWNGET_LINE_INFO) == "library");
    CHECK(cache.has("pawnc-1.0-linux.tar.gz"));
}

TEST_CASE ("satisfy reports corrupt entries", "[artifactcache]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("cache-corrupt");
    fs.create_directories(base / "cache", PAWNGET_LINE_INFO);
    fs.create_directories(base / "out", PAWNGET_LINE_INFO);
    fs.write_contents(base / "cache" / "pawnc-1.0-linux.tar.gz", "truncated", PAWNGET_LINE_INFO);

    ArtifactCache cache(fs, base / "cache");
    auto result = cache.satisfy(make_package(), base / "out", never_cancelled());
    REQUIRE(!result.has_value());
    CHECK(result.error().kind == CacheErrorKind::Corrupt);
    CHECK_THAT(result.error().message.data(), Catch::Contains("is unusable and will be downloaded again"));
    CHECK(fs.get_regular_files_recursive(base / "out", PAWNGET_LINE_INFO).empty());

    // an archive without the expected members is corrupt too
    Test::write_files(fs, base / "contents", {{"unrelated.txt", "x"}});
    Test::make_tar_gz(base / "contents", base / "cache" / "pawnc-1.0-linux.tar.gz");
    auto missing = cache.satisfy(make_package(), base / "out", never_cancelled());
    REQUIRE(!missing.has_value());
    CHECK(missing.error().kind == CacheErrorKind::Corrupt);
}

TEST_CASE ("satisfy honors cancellation", "[artifactcache]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("cache-cancelled");
    Test::write_files(fs,
                      base / "contents",
                      {{"pawnc-1.0-linux/bin/pawncc", "compiler"}, {"pawnc-1.0-linux/lib/libpawnc.so", "library"}});
    fs.create_directories(base / "cache", PAWNGET_LINE_INFO);
    Test::make_tar_gz(base / "contents", base / "cache" / "pawnc-1.0-linux.tar.gz");

    CancellationToken cancel;
    cancel.cancel();
    ArtifactCache cache(fs, base / "cache");
    auto result = cache.satisfy(make_package(), base / "out", cancel);
    REQUIRE(!result.has_value());
    CHECK(result.error().kind == CacheErrorKind::Cancelled);
}

TEST_CASE ("default cache root", "[artifactcache]")
{
    const auto original = get_environment_variable(EnvironmentVariablePawngetCacheRoot);

#if defined(_WIN32)
    const StringLiteral absolute_root = "C:\\pawnget-cache";
#else
    const StringLiteral absolute_root = "/var/cache/pawnget-test";
#endif
    set_environment_variable(EnvironmentVariablePawngetCacheRoot, absolute_root);
    auto from_env = get_default_cache_root();
    REQUIRE(from_env.has_value());
    CHECK(from_env.get()->native() == absolute_root);

    set_environment_variable(EnvironmentVariablePawngetCacheRoot, "relative/cache");
    auto relative = get_default_cache_root();
    REQUIRE(!relative.has_value());
    CHECK_THAT(relative.error().data(), Catch::Contains("must be an absolute path"));

    if (auto value = original.get())
    {
        set_environment_variable(EnvironmentVariablePawngetCacheRoot, *value);
    }
    else
    {
        set_environment_variable(EnvironmentVariablePawngetCacheRoot, nullopt);
    }
}
