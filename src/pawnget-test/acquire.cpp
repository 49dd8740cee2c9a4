#include <pawnget-test/util.h>

#include <pawnget/base/message_sinks.h>

#include <pawnget/acquire.h>
#include <pawnget/versiontemplate.h>

#include <algorithm>
#include <atomic>
#include <chrono>

using namespace pawnget;

namespace
{
    constexpr StringLiteral version = "3.10.10";
    constexpr StringLiteral archive_name = "pawnc-3.10.10-linux.tar.gz";
    constexpr StringLiteral url =
        "https://github.com/Zeex/pawn/releases/download/v3.10.10/pawnc-3.10.10-linux.tar.gz";

    // Forwards to the real filesystem, counting every call.
    struct CountingFilesystem final : Filesystem
    {
        virtual FileType status(const Path& target, std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.status(target, ec);
        }
        virtual FileType symlink_status(const Path& target, std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.symlink_status(target, ec);
        }
        virtual std::uint64_t file_size(const Path& file_path, std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.file_size(file_path, ec);
        }
        virtual std::string read_contents(const Path& file_path, std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.read_contents(file_path, ec);
        }
        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const override
        {
            ++calls;
            real_filesystem.write_contents(file_path, data, ec);
        }
        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.create_directories(new_directory, ec);
        }
        virtual bool remove(const Path& target, std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.remove(target, ec);
        }
        virtual void remove_all(const Path& base, std::error_code& ec) const override
        {
            ++calls;
            real_filesystem.remove_all(base, ec);
        }
        virtual void rename(const Path& old_path, const Path& new_path, std::error_code& ec) const override
        {
            ++calls;
            real_filesystem.rename(old_path, new_path, ec);
        }
        virtual bool copy_file(const Path& source,
                               const Path& destination,
                               CopyOptions options,
                               std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.copy_file(source, destination, options, ec);
        }
        virtual std::vector<Path> get_regular_files_recursive(const Path& dir, std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.get_regular_files_recursive(dir, ec);
        }
        virtual Path absolute(const Path& target, std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.absolute(target, ec);
        }
        virtual Path canonical(const Path& target, std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.canonical(target, ec);
        }
        virtual WriteFilePointer open_for_write(const Path& file_path,
                                                Append append,
                                                std::error_code& ec) const override
        {
            ++calls;
            return real_filesystem.open_for_write(file_path, append, ec);
        }

        mutable std::atomic<int> calls{0};
    };

    struct AcquireFixture
    {
        explicit AcquireFixture(StringView name) : base(Test::fresh_test_directory(name))
        {
            Test::write_files(fs,
                              base / "contents",
                              {
                                  {"pawnc-3.10.10-linux/bin/pawncc", "compiler"},
                                  {"pawnc-3.10.10-linux/lib/libpawnc.so", "library"},
                                  {"pawnc-3.10.10-linux/include/amx.h", "header"},
                              });
#if !defined(_WIN32)
            Test::make_executable(base / "contents" / "pawnc-3.10.10-linux/bin/pawncc");
#endif
            Test::make_tar_gz(base / "contents", good_archive());
        }

        Path good_archive() const { return base / "good.tar.gz"; }
        Path cache_root() const { return base / "cache"; }
        Path cache_entry() const { return cache_root() / archive_name; }

        AcquisitionContext context(const IArtifactDownloader& downloader,
                                   const CancellationToken& cancel = never_cancelled())
        {
            return AcquisitionContext{fs, downloader, cache_root(), status, cancel};
        }

        std::vector<Path> installed(const Path& destination) const
        {
            auto files = fs.get_regular_files_recursive(destination, PAWNGET_LINE_INFO);
            std::sort(files.begin(), files.end(), [](const Path& lhs, const Path& rhs) {
                return lhs.native() < rhs.native();
            });
            return files;
        }

        const Filesystem& fs = real_filesystem;
        BufferedMessageSink status;
        Path base;
    };
}

TEST_CASE ("catalog templates resolve completely", "[acquire]")
{
    for (auto platform : {Platform::Darwin, Platform::Linux, Platform::Windows})
    {
        for (StringView v : {"3.10.10", "1.0", "4.0.0-rc1", "x"})
        {
            auto package = resolve_package(lookup_package(platform), v).value_or_exit(PAWNGET_LINE_INFO);
            CHECK(package.url.find('{') == std::string::npos);
            CHECK(package.url.find('}') == std::string::npos);
            for (auto&& mapping : package.path_map)
            {
                CHECK(mapping.member.find('{') == std::string::npos);
                CHECK(mapping.install_path.find('{') == std::string::npos);
            }
        }
    }
}

TEST_CASE ("a second acquisition is served from the cache", "[acquire]")
{
    AcquireFixture fixture("acquire-idempotent");
    Test::FakeDownloader downloader(fixture.good_archive());

    const auto first = fixture.base / "first";
    auto first_result = acquire_artifact(fixture.context(downloader), Platform::Linux, version, first);
    REQUIRE(first_result.has_value());
    CHECK(downloader.calls == 1);
    CHECK(downloader.requested_urls() == std::vector<std::string>{url.to_string()});
    CHECK(fixture.fs.is_regular_file(fixture.cache_entry()));

    const auto second = fixture.base / "second";
    auto second_result = acquire_artifact(fixture.context(downloader), Platform::Linux, version, second);
    REQUIRE(second_result.has_value());
    CHECK(downloader.calls == 1);

    const auto first_files = fixture.installed(first);
    const auto second_files = fixture.installed(second);
    REQUIRE(first_files.size() == 2);
    REQUIRE(second_files.size() == 2);
    for (size_t idx = 0; idx < first_files.size(); ++idx)
    {
        CHECK(first_files[idx].filename() == second_files[idx].filename());
        CHECK(fixture.fs.read_contents(first_files[idx], PAWNGET_LINE_INFO) ==
              fixture.fs.read_contents(second_files[idx], PAWNGET_LINE_INFO));
    }

    CHECK(fixture.fs.read_contents(second / "pawncc", PAWNGET_LINE_INFO) == "compiler");
    CHECK(fixture.fs.read_contents(second / "libpawnc.so", PAWNGET_LINE_INFO) == "library");
#if !defined(_WIN32)
    CHECK(Test::is_executable(first / "pawncc"));
    CHECK(Test::is_executable(second / "pawncc"));
#endif
    CHECK_THAT(fixture.status.text(), Catch::Contains("Using cached package"));
}

TEST_CASE ("a corrupt cache entry is downloaded again", "[acquire]")
{
    AcquireFixture fixture("acquire-corrupt");
    fixture.fs.create_directories(fixture.cache_root(), PAWNGET_LINE_INFO);
    fixture.fs.write_contents(fixture.cache_entry(), "truncated download", PAWNGET_LINE_INFO);

    Test::FakeDownloader downloader(fixture.good_archive());
    auto result = acquire_artifact(fixture.context(downloader), Platform::Linux, version, fixture.base / "out");
    REQUIRE(result.has_value());
    CHECK(downloader.calls == 1);
    CHECK(fixture.fs.read_contents(fixture.base / "out" / "pawncc", PAWNGET_LINE_INFO) == "compiler");
    CHECK(fixture.fs.read_contents(fixture.cache_entry(), PAWNGET_LINE_INFO) ==
          fixture.fs.read_contents(fixture.good_archive(), PAWNGET_LINE_INFO));

    bool warned = false;
    for (auto&& line : fixture.status.lines())
    {
        if (line.color == Color::warning)
        {
            warned = true;
            CHECK_THAT(line.text, Catch::Contains("is unusable and will be downloaded again"));
        }
    }

    CHECK(warned);

    // the replaced entry now serves further acquisitions
    auto again = acquire_artifact(fixture.context(downloader), Platform::Linux, version, fixture.base / "again");
    REQUIRE(again.has_value());
    CHECK(downloader.calls == 1);
}

TEST_CASE ("a member missing from the download is named", "[acquire]")
{
    AcquireFixture fixture("acquire-missing-member");
    Test::write_files(fixture.fs, fixture.base / "partial", {{"pawnc-3.10.10-linux/bin/pawncc", "compiler"}});
    const auto partial_archive = fixture.base / "partial.tar.gz";
    Test::make_tar_gz(fixture.base / "partial", partial_archive);

    Test::FakeDownloader downloader(partial_archive);
    const auto destination = fixture.base / "out";
    auto result = acquire_artifact(fixture.context(downloader), Platform::Linux, version, destination);
    REQUIRE(!result.has_value());
    CHECK(result.error().stage == AcquisitionStage::Extraction);
    CHECK_THAT(result.error().message.data(), Catch::Contains("pawnc-3.10.10-linux/lib/libpawnc.so"));
    CHECK_THAT(result.error().message.data(),
               Catch::StartsWith("failed to acquire pawnc 3.10.10 for linux\nwhile installing the compiler files:"));

    // nothing was installed, and nothing but the downloaded archive remains in the cache
    CHECK(fixture.installed(destination).empty());
    const auto cache_files = fixture.fs.get_regular_files_recursive(fixture.cache_root(), PAWNGET_LINE_INFO);
    REQUIRE(cache_files.size() == 1);
    CHECK(cache_files[0].filename() == archive_name);
}

TEST_CASE ("an interrupted download leaves no cache entry", "[acquire]")
{
    AcquireFixture fixture("acquire-interrupted");
    Test::FakeDownloader downloader(fixture.good_archive(), Test::FakeDownloader::Mode::Truncate);
    const auto destination = fixture.base / "out";
    auto result = acquire_artifact(fixture.context(downloader), Platform::Linux, version, destination);
    REQUIRE(!result.has_value());
    CHECK(result.error().stage == AcquisitionStage::Network);
    CHECK(!fixture.fs.exists(fixture.cache_entry(), PAWNGET_LINE_INFO));
    CHECK(fixture.fs.get_regular_files_recursive(fixture.cache_root(), PAWNGET_LINE_INFO).empty());
    CHECK(fixture.installed(destination).empty());

    // a later complete download succeeds
    Test::FakeDownloader working(fixture.good_archive());
    REQUIRE(acquire_artifact(fixture.context(working), Platform::Linux, version, destination).has_value());
    CHECK(fixture.fs.is_regular_file(fixture.cache_entry()));
}

TEST_CASE ("a failed download keeps an existing destination intact", "[acquire]")
{
    AcquireFixture fixture("acquire-network-failure");
    Test::FakeDownloader downloader(fixture.good_archive(), Test::FakeDownloader::Mode::Fail);
    const auto destination = fixture.base / "out";
    Test::write_files(fixture.fs, destination, {{"pawncc", "previous compiler"}});

    auto result = acquire_artifact(fixture.context(downloader), Platform::Linux, version, destination);
    REQUIRE(!result.has_value());
    CHECK(result.error().stage == AcquisitionStage::Network);
    CHECK_THAT(result.error().message.data(), Catch::Contains("failed to download " + url.to_string()));
    CHECK(fixture.fs.read_contents(destination / "pawncc", PAWNGET_LINE_INFO) == "previous compiler");
}

TEST_CASE ("an unsupported platform performs no I/O", "[acquire]")
{
    CountingFilesystem fs;
    Test::FakeDownloader downloader(Test::base_temporary_directory() / "unused.tar.gz");
    BufferedMessageSink status;
    const AcquisitionContext context{
        fs, downloader, Test::base_temporary_directory() / "unsupported-cache", status, never_cancelled()};

    auto result = acquire_artifact(context, "freebsd", version, Test::base_temporary_directory() / "unsupported");
    REQUIRE(!result.has_value());
    CHECK(result.error().stage == AcquisitionStage::ResolveDescriptor);
    CHECK(result.error().message ==
          LocalizedString::from_raw("failed to acquire pawnc 3.10.10 for freebsd\n"
                                    "while resolving the compiler package:\n"
                                    "unsupported platform 'freebsd'; supported platforms are: darwin, linux, windows"));
    CHECK(fs.calls == 0);
    CHECK(downloader.calls == 0);
    CHECK(status.lines().empty());
}

TEST_CASE ("an invalid version performs no I/O", "[acquire]")
{
    CountingFilesystem fs;
    Test::FakeDownloader downloader(Test::base_temporary_directory() / "unused.tar.gz");
    BufferedMessageSink status;
    const AcquisitionContext context{
        fs, downloader, Test::base_temporary_directory() / "invalid-version-cache", status, never_cancelled()};

    auto result = acquire_artifact(context, "linux", "../3.10", Test::base_temporary_directory() / "invalid");
    REQUIRE(!result.has_value());
    CHECK(result.error().stage == AcquisitionStage::ResolveDescriptor);
    CHECK(fs.calls == 0);
    CHECK(downloader.calls == 0);
}

TEST_CASE ("a cancelled acquisition stops before downloading", "[acquire]")
{
    AcquireFixture fixture("acquire-cancelled");
    Test::FakeDownloader downloader(fixture.good_archive());
    CancellationToken cancel;
    cancel.cancel();
    auto result =
        acquire_artifact(fixture.context(downloader, cancel), Platform::Linux, version, fixture.base / "out");
    REQUIRE(!result.has_value());
    CHECK(result.error().stage == AcquisitionStage::Network);
    CHECK(downloader.calls == 0);
    CHECK(!fixture.fs.exists(fixture.cache_entry(), PAWNGET_LINE_INFO));
}

#if !defined(_WIN32)
TEST_CASE ("cancelling while a cached package unpacks keeps the entry", "[acquire]")
{
    AcquireFixture fixture("acquire-cancelled-unpack");
    Test::FakeDownloader downloader(fixture.good_archive());
    REQUIRE(acquire_artifact(fixture.context(downloader), Platform::Linux, version, fixture.base / "first")
                .has_value());
    REQUIRE(downloader.calls == 1);

    // stands in for a tar killed by the same SIGINT that cancels the token
    Test::write_tool_script(fixture.base / "tools", "tar", "sleep 2\nexit 130");
    Test::ScopedPathPrefix path_prefix(fixture.base / "tools");
    CancellationToken cancel;
    cancel.set_timeout(std::chrono::seconds(1));
    auto result =
        acquire_artifact(fixture.context(downloader, cancel), Platform::Linux, version, fixture.base / "second");
    REQUIRE(!result.has_value());
    CHECK(result.error().stage == AcquisitionStage::Cache);
    CHECK(downloader.calls == 1);
    for (auto&& line : fixture.status.lines())
    {
        CHECK(line.color != Color::warning);
    }

    CHECK(fixture.fs.read_contents(fixture.cache_entry(), PAWNGET_LINE_INFO) ==
          fixture.fs.read_contents(fixture.good_archive(), PAWNGET_LINE_INFO));
}
#endif

TEST_CASE ("acquisition stage names", "[acquire]")
{
    CHECK(to_string_literal(AcquisitionStage::ResolveDescriptor) == "resolve");
    CHECK(to_string_literal(AcquisitionStage::Cache) == "cache");
    CHECK(to_string_literal(AcquisitionStage::Network) == "network");
    CHECK(fmt::format("{}", AcquisitionStage::Extraction) == "extraction");
}
