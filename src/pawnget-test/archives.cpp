#include <pawnget-test/util.h>

#include <pawnget/archives.h>

#include <chrono>

using namespace pawnget;

namespace
{
    const Test::FileList package_files{
        {"pawnc-1.0-linux/bin/pawncc", "compiler"},
        {"pawnc-1.0-linux/lib/libpawnc.so", "library"},
        {"pawnc-1.0-linux/include/amx.h", "header"},
    };

    const std::vector<PathMapping> package_map{
        {"pawnc-1.0-linux/bin/pawncc", "pawncc"},
        {"pawnc-1.0-linux/lib/libpawnc.so", "libpawnc.so"},
    };

    struct ArchiveFixture
    {
        ArchiveFixture(StringView name) : base(Test::fresh_test_directory(name))
        {
            Test::write_files(fs, base / "contents", package_files);
#if !defined(_WIN32)
            Test::make_executable(base / "contents" / "pawnc-1.0-linux/bin/pawncc");
#endif
            Test::make_tar_gz(base / "contents", tar_gz());
            Test::make_zip(base / "contents", zip());
            fs.create_directories(destination(), PAWNGET_LINE_INFO);
        }

        Path tar_gz() const { return base / "pawnc-1.0-linux.tar.gz"; }
        Path zip() const { return base / "pawnc-1.0-linux.zip"; }
        Path destination() const { return base / "out"; }

        const Filesystem& fs = real_filesystem;
        Path base;
    };
}

TEST_CASE ("extraction type names", "[archives]")
{
    CHECK(to_string_literal(ExtractionType::Zip) == "zip");
    CHECK(to_string_literal(ExtractionType::TarGzip) == "tar+gzip");
    CHECK(fmt::format("{}", ExtractionType::TarGzip) == "tar+gzip");
}

TEST_CASE ("extract mapped members from a tar.gz", "[archives]")
{
    ArchiveFixture fixture("archives-tar");
    auto result = extract_archive_members(fixture.fs,
                                          ExtractionType::TarGzip,
                                          fixture.tar_gz(),
                                          fixture.destination(),
                                          package_map,
                                          never_cancelled());
    REQUIRE(result.has_value());
    CHECK(fixture.fs.read_contents(fixture.destination() / "pawncc", PAWNGET_LINE_INFO) == "compiler");
    CHECK(fixture.fs.read_contents(fixture.destination() / "libpawnc.so", PAWNGET_LINE_INFO) == "library");

    // only mapped files are installed, and no scratch directory is left behind
    CHECK(fixture.fs.get_regular_files_recursive(fixture.destination(), PAWNGET_LINE_INFO).size() == 2);
    const auto base_files = fixture.fs.get_regular_files_recursive(fixture.base, PAWNGET_LINE_INFO);
    for (auto&& file : base_files)
    {
        CHECK(file.native().find(".partial") == std::string::npos);
    }

    // the archive is kept
    CHECK(fixture.fs.is_regular_file(fixture.tar_gz()));
}

TEST_CASE ("extract mapped members from a zip", "[archives]")
{
    ArchiveFixture fixture("archives-zip");
    auto result = extract_archive_members(
        fixture.fs, ExtractionType::Zip, fixture.zip(), fixture.destination(), package_map, never_cancelled());
    REQUIRE(result.has_value());
    CHECK(fixture.fs.read_contents(fixture.destination() / "pawncc", PAWNGET_LINE_INFO) == "compiler");
    CHECK(fixture.fs.read_contents(fixture.destination() / "libpawnc.so", PAWNGET_LINE_INFO) == "library");
    CHECK(!fixture.fs.exists(fixture.destination() / "amx.h", PAWNGET_LINE_INFO));
}

TEST_CASE ("install paths may name subdirectories and replace existing files", "[archives]")
{
    ArchiveFixture fixture("archives-nested");
    const std::vector<PathMapping> nested_map{
        {"pawnc-1.0-linux/bin/pawncc", "bin/pawncc"},
        {"pawnc-1.0-linux/include/amx.h", "include/pawn/amx.h"},
    };

    Test::write_files(fixture.fs, fixture.destination(), {{"bin/pawncc", "old compiler"}});
    auto result = extract_archive_members(fixture.fs,
                                          ExtractionType::TarGzip,
                                          fixture.tar_gz(),
                                          fixture.destination(),
                                          nested_map,
                                          never_cancelled());
    REQUIRE(result.has_value());
    CHECK(fixture.fs.read_contents(fixture.destination() / "bin/pawncc", PAWNGET_LINE_INFO) == "compiler");
    CHECK(fixture.fs.read_contents(fixture.destination() / "include/pawn/amx.h", PAWNGET_LINE_INFO) == "header");
}

TEST_CASE ("a missing member installs nothing", "[archives]")
{
    ArchiveFixture fixture("archives-missing");
    const std::vector<PathMapping> map_with_missing{
        {"pawnc-1.0-linux/bin/pawncc", "pawncc"},
        {"pawnc-1.0-linux/bin/pawndisasm", "pawndisasm"},
    };

    auto result = extract_archive_members(fixture.fs,
                                          ExtractionType::TarGzip,
                                          fixture.tar_gz(),
                                          fixture.destination(),
                                          map_with_missing,
                                          never_cancelled());
    REQUIRE(!result.has_value());
    CHECK(result.error().kind == ExtractionErrorKind::MissingMember);
    CHECK(result.error().member == "pawnc-1.0-linux/bin/pawndisasm");
    CHECK_THAT(result.error().message.data(), Catch::Contains("does not contain pawnc-1.0-linux/bin/pawndisasm"));
    CHECK(fixture.fs.get_regular_files_recursive(fixture.destination(), PAWNGET_LINE_INFO).empty());
}

TEST_CASE ("an archive that cannot be read is reported as unreadable", "[archives]")
{
    ArchiveFixture fixture("archives-garbage");
    const auto garbage = fixture.base / "garbage.tar.gz";
    fixture.fs.write_contents(garbage, "this is not a gzip stream", PAWNGET_LINE_INFO);
    auto tar_result = extract_archive_members(
        fixture.fs, ExtractionType::TarGzip, garbage, fixture.destination(), package_map, never_cancelled());
    REQUIRE(!tar_result.has_value());
    CHECK(tar_result.error().kind == ExtractionErrorKind::UnreadableArchive);

    // a tar.gz is not a zip
    auto zip_result = extract_archive_members(
        fixture.fs, ExtractionType::Zip, fixture.tar_gz(), fixture.destination(), package_map, never_cancelled());
    REQUIRE(!zip_result.has_value());
    CHECK(zip_result.error().kind == ExtractionErrorKind::UnreadableArchive);
    CHECK(fixture.fs.get_regular_files_recursive(fixture.destination(), PAWNGET_LINE_INFO).empty());
}

TEST_CASE ("a cancelled extraction installs nothing", "[archives]")
{
    ArchiveFixture fixture("archives-cancelled");
    CancellationToken cancel;
    cancel.cancel();
    auto result = extract_archive_members(
        fixture.fs, ExtractionType::TarGzip, fixture.tar_gz(), fixture.destination(), package_map, cancel);
    REQUIRE(!result.has_value());
    CHECK(result.error().kind == ExtractionErrorKind::Cancelled);
    CHECK(fixture.fs.get_regular_files_recursive(fixture.destination(), PAWNGET_LINE_INFO).empty());
}

#if !defined(_WIN32)
TEST_CASE ("executable members stay executable", "[archives]")
{
    ArchiveFixture fixture("archives-modes");
    const auto tar_destination = fixture.base / "from-tar";
    REQUIRE(extract_archive_members(fixture.fs,
                                    ExtractionType::TarGzip,
                                    fixture.tar_gz(),
                                    tar_destination,
                                    package_map,
                                    never_cancelled())
                .has_value());
    CHECK(Test::is_executable(tar_destination / "pawncc"));
    CHECK(!Test::is_executable(tar_destination / "libpawnc.so"));

    const auto zip_destination = fixture.base / "from-zip";
    REQUIRE(extract_archive_members(
                fixture.fs, ExtractionType::Zip, fixture.zip(), zip_destination, package_map, never_cancelled())
                .has_value());
    CHECK(Test::is_executable(zip_destination / "pawncc"));
    CHECK(!Test::is_executable(zip_destination / "libpawnc.so"));
}

TEST_CASE ("a tool stopped by cancellation is not an unreadable archive", "[archives]")
{
    ArchiveFixture fixture("archives-interrupted-tool");
    // stands in for a tar killed by the same SIGINT that cancels the token
    Test::write_tool_script(fixture.base / "tools", "tar", "sleep 2\nexit 130");
    Test::ScopedPathPrefix path_prefix(fixture.base / "tools");

    CancellationToken cancel;
    cancel.set_timeout(std::chrono::seconds(1));
    auto cancelled = extract_archive_members(
        fixture.fs, ExtractionType::TarGzip, fixture.tar_gz(), fixture.destination(), package_map, cancel);
    REQUIRE(!cancelled.has_value());
    CHECK(cancelled.error().kind == ExtractionErrorKind::Cancelled);

    // without cancellation the same exit code means the archive could not be read
    auto failed = extract_archive_members(fixture.fs,
                                          ExtractionType::TarGzip,
                                          fixture.tar_gz(),
                                          fixture.destination(),
                                          package_map,
                                          never_cancelled());
    REQUIRE(!failed.has_value());
    CHECK(failed.error().kind == ExtractionErrorKind::UnreadableArchive);
    CHECK_THAT(failed.error().message.data(), Catch::Contains("130"));
    CHECK(fixture.fs.get_regular_files_recursive(fixture.destination(), PAWNGET_LINE_INFO).empty());
}

TEST_CASE ("members stored as links install the file they point at", "[archives]")
{
    ArchiveFixture fixture("archives-links");
    const auto contents = fixture.base / "linked";
    Test::write_files(fixture.fs,
                      contents,
                      {
                          {"pawnc-1.0-linux/bin/pawncc", "compiler"},
                          {"pawnc-1.0-linux/lib/libpawnc.so.3", "library"},
                      });
    Test::make_executable(contents / "pawnc-1.0-linux/bin/pawncc");
    Test::create_symlink("libpawnc.so.3", contents / "pawnc-1.0-linux/lib/libpawnc.so");
    Test::create_symlink("../bin/pawncc", contents / "pawnc-1.0-linux/lib/pawncc");
    const auto archive = fixture.base / "linked.tar.gz";
    Test::make_tar_gz(contents, archive);

    const std::vector<PathMapping> linked_map{
        {"pawnc-1.0-linux/lib/pawncc", "pawncc"},
        {"pawnc-1.0-linux/lib/libpawnc.so", "libpawnc.so"},
        {"pawnc-1.0-linux/lib/libpawnc.so.3", "libpawnc.so.3"},
    };

    auto result = extract_archive_members(
        fixture.fs, ExtractionType::TarGzip, archive, fixture.destination(), linked_map, never_cancelled());
    REQUIRE(result.has_value());
    CHECK(fixture.fs.symlink_status(fixture.destination() / "libpawnc.so", PAWNGET_LINE_INFO) == FileType::regular);
    CHECK(fixture.fs.read_contents(fixture.destination() / "libpawnc.so", PAWNGET_LINE_INFO) == "library");
    CHECK(fixture.fs.read_contents(fixture.destination() / "libpawnc.so.3", PAWNGET_LINE_INFO) == "library");
    CHECK(fixture.fs.read_contents(fixture.destination() / "pawncc", PAWNGET_LINE_INFO) == "compiler");
    CHECK(Test::is_executable(fixture.destination() / "pawncc"));
}

TEST_CASE ("a link leaving the archive is not installed", "[archives]")
{
    ArchiveFixture fixture("archives-escaping-link");
    fixture.fs.write_contents(fixture.base / "outside.txt", "not part of the package", PAWNGET_LINE_INFO);
    const auto contents = fixture.base / "escaping";
    Test::write_files(fixture.fs, contents, {{"pawnc-1.0-linux/bin/pawncc", "compiler"}});
    Test::create_symlink((fixture.base / "outside.txt").native(), contents / "pawnc-1.0-linux/lib/libpawnc.so");
    const auto archive = fixture.base / "escaping.tar.gz";
    Test::make_tar_gz(contents, archive);

    auto escaping = extract_archive_members(
        fixture.fs, ExtractionType::TarGzip, archive, fixture.destination(), package_map, never_cancelled());
    REQUIRE(!escaping.has_value());
    CHECK(escaping.error().kind == ExtractionErrorKind::MissingMember);
    CHECK(escaping.error().member == "pawnc-1.0-linux/lib/libpawnc.so");
    CHECK_THAT(escaping.error().message.data(), Catch::Contains("is a link to a file outside the archive"));
    CHECK(fixture.fs.get_regular_files_recursive(fixture.destination(), PAWNGET_LINE_INFO).empty());

    // a dangling link is simply missing
    const auto dangling_contents = fixture.base / "dangling";
    Test::write_files(fixture.fs, dangling_contents, {{"pawnc-1.0-linux/bin/pawncc", "compiler"}});
    Test::create_symlink("libpawnc.so.9", dangling_contents / "pawnc-1.0-linux/lib/libpawnc.so");
    const auto dangling_archive = fixture.base / "dangling.tar.gz";
    Test::make_tar_gz(dangling_contents, dangling_archive);

    auto dangling = extract_archive_members(
        fixture.fs, ExtractionType::TarGzip, dangling_archive, fixture.destination(), package_map, never_cancelled());
    REQUIRE(!dangling.has_value());
    CHECK(dangling.error().kind == ExtractionErrorKind::MissingMember);
    CHECK_THAT(dangling.error().message.data(), Catch::Contains("does not contain pawnc-1.0-linux/lib/libpawnc.so"));
}
#endif
