#include <pawnget-test/util.h>

#include <pawnget/base/files.h>

#include <string>

using namespace pawnget;

namespace
{
    void test_parent_path(Path input, StringView expected)
    {
        const auto actual = input.parent_path();
        CHECK(actual == expected);
        const bool should_change = input.native().size() != expected.size();
        CHECK(input.make_parent_path() == should_change);
        CHECK(input.native() == expected);
    }
}

TEST_CASE ("Path::make_parent_path and Path::parent_path", "[filesystem][files]")
{
    test_parent_path({}, {});
    test_parent_path("/a/", "/a");
    test_parent_path("/a/b", "/a");
    test_parent_path("/a////////b", "/a");
    test_parent_path("/a", "/");
    test_parent_path("/", "/");
    test_parent_path("a/b", "a");
    test_parent_path("a", "");
}

TEST_CASE ("Path::operator/", "[filesystem][files]")
{
    CHECK((Path("cache") / "pawnc.tar.gz").native() == "cache" PAWNGET_PREFERRED_SEPARATOR "pawnc.tar.gz");
    CHECK((Path("cache/") / "pawnc.tar.gz").native() == "cache/pawnc.tar.gz");
    CHECK((Path() / "pawnc.tar.gz").native() == "pawnc.tar.gz");
#if !defined(_WIN32)
    CHECK((Path("cache") / "/elsewhere").native() == "/elsewhere");
#endif
}

TEST_CASE ("Path filename, extension, and stem", "[filesystem][files]")
{
    const Path archive("/cache/pawnget/pawnc-3.10.10-linux.tar.gz");
    CHECK(archive.filename() == "pawnc-3.10.10-linux.tar.gz");
    CHECK(archive.extension() == ".gz");
    CHECK(archive.stem() == "pawnc-3.10.10-linux.tar");

    CHECK(Path("dir/.bashrc").extension() == "");
    CHECK(Path("dir/..").extension() == "");
    CHECK(Path("dir/").filename() == "");
    CHECK(Path("pawncc").extension() == "");
}

TEST_CASE ("is_absolute_path", "[filesystem][files]")
{
#if defined(_WIN32)
    CHECK(is_absolute_path("C:\\pawnc"));
    CHECK(is_absolute_path("C:/pawnc"));
    CHECK(!is_absolute_path("C:pawnc"));
#else
    CHECK(is_absolute_path("/tmp"));
    CHECK(!is_absolute_path("tmp/pawnc"));
#endif
    CHECK(!is_absolute_path(""));
}

TEST_CASE ("real filesystem round trip", "[filesystem][files]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("files");
    const auto nested = base / "a" / "b";
    CHECK(fs.create_directories(nested, PAWNGET_LINE_INFO));
    CHECK(!fs.create_directories(nested, PAWNGET_LINE_INFO));
    CHECK(fs.is_directory(nested));

    const auto file = nested / "pawncc";
    fs.write_contents(file, "compiler", PAWNGET_LINE_INFO);
    CHECK(fs.is_regular_file(file));
    CHECK(fs.file_size(file, PAWNGET_LINE_INFO) == 8);
    CHECK(fs.read_contents(file, PAWNGET_LINE_INFO) == "compiler");

    const auto moved = base / "pawncc";
    fs.rename(file, moved, PAWNGET_LINE_INFO);
    CHECK(!fs.exists(file, PAWNGET_LINE_INFO));
    CHECK(fs.read_contents(moved, PAWNGET_LINE_INFO) == "compiler");

    std::error_code ec;
    CHECK(fs.status(base / "missing", ec) == FileType::not_found);
    CHECK(!ec);

    const auto files = fs.get_regular_files_recursive(base, PAWNGET_LINE_INFO);
    REQUIRE(files.size() == 1);
    CHECK(files[0].filename() == "pawncc");

    fs.remove_all(base, PAWNGET_LINE_INFO);
    CHECK(!fs.exists(base, PAWNGET_LINE_INFO));
}

TEST_CASE ("WriteFilePointer reports the file it writes", "[filesystem][files]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("file-pointer");
    const auto target = base / "out.bin";
    {
        auto out = fs.open_for_write(target, PAWNGET_LINE_INFO);
        REQUIRE(static_cast<bool>(out));
        CHECK(out.path() == target);
        static constexpr char data[] = "abc";
        CHECK(out.write(data, 1, 3) == 3);
        CHECK(!out.close());
    }

    CHECK(fs.read_contents(target, PAWNGET_LINE_INFO) == "abc");

    std::error_code ec;
    auto missing = fs.open_for_write(base / "no-such-dir" / "out.bin", Append::NO, ec);
    CHECK(ec);
    CHECK(!missing);
}

TEST_CASE ("TemporaryDirectory removes its tree", "[filesystem][files]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("temporary-directory");
    const auto scratch = base / "scratch";
    {
        TemporaryDirectory guard(fs, scratch);
        Test::write_files(fs, scratch, {{"x/y.txt", "y"}});
        CHECK(fs.is_regular_file(scratch / "x" / "y.txt"));
    }

    CHECK(!fs.exists(scratch, PAWNGET_LINE_INFO));
}

TEST_CASE ("format_filesystem_call_error", "[filesystem][files]")
{
    const auto ec = std::make_error_code(std::errc::no_such_file_or_directory);
    const auto message = format_filesystem_call_error(ec, "rename", {"a", "b"});
    CHECK(message.data() == "rename(\"a\", \"b\"): " + ec.message());
}

#if !defined(_WIN32)
TEST_CASE ("status follows links and symlink_status does not", "[filesystem][files]")
{
    const auto& fs = real_filesystem;
    const auto base = Test::fresh_test_directory("symlinks");
    fs.write_contents(base / "libpawnc.so.3", "library", PAWNGET_LINE_INFO);
    Test::create_symlink("libpawnc.so.3", base / "libpawnc.so");
    Test::create_symlink("nowhere", base / "dangling");

    CHECK(fs.status(base / "libpawnc.so", PAWNGET_LINE_INFO) == FileType::regular);
    CHECK(fs.symlink_status(base / "libpawnc.so", PAWNGET_LINE_INFO) == FileType::symlink);
    CHECK(fs.status(base / "dangling", PAWNGET_LINE_INFO) == FileType::not_found);
    CHECK(fs.symlink_status(base / "dangling", PAWNGET_LINE_INFO) == FileType::symlink);
    CHECK(fs.symlink_status(base / "missing", PAWNGET_LINE_INFO) == FileType::not_found);

    const auto canonical_base = fs.canonical(base, PAWNGET_LINE_INFO);
    CHECK(fs.canonical(base / "libpawnc.so", PAWNGET_LINE_INFO) == canonical_base / "libpawnc.so.3");

    std::error_code ec;
    fs.canonical(base / "dangling", ec);
    CHECK(ec);

    fs.remove_all(base, PAWNGET_LINE_INFO);
}
#endif
