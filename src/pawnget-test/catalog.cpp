#include <pawnget-test/util.h>

#include <pawnget/catalog.h>

using namespace pawnget;

TEST_CASE ("platform names", "[catalog]")
{
    CHECK(to_string_literal(Platform::Darwin) == "darwin");
    CHECK(to_string_literal(Platform::Linux) == "linux");
    CHECK(to_string_literal(Platform::Windows) == "windows");

    CHECK(to_platform("linux").value_or(Platform::Windows) == Platform::Linux);
    CHECK(!to_platform("Linux").has_value());
    CHECK(!to_platform("freebsd").has_value());
    CHECK(!to_platform("").has_value());

    CHECK(supported_platform_names() == "darwin, linux, windows");
    CHECK(fmt::format("{}", Platform::Darwin) == "darwin");
}

TEST_CASE ("host platform", "[catalog]")
{
    const auto host = get_host_platform();
#if defined(_WIN32)
    CHECK(host.value_or(Platform::Linux) == Platform::Windows);
#elif defined(__APPLE__)
    CHECK(host.value_or(Platform::Linux) == Platform::Darwin);
#elif defined(__linux__)
    CHECK(host.value_or(Platform::Darwin) == Platform::Linux);
#else
    CHECK(!host.has_value());
#endif
}

TEST_CASE ("every platform has a descriptor", "[catalog]")
{
    for (auto platform : {Platform::Darwin, Platform::Linux, Platform::Windows})
    {
        const auto& descriptor = lookup_package(platform);
        CHECK(descriptor.platform == platform);
        CHECK(descriptor.path_map_size() == 2);
        auto resolved = resolve_package(descriptor, "3.10.10");
        REQUIRE(resolved.has_value());
    }
}

TEST_CASE ("lookup_package by name", "[catalog]")
{
    auto linux_package = lookup_package("linux");
    REQUIRE(linux_package.has_value());
    CHECK((*linux_package.get())->platform == Platform::Linux);

    auto unknown = lookup_package("amiga");
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error() == LocalizedString::from_raw(
                                 "unsupported platform 'amiga'; supported platforms are: darwin, linux, windows"));
}

TEST_CASE ("resolve the linux package", "[catalog]")
{
    auto resolved = resolve_package(lookup_package(Platform::Linux), "3.10.10").value_or_exit(PAWNGET_LINE_INFO);
    CHECK(resolved.platform == Platform::Linux);
    CHECK(resolved.version == "3.10.10");
    CHECK(resolved.url == "https://github.com/Zeex/pawn/releases/download/v3.10.10/pawnc-3.10.10-linux.tar.gz");
    CHECK(resolved.filename == "pawnc-3.10.10-linux.tar.gz");
    CHECK(resolved.extraction == ExtractionType::TarGzip);
    const std::vector<PathMapping> expected{
        {"pawnc-3.10.10-linux/bin/pawncc", "pawncc"},
        {"pawnc-3.10.10-linux/lib/libpawnc.so", "libpawnc.so"},
    };
    CHECK(resolved.path_map == expected);
}

TEST_CASE ("resolve the windows and darwin packages", "[catalog]")
{
    auto windows = resolve_package(lookup_package(Platform::Windows), "3.10.8").value_or_exit(PAWNGET_LINE_INFO);
    CHECK(windows.filename == "pawnc-3.10.8-windows.zip");
    CHECK(windows.extraction == ExtractionType::Zip);
    REQUIRE(windows.path_map.size() == 2);
    CHECK(windows.path_map[0] == PathMapping{"pawnc-3.10.8-windows/bin/pawncc.exe", "pawncc.exe"});
    CHECK(windows.path_map[1] == PathMapping{"pawnc-3.10.8-windows/bin/pawnc.dll", "pawnc.dll"});

    auto darwin = resolve_package(lookup_package(Platform::Darwin), "3.10.8").value_or_exit(PAWNGET_LINE_INFO);
    CHECK(darwin.url == "https://github.com/Zeex/pawn/releases/download/v3.10.8/pawnc-3.10.8-darwin.zip");
    CHECK(darwin.path_map[1] == PathMapping{"pawnc-3.10.8-darwin/lib/libpawnc.dylib", "libpawnc.dylib"});
}

TEST_CASE ("resolution rejects hostile versions", "[catalog]")
{
    REQUIRE_ERROR_CONTAINS(resolve_package(lookup_package(Platform::Linux), "../../etc"), "is not a valid version");
    REQUIRE_ERROR_CONTAINS(resolve_package(lookup_package(Platform::Linux), ""), "is not a valid version");
}

TEST_CASE ("descriptors with broken templates fail to resolve", "[catalog]")
{
    static constexpr PathMappingTemplate members[] = {{"pawnc-{version}/pawncc", "pawncc"}};
    static constexpr PathMappingTemplate escaping[] = {{"pawnc-{version}/pawncc", "../pawncc"}};

    const PackageDescriptor bad_locator{
        Platform::Linux, "https://example.com/{release}.tar.gz", ExtractionType::TarGzip, members};
    REQUIRE_ERROR_CONTAINS(resolve_package(bad_locator, "1.0"), "unknown placeholder 'release'");

    const PackageDescriptor no_filename{Platform::Linux, "https://example.com/", ExtractionType::TarGzip, members};
    REQUIRE_ERROR_CONTAINS(resolve_package(no_filename, "1.0"), "https://example.com/");

    const PackageDescriptor bad_install{
        Platform::Linux, "https://example.com/{version}.tar.gz", ExtractionType::TarGzip, escaping};
    REQUIRE_ERROR_CONTAINS(resolve_package(bad_install, "1.0"), "../pawncc");
}

TEST_CASE ("is_valid_install_path", "[catalog]")
{
    CHECK(is_valid_install_path("pawncc"));
    CHECK(is_valid_install_path("bin/pawncc"));
    CHECK(!is_valid_install_path(""));
    CHECK(!is_valid_install_path("/usr/bin/pawncc"));
    CHECK(!is_valid_install_path("C:/pawncc"));
    CHECK(!is_valid_install_path("bin\\pawncc"));
    CHECK(!is_valid_install_path("bin//pawncc"));
    CHECK(!is_valid_install_path("bin/"));
    CHECK(!is_valid_install_path("./pawncc"));
    CHECK(!is_valid_install_path("bin/../../pawncc"));
}
