#include <pawnget/base/checks.h>
#include <pawnget/base/downloads.h>
#include <pawnget/base/strings.h>
#include <pawnget/base/system.debug.h>

#include <pawnget/catalog.h>
#include <pawnget/versiontemplate.h>

#include <algorithm>

namespace
{
    using namespace pawnget;

    struct PlatformEntry
    {
        StringLiteral name;
        Platform platform;
    };

    constexpr PlatformEntry platform_names[] = {
        {"darwin", Platform::Darwin},
        {"linux", Platform::Linux},
        {"windows", Platform::Windows},
    };

    constexpr PathMappingTemplate darwin_members[] = {
        {"pawnc-{version}-darwin/bin/pawncc", "pawncc"},
        {"pawnc-{version}-darwin/lib/libpawnc.dylib", "libpawnc.dylib"},
    };

    constexpr PathMappingTemplate linux_members[] = {
        {"pawnc-{version}-linux/bin/pawncc", "pawncc"},
        {"pawnc-{version}-linux/lib/libpawnc.so", "libpawnc.so"},
    };

    constexpr PathMappingTemplate windows_members[] = {
        {"pawnc-{version}-windows/bin/pawncc.exe", "pawncc.exe"},
        {"pawnc-{version}-windows/bin/pawnc.dll", "pawnc.dll"},
    };

    // Indexed by Platform
    constexpr PackageDescriptor package_table[] = {
        {Platform::Darwin,
         "https://github.com/Zeex/pawn/releases/download/v{version}/pawnc-{version}-darwin.zip",
         ExtractionType::Zip,
         darwin_members},
        {Platform::Linux,
         "https://github.com/Zeex/pawn/releases/download/v{version}/pawnc-{version}-linux.tar.gz",
         ExtractionType::TarGzip,
         linux_members},
        {Platform::Windows,
         "https://github.com/Zeex/pawn/releases/download/v{version}/pawnc-{version}-windows.zip",
         ExtractionType::Zip,
         windows_members},
    };

    bool is_drive_letter_prefix(StringView path) noexcept
    {
        return path.size() >= 2 && path[1] == ':' &&
               ((path[0] >= 'a' && path[0] <= 'z') || (path[0] >= 'A' && path[0] <= 'Z'));
    }
}

namespace pawnget
{
    StringLiteral to_string_literal(Platform platform) noexcept
    {
        switch (platform)
        {
            case Platform::Darwin: return "darwin";
            case Platform::Linux: return "linux";
            case Platform::Windows: return "windows";
            default: Checks::unreachable(PAWNGET_LINE_INFO);
        }
    }

    Optional<Platform> to_platform(StringView name) noexcept
    {
        for (auto&& entry : platform_names)
        {
            if (entry.name == name)
            {
                return entry.platform;
            }
        }

        return nullopt;
    }

    Optional<Platform> get_host_platform() noexcept
    {
#if defined(_WIN32)
        return Platform::Windows;
#elif defined(__APPLE__)
        return Platform::Darwin;
#elif defined(__linux__)
        return Platform::Linux;
#else
        return nullopt;
#endif
    }

    std::string supported_platform_names()
    {
        return Strings::join(", ", platform_names, [](const PlatformEntry& entry) { return entry.name; });
    }

    const PackageDescriptor& lookup_package(Platform platform) noexcept
    {
        const auto& descriptor = package_table[static_cast<size_t>(platform)];
        if (descriptor.platform != platform)
        {
            Checks::unreachable(PAWNGET_LINE_INFO);
        }

        return descriptor;
    }

    ExpectedL<const PackageDescriptor*> lookup_package(StringView platform_name)
    {
        const auto maybe_platform = to_platform(platform_name);
        if (auto platform = maybe_platform.get())
        {
            return &lookup_package(*platform);
        }

        return msg::format(
            msgUnsupportedPlatform, msg::platform = platform_name, msg::value = supported_platform_names());
    }

    bool is_valid_install_path(StringView path) noexcept
    {
        if (path.empty() || path.contains('\\') || is_absolute_path(path) || path[0] == '/' ||
            is_drive_letter_prefix(path))
        {
            return false;
        }

        auto first = path.begin();
        const auto last = path.end();
        for (;;)
        {
            const auto slash = std::find(first, last, '/');
            const StringView segment{first, slash};
            if (segment.empty() || segment == "." || segment == "..")
            {
                return false;
            }

            if (slash == last)
            {
                return true;
            }

            first = slash + 1;
        }
    }

    ExpectedL<ResolvedPackage> resolve_package(const PackageDescriptor& descriptor, StringView version)
    {
        auto maybe_url = resolve_version_template(descriptor.locator_template, version);
        auto url = maybe_url.get();
        if (!url)
        {
            return std::move(maybe_url).error();
        }

        if (!is_well_formed_download_url(*url))
        {
            return msg::format(msgInvalidDownloadUrl, msg::url = *url);
        }

        ResolvedPackage result;
        result.platform = descriptor.platform;
        result.version = version.to_string();
        result.filename = url_filename(parse_split_url_view(*url).value_or_exit(PAWNGET_LINE_INFO)).to_string();
        result.url = std::move(*url);
        result.extraction = descriptor.extraction;
        for (auto it = descriptor.path_map_begin(); it != descriptor.path_map_end(); ++it)
        {
            auto maybe_member = resolve_version_template(it->member, version);
            auto member = maybe_member.get();
            if (!member)
            {
                return std::move(maybe_member).error();
            }

            if (!is_valid_install_path(*member))
            {
                return msg::format(msgInvalidInstallPath, msg::path = *member);
            }

            auto maybe_install_path = resolve_version_template(it->install_path, version);
            auto install_path = maybe_install_path.get();
            if (!install_path)
            {
                return std::move(maybe_install_path).error();
            }

            if (!is_valid_install_path(*install_path))
            {
                return msg::format(msgInvalidInstallPath, msg::path = *install_path);
            }

            result.path_map.push_back(PathMapping{std::move(*member), std::move(*install_path)});
        }

        Debug::println("Resolved ", to_string_literal(result.platform), " ", result.version, " to ", result.url);
        return result;
    }
}
