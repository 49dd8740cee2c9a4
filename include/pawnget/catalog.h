#pragma once

#include <pawnget/base/expected.h>
#include <pawnget/base/fmt.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/optional.h>
#include <pawnget/base/stringview.h>

#include <pawnget/archives.h>

#include <stddef.h>

#include <string>
#include <vector>

namespace pawnget
{
    enum class Platform
    {
        Darwin,
        Linux,
        Windows,
    };

    StringLiteral to_string_literal(Platform platform) noexcept;
    Optional<Platform> to_platform(StringView name) noexcept;
    Optional<Platform> get_host_platform() noexcept;

    // "darwin, linux, windows"
    std::string supported_platform_names();

    struct PathMappingTemplate
    {
        StringLiteral member;
        StringLiteral install_path;
    };

    struct PackageDescriptor
    {
        template<size_t N>
        constexpr PackageDescriptor(Platform platform,
                                    StringLiteral locator_template,
                                    ExtractionType extraction,
                                    const PathMappingTemplate (&path_map)[N]) noexcept
            : platform(platform)
            , locator_template(locator_template)
            , extraction(extraction)
            , m_path_map(path_map)
            , m_path_map_size(N)
        {
        }

        Platform platform;
        StringLiteral locator_template;
        ExtractionType extraction;

        constexpr const PathMappingTemplate* path_map_begin() const noexcept { return m_path_map; }
        constexpr const PathMappingTemplate* path_map_end() const noexcept { return m_path_map + m_path_map_size; }
        constexpr size_t path_map_size() const noexcept { return m_path_map_size; }

    private:
        const PathMappingTemplate* m_path_map;
        size_t m_path_map_size;
    };

    // A PackageDescriptor with the version substituted into every template.
    struct ResolvedPackage
    {
        Platform platform;
        std::string version;
        std::string url;
        // the last segment of url; names the cache entry
        std::string filename;
        ExtractionType extraction;
        std::vector<PathMapping> path_map;
    };

    const PackageDescriptor& lookup_package(Platform platform) noexcept;
    ExpectedL<const PackageDescriptor*> lookup_package(StringView platform_name);

    // Non-empty, relative, '/' separated, with no empty, "." or ".." segment and no backslash.
    bool is_valid_install_path(StringView path) noexcept;

    ExpectedL<ResolvedPackage> resolve_package(const PackageDescriptor& descriptor, StringView version);
}

PAWNGET_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(pawnget::Platform);
