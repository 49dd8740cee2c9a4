#pragma once

#include <pawnget/base/expected.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/stringview.h>

#include <string>
#include <vector>

namespace pawnget
{
    // Templates are literal text with any number of "{version}" placeholders. No other braces are allowed, and
    // there is no escape syntax.
    struct VersionTemplate
    {
        struct Segment
        {
            // true for "{version}"; literal is then empty
            bool is_placeholder;
            std::string literal;
        };

        std::vector<Segment> segments;

        std::string resolve(StringView version) const;
        size_t placeholder_count() const noexcept;
    };

    ExpectedL<VersionTemplate> parse_version_template(StringView template_text);

    // Versions may only contain ASCII letters, digits, '.', '_', '+' and '-', and must not be "." or "..".
    bool is_valid_version(StringView version) noexcept;
    ExpectedL<Unit> check_version(StringView version);

    // Validates the version, then substitutes it for every placeholder of template_text.
    ExpectedL<std::string> resolve_version_template(StringView template_text, StringView version);
}
