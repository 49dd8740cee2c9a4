#include <pawnget/base/strings.h>

#include <pawnget/versiontemplate.h>

#include <algorithm>

namespace
{
    using namespace pawnget;

    constexpr StringLiteral version_placeholder_name = "version";

    bool is_version_char(char ch) noexcept
    {
        return (ch >= 'a' && ch <= 'z') || (ch >= 'A' && ch <= 'Z') || (ch >= '0' && ch <= '9') || ch == '.' ||
               ch == '_' || ch == '+' || ch == '-';
    }

    int column_of(StringView text, const char* p) noexcept { return static_cast<int>(p - text.begin()) + 1; }
}

namespace pawnget
{
    std::string VersionTemplate::resolve(StringView version) const
    {
        std::string result;
        for (auto&& segment : segments)
        {
            if (segment.is_placeholder)
            {
                result.append(version.data(), version.size());
            }
            else
            {
                result.append(segment.literal);
            }
        }

        return result;
    }

    size_t VersionTemplate::placeholder_count() const noexcept
    {
        return static_cast<size_t>(
            std::count_if(segments.begin(), segments.end(), [](const Segment& s) { return s.is_placeholder; }));
    }

    ExpectedL<VersionTemplate> parse_version_template(StringView template_text)
    {
        static constexpr char s_brackets[] = "{}";

        VersionTemplate result;
        auto prev = template_text.begin();
        const auto last = template_text.end();
        for (const char* p = std::find_first_of(prev, last, s_brackets, s_brackets + 2); p != last;
             p = std::find_first_of(p, last, s_brackets, s_brackets + 2))
        {
            if (p[0] == '}')
            {
                return msg::format(
                    msgTemplateUnbalancedBrace, msg::value = template_text, msg::column = column_of(template_text, p));
            }

            // p[0] == '{'
            const auto open = p;
            const auto name_start = p + 1;
            p = std::find_first_of(name_start, last, s_brackets, s_brackets + 2);
            if (p == last || p[0] != '}')
            {
                return msg::format(msgTemplateUnbalancedBrace,
                                   msg::value = template_text,
                                   msg::column = column_of(template_text, open));
            }

            const StringView name{name_start, p};
            if (name != version_placeholder_name)
            {
                return msg::format(msgTemplateUnknownPlaceholder,
                                   msg::value = template_text,
                                   msg::placeholder = name,
                                   msg::column = column_of(template_text, open));
            }

            if (prev != open)
            {
                result.segments.push_back(VersionTemplate::Segment{false, std::string(prev, open)});
            }

            result.segments.push_back(VersionTemplate::Segment{true, std::string()});
            prev = ++p;
        }

        if (prev != last)
        {
            result.segments.push_back(VersionTemplate::Segment{false, std::string(prev, last)});
        }

        return result;
    }

    bool is_valid_version(StringView version) noexcept
    {
        if (version.empty() || version == "." || version == "..")
        {
            return false;
        }

        return std::all_of(version.begin(), version.end(), is_version_char);
    }

    ExpectedL<Unit> check_version(StringView version)
    {
        if (!is_valid_version(version))
        {
            return msg::format(msgInvalidVersion, msg::version = version);
        }

        return Unit{};
    }

    ExpectedL<std::string> resolve_version_template(StringView template_text, StringView version)
    {
        return check_version(version).then([&](Unit) {
            return parse_version_template(template_text).map([&](const VersionTemplate& parsed) {
                return parsed.resolve(version);
            });
        });
    }
}
