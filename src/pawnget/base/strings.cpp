#include <pawnget/base/strings.h>

#include <iterator>
#include <limits>

namespace pawnget::Strings::details
{
    void append_internal(std::string& into, char c) { into.push_back(c); }
    void append_internal(std::string& into, const char* v) { into.append(v); }
    void append_internal(std::string& into, const std::string& s) { into.append(s); }
    void append_internal(std::string& into, StringView s) { into.append(s.begin(), s.end()); }
}

namespace
{
    char tolower_char(const char c) { return (c < 'A' || c > 'Z') ? c : static_cast<char>(c - 'A' + 'a'); }

    constexpr struct
    {
        bool operator()(char a, char b) const noexcept { return tolower_char(a) == tolower_char(b); }
    } icase_eq{};
}

namespace pawnget::Strings
{
    bool case_insensitive_ascii_equals(StringView left, StringView right) noexcept
    {
        return std::equal(left.begin(), left.end(), right.begin(), right.end(), icase_eq);
    }

    std::string ascii_to_lowercase(StringView s)
    {
        std::string result;
        result.reserve(s.size());
        std::transform(s.begin(), s.end(), std::back_inserter(result), tolower_char);
        return result;
    }

    bool starts_with(StringView s, StringView pattern) { return s.starts_with(pattern); }

    bool ends_with(StringView s, StringView pattern) { return s.ends_with(pattern); }

    std::vector<std::string> split(StringView s, char delimiter)
    {
        std::vector<std::string> output;
        auto first = s.begin();
        const auto last = s.end();
        for (;;)
        {
            first = std::find_if(first, last, [=](char c) { return c != delimiter; });
            if (first == last)
            {
                return output;
            }

            auto next = std::find(first, last, delimiter);
            output.emplace_back(first, next);
            first = next;
        }
    }

    const char* find_first_of(StringView searched, StringView candidates) noexcept
    {
        return std::find_first_of(searched.begin(), searched.end(), candidates.begin(), candidates.end());
    }

    Optional<unsigned long long> strto_unsigned(StringView sv)
    {
        if (sv.empty())
        {
            return nullopt;
        }

        unsigned long long result = 0;
        for (char c : sv)
        {
            if (c < '0' || c > '9')
            {
                return nullopt;
            }

            const auto digit = static_cast<unsigned long long>(c - '0');
            if (result > (std::numeric_limits<unsigned long long>::max() - digit) / 10)
            {
                return nullopt;
            }

            result = result * 10 + digit;
        }

        return result;
    }
}
