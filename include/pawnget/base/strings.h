#pragma once

#include <pawnget/base/optional.h>
#include <pawnget/base/stringview.h>

#include <algorithm>
#include <iterator>
#include <string>
#include <type_traits>
#include <vector>

namespace pawnget::Strings::details
{
    void append_internal(std::string& into, char c);
    void append_internal(std::string& into, const char* v);
    void append_internal(std::string& into, const std::string& s);
    void append_internal(std::string& into, StringView s);
    template<class T, class = decltype(std::declval<const T&>().to_string(std::declval<std::string&>()))>
    void append_internal(std::string& into, const T& t)
    {
        t.to_string(into);
    }
    template<class T, std::enable_if_t<std::is_integral_v<T> && !std::is_same_v<T, char>, int> = 0>
    void append_internal(std::string& into, T t)
    {
        into.append(std::to_string(t));
    }
}

namespace pawnget::Strings
{
    template<class... Args>
    std::string& append(std::string& into, const Args&... args)
    {
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return into;
    }

    template<class... Args>
    [[nodiscard]] std::string concat(const Args&... args)
    {
        std::string into;
        (void)((details::append_internal(into, args), 0) || ... || 0);
        return into;
    }

    bool case_insensitive_ascii_equals(StringView left, StringView right) noexcept;

    [[nodiscard]] std::string ascii_to_lowercase(StringView s);

    bool starts_with(StringView s, StringView pattern);
    bool ends_with(StringView s, StringView pattern);

    template<class InputIterator, class Transformer>
    std::string join(StringView delimiter, InputIterator begin, InputIterator end, Transformer transformer)
    {
        if (begin == end)
        {
            return std::string();
        }

        std::string output;
        append(output, transformer(*begin));
        for (auto it = std::next(begin); it != end; ++it)
        {
            output.append(delimiter.data(), delimiter.size());
            append(output, transformer(*it));
        }

        return output;
    }

    template<class Container, class Transformer>
    std::string join(StringView delimiter, const Container& v, Transformer transformer)
    {
        const auto begin = std::begin(v);
        const auto end = std::end(v);

        return join(delimiter, begin, end, transformer);
    }

    template<class InputIterator>
    std::string join(StringView delimiter, InputIterator begin, InputIterator end)
    {
        return join(delimiter, begin, end, [](const auto& x) -> const auto& { return x; });
    }

    template<class Container>
    std::string join(StringView delimiter, const Container& v)
    {
        return join(delimiter, std::begin(v), std::end(v));
    }

    [[nodiscard]] std::vector<std::string> split(StringView s, char delimiter);

    const char* find_first_of(StringView searched, StringView candidates) noexcept;

    // Parses a base 10 unsigned integer, rejecting signs, whitespace and trailing characters.
    Optional<unsigned long long> strto_unsigned(StringView sv);
}
