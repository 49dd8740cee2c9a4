#pragma once

#include <pawnget/base/fmt.h>

#include <stddef.h>
#include <string.h>

#include <iterator>
#include <limits>
#include <string>

namespace pawnget
{
    struct StringView
    {
        constexpr StringView() = default;
        StringView(const std::string& s) noexcept; // Implicit by design
        StringView(const char* ptr) noexcept : m_ptr(ptr), m_size(strlen(ptr)) { }
        constexpr StringView(const char* ptr, size_t size) noexcept : m_ptr(ptr), m_size(size) { }
        constexpr StringView(const char* b, const char* e) noexcept : m_ptr(b), m_size(static_cast<size_t>(e - b)) { }

        constexpr const char* begin() const noexcept { return m_ptr; }
        constexpr const char* end() const noexcept { return m_ptr + m_size; }

        constexpr const char& front() const noexcept { return *m_ptr; }
        constexpr const char& back() const noexcept { return m_ptr[m_size - 1]; }

        constexpr const char* data() const noexcept { return m_ptr; }
        constexpr size_t size() const noexcept { return m_size; }
        constexpr bool empty() const noexcept { return m_size == 0; }
        bool ends_with(StringView pattern) const noexcept;
        bool starts_with(StringView pattern) const noexcept;
        bool contains(StringView needle) const noexcept;
        bool contains(char needle) const noexcept;

        // intentionally not provided because this may not be null terminated
        // constexpr const char* c_str() const

        std::string to_string() const;
        void to_string(std::string& out) const;
        explicit operator std::string() const { return to_string(); }

        constexpr StringView substr(size_t pos, size_t count = std::numeric_limits<size_t>::max()) const noexcept
        {
            if (pos > m_size)
            {
                return StringView();
            }

            if (count > m_size - pos)
            {
                return StringView(m_ptr + pos, m_size - pos);
            }

            return StringView(m_ptr + pos, count);
        }

        constexpr char operator[](size_t pos) const noexcept { return m_ptr[pos]; }
        friend std::string operator+(std::string&& l, const StringView& r);

    private:
        const char* m_ptr = "";
        size_t m_size = 0;
    };

    bool operator==(StringView lhs, StringView rhs) noexcept;
    bool operator!=(StringView lhs, StringView rhs) noexcept;
    bool operator<(StringView lhs, StringView rhs) noexcept;

    // A counted view of a null-terminated string
    struct ZStringView : StringView
    {
        constexpr ZStringView() : StringView("", size_t{}) { }
        ZStringView(const std::string& s) : StringView(s) { }
        constexpr ZStringView(const char* ptr, size_t size) noexcept : StringView(ptr, size) { }
        ZStringView(const char* ptr) noexcept : StringView(ptr) { }

        constexpr const char* c_str() const noexcept { return data(); }

        void substr(size_t pos, size_t count) const = delete;
    };

    struct StringLiteral : ZStringView
    {
        template<int N>
        constexpr StringLiteral(const char (&str)[N]) : ZStringView(str, N - 1)
        {
        }
    };
}

template<class Char>
struct fmt::formatter<pawnget::StringView, Char, void> : fmt::formatter<fmt::basic_string_view<Char>, Char, void>
{
    template<class FormatContext>
    auto format(pawnget::StringView sv, FormatContext& ctx) const -> decltype(ctx.out())
    {
        return fmt::formatter<fmt::basic_string_view<Char>, Char, void>::format({sv.data(), sv.size()}, ctx);
    }
};

PAWNGET_FORMAT_AS(pawnget::ZStringView, pawnget::StringView);
PAWNGET_FORMAT_AS(pawnget::StringLiteral, pawnget::StringView);
