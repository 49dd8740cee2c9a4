#pragma once

#include <pawnget/base/fmt.h>
#include <pawnget/base/stringview.h>

#include <string>

#if defined(_WIN32)
#define PAWNGET_PREFERRED_SEPARATOR "\\"
#else // ^^^ _WIN32 / !_WIN32 vvv
#define PAWNGET_PREFERRED_SEPARATOR "/"
#endif // _WIN32

namespace pawnget
{
    struct Path
    {
        Path() = default;
        Path(const StringView sv);
        Path(const std::string& s);
        Path(std::string&& s);
        Path(const char* s);

        const std::string& native() const& noexcept;
        std::string&& native() && noexcept;
        operator StringView() const noexcept;

        const char* c_str() const noexcept;

        std::string generic_u8string() const;

        bool empty() const noexcept;

        Path operator/(StringView sv) const&;
        Path operator/(StringView sv) &&;
        Path operator+(StringView sv) const&;
        Path operator+(StringView sv) &&;

        Path& operator/=(StringView sv);
        Path& operator+=(StringView sv);

        void replace_filename(StringView sv);
        void remove_filename();
        void clear();

        // Sets *this to parent_path, returns whether anything was removed
        bool make_parent_path();

        StringView parent_path() const;
        StringView filename() const;
        StringView extension() const;
        StringView stem() const;

        bool is_absolute() const;
        bool is_relative() const;

    private:
        std::string m_str;
    };

    bool is_slash(char c) noexcept;
    bool is_absolute_path(StringView path) noexcept;
}

PAWNGET_FORMAT_AS(pawnget::Path, pawnget::StringView);
