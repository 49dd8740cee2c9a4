#include <pawnget/base/stringview.h>

#include <string.h>

#include <algorithm>
#include <utility>

namespace pawnget
{
    StringView::StringView(const std::string& s) noexcept : m_ptr(s.data()), m_size(s.size()) { }

    bool StringView::ends_with(StringView pattern) const noexcept
    {
        if (m_size < pattern.size()) return false;
        auto offset = m_size - pattern.size();
        return std::equal(m_ptr + offset, m_ptr + m_size, pattern.begin(), pattern.end());
    }

    bool StringView::starts_with(StringView pattern) const noexcept
    {
        if (m_size < pattern.size()) return false;
        return std::equal(m_ptr, m_ptr + pattern.size(), pattern.begin(), pattern.end());
    }

    bool StringView::contains(StringView needle) const noexcept
    {
        return std::search(begin(), end(), needle.begin(), needle.end()) != end();
    }

    bool StringView::contains(char needle) const noexcept
    {
        auto end_ = end();
        return std::find(m_ptr, end_, needle) != end_;
    }

    std::string StringView::to_string() const { return std::string(m_ptr, m_size); }
    void StringView::to_string(std::string& s) const { s.append(m_ptr, m_size); }

    bool operator==(StringView lhs, StringView rhs) noexcept
    {
        return lhs.size() == rhs.size() && (lhs.empty() || memcmp(lhs.data(), rhs.data(), lhs.size()) == 0);
    }

    bool operator!=(StringView lhs, StringView rhs) noexcept { return !(lhs == rhs); }

    bool operator<(StringView lhs, StringView rhs) noexcept
    {
        return std::lexicographical_compare(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
    }

    std::string operator+(std::string&& l, const StringView& r)
    {
        l.append(r.m_ptr, r.m_size);
        return std::move(l);
    }
}
