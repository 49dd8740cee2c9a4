#pragma once

#include <pawnget/base/checks.h>
#include <pawnget/base/lineinfo.h>

#include <optional>
#include <type_traits>
#include <utility>

namespace pawnget
{
    struct NullOpt
    {
        explicit constexpr NullOpt(int) { }
    };

    const static constexpr NullOpt nullopt{0};

    // Like std::optional, but access is through get() returning a nullable pointer, which keeps
    // "if (auto p = x.get())" the only way to reach the value.
    template<class T>
    struct Optional
    {
        static_assert(!std::is_reference_v<T>, "Optional of references is not supported");

        constexpr Optional() noexcept { }

        // Constructors are intentionally implicit
        constexpr Optional(NullOpt) noexcept { }

        template<class U,
                 std::enable_if_t<!std::is_same_v<std::decay_t<U>, Optional> &&
                                      !std::is_same_v<std::decay_t<U>, NullOpt> && std::is_constructible_v<T, U>,
                                  int> = 0>
        constexpr Optional(U&& t) noexcept(std::is_nothrow_constructible_v<T, U>) : m_storage(std::forward<U>(t))
        {
        }

        template<class... Args>
        T& emplace(Args&&... args)
        {
            return m_storage.emplace(std::forward<Args>(args)...);
        }

        void clear() noexcept { m_storage.reset(); }

        constexpr bool has_value() const noexcept { return m_storage.has_value(); }

        T* get() & noexcept { return m_storage.has_value() ? &*m_storage : nullptr; }
        const T* get() const& noexcept { return m_storage.has_value() ? &*m_storage : nullptr; }

        T&& value_or_exit(const LineInfo& line_info) && noexcept
        {
            Checks::check_exit(line_info, this->has_value(), "Value was null");
            return std::move(*m_storage);
        }

        T& value_or_exit(const LineInfo& line_info) & noexcept
        {
            Checks::check_exit(line_info, this->has_value(), "Value was null");
            return *m_storage;
        }

        const T& value_or_exit(const LineInfo& line_info) const& noexcept
        {
            Checks::check_exit(line_info, this->has_value(), "Value was null");
            return *m_storage;
        }

        template<class U>
        T value_or(U&& default_value) const&
        {
            return m_storage.has_value() ? *m_storage : static_cast<T>(std::forward<U>(default_value));
        }

        template<class U>
        T value_or(U&& default_value) &&
        {
            return m_storage.has_value() ? std::move(*m_storage) : static_cast<T>(std::forward<U>(default_value));
        }

        template<class F>
        auto map(F f) const& -> Optional<decltype(f(std::declval<const T&>()))>
        {
            if (m_storage.has_value())
            {
                return f(*m_storage);
            }

            return nullopt;
        }

        friend bool operator==(const Optional& lhs, const Optional& rhs) { return lhs.m_storage == rhs.m_storage; }
        friend bool operator!=(const Optional& lhs, const Optional& rhs) { return !(lhs == rhs); }

    private:
        std::optional<T> m_storage;
    };
}
