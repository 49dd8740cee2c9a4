#pragma once

#include <pawnget/base/fwd/expected.h>

#include <pawnget/base/checks.h>
#include <pawnget/base/lineinfo.h>
#include <pawnget/base/messages.h>

#include <functional>
#include <new>
#include <type_traits>
#include <utility>

namespace pawnget
{
    struct Unit
    {
        // A meaningless type intended to be used with Expected when there is no meaningful value.
    };

    struct ExpectedLeftTag
    {
    };
    struct ExpectedRightTag
    {
    };
    constexpr ExpectedLeftTag expected_left_tag;
    constexpr ExpectedRightTag expected_right_tag;

    template<class T, class Error>
    struct ExpectedT
    {
        // Constructors are intentionally implicit

        // Each single argument ctor exists if we can convert to T or Error, and it isn't exactly the other type.
        template<class ConvToT,
                 std::enable_if_t<std::is_convertible_v<ConvToT, T> &&
                                      !std::is_same_v<std::remove_cv_t<std::remove_reference_t<ConvToT>>, Error>,
                                  int> = 0>
        ExpectedT(ConvToT&& t) noexcept(std::is_nothrow_constructible_v<T, ConvToT>)
            : m_t(std::forward<ConvToT>(t)), value_is_error(false)
        {
        }

        template<class ConvToError,
                 std::enable_if_t<std::is_convertible_v<ConvToError, Error> &&
                                      !std::is_same_v<std::remove_cv_t<std::remove_reference_t<ConvToError>>, T>,
                                  int> = 0,
                 int = 1>
        ExpectedT(ConvToError&& e) noexcept(std::is_nothrow_constructible_v<Error, ConvToError>)
            : m_error(std::forward<ConvToError>(e)), value_is_error(true)
        {
        }

        template<class ConvToT, std::enable_if_t<std::is_convertible_v<ConvToT, T>, int> = 0>
        ExpectedT(ConvToT&& t, ExpectedLeftTag) noexcept(std::is_nothrow_constructible_v<T, ConvToT>)
            : m_t(std::forward<ConvToT>(t)), value_is_error(false)
        {
        }

        template<class ConvToError, std::enable_if_t<std::is_convertible_v<ConvToError, Error>, int> = 0>
        ExpectedT(ConvToError&& e, ExpectedRightTag) noexcept(std::is_nothrow_constructible_v<Error, ConvToError>)
            : m_error(std::forward<ConvToError>(e)), value_is_error(true)
        {
        }

        ExpectedT(const ExpectedT& other) : value_is_error(other.value_is_error)
        {
            if (value_is_error)
            {
                ::new (&m_error) Error(other.m_error);
            }
            else
            {
                ::new (&m_t) T(other.m_t);
            }
        }

        ExpectedT(ExpectedT&& other) noexcept(std::is_nothrow_move_constructible_v<Error> &&
                                              std::is_nothrow_move_constructible_v<T>)
            : value_is_error(other.value_is_error)
        {
            if (value_is_error)
            {
                ::new (&m_error) Error(std::move(other.m_error));
            }
            else
            {
                ::new (&m_t) T(std::move(other.m_t));
            }
        }

        // copy assign is deleted to avoid creating "valueless by exception" states
        ExpectedT& operator=(const ExpectedT& other) = delete;

        ExpectedT& operator=(ExpectedT&& other) noexcept // enforces termination
        {
            if (this == &other)
            {
                return *this;
            }

            destroy();
            value_is_error = other.value_is_error;
            if (value_is_error)
            {
                ::new (&m_error) Error(std::move(other.m_error));
            }
            else
            {
                ::new (&m_t) T(std::move(other.m_t));
            }

            return *this;
        }

        ~ExpectedT() { destroy(); }

        explicit constexpr operator bool() const noexcept { return !value_is_error; }
        constexpr bool has_value() const noexcept { return !value_is_error; }

        T&& value_or_exit(const LineInfo& line_info) &&
        {
            exit_if_error(line_info);
            return std::move(m_t);
        }

        T& value_or_exit(const LineInfo& line_info) &
        {
            exit_if_error(line_info);
            return m_t;
        }

        const T& value_or_exit(const LineInfo& line_info) const&
        {
            exit_if_error(line_info);
            return m_t;
        }

        const T& value(const LineInfo& line_info) const& noexcept
        {
            unreachable_if_error(line_info);
            return m_t;
        }

        T&& value(const LineInfo& line_info) && noexcept
        {
            unreachable_if_error(line_info);
            return std::move(m_t);
        }

        Error& error() & noexcept
        {
            unreachable_if_not_error(PAWNGET_LINE_INFO);
            return m_error;
        }

        const Error& error() const& noexcept
        {
            unreachable_if_not_error(PAWNGET_LINE_INFO);
            return m_error;
        }

        Error&& error() && noexcept
        {
            unreachable_if_not_error(PAWNGET_LINE_INFO);
            return std::move(m_error);
        }

        const T* get() const noexcept { return value_is_error ? nullptr : &m_t; }

        T* get() noexcept { return value_is_error ? nullptr : &m_t; }

        // map(F): returns an Expected<result_of_calling_F, Error>
        //
        // If *this holds a value, returns an expected holding the value F(*get())
        // Otherwise, returns an expected containing a copy of error()
        template<class F>
        ExpectedT<decltype(std::declval<F&>()(std::declval<const T&>())), Error> map(F f) const&
        {
            if (value_is_error)
            {
                return {m_error, expected_right_tag};
            }

            return {f(m_t), expected_left_tag};
        }

        template<class F>
        ExpectedT<decltype(std::declval<F&>()(std::declval<T>())), Error> map(F f) &&
        {
            if (value_is_error)
            {
                return {std::move(m_error), expected_right_tag};
            }

            return {f(std::move(m_t)), expected_left_tag};
        }

        // map_error(F): returns an Expected<T, result_of_calling_F>
        template<class F>
        ExpectedT<T, decltype(std::declval<F&>()(std::declval<Error>()))> map_error(F f) &&
        {
            if (value_is_error)
            {
                return {f(std::move(m_error)), expected_right_tag};
            }

            return {std::move(m_t), expected_left_tag};
        }

        // then: f(T, Args...)
        // If *this contains a value, returns INVOKE(f, *get(), forward(args)...)
        // Otherwise, returns error() put into the same type.
        template<class F, class... Args>
        typename std::invoke_result<F, T, Args...>::type then(F f, Args&&... args) &&
        {
            if (value_is_error)
            {
                return {std::move(m_error), expected_right_tag};
            }

            return std::invoke(f, std::move(m_t), static_cast<Args&&>(args)...);
        }

    private:
        void destroy() noexcept
        {
            if (value_is_error)
            {
                m_error.~Error();
            }
            else
            {
                m_t.~T();
            }
        }

        void exit_if_error(const LineInfo& line_info) const
        {
            if (value_is_error)
            {
                Checks::msg_exit_with_error(line_info, to_localized(m_error));
            }
        }

        void unreachable_if_error(const LineInfo& line_info) const noexcept
        {
            if (value_is_error)
            {
                Checks::unreachable(line_info);
            }
        }

        void unreachable_if_not_error(const LineInfo& line_info) const noexcept
        {
            if (!value_is_error)
            {
                Checks::unreachable(line_info);
            }
        }

        static const LocalizedString& to_localized(const LocalizedString& error) noexcept { return error; }
        template<class E>
        static LocalizedString to_localized(const E& error)
        {
            return error.to_localized_string();
        }

        union
        {
            Error m_error;
            T m_t;
        };

        bool value_is_error;
    };
}
