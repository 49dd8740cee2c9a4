#include <pawnget/base/checks.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/stringview.h>
#include <pawnget/base/system.debug.h>

#include <stdio.h>
#include <stdlib.h>

#include <atomic>

namespace
{
    using namespace pawnget;

    LocalizedString locale_invariant_lineinfo(const LineInfo& line_info)
    {
        return LocalizedString::from_raw(fmt::format("{}: ", line_info));
    }
}

std::string pawnget::LineInfo::to_string() const { return fmt::format("{}({})", file_name, line_number); }

namespace pawnget
{
    [[noreturn]] void Checks::final_cleanup_and_exit(const int exit_code)
    {
        static std::atomic<bool> have_entered{false};
        if (have_entered.exchange(true))
        {
            std::abort();
        }

        on_final_cleanup_and_exit();

        fflush(nullptr);
        std::exit(exit_code);
    }

    [[noreturn]] void Checks::unreachable(const LineInfo& line_info)
    {
        msg::write_unlocalized_text_to_stderr(
            Color::error, locale_invariant_lineinfo(line_info).append(msgChecksUnreachableCode).append_raw('\n'));
#ifndef NDEBUG
        std::abort();
#else
        final_cleanup_and_exit(EXIT_FAILURE);
#endif
    }

    [[noreturn]] void Checks::unreachable(const LineInfo& line_info, StringView message)
    {
        msg::write_unlocalized_text_to_stderr(
            Color::error, locale_invariant_lineinfo(line_info).append_raw(message).append_raw('\n'));
#ifndef NDEBUG
        std::abort();
#else
        final_cleanup_and_exit(EXIT_FAILURE);
#endif
    }

    [[noreturn]] void Checks::exit_with_code(const LineInfo& line_info, const int exit_code)
    {
        Debug::println(locale_invariant_lineinfo(line_info), "exiting with code ", exit_code);
        final_cleanup_and_exit(exit_code);
    }

    [[noreturn]] void Checks::exit_fail(const LineInfo& line_info) { exit_with_code(line_info, EXIT_FAILURE); }

    [[noreturn]] void Checks::exit_success(const LineInfo& line_info) { exit_with_code(line_info, EXIT_SUCCESS); }

    [[noreturn]] void Checks::msg_exit_with_message(const LineInfo& line_info, const LocalizedString& error_message)
    {
        msg::write_unlocalized_text_to_stderr(Color::error, error_message);
        msg::write_unlocalized_text_to_stderr(Color::none, "\n");
        exit_fail(line_info);
    }

    void Checks::check_exit(const LineInfo& line_info, bool expression)
    {
        if (!expression)
        {
            msg::write_unlocalized_text_to_stderr(Color::error,
                                                  internal_error_prefix()
                                                      .append(locale_invariant_lineinfo(line_info))
                                                      .append(msgChecksFailedCheck)
                                                      .append_raw('\n'));
            exit_fail(line_info);
        }
    }

    void Checks::check_exit(const LineInfo& line_info, bool expression, StringView error_message)
    {
        if (!expression)
        {
            msg::write_unlocalized_text_to_stderr(Color::error,
                                                  internal_error_prefix()
                                                      .append(locale_invariant_lineinfo(line_info))
                                                      .append_raw(error_message)
                                                      .append_raw('\n'));
            exit_fail(line_info);
        }
    }

    void Checks::msg_check_exit(const LineInfo& line_info, bool expression, const LocalizedString& error_message)
    {
        if (!expression)
        {
            msg_exit_with_message(line_info, error_message);
        }
    }
}
