#include <pawnget/base/cancellation.h>
#include <pawnget/base/checks.h>
#include <pawnget/base/files.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/system.debug.h>
#include <pawnget/base/system.h>

#include <pawnget/commands.h>
#include <pawnget/commands.version.h>
#include <pawnget/pawngetcmdarguments.h>

#include <locale.h>
#include <signal.h>
#include <stdio.h>
#include <stdlib.h>

#include <exception>
#include <string>

using namespace pawnget;

namespace
{
    void on_interrupt(int)
    {
        global_cancellation_token().cancel();
        // a second Ctrl+C terminates immediately
        ::signal(SIGINT, SIG_DFL);
    }

    void invalid_command(const PawnGetCmdArguments& args)
    {
        msg::println_error(msgInvalidCommand, msg::command_name = args.get_command());
        msg::write_unlocalized_text_to_stderr(Color::none, get_zero_args_usage());
        Checks::exit_fail(PAWNGET_LINE_INFO);
    }

    void inner(const Filesystem& fs, const PawnGetCmdArguments& args)
    {
        if (args.get_command().empty())
        {
            msg::write_unlocalized_text_to_stderr(Color::none, get_zero_args_usage());
            Checks::exit_fail(PAWNGET_LINE_INFO);
        }

        if (const auto command_function = find_command(args.get_command()))
        {
            Debug::println("Running command ", command_function->metadata.name);
            return command_function->function(args, fs);
        }

        return invalid_command(args);
    }
}

namespace pawnget::Checks
{
    // Implements link seam from checks.h
    void on_final_cleanup_and_exit() { Debug::g_debugging = false; }
}

int main(const int argc, const char* const* const argv)
{
    if (argc == 0) std::abort();

#if !defined(_WIN32)
    static const char* const utf8_locales[] = {
        "C.UTF-8",
        "POSIX.UTF-8",
        "en_US.UTF-8",
    };

    for (const char* utf8_locale : utf8_locales)
    {
        if (::setlocale(LC_ALL, utf8_locale))
        {
            break;
        }
    }
#endif

    ::signal(SIGINT, on_interrupt);

    PawnGetCmdArguments args = PawnGetCmdArguments::create_from_command_line(argc, argv);
    args.imbue_from_environment();
    if (const auto p = args.debug.get()) Debug::g_debugging = *p;
    Debug::println("pawnget version ", pawnget_executable_version);

    const auto& errors = args.get_errors();
    if (!errors.empty())
    {
        for (auto&& error : errors)
        {
            msg::println_error(error);
        }

        Checks::exit_fail(PAWNGET_LINE_INFO);
    }

    std::string exc_msg;
    try
    {
        inner(real_filesystem, args);
        Checks::exit_fail(PAWNGET_LINE_INFO);
    }
    catch (std::exception& e)
    {
        exc_msg = e.what();
    }

    fflush(stdout);
    auto data_blob = error_prefix()
                         .append(msgPawngetHasCrashed)
                         .append_raw("\nVersion=")
                         .append_raw(pawnget_executable_version)
                         .append_raw("\nEXCEPTION=")
                         .append_raw(exc_msg)
                         .append_raw("\nCMD=\n");

    for (int x = 0; x < argc; ++x)
    {
        data_blob.append_raw(argv[x]).append_raw("|\n");
    }

    msg::write_unlocalized_text_to_stderr(Color::none, data_blob);
    Checks::exit_fail(PAWNGET_LINE_INFO);
}
