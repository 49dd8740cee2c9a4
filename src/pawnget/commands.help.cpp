#include <pawnget/base/checks.h>

#include <pawnget/commands.h>
#include <pawnget/commands.help.h>
#include <pawnget/pawngetcmdarguments.h>

namespace pawnget
{
    constexpr CommandMetadata CommandHelpMetadata{
        "help",
        msgHelpCommandSynopsis,
        "pawnget help acquire",
        0,
        1,
    };

    void command_help_and_exit(const PawnGetCmdArguments& args, const Filesystem&)
    {
        const auto parsed = args.parse_arguments(CommandHelpMetadata);
        if (parsed.command_arguments.empty())
        {
            msg::write_unlocalized_text(Color::none, get_zero_args_usage());
            Checks::exit_success(PAWNGET_LINE_INFO);
        }

        const auto& topic = parsed.command_arguments[0];
        if (auto command = find_command(topic))
        {
            msg::println(usage_for_command(command->metadata));
            Checks::exit_success(PAWNGET_LINE_INFO);
        }

        msg::println_error(msgInvalidCommand, msg::command_name = topic);
        msg::write_unlocalized_text_to_stderr(Color::none, get_zero_args_usage());
        Checks::exit_fail(PAWNGET_LINE_INFO);
    }
}
