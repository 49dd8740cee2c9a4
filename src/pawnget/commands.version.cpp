#include <pawnget/base/checks.h>

#include <pawnget/commands.version.h>
#include <pawnget/pawngetcmdarguments.h>

namespace
{
    using namespace pawnget;

    constexpr StringLiteral version_init = PAWNGET_VERSION_AS_STRING
#ifndef NDEBUG
        "-debug"
#endif
        ;
}

namespace pawnget
{
    constexpr StringLiteral pawnget_executable_version = version_init;
    constexpr CommandMetadata CommandVersionMetadata{
        "version",
        msgVersionCommandSynopsis,
        "pawnget version",
        0,
        0,
    };

    void command_version_and_exit(const PawnGetCmdArguments& args, const Filesystem&)
    {
        (void)args.parse_arguments(CommandVersionMetadata);
        msg::println(msgVersionCommandHeader, msg::version = pawnget_executable_version);
        Checks::exit_success(PAWNGET_LINE_INFO);
    }
}
