#include <pawnget/base/checks.h>

#include <pawnget/commands.cache-path.h>
#include <pawnget/commands.h>
#include <pawnget/pawngetcmdarguments.h>

namespace pawnget
{
    constexpr CommandMetadata CommandCachePathMetadata{
        "cache-path",
        msgCachePathCommandSynopsis,
        "pawnget cache-path",
        0,
        0,
    };

    void command_cache_path_and_exit(const PawnGetCmdArguments& args, const Filesystem& fs)
    {
        (void)args.parse_arguments(CommandCachePathMetadata);
        const auto cache_root = determine_cache_root(args, fs).value_or_exit(PAWNGET_LINE_INFO);
        msg::write_unlocalized_text(Color::none, cache_root);
        msg::println();
        Checks::exit_success(PAWNGET_LINE_INFO);
    }
}
