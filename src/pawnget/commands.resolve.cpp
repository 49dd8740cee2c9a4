#include <pawnget/base/checks.h>
#include <pawnget/base/files.h>

#include <pawnget/artifactcache.h>
#include <pawnget/catalog.h>
#include <pawnget/commands.h>
#include <pawnget/commands.resolve.h>
#include <pawnget/pawngetcmdarguments.h>

namespace
{
    using namespace pawnget;

    constexpr CommandSetting ResolveSettings[] = {
        {SwitchPlatform, &msgHelpOptionPlatform},
    };
}

namespace pawnget
{
    constexpr CommandMetadata CommandResolveMetadata{
        "resolve",
        msgResolveCommandSynopsis,
        "pawnget resolve 3.10.10 --platform=windows",
        1,
        1,
        ResolveSettings,
    };

    void command_resolve_and_exit(const PawnGetCmdArguments& args, const Filesystem& fs)
    {
        const auto parsed = args.parse_arguments(CommandResolveMetadata);
        const auto descriptor = determine_package(parsed).value_or_exit(PAWNGET_LINE_INFO);
        const auto package = resolve_package(*descriptor, parsed.command_arguments[0]).value_or_exit(PAWNGET_LINE_INFO);

        msg::println(msgResolvedUrl, msg::url = package.url);
        auto maybe_cache_root = determine_cache_root(args, fs);
        if (auto cache_root = maybe_cache_root.get())
        {
            const ArtifactCache cache(fs, *cache_root);
            msg::println(msgResolvedCacheFile, msg::path = cache.entry_path(package.filename));
        }

        msg::println(msgResolvedExtraction, msg::extraction = to_string_literal(package.extraction));
        msg::println(msgResolvedMembersHeader);
        for (auto&& mapping : package.path_map)
        {
            msg::print(LocalizedString().append_indent().append(
                msgResolvedMember, msg::member = mapping.member, msg::path = mapping.install_path));
            msg::println();
        }

        Checks::exit_success(PAWNGET_LINE_INFO);
    }
}
