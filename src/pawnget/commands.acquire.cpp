#include <pawnget/base/cancellation.h>
#include <pawnget/base/checks.h>
#include <pawnget/base/files.h>
#include <pawnget/base/message_sinks.h>
#include <pawnget/base/system.debug.h>

#include <pawnget/acquire.h>
#include <pawnget/commands.acquire.h>
#include <pawnget/commands.h>
#include <pawnget/fetcher.h>
#include <pawnget/pawngetcmdarguments.h>

namespace
{
    using namespace pawnget;

    constexpr CommandSetting AcquireSettings[] = {
        {SwitchPlatform, &msgHelpOptionPlatform},
    };
}

namespace pawnget
{
    constexpr CommandMetadata CommandAcquireMetadata{
        "acquire",
        msgAcquireCommandSynopsis,
        "pawnget acquire 3.10.10 ./pawno --platform=linux",
        2,
        2,
        AcquireSettings,
    };

    void command_acquire_and_exit(const PawnGetCmdArguments& args, const Filesystem& fs)
    {
        const auto parsed = args.parse_arguments(CommandAcquireMetadata);
        const auto& version = parsed.command_arguments[0];
        const auto destination = fs.absolute(parsed.command_arguments[1], PAWNGET_LINE_INFO);

        auto& cancel = global_cancellation_token();
        const auto maybe_timeout = args.download_timeout().value_or_exit(PAWNGET_LINE_INFO);
        if (auto timeout = maybe_timeout.get())
        {
            Debug::println("Download deadline in ", timeout->count(), "s");
            cancel.set_timeout(*timeout);
        }

        const auto package = determine_package(parsed).value_or_exit(PAWNGET_LINE_INFO);
        CurlArtifactDownloader downloader;
        const AcquisitionContext context{
            fs,
            downloader,
            determine_cache_root(args, fs).value_or_exit(PAWNGET_LINE_INFO),
            stdout_sink,
            cancel,
        };

        auto result = acquire_artifact(context, package->platform, version, destination);
        if (!result)
        {
            Debug::println("Acquisition failed at stage ", to_string_literal(result.error().stage));
            msg::println_error(result.error().message);
            Checks::exit_fail(PAWNGET_LINE_INFO);
        }

        msg::println(Color::success, msgAcquireSucceeded, msg::version = version, msg::path = destination);
        Checks::exit_success(PAWNGET_LINE_INFO);
    }
}
