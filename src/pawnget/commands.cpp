#include <pawnget/base/files.h>
#include <pawnget/base/strings.h>
#include <pawnget/base/system.h>

#include <pawnget/artifactcache.h>
#include <pawnget/commands.acquire.h>
#include <pawnget/commands.cache-path.h>
#include <pawnget/commands.h>
#include <pawnget/commands.help.h>
#include <pawnget/commands.resolve.h>
#include <pawnget/commands.version.h>
#include <pawnget/pawngetcmdarguments.h>

#include <iterator>

namespace pawnget
{
    static constexpr CommandRegistration<BasicCommandFn> basic_commands_storage[] = {
        {CommandAcquireMetadata, command_acquire_and_exit},
        {CommandCachePathMetadata, command_cache_path_and_exit},
        {CommandHelpMetadata, command_help_and_exit},
        {CommandResolveMetadata, command_resolve_and_exit},
        {CommandVersionMetadata, command_version_and_exit},
    };

    constexpr const CommandRegistration<BasicCommandFn>* const basic_commands_begin = std::begin(basic_commands_storage);
    constexpr const CommandRegistration<BasicCommandFn>* const basic_commands_end = std::end(basic_commands_storage);

    const CommandRegistration<BasicCommandFn>* find_command(StringView command_name) noexcept
    {
        for (auto&& command : basic_commands_storage)
        {
            if (Strings::case_insensitive_ascii_equals(command.metadata.name, command_name))
            {
                return &command;
            }
        }

        return nullptr;
    }

    std::vector<const CommandMetadata*> get_all_commands_metadata()
    {
        std::vector<const CommandMetadata*> result;
        for (auto&& basic_command : basic_commands_storage)
        {
            result.push_back(&basic_command.metadata);
        }

        return result;
    }

    std::string get_zero_args_usage()
    {
        LocalizedString result = msg::format(msgHelpUsage);
        result.append_raw("\n\n").append(msgHelpCommandsHeader);
        for (auto&& basic_command : basic_commands_storage)
        {
            result.append_raw('\n')
                .append_indent()
                .append_raw(fmt::format("{:<24}", basic_command.metadata.name))
                .append(*basic_command.metadata.synopsis);
        }

        result.append_raw("\n\n").append(msgHelpGlobalOptionsHeader);
        result.append_raw('\n')
            .append_indent()
            .append_raw(fmt::format("{:<24}", fmt::format("--{}", SwitchDebug)))
            .append(msgHelpOptionDebug);
        result.append_raw('\n')
            .append_indent()
            .append_raw(fmt::format("{:<24}", fmt::format("--{}=...", SwitchCacheRoot)))
            .append(msgHelpOptionCacheRoot,
                    msg::env_var = format_environment_variable(EnvironmentVariablePawngetCacheRoot));
        result.append_raw('\n')
            .append_indent()
            .append_raw(fmt::format("{:<24}", fmt::format("--{}=...", SwitchTimeout)))
            .append(msgHelpOptionTimeout,
                    msg::env_var = format_environment_variable(EnvironmentVariablePawngetDownloadTimeout));
        result.append_raw('\n');
        return result.extract_data();
    }

    ExpectedL<Path> determine_cache_root(const PawnGetCmdArguments& args, const Filesystem& fs)
    {
        if (auto cache_root_dir = args.cache_root_dir.get())
        {
            std::error_code ec;
            auto root = fs.absolute(*cache_root_dir, ec);
            if (ec)
            {
                return format_filesystem_call_error(ec, "absolute", {*cache_root_dir});
            }

            return root;
        }

        auto maybe_root = get_default_cache_root();
        if (!maybe_root)
        {
            return std::move(maybe_root).error().append_raw('\n').append(msgCacheUnavailable);
        }

        return maybe_root;
    }

    ExpectedL<const PackageDescriptor*> determine_package(const ParsedArguments& parsed)
    {
        if (auto platform_name = parsed.read_setting(SwitchPlatform))
        {
            return lookup_package(*platform_name);
        }

        auto host = get_host_platform();
        if (auto platform = host.get())
        {
            return &lookup_package(*platform);
        }

        return msg::format(msgHostPlatformUnsupported);
    }
}
