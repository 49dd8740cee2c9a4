#pragma once

#include <pawnget/fwd/pawngetcmdarguments.h>

#include <pawnget/base/expected.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/optional.h>
#include <pawnget/base/stringview.h>

#include <chrono>
#include <map>
#include <string>
#include <vector>

namespace pawnget
{
    inline constexpr StringLiteral EnvironmentVariablePawngetDebug = "PAWNGET_DEBUG";
    inline constexpr StringLiteral EnvironmentVariablePawngetDownloadTimeout = "PAWNGET_DOWNLOAD_TIMEOUT";

    inline constexpr StringLiteral SwitchDebug = "debug";
    inline constexpr StringLiteral SwitchCacheRoot = "cache-root";
    inline constexpr StringLiteral SwitchTimeout = "timeout";
    inline constexpr StringLiteral SwitchPlatform = "platform";

    struct ParsedArguments
    {
        std::map<StringLiteral, std::string, std::less<>> settings;
        std::vector<std::string> command_arguments;

        const std::string* read_setting(StringLiteral setting) const noexcept;
    };

    struct CommandSetting
    {
        StringLiteral name;
        const msg::MessageT<>* helpmsg;
    };

    struct CommandMetadata
    {
        template<size_t N>
        constexpr CommandMetadata(StringLiteral name,
                                  const msg::MessageT<>& synopsis,
                                  StringLiteral example,
                                  size_t minimum_arity,
                                  size_t maximum_arity,
                                  const CommandSetting (&settings)[N]) noexcept
            : name(name)
            , synopsis(&synopsis)
            , example(example)
            , minimum_arity(minimum_arity)
            , maximum_arity(maximum_arity)
            , settings(settings)
            , settings_size(N)
        {
        }

        constexpr CommandMetadata(StringLiteral name,
                                  const msg::MessageT<>& synopsis,
                                  StringLiteral example,
                                  size_t minimum_arity,
                                  size_t maximum_arity) noexcept
            : name(name)
            , synopsis(&synopsis)
            , example(example)
            , minimum_arity(minimum_arity)
            , maximum_arity(maximum_arity)
            , settings(nullptr)
            , settings_size(0)
        {
        }

        StringLiteral name;
        const msg::MessageT<>* synopsis;
        StringLiteral example;

        size_t minimum_arity;
        size_t maximum_arity;

        const CommandSetting* settings;
        size_t settings_size;

        const CommandSetting* find_setting(StringView setting_name) const noexcept;
    };

    LocalizedString usage_for_command(const CommandMetadata& command_metadata);

    struct PawnGetCmdArguments
    {
        static PawnGetCmdArguments create_from_command_line(const int argc, const char* const* const argv);
        static PawnGetCmdArguments create_from_arg_sequence(const std::string* arg_begin, const std::string* arg_end);

        // Fills in options not given on the command line from PAWNGET_DEBUG and PAWNGET_DOWNLOAD_TIMEOUT.
        void imbue_from_environment();

        // Checks the arguments that follow the command against command_metadata.
        ExpectedL<ParsedArguments> try_parse_arguments(const CommandMetadata& command_metadata) const;
        // As try_parse_arguments, but prints the error and the command's usage and exits on failure.
        ParsedArguments parse_arguments(const CommandMetadata& command_metadata) const;

        const std::string& get_command() const noexcept { return command; }

        // Parse failures of the global options, if any.
        const std::vector<LocalizedString>& get_errors() const noexcept { return errors; }

        // --timeout, in seconds; empty for no deadline.
        ExpectedL<Optional<std::chrono::seconds>> download_timeout() const;

        Optional<bool> debug;
        Optional<std::string> cache_root_dir;
        Optional<std::string> download_timeout_seconds;

    private:
        std::string command;
        std::vector<std::string> positional_arguments;
        // --name or --name=value options other than the global ones, in order
        std::vector<std::pair<std::string, Optional<std::string>>> command_options;
        std::vector<LocalizedString> errors;
    };
}
