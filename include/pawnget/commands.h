#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/base/expected.h>
#include <pawnget/base/path.h>
#include <pawnget/base/stringview.h>

#include <pawnget/fwd/pawngetcmdarguments.h>

#include <pawnget/catalog.h>

#include <stddef.h>

#include <string>
#include <vector>

namespace pawnget
{
    using BasicCommandFn = void (*)(const PawnGetCmdArguments& args, const Filesystem& fs);

    template<class T>
    struct CommandRegistration
    {
        const CommandMetadata& metadata;
        T function;
    };

    extern const CommandRegistration<BasicCommandFn>* const basic_commands_begin;
    extern const CommandRegistration<BasicCommandFn>* const basic_commands_end;

    // Returns nullptr if no command is named command_name.
    const CommandRegistration<BasicCommandFn>* find_command(StringView command_name) noexcept;

    std::vector<const CommandMetadata*> get_all_commands_metadata();

    std::string get_zero_args_usage();

    // --cache-root made absolute, or get_default_cache_root().
    ExpectedL<Path> determine_cache_root(const PawnGetCmdArguments& args, const Filesystem& fs);

    // The descriptor named by --platform, or the host's.
    ExpectedL<const PackageDescriptor*> determine_package(const ParsedArguments& parsed);
}
