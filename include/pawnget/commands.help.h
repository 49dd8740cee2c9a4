#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/fwd/pawngetcmdarguments.h>

namespace pawnget
{
    extern const CommandMetadata CommandHelpMetadata;
    void command_help_and_exit(const PawnGetCmdArguments& args, const Filesystem& fs);
}
