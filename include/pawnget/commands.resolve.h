#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/fwd/pawngetcmdarguments.h>

namespace pawnget
{
    extern const CommandMetadata CommandResolveMetadata;
    void command_resolve_and_exit(const PawnGetCmdArguments& args, const Filesystem& fs);
}
