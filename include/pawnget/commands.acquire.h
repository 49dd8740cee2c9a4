#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/fwd/pawngetcmdarguments.h>

namespace pawnget
{
    extern const CommandMetadata CommandAcquireMetadata;
    void command_acquire_and_exit(const PawnGetCmdArguments& args, const Filesystem& fs);
}
