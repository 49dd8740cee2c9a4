#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/fwd/pawngetcmdarguments.h>

namespace pawnget
{
    extern const CommandMetadata CommandCachePathMetadata;
    void command_cache_path_and_exit(const PawnGetCmdArguments& args, const Filesystem& fs);
}
