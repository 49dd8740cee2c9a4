#pragma once

#include <pawnget/base/fwd/files.h>
#include <pawnget/base/stringview.h>

#include <pawnget/fwd/pawngetcmdarguments.h>

#define STRINGIFY(...) #__VA_ARGS__
#define MACRO_TO_STRING(X) STRINGIFY(X)

#if !defined(PAWNGET_VERSION)
#error PAWNGET_VERSION must be defined
#endif

#define PAWNGET_VERSION_AS_STRING MACRO_TO_STRING(PAWNGET_VERSION)

namespace pawnget
{
    extern const StringLiteral pawnget_executable_version;
    extern const CommandMetadata CommandVersionMetadata;
    void command_version_and_exit(const PawnGetCmdArguments& args, const Filesystem& fs);
}
