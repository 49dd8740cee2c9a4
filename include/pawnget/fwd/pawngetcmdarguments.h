#pragma once

namespace pawnget
{
    struct ParsedArguments;
    struct CommandSetting;
    struct CommandMetadata;
    struct PawnGetCmdArguments;
}
