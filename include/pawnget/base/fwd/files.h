#pragma once

namespace pawnget
{
    enum class CopyOptions
    {
        none = 0,
        skip_existing = 0x1,
        overwrite_existing = 0x2,
    };

    enum class FileType
    {
        none,
        not_found,
        regular,
        directory,
        symlink,
        unknown,
    };

    enum class Append
    {
        NO = 0,
        YES,
    };

    struct IgnoreErrors;
    struct Path;
    struct FilePointer;
    struct WriteFilePointer;
    struct Filesystem;
    struct TemporaryDirectory;

    extern const Filesystem& real_filesystem;
}
