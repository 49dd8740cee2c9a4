#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/base/cancellation.h>
#include <pawnget/base/expected.h>
#include <pawnget/base/fmt.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/path.h>
#include <pawnget/base/stringview.h>

#include <string>
#include <vector>

namespace pawnget
{
    enum class ExtractionType
    {
        Zip,
        TarGzip,
    };

    StringLiteral to_string_literal(ExtractionType type) noexcept;

    // A member of an archive and the path, relative to the install directory, that it is installed to.
    struct PathMapping
    {
        std::string member;
        std::string install_path;

        friend bool operator==(const PathMapping& lhs, const PathMapping& rhs) noexcept
        {
            return lhs.member == rhs.member && lhs.install_path == rhs.install_path;
        }
        friend bool operator!=(const PathMapping& lhs, const PathMapping& rhs) noexcept { return !(lhs == rhs); }
    };

    enum class ExtractionErrorKind
    {
        // the archive tool failed, e.g. on a truncated or foreign file
        UnreadableArchive,
        MissingMember,
        WriteFailed,
        Cancelled,
    };

    struct ExtractionError
    {
        ExtractionErrorKind kind;
        // the member involved, if any
        std::string member;
        LocalizedString message;

        LocalizedString to_localized_string() const { return message; }
    };

    // Unpacks archive into a scratch directory beside it, checks that every mapped member is present, then moves
    // each member to destination / install_path, replacing existing files. No unmapped file is left behind.
    ExpectedT<Unit, ExtractionError> extract_archive_members(const Filesystem& fs,
                                                             ExtractionType type,
                                                             const Path& archive,
                                                             const Path& destination,
                                                             const std::vector<PathMapping>& path_map,
                                                             const CancellationToken& cancel);
}

PAWNGET_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(pawnget::ExtractionType);
