#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/base/cancellation.h>
#include <pawnget/base/expected.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/path.h>
#include <pawnget/base/stringview.h>

#include <pawnget/catalog.h>

#include <functional>

namespace pawnget
{
    inline constexpr StringLiteral EnvironmentVariablePawngetCacheRoot = "PAWNGET_CACHE_ROOT";

    // $PAWNGET_CACHE_ROOT, which must be absolute, or the "pawnget" directory of the platform cache root.
    ExpectedL<Path> get_default_cache_root();

    enum class CacheErrorKind
    {
        // the entry exists but could not be extracted; it should be fetched again
        Corrupt,
        Io,
        Cancelled,
    };

    struct CacheError
    {
        CacheErrorKind kind;
        LocalizedString message;

        LocalizedString to_localized_string() const { return message; }
    };

    // Fills an open file; returning an error abandons the store.
    using ArtifactWriter = std::function<ExpectedL<Unit>(WriteFilePointer&)>;

    // A directory of downloaded archives named by the last segment of their URL. Entries only ever appear through
    // an atomic rename of a completely written file, so any process sharing the directory sees a whole file or
    // nothing.
    struct ArtifactCache
    {
        ArtifactCache(const Filesystem& fs, Path cache_root);

        const Path& root() const noexcept { return m_root; }
        Path entry_path(StringView filename) const;

        bool has(StringView filename) const;

        // Installs package from its cache entry. Returns false if there is no entry.
        ExpectedT<bool, CacheError> satisfy(const ResolvedPackage& package,
                                            const Path& destination,
                                            const CancellationToken& cancel) const;

        // Streams writer's output to a process-unique temporary file, then renames it over the entry.
        ExpectedL<Path> store(StringView filename, const ArtifactWriter& writer) const;

    private:
        const Filesystem* m_fs;
        Path m_root;
    };
}
