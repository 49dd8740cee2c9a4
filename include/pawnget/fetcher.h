#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/base/cancellation.h>
#include <pawnget/base/expected.h>
#include <pawnget/base/path.h>
#include <pawnget/base/stringview.h>

#include <pawnget/artifactcache.h>

namespace pawnget
{
    struct IArtifactDownloader
    {
        // Streams the resource at url into out without buffering it whole.
        virtual ExpectedL<Unit> download(StringView url, WriteFilePointer& out, const CancellationToken& cancel) const = 0;

        virtual ~IArtifactDownloader() = default;
    };

    struct CurlArtifactDownloader final : IArtifactDownloader
    {
        virtual ExpectedL<Unit> download(StringView url,
                                         WriteFilePointer& out,
                                         const CancellationToken& cancel) const override;
    };

    // Downloads url into cache as filename. On failure no entry named filename is created, and an existing one is
    // left untouched.
    ExpectedL<Path> fetch_artifact(const IArtifactDownloader& downloader,
                                   const ArtifactCache& cache,
                                   StringView url,
                                   StringView filename,
                                   const CancellationToken& cancel);
}
