#include <pawnget/base/downloads.h>
#include <pawnget/base/files.h>
#include <pawnget/base/system.debug.h>

#include <pawnget/fetcher.h>

namespace pawnget
{
    ExpectedL<Unit> CurlArtifactDownloader::download(StringView url,
                                                     WriteFilePointer& out,
                                                     const CancellationToken& cancel) const
    {
        return download_to_file_pointer(url, out, cancel);
    }

    ExpectedL<Path> fetch_artifact(const IArtifactDownloader& downloader,
                                   const ArtifactCache& cache,
                                   StringView url,
                                   StringView filename,
                                   const CancellationToken& cancel)
    {
        if (cancel.is_cancelled())
        {
            return msg::format(msgDownloadCancelled, msg::url = url);
        }

        Debug::println("Fetching ", url, " into ", cache.root());
        return cache.store(filename, [&](WriteFilePointer& out) { return downloader.download(url, out, cancel); });
    }
}
