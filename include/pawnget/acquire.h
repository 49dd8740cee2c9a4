#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/base/cancellation.h>
#include <pawnget/base/expected.h>
#include <pawnget/base/fmt.h>
#include <pawnget/base/message_sinks.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/path.h>
#include <pawnget/base/stringview.h>

#include <pawnget/catalog.h>
#include <pawnget/fetcher.h>

namespace pawnget
{
    enum class AcquisitionStage
    {
        ResolveDescriptor,
        Cache,
        Network,
        Extraction,
    };

    StringLiteral to_string_literal(AcquisitionStage stage) noexcept;

    struct AcquisitionError
    {
        AcquisitionStage stage;
        // names the platform, the version, the stage, and the underlying cause
        LocalizedString message;

        LocalizedString to_localized_string() const { return message; }
    };

    struct AcquisitionContext
    {
        const Filesystem& fs;
        const IArtifactDownloader& downloader;
        Path cache_root;
        // progress and recoverable problems, e.g. a corrupt cache entry
        MessageSink& status;
        const CancellationToken& cancel;
    };

    // Installs the members of the (platform, version) package into destination, from the cache when it holds a
    // usable archive and from the network otherwise.
    ExpectedT<Unit, AcquisitionError> acquire_artifact(const AcquisitionContext& context,
                                                       Platform platform,
                                                       StringView version,
                                                       const Path& destination);
    ExpectedT<Unit, AcquisitionError> acquire_artifact(const AcquisitionContext& context,
                                                       StringView platform,
                                                       StringView version,
                                                       const Path& destination);
}

PAWNGET_FORMAT_WITH_TO_STRING_LITERAL_NONMEMBER(pawnget::AcquisitionStage);
