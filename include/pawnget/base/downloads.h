#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/base/cancellation.h>
#include <pawnget/base/expected.h>
#include <pawnget/base/optional.h>
#include <pawnget/base/stringview.h>

namespace pawnget
{
    struct SplitUrlView
    {
        StringView scheme;
        Optional<StringView> authority;
        StringView path_query_fragment;
    };

    // e.g. {"https", "//example.org", "/index.html?x=1"}
    Optional<SplitUrlView> parse_split_url_view(StringView raw_url);

    // The last segment of the URL's path, without query or fragment. Empty if the path ends in '/'.
    StringView url_filename(const SplitUrlView& url) noexcept;

    // Whether the URL has a scheme, a non-empty authority and a non-empty last path segment.
    bool is_well_formed_download_url(StringView raw_url);

    // Streams the body of url into out. Fails on transport errors, HTTP statuses outside 2xx, short writes, and
    // when cancel is triggered or its deadline passes.
    ExpectedL<Unit> download_to_file_pointer(StringView url, WriteFilePointer& out, const CancellationToken& cancel);
}
