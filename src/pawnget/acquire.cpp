#include <pawnget/base/checks.h>
#include <pawnget/base/files.h>
#include <pawnget/base/system.debug.h>

#include <pawnget/acquire.h>
#include <pawnget/archives.h>
#include <pawnget/artifactcache.h>

namespace
{
    using namespace pawnget;

    LocalizedString describe_stage(AcquisitionStage stage)
    {
        switch (stage)
        {
            case AcquisitionStage::ResolveDescriptor: return msg::format(msgAcquisitionStageResolve);
            case AcquisitionStage::Cache: return msg::format(msgAcquisitionStageCache);
            case AcquisitionStage::Network: return msg::format(msgAcquisitionStageNetwork);
            case AcquisitionStage::Extraction: return msg::format(msgAcquisitionStageExtraction);
            default: Checks::unreachable(PAWNGET_LINE_INFO);
        }
    }

    // failed to acquire pawnc <version> for <platform>
    // while <stage>:
    // <cause>
    AcquisitionError make_error(AcquisitionStage stage,
                                StringView platform,
                                StringView version,
                                const LocalizedString& cause)
    {
        return AcquisitionError{stage,
                                msg::format(msgAcquisitionFailed, msg::version = version, msg::platform = platform)
                                    .append_raw('\n')
                                    .append(msgAcquisitionWhileStage, msg::value = describe_stage(stage))
                                    .append_raw('\n')
                                    .append(cause)};
    }
}

namespace pawnget
{
    StringLiteral to_string_literal(AcquisitionStage stage) noexcept
    {
        switch (stage)
        {
            case AcquisitionStage::ResolveDescriptor: return "resolve";
            case AcquisitionStage::Cache: return "cache";
            case AcquisitionStage::Network: return "network";
            case AcquisitionStage::Extraction: return "extraction";
            default: Checks::unreachable(PAWNGET_LINE_INFO);
        }
    }

    ExpectedT<Unit, AcquisitionError> acquire_artifact(const AcquisitionContext& context,
                                                       Platform platform,
                                                       StringView version,
                                                       const Path& destination)
    {
        const auto platform_name = to_string_literal(platform);
        auto maybe_package = resolve_package(lookup_package(platform), version);
        auto package = maybe_package.get();
        if (!package)
        {
            return make_error(AcquisitionStage::ResolveDescriptor, platform_name, version, maybe_package.error());
        }

        context.status.println(msgAcquiringArtifact, msg::version = version, msg::platform = platform_name);

        const auto& fs = context.fs;
        std::error_code ec;
        fs.create_directories(destination, ec);
        if (ec)
        {
            return make_error(AcquisitionStage::Extraction,
                              platform_name,
                              version,
                              format_filesystem_call_error(ec, "create_directories", {destination}));
        }

        const ArtifactCache cache(fs, context.cache_root);
        auto maybe_hit = cache.satisfy(*package, destination, context.cancel);
        if (auto hit = maybe_hit.get())
        {
            if (*hit)
            {
                context.status.println(msgUsingCachedArtifact, msg::path = cache.entry_path(package->filename));
                return Unit{};
            }
        }
        else
        {
            auto& cache_error = maybe_hit.error();
            if (cache_error.kind != CacheErrorKind::Corrupt)
            {
                return make_error(AcquisitionStage::Cache, platform_name, version, cache_error.message);
            }

            // the download below replaces the entry
            context.status.println(Color::warning, warning_prefix().append(cache_error.message));
        }

        fs.create_directories(cache.root(), ec);
        if (ec)
        {
            return make_error(AcquisitionStage::Cache,
                              platform_name,
                              version,
                              format_filesystem_call_error(ec, "create_directories", {cache.root()}));
        }

        context.status.println(msgDownloadingArtifact, msg::url = package->url);
        auto maybe_archive = fetch_artifact(context.downloader, cache, package->url, package->filename, context.cancel);
        auto archive = maybe_archive.get();
        if (!archive)
        {
            return make_error(AcquisitionStage::Network, platform_name, version, maybe_archive.error());
        }

        context.status.println(msgExtractingArtifact, msg::path = *archive);
        auto extracted = extract_archive_members(
            fs, package->extraction, *archive, destination, package->path_map, context.cancel);
        if (!extracted)
        {
            // the entry stays cached; a retry treats it as corrupt and downloads it again
            return make_error(AcquisitionStage::Extraction,
                              platform_name,
                              version,
                              msg::format(msgExtractionFailed, msg::path = *archive)
                                  .append_raw('\n')
                                  .append(extracted.error().message));
        }

        Debug::println("Acquired ", platform_name, " ", version, " into ", destination);
        return Unit{};
    }

    ExpectedT<Unit, AcquisitionError> acquire_artifact(const AcquisitionContext& context,
                                                       StringView platform,
                                                       StringView version,
                                                       const Path& destination)
    {
        auto maybe_descriptor = lookup_package(platform);
        if (auto descriptor = maybe_descriptor.get())
        {
            return acquire_artifact(context, (*descriptor)->platform, version, destination);
        }

        return make_error(AcquisitionStage::ResolveDescriptor, platform, version, maybe_descriptor.error());
    }
}
