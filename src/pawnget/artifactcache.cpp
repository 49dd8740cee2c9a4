#include <pawnget/base/checks.h>
#include <pawnget/base/files.h>
#include <pawnget/base/system.debug.h>
#include <pawnget/base/system.h>

#include <pawnget/archives.h>
#include <pawnget/artifactcache.h>

namespace
{
    using namespace pawnget;

    bool is_valid_entry_name(StringView filename) noexcept
    {
        return !filename.empty() && filename != "." && filename != ".." && !filename.contains('/') &&
               !filename.contains('\\');
    }

    CacheErrorKind to_cache_error_kind(ExtractionErrorKind kind)
    {
        switch (kind)
        {
            case ExtractionErrorKind::UnreadableArchive:
            case ExtractionErrorKind::MissingMember: return CacheErrorKind::Corrupt;
            case ExtractionErrorKind::WriteFailed: return CacheErrorKind::Io;
            case ExtractionErrorKind::Cancelled: return CacheErrorKind::Cancelled;
            default: Checks::unreachable(PAWNGET_LINE_INFO);
        }
    }
}

namespace pawnget
{
    ExpectedL<Path> get_default_cache_root()
    {
        auto maybe_root = get_environment_variable(EnvironmentVariablePawngetCacheRoot);
        if (auto root = maybe_root.get())
        {
            if (!root->empty())
            {
                Path p = std::move(*root);
                if (!p.is_absolute())
                {
                    return msg::format(msgCacheRootMustBeAbsolute,
                                       msg::env_var = format_environment_variable(EnvironmentVariablePawngetCacheRoot),
                                       msg::path = p);
                }

                return p;
            }
        }

        return get_platform_cache_root().map([](const Path& p) { return p / "pawnget"; });
    }

    ArtifactCache::ArtifactCache(const Filesystem& fs, Path cache_root) : m_fs(&fs), m_root(std::move(cache_root)) { }

    Path ArtifactCache::entry_path(StringView filename) const
    {
        if (!is_valid_entry_name(filename))
        {
            Checks::unreachable(PAWNGET_LINE_INFO, "cache entries must be plain file names");
        }

        return m_root / filename;
    }

    bool ArtifactCache::has(StringView filename) const { return m_fs->is_regular_file(entry_path(filename)); }

    ExpectedT<bool, CacheError> ArtifactCache::satisfy(const ResolvedPackage& package,
                                                       const Path& destination,
                                                       const CancellationToken& cancel) const
    {
        const auto entry = entry_path(package.filename);
        std::error_code ec;
        const auto file_type = m_fs->status(entry, ec);
        if (ec)
        {
            return CacheError{CacheErrorKind::Io,
                              msg::format(msgCacheEntryProbeFailed, msg::path = entry)
                                  .append_raw('\n')
                                  .append(format_filesystem_call_error(ec, "status", {entry}))};
        }

        if (!is_regular_file(file_type))
        {
            Debug::println("Cache miss: ", entry);
            return false;
        }

        Debug::println("Cache hit: ", entry);
        auto extracted =
            extract_archive_members(*m_fs, package.extraction, entry, destination, package.path_map, cancel);
        if (auto error = extracted.get() ? nullptr : &extracted.error())
        {
            const auto kind = to_cache_error_kind(error->kind);
            if (kind == CacheErrorKind::Corrupt)
            {
                return CacheError{kind,
                                  msg::format(msgCacheCorruptEntry, msg::path = entry)
                                      .append_raw('\n')
                                      .append(error->message)};
            }

            return CacheError{kind, std::move(error->message)};
        }

        return true;
    }

    ExpectedL<Path> ArtifactCache::store(StringView filename, const ArtifactWriter& writer) const
    {
        auto final_path = entry_path(filename);
        auto part_path = m_root / fmt::format("{}.{}.part", filename, get_process_id());
        std::error_code ec;
        auto file = m_fs->open_for_write(part_path, Append::NO, ec);
        if (ec)
        {
            return msg::format(msgCacheStoreFailed, msg::path = final_path)
                .append_raw('\n')
                .append(format_filesystem_call_error(ec, "open_for_write", {part_path}));
        }

        auto written = writer(file);
        ec = file.close();
        if (!written)
        {
            m_fs->remove(part_path, IgnoreErrors{});
            return std::move(written).error();
        }

        if (ec)
        {
            m_fs->remove(part_path, IgnoreErrors{});
            return msg::format(msgCacheStoreFailed, msg::path = final_path)
                .append_raw('\n')
                .append(format_filesystem_call_error(ec, "fclose", {part_path}));
        }

        m_fs->rename(part_path, final_path, ec);
        if (ec)
        {
            m_fs->remove(part_path, IgnoreErrors{});
            return msg::format(msgCacheStoreFailed, msg::path = final_path)
                .append_raw('\n')
                .append(format_filesystem_call_error(ec, "rename", {part_path, final_path}));
        }

        Debug::println("Stored ", final_path);
        return final_path;
    }
}
