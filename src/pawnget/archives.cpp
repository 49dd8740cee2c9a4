#include <pawnget/base/checks.h>
#include <pawnget/base/files.h>
#include <pawnget/base/strings.h>
#include <pawnget/base/system.debug.h>
#include <pawnget/base/system.h>
#include <pawnget/base/system.process.h>

#include <pawnget/archives.h>

namespace
{
    using namespace pawnget;

    struct ArchiveTool
    {
        StringLiteral name;
        Command command;
    };

    ArchiveTool make_unpack_command(ExtractionType type, const Path& archive)
    {
        switch (type)
        {
            case ExtractionType::TarGzip: return {"tar", Command{"tar"}.string_arg("xzf").string_arg(archive)};
            case ExtractionType::Zip:
#if defined(_WIN32)
                // bsdtar, shipped with Windows, reads zip files
                return {"tar", Command{"tar"}.string_arg("xf").string_arg(archive)};
#else
                return {"unzip", Command{"unzip"}.string_arg("-qqo").string_arg(archive)};
#endif
            default: Checks::unreachable(PAWNGET_LINE_INFO);
        }
    }

    ExtractionError cancelled_error()
    {
        return ExtractionError{ExtractionErrorKind::Cancelled, std::string(), msg::format(msgOperationCancelled)};
    }

    ExtractionError write_failed_error(const PathMapping& mapping, const Path& target, LocalizedString&& cause)
    {
        return ExtractionError{
            ExtractionErrorKind::WriteFailed,
            mapping.member,
            msg::format(msgExtractionWriteFailed, msg::member = mapping.member, msg::path = target)
                .append_raw('\n')
                .append(cause)};
    }

    struct UnpackedMember
    {
        Path source;
        bool is_link;
    };

    // Follows a member that the archive stores as a symlink. The link must end at a regular file inside the
    // unpacked tree.
    ExpectedT<Path, ExtractionError> resolve_member_link(const Filesystem& fs,
                                                         const Path& scratch,
                                                         const PathMapping& mapping,
                                                         const Path& archive)
    {
        std::error_code ec;
        const auto scratch_root = fs.canonical(scratch, ec);
        if (ec)
        {
            return ExtractionError{ExtractionErrorKind::UnreadableArchive,
                                   mapping.member,
                                   format_filesystem_call_error(ec, "canonical", {scratch})};
        }

        auto resolved = fs.canonical(scratch / mapping.member, ec);
        if (ec || !fs.is_regular_file(resolved))
        {
            Debug::println("The link ", mapping.member, " does not lead to a regular file");
            return ExtractionError{
                ExtractionErrorKind::MissingMember,
                mapping.member,
                msg::format(msgArchiveMemberMissing, msg::member = mapping.member, msg::path = archive)};
        }

        if (!Strings::starts_with(resolved, scratch_root + PAWNGET_PREFERRED_SEPARATOR))
        {
            return ExtractionError{
                ExtractionErrorKind::MissingMember,
                mapping.member,
                msg::format(msgArchiveMemberLinksOutside, msg::member = mapping.member, msg::path = archive)};
        }

        return resolved;
    }

    // Moves source onto target, replacing target. Falls back to copying when source and target are on different
    // devices.
    void move_file(const Filesystem& fs, const Path& source, const Path& target, std::error_code& ec)
    {
        fs.rename(source, target, ec);
        if (!ec)
        {
            return;
        }

        Debug::println("rename ", source, " -> ", target, " failed (", ec.message(), "), copying instead");
        fs.copy_file(source, target, CopyOptions::overwrite_existing, ec);
    }
}

namespace pawnget
{
    StringLiteral to_string_literal(ExtractionType type) noexcept
    {
        switch (type)
        {
            case ExtractionType::Zip: return "zip";
            case ExtractionType::TarGzip: return "tar+gzip";
            default: Checks::unreachable(PAWNGET_LINE_INFO);
        }
    }

    ExpectedT<Unit, ExtractionError> extract_archive_members(const Filesystem& fs,
                                                             ExtractionType type,
                                                             const Path& archive,
                                                             const Path& destination,
                                                             const std::vector<PathMapping>& path_map,
                                                             const CancellationToken& cancel)
    {
        if (cancel.is_cancelled())
        {
            return cancelled_error();
        }

        std::error_code ec;
        const auto absolute_archive = fs.absolute(archive, ec);
        if (ec)
        {
            return ExtractionError{ExtractionErrorKind::UnreadableArchive,
                                   std::string(),
                                   format_filesystem_call_error(ec, "absolute", {archive})};
        }

        auto scratch_path = absolute_archive;
        scratch_path += fmt::format(".{}.partial", get_process_id());
        fs.remove_all(scratch_path, ec);
        if (!ec)
        {
            fs.create_directories(scratch_path, ec);
        }

        if (ec)
        {
            return ExtractionError{ExtractionErrorKind::WriteFailed,
                                   std::string(),
                                   format_filesystem_call_error(ec, "create_directories", {scratch_path})};
        }

        TemporaryDirectory scratch(fs, std::move(scratch_path));
        auto tool = make_unpack_command(type, absolute_archive);
        Debug::println("Unpacking ", absolute_archive, " as ", to_string_literal(type), " into ", scratch.path());
        auto maybe_exit = cmd_execute(tool.command, ProcessLaunchSettings{scratch.path()});
        // SIGINT also reaches the tool, so its exit code says nothing about the archive
        if (cancel.is_cancelled())
        {
            return cancelled_error();
        }

        if (!succeeded(maybe_exit))
        {
            if (auto exit_code = maybe_exit.get())
            {
                return ExtractionError{ExtractionErrorKind::UnreadableArchive,
                                       std::string(),
                                       msg::format(msgArchiveToolFailed,
                                                   msg::tool_name = tool.name,
                                                   msg::path = archive,
                                                   msg::exit_code = *exit_code)};
            }

            return ExtractionError{
                ExtractionErrorKind::UnreadableArchive,
                std::string(),
                msg::format(msgArchiveToolLaunchFailed, msg::tool_name = tool.name, msg::path = archive)
                    .append_raw('\n')
                    .append(maybe_exit.error())};
        }

        // every member is checked before anything is installed
        std::vector<UnpackedMember> members;
        members.reserve(path_map.size());
        for (auto&& mapping : path_map)
        {
            auto unpacked = scratch.path() / mapping.member;
            const auto link_type = fs.symlink_status(unpacked, ec);
            if (ec)
            {
                return ExtractionError{ExtractionErrorKind::UnreadableArchive,
                                       mapping.member,
                                       format_filesystem_call_error(ec, "symlink_status", {unpacked})};
            }

            if (link_type == FileType::symlink)
            {
                auto maybe_resolved = resolve_member_link(fs, scratch.path(), mapping, archive);
                if (auto resolved = maybe_resolved.get())
                {
                    members.push_back(UnpackedMember{std::move(*resolved), true});
                    continue;
                }

                return std::move(maybe_resolved).error();
            }

            if (!is_regular_file(link_type))
            {
                return ExtractionError{
                    ExtractionErrorKind::MissingMember,
                    mapping.member,
                    msg::format(msgArchiveMemberMissing, msg::member = mapping.member, msg::path = archive)};
            }

            members.push_back(UnpackedMember{std::move(unpacked), false});
        }

        // links are copied first, since the files they point at may be moved away afterwards
        std::vector<size_t> install_order;
        install_order.reserve(members.size());
        for (size_t idx = 0; idx < members.size(); ++idx)
        {
            if (members[idx].is_link) install_order.push_back(idx);
        }

        for (size_t idx = 0; idx < members.size(); ++idx)
        {
            if (!members[idx].is_link) install_order.push_back(idx);
        }

        for (auto idx : install_order)
        {
            if (cancel.is_cancelled())
            {
                return cancelled_error();
            }

            const auto& mapping = path_map[idx];
            const auto& member = members[idx];
            const auto target = destination / mapping.install_path;
            const auto target_dir = Path(target.parent_path());
            if (!target_dir.empty())
            {
                fs.create_directories(target_dir, ec);
                if (ec)
                {
                    return write_failed_error(
                        mapping, target, format_filesystem_call_error(ec, "create_directories", {target_dir}));
                }
            }

            if (member.is_link)
            {
                fs.copy_file(member.source, target, CopyOptions::overwrite_existing, ec);
            }
            else
            {
                move_file(fs, member.source, target, ec);
            }

            if (ec)
            {
                return write_failed_error(mapping, target, format_filesystem_call_error(ec, "copy_file", {target}));
            }

            Debug::println("Installed ", mapping.member, " to ", target);
        }

        return Unit{};
    }
}
