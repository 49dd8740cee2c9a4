#include <pawnget-test/util.h>

#include <pawnget/base/checks.h>
#include <pawnget/base/system.h>
#include <pawnget/base/system.process.h>

#if !defined(_WIN32)
#include <sys/stat.h>
#include <unistd.h>

#include <errno.h>
#endif

namespace pawnget::Test
{
    static Path internal_base_temporary_directory()
    {
#if defined(_WIN32)
        return Path(get_environment_variable("TEMP").value_or_exit(PAWNGET_LINE_INFO)) / "pawnget-test";
#else
        return "/tmp/pawnget-test";
#endif
    }

    const Path& base_temporary_directory() noexcept
    {
        const static Path BASE_TEMPORARY_DIRECTORY = internal_base_temporary_directory();
        return BASE_TEMPORARY_DIRECTORY;
    }

    Path fresh_test_directory(StringView name)
    {
        // unique per process so parallel test runs do not collide
        Path result = base_temporary_directory() / fmt::format("{}-{}", name, get_process_id());
        real_filesystem.remove_all(result, PAWNGET_LINE_INFO);
        real_filesystem.create_directories(result, PAWNGET_LINE_INFO);
        return result;
    }

    void write_files(const Filesystem& fs, const Path& root, const FileList& files)
    {
        for (auto&& file : files)
        {
            const auto target = root / file.first;
            fs.create_directories(Path(target.parent_path()), PAWNGET_LINE_INFO);
            fs.write_contents(target, file.second, PAWNGET_LINE_INFO);
        }
    }

    static void run_packer(const Command& cmd, const Path& source_dir)
    {
        ProcessLaunchSettings settings;
        settings.working_directory = source_dir;
        auto maybe_exit_code = cmd_execute(cmd, settings);
        if (auto exit_code = maybe_exit_code.get())
        {
            if (*exit_code != 0)
            {
                FAIL(cmd.command_line().to_string() << " exited with " << *exit_code);
            }
        }
        else
        {
            FAIL(maybe_exit_code.error().data());
        }
    }

    void make_tar_gz(const Path& source_dir, const Path& archive)
    {
        run_packer(Command{"tar"}.string_arg("czf").string_arg(archive).string_arg("."), source_dir);
    }

    void make_zip(const Path& source_dir, const Path& archive)
    {
        run_packer(Command{"zip"}.string_arg("-qr").string_arg(archive).string_arg("."), source_dir);
    }

#if !defined(_WIN32)
    void make_executable(const Path& file)
    {
        if (::chmod(file.c_str(), 0755) != 0)
        {
            FAIL("chmod " << file.native() << " failed with " << errno);
        }
    }

    bool is_executable(const Path& file)
    {
        struct stat s;
        if (::stat(file.c_str(), &s) != 0)
        {
            FAIL("stat " << file.native() << " failed with " << errno);
        }

        return (s.st_mode & 0111) != 0;
    }

    void create_symlink(StringView target, const Path& link)
    {
        real_filesystem.create_directories(Path(link.parent_path()), PAWNGET_LINE_INFO);
        if (::symlink(target.to_string().c_str(), link.c_str()) != 0)
        {
            FAIL("symlink " << link.native() << " failed with " << errno);
        }
    }

    void write_tool_script(const Path& dir, StringView name, StringView body)
    {
        const auto script = dir / name;
        real_filesystem.create_directories(dir, PAWNGET_LINE_INFO);
        real_filesystem.write_contents(script, Strings::concat("#!/bin/sh\n", body, "\n"), PAWNGET_LINE_INFO);
        make_executable(script);
    }

    ScopedPathPrefix::ScopedPathPrefix(const Path& dir) : m_old_path(get_environment_variable("PATH"))
    {
        auto new_path = dir.native();
        if (auto old_path = m_old_path.get())
        {
            new_path.push_back(':');
            new_path.append(*old_path);
        }

        set_environment_variable("PATH", ZStringView{new_path});
    }

    ScopedPathPrefix::~ScopedPathPrefix()
    {
        if (auto old_path = m_old_path.get())
        {
            set_environment_variable("PATH", ZStringView{*old_path});
        }
        else
        {
            set_environment_variable("PATH", nullopt);
        }
    }
#endif

    ExpectedL<Unit> FakeDownloader::download(StringView url, WriteFilePointer& out, const CancellationToken& cancel) const
    {
        ++calls;
        {
            std::lock_guard<std::mutex> lock(m_lock);
            m_requested_urls.push_back(url.to_string());
        }

        if (cancel.is_cancelled())
        {
            return msg::format(msgDownloadCancelled, msg::url = url);
        }

        if (mode == Mode::Fail)
        {
            return msg::format(msgDownloadFailed, msg::url = url);
        }

        const auto contents = real_filesystem.read_contents(source, PAWNGET_LINE_INFO);
        const auto to_write = mode == Mode::Truncate ? contents.size() / 2 : contents.size();
        if (out.write(contents.data(), 1, to_write) != to_write)
        {
            return msg::format(msgCurlShortWrite, msg::path = out.path());
        }

        if (mode == Mode::Truncate)
        {
            return msg::format(msgDownloadFailed, msg::url = url);
        }

        return Unit{};
    }

    std::vector<std::string> FakeDownloader::requested_urls() const
    {
        std::lock_guard<std::mutex> lock(m_lock);
        return m_requested_urls;
    }
}
