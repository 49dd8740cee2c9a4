#pragma once

#include <pawnget/base/fwd/files.h>

#include <pawnget/base/checks.h>
#include <pawnget/base/expected.h>
#include <pawnget/base/lineinfo.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/path.h>
#include <pawnget/base/stringview.h>

#include <stdio.h>

#include <cstdint>
#include <initializer_list>
#include <string>
#include <system_error>
#include <vector>

namespace pawnget
{
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);
    [[noreturn]] void exit_filesystem_call_error(LineInfo li,
                                                 const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args);
    struct IgnoreErrors
    {
        operator std::error_code&();

    private:
        std::error_code ec;
    };

    bool is_regular_file(FileType s);
    bool is_directory(FileType s);
    bool exists(FileType s);

    struct FilePointer
    {
    protected:
        FILE* m_fs;
        Path m_path;

        FilePointer(const Path& path);

    public:
        FilePointer() noexcept;

        FilePointer(const FilePointer&) = delete;
        FilePointer(FilePointer&& other) noexcept;
        FilePointer& operator=(const FilePointer&) = delete;
        explicit operator bool() const noexcept;

        std::error_code error() const noexcept;
        const Path& path() const;

        // Flushes and closes the file; returns a failure to write buffered data.
        std::error_code close() noexcept;

        ~FilePointer();
    };

    struct WriteFilePointer : FilePointer
    {
        WriteFilePointer() noexcept;
        WriteFilePointer(WriteFilePointer&&) noexcept;
        explicit WriteFilePointer(const Path& file_path, Append append, std::error_code& ec);
        WriteFilePointer& operator=(WriteFilePointer&& other) noexcept;
        size_t write(const void* buffer, size_t element_size, size_t element_count) const noexcept;
    };

    struct Filesystem
    {
        virtual FileType status(const Path& target, std::error_code& ec) const = 0;
        FileType status(const Path& target, LineInfo li) const noexcept;

        // Like status, but reports a symlink rather than what it points to
        virtual FileType symlink_status(const Path& target, std::error_code& ec) const = 0;
        FileType symlink_status(const Path& target, LineInfo li) const noexcept;

        bool exists(const Path& target, std::error_code& ec) const;
        bool exists(const Path& target, LineInfo li) const;
        bool is_regular_file(const Path& target) const;
        bool is_directory(const Path& target) const;

        virtual std::uint64_t file_size(const Path& file_path, std::error_code& ec) const = 0;
        std::uint64_t file_size(const Path& file_path, LineInfo li) const;

        virtual std::string read_contents(const Path& file_path, std::error_code& ec) const = 0;
        std::string read_contents(const Path& file_path, LineInfo li) const;

        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const = 0;
        void write_contents(const Path& file_path, StringView data, LineInfo li) const;

        // Returns whether the directory was created
        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const = 0;
        bool create_directories(const Path& new_directory, LineInfo li) const;

        virtual bool remove(const Path& target, std::error_code& ec) const = 0;
        bool remove(const Path& target, LineInfo li) const;

        virtual void remove_all(const Path& base, std::error_code& ec) const = 0;
        void remove_all(const Path& base, LineInfo li) const;

        virtual void rename(const Path& old_path, const Path& new_path, std::error_code& ec) const = 0;
        void rename(const Path& old_path, const Path& new_path, LineInfo li) const;

        // Returns whether the file was copied
        virtual bool copy_file(const Path& source,
                               const Path& destination,
                               CopyOptions options,
                               std::error_code& ec) const = 0;
        bool copy_file(const Path& source, const Path& destination, CopyOptions options, LineInfo li) const;

        virtual std::vector<Path> get_regular_files_recursive(const Path& dir, std::error_code& ec) const = 0;
        std::vector<Path> get_regular_files_recursive(const Path& dir, LineInfo li) const;

        virtual Path absolute(const Path& target, std::error_code& ec) const = 0;
        Path absolute(const Path& target, LineInfo li) const;

        // Resolves every symlink along target, which must exist
        virtual Path canonical(const Path& target, std::error_code& ec) const = 0;
        Path canonical(const Path& target, LineInfo li) const;

        virtual WriteFilePointer open_for_write(const Path& file_path, Append append, std::error_code& ec) const = 0;
        WriteFilePointer open_for_write(const Path& file_path, Append append, LineInfo li) const;
        WriteFilePointer open_for_write(const Path& file_path, LineInfo li) const;

    protected:
        Filesystem() = default;
        ~Filesystem() = default;
    };

    // Removes the directory tree at the given path, if any, when destroyed.
    struct TemporaryDirectory
    {
        TemporaryDirectory(const Filesystem& fs, Path path) noexcept : m_fs(&fs), m_path(std::move(path)) { }
        TemporaryDirectory(const TemporaryDirectory&) = delete;
        TemporaryDirectory& operator=(const TemporaryDirectory&) = delete;
        ~TemporaryDirectory();

        const Path& path() const noexcept { return m_path; }

    private:
        const Filesystem* m_fs;
        Path m_path;
    };
}
