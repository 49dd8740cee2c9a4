#include <pawnget/base/files.h>
#include <pawnget/base/strings.h>
#include <pawnget/base/system.debug.h>

#include <errno.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace stdfs = std::filesystem;

namespace
{
    using namespace pawnget;

    constexpr char preferred_separator = PAWNGET_PREFERRED_SEPARATOR[0];

    const char* find_filename(const char* first, const char* last) noexcept
    {
        while (last != first && !is_slash(last[-1]))
        {
            --last;
        }

        return last;
    }

    const char* find_root_end(const char* first, const char* last) noexcept
    {
#if defined(_WIN32)
        // X:
        if (last - first >= 2 && first[1] == ':' &&
            ((first[0] >= 'A' && first[0] <= 'Z') || (first[0] >= 'a' && first[0] <= 'z')))
        {
            first += 2;
        }
#endif // _WIN32
        return std::find_if_not(first, last, is_slash);
    }

    stdfs::path to_stdfs_path(const Path& p) { return stdfs::u8path(p.native()); }

    Path from_stdfs_path(const stdfs::path& p) { return Path(p.u8string()); }

    FileType convert_file_type(stdfs::file_type type) noexcept
    {
        switch (type)
        {
            case stdfs::file_type::none: return FileType::none;
            case stdfs::file_type::not_found: return FileType::not_found;
            case stdfs::file_type::regular: return FileType::regular;
            case stdfs::file_type::directory: return FileType::directory;
            case stdfs::file_type::symlink: return FileType::symlink;
            default: return FileType::unknown;
        }
    }

    void translate_not_found_to_success(std::error_code& ec)
    {
        if (ec && (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory ||
                   ec == std::errc::too_many_symbolic_link_levels))
        {
            ec.clear();
        }
    }
}

namespace pawnget
{
    LocalizedString format_filesystem_call_error(const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args)
    {
        auto arguments = args.size() == 0 ? "()" : "(\"" + Strings::join("\", \"", args.begin(), args.end()) + "\")";
        return LocalizedString::from_raw(Strings::concat(call_name, arguments, ": ", ec.message()));
    }

    [[noreturn]] void exit_filesystem_call_error(LineInfo li,
                                                 const std::error_code& ec,
                                                 StringView call_name,
                                                 std::initializer_list<StringView> args)
    {
        Checks::msg_exit_with_error(li, format_filesystem_call_error(ec, call_name, args));
    }

    IgnoreErrors::operator std::error_code&() { return ec; }

    bool is_slash(char c) noexcept
    {
        return c == '/'
#if defined(_WIN32)
               || c == '\\'
#endif // _WIN32
            ;
    }

    bool is_absolute_path(StringView path) noexcept
    {
#if defined(_WIN32)
        if (path.size() >= 3 && path[1] == ':' && is_slash(path[2]))
        {
            return true;
        }

        return path.size() >= 2 && is_slash(path[0]) && is_slash(path[1]);
#else  // ^^^ _WIN32 / !_WIN32 vvv
        return !path.empty() && path[0] == '/';
#endif // ^^^ !_WIN32
    }

    Path::Path(const StringView sv) : m_str(sv.to_string()) { }
    Path::Path(const std::string& s) : m_str(s) { }
    Path::Path(std::string&& s) : m_str(std::move(s)) { }
    Path::Path(const char* s) : m_str(s) { }

    const std::string& Path::native() const& noexcept { return m_str; }
    std::string&& Path::native() && noexcept { return std::move(m_str); }
    Path::operator StringView() const noexcept { return m_str; }

    const char* Path::c_str() const noexcept { return m_str.c_str(); }

    std::string Path::generic_u8string() const
    {
#if defined(_WIN32)
        auto result = m_str;
        std::replace(result.begin(), result.end(), '\\', '/');
        return result;
#else
        return m_str;
#endif
    }

    bool Path::empty() const noexcept { return m_str.empty(); }

    Path Path::operator/(StringView sv) const&
    {
        Path result = *this;
        result /= sv;
        return result;
    }

    Path Path::operator/(StringView sv) &&
    {
        *this /= sv;
        return std::move(*this);
    }

    Path Path::operator+(StringView sv) const&
    {
        Path result = *this;
        result.m_str.append(sv.data(), sv.size());
        return result;
    }

    Path Path::operator+(StringView sv) &&
    {
        m_str.append(sv.data(), sv.size());
        return std::move(*this);
    }

    Path& Path::operator/=(StringView sv)
    {
        if (is_absolute_path(sv) || m_str.empty())
        {
            m_str.assign(sv.data(), sv.size());
            return *this;
        }

        if (!sv.empty() && !is_slash(m_str.back()))
        {
            m_str.push_back(preferred_separator);
        }

        m_str.append(sv.data(), sv.size());
        return *this;
    }

    Path& Path::operator+=(StringView sv)
    {
        m_str.append(sv.data(), sv.size());
        return *this;
    }

    void Path::replace_filename(StringView sv)
    {
        // note: sv may refer to data in m_str, so do everything with one call to replace()
        const char* first = m_str.data();
        const char* last = first + m_str.size();
        const char* filename = find_filename(first, last);
        m_str.replace(m_str.begin() + (filename - first), m_str.end(), sv.data(), sv.size());
    }

    void Path::remove_filename()
    {
        const char* first = m_str.data();
        const char* last = first + m_str.size();
        const char* filename = find_filename(first, last);
        m_str.erase(m_str.begin() + (filename - first), m_str.end());
    }

    void Path::clear() { m_str.clear(); }

    bool Path::make_parent_path()
    {
        const auto parent = parent_path();
        if (parent.size() == m_str.size())
        {
            return false;
        }

        m_str.resize(parent.size());
        return true;
    }

    StringView Path::parent_path() const
    {
        const char* first = m_str.data();
        const char* last = first + m_str.size();
        const char* root_end = find_root_end(first, last);
        const char* filename = find_filename(root_end, last);
        // strip the separators between the parent and the filename, but never the root
        while (filename != root_end && is_slash(filename[-1]))
        {
            --filename;
        }

        if (filename == root_end)
        {
            return StringView{first, root_end};
        }

        return StringView{first, filename};
    }

    StringView Path::filename() const
    {
        const char* first = m_str.data();
        const char* last = first + m_str.size();
        return StringView{find_filename(first, last), last};
    }

    StringView Path::extension() const
    {
        const auto name = filename();
        if (name == "." || name == "..")
        {
            return StringView{};
        }

        const auto dot = std::find(std::make_reverse_iterator(name.end()), std::make_reverse_iterator(name.begin()), '.');
        if (dot.base() == name.begin() || dot.base() - 1 == name.begin())
        {
            return StringView{};
        }

        return StringView{dot.base() - 1, name.end()};
    }

    StringView Path::stem() const
    {
        const auto name = filename();
        const auto ext = extension();
        return StringView{name.begin(), name.size() - ext.size()};
    }

    bool Path::is_absolute() const { return is_absolute_path(m_str); }
    bool Path::is_relative() const { return !is_absolute(); }

    bool is_regular_file(FileType s) { return s == FileType::regular; }
    bool is_directory(FileType s) { return s == FileType::directory; }
    bool exists(FileType s) { return s != FileType::not_found && s != FileType::none; }

    FilePointer::FilePointer(const Path& path) : m_fs(nullptr), m_path(path) { }
    FilePointer::FilePointer() noexcept : m_fs(nullptr), m_path{} { }

    FilePointer::FilePointer(FilePointer&& other) noexcept : m_fs(other.m_fs), m_path(std::move(other.m_path))
    {
        other.m_fs = nullptr;
        other.m_path = {};
    }

    FilePointer::operator bool() const noexcept { return m_fs != nullptr; }

    std::error_code FilePointer::error() const noexcept
    {
        return std::error_code(::ferror(m_fs), std::generic_category());
    }

    const Path& FilePointer::path() const { return m_path; }

    std::error_code FilePointer::close() noexcept
    {
        std::error_code ec;
        if (m_fs)
        {
            const bool had_error = ::ferror(m_fs) != 0;
            if (::fclose(m_fs) != 0 || had_error)
            {
                ec.assign(errno ? errno : EIO, std::generic_category());
            }

            m_fs = nullptr;
        }

        return ec;
    }

    FilePointer::~FilePointer()
    {
        if (m_fs)
        {
            Checks::check_exit(PAWNGET_LINE_INFO, ::fclose(m_fs) == 0);
        }
    }

    WriteFilePointer::WriteFilePointer() noexcept = default;

    WriteFilePointer::WriteFilePointer(WriteFilePointer&&) noexcept = default;

    WriteFilePointer::WriteFilePointer(const Path& file_path, Append append, std::error_code& ec)
        : FilePointer(file_path)
    {
#if defined(_WIN32)
        ec.assign(::_wfopen_s(&m_fs, to_stdfs_path(file_path).c_str(), append == Append::YES ? L"ab" : L"wb"),
                  std::generic_category());
#else  // ^^^ _WIN32 / !_WIN32 vvv
        m_fs = ::fopen(file_path.c_str(), append == Append::YES ? "ab" : "wb");
        if (m_fs)
        {
            ec.clear();
        }
        else
        {
            ec.assign(errno, std::generic_category());
        }
#endif // ^^^ !_WIN32
    }

    WriteFilePointer& WriteFilePointer::operator=(WriteFilePointer&& other) noexcept
    {
        WriteFilePointer fp{std::move(other)};
        std::swap(m_fs, fp.m_fs);
        std::swap(m_path, fp.m_path);
        return *this;
    }

    size_t WriteFilePointer::write(const void* buffer, size_t element_size, size_t element_count) const noexcept
    {
        return ::fwrite(buffer, element_size, element_count, m_fs);
    }

    FileType Filesystem::status(const Path& target, LineInfo li) const noexcept
    {
        std::error_code ec;
        auto result = this->status(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return result;
    }

    FileType Filesystem::symlink_status(const Path& target, LineInfo li) const noexcept
    {
        std::error_code ec;
        auto result = this->symlink_status(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return result;
    }

    bool Filesystem::exists(const Path& target, std::error_code& ec) const
    {
        return pawnget::exists(this->status(target, ec));
    }

    bool Filesystem::exists(const Path& target, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->exists(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return result;
    }

    bool Filesystem::is_regular_file(const Path& target) const
    {
        std::error_code ec;
        return pawnget::is_regular_file(this->status(target, ec)) && !ec;
    }

    bool Filesystem::is_directory(const Path& target) const
    {
        std::error_code ec;
        return pawnget::is_directory(this->status(target, ec)) && !ec;
    }

    std::uint64_t Filesystem::file_size(const Path& file_path, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->file_size(file_path, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {file_path});
        }

        return result;
    }

    std::string Filesystem::read_contents(const Path& file_path, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->read_contents(file_path, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {file_path});
        }

        return result;
    }

    void Filesystem::write_contents(const Path& file_path, StringView data, LineInfo li) const
    {
        std::error_code ec;
        this->write_contents(file_path, data, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {file_path});
        }
    }

    bool Filesystem::create_directories(const Path& new_directory, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->create_directories(new_directory, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {new_directory});
        }

        return result;
    }

    bool Filesystem::remove(const Path& target, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->remove(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return result;
    }

    void Filesystem::remove_all(const Path& base, LineInfo li) const
    {
        std::error_code ec;
        this->remove_all(base, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {base});
        }
    }

    void Filesystem::rename(const Path& old_path, const Path& new_path, LineInfo li) const
    {
        std::error_code ec;
        this->rename(old_path, new_path, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {old_path, new_path});
        }
    }

    bool Filesystem::copy_file(const Path& source, const Path& destination, CopyOptions options, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->copy_file(source, destination, options, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {source, destination});
        }

        return result;
    }

    std::vector<Path> Filesystem::get_regular_files_recursive(const Path& dir, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->get_regular_files_recursive(dir, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {dir});
        }

        return result;
    }

    Path Filesystem::absolute(const Path& target, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->absolute(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return result;
    }

    Path Filesystem::canonical(const Path& target, LineInfo li) const
    {
        std::error_code ec;
        auto result = this->canonical(target, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {target});
        }

        return result;
    }

    WriteFilePointer Filesystem::open_for_write(const Path& file_path, Append append, LineInfo li) const
    {
        std::error_code ec;
        auto ret = this->open_for_write(file_path, append, ec);
        if (ec)
        {
            exit_filesystem_call_error(li, ec, __func__, {file_path});
        }

        return ret;
    }

    WriteFilePointer Filesystem::open_for_write(const Path& file_path, LineInfo li) const
    {
        return this->open_for_write(file_path, Append::NO, li);
    }

    TemporaryDirectory::~TemporaryDirectory()
    {
        std::error_code ec;
        m_fs->remove_all(m_path, ec);
        if (ec)
        {
            Debug::println("Failed to remove temporary directory ", m_path, ": ", ec.message());
        }
    }

    struct RealFilesystem final : Filesystem
    {
        virtual FileType status(const Path& target, std::error_code& ec) const override
        {
            auto result = stdfs::status(to_stdfs_path(target), ec);
            translate_not_found_to_success(ec);
            return convert_file_type(result.type());
        }

        virtual FileType symlink_status(const Path& target, std::error_code& ec) const override
        {
            auto result = stdfs::symlink_status(to_stdfs_path(target), ec);
            translate_not_found_to_success(ec);
            return convert_file_type(result.type());
        }

        virtual std::uint64_t file_size(const Path& file_path, std::error_code& ec) const override
        {
            return stdfs::file_size(to_stdfs_path(file_path), ec);
        }

        virtual std::string read_contents(const Path& file_path, std::error_code& ec) const override
        {
            std::ifstream in(to_stdfs_path(file_path), std::ios::binary);
            if (!in)
            {
                ec = std::make_error_code(std::errc::no_such_file_or_directory);
                return std::string();
            }

            std::string result{std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
            if (in.bad())
            {
                ec = std::make_error_code(std::errc::io_error);
                return std::string();
            }

            ec.clear();
            return result;
        }

        virtual void write_contents(const Path& file_path, StringView data, std::error_code& ec) const override
        {
            WriteFilePointer f{file_path, Append::NO, ec};
            if (ec)
            {
                return;
            }

            if (f.write(data.data(), 1, data.size()) != data.size())
            {
                ec = f.error();
                if (!ec)
                {
                    ec = std::make_error_code(std::errc::io_error);
                }

                return;
            }

            ec = f.close();
        }

        virtual bool create_directories(const Path& new_directory, std::error_code& ec) const override
        {
            return stdfs::create_directories(to_stdfs_path(new_directory), ec);
        }

        virtual bool remove(const Path& target, std::error_code& ec) const override
        {
            return stdfs::remove(to_stdfs_path(target), ec);
        }

        virtual void remove_all(const Path& base, std::error_code& ec) const override
        {
            stdfs::remove_all(to_stdfs_path(base), ec);
        }

        virtual void rename(const Path& old_path, const Path& new_path, std::error_code& ec) const override
        {
            stdfs::rename(to_stdfs_path(old_path), to_stdfs_path(new_path), ec);
        }

        virtual bool copy_file(const Path& source,
                               const Path& destination,
                               CopyOptions options,
                               std::error_code& ec) const override
        {
            auto std_options = stdfs::copy_options::none;
            switch (options)
            {
                case CopyOptions::none: break;
                case CopyOptions::skip_existing: std_options = stdfs::copy_options::skip_existing; break;
                case CopyOptions::overwrite_existing: std_options = stdfs::copy_options::overwrite_existing; break;
                default: Checks::unreachable(PAWNGET_LINE_INFO);
            }

            return stdfs::copy_file(to_stdfs_path(source), to_stdfs_path(destination), std_options, ec);
        }

        virtual std::vector<Path> get_regular_files_recursive(const Path& dir, std::error_code& ec) const override
        {
            std::vector<Path> result;
            stdfs::recursive_directory_iterator it(to_stdfs_path(dir), ec);
            for (; !ec && it != stdfs::recursive_directory_iterator(); it.increment(ec))
            {
                if (it->is_regular_file())
                {
                    result.push_back(from_stdfs_path(it->path()));
                }
            }

            return result;
        }

        virtual Path absolute(const Path& target, std::error_code& ec) const override
        {
            return from_stdfs_path(stdfs::absolute(to_stdfs_path(target), ec));
        }

        virtual Path canonical(const Path& target, std::error_code& ec) const override
        {
            return from_stdfs_path(stdfs::canonical(to_stdfs_path(target), ec));
        }

        virtual WriteFilePointer open_for_write(const Path& file_path,
                                                Append append,
                                                std::error_code& ec) const override
        {
            return WriteFilePointer{file_path, append, ec};
        }
    };

    static constexpr RealFilesystem real_filesystem_instance;
    constexpr const Filesystem& real_filesystem = real_filesystem_instance;
}
