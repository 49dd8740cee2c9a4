#pragma once

#include <catch2/catch.hpp>

#include <pawnget/base/fwd/files.h>

#include <pawnget/base/cancellation.h>
#include <pawnget/base/expected.h>
#include <pawnget/base/files.h>
#include <pawnget/base/fmt.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/optional.h>
#include <pawnget/base/strings.h>

#include <pawnget/fetcher.h>

#include <atomic>
#include <iomanip>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#define CHECK_EC(ec)                                                                                                   \
    do                                                                                                                 \
    {                                                                                                                  \
        if (ec)                                                                                                        \
        {                                                                                                              \
            FAIL(ec.message());                                                                                        \
        }                                                                                                              \
    } while (0)

namespace Catch
{
    template<>
    struct StringMaker<pawnget::LocalizedString>
    {
        static const std::string convert(const pawnget::LocalizedString& value) { return "LL\"" + value.data() + "\""; }
    };

    template<>
    struct StringMaker<pawnget::Path>
    {
        static const std::string convert(const pawnget::Path& value) { return "\"" + value.native() + "\""; }
    };

    template<>
    struct StringMaker<pawnget::PathMapping>
    {
        static const std::string convert(const pawnget::PathMapping& value)
        {
            return "{\"" + value.member + "\", \"" + value.install_path + "\"}";
        }
    };
}

namespace pawnget
{
    inline std::ostream& operator<<(std::ostream& os, const LocalizedString& value)
    {
        return os << "LL" << std::quoted(value.data());
    }

    inline std::ostream& operator<<(std::ostream& os, const Path& value) { return os << value.native(); }

    template<class T>
    inline auto operator<<(std::ostream& os, const Optional<T>& value) -> decltype(os << *(value.get()))
    {
        if (auto v = value.get())
        {
            return os << *v;
        }
        else
        {
            return os << "nullopt";
        }
    }
}

namespace pawnget::Test
{
    const Path& base_temporary_directory() noexcept;

    // An empty directory named name under base_temporary_directory(); anything already there is removed.
    Path fresh_test_directory(StringView name);

    // Each pair is (relative path, contents).
    using FileList = std::vector<std::pair<std::string, std::string>>;

    void write_files(const Filesystem& fs, const Path& root, const FileList& files);

    // Packs every file in source_dir, with paths relative to it, using the system tar and zip tools.
    void make_tar_gz(const Path& source_dir, const Path& archive);
    void make_zip(const Path& source_dir, const Path& archive);

#if !defined(_WIN32)
    void make_executable(const Path& file);
    bool is_executable(const Path& file);

    // Creates link pointing at target; target is stored as written.
    void create_symlink(StringView target, const Path& link);

    // Writes a /bin/sh script named name into dir and makes it executable.
    void write_tool_script(const Path& dir, StringView name, StringView body);

    // Puts dir in front of PATH until destroyed.
    struct ScopedPathPrefix
    {
        explicit ScopedPathPrefix(const Path& dir);
        ScopedPathPrefix(const ScopedPathPrefix&) = delete;
        ScopedPathPrefix& operator=(const ScopedPathPrefix&) = delete;
        ~ScopedPathPrefix();

    private:
        Optional<std::string> m_old_path;
    };
#endif

    // Serves every URL from one local file, and counts requests.
    struct FakeDownloader final : IArtifactDownloader
    {
        enum class Mode
        {
            Serve,
            // writes the first half of the file, then reports a failure
            Truncate,
            Fail,
        };

        explicit FakeDownloader(Path source, Mode mode = Mode::Serve) : source(std::move(source)), mode(mode) { }

        virtual ExpectedL<Unit> download(StringView url,
                                         WriteFilePointer& out,
                                         const CancellationToken& cancel) const override;

        Path source;
        Mode mode;
        mutable std::atomic<int> calls{0};

        std::vector<std::string> requested_urls() const;

    private:
        mutable std::mutex m_lock;
        mutable std::vector<std::string> m_requested_urls;
    };
}

#define REQUIRE_ERROR_CONTAINS(expected, substring)                                                                    \
    do                                                                                                                 \
    {                                                                                                                  \
        REQUIRE(!(expected).has_value());                                                                              \
        CHECK_THAT((expected).error().data(), Catch::Contains(substring));                                             \
    } while (0)
