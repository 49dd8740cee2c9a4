#include <pawnget/base/checks.h>
#include <pawnget/base/messages.h>

#include <errno.h>
#include <stdio.h>
#include <stdlib.h>

#include <array>
#include <iterator>
#include <utility>

#if defined(_WIN32)
#include <io.h>
#else
#include <unistd.h>
#endif

using namespace pawnget;

namespace pawnget
{
    LocalizedString::operator StringView() const noexcept { return m_data; }
    const std::string& LocalizedString::data() const noexcept { return m_data; }
    const std::string& LocalizedString::to_string() const noexcept { return m_data; }
    std::string LocalizedString::extract_data() { return std::exchange(m_data, std::string{}); }

    template<class T, std::enable_if_t<std::is_same<char, T>::value, int>>
    LocalizedString LocalizedString::from_raw(std::basic_string<T>&& s) noexcept
    {
        return LocalizedString(std::move(s));
    }
    template LocalizedString LocalizedString::from_raw<char>(std::basic_string<char>&& s) noexcept;
    LocalizedString LocalizedString::from_raw(StringView s) { return LocalizedString(s); }

    LocalizedString& LocalizedString::append_raw(char c) &
    {
        m_data.push_back(c);
        return *this;
    }

    LocalizedString&& LocalizedString::append_raw(char c) && { return std::move(append_raw(c)); }

    LocalizedString& LocalizedString::append_raw(StringView s) &
    {
        m_data.append(s.begin(), s.size());
        return *this;
    }

    LocalizedString&& LocalizedString::append_raw(StringView s) && { return std::move(append_raw(s)); }

    LocalizedString& LocalizedString::append(const LocalizedString& s) &
    {
        m_data.append(s.m_data);
        return *this;
    }

    LocalizedString&& LocalizedString::append(const LocalizedString& s) && { return std::move(append(s)); }

    LocalizedString& LocalizedString::append_indent(size_t indent) &
    {
        m_data.append(indent * 2, ' ');
        return *this;
    }

    LocalizedString&& LocalizedString::append_indent(size_t indent) && { return std::move(append_indent(indent)); }

    bool operator==(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
    {
        return lhs.data() == rhs.data();
    }

    bool operator!=(const LocalizedString& lhs, const LocalizedString& rhs) noexcept
    {
        return lhs.data() != rhs.data();
    }

    bool LocalizedString::empty() const noexcept { return m_data.empty(); }
    void LocalizedString::clear() noexcept { m_data.clear(); }

    LocalizedString::LocalizedString(StringView data) : m_data(data.data(), data.size()) { }
    LocalizedString::LocalizedString(std::string&& data) noexcept : m_data(std::move(data)) { }

    LocalizedString format_environment_variable(StringView variable_name)
    {
#if defined(_WIN32)
        return LocalizedString::from_raw(fmt::format("%{}%", variable_name));
#else  // ^^^ _WIN32 / !_WIN32 vvv
        return LocalizedString::from_raw(fmt::format("${}", variable_name));
#endif // ^^^ !_WIN32
    }

    LocalizedString error_prefix() { return LocalizedString::from_raw(ErrorPrefix); }
    LocalizedString internal_error_prefix() { return LocalizedString::from_raw(InternalErrorPrefix); }
    LocalizedString note_prefix() { return LocalizedString::from_raw(NotePrefix); }
    LocalizedString warning_prefix() { return LocalizedString::from_raw(WarningPrefix); }
}

#define DECLARE_MSG_ARG(NAME, EXAMPLE) const StringLiteral pawnget::msg::NAME##_t::name = #NAME;
#include <pawnget/base/message-args.inc.h>
#undef DECLARE_MSG_ARG

namespace pawnget
{
    namespace
    {
        struct MessageData
        {
            StringLiteral name;
            StringLiteral builtin_message;
        };

        constexpr MessageData message_data[] = {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) {#NAME, __VA_ARGS__},
#include <pawnget/base/message-data.inc.h>
#undef DECLARE_MESSAGE
        };

        enum class message_index
        {
#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...) NAME,
#include <pawnget/base/message-data.inc.h>
#undef DECLARE_MESSAGE
        };
    }

    namespace msg::detail
    {
        static constexpr const size_t number_of_messages = std::size(message_data);

        void format_message_by_index_to(LocalizedString& s, size_t index, fmt::format_args args)
        {
            if (index >= number_of_messages) Checks::unreachable(PAWNGET_LINE_INFO);
            const auto format_string = message_data[index].builtin_message;
            try
            {
                fmt::vformat_to(std::back_inserter(s.m_data), {format_string.data(), format_string.size()}, args);
                return;
            }
            catch (const fmt::format_error&)
            {
            }

            msg::write_unlocalized_text_to_stderr(
                Color::error,
                fmt::format("internal error: failed to format message {}\nformat string: {}\n",
                            message_data[index].name,
                            format_string));
            Checks::exit_fail(PAWNGET_LINE_INFO);
        }

        LocalizedString format_message_by_index(size_t index, fmt::format_args args)
        {
            LocalizedString s;
            format_message_by_index_to(s, index, args);
            return s;
        }
    }

#define DECLARE_MESSAGE(NAME, ARGS, COMMENT, ...)                                                                      \
    const decltype(::pawnget::msg::detail::make_message_base ARGS) msg##NAME{static_cast<size_t>(message_index::NAME)};

#include <pawnget/base/message-data.inc.h>
#undef DECLARE_MESSAGE
}

namespace pawnget::msg
{
#if defined(_WIN32)
    static int stdout_fd() { return _fileno(stdout); }
    static int stderr_fd() { return _fileno(stderr); }
    static bool is_a_terminal(int fd) { return ::_isatty(fd) != 0; }
    static long write_some(int fd, const char* ptr, size_t size)
    {
        return ::_write(fd, ptr, static_cast<unsigned int>(size > 0x7FFFFFFF ? 0x7FFFFFFF : size));
    }
#else
    static int stdout_fd() { return STDOUT_FILENO; }
    static int stderr_fd() { return STDERR_FILENO; }
    static bool is_a_terminal(int fd) { return ::isatty(fd) != 0; }
    static long write_some(int fd, const char* ptr, size_t size) { return static_cast<long>(::write(fd, ptr, size)); }
#endif

    static void write_all(const char* ptr, size_t to_write, int fd)
    {
        while (to_write != 0)
        {
            auto written = write_some(fd, ptr, to_write);
            if (written < 0)
            {
                if (errno == EINTR) continue;
                ::fprintf(stderr, "[DEBUG] Failed to write to console: %d\n", errno);
                std::abort();
            }

            ptr += written;
            to_write -= static_cast<size_t>(written);
        }
    }

    static void write_unlocalized_text_impl(Color c, StringView sv, int fd, bool is_a_tty)
    {
        static constexpr char reset_color_sequence[] = {'\033', '[', '0', 'm'};

        if (sv.empty()) return;

        bool reset_color = false;
#if !defined(_WIN32)
        if (is_a_tty && c != Color::none)
        {
            reset_color = true;

            const char set_color_sequence[] = {'\033', '[', '9', static_cast<char>(c), 'm'};
            write_all(set_color_sequence, sizeof(set_color_sequence), fd);
        }
#else
        (void)c;
        (void)is_a_tty;
#endif

        write_all(sv.data(), sv.size(), fd);

        if (reset_color)
        {
            write_all(reset_color_sequence, sizeof(reset_color_sequence), fd);
        }
    }

    void write_unlocalized_text(Color c, StringView sv) { write_unlocalized_text_to_stdout(c, sv); }

    void write_unlocalized_text_to_stdout(Color c, StringView sv)
    {
        static bool is_a_tty = is_a_terminal(stdout_fd());
        return write_unlocalized_text_impl(c, sv, stdout_fd(), is_a_tty);
    }

    void write_unlocalized_text_to_stderr(Color c, StringView sv)
    {
        static bool is_a_tty = is_a_terminal(stderr_fd());
        return write_unlocalized_text_impl(c, sv, stderr_fd(), is_a_tty);
    }

    LocalizedString format_error(const LocalizedString& s) { return error_prefix().append(s); }

    void println_error(const LocalizedString& s)
    {
        write_unlocalized_text_to_stderr(Color::error, "error");
        write_unlocalized_text_to_stderr(Color::none, LocalizedString::from_raw(": ").append(s).append_raw('\n'));
    }

    LocalizedString format_warning(const LocalizedString& s) { return warning_prefix().append(s); }

    void println_warning(const LocalizedString& s)
    {
        write_unlocalized_text_to_stderr(Color::warning, "warning");
        write_unlocalized_text_to_stderr(Color::none, LocalizedString::from_raw(": ").append(s).append_raw('\n'));
    }
}
