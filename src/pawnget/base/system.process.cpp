#include <pawnget/base/checks.h>
#include <pawnget/base/strings.h>
#include <pawnget/base/system.debug.h>
#include <pawnget/base/system.process.h>

#include <errno.h>
#include <stdlib.h>

#include <system_error>

#if defined(_WIN32)
#include <process.h>
#else
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace
{
    using namespace pawnget;

    LocalizedString format_system_api_error(StringLiteral api_name, int error_value)
    {
        return LocalizedString::from_raw(
            fmt::format("{}() failed with {}: {}", api_name, error_value, std::generic_category().message(error_value)));
    }
}

namespace pawnget
{
    void append_shell_escaped(std::string& target, StringView content)
    {
        if (content.empty())
        {
            target.append("\"\"");
            return;
        }

        if (Strings::find_first_of(content, " \t\n\r\"\\`$,;&^|'()<>*?") == content.end())
        {
            target.append(content.data(), content.size());
            return;
        }

#if defined(_WIN32)
        // `\`s before a double-quote must be doubled. Inner double-quotes must be escaped.
        target.push_back('"');
        size_t n_slashes = 0;
        for (auto ch : content)
        {
            if (ch == '\\')
            {
                ++n_slashes;
            }
            else if (ch == '"')
            {
                target.append(n_slashes + 1, '\\');
                n_slashes = 0;
            }
            else
            {
                n_slashes = 0;
            }
            target.push_back(ch);
        }
        target.append(n_slashes, '\\');
        target.push_back('"');
#else
        // '`' and '$' keep their special meaning inside double quotes
        target.push_back('"');
        for (auto ch : content)
        {
            if (ch == '\\' || ch == '"' || ch == '`' || ch == '$') target.push_back('\\');
            target.push_back(ch);
        }
        target.push_back('"');
#endif
    }

    Command& Command::string_arg(StringView s) &
    {
        if (!buf.empty())
        {
            buf.push_back(' ');
        }

        append_shell_escaped(buf, s);
        return *this;
    }

    Command& Command::raw_arg(StringView s) &
    {
        if (!buf.empty())
        {
            buf.push_back(' ');
        }

        buf.append(s.data(), s.size());
        return *this;
    }

    ExpectedL<ExitCodeIntegral> cmd_execute(const Command& cmd) { return cmd_execute(cmd, ProcessLaunchSettings{}); }

    ExpectedL<ExitCodeIntegral> cmd_execute(const Command& cmd, const ProcessLaunchSettings& settings)
    {
        Debug::println("cmd_execute: ", cmd.command_line());
#if defined(_WIN32)
        std::string full_command;
        if (auto wd = settings.working_directory.get())
        {
            full_command.append("cd /d ");
            append_shell_escaped(full_command, *wd);
            full_command.append(" && ");
        }

        full_command.append(cmd.command_line().data(), cmd.command_line().size());
        // cmd.exe strips the outermost quotes of the /c argument
        full_command = "\"" + full_command + "\"";
        const int exit_code = ::system(full_command.c_str());
        if (exit_code == -1)
        {
            return format_system_api_error("system", errno);
        }

        Debug::println("cmd_execute: exited with ", exit_code);
        return exit_code;
#else  // ^^^ _WIN32 / !_WIN32 vvv
        const pid_t pid = ::fork();
        if (pid < 0)
        {
            return format_system_api_error("fork", errno);
        }

        if (pid == 0)
        {
            if (auto wd = settings.working_directory.get())
            {
                if (::chdir(wd->c_str()) != 0)
                {
                    ::_exit(126);
                }
            }

            ::execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char*>(nullptr));
            ::_exit(127);
        }

        int status;
        while (::waitpid(pid, &status, 0) < 0)
        {
            if (errno != EINTR)
            {
                return format_system_api_error("waitpid", errno);
            }
        }

        int exit_code;
        if (WIFEXITED(status))
        {
            exit_code = WEXITSTATUS(status);
        }
        else if (WIFSIGNALED(status))
        {
            exit_code = 128 + WTERMSIG(status);
        }
        else
        {
            exit_code = -1;
        }

        Debug::println("cmd_execute: ", pid, " exited with ", exit_code);
        return exit_code;
#endif // ^^^ !_WIN32
    }

    bool succeeded(const ExpectedL<ExitCodeIntegral>& maybe_exit) noexcept
    {
        if (auto exit = maybe_exit.get())
        {
            return *exit == 0;
        }

        return false;
    }
}
