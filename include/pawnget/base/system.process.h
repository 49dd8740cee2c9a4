#pragma once

#include <pawnget/base/fwd/expected.h>

#include <pawnget/base/expected.h>
#include <pawnget/base/optional.h>
#include <pawnget/base/path.h>
#include <pawnget/base/stringview.h>

#include <string>

namespace pawnget
{
    using ExitCodeIntegral = int;

    void append_shell_escaped(std::string& target, StringView content);

    struct Command
    {
        Command() = default;
        explicit Command(StringView s) { string_arg(s); }

        Command& string_arg(StringView s) &;
        Command& raw_arg(StringView s) &;

        Command&& string_arg(StringView s) && { return std::move(string_arg(s)); };
        Command&& raw_arg(StringView s) && { return std::move(raw_arg(s)); }

        std::string&& extract() && { return std::move(buf); }
        StringView command_line() const { return buf; }
        const char* c_str() const { return buf.c_str(); }

        void clear() { buf.clear(); }
        bool empty() const { return buf.empty(); }

    private:
        std::string buf;
    };

    struct ProcessLaunchSettings
    {
        Optional<Path> working_directory;
    };

    // Runs cmd through the system shell, inheriting the standard streams, and waits for it to exit.
    ExpectedL<ExitCodeIntegral> cmd_execute(const Command& cmd);
    ExpectedL<ExitCodeIntegral> cmd_execute(const Command& cmd, const ProcessLaunchSettings& settings);

    bool succeeded(const ExpectedL<ExitCodeIntegral>& maybe_exit) noexcept;
}
