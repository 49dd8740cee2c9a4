#include <pawnget/base/checks.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/system.debug.h>
#include <pawnget/base/system.h>

#include <stdlib.h>

#if defined(_WIN32)
#include <process.h>
#else
#include <unistd.h>
#endif

namespace
{
    using namespace pawnget;

#if defined(_WIN32)
    constexpr StringLiteral EnvironmentVariableHome = "USERPROFILE";
    constexpr StringLiteral EnvironmentVariableLocalAppData = "LOCALAPPDATA";
    constexpr StringLiteral EnvironmentVariableAppData = "APPDATA";
#else
    constexpr StringLiteral EnvironmentVariableHome = "HOME";
    constexpr StringLiteral EnvironmentVariableXdgCacheHome = "XDG_CACHE_HOME";
#endif

    ExpectedL<Path> require_absolute(Path p, StringLiteral env_var)
    {
        if (!p.is_absolute())
        {
            return msg::format(
                msgCacheRootMustBeAbsolute, msg::env_var = format_environment_variable(env_var), msg::path = p);
        }

        return p;
    }
}

namespace pawnget
{
    long get_process_id()
    {
#ifdef _WIN32
        return ::_getpid();
#else
        return ::getpid();
#endif // ^^^ !_WIN32
    }

    Optional<std::string> get_environment_variable(ZStringView varname) noexcept
    {
        auto v = ::getenv(varname.c_str());
        if (!v) return nullopt;
        return std::string(v);
    }

    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept
    {
#if defined(_WIN32)
        if (auto v = value.get())
        {
            Checks::check_exit(PAWNGET_LINE_INFO, ::_putenv_s(varname.c_str(), v->c_str()) == 0);
        }
        else
        {
            Checks::check_exit(PAWNGET_LINE_INFO, ::_putenv_s(varname.c_str(), "") == 0);
        }
#else
        if (auto v = value.get())
        {
            Checks::check_exit(PAWNGET_LINE_INFO, ::setenv(varname.c_str(), v->c_str(), 1) == 0);
        }
        else
        {
            Checks::check_exit(PAWNGET_LINE_INFO, ::unsetenv(varname.c_str()) == 0);
        }
#endif
    }

    const ExpectedL<Path>& get_home_dir() noexcept
    {
        static ExpectedL<Path> s_home = []() -> ExpectedL<Path> {
            auto maybe_home = get_environment_variable(EnvironmentVariableHome);
            if (!maybe_home.has_value() || maybe_home.get()->empty())
            {
                return msg::format(msgUnableToReadEnvironmentVariable,
                                   msg::env_var = format_environment_variable(EnvironmentVariableHome));
            }

            return require_absolute(std::move(*maybe_home.get()), EnvironmentVariableHome);
        }();

        return s_home;
    }

    const ExpectedL<Path>& get_platform_cache_root() noexcept
    {
        static ExpectedL<Path> s_cache = []() -> ExpectedL<Path> {
#if defined(_WIN32)
            auto maybe_local = get_environment_variable(EnvironmentVariableLocalAppData);
            if (auto p = maybe_local.get())
            {
                if (!p->empty())
                {
                    return require_absolute(std::move(*p), EnvironmentVariableLocalAppData);
                }
            }

            // Service accounts may only have %APPDATA%
            auto maybe_roaming = get_environment_variable(EnvironmentVariableAppData);
            if (auto p = maybe_roaming.get())
            {
                if (!p->empty())
                {
                    auto local = Path(Path(std::move(*p)).parent_path()) / "Local";
                    return require_absolute(std::move(local), EnvironmentVariableAppData);
                }
            }

            return msg::format(msgUnableToReadEnvironmentVariable,
                               msg::env_var = format_environment_variable(EnvironmentVariableLocalAppData));
#else
            auto maybe_cache = get_environment_variable(EnvironmentVariableXdgCacheHome);
            if (auto p = maybe_cache.get())
            {
                if (!p->empty())
                {
                    return require_absolute(std::move(*p), EnvironmentVariableXdgCacheHome);
                }
            }

            return get_home_dir().map([](Path home) {
                home /= ".cache";
                return home;
            });
#endif
        }();

        return s_cache;
    }
}

namespace pawnget::Debug
{
    std::atomic<bool> g_debugging(false);
}
