#pragma once

#include <pawnget/base/fwd/expected.h>
#include <pawnget/base/fwd/files.h>

#include <pawnget/base/expected.h>
#include <pawnget/base/optional.h>
#include <pawnget/base/path.h>
#include <pawnget/base/stringview.h>

#include <string>

namespace pawnget
{
    Optional<std::string> get_environment_variable(ZStringView varname) noexcept;
    void set_environment_variable(ZStringView varname, Optional<ZStringView> value) noexcept;

    const ExpectedL<Path>& get_home_dir() noexcept;

    // %LOCALAPPDATA% on Windows; $XDG_CACHE_HOME or ~/.cache elsewhere
    const ExpectedL<Path>& get_platform_cache_root() noexcept;

    long get_process_id();
}
