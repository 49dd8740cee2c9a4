#define CATCH_CONFIG_RUNNER
#include <catch2/catch.hpp>

#include <pawnget/base/checks.h>
#include <pawnget/base/messages.h>
#include <pawnget/base/system.debug.h>
#include <pawnget/base/system.h>

namespace pawnget::Checks
{
    void on_final_cleanup_and_exit() { }
}

int main(int argc, char** argv)
{
    if (pawnget::get_environment_variable("PAWNGET_DEBUG").value_or("") == "1") pawnget::Debug::g_debugging = true;
    // Keep the tests away from the user's real package cache.
    pawnget::set_environment_variable("PAWNGET_CACHE_ROOT", "PAWNGET_TESTS_SHOULD_NOT_USE_THE_DEFAULT_CACHE");

    return Catch::Session().run(argc, argv);
}
