#include <pawnget-test/util.h>

#include <pawnget/base/system.h>

#include <pawnget/commands.acquire.h>
#include <pawnget/commands.h>
#include <pawnget/commands.help.h>
#include <pawnget/commands.version.h>
#include <pawnget/pawngetcmdarguments.h>

#include <string>
#include <vector>

using namespace pawnget;

namespace
{
    PawnGetCmdArguments make_args(const std::vector<std::string>& t)
    {
        return PawnGetCmdArguments::create_from_arg_sequence(t.data(), t.data() + t.size());
    }
}

TEST_CASE ("PawnGetCmdArguments global options", "[arguments]")
{
    auto v = make_args({"--debug", "acquire", "--cache-root=/var/cache/pawn", "3.10.10", "--TIMEOUT=30", "./pawno"});
    CHECK(v.get_command() == "acquire");
    CHECK(v.debug.value_or(false));
    CHECK(v.cache_root_dir.value_or("") == "/var/cache/pawn");
    CHECK(v.download_timeout_seconds.value_or("") == "30");
    CHECK(v.get_errors().empty());

    auto parsed = v.try_parse_arguments(CommandAcquireMetadata).value_or_exit(PAWNGET_LINE_INFO);
    CHECK(parsed.command_arguments == std::vector<std::string>{"3.10.10", "./pawno"});
    CHECK(parsed.settings.empty());
}

TEST_CASE ("PawnGetCmdArguments global option errors", "[arguments]")
{
    auto v = make_args({"--debug=yes", "--cache-root", "version"});
    REQUIRE(v.get_errors().size() == 2);
    CHECK(v.get_errors()[0] == LocalizedString::from_raw("the option --debug does not take a value"));
    CHECK(v.get_errors()[1] == LocalizedString::from_raw("the option --cache-root requires a value"));
    CHECK(v.get_command() == "version");
}

TEST_CASE ("PawnGetCmdArguments command settings", "[arguments]")
{
    auto v = make_args({"acquire", "3.10.10", "out", "--platform=windows"});
    auto parsed = v.try_parse_arguments(CommandAcquireMetadata).value_or_exit(PAWNGET_LINE_INFO);
    auto platform = parsed.read_setting(SwitchPlatform);
    REQUIRE(platform);
    CHECK(*platform == "windows");
    CHECK(!parsed.read_setting(SwitchTimeout));

    auto unknown = make_args({"acquire", "3.10.10", "out", "--triplet=x64"}).try_parse_arguments(CommandAcquireMetadata);
    REQUIRE(!unknown.has_value());
    CHECK(unknown.error() == LocalizedString::from_raw("'--triplet' is not an option of 'acquire'"));

    auto no_value = make_args({"acquire", "3.10.10", "out", "--platform"}).try_parse_arguments(CommandAcquireMetadata);
    REQUIRE(!no_value.has_value());
    CHECK(no_value.error() == LocalizedString::from_raw("the option --platform requires a value"));

    // version takes no options at all
    auto version_option = make_args({"version", "--platform=linux"}).try_parse_arguments(CommandVersionMetadata);
    REQUIRE(!version_option.has_value());
}

TEST_CASE ("PawnGetCmdArguments arity", "[arguments]")
{
    auto too_few = make_args({"acquire", "3.10.10"}).try_parse_arguments(CommandAcquireMetadata);
    REQUIRE(!too_few.has_value());
    CHECK(too_few.error() == LocalizedString::from_raw("'acquire' requires 2 arguments, but 1 were provided"));

    auto too_many = make_args({"help", "a", "b"}).try_parse_arguments(CommandHelpMetadata);
    REQUIRE(!too_many.has_value());
    CHECK(too_many.error() == LocalizedString::from_raw("'help' requires 0 to 1 arguments, but 2 were provided"));

    CHECK(make_args({"help"}).try_parse_arguments(CommandHelpMetadata).has_value());
    CHECK(make_args({"help", "acquire"}).try_parse_arguments(CommandHelpMetadata).has_value());
}

TEST_CASE ("PawnGetCmdArguments double dash ends options", "[arguments]")
{
    auto v = make_args({"acquire", "--", "--weird-version", "out"});
    CHECK(v.get_errors().empty());
    auto parsed = v.try_parse_arguments(CommandAcquireMetadata).value_or_exit(PAWNGET_LINE_INFO);
    CHECK(parsed.command_arguments == std::vector<std::string>{"--weird-version", "out"});
}

TEST_CASE ("download timeout", "[arguments]")
{
    CHECK(!make_args({}).download_timeout().value_or_exit(PAWNGET_LINE_INFO).has_value());
    CHECK(!make_args({"--timeout=0"}).download_timeout().value_or_exit(PAWNGET_LINE_INFO).has_value());

    auto thirty = make_args({"--timeout=30"}).download_timeout().value_or_exit(PAWNGET_LINE_INFO);
    REQUIRE(thirty.has_value());
    CHECK(thirty.get()->count() == 30);

    auto bad = make_args({"--timeout=soon"}).download_timeout();
    REQUIRE(!bad.has_value());
    CHECK(bad.error() == LocalizedString::from_raw("'soon' is not a valid number of seconds"));
}

TEST_CASE ("PawnGetCmdArguments from the environment", "[arguments]")
{
    const auto original_debug = get_environment_variable(EnvironmentVariablePawngetDebug);
    const auto original_timeout = get_environment_variable(EnvironmentVariablePawngetDownloadTimeout);
    set_environment_variable(EnvironmentVariablePawngetDebug, "1");
    set_environment_variable(EnvironmentVariablePawngetDownloadTimeout, "45");

    auto from_env = make_args({"version"});
    from_env.imbue_from_environment();
    CHECK(from_env.debug.value_or(false));
    CHECK(from_env.download_timeout_seconds.value_or("") == "45");

    // the command line wins
    auto from_cli = make_args({"--timeout=5", "version"});
    from_cli.imbue_from_environment();
    CHECK(from_cli.download_timeout_seconds.value_or("") == "5");

    auto restore = [](ZStringView name, const Optional<std::string>& value) {
        if (auto v = value.get())
        {
            set_environment_variable(name, *v);
        }
        else
        {
            set_environment_variable(name, nullopt);
        }
    };

    restore(EnvironmentVariablePawngetDebug, original_debug);
    restore(EnvironmentVariablePawngetDownloadTimeout, original_timeout);
}

TEST_CASE ("command lookup", "[commands]")
{
    REQUIRE(find_command("acquire"));
    CHECK(find_command("ACQUIRE") == find_command("acquire"));
    CHECK(&find_command("version")->metadata == &CommandVersionMetadata);
    CHECK(!find_command("install"));

    const auto all = get_all_commands_metadata();
    CHECK(all.size() == 5);

    const auto usage = get_zero_args_usage();
    for (auto&& metadata : all)
    {
        CHECK_THAT(usage, Catch::Contains(metadata->name.to_string()));
    }

    CHECK_THAT(usage, Catch::Contains("--cache-root"));
    CHECK_THAT(usage_for_command(CommandAcquireMetadata).data(), Catch::Contains("--platform"));
}
