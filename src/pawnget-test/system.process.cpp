#include <pawnget-test/util.h>

#include <pawnget/base/files.h>
#include <pawnget/base/system.process.h>

#include <string>

using namespace pawnget;

TEST_CASE ("append_shell_escaped", "[system.process]")
{
    std::string target;
    append_shell_escaped(target, "plain");
    CHECK(target == "plain");

    target.clear();
    append_shell_escaped(target, "");
    CHECK(target == "\"\"");

    target.clear();
    append_shell_escaped(target, "with space");
    CHECK(target == "\"with space\"");

#if !defined(_WIN32)
    target.clear();
    append_shell_escaped(target, "a\"b$c");
    CHECK(target == "\"a\\\"b\\$c\"");
#endif
}

TEST_CASE ("Command builds a command line", "[system.process]")
{
    Command cmd("tar");
    cmd.string_arg("-xzf").string_arg("my archive.tgz").raw_arg("2>&1");
    CHECK(cmd.command_line() == "tar -xzf \"my archive.tgz\" 2>&1");
    CHECK(!cmd.empty());
    cmd.clear();
    CHECK(cmd.empty());
}

#if !defined(_WIN32)
TEST_CASE ("cmd_execute reports exit codes", "[system.process]")
{
    auto success = cmd_execute(Command{"true"});
    CHECK(succeeded(success));

    auto failure = cmd_execute(Command{"sh"}.string_arg("-c").string_arg("exit 3"));
    REQUIRE(failure.has_value());
    CHECK(*failure.get() == 3);
    CHECK(!succeeded(failure));
}

TEST_CASE ("cmd_execute honors the working directory", "[system.process]")
{
    auto& fs = real_filesystem;
    TemporaryDirectory temp(fs, Test::fresh_test_directory("cmd-execute"));
    fs.create_directories(temp.path(), PAWNGET_LINE_INFO);

    ProcessLaunchSettings settings{temp.path()};
    auto result = cmd_execute(Command{"touch"}.string_arg("marker"), settings);
    CHECK(succeeded(result));
    CHECK(fs.is_regular_file(temp.path() / "marker"));
}
#endif
