#include <pawnget-test/util.h>

#include <pawnget/base/message_sinks.h>
#include <pawnget/base/messages.h>

#include <string>

using namespace pawnget;

TEST_CASE ("LocalizedString from_raw", "[LocalizedString]")
{
    CHECK(LocalizedString::from_raw("literal").data() == "literal");
    const std::string owned = "owned";
    CHECK(LocalizedString::from_raw(owned).data() == "owned");
    CHECK(LocalizedString::from_raw(std::string("moved")).data() == "moved");
    CHECK(LocalizedString::from_raw(StringView{"a view", 1}).data() == "a");
    CHECK(LocalizedString::from_raw(ErrorPrefix).data() == "error: ");
}

TEST_CASE ("LocalizedString appends", "[LocalizedString]")
{
    auto s = LocalizedString::from_raw("heading");
    s.append_raw('\n').append_indent().append_raw("item");
    CHECK(s.data() == "heading\n  item");
    s.append_indent(2);
    CHECK(s.data() == "heading\n  item    ");

    LocalizedString empty;
    CHECK(empty.empty());
    empty.append(LocalizedString::from_raw("x"));
    CHECK(empty == LocalizedString::from_raw("x"));
    CHECK(empty != LocalizedString::from_raw("y"));
    empty.clear();
    CHECK(empty.empty());
}

TEST_CASE ("message formatting", "[messages]")
{
    CHECK(msg::format(msgDownloadFailed, msg::url = "https://example.com/a.zip").data() ==
          "failed to download https://example.com/a.zip");
    CHECK(msg::format(msgArgumentRequiresValue, msg::option = "timeout").data() ==
          "the option --timeout requires a value");
    CHECK(error_prefix().data() == "error: ");
    CHECK(warning_prefix().data() == "warning: ");
    CHECK(note_prefix().data() == "note: ");
#if defined(_WIN32)
    CHECK(format_environment_variable("HOME").data() == "%HOME%");
#else
    CHECK(format_environment_variable("HOME").data() == "$HOME");
#endif
}

TEST_CASE ("BufferedMessageSink records lines in order", "[messages]")
{
    BufferedMessageSink sink;
    sink.println(LocalizedString::from_raw("first"));
    sink.println(Color::warning, LocalizedString::from_raw("second"));
    sink.println(msgDownloadingArtifact, msg::url = "file:///tmp/x.zip");

    const auto lines = sink.lines();
    REQUIRE(lines.size() == 3);
    CHECK(lines[0].color == Color::none);
    CHECK(lines[0].text == "first");
    CHECK(lines[1].color == Color::warning);
    CHECK(lines[2].text == "Downloading file:///tmp/x.zip");
    CHECK(sink.text() == "first\nsecond\nDownloading file:///tmp/x.zip\n");
}
