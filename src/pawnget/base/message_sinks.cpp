#include <pawnget/base/message_sinks.h>

namespace
{
    using namespace pawnget;

    struct NullMessageSink final : MessageSink
    {
        virtual void println(Color, const LocalizedString&) override { }
    };

    NullMessageSink null_sink_instance;

    struct StdOutMessageSink final : MessageSink
    {
        virtual void println(Color color, const LocalizedString& text) override
        {
            msg::write_unlocalized_text_to_stdout(color, text);
            msg::write_unlocalized_text_to_stdout(Color::none, "\n");
        }
    };

    StdOutMessageSink stdout_sink_instance;

    struct StdErrMessageSink final : MessageSink
    {
        virtual void println(Color color, const LocalizedString& text) override
        {
            msg::write_unlocalized_text_to_stderr(color, text);
            msg::write_unlocalized_text_to_stderr(Color::none, "\n");
        }
    };

    StdErrMessageSink stderr_sink_instance;
}

namespace pawnget
{
    MessageSink& null_sink = null_sink_instance;
    MessageSink& stdout_sink = stdout_sink_instance;
    MessageSink& stderr_sink = stderr_sink_instance;

    void BufferedMessageSink::println(Color c, const LocalizedString& s)
    {
        std::lock_guard<std::mutex> lock(m_lock);
        m_lines.push_back(BufferedMessageLine{c, s.data()});
    }

    std::vector<BufferedMessageLine> BufferedMessageSink::lines() const
    {
        std::lock_guard<std::mutex> lock(m_lock);
        return m_lines;
    }

    std::string BufferedMessageSink::text() const
    {
        std::lock_guard<std::mutex> lock(m_lock);
        std::string result;
        for (auto&& line : m_lines)
        {
            result.append(line.text);
            result.push_back('\n');
        }

        return result;
    }
}
