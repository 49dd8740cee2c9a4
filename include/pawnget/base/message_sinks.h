#pragma once

#include <pawnget/base/messages.h>

#include <mutex>
#include <string>
#include <vector>

namespace pawnget
{
    struct MessageSink
    {
        virtual void println(Color c, const LocalizedString& s) = 0;

        void println(const LocalizedString& s) { this->println(Color::none, s); }

        template<PAWNGET_DECL_MSG_TEMPLATE>
        void println(PAWNGET_DECL_MSG_ARGS)
        {
            this->println(Color::none, msg::format(PAWNGET_EXPAND_MSG_ARGS));
        }

        template<PAWNGET_DECL_MSG_TEMPLATE>
        void println(Color c, PAWNGET_DECL_MSG_ARGS)
        {
            this->println(c, msg::format(PAWNGET_EXPAND_MSG_ARGS));
        }

        MessageSink(const MessageSink&) = delete;
        MessageSink& operator=(const MessageSink&) = delete;

    protected:
        MessageSink() = default;
        ~MessageSink() = default;
    };

    struct BufferedMessageLine
    {
        Color color;
        std::string text;
    };

    // Collects lines rather than printing them; safe to share between threads.
    struct BufferedMessageSink final : MessageSink
    {
        BufferedMessageSink() = default;

        virtual void println(Color c, const LocalizedString& s) override;
        using MessageSink::println;

        std::vector<BufferedMessageLine> lines() const;
        std::string text() const;

    private:
        mutable std::mutex m_lock;
        std::vector<BufferedMessageLine> m_lines;
    };

    extern MessageSink& null_sink;
    extern MessageSink& stdout_sink;
    extern MessageSink& stderr_sink;
}
