// tests/test_input.cpp
// @brief Verify key decoding and backend event polling.
// @invariant Split sequences decode identically to whole ones.
// @ownership Test owns decoders, TermIO and backends.

#include "morlock/term/input.hpp"
#include "morlock/term/term_io.hpp"
#include "morlock/term/terminal_backend.hpp"
#include "morlock/ui/backend.hpp"

#include "tests/TestHarness.hpp"

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

using morlock::term::InputDecoder;
using morlock::term::KeyEvent;
using morlock::term::StringTermIO;
using morlock::term::TerminalBackend;
using morlock::ui::Event;
using Code = KeyEvent::Code;

namespace
{
/// First read() reports a signal interruption, later ones serve @c input_.
class InterruptOnceTermIO final : public morlock::term::TermIO
{
  public:
    explicit InterruptOnceTermIO(std::string input) : input_(std::move(input)) {}

    void write(std::string_view) override {}

    void flush() override {}

    std::size_t read(char *buf, std::size_t max) override
    {
        ++reads;
        interrupted_ = reads == 1;
        if (interrupted_)
            return 0;
        const std::size_t n = std::min(max, input_.size());
        input_.copy(buf, n);
        input_.erase(0, n);
        return n;
    }

    bool interrupted() const override
    {
        return interrupted_;
    }

    int reads{0};

  private:
    std::string input_;
    bool interrupted_{false};
};

std::vector<KeyEvent> decode(const std::string &bytes)
{
    InputDecoder d;
    d.feed(bytes);
    return d.drain();
}
} // namespace

TEST(Input, PrintableAscii)
{
    auto ev = decode("q");
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].code, Code::Unknown);
    EXPECT_EQ(ev[0].codepoint, static_cast<uint32_t>('q'));
    EXPECT_EQ(ev[0].mods, 0u);
}

TEST(Input, ControlKeys)
{
    auto ev = decode("\r\t\x7f\x03");
    ASSERT_EQ(ev.size(), 4u);
    EXPECT_EQ(ev[0].code, Code::Enter);
    EXPECT_EQ(ev[1].code, Code::Tab);
    EXPECT_EQ(ev[2].code, Code::Backspace);
    EXPECT_EQ(ev[3].mods, static_cast<unsigned>(KeyEvent::Ctrl));
    EXPECT_EQ(ev[3].codepoint, static_cast<uint32_t>('c'));
}

TEST(Input, EscapeSequences)
{
    auto ev = decode("\x1b[A\x1b[1;5C\x1b[3~\x1b[15~\x1bOP\x1b[Z");
    ASSERT_EQ(ev.size(), 6u);
    EXPECT_EQ(ev[0].code, Code::Up);
    EXPECT_EQ(ev[1].code, Code::Right);
    EXPECT_EQ(ev[1].mods, static_cast<unsigned>(KeyEvent::Ctrl));
    EXPECT_EQ(ev[2].code, Code::Delete);
    EXPECT_EQ(ev[3].code, Code::F5);
    EXPECT_EQ(ev[4].code, Code::F1);
    EXPECT_EQ(ev[5].code, Code::Tab);
    EXPECT_EQ(ev[5].mods, static_cast<unsigned>(KeyEvent::Shift));
}

TEST(Input, LoneEscapeAndAlt)
{
    auto esc = decode("\x1b");
    ASSERT_EQ(esc.size(), 1u);
    EXPECT_EQ(esc[0].code, Code::Esc);

    auto alt = decode("\x1bx");
    ASSERT_EQ(alt.size(), 1u);
    EXPECT_EQ(alt[0].mods, static_cast<unsigned>(KeyEvent::Alt));
    EXPECT_EQ(alt[0].codepoint, static_cast<uint32_t>('x'));
}

TEST(Input, SplitSequencesWaitForCompletion)
{
    InputDecoder d;
    d.feed("\x1b[1;");
    EXPECT_TRUE(d.drain().empty());
    d.feed("2B\xC3");
    auto first = d.drain();
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].code, Code::Down);
    EXPECT_EQ(first[0].mods, static_cast<unsigned>(KeyEvent::Shift));
    d.feed("\xA9");
    auto second = d.drain();
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].codepoint, 0xE9u);
}

TEST(Input, InvalidUtf8IsUnknown)
{
    auto ev = decode("\xFF");
    ASSERT_EQ(ev.size(), 1u);
    EXPECT_EQ(ev[0].code, Code::Unknown);
    EXPECT_EQ(ev[0].codepoint, 0u);
}

TEST(Input, OversizedParametersAreClamped)
{
    auto ev = decode("\x1b[123456789012345678901234567890~\x1b[1;99999999999999999999A\x1b[B");
    ASSERT_EQ(ev.size(), 3u);
    EXPECT_EQ(ev[0].code, Code::Unknown);
    EXPECT_EQ(ev[1].code, Code::Up);
    EXPECT_EQ(ev[1].mods & ~7u, 0u);
    EXPECT_EQ(ev[2].code, Code::Down);
}

TEST(Input, BackendPollsQueuedKeysThenEof)
{
    StringTermIO tio;
    TerminalBackend backend(tio, 1, 1);
    tio.feedInput("ab");
    Event e1 = backend.pollEvent();
    Event e2 = backend.pollEvent();
    Event e3 = backend.pollEvent();
    EXPECT_EQ(e1.type, Event::Type::Key);
    EXPECT_EQ(e1.key.codepoint, static_cast<uint32_t>('a'));
    EXPECT_EQ(e2.type, Event::Type::Key);
    EXPECT_EQ(e2.key.codepoint, static_cast<uint32_t>('b'));
    EXPECT_EQ(e3.type, Event::Type::Eof);
}

TEST(Input, InterruptedReadIsRetried)
{
    InterruptOnceTermIO tio("x");
    TerminalBackend backend(tio, 1, 1);
    Event ev = backend.pollEvent();
    EXPECT_EQ(tio.reads, 2);
    EXPECT_EQ(ev.type, Event::Type::Key);
    EXPECT_EQ(ev.key.codepoint, static_cast<uint32_t>('x'));
    EXPECT_EQ(backend.pollEvent().type, Event::Type::Eof);
}

TEST(Input, QueuedResizeComesBeforeInput)
{
    StringTermIO tio;
    TerminalBackend backend(tio, 1, 1);
    tio.feedInput("k");
    backend.notifyResize(3, 5);
    Event resize = backend.pollEvent();
    EXPECT_EQ(resize.type, Event::Type::Resize);
    EXPECT_EQ(resize.size.width, 5);
    EXPECT_EQ(resize.size.height, 3);
    EXPECT_EQ(backend.cells().rows(), 3);
    EXPECT_EQ(backend.cells().cols(), 5);
    EXPECT_EQ(backend.pollEvent().key.codepoint, static_cast<uint32_t>('k'));
}

int main(int argc, char **argv)
{
    morlock_test::init(&argc, argv);
    return morlock_test::run_all_tests();
}
