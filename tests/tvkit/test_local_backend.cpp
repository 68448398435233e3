// File: tests/tvkit/test_local_backend.cpp
// Purpose: Drive LocalBackend over a pseudo-terminal pair: raw mode setup and
//          restore, timed ESC handling, partial-sequence flushing, dump
//          hot keys, SIGWINCH resize notification and an application quit
//          through the Esc+X binding.
// Key invariants: The backend only ever talks to the slave side; the test
//                 types and reads on the master side.
// Ownership/Lifetime: The fixture owns both pty descriptors.
// Links: include/tvkit/term/local_backend.hpp, src/term/local_backend.cpp

#include <gtest/gtest.h>

#include "tvkit/app.hpp"
#include "tvkit/term/local_backend.hpp"
#include "tvkit/term/terminal.hpp"

#include <array>
#include <atomic>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <memory>
#include <optional>
#include <poll.h>
#include <string>
#include <sys/ioctl.h>
#include <termios.h>
#include <thread>
#include <unistd.h>

using namespace tvkit;
using namespace std::chrono_literals;
using tvkit::term::LocalBackend;

namespace
{

std::string joined(const std::array<std::string_view, 6> &seqs)
{
    std::string out;
    for (auto s : seqs)
        out.append(s);
    return out;
}

class LocalBackendTest : public ::testing::Test
{
  protected:
    void SetUp() override
    {
        master_ = ::posix_openpt(O_RDWR | O_NOCTTY);
        ASSERT_GE(master_, 0);
        ASSERT_EQ(::grantpt(master_), 0);
        ASSERT_EQ(::unlockpt(master_), 0);
        const char *name = ::ptsname(master_);
        ASSERT_NE(name, nullptr);
        slave_ = ::open(name, O_RDWR | O_NOCTTY);
        ASSERT_GE(slave_, 0);
        setWindowSize(80, 24);
    }

    void TearDown() override
    {
        if (slave_ >= 0)
            ::close(slave_);
        if (master_ >= 0)
            ::close(master_);
    }

    LocalBackend::Options options() const
    {
        LocalBackend::Options opts;
        opts.inFd = slave_;
        opts.outFd = slave_;
        opts.escTimeout = 300ms;
        opts.escapeDelay = 25ms;
        return opts;
    }

    void setWindowSize(unsigned short cols, unsigned short rows)
    {
        winsize ws{};
        ws.ws_col = cols;
        ws.ws_row = rows;
        ASSERT_EQ(::ioctl(master_, TIOCSWINSZ, &ws), 0);
    }

    void type(std::string_view bytes)
    {
        ASSERT_EQ(::write(master_, bytes.data(), bytes.size()), static_cast<ssize_t>(bytes.size()));
    }

    /// Everything the backend wrote, collected until the line goes quiet.
    std::string screenOutput()
    {
        std::string out;
        for (;;)
        {
            pollfd pfd{};
            pfd.fd = master_;
            pfd.events = POLLIN;
            if (::poll(&pfd, 1, 100) <= 0)
                return out;
            char buf[512];
            const ssize_t n = ::read(master_, buf, sizeof(buf));
            if (n <= 0)
                return out;
            out.append(buf, static_cast<std::size_t>(n));
        }
    }

    /// Poll until an event arrives or @p budget polls come back empty.
    std::optional<Event> nextEvent(LocalBackend &backend, int budget = 10)
    {
        for (int i = 0; i < budget; ++i)
        {
            auto polled = backend.pollEvent(200ms);
            EXPECT_TRUE(polled.isOk());
            if (!polled.isOk())
                return std::nullopt;
            if (polled.value())
                return polled.value();
        }
        return std::nullopt;
    }

    int master_ = -1;
    int slave_ = -1;
};

} // namespace

TEST_F(LocalBackendTest, InitAndCleanupAreExactInverses)
{
    termios before{};
    ASSERT_EQ(::tcgetattr(slave_, &before), 0);

    LocalBackend backend(options());
    ASSERT_TRUE(backend.init().isOk());
    EXPECT_TRUE(backend.initialized());
    EXPECT_EQ(screenOutput(), joined(term::kInitSequence));

    termios raw{};
    ASSERT_EQ(::tcgetattr(slave_, &raw), 0);
    EXPECT_EQ(raw.c_lflag & (ICANON | ECHO | ISIG), 0u);
    EXPECT_EQ(raw.c_oflag & OPOST, 0u);

    ASSERT_TRUE(backend.init().isOk());
    EXPECT_TRUE(screenOutput().empty());

    ASSERT_TRUE(backend.cleanup().isOk());
    EXPECT_FALSE(backend.initialized());
    EXPECT_EQ(screenOutput(), joined(term::kCleanupSequence));

    termios after{};
    ASSERT_EQ(::tcgetattr(slave_, &after), 0);
    EXPECT_EQ(after.c_lflag, before.c_lflag);
    EXPECT_EQ(after.c_iflag, before.c_iflag);
    EXPECT_EQ(after.c_oflag, before.c_oflag);
    EXPECT_EQ(after.c_cflag, before.c_cflag);

    ASSERT_TRUE(backend.cleanup().isOk());
    EXPECT_TRUE(screenOutput().empty());
}

TEST_F(LocalBackendTest, MouseSequencesFollowOption)
{
    auto opts = options();
    opts.mouse = false;
    LocalBackend backend(opts);
    ASSERT_TRUE(backend.init().isOk());
    const std::string out = screenOutput();
    EXPECT_EQ(out.find(term::kEnableMouse), std::string::npos);
    EXPECT_NE(out.find(term::kEnterAltScreen), std::string::npos);
    EXPECT_FALSE(backend.capabilities().mouse);
}

TEST_F(LocalBackendTest, ReportsPtySize)
{
    LocalBackend backend(options());
    auto sz = backend.size();
    ASSERT_TRUE(sz.isOk());
    EXPECT_EQ(sz.value(), (term::TermSize{80, 24}));
}

TEST_F(LocalBackendTest, PlainKeysPassThrough)
{
    LocalBackend backend(options());
    ASSERT_TRUE(backend.init().isOk());
    type("a\x1b[A");

    auto first = nextEvent(backend);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->keyCode, 'a');
    auto second = nextEvent(backend);
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(second->keyCode, kbUp);

    auto idle = backend.pollEvent(20ms);
    ASSERT_TRUE(idle.isOk());
    EXPECT_FALSE(idle.value().has_value());
}

TEST_F(LocalBackendTest, LoneEscHeldUntilWindowExpires)
{
    LocalBackend backend(options());
    ASSERT_TRUE(backend.init().isOk());
    type("\x1b");

    auto early = backend.pollEvent(100ms);
    ASSERT_TRUE(early.isOk());
    EXPECT_FALSE(early.value().has_value());

    auto esc = nextEvent(backend);
    ASSERT_TRUE(esc.has_value());
    EXPECT_EQ(esc->keyCode, kbEsc);
}

TEST_F(LocalBackendTest, EscEscInsideWindow)
{
    LocalBackend backend(options());
    ASSERT_TRUE(backend.init().isOk());
    type("\x1b");
    auto held = backend.pollEvent(60ms);
    ASSERT_TRUE(held.isOk());
    EXPECT_FALSE(held.value().has_value());

    type("\x1b");
    auto ev = nextEvent(backend);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->keyCode, kbEscEsc);
}

TEST_F(LocalBackendTest, EscThenLetterInLaterReadGivesEscCode)
{
    LocalBackend backend(options());
    ASSERT_TRUE(backend.init().isOk());
    type("\x1b");
    auto held = backend.pollEvent(60ms);
    ASSERT_TRUE(held.isOk());
    EXPECT_FALSE(held.value().has_value());

    type("x");
    auto ev = nextEvent(backend);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->keyCode, kbEscX);
}

TEST_F(LocalBackendTest, EscLetterInOneReadGivesAltCode)
{
    LocalBackend backend(options());
    ASSERT_TRUE(backend.init().isOk());
    type("\x1bx");

    auto ev = nextEvent(backend);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->keyCode, kbAltX);
}

TEST_F(LocalBackendTest, PartialSequenceFlushedAfterEscapeDelay)
{
    LocalBackend backend(options());
    ASSERT_TRUE(backend.init().isOk());
    type("\x1b[1");

    auto esc = nextEvent(backend);
    ASSERT_TRUE(esc.has_value());
    EXPECT_EQ(esc->keyCode, kbEsc);
    auto bracket = nextEvent(backend);
    ASSERT_TRUE(bracket.has_value());
    EXPECT_EQ(bracket->keyCode, '[');
    auto digit = nextEvent(backend);
    ASSERT_TRUE(digit.has_value());
    EXPECT_EQ(digit->keyCode, '1');
}

TEST_F(LocalBackendTest, SplitSequenceWithinDelayStillDecodes)
{
    auto opts = options();
    opts.escapeDelay = 250ms;
    LocalBackend backend(opts);
    ASSERT_TRUE(backend.init().isOk());

    type("\x1b[");
    auto partial = backend.pollEvent(0ms);
    ASSERT_TRUE(partial.isOk());
    EXPECT_FALSE(partial.value().has_value());

    type("B");
    auto ev = nextEvent(backend);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->keyCode, kbDown);
}

TEST_F(LocalBackendTest, DumpKeysRunCallbacksAndYieldNoEvent)
{
    LocalBackend backend(options());
    int screenDumps = 0;
    int viewDumps = 0;
    backend.setScreenDumpCallback([&screenDumps] { ++screenDumps; });
    backend.setViewDumpCallback([&viewDumps] { ++viewDumps; });
    ASSERT_TRUE(backend.init().isOk());

    type("\x1b[24~");
    for (int i = 0; i < 10 && screenDumps == 0; ++i)
    {
        auto polled = backend.pollEvent(200ms);
        ASSERT_TRUE(polled.isOk());
        EXPECT_FALSE(polled.value().has_value());
    }
    EXPECT_EQ(screenDumps, 1);

    type("\x1b[24;2~");
    for (int i = 0; i < 10 && viewDumps == 0; ++i)
    {
        auto polled = backend.pollEvent(200ms);
        ASSERT_TRUE(polled.isOk());
        EXPECT_FALSE(polled.value().has_value());
    }
    EXPECT_EQ(viewDumps, 1);

    type("a");
    auto ev = nextEvent(backend);
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->keyCode, 'a');
    EXPECT_EQ(screenDumps, 1);
}

TEST_F(LocalBackendTest, ClosedPeerFailsPoll)
{
    LocalBackend backend(options());
    ASSERT_TRUE(backend.init().isOk());
    ::close(master_);
    master_ = -1;

    bool failed = false;
    for (int i = 0; i < 10 && !failed; ++i)
    {
        auto polled = backend.pollEvent(200ms);
        failed = !polled.isOk();
    }
    EXPECT_TRUE(failed);
}

TEST_F(LocalBackendTest, SigwinchDrivesTerminalResize)
{
    term::Terminal terminal(std::make_unique<LocalBackend>(options()));
    ASSERT_TRUE(terminal.init().isOk());
    EXPECT_FALSE(terminal.checkResize());

    setWindowSize(100, 30);
    EXPECT_FALSE(terminal.checkResize());
    EXPECT_EQ(terminal.size(), (term::TermSize{80, 24}));

    ASSERT_EQ(std::raise(SIGWINCH), 0);
    EXPECT_TRUE(terminal.checkResize());
    EXPECT_EQ(terminal.size(), (term::TermSize{100, 30}));
    EXPECT_FALSE(terminal.checkResize());
}

TEST_F(LocalBackendTest, TakeResizeClearsFlag)
{
    LocalBackend backend(options());
    ASSERT_TRUE(backend.init().isOk());
    EXPECT_TRUE(backend.takeResize());
    EXPECT_FALSE(backend.takeResize());

    ASSERT_EQ(std::raise(SIGWINCH), 0);
    EXPECT_TRUE(backend.takeResize());
    EXPECT_FALSE(backend.takeResize());
}

TEST_F(LocalBackendTest, ApplicationQuitsOnEscThenX)
{
    Application app(std::make_unique<LocalBackend>(options()));

    std::atomic<bool> done{false};
    bool gaveUp = false;
    std::thread user(
        [&]
        {
            const auto start = std::chrono::steady_clock::now();
            bool typed = false;
            std::string seen;
            while (!done)
            {
                pollfd pfd{};
                pfd.fd = master_;
                pfd.events = POLLIN;
                if (::poll(&pfd, 1, 20) > 0)
                {
                    char buf[1024];
                    const ssize_t n = ::read(master_, buf, sizeof(buf));
                    if (n > 0)
                        seen.append(buf, static_cast<std::size_t>(n));
                }
                if (!typed && seen.find(term::kEnterAltScreen) != std::string::npos)
                {
                    type("\x1b");
                    std::this_thread::sleep_for(100ms);
                    type("x");
                    typed = true;
                }
                if (std::chrono::steady_clock::now() - start > 5s)
                {
                    // Unblock run() with a read error rather than hang.
                    ::close(master_);
                    gaveUp = true;
                    return;
                }
            }
        });

    auto st = app.run();
    done = true;
    user.join();
    if (gaveUp)
        master_ = -1;

    EXPECT_FALSE(gaveUp);
    EXPECT_TRUE(st.isOk());
    EXPECT_FALSE(app.running());
}
