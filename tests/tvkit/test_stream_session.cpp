// File: tests/tvkit/test_stream_session.cpp
// Purpose: Verify the socket pump that bridges a byte stream to a channel
//          session, and LocalBackend's refusal to run without a terminal.
// Key invariants: Peer close disconnects the session; backend output reaches
//                 the peer.
// Ownership/Lifetime: Tests own both socket ends and close them on exit.
// Links: include/tvkit/term/stream_session.hpp, include/tvkit/term/local_backend.hpp

#include <gtest/gtest.h>

#include "tvkit/term/local_backend.hpp"
#include "tvkit/term/stream_session.hpp"

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <string>
#include <thread>

using namespace tvkit;
using namespace std::chrono_literals;
using tvkit::support::Errc;
using tvkit::term::ChannelSessionBuilder;
using tvkit::term::StreamSession;

namespace
{
struct SocketPair
{
    int app = -1;
    int peer = -1;

    SocketPair()
    {
        int fds[2];
        if (::socketpair(AF_UNIX, SOCK_STREAM, 0, fds) == 0)
        {
            app = fds[0];
            peer = fds[1];
        }
    }

    ~SocketPair()
    {
        closePeer();
        if (app >= 0)
            ::close(app);
    }

    void closePeer()
    {
        if (peer >= 0)
        {
            ::close(peer);
            peer = -1;
        }
    }
};

std::string readUntil(int fd, const std::string &needle, std::chrono::milliseconds budget)
{
    std::string got;
    const auto deadline = std::chrono::steady_clock::now() + budget;
    while (got.find(needle) == std::string::npos && std::chrono::steady_clock::now() < deadline)
    {
        pollfd pfd{fd, POLLIN, 0};
        if (::poll(&pfd, 1, 20) <= 0)
        {
            continue;
        }
        char buf[1024];
        const ssize_t n = ::read(fd, buf, sizeof(buf));
        if (n <= 0)
        {
            break;
        }
        got.append(buf, static_cast<std::size_t>(n));
    }
    return got;
}
} // namespace

TEST(StreamSession, ForwardsInputAndOutput)
{
    SocketPair sp;
    ASSERT_GE(sp.app, 0);
    auto session = ChannelSessionBuilder().build();
    StreamSession pump(std::move(session.handle), sp.app, sp.app);
    pump.start();

    ASSERT_EQ(::write(sp.peer, "\x1b[B", 3), 3);
    auto ev = session.backend->pollEvent(2000ms);
    ASSERT_TRUE(ev.isOk());
    ASSERT_TRUE(ev.value().has_value());
    EXPECT_EQ(ev.value()->keyCode, kbDown);

    ASSERT_TRUE(session.backend->init().isOk());
    const std::string out = readUntil(sp.peer, std::string(term::kAutowrapOff), 2000ms);
    EXPECT_NE(out.find(std::string(term::kEnterAltScreen)), std::string::npos);

    pump.stop();
}

TEST(StreamSession, LoneEscIsFlushedAfterDelay)
{
    SocketPair sp;
    ASSERT_GE(sp.app, 0);
    auto session = ChannelSessionBuilder().build();
    StreamSession::Options opts;
    opts.escapeDelay = 5ms;
    StreamSession pump(std::move(session.handle), sp.app, sp.app, opts);
    pump.start();

    ASSERT_EQ(::write(sp.peer, "\x1b", 1), 1);
    auto ev = session.backend->pollEvent(2000ms);
    ASSERT_TRUE(ev.isOk());
    ASSERT_TRUE(ev.value().has_value());
    EXPECT_EQ(ev.value()->keyCode, kbEsc);
    pump.stop();
}

TEST(StreamSession, PeerCloseDisconnectsBackend)
{
    SocketPair sp;
    ASSERT_GE(sp.app, 0);
    auto session = ChannelSessionBuilder().build();
    StreamSession pump(std::move(session.handle), sp.app, sp.app);
    pump.start();
    sp.closePeer();

    bool broken = false;
    for (int i = 0; i < 200 && !broken; ++i)
    {
        auto polled = session.backend->pollEvent(10ms);
        if (!polled.isOk())
        {
            EXPECT_EQ(polled.error().code, Errc::BrokenPipe);
            broken = true;
        }
    }
    EXPECT_TRUE(broken);
    pump.stop();
    EXPECT_TRUE(pump.finished());
}

TEST(StreamSession, BackendDropEndsPump)
{
    SocketPair sp;
    ASSERT_GE(sp.app, 0);
    auto session = ChannelSessionBuilder().build();
    StreamSession pump(std::move(session.handle), sp.app, sp.app);
    pump.start();
    session.backend.reset();

    for (int i = 0; i < 200 && !pump.finished(); ++i)
    {
        std::this_thread::sleep_for(10ms);
    }
    EXPECT_TRUE(pump.finished());
    pump.stop();
}

TEST(LocalBackend, RefusesNonTerminalInput)
{
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    term::LocalBackend::Options opts;
    opts.inFd = fds[0];
    opts.outFd = fds[1];
    term::LocalBackend backend(opts);

    auto st = backend.init();
    ASSERT_FALSE(st.isOk());
    EXPECT_EQ(st.error().code, Errc::TerminalInit);
    EXPECT_FALSE(backend.initialized());
    EXPECT_TRUE(backend.cleanup().isOk());

    ::close(fds[0]);
    ::close(fds[1]);
}
