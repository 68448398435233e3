// File: tests/tvkit/test_channel_backend.cpp
// Purpose: Verify the remote-session backend and its transport handle.
// Key invariants: init/cleanup emit the escape strings in order and reverse
//                 order; a vanished peer surfaces as BrokenPipe.
// Ownership/Lifetime: The test plays both the UI thread and the transport.
// Links: include/tvkit/term/channel_backend.hpp

#include <gtest/gtest.h>

#include "tvkit/term/channel_backend.hpp"

#include <string>

using namespace tvkit;
using namespace std::chrono_literals;
using tvkit::support::Errc;
using tvkit::term::ChannelSessionBuilder;
using tvkit::term::TermSize;

namespace
{
std::string joined(const auto &seqs)
{
    std::string out;
    for (auto s : seqs)
    {
        out.append(s);
    }
    return out;
}

std::string drainOutput(term::ChannelSessionHandle &handle)
{
    std::string out;
    while (auto chunk = handle.tryRecvOutput())
    {
        out += *chunk;
    }
    return out;
}
} // namespace

TEST(ChannelBackend, InitAndCleanupSendInverseSequences)
{
    auto session = ChannelSessionBuilder().build();
    auto &backend = *session.backend;

    ASSERT_TRUE(backend.init().isOk());
    EXPECT_TRUE(backend.initialized());
    EXPECT_EQ(drainOutput(session.handle), joined(term::kInitSequence));

    ASSERT_TRUE(backend.init().isOk());
    EXPECT_EQ(drainOutput(session.handle), "");

    ASSERT_TRUE(backend.cleanup().isOk());
    EXPECT_EQ(drainOutput(session.handle), joined(term::kCleanupSequence) + std::string(term::kResetAttributes));
    ASSERT_TRUE(backend.cleanup().isOk());
    EXPECT_EQ(drainOutput(session.handle), "");
}

TEST(ChannelBackend, DefaultsAndBuilderSize)
{
    auto plain = ChannelSessionBuilder().build();
    auto sz = plain.backend->size();
    ASSERT_TRUE(sz.isOk());
    EXPECT_EQ(sz.value(), (TermSize{80, 24}));
    EXPECT_FALSE(plain.backend->capabilities().trueColor);

    auto custom = ChannelSessionBuilder().size(132, 43).build();
    EXPECT_EQ(custom.backend->size().value(), (TermSize{132, 43}));
}

TEST(ChannelBackend, InputIsDecodedAndQueuedEventsComeFirst)
{
    auto session = ChannelSessionBuilder().build();
    auto &backend = *session.backend;

    EXPECT_TRUE(session.handle.processInput("\x1b[A"));
    backend.putEvent(Event::commandEvent(cmZoom));

    auto first = backend.pollEvent(0ms);
    ASSERT_TRUE(first.isOk());
    ASSERT_TRUE(first.value().has_value());
    EXPECT_EQ(first.value()->command, cmZoom);

    auto second = backend.pollEvent(100ms);
    ASSERT_TRUE(second.isOk());
    ASSERT_TRUE(second.value().has_value());
    EXPECT_EQ(second.value()->keyCode, kbUp);

    auto idle = backend.pollEvent(10ms);
    ASSERT_TRUE(idle.isOk());
    EXPECT_FALSE(idle.value().has_value());
}

TEST(ChannelBackend, HeldEscIsFlushedOnRequest)
{
    auto session = ChannelSessionBuilder().build();
    EXPECT_TRUE(session.handle.processInput("\x1b"));
    EXPECT_TRUE(session.handle.hasPendingInput());
    EXPECT_FALSE(session.backend->pollEvent(0ms).value().has_value());

    EXPECT_TRUE(session.handle.flushPendingInput());
    auto ev = session.backend->pollEvent(100ms);
    ASSERT_TRUE(ev.isOk());
    ASSERT_TRUE(ev.value().has_value());
    EXPECT_EQ(ev.value()->keyCode, kbEsc);
}

TEST(ChannelBackend, DoubleClickIsDetected)
{
    auto session = ChannelSessionBuilder().doubleClickWindow(5000ms).build();
    session.handle.processInput("\x1b[<0;3;3M\x1b[<0;3;3m\x1b[<0;3;3M");
    auto down1 = session.backend->pollEvent(100ms);
    auto up = session.backend->pollEvent(100ms);
    auto down2 = session.backend->pollEvent(100ms);
    ASSERT_TRUE(down1.isOk() && up.isOk() && down2.isOk());
    EXPECT_FALSE(down1.value()->mouse.doubleClick);
    EXPECT_EQ(up.value()->what, EventType::MouseUp);
    EXPECT_TRUE(down2.value()->mouse.doubleClick);
}

TEST(ChannelBackend, ResizeWakesWithoutEvent)
{
    auto session = ChannelSessionBuilder().build();
    EXPECT_TRUE(session.handle.resize(100, 40));
    auto polled = session.backend->pollEvent(100ms);
    ASSERT_TRUE(polled.isOk());
    EXPECT_FALSE(polled.value().has_value());
    EXPECT_EQ(session.backend->size().value(), (TermSize{100, 40}));
}

TEST(ChannelBackend, OutputIsBufferedUntilFlush)
{
    auto session = ChannelSessionBuilder().build();
    auto &backend = *session.backend;
    ASSERT_TRUE(backend.writeRaw("abc").isOk());
    ASSERT_TRUE(backend.showCursor(1, 2).isOk());
    EXPECT_FALSE(session.handle.tryRecvOutput().has_value());

    ASSERT_TRUE(backend.flush().isOk());
    EXPECT_EQ(drainOutput(session.handle), "abc\x1b[3;2H\x1b[?25h");

    ASSERT_TRUE(backend.flush().isOk());
    EXPECT_FALSE(session.handle.tryRecvOutput().has_value());

    ASSERT_TRUE(backend.bell().isOk());
    EXPECT_EQ(drainOutput(session.handle), "\x07");
    ASSERT_TRUE(backend.suspend().isOk());
    ASSERT_TRUE(backend.resume().isOk());
}

TEST(ChannelBackend, ClosedHandleBreaksPolling)
{
    auto session = ChannelSessionBuilder().build();
    session.handle.processInput("q");
    session.handle.close();

    auto queued = session.backend->pollEvent(0ms);
    ASSERT_TRUE(queued.isOk());
    EXPECT_EQ(queued.value()->keyCode, 'q');

    auto gone = session.backend->pollEvent(10ms);
    ASSERT_FALSE(gone.isOk());
    EXPECT_EQ(gone.error().code, Errc::BrokenPipe);
}

TEST(ChannelBackend, DroppedTransportBreaksFlush)
{
    auto session = ChannelSessionBuilder().build();
    auto backend = std::move(session.backend);
    {
        auto handle = std::move(session.handle);
    }
    ASSERT_TRUE(backend->writeRaw("x").isOk());
    auto st = backend->flush();
    ASSERT_FALSE(st.isOk());
    EXPECT_EQ(st.error().code, Errc::BrokenPipe);
}

TEST(ChannelBackend, HandleSeesBackendDrop)
{
    auto session = ChannelSessionBuilder().build();
    EXPECT_FALSE(session.handle.isDisconnected());
    session.backend.reset();
    EXPECT_TRUE(session.handle.isDisconnected());
    EXPECT_FALSE(session.handle.processInput("x"));
}
