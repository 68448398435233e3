// File: tests/tvkit/test_keys_events.cpp
// Purpose: Pin the legacy key code table and Event helpers.
// Key invariants: Key codes are a wire contract and must stay bit-exact.
// Ownership/Lifetime: Tests operate on value types only.
// Links: include/tvkit/core/keys.hpp, include/tvkit/core/event.hpp

#include <gtest/gtest.h>

#include "tvkit/core/event.hpp"
#include "tvkit/core/keys.hpp"

using namespace tvkit;

TEST(Keys, LegacyTableIsBitExact)
{
    EXPECT_EQ(kbEsc, 0x011B);
    EXPECT_EQ(kbEnter, 0x1C0D);
    EXPECT_EQ(kbBackspace, 0x0E08);
    EXPECT_EQ(kbTab, 0x0F09);
    EXPECT_EQ(kbShiftTab, 0x0F00);
    EXPECT_EQ(kbF1, 0x3B00);
    EXPECT_EQ(kbF10, 0x4400);
    EXPECT_EQ(kbF11, 0x8500);
    EXPECT_EQ(kbF12, 0x8600);
    EXPECT_EQ(kbShiftF12, 0x8601);
    EXPECT_EQ(kbAltF3, 0x6A00);
    EXPECT_EQ(kbEscEsc, 0x011C);
    EXPECT_EQ(kbCtrlZ, 0x001A);
}

TEST(Keys, LetterCodesFollowScanTable)
{
    EXPECT_EQ(altLetterCode('x'), kbAltX);
    EXPECT_EQ(altLetterCode('X'), kbAltX);
    EXPECT_EQ(*altLetterCode('x'), 0x2D00);
    EXPECT_EQ(escLetterCode('x'), kbEscX);
    EXPECT_EQ(*escLetterCode('x'), 0x2D01);
    EXPECT_EQ(ctrlLetterCode('q'), kbCtrlQ);
    EXPECT_FALSE(altLetterCode('1').has_value());
}

TEST(Keys, NamesKnownCodes)
{
    EXPECT_EQ(keyName(kbF6), "F6");
    EXPECT_EQ(keyName(kbShiftTab), "Shift+Tab");
}

TEST(Event, ClearMeansConsumed)
{
    Event ev = Event::keyboard(kbEnter);
    EXPECT_TRUE(ev.isKeyboard());
    EXPECT_EQ(ev.mask(), evKeyboard);
    ev.clear();
    EXPECT_TRUE(ev.isNothing());
    EXPECT_EQ(ev.mask(), evNothing);
}

TEST(Event, MasksMatchLegacyValues)
{
    EXPECT_EQ(Event::mouseEvent(EventType::MouseDown, Point(0, 0), mbLeftButton).mask(), evMouseDown);
    EXPECT_EQ(Event::mouseEvent(EventType::MouseWheelDown, Point(0, 0), 0).mask(), evMouseWheelDown);
    EXPECT_EQ(Event::commandEvent(cmQuit).mask(), evCommand);
    EXPECT_EQ(Event::broadcastEvent(cmCommandSetChanged).mask(), evBroadcast);
    EXPECT_EQ(evBroadcast, 0x0200);
    EXPECT_TRUE(Event::mouseEvent(EventType::MouseAuto, Point(1, 1), 0).isMouse());
}

TEST(Event, TextCarriesScalar)
{
    const Event ascii = Event::text(U'a');
    EXPECT_EQ(ascii.keyCode, 'a');
    const Event wide = Event::text(U'é');
    EXPECT_EQ(wide.keyCode, kbNone);
    EXPECT_EQ(wide.ch, U'é');
}

TEST(Event, TerminalCommandRange)
{
    EXPECT_TRUE(isTerminalCommand(cmOk));
    EXPECT_TRUE(isTerminalCommand(999));
    EXPECT_FALSE(isTerminalCommand(kInternalCommandBase));
    EXPECT_FALSE(isTerminalCommand(cmNone));
}
