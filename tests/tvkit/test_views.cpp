// File: tests/tvkit/test_views.cpp
// Purpose: Routing and behaviour of the view hierarchy: groups, windows,
//          desktop window management, dialogs, buttons and the bars.
// Key invariants: Keyboard and commands follow pre/focused/post order; mouse
//                 events go to the topmost child under the pointer unless a
//                 child is dragging; a modal dialog ends on terminal commands.
// Ownership/Lifetime: Views are owned by the groups they are added to.
// Links: include/tvkit/ui/group.hpp, include/tvkit/ui/desktop.hpp

#include <gtest/gtest.h>

#include "recording_view.hpp"
#include "tvkit/ui/button.hpp"
#include "tvkit/ui/desktop.hpp"
#include "tvkit/ui/dialog.hpp"
#include "tvkit/ui/menu_bar.hpp"
#include "tvkit/ui/status_line.hpp"
#include "tvkit/ui/window.hpp"

#include <deque>
#include <memory>
#include <string>
#include <vector>

using namespace tvkit;
using tvkit::testing::RecordingView;

namespace
{

constexpr CommandId cmNewWindow = 100;

Event mouseDown(int x, int y)
{
    return Event::mouseEvent(EventType::MouseDown, Point(static_cast<int16_t>(x), static_cast<int16_t>(y)),
                             mbLeftButton);
}

ui::Group::EventSource scripted(std::deque<Event> &events)
{
    return [&events]() -> support::Result<std::optional<Event>> {
        if (events.empty())
        {
            return support::Result<std::optional<Event>>::error(support::Errc::BrokenPipe, "script ended");
        }
        Event ev = events.front();
        events.pop_front();
        return std::optional<Event>(ev);
    };
}

} // namespace

TEST(Group, AddConvertsRelativeBounds)
{
    ui::Group group(Rect(10, 5, 50, 20));
    auto *child = group.add(std::make_unique<RecordingView>(Rect(1, 1, 5, 2)));
    EXPECT_EQ(child->bounds(), Rect(11, 6, 15, 7));

    ui::Window win(Rect(10, 5, 50, 20), "w");
    auto *inner = win.add(std::make_unique<RecordingView>(Rect(0, 0, 5, 1)));
    EXPECT_EQ(inner->bounds(), Rect(11, 6, 16, 7));
    EXPECT_EQ(win.interior(), Rect(11, 6, 49, 19));
}

TEST(Group, TabCyclesSkippingUnselectable)
{
    ui::Group group(Rect(0, 0, 40, 10));
    auto *a = group.add(std::make_unique<RecordingView>(Rect(0, 0, 5, 1), "a"));
    auto *b = group.add(std::make_unique<RecordingView>(Rect(0, 1, 5, 2), "b", false));
    auto *c = group.add(std::make_unique<RecordingView>(Rect(0, 2, 5, 3), "c"));
    group.setInitialFocus();
    ASSERT_EQ(group.current(), a);
    EXPECT_TRUE(a->getState(sfFocused | sfSelected));

    Event tab = Event::keyboard(kbTab);
    group.handleEvent(tab);
    EXPECT_TRUE(tab.isNothing());
    EXPECT_EQ(group.current(), c);
    EXPECT_FALSE(a->getState(sfFocused));
    EXPECT_TRUE(b->seen.empty());

    tab = Event::keyboard(kbTab);
    group.handleEvent(tab);
    EXPECT_EQ(group.current(), a);

    Event back = Event::keyboard(kbShiftTab);
    group.handleEvent(back);
    EXPECT_TRUE(back.isNothing());
    EXPECT_EQ(group.current(), c);
}

TEST(Group, FocusedChildMayConsumeTab)
{
    ui::Group group(Rect(0, 0, 40, 10));
    auto *a = group.add(std::make_unique<RecordingView>(Rect(0, 0, 5, 1), "a"));
    group.add(std::make_unique<RecordingView>(Rect(0, 1, 5, 2), "b"));
    a->onEvent = [](Event &ev) {
        if (ev.isKeyboard() && ev.keyCode == kbTab)
            ev.clear();
    };
    group.setInitialFocus();

    Event tab = Event::keyboard(kbTab);
    group.handleEvent(tab);
    EXPECT_EQ(group.current(), a);
    EXPECT_EQ(a->seen.size(), 1u);
}

TEST(Group, FocusRejectsUnfocusableChildren)
{
    ui::Group group(Rect(0, 0, 40, 10));
    auto *a = group.add(std::make_unique<RecordingView>(Rect(0, 0, 5, 1), "a"));
    auto *b = group.add(std::make_unique<RecordingView>(Rect(0, 1, 5, 2), "b"));
    ASSERT_TRUE(group.focus(a));
    b->setState(sfDisabled, true);
    EXPECT_FALSE(group.focus(b));
    EXPECT_EQ(group.current(), a);

    RecordingView stranger(Rect(0, 0, 1, 1));
    EXPECT_FALSE(group.focus(&stranger));
}

TEST(Group, PreFocusedPostOrder)
{
    std::vector<std::string> log;
    ui::Group group(Rect(0, 0, 40, 10));
    auto *post = group.add(std::make_unique<RecordingView>(Rect(0, 0, 5, 1), "post", false));
    auto *focused = group.add(std::make_unique<RecordingView>(Rect(0, 1, 5, 2), "focused"));
    auto *pre = group.add(std::make_unique<RecordingView>(Rect(0, 2, 5, 3), "pre", false));
    auto *idle = group.add(std::make_unique<RecordingView>(Rect(0, 3, 5, 4), "idle", false));
    post->setOptions(ofPostProcess);
    pre->setOptions(ofPreProcess);
    for (RecordingView *p : {post, focused, pre, idle})
        p->log = &log;
    ASSERT_TRUE(group.focus(focused));

    Event key = Event::keyboard('a');
    group.handleEvent(key);
    EXPECT_EQ(log, (std::vector<std::string>{"pre", "focused", "post"}));

    log.clear();
    pre->onEvent = [](Event &ev) { ev.clear(); };
    Event cmd = Event::commandEvent(cmNewWindow);
    group.handleEvent(cmd);
    EXPECT_EQ(log, (std::vector<std::string>{"pre"}));
    EXPECT_TRUE(cmd.isNothing());
}

TEST(Group, MouseGoesToTopmostChildUnderPointer)
{
    ui::Group group(Rect(0, 0, 40, 10));
    auto *below = group.add(std::make_unique<RecordingView>(Rect(0, 0, 20, 5), "below"));
    auto *above = group.add(std::make_unique<RecordingView>(Rect(10, 0, 30, 5), "above"));
    group.setInitialFocus();
    ASSERT_EQ(group.current(), below);

    Event shared = mouseDown(15, 2);
    group.handleEvent(shared);
    EXPECT_EQ(above->seen.size(), 1u);
    EXPECT_TRUE(below->seen.empty());
    EXPECT_EQ(group.current(), above);

    Event only = mouseDown(2, 2);
    group.handleEvent(only);
    EXPECT_EQ(below->seen.size(), 1u);
    EXPECT_EQ(group.current(), below);

    Event outside = mouseDown(35, 8);
    group.handleEvent(outside);
    EXPECT_EQ(group.current(), below);
    EXPECT_EQ(above->seen.size(), 1u);
}

TEST(Group, DraggingChildKeepsMouseMoves)
{
    ui::Group group(Rect(0, 0, 40, 10));
    auto *dragger = group.add(std::make_unique<RecordingView>(Rect(0, 0, 5, 5), "dragger"));
    auto *other = group.add(std::make_unique<RecordingView>(Rect(10, 0, 20, 5), "other"));
    ASSERT_TRUE(group.focus(dragger));
    dragger->setState(sfDragging, true);

    Event move = Event::mouseEvent(EventType::MouseMove, Point(12, 2), mbLeftButton);
    group.handleEvent(move);
    Event up = Event::mouseEvent(EventType::MouseUp, Point(12, 2), 0);
    group.handleEvent(up);
    EXPECT_EQ(dragger->seen.size(), 2u);
    EXPECT_TRUE(other->seen.empty());
}

TEST(Group, BroadcastStopsWhenCleared)
{
    ui::Group group(Rect(0, 0, 40, 10));
    auto *a = group.add(std::make_unique<RecordingView>(Rect(0, 0, 5, 1), "a"));
    auto *b = group.add(std::make_unique<RecordingView>(Rect(0, 1, 5, 2), "b"));
    auto *c = group.add(std::make_unique<RecordingView>(Rect(0, 2, 5, 3), "c"));
    b->onEvent = [](Event &ev) { ev.clear(); };

    Event ev = Event::broadcastEvent(cmReceivedFocus);
    group.handleEvent(ev);
    EXPECT_EQ(a->seen.size(), 1u);
    EXPECT_EQ(b->seen.size(), 1u);
    EXPECT_TRUE(c->seen.empty());
    EXPECT_TRUE(ev.isNothing());
}

TEST(Group, RemoveRefocusesTopmostFocusable)
{
    ui::Group group(Rect(0, 0, 40, 10));
    auto *a = group.add(std::make_unique<RecordingView>(Rect(0, 0, 5, 1), "a"));
    auto *b = group.add(std::make_unique<RecordingView>(Rect(0, 1, 5, 2), "b"));
    auto *c = group.add(std::make_unique<RecordingView>(Rect(0, 2, 5, 3), "c"));
    ASSERT_TRUE(group.focus(c));

    auto owned = group.remove(c);
    ASSERT_NE(owned, nullptr);
    EXPECT_FALSE(owned->getState(sfFocused));
    EXPECT_EQ(group.size(), 2u);
    EXPECT_EQ(group.current(), b);

    ASSERT_TRUE(group.focus(a));
    auto other = group.remove(b);
    EXPECT_EQ(group.current(), a);
    EXPECT_EQ(group.indexOf(a), 0);
    EXPECT_EQ(group.remove(b), nullptr);
}

TEST(Group, BringToFrontKeepsFocus)
{
    ui::Group group(Rect(0, 0, 40, 10));
    auto *a = group.add(std::make_unique<RecordingView>(Rect(0, 0, 5, 1), "a"));
    auto *b = group.add(std::make_unique<RecordingView>(Rect(0, 1, 5, 2), "b"));
    auto *c = group.add(std::make_unique<RecordingView>(Rect(0, 2, 5, 3), "c"));
    ASSERT_TRUE(group.focus(a));

    group.bringToFront(a);
    EXPECT_EQ(group.at(0), b);
    EXPECT_EQ(group.at(1), c);
    EXPECT_EQ(group.at(2), a);
    EXPECT_EQ(group.current(), a);
}

TEST(Group, ExecuteRunsUntilTerminalCommand)
{
    ui::Group group(Rect(0, 0, 40, 10));
    auto *watcher = group.add(std::make_unique<RecordingView>(Rect(0, 0, 5, 1)));
    group.setInitialFocus();
    watcher->onEvent = [&group](Event & /*ev*/) { EXPECT_TRUE(group.getState(sfModal)); };

    std::deque<Event> events{Event::keyboard('x'), Event::commandEvent(1500), Event::commandEvent(cmOk),
                             Event::keyboard('y')};
    EXPECT_EQ(group.execute(scripted(events)), cmOk);
    EXPECT_EQ(watcher->seen.size(), 3u);
    EXPECT_EQ(events.size(), 1u);
    EXPECT_FALSE(group.getState(sfModal));
    EXPECT_EQ(group.endState(), cmOk);
}

TEST(Group, ExecuteSkipsEmptyTicksAndCancelsOnSourceError)
{
    ui::Group group(Rect(0, 0, 40, 10));
    int calls = 0;
    auto source = [&calls]() -> support::Result<std::optional<Event>> {
        if (++calls < 3)
        {
            return std::optional<Event>();
        }
        return support::Result<std::optional<Event>>::error(support::Errc::BrokenPipe, "peer closed");
    };
    EXPECT_EQ(group.execute(source), cmCancel);
    EXPECT_EQ(calls, 3);
    EXPECT_FALSE(group.getState(sfModal));
}

class DesktopTest : public ::testing::Test
{
  protected:
    ui::Desktop desktop{Rect(0, 0, 80, 24)};
};

TEST_F(DesktopTest, StartsWithBackgroundOnly)
{
    EXPECT_EQ(desktop.size(), 1u);
    EXPECT_EQ(desktop.windowCount(), 0u);
    ASSERT_NE(desktop.background(), nullptr);
    EXPECT_EQ(desktop.background()->bounds(), Rect(0, 0, 80, 24));
    EXPECT_EQ(desktop.current(), nullptr);
    EXPECT_FALSE(desktop.hasTileableWindows());
}

TEST_F(DesktopTest, AddFocusesNewWindow)
{
    auto *one = desktop.add(std::make_unique<ui::Window>(Rect(5, 3, 35, 13), "One"));
    EXPECT_EQ(desktop.current(), one);
    auto *two = desktop.add(std::make_unique<ui::Window>(Rect(20, 8, 60, 20), "Two"));
    EXPECT_EQ(desktop.current(), two);
    EXPECT_FALSE(one->getState(sfFocused));
    EXPECT_EQ(desktop.windowCount(), 2u);
    EXPECT_EQ(desktop.windowAt(0), one);
    EXPECT_TRUE(desktop.hasTileableWindows());
}

TEST_F(DesktopTest, CloseCommandClosesFocusedWindow)
{
    auto *one = desktop.add(std::make_unique<ui::Window>(Rect(5, 3, 35, 13), "One"));
    auto *two = desktop.add(std::make_unique<ui::Window>(Rect(20, 8, 60, 20), "Two"));

    Event ev = Event::commandEvent(cmClose);
    desktop.handleEvent(ev);
    EXPECT_TRUE(ev.isNothing());
    EXPECT_TRUE(two->getState(sfClosed));
    EXPECT_FALSE(two->getState(sfVisible));
    EXPECT_FALSE(one->getState(sfClosed));

    EXPECT_TRUE(desktop.removeClosedWindows());
    EXPECT_EQ(desktop.windowCount(), 1u);
    EXPECT_EQ(desktop.current(), one);
    EXPECT_FALSE(desktop.removeClosedWindows());
}

TEST_F(DesktopTest, CloseBoxClickClosesWindow)
{
    desktop.add(std::make_unique<ui::Window>(Rect(5, 3, 35, 13), "One"));
    auto *two = desktop.add(std::make_unique<ui::Window>(Rect(20, 8, 60, 20), "Two"));

    Event click = mouseDown(23, 8);
    desktop.handleEvent(click);
    EXPECT_TRUE(click.isNothing());
    EXPECT_TRUE(two->getState(sfClosed));
}

TEST_F(DesktopTest, TitleDragMovesWindowAndChildren)
{
    auto *win = desktop.add(std::make_unique<ui::Window>(Rect(20, 8, 60, 20), "Drag"));
    auto *child = win->add(std::make_unique<RecordingView>(Rect(0, 0, 5, 1)));
    ASSERT_EQ(child->bounds(), Rect(21, 9, 26, 10));

    Event down = mouseDown(30, 8);
    desktop.handleEvent(down);
    EXPECT_TRUE(down.isNothing());
    EXPECT_TRUE(win->getState(sfDragging));

    Event move = Event::mouseEvent(EventType::MouseMove, Point(40, 10), mbLeftButton);
    desktop.handleEvent(move);
    EXPECT_EQ(win->bounds(), Rect(30, 10, 70, 22));
    EXPECT_EQ(child->bounds(), Rect(31, 11, 36, 12));

    Event up = Event::mouseEvent(EventType::MouseUp, Point(40, 10), 0);
    desktop.handleEvent(up);
    EXPECT_FALSE(win->getState(sfDragging));
    EXPECT_FALSE(win->getState(sfClosed));
}

TEST_F(DesktopTest, NextAndPrevRotateWindows)
{
    auto *one = desktop.add(std::make_unique<ui::Window>(Rect(0, 0, 20, 10), "One"));
    auto *two = desktop.add(std::make_unique<ui::Window>(Rect(5, 2, 25, 12), "Two"));
    auto *three = desktop.add(std::make_unique<ui::Window>(Rect(10, 4, 30, 14), "Three"));

    Event next = Event::commandEvent(cmNext);
    desktop.handleEvent(next);
    EXPECT_TRUE(next.isNothing());
    EXPECT_EQ(desktop.current(), one);
    EXPECT_EQ(desktop.windowAt(0), two);
    EXPECT_EQ(desktop.windowAt(1), three);
    EXPECT_EQ(desktop.windowAt(2), one);

    Event prev = Event::commandEvent(cmPrev);
    desktop.handleEvent(prev);
    EXPECT_TRUE(prev.isNothing());
    EXPECT_EQ(desktop.windowAt(0), one);
    EXPECT_EQ(desktop.windowAt(1), two);
    EXPECT_EQ(desktop.windowAt(2), three);
    EXPECT_EQ(desktop.current(), three);
    EXPECT_FALSE(one->getState(sfFocused));
}

TEST_F(DesktopTest, TileAndCascade)
{
    auto *one = desktop.add(std::make_unique<ui::Window>(Rect(5, 3, 35, 13), "One"));
    auto *two = desktop.add(std::make_unique<ui::Window>(Rect(20, 8, 60, 20), "Two"));

    desktop.tile();
    EXPECT_EQ(one->bounds(), Rect(0, 0, 40, 24));
    EXPECT_EQ(two->bounds(), Rect(40, 0, 80, 24));

    desktop.cascade();
    EXPECT_EQ(one->bounds(), Rect(0, 0, 80, 24));
    EXPECT_EQ(two->bounds(), Rect(1, 1, 80, 24));
}

TEST_F(DesktopTest, TileSkipsNonTileableViews)
{
    auto *win = desktop.add(std::make_unique<ui::Window>(Rect(5, 3, 35, 13), "One"));
    auto *dlg = desktop.add(std::make_unique<ui::Dialog>(Rect(20, 8, 60, 20), "Dialog"));

    desktop.tile();
    EXPECT_EQ(win->bounds(), Rect(0, 0, 80, 24));
    EXPECT_EQ(dlg->bounds(), Rect(20, 8, 60, 20));
}

TEST_F(DesktopTest, ZoomToggles)
{
    auto *win = desktop.add(std::make_unique<ui::Window>(Rect(20, 8, 60, 20), "Zoom"));

    Event zoom = Event::commandEvent(cmZoom);
    desktop.handleEvent(zoom);
    EXPECT_TRUE(zoom.isNothing());
    EXPECT_EQ(win->bounds(), Rect(0, 0, 80, 24));

    zoom = Event::commandEvent(cmZoom);
    desktop.handleEvent(zoom);
    EXPECT_EQ(win->bounds(), Rect(20, 8, 60, 20));
}

TEST_F(DesktopTest, ClickBringsBackgroundWindowToFront)
{
    auto *one = desktop.add(std::make_unique<ui::Window>(Rect(5, 3, 35, 13), "One"));
    auto *two = desktop.add(std::make_unique<ui::Window>(Rect(20, 8, 60, 20), "Two"));

    Event click = mouseDown(6, 4);
    desktop.handleEvent(click);
    EXPECT_EQ(desktop.windowAt(1), one);
    EXPECT_EQ(desktop.current(), one);
    EXPECT_TRUE(one->getState(sfFocused));
    EXPECT_FALSE(two->getState(sfFocused));
}

TEST_F(DesktopTest, ModalTopViewReceivesEverything)
{
    auto *one = desktop.add(std::make_unique<ui::Window>(Rect(5, 3, 35, 13), "One"));
    auto *modal = desktop.add(std::make_unique<RecordingView>(Rect(50, 10, 70, 15), "modal"));
    modal->setState(sfModal, true);

    Event click = mouseDown(6, 4);
    desktop.handleEvent(click);
    Event cmd = Event::commandEvent(cmNext);
    desktop.handleEvent(cmd);
    EXPECT_EQ(modal->seen.size(), 2u);
    EXPECT_EQ(desktop.windowAt(1), modal);
    EXPECT_FALSE(one->getState(sfFocused));
    EXPECT_EQ(desktop.current(), modal);

    Event bc = Event::broadcastEvent(cmCommandSetChanged);
    desktop.handleEvent(bc);
    EXPECT_EQ(modal->seen.size(), 3u);
}

class DialogTest : public ::testing::Test
{
  protected:
    void build()
    {
        dialog = std::make_unique<ui::Dialog>(Rect(0, 0, 40, 12), "Confirm");
        field = dialog->add(std::make_unique<RecordingView>(Rect(0, 0, 10, 1), "field"));
        yes = dialog->add(std::make_unique<ui::Button>(Rect(2, 8, 12, 10), "~Y~es", cmYes, registry, true));
        no = dialog->add(std::make_unique<ui::Button>(Rect(14, 8, 24, 10), "~N~o", cmNo, registry));
        dialog->setInitialFocus();
    }

    CommandRegistry registry;
    std::unique_ptr<ui::Dialog> dialog;
    RecordingView *field = nullptr;
    ui::Button *yes = nullptr;
    ui::Button *no = nullptr;
};

TEST_F(DialogTest, EnterActivatesDefaultButton)
{
    build();
    ASSERT_EQ(dialog->current(), field);

    Event enter = Event::keyboard(kbEnter);
    dialog->handleEvent(enter);
    ASSERT_TRUE(enter.isCommand());
    EXPECT_EQ(enter.command, cmYes);
    EXPECT_EQ(field->seen.size(), 1u);
    EXPECT_EQ(dialog->endState(), cmNone);
}

TEST_F(DialogTest, DisabledDefaultSwallowsEnter)
{
    registry.disable(cmYes);
    build();
    EXPECT_TRUE(yes->getState(sfDisabled));

    Event enter = Event::keyboard(kbEnter);
    dialog->handleEvent(enter);
    EXPECT_TRUE(enter.isNothing());
}

TEST_F(DialogTest, EscEscCancels)
{
    build();
    Event esc = Event::keyboard(kbEscEsc);
    dialog->handleEvent(esc);
    ASSERT_TRUE(esc.isCommand());
    EXPECT_EQ(esc.command, cmCancel);

    dialog->setState(sfModal, true);
    esc = Event::keyboard(kbEscEsc);
    dialog->handleEvent(esc);
    EXPECT_TRUE(esc.isNothing());
    EXPECT_EQ(dialog->endState(), cmCancel);
}

TEST_F(DialogTest, ModalHotKeyEndsWithButtonCommand)
{
    build();
    std::deque<Event> events{Event::keyboard('x'), Event::commandEvent(1500), Event::keyboard(kbAltN)};
    EXPECT_EQ(dialog->execute(scripted(events)), cmNo);
    EXPECT_TRUE(events.empty());
    ASSERT_EQ(field->seen.size(), 3u);
    EXPECT_EQ(field->seen[1].command, 1500);
    EXPECT_FALSE(dialog->getState(sfModal));
}

TEST_F(DialogTest, ModalCloseBoxCancels)
{
    build();
    dialog->setState(sfModal, true);

    Event click = mouseDown(3, 0);
    dialog->handleEvent(click);
    EXPECT_TRUE(click.isNothing());
    EXPECT_EQ(dialog->endState(), cmCancel);
    EXPECT_FALSE(dialog->getState(sfClosed));

    dialog->setEndState(cmNone);
    Event close = Event::commandEvent(cmClose);
    dialog->handleEvent(close);
    EXPECT_EQ(dialog->endState(), cmCancel);
    EXPECT_FALSE(dialog->getState(sfClosed));
}

TEST_F(DialogTest, CommandSetChangedResyncsButtons)
{
    registry.disable(cmNo);
    build();
    ASSERT_TRUE(no->getState(sfDisabled));

    Event hot = Event::keyboard(kbAltN);
    dialog->handleEvent(hot);
    EXPECT_TRUE(hot.isKeyboard());

    registry.enable(cmNo);
    Event changed = Event::broadcastEvent(cmCommandSetChanged);
    dialog->handleEvent(changed);
    EXPECT_TRUE(changed.isBroadcast());
    EXPECT_FALSE(no->getState(sfDisabled));
    EXPECT_EQ(field->seen.size(), 2u);
}

TEST(Button, ClickOnFaceButNotShadow)
{
    CommandRegistry registry;
    ui::Button button(Rect(10, 5, 20, 7), "~O~K", cmOk, registry);

    Event face = mouseDown(12, 5);
    button.handleEvent(face);
    ASSERT_TRUE(face.isCommand());
    EXPECT_EQ(face.command, cmOk);

    Event shadow = mouseDown(12, 6);
    button.handleEvent(shadow);
    EXPECT_EQ(shadow.what, EventType::MouseDown);

    ui::Button flat(Rect(10, 5, 20, 6), "Flat", cmOk, registry);
    Event single = mouseDown(19, 5);
    flat.handleEvent(single);
    EXPECT_TRUE(single.isCommand());
}

TEST(Button, KeyboardActivation)
{
    CommandRegistry registry;
    ui::Button button(Rect(0, 0, 10, 2), "~O~K", cmOk, registry);

    Event enter = Event::keyboard(kbEnter);
    button.handleEvent(enter);
    EXPECT_TRUE(enter.isKeyboard());

    Event hot = Event::keyboard(kbAltO);
    button.handleEvent(hot);
    EXPECT_TRUE(hot.isCommand());

    button.setState(sfFocused, true);
    Event space = Event::keyboard(' ');
    button.handleEvent(space);
    ASSERT_TRUE(space.isCommand());
    EXPECT_EQ(space.command, cmOk);

    button.setState(sfDisabled, true);
    Event ignored = Event::keyboard(kbEnter);
    button.handleEvent(ignored);
    EXPECT_TRUE(ignored.isKeyboard());
    EXPECT_FALSE(button.canFocus());
}

class StatusLineTest : public ::testing::Test
{
  protected:
    CommandRegistry registry;
    ui::StatusLine status{Rect(0, 24, 80, 25),
                          {{"~Alt+X~ Exit", kbAltX, cmQuit},
                           {"~F3~ New", kbF3, cmNewWindow},
                           {"", kbShiftTab, cmPrev},
                           {"~F6~ Next", kbF6, cmNext}},
                          registry};
};

TEST_F(StatusLineTest, KeysFireEnabledCommands)
{
    Event f3 = Event::keyboard(kbF3);
    status.handleEvent(f3);
    ASSERT_TRUE(f3.isCommand());
    EXPECT_EQ(f3.command, cmNewWindow);

    Event hidden = Event::keyboard(kbShiftTab);
    status.handleEvent(hidden);
    ASSERT_TRUE(hidden.isCommand());
    EXPECT_EQ(hidden.command, cmPrev);

    registry.disable(cmNewWindow);
    Event disabled = Event::keyboard(kbF3);
    status.handleEvent(disabled);
    EXPECT_TRUE(disabled.isKeyboard());
    EXPECT_EQ(disabled.keyCode, kbF3);

    Event other = Event::keyboard('q');
    status.handleEvent(other);
    EXPECT_TRUE(other.isKeyboard());
}

TEST_F(StatusLineTest, ClicksHitItemSpans)
{
    Event item = mouseDown(15, 24);
    status.handleEvent(item);
    ASSERT_TRUE(item.isCommand());
    EXPECT_EQ(item.command, cmNewWindow);

    Event first = mouseDown(0, 24);
    status.handleEvent(first);
    EXPECT_EQ(first.command, cmQuit);

    Event gap = mouseDown(13, 24);
    status.handleEvent(gap);
    EXPECT_TRUE(gap.isNothing());

    Event elsewhere = mouseDown(15, 10);
    status.handleEvent(elsewhere);
    EXPECT_EQ(elsewhere.what, EventType::MouseDown);

    registry.disable(cmNewWindow);
    Event disabled = mouseDown(15, 24);
    status.handleEvent(disabled);
    EXPECT_TRUE(disabled.isNothing());
}

class MenuBarTest : public ::testing::Test
{
  protected:
    CommandRegistry registry;
    ui::MenuBar menu{Rect(0, 0, 80, 1),
                     {{"~N~ew", cmNewWindow}, {"~T~ile", cmTile}, {"~C~ascade", cmCascade}},
                     registry};
};

TEST_F(MenuBarTest, HotKeysAndF10)
{
    Event tile = Event::keyboard(kbAltT);
    menu.handleEvent(tile);
    ASSERT_TRUE(tile.isCommand());
    EXPECT_EQ(tile.command, cmTile);

    Event f10 = Event::keyboard(kbF10);
    menu.handleEvent(f10);
    ASSERT_TRUE(f10.isCommand());
    EXPECT_EQ(f10.command, cmNewWindow);

    registry.disable(cmCascade);
    Event cascade = Event::keyboard(kbAltC);
    menu.handleEvent(cascade);
    EXPECT_TRUE(cascade.isNothing());
}

TEST_F(MenuBarTest, ClicksOnTheBarRow)
{
    Event tile = mouseDown(7, 0);
    menu.handleEvent(tile);
    ASSERT_TRUE(tile.isCommand());
    EXPECT_EQ(tile.command, cmTile);

    Event first = mouseDown(1, 0);
    menu.handleEvent(first);
    EXPECT_EQ(first.command, cmNewWindow);

    Event margin = mouseDown(0, 0);
    menu.handleEvent(margin);
    EXPECT_TRUE(margin.isNothing());

    Event beyond = mouseDown(40, 0);
    menu.handleEvent(beyond);
    EXPECT_TRUE(beyond.isNothing());

    Event below = mouseDown(7, 3);
    menu.handleEvent(below);
    EXPECT_EQ(below.what, EventType::MouseDown);
}
