// File: tests/tvkit/recording_view.hpp
// Purpose: Recording view shared by the view and application tests.
// Key invariants: Every event reaching handleEvent() is logged by name.
// Ownership/Lifetime: The optional shared log outlives the views using it.
// Links: include/tvkit/ui/view.hpp

#pragma once

#include "tvkit/ui/view.hpp"

#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace tvkit::testing
{

class RecordingView : public ui::View
{
  public:
    explicit RecordingView(const Rect &bounds, std::string name = "view", bool selectable = true)
        : View(bounds), name_(std::move(name))
    {
        if (selectable)
        {
            options_ = ofSelectable;
        }
    }

    void handleEvent(Event &ev) override
    {
        seen.push_back(ev);
        if (log)
        {
            log->push_back(name_);
        }
        if (onEvent)
        {
            onEvent(ev);
        }
    }

    void idle() override
    {
        ++idleCalls;
    }

    const char *typeName() const override
    {
        return "Recording";
    }

    std::vector<Event> seen;
    std::vector<std::string> *log = nullptr;
    std::function<void(Event &)> onEvent;
    int idleCalls = 0;

  private:
    std::string name_;
};

} // namespace tvkit::testing
