#pragma once

#include <string_view>
#include <termdeck/action.hpp>
#include <variant>

namespace termdeck
{

// Events a toolkit adapter delivers to a Window. Each adapter window is bound
// to exactly one Window, so the originating window is implicit in the route.
namespace events
{

// User asked to close the window (title-bar button, WM close, Ctrl+Q ...).
struct CloseRequested
{
};

// The native window is gone through another path; no confirmation possible.
struct Destroyed
{
};

// Menu or accelerator invoked a binding action.
struct ActionInvoked
{
    Action action;
};

// The "+" button in the title bar.
struct NewTabClicked
{
};

// The tab overview asked for a fresh tab.
struct TabCreatedFromOverview
{
};

struct ContextMenuClosed
{
};

struct AboutRequested
{
};

// Raw key press; mods uses the KeyMod bit layout.
struct KeyPressed
{
    int key  = 0;
    int mods = 0;
};

}   // namespace events

using WindowEvent = std::variant<events::CloseRequested,
                                 events::Destroyed,
                                 events::ActionInvoked,
                                 events::NewTabClicked,
                                 events::TabCreatedFromOverview,
                                 events::ContextMenuClosed,
                                 events::AboutRequested,
                                 events::KeyPressed>;

std::string_view event_name(const WindowEvent& event);

}   // namespace termdeck
