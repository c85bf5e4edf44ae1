#include "window_event.hpp"

namespace termdeck
{

namespace
{

struct EventNamer
{
    std::string_view operator()(const events::CloseRequested&) const { return "close_requested"; }
    std::string_view operator()(const events::Destroyed&) const { return "destroyed"; }
    std::string_view operator()(const events::ActionInvoked&) const { return "action_invoked"; }
    std::string_view operator()(const events::NewTabClicked&) const { return "new_tab_clicked"; }
    std::string_view operator()(const events::TabCreatedFromOverview&) const
    {
        return "tab_created_from_overview";
    }
    std::string_view operator()(const events::ContextMenuClosed&) const
    {
        return "context_menu_closed";
    }
    std::string_view operator()(const events::AboutRequested&) const { return "about_requested"; }
    std::string_view operator()(const events::KeyPressed&) const { return "key_pressed"; }
};

}   // namespace

std::string_view event_name(const WindowEvent& event)
{
    return std::visit(EventNamer{}, event);
}

}   // namespace termdeck
