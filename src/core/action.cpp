#include <termdeck/action.hpp>

namespace termdeck
{

std::string_view action_name(Action action)
{
    switch (action)
    {
        case Action::NewTab:
            return "new_tab";
        case Action::NewWindow:
            return "new_window";
        case Action::CloseSurface:
            return "close_surface";
        case Action::SplitRight:
            return "split_right";
        case Action::SplitDown:
            return "split_down";
        case Action::ToggleInspector:
            return "toggle_inspector";
        case Action::CopyToClipboard:
            return "copy_to_clipboard";
        case Action::PasteFromClipboard:
            return "paste_from_clipboard";
        case Action::Reset:
            return "reset";
    }
    return "unknown";
}

std::optional<Action> parse_action(std::string_view name)
{
    for (Action action : ALL_ACTIONS)
    {
        if (action_name(action) == name)
            return action;
    }
    return std::nullopt;
}

std::string_view action_result_name(ActionResult result)
{
    switch (result)
    {
        case ActionResult::Performed:
            return "performed";
        case ActionResult::NoSurface:
            return "no_surface";
        case ActionResult::Rejected:
            return "rejected";
        case ActionResult::Unknown:
            return "unknown";
    }
    return "unknown";
}

}   // namespace termdeck
