#pragma once

#include <array>
#include <optional>
#include <string_view>

namespace termdeck
{

// Binding actions a window can forward to its focused surface.
// The set is closed; each value maps 1:1 to a terminal-engine binding action.
enum class Action
{
    NewTab,
    NewWindow,
    CloseSurface,
    SplitRight,
    SplitDown,
    ToggleInspector,
    CopyToClipboard,
    PasteFromClipboard,
    Reset,
};

inline constexpr std::array<Action, 9> ALL_ACTIONS = {
    Action::NewTab,
    Action::NewWindow,
    Action::CloseSurface,
    Action::SplitRight,
    Action::SplitDown,
    Action::ToggleInspector,
    Action::CopyToClipboard,
    Action::PasteFromClipboard,
    Action::Reset,
};

// Outcome of routing an action to a surface.
enum class ActionResult
{
    Performed,   // engine accepted the binding action
    NoSurface,   // nothing focused; dropped without error
    Rejected,    // engine refused; logged and absorbed
    Unknown,     // identifier not in the recognized set
};

// Identifier used by menus, keybindings and config, e.g. "split_right".
std::string_view action_name(Action action);

// Inverse of action_name(). Returns nullopt for unrecognized identifiers.
std::optional<Action> parse_action(std::string_view name);

std::string_view action_result_name(ActionResult result);

}   // namespace termdeck
