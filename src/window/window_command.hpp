#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <termdeck/action.hpp>

namespace termdeck
{

// A command addressed to a window: either a binding action for the focused
// surface or a window-level operation. Textual form is used by keybindings
// and the config file, e.g. "split_right", "next_tab", "goto_tab:3".
struct WindowCommand
{
    enum class Kind
    {
        Dispatch,
        NextTab,
        PreviousTab,
        LastTab,
        GotoTab,
        ToggleFullscreen,
        ToggleDecorations,
        CloseWindow,
    };

    Kind   kind      = Kind::Dispatch;
    Action action    = Action::NewTab;   // Dispatch only
    size_t tab_index = 0;                // GotoTab only, 1-based

    static WindowCommand dispatch(Action a) { return {Kind::Dispatch, a, 0}; }
    static WindowCommand goto_tab(size_t n) { return {Kind::GotoTab, Action::NewTab, n}; }
    static WindowCommand of(Kind k) { return {k, Action::NewTab, 0}; }

    static std::optional<WindowCommand> parse(std::string_view text);
    std::string                         to_string() const;

    bool operator==(const WindowCommand& o) const = default;
};

}   // namespace termdeck
