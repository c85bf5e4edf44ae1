#include "window_command.hpp"

#include <charconv>

namespace termdeck
{

namespace
{

struct NamedKind
{
    std::string_view    name;
    WindowCommand::Kind kind;
};

constexpr NamedKind NAMED_KINDS[] = {
    {"next_tab", WindowCommand::Kind::NextTab},
    {"previous_tab", WindowCommand::Kind::PreviousTab},
    {"last_tab", WindowCommand::Kind::LastTab},
    {"toggle_fullscreen", WindowCommand::Kind::ToggleFullscreen},
    {"toggle_window_decorations", WindowCommand::Kind::ToggleDecorations},
    {"close_window", WindowCommand::Kind::CloseWindow},
};

constexpr std::string_view GOTO_TAB_PREFIX = "goto_tab:";

}   // namespace

std::optional<WindowCommand> WindowCommand::parse(std::string_view text)
{
    if (auto action = parse_action(text))
        return dispatch(*action);

    for (const auto& named : NAMED_KINDS)
    {
        if (named.name == text)
            return of(named.kind);
    }

    if (text.substr(0, GOTO_TAB_PREFIX.size()) == GOTO_TAB_PREFIX)
    {
        auto   digits = text.substr(GOTO_TAB_PREFIX.size());
        size_t n      = 0;
        auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), n);
        if (ec == std::errc() && ptr == digits.data() + digits.size() && !digits.empty())
            return goto_tab(n);
    }

    return std::nullopt;
}

std::string WindowCommand::to_string() const
{
    switch (kind)
    {
        case Kind::Dispatch:
            return std::string(action_name(action));
        case Kind::GotoTab:
            return std::string(GOTO_TAB_PREFIX) + std::to_string(tab_index);
        default:
            break;
    }
    for (const auto& named : NAMED_KINDS)
    {
        if (named.kind == kind)
            return std::string(named.name);
    }
    return {};
}

}   // namespace termdeck
