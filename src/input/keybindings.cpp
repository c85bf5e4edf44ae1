#include "keybindings.hpp"

#include <cctype>
#include <charconv>
#include <sstream>
#include <system_error>
#include <termdeck/logger.hpp>

namespace termdeck
{

// ─── Shortcut string conversion ──────────────────────────────────────────────

// GLFW key codes (subset needed for string conversion and defaults)
namespace glfw_keys
{
constexpr int KEY_SPACE         = 32;
constexpr int KEY_APOSTROPHE    = 39;
constexpr int KEY_COMMA         = 44;
constexpr int KEY_MINUS         = 45;
constexpr int KEY_PERIOD        = 46;
constexpr int KEY_SLASH         = 47;
constexpr int KEY_0             = 48;
constexpr int KEY_1             = 49;
constexpr int KEY_9             = 57;
constexpr int KEY_SEMICOLON     = 59;
constexpr int KEY_EQUAL         = 61;
constexpr int KEY_A             = 65;
constexpr int KEY_Z             = 90;
constexpr int KEY_LEFT_BRACKET  = 91;
constexpr int KEY_BACKSLASH     = 92;
constexpr int KEY_RIGHT_BRACKET = 93;
constexpr int KEY_ESCAPE        = 256;
constexpr int KEY_ENTER         = 257;
constexpr int KEY_TAB           = 258;
constexpr int KEY_BACKSPACE     = 259;
constexpr int KEY_INSERT        = 260;
constexpr int KEY_DELETE        = 261;
constexpr int KEY_RIGHT         = 262;
constexpr int KEY_LEFT          = 263;
constexpr int KEY_DOWN          = 264;
constexpr int KEY_UP            = 265;
constexpr int KEY_PAGE_UP       = 266;
constexpr int KEY_PAGE_DOWN     = 267;
constexpr int KEY_HOME          = 268;
constexpr int KEY_END           = 269;
constexpr int KEY_F1            = 290;
constexpr int KEY_F11           = 300;
constexpr int KEY_F12           = 301;

constexpr int KEY_C = 67;
constexpr int KEY_E = 69;
constexpr int KEY_I = 73;
constexpr int KEY_N = 78;
constexpr int KEY_O = 79;
constexpr int KEY_T = 84;
constexpr int KEY_V = 86;
constexpr int KEY_W = 87;
}   // namespace glfw_keys

namespace
{

struct NamedKey
{
    int         key;
    const char* name;
};

constexpr NamedKey NAMED_KEYS[] = {
    {glfw_keys::KEY_SPACE, "Space"},
    {glfw_keys::KEY_ESCAPE, "Escape"},
    {glfw_keys::KEY_ENTER, "Enter"},
    {glfw_keys::KEY_TAB, "Tab"},
    {glfw_keys::KEY_BACKSPACE, "Backspace"},
    {glfw_keys::KEY_INSERT, "Insert"},
    {glfw_keys::KEY_DELETE, "Delete"},
    {glfw_keys::KEY_RIGHT, "Right"},
    {glfw_keys::KEY_LEFT, "Left"},
    {glfw_keys::KEY_DOWN, "Down"},
    {glfw_keys::KEY_UP, "Up"},
    {glfw_keys::KEY_PAGE_UP, "PageUp"},
    {glfw_keys::KEY_PAGE_DOWN, "PageDown"},
    {glfw_keys::KEY_HOME, "Home"},
    {glfw_keys::KEY_END, "End"},
    {glfw_keys::KEY_MINUS, "-"},
    {glfw_keys::KEY_EQUAL, "="},
    {glfw_keys::KEY_LEFT_BRACKET, "["},
    {glfw_keys::KEY_RIGHT_BRACKET, "]"},
    {glfw_keys::KEY_SEMICOLON, ";"},
    {glfw_keys::KEY_APOSTROPHE, "'"},
    {glfw_keys::KEY_COMMA, ","},
    {glfw_keys::KEY_PERIOD, "."},
    {glfw_keys::KEY_SLASH, "/"},
    {glfw_keys::KEY_BACKSLASH, "\\"},
};

std::string to_lower(const std::string& s)
{
    std::string lower;
    lower.reserve(s.size());
    for (char c : s)
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return lower;
}

std::string key_to_string(int key)
{
    using namespace glfw_keys;
    if ((key >= KEY_A && key <= KEY_Z) || (key >= KEY_0 && key <= KEY_9))
        return std::string(1, static_cast<char>(key));
    if (key >= KEY_F1 && key <= KEY_F12)
        return "F" + std::to_string(key - KEY_F1 + 1);
    for (const auto& named : NAMED_KEYS)
    {
        if (named.key == key)
            return named.name;
    }
    return "Key" + std::to_string(key);
}

int string_to_key(const std::string& str)
{
    using namespace glfw_keys;
    if (str.size() == 1)
    {
        char c = static_cast<char>(std::toupper(static_cast<unsigned char>(str[0])));
        if ((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))
            return c;
    }

    std::string lower = to_lower(str);
    for (const auto& named : NAMED_KEYS)
    {
        if (to_lower(named.name) == lower)
            return named.key;
    }
    if (lower == "esc")
        return KEY_ESCAPE;
    if (lower == "return")
        return KEY_ENTER;
    if (lower == "del")
        return KEY_DELETE;

    if (lower.size() >= 2 && lower[0] == 'f')
    {
        int         n     = 0;
        const char* first = lower.data() + 1;
        const char* last  = lower.data() + lower.size();
        auto [ptr, ec]    = std::from_chars(first, last, n);
        if (ec == std::errc() && ptr == last && n >= 1 && n <= 12)
            return KEY_F1 + n - 1;
    }

    return 0;
}

}   // namespace

std::string Shortcut::to_string() const
{
    std::string result;
    if (has_mod(mods, KeyMod::Control))
        result += "Ctrl+";
    if (has_mod(mods, KeyMod::Shift))
        result += "Shift+";
    if (has_mod(mods, KeyMod::Alt))
        result += "Alt+";
    if (has_mod(mods, KeyMod::Super))
        result += "Super+";
    result += key_to_string(key);
    return result;
}

Shortcut Shortcut::from_string(const std::string& str)
{
    Shortcut                 s;
    std::istringstream       iss(str);
    std::string              token;
    std::vector<std::string> parts;

    // Split by '+'
    while (std::getline(iss, token, '+'))
    {
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.front())))
            token.erase(token.begin());
        while (!token.empty() && std::isspace(static_cast<unsigned char>(token.back())))
            token.pop_back();
        if (!token.empty())
            parts.push_back(token);
    }

    if (parts.empty())
        return s;

    // Last part is the key, everything before is modifiers
    for (size_t i = 0; i + 1 < parts.size(); ++i)
    {
        std::string lower = to_lower(parts[i]);
        if (lower == "ctrl" || lower == "control")
            s.mods = s.mods | KeyMod::Control;
        else if (lower == "shift")
            s.mods = s.mods | KeyMod::Shift;
        else if (lower == "alt")
            s.mods = s.mods | KeyMod::Alt;
        else if (lower == "super" || lower == "meta" || lower == "cmd")
            s.mods = s.mods | KeyMod::Super;
        else
            return {};   // unknown modifier
    }

    s.key = string_to_key(parts.back());
    if (!s.valid())
        s.mods = KeyMod::None;
    return s;
}

// ─── Keybindings ─────────────────────────────────────────────────────────────

void Keybindings::bind(Shortcut shortcut, WindowCommand command)
{
    if (!shortcut.valid())
        return;
    bindings_[shortcut] = command;
}

void Keybindings::unbind(const Shortcut& shortcut)
{
    bindings_.erase(shortcut);
}

void Keybindings::unbind_command(const WindowCommand& command)
{
    std::erase_if(bindings_, [&](const auto& pair) { return pair.second == command; });
}

std::optional<WindowCommand> Keybindings::command_for_shortcut(const Shortcut& shortcut) const
{
    auto it = bindings_.find(shortcut);
    if (it == bindings_.end())
        return std::nullopt;
    return it->second;
}

Shortcut Keybindings::shortcut_for_command(const WindowCommand& command) const
{
    for (const auto& [sc, cmd] : bindings_)
    {
        if (cmd == command)
            return sc;
    }
    return {};
}

std::vector<KeyBinding> Keybindings::all_bindings() const
{
    std::vector<KeyBinding> result;
    result.reserve(bindings_.size());
    for (const auto& [sc, cmd] : bindings_)
        result.push_back({sc, cmd});
    return result;
}

std::optional<WindowCommand> Keybindings::lookup(int key, int mods) const
{
    Shortcut sc;
    sc.key  = key;
    sc.mods = static_cast<KeyMod>(mods & 0x0F);   // Mask to our modifier bits
    return command_for_shortcut(sc);
}

void Keybindings::register_defaults()
{
    using namespace glfw_keys;
    const KeyMod ctrl_shift = KeyMod::Control | KeyMod::Shift;

    bind({KEY_T, ctrl_shift}, WindowCommand::dispatch(Action::NewTab));
    bind({KEY_N, ctrl_shift}, WindowCommand::dispatch(Action::NewWindow));
    bind({KEY_W, ctrl_shift}, WindowCommand::dispatch(Action::CloseSurface));
    bind({KEY_C, ctrl_shift}, WindowCommand::dispatch(Action::CopyToClipboard));
    bind({KEY_V, ctrl_shift}, WindowCommand::dispatch(Action::PasteFromClipboard));
    bind({KEY_O, ctrl_shift}, WindowCommand::dispatch(Action::SplitRight));
    bind({KEY_E, ctrl_shift}, WindowCommand::dispatch(Action::SplitDown));
    bind({KEY_I, ctrl_shift}, WindowCommand::dispatch(Action::ToggleInspector));

    bind({KEY_PAGE_DOWN, KeyMod::Control}, WindowCommand::of(WindowCommand::Kind::NextTab));
    bind({KEY_PAGE_UP, KeyMod::Control}, WindowCommand::of(WindowCommand::Kind::PreviousTab));

    // Alt+1..8 select a tab, Alt+9 the last one
    for (int i = 0; i < 8; ++i)
        bind({KEY_1 + i, KeyMod::Alt}, WindowCommand::goto_tab(static_cast<size_t>(i + 1)));
    bind({KEY_9, KeyMod::Alt}, WindowCommand::of(WindowCommand::Kind::LastTab));

    bind({KEY_F11, KeyMod::None}, WindowCommand::of(WindowCommand::Kind::ToggleFullscreen));
}

size_t Keybindings::apply_overrides(const std::vector<KeybindOverride>& overrides)
{
    size_t applied = 0;
    for (const auto& o : overrides)
    {
        Shortcut sc = Shortcut::from_string(o.shortcut);
        if (!sc.valid())
        {
            TERMDECK_LOG_WARN("keybinds", "Ignoring invalid shortcut \"{}\"", o.shortcut);
            continue;
        }

        if (o.command.empty())
        {
            unbind(sc);
            ++applied;
            continue;
        }

        auto cmd = WindowCommand::parse(o.command);
        if (!cmd)
        {
            TERMDECK_LOG_WARN("keybinds",
                              "Ignoring unknown command \"{}\" for {}",
                              o.command,
                              sc.to_string());
            continue;
        }
        bind(sc, *cmd);
        ++applied;
    }
    return applied;
}

}   // namespace termdeck
