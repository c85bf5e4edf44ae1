#pragma once

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <termdeck/config.hpp>
#include <unordered_map>
#include <vector>

#include "window/window_command.hpp"

namespace termdeck
{

// Modifier flags (matching GLFW modifier bits)
enum class KeyMod : uint8_t
{
    None    = 0,
    Shift   = 0x01,
    Control = 0x02,
    Alt     = 0x04,
    Super   = 0x08,
};

inline KeyMod operator|(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) | static_cast<uint8_t>(b));
}
inline KeyMod operator&(KeyMod a, KeyMod b)
{
    return static_cast<KeyMod>(static_cast<uint8_t>(a) & static_cast<uint8_t>(b));
}
inline bool has_mod(KeyMod mods, KeyMod flag)
{
    return (static_cast<uint8_t>(mods) & static_cast<uint8_t>(flag)) != 0;
}

// A keyboard shortcut: key + modifiers.
struct Shortcut
{
    int    key  = 0;   // GLFW key code
    KeyMod mods = KeyMod::None;

    bool operator==(const Shortcut& o) const { return key == o.key && mods == o.mods; }
    bool operator!=(const Shortcut& o) const { return !(*this == o); }

    // e.g. "Ctrl+Shift+T"
    std::string to_string() const;

    // Parse from human-readable string. Returns an invalid shortcut on failure.
    static Shortcut from_string(const std::string& str);

    bool valid() const { return key != 0; }
};

struct ShortcutHash
{
    size_t operator()(const Shortcut& s) const
    {
        return std::hash<int>()(s.key) ^ (std::hash<uint8_t>()(static_cast<uint8_t>(s.mods)) << 16);
    }
};

struct KeyBinding
{
    Shortcut      shortcut;
    WindowCommand command;
};

// Shortcut -> window command table shared by every window of the process.
class Keybindings
{
   public:
    Keybindings()  = default;
    ~Keybindings() = default;

    Keybindings(const Keybindings&)            = delete;
    Keybindings& operator=(const Keybindings&) = delete;

    // Replaces an existing binding for the same shortcut.
    void bind(Shortcut shortcut, WindowCommand command);
    void unbind(const Shortcut& shortcut);
    void unbind_command(const WindowCommand& command);

    std::optional<WindowCommand> command_for_shortcut(const Shortcut& shortcut) const;
    Shortcut                     shortcut_for_command(const WindowCommand& command) const;
    std::vector<KeyBinding>      all_bindings() const;

    // Resolve a key press; mods are GLFW modifier bits.
    std::optional<WindowCommand> lookup(int key, int mods) const;

    void register_defaults();

    // Layer config overrides on top of the current table. Entries with an
    // unparsable shortcut or command are skipped with a warning; an empty
    // command unbinds. Returns the number applied.
    size_t apply_overrides(const std::vector<KeybindOverride>& overrides);

    size_t count() const { return bindings_.size(); }
    void   clear() { bindings_.clear(); }

   private:
    std::unordered_map<Shortcut, WindowCommand, ShortcutHash> bindings_;
};

}   // namespace termdeck
