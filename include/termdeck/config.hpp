#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <termdeck/logger.hpp>
#include <vector>

namespace termdeck
{

enum class TabsLocation
{
    Top,
    Bottom,
    Left,
    Right,
};

enum class ToolbarStyle
{
    Flat,
    Raised,
    RaisedBorder,
};

std::string_view            tabs_location_name(TabsLocation location);
std::optional<TabsLocation> parse_tabs_location(std::string_view name);
std::string_view            toolbar_style_name(ToolbarStyle style);
std::optional<ToolbarStyle> parse_toolbar_style(std::string_view name);

// Keybinding override as written in the config file.
// An empty command unbinds the shortcut.
struct KeybindOverride
{
    std::string shortcut;   // e.g. "Ctrl+Shift+T"
    std::string command;    // e.g. "new_tab", "goto_tab:3", ""
};

// Window-level options, read once when a window is created.
struct WindowConfig
{
    std::string  title           = "termdeck";
    int          width           = 1000;
    int          height          = 600;
    bool         titlebar        = true;
    bool         fullscreen      = false;
    bool         decoration      = true;
    TabsLocation tabs_location   = TabsLocation::Top;
    bool         wide_tabs       = true;
    ToolbarStyle toolbar_style   = ToolbarStyle::Raised;
    bool         enhanced_chrome = true;

    std::optional<LogLevel>      log_level;
    std::vector<KeybindOverride> keybinds;
};

// Serialize to the versioned JSON format.
std::string serialize_config(const WindowConfig& config);

// Parse JSON into config. Keys absent from the document keep their current
// values. Returns false on empty input or a newer format version.
bool deserialize_config(const std::string& json, WindowConfig& config);

bool load_config(const std::string& path, WindowConfig& config);
bool save_config(const std::string& path, const WindowConfig& config);

// $XDG_CONFIG_HOME/termdeck/window.json, falling back to ~/.config.
std::string default_config_path();

}   // namespace termdeck
