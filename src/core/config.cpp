#include <cctype>
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <termdeck/config.hpp>
#include <termdeck/logger.hpp>

namespace termdeck
{

static constexpr int CONFIG_VERSION = 1;

// ─── Enum names ──────────────────────────────────────────────────────────────

std::string_view tabs_location_name(TabsLocation location)
{
    switch (location)
    {
        case TabsLocation::Top:
            return "top";
        case TabsLocation::Bottom:
            return "bottom";
        case TabsLocation::Left:
            return "left";
        case TabsLocation::Right:
            return "right";
    }
    return "top";
}

std::optional<TabsLocation> parse_tabs_location(std::string_view name)
{
    if (name == "top")
        return TabsLocation::Top;
    if (name == "bottom")
        return TabsLocation::Bottom;
    if (name == "left")
        return TabsLocation::Left;
    if (name == "right")
        return TabsLocation::Right;
    return std::nullopt;
}

std::string_view toolbar_style_name(ToolbarStyle style)
{
    switch (style)
    {
        case ToolbarStyle::Flat:
            return "flat";
        case ToolbarStyle::Raised:
            return "raised";
        case ToolbarStyle::RaisedBorder:
            return "raised-border";
    }
    return "raised";
}

std::optional<ToolbarStyle> parse_toolbar_style(std::string_view name)
{
    if (name == "flat")
        return ToolbarStyle::Flat;
    if (name == "raised")
        return ToolbarStyle::Raised;
    if (name == "raised-border")
        return ToolbarStyle::RaisedBorder;
    return std::nullopt;
}

// ─── JSON writing ────────────────────────────────────────────────────────────

static std::string escape_json(const std::string& s)
{
    std::string out;
    out.reserve(s.size() + 8);
    for (char c : s)
    {
        switch (c)
        {
            case '"':
                out += "\\\"";
                break;
            case '\\':
                out += "\\\\";
                break;
            case '\n':
                out += "\\n";
                break;
            case '\r':
                out += "\\r";
                break;
            case '\t':
                out += "\\t";
                break;
            default:
                out += c;
                break;
        }
    }
    return out;
}

static const char* bool_str(bool v)
{
    return v ? "true" : "false";
}

std::string serialize_config(const WindowConfig& config)
{
    std::ostringstream os;
    os << "{\n";
    os << "  \"version\": " << CONFIG_VERSION << ",\n";
    os << "  \"title\": \"" << escape_json(config.title) << "\",\n";
    os << "  \"width\": " << config.width << ",\n";
    os << "  \"height\": " << config.height << ",\n";
    os << "  \"titlebar\": " << bool_str(config.titlebar) << ",\n";
    os << "  \"fullscreen\": " << bool_str(config.fullscreen) << ",\n";
    os << "  \"decoration\": " << bool_str(config.decoration) << ",\n";
    os << "  \"tabs_location\": \"" << tabs_location_name(config.tabs_location) << "\",\n";
    os << "  \"wide_tabs\": " << bool_str(config.wide_tabs) << ",\n";
    os << "  \"toolbar_style\": \"" << toolbar_style_name(config.toolbar_style) << "\",\n";
    os << "  \"enhanced_chrome\": " << bool_str(config.enhanced_chrome) << ",\n";
    if (config.log_level)
    {
        std::string level = Logger::level_to_string(*config.log_level);
        for (auto& c : level)
            c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        os << "  \"log_level\": \"" << level << "\",\n";
    }
    os << "  \"keybinds\": [\n";
    for (size_t i = 0; i < config.keybinds.size(); ++i)
    {
        const auto& kb = config.keybinds[i];
        os << "    { \"shortcut\": \"" << escape_json(kb.shortcut) << "\", \"command\": \""
           << escape_json(kb.command) << "\" }";
        if (i + 1 < config.keybinds.size())
            os << ",";
        os << "\n";
    }
    os << "  ]\n";
    os << "}\n";
    return os.str();
}

// ─── JSON reading ────────────────────────────────────────────────────────────
// Minimal reader for the flat format written above; not a general JSON parser.

// Index of the quote closing the string that opens at `open`, or npos.
static size_t string_end(const std::string& json, size_t open)
{
    for (size_t i = open + 1; i < json.size(); ++i)
    {
        if (json[i] == '\\')
            ++i;
        else if (json[i] == '"')
            return i;
    }
    return std::string::npos;
}

// Position just past the ':' following "key", or npos. Only strings in key
// position match; a string value equal to a key name is skipped.
static size_t find_value(const std::string& json, const std::string& key)
{
    for (size_t i = 0; i < json.size(); ++i)
    {
        if (json[i] != '"')
            continue;
        size_t end = string_end(json, i);
        if (end == std::string::npos)
            return std::string::npos;
        size_t next = json.find_first_not_of(" \t\r\n", end + 1);
        if (next != std::string::npos && json[next] == ':'
            && json.compare(i + 1, end - i - 1, key) == 0)
            return next + 1;
        i = end;
    }
    return std::string::npos;
}

static std::optional<std::string> read_json_string(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find_first_not_of(" \t\r\n", pos);
    if (pos == std::string::npos || json[pos] != '"')
        return std::nullopt;

    std::string out;
    for (size_t i = pos + 1; i < json.size(); ++i)
    {
        char c = json[i];
        if (c == '"')
            return out;
        if (c == '\\' && i + 1 < json.size())
        {
            char e = json[++i];
            switch (e)
            {
                case 'n':
                    out += '\n';
                    break;
                case 'r':
                    out += '\r';
                    break;
                case 't':
                    out += '\t';
                    break;
                default:
                    out += e;
                    break;
            }
            continue;
        }
        out += c;
    }
    return std::nullopt;   // unterminated
}

static std::optional<bool> read_json_bool(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find_first_not_of(" \t\r\n", pos);
    if (pos == std::string::npos)
        return std::nullopt;
    if (json.compare(pos, 4, "true") == 0)
        return true;
    if (json.compare(pos, 5, "false") == 0)
        return false;
    return std::nullopt;
}

static std::optional<int> read_json_int(const std::string& json, const std::string& key)
{
    auto pos = find_value(json, key);
    if (pos == std::string::npos)
        return std::nullopt;
    pos = json.find_first_not_of(" \t\r\n", pos);
    if (pos == std::string::npos)
        return std::nullopt;
    int         value = 0;
    const char* begin = json.data() + pos;
    auto [ptr, ec]    = std::from_chars(begin, json.data() + json.size(), value);
    if (ec != std::errc() || ptr == begin)
        return std::nullopt;
    return value;
}

// Locates the [ ... ] of the "keybinds" array. Returns false if absent.
static bool find_keybind_array(const std::string& json, size_t& open, size_t& close)
{
    auto pos = find_value(json, "keybinds");
    if (pos == std::string::npos)
        return false;
    open = json.find('[', pos);
    if (open == std::string::npos)
        return false;
    int depth = 0;
    for (size_t i = open; i < json.size(); ++i)
    {
        if (json[i] == '"')
        {
            i = string_end(json, i);
            if (i == std::string::npos)
                return false;
        }
        else if (json[i] == '[')
            ++depth;
        else if (json[i] == ']' && --depth == 0)
        {
            close = i;
            return true;
        }
    }
    return false;
}

static std::vector<std::string> split_objects(const std::string& array)
{
    std::vector<std::string> objects;
    int                      depth     = 0;
    size_t                   obj_start = 0;
    for (size_t i = 0; i < array.size(); ++i)
    {
        if (array[i] == '"')
        {
            i = string_end(array, i);
            if (i == std::string::npos)
                break;
        }
        else if (array[i] == '{')
        {
            if (depth == 0)
                obj_start = i;
            ++depth;
        }
        else if (array[i] == '}' && depth > 0)
        {
            if (--depth == 0)
                objects.push_back(array.substr(obj_start, i - obj_start + 1));
        }
    }
    return objects;
}

bool deserialize_config(const std::string& json, WindowConfig& config)
{
    if (json.empty())
        return false;

    // Keybind objects carry their own keys; scan top-level keys without them.
    std::string top = json;
    size_t      open = 0, close = 0;
    bool        has_keybinds = find_keybind_array(json, open, close);
    if (has_keybinds)
        top.erase(open, close - open + 1);

    if (auto version = read_json_int(top, "version"); version && *version > CONFIG_VERSION)
    {
        TERMDECK_LOG_WARN("config", "Unsupported config version {}", *version);
        return false;
    }

    if (auto v = read_json_string(top, "title"))
        config.title = *v;
    if (auto v = read_json_int(top, "width"); v && *v > 0)
        config.width = *v;
    if (auto v = read_json_int(top, "height"); v && *v > 0)
        config.height = *v;
    if (auto v = read_json_bool(top, "titlebar"))
        config.titlebar = *v;
    if (auto v = read_json_bool(top, "fullscreen"))
        config.fullscreen = *v;
    if (auto v = read_json_bool(top, "decoration"))
        config.decoration = *v;
    if (auto v = read_json_bool(top, "wide_tabs"))
        config.wide_tabs = *v;
    if (auto v = read_json_bool(top, "enhanced_chrome"))
        config.enhanced_chrome = *v;

    if (auto v = read_json_string(top, "tabs_location"))
    {
        if (auto loc = parse_tabs_location(*v))
            config.tabs_location = *loc;
        else
            TERMDECK_LOG_WARN("config", "Ignoring unknown tabs_location \"{}\"", *v);
    }
    if (auto v = read_json_string(top, "toolbar_style"))
    {
        if (auto style = parse_toolbar_style(*v))
            config.toolbar_style = *style;
        else
            TERMDECK_LOG_WARN("config", "Ignoring unknown toolbar_style \"{}\"", *v);
    }
    if (auto v = read_json_string(top, "log_level"))
    {
        if (auto level = parse_log_level(*v))
            config.log_level = *level;
        else
            TERMDECK_LOG_WARN("config", "Ignoring unknown log_level \"{}\"", *v);
    }

    if (has_keybinds)
    {
        config.keybinds.clear();
        for (const auto& obj : split_objects(json.substr(open + 1, close - open - 1)))
        {
            KeybindOverride kb;
            kb.shortcut = read_json_string(obj, "shortcut").value_or("");
            kb.command  = read_json_string(obj, "command").value_or("");
            if (!kb.shortcut.empty())
                config.keybinds.push_back(std::move(kb));
        }
    }

    return true;
}

// ─── File I/O ────────────────────────────────────────────────────────────────

bool load_config(const std::string& path, WindowConfig& config)
{
    std::ifstream f(path);
    if (!f.is_open())
    {
        TERMDECK_LOG_DEBUG("config", "No config at {}", path);
        return false;
    }
    std::string json((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (!deserialize_config(json, config))
    {
        TERMDECK_LOG_WARN("config", "Failed to parse {}, keeping defaults", path);
        return false;
    }
    TERMDECK_LOG_INFO("config", "Loaded {}", path);
    return true;
}

bool save_config(const std::string& path, const WindowConfig& config)
{
    auto dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            TERMDECK_LOG_WARN("config", "Cannot create {}: {}", dir.string(), ec.message());
            return false;
        }
    }

    std::ofstream f(path);
    if (!f.is_open())
        return false;
    f << serialize_config(config);
    return f.good();
}

std::string default_config_path()
{
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
        base = xdg;
    else if (const char* home = std::getenv("HOME"))
        base = std::filesystem::path(home) / ".config";
    else
        return "window.json";

    return (base / "termdeck" / "window.json").string();
}

}   // namespace termdeck
