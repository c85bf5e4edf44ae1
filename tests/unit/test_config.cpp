#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <termdeck/config.hpp>

using namespace termdeck;

// ─── Defaults ────────────────────────────────────────────────────────────────

TEST(WindowConfigDefaults, MatchDocumentedValues)
{
    WindowConfig cfg;
    EXPECT_EQ(cfg.title, "termdeck");
    EXPECT_EQ(cfg.width, 1000);
    EXPECT_EQ(cfg.height, 600);
    EXPECT_TRUE(cfg.titlebar);
    EXPECT_FALSE(cfg.fullscreen);
    EXPECT_TRUE(cfg.decoration);
    EXPECT_EQ(cfg.tabs_location, TabsLocation::Top);
    EXPECT_TRUE(cfg.wide_tabs);
    EXPECT_EQ(cfg.toolbar_style, ToolbarStyle::Raised);
    EXPECT_TRUE(cfg.enhanced_chrome);
    EXPECT_FALSE(cfg.log_level.has_value());
    EXPECT_TRUE(cfg.keybinds.empty());
}

// ─── Enum names ──────────────────────────────────────────────────────────────

TEST(WindowConfigEnums, TabsLocationNames)
{
    EXPECT_EQ(parse_tabs_location("top"), TabsLocation::Top);
    EXPECT_EQ(parse_tabs_location("bottom"), TabsLocation::Bottom);
    EXPECT_EQ(parse_tabs_location("left"), TabsLocation::Left);
    EXPECT_EQ(parse_tabs_location("right"), TabsLocation::Right);
    EXPECT_FALSE(parse_tabs_location("middle").has_value());
    EXPECT_EQ(tabs_location_name(TabsLocation::Bottom), "bottom");
}

TEST(WindowConfigEnums, ToolbarStyleNames)
{
    EXPECT_EQ(parse_toolbar_style("flat"), ToolbarStyle::Flat);
    EXPECT_EQ(parse_toolbar_style("raised"), ToolbarStyle::Raised);
    EXPECT_EQ(parse_toolbar_style("raised-border"), ToolbarStyle::RaisedBorder);
    EXPECT_FALSE(parse_toolbar_style("raised_border").has_value());
    EXPECT_EQ(toolbar_style_name(ToolbarStyle::RaisedBorder), "raised-border");
}

// ─── Serialization ───────────────────────────────────────────────────────────

TEST(WindowConfigSerialize, ContainsVersion)
{
    std::string json = serialize_config(WindowConfig{});
    EXPECT_NE(json.find("\"version\": 1"), std::string::npos);
    EXPECT_NE(json.find("\"keybinds\""), std::string::npos);
}

TEST(WindowConfigSerialize, RoundTripNonDefaults)
{
    WindowConfig cfg;
    cfg.title           = "my \"deck\"";
    cfg.width           = 1280;
    cfg.height          = 720;
    cfg.titlebar        = false;
    cfg.fullscreen      = true;
    cfg.decoration      = false;
    cfg.tabs_location   = TabsLocation::Left;
    cfg.wide_tabs       = false;
    cfg.toolbar_style   = ToolbarStyle::RaisedBorder;
    cfg.enhanced_chrome = false;
    cfg.log_level       = LogLevel::Debug;
    cfg.keybinds        = {{"Ctrl+Shift+T", ""}, {"Alt+0", "goto_tab:10"}};

    WindowConfig loaded;
    ASSERT_TRUE(deserialize_config(serialize_config(cfg), loaded));
    EXPECT_EQ(loaded.title, cfg.title);
    EXPECT_EQ(loaded.width, 1280);
    EXPECT_EQ(loaded.height, 720);
    EXPECT_FALSE(loaded.titlebar);
    EXPECT_TRUE(loaded.fullscreen);
    EXPECT_FALSE(loaded.decoration);
    EXPECT_EQ(loaded.tabs_location, TabsLocation::Left);
    EXPECT_FALSE(loaded.wide_tabs);
    EXPECT_EQ(loaded.toolbar_style, ToolbarStyle::RaisedBorder);
    EXPECT_FALSE(loaded.enhanced_chrome);
    EXPECT_EQ(loaded.log_level, LogLevel::Debug);
    ASSERT_EQ(loaded.keybinds.size(), 2u);
    EXPECT_EQ(loaded.keybinds[0].shortcut, "Ctrl+Shift+T");
    EXPECT_EQ(loaded.keybinds[0].command, "");
    EXPECT_EQ(loaded.keybinds[1].command, "goto_tab:10");
}

// ─── Deserialization ─────────────────────────────────────────────────────────

TEST(WindowConfigDeserialize, EmptyInputRejected)
{
    WindowConfig cfg;
    EXPECT_FALSE(deserialize_config("", cfg));
}

TEST(WindowConfigDeserialize, FutureVersionRejected)
{
    WindowConfig cfg;
    cfg.title = "unchanged";
    EXPECT_FALSE(deserialize_config(R"({"version": 2, "title": "new"})", cfg));
    EXPECT_EQ(cfg.title, "unchanged");
}

TEST(WindowConfigDeserialize, MissingKeysKeepCurrentValues)
{
    WindowConfig cfg;
    cfg.width = 640;
    ASSERT_TRUE(deserialize_config(R"({"version": 1, "fullscreen": true})", cfg));
    EXPECT_TRUE(cfg.fullscreen);
    EXPECT_EQ(cfg.width, 640);
    EXPECT_EQ(cfg.title, "termdeck");
}

TEST(WindowConfigDeserialize, UnknownEnumValuesIgnored)
{
    WindowConfig cfg;
    ASSERT_TRUE(deserialize_config(
        R"({"tabs_location": "diagonal", "toolbar_style": "shiny", "log_level": "loud"})", cfg));
    EXPECT_EQ(cfg.tabs_location, TabsLocation::Top);
    EXPECT_EQ(cfg.toolbar_style, ToolbarStyle::Raised);
    EXPECT_FALSE(cfg.log_level.has_value());
}

TEST(WindowConfigDeserialize, NonPositiveSizeIgnored)
{
    WindowConfig cfg;
    ASSERT_TRUE(deserialize_config(R"({"width": 0, "height": -5})", cfg));
    EXPECT_EQ(cfg.width, 1000);
    EXPECT_EQ(cfg.height, 600);
}

TEST(WindowConfigDeserialize, KeybindKeysDoNotLeakIntoTopLevel)
{
    WindowConfig cfg;
    ASSERT_TRUE(deserialize_config(
        R"({"keybinds": [{"shortcut": "F5", "command": "reset"}], "title": "outer"})", cfg));
    EXPECT_EQ(cfg.title, "outer");
    ASSERT_EQ(cfg.keybinds.size(), 1u);
    EXPECT_EQ(cfg.keybinds[0].shortcut, "F5");
    EXPECT_EQ(cfg.keybinds[0].command, "reset");
}

TEST(WindowConfigDeserialize, KeybindWithoutShortcutDropped)
{
    WindowConfig cfg;
    ASSERT_TRUE(deserialize_config(R"({"keybinds": [{"command": "reset"}]})", cfg));
    EXPECT_TRUE(cfg.keybinds.empty());
}

TEST(WindowConfigDeserialize, BracketShortcutsRoundTrip)
{
    WindowConfig cfg;
    cfg.keybinds = {{"Ctrl+]", "next_tab"}, {"Ctrl+[", "previous_tab"}, {"Ctrl+T", "new_tab"}};
    cfg.title    = "after";

    WindowConfig loaded;
    ASSERT_TRUE(deserialize_config(serialize_config(cfg), loaded));
    ASSERT_EQ(loaded.keybinds.size(), 3u);
    EXPECT_EQ(loaded.keybinds[0].shortcut, "Ctrl+]");
    EXPECT_EQ(loaded.keybinds[0].command, "next_tab");
    EXPECT_EQ(loaded.keybinds[1].shortcut, "Ctrl+[");
    EXPECT_EQ(loaded.keybinds[2].command, "new_tab");
    EXPECT_EQ(loaded.title, "after");
}

TEST(WindowConfigDeserialize, BracesInsideKeybindStrings)
{
    WindowConfig cfg;
    ASSERT_TRUE(deserialize_config(
        R"({"keybinds": [{"shortcut": "Ctrl+}", "command": "reset"}, {"shortcut": "F5", "command": "reset"}]})",
        cfg));
    ASSERT_EQ(cfg.keybinds.size(), 2u);
    EXPECT_EQ(cfg.keybinds[0].shortcut, "Ctrl+}");
    EXPECT_EQ(cfg.keybinds[1].shortcut, "F5");
}

TEST(WindowConfigDeserialize, TitleEqualToKeyNameRoundTrip)
{
    WindowConfig cfg;
    cfg.title      = "fullscreen";
    cfg.fullscreen = true;
    cfg.decoration = false;

    WindowConfig loaded;
    ASSERT_TRUE(deserialize_config(serialize_config(cfg), loaded));
    EXPECT_EQ(loaded.title, "fullscreen");
    EXPECT_TRUE(loaded.fullscreen);
    EXPECT_FALSE(loaded.decoration);
}

TEST(WindowConfigDeserialize, StringValueIsNeverReadAsKey)
{
    WindowConfig cfg;
    ASSERT_TRUE(deserialize_config(R"({"title": "decoration", "decoration": false})", cfg));
    EXPECT_EQ(cfg.title, "decoration");
    EXPECT_FALSE(cfg.decoration);
}

TEST(WindowConfigDeserialize, OutOfRangeSizeIgnored)
{
    WindowConfig cfg;
    ASSERT_TRUE(deserialize_config(R"({"width": 99999999999, "height": 720})", cfg));
    EXPECT_EQ(cfg.width, 1000);
    EXPECT_EQ(cfg.height, 720);
}

// ─── File I/O ────────────────────────────────────────────────────────────────

class WindowConfigFileTest : public ::testing::Test
{
   protected:
    void SetUp() override
    {
        dir_ = std::filesystem::temp_directory_path() / "termdeck_config_test";
        std::filesystem::remove_all(dir_);
    }

    void TearDown() override { std::filesystem::remove_all(dir_); }

    std::filesystem::path dir_;
};

TEST_F(WindowConfigFileTest, SaveCreatesDirectoriesAndLoads)
{
    auto path = (dir_ / "nested" / "window.json").string();

    WindowConfig cfg;
    cfg.title = "saved";
    ASSERT_TRUE(save_config(path, cfg));
    EXPECT_TRUE(std::filesystem::exists(path));

    WindowConfig loaded;
    ASSERT_TRUE(load_config(path, loaded));
    EXPECT_EQ(loaded.title, "saved");
}

TEST_F(WindowConfigFileTest, LoadMissingFileKeepsDefaults)
{
    WindowConfig cfg;
    EXPECT_FALSE(load_config((dir_ / "absent.json").string(), cfg));
    EXPECT_EQ(cfg.title, "termdeck");
}

TEST_F(WindowConfigFileTest, LoadMalformedFileFails)
{
    std::filesystem::create_directories(dir_);
    auto path = (dir_ / "empty.json").string();
    {
        std::ofstream f(path);
    }
    WindowConfig cfg;
    EXPECT_FALSE(load_config(path, cfg));
}

TEST(WindowConfigPath, UsesXdgConfigHome)
{
    const char* old = std::getenv("XDG_CONFIG_HOME");
    std::string saved = old ? old : "";

    setenv("XDG_CONFIG_HOME", "/tmp/xdg", 1);
    EXPECT_EQ(default_config_path(), "/tmp/xdg/termdeck/window.json");

    if (old)
        setenv("XDG_CONFIG_HOME", saved.c_str(), 1);
    else
        unsetenv("XDG_CONFIG_HOME");
}
