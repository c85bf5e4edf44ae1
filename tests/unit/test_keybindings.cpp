#include <gtest/gtest.h>

#include "input/keybindings.hpp"

using namespace termdeck;

// GLFW key codes
constexpr int KEY_T         = 84;
constexpr int KEY_1         = 49;
constexpr int KEY_8         = 56;
constexpr int KEY_9         = 57;
constexpr int KEY_PAGE_DOWN = 267;
constexpr int KEY_ESCAPE    = 256;
constexpr int KEY_F5        = 294;
constexpr int KEY_F11       = 300;
constexpr int KEY_F12       = 301;

// ─── Shortcut parsing ────────────────────────────────────────────────────────

TEST(ShortcutParse, ModifiersAndKey)
{
    Shortcut s = Shortcut::from_string("Ctrl+Shift+T");
    EXPECT_EQ(s.key, KEY_T);
    EXPECT_EQ(s.mods, KeyMod::Control | KeyMod::Shift);
    EXPECT_TRUE(s.valid());
}

TEST(ShortcutParse, CaseAndWhitespaceInsensitive)
{
    Shortcut s = Shortcut::from_string(" ctrl + shift + t ");
    EXPECT_EQ(s, Shortcut::from_string("Ctrl+Shift+T"));
}

TEST(ShortcutParse, NamedKeysAndAliases)
{
    EXPECT_EQ(Shortcut::from_string("PageDown").key, KEY_PAGE_DOWN);
    EXPECT_EQ(Shortcut::from_string("Esc").key, KEY_ESCAPE);
    EXPECT_EQ(Shortcut::from_string("F5").key, KEY_F5);
}

TEST(ShortcutParse, UnknownModifierInvalid)
{
    EXPECT_FALSE(Shortcut::from_string("Hyper+T").valid());
}

TEST(ShortcutParse, UnknownKeyInvalid)
{
    Shortcut s = Shortcut::from_string("Ctrl+Banana");
    EXPECT_FALSE(s.valid());
    EXPECT_EQ(s.mods, KeyMod::None);
}

TEST(ShortcutParse, FunctionKeyNeedsWholeNumber)
{
    EXPECT_EQ(Shortcut::from_string("F12").key, KEY_F12);
    EXPECT_FALSE(Shortcut::from_string("F1abc").valid());
    EXPECT_FALSE(Shortcut::from_string("F13").valid());
}

TEST(ShortcutParse, EmptyInvalid)
{
    EXPECT_FALSE(Shortcut::from_string("").valid());
    EXPECT_FALSE(Shortcut::from_string("+").valid());
}

TEST(ShortcutFormat, CanonicalOrder)
{
    Shortcut s{KEY_T, KeyMod::Shift | KeyMod::Control};
    EXPECT_EQ(s.to_string(), "Ctrl+Shift+T");
    EXPECT_EQ((Shortcut{KEY_F11, KeyMod::None}).to_string(), "F11");
    EXPECT_EQ((Shortcut{KEY_PAGE_DOWN, KeyMod::Control}).to_string(), "Ctrl+PageDown");
}

// ─── Binding table ───────────────────────────────────────────────────────────

TEST(KeybindingsTable, BindAndLookup)
{
    Keybindings kb;
    kb.bind({KEY_F5, KeyMod::None}, WindowCommand::dispatch(Action::Reset));
    auto cmd = kb.lookup(KEY_F5, 0);
    ASSERT_TRUE(cmd.has_value());
    EXPECT_EQ(*cmd, WindowCommand::dispatch(Action::Reset));
}

TEST(KeybindingsTable, LookupIgnoresLockModifiers)
{
    Keybindings kb;
    kb.bind({KEY_F5, KeyMod::Control}, WindowCommand::dispatch(Action::Reset));
    // 0x10 = caps lock, 0x20 = num lock
    EXPECT_TRUE(kb.lookup(KEY_F5, 0x02 | 0x10 | 0x20).has_value());
}

TEST(KeybindingsTable, InvalidShortcutNotBound)
{
    Keybindings kb;
    kb.bind({}, WindowCommand::dispatch(Action::Reset));
    EXPECT_EQ(kb.count(), 0u);
}

TEST(KeybindingsTable, RebindReplaces)
{
    Keybindings kb;
    kb.bind({KEY_F5, KeyMod::None}, WindowCommand::dispatch(Action::Reset));
    kb.bind({KEY_F5, KeyMod::None}, WindowCommand::of(WindowCommand::Kind::LastTab));
    EXPECT_EQ(kb.count(), 1u);
    EXPECT_EQ(*kb.lookup(KEY_F5, 0), WindowCommand::of(WindowCommand::Kind::LastTab));
}

TEST(KeybindingsTable, UnbindCommandRemovesAllShortcuts)
{
    Keybindings kb;
    kb.bind({KEY_F5, KeyMod::None}, WindowCommand::dispatch(Action::Reset));
    kb.bind({KEY_F11, KeyMod::None}, WindowCommand::dispatch(Action::Reset));
    kb.unbind_command(WindowCommand::dispatch(Action::Reset));
    EXPECT_EQ(kb.count(), 0u);
}

TEST(KeybindingsTable, ShortcutForCommand)
{
    Keybindings kb;
    kb.bind({KEY_F5, KeyMod::Alt}, WindowCommand::dispatch(Action::Reset));
    EXPECT_EQ(kb.shortcut_for_command(WindowCommand::dispatch(Action::Reset)),
              (Shortcut{KEY_F5, KeyMod::Alt}));
    EXPECT_FALSE(kb.shortcut_for_command(WindowCommand::dispatch(Action::NewTab)).valid());
}

// ─── Defaults ────────────────────────────────────────────────────────────────

TEST(KeybindingsDefaults, CoverActionsAndNavigation)
{
    Keybindings kb;
    kb.register_defaults();

    EXPECT_EQ(*kb.lookup(KEY_T, 0x03), WindowCommand::dispatch(Action::NewTab));
    EXPECT_EQ(*kb.lookup(KEY_PAGE_DOWN, 0x02), WindowCommand::of(WindowCommand::Kind::NextTab));
    EXPECT_EQ(*kb.lookup(KEY_1, 0x04), WindowCommand::goto_tab(1));
    EXPECT_EQ(*kb.lookup(KEY_8, 0x04), WindowCommand::goto_tab(8));
    EXPECT_EQ(*kb.lookup(KEY_9, 0x04), WindowCommand::of(WindowCommand::Kind::LastTab));
    EXPECT_EQ(*kb.lookup(KEY_F11, 0), WindowCommand::of(WindowCommand::Kind::ToggleFullscreen));

    for (Action action : ALL_ACTIONS)
    {
        if (action == Action::Reset)
            continue;
        EXPECT_TRUE(kb.shortcut_for_command(WindowCommand::dispatch(action)).valid())
            << action_name(action);
    }
}

// ─── Overrides ───────────────────────────────────────────────────────────────

TEST(KeybindingsOverrides, ApplyBindUnbindAndSkipInvalid)
{
    Keybindings kb;
    kb.register_defaults();
    const size_t before = kb.count();

    size_t applied = kb.apply_overrides({
        {"F5", "reset"},
        {"Ctrl+Shift+T", ""},
        {"Hyper+X", "reset"},
        {"F6", "frobnicate"},
    });

    EXPECT_EQ(applied, 2u);
    EXPECT_EQ(kb.count(), before);   // one added, one removed
    EXPECT_EQ(*kb.lookup(KEY_F5, 0), WindowCommand::dispatch(Action::Reset));
    EXPECT_FALSE(kb.lookup(KEY_T, 0x03).has_value());
}

TEST(KeybindingsOverrides, OverrideReplacesDefault)
{
    Keybindings kb;
    kb.register_defaults();
    kb.apply_overrides({{"F11", "toggle_window_decorations"}});
    EXPECT_EQ(*kb.lookup(KEY_F11, 0), WindowCommand::of(WindowCommand::Kind::ToggleDecorations));
}
