#include <gtest/gtest.h>

#include "window/window_command.hpp"
#include "window/window_event.hpp"

using namespace termdeck;

// ─── Parsing ─────────────────────────────────────────────────────────────────

TEST(WindowCommandParse, ActionNamesBecomeDispatch)
{
    for (Action action : ALL_ACTIONS)
    {
        auto cmd = WindowCommand::parse(action_name(action));
        ASSERT_TRUE(cmd.has_value()) << action_name(action);
        EXPECT_EQ(cmd->kind, WindowCommand::Kind::Dispatch);
        EXPECT_EQ(cmd->action, action);
    }
}

TEST(WindowCommandParse, WindowLevelCommands)
{
    using Kind = WindowCommand::Kind;
    EXPECT_EQ(WindowCommand::parse("next_tab"), WindowCommand::of(Kind::NextTab));
    EXPECT_EQ(WindowCommand::parse("previous_tab"), WindowCommand::of(Kind::PreviousTab));
    EXPECT_EQ(WindowCommand::parse("last_tab"), WindowCommand::of(Kind::LastTab));
    EXPECT_EQ(WindowCommand::parse("toggle_fullscreen"), WindowCommand::of(Kind::ToggleFullscreen));
    EXPECT_EQ(WindowCommand::parse("toggle_window_decorations"),
              WindowCommand::of(Kind::ToggleDecorations));
    EXPECT_EQ(WindowCommand::parse("close_window"), WindowCommand::of(Kind::CloseWindow));
}

TEST(WindowCommandParse, GotoTab)
{
    EXPECT_EQ(WindowCommand::parse("goto_tab:3"), WindowCommand::goto_tab(3));
    EXPECT_EQ(WindowCommand::parse("goto_tab:0"), WindowCommand::goto_tab(0));
    EXPECT_FALSE(WindowCommand::parse("goto_tab:").has_value());
    EXPECT_FALSE(WindowCommand::parse("goto_tab:x").has_value());
    EXPECT_FALSE(WindowCommand::parse("goto_tab:-1").has_value());
    EXPECT_FALSE(WindowCommand::parse("goto_tab:2a").has_value());
}

TEST(WindowCommandParse, UnknownRejected)
{
    EXPECT_FALSE(WindowCommand::parse("").has_value());
    EXPECT_FALSE(WindowCommand::parse("quit").has_value());
}

TEST(WindowCommandFormat, ToStringParsesBack)
{
    const WindowCommand commands[] = {
        WindowCommand::dispatch(Action::SplitRight),
        WindowCommand::goto_tab(7),
        WindowCommand::of(WindowCommand::Kind::CloseWindow),
    };
    for (const auto& cmd : commands)
        EXPECT_EQ(WindowCommand::parse(cmd.to_string()), cmd) << cmd.to_string();
}

// ─── Events ──────────────────────────────────────────────────────────────────

TEST(WindowEventName, NamesEachAlternative)
{
    EXPECT_EQ(event_name(events::CloseRequested{}), "close_requested");
    EXPECT_EQ(event_name(events::KeyPressed{}), "key_pressed");
    EXPECT_EQ(event_name(events::ActionInvoked{Action::Reset}), "action_invoked");
}
