#include <gtest/gtest.h>
#include <iterator>
#include <string>
#include <vector>

#include "util/fake_terminal.hpp"
#include "window/action_dispatcher.hpp"

namespace termdeck
{

class ActionDispatcherTest : public ::testing::Test
{
   protected:
    ActionDispatcher  dispatcher_;
    test::FakeSurface surface_{nullptr};
};

// ─── Action names ─────────────────────────────────────────────────────────────

TEST(ActionNames, RoundTripClosedSet)
{
    const char* names[] = {"new_tab",
                           "new_window",
                           "close_surface",
                           "split_right",
                           "split_down",
                           "toggle_inspector",
                           "copy_to_clipboard",
                           "paste_from_clipboard",
                           "reset"};
    ASSERT_EQ(std::size(names), ALL_ACTIONS.size());
    for (size_t i = 0; i < ALL_ACTIONS.size(); ++i)
    {
        EXPECT_EQ(action_name(ALL_ACTIONS[i]), names[i]);
        auto parsed = parse_action(names[i]);
        ASSERT_TRUE(parsed.has_value()) << names[i];
        EXPECT_EQ(*parsed, ALL_ACTIONS[i]);
    }
}

TEST(ActionNames, UnknownIdentifiers)
{
    EXPECT_FALSE(parse_action("").has_value());
    EXPECT_FALSE(parse_action("New_Tab").has_value());
    EXPECT_FALSE(parse_action("quit").has_value());
}

// ─── Dispatch ─────────────────────────────────────────────────────────────────

TEST_F(ActionDispatcherTest, NoSurfaceIsNoOpForEveryAction)
{
    for (Action action : ALL_ACTIONS)
        EXPECT_EQ(dispatcher_.dispatch(nullptr, action), ActionResult::NoSurface);
}

TEST_F(ActionDispatcherTest, ForwardsToSurface)
{
    EXPECT_EQ(dispatcher_.dispatch(&surface_, Action::SplitDown), ActionResult::Performed);
    EXPECT_EQ(dispatcher_.dispatch(&surface_, Action::ToggleInspector), ActionResult::Performed);
    EXPECT_EQ(surface_.performed,
              (std::vector<Action>{Action::SplitDown, Action::ToggleInspector}));
}

TEST_F(ActionDispatcherTest, DispatchByIdentifier)
{
    EXPECT_EQ(dispatcher_.dispatch(&surface_, "close_surface"), ActionResult::Performed);
    ASSERT_EQ(surface_.performed.size(), 1u);
    EXPECT_EQ(surface_.performed[0], Action::CloseSurface);
}

TEST_F(ActionDispatcherTest, UnknownIdentifierIsReported)
{
    EXPECT_EQ(dispatcher_.dispatch(&surface_, "explode"), ActionResult::Unknown);
    EXPECT_TRUE(surface_.performed.empty());
}

TEST_F(ActionDispatcherTest, EngineFailureIsRejectedNotThrown)
{
    surface_.fail_actions = true;
    ActionResult result   = ActionResult::Performed;
    EXPECT_NO_THROW(result = dispatcher_.dispatch(&surface_, Action::Reset));
    EXPECT_EQ(result, ActionResult::Rejected);
}

// ─── Acknowledgment ───────────────────────────────────────────────────────────

TEST_F(ActionDispatcherTest, CopyAcknowledgedWhenNotifierInstalled)
{
    std::vector<std::string> shown;
    dispatcher_.set_notify_callback([&](const std::string& text) { shown.push_back(text); });
    EXPECT_TRUE(dispatcher_.has_notify_callback());

    dispatcher_.dispatch(&surface_, Action::CopyToClipboard);
    dispatcher_.dispatch(&surface_, Action::PasteFromClipboard);
    EXPECT_EQ(shown, (std::vector<std::string>{"Copied to clipboard"}));
}

TEST_F(ActionDispatcherTest, FailedCopyIsNotAcknowledged)
{
    std::vector<std::string> shown;
    dispatcher_.set_notify_callback([&](const std::string& text) { shown.push_back(text); });
    surface_.fail_actions = true;
    dispatcher_.dispatch(&surface_, Action::CopyToClipboard);
    EXPECT_TRUE(shown.empty());
}

TEST_F(ActionDispatcherTest, CopyWithoutNotifierStillPerforms)
{
    EXPECT_FALSE(dispatcher_.has_notify_callback());
    EXPECT_EQ(dispatcher_.dispatch(&surface_, Action::CopyToClipboard), ActionResult::Performed);
}

TEST(ActionAcknowledgment, OnlyCopyHasText)
{
    for (Action action : ALL_ACTIONS)
    {
        if (action == Action::CopyToClipboard)
            EXPECT_EQ(ActionDispatcher::acknowledgment(action), "Copied to clipboard");
        else
            EXPECT_TRUE(ActionDispatcher::acknowledgment(action).empty());
    }
}

}   // namespace termdeck
