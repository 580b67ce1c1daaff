#include "create_device_form.hpp"
#include "fakes/test_helpers.hpp"
#include "navigation.hpp"
#include <gtest/gtest.h>

namespace emu {
namespace {

using testing::make_devices;

KeyEvent key(const Key k) { return KeyEvent::special(k); }
KeyEvent ch(const char c) { return KeyEvent::character(c); }

bool has_action(const std::vector<Action>& actions, const ActionType type) {
    for (const auto& action : actions) {
        if (action.type == type) return true;
    }
    return false;
}

class NavigationTest : public ::testing::Test {
protected:
    void SetUp() override {
        state.update_device_list(Platform::Android, make_devices(Platform::Android, {"a", "b", "c"}));
        state.update_device_list(Platform::Ios, make_devices(Platform::Ios, {"x", "y"}));
    }

    AppState state;
    Navigator navigator;
};

TEST_F(NavigationTest, DownPastTheEndWrapsToTop) {
    navigator.handle_key(state, key(Key::Down));
    navigator.handle_key(state, key(Key::Down));
    EXPECT_EQ(state.selected_tag()->identifier, "c");

    const auto actions = navigator.handle_key(state, key(Key::Down));
    EXPECT_EQ(state.selected_tag()->identifier, "a");
    EXPECT_TRUE(has_action(actions, ActionType::SelectionChanged));
}

TEST_F(NavigationTest, VimKeysMoveSelection) {
    navigator.handle_key(state, ch('k'));
    EXPECT_EQ(state.selected_index(Platform::Android), 2u);
    navigator.handle_key(state, ch('j'));
    EXPECT_EQ(state.selected_index(Platform::Android), 0u);
    navigator.handle_key(state, ch('G'));
    EXPECT_EQ(state.selected_index(Platform::Android), 2u);
    navigator.handle_key(state, ch('g'));
    EXPECT_EQ(state.selected_index(Platform::Android), 0u);
}

TEST_F(NavigationTest, PageKeysMoveByPageSize) {
    navigator.set_page_size(2);
    navigator.handle_key(state, key(Key::PageDown));
    EXPECT_EQ(state.selected_index(Platform::Android), 2u);
    navigator.handle_key(state, key(Key::PageUp));
    EXPECT_EQ(state.selected_index(Platform::Android), 0u);
}

TEST_F(NavigationTest, ListStepOnlyInBrowsing) {
    EXPECT_EQ(navigator.list_step(Mode::Browsing, key(Key::Up)), -1);
    EXPECT_EQ(navigator.list_step(Mode::Browsing, ch('j')), 1);
    EXPECT_FALSE(navigator.list_step(Mode::Browsing, key(Key::PageDown)).has_value());
    EXPECT_FALSE(navigator.list_step(Mode::CreateForm, key(Key::Down)).has_value());
}

TEST_F(NavigationTest, MoveSelectionIgnoredOutsideBrowsing) {
    state.set_mode(Mode::Help);
    EXPECT_TRUE(navigator.move_selection(state, 2).empty());
    EXPECT_EQ(state.selected_index(Platform::Android), 0u);
}

TEST_F(NavigationTest, TabSwitchesFocus) {
    const auto actions = navigator.handle_key(state, key(Key::Tab));
    EXPECT_EQ(state.focus(), Platform::Ios);
    EXPECT_TRUE(has_action(actions, ActionType::SelectionChanged));

    navigator.handle_key(state, ch('h'));
    EXPECT_EQ(state.focus(), Platform::Android);
}

TEST_F(NavigationTest, EnterTogglesSelectedDevice) {
    navigator.handle_key(state, key(Key::Down));
    const auto actions = navigator.handle_key(state, key(Key::Enter));

    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].type, ActionType::ToggleDevice);
    EXPECT_EQ(actions[0].device->identifier, "b");
}

TEST_F(NavigationTest, QuitAndRefreshKeys) {
    EXPECT_TRUE(has_action(navigator.handle_key(state, ch('q')), ActionType::Quit));
    EXPECT_TRUE(has_action(navigator.handle_key(state, ch('r')), ActionType::Refresh));
    EXPECT_TRUE(has_action(navigator.handle_key(state, key(Key::F5)), ActionType::Refresh));
}

TEST_F(NavigationTest, InterruptQuitsFromEveryMode) {
    EXPECT_TRUE(has_action(navigator.handle_key(state, key(Key::Interrupt)), ActionType::Quit));

    navigator.handle_key(state, ch('c'));
    ASSERT_EQ(state.mode(), Mode::CreateForm);
    EXPECT_TRUE(has_action(navigator.handle_key(state, key(Key::Interrupt)), ActionType::Quit));
    navigator.handle_key(state, key(Key::Escape));

    navigator.handle_key(state, ch('d'));
    ASSERT_EQ(state.mode(), Mode::ConfirmPending);
    EXPECT_TRUE(has_action(navigator.handle_key(state, key(Key::Interrupt)), ActionType::Quit));
    navigator.handle_key(state, key(Key::Escape));

    navigator.handle_key(state, ch('?'));
    ASSERT_EQ(state.mode(), Mode::Help);
    EXPECT_TRUE(has_action(navigator.handle_key(state, key(Key::Interrupt)), ActionType::Quit));
}

TEST_F(NavigationTest, DeleteAsksForConfirmation) {
    navigator.handle_key(state, ch('d'));
    ASSERT_EQ(state.mode(), Mode::ConfirmPending);
    EXPECT_EQ(state.confirm_dialog().target.identifier, "a");
    EXPECT_EQ(state.confirm_dialog().action, ConfirmAction::Delete);

    const auto actions = navigator.handle_key(state, ch('y'));
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].type, ActionType::DeleteDevice);
    EXPECT_EQ(actions[0].device->identifier, "a");
    EXPECT_EQ(state.mode(), Mode::Browsing);
    EXPECT_FALSE(state.confirm_dialog().is_visible);
}

TEST_F(NavigationTest, ConfirmDialogCapturesOtherKeys) {
    navigator.handle_key(state, ch('w'));
    ASSERT_EQ(state.mode(), Mode::ConfirmPending);

    EXPECT_TRUE(navigator.handle_key(state, ch('q')).empty());
    EXPECT_TRUE(navigator.handle_key(state, key(Key::Down)).empty());
    EXPECT_EQ(state.mode(), Mode::ConfirmPending);
    EXPECT_EQ(state.selected_index(Platform::Android), 0u);

    EXPECT_TRUE(navigator.handle_key(state, key(Key::Escape)).empty());
    EXPECT_EQ(state.mode(), Mode::Browsing);
}

TEST_F(NavigationTest, WipeConfirmedWithEnter) {
    navigator.handle_key(state, ch('w'));
    const auto actions = navigator.handle_key(state, key(Key::Enter));
    ASSERT_EQ(actions.size(), 1u);
    EXPECT_EQ(actions[0].type, ActionType::WipeDevice);
}

TEST_F(NavigationTest, DestructiveActionRejectedWhilePending) {
    state.set_operation_pending({Platform::Android, "a"}, OperationKind::Start, "a");

    navigator.handle_key(state, ch('d'));
    EXPECT_EQ(state.mode(), Mode::Browsing);
    ASSERT_EQ(state.notifications().size(), 1u);
    EXPECT_EQ(state.notifications().back().level, NotificationLevel::Warning);
    EXPECT_EQ(state.notifications().back().message, "Operation already in progress for a");
}

TEST_F(NavigationTest, CreateOpensFormForFocusedFamily) {
    navigator.handle_key(state, key(Key::Tab));
    const auto actions = navigator.handle_key(state, ch('c'));

    EXPECT_TRUE(has_action(actions, ActionType::OpenCreateForm));
    EXPECT_EQ(state.mode(), Mode::CreateForm);
    EXPECT_EQ(state.create_form().platform, Platform::Ios);
    EXPECT_TRUE(state.create_form().options_loading);
}

TEST_F(NavigationTest, CreateRefusedWhenToolsUnavailable) {
    state.set_backend_available(Platform::Android, false);
    EXPECT_TRUE(navigator.handle_key(state, ch('c')).empty());
    EXPECT_EQ(state.mode(), Mode::Browsing);
    EXPECT_EQ(state.notifications().size(), 1u);
}

TEST_F(NavigationTest, FormCapturesQuitKeyAsText) {
    navigator.handle_key(state, ch('c'));
    EXPECT_TRUE(navigator.handle_key(state, ch('q')).empty());

    EXPECT_EQ(state.mode(), Mode::CreateForm);
    EXPECT_EQ(find_field(state.create_form(), FormFieldId::Name)->value, "q");
}

TEST_F(NavigationTest, FormEscapeDiscards) {
    navigator.handle_key(state, ch('c'));
    navigator.handle_key(state, ch('z'));
    navigator.handle_key(state, key(Key::Escape));

    EXPECT_EQ(state.mode(), Mode::Browsing);
    EXPECT_FALSE(state.create_form().is_visible);
    EXPECT_TRUE(state.create_form().fields.empty());
}

TEST_F(NavigationTest, FormSubmitIgnoredWhileOptionsLoad) {
    navigator.handle_key(state, ch('c'));
    navigator.handle_key(state, ch('p'));
    EXPECT_TRUE(navigator.handle_key(state, key(Key::Enter)).empty());
    EXPECT_FALSE(state.create_form().is_submitting);
}

TEST_F(NavigationTest, ValidFormSubmitsOnce) {
    navigator.handle_key(state, ch('c'));
    apply_form_options(state.create_form(), {{"pixel_7", "Pixel 7", "phone"}},
                       {{"system-images;android-34;google_apis;x86_64", "API 34"}});
    for (const char c : std::string("Pixel_Test")) {
        navigator.handle_key(state, ch(c));
    }

    const auto actions = navigator.handle_key(state, key(Key::Enter));
    ASSERT_EQ(actions.size(), 1u);
    ASSERT_EQ(actions[0].type, ActionType::SubmitCreate);
    EXPECT_EQ(actions[0].config->name, "Pixel_Test");
    EXPECT_EQ(actions[0].config->device_type, "pixel_7");
    EXPECT_TRUE(state.create_form().is_submitting);

    EXPECT_TRUE(navigator.handle_key(state, key(Key::Enter)).empty());
}

TEST_F(NavigationTest, InvalidFormStaysOpenWithError) {
    navigator.handle_key(state, ch('c'));
    apply_form_options(state.create_form(), {{"pixel_7", "Pixel 7", "phone"}}, {{"img", "API 34"}});

    EXPECT_TRUE(navigator.handle_key(state, key(Key::Enter)).empty());
    EXPECT_EQ(state.mode(), Mode::CreateForm);
    EXPECT_EQ(state.create_form().error_message, "Name: Device name cannot be empty");
}

TEST_F(NavigationTest, HelpClosesOnlyOnDismissKeys) {
    navigator.handle_key(state, ch('?'));
    ASSERT_EQ(state.mode(), Mode::Help);

    EXPECT_TRUE(navigator.handle_key(state, key(Key::Down)).empty());
    EXPECT_TRUE(navigator.handle_key(state, ch('d')).empty());
    EXPECT_EQ(state.mode(), Mode::Help);
    EXPECT_EQ(state.selected_index(Platform::Android), 0u);

    navigator.handle_key(state, key(Key::F1));
    EXPECT_EQ(state.mode(), Mode::Browsing);
}

TEST_F(NavigationTest, FullscreenLogScrollsInsteadOfMovingSelection) {
    const DeviceTag a{Platform::Android, "a"};
    state.begin_log_stream(a);
    for (int i = 0; i < 5; ++i) {
        state.push_log(LogEntry{std::chrono::system_clock::now(), LogLevel::Info, a, "line"});
    }

    navigator.handle_key(state, ch('F'));
    ASSERT_EQ(state.mode(), Mode::FullscreenLog);
    navigator.handle_key(state, key(Key::Up));

    EXPECT_EQ(state.log_panel().scroll_from_bottom, 1u);
    EXPECT_EQ(state.selected_index(Platform::Android), 0u);

    navigator.handle_key(state, key(Key::Escape));
    EXPECT_EQ(state.mode(), Mode::Browsing);
}

TEST_F(NavigationTest, LogFilterAndClearKeys) {
    navigator.handle_key(state, ch('f'));
    EXPECT_EQ(state.log_panel().filter, LogLevel::Error);

    const DeviceTag a{Platform::Android, "a"};
    state.begin_log_stream(a);
    state.push_log(LogEntry{std::chrono::system_clock::now(), LogLevel::Error, a, "e"});
    navigator.handle_key(state, ch('L'));
    EXPECT_TRUE(state.log_panel().entries.empty());
}

} // namespace
} // namespace emu
