#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <string>

#include "include/cli_renderer.hpp"
#include "include/key_bindings.hpp"
#include "include/terminal.hpp"
#include "tests/fakes.hpp"

using namespace vantage::core;
using namespace vantage::ui;
using vantage::testing::FakeDnsApplier;
using vantage::testing::FakeProber;
using namespace std::chrono_literals;

namespace {

Key ch(char c) {
    return Key{KeyCode::Char, c};
}

Key code(KeyCode c) {
    return Key{c};
}

}  // namespace

TEST(DecodeKeyTest, ControlAndPrintable) {
    EXPECT_EQ(decode_key("\r"), code(KeyCode::Enter));
    EXPECT_EQ(decode_key("\n"), code(KeyCode::Enter));
    EXPECT_EQ(decode_key("\x7f"), code(KeyCode::Backspace));
    EXPECT_EQ(decode_key("\t"), code(KeyCode::Tab));
    EXPECT_EQ(decode_key("\x03"), code(KeyCode::CtrlC));
    EXPECT_EQ(decode_key("\x04"), code(KeyCode::CtrlD));
    EXPECT_EQ(decode_key("a"), ch('a'));
    EXPECT_EQ(decode_key("."), ch('.'));
    EXPECT_FALSE(decode_key(""));
    EXPECT_FALSE(decode_key("\x01"));
}

TEST(DecodeKeyTest, EscapeSequences) {
    EXPECT_EQ(decode_key("\x1b"), code(KeyCode::Escape));
    EXPECT_EQ(decode_key("\x1b[A"), code(KeyCode::Up));
    EXPECT_EQ(decode_key("\x1b[B"), code(KeyCode::Down));
    EXPECT_EQ(decode_key("\x1bOC"), code(KeyCode::Right));
    EXPECT_EQ(decode_key("\x1b[D"), code(KeyCode::Left));
}

TEST(ProgressBarTest, FillsProportionally) {
    EXPECT_EQ(create_progress_bar(0, 4, 8), "[--------]");
    EXPECT_EQ(create_progress_bar(2, 4, 8), "[####----]");
    EXPECT_EQ(create_progress_bar(4, 4, 8), "[########]");
    EXPECT_EQ(create_progress_bar(9, 4, 8), "[########]");
    EXPECT_EQ(create_progress_bar(0, 0, 4), "[----]");
    EXPECT_EQ(create_progress_bar(1, 1, 0), "[]");
}

class KeyBindingsTest : public ::testing::Test {
   protected:
    std::shared_ptr<FakeProber> prober_ = std::make_shared<FakeProber>();
    FakeDnsApplier applier_;
    Session session_{prober_, applier_};
    std::string line_;

    void type(std::string_view text) {
        for (char c : text)
            ASSERT_EQ(handle_key(session_, line_, ch(c)), KeyAction::Handled);
    }

    KeyAction press(KeyCode c) { return handle_key(session_, line_, code(c)); }
};

TEST_F(KeyBindingsTest, EnterSubmitsEntriesAndKeepsRejectedOnes) {
    type("1.1.1.1, bogus ,8.8.8.8");
    EXPECT_EQ(press(KeyCode::Enter), KeyAction::Handled);

    ASSERT_EQ(session_.targets().size(), 2u);
    EXPECT_EQ(session_.targets()[0].id, "1.1.1.1");
    EXPECT_EQ(session_.targets()[1].id, "8.8.8.8");
    EXPECT_EQ(line_, "bogus");
    EXPECT_EQ(session_.screen(), Screen::Input);
}

TEST_F(KeyBindingsTest, BackspaceEditsLineThenRemovesTargets) {
    type("1.1.1.1");
    press(KeyCode::Enter);
    type("9.");
    press(KeyCode::Backspace);
    EXPECT_EQ(line_, "9");
    press(KeyCode::Backspace);
    EXPECT_TRUE(line_.empty());
    EXPECT_EQ(session_.targets().size(), 1u);

    press(KeyCode::Backspace);
    EXPECT_TRUE(session_.targets().empty());
}

TEST_F(KeyBindingsTest, EnterOnEmptyLineRunsThenResultsKeysWork) {
    type("1.1.1.1,8.8.8.8");
    press(KeyCode::Enter);
    press(KeyCode::Enter);
    EXPECT_EQ(session_.screen(), Screen::Running);
    ASSERT_TRUE(session_.wait_until_idle(10s));
    ASSERT_EQ(session_.screen(), Screen::Results);

    const auto before = session_.sort();
    EXPECT_EQ(handle_key(session_, line_, ch('d')), KeyAction::Handled);
    EXPECT_NE(session_.sort().direction, before.direction);
    EXPECT_EQ(handle_key(session_, line_, ch('s')), KeyAction::Handled);
    EXPECT_NE(session_.sort().column, before.column);

    EXPECT_EQ(handle_key(session_, line_, ch('x')), KeyAction::Ignored);

    EXPECT_EQ(handle_key(session_, line_, ch('r')), KeyAction::Handled);
    EXPECT_EQ(session_.screen(), Screen::Input);
    EXPECT_EQ(session_.targets().size(), 2u);
}

TEST_F(KeyBindingsTest, TabTogglesModeOnInput) {
    EXPECT_EQ(press(KeyCode::Tab), KeyAction::Handled);
    EXPECT_EQ(session_.mode(), Mode::Mirror);
    EXPECT_EQ(press(KeyCode::Tab), KeyAction::Handled);
    EXPECT_EQ(session_.mode(), Mode::Dns);
}

TEST_F(KeyBindingsTest, CancelWhileRunning) {
    prober_->delay_all(2s);
    type("1.1.1.1,8.8.8.8,9.9.9.9");
    press(KeyCode::Enter);
    press(KeyCode::Enter);
    ASSERT_EQ(session_.screen(), Screen::Running);

    EXPECT_EQ(handle_key(session_, line_, ch('c')), KeyAction::Handled);
    ASSERT_TRUE(session_.wait_until_idle(10s));
    EXPECT_EQ(session_.screen(), Screen::Results);
    EXPECT_EQ(session_.table().status(), RunStatus::Cancelled);
}

TEST_F(KeyBindingsTest, QuitKeys) {
    EXPECT_EQ(press(KeyCode::CtrlC), KeyAction::Quit);
    EXPECT_TRUE(session_.quit_requested());
}

TEST_F(KeyBindingsTest, EscapeQuitsFromInput) {
    EXPECT_EQ(press(KeyCode::Escape), KeyAction::Quit);
    EXPECT_TRUE(session_.quit_requested());
}

TEST(KeyHelpTest, EveryScreenHasHelp) {
    EXPECT_FALSE(key_help(Screen::Input).empty());
    EXPECT_FALSE(key_help(Screen::Running).empty());
    EXPECT_NE(key_help(Screen::Results).find("apply"), std::string_view::npos);
}

class RenderTest : public ::testing::Test {
   protected:
    std::shared_ptr<FakeProber> prober_ = std::make_shared<FakeProber>();
    FakeDnsApplier applier_;
    Session session_{prober_, applier_};
};

TEST_F(RenderTest, InputFrameShowsTargetsAndEntryLine) {
    ASSERT_TRUE(session_.add_target("1.1.1.1"));
    auto frame = render_frame(session_, "8.8.", 0, 80);

    EXPECT_NE(frame.find("DNS mode"), std::string::npos);
    EXPECT_NE(frame.find("[Input]"), std::string::npos);
    EXPECT_NE(frame.find("Targets (1): 1.1.1.1"), std::string::npos);
    EXPECT_NE(frame.find(" > 8.8._"), std::string::npos);
    EXPECT_NE(frame.find(key_help(Screen::Input)), std::string::npos);
}

TEST_F(RenderTest, ResultsFrameShowsTableAndBest) {
    prober_->succeed("1.1.1.1", 12.0, 250.0);
    prober_->fail("8.8.8.8", "Latency test failed: SERVFAIL");
    ASSERT_TRUE(session_.add_target("1.1.1.1"));
    ASSERT_TRUE(session_.add_target("8.8.8.8"));
    ASSERT_TRUE(session_.start());
    ASSERT_TRUE(session_.wait_until_idle(10s));

    auto frame = render_frame(session_, "", 3, 100);
    EXPECT_NE(frame.find("[Results]"), std::string::npos);
    EXPECT_NE(frame.find("Resolver"), std::string::npos);
    EXPECT_NE(frame.find("12.0 ms"), std::string::npos);
    EXPECT_NE(frame.find("250.00 Mbps"), std::string::npos);
    EXPECT_NE(frame.find("Failed: Latency test failed"), std::string::npos);
    EXPECT_NE(frame.find("Best: "), std::string::npos);
    EXPECT_NE(frame.find("Sort: Throughput desc"), std::string::npos);
    EXPECT_EQ(frame.find(" > "), std::string::npos);
}

TEST(FormatTableTest, MarksBestRowAndInProgressRow) {
    ProbeResult ok;
    ok.index = 0;
    ok.target = Target{"1.1.1.1", TargetKind::Dns, ""};
    ok.status = ProbeStatus::Success;
    ok.latency = Milliseconds{5.0};
    ok.throughput_mbps = 90.0;

    ProbeResult pending;
    pending.index = 1;
    pending.target = Target{"8.8.8.8", TargetKind::Dns, ""};

    auto table = format_results_table({ok, pending}, &ok, Mode::Dns, 100, 1);
    EXPECT_EQ(table.find("*1"), table.find('\n') + 1);
    EXPECT_NE(table.find("Testing..."), std::string::npos);
    EXPECT_NE(table.find("90.00 Mbps"), std::string::npos);
}
