// ==============================================================================
// test_action_gtest.cpp - Тесты ActionRunner (GoogleTest)
// ==============================================================================

#include <gtest/gtest.h>
#include <midimacro/action.hpp>
#include <midimacro/output.hpp>
#include <string>
#include <vector>

namespace midimacro::action::test {

namespace {

/// Записывает все вызовы адаптеров в общий журнал
class RecordingKeyboard : public KeyboardAdapter {
public:
    explicit RecordingKeyboard(std::vector<std::string>& log) : log_(log) {}

    bool send_key_sequence(std::string_view sequence, std::chrono::microseconds delay) override {
        log_.push_back("key " + std::string(sequence));
        last_delay = delay;
        return !fail;
    }

    bool send_text(std::string_view text, std::chrono::microseconds delay) override {
        log_.push_back("text " + std::string(text));
        last_delay = delay;
        return !fail;
    }

    bool fail = false;
    std::chrono::microseconds last_delay{0};

private:
    std::vector<std::string>& log_;
};

class RecordingSpawner : public ProcessSpawner {
public:
    explicit RecordingSpawner(std::vector<std::string>& log) : log_(log) {}

    SpawnResult spawn(const Shell& shell) override {
        log_.push_back("shell " + shell.command);
        return result;
    }

    SpawnResult result{true, 0, ""};

private:
    std::vector<std::string>& log_;
};

output::OutputConfig quiet_config() {
    output::OutputConfig cfg;
    cfg.quiet = true;
    return cfg;
}

class ActionRunnerTest : public ::testing::Test {
protected:
    std::vector<std::string> log;
    RecordingKeyboard keyboard{log};
    RecordingSpawner spawner{log};
    output::Writer writer{quiet_config()};
    ActionRunner runner{keyboard, spawner, writer, std::chrono::microseconds(250)};
};

}  // namespace

// ==============================================================================
// Описания
// ==============================================================================

TEST(ActionTest, TypeNames) {
    EXPECT_STREQ(action_type_name(Action::key_sequence("a")), "key_sequence");
    EXPECT_STREQ(action_type_name(Action::enter_text("a")), "enter_text");
    EXPECT_STREQ(action_type_name(Action::shell("ls")), "shell");
    EXPECT_STREQ(action_type_name(Action::combination({})), "combination");
}

TEST(ActionTest, Describe) {
    EXPECT_EQ(describe(Action::key_sequence("ctrl+c", 2)), "key_sequence \"ctrl+c\" x2");
    EXPECT_EQ(describe(Action::shell("notify-send", std::vector<std::string>{"hi"})),
              "shell notify-send hi");
    EXPECT_EQ(describe(Action::combination({Action::enter_text("x"), Action::key_sequence("y")})),
              "combination [enter_text \"x\" x1, key_sequence \"y\" x1]");
}

TEST(ActionTest, DefaultCountIsOne) {
    EXPECT_EQ(Action::key_sequence("a").get_key_sequence()->count, 1u);
    EXPECT_EQ(Action::enter_text("a").get_enter_text()->count, 1u);
}

// ==============================================================================
// ActionRunner
// ==============================================================================

TEST_F(ActionRunnerTest, KeySequenceRepeatsCountTimes) {
    EXPECT_TRUE(runner.run(Action::key_sequence("ctrl+t", 3)));
    EXPECT_EQ(log, (std::vector<std::string>{"key ctrl+t", "key ctrl+t", "key ctrl+t"}));
    EXPECT_EQ(keyboard.last_delay, std::chrono::microseconds(250));
}

TEST_F(ActionRunnerTest, CountZeroMakesNoCalls) {
    EXPECT_TRUE(runner.run(Action::key_sequence("a", 0)));
    EXPECT_TRUE(runner.run(Action::enter_text("b", 0)));
    EXPECT_TRUE(log.empty());
}

TEST_F(ActionRunnerTest, EnterText) {
    EXPECT_TRUE(runner.run(Action::enter_text("hello", 2)));
    EXPECT_EQ(log, (std::vector<std::string>{"text hello", "text hello"}));
}

TEST_F(ActionRunnerTest, ShellExitStatus) {
    EXPECT_TRUE(runner.run(Action::shell("/bin/true")));

    spawner.result = SpawnResult{true, 3, ""};
    EXPECT_FALSE(runner.run(Action::shell("/bin/false")));

    spawner.result = SpawnResult{false, -1, "No such file or directory"};
    EXPECT_FALSE(runner.run(Action::shell("/nope")));

    spawner.result = SpawnResult{true, -1, "killed by signal 9"};
    EXPECT_FALSE(runner.run(Action::shell("/bin/sleep")));

    EXPECT_EQ(log.size(), 4u);
}

TEST_F(ActionRunnerTest, CombinationRunsInOrder) {
    auto combo = Action::combination({Action::key_sequence("a"),
                                      Action::combination({Action::enter_text("b")}),
                                      Action::shell("c")});
    EXPECT_TRUE(runner.run(combo));
    EXPECT_EQ(log, (std::vector<std::string>{"key a", "text b", "shell c"}));
}

TEST_F(ActionRunnerTest, CombinationContinuesAfterFailure) {
    spawner.result = SpawnResult{false, -1, "not found"};
    auto combo = Action::combination({Action::shell("missing"), Action::enter_text("after")});

    EXPECT_FALSE(runner.run(combo));
    EXPECT_EQ(log, (std::vector<std::string>{"shell missing", "text after"}));
}

TEST_F(ActionRunnerTest, CombinationContinuesAfterNonZeroExit) {
    // Процесс запустился, но завершился со статусом 1
    spawner.result = SpawnResult{true, 1, ""};
    auto combo = Action::combination({Action::shell("/bin/false"), Action::enter_text("x")});

    EXPECT_FALSE(runner.run(combo));
    EXPECT_EQ(log, (std::vector<std::string>{"shell /bin/false", "text x"}));
}

TEST_F(ActionRunnerTest, KeyboardFailureStopsRepeats) {
    keyboard.fail = true;
    EXPECT_FALSE(runner.run(Action::key_sequence("a", 5)));
    EXPECT_EQ(log.size(), 1u);
}

TEST_F(ActionRunnerTest, RunAllIsBestEffort) {
    keyboard.fail = true;
    ActionVec actions{Action::key_sequence("a"), Action::shell("b")};
    EXPECT_FALSE(runner.run_all(actions));
    EXPECT_EQ(log, (std::vector<std::string>{"key a", "shell b"}));
}

}  // namespace midimacro::action::test
