// ==============================================================================
// test_engine_gtest.cpp - Тесты MessageQueue / select / Engine (GoogleTest)
// ==============================================================================

#include <gtest/gtest.h>
#include <midimacro/devices.hpp>
#include <midimacro/engine.hpp>
#include <midimacro/output.hpp>
#include <string>
#include <thread>
#include <vector>

namespace midimacro::engine::test {

using match::NumberMatcher;
using midi::MidiMessage;
using rule::MacroBuilder;
using rule::MidiEventMatcher;

namespace {

class RecordingKeyboard : public action::KeyboardAdapter {
public:
    bool send_key_sequence(std::string_view sequence, std::chrono::microseconds) override {
        calls.push_back("key " + std::string(sequence));
        return true;
    }
    bool send_text(std::string_view text, std::chrono::microseconds) override {
        calls.push_back("text " + std::string(text));
        return true;
    }

    std::vector<std::string> calls;
};

class NullSpawner : public action::ProcessSpawner {
public:
    action::SpawnResult spawn(const action::Shell&) override { return {true, 0, ""}; }
};

class CountingFocus : public state::FocusAdapter {
public:
    std::optional<state::WindowInfo> focused_window() override {
        ++queries;
        return state::WindowInfo{"firefox", "Mozilla Firefox"};
    }

    int queries = 0;
};

class CountingListener : public devices::MidiAdapter {
public:
    std::vector<devices::MidiPort> list_ports() override { return {}; }
    devices::ListenResult start_listening(std::string_view, MessageQueue&) override {
        return {};
    }
    void stop_listening() override { ++stops; }

    int stops = 0;
};

rule::EventMatcher cc(std::optional<NumberMatcher> control, std::optional<NumberMatcher> value) {
    return MidiEventMatcher::control_change(std::nullopt, control, value);
}

output::OutputConfig quiet_config() {
    output::OutputConfig cfg;
    cfg.quiet = true;
    return cfg;
}

class EngineTest : public ::testing::Test {
protected:
    RecordingKeyboard keyboard;
    NullSpawner spawner;
    output::Writer writer{quiet_config()};
    action::ActionRunner runner{keyboard, spawner, writer};
    state::State state;

    Engine make_engine(std::vector<rule::Macro> macros) {
        config::Config cfg;
        cfg.macros = std::move(macros);
        return Engine(std::move(cfg), state, runner, writer);
    }
};

}  // namespace

// ==============================================================================
// MessageQueue
// ==============================================================================

TEST(MessageQueueTest, FifoOrder) {
    MessageQueue queue;
    EXPECT_TRUE(queue.push(MidiMessage::note_on(0, 1, 1)));
    EXPECT_TRUE(queue.push(MidiMessage::note_on(0, 2, 1)));
    EXPECT_EQ(queue.size(), 2u);

    EXPECT_EQ(queue.pop()->primary, 1);
    EXPECT_EQ(queue.try_pop()->primary, 2);
    EXPECT_FALSE(queue.try_pop().has_value());
}

TEST(MessageQueueTest, CloseDrainsThenEnds) {
    MessageQueue queue;
    queue.push(MidiMessage::note_on(0, 1, 1));
    queue.close();

    EXPECT_TRUE(queue.closed());
    EXPECT_FALSE(queue.push(MidiMessage::note_on(0, 2, 1)));
    EXPECT_TRUE(queue.pop().has_value());
    EXPECT_FALSE(queue.pop().has_value());
}

TEST(MessageQueueTest, CloseWakesBlockedConsumer) {
    MessageQueue queue;
    std::optional<MidiMessage> result = MidiMessage::note_on(0, 0, 0);

    std::thread consumer([&] { result = queue.pop(); });
    queue.close();
    consumer.join();

    EXPECT_FALSE(result.has_value());
}

TEST(MessageQueueTest, ProducerThread) {
    MessageQueue queue;
    std::thread producer([&queue] {
        for (int i = 0; i < 100; ++i) {
            queue.push(MidiMessage::control_change(0, 1, static_cast<std::uint8_t>(i)));
        }
        queue.close();
    });

    int expected = 0;
    while (auto msg = queue.pop()) {
        EXPECT_EQ(msg->secondary, expected);
        ++expected;
    }
    producer.join();
    EXPECT_EQ(expected, 100);
}

// ==============================================================================
// select
// ==============================================================================

TEST(SelectTest, FirstMatchWins) {
    std::vector<rule::Macro> macros;
    macros.push_back(MacroBuilder::from_event_matcher(cc(NumberMatcher::val(7), std::nullopt))
                         .set_name("M1")
                         .add_action(action::Action::key_sequence("a"))
                         .build());
    macros.push_back(MacroBuilder::from_event_matcher(cc(std::nullopt, std::nullopt))
                         .set_name("M2")
                         .add_action(action::Action::key_sequence("b"))
                         .build());

    state::Snapshot snapshot;
    auto seven = MidiMessage::control_change(0, 7, 1);
    auto other = MidiMessage::control_change(0, 9, 1);

    auto first = select(macros, rule::make_event(seven), snapshot);
    ASSERT_TRUE(first);
    EXPECT_EQ(*first.macro->name(), "M1");
    EXPECT_EQ(first.actions, &macros[0].actions());

    auto second = select(macros, rule::make_event(other), snapshot);
    ASSERT_TRUE(second);
    EXPECT_EQ(*second.macro->name(), "M2");
}

TEST(SelectTest, NoMatch) {
    std::vector<rule::Macro> macros;
    macros.push_back(
        MacroBuilder::from_event_matcher(cc(NumberMatcher::val(7), std::nullopt)).build());

    state::Snapshot snapshot;
    auto msg = MidiMessage::note_on(0, 7, 1);
    EXPECT_FALSE(select(macros, rule::make_event(msg), snapshot));
    EXPECT_FALSE(select({}, rule::make_event(msg), snapshot));
}

// ==============================================================================
// Engine
// ==============================================================================

TEST_F(EngineTest, DispatchesMatchingMacroOnly) {
    std::vector<rule::Macro> macros;
    macros.push_back(
        MacroBuilder::from_event_matcher(cc(NumberMatcher::val(7), NumberMatcher::range(0, 63)))
            .add_action(action::Action::key_sequence("XF86AudioLowerVolume"))
            .build());
    auto engine = make_engine(std::move(macros));

    EXPECT_FALSE(engine.process(MidiMessage::control_change(0, 7, 40)));
    EXPECT_FALSE(engine.process(MidiMessage::control_change(0, 7, 100)));

    EXPECT_EQ(keyboard.calls, (std::vector<std::string>{"key XF86AudioLowerVolume"}));
}

TEST_F(EngineTest, OnlyFirstMatchRuns) {
    std::vector<rule::Macro> macros;
    macros.push_back(MacroBuilder::from_event_matcher(cc(NumberMatcher::val(7), std::nullopt))
                         .add_action(action::Action::enter_text("first"))
                         .build());
    macros.push_back(MacroBuilder::from_event_matcher(cc(NumberMatcher::val(7), std::nullopt))
                         .add_action(action::Action::enter_text("second"))
                         .build());
    auto engine = make_engine(std::move(macros));

    engine.process(MidiMessage::control_change(0, 7, 1));
    EXPECT_EQ(keyboard.calls, (std::vector<std::string>{"text first"}));
}

TEST_F(EngineTest, PreconditionsSeeOnlyEarlierMessages) {
    // Нота 60 срабатывает только если она ещё не удерживается
    std::vector<rule::Macro> macros;
    macros.push_back(
        MacroBuilder::from_event_matcher(
            MidiEventMatcher::note_on(std::nullopt, NumberMatcher::val(60), std::nullopt))
            .add_precondition(rule::Precondition(
                rule::NoteActiveCondition{std::nullopt, NumberMatcher::val(60)}, true))
            .add_action(action::Action::key_sequence("x"))
            .build());
    auto engine = make_engine(std::move(macros));

    engine.process(MidiMessage::note_on(0, 60, 100));
    EXPECT_EQ(keyboard.calls.size(), 1u);
    EXPECT_EQ(state.snapshot()->channels[0].notes[60], 100);

    // Повторное нажатие без отпускания: нота уже удерживается
    engine.process(MidiMessage::note_on(0, 60, 90));
    EXPECT_EQ(keyboard.calls.size(), 1u);
}

TEST_F(EngineTest, ControlPreconditionUsesPreviousValue) {
    std::vector<rule::Macro> macros;
    macros.push_back(
        MacroBuilder::from_event_matcher(cc(NumberMatcher::val(8), std::nullopt))
            .add_precondition(rule::Precondition(
                rule::ControlValueCondition{std::nullopt, 8, NumberMatcher::range(64, 127)}))
            .add_action(action::Action::key_sequence("x"))
            .build());
    auto engine = make_engine(std::move(macros));

    engine.process(MidiMessage::control_change(0, 8, 100));
    EXPECT_TRUE(keyboard.calls.empty());
    EXPECT_EQ(state.snapshot()->channels[0].controls[8], 100);

    engine.process(MidiMessage::control_change(0, 8, 10));
    EXPECT_EQ(keyboard.calls.size(), 1u);
}

TEST(EngineFocusTest, FocusQueriedOnlyWithScopedMacros) {
    CountingFocus focus;
    state::State state(&focus);
    RecordingKeyboard keyboard;
    NullSpawner spawner;
    output::Writer writer{quiet_config()};
    action::ActionRunner runner{keyboard, spawner, writer};

    config::Config unscoped;
    unscoped.macros.push_back(MacroBuilder::from_event_matcher(cc(std::nullopt, std::nullopt))
                                  .set_scope(rule::Scope{})
                                  .add_action(action::Action::key_sequence("a"))
                                  .build());
    Engine plain(std::move(unscoped), state, runner, writer);
    for (int i = 0; i < 6; ++i) {
        plain.process(MidiMessage::control_change(0, 7, static_cast<std::uint8_t>(i)));
    }
    EXPECT_EQ(focus.queries, 0);
    EXPECT_EQ(keyboard.calls.size(), 6u);

    config::Config scoped;
    scoped.macros.push_back(
        MacroBuilder::from_event_matcher(cc(std::nullopt, std::nullopt))
            .set_scope(rule::Scope{match::StringMatcher::equals("firefox"), std::nullopt})
            .add_action(action::Action::key_sequence("b"))
            .build());
    Engine windowed(std::move(scoped), state, runner, writer);
    windowed.process(MidiMessage::control_change(0, 7, 1));
    windowed.process(MidiMessage::control_change(0, 7, 2));
    EXPECT_EQ(focus.queries, 2);
    EXPECT_EQ(keyboard.calls.size(), 8u);
}

TEST_F(EngineTest, StopEvent) {
    auto engine = make_engine({});
    EXPECT_FALSE(engine.process(MidiMessage::control_change(0, 51, 126)));
    EXPECT_TRUE(engine.process(MidiMessage::control_change(4, 51, 127)));
}

TEST_F(EngineTest, RunStopsOnStopEvent) {
    auto engine = make_engine({});
    CountingListener listener;
    MessageQueue queue;

    queue.push(MidiMessage::note_on(0, 60, 1));
    queue.push(MidiMessage::control_change(0, 51, 127));

    EXPECT_EQ(engine.run(queue, &listener), 2u);
    EXPECT_EQ(listener.stops, 1);
    EXPECT_TRUE(queue.closed());
}

TEST_F(EngineTest, RunEndsWhenQueueCloses) {
    std::vector<rule::Macro> macros;
    macros.push_back(MacroBuilder::from_event_matcher(cc(std::nullopt, std::nullopt))
                         .add_action(action::Action::key_sequence("k"))
                         .build());
    auto engine = make_engine(std::move(macros));
    MessageQueue queue;

    std::thread producer([&queue] {
        for (std::uint8_t i = 0; i < 5; ++i) {
            queue.push(MidiMessage::control_change(0, 1, i));
        }
        queue.close();
    });

    EXPECT_EQ(engine.run(queue, nullptr), 5u);
    producer.join();
    EXPECT_EQ(keyboard.calls.size(), 5u);
}

TEST_F(EngineTest, SameInputSameDispatch) {
    std::vector<rule::Macro> macros;
    macros.push_back(MacroBuilder::from_event_matcher(cc(NumberMatcher::val(7), std::nullopt))
                         .add_action(action::Action::key_sequence("a"))
                         .build());
    auto engine = make_engine(std::move(macros));

    engine.process(MidiMessage::control_change(0, 7, 1));
    engine.process(MidiMessage::control_change(0, 7, 1));
    EXPECT_EQ(keyboard.calls, (std::vector<std::string>{"key a", "key a"}));
}

}  // namespace midimacro::engine::test
