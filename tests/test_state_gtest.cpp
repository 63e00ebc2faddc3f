// ==============================================================================
// test_state_gtest.cpp - Тесты Snapshot / State (GoogleTest)
// ==============================================================================

#include <gtest/gtest.h>
#include <midimacro/state.hpp>
#include <thread>
#include <vector>

namespace midimacro::state::test {

using match::NumberMatcher;
using match::StringMatcher;
using midi::MidiMessage;
using rule::Precondition;
using rule::Scope;

namespace {

class FakeFocus : public FocusAdapter {
public:
    std::optional<WindowInfo> window;
    int calls = 0;

    std::optional<WindowInfo> focused_window() override {
        ++calls;
        return window;
    }
};

Scope class_scope(const std::string& window_class) {
    Scope scope;
    scope.window_class = StringMatcher::equals(window_class);
    return scope;
}

}  // namespace

// ==============================================================================
// Scope
// ==============================================================================

TEST(SnapshotTest, AbsentScopeAlwaysMatches) {
    Snapshot snapshot;
    EXPECT_TRUE(snapshot.matches_scope(std::optional<Scope>()));
    EXPECT_TRUE(snapshot.matches_scope(Scope{}));
}

TEST(SnapshotTest, ScopeWithoutFocusDoesNotMatch) {
    Snapshot snapshot;
    EXPECT_FALSE(snapshot.matches_scope(class_scope("firefox")));
}

TEST(SnapshotTest, ScopeClassAndName) {
    Snapshot snapshot;
    snapshot.window = WindowInfo{"firefox", "Inbox - Mozilla Firefox"};

    EXPECT_TRUE(snapshot.matches_scope(class_scope("firefox")));
    EXPECT_FALSE(snapshot.matches_scope(class_scope("xterm")));

    Scope both = class_scope("firefox");
    both.window_name = StringMatcher::contains("Inbox");
    EXPECT_TRUE(snapshot.matches_scope(both));

    both.window_name = StringMatcher::contains("Calendar");
    EXPECT_FALSE(snapshot.matches_scope(both));
}

// ==============================================================================
// Preconditions
// ==============================================================================

TEST(SnapshotTest, ControlValueNeedsObservedValue) {
    Precondition pre(rule::ControlValueCondition{std::nullopt, 8, NumberMatcher::range(64, 127)});

    Snapshot snapshot;
    EXPECT_FALSE(snapshot.matches(pre));

    snapshot.apply(MidiMessage::control_change(2, 8, 30));
    EXPECT_FALSE(snapshot.matches(pre));

    snapshot.apply(MidiMessage::control_change(2, 8, 100));
    EXPECT_TRUE(snapshot.matches(pre));
}

TEST(SnapshotTest, ControlValueChannelFilter) {
    Precondition pre(
        rule::ControlValueCondition{NumberMatcher::val(0), 8, NumberMatcher::any()});

    Snapshot snapshot;
    snapshot.apply(MidiMessage::control_change(1, 8, 100));
    EXPECT_FALSE(snapshot.matches(pre));

    snapshot.apply(MidiMessage::control_change(0, 8, 0));
    EXPECT_TRUE(snapshot.matches(pre));
}

TEST(SnapshotTest, NoteActiveTracksNoteOnAndOff) {
    Precondition pre(rule::NoteActiveCondition{std::nullopt, NumberMatcher::val(36)});

    Snapshot snapshot;
    EXPECT_FALSE(snapshot.matches(pre));

    snapshot.apply(MidiMessage::note_on(9, 36, 90));
    EXPECT_TRUE(snapshot.matches(pre));

    snapshot.apply(MidiMessage::note_off(9, 36, 0));
    EXPECT_FALSE(snapshot.matches(pre));

    snapshot.apply(MidiMessage::note_on(9, 36, 90));
    snapshot.apply(MidiMessage::note_on(9, 36, 0));
    EXPECT_FALSE(snapshot.matches(pre));
}

TEST(SnapshotTest, ProgramAndPitchBend) {
    Precondition program(rule::ProgramCondition{std::nullopt, NumberMatcher::val(5)});
    Precondition bend(rule::PitchBendCondition{std::nullopt, NumberMatcher::range(8192, 16383)});

    Snapshot snapshot;
    EXPECT_FALSE(snapshot.matches(program));
    EXPECT_FALSE(snapshot.matches(bend));

    snapshot.apply(MidiMessage::program_change(0, 5));
    snapshot.apply(MidiMessage::pitch_bend(0, 12000));
    EXPECT_TRUE(snapshot.matches(program));
    EXPECT_TRUE(snapshot.matches(bend));

    snapshot.apply(MidiMessage::pitch_bend(0, 0));
    EXPECT_FALSE(snapshot.matches(bend));
}

TEST(SnapshotTest, InvertedPrecondition) {
    Precondition held(rule::NoteActiveCondition{std::nullopt, NumberMatcher::any()}, true);

    Snapshot snapshot;
    EXPECT_TRUE(snapshot.matches(held));

    snapshot.apply(MidiMessage::note_on(0, 60, 1));
    EXPECT_FALSE(snapshot.matches(held));
}

// ==============================================================================
// State
// ==============================================================================

TEST(StateTest, SnapshotsAreImmutable) {
    State state;
    auto before = state.snapshot();

    state.record(MidiMessage::control_change(0, 7, 99));
    auto after = state.snapshot();

    EXPECT_EQ(before->channels[0].controls[7], -1);
    EXPECT_EQ(after->channels[0].controls[7], 99);
}

TEST(StateTest, RefreshFocusQueriesAdapter) {
    FakeFocus focus;
    focus.window = WindowInfo{"firefox", "Mozilla Firefox"};

    State state(&focus);
    EXPECT_FALSE(state.snapshot()->window.has_value());

    state.refresh_focus();
    EXPECT_EQ(focus.calls, 1);
    ASSERT_TRUE(state.snapshot()->window.has_value());
    EXPECT_EQ(state.snapshot()->window->window_class, "firefox");
    EXPECT_TRUE(state.matches_scope(class_scope("firefox")));

    focus.window.reset();
    state.refresh_focus();
    EXPECT_FALSE(state.snapshot()->window.has_value());
}

TEST(StateTest, RefreshWithoutAdapterKeepsFocus) {
    State state;
    state.set_focus(WindowInfo{"xterm", "bash"});
    state.refresh_focus();
    ASSERT_TRUE(state.snapshot()->window.has_value());
    EXPECT_EQ(state.snapshot()->window->name, "bash");
}

TEST(StateTest, ConcurrentReadersSeeWholeSnapshots) {
    State state;
    Precondition pre(rule::ControlValueCondition{std::nullopt, 1, NumberMatcher::any()});

    std::thread writer([&state] {
        for (int i = 0; i < 500; ++i) {
            state.record(MidiMessage::control_change(0, 1, static_cast<std::uint8_t>(i % 128)));
            state.record(MidiMessage::control_change(0, 2, static_cast<std::uint8_t>(i % 128)));
        }
    });

    for (int i = 0; i < 500; ++i) {
        auto snapshot = state.snapshot();
        // Контроллер 2 никогда не опережает контроллер 1 в одном снимке
        if (snapshot->channels[0].controls[2] >= 0) {
            EXPECT_GE(snapshot->channels[0].controls[1], 0);
        }
    }
    writer.join();

    EXPECT_TRUE(state.matches(pre));
}

}  // namespace midimacro::state::test
