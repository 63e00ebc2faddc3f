// ==============================================================================
// test_event_gtest.cpp - Тесты сопоставителей событий (GoogleTest)
// ==============================================================================

#include <gtest/gtest.h>
#include <midimacro/event.hpp>
#include <midimacro/state.hpp>

namespace midimacro::rule::test {

using match::NumberMatcher;
using midi::MidiMessage;

namespace {

bool event_matches(const EventMatcher& matcher, const MidiMessage& msg) {
    state::Snapshot snapshot;
    return matches(matcher, make_event(msg), snapshot);
}

}  // namespace

// ==============================================================================
// MidiEventMatcher
// ==============================================================================

TEST(EventMatcherTest, KindMustMatch) {
    auto m = MidiEventMatcher::control_change(std::nullopt, std::nullopt, std::nullopt);
    EXPECT_TRUE(m.matches(MidiMessage::control_change(0, 7, 40)));
    EXPECT_FALSE(m.matches(MidiMessage::note_on(0, 7, 40)));
}

TEST(EventMatcherTest, AbsentFieldsAreDontCare) {
    auto m = MidiEventMatcher::note_on(std::nullopt, std::nullopt, std::nullopt);
    EXPECT_TRUE(m.matches(MidiMessage::note_on(15, 0, 1)));
    EXPECT_TRUE(m.matches(MidiMessage::note_on(3, 127, 127)));
}

TEST(EventMatcherTest, FieldsCombineWithAnd) {
    auto m = MidiEventMatcher::control_change(NumberMatcher::val(0), NumberMatcher::val(7),
                                              NumberMatcher::range(0, 63));
    EXPECT_TRUE(m.matches(MidiMessage::control_change(0, 7, 40)));
    EXPECT_TRUE(m.matches(MidiMessage::control_change(0, 7, 63)));
    EXPECT_FALSE(m.matches(MidiMessage::control_change(0, 7, 100)));
    EXPECT_FALSE(m.matches(MidiMessage::control_change(1, 7, 40)));
    EXPECT_FALSE(m.matches(MidiMessage::control_change(0, 8, 40)));
}

TEST(EventMatcherTest, ProgramChange) {
    auto m = MidiEventMatcher::program_change(std::nullopt, NumberMatcher::range(10, 20));
    EXPECT_TRUE(m.matches(MidiMessage::program_change(4, 10)));
    EXPECT_FALSE(m.matches(MidiMessage::program_change(4, 21)));
}

TEST(EventMatcherTest, PitchBendUsesFullRange) {
    auto m = MidiEventMatcher::pitch_bend(std::nullopt, NumberMatcher::range(8192, 16383));
    EXPECT_TRUE(m.matches(MidiMessage::pitch_bend(0, 16000)));
    EXPECT_FALSE(m.matches(MidiMessage::pitch_bend(0, 100)));
}

TEST(EventMatcherTest, Describe) {
    auto cc = MidiEventMatcher::control_change(NumberMatcher::any(), NumberMatcher::val(7),
                                               NumberMatcher::range(0, 63));
    EXPECT_EQ(cc.describe(), "midi control_change channel=any control=7 value=0..63");

    auto note = MidiEventMatcher::note_on(std::nullopt, NumberMatcher::val(60), std::nullopt);
    EXPECT_EQ(note.describe(), "midi note_on note=60");

    auto program = MidiEventMatcher::program_change(std::nullopt, NumberMatcher::any());
    EXPECT_EQ(program.describe(), "midi program_change program=any");
}

// ==============================================================================
// EventMatcher / Event
// ==============================================================================

TEST(EventMatcherTest, VariantDispatch) {
    EventMatcher matcher =
        MidiEventMatcher::note_off(std::nullopt, NumberMatcher::val(36), std::nullopt);
    EXPECT_TRUE(event_matches(matcher, MidiMessage::note_off(9, 36, 0)));
    EXPECT_FALSE(event_matches(matcher, MidiMessage::note_on(9, 36, 100)));
    EXPECT_EQ(describe(matcher), "midi note_off note=36");
}

TEST(EventMatcherTest, StateDoesNotAffectFieldMatch) {
    EventMatcher matcher =
        MidiEventMatcher::control_change(std::nullopt, NumberMatcher::val(7), std::nullopt);
    auto msg = MidiMessage::control_change(0, 7, 10);

    state::Snapshot empty;
    state::Snapshot busy;
    busy.apply(MidiMessage::note_on(0, 60, 100));
    busy.window = state::WindowInfo{"xterm", "bash"};

    EXPECT_TRUE(matches(matcher, make_event(msg), empty));
    EXPECT_TRUE(matches(matcher, make_event(msg), busy));
}

TEST(EventMatcherTest, NullEventNeverMatches) {
    EventMatcher matcher = MidiEventMatcher::note_on(std::nullopt, std::nullopt, std::nullopt);
    state::Snapshot snapshot;
    EXPECT_FALSE(matches(matcher, Event{MidiEvent{nullptr}}, snapshot));
}

}  // namespace midimacro::rule::test
