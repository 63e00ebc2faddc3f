// ==============================================================================
// test_macro_gtest.cpp - Тесты Macro / MacroBuilder (GoogleTest)
// ==============================================================================

#include <gtest/gtest.h>
#include <midimacro/macro.hpp>
#include <stdexcept>

namespace midimacro::rule::test {

using match::NumberMatcher;
using match::StringMatcher;
using midi::MidiMessage;

namespace {

EventMatcher cc(int control) {
    return MidiEventMatcher::control_change(std::nullopt, NumberMatcher::val(control),
                                            std::nullopt);
}

Scope firefox_scope() {
    Scope scope;
    scope.window_class = StringMatcher::equals("firefox");
    return scope;
}

}  // namespace

// ==============================================================================
// MacroBuilder
// ==============================================================================

TEST(MacroBuilderTest, BuildMovesStagedFields) {
    auto builder = MacroBuilder::from_event_matcher(cc(7));
    builder.set_name("Volume")
        .add_event_matcher(cc(8))
        .add_precondition(Precondition(NoteActiveCondition{}))
        .set_scope(firefox_scope())
        .add_action(action::Action::key_sequence("a"))
        .add_action(action::Action::enter_text("b"));

    Macro macro = builder.build();
    ASSERT_NE(macro.name(), nullptr);
    EXPECT_EQ(*macro.name(), "Volume");
    EXPECT_EQ(macro.match_events().size(), 2u);
    ASSERT_TRUE(macro.required_preconditions().has_value());
    EXPECT_EQ(macro.required_preconditions()->size(), 1u);
    EXPECT_TRUE(macro.scope().has_value());
    EXPECT_EQ(macro.actions().size(), 2u);
    EXPECT_TRUE(builder.consumed());
}

TEST(MacroBuilderTest, OptionalPartsStayAbsent) {
    Macro macro = MacroBuilder::from_event_matcher(cc(1)).build();
    EXPECT_EQ(macro.name(), nullptr);
    EXPECT_FALSE(macro.required_preconditions().has_value());
    EXPECT_FALSE(macro.scope().has_value());
    EXPECT_TRUE(macro.actions().empty());
}

TEST(MacroBuilderTest, EmptyMatchersRejected) {
    MacroBuilder builder;
    builder.set_name("nothing");
    EXPECT_THROW(builder.build(), std::invalid_argument);

    auto from_empty = MacroBuilder::from_event_matchers({});
    EXPECT_THROW(from_empty.build(), std::invalid_argument);
}

TEST(MacroBuilderTest, SecondBuildRejected) {
    auto builder = MacroBuilder::from_event_matcher(cc(1));
    builder.build();
    EXPECT_THROW(builder.build(), std::logic_error);
}

TEST(MacroBuilderTest, SetEventMatchersReplaces) {
    auto builder = MacroBuilder::from_event_matchers({cc(1), cc(2)});
    builder.set_event_matchers({cc(3)});
    Macro macro = builder.build();
    ASSERT_EQ(macro.match_events().size(), 1u);
    EXPECT_EQ(describe(macro.match_events()[0]), "midi control_change control=3");
}

// ==============================================================================
// Macro::evaluate
// ==============================================================================

TEST(MacroTest, MatchesAnyEventMatcher) {
    Macro macro = MacroBuilder::from_event_matchers({cc(7), cc(8)})
                      .add_action(action::Action::key_sequence("a"))
                      .build();
    state::Snapshot snapshot;

    auto seven = MidiMessage::control_change(0, 7, 1);
    auto eight = MidiMessage::control_change(0, 8, 1);
    auto nine = MidiMessage::control_change(0, 9, 1);

    const auto* actions = macro.evaluate(make_event(seven), snapshot);
    ASSERT_NE(actions, nullptr);
    EXPECT_EQ(actions, &macro.actions());
    EXPECT_NE(macro.evaluate(make_event(eight), snapshot), nullptr);
    EXPECT_EQ(macro.evaluate(make_event(nine), snapshot), nullptr);
}

TEST(MacroTest, ScopeGatesMatch) {
    Macro macro = MacroBuilder::from_event_matcher(cc(7)).set_scope(firefox_scope()).build();
    auto msg = MidiMessage::control_change(0, 7, 1);

    state::Snapshot no_focus;
    EXPECT_EQ(macro.evaluate(make_event(msg), no_focus), nullptr);

    state::Snapshot xterm;
    xterm.window = state::WindowInfo{"xterm", "bash"};
    EXPECT_EQ(macro.evaluate(make_event(msg), xterm), nullptr);

    state::Snapshot firefox;
    firefox.window = state::WindowInfo{"firefox", "Mozilla Firefox"};
    EXPECT_NE(macro.evaluate(make_event(msg), firefox), nullptr);
}

TEST(MacroTest, AllPreconditionsRequired) {
    Macro macro =
        MacroBuilder::from_event_matcher(cc(7))
            .add_precondition(
                Precondition(ControlValueCondition{std::nullopt, 8, NumberMatcher::range(64, 127)}))
            .add_precondition(
                Precondition(NoteActiveCondition{std::nullopt, NumberMatcher::val(36)}))
            .build();
    auto msg = MidiMessage::control_change(0, 7, 1);

    state::Snapshot snapshot;
    snapshot.apply(MidiMessage::control_change(0, 8, 100));
    EXPECT_EQ(macro.evaluate(make_event(msg), snapshot), nullptr);

    snapshot.apply(MidiMessage::note_on(0, 36, 100));
    EXPECT_NE(macro.evaluate(make_event(msg), snapshot), nullptr);
}

TEST(MacroTest, EmptyPreconditionListPasses) {
    Macro macro = MacroBuilder::from_event_matcher(cc(7)).set_preconditions({}).build();
    ASSERT_TRUE(macro.required_preconditions().has_value());

    state::Snapshot snapshot;
    auto msg = MidiMessage::control_change(0, 7, 1);
    EXPECT_NE(macro.evaluate(make_event(msg), snapshot), nullptr);
}

TEST(MacroTest, EvaluateDoesNotChangeMacro) {
    Macro macro = MacroBuilder::from_event_matcher(cc(7))
                      .add_action(action::Action::enter_text("x", 2))
                      .build();
    state::Snapshot snapshot;
    auto msg = MidiMessage::control_change(0, 7, 1);

    const auto* first = macro.evaluate(make_event(msg), snapshot);
    const auto* second = macro.evaluate(make_event(msg), snapshot);
    EXPECT_EQ(first, second);
    EXPECT_EQ(macro.actions()[0].get_enter_text()->count, 2u);
}

}  // namespace midimacro::rule::test
