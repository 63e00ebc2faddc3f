// ==============================================================================
// macro.cpp - Macro / MacroBuilder
// ==============================================================================

#include <algorithm>
#include <midimacro/macro.hpp>
#include <stdexcept>

namespace midimacro::rule {

// ============================================================================
// Macro
// ============================================================================

const action::ActionVec* Macro::evaluate(const Event& event, const state::Snapshot& state) const {
    if (!state.matches_scope(scope_)) {
        return nullptr;
    }

    if (required_preconditions_) {
        for (const auto& condition : *required_preconditions_) {
            if (!state.matches(condition)) {
                return nullptr;
            }
        }
    }

    if (!matches_event(event, state)) {
        return nullptr;
    }

    return &actions_;
}

bool Macro::matches_event(const Event& event, const state::Snapshot& state) const {
    return std::any_of(match_events_.begin(), match_events_.end(),
                       [&](const EventMatcher& m) { return matches(m, event, state); });
}

// ============================================================================
// MacroBuilder
// ============================================================================

MacroBuilder MacroBuilder::from_event_matcher(EventMatcher matcher) {
    MacroBuilder builder;
    builder.staged_.match_events_.push_back(std::move(matcher));
    return builder;
}

MacroBuilder MacroBuilder::from_event_matchers(std::vector<EventMatcher> matchers) {
    MacroBuilder builder;
    builder.staged_.match_events_ = std::move(matchers);
    return builder;
}

MacroBuilder& MacroBuilder::set_name(std::string name) {
    staged_.name_ = std::move(name);
    return *this;
}

MacroBuilder& MacroBuilder::set_event_matchers(std::vector<EventMatcher> matchers) {
    staged_.match_events_ = std::move(matchers);
    return *this;
}

MacroBuilder& MacroBuilder::add_event_matcher(EventMatcher matcher) {
    staged_.match_events_.push_back(std::move(matcher));
    return *this;
}

MacroBuilder& MacroBuilder::set_preconditions(std::vector<Precondition> preconditions) {
    staged_.required_preconditions_ = std::move(preconditions);
    return *this;
}

MacroBuilder& MacroBuilder::add_precondition(Precondition precondition) {
    if (!staged_.required_preconditions_) {
        staged_.required_preconditions_.emplace();
    }
    staged_.required_preconditions_->push_back(std::move(precondition));
    return *this;
}

MacroBuilder& MacroBuilder::set_scope(Scope scope) {
    staged_.scope_ = std::move(scope);
    return *this;
}

MacroBuilder& MacroBuilder::set_actions(action::ActionVec actions) {
    staged_.actions_ = std::move(actions);
    return *this;
}

MacroBuilder& MacroBuilder::add_action(action::Action action) {
    staged_.actions_.push_back(std::move(action));
    return *this;
}

Macro MacroBuilder::build() {
    if (consumed_) {
        throw std::logic_error("MacroBuilder::build() called twice");
    }
    if (staged_.match_events_.empty()) {
        throw std::invalid_argument("macro must have at least one event matcher");
    }
    consumed_ = true;
    return std::move(staged_);
}

}  // namespace midimacro::rule
