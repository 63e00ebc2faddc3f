// ==============================================================================
// midimacro/macro.hpp - Macro (неизменяемое правило) и MacroBuilder
// ==============================================================================
//
// Macro = имя + сопоставители событий (OR) + предусловия (AND) + scope +
// список действий. После build() макрос не изменяется.
//
// Порядок проверок в evaluate(): scope → предусловия → события.
//
// ==============================================================================

#ifndef MIDIMACRO_MACRO_HPP
#define MIDIMACRO_MACRO_HPP

#include <midimacro/action.hpp>
#include <midimacro/event.hpp>
#include <midimacro/precondition.hpp>
#include <midimacro/state.hpp>
#include <optional>
#include <string>
#include <vector>

namespace midimacro::rule {

class MacroBuilder;

// ============================================================================
// Macro
// ============================================================================

class Macro {
public:
    /// Имя макроса (nullptr если не задано)
    const std::string* name() const { return name_ ? &*name_ : nullptr; }

    const std::vector<EventMatcher>& match_events() const { return match_events_; }

    const std::optional<std::vector<Precondition>>& required_preconditions() const {
        return required_preconditions_;
    }

    const std::optional<Scope>& scope() const { return scope_; }

    const action::ActionVec& actions() const { return actions_; }

    /// Вычислить событие против макроса.
    /// @return указатель на действия макроса при совпадении, иначе nullptr.
    ///         Действиями по-прежнему владеет макрос.
    const action::ActionVec* evaluate(const Event& event, const state::Snapshot& state) const;

    /// Совпадает ли событие хотя бы с одним сопоставителем
    bool matches_event(const Event& event, const state::Snapshot& state) const;

private:
    friend class MacroBuilder;

    Macro() = default;

    std::optional<std::string> name_;
    std::vector<EventMatcher> match_events_;
    std::optional<std::vector<Precondition>> required_preconditions_;
    std::optional<Scope> scope_;
    action::ActionVec actions_;
};

// ============================================================================
// MacroBuilder
// ============================================================================

/// Изменяемая заготовка макроса. build() переносит содержимое в новый Macro;
/// после этого заготовка считается израсходованной.
class MacroBuilder {
public:
    MacroBuilder() = default;

    static MacroBuilder from_event_matcher(EventMatcher matcher);
    static MacroBuilder from_event_matchers(std::vector<EventMatcher> matchers);

    MacroBuilder& set_name(std::string name);
    MacroBuilder& set_event_matchers(std::vector<EventMatcher> matchers);
    MacroBuilder& add_event_matcher(EventMatcher matcher);
    MacroBuilder& set_preconditions(std::vector<Precondition> preconditions);
    MacroBuilder& add_precondition(Precondition precondition);
    MacroBuilder& set_scope(Scope scope);
    MacroBuilder& set_actions(action::ActionVec actions);
    MacroBuilder& add_action(action::Action action);

    /// @throw std::invalid_argument если нет ни одного сопоставителя событий
    /// @throw std::logic_error если build() уже вызывался
    Macro build();

    bool consumed() const { return consumed_; }

private:
    Macro staged_;
    bool consumed_ = false;
};

}  // namespace midimacro::rule

#endif  // MIDIMACRO_MACRO_HPP
