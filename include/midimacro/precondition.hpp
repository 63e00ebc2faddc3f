// ==============================================================================
// midimacro/precondition.hpp - Scope и Precondition (гейты макроса)
// ==============================================================================
//
// Назначение:
// - Scope: ограничение по активному окну (класс и/или заголовок)
// - Precondition: именованный предикат над состоянием устройства,
//   не зависящий от события-триггера
//
// Вычисление выполняет state::Snapshot (matches_scope / matches); здесь только
// неизменяемые описания.
//
// ==============================================================================

#ifndef MIDIMACRO_PRECONDITION_HPP
#define MIDIMACRO_PRECONDITION_HPP

#include <cstdint>
#include <midimacro/match.hpp>
#include <optional>
#include <string>
#include <variant>

namespace midimacro::rule {

// ============================================================================
// Scope
// ============================================================================

/// Оба поля пусты → глобальный scope (любое окно)
struct Scope {
    std::optional<match::StringMatcher> window_class;
    std::optional<match::StringMatcher> window_name;

    bool is_global() const { return !window_class && !window_name; }

    std::string describe() const;
};

// ============================================================================
// Условия
// ============================================================================

/// Последнее значение контроллера на подходящем канале попадает в value
struct ControlValueCondition {
    std::optional<match::NumberMatcher> channel;
    std::uint8_t control = 0;
    match::NumberMatcher value = match::NumberMatcher::any();
};

/// На подходящем канале удерживается хотя бы одна подходящая нота
struct NoteActiveCondition {
    std::optional<match::NumberMatcher> channel;
    match::NumberMatcher note = match::NumberMatcher::any();
};

/// Последняя выбранная программа на подходящем канале
struct ProgramCondition {
    std::optional<match::NumberMatcher> channel;
    match::NumberMatcher program = match::NumberMatcher::any();
};

/// Последнее значение pitch bend на подходящем канале
struct PitchBendCondition {
    std::optional<match::NumberMatcher> channel;
    match::NumberMatcher value = match::NumberMatcher::any();
};

using Condition = std::variant<ControlValueCondition, NoteActiveCondition, ProgramCondition,
                               PitchBendCondition>;

// ============================================================================
// Precondition
// ============================================================================

class Precondition {
public:
    explicit Precondition(Condition condition, bool invert = false)
        : condition_(std::move(condition)), invert_(invert) {}

    const Condition& condition() const { return condition_; }

    /// Результат условия инвертируется
    bool inverted() const { return invert_; }

    /// Имя условия: "control_value", "note_active", "program", "pitch_bend"
    const char* name() const;

    std::string describe() const;

private:
    Condition condition_;
    bool invert_ = false;
};

}  // namespace midimacro::rule

#endif  // MIDIMACRO_PRECONDITION_HPP
