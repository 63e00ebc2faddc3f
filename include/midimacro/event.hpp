// ==============================================================================
// midimacro/event.hpp - События и сопоставители событий
// ==============================================================================
//
// Назначение:
// - Event: закрытый вариант источников событий (сейчас только MIDI)
// - EventMatcher: вариант сопоставителей, по одному семейству на источник
// - MidiEventMatcher: тип сообщения + необязательные NumberMatcher по полям
//
// Внутри одного сопоставителя поля объединяются по AND; отсутствующий
// matcher поля означает "не важно".
//
// ==============================================================================

#ifndef MIDIMACRO_EVENT_HPP
#define MIDIMACRO_EVENT_HPP

#include <midimacro/match.hpp>
#include <midimacro/midi.hpp>
#include <midimacro/state.hpp>
#include <optional>
#include <string>
#include <variant>

namespace midimacro::rule {

// ============================================================================
// Event
// ============================================================================

/// MIDI событие: ссылка на неизменяемое сообщение (не владеет им)
struct MidiEvent {
    const midi::MidiMessage* message;
};

using Event = std::variant<MidiEvent>;

inline Event make_event(const midi::MidiMessage& message) {
    return MidiEvent{&message};
}

// ============================================================================
// MidiEventMatcher
// ============================================================================

/// Сопоставитель MIDI сообщения одного типа.
/// primary/secondary соответствуют полям midi::MidiMessage (см. midi.hpp).
struct MidiEventMatcher {
    midi::MessageKind kind = midi::MessageKind::ControlChange;
    std::optional<match::NumberMatcher> channel;
    std::optional<match::NumberMatcher> primary;
    std::optional<match::NumberMatcher> secondary;

    using Field = std::optional<match::NumberMatcher>;

    static MidiEventMatcher note_on(Field channel, Field note, Field velocity);
    static MidiEventMatcher note_off(Field channel, Field note, Field velocity);
    static MidiEventMatcher key_pressure(Field channel, Field note, Field value);
    static MidiEventMatcher control_change(Field channel, Field control, Field value);
    static MidiEventMatcher program_change(Field channel, Field program);
    static MidiEventMatcher channel_pressure(Field channel, Field value);
    static MidiEventMatcher pitch_bend(Field channel, Field value);

    bool matches(const midi::MidiMessage& msg) const;

    std::string describe() const;
};

// ============================================================================
// EventMatcher
// ============================================================================

using EventMatcher = std::variant<MidiEventMatcher>;

/// Проверить событие. Состояние передаётся для будущих сопоставителей,
/// зависящих от истории; поля события сравниваются без него.
bool matches(const EventMatcher& matcher, const Event& event, const state::Snapshot& state);

std::string describe(const EventMatcher& matcher);

}  // namespace midimacro::rule

#endif  // MIDIMACRO_EVENT_HPP
