// ==============================================================================
// event.cpp - Сопоставители событий
// ==============================================================================

#include <midimacro/event.hpp>

namespace midimacro::rule {

// ============================================================================
// MidiEventMatcher
// ============================================================================

MidiEventMatcher MidiEventMatcher::note_on(Field channel, Field note, Field velocity) {
    return MidiEventMatcher{midi::MessageKind::NoteOn, channel, note, velocity};
}

MidiEventMatcher MidiEventMatcher::note_off(Field channel, Field note, Field velocity) {
    return MidiEventMatcher{midi::MessageKind::NoteOff, channel, note, velocity};
}

MidiEventMatcher MidiEventMatcher::key_pressure(Field channel, Field note, Field value) {
    return MidiEventMatcher{midi::MessageKind::KeyPressure, channel, note, value};
}

MidiEventMatcher MidiEventMatcher::control_change(Field channel, Field control, Field value) {
    return MidiEventMatcher{midi::MessageKind::ControlChange, channel, control, value};
}

MidiEventMatcher MidiEventMatcher::program_change(Field channel, Field program) {
    return MidiEventMatcher{midi::MessageKind::ProgramChange, channel, program, std::nullopt};
}

MidiEventMatcher MidiEventMatcher::channel_pressure(Field channel, Field value) {
    return MidiEventMatcher{midi::MessageKind::ChannelPressure, channel, value, std::nullopt};
}

MidiEventMatcher MidiEventMatcher::pitch_bend(Field channel, Field value) {
    return MidiEventMatcher{midi::MessageKind::PitchBend, channel, value, std::nullopt};
}

bool MidiEventMatcher::matches(const midi::MidiMessage& msg) const {
    if (msg.kind != kind) {
        return false;
    }
    if (channel && !channel->matches(msg.channel)) {
        return false;
    }
    if (primary && !primary->matches(msg.primary)) {
        return false;
    }
    if (secondary && !secondary->matches(msg.secondary)) {
        return false;
    }
    return true;
}

namespace {

// Имена полей как в конфигурации
struct MatcherFieldNames {
    const char* primary;
    const char* secondary;
};

MatcherFieldNames matcher_field_names(midi::MessageKind kind) {
    switch (kind) {
    case midi::MessageKind::NoteOff:
    case midi::MessageKind::NoteOn:
        return {"note", "velocity"};
    case midi::MessageKind::KeyPressure:
        return {"note", "value"};
    case midi::MessageKind::ControlChange:
        return {"control", "value"};
    case midi::MessageKind::ProgramChange:
        return {"program", nullptr};
    case midi::MessageKind::ChannelPressure:
    case midi::MessageKind::PitchBend:
        return {"value", nullptr};
    }
    return {"value", nullptr};
}

}  // namespace

std::string MidiEventMatcher::describe() const {
    MatcherFieldNames names = matcher_field_names(kind);
    std::string text = std::string("midi ") + midi::message_kind_to_string(kind);
    if (channel) {
        text += " channel=" + channel->describe();
    }
    if (primary) {
        text += std::string(" ") + names.primary + "=" + primary->describe();
    }
    if (secondary && names.secondary != nullptr) {
        text += std::string(" ") + names.secondary + "=" + secondary->describe();
    }
    return text;
}

// ============================================================================
// EventMatcher
// ============================================================================

bool matches(const EventMatcher& matcher, const Event& event, const state::Snapshot& state) {
    (void)state;
    return std::visit(
        [](const auto& m, const auto& e) -> bool {
            using M = std::decay_t<decltype(m)>;
            using E = std::decay_t<decltype(e)>;

            if constexpr (std::is_same_v<M, MidiEventMatcher> && std::is_same_v<E, MidiEvent>) {
                return e.message != nullptr && m.matches(*e.message);
            } else {
                return false;
            }
        },
        matcher, event);
}

std::string describe(const EventMatcher& matcher) {
    return std::visit([](const auto& m) { return m.describe(); }, matcher);
}

}  // namespace midimacro::rule
