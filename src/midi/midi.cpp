// ==============================================================================
// midi.cpp - MIDI сообщения и декодер
// ==============================================================================

#include <midimacro/midi.hpp>
#include <sstream>

namespace midimacro::midi {

// ============================================================================
// MessageKind
// ============================================================================

const char* message_kind_to_string(MessageKind kind) {
    switch (kind) {
    case MessageKind::NoteOff:
        return "note_off";
    case MessageKind::NoteOn:
        return "note_on";
    case MessageKind::KeyPressure:
        return "key_pressure";
    case MessageKind::ControlChange:
        return "control_change";
    case MessageKind::ProgramChange:
        return "program_change";
    case MessageKind::ChannelPressure:
        return "channel_pressure";
    case MessageKind::PitchBend:
        return "pitch_bend";
    }
    return "unknown";
}

std::optional<MessageKind> parse_message_kind(std::string_view s) {
    if (s == "note_off")
        return MessageKind::NoteOff;
    if (s == "note_on")
        return MessageKind::NoteOn;
    if (s == "key_pressure")
        return MessageKind::KeyPressure;
    if (s == "control_change")
        return MessageKind::ControlChange;
    if (s == "program_change")
        return MessageKind::ProgramChange;
    if (s == "channel_pressure")
        return MessageKind::ChannelPressure;
    if (s == "pitch_bend")
        return MessageKind::PitchBend;
    return std::nullopt;
}

// ============================================================================
// MidiMessage
// ============================================================================

MidiMessage MidiMessage::note_on(std::uint8_t channel, std::uint8_t note, std::uint8_t velocity) {
    return MidiMessage{MessageKind::NoteOn, channel, note, velocity};
}

MidiMessage MidiMessage::note_off(std::uint8_t channel, std::uint8_t note, std::uint8_t velocity) {
    return MidiMessage{MessageKind::NoteOff, channel, note, velocity};
}

MidiMessage MidiMessage::key_pressure(std::uint8_t channel, std::uint8_t note,
                                      std::uint8_t value) {
    return MidiMessage{MessageKind::KeyPressure, channel, note, value};
}

MidiMessage MidiMessage::control_change(std::uint8_t channel, std::uint8_t control,
                                        std::uint8_t value) {
    return MidiMessage{MessageKind::ControlChange, channel, control, value};
}

MidiMessage MidiMessage::program_change(std::uint8_t channel, std::uint8_t program) {
    return MidiMessage{MessageKind::ProgramChange, channel, program, 0};
}

MidiMessage MidiMessage::channel_pressure(std::uint8_t channel, std::uint8_t value) {
    return MidiMessage{MessageKind::ChannelPressure, channel, value, 0};
}

MidiMessage MidiMessage::pitch_bend(std::uint8_t channel, std::uint16_t value) {
    return MidiMessage{MessageKind::PitchBend, channel, value, 0};
}

namespace {

// Имена полей primary/secondary для каждого типа
struct FieldNames {
    const char* primary;
    const char* secondary;  // nullptr если поле не используется
};

FieldNames field_names(MessageKind kind) {
    switch (kind) {
    case MessageKind::NoteOff:
    case MessageKind::NoteOn:
        return {"note", "velocity"};
    case MessageKind::KeyPressure:
        return {"note", "value"};
    case MessageKind::ControlChange:
        return {"control", "value"};
    case MessageKind::ProgramChange:
        return {"program", nullptr};
    case MessageKind::ChannelPressure:
    case MessageKind::PitchBend:
        return {"value", nullptr};
    }
    return {"value", nullptr};
}

}  // namespace

std::string describe(const MidiMessage& msg) {
    FieldNames names = field_names(msg.kind);
    std::ostringstream oss;
    oss << message_kind_to_string(msg.kind) << " ch=" << static_cast<int>(msg.channel) << ' '
        << names.primary << '=' << msg.primary;
    if (names.secondary != nullptr) {
        oss << ' ' << names.secondary << '=' << static_cast<int>(msg.secondary);
    }
    return oss.str();
}

Value to_value(const MidiMessage& msg) {
    FieldNames names = field_names(msg.kind);
    Value::Object obj;
    obj["message_type"] = Value(message_kind_to_string(msg.kind));
    obj["channel"] = Value(static_cast<std::int64_t>(msg.channel));
    obj[names.primary] = Value(static_cast<std::int64_t>(msg.primary));
    if (names.secondary != nullptr) {
        obj[names.secondary] = Value(static_cast<std::int64_t>(msg.secondary));
    }
    return Value(std::move(obj));
}

// ============================================================================
// Decoder
// ============================================================================

namespace {

// Количество байтов данных для канального статуса
std::size_t data_length(std::uint8_t status) {
    switch (status & 0xF0) {
    case 0xC0:
    case 0xD0:
        return 1;
    default:
        return 2;
    }
}

// Количество байтов данных system common сообщения
std::size_t common_length(std::uint8_t status) {
    switch (status) {
    case 0xF1:  // MTC quarter frame
    case 0xF3:  // song select
        return 1;
    case 0xF2:  // song position
        return 2;
    default:
        return 0;
    }
}

MidiMessage make_message(std::uint8_t status, const std::uint8_t* data) {
    auto channel = static_cast<std::uint8_t>(status & 0x0F);
    switch (status & 0xF0) {
    case 0x80:
        return MidiMessage::note_off(channel, data[0], data[1]);
    case 0x90:
        return MidiMessage::note_on(channel, data[0], data[1]);
    case 0xA0:
        return MidiMessage::key_pressure(channel, data[0], data[1]);
    case 0xB0:
        return MidiMessage::control_change(channel, data[0], data[1]);
    case 0xC0:
        return MidiMessage::program_change(channel, data[0]);
    case 0xD0:
        return MidiMessage::channel_pressure(channel, data[0]);
    default:
        // 0xE0: LSB, MSB
        return MidiMessage::pitch_bend(
            channel, static_cast<std::uint16_t>(data[0] | (static_cast<unsigned>(data[1]) << 7)));
    }
}

}  // namespace

std::optional<MidiMessage> Decoder::feed(std::uint8_t byte) {
    // System real-time: могут появляться внутри любого сообщения
    if (byte >= 0xF8) {
        return std::nullopt;
    }

    if (byte & 0x80) {
        if (byte == 0xF7) {
            // Конец SysEx
            in_sysex_ = false;
            return std::nullopt;
        }
        if (byte >= 0xF0) {
            // SysEx и system common сбрасывают running status
            status_ = 0;
            data_count_ = 0;
            in_sysex_ = (byte == 0xF0);
            skip_common_ = common_length(byte);
            return std::nullopt;
        }
        status_ = byte;
        data_count_ = 0;
        in_sysex_ = false;
        skip_common_ = 0;
        return std::nullopt;
    }

    // Байт данных
    if (in_sysex_) {
        return std::nullopt;
    }
    if (skip_common_ > 0) {
        --skip_common_;
        return std::nullopt;
    }
    if (status_ == 0) {
        return std::nullopt;
    }

    data_[data_count_++] = byte;
    if (data_count_ < data_length(status_)) {
        return std::nullopt;
    }

    data_count_ = 0;
    return make_message(status_, data_);
}

void Decoder::feed(const std::uint8_t* data, std::size_t size, std::vector<MidiMessage>& out) {
    for (std::size_t i = 0; i < size; ++i) {
        if (auto msg = feed(data[i])) {
            out.push_back(*msg);
        }
    }
}

void Decoder::reset() {
    status_ = 0;
    data_count_ = 0;
    in_sysex_ = false;
    skip_common_ = 0;
}

}  // namespace midimacro::midi
