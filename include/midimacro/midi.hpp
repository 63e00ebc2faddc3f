// ==============================================================================
// midimacro/midi.hpp - Модель MIDI сообщений и декодер потока байтов
// ==============================================================================
//
// Назначение:
// - MidiMessage: неизменяемая запись {kind, channel, primary, secondary}
// - Decoder: поток байтов (с running status) → MidiMessage
// - Представление сообщения как Value (для JSON вывода monitor)
//
// Значения полей по типам:
//   NoteOff/NoteOn       primary = нота,       secondary = velocity
//   KeyPressure          primary = нота,       secondary = давление
//   ControlChange        primary = контроллер, secondary = значение
//   ProgramChange        primary = программа,  secondary = 0
//   ChannelPressure      primary = давление,   secondary = 0
//   PitchBend            primary = 0..16383,   secondary = 0
//
// ==============================================================================

#ifndef MIDIMACRO_MIDI_HPP
#define MIDIMACRO_MIDI_HPP

#include <cstdint>
#include <midimacro/value.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace midimacro::midi {

/// Количество MIDI каналов
constexpr int CHANNEL_COUNT = 16;

/// Центр pitch bend (без отклонения)
constexpr std::uint16_t PITCH_BEND_CENTER = 8192;

/// Тип канального сообщения (старший полубайт статуса)
enum class MessageKind {
    NoteOff,          // 0x8n
    NoteOn,           // 0x9n
    KeyPressure,      // 0xAn (polyphonic aftertouch)
    ControlChange,    // 0xBn
    ProgramChange,    // 0xCn
    ChannelPressure,  // 0xDn
    PitchBend         // 0xEn
};

/// Имя типа сообщения ("note_on", "control_change", ...)
const char* message_kind_to_string(MessageKind kind);

/// Разобрать имя типа сообщения
std::optional<MessageKind> parse_message_kind(std::string_view s);

/// Канальное MIDI сообщение
struct MidiMessage {
    MessageKind kind = MessageKind::NoteOn;
    std::uint8_t channel = 0;     // 0..15
    std::uint16_t primary = 0;    // 0..127 (0..16383 для PitchBend)
    std::uint8_t secondary = 0;   // 0..127

    static MidiMessage note_on(std::uint8_t channel, std::uint8_t note, std::uint8_t velocity);
    static MidiMessage note_off(std::uint8_t channel, std::uint8_t note, std::uint8_t velocity);
    static MidiMessage key_pressure(std::uint8_t channel, std::uint8_t note, std::uint8_t value);
    static MidiMessage control_change(std::uint8_t channel, std::uint8_t control,
                                      std::uint8_t value);
    static MidiMessage program_change(std::uint8_t channel, std::uint8_t program);
    static MidiMessage channel_pressure(std::uint8_t channel, std::uint8_t value);
    static MidiMessage pitch_bend(std::uint8_t channel, std::uint16_t value);

    bool operator==(const MidiMessage& other) const {
        return kind == other.kind && channel == other.channel && primary == other.primary &&
               secondary == other.secondary;
    }
    bool operator!=(const MidiMessage& other) const { return !(*this == other); }
};

/// Человекочитаемое описание: "control_change ch=0 control=7 value=40"
std::string describe(const MidiMessage& msg);

/// Представление сообщения как объект Value (для JSON вывода)
Value to_value(const MidiMessage& msg);

// ----------------------------------------------------------------------------
// Decoder - декодер потока байтов
// ----------------------------------------------------------------------------

/// Декодирует поток MIDI байтов в канальные сообщения.
/// Поддерживает running status; system real-time байты (0xF8..0xFF)
/// пропускаются, SysEx (0xF0..0xF7) и system common сообщения отбрасываются.
class Decoder {
public:
    /// Подать один байт; возвращает сообщение, если оно завершено
    std::optional<MidiMessage> feed(std::uint8_t byte);

    /// Подать буфер байтов; завершённые сообщения добавляются в out
    void feed(const std::uint8_t* data, std::size_t size, std::vector<MidiMessage>& out);

    /// Сбросить состояние (running status, незавершённое сообщение)
    void reset();

private:
    std::uint8_t status_ = 0;  // текущий running status (0 = нет)
    std::uint8_t data_[2] = {0, 0};
    std::size_t data_count_ = 0;
    bool in_sysex_ = false;
    std::size_t skip_common_ = 0;  // байты данных system common для пропуска
};

}  // namespace midimacro::midi

#endif  // MIDIMACRO_MIDI_HPP
