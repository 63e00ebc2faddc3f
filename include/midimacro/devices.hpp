// ==============================================================================
// midimacro/devices.hpp - Адаптеры платформы (MIDI, клавиатура, фокус, процессы)
// ==============================================================================
//
// Назначение:
// - MidiAdapter: перечисление портов и приём сообщений в engine::MessageQueue
// - RawMidiAdapter: ALSA rawmidi через /dev/snd/midiC*D* (без libasound)
// - XdotoolKeyboard / XdotoolFocus: синтез ввода и активное окно через xdotool
// - PosixProcessSpawner: запуск Shell действий (platform::run_process)
// - DryRun*: только логируют, ничего не исполняя (--dry-run)
//
// Фабрики make_* возвращают nullptr, если бэкенд недоступен.
//
// ==============================================================================

#ifndef MIDIMACRO_DEVICES_HPP
#define MIDIMACRO_DEVICES_HPP

#include <atomic>
#include <filesystem>
#include <memory>
#include <midimacro/action.hpp>
#include <midimacro/engine.hpp>
#include <midimacro/state.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace midimacro::output {
class Writer;
}

namespace midimacro::devices {

// ============================================================================
// MIDI
// ============================================================================

struct MidiPort {
    std::string name;             // "<card id> (hw:<card>,<device>)"
    std::filesystem::path device; // /dev/snd/midiC<card>D<device>
    int card = 0;
    int device_index = 0;
};

struct ListenResult {
    bool ok = false;
    MidiPort port;
    std::string error;

    explicit operator bool() const { return ok; }
};

class MidiAdapter {
public:
    virtual ~MidiAdapter() = default;

    /// Доступные входные порты (отсортированы по card/device)
    virtual std::vector<MidiPort> list_ports() = 0;

    /// Начать приём с первого порта, имя которого содержит port_pattern
    /// (без учёта регистра). Сообщения помещаются в queue по порядку.
    virtual ListenResult start_listening(std::string_view port_pattern,
                                         engine::MessageQueue& queue) = 0;

    /// Остановить приём. Безопасно вызывать повторно и из потока движка.
    virtual void stop_listening() = 0;
};

class RawMidiAdapter : public MidiAdapter {
public:
    RawMidiAdapter(output::Writer& writer, std::filesystem::path dev_dir = "/dev/snd",
                   std::filesystem::path proc_dir = "/proc/asound");
    ~RawMidiAdapter() override;

    RawMidiAdapter(const RawMidiAdapter&) = delete;
    RawMidiAdapter& operator=(const RawMidiAdapter&) = delete;

    std::vector<MidiPort> list_ports() override;

    ListenResult start_listening(std::string_view port_pattern,
                                 engine::MessageQueue& queue) override;

    void stop_listening() override;

    bool listening() const { return listening_.load(); }

private:
    void read_loop(int fd, engine::MessageQueue* queue);

    output::Writer& writer_;
    std::filesystem::path dev_dir_;
    std::filesystem::path proc_dir_;

    std::thread thread_;
    std::atomic<bool> listening_{false};
    int device_fd_ = -1;
    int wake_pipe_[2] = {-1, -1};
};

/// Разобрать имя "midiC<card>D<device>"; nullopt если не подходит
std::optional<std::pair<int, int>> parse_rawmidi_name(std::string_view filename);

/// nullptr если каталог устройств отсутствует
std::unique_ptr<MidiAdapter> make_midi_adapter(output::Writer& writer);

// ============================================================================
// xdotool
// ============================================================================

/// Задержка xdotool задаётся в миллисекундах (округление вверх)
long delay_to_millis(std::chrono::microseconds delay);

/// Разбить последовательность клавиш по пробелам: "ctrl+c ctrl+v" → {"ctrl+c", "ctrl+v"}
std::vector<std::string> split_key_sequence(std::string_view sequence);

class XdotoolKeyboard : public action::KeyboardAdapter {
public:
    explicit XdotoolKeyboard(std::filesystem::path xdotool) : xdotool_(std::move(xdotool)) {}

    bool send_key_sequence(std::string_view sequence, std::chrono::microseconds delay) override;

    bool send_text(std::string_view text, std::chrono::microseconds delay) override;

private:
    std::filesystem::path xdotool_;
};

class XdotoolFocus : public state::FocusAdapter {
public:
    explicit XdotoolFocus(std::filesystem::path xdotool) : xdotool_(std::move(xdotool)) {}

    std::optional<state::WindowInfo> focused_window() override;

private:
    std::optional<std::string> query(const char* command);

    std::filesystem::path xdotool_;
};

/// nullptr если xdotool не найден в PATH или нет $DISPLAY
std::unique_ptr<action::KeyboardAdapter> make_keyboard_adapter();
std::unique_ptr<state::FocusAdapter> make_focus_adapter();

// ============================================================================
// Процессы
// ============================================================================

class PosixProcessSpawner : public action::ProcessSpawner {
public:
    action::SpawnResult spawn(const action::Shell& shell) override;
};

// ============================================================================
// Dry run
// ============================================================================

class DryRunKeyboard : public action::KeyboardAdapter {
public:
    explicit DryRunKeyboard(output::Writer& writer) : writer_(writer) {}

    bool send_key_sequence(std::string_view sequence, std::chrono::microseconds delay) override;

    bool send_text(std::string_view text, std::chrono::microseconds delay) override;

private:
    output::Writer& writer_;
};

class DryRunSpawner : public action::ProcessSpawner {
public:
    explicit DryRunSpawner(output::Writer& writer) : writer_(writer) {}

    action::SpawnResult spawn(const action::Shell& shell) override;

private:
    output::Writer& writer_;
};

}  // namespace midimacro::devices

#endif  // MIDIMACRO_DEVICES_HPP
