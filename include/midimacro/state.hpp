// ==============================================================================
// midimacro/state.hpp - Изменяемый контекст выполнения (окно + состояние MIDI)
// ==============================================================================
//
// Назначение:
// - Snapshot: неизменяемый снимок (активное окно, состояние каналов MIDI)
//   с запросами matches_scope / matches(precondition)
// - State: владелец текущего снимка; писатели публикуют новый снимок под
//   mutex, читатели получают shared_ptr на целый снимок (без "разрывов")
// - FocusAdapter: внешний источник информации об активном окне
//
// ==============================================================================

#ifndef MIDIMACRO_STATE_HPP
#define MIDIMACRO_STATE_HPP

#include <array>
#include <cstdint>
#include <memory>
#include <midimacro/midi.hpp>
#include <midimacro/precondition.hpp>
#include <mutex>
#include <optional>
#include <string>

namespace midimacro::state {

// ----------------------------------------------------------------------------
// Активное окно
// ----------------------------------------------------------------------------

struct WindowInfo {
    std::string window_class;
    std::string name;

    bool operator==(const WindowInfo& other) const {
        return window_class == other.window_class && name == other.name;
    }
};

/// Источник информации об активном окне (реализуется адаптером платформы)
class FocusAdapter {
public:
    virtual ~FocusAdapter() = default;

    /// Текущее активное окно; nullopt если определить не удалось
    virtual std::optional<WindowInfo> focused_window() = 0;
};

// ----------------------------------------------------------------------------
// Состояние MIDI
// ----------------------------------------------------------------------------

/// Состояние одного канала. -1 означает "значение ещё не приходило".
struct ChannelState {
    std::array<std::int16_t, 128> controls;
    std::array<std::uint8_t, 128> notes;  // velocity удерживаемой ноты, 0 = отпущена
    std::int16_t program = -1;
    std::int32_t pitch_bend = -1;

    ChannelState() {
        controls.fill(-1);
        notes.fill(0);
    }
};

// ----------------------------------------------------------------------------
// Snapshot
// ----------------------------------------------------------------------------

struct Snapshot {
    std::optional<WindowInfo> window;
    std::array<ChannelState, midi::CHANNEL_COUNT> channels;

    /// Отсутствующий scope или глобальный scope совпадает всегда.
    /// Иначе каждый заданный matcher должен принять активное окно;
    /// если окно неизвестно, такой scope не совпадает.
    bool matches_scope(const std::optional<rule::Scope>& scope) const;
    bool matches_scope(const rule::Scope& scope) const;

    bool matches(const rule::Precondition& precondition) const;

    /// Обновить состояние каналов по сообщению
    void apply(const midi::MidiMessage& msg);
};

// ----------------------------------------------------------------------------
// State
// ----------------------------------------------------------------------------

class State {
public:
    explicit State(FocusAdapter* focus = nullptr);

    State(const State&) = delete;
    State& operator=(const State&) = delete;

    /// Текущий снимок; остаётся валидным и неизменным у владельца
    std::shared_ptr<const Snapshot> snapshot() const;

    /// Записать MIDI сообщение (публикует новый снимок)
    void record(const midi::MidiMessage& msg);

    /// Установить активное окно (публикует новый снимок)
    void set_focus(std::optional<WindowInfo> window);

    /// Запросить FocusAdapter и опубликовать результат (если адаптер задан)
    void refresh_focus();

    bool matches_scope(const std::optional<rule::Scope>& scope) const {
        return snapshot()->matches_scope(scope);
    }

    bool matches(const rule::Precondition& precondition) const {
        return snapshot()->matches(precondition);
    }

private:
    template <typename Fn>
    void publish(Fn&& mutate);

    FocusAdapter* focus_ = nullptr;
    mutable std::mutex mutex_;
    std::shared_ptr<const Snapshot> snapshot_;
};

}  // namespace midimacro::state

#endif  // MIDIMACRO_STATE_HPP
