// ==============================================================================
// midimacro/engine.hpp - Движок вычисления правил
// ==============================================================================
//
// Назначение:
// - MessageQueue: упорядоченная очередь между приёмником MIDI и движком
// - select(): выбор первого совпавшего макроса (first-match-wins)
// - Engine: обработка сообщений строго по одному, в порядке поступления
//
// Каждое событие вычисляется против одного снимка состояния; действия
// совпавшего макроса выполняются до перехода к следующему событию.
//
// ==============================================================================

#ifndef MIDIMACRO_ENGINE_HPP
#define MIDIMACRO_ENGINE_HPP

#include <condition_variable>
#include <cstddef>
#include <deque>
#include <midimacro/action.hpp>
#include <midimacro/config.hpp>
#include <midimacro/event.hpp>
#include <midimacro/macro.hpp>
#include <midimacro/midi.hpp>
#include <midimacro/state.hpp>
#include <mutex>
#include <optional>
#include <vector>

namespace midimacro::output {
class Writer;
}

namespace midimacro::devices {
class MidiAdapter;
}

namespace midimacro::engine {

// ----------------------------------------------------------------------------
// MessageQueue
// ----------------------------------------------------------------------------

/// Потокобезопасная FIFO очередь MIDI сообщений.
/// После close() новые сообщения отбрасываются, а pop() отдаёт оставшиеся
/// и затем возвращает nullopt.
class MessageQueue {
public:
    /// @return false если очередь закрыта
    bool push(const midi::MidiMessage& msg);

    /// Блокирующее извлечение
    std::optional<midi::MidiMessage> pop();

    /// Неблокирующее извлечение
    std::optional<midi::MidiMessage> try_pop();

    void close();

    bool closed() const;

    std::size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<midi::MidiMessage> queue_;
    bool closed_ = false;
};

// ----------------------------------------------------------------------------
// Выбор макроса
// ----------------------------------------------------------------------------

struct Selection {
    const rule::Macro* macro = nullptr;
    const action::ActionVec* actions = nullptr;

    explicit operator bool() const { return macro != nullptr; }
};

/// Первый в порядке объявления макрос, чей evaluate() вернул действия.
/// Остальные макросы не вычисляются.
Selection select(const std::vector<rule::Macro>& macros, const rule::Event& event,
                 const state::Snapshot& snapshot);

// ----------------------------------------------------------------------------
// Engine
// ----------------------------------------------------------------------------

class Engine {
public:
    Engine(config::Config config, state::State& state, action::ActionRunner& runner,
           output::Writer& writer);

    /// Обработать одно сообщение: выбрать макрос по снимку состояния до
    /// сообщения, выполнить его действия, затем учесть сообщение в состоянии.
    /// @return true если сообщение совпало с событием остановки
    bool process(const midi::MidiMessage& msg);

    /// Обрабатывать сообщения из очереди до её закрытия и опустошения.
    /// При событии остановки вызывает listener->stop_listening() и закрывает очередь.
    /// @return количество обработанных сообщений
    std::size_t run(MessageQueue& queue, devices::MidiAdapter* listener);

    const config::Config& config() const { return config_; }

private:
    config::Config config_;
    state::State& state_;
    action::ActionRunner& runner_;
    output::Writer& writer_;
    bool needs_focus_ = false;
};

}  // namespace midimacro::engine

#endif  // MIDIMACRO_ENGINE_HPP
