// ==============================================================================
// engine.cpp - Движок вычисления правил
// ==============================================================================

#include <midimacro/devices.hpp>
#include <midimacro/engine.hpp>
#include <midimacro/output.hpp>

namespace midimacro::engine {

// ----------------------------------------------------------------------------
// MessageQueue
// ----------------------------------------------------------------------------

bool MessageQueue::push(const midi::MidiMessage& msg) {
    {
        std::lock_guard<std::mutex> lg(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(msg);
    }
    cv_.notify_one();
    return true;
}

std::optional<midi::MidiMessage> MessageQueue::pop() {
    std::unique_lock<std::mutex> lk(mutex_);
    cv_.wait(lk, [&] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    midi::MidiMessage msg = queue_.front();
    queue_.pop_front();
    return msg;
}

std::optional<midi::MidiMessage> MessageQueue::try_pop() {
    std::lock_guard<std::mutex> lg(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    midi::MidiMessage msg = queue_.front();
    queue_.pop_front();
    return msg;
}

void MessageQueue::close() {
    {
        std::lock_guard<std::mutex> lg(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool MessageQueue::closed() const {
    std::lock_guard<std::mutex> lg(mutex_);
    return closed_;
}

std::size_t MessageQueue::size() const {
    std::lock_guard<std::mutex> lg(mutex_);
    return queue_.size();
}

// ----------------------------------------------------------------------------
// select
// ----------------------------------------------------------------------------

Selection select(const std::vector<rule::Macro>& macros, const rule::Event& event,
                 const state::Snapshot& snapshot) {
    for (const auto& macro : macros) {
        if (const auto* actions = macro.evaluate(event, snapshot)) {
            return Selection{&macro, actions};
        }
    }
    return Selection{};
}

// ----------------------------------------------------------------------------
// Engine
// ----------------------------------------------------------------------------

Engine::Engine(config::Config config, state::State& state, action::ActionRunner& runner,
               output::Writer& writer)
    : config_(std::move(config)), state_(state), runner_(runner), writer_(writer) {
    for (const auto& macro : config_.macros) {
        if (macro.scope() && !macro.scope()->is_global()) {
            needs_focus_ = true;
            break;
        }
    }
}

bool Engine::process(const midi::MidiMessage& msg) {
    // Запрос активного окна дорогой (xdotool), делаем его только при наличии scope
    if (needs_focus_) {
        state_.refresh_focus();
    }

    // Предусловия видят только предыдущие сообщения; триггер учитывается после
    auto snapshot = state_.snapshot();
    auto event = rule::make_event(msg);

    writer_.trace("received " + midi::describe(msg));

    auto selection = select(config_.macros, event, *snapshot);
    if (selection) {
        if (const auto* name = selection.macro->name()) {
            writer_.info("Executing macro named: '" + *name + "'");
        } else {
            writer_.info("Executing macro. (No name given)");
        }
        runner_.run_all(*selection.actions);
    } else {
        writer_.trace("no macro matched");
    }

    bool stop = rule::matches(config_.settings.stop_event, event, *snapshot);
    state_.record(msg);
    return stop;
}

std::size_t Engine::run(MessageQueue& queue, devices::MidiAdapter* listener) {
    std::size_t processed = 0;
    while (auto msg = queue.pop()) {
        ++processed;
        if (process(*msg)) {
            writer_.debug("stop event received");
            if (listener != nullptr) {
                listener->stop_listening();
            }
            queue.close();
        }
    }
    return processed;
}

}  // namespace midimacro::engine
