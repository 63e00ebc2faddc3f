// ==============================================================================
// state.cpp - Snapshot / State
// ==============================================================================

#include <midimacro/state.hpp>

namespace midimacro::state {

// ============================================================================
// Snapshot: scope
// ============================================================================

bool Snapshot::matches_scope(const std::optional<rule::Scope>& scope) const {
    if (!scope) {
        return true;
    }
    return matches_scope(*scope);
}

bool Snapshot::matches_scope(const rule::Scope& scope) const {
    if (scope.is_global()) {
        return true;
    }
    if (!window) {
        return false;
    }
    if (scope.window_class && !scope.window_class->matches(window->window_class)) {
        return false;
    }
    if (scope.window_name && !scope.window_name->matches(window->name)) {
        return false;
    }
    return true;
}

// ============================================================================
// Snapshot: preconditions
// ============================================================================

namespace {

bool channel_matches(const std::optional<match::NumberMatcher>& channel, int index) {
    return !channel || channel->matches(index);
}

}  // namespace

bool Snapshot::matches(const rule::Precondition& precondition) const {
    bool result = std::visit(
        [this](const auto& cond) -> bool {
            using T = std::decay_t<decltype(cond)>;

            for (int ch = 0; ch < midi::CHANNEL_COUNT; ++ch) {
                if (!channel_matches(cond.channel, ch)) {
                    continue;
                }
                const ChannelState& state = channels[static_cast<std::size_t>(ch)];

                if constexpr (std::is_same_v<T, rule::ControlValueCondition>) {
                    std::int16_t value = state.controls[static_cast<std::size_t>(cond.control & 0x7F)];
                    if (value >= 0 && cond.value.matches(value)) {
                        return true;
                    }
                } else if constexpr (std::is_same_v<T, rule::NoteActiveCondition>) {
                    for (std::size_t note = 0; note < state.notes.size(); ++note) {
                        if (state.notes[note] > 0 &&
                            cond.note.matches(static_cast<std::int64_t>(note))) {
                            return true;
                        }
                    }
                } else if constexpr (std::is_same_v<T, rule::ProgramCondition>) {
                    if (state.program >= 0 && cond.program.matches(state.program)) {
                        return true;
                    }
                } else {
                    if (state.pitch_bend >= 0 && cond.value.matches(state.pitch_bend)) {
                        return true;
                    }
                }
            }
            return false;
        },
        precondition.condition());

    return precondition.inverted() ? !result : result;
}

// ============================================================================
// Snapshot: обновление
// ============================================================================

void Snapshot::apply(const midi::MidiMessage& msg) {
    ChannelState& state = channels[static_cast<std::size_t>(msg.channel & 0x0F)];
    auto index = static_cast<std::size_t>(msg.primary & 0x7F);

    switch (msg.kind) {
    case midi::MessageKind::NoteOn:
        // NoteOn с velocity 0 - это NoteOff
        state.notes[index] = msg.secondary;
        break;
    case midi::MessageKind::NoteOff:
        state.notes[index] = 0;
        break;
    case midi::MessageKind::ControlChange:
        state.controls[index] = msg.secondary;
        break;
    case midi::MessageKind::ProgramChange:
        state.program = static_cast<std::int16_t>(index);
        break;
    case midi::MessageKind::PitchBend:
        state.pitch_bend = msg.primary;
        break;
    case midi::MessageKind::KeyPressure:
    case midi::MessageKind::ChannelPressure:
        break;
    }
}

// ============================================================================
// State
// ============================================================================

State::State(FocusAdapter* focus) : focus_(focus), snapshot_(std::make_shared<Snapshot>()) {}

std::shared_ptr<const Snapshot> State::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return snapshot_;
}

template <typename Fn>
void State::publish(Fn&& mutate) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto next = std::make_shared<Snapshot>(*snapshot_);
    mutate(*next);
    snapshot_ = std::move(next);
}

void State::record(const midi::MidiMessage& msg) {
    publish([&msg](Snapshot& s) { s.apply(msg); });
}

void State::set_focus(std::optional<WindowInfo> window) {
    publish([&window](Snapshot& s) { s.window = std::move(window); });
}

void State::refresh_focus() {
    if (focus_ == nullptr) {
        return;
    }
    // Запрос к адаптеру выполняется вне блокировки
    set_focus(focus_->focused_window());
}

}  // namespace midimacro::state
