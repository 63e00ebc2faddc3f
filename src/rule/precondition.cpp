// ==============================================================================
// precondition.cpp - Scope / Precondition: описания для диагностики
// ==============================================================================

#include <midimacro/precondition.hpp>

namespace midimacro::rule {

std::string Scope::describe() const {
    if (is_global()) {
        return "global";
    }
    std::string text;
    if (window_class) {
        text += "window_class " + window_class->describe();
    }
    if (window_name) {
        if (!text.empty()) {
            text += ", ";
        }
        text += "window_name " + window_name->describe();
    }
    return text;
}

const char* Precondition::name() const {
    return std::visit(
        [](const auto& cond) -> const char* {
            using T = std::decay_t<decltype(cond)>;

            if constexpr (std::is_same_v<T, ControlValueCondition>) {
                return "control_value";
            } else if constexpr (std::is_same_v<T, NoteActiveCondition>) {
                return "note_active";
            } else if constexpr (std::is_same_v<T, ProgramCondition>) {
                return "program";
            } else {
                return "pitch_bend";
            }
        },
        condition_);
}

namespace {

std::string channel_text(const std::optional<match::NumberMatcher>& channel) {
    return channel ? " ch=" + channel->describe() : std::string();
}

}  // namespace

std::string Precondition::describe() const {
    std::string body = std::visit(
        [](const auto& cond) -> std::string {
            using T = std::decay_t<decltype(cond)>;

            if constexpr (std::is_same_v<T, ControlValueCondition>) {
                return channel_text(cond.channel) + " control=" + std::to_string(cond.control) +
                       " value=" + cond.value.describe();
            } else if constexpr (std::is_same_v<T, NoteActiveCondition>) {
                return channel_text(cond.channel) + " note=" + cond.note.describe();
            } else if constexpr (std::is_same_v<T, ProgramCondition>) {
                return channel_text(cond.channel) + " program=" + cond.program.describe();
            } else {
                return channel_text(cond.channel) + " value=" + cond.value.describe();
            }
        },
        condition_);

    return (invert_ ? std::string("not ") : std::string()) + name() + body;
}

}  // namespace midimacro::rule
