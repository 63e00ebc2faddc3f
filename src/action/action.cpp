// ==============================================================================
// action.cpp - Описание и исполнение действий
// ==============================================================================

#include <midimacro/action.hpp>
#include <midimacro/output.hpp>

namespace midimacro::action {

// ============================================================================
// Описания
// ============================================================================

const char* action_type_name(const Action& action) {
    return std::visit(
        [](const auto& a) -> const char* {
            using T = std::decay_t<decltype(a)>;

            if constexpr (std::is_same_v<T, KeySequence>) {
                return "key_sequence";
            } else if constexpr (std::is_same_v<T, EnterText>) {
                return "enter_text";
            } else if constexpr (std::is_same_v<T, Shell>) {
                return "shell";
            } else {
                return "combination";
            }
        },
        action.data);
}

std::string describe(const Action& action) {
    return std::visit(
        [](const auto& a) -> std::string {
            using T = std::decay_t<decltype(a)>;

            if constexpr (std::is_same_v<T, KeySequence>) {
                return "key_sequence \"" + a.sequence + "\" x" + std::to_string(a.count);
            } else if constexpr (std::is_same_v<T, EnterText>) {
                return "enter_text \"" + a.text + "\" x" + std::to_string(a.count);
            } else if constexpr (std::is_same_v<T, Shell>) {
                std::string text = "shell " + a.command;
                if (a.args) {
                    for (const auto& arg : *a.args) {
                        text += " " + arg;
                    }
                }
                return text;
            } else {
                std::string text = "combination [";
                for (std::size_t i = 0; i < a.actions.size(); ++i) {
                    if (i > 0)
                        text += ", ";
                    text += describe(a.actions[i]);
                }
                return text + "]";
            }
        },
        action.data);
}

// ============================================================================
// ActionRunner
// ============================================================================

ActionRunner::ActionRunner(KeyboardAdapter& keyboard, ProcessSpawner& spawner,
                           output::Writer& writer, std::chrono::microseconds key_delay)
    : keyboard_(keyboard), spawner_(spawner), writer_(writer), key_delay_(key_delay) {}

bool ActionRunner::run(const Action& action) {
    return std::visit(
        [this](const auto& a) -> bool {
            using T = std::decay_t<decltype(a)>;

            if constexpr (std::is_same_v<T, KeySequence>) {
                return run_key_sequence(a);
            } else if constexpr (std::is_same_v<T, EnterText>) {
                return run_enter_text(a);
            } else if constexpr (std::is_same_v<T, Shell>) {
                return run_shell(a);
            } else {
                return run_all(a.actions);
            }
        },
        action.data);
}

bool ActionRunner::run_all(const ActionVec& actions) {
    bool all_ok = true;
    for (const auto& child : actions) {
        if (!run(child)) {
            all_ok = false;
        }
    }
    return all_ok;
}

bool ActionRunner::run_key_sequence(const KeySequence& ks) {
    for (std::size_t i = 0; i < ks.count; ++i) {
        if (!keyboard_.send_key_sequence(ks.sequence, key_delay_)) {
            writer_.warn("failed to send key sequence '" + ks.sequence + "'");
            return false;
        }
    }
    return true;
}

bool ActionRunner::run_enter_text(const EnterText& et) {
    for (std::size_t i = 0; i < et.count; ++i) {
        if (!keyboard_.send_text(et.text, key_delay_)) {
            writer_.warn("failed to enter text '" + et.text + "'");
            return false;
        }
    }
    return true;
}

bool ActionRunner::run_shell(const Shell& shell) {
    writer_.debug("running command: " + shell.command);

    SpawnResult result = spawner_.spawn(shell);
    if (!result.started) {
        writer_.warn("failed to run '" + shell.command + "': " + result.error);
        return false;
    }
    if (!result.error.empty()) {
        writer_.warn("command '" + shell.command + "' " + result.error);
        return false;
    }
    if (result.exit_code != 0) {
        writer_.warn("command '" + shell.command + "' exited with status " +
                     std::to_string(result.exit_code));
        return false;
    }
    return true;
}

}  // namespace midimacro::action
