// ==============================================================================
// midimacro/action.hpp - Действия макросов и их исполнитель
// ==============================================================================
//
// Назначение:
// - Action: закрытый вариант действий (KeySequence, EnterText, Shell,
//   Combination). Действия - чистые данные без ссылок на адаптеры.
// - KeyboardAdapter / ProcessSpawner: внешние адаптеры исполнения
// - ActionRunner: отображает каждое действие ровно на один вызов адаптера
//
// Ошибки исполнения логируются и не прерывают соседние действия.
//
// ==============================================================================

#ifndef MIDIMACRO_ACTION_HPP
#define MIDIMACRO_ACTION_HPP

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace midimacro::output {
class Writer;
}

namespace midimacro::action {

// ============================================================================
// Action
// ============================================================================

struct Action;
using ActionVec = std::vector<Action>;
using EnvVars = std::vector<std::pair<std::string, std::string>>;

/// Последовательность клавиш в нотации X keysym ("ctrl+shift+t"), count раз
struct KeySequence {
    std::string sequence;
    std::size_t count = 1;
};

/// Ввод текста как с клавиатуры, count раз
struct EnterText {
    std::string text;
    std::size_t count = 1;
};

/// Запуск внешней программы
struct Shell {
    std::string command;                            // путь к программе без аргументов
    std::optional<std::vector<std::string>> args;   // аргументы
    std::optional<EnvVars> env_vars;                // переменные окружения
};

/// Действия по порядку
struct Combination {
    ActionVec actions;
};

using ActionVariant = std::variant<KeySequence, EnterText, Shell, Combination>;

struct Action {
    ActionVariant data;

    Action() : data(Combination{}) {}

    explicit Action(ActionVariant v) : data(std::move(v)) {}

    static Action key_sequence(std::string sequence, std::size_t count = 1) {
        return Action(KeySequence{std::move(sequence), count});
    }
    static Action enter_text(std::string text, std::size_t count = 1) {
        return Action(EnterText{std::move(text), count});
    }
    static Action shell(std::string command,
                        std::optional<std::vector<std::string>> args = std::nullopt,
                        std::optional<EnvVars> env_vars = std::nullopt) {
        return Action(Shell{std::move(command), std::move(args), std::move(env_vars)});
    }
    static Action combination(ActionVec actions) {
        return Action(Combination{std::move(actions)});
    }

    const KeySequence* get_key_sequence() const { return std::get_if<KeySequence>(&data); }
    const EnterText* get_enter_text() const { return std::get_if<EnterText>(&data); }
    const Shell* get_shell() const { return std::get_if<Shell>(&data); }
    const Combination* get_combination() const { return std::get_if<Combination>(&data); }
};

/// Имя типа действия как в конфигурации ("key_sequence", ...)
const char* action_type_name(const Action& action);

/// Однострочное описание действия
std::string describe(const Action& action);

// ============================================================================
// Адаптеры
// ============================================================================

/// Синтез клавиатурного ввода
class KeyboardAdapter {
public:
    virtual ~KeyboardAdapter() = default;

    /// @return false если ввод не удался
    virtual bool send_key_sequence(std::string_view sequence,
                                   std::chrono::microseconds delay) = 0;

    virtual bool send_text(std::string_view text, std::chrono::microseconds delay) = 0;
};

/// Результат запуска процесса
struct SpawnResult {
    bool started = false;
    int exit_code = -1;
    std::string error;

    bool success() const { return started && exit_code == 0; }
};

/// Запуск внешних процессов (синхронно, со статусом завершения)
class ProcessSpawner {
public:
    virtual ~ProcessSpawner() = default;

    virtual SpawnResult spawn(const Shell& shell) = 0;
};

// ============================================================================
// ActionRunner
// ============================================================================

/// Задержка между нажатиями по умолчанию
constexpr std::chrono::microseconds DEFAULT_KEY_DELAY{100};

class ActionRunner {
public:
    ActionRunner(KeyboardAdapter& keyboard, ProcessSpawner& spawner, output::Writer& writer,
                 std::chrono::microseconds key_delay = DEFAULT_KEY_DELAY);

    /// Выполнить действие. Combination выполняет все дочерние действия по
    /// порядку, даже если какое-то из них завершилось ошибкой.
    /// @return true если все вызовы адаптеров завершились успешно
    bool run(const Action& action);

    /// Выполнить список действий по порядку (best effort)
    bool run_all(const ActionVec& actions);

private:
    bool run_key_sequence(const KeySequence& ks);
    bool run_enter_text(const EnterText& et);
    bool run_shell(const Shell& shell);

    KeyboardAdapter& keyboard_;
    ProcessSpawner& spawner_;
    output::Writer& writer_;
    std::chrono::microseconds key_delay_;
};

}  // namespace midimacro::action

#endif  // MIDIMACRO_ACTION_HPP
