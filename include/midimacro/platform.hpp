// ==============================================================================
// midimacro/platform.hpp - Платформенные абстракции
// ==============================================================================
//
// Назначение:
// - Преобразования путей <-> UTF-8
// - Определение TTY для цветного вывода
// - Поиск исполняемых файлов в PATH, путь конфигурации по умолчанию
// - Запуск внешних процессов (fork/execvp) с наблюдением статуса
//
// Вся POSIX-специфика изолирована здесь.
//
// ==============================================================================

#ifndef MIDIMACRO_PLATFORM_HPP
#define MIDIMACRO_PLATFORM_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace midimacro::platform {

// ----------------------------------------------------------------------------
// Пути и окружение
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str);

std::string path_to_utf8(const std::filesystem::path& p);

bool is_tty_stdout();

bool is_tty_stderr();

/// Значение переменной окружения (nullopt если не задана или пуста)
std::optional<std::string> get_env(const char* name);

/// $XDG_CONFIG_HOME/midi-macro-pad/config.yml или ~/.config/midi-macro-pad/config.yml
std::optional<std::filesystem::path> default_config_path();

/// Найти исполняемый файл в PATH (или проверить путь, если он содержит '/')
std::optional<std::filesystem::path> find_executable(std::string_view name);

// ----------------------------------------------------------------------------
// Запуск процессов
// ----------------------------------------------------------------------------

using EnvVars = std::vector<std::pair<std::string, std::string>>;

struct ProcessOptions {
    /// Дополнительные/переопределённые переменные окружения
    EnvVars env;
    /// Захватить stdout процесса в ProcessResult::output
    bool capture_stdout = false;
};

struct ProcessResult {
    bool started = false;  // процесс был успешно запущен (exec выполнен)
    int exit_code = -1;    // код выхода (если завершился нормально)
    int signal = 0;        // номер сигнала (если убит сигналом)
    std::string error;     // описание ошибки запуска
    std::string output;    // stdout (только при capture_stdout)

    bool success() const { return started && signal == 0 && exit_code == 0; }
};

/// Запустить процесс и дождаться его завершения.
/// argv[0] ищется в PATH. Ошибка exec сообщается через ProcessResult::error.
ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options = {});

}  // namespace midimacro::platform

#endif  // MIDIMACRO_PLATFORM_HPP
