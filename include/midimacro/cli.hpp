// ==============================================================================
// midimacro/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv в GlobalOptions + Command
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef MIDIMACRO_CLI_HPP
#define MIDIMACRO_CLI_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <variant>

namespace midimacro::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;     // -v (repeatable)
    bool quiet = false;  // -q
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// list-ports - перечислить входные MIDI порты
struct ListPortsCommand {};

/// listen - слушать порт и исполнять макросы
struct ListenCommand {
    std::optional<std::string> port_pattern;      // positional (иначе global.midi_port)
    std::optional<std::filesystem::path> config;  // -c, --config
    bool dry_run = false;                         // --dry-run
};

/// monitor - печатать принятые сообщения как JSON lines
struct MonitorCommand {
    std::string port_pattern;
};

/// lint - проверить конфигурацию и вывести сводку
struct LintCommand {
    std::filesystem::path path;
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<ListPortsCommand, ListenCommand, MonitorCommand, LintCommand,
                             HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

constexpr const char* PROGRAM_NAME = "midi-macro-pad";

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Run keyboard and shell macros from a MIDI controller";

}  // namespace midimacro::cli

#endif  // MIDIMACRO_CLI_HPP
