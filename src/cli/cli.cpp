// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Формат справки и ошибок: clap-подобный ("error: ...", Usage, подсказка).
// Глобальные -v/-q принимаются как до, так и после подкоманды.
//
// ==============================================================================

#include <cstring>
#include <midimacro/cli.hpp>
#include <midimacro/platform.hpp>

namespace midimacro::cli {

namespace {

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool is_help(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

/// -v, -vv, -vvv...
int verbose_level(const char* arg) {
    if (arg[0] != '-' || arg[1] != 'v') {
        return 0;
    }
    int level = 0;
    for (const char* p = arg + 1; *p != '\0'; ++p) {
        if (*p != 'v') {
            return 0;
        }
        ++level;
    }
    return level;
}

std::string render_usage_error(const std::string& error_msg, const char* usage) {
    return "error: " + error_msg + "\n\nUsage: " + usage +
           "\n\nFor more information, try '--help'.\n";
}

ParseResult usage_error(ParseResult result, const std::string& message, const char* usage) {
    result.ok = false;
    result.diagnostic.exit_code = 2;
    result.diagnostic.stderr_message = render_usage_error(message, usage);
    return result;
}

constexpr const char* MAIN_USAGE = "midi-macro-pad [OPTIONS] <COMMAND>";
constexpr const char* LISTEN_USAGE =
    "midi-macro-pad listen [OPTIONS] [PORT_PATTERN]";
constexpr const char* MONITOR_USAGE = "midi-macro-pad monitor [OPTIONS] <PORT_PATTERN>";
constexpr const char* LINT_USAGE = "midi-macro-pad lint [OPTIONS] <CONFIG>";
constexpr const char* LIST_PORTS_USAGE = "midi-macro-pad list-ports [OPTIONS]";

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string(PROGRAM_NAME) + " " + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: midi-macro-pad [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  list-ports  List the MIDI input ports that can be listened on\n"
               "  listen      Listen on a MIDI port and run the configured macros\n"
               "  monitor     Print every message received on a MIDI port as JSON lines\n"
               "  lint        Check that a config file resolves and summarise its macros\n"
               "  help        Print this message or the help of the given subcommand\n"
               "\n"
               "Options:\n"
               "  -v...          Print verbose output (-vv for tracing)\n"
               "  -q             Suppress informational output\n"
               "  -h, --help     Print help\n"
               "  -V, --version  Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Find the name of your controller:\n"
               "        midi-macro-pad list-ports\n"
               "\n"
               "    Run macros from the default config on a nanoKONTROL:\n"
               "        midi-macro-pad listen nanoKONTROL\n"
               "\n"
               "    Check a config without touching any device:\n"
               "        midi-macro-pad lint ~/.config/midi-macro-pad/config.yml\n";
    }
    if (*command == "listen") {
        return "Listen on a MIDI port and run the configured macros\n"
               "\n"
               "Usage: midi-macro-pad listen [OPTIONS] [PORT_PATTERN]\n"
               "\n"
               "Arguments:\n"
               "  [PORT_PATTERN]  Case-insensitive substring of the port name "
               "(default: global.midi_port)\n"
               "\n"
               "Options:\n"
               "  -c, --config <CONFIG>  Config file (default: "
               "$XDG_CONFIG_HOME/midi-macro-pad/config.yml)\n"
               "      --dry-run          Log actions instead of running them\n"
               "  -v...                  Print verbose output\n"
               "  -q                     Suppress informational output\n"
               "  -h, --help             Print help\n";
    }
    if (*command == "monitor") {
        return "Print every message received on a MIDI port as JSON lines\n"
               "\n"
               "Usage: midi-macro-pad monitor [OPTIONS] <PORT_PATTERN>\n"
               "\n"
               "Arguments:\n"
               "  <PORT_PATTERN>  Case-insensitive substring of the port name\n"
               "\n"
               "Options:\n"
               "  -v...       Print verbose output\n"
               "  -q          Suppress informational output\n"
               "  -h, --help  Print help\n";
    }
    if (*command == "lint") {
        return "Check that a config file resolves and summarise its macros\n"
               "\n"
               "Usage: midi-macro-pad lint [OPTIONS] <CONFIG>\n"
               "\n"
               "Arguments:\n"
               "  <CONFIG>  Path to a YAML (.yml, .yaml) or JSON (.json) config file\n"
               "\n"
               "Options:\n"
               "  -v...       Print verbose output\n"
               "  -q          Suppress informational output\n"
               "  -h, --help  Print help\n";
    }
    if (*command == "list-ports") {
        return "List the MIDI input ports that can be listened on\n"
               "\n"
               "Usage: midi-macro-pad list-ports [OPTIONS]\n"
               "\n"
               "Options:\n"
               "  -v...       Print verbose output\n"
               "  -h, --help  Print help\n";
    }
    return render_help(std::nullopt);
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        // Без аргументов: справка в stderr, exit code 2
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    // Глобальные опции до подкоманды
    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (int level = verbose_level(arg)) {
            result.global.verbose += level;
        } else if (str_eq(arg, "-q")) {
            result.global.quiet = true;
        } else if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (arg[0] == '-') {
            return usage_error(std::move(result),
                               "unexpected argument '" + std::string(arg) + "' found",
                               MAIN_USAGE);
        } else {
            cmd_idx = i;
            break;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];

    // Общая обработка глобальных опций после подкоманды
    auto global_option = [&](const char* arg) {
        if (int level = verbose_level(arg)) {
            result.global.verbose += level;
            return true;
        }
        if (str_eq(arg, "-q")) {
            result.global.quiet = true;
            return true;
        }
        return false;
    };

    if (str_eq(cmd, "help")) {
        HelpCommand help_cmd;
        if (cmd_idx + 1 < argc) {
            help_cmd.command = std::string(argv[cmd_idx + 1]);
        }
        result.ok = true;
        result.command = help_cmd;
    } else if (str_eq(cmd, "list-ports")) {
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{"list-ports"};
                return result;
            }
            if (!global_option(arg)) {
                return usage_error(std::move(result),
                                   "unexpected argument '" + std::string(arg) + "' found",
                                   LIST_PORTS_USAGE);
            }
        }
        result.ok = true;
        result.command = ListPortsCommand{};
    } else if (str_eq(cmd, "listen")) {
        ListenCommand listen_cmd;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{"listen"};
                return result;
            } else if (global_option(arg)) {
                continue;
            } else if (str_eq(arg, "-c") || str_eq(arg, "--config")) {
                if (i + 1 >= argc) {
                    return usage_error(
                        std::move(result),
                        "a value is required for '--config <CONFIG>' but none was supplied",
                        LISTEN_USAGE);
                }
                ++i;
                listen_cmd.config = platform::path_from_utf8(argv[i]);
            } else if (str_eq(arg, "--dry-run")) {
                listen_cmd.dry_run = true;
            } else if (arg[0] == '-') {
                return usage_error(std::move(result),
                                   "unexpected argument '" + std::string(arg) + "' found",
                                   LISTEN_USAGE);
            } else if (!listen_cmd.port_pattern) {
                listen_cmd.port_pattern = std::string(arg);
            } else {
                return usage_error(std::move(result),
                                   "unexpected argument '" + std::string(arg) + "' found",
                                   LISTEN_USAGE);
            }
        }
        result.ok = true;
        result.command = listen_cmd;
    } else if (str_eq(cmd, "monitor") || str_eq(cmd, "lint")) {
        const bool is_monitor = str_eq(cmd, "monitor");
        const char* usage = is_monitor ? MONITOR_USAGE : LINT_USAGE;
        std::optional<std::string> positional;
        for (int i = cmd_idx + 1; i < argc; ++i) {
            const char* arg = argv[i];
            if (is_help(arg)) {
                result.ok = true;
                result.command = HelpCommand{std::string(cmd)};
                return result;
            } else if (global_option(arg)) {
                continue;
            } else if (arg[0] == '-' || positional) {
                return usage_error(std::move(result),
                                   "unexpected argument '" + std::string(arg) + "' found",
                                   usage);
            } else {
                positional = std::string(arg);
            }
        }
        if (!positional) {
            return usage_error(std::move(result),
                               std::string("the following required arguments were not "
                                           "provided:\n  ") +
                                   (is_monitor ? "<PORT_PATTERN>" : "<CONFIG>"),
                               usage);
        }
        result.ok = true;
        if (is_monitor) {
            result.command = MonitorCommand{*positional};
        } else {
            result.command = LintCommand{platform::path_from_utf8(*positional)};
        }
    } else {
        return usage_error(std::move(result),
                           "unrecognized subcommand '" + std::string(cmd) + "'", MAIN_USAGE);
    }

    return result;
}

}  // namespace midimacro::cli
