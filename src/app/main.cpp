// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Dispatch команды
// 4. Возврат exit code
//
// Исключения перехватываются на границе app и печатаются как "[x] <err>".
//
// ==============================================================================

#include <exception>
#include <iostream>
#include <memory>
#include <midimacro/action.hpp>
#include <midimacro/cli.hpp>
#include <midimacro/config.hpp>
#include <midimacro/devices.hpp>
#include <midimacro/engine.hpp>
#include <midimacro/midi.hpp>
#include <midimacro/output.hpp>
#include <midimacro/platform.hpp>
#include <midimacro/state.hpp>
#include <rapidjson/document.h>
#include <type_traits>
#include <variant>

namespace {

using namespace midimacro;

// ----------------------------------------------------------------------------
// list-ports
// ----------------------------------------------------------------------------

int run_list_ports(output::Writer& writer) {
    auto midi_adapter = devices::make_midi_adapter(writer);
    if (!midi_adapter) {
        writer.error("Unable to set up MIDI adapter - no /dev/snd on this system");
        return 1;
    }

    auto ports = midi_adapter->list_ports();
    if (ports.empty()) {
        writer.warn("No MIDI ports found");
        return 0;
    }

    for (const auto& port : ports) {
        writer.write_line(output::Stream::Stdout, port.name);
        writer.debug("  device: " + platform::path_to_utf8(port.device));
    }
    return 0;
}

// ----------------------------------------------------------------------------
// lint
// ----------------------------------------------------------------------------

void print_macro_summary(output::Writer& writer, std::size_t index, const rule::Macro& macro) {
    std::string title = "macro " + std::to_string(index) + ": ";
    title += macro.name() ? "'" + *macro.name() + "'" : std::string("(no name)");
    writer.green_line(title);

    for (const auto& matcher : macro.match_events()) {
        writer.write_line(output::Stream::Stdout, "  on:     " + rule::describe(matcher));
    }
    if (const auto& preconditions = macro.required_preconditions()) {
        for (const auto& precondition : *preconditions) {
            writer.write_line(output::Stream::Stdout, "  when:   " + precondition.describe());
        }
    }
    if (macro.scope()) {
        writer.write_line(output::Stream::Stdout, "  scope:  " + macro.scope()->describe());
    }
    for (const auto& action : macro.actions()) {
        writer.write_line(output::Stream::Stdout, "  do:     " + action::describe(action));
    }
}

int run_lint(const cli::LintCommand& cmd, output::Writer& writer) {
    writer.info("Validating config " + platform::path_to_utf8(cmd.path) + "...");

    auto result = config::load(cmd.path);
    if (!result) {
        writer.error(result.error.format());
        return 1;
    }

    const auto& cfg = result.config;
    for (std::size_t i = 0; i < cfg.macros.size(); ++i) {
        print_macro_summary(writer, i, cfg.macros[i]);
    }

    writer.debug("stop event: " + rule::describe(cfg.settings.stop_event));
    writer.debug("key delay: " + std::to_string(cfg.settings.key_delay.count()) + "us");
    writer.info("Validated " + std::to_string(cfg.macros.size()) + " macro(s)");
    return 0;
}

// ----------------------------------------------------------------------------
// monitor
// ----------------------------------------------------------------------------

int run_monitor(const cli::MonitorCommand& cmd, output::Writer& writer) {
    // Очередь переживает адаптер: его деструктор останавливает поток чтения
    engine::MessageQueue queue;
    auto midi_adapter = devices::make_midi_adapter(writer);
    if (!midi_adapter) {
        writer.error("Unable to set up MIDI adapter - no /dev/snd on this system");
        return 1;
    }

    auto listening = midi_adapter->start_listening(cmd.port_pattern, queue);
    if (!listening) {
        writer.error("Unable to start listening for MIDI events: " + listening.error);
        return 1;
    }
    writer.info("Monitoring " + listening.port.name);

    while (auto msg = queue.pop()) {
        auto doc = midi::to_value(*msg).to_rapidjson_document();
        writer.write_json_line(doc);
    }

    midi_adapter->stop_listening();
    return 0;
}

// ----------------------------------------------------------------------------
// listen
// ----------------------------------------------------------------------------

int run_listen(const cli::ListenCommand& cmd, output::Writer& writer) {
    // Конфигурация
    auto config_path = cmd.config ? cmd.config : platform::default_config_path();
    if (!config_path) {
        writer.error("No config file given and no default location ($XDG_CONFIG_HOME or $HOME)");
        return 1;
    }

    auto loaded = config::load(*config_path);
    if (!loaded) {
        writer.error(loaded.error.format());
        return 1;
    }
    writer.info("Loaded " + std::to_string(loaded.config.macros.size()) + " macro(s) from " +
                platform::path_to_utf8(*config_path));

    auto port_pattern = cmd.port_pattern ? cmd.port_pattern : loaded.config.settings.midi_port;
    if (!port_pattern) {
        writer.error("No MIDI port given and global.midi_port is not set");
        return 1;
    }

    // Адаптеры: любой отказ фатален до входа в цикл.
    // Очередь объявлена раньше адаптера и переживает его поток чтения.
    engine::MessageQueue queue;
    auto midi_adapter = devices::make_midi_adapter(writer);
    if (!midi_adapter) {
        writer.error("Unable to set up MIDI adapter - no /dev/snd on this system");
        return 1;
    }

    auto focus = devices::make_focus_adapter();
    if (!focus) {
        if (!cmd.dry_run) {
            writer.error("Unable to set up focus adapter - can't detect focused window.");
            return 1;
        }
        writer.warn("No focus adapter - scoped macros will not fire");
    }

    std::unique_ptr<action::KeyboardAdapter> keyboard;
    std::unique_ptr<action::ProcessSpawner> spawner;
    if (cmd.dry_run) {
        keyboard = std::make_unique<devices::DryRunKeyboard>(writer);
        spawner = std::make_unique<devices::DryRunSpawner>(writer);
    } else {
        keyboard = devices::make_keyboard_adapter();
        if (!keyboard) {
            writer.error("Unable to get an action runner - xdotool not found or no $DISPLAY");
            return 1;
        }
        spawner = std::make_unique<devices::PosixProcessSpawner>();
    }

    state::State state(focus.get());
    action::ActionRunner runner(*keyboard, *spawner, writer, loaded.config.settings.key_delay);

    auto listening = midi_adapter->start_listening(*port_pattern, queue);
    if (!listening) {
        writer.error("Unable to start listening for MIDI events: " + listening.error);
        return 1;
    }
    writer.info("Listening on " + listening.port.name);
    writer.debug("stop event: " + rule::describe(loaded.config.settings.stop_event));

    engine::Engine engine(std::move(loaded.config), state, runner, writer);
    std::size_t processed = engine.run(queue, midi_adapter.get());
    midi_adapter->stop_listening();

    writer.debug("processed " + std::to_string(processed) + " message(s)");
    writer.info("Exiting.");
    return 0;
}

// ----------------------------------------------------------------------------
// Главная функция выполнения (run)
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // Ошибки парсинга печатаются как есть, без префикса [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    return std::visit(
        [&](auto&& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                writer.write(output::Stream::Stdout, cli::render_help(cmd.command));
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::ListPortsCommand>) {
                return run_list_ports(writer);
            } else if constexpr (std::is_same_v<T, cli::ListenCommand>) {
                return run_listen(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::MonitorCommand>) {
                return run_monitor(cmd, writer);
            } else if constexpr (std::is_same_v<T, cli::LintCommand>) {
                return run_lint(cmd, writer);
            } else {
                return 1;
            }
        },
        parse_result.command);
}

}  // namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
