// ==============================================================================
// process.cpp - Запуск Shell действий и dry-run адаптеры
// ==============================================================================

#include <midimacro/devices.hpp>
#include <midimacro/output.hpp>
#include <midimacro/platform.hpp>

namespace midimacro::devices {

// ----------------------------------------------------------------------------
// PosixProcessSpawner
// ----------------------------------------------------------------------------

action::SpawnResult PosixProcessSpawner::spawn(const action::Shell& shell) {
    std::vector<std::string> argv;
    argv.push_back(shell.command);
    if (shell.args) {
        argv.insert(argv.end(), shell.args->begin(), shell.args->end());
    }

    platform::ProcessOptions options;
    if (shell.env_vars) {
        options.env = *shell.env_vars;
    }

    auto result = platform::run_process(argv, options);

    action::SpawnResult spawned;
    spawned.started = result.started;
    spawned.exit_code = result.exit_code;
    spawned.error = result.error;
    if (result.signal != 0) {
        spawned.error = "killed by signal " + std::to_string(result.signal);
    }
    return spawned;
}

// ----------------------------------------------------------------------------
// Dry run
// ----------------------------------------------------------------------------

bool DryRunKeyboard::send_key_sequence(std::string_view sequence,
                                       std::chrono::microseconds /*delay*/) {
    writer_.info("[dry-run] key sequence: " + std::string(sequence));
    return true;
}

bool DryRunKeyboard::send_text(std::string_view text, std::chrono::microseconds /*delay*/) {
    writer_.info("[dry-run] enter text: " + std::string(text));
    return true;
}

action::SpawnResult DryRunSpawner::spawn(const action::Shell& shell) {
    std::string line = "[dry-run] shell: " + shell.command;
    if (shell.args) {
        for (const auto& arg : *shell.args) {
            line += " " + arg;
        }
    }
    writer_.info(line);

    action::SpawnResult result;
    result.started = true;
    result.exit_code = 0;
    return result;
}

}  // namespace midimacro::devices
