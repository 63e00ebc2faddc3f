// ==============================================================================
// platform.cpp - Платформенные абстракции (POSIX)
// ==============================================================================

#include "midimacro/platform.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace midimacro::platform {

// ----------------------------------------------------------------------------
// Пути и окружение
// ----------------------------------------------------------------------------

std::filesystem::path path_from_utf8(std::string_view u8str) {
    // Unix: пути уже в UTF-8
    return std::filesystem::path(u8str);
}

std::string path_to_utf8(const std::filesystem::path& p) {
    return p.string();
}

bool is_tty_stdout() {
    return isatty(fileno(stdout)) != 0;
}

bool is_tty_stderr() {
    return isatty(fileno(stderr)) != 0;
}

std::optional<std::string> get_env(const char* name) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::nullopt;
    }
    return std::string(value);
}

std::optional<std::filesystem::path> default_config_path() {
    const std::filesystem::path relative =
        std::filesystem::path("midi-macro-pad") / "config.yml";

    if (auto xdg = get_env("XDG_CONFIG_HOME")) {
        return path_from_utf8(*xdg) / relative;
    }
    if (auto home = get_env("HOME")) {
        return path_from_utf8(*home) / ".config" / relative;
    }
    return std::nullopt;
}

std::optional<std::filesystem::path> find_executable(std::string_view name) {
    if (name.empty()) {
        return std::nullopt;
    }

    auto is_executable = [](const std::filesystem::path& p) {
        std::error_code ec;
        return std::filesystem::is_regular_file(p, ec) && access(p.c_str(), X_OK) == 0;
    };

    if (name.find('/') != std::string_view::npos) {
        std::filesystem::path p = path_from_utf8(name);
        if (is_executable(p)) {
            return p;
        }
        return std::nullopt;
    }

    auto path_env = get_env("PATH");
    if (!path_env) {
        return std::nullopt;
    }

    std::string_view remaining = *path_env;
    while (!remaining.empty()) {
        std::size_t sep = remaining.find(':');
        std::string_view dir = remaining.substr(0, sep);
        if (!dir.empty()) {
            std::filesystem::path candidate = path_from_utf8(dir) / path_from_utf8(name);
            if (is_executable(candidate)) {
                return candidate;
            }
        }
        if (sep == std::string_view::npos) {
            break;
        }
        remaining.remove_prefix(sep + 1);
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------------
// Запуск процессов
// ----------------------------------------------------------------------------

namespace {

// Окружение потомка: текущее environ + переопределения
std::vector<std::string> build_environment(const EnvVars& overrides) {
    std::vector<std::string> entries;
    for (char** env = environ; env != nullptr && *env != nullptr; ++env) {
        std::string_view entry(*env);
        std::string_view key = entry.substr(0, entry.find('='));
        bool overridden = false;
        for (const auto& [k, v] : overrides) {
            if (key == k) {
                overridden = true;
                break;
            }
        }
        if (!overridden) {
            entries.emplace_back(entry);
        }
    }
    for (const auto& [k, v] : overrides) {
        entries.push_back(k + "=" + v);
    }
    return entries;
}

void close_fd(int& fd) {
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
}

}  // namespace

ProcessResult run_process(const std::vector<std::string>& argv, const ProcessOptions& options) {
    ProcessResult result;

    if (argv.empty() || argv[0].empty()) {
        result.error = "empty command";
        return result;
    }

    // Все аллокации выполняются до fork()
    std::vector<char*> c_argv;
    c_argv.reserve(argv.size() + 1);
    for (const auto& arg : argv) {
        c_argv.push_back(const_cast<char*>(arg.c_str()));
    }
    c_argv.push_back(nullptr);

    std::vector<std::string> env_entries = build_environment(options.env);
    std::vector<char*> c_envp;
    c_envp.reserve(env_entries.size() + 1);
    for (auto& entry : env_entries) {
        c_envp.push_back(entry.data());
    }
    c_envp.push_back(nullptr);

    // Канал для errno неудачного exec (закрывается при успешном exec)
    int err_pipe[2] = {-1, -1};
    if (pipe2(err_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    int out_pipe[2] = {-1, -1};
    if (options.capture_stdout && pipe2(out_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close_fd(err_pipe[0]);
        close_fd(err_pipe[1]);
        close_fd(out_pipe[0]);
        close_fd(out_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Потомок: только async-signal-safe вызовы
        if (out_pipe[1] >= 0) {
            dup2(out_pipe[1], STDOUT_FILENO);
        }
        execvpe(c_argv[0], c_argv.data(), c_envp.data());
        int exec_errno = errno;
        ssize_t written = write(err_pipe[1], &exec_errno, sizeof(exec_errno));
        (void)written;
        _exit(127);
    }

    close_fd(err_pipe[1]);
    close_fd(out_pipe[1]);

    int exec_errno = 0;
    ssize_t n = 0;
    do {
        n = read(err_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (n < 0 && errno == EINTR);
    close_fd(err_pipe[0]);

    if (out_pipe[0] >= 0) {
        char buffer[4096];
        for (;;) {
            ssize_t got = read(out_pipe[0], buffer, sizeof(buffer));
            if (got > 0) {
                result.output.append(buffer, static_cast<std::size_t>(got));
            } else if (got < 0 && errno == EINTR) {
                continue;
            } else {
                break;
            }
        }
        close_fd(out_pipe[0]);
    }

    int status = 0;
    pid_t waited = 0;
    do {
        waited = waitpid(pid, &status, 0);
    } while (waited < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
        result.error = "failed to execute '" + argv[0] + "': " + std::strerror(exec_errno);
        return result;
    }

    if (waited < 0) {
        result.error = std::string("waitpid failed: ") + std::strerror(errno);
        return result;
    }

    result.started = true;
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

}  // namespace midimacro::platform
