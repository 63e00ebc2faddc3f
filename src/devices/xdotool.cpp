// ==============================================================================
// xdotool.cpp - Синтез клавиатуры и активное окно через xdotool
// ==============================================================================
//
// xdotool запускается через platform::run_process для каждого действия.
// Класс окна и заголовок читаются командами
//   xdotool getactivewindow getwindowclassname
//   xdotool getactivewindow getwindowname
//
// ==============================================================================

#include <midimacro/devices.hpp>
#include <midimacro/platform.hpp>

namespace midimacro::devices {

namespace {

std::string trim_newline(std::string s) {
    while (!s.empty() && (s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
    return s;
}

}  // namespace

long delay_to_millis(std::chrono::microseconds delay) {
    if (delay.count() <= 0) {
        return 0;
    }
    return static_cast<long>((delay.count() + 999) / 1000);
}

std::vector<std::string> split_key_sequence(std::string_view sequence) {
    std::vector<std::string> keys;
    std::size_t pos = 0;
    while (pos < sequence.size()) {
        auto start = sequence.find_first_not_of(" \t", pos);
        if (start == std::string_view::npos) {
            break;
        }
        auto end = sequence.find_first_of(" \t", start);
        if (end == std::string_view::npos) {
            end = sequence.size();
        }
        keys.emplace_back(sequence.substr(start, end - start));
        pos = end;
    }
    return keys;
}

// ----------------------------------------------------------------------------
// XdotoolKeyboard
// ----------------------------------------------------------------------------

bool XdotoolKeyboard::send_key_sequence(std::string_view sequence,
                                        std::chrono::microseconds delay) {
    auto keys = split_key_sequence(sequence);
    if (keys.empty()) {
        return false;
    }

    std::vector<std::string> argv = {platform::path_to_utf8(xdotool_), "key", "--delay",
                                      std::to_string(delay_to_millis(delay)), "--"};
    argv.insert(argv.end(), keys.begin(), keys.end());

    return platform::run_process(argv).success();
}

bool XdotoolKeyboard::send_text(std::string_view text, std::chrono::microseconds delay) {
    std::vector<std::string> argv = {platform::path_to_utf8(xdotool_), "type", "--delay",
                                     std::to_string(delay_to_millis(delay)), "--",
                                     std::string(text)};
    return platform::run_process(argv).success();
}

// ----------------------------------------------------------------------------
// XdotoolFocus
// ----------------------------------------------------------------------------

std::optional<std::string> XdotoolFocus::query(const char* command) {
    platform::ProcessOptions options;
    options.capture_stdout = true;

    auto result = platform::run_process(
        {platform::path_to_utf8(xdotool_), "getactivewindow", command}, options);
    if (!result.success()) {
        return std::nullopt;
    }
    return trim_newline(std::move(result.output));
}

std::optional<state::WindowInfo> XdotoolFocus::focused_window() {
    auto window_class = query("getwindowclassname");
    if (!window_class) {
        return std::nullopt;
    }
    auto name = query("getwindowname");

    state::WindowInfo info;
    info.window_class = std::move(*window_class);
    info.name = name ? std::move(*name) : std::string();
    return info;
}

// ----------------------------------------------------------------------------
// Фабрики
// ----------------------------------------------------------------------------

namespace {

std::optional<std::filesystem::path> find_xdotool() {
    if (!platform::get_env("DISPLAY")) {
        return std::nullopt;
    }
    return platform::find_executable("xdotool");
}

}  // namespace

std::unique_ptr<action::KeyboardAdapter> make_keyboard_adapter() {
    auto xdotool = find_xdotool();
    if (!xdotool) {
        return nullptr;
    }
    return std::make_unique<XdotoolKeyboard>(*xdotool);
}

std::unique_ptr<state::FocusAdapter> make_focus_adapter() {
    auto xdotool = find_xdotool();
    if (!xdotool) {
        return nullptr;
    }
    return std::make_unique<XdotoolFocus>(*xdotool);
}

}  // namespace midimacro::devices
