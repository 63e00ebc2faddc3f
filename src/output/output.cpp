// ==============================================================================
// output.cpp - Пользовательский вывод
// ==============================================================================
//
// Байты первичны: избегаем std::endl и iostream, пишем через fwrite.
//
// ==============================================================================

#include <cstdio>
#include <midimacro/output.hpp>
#include <midimacro/platform.hpp>
#include <rapidjson/document.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

namespace midimacro::output {

namespace {

// ANSI SGR коды
constexpr const char* ANSI_RESET = "\x1b[0m";
constexpr const char* ANSI_GREEN = "\x1b[32m";
constexpr const char* ANSI_YELLOW = "\x1b[33m";
constexpr const char* ANSI_RED = "\x1b[31m";
constexpr const char* ANSI_CYAN = "\x1b[36m";
constexpr const char* ANSI_MAGENTA = "\x1b[35m";

std::string prefixed(std::string_view prefix, std::string_view message) {
    std::string result(prefix);
    result.append(message);
    result.push_back('\n');
    return result;
}

}  // namespace

// ----------------------------------------------------------------------------
// Writer
// ----------------------------------------------------------------------------

Writer::Writer(const OutputConfig& cfg) : config_(cfg) {}

Writer::~Writer() {
    flush();
}

void Writer::write(Stream s, std::string_view bytes) {
    write_impl(s, bytes);
}

void Writer::write_line(Stream s, std::string_view bytes) {
    std::string line(bytes);
    line.push_back('\n');
    write_impl(s, line);
}

void Writer::write_impl(Stream s, std::string_view bytes) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fwrite(bytes.data(), 1, bytes.size(), get_file(s));
    if (s == Stream::Stderr) {
        std::fflush(stderr);
    }
}

FILE* Writer::get_file(Stream s) {
    return (s == Stream::Stdout) ? stdout : stderr;
}

void Writer::write_prefixed(std::string_view prefix, Color color, std::string_view message) {
    if (supports_color(Stream::Stderr)) {
        std::string line = ansi_color_code(color);
        line.append(prefix);
        line.append(ANSI_RESET);
        line.append(message);
        line.push_back('\n');
        write_impl(Stream::Stderr, line);
    } else {
        write_impl(Stream::Stderr, prefixed(prefix, message));
    }
}

void Writer::info(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[+] ", Color::Green, message);
}

void Writer::warn(std::string_view message) {
    if (config_.quiet) {
        return;
    }
    write_prefixed("[!] ", Color::Yellow, message);
}

void Writer::error(std::string_view message) {
    // Ошибки печатаются всегда, даже при --quiet
    write_prefixed("[x] ", Color::Red, message);
}

void Writer::debug(std::string_view message) {
    if (config_.verbose <= 0) {
        return;
    }
    write_prefixed("[*] ", Color::Cyan, message);
}

void Writer::trace(std::string_view message) {
    if (config_.verbose <= 1) {
        return;
    }
    write_prefixed("[~] ", Color::Magenta, message);
}

void Writer::green_line(std::string_view message) {
    write_colored_line(Stream::Stdout, message, Color::Green);
}

void Writer::write_colored_line(Stream s, std::string_view message, Color color) {
    std::string line;
    if (supports_color(s)) {
        line = ansi_color_code(color);
        line.append(message);
        line.append(ANSI_RESET);
    } else {
        line.assign(message);
    }
    line.push_back('\n');
    write_impl(s, line);
}

void Writer::write_json_line(const rapidjson::Value& value) {
    rapidjson::StringBuffer buffer;
    rapidjson::Writer<rapidjson::StringBuffer> writer(buffer);
    value.Accept(writer);

    std::string line(buffer.GetString(), buffer.GetSize());
    line.push_back('\n');
    write_impl(Stream::Stdout, line);
    flush();
}

void Writer::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    std::fflush(stderr);
}

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color) {
    switch (color) {
    case Color::Green:
        return ANSI_GREEN;
    case Color::Yellow:
        return ANSI_YELLOW;
    case Color::Red:
        return ANSI_RED;
    case Color::Cyan:
        return ANSI_CYAN;
    case Color::Magenta:
        return ANSI_MAGENTA;
    case Color::Default:
    default:
        return "";
    }
}

bool supports_color(Stream s) {
    if (s == Stream::Stdout) {
        return platform::is_tty_stdout();
    }
    return platform::is_tty_stderr();
}

}  // namespace midimacro::output
