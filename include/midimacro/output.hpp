// ==============================================================================
// midimacro/output.hpp - Пользовательский вывод
// ==============================================================================
//
// Назначение:
// - Единственная точка записи в stdout/stderr
// - Диагностика с уровнями: info/warn/error/debug/trace
// - JSON Lines для команды monitor (RapidJSON)
// - Цветной вывод (ANSI escape codes) при TTY
//
// Writer используется из нескольких потоков (приёмник MIDI и движок),
// поэтому каждая строка пишется одним вызовом под мьютексом.
//
// ==============================================================================

#ifndef MIDIMACRO_OUTPUT_HPP
#define MIDIMACRO_OUTPUT_HPP

#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>

// Forward declarations для JSON
namespace rapidjson {
class CrtAllocator;
template <typename BaseAllocator>
class MemoryPoolAllocator;
template <typename Encoding, typename Allocator>
class GenericValue;
template <typename CharType>
struct UTF8;
using Value = GenericValue<UTF8<char>, MemoryPoolAllocator<CrtAllocator>>;
}  // namespace rapidjson

namespace midimacro::output {

enum class Stream { Stdout, Stderr };

enum class Color {
    Default,
    Green,   // Успех, информация
    Yellow,  // Предупреждения
    Red,     // Ошибки
    Cyan,    // Отладка
    Magenta  // Трассировка
};

// ----------------------------------------------------------------------------
// Конфигурация вывода
// ----------------------------------------------------------------------------

struct OutputConfig {
    bool quiet = false;  // -q: подавить info/warn
    int verbose = 0;     // -v: уровень подробности (0..2+)
};

// ----------------------------------------------------------------------------
// Writer - единый слой вывода
// ----------------------------------------------------------------------------

class Writer {
public:
    explicit Writer(const OutputConfig& cfg);
    ~Writer();

    Writer(const Writer&) = delete;
    Writer& operator=(const Writer&) = delete;

    /// Записать байты в поток
    void write(Stream s, std::string_view bytes);

    /// Записать строку с переводом строки
    void write_line(Stream s, std::string_view bytes);

    /// "[+] <message>" в stderr (если не quiet)
    void info(std::string_view message);

    /// "[!] <message>" в stderr (если не quiet)
    void warn(std::string_view message);

    /// "[x] <message>" в stderr (всегда)
    void error(std::string_view message);

    /// "[*] <message>" в stderr (только при verbose > 0)
    void debug(std::string_view message);

    /// "[~] <message>" в stderr (только при verbose > 1)
    void trace(std::string_view message);

    /// Зелёная строка в stdout
    void green_line(std::string_view message);

    /// Записать JSON значение + newline в stdout (JSONL)
    void write_json_line(const rapidjson::Value& value);

    void flush();

    const OutputConfig& config() const { return config_; }

private:
    void write_impl(Stream s, std::string_view bytes);

    void write_prefixed(std::string_view prefix, Color color, std::string_view message);

    void write_colored_line(Stream s, std::string_view message, Color color);

    static FILE* get_file(Stream s);

    OutputConfig config_;
    std::mutex mutex_;
};

// ----------------------------------------------------------------------------
// Вспомогательные функции
// ----------------------------------------------------------------------------

std::string ansi_color_code(Color color);

/// Проверить, поддерживает ли поток цвета (TTY check)
bool supports_color(Stream s);

}  // namespace midimacro::output

#endif  // MIDIMACRO_OUTPUT_HPP
