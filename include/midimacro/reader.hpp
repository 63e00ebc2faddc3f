// ==============================================================================
// midimacro/reader.hpp - Источник конфигурации (YAML/JSON → Value)
// ==============================================================================
//
// Назначение:
// - Выбор парсера по расширению файла (yml/yaml → yaml-cpp, json → RapidJSON)
// - Построение канонического дерева Value из текста или файла
// - Типизация YAML скаляров по core schema YAML 1.2
//
// Модуль ничего не знает о схеме конфигурации: он отдаёт только Value.
//
// ==============================================================================

#ifndef MIDIMACRO_READER_HPP
#define MIDIMACRO_READER_HPP

#include <filesystem>
#include <midimacro/value.hpp>
#include <string>
#include <string_view>

namespace midimacro::io {

// ----------------------------------------------------------------------------
// DocumentFormat - формат текста конфигурации
// ----------------------------------------------------------------------------

enum class DocumentFormat {
    Yaml,    // .yml, .yaml
    Json,    // .json
    Unknown  // Неизвестное расширение
};

/// Преобразовать DocumentFormat в строку
const char* document_format_to_string(DocumentFormat format);

/// Определить формат по расширению (без точки, регистр не важен)
DocumentFormat document_format_from_extension(std::string_view ext);

/// Определить формат по пути файла
DocumentFormat document_format_from_path(const std::filesystem::path& path);

// ----------------------------------------------------------------------------
// ReaderError - ошибки чтения
// ----------------------------------------------------------------------------

enum class ReaderErrorKind {
    FileNotFound,       // Файл не найден
    UnsupportedFormat,  // Расширение не распознано
    ParseError,         // Ошибка синтаксиса YAML/JSON
    IoError             // Ошибка ввода-вывода
};

struct ReaderError {
    ReaderErrorKind kind = ReaderErrorKind::IoError;
    std::string message;
    std::string path;

    /// Формат: "failed to load file '<path>' - <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// DocumentResult
// ----------------------------------------------------------------------------

struct DocumentResult {
    bool ok = false;
    Value document;
    ReaderError error;

    explicit operator bool() const { return ok; }
};

/// Распарсить текст в Value
DocumentResult parse_document(std::string_view text, DocumentFormat format);

/// Прочитать и распарсить файл; формат определяется по расширению
DocumentResult load_document(const std::filesystem::path& path);

}  // namespace midimacro::io

#endif  // MIDIMACRO_READER_HPP
