// ==============================================================================
// midimacro/config.hpp - Разрешение конфигурации (Value → Config)
// ==============================================================================
//
// Назначение:
// - Config: упорядоченный список макросов + глобальные настройки
// - Resolver: независимая реализация на каждую версию схемы
// - load(): чтение файла (io::load_document) + разрешение
//
// Порядок макросов в Config совпадает с порядком объявления в документе.
// Частично разобранные макросы в Config не попадают: любая ошибка отменяет
// всю конфигурацию.
//
// ==============================================================================

#ifndef MIDIMACRO_CONFIG_HPP
#define MIDIMACRO_CONFIG_HPP

#include <chrono>
#include <filesystem>
#include <memory>
#include <midimacro/action.hpp>
#include <midimacro/event.hpp>
#include <midimacro/macro.hpp>
#include <midimacro/value.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace midimacro::config {

// ----------------------------------------------------------------------------
// ConfigError
// ----------------------------------------------------------------------------

enum class ConfigErrorKind {
    InvalidConfig,       // Поле отсутствует, неверной формы или вне допустимых значений
    UnsupportedVersion,  // Неизвестная версия схемы
    SourceError          // Файл не прочитан или не распарсен
};

const char* config_error_kind_to_string(ConfigErrorKind kind);

struct ConfigError {
    ConfigErrorKind kind = ConfigErrorKind::InvalidConfig;
    std::string message;

    /// Формат: "<kind>: <message>"
    std::string format() const;
};

// ----------------------------------------------------------------------------
// Config
// ----------------------------------------------------------------------------

/// CC 51 = 127 на любом канале
rule::EventMatcher default_stop_event();

struct Settings {
    /// Подстрока имени порта для `listen` без явного аргумента
    std::optional<std::string> midi_port;
    std::chrono::microseconds key_delay = action::DEFAULT_KEY_DELAY;
    rule::EventMatcher stop_event = default_stop_event();
};

struct Config {
    std::vector<rule::Macro> macros;
    Settings settings;
};

struct ResolveResult {
    bool ok = false;
    Config config;
    ConfigError error;

    explicit operator bool() const { return ok; }
};

// ----------------------------------------------------------------------------
// Resolver
// ----------------------------------------------------------------------------

/// Разрешение документа одной версии схемы.
/// resolve() бросает std::runtime_error с сообщением вида "<путь поля>: <ошибка>".
class Resolver {
public:
    virtual ~Resolver() = default;

    virtual const char* version() const = 0;

    virtual Config resolve(const Value& document) const = 0;
};

std::unique_ptr<Resolver> make_version1_resolver();

/// nullptr если версия неизвестна
std::unique_ptr<Resolver> resolver_for_version(std::string_view version);

/// Последняя поддерживаемая версия схемы
constexpr const char* CURRENT_VERSION = "1";

// ----------------------------------------------------------------------------
// Точки входа
// ----------------------------------------------------------------------------

/// Разрешить документ по явно заданной версии
ResolveResult resolve(const Value& document, std::string_view version);

/// Разрешить документ; версия берётся из поля `version` (по умолчанию "1")
ResolveResult resolve(const Value& document);

/// Прочитать файл (YAML/JSON по расширению) и разрешить его
ResolveResult load(const std::filesystem::path& path);

}  // namespace midimacro::config

#endif  // MIDIMACRO_CONFIG_HPP
