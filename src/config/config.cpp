// ==============================================================================
// config.cpp - Точки входа разрешения конфигурации
// ==============================================================================

#include <midimacro/config.hpp>
#include <midimacro/reader.hpp>
#include <stdexcept>

namespace midimacro::config {

namespace {

ResolveResult make_error(ConfigErrorKind kind, std::string message) {
    ResolveResult result;
    result.ok = false;
    result.error.kind = kind;
    result.error.message = std::move(message);
    return result;
}

}  // namespace

const char* config_error_kind_to_string(ConfigErrorKind kind) {
    switch (kind) {
    case ConfigErrorKind::InvalidConfig:
        return "invalid config";
    case ConfigErrorKind::UnsupportedVersion:
        return "unsupported version";
    case ConfigErrorKind::SourceError:
        return "config source error";
    }
    return "unknown";
}

std::string ConfigError::format() const {
    std::string result = config_error_kind_to_string(kind);
    result += ": ";
    result += message;
    return result;
}

rule::EventMatcher default_stop_event() {
    return rule::MidiEventMatcher::control_change(std::nullopt, match::NumberMatcher::val(51),
                                                  match::NumberMatcher::val(127));
}

std::unique_ptr<Resolver> resolver_for_version(std::string_view version) {
    if (version == "1") {
        return make_version1_resolver();
    }
    return nullptr;
}

ResolveResult resolve(const Value& document, std::string_view version) {
    auto resolver = resolver_for_version(version);
    if (!resolver) {
        return make_error(ConfigErrorKind::UnsupportedVersion,
                          "config version '" + std::string(version) +
                              "' is not supported (latest is " + CURRENT_VERSION + ")");
    }

    // Резолверы сообщают об ошибках исключениями; наружу - только ResolveResult
    try {
        ResolveResult result;
        result.config = resolver->resolve(document);
        result.ok = true;
        return result;
    } catch (const std::runtime_error& e) {
        return make_error(ConfigErrorKind::InvalidConfig, e.what());
    } catch (const std::invalid_argument& e) {
        return make_error(ConfigErrorKind::InvalidConfig, e.what());
    }
}

ResolveResult resolve(const Value& document) {
    if (!document.is_object()) {
        return make_error(ConfigErrorKind::InvalidConfig,
                          std::string("config should be a map, found ") +
                              type_name(document.type()));
    }

    const Value* version = document.get("version");
    if (version == nullptr || version->is_null()) {
        return resolve(document, CURRENT_VERSION);
    }
    if (const auto* s = version->get_string()) {
        return resolve(document, *s);
    }
    if (const auto* i = version->get_int()) {
        return resolve(document, std::to_string(*i));
    }
    return make_error(ConfigErrorKind::InvalidConfig,
                      std::string("version: should be a string or integer, found ") +
                          type_name(version->type()));
}

ResolveResult load(const std::filesystem::path& path) {
    auto doc = io::load_document(path);
    if (!doc) {
        return make_error(ConfigErrorKind::SourceError, doc.error.format());
    }
    return resolve(doc.document);
}

}  // namespace midimacro::config
