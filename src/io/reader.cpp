// ==============================================================================
// reader.cpp - Источник конфигурации: YAML (yaml-cpp) и JSON (RapidJSON)
// ==============================================================================

#include <cctype>
#include <fstream>
#include <midimacro/platform.hpp>
#include <midimacro/reader.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>
#include <sstream>
#include <yaml-cpp/yaml.h>

namespace midimacro::io {

// ============================================================================
// DocumentFormat функции
// ============================================================================

const char* document_format_to_string(DocumentFormat format) {
    switch (format) {
    case DocumentFormat::Yaml:
        return "yaml";
    case DocumentFormat::Json:
        return "json";
    case DocumentFormat::Unknown:
        return "unknown";
    }
    return "unknown";
}

DocumentFormat document_format_from_extension(std::string_view ext) {
    std::string lower_ext;
    lower_ext.reserve(ext.size());
    for (char c : ext) {
        lower_ext.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
    }

    if (lower_ext == "yml" || lower_ext == "yaml") {
        return DocumentFormat::Yaml;
    }
    if (lower_ext == "json") {
        return DocumentFormat::Json;
    }
    return DocumentFormat::Unknown;
}

DocumentFormat document_format_from_path(const std::filesystem::path& path) {
    if (!path.has_extension()) {
        return DocumentFormat::Unknown;
    }
    std::string ext = path.extension().string();
    if (!ext.empty() && ext[0] == '.') {
        ext = ext.substr(1);
    }
    return document_format_from_extension(ext);
}

std::string ReaderError::format() const {
    if (path.empty()) {
        return "failed to load document - " + message;
    }
    return "failed to load file '" + path + "' - " + message;
}

// ============================================================================
// YAML → Value
// ============================================================================

namespace {

bool is_yaml_bool(const std::string& s, bool& out) {
    if (s == "true" || s == "True" || s == "TRUE") {
        out = true;
        return true;
    }
    if (s == "false" || s == "False" || s == "FALSE") {
        out = false;
        return true;
    }
    return false;
}

// Скаляр: кавычки → строка; иначе bool → int → float → строка.
// Только true/false считаются bool: "yes"/"on"/"y" остаются строками,
// чтобы "y" в key_sequence не превращалась в булево значение.
Value scalar_from_yaml(const YAML::Node& node) {
    const std::string& text = node.Scalar();

    if (node.Tag() == "!") {
        return Value(text);
    }

    bool b = false;
    if (is_yaml_bool(text, b)) {
        return Value(b);
    }

    std::int64_t i = 0;
    if (YAML::convert<std::int64_t>::decode(node, i)) {
        return Value(i);
    }

    double d = 0.0;
    if (!text.empty() && (std::isdigit(static_cast<unsigned char>(text[0])) || text[0] == '-' ||
                          text[0] == '+' || text[0] == '.')) {
        if (YAML::convert<double>::decode(node, d)) {
            return Value(d);
        }
    }

    return Value(text);
}

Value value_from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
        return Value();

    case YAML::NodeType::Scalar:
        return scalar_from_yaml(node);

    case YAML::NodeType::Sequence: {
        Value::Array arr;
        arr.reserve(node.size());
        for (const auto& item : node) {
            arr.push_back(value_from_yaml(item));
        }
        return Value(std::move(arr));
    }

    case YAML::NodeType::Map: {
        Value::Object obj;
        for (const auto& kv : node) {
            obj[kv.first.as<std::string>()] = value_from_yaml(kv.second);
        }
        return Value(std::move(obj));
    }
    }

    return Value();
}

DocumentResult parse_yaml(std::string_view text) {
    DocumentResult result;
    try {
        YAML::Node root = YAML::Load(std::string(text));
        result.document = value_from_yaml(root);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = ReaderError{ReaderErrorKind::ParseError,
                                   std::string("YAML parse error: ") + e.what(), {}};
    }
    return result;
}

DocumentResult parse_json(std::string_view text) {
    DocumentResult result;
    rapidjson::Document doc;
    doc.Parse(text.data(), text.size());
    if (doc.HasParseError()) {
        result.error = ReaderError{ReaderErrorKind::ParseError,
                                   std::string("JSON parse error: ") +
                                       rapidjson::GetParseError_En(doc.GetParseError()) +
                                       " at offset " + std::to_string(doc.GetErrorOffset()),
                                   {}};
        return result;
    }
    result.document = Value::from_rapidjson(doc);
    result.ok = true;
    return result;
}

}  // namespace

// ============================================================================
// Публичный API
// ============================================================================

DocumentResult parse_document(std::string_view text, DocumentFormat format) {
    switch (format) {
    case DocumentFormat::Yaml:
        return parse_yaml(text);
    case DocumentFormat::Json:
        return parse_json(text);
    case DocumentFormat::Unknown:
        break;
    }

    DocumentResult result;
    result.error =
        ReaderError{ReaderErrorKind::UnsupportedFormat, "unsupported document format", {}};
    return result;
}

DocumentResult load_document(const std::filesystem::path& path) {
    DocumentResult result;
    const std::string path_utf8 = platform::path_to_utf8(path);

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        result.error = ReaderError{ReaderErrorKind::FileNotFound, "file not found", path_utf8};
        return result;
    }

    DocumentFormat format = document_format_from_path(path);
    if (format == DocumentFormat::Unknown) {
        result.error = ReaderError{ReaderErrorKind::UnsupportedFormat,
                                   "config must have a .yml, .yaml or .json extension",
                                   path_utf8};
        return result;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = ReaderError{ReaderErrorKind::IoError, "could not open file", path_utf8};
        return result;
    }

    std::ostringstream buffer;
    buffer << file.rdbuf();
    if (file.bad()) {
        result.error = ReaderError{ReaderErrorKind::IoError, "could not read file", path_utf8};
        return result;
    }

    result = parse_document(buffer.str(), format);
    if (!result.ok) {
        result.error.path = path_utf8;
    }
    return result;
}

}  // namespace midimacro::io
