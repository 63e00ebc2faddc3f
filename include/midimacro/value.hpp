// ==============================================================================
// midimacro/value.hpp - Каноническая модель нетипизированного документа (Value)
// ==============================================================================
//
// Назначение:
// - Представление распарсенной конфигурации (YAML/JSON) до разрешения
// - Рекурсивный вариант: Null, Bool, Int, Float, String, Array, Object
// - Конверсия из/в RapidJSON Value
//
// Дерево Value создаётся один раз на загрузку конфигурации и потребляется
// целиком резолвером; после этого оно не живёт.
//
// ==============================================================================

#ifndef MIDIMACRO_VALUE_HPP
#define MIDIMACRO_VALUE_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

#include <rapidjson/document.h>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::get on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace midimacro {

class Value;

/// Тип для массива значений (порядок сохраняется)
using ValueArray = std::vector<Value>;

/// Тип для объекта (порядок ключей не важен)
using ValueObject = std::unordered_map<std::string, Value>;

/// Нетипизированное значение конфигурации
class Value {
public:
    struct Null {};
    using Bool = bool;
    using Int64 = std::int64_t;
    using Double = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;

    /// Тип значения (для диагностики)
    enum class Type { Null, Bool, Int, Float, String, Array, Object };

private:
    std::variant<Null, Bool, Int64, Double, String, std::shared_ptr<Array>,
                 std::shared_ptr<Object>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}

    explicit Value(bool v) : data_(v) {}

    explicit Value(std::int64_t v) : data_(v) {}

    explicit Value(int v) : data_(static_cast<std::int64_t>(v)) {}

    explicit Value(double v) : data_(v) {}

    explicit Value(std::string v) : data_(std::move(v)) {}

    explicit Value(const char* v) : data_(std::string(v)) {}

    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}

    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_int() const { return std::holds_alternative<Int64>(data_); }
    bool is_double() const { return std::holds_alternative<Double>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }

    Type type() const;

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Int64 as_int() const { return std::get<Int64>(data_); }
    Double as_double() const { return std::get<Double>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const Bool* get_bool() const { return std::get_if<Bool>(&data_); }

    const Int64* get_int() const { return std::get_if<Int64>(&data_); }

    const Double* get_double() const { return std::get_if<Double>(&data_); }

    const String* get_string() const { return std::get_if<String>(&data_); }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Массив
    // -------------------------------------------------------------------------

    /// Размер массива (0 если не массив)
    std::size_t array_size() const {
        const auto* arr = get_array();
        return arr ? arr->size() : 0;
    }

    /// Доступ к элементу массива по индексу
    const Value* at(std::size_t index) const {
        if (const auto* arr = get_array()) {
            if (index < arr->size()) {
                return &(*arr)[index];
            }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Объект
    // -------------------------------------------------------------------------

    /// Получить поле объекта по ключу (nullptr если не найдено или не объект)
    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    /// Проверить наличие ключа в объекте
    bool has(const std::string& key) const { return get(key) != nullptr; }

    // -------------------------------------------------------------------------
    // Конверсия RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value
    /// Числа: Int64 если представимо, иначе Double
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Конвертировать в RapidJSON Value
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;

    /// Создать новый RapidJSON Document из этого Value
    rapidjson::Document to_rapidjson_document() const;

};

/// Имя типа для сообщений об ошибках ("map", "string", ...)
const char* type_name(Value::Type type);

}  // namespace midimacro

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // MIDIMACRO_VALUE_HPP
