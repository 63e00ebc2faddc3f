// ==============================================================================
// value.cpp - Реализация Value (каноническая модель документа)
// ==============================================================================

#include <cmath>
#include <midimacro/value.hpp>
#include <rapidjson/document.h>
#include <stdexcept>

namespace midimacro {

Value::Type Value::type() const {
    if (is_null())
        return Type::Null;
    if (is_bool())
        return Type::Bool;
    if (is_int())
        return Type::Int;
    if (is_double())
        return Type::Float;
    if (is_string())
        return Type::String;
    if (is_array())
        return Type::Array;
    return Type::Object;
}

const char* type_name(Value::Type type) {
    switch (type) {
    case Value::Type::Null:
        return "null";
    case Value::Type::Bool:
        return "boolean";
    case Value::Type::Int:
        return "integer";
    case Value::Type::Float:
        return "float";
    case Value::Type::String:
        return "string";
    case Value::Type::Array:
        return "list";
    case Value::Type::Object:
        return "map";
    }
    return "unknown";
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson - конверсия из RapidJSON
// ----------------------------------------------------------------------------
//
// Порядок для чисел: Int64 → Double. UInt64 сверх диапазона int64
// становится Double: в конфигурации нет беззнаковых полей.
//

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
        if (json.IsInt64()) {
            return Value(static_cast<std::int64_t>(json.GetInt64()));
        }
        return Value(json.GetDouble());
    }

    if (json.IsString()) {
        return Value(std::string(json.GetString(), json.GetStringLength()));
    }

    if (json.IsArray()) {
        Array arr;
        arr.reserve(json.Size());
        for (rapidjson::SizeType i = 0; i < json.Size(); ++i) {
            arr.push_back(from_rapidjson(json[i]));
        }
        return Value(std::move(arr));
    }

    if (json.IsObject()) {
        Object obj;
        for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it) {
            std::string key(it->name.GetString(), it->name.GetStringLength());
            obj[key] = from_rapidjson(it->value);
        }
        return Value(std::move(obj));
    }

    return Value();
}

// ----------------------------------------------------------------------------
// Value::to_rapidjson - конверсия в RapidJSON
// ----------------------------------------------------------------------------

void Value::to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const {
    if (is_null()) {
        out.SetNull();
        return;
    }

    if (is_bool()) {
        out.SetBool(as_bool());
        return;
    }

    if (is_int()) {
        out.SetInt64(as_int());
        return;
    }

    if (is_double()) {
        double d = as_double();
        if (!std::isfinite(d)) {
            throw std::runtime_error("could not convert float to JSON: non-finite value");
        }
        out.SetDouble(d);
        return;
    }

    if (is_string()) {
        const auto& s = as_string();
        out.SetString(s.c_str(), static_cast<rapidjson::SizeType>(s.size()), alloc);
        return;
    }

    if (is_array()) {
        out.SetArray();
        const auto& arr = as_array();
        out.Reserve(static_cast<rapidjson::SizeType>(arr.size()), alloc);
        for (const auto& elem : arr) {
            rapidjson::Value v;
            elem.to_rapidjson(v, alloc);
            out.PushBack(v, alloc);
        }
        return;
    }

    out.SetObject();
    for (const auto& [key, val] : as_object()) {
        rapidjson::Value k;
        k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
        rapidjson::Value v;
        val.to_rapidjson(v, alloc);
        out.AddMember(k, v, alloc);
    }
}

rapidjson::Document Value::to_rapidjson_document() const {
    rapidjson::Document doc;
    to_rapidjson(doc, doc.GetAllocator());
    return doc;
}

}  // namespace midimacro
