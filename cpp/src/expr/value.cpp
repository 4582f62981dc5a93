// ==============================================================================
// value.cpp - Реализация Value (значения контекста выражений)
// ==============================================================================

#include <cmath>
#include <cstdio>
#include <factguard/value.hpp>
#include <rapidjson/document.h>

namespace factguard {

// ----------------------------------------------------------------------------
// Диагностика
// ----------------------------------------------------------------------------

const char* Value::type_name() const {
    if (is_null())
        return "null";
    if (is_bool())
        return "boolean";
    if (is_number())
        return "number";
    if (is_string())
        return "string";
    if (is_array())
        return "array";
    if (is_object())
        return "object";
    return "function";
}

// ----------------------------------------------------------------------------
// Строковое представление
// ----------------------------------------------------------------------------

std::string format_number(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    if (std::isinf(value)) {
        return value > 0 ? "Infinity" : "-Infinity";
    }
    // Целые значения без дробной части: 3, а не 3.000000
    if (value == std::floor(value) && std::fabs(value) < 1e15) {
        char buf[32];
        std::snprintf(buf, sizeof(buf), "%.0f", value);
        // -0 печатается как 0
        return value == 0 ? "0" : std::string(buf);
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.15g", value);
    return buf;
}

std::string Value::to_display_string() const {
    if (is_null()) {
        return "null";
    }
    if (is_bool()) {
        return as_bool() ? "true" : "false";
    }
    if (is_number()) {
        return format_number(as_number());
    }
    if (is_string()) {
        return as_string();
    }
    if (is_array()) {
        std::string result;
        const auto& arr = as_array();
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (i > 0)
                result += ",";
            // null внутри массива отображается пустой строкой
            if (!arr[i].is_null()) {
                result += arr[i].to_display_string();
            }
        }
        return result;
    }
    if (is_object()) {
        return "[object]";
    }
    return "[function]";
}

// ----------------------------------------------------------------------------
// Value::from_rapidjson - конверсия из RapidJSON
// ----------------------------------------------------------------------------

Value Value::from_rapidjson(const rapidjson::Value& json) {
    if (json.IsNull()) {
        return Value();
    }

    if (json.IsBool()) {
        return Value(json.GetBool());
    }

    if (json.IsNumber()) {
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

    if (is_number()) {
        double d = as_number();
        // JSON не умеет NaN/Infinity: пишем null
        if (!std::isfinite(d)) {
            out.SetNull();
            return;
        }
        if (d == std::floor(d) && std::fabs(d) < 9.0e15) {
            out.SetInt64(static_cast<std::int64_t>(d));
        } else {
            out.SetDouble(d);
        }
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

    if (is_object()) {
        out.SetObject();
        const auto& obj = as_object();
        for (const auto& [key, val] : obj) {
            rapidjson::Value k;
            k.SetString(key.c_str(), static_cast<rapidjson::SizeType>(key.size()), alloc);
            rapidjson::Value v;
            val.to_rapidjson(v, alloc);
            out.AddMember(k, v, alloc);
        }
        return;
    }

    out.SetString("[function]", alloc);
}

}  // namespace factguard
