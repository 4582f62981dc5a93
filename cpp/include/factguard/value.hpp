// ==============================================================================
// factguard/value.hpp - Значения контекста выражений (Value)
// ==============================================================================
//
// Назначение:
// - Каноническое представление значений, доступных выражениям $if
// - Плоские записи (Object) для одноуровневого доступа: time.hour
// - Нативные функции контекста (random, hasFact, roll, ...)
// - Конверсия из/в RapidJSON Value (конфиг, JSON вывод trace)
//
// Числа хранятся только как double: выражения не различают int/float.
//
// ==============================================================================

#ifndef FACTGUARD_VALUE_HPP
#define FACTGUARD_VALUE_HPP

#include <functional>
#include <memory>
#include <string>
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

namespace factguard {

class Value;

/// Тип для массива значений
using ValueArray = std::vector<Value>;

/// Тип для записи (map string -> Value)
using ValueObject = std::unordered_map<std::string, Value>;

/// Нативная функция контекста
using NativeFunction = std::function<Value(const std::vector<Value>&)>;

/// Значение контекста выражения
class Value {
public:
    struct Null {};
    using Bool = bool;
    using Number = double;
    using String = std::string;
    using Array = ValueArray;
    using Object = ValueObject;
    using Function = NativeFunction;

private:
    std::variant<Null, Bool, Number, String, std::shared_ptr<Array>, std::shared_ptr<Object>,
                 std::shared_ptr<const Function>>
        data_;

public:
    // -------------------------------------------------------------------------
    // Конструкторы
    // -------------------------------------------------------------------------

    Value() : data_(Null{}) {}

    explicit Value(bool v) : data_(v) {}

    explicit Value(double v) : data_(v) {}

    explicit Value(int v) : data_(static_cast<double>(v)) {}

    explicit Value(std::string v) : data_(std::move(v)) {}

    explicit Value(const char* v) : data_(std::string(v)) {}

    explicit Value(Array v) : data_(std::make_shared<Array>(std::move(v))) {}

    explicit Value(Object v) : data_(std::make_shared<Object>(std::move(v))) {}

    explicit Value(Function fn) : data_(std::make_shared<const Function>(std::move(fn))) {}

    // -------------------------------------------------------------------------
    // Статические фабричные методы
    // -------------------------------------------------------------------------

    static Value make_null() { return Value(); }
    static Value make_bool(bool v) { return Value(v); }
    static Value make_number(double v) { return Value(v); }
    static Value make_string(std::string v) { return Value(std::move(v)); }
    static Value make_array() { return Value(Array{}); }
    static Value make_object() { return Value(Object{}); }
    static Value make_function(Function fn) { return Value(std::move(fn)); }

    // -------------------------------------------------------------------------
    // Проверка типа
    // -------------------------------------------------------------------------

    bool is_null() const { return std::holds_alternative<Null>(data_); }
    bool is_bool() const { return std::holds_alternative<Bool>(data_); }
    bool is_number() const { return std::holds_alternative<Number>(data_); }
    bool is_string() const { return std::holds_alternative<String>(data_); }
    bool is_array() const { return std::holds_alternative<std::shared_ptr<Array>>(data_); }
    bool is_object() const { return std::holds_alternative<std::shared_ptr<Object>>(data_); }
    bool is_function() const {
        return std::holds_alternative<std::shared_ptr<const Function>>(data_);
    }

    /// Имя типа для диагностики ("null", "number", ...)
    const char* type_name() const;

    // -------------------------------------------------------------------------
    // Доступ к значению (undefined behavior при несовпадении типа)
    // -------------------------------------------------------------------------

    Bool as_bool() const { return std::get<Bool>(data_); }
    Number as_number() const { return std::get<Number>(data_); }
    const String& as_string() const { return std::get<String>(data_); }
    const Array& as_array() const { return *std::get<std::shared_ptr<Array>>(data_); }
    const Object& as_object() const { return *std::get<std::shared_ptr<Object>>(data_); }
    const Function& as_function() const {
        return *std::get<std::shared_ptr<const Function>>(data_);
    }

    // -------------------------------------------------------------------------
    // Безопасный доступ (nullptr если тип не совпадает)
    // -------------------------------------------------------------------------

    const Bool* get_bool() const { return std::get_if<Bool>(&data_); }

    const Number* get_number() const { return std::get_if<Number>(&data_); }

    const String* get_string() const { return std::get_if<String>(&data_); }

    const Array* get_array() const {
        auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Object* get_object() const {
        auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    const Function* get_function() const {
        auto* ptr = std::get_if<std::shared_ptr<const Function>>(&data_);
        return ptr ? ptr->get() : nullptr;
    }

    // -------------------------------------------------------------------------
    // Операции с массивом
    // -------------------------------------------------------------------------

    /// Добавить элемент в массив (только если is_array())
    void push_back(Value v) {
        if (auto* ptr = std::get_if<std::shared_ptr<Array>>(&data_)) {
            (*ptr)->push_back(std::move(v));
        }
    }

    /// Размер массива (0 если не массив)
    std::size_t array_size() const {
        if (const auto* arr = get_array()) {
            return arr->size();
        }
        return 0;
    }

    // -------------------------------------------------------------------------
    // Операции с записью
    // -------------------------------------------------------------------------

    /// Установить поле записи (только если is_object())
    void set(const std::string& key, Value v) {
        if (auto* ptr = std::get_if<std::shared_ptr<Object>>(&data_)) {
            (**ptr)[key] = std::move(v);
        }
    }

    /// Получить поле записи (nullptr если не найдено или не запись)
    const Value* get(const std::string& key) const {
        if (const auto* obj = get_object()) {
            auto it = obj->find(key);
            if (it != obj->end()) {
                return &it->second;
            }
        }
        return nullptr;
    }

    // -------------------------------------------------------------------------
    // Строковое представление
    // -------------------------------------------------------------------------

    /// Строковая форма для конкатенации и вывода:
    /// 3 -> "3", 0.5 -> "0.5", true -> "true", [1,2] -> "1,2", null -> "null"
    std::string to_display_string() const;

    // -------------------------------------------------------------------------
    // Конверсия из/в RapidJSON
    // -------------------------------------------------------------------------

    /// Конвертировать из RapidJSON Value (все числа -> double)
    static Value from_rapidjson(const rapidjson::Value& json);

    /// Конвертировать в RapidJSON Value. Функции сериализуются как "[function]"
    void to_rapidjson(rapidjson::Value& out, rapidjson::Document::AllocatorType& alloc) const;
};

/// Форматирование числа так, как его увидит автор ("3", "0.25", "NaN")
std::string format_number(double value);

}  // namespace factguard

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif

#endif  // FACTGUARD_VALUE_HPP
