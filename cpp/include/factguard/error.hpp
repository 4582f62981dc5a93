// ==============================================================================
// factguard/error.hpp - Единый тип ошибки песочницы
// ==============================================================================
//
// Назначение:
// - Один внешне видимый тип ошибки для всех отказов ядра
// - Классификация по стадии (парсинг факта, санитайзер, компиляция,
//   вычисление, проверка regex)
// - Сообщение пригодно для показа автору контента как есть
//
// ==============================================================================

#ifndef FACTGUARD_ERROR_HPP
#define FACTGUARD_ERROR_HPP

#include <stdexcept>
#include <string>

namespace factguard {

/// Стадия, на которой произошёл отказ
enum class ErrorKind {
    Parse,         // синтаксис "$if <expr>: <content>"
    Sanitization,  // allowlist символов / blocklist ключевых слов
    Compilation,   // грамматика выражения
    Evaluation,    // ошибка времени выполнения (roll("abc"), неизвестный идентификатор)
    RegexSafety    // структурный отказ валидатора regex
};

/// Строковое имя стадии (для JSON/trace вывода)
inline const char* to_string(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::Parse:
        return "parse";
    case ErrorKind::Sanitization:
        return "sanitization";
    case ErrorKind::Compilation:
        return "compilation";
    case ErrorKind::Evaluation:
        return "evaluation";
    case ErrorKind::RegexSafety:
        return "regex";
    }
    return "unknown";
}

/// Ошибка выражения / факта / regex
class ExprError : public std::runtime_error {
public:
    ExprError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ErrorKind kind() const noexcept { return kind_; }

private:
    ErrorKind kind_;
};

}  // namespace factguard

#endif  // FACTGUARD_ERROR_HPP
