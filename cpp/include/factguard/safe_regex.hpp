// ==============================================================================
// factguard/safe_regex.hpp - Структурная проверка безопасности regex
// ==============================================================================
//
// Назначение:
// - Валидатор паттернов от авторов контента (рекурсивный спуск, один проход)
// - Отказ для любых конструкций с катастрофическим backtracking
// - Отказ для capturing-групп, lookaround, именованных групп, backreferences
// - Безопасные операции match/search/replace/split поверх std::regex
//
// Инвариант: квантификатор нельзя применить к атому, внутри которого уже есть
// квантификатор. Это исключает все формы вида (a+)+ при любой вложенности.
//
// Валидация выполняется независимым анализом строки: паттерн никогда не
// компилируется в std::regex до того, как проверка пройдена.
//
// ==============================================================================

#ifndef FACTGUARD_SAFE_REGEX_HPP
#define FACTGUARD_SAFE_REGEX_HPP

#include <cstddef>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <vector>

namespace factguard::regex {

// ============================================================================
// Validator
// ============================================================================

/// Предел длины паттерна
constexpr std::size_t MAX_REGEX_PATTERN = 1000;

/// Предел вложенности групп (?:...)
constexpr std::size_t MAX_GROUP_NESTING = 32;

/// Предел длины строки, к которой применяется regex (std::regex рекурсивен
/// по длине входа)
constexpr std::size_t MAX_REGEX_INPUT = 10000;

/// Проверить паттерн. Возвращает управление, если паттерн безопасен;
/// иначе бросает ExprError(ErrorKind::RegexSafety) с описанием причины.
void validate_regex_pattern(std::string_view pattern);

/// Неисключительный вариант: сообщение об ошибке или nullopt
std::optional<std::string> check_regex_pattern(std::string_view pattern);

// ============================================================================
// Safe operations - единственные точки создания std::regex из чужих строк
// ============================================================================

/// Бросает ExprError(ErrorKind::RegexSafety), если text длиннее MAX_REGEX_INPUT
void check_regex_input(std::string_view text);

/// Проверить и скомпилировать паттерн (ECMAScript)
std::regex compile_safe(std::string_view pattern, bool ignore_case = false);

/// Первое совпадение паттерна в строке (nullopt если нет совпадения)
std::optional<std::string> safe_match(const std::string& text, std::string_view pattern,
                                      bool ignore_case = false);

/// Есть ли совпадение где-либо в строке
bool safe_test(const std::string& text, std::string_view pattern, bool ignore_case = false);

/// Позиция первого совпадения или -1
long safe_search(const std::string& text, std::string_view pattern);

/// Заменить первое совпадение
std::string safe_replace(const std::string& text, std::string_view pattern,
                         const std::string& replacement);

/// Разбить строку по паттерну
std::vector<std::string> safe_split(const std::string& text, std::string_view pattern);

}  // namespace factguard::regex

#endif  // FACTGUARD_SAFE_REGEX_HPP
