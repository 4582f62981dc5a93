// ==============================================================================
// factguard/fact.hpp - Факты и условные факты $if
// ==============================================================================
//
// Назначение:
// - Разбор строки факта: "$if <expr>: <content>" или обычный текст
// - Комментарии "$#" (не попадают в результат)
// - Пакетное вычисление списка фактов против контекста
// - Трассировка и lint (инструменты автора фактов)
// - Загрузка файла фактов (.json массив строк или текст построчно)
//
// ==============================================================================

#ifndef FACTGUARD_FACT_HPP
#define FACTGUARD_FACT_HPP

#include <cstddef>
#include <factguard/context.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace factguard::fact {

/// Префикс условного факта (чувствителен к регистру, ровно один пробел)
constexpr std::string_view CONDITIONAL_PREFIX = "$if ";

/// Префикс строки-комментария
constexpr std::string_view COMMENT_PREFIX = "$#";

// ============================================================================
// Fact
// ============================================================================

struct Fact {
    std::string content;
    bool conditional = false;
    std::optional<std::string> expression;  // только для conditional
};

/// Разобрать строку факта.
/// @throw ExprError(Parse) если после "$if " нет двоеточия
Fact parse_fact(std::string_view raw);

/// У условного факта непустое выражение ("$if : x" - пустое)
bool has_expression(const Fact& fact);

/// Строка является комментарием "$#"
bool is_comment(std::string_view raw);

/// Убрать комментарии из списка
std::vector<std::string> strip_comments(const std::vector<std::string>& facts);

/// Активные факты: безусловные всегда, условные если выражение истинно.
/// Условный факт с пустым выражением не включается. Комментарии
/// пропускаются. Первая ошибка прерывает пакет.
std::vector<std::string> evaluate_facts(const std::vector<std::string>& facts,
                                        const expr::Context& ctx);

// ============================================================================
// Trace / lint
// ============================================================================

/// Результат вычисления одного факта
struct FactTrace {
    std::string raw;
    bool conditional = false;
    std::optional<std::string> expression;
    std::optional<bool> result;       // нет значения при ошибке или для безусловных
    std::optional<std::string> error;
    bool included = false;
    std::string content;
};

/// Вычислить каждый факт отдельно; ошибка факта фиксируется в его записи
std::vector<FactTrace> trace_facts(const std::vector<std::string>& facts,
                                   const expr::Context& ctx);

/// Проблема, найденная lint
struct LintIssue {
    std::size_t line = 0;  // номер строки файла или 1-based индекс в списке
    std::string raw;
    std::string message;
};

/// Разобрать и скомпилировать все факты без вычисления
std::vector<LintIssue> lint_facts(const std::vector<std::string>& facts);

/// То же, lines[i] - номер строки файла для facts[i] (LoadResult::lines)
std::vector<LintIssue> lint_facts(const std::vector<std::string>& facts,
                                  const std::vector<std::size_t>& lines);

// ============================================================================
// Loading
// ============================================================================

/// Ошибка загрузки файла фактов
struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

/// Результат загрузки
struct LoadResult {
    bool ok = false;
    std::vector<std::string> facts;
    std::vector<std::size_t> lines;  // номер строки (элемента JSON) каждого факта, 1-based
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить факты: .json - массив строк, иначе по одному факту на непустую строку
LoadResult load_facts(const std::filesystem::path& path);

}  // namespace factguard::fact

#endif  // FACTGUARD_FACT_HPP
