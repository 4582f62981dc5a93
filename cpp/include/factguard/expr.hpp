// ==============================================================================
// factguard/expr.hpp - Песочница выражений $if (санитайзер + компилятор)
// ==============================================================================
//
// Назначение:
// - Санитайзер: allowlist символов + blocklist ключевых слов (первый слой)
// - AST ограниченной грамматики (арифметика, сравнения, && || !, тернарный
//   оператор, литералы, вызовы функций контекста)
// - Вычислитель: идентификаторы разрешаются только через Context (второй слой)
// - Predicate: скомпилированное выражение, кэш LRU по тексту выражения
//
// Доступ к полям ограничен одним уровнем записи контекста (time.hour).
// Методы строк/массивов - фиксированный набор; regex-методы проходят
// через валидатор safe_regex.
//
// ==============================================================================

#ifndef FACTGUARD_EXPR_HPP
#define FACTGUARD_EXPR_HPP

#include <cstddef>
#include <cstdint>
#include <factguard/context.hpp>
#include <factguard/value.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace factguard::expr {

// ============================================================================
// Sanitizer
// ============================================================================

/// Проверить выражение. Возвращает обрезанный текст выражения или бросает
/// ExprError(ErrorKind::Sanitization)
std::string sanitize_expr(std::string_view expr);

/// Ключевые слова, запрещённые как отдельные слова
const std::vector<std::string>& blocked_keywords();

// ============================================================================
// Enums
// ============================================================================

/// Бинарный оператор
enum class BinaryOp {
    Add,          // +
    Sub,          // -
    Mul,          // *
    Div,          // /
    Mod,          // %
    Equal,        // ==
    NotEqual,     // !=
    StrictEqual,  // ===
    StrictNotEqual,  // !==
    Less,         // <
    LessEqual,    // <=
    Greater,      // >
    GreaterEqual  // >=
};

/// Логический оператор (с коротким замыканием)
enum class LogicalOp { And, Or };

/// Унарный оператор
enum class UnaryOp {
    Not,     // !
    Negate,  // -
    Plus     // +
};

/// Фиксированный набор методов строк и массивов
enum class Method {
    Match,        // str.match(pattern)
    Search,       // str.search(pattern)
    Replace,      // str.replace(pattern, replacement)
    Split,        // str.split(pattern)
    Includes,     // str.includes(s) / arr.includes(v)
    StartsWith,   // str.startsWith(s)
    EndsWith,     // str.endsWith(s)
    ToLowerCase,  // str.toLowerCase()
    ToUpperCase,  // str.toUpperCase()
    Trim,         // str.trim()
    Join          // arr.join(sep)
};

// ============================================================================
// Node - AST выражения
// ============================================================================

struct Node;
using NodePtr = std::unique_ptr<Node>;
using NodeVec = std::vector<Node>;

/// Литерал: число, строка, true/false/null
struct NodeLiteral {
    Value value;
};

/// Идентификатор контекста
struct NodeIdentifier {
    std::string name;
};

/// Поле записи контекста: object.field (ровно один уровень)
struct NodeField {
    std::string object;
    std::string field;
};

/// target.length
struct NodeLength {
    NodePtr target;
};

/// target[index] (массивы и строки)
struct NodeIndex {
    NodePtr target;
    NodePtr index;
};

struct NodeUnary {
    UnaryOp op;
    NodePtr operand;
};

struct NodeBinary {
    NodePtr left;
    BinaryOp op;
    NodePtr right;
};

struct NodeLogical {
    NodePtr left;
    LogicalOp op;
    NodePtr right;
};

/// test ? consequent : alternate
struct NodeConditional {
    NodePtr test;
    NodePtr consequent;
    NodePtr alternate;
};

/// Вызов функции контекста: name(args...)
struct NodeCall {
    std::string callee;
    NodeVec args;
};

/// Вызов метода из фиксированного набора: target.method(args...)
struct NodeMethodCall {
    NodePtr target;
    Method method;
    NodeVec args;
};

using NodeVariant =
    std::variant<NodeLiteral, NodeIdentifier, NodeField, NodeLength, NodeIndex, NodeUnary,
                 NodeBinary, NodeLogical, NodeConditional, NodeCall, NodeMethodCall>;

/// Node - рекурсивный узел AST
struct Node {
    NodeVariant data;
    std::size_t height = 1;  // высота поддерева, считает парсер

    Node() : data(NodeLiteral{}) {}

    explicit Node(NodeVariant v) : data(std::move(v)) {}

    static Node make_literal(Value v) { return Node(NodeLiteral{std::move(v)}); }
    static Node make_identifier(std::string name) {
        return Node(NodeIdentifier{std::move(name)});
    }

    bool is_literal() const { return std::holds_alternative<NodeLiteral>(data); }
    bool is_identifier() const { return std::holds_alternative<NodeIdentifier>(data); }

    const NodeLiteral* get_literal() const { return std::get_if<NodeLiteral>(&data); }
    const NodeIdentifier* get_identifier() const { return std::get_if<NodeIdentifier>(&data); }
};

// ============================================================================
// Parser / evaluator
// ============================================================================

/// Предел вложенности рекурсивного спуска (скобки, унарные цепочки, аргументы)
constexpr std::size_t MAX_NESTING = 64;

/// Предел высоты AST (включая левые цепочки бинарных операторов)
constexpr std::size_t MAX_TREE_HEIGHT = 256;

/// Разобрать (уже санитизированное) выражение в AST.
/// Бросает ExprError(Compilation) при синтаксической ошибке или превышении
/// MAX_NESTING / MAX_TREE_HEIGHT и
/// ExprError(RegexSafety) если литеральный паттерн regex-метода небезопасен
Node parse_expression(std::string_view source);

/// Вычислить AST против контекста
Value evaluate(const Node& node, const Context& ctx);

/// Истинность значения: false, 0, NaN, "", null - ложь
bool truthy(const Value& value);

/// Числовое приведение ("3" -> 3, true -> 1, null -> 0, "abc" -> NaN)
double to_number(const Value& value);

/// Имя метода -> Method (nullopt для методов вне набора)
std::optional<Method> method_from_name(std::string_view name);

/// Method -> имя метода
const char* to_string(Method method);

// ============================================================================
// Predicate - скомпилированное выражение
// ============================================================================

class Predicate {
public:
    Predicate() = default;

    Predicate(std::string source, std::shared_ptr<const Node> root)
        : source_(std::move(source)), root_(std::move(root)) {}

    /// Вычислить выражение и привести результат к bool
    bool operator()(const Context& ctx) const { return truthy(evaluate(ctx)); }

    /// Вычислить выражение без приведения к bool
    Value evaluate(const Context& ctx) const;

    /// Санитизированный текст выражения
    const std::string& source() const { return source_; }

    /// Предикат содержит AST
    bool valid() const { return root_ != nullptr; }

    /// Корень AST (для инструментов)
    const Node* root() const { return root_.get(); }

private:
    std::string source_;
    std::shared_ptr<const Node> root_;
};

// ============================================================================
// Compilation & caching
// ============================================================================

/// Ёмкость кэша по умолчанию
constexpr std::size_t DEFAULT_CACHE_CAPACITY = 1024;

/// Скомпилировать выражение (кэш по обрезанному тексту)
Predicate compile_expr(std::string_view expr);

/// Скомпилировать и вычислить выражение. Ошибки, кроме отказа санитайзера,
/// оборачиваются: "Failed to evaluate expression "<expr>": <cause>"
bool eval_expr(std::string_view expr, const Context& ctx);

/// Как eval_expr, но возвращает значение без приведения к bool
Value eval_value(std::string_view expr, const Context& ctx);

/// Счётчики кэша компиляции
struct CompileStats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t sanitize_calls = 0;  // вызовы санитайзера из compile_expr
    std::size_t size = 0;
    std::size_t capacity = 0;
};

/// Снимок счётчиков кэша
CompileStats compile_stats();

/// Очистить кэш и обнулить счётчики
void clear_compile_cache();

/// Изменить ёмкость кэша (0 трактуется как 1); лишние записи вытесняются
void set_cache_capacity(std::size_t capacity);

}  // namespace factguard::expr

#endif  // FACTGUARD_EXPR_HPP
