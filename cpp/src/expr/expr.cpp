// ==============================================================================
// expr.cpp - Компилятор и вычислитель выражений $if
// ==============================================================================
//
// Лексер -> рекурсивный спуск по уровням приоритета -> AST (Node) ->
// вычисление через std::visit. Идентификаторы ищутся только в Context.
//
// Приоритеты (от низкого к высокому):
//   ?:  ||  &&  == != === !==  < <= > >=  + -  * / %  ! - +  postfix
//
// ==============================================================================

#include <factguard/error.hpp>
#include <factguard/expr.hpp>
#include <factguard/safe_regex.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <cstdlib>
#include <list>
#include <mutex>
#include <type_traits>
#include <unordered_map>

// GCC 13 generates false positives for -Wnull-dereference when using
// std::visit on std::variant at high optimization levels.
// See: https://gcc.gnu.org/bugzilla/show_bug.cgi?id=108842
#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wnull-dereference"
#endif

namespace factguard::expr {

namespace {

// ============================================================================
// Lexer
// ============================================================================

enum class TokenType { Number, String, Identifier, Punct, End };

struct Token {
    TokenType type = TokenType::End;
    std::string text;
    double number = 0;
    std::size_t pos = 0;
};

bool is_ident_start(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[noreturn]] void compile_error(const std::string& message, std::size_t pos) {
    throw ExprError(ErrorKind::Compilation,
                    message + " at position " + std::to_string(pos + 1));
}

// Операторы, длинные раньше коротких
constexpr const char* PUNCTUATORS[] = {"===", "!==", "==", "!=", "<=", ">=", "&&", "||",
                                       "+",   "-",   "*",  "/",  "%",  "!",  "<",  ">",
                                       "?",   ":",   "(",  ")",  "[",  "]",  ",",  "."};

std::vector<Token> tokenize(std::string_view src) {
    std::vector<Token> tokens;
    std::size_t i = 0;

    while (i < src.size()) {
        char c = src[i];

        if (std::isspace(static_cast<unsigned char>(c)) != 0) {
            ++i;
            continue;
        }

        Token tok;
        tok.pos = i;

        if (is_digit(c)) {
            std::size_t start = i;
            while (i < src.size() && is_digit(src[i]))
                ++i;
            if (i + 1 < src.size() && src[i] == '.' && is_digit(src[i + 1])) {
                ++i;
                while (i < src.size() && is_digit(src[i]))
                    ++i;
            }
            if (i < src.size() && is_ident_char(src[i])) {
                compile_error("Invalid number literal", start);
            }
            tok.type = TokenType::Number;
            tok.text = std::string(src.substr(start, i - start));
            tok.number = std::strtod(tok.text.c_str(), nullptr);
            tokens.push_back(std::move(tok));
            continue;
        }

        if (is_ident_start(c)) {
            std::size_t start = i;
            while (i < src.size() && is_ident_char(src[i]))
                ++i;
            tok.type = TokenType::Identifier;
            tok.text = std::string(src.substr(start, i - start));
            tokens.push_back(std::move(tok));
            continue;
        }

        if (c == '"' || c == '\'') {
            std::size_t end = src.find(c, i + 1);
            if (end == std::string_view::npos) {
                compile_error("Unterminated string literal", i);
            }
            tok.type = TokenType::String;
            tok.text = std::string(src.substr(i + 1, end - i - 1));
            tokens.push_back(std::move(tok));
            i = end + 1;
            continue;
        }

        bool matched = false;
        for (const char* punct : PUNCTUATORS) {
            std::string_view p(punct);
            if (src.substr(i, p.size()) == p) {
                tok.type = TokenType::Punct;
                tok.text = std::string(p);
                tokens.push_back(std::move(tok));
                i += p.size();
                matched = true;
                break;
            }
        }
        if (!matched) {
            if (c == '=') {
                compile_error("Assignment is not allowed", i);
            }
            compile_error(std::string("Unexpected character \"") + c + "\"", i);
        }
    }

    Token end;
    end.type = TokenType::End;
    end.pos = src.size();
    tokens.push_back(std::move(end));
    return tokens;
}

// ============================================================================
// Parser
// ============================================================================

bool is_regex_method(Method m) {
    return m == Method::Match || m == Method::Search || m == Method::Replace ||
           m == Method::Split;
}

/// Допустимое число аргументов метода [min, max]
std::pair<std::size_t, std::size_t> method_arity(Method m) {
    switch (m) {
    case Method::Replace:
        return {2, 2};
    case Method::ToLowerCase:
    case Method::ToUpperCase:
    case Method::Trim:
        return {0, 0};
    case Method::Join:
        return {0, 1};
    default:
        return {1, 1};
    }
}

NodePtr boxed(Node node) {
    return std::make_unique<Node>(std::move(node));
}

/// Наибольшая высота непосредственных потомков узла
std::size_t child_height(const NodeVariant& data) {
    std::size_t height = 0;
    auto take = [&height](const Node& child) { height = std::max(height, child.height); };

    std::visit(
        [&](const auto& n) {
            using T = std::decay_t<decltype(n)>;
            if constexpr (std::is_same_v<T, NodeLength>) {
                take(*n.target);
            } else if constexpr (std::is_same_v<T, NodeIndex>) {
                take(*n.target);
                take(*n.index);
            } else if constexpr (std::is_same_v<T, NodeUnary>) {
                take(*n.operand);
            } else if constexpr (std::is_same_v<T, NodeBinary> || std::is_same_v<T, NodeLogical>) {
                take(*n.left);
                take(*n.right);
            } else if constexpr (std::is_same_v<T, NodeConditional>) {
                take(*n.test);
                take(*n.consequent);
                take(*n.alternate);
            } else if constexpr (std::is_same_v<T, NodeCall>) {
                for (const auto& arg : n.args)
                    take(arg);
            } else if constexpr (std::is_same_v<T, NodeMethodCall>) {
                take(*n.target);
                for (const auto& arg : n.args)
                    take(arg);
            }
        },
        data);
    return height;
}

class Parser {
public:
    explicit Parser(std::string_view source) : tokens_(tokenize(source)) {}

    Node parse() {
        if (peek().type == TokenType::End) {
            compile_error("Empty expression", 0);
        }
        Node node = parse_conditional();
        if (peek().type != TokenType::End) {
            compile_error("Unexpected token \"" + peek().text + "\"", peek().pos);
        }
        return node;
    }

private:
    /// Счётчик глубины рекурсивного спуска
    class NestingGuard {
    public:
        explicit NestingGuard(Parser& parser) : parser_(parser) {
            if (parser_.depth_ >= MAX_NESTING) {
                compile_error("Expression nested too deeply", parser_.peek().pos);
            }
            ++parser_.depth_;
        }
        ~NestingGuard() { --parser_.depth_; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        Parser& parser_;
    };

    /// Составной узел: высота = 1 + max(высоты детей), не более MAX_TREE_HEIGHT
    Node composite(NodeVariant data) const {
        Node node(std::move(data));
        node.height = 1 + child_height(node.data);
        if (node.height > MAX_TREE_HEIGHT) {
            compile_error("Expression nested too deeply", peek().pos);
        }
        return node;
    }

    const Token& peek() const { return tokens_[pos_]; }

    const Token& advance() { return tokens_[pos_++]; }

    bool check(const char* punct) const {
        return peek().type == TokenType::Punct && peek().text == punct;
    }

    bool match(const char* punct) {
        if (check(punct)) {
            ++pos_;
            return true;
        }
        return false;
    }

    void expect(const char* punct) {
        if (!match(punct)) {
            std::string found = peek().type == TokenType::End ? "end of expression"
                                                              : "\"" + peek().text + "\"";
            compile_error(std::string("Expected \"") + punct + "\" but found " + found,
                          peek().pos);
        }
    }

    Node parse_conditional() {
        NestingGuard guard(*this);
        Node test = parse_or();
        if (!match("?")) {
            return test;
        }
        Node consequent = parse_conditional();
        expect(":");
        Node alternate = parse_conditional();
        return composite(NodeConditional{boxed(std::move(test)), boxed(std::move(consequent)),
                                    boxed(std::move(alternate))});
    }

    Node parse_or() {
        Node left = parse_and();
        while (match("||")) {
            Node right = parse_and();
            left = composite(
                NodeLogical{boxed(std::move(left)), LogicalOp::Or, boxed(std::move(right))});
        }
        return left;
    }

    Node parse_and() {
        Node left = parse_equality();
        while (match("&&")) {
            Node right = parse_equality();
            left = composite(
                NodeLogical{boxed(std::move(left)), LogicalOp::And, boxed(std::move(right))});
        }
        return left;
    }

    Node parse_equality() {
        Node left = parse_relational();
        while (true) {
            BinaryOp op;
            if (match("===")) {
                op = BinaryOp::StrictEqual;
            } else if (match("!==")) {
                op = BinaryOp::StrictNotEqual;
            } else if (match("==")) {
                op = BinaryOp::Equal;
            } else if (match("!=")) {
                op = BinaryOp::NotEqual;
            } else {
                return left;
            }
            Node right = parse_relational();
            left = composite(NodeBinary{boxed(std::move(left)), op, boxed(std::move(right))});
        }
    }

    Node parse_relational() {
        Node left = parse_additive();
        while (true) {
            BinaryOp op;
            if (match("<=")) {
                op = BinaryOp::LessEqual;
            } else if (match(">=")) {
                op = BinaryOp::GreaterEqual;
            } else if (match("<")) {
                op = BinaryOp::Less;
            } else if (match(">")) {
                op = BinaryOp::Greater;
            } else {
                return left;
            }
            Node right = parse_additive();
            left = composite(NodeBinary{boxed(std::move(left)), op, boxed(std::move(right))});
        }
    }

    Node parse_additive() {
        Node left = parse_multiplicative();
        while (true) {
            BinaryOp op;
            if (match("+")) {
                op = BinaryOp::Add;
            } else if (match("-")) {
                op = BinaryOp::Sub;
            } else {
                return left;
            }
            Node right = parse_multiplicative();
            left = composite(NodeBinary{boxed(std::move(left)), op, boxed(std::move(right))});
        }
    }

    Node parse_multiplicative() {
        Node left = parse_unary();
        while (true) {
            BinaryOp op;
            if (match("*")) {
                op = BinaryOp::Mul;
            } else if (match("/")) {
                op = BinaryOp::Div;
            } else if (match("%")) {
                op = BinaryOp::Mod;
            } else {
                return left;
            }
            Node right = parse_unary();
            left = composite(NodeBinary{boxed(std::move(left)), op, boxed(std::move(right))});
        }
    }

    Node parse_unary() {
        UnaryOp op;
        if (match("!")) {
            op = UnaryOp::Not;
        } else if (match("-")) {
            op = UnaryOp::Negate;
        } else if (match("+")) {
            op = UnaryOp::Plus;
        } else {
            return parse_postfix();
        }
        NestingGuard guard(*this);
        return composite(NodeUnary{op, boxed(parse_unary())});
    }

    Node parse_postfix() {
        Node node = parse_primary();

        while (true) {
            if (match(".")) {
                const Token& name = advance();
                if (name.type != TokenType::Identifier) {
                    compile_error("Expected property name after \".\"", name.pos);
                }

                if (check("(")) {
                    auto method = method_from_name(name.text);
                    if (!method) {
                        compile_error("Unknown method \"" + name.text + "\"", name.pos);
                    }
                    NodeVec args = parse_arguments();
                    check_method_call(*method, args, name.pos);
                    node = composite(
                        NodeMethodCall{boxed(std::move(node)), *method, std::move(args)});
                } else if (name.text == "length") {
                    node = composite(NodeLength{boxed(std::move(node))});
                } else if (const auto* id = node.get_identifier()) {
                    std::string object = id->name;
                    node = Node(NodeField{std::move(object), name.text});
                } else {
                    compile_error("Property access is limited to one level of a context field (\"." +
                                      name.text + "\")",
                                  name.pos);
                }
            } else if (check("(")) {
                const auto* id = node.get_identifier();
                if (id == nullptr) {
                    compile_error("Only context functions can be called", peek().pos);
                }
                std::string callee = id->name;
                NodeVec args = parse_arguments();
                node = composite(NodeCall{std::move(callee), std::move(args)});
            } else if (match("[")) {
                Node index = parse_conditional();
                expect("]");
                node = composite(NodeIndex{boxed(std::move(node)), boxed(std::move(index))});
            } else {
                return node;
            }
        }
    }

    NodeVec parse_arguments() {
        expect("(");
        NodeVec args;
        if (match(")")) {
            return args;
        }
        do {
            args.push_back(parse_conditional());
        } while (match(","));
        expect(")");
        return args;
    }

    void check_method_call(Method method, const NodeVec& args, std::size_t pos) {
        auto [min_args, max_args] = method_arity(method);
        if (args.size() < min_args || args.size() > max_args) {
            compile_error(std::string("Wrong number of arguments for ") + to_string(method) + "()",
                          pos);
        }
        // Литеральный паттерн проверяется сразу при компиляции
        if (is_regex_method(method) && !args.empty()) {
            if (const auto* lit = args[0].get_literal()) {
                if (const auto* pattern = lit->value.get_string()) {
                    regex::validate_regex_pattern(*pattern);
                }
            }
        }
    }

    Node parse_primary() {
        const Token& tok = advance();

        switch (tok.type) {
        case TokenType::Number:
            return Node::make_literal(Value(tok.number));
        case TokenType::String:
            return Node::make_literal(Value(tok.text));
        case TokenType::Identifier:
            if (tok.text == "true") {
                return Node::make_literal(Value(true));
            }
            if (tok.text == "false") {
                return Node::make_literal(Value(false));
            }
            if (tok.text == "null") {
                return Node::make_literal(Value());
            }
            return Node::make_identifier(tok.text);
        case TokenType::Punct:
            if (tok.text == "(") {
                Node inner = parse_conditional();
                expect(")");
                return inner;
            }
            compile_error("Unexpected token \"" + tok.text + "\"", tok.pos);
        case TokenType::End:
            break;
        }
        compile_error("Unexpected end of expression", tok.pos);
    }

    std::vector<Token> tokens_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
};

// ============================================================================
// Evaluation helpers
// ============================================================================

[[noreturn]] void eval_error(const std::string& message) {
    throw ExprError(ErrorKind::Evaluation, message);
}

bool same_identity(const Value& a, const Value& b) {
    if (a.is_array())
        return a.get_array() == b.get_array();
    if (a.is_object())
        return a.get_object() == b.get_object();
    return a.get_function() == b.get_function();
}

bool strict_equal(const Value& a, const Value& b) {
    if (a.is_null() || b.is_null()) {
        return a.is_null() && b.is_null();
    }
    if (a.is_bool() && b.is_bool()) {
        return a.as_bool() == b.as_bool();
    }
    if (a.is_number() && b.is_number()) {
        return a.as_number() == b.as_number();
    }
    if (a.is_string() && b.is_string()) {
        return a.as_string() == b.as_string();
    }
    if (std::string_view(a.type_name()) != b.type_name()) {
        return false;
    }
    return same_identity(a, b);
}

bool is_primitive(const Value& v) {
    return v.is_bool() || v.is_number() || v.is_string();
}

/// Операнд "+" без строк и составных значений складывается как число
bool is_numeric_operand(const Value& v) {
    return v.is_null() || v.is_bool() || v.is_number();
}

bool loose_equal(const Value& a, const Value& b) {
    if (std::string_view(a.type_name()) == b.type_name()) {
        return strict_equal(a, b);
    }
    if (a.is_null() || b.is_null()) {
        return false;
    }
    if (is_primitive(a) && is_primitive(b)) {
        return to_number(a) == to_number(b);
    }
    return false;
}

bool compare(const Value& a, const Value& b, BinaryOp op) {
    if (a.is_string() && b.is_string()) {
        const auto& x = a.as_string();
        const auto& y = b.as_string();
        switch (op) {
        case BinaryOp::Less:
            return x < y;
        case BinaryOp::LessEqual:
            return x <= y;
        case BinaryOp::Greater:
            return x > y;
        default:
            return x >= y;
        }
    }
    double x = to_number(a);
    double y = to_number(b);
    switch (op) {
    case BinaryOp::Less:
        return x < y;
    case BinaryOp::LessEqual:
        return x <= y;
    case BinaryOp::Greater:
        return x > y;
    default:
        return x >= y;
    }
}

Value apply_binary(const Value& a, BinaryOp op, const Value& b) {
    switch (op) {
    case BinaryOp::Add:
        if (is_numeric_operand(a) && is_numeric_operand(b)) {
            return Value(to_number(a) + to_number(b));
        }
        return Value(a.to_display_string() + b.to_display_string());
    case BinaryOp::Sub:
        return Value(to_number(a) - to_number(b));
    case BinaryOp::Mul:
        return Value(to_number(a) * to_number(b));
    case BinaryOp::Div:
        return Value(to_number(a) / to_number(b));
    case BinaryOp::Mod:
        return Value(std::fmod(to_number(a), to_number(b)));
    case BinaryOp::Equal:
        return Value(loose_equal(a, b));
    case BinaryOp::NotEqual:
        return Value(!loose_equal(a, b));
    case BinaryOp::StrictEqual:
        return Value(strict_equal(a, b));
    case BinaryOp::StrictNotEqual:
        return Value(!strict_equal(a, b));
    case BinaryOp::Less:
    case BinaryOp::LessEqual:
    case BinaryOp::Greater:
    case BinaryOp::GreaterEqual:
        return Value(compare(a, b, op));
    }
    return Value();
}

std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string uppercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return s;
}

std::string trim_copy(const std::string& s) {
    std::size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin])) != 0)
        ++begin;
    std::size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0)
        --end;
    return s.substr(begin, end - begin);
}

/// Аргумент-паттерн regex-метода
std::string pattern_arg(const std::vector<Value>& args, Method method) {
    if (args[0].is_null()) {
        eval_error(std::string(to_string(method)) + "() expects a pattern string");
    }
    return args[0].to_display_string();
}

Value call_string_method(const std::string& text, Method method, const std::vector<Value>& args) {
    switch (method) {
    case Method::Match: {
        auto m = regex::safe_match(text, pattern_arg(args, method));
        if (!m) {
            return Value();
        }
        ValueArray result;
        result.push_back(Value(*m));
        return Value(std::move(result));
    }
    case Method::Search:
        return Value(static_cast<double>(regex::safe_search(text, pattern_arg(args, method))));
    case Method::Replace:
        return Value(
            regex::safe_replace(text, pattern_arg(args, method), args[1].to_display_string()));
    case Method::Split: {
        ValueArray parts;
        for (auto& part : regex::safe_split(text, pattern_arg(args, method))) {
            parts.push_back(Value(std::move(part)));
        }
        return Value(std::move(parts));
    }
    case Method::Includes:
        return Value(text.find(args[0].to_display_string()) != std::string::npos);
    case Method::StartsWith: {
        std::string prefix = args[0].to_display_string();
        return Value(text.compare(0, prefix.size(), prefix) == 0);
    }
    case Method::EndsWith: {
        std::string suffix = args[0].to_display_string();
        return Value(text.size() >= suffix.size() &&
                     text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0);
    }
    case Method::ToLowerCase:
        return Value(lowercase(text));
    case Method::ToUpperCase:
        return Value(uppercase(text));
    case Method::Trim:
        return Value(trim_copy(text));
    case Method::Join:
        break;
    }
    eval_error(std::string(to_string(method)) + "() is not available on string");
}

Value call_array_method(const ValueArray& arr, Method method, const std::vector<Value>& args) {
    switch (method) {
    case Method::Includes:
        return Value(std::any_of(arr.begin(), arr.end(),
                                 [&](const Value& v) { return strict_equal(v, args[0]); }));
    case Method::Join: {
        std::string sep = args.empty() ? "," : args[0].to_display_string();
        std::string result;
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (i > 0)
                result += sep;
            if (!arr[i].is_null())
                result += arr[i].to_display_string();
        }
        return Value(std::move(result));
    }
    default:
        break;
    }
    eval_error(std::string(to_string(method)) + "() is not available on array");
}

const Value& lookup(const Context& ctx, const std::string& name) {
    const Value* value = ctx.find(name);
    if (value == nullptr) {
        eval_error("Unknown identifier: " + name);
    }
    return *value;
}

std::vector<Value> evaluate_all(const NodeVec& nodes, const Context& ctx) {
    std::vector<Value> values;
    values.reserve(nodes.size());
    for (const auto& node : nodes) {
        values.push_back(evaluate(node, ctx));
    }
    return values;
}

// ============================================================================
// Compiled expression cache (LRU)
// ============================================================================

std::string_view trim_view(std::string_view s) {
    std::size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin])) != 0)
        ++begin;
    std::size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0)
        --end;
    return s.substr(begin, end - begin);
}

class ExprCache {
public:
    std::optional<Predicate> lookup(const std::string& key) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++stats_.misses;
            return std::nullopt;
        }
        ++stats_.hits;
        entries_.splice(entries_.begin(), entries_, it->second);
        return it->second->second;
    }

    void record_sanitize() {
        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.sanitize_calls;
    }

    // Повторная компиляция того же ключа в параллельном потоке безвредна:
    // запись просто уже существует
    void insert(const std::string& key, const Predicate& predicate) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (index_.find(key) != index_.end()) {
            return;
        }
        entries_.emplace_front(key, predicate);
        index_[key] = entries_.begin();
        evict_locked();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_.clear();
        index_.clear();
        std::size_t capacity = stats_.capacity;
        stats_ = CompileStats{};
        stats_.capacity = capacity;
    }

    void set_capacity(std::size_t capacity) {
        std::lock_guard<std::mutex> lock(mutex_);
        stats_.capacity = capacity == 0 ? 1 : capacity;
        evict_locked();
    }

    CompileStats stats() {
        std::lock_guard<std::mutex> lock(mutex_);
        CompileStats snapshot = stats_;
        snapshot.size = entries_.size();
        return snapshot;
    }

private:
    void evict_locked() {
        while (entries_.size() > stats_.capacity) {
            index_.erase(entries_.back().first);
            entries_.pop_back();
        }
    }

    using Entry = std::pair<std::string, Predicate>;

    std::mutex mutex_;
    std::list<Entry> entries_;
    std::unordered_map<std::string, std::list<Entry>::iterator> index_;
    CompileStats stats_{0, 0, 0, 0, DEFAULT_CACHE_CAPACITY};
};

ExprCache& cache() {
    static ExprCache instance;
    return instance;
}

std::string wrap_message(std::string_view expr, const char* cause) {
    return "Failed to evaluate expression \"" + std::string(expr) + "\": " + cause;
}

}  // namespace

// ============================================================================
// Public helpers
// ============================================================================

std::optional<Method> method_from_name(std::string_view name) {
    static const std::unordered_map<std::string_view, Method> methods = {
        {"match", Method::Match},
        {"search", Method::Search},
        {"replace", Method::Replace},
        {"split", Method::Split},
        {"includes", Method::Includes},
        {"startsWith", Method::StartsWith},
        {"endsWith", Method::EndsWith},
        {"toLowerCase", Method::ToLowerCase},
        {"toUpperCase", Method::ToUpperCase},
        {"trim", Method::Trim},
        {"join", Method::Join},
    };
    auto it = methods.find(name);
    if (it == methods.end()) {
        return std::nullopt;
    }
    return it->second;
}

const char* to_string(Method method) {
    switch (method) {
    case Method::Match:
        return "match";
    case Method::Search:
        return "search";
    case Method::Replace:
        return "replace";
    case Method::Split:
        return "split";
    case Method::Includes:
        return "includes";
    case Method::StartsWith:
        return "startsWith";
    case Method::EndsWith:
        return "endsWith";
    case Method::ToLowerCase:
        return "toLowerCase";
    case Method::ToUpperCase:
        return "toUpperCase";
    case Method::Trim:
        return "trim";
    case Method::Join:
        return "join";
    }
    return "unknown";
}

bool truthy(const Value& value) {
    if (value.is_null()) {
        return false;
    }
    if (const auto* b = value.get_bool()) {
        return *b;
    }
    if (const auto* n = value.get_number()) {
        return *n != 0 && !std::isnan(*n);
    }
    if (const auto* s = value.get_string()) {
        return !s->empty();
    }
    return true;
}

double to_number(const Value& value) {
    if (value.is_null()) {
        return 0;
    }
    if (const auto* b = value.get_bool()) {
        return *b ? 1 : 0;
    }
    if (const auto* n = value.get_number()) {
        return *n;
    }
    if (const auto* s = value.get_string()) {
        std::string trimmed = trim_copy(*s);
        if (trimmed.empty()) {
            return 0;
        }
        char* end = nullptr;
        double result = std::strtod(trimmed.c_str(), &end);
        if (end != trimmed.c_str() + trimmed.size()) {
            return std::nan("");
        }
        return result;
    }
    return std::nan("");
}

// ============================================================================
// Parser / evaluator
// ============================================================================

Node parse_expression(std::string_view source) {
    Parser parser(source);
    return parser.parse();
}

Value evaluate(const Node& node, const Context& ctx) {
    return std::visit(
        [&ctx](const auto& n) -> Value {
            using T = std::decay_t<decltype(n)>;

            if constexpr (std::is_same_v<T, NodeLiteral>) {
                return n.value;
            } else if constexpr (std::is_same_v<T, NodeIdentifier>) {
                return lookup(ctx, n.name);
            } else if constexpr (std::is_same_v<T, NodeField>) {
                const Value& object = lookup(ctx, n.object);
                if (!object.is_object()) {
                    eval_error("Cannot read field \"" + n.field + "\" of " + n.object + " (" +
                               object.type_name() + ")");
                }
                const Value* field = object.get(n.field);
                return field != nullptr ? *field : Value();
            } else if constexpr (std::is_same_v<T, NodeLength>) {
                Value target = evaluate(*n.target, ctx);
                if (const auto* s = target.get_string()) {
                    return Value(static_cast<double>(s->size()));
                }
                if (const auto* arr = target.get_array()) {
                    return Value(static_cast<double>(arr->size()));
                }
                eval_error(std::string("length is not available on ") + target.type_name());
            } else if constexpr (std::is_same_v<T, NodeIndex>) {
                Value target = evaluate(*n.target, ctx);
                double idx = to_number(evaluate(*n.index, ctx));
                bool valid = idx >= 0 && idx == std::floor(idx);
                if (const auto* arr = target.get_array()) {
                    if (!valid || idx >= static_cast<double>(arr->size())) {
                        return Value();
                    }
                    return (*arr)[static_cast<std::size_t>(idx)];
                }
                if (const auto* s = target.get_string()) {
                    if (!valid || idx >= static_cast<double>(s->size())) {
                        return Value();
                    }
                    return Value(std::string(1, (*s)[static_cast<std::size_t>(idx)]));
                }
                eval_error(std::string("Index access is not available on ") + target.type_name());
            } else if constexpr (std::is_same_v<T, NodeUnary>) {
                Value operand = evaluate(*n.operand, ctx);
                switch (n.op) {
                case UnaryOp::Not:
                    return Value(!truthy(operand));
                case UnaryOp::Negate:
                    return Value(-to_number(operand));
                case UnaryOp::Plus:
                    return Value(to_number(operand));
                }
                return Value();
            } else if constexpr (std::is_same_v<T, NodeBinary>) {
                Value left = evaluate(*n.left, ctx);
                Value right = evaluate(*n.right, ctx);
                return apply_binary(left, n.op, right);
            } else if constexpr (std::is_same_v<T, NodeLogical>) {
                Value left = evaluate(*n.left, ctx);
                if (n.op == LogicalOp::And) {
                    return truthy(left) ? evaluate(*n.right, ctx) : left;
                }
                return truthy(left) ? left : evaluate(*n.right, ctx);
            } else if constexpr (std::is_same_v<T, NodeConditional>) {
                return truthy(evaluate(*n.test, ctx)) ? evaluate(*n.consequent, ctx)
                                                      : evaluate(*n.alternate, ctx);
            } else if constexpr (std::is_same_v<T, NodeCall>) {
                const Value& callee = lookup(ctx, n.callee);
                const auto* fn = callee.get_function();
                if (fn == nullptr) {
                    eval_error(n.callee + " is not a function");
                }
                return (*fn)(evaluate_all(n.args, ctx));
            } else {
                static_assert(std::is_same_v<T, NodeMethodCall>);
                Value target = evaluate(*n.target, ctx);
                std::vector<Value> args = evaluate_all(n.args, ctx);
                if (const auto* s = target.get_string()) {
                    return call_string_method(*s, n.method, args);
                }
                if (const auto* arr = target.get_array()) {
                    return call_array_method(*arr, n.method, args);
                }
                eval_error(std::string(to_string(n.method)) + "() is not available on " +
                           target.type_name());
            }
        },
        node.data);
}

Value Predicate::evaluate(const Context& ctx) const {
    if (!root_) {
        throw ExprError(ErrorKind::Compilation, "Predicate is empty");
    }
    return expr::evaluate(*root_, ctx);
}

// ============================================================================
// Compilation & caching
// ============================================================================

Predicate compile_expr(std::string_view expr) {
    std::string key(trim_view(expr));

    if (auto cached = cache().lookup(key)) {
        return *cached;
    }

    cache().record_sanitize();
    std::string sanitized = sanitize_expr(key);
    auto root = std::make_shared<const Node>(parse_expression(sanitized));

    Predicate predicate(std::move(sanitized), std::move(root));
    cache().insert(key, predicate);
    return predicate;
}

Value eval_value(std::string_view expr, const Context& ctx) {
    try {
        Predicate predicate = compile_expr(expr);
        return predicate.evaluate(ctx);
    } catch (const ExprError& e) {
        if (e.kind() == ErrorKind::Sanitization) {
            throw;
        }
        throw ExprError(e.kind(), wrap_message(expr, e.what()));
    } catch (const std::exception& e) {
        // Исключение из нативной функции контекста
        throw ExprError(ErrorKind::Evaluation, wrap_message(expr, e.what()));
    }
}

bool eval_expr(std::string_view expr, const Context& ctx) {
    return truthy(eval_value(expr, ctx));
}

CompileStats compile_stats() {
    return cache().stats();
}

void clear_compile_cache() {
    cache().clear();
}

void set_cache_capacity(std::size_t capacity) {
    cache().set_capacity(capacity);
}

}  // namespace factguard::expr

#if defined(__GNUC__) && !defined(__clang__)
#pragma GCC diagnostic pop
#endif
