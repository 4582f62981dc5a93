// ==============================================================================
// safe_regex.cpp - Валидатор безопасности regex и безопасные операции
// ==============================================================================
//
// Грамматика (один проход слева направо, без возвратов):
//
//   Alternation := Sequence ('|' Sequence)*
//   Sequence    := (Atom Quantifier?)*
//   Atom        := Escape | CharClass | Group | '.' | Anchor | Literal
//
// Каждое правило возвращает RegexNode{has_quantifier, is_anchor}.
// Стоимость проверки линейна по длине паттерна.
//
// ==============================================================================

#include <factguard/error.hpp>
#include <factguard/safe_regex.hpp>

#include <cctype>
#include <string>

namespace factguard::regex {

namespace {

// ----------------------------------------------------------------------------
// Допустимые escape-последовательности
// ----------------------------------------------------------------------------

/// Сокращённые классы и спец-escape: \d \D \w \W \s \S \t \n \r \b
bool is_shorthand_escape(char c) {
    switch (c) {
    case 'd':
    case 'D':
    case 'w':
    case 'W':
    case 's':
    case 'S':
    case 't':
    case 'n':
    case 'r':
    case 'b':
        return true;
    default:
        return false;
    }
}

/// Экранированные спецсимволы (литеральное значение)
bool is_special_escape(char c) {
    switch (c) {
    case '.':
    case '\\':
    case '[':
    case ']':
    case '(':
    case ')':
    case '{':
    case '}':
    case '+':
    case '*':
    case '?':
    case '^':
    case '$':
    case '|':
    case '-':
    case '/':
        return true;
    default:
        return false;
    }
}

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

[[noreturn]] void fail(const std::string& message) {
    throw ExprError(ErrorKind::RegexSafety, "Unsafe regex: " + message);
}

[[noreturn]] void fail_backreference(char c) {
    fail(std::string("backreferences (\\") + c +
         ") are not allowed; they can cause exponential matching time");
}

[[noreturn]] void fail_unknown_escape(char c) {
    fail(std::string("unknown escape \"\\") + c +
         "\". Allowed: \\d \\w \\s \\D \\W \\S \\t \\n \\r \\b and escaped special characters");
}

[[noreturn]] void fail_unterminated_group() {
    fail("unterminated group, missing closing \")\"");
}

// ----------------------------------------------------------------------------
// RegexNode - результат разбора узла (не сохраняется после проверки)
// ----------------------------------------------------------------------------

struct RegexNode {
    bool has_quantifier = false;  // узел или потомок содержит квантификатор
    bool is_anchor = false;       // zero-width: ^ $ \b
};

// ----------------------------------------------------------------------------
// Parser
// ----------------------------------------------------------------------------

class Parser {
public:
    explicit Parser(std::string_view pattern) : pattern_(pattern) {}

    void parse() {
        parse_alternation();
        if (has_more()) {
            char c = peek();
            if (c == ')') {
                fail("unexpected \")\" without matching \"(\"");
            }
            fail(std::string("unexpected character \"") + c + "\"");
        }
    }

private:
    bool has_more() const { return pos_ < pattern_.size(); }

    char peek() const { return pattern_[pos_]; }

    char advance() { return pattern_[pos_++]; }

    RegexNode parse_alternation() {
        RegexNode node = parse_sequence();
        while (has_more() && peek() == '|') {
            advance();
            RegexNode right = parse_sequence();
            node = RegexNode{node.has_quantifier || right.has_quantifier, false};
        }
        return node;
    }

    RegexNode parse_sequence() {
        bool has_quantifier = false;

        while (has_more()) {
            char c = peek();
            if (c == '|' || c == ')') {
                break;
            }
            RegexNode atom = parse_atom();
            RegexNode quantified = try_quantifier(atom);
            if (quantified.has_quantifier) {
                has_quantifier = true;
            }
        }

        return RegexNode{has_quantifier, false};
    }

    RegexNode parse_atom() {
        char c = peek();

        switch (c) {
        case '\\':
            return parse_escape();
        case '[':
            return parse_character_class();
        case '(':
            return parse_group();
        case '^':
        case '$':
            advance();
            return RegexNode{false, true};
        case '*':
        case '+':
        case '?':
            fail("quantifier without preceding element");
        case '{':
            if (is_quantifier_brace()) {
                fail("quantifier without preceding element");
            }
            // Не квантификатор: литерал "{"
            advance();
            return RegexNode{};
        default:
            // '.' и обычные литералы
            advance();
            return RegexNode{};
        }
    }

    RegexNode parse_escape() {
        advance();  // '\'
        if (!has_more()) {
            fail("trailing backslash with nothing after it");
        }

        char c = advance();

        if (is_shorthand_escape(c)) {
            // \b - граница слова (zero-width)
            return RegexNode{false, c == 'b'};
        }
        if (is_special_escape(c)) {
            return RegexNode{};
        }
        if (c >= '1' && c <= '9') {
            fail_backreference(c);
        }
        fail_unknown_escape(c);
    }

    RegexNode parse_character_class() {
        advance();  // '['

        if (has_more() && peek() == '^') {
            advance();
        }
        // "]" первым символом класса - литерал
        if (has_more() && peek() == ']') {
            advance();
        }

        while (has_more()) {
            char c = peek();
            if (c == ']') {
                advance();
                return RegexNode{};
            }
            if (c == '\\') {
                parse_class_escape();
            } else {
                advance();
            }
        }

        fail("unterminated character class, missing closing \"]\"");
    }

    void parse_class_escape() {
        advance();  // '\'
        if (!has_more()) {
            fail("trailing backslash with nothing after it");
        }

        char c = advance();
        if (is_shorthand_escape(c) || is_special_escape(c)) {
            return;
        }
        if (c >= '1' && c <= '9') {
            fail_backreference(c);
        }
        fail_unknown_escape(c);
    }

    RegexNode parse_group() {
        advance();  // '('
        if (!has_more()) {
            fail_unterminated_group();
        }

        if (peek() != '?') {
            fail("capturing groups are not allowed (causes backtracking). Use (?:abc) instead");
        }

        advance();  // '?'
        if (!has_more()) {
            fail_unterminated_group();
        }

        char next = peek();
        switch (next) {
        case ':': {
            advance();
            if (depth_ >= MAX_GROUP_NESTING) {
                fail("group nesting too deep (limit " + std::to_string(MAX_GROUP_NESTING) + ")");
            }
            ++depth_;
            RegexNode inner = parse_alternation();
            --depth_;
            if (!has_more() || peek() != ')') {
                fail_unterminated_group();
            }
            advance();  // ')'
            return RegexNode{inner.has_quantifier, false};
        }
        case '=':
            fail("lookahead (?=...) is not allowed");
        case '!':
            fail("negative lookahead (?!...) is not allowed");
        case '<': {
            advance();
            if (!has_more()) {
                fail_unterminated_group();
            }
            char after = peek();
            if (after == '=') {
                fail("lookbehind (?<=...) is not allowed");
            }
            if (after == '!') {
                fail("negative lookbehind (?<!...) is not allowed");
            }
            fail("named groups are not allowed. Use (?:...) instead");
        }
        default:
            fail(std::string("unknown group type \"(?") + next + "...)\"");
        }
    }

    RegexNode try_quantifier(const RegexNode& atom) {
        if (!has_more()) {
            return atom;
        }

        char c = peek();
        bool is_quantifier = c == '*' || c == '+' || c == '?' || (c == '{' && is_quantifier_brace());
        if (!is_quantifier) {
            return atom;
        }

        if (atom.is_anchor) {
            fail("quantifier on an anchor (^ $ \\b); anchors are zero-width and cannot be "
                 "quantified");
        }

        if (atom.has_quantifier) {
            std::string quant = c == '{' ? peek_quantifier_brace() : std::string(1, c);
            fail("nested quantifier \"" + quant +
                 "\" on a group that already contains a quantifier; this causes catastrophic "
                 "backtracking. Flatten the pattern or remove one quantifier");
        }

        consume_quantifier();
        return RegexNode{true, false};
    }

    /// Lookahead: начинается ли с текущей позиции {n}, {n,} или {n,m}
    bool is_quantifier_brace() const {
        std::size_t i = pos_ + 1;
        const std::size_t n = pattern_.size();

        if (i >= n || !is_digit(pattern_[i]))
            return false;
        while (i < n && is_digit(pattern_[i]))
            ++i;
        if (i >= n)
            return false;
        if (pattern_[i] == '}')
            return true;
        if (pattern_[i] != ',')
            return false;

        ++i;
        if (i >= n)
            return false;
        if (pattern_[i] == '}')
            return true;
        if (!is_digit(pattern_[i]))
            return false;
        while (i < n && is_digit(pattern_[i]))
            ++i;
        return i < n && pattern_[i] == '}';
    }

    std::string peek_quantifier_brace() const {
        std::size_t end = pattern_.find('}', pos_);
        if (end == std::string_view::npos) {
            return std::string(pattern_.substr(pos_));
        }
        return std::string(pattern_.substr(pos_, end - pos_ + 1));
    }

    /// *, +, ?, {n}, {n,}, {n,m} и необязательный ленивый "?"
    void consume_quantifier() {
        char c = advance();
        if (c == '{') {
            while (has_more() && peek() != '}') {
                advance();
            }
            if (has_more()) {
                advance();  // '}'
            }
        }
        if (has_more() && peek() == '?') {
            advance();
        }
    }

    std::string_view pattern_;
    std::size_t pos_ = 0;
    std::size_t depth_ = 0;
};

}  // namespace

// ============================================================================
// Validator
// ============================================================================

void validate_regex_pattern(std::string_view pattern) {
    if (pattern.size() > MAX_REGEX_PATTERN) {
        fail("pattern too long (" + std::to_string(pattern.size()) + " characters, limit " +
             std::to_string(MAX_REGEX_PATTERN) + ")");
    }
    Parser parser(pattern);
    parser.parse();
}

std::optional<std::string> check_regex_pattern(std::string_view pattern) {
    try {
        validate_regex_pattern(pattern);
    } catch (const ExprError& e) {
        return std::string(e.what());
    }
    return std::nullopt;
}

// ============================================================================
// Safe operations
// ============================================================================

void check_regex_input(std::string_view text) {
    if (text.size() > MAX_REGEX_INPUT) {
        throw ExprError(ErrorKind::RegexSafety,
                        "Unsafe regex: input too long (" + std::to_string(text.size()) +
                            " characters, limit " + std::to_string(MAX_REGEX_INPUT) + ")");
    }
}

std::regex compile_safe(std::string_view pattern, bool ignore_case) {
    validate_regex_pattern(pattern);

    auto flags = std::regex::ECMAScript;
    if (ignore_case) {
        flags |= std::regex::icase;
    }
    try {
        return std::regex(pattern.begin(), pattern.end(), flags);
    } catch (const std::regex_error& e) {
        // Структурно безопасный, но отвергнутый движком паттерн (например, [z-a])
        throw ExprError(ErrorKind::RegexSafety,
                        "Invalid regex \"" + std::string(pattern) + "\": " + e.what());
    }
}

std::optional<std::string> safe_match(const std::string& text, std::string_view pattern,
                                      bool ignore_case) {
    check_regex_input(text);
    std::regex re = compile_safe(pattern, ignore_case);
    std::smatch m;
    if (!std::regex_search(text, m, re)) {
        return std::nullopt;
    }
    return m.str(0);
}

bool safe_test(const std::string& text, std::string_view pattern, bool ignore_case) {
    check_regex_input(text);
    std::regex re = compile_safe(pattern, ignore_case);
    return std::regex_search(text, re);
}

long safe_search(const std::string& text, std::string_view pattern) {
    check_regex_input(text);
    std::regex re = compile_safe(pattern);
    std::smatch m;
    if (!std::regex_search(text, m, re)) {
        return -1;
    }
    return static_cast<long>(m.position(0));
}

std::string safe_replace(const std::string& text, std::string_view pattern,
                         const std::string& replacement) {
    check_regex_input(text);
    std::regex re = compile_safe(pattern);
    return std::regex_replace(text, re, replacement, std::regex_constants::format_first_only);
}

std::vector<std::string> safe_split(const std::string& text, std::string_view pattern) {
    check_regex_input(text);
    std::regex re = compile_safe(pattern);

    std::vector<std::string> parts;
    std::size_t last = 0;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), re); it != std::sregex_iterator();
         ++it) {
        auto pos = static_cast<std::size_t>(it->position(0));
        auto len = static_cast<std::size_t>(it->length(0));
        // Пустое совпадение на краях строки не создаёт пустых частей
        if (len == 0 && (pos == 0 || pos >= text.size())) {
            continue;
        }
        parts.push_back(text.substr(last, pos - last));
        last = pos + len;
    }
    parts.push_back(text.substr(last));
    return parts;
}

}  // namespace factguard::regex
