// ==============================================================================
// sanitize.cpp - Санитайзер выражений $if (первый слой защиты)
// ==============================================================================
//
// Две независимые проверки, обе обязательны:
// 1. allowlist символов: [A-Za-z0-9_], пробельные, . , ( ) [ ] ! & | < > = + - * / % ? : " '
// 2. blocklist: ключевые слова целым словом, а также "=>", ";", "{", "}"
//
// Blocklist закрывает опасные идентификаторы из букв и цифр (constructor,
// __proto__), которые allowlist пропустить обязан.
//
// ==============================================================================

#include <factguard/error.hpp>
#include <factguard/expr.hpp>

#include <cctype>
#include <unordered_set>

namespace factguard::expr {

namespace {

bool is_word_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_';
}

bool is_space(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool is_allowed_char(char c) {
    if (is_word_char(c) || is_space(c)) {
        return true;
    }
    switch (c) {
    case '.':
    case ',':
    case '(':
    case ')':
    case '[':
    case ']':
    case '!':
    case '&':
    case '|':
    case '<':
    case '>':
    case '=':
    case '+':
    case '-':
    case '*':
    case '/':
    case '%':
    case '?':
    case ':':
    case '"':
    case '\'':
        return true;
    default:
        return false;
    }
}

std::string_view trim(std::string_view s) {
    std::size_t begin = 0;
    while (begin < s.size() && is_space(s[begin])) {
        ++begin;
    }
    std::size_t end = s.size();
    while (end > begin && is_space(s[end - 1])) {
        --end;
    }
    return s.substr(begin, end - begin);
}

const std::unordered_set<std::string>& keyword_set() {
    static const std::unordered_set<std::string> set(blocked_keywords().begin(),
                                                     blocked_keywords().end());
    return set;
}

/// Есть ли в тексте запрещённое слово (границы как у \b: по [A-Za-z0-9_])
bool contains_blocked_word(std::string_view text) {
    const auto& keywords = keyword_set();
    std::size_t i = 0;
    while (i < text.size()) {
        if (!is_word_char(text[i])) {
            ++i;
            continue;
        }
        std::size_t start = i;
        while (i < text.size() && is_word_char(text[i])) {
            ++i;
        }
        if (keywords.count(std::string(text.substr(start, i - start))) > 0) {
            return true;
        }
    }
    return false;
}

bool contains_blocked_sequence(std::string_view text) {
    return text.find("=>") != std::string_view::npos ||
           text.find_first_of(";{}") != std::string_view::npos;
}

}  // namespace

const std::vector<std::string>& blocked_keywords() {
    static const std::vector<std::string> keywords = {
        "eval",     "Function",   "constructor",   "prototype", "__proto__",   "import",
        "export",   "require",    "process",       "global",    "window",      "document",
        "fetch",    "XMLHttpRequest", "setTimeout", "setInterval", "Promise",  "async",
        "await",    "while",      "for",           "do",        "class",       "new",
        "this",     "super",      "return",        "throw",     "try",         "catch",
        "finally",  "delete",     "typeof",        "instanceof", "void",       "in",
        "of",       "let",        "const",         "var",       "function",
    };
    return keywords;
}

std::string sanitize_expr(std::string_view expr) {
    std::string trimmed(trim(expr));

    bool charset_ok = !trimmed.empty();
    for (char c : trimmed) {
        if (!is_allowed_char(c)) {
            charset_ok = false;
            break;
        }
    }
    if (!charset_ok) {
        throw ExprError(ErrorKind::Sanitization, "Invalid characters in expression: " + trimmed);
    }

    if (contains_blocked_word(trimmed) || contains_blocked_sequence(trimmed)) {
        throw ExprError(ErrorKind::Sanitization, "Dangerous pattern in expression: " + trimmed);
    }

    return trimmed;
}

}  // namespace factguard::expr
