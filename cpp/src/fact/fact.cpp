// ==============================================================================
// fact.cpp - Разбор, вычисление и загрузка фактов
// ==============================================================================

#include <factguard/error.hpp>
#include <factguard/expr.hpp>
#include <factguard/fact.hpp>
#include <factguard/platform.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>

#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

namespace factguard::fact {

namespace {

std::string_view trim(std::string_view s) {
    std::size_t begin = 0;
    while (begin < s.size() && std::isspace(static_cast<unsigned char>(s[begin])) != 0) {
        ++begin;
    }
    std::size_t end = s.size();
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])) != 0) {
        --end;
    }
    return s.substr(begin, end - begin);
}

bool starts_with(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

std::string lower_extension(const std::filesystem::path& path) {
    std::string ext = path.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

bool read_file(const std::filesystem::path& path, std::string& out) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        return false;
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    out = buffer.str();
    return true;
}

void load_json(const std::string& content, const std::string& path, LoadResult& result) {
    rapidjson::Document doc;
    doc.Parse(content.c_str());

    if (doc.HasParseError()) {
        result.error = Error{std::string("JSON parse error: ") +
                                 rapidjson::GetParseError_En(doc.GetParseError()) + " at offset " +
                                 std::to_string(doc.GetErrorOffset()),
                             path};
        return;
    }
    if (!doc.IsArray()) {
        result.error = Error{"fact file must contain a JSON array of strings", path};
        return;
    }

    for (rapidjson::SizeType i = 0; i < doc.Size(); ++i) {
        if (!doc[i].IsString()) {
            result.error =
                Error{"element " + std::to_string(i) + " of fact array is not a string", path};
            return;
        }
        result.facts.emplace_back(doc[i].GetString(), doc[i].GetStringLength());
        result.lines.push_back(static_cast<std::size_t>(i) + 1);
    }
    result.ok = true;
}

void load_lines(const std::string& content, LoadResult& result) {
    std::istringstream stream(content);
    std::string line;
    std::size_t number = 0;
    while (std::getline(stream, line)) {
        ++number;
        if (!trim(line).empty()) {
            result.facts.push_back(line);
            result.lines.push_back(number);
        }
    }
    result.ok = true;
}

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

Fact parse_fact(std::string_view raw) {
    std::string_view text = trim(raw);
    Fact fact;

    if (!starts_with(text, CONDITIONAL_PREFIX)) {
        fact.content = std::string(text);
        return fact;
    }

    std::string_view rest = text.substr(CONDITIONAL_PREFIX.size());
    std::size_t colon = rest.find(':');
    if (colon == std::string_view::npos) {
        throw ExprError(ErrorKind::Parse,
                        "Invalid $if fact, missing colon: " + std::string(raw));
    }

    fact.conditional = true;
    fact.expression = std::string(trim(rest.substr(0, colon)));
    fact.content = std::string(trim(rest.substr(colon + 1)));
    return fact;
}

bool has_expression(const Fact& fact) {
    return fact.expression.has_value() && !fact.expression->empty();
}

bool is_comment(std::string_view raw) {
    return starts_with(trim(raw), COMMENT_PREFIX);
}

std::vector<std::string> strip_comments(const std::vector<std::string>& facts) {
    std::vector<std::string> result;
    result.reserve(facts.size());
    std::copy_if(facts.begin(), facts.end(), std::back_inserter(result),
                 [](const std::string& f) { return !is_comment(f); });
    return result;
}

// ============================================================================
// Evaluation
// ============================================================================

std::vector<std::string> evaluate_facts(const std::vector<std::string>& facts,
                                        const expr::Context& ctx) {
    std::vector<std::string> active;

    for (const auto& raw : facts) {
        if (is_comment(raw)) {
            continue;
        }
        Fact fact = parse_fact(raw);
        bool active = !fact.conditional ||
                      (has_expression(fact) && expr::eval_expr(*fact.expression, ctx));
        if (active) {
            active.push_back(std::move(fact.content));
        }
    }

    return active;
}

std::vector<FactTrace> trace_facts(const std::vector<std::string>& facts,
                                   const expr::Context& ctx) {
    std::vector<FactTrace> traces;
    traces.reserve(facts.size());

    for (const auto& raw : facts) {
        if (is_comment(raw)) {
            continue;
        }

        FactTrace trace;
        trace.raw = raw;

        try {
            Fact fact = parse_fact(raw);
            trace.conditional = fact.conditional;
            trace.expression = fact.expression;
            trace.content = fact.content;

            if (fact.conditional) {
                bool value = has_expression(fact) && expr::eval_expr(*fact.expression, ctx);
                trace.result = value;
                trace.included = value;
            } else {
                trace.included = true;
            }
        } catch (const ExprError& e) {
            trace.error = e.what();
            trace.included = false;
        }

        traces.push_back(std::move(trace));
    }

    return traces;
}

std::vector<LintIssue> lint_facts(const std::vector<std::string>& facts) {
    return lint_facts(facts, {});
}

std::vector<LintIssue> lint_facts(const std::vector<std::string>& facts,
                                  const std::vector<std::size_t>& lines) {
    std::vector<LintIssue> issues;

    for (std::size_t i = 0; i < facts.size(); ++i) {
        const auto& raw = facts[i];
        if (is_comment(raw)) {
            continue;
        }
        std::size_t line = i < lines.size() ? lines[i] : i + 1;
        try {
            Fact fact = parse_fact(raw);
            if (!fact.conditional) {
                continue;
            }
            if (!has_expression(fact)) {
                issues.push_back(
                    LintIssue{line, raw, "Empty $if expression, fact is never included"});
                continue;
            }
            expr::compile_expr(*fact.expression);
        } catch (const ExprError& e) {
            issues.push_back(LintIssue{line, raw, e.what()});
        }
    }

    return issues;
}

// ============================================================================
// Loading
// ============================================================================

std::string Error::format() const {
    std::ostringstream oss;
    oss << "fact file error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

LoadResult load_facts(const std::filesystem::path& path) {
    LoadResult result;
    std::string display = platform::path_to_utf8(path);

    std::string content;
    if (!read_file(path, content)) {
        result.error = Error{"could not open file", display};
        return result;
    }

    if (lower_extension(path) == ".json") {
        load_json(content, display, result);
    } else {
        load_lines(content, result);
    }
    return result;
}

}  // namespace factguard::fact
