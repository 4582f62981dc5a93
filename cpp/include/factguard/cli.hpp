// ==============================================================================
// factguard/cli.hpp - CLI парсинг и команды
// ==============================================================================
//
// Назначение:
// - Парсинг argv
// - Генерация --help / --version
// - Диагностические ошибки CLI (exit code 2)
//
// ==============================================================================

#ifndef FACTGUARD_CLI_HPP
#define FACTGUARD_CLI_HPP

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace factguard::cli {

// ----------------------------------------------------------------------------
// Глобальные опции
// ----------------------------------------------------------------------------

struct GlobalOptions {
    int verbose = 0;                              // -v (repeatable)
    bool quiet = false;                           // -q
    std::optional<std::filesystem::path> config;  // --config
};

// ----------------------------------------------------------------------------
// Опции построения контекста (eval, facts, trace)
// ----------------------------------------------------------------------------

struct ContextOptions {
    std::vector<std::string> vars;         // --var KEY=VALUE (repeatable)
    std::optional<std::uint32_t> seed;     // --seed
    std::optional<int> hour;               // --hour
    std::optional<std::string> name;       // --name
};

// ----------------------------------------------------------------------------
// Подкоманды
// ----------------------------------------------------------------------------

/// eval - вычислить одно выражение
struct EvalCommand {
    std::string expression;
    std::vector<std::string> facts;  // --fact (для hasFact)
    ContextOptions context;
    bool json = false;
};

/// facts - активные факты файла
struct FactsCommand {
    std::filesystem::path path;
    ContextOptions context;
    bool json = false;
    std::optional<std::filesystem::path> output;  // -o, --output
};

/// trace - результат каждого факта
struct TraceCommand {
    std::filesystem::path path;
    ContextOptions context;
    bool json = false;
    std::optional<std::filesystem::path> output;
};

/// lint - проверить, что все факты разбираются и компилируются
struct LintCommand {
    std::filesystem::path path;
    bool json = false;
};

/// regex - проверить паттерны валидатором
struct RegexCommand {
    std::vector<std::string> patterns;
    bool json = false;
};

struct HelpCommand {
    std::optional<std::string> command;
};

struct VersionCommand {};

using Command = std::variant<EvalCommand, FactsCommand, TraceCommand, LintCommand, RegexCommand,
                             HelpCommand, VersionCommand>;

// ----------------------------------------------------------------------------
// Диагностика и результат парсинга
// ----------------------------------------------------------------------------

struct CliDiagnostic {
    int exit_code = 1;
    std::string stderr_message;
};

struct ParseResult {
    bool ok = false;
    GlobalOptions global;
    Command command;
    CliDiagnostic diagnostic;
};

/// Парсить аргументы командной строки
ParseResult parse(int argc, char** argv);

/// Текст --help (общий или для подкоманды)
std::string render_help(const std::optional<std::string>& command = std::nullopt);

/// Текст --version
std::string render_version();

constexpr const char* VERSION = "0.1.0";

constexpr const char* ABOUT = "Evaluate conditional $if facts in a sandbox";

}  // namespace factguard::cli

#endif  // FACTGUARD_CLI_HPP
