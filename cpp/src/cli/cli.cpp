// ==============================================================================
// cli.cpp - CLI парсинг
// ==============================================================================
//
// Формат ошибок: "error: <message>\n\nUsage: ...\n\nFor more information,
// try '--help'.\n", exit code 2.
//
// ==============================================================================

#include <factguard/cli.hpp>
#include <factguard/platform.hpp>

#include <charconv>
#include <cstring>
#include <string_view>

namespace factguard::cli {

namespace {

constexpr const char* MAIN_USAGE = "Usage: factguard [OPTIONS] <COMMAND>";

bool str_eq(const char* a, const char* b) {
    return std::strcmp(a, b) == 0;
}

bool is_help(const char* arg) {
    return str_eq(arg, "-h") || str_eq(arg, "--help");
}

bool is_json(const char* arg) {
    return str_eq(arg, "-j") || str_eq(arg, "--json");
}

bool is_output(const char* arg) {
    return str_eq(arg, "-o") || str_eq(arg, "--output");
}

/// Позиционный аргумент ("-" сам по себе тоже позиционный)
bool is_positional(const char* arg) {
    return arg[0] != '-' || arg[1] == '\0';
}

std::string usage_error(const std::string& message, const std::string& usage) {
    return "error: " + message + "\n\n" + usage + "\n\nFor more information, try '--help'.\n";
}

template <typename T>
bool parse_number(const char* text, T& out) {
    std::string_view s(text);
    auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
    return ec == std::errc() && ptr == s.data() + s.size();
}

/// Состояние разбора аргументов одной подкоманды
class ArgParser {
public:
    ArgParser(int argc, char** argv, ParseResult& result, std::string usage)
        : argc_(argc), argv_(argv), result_(result), usage_(std::move(usage)) {}

    void fail(const std::string& message) {
        result_.ok = false;
        result_.diagnostic.exit_code = 2;
        result_.diagnostic.stderr_message = usage_error(message, usage_);
    }

    /// Значение опции argv[i + 1]; при отсутствии - ошибка
    const char* value(int& i, const char* option) {
        if (i + 1 >= argc_) {
            fail(std::string("a value is required for '") + option +
                 "' but none was supplied");
            return nullptr;
        }
        return argv_[++i];
    }

    /// Опции -v/-q допустимы и после подкоманды
    bool global_flag(const char* arg) {
        if (str_eq(arg, "-v")) {
            result_.global.verbose++;
            return true;
        }
        if (str_eq(arg, "-q") || str_eq(arg, "--quiet")) {
            result_.global.quiet = true;
            return true;
        }
        return false;
    }

    enum class Status { NotMatched, Matched, Failed };

    /// --var, --seed, --hour, --name
    Status context_option(int& i, ContextOptions& ctx) {
        const char* arg = argv_[i];
        if (str_eq(arg, "--var")) {
            const char* v = value(i, "--var <KEY=VALUE>");
            if (v == nullptr)
                return Status::Failed;
            ctx.vars.emplace_back(v);
            return Status::Matched;
        }
        if (str_eq(arg, "--seed")) {
            const char* v = value(i, "--seed <SEED>");
            if (v == nullptr)
                return Status::Failed;
            std::uint32_t seed = 0;
            if (!parse_number(v, seed)) {
                fail(std::string("invalid value '") + v + "' for '--seed <SEED>'");
                return Status::Failed;
            }
            ctx.seed = seed;
            return Status::Matched;
        }
        if (str_eq(arg, "--hour")) {
            const char* v = value(i, "--hour <HOUR>");
            if (v == nullptr)
                return Status::Failed;
            int hour = 0;
            if (!parse_number(v, hour) || hour < 0 || hour > 23) {
                fail(std::string("invalid value '") + v + "' for '--hour <HOUR>': expected 0..23");
                return Status::Failed;
            }
            ctx.hour = hour;
            return Status::Matched;
        }
        if (str_eq(arg, "--name")) {
            const char* v = value(i, "--name <NAME>");
            if (v == nullptr)
                return Status::Failed;
            ctx.name = v;
            return Status::Matched;
        }
        return Status::NotMatched;
    }

    void unexpected(const char* arg) { fail(std::string("unexpected argument '") + arg + "' found"); }

    void missing(const char* what) {
        fail(std::string("the following required arguments were not provided:\n  ") + what);
    }

    char* arg(int i) const { return argv_[i]; }
    int argc() const { return argc_; }

private:
    int argc_;
    char** argv_;
    ParseResult& result_;
    std::string usage_;
};

// Подкоманды с FILE и опциями контекста (facts, trace)
template <typename CommandT>
void parse_file_command(ArgParser& p, ParseResult& result, int start, const char* name) {
    CommandT cmd;
    bool have_path = false;

    for (int i = start; i < p.argc(); ++i) {
        const char* arg = p.arg(i);
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{name};
            return;
        }
        if (p.global_flag(arg)) {
            continue;
        }
        auto status = p.context_option(i, cmd.context);
        if (status == ArgParser::Status::Failed) {
            return;
        }
        if (status == ArgParser::Status::Matched) {
            continue;
        }
        if (is_json(arg)) {
            cmd.json = true;
        } else if (is_output(arg)) {
            const char* v = p.value(i, "--output <OUTPUT>");
            if (v == nullptr)
                return;
            cmd.output = platform::path_from_utf8(v);
        } else if (is_positional(arg) && !have_path) {
            cmd.path = platform::path_from_utf8(arg);
            have_path = true;
        } else {
            p.unexpected(arg);
            return;
        }
    }

    if (!have_path) {
        p.missing("<PATH>");
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_eval(ArgParser& p, ParseResult& result, int start) {
    EvalCommand cmd;
    bool have_expr = false;

    for (int i = start; i < p.argc(); ++i) {
        const char* arg = p.arg(i);
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"eval"};
            return;
        }
        if (p.global_flag(arg)) {
            continue;
        }
        auto status = p.context_option(i, cmd.context);
        if (status == ArgParser::Status::Failed) {
            return;
        }
        if (status == ArgParser::Status::Matched) {
            continue;
        }
        if (is_json(arg)) {
            cmd.json = true;
        } else if (str_eq(arg, "--fact")) {
            const char* v = p.value(i, "--fact <FACT>");
            if (v == nullptr)
                return;
            cmd.facts.emplace_back(v);
        } else if (str_eq(arg, "--")) {
            // Всё после "--" - выражение (может начинаться с "-")
            if (i + 1 < p.argc() && !have_expr) {
                cmd.expression = p.arg(++i);
                have_expr = true;
            }
        } else if (is_positional(arg) && !have_expr) {
            cmd.expression = arg;
            have_expr = true;
        } else {
            p.unexpected(arg);
            return;
        }
    }

    if (!have_expr) {
        p.missing("<EXPR>");
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_lint(ArgParser& p, ParseResult& result, int start) {
    LintCommand cmd;
    bool have_path = false;

    for (int i = start; i < p.argc(); ++i) {
        const char* arg = p.arg(i);
        if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"lint"};
            return;
        }
        if (p.global_flag(arg)) {
            continue;
        }
        if (is_json(arg)) {
            cmd.json = true;
        } else if (is_positional(arg) && !have_path) {
            cmd.path = platform::path_from_utf8(arg);
            have_path = true;
        } else {
            p.unexpected(arg);
            return;
        }
    }

    if (!have_path) {
        p.missing("<PATH>");
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

void parse_regex(ArgParser& p, ParseResult& result, int start) {
    RegexCommand cmd;
    bool raw = false;  // после "--" всё - паттерны

    for (int i = start; i < p.argc(); ++i) {
        const char* arg = p.arg(i);
        if (raw || is_positional(arg)) {
            cmd.patterns.emplace_back(arg);
            continue;
        }
        if (str_eq(arg, "--")) {
            raw = true;
        } else if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{"regex"};
            return;
        } else if (p.global_flag(arg)) {
            continue;
        } else if (is_json(arg)) {
            cmd.json = true;
        } else {
            p.unexpected(arg);
            return;
        }
    }

    if (cmd.patterns.empty()) {
        p.missing("<PATTERN>...");
        return;
    }
    result.ok = true;
    result.command = std::move(cmd);
}

}  // namespace

// ----------------------------------------------------------------------------
// render_version / render_help
// ----------------------------------------------------------------------------

std::string render_version() {
    return std::string("factguard ") + VERSION + "\n";
}

std::string render_help(const std::optional<std::string>& command) {
    if (!command.has_value()) {
        return std::string(ABOUT) +
               "\n"
               "\n"
               "Usage: factguard [OPTIONS] <COMMAND>\n"
               "\n"
               "Commands:\n"
               "  eval   Evaluate one expression against the base context\n"
               "  facts  Print the active facts of a fact file\n"
               "  trace  Show the evaluation result of every fact\n"
               "  lint   Check that every fact parses and compiles\n"
               "  regex  Check patterns with the regex safety validator\n"
               "  help   Print this message or the help of the given subcommand\n"
               "\n"
               "Options:\n"
               "      --config <PATH>  Load settings from a YAML file\n"
               "  -v...                Print verbose output\n"
               "  -q, --quiet          Suppress informational output\n"
               "  -h, --help           Print help\n"
               "  -V, --version        Print version\n"
               "\n"
               "Examples:\n"
               "\n"
               "    Evaluate an expression at night:\n"
               "        ./factguard eval 'time.isNight && roll(\"1d6\") > 3' --hour 22\n"
               "\n"
               "    Show which facts are active for a character:\n"
               "        ./factguard facts lore.txt --name Aria --var unread_count=3\n";
    }

    const std::string context_options =
        "      --var <KEY=VALUE>  Add a context variable (repeatable)\n"
        "      --seed <SEED>      Seed for random() and roll()\n"
        "      --hour <HOUR>      Override the wall-clock hour (0..23)\n"
        "      --name <NAME>      Entity name for the context\n";

    if (*command == "eval") {
        return "Evaluate one expression against the base context\n"
               "\n"
               "Usage: factguard eval [OPTIONS] <EXPR>\n"
               "\n"
               "Arguments:\n"
               "  <EXPR>  The expression to evaluate\n"
               "\n"
               "Options:\n"
               "      --fact <FACT>      A known fact for hasFact() (repeatable)\n" +
               context_options +
               "  -j, --json             Output as JSON\n"
               "  -h, --help             Print help\n";
    }
    if (*command == "facts" || *command == "trace") {
        bool facts = *command == "facts";
        return std::string(facts ? "Print the active facts of a fact file\n"
                                 : "Show the evaluation result of every fact\n") +
               "\n"
               "Usage: factguard " + *command + " [OPTIONS] <PATH>\n"
               "\n"
               "Arguments:\n"
               "  <PATH>  A fact file (.json array of strings, or one fact per line)\n"
               "\n"
               "Options:\n" +
               context_options +
               "  -j, --json             Output as JSON\n"
               "  -o, --output <OUTPUT>  Save output to a file\n"
               "  -h, --help             Print help\n";
    }
    if (*command == "lint") {
        return "Check that every fact parses and compiles\n"
               "\n"
               "Usage: factguard lint [OPTIONS] <PATH>\n"
               "\n"
               "Arguments:\n"
               "  <PATH>  A fact file\n"
               "\n"
               "Options:\n"
               "  -j, --json  Output as JSON\n"
               "  -h, --help  Print help\n";
    }
    if (*command == "regex") {
        return "Check patterns with the regex safety validator\n"
               "\n"
               "Usage: factguard regex [OPTIONS] <PATTERN>...\n"
               "\n"
               "Arguments:\n"
               "  <PATTERN>...  Patterns to check (use -- before patterns starting with '-')\n"
               "\n"
               "Options:\n"
               "  -j, --json  Output as JSON\n"
               "  -h, --help  Print help\n";
    }
    return "error: unrecognized subcommand '" + *command + "'\n";
}

// ----------------------------------------------------------------------------
// parse
// ----------------------------------------------------------------------------

ParseResult parse(int argc, char** argv) {
    ParseResult result;
    result.command = HelpCommand{};

    if (argc < 2) {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message = render_help(std::nullopt);
        return result;
    }

    ArgParser global(argc, argv, result, MAIN_USAGE);

    int cmd_idx = argc;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];

        if (global.global_flag(arg)) {
            continue;
        }
        if (str_eq(arg, "--config")) {
            const char* v = global.value(i, "--config <PATH>");
            if (v == nullptr) {
                return result;
            }
            result.global.config = platform::path_from_utf8(v);
        } else if (is_help(arg)) {
            result.ok = true;
            result.command = HelpCommand{};
            return result;
        } else if (str_eq(arg, "-V") || str_eq(arg, "--version")) {
            result.ok = true;
            result.command = VersionCommand{};
            return result;
        } else if (is_positional(arg)) {
            cmd_idx = i;
            break;
        } else {
            global.unexpected(arg);
            return result;
        }
    }

    if (cmd_idx >= argc) {
        result.ok = true;
        result.command = HelpCommand{};
        return result;
    }

    const char* cmd = argv[cmd_idx];
    int start = cmd_idx + 1;

    if (str_eq(cmd, "eval")) {
        ArgParser p(argc, argv, result, "Usage: factguard eval [OPTIONS] <EXPR>");
        parse_eval(p, result, start);
    } else if (str_eq(cmd, "facts")) {
        ArgParser p(argc, argv, result, "Usage: factguard facts [OPTIONS] <PATH>");
        parse_file_command<FactsCommand>(p, result, start, "facts");
    } else if (str_eq(cmd, "trace")) {
        ArgParser p(argc, argv, result, "Usage: factguard trace [OPTIONS] <PATH>");
        parse_file_command<TraceCommand>(p, result, start, "trace");
    } else if (str_eq(cmd, "lint")) {
        ArgParser p(argc, argv, result, "Usage: factguard lint [OPTIONS] <PATH>");
        parse_lint(p, result, start);
    } else if (str_eq(cmd, "regex")) {
        ArgParser p(argc, argv, result, "Usage: factguard regex [OPTIONS] <PATTERN>...");
        parse_regex(p, result, start);
    } else if (str_eq(cmd, "help")) {
        result.ok = true;
        if (start < argc) {
            result.command = HelpCommand{std::string(argv[start])};
        } else {
            result.command = HelpCommand{};
        }
    } else {
        result.diagnostic.exit_code = 2;
        result.diagnostic.stderr_message =
            usage_error(std::string("unrecognized subcommand '") + cmd + "'", MAIN_USAGE);
    }

    return result;
}

}  // namespace factguard::cli
