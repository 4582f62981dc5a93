// ==============================================================================
// main.cpp - Точка входа приложения
// ==============================================================================
//
// 1. Парсинг argv (cli)
// 2. Создание Writer (output)
// 3. Загрузка конфигурации (--config)
// 4. Dispatch команды, возврат exit code
//
// Исключения перехватываются на границе app.
//
// ==============================================================================

#include <factguard/cli.hpp>
#include <factguard/config.hpp>
#include <factguard/error.hpp>
#include <factguard/expr.hpp>
#include <factguard/fact.hpp>
#include <factguard/output.hpp>
#include <factguard/platform.hpp>
#include <factguard/safe_regex.hpp>

#include <cstdint>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <rapidjson/document.h>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace {

using namespace factguard;

constexpr std::size_t CELL_LIMIT = 60;

// ----------------------------------------------------------------------------
// Контекст
// ----------------------------------------------------------------------------

/// Базовый контекст + поля отладочного контекста + переменные конфигурации и --var.
/// nullopt если --var некорректен (ошибка уже выведена)
std::optional<expr::Context> build_context(const cli::ContextOptions& opts,
                                           const config::Config& cfg,
                                           const std::vector<std::string>& known_facts,
                                           output::Writer& writer) {
    expr::BaseContextOptions options = config::context_options(cfg);
    if (opts.hour.has_value()) {
        options.hour = opts.hour;
    }
    if (opts.seed.has_value()) {
        options.seed = opts.seed;
    }
    std::string name = opts.name.has_value() ? *opts.name : cfg.name;

    expr::Context ctx = expr::create_debug_context(known_facts, name, options);
    config::apply_variables(cfg, ctx);
    for (const auto& [key, value] : cfg.variables) {
        writer.trace("Variable " + key + " = " + value.to_display_string() + " (config)");
    }

    for (const auto& assignment : opts.vars) {
        try {
            auto [key, value] = config::parse_var(assignment);
            writer.trace("Variable " + key + " = " + value.to_display_string() + " (--var)");
            ctx.set(key, std::move(value));
        } catch (const std::invalid_argument& e) {
            writer.error(std::string("Invalid --var: ") + e.what());
            return std::nullopt;
        }
    }

    writer.debug("Context has " + std::to_string(ctx.size()) + " entries" +
                 (options.seed.has_value() ? ", seed " + std::to_string(*options.seed) : ""));
    return ctx;
}

/// Содержимое безусловных фактов (для hasFact)
std::vector<std::string> unconditional_contents(const std::vector<std::string>& facts) {
    std::vector<std::string> contents;
    for (const auto& raw : fact::strip_comments(facts)) {
        try {
            fact::Fact f = fact::parse_fact(raw);
            if (!f.conditional) {
                contents.push_back(std::move(f.content));
            }
        } catch (const ExprError&) {
            // Битые условные факты не участвуют в hasFact; их показывает trace/lint
            continue;
        }
    }
    return contents;
}

/// Загрузить файл фактов; nullopt при ошибке (ошибка уже выведена)
std::optional<fact::LoadResult> load_fact_file(const std::filesystem::path& path,
                                               output::Writer& writer) {
    auto result = fact::load_facts(path);
    if (!result) {
        writer.error(result.error.format());
        return std::nullopt;
    }
    writer.info("Loaded " + std::to_string(result.facts.size()) + " facts from " +
                platform::path_to_utf8(path));
    return result;
}

/// Writer для stdout команды: файловый при --output
std::unique_ptr<output::Writer> make_file_writer(const output::Writer& writer,
                                                 const std::optional<std::filesystem::path>& path) {
    if (!path.has_value()) {
        return nullptr;
    }
    output::OutputConfig cfg = writer.config();
    cfg.output_path = path;
    return std::make_unique<output::Writer>(cfg);
}

void log_cache_stats(output::Writer& writer) {
    auto stats = expr::compile_stats();
    writer.debug("Expression cache: " + std::to_string(stats.size) + "/" +
                 std::to_string(stats.capacity) + " entries, " + std::to_string(stats.hits) +
                 " hits, " + std::to_string(stats.misses) + " misses");
}

// ----------------------------------------------------------------------------
// Команды
// ----------------------------------------------------------------------------

int run_eval(const cli::EvalCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    auto ctx = build_context(cmd.context, cfg, cmd.facts, writer);
    if (!ctx) {
        return 1;
    }

    Value value;
    try {
        value = expr::eval_value(cmd.expression, *ctx);
    } catch (const ExprError& e) {
        writer.debug(std::string("Error kind: ") + to_string(e.kind()));
        writer.error(e.what());
        return 1;
    }
    bool truthy = expr::truthy(value);

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetObject();
        auto& alloc = doc.GetAllocator();
        rapidjson::Value json_value;
        value.to_rapidjson(json_value, alloc);
        doc.AddMember("expression", rapidjson::Value(cmd.expression.c_str(), alloc), alloc);
        doc.AddMember("value", json_value, alloc);
        doc.AddMember("truthy", truthy, alloc);
        writer.write_json_pretty(doc);
    } else if (truthy) {
        writer.green_line(value.to_display_string());
    } else {
        writer.yellow_line(value.to_display_string());
    }

    writer.debug(std::string("Result is ") + (truthy ? "truthy" : "falsy"));
    log_cache_stats(writer);
    return 0;
}

int run_facts(const cli::FactsCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    auto loaded = load_fact_file(cmd.path, writer);
    if (!loaded) {
        return 1;
    }
    const std::vector<std::string>& facts = loaded->facts;
    auto ctx = build_context(cmd.context, cfg, unconditional_contents(facts), writer);
    if (!ctx) {
        return 1;
    }

    std::vector<std::string> active;
    try {
        active = fact::evaluate_facts(facts, *ctx);
    } catch (const ExprError& e) {
        writer.error(e.what());
        writer.warn("Use 'factguard trace' to see the result of every fact");
        return 1;
    }

    auto file_writer = make_file_writer(writer, cmd.output);
    output::Writer& out = file_writer ? *file_writer : writer;
    if (file_writer && !file_writer->has_output_file()) {
        writer.error("Could not open output file " + platform::path_to_utf8(*cmd.output));
        return 1;
    }

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetArray();
        auto& alloc = doc.GetAllocator();
        for (const auto& content : active) {
            doc.PushBack(rapidjson::Value(content.c_str(), alloc), alloc);
        }
        out.write_json_pretty(doc);
    } else {
        for (const auto& content : active) {
            out.write_line(output::Stream::Stdout, content);
        }
    }

    writer.info(std::to_string(active.size()) + " of " +
                std::to_string(fact::strip_comments(facts).size()) + " facts are active");
    log_cache_stats(writer);
    return 0;
}

int run_trace(const cli::TraceCommand& cmd, const config::Config& cfg, output::Writer& writer) {
    auto loaded = load_fact_file(cmd.path, writer);
    if (!loaded) {
        return 1;
    }
    const std::vector<std::string>& facts = loaded->facts;
    auto ctx = build_context(cmd.context, cfg, unconditional_contents(facts), writer);
    if (!ctx) {
        return 1;
    }

    std::vector<fact::FactTrace> traces = fact::trace_facts(facts, *ctx);

    auto file_writer = make_file_writer(writer, cmd.output);
    output::Writer& out = file_writer ? *file_writer : writer;
    if (file_writer && !file_writer->has_output_file()) {
        writer.error("Could not open output file " + platform::path_to_utf8(*cmd.output));
        return 1;
    }

    std::size_t failed = 0;
    std::size_t included = 0;
    for (const auto& t : traces) {
        failed += t.error.has_value() ? 1 : 0;
        included += t.included ? 1 : 0;
    }

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetArray();
        auto& alloc = doc.GetAllocator();
        for (const auto& t : traces) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("raw", rapidjson::Value(t.raw.c_str(), alloc), alloc);
            obj.AddMember("conditional", t.conditional, alloc);
            if (t.expression) {
                obj.AddMember("expression", rapidjson::Value(t.expression->c_str(), alloc), alloc);
            }
            if (t.result) {
                obj.AddMember("result", *t.result, alloc);
            }
            if (t.error) {
                obj.AddMember("error", rapidjson::Value(t.error->c_str(), alloc), alloc);
            }
            obj.AddMember("included", t.included, alloc);
            obj.AddMember("content", rapidjson::Value(t.content.c_str(), alloc), alloc);
            doc.PushBack(obj, alloc);
        }
        out.write_json_pretty(doc);
    } else {
        output::Table table;
        table.set_headers({"#", "expression", "result", "content"});
        std::size_t index = 0;
        for (const auto& t : traces) {
            ++index;
            std::string result = "always";
            if (t.error) {
                result = "error";
            } else if (t.result) {
                result = *t.result ? "true" : "false";
            }
            std::string content = t.error ? *t.error : t.content;
            table.add_row({std::to_string(index),
                           output::format_cell(t.expression.value_or("-"), CELL_LIMIT), result,
                           output::format_cell(content, CELL_LIMIT)});
        }
        table.print(out);
    }

    for (const auto& t : traces) {
        if (t.error) {
            writer.warn(*t.error);
        }
    }
    writer.info(std::to_string(included) + " of " + std::to_string(traces.size()) +
                " facts included, " + std::to_string(failed) + " failed");
    log_cache_stats(writer);
    return failed == 0 ? 0 : 1;
}

int run_lint(const cli::LintCommand& cmd, output::Writer& writer) {
    auto loaded = load_fact_file(cmd.path, writer);
    if (!loaded) {
        return 1;
    }
    const std::vector<std::string>& facts = loaded->facts;

    std::vector<fact::LintIssue> issues = fact::lint_facts(facts, loaded->lines);

    if (cmd.json) {
        rapidjson::Document doc;
        doc.SetArray();
        auto& alloc = doc.GetAllocator();
        for (const auto& issue : issues) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("line", static_cast<std::uint64_t>(issue.line), alloc);
            obj.AddMember("raw", rapidjson::Value(issue.raw.c_str(), alloc), alloc);
            obj.AddMember("message", rapidjson::Value(issue.message.c_str(), alloc), alloc);
            doc.PushBack(obj, alloc);
        }
        writer.write_json_pretty(doc);
    } else {
        for (const auto& issue : issues) {
            writer.warn("line " + std::to_string(issue.line) + ": " + issue.message);
        }
    }

    std::size_t total = fact::strip_comments(facts).size();
    writer.info("Validated " + std::to_string(total - issues.size()) + " facts out of " +
                std::to_string(total));
    return issues.empty() ? 0 : 1;
}

int run_regex(const cli::RegexCommand& cmd, output::Writer& writer) {
    std::size_t unsafe = 0;

    rapidjson::Document doc;
    doc.SetArray();
    auto& alloc = doc.GetAllocator();

    for (const auto& pattern : cmd.patterns) {
        std::optional<std::string> reason = regex::check_regex_pattern(pattern);
        if (reason) {
            ++unsafe;
        }

        if (cmd.json) {
            rapidjson::Value obj(rapidjson::kObjectType);
            obj.AddMember("pattern", rapidjson::Value(pattern.c_str(), alloc), alloc);
            obj.AddMember("safe", !reason.has_value(), alloc);
            if (reason) {
                obj.AddMember("reason", rapidjson::Value(reason->c_str(), alloc), alloc);
            }
            doc.PushBack(obj, alloc);
        } else if (reason) {
            writer.red_line("unsafe  " + pattern + "  (" + *reason + ")");
        } else {
            writer.green_line("safe    " + pattern);
        }
    }

    if (cmd.json) {
        writer.write_json_pretty(doc);
    }
    writer.info(std::to_string(cmd.patterns.size() - unsafe) + " of " +
                std::to_string(cmd.patterns.size()) + " patterns are safe");
    return unsafe == 0 ? 0 : 1;
}

// ----------------------------------------------------------------------------
// run
// ----------------------------------------------------------------------------

int run(int argc, char** argv) {
    cli::ParseResult parse_result = cli::parse(argc, argv);

    output::OutputConfig out_cfg;
    out_cfg.quiet = parse_result.global.quiet;
    out_cfg.verbose = parse_result.global.verbose;
    output::Writer writer(out_cfg);

    // Диагностика парсинга выводится как есть, без [x]
    if (!parse_result.ok) {
        writer.write(output::Stream::Stderr, parse_result.diagnostic.stderr_message);
        return parse_result.diagnostic.exit_code;
    }

    config::Config cfg;
    if (parse_result.global.config.has_value()) {
        auto loaded = config::load_config(*parse_result.global.config);
        if (!loaded) {
            writer.error(loaded.error.format());
            return 1;
        }
        cfg = std::move(loaded.config);
        writer.debug("Loaded configuration from " +
                     platform::path_to_utf8(*parse_result.global.config));
    }
    expr::set_cache_capacity(cfg.cache_capacity);

    return std::visit(
        [&](const auto& cmd) -> int {
            using T = std::decay_t<decltype(cmd)>;

            if constexpr (std::is_same_v<T, cli::HelpCommand>) {
                std::string help = cli::render_help(cmd.command);
                // help <unknown> - ошибка использования
                if (help.rfind("error: ", 0) == 0) {
                    writer.write(output::Stream::Stderr, help);
                    return 2;
                }
                writer.write(output::Stream::Stdout, help);
                return 0;
            } else if constexpr (std::is_same_v<T, cli::VersionCommand>) {
                writer.write(output::Stream::Stdout, cli::render_version());
                return 0;
            } else if constexpr (std::is_same_v<T, cli::EvalCommand>) {
                return run_eval(cmd, cfg, writer);
            } else if constexpr (std::is_same_v<T, cli::FactsCommand>) {
                return run_facts(cmd, cfg, writer);
            } else if constexpr (std::is_same_v<T, cli::TraceCommand>) {
                return run_trace(cmd, cfg, writer);
            } else if constexpr (std::is_same_v<T, cli::LintCommand>) {
                return run_lint(cmd, writer);
            } else {
                static_assert(std::is_same_v<T, cli::RegexCommand>);
                return run_regex(cmd, writer);
            }
        },
        parse_result.command);
}

}  // anonymous namespace

int main(int argc, char** argv) {
    try {
        return run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "[x] " << e.what() << "\n";
        return 1;
    }
}
