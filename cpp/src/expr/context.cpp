// ==============================================================================
// context.cpp - Базовый контекст выражений
// ==============================================================================

#include <factguard/context.hpp>
#include <factguard/error.hpp>
#include <factguard/platform.hpp>
#include <factguard/safe_regex.hpp>

#include <charconv>
#include <memory>
#include <regex>

namespace factguard::expr {

namespace {

// Формат броска: фиксированный паттерн, не от автора контента
const std::regex& dice_regex() {
    static const std::regex re(R"(^(\d+)d(\d+)([+-]\d+)?$)", std::regex::ECMAScript);
    return re;
}

[[noreturn]] void invalid_dice(const std::string& dice) {
    throw ExprError(ErrorKind::Evaluation, "Invalid dice expression: " + dice);
}

std::uint64_t parse_count(const std::string& digits, const std::string& dice) {
    std::uint64_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc() || ptr != digits.data() + digits.size()) {
        invalid_dice(dice);
    }
    return value;
}

/// Первый аргумент нативной функции как строка
std::string string_arg(const std::vector<Value>& args, const char* fn) {
    if (args.empty() || args[0].is_null()) {
        throw ExprError(ErrorKind::Evaluation, std::string(fn) + "() expects a string argument");
    }
    return args[0].to_display_string();
}

}  // namespace

// ============================================================================
// Time / dice
// ============================================================================

TimeInfo time_info(int hour) {
    TimeInfo info;
    info.hour = hour;
    info.is_day = hour >= 6 && hour < 18;
    info.is_night = !info.is_day;
    return info;
}

double roll_dice(const std::string& dice, std::mt19937& rng) {
    std::smatch m;
    if (dice.size() > MAX_DICE_EXPRESSION || !std::regex_match(dice, m, dice_regex())) {
        invalid_dice(dice);
    }

    std::uint64_t count = parse_count(m.str(1), dice);
    std::uint64_t sides = parse_count(m.str(2), dice);
    if (sides == 0 || count > MAX_DICE) {
        invalid_dice(dice);
    }

    double total = 0;
    if (m[3].matched) {
        std::string mod = m.str(3);
        bool negative = mod[0] == '-';
        total = static_cast<double>(parse_count(mod.substr(1), dice));
        if (negative) {
            total = -total;
        }
    }

    std::uniform_int_distribution<std::uint64_t> dist(1, sides);
    for (std::uint64_t i = 0; i < count; ++i) {
        total += static_cast<double>(dist(rng));
    }
    return total;
}

// ============================================================================
// Base context
// ============================================================================

Context create_base_context(HasFactFn has_fact) {
    return create_base_context(std::move(has_fact), BaseContextOptions{});
}

Context create_base_context(HasFactFn has_fact, const BaseContextOptions& options) {
    // Генератор разделяется функциями random и roll этого контекста
    auto rng = std::make_shared<std::mt19937>(options.seed.has_value() ? *options.seed
                                                                       : std::random_device{}());

    Context ctx;

    ctx.set("random", Value::make_function([rng](const std::vector<Value>& args) {
                if (args.empty() || !args[0].is_number()) {
                    throw ExprError(ErrorKind::Evaluation, "random() expects a number argument");
                }
                double chance = args[0].as_number();
                // Равномерное [0, 1): chance = 0 никогда, chance = 1 всегда
                std::uniform_real_distribution<double> dist(0.0, 1.0);
                return Value(dist(*rng) < chance);
            }));

    if (has_fact) {
        ctx.set("hasFact",
                Value::make_function([fn = std::move(has_fact)](const std::vector<Value>& args) {
                    return Value(fn(string_arg(args, "hasFact")));
                }));
    } else {
        ctx.set("hasFact", Value::make_function(
                               [](const std::vector<Value>&) { return Value(false); }));
    }

    ctx.set("roll", Value::make_function([rng](const std::vector<Value>& args) {
                return Value(roll_dice(string_arg(args, "roll"), *rng));
            }));

    TimeInfo info = time_info(options.hour.has_value() ? *options.hour : platform::local_hour());
    Value time = Value::make_object();
    time.set("hour", Value(info.hour));
    time.set("isDay", Value(info.is_day));
    time.set("isNight", Value(info.is_night));
    ctx.set("time", std::move(time));

    return ctx;
}

// ============================================================================
// Fact matcher / debug context
// ============================================================================

HasFactFn make_fact_matcher(std::vector<std::string> facts) {
    return [facts = std::move(facts)](const std::string& pattern) {
        std::regex re = regex::compile_safe(pattern, true);
        for (const auto& fact : facts) {
            regex::check_regex_input(fact);
            if (std::regex_search(fact, re)) {
                return true;
            }
        }
        return false;
    };
}

Context create_debug_context(const std::vector<std::string>& facts, const std::string& name,
                             const BaseContextOptions& options) {
    Context ctx = create_base_context(make_fact_matcher(facts), options);

    Value list = Value::make_array();
    for (const auto& fact : facts) {
        list.push_back(Value(fact));
    }

    ctx.extend("facts", std::move(list))
        .extend("name", Value(name))
        .extend("unread_count", Value(0));

    // has_fact - синоним hasFact для старых фактов
    if (const Value* has_fact = ctx.find("hasFact")) {
        Value alias = *has_fact;
        ctx.set("has_fact", std::move(alias));
    }

    return ctx;
}

}  // namespace factguard::expr
