// ==============================================================================
// factguard/context.hpp - Контекст выражений и фабрика базового контекста
// ==============================================================================
//
// Назначение:
// - Context: плоское отображение имя -> Value, единственный источник
//   идентификаторов для выражений $if
// - Базовый контекст: random, hasFact, roll, time
// - Бросок кубиков "NdM+K"
// - hasFact по списку фактов (case-insensitive, через safe regex)
// - Отладочный контекст для trace/lint инструментов
//
// Контекст создаётся вызывающей стороной на каждый вызов и не изменяется
// вычислителем.
//
// ==============================================================================

#ifndef FACTGUARD_CONTEXT_HPP
#define FACTGUARD_CONTEXT_HPP

#include <cstddef>
#include <cstdint>
#include <factguard/value.hpp>
#include <functional>
#include <optional>
#include <random>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace factguard::expr {

/// Проверка наличия факта у сущности (pattern -> bool)
using HasFactFn = std::function<bool(const std::string&)>;

// ============================================================================
// Context
// ============================================================================

class Context {
public:
    Context() = default;

    /// Установить (или заменить) значение
    void set(const std::string& name, Value value) { vars_[name] = std::move(value); }

    /// Добавить доменное поле, возвращает *this для цепочки вызовов
    Context& extend(const std::string& name, Value value) {
        set(name, std::move(value));
        return *this;
    }

    /// Найти значение (nullptr если имени нет в контексте)
    const Value* find(const std::string& name) const {
        auto it = vars_.find(name);
        return it != vars_.end() ? &it->second : nullptr;
    }

    bool has(const std::string& name) const { return vars_.find(name) != vars_.end(); }

    std::size_t size() const { return vars_.size(); }

    const std::unordered_map<std::string, Value>& entries() const { return vars_; }

private:
    std::unordered_map<std::string, Value> vars_;
};

// ============================================================================
// Base context
// ============================================================================

/// Параметры базового контекста
struct BaseContextOptions {
    std::optional<int> hour;           // переопределение часа (иначе локальное время)
    std::optional<std::uint32_t> seed;  // детерминированный генератор
};

/// Время суток, производное от часа
struct TimeInfo {
    int hour = 0;
    bool is_day = false;    // 6 <= hour < 18
    bool is_night = false;  // !is_day
};

/// Максимальное число кубиков в одном броске
constexpr std::uint64_t MAX_DICE = 1000;

/// Предел длины строки NdM[+-K]
constexpr std::size_t MAX_DICE_EXPRESSION = 32;

/// Вычислить TimeInfo для часа
TimeInfo time_info(int hour);

/// Бросить кубики "NdM" / "NdM+K" / "NdM-K".
/// Бросает ExprError(Evaluation) при несовпадении формата, M == 0 или N > MAX_DICE
double roll_dice(const std::string& dice, std::mt19937& rng);

/// Базовый контекст: random(chance), hasFact(pattern), roll(dice), time
Context create_base_context(HasFactFn has_fact);

/// Базовый контекст с явными параметрами (час, seed)
Context create_base_context(HasFactFn has_fact, const BaseContextOptions& options);

/// hasFact по списку фактов: паттерн проверяется валидатором regex и
/// ищется в каждом факте без учёта регистра
HasFactFn make_fact_matcher(std::vector<std::string> facts);

/// Контекст для отладочных инструментов: базовый контекст плюс
/// facts, name, has_fact (синоним hasFact), unread_count = 0
Context create_debug_context(const std::vector<std::string>& facts, const std::string& name,
                             const BaseContextOptions& options = {});

}  // namespace factguard::expr

#endif  // FACTGUARD_CONTEXT_HPP
