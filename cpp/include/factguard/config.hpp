// ==============================================================================
// factguard/config.hpp - Конфигурация (YAML)
// ==============================================================================
//
// Формат файла:
//
//   cache_capacity: 1024
//   seed: 42
//   hour: 21
//   name: "Aria"
//   variables:
//     unread_count: 3
//     channel: { name: "tavern", is_nsfw: false }
//
// Неизвестные ключи - ошибка. Опции CLI переопределяют значения файла.
//
// ==============================================================================

#ifndef FACTGUARD_CONFIG_HPP
#define FACTGUARD_CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <factguard/context.hpp>
#include <factguard/expr.hpp>
#include <factguard/value.hpp>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace factguard::config {

struct Config {
    std::size_t cache_capacity = expr::DEFAULT_CACHE_CAPACITY;
    std::optional<std::uint32_t> seed;
    std::optional<int> hour;
    std::string name;
    std::vector<std::pair<std::string, Value>> variables;  // в порядке файла
};

struct Error {
    std::string message;
    std::string path;

    std::string format() const;
};

struct ConfigResult {
    bool ok = false;
    Config config;
    Error error;

    explicit operator bool() const { return ok; }
};

/// Загрузить конфигурацию из YAML файла
ConfigResult load_config(const std::filesystem::path& path);

/// Разобрать конфигурацию из YAML текста
ConfigResult parse_config(std::string_view yaml);

/// Скаляр "true"/"false"/"null"/число -> соответствующий тип, иначе строка
Value parse_scalar(std::string_view text);

/// "key=value" -> (key, parse_scalar(value))
/// @throw std::invalid_argument если нет '=' или имя не является идентификатором
std::pair<std::string, Value> parse_var(std::string_view assignment);

/// Имя пригодно как идентификатор выражения
bool is_identifier(std::string_view name);

/// Параметры базового контекста из конфигурации
expr::BaseContextOptions context_options(const Config& config);

/// Добавить переменные конфигурации в контекст
void apply_variables(const Config& config, expr::Context& ctx);

}  // namespace factguard::config

#endif  // FACTGUARD_CONFIG_HPP
