// ==============================================================================
// config.cpp - Загрузка конфигурации (yaml-cpp)
// ==============================================================================

#include <factguard/config.hpp>
#include <factguard/platform.hpp>

#include <cctype>
#include <cstdlib>
#include <sstream>
#include <stdexcept>

#include <yaml-cpp/yaml.h>

namespace factguard::config {

namespace {

constexpr const char* BUILTIN_NAMES[] = {"random", "hasFact", "roll", "time"};

bool is_builtin(const std::string& name) {
    for (const char* builtin : BUILTIN_NAMES) {
        if (name == builtin) {
            return true;
        }
    }
    return false;
}

bool looks_numeric(std::string_view text) {
    if (text.empty()) {
        return false;
    }
    bool has_digit = false;
    for (char c : text) {
        if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
            has_digit = true;
        } else if (c != '.' && c != '-' && c != '+' && c != 'e' && c != 'E') {
            return false;
        }
    }
    return has_digit;
}

long long integer_field(const YAML::Node& node, const std::string& key) {
    if (!node.IsScalar()) {
        throw std::runtime_error(key + " must be an integer");
    }
    try {
        return node.as<long long>();
    } catch (const YAML::BadConversion&) {
        throw std::runtime_error(key + " must be an integer, got \"" + node.Scalar() + "\"");
    }
}

Value value_from_yaml(const YAML::Node& node) {
    switch (node.Type()) {
    case YAML::NodeType::Scalar:
        // Строка в кавычках остаётся строкой
        if (node.Tag() == "!") {
            return Value(node.Scalar());
        }
        return parse_scalar(node.Scalar());
    case YAML::NodeType::Sequence: {
        Value list = Value::make_array();
        for (const auto& item : node) {
            list.push_back(value_from_yaml(item));
        }
        return list;
    }
    case YAML::NodeType::Map: {
        Value record = Value::make_object();
        for (const auto& kv : node) {
            record.set(kv.first.as<std::string>(), value_from_yaml(kv.second));
        }
        return record;
    }
    case YAML::NodeType::Null:
    case YAML::NodeType::Undefined:
        break;
    }
    return Value();
}

void parse_variables(const YAML::Node& node, Config& config) {
    if (node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw std::runtime_error("variables must be a mapping");
    }
    for (const auto& kv : node) {
        std::string name = kv.first.as<std::string>();
        if (!is_identifier(name)) {
            throw std::runtime_error("variable name is not an identifier: " + name);
        }
        if (is_builtin(name)) {
            throw std::runtime_error("variable shadows a built-in: " + name);
        }
        config.variables.emplace_back(name, value_from_yaml(kv.second));
    }
}

Config parse_root(const YAML::Node& root) {
    Config config;

    if (!root.IsDefined() || root.IsNull()) {
        return config;
    }
    if (!root.IsMap()) {
        throw std::runtime_error("configuration must be a mapping");
    }

    for (const auto& kv : root) {
        std::string key = kv.first.as<std::string>();
        const YAML::Node& value = kv.second;

        if (key == "cache_capacity") {
            long long capacity = integer_field(value, key);
            if (capacity < 1) {
                throw std::runtime_error("cache_capacity must be at least 1");
            }
            config.cache_capacity = static_cast<std::size_t>(capacity);
        } else if (key == "seed") {
            long long seed = integer_field(value, key);
            if (seed < 0 || seed > 0xFFFFFFFFLL) {
                throw std::runtime_error("seed must be in range 0..4294967295");
            }
            config.seed = static_cast<std::uint32_t>(seed);
        } else if (key == "hour") {
            long long hour = integer_field(value, key);
            if (hour < 0 || hour > 23) {
                throw std::runtime_error("hour must be in range 0..23");
            }
            config.hour = static_cast<int>(hour);
        } else if (key == "name") {
            if (!value.IsScalar()) {
                throw std::runtime_error("name must be a string");
            }
            config.name = value.Scalar();
        } else if (key == "variables") {
            parse_variables(value, config);
        } else {
            throw std::runtime_error("unknown configuration key: " + key);
        }
    }

    return config;
}

}  // namespace

std::string Error::format() const {
    std::ostringstream oss;
    oss << "config error";
    if (!path.empty()) {
        oss << " [" << path << "]";
    }
    oss << ": " << message;
    return oss.str();
}

ConfigResult load_config(const std::filesystem::path& path) {
    ConfigResult result;
    std::string display = platform::path_to_utf8(path);

    try {
        YAML::Node root = YAML::LoadFile(path.string());
        result.config = parse_root(root);
        result.ok = true;
    } catch (const YAML::BadFile&) {
        result.error = Error{"could not open file", display};
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), display};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), display};
    }

    return result;
}

ConfigResult parse_config(std::string_view yaml) {
    ConfigResult result;

    try {
        YAML::Node root = YAML::Load(std::string(yaml));
        result.config = parse_root(root);
        result.ok = true;
    } catch (const YAML::Exception& e) {
        result.error = Error{e.what(), ""};
    } catch (const std::exception& e) {
        result.error = Error{e.what(), ""};
    }

    return result;
}

Value parse_scalar(std::string_view text) {
    if (text == "true") {
        return Value(true);
    }
    if (text == "false") {
        return Value(false);
    }
    if (text == "null" || text == "~") {
        return Value();
    }
    if (looks_numeric(text)) {
        std::string s(text);
        char* end = nullptr;
        double number = std::strtod(s.c_str(), &end);
        if (end == s.c_str() + s.size()) {
            return Value(number);
        }
    }
    return Value(std::string(text));
}

bool is_identifier(std::string_view name) {
    if (name.empty()) {
        return false;
    }
    if (std::isdigit(static_cast<unsigned char>(name[0])) != 0) {
        return false;
    }
    for (char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_') {
            return false;
        }
    }
    return true;
}

std::pair<std::string, Value> parse_var(std::string_view assignment) {
    std::size_t eq = assignment.find('=');
    if (eq == std::string_view::npos) {
        throw std::invalid_argument("expected KEY=VALUE, got \"" + std::string(assignment) + "\"");
    }
    std::string key(assignment.substr(0, eq));
    if (!is_identifier(key)) {
        throw std::invalid_argument("variable name is not an identifier: " + key);
    }
    if (is_builtin(key)) {
        throw std::invalid_argument("variable shadows a built-in: " + key);
    }
    return {key, parse_scalar(assignment.substr(eq + 1))};
}

expr::BaseContextOptions context_options(const Config& config) {
    expr::BaseContextOptions options;
    options.hour = config.hour;
    options.seed = config.seed;
    return options;
}

void apply_variables(const Config& config, expr::Context& ctx) {
    for (const auto& [name, value] : config.variables) {
        ctx.set(name, value);
    }
}

}  // namespace factguard::config
