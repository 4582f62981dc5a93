// ==============================================================================
// test_config_gtest.cpp - Тесты конфигурации (yaml-cpp)
// ==============================================================================

#include <factguard/config.hpp>
#include <factguard/expr.hpp>

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>

#ifdef _WIN32
#include <windows.h>
#else
#include <unistd.h>
#endif

namespace factguard::config::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

std::string parse_error(const std::string& yaml) {
    ConfigResult result = parse_config(yaml);
    EXPECT_FALSE(result) << yaml;
    return result.error.message;
}

const Value* variable(const Config& config, const std::string& name) {
    for (const auto& [key, value] : config.variables) {
        if (key == name) {
            return &value;
        }
    }
    return nullptr;
}

// ==============================================================================
// Корректная конфигурация
// ==============================================================================

TEST(ConfigTest, ParseConfig_AllKeys) {
    // Arrange
    const char* yaml = R"(
cache_capacity: 64
seed: 42
hour: 21
name: Aria
variables:
  unread_count: 3
  mood: "calm"
  channel: { name: tavern, is_nsfw: false }
  tags: [a, b]
)";

    // Act
    ConfigResult result = parse_config(yaml);

    // Assert
    ASSERT_TRUE(result) << result.error.format();
    const Config& config = result.config;
    EXPECT_EQ(config.cache_capacity, 64u);
    EXPECT_EQ(config.seed, std::optional<std::uint32_t>(42));
    EXPECT_EQ(config.hour, std::optional<int>(21));
    EXPECT_EQ(config.name, "Aria");

    ASSERT_EQ(config.variables.size(), 4u);
    EXPECT_EQ(config.variables[0].first, "unread_count");
    EXPECT_DOUBLE_EQ(variable(config, "unread_count")->as_number(), 3);
    EXPECT_EQ(variable(config, "mood")->as_string(), "calm");
    EXPECT_FALSE(variable(config, "channel")->get("is_nsfw")->as_bool());
    EXPECT_EQ(variable(config, "tags")->array_size(), 2u);
}

TEST(ConfigTest, ParseConfig_EmptyDocument_Defaults) {
    ConfigResult result = parse_config("");
    ASSERT_TRUE(result);
    EXPECT_EQ(result.config.cache_capacity, expr::DEFAULT_CACHE_CAPACITY);
    EXPECT_FALSE(result.config.seed.has_value());
    EXPECT_FALSE(result.config.hour.has_value());
    EXPECT_TRUE(result.config.variables.empty());
}

TEST(ConfigTest, ParseConfig_QuotedScalarStaysString) {
    ConfigResult result = parse_config("variables:\n  code: \"42\"\n  flag: 'true'\n");
    ASSERT_TRUE(result);
    EXPECT_EQ(variable(result.config, "code")->as_string(), "42");
    EXPECT_EQ(variable(result.config, "flag")->as_string(), "true");
}

// ==============================================================================
// Ошибки валидации
// ==============================================================================

TEST(ConfigTest, ParseConfig_UnknownKey) {
    EXPECT_EQ(parse_error("colour: red\n"), "unknown configuration key: colour");
}

TEST(ConfigTest, ParseConfig_RangeChecks) {
    EXPECT_EQ(parse_error("cache_capacity: 0\n"), "cache_capacity must be at least 1");
    EXPECT_EQ(parse_error("seed: -1\n"), "seed must be in range 0..4294967295");
    EXPECT_EQ(parse_error("seed: 4294967296\n"), "seed must be in range 0..4294967295");
    EXPECT_EQ(parse_error("hour: 24\n"), "hour must be in range 0..23");
}

TEST(ConfigTest, ParseConfig_NonInteger) {
    EXPECT_EQ(parse_error("hour: noon\n"), "hour must be an integer, got \"noon\"");
}

TEST(ConfigTest, ParseConfig_StructuralErrors) {
    EXPECT_EQ(parse_error("- a\n- b\n"), "configuration must be a mapping");
    EXPECT_EQ(parse_error("variables: [a]\n"), "variables must be a mapping");
    EXPECT_EQ(parse_error("name: [a]\n"), "name must be a string");
}

TEST(ConfigTest, ParseConfig_BadVariableNames) {
    EXPECT_EQ(parse_error("variables:\n  bad-name: 1\n"),
              "variable name is not an identifier: bad-name");
    EXPECT_EQ(parse_error("variables:\n  roll: 1\n"), "variable shadows a built-in: roll");
}

TEST(ConfigTest, ParseConfig_YamlSyntaxError) {
    ConfigResult result = parse_config("hour: [1, 2\n");
    EXPECT_FALSE(result);
    EXPECT_FALSE(result.error.message.empty());
}

// ==============================================================================
// load_config
// ==============================================================================

TEST(ConfigTest, LoadConfig_FromFile) {
    // Arrange
    std::filesystem::path path = std::filesystem::temp_directory_path() /
                                 ("factguard_config_" + std::to_string(
#ifdef _WIN32
                                                            GetCurrentProcessId()
#else
                                                            getpid()
#endif
                                                                ) +
                                  ".yaml");
    {
        std::ofstream out(path);
        out << "hour: 3\nseed: 9\n";
    }

    // Act
    ConfigResult result = load_config(path);

    // Assert
    ASSERT_TRUE(result) << result.error.format();
    EXPECT_EQ(result.config.hour, std::optional<int>(3));

    std::filesystem::remove(path);
}

TEST(ConfigTest, LoadConfig_MissingFile) {
    ConfigResult result = load_config("/nonexistent/factguard.yaml");
    EXPECT_FALSE(result);
    EXPECT_EQ(result.error.format(), "config error [/nonexistent/factguard.yaml]: could not open file");
}

// ==============================================================================
// Скаляры и --var
// ==============================================================================

TEST(ConfigTest, ParseScalar_Types) {
    EXPECT_TRUE(parse_scalar("true").as_bool());
    EXPECT_FALSE(parse_scalar("false").as_bool());
    EXPECT_TRUE(parse_scalar("null").is_null());
    EXPECT_TRUE(parse_scalar("~").is_null());
    EXPECT_DOUBLE_EQ(parse_scalar("3").as_number(), 3);
    EXPECT_DOUBLE_EQ(parse_scalar("-0.5").as_number(), -0.5);
    EXPECT_DOUBLE_EQ(parse_scalar("1e3").as_number(), 1000);
    EXPECT_EQ(parse_scalar("1.2.3").as_string(), "1.2.3");
    EXPECT_EQ(parse_scalar("tavern").as_string(), "tavern");
    EXPECT_EQ(parse_scalar("").as_string(), "");
}

TEST(ConfigTest, ParseVar_KeyValue) {
    auto [key, value] = parse_var("unread_count=5");
    EXPECT_EQ(key, "unread_count");
    EXPECT_DOUBLE_EQ(value.as_number(), 5);

    auto [key2, value2] = parse_var("greeting=a=b");
    EXPECT_EQ(key2, "greeting");
    EXPECT_EQ(value2.as_string(), "a=b");
}

TEST(ConfigTest, ParseVar_Invalid) {
    EXPECT_THROW(parse_var("novalue"), std::invalid_argument);
    EXPECT_THROW(parse_var("9lives=1"), std::invalid_argument);
    EXPECT_THROW(parse_var("=1"), std::invalid_argument);
    EXPECT_THROW(parse_var("time=1"), std::invalid_argument);
}

TEST(ConfigTest, IsIdentifier) {
    EXPECT_TRUE(is_identifier("_x1"));
    EXPECT_TRUE(is_identifier("unreadCount"));
    EXPECT_FALSE(is_identifier(""));
    EXPECT_FALSE(is_identifier("1x"));
    EXPECT_FALSE(is_identifier("a.b"));
}

// ==============================================================================
// Применение к контексту
// ==============================================================================

TEST(ConfigTest, ContextOptionsAndVariables_FeedEvaluation) {
    // Arrange
    ConfigResult result = parse_config("hour: 4\nvariables:\n  unread_count: 2\n");
    ASSERT_TRUE(result);

    // Act
    expr::Context ctx = expr::create_base_context(expr::HasFactFn{}, context_options(result.config));
    apply_variables(result.config, ctx);

    // Assert
    EXPECT_TRUE(expr::eval_expr("time.isNight && unread_count === 2", ctx));
}

}  // namespace factguard::config::test
