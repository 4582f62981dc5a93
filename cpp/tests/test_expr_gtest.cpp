// ==============================================================================
// test_expr_gtest.cpp - Тесты компилятора и вычислителя выражений
// ==============================================================================
//
// Грамматика, семантика операторов, разрешение идентификаторов,
// методы строк/массивов, обёртка ошибок, кэш компиляции.
//
// ==============================================================================

#include <factguard/context.hpp>
#include <factguard/error.hpp>
#include <factguard/expr.hpp>
#include <factguard/safe_regex.hpp>

#include <atomic>
#include <gtest/gtest.h>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace factguard::expr::test {

// ==============================================================================
// Вспомогательные функции
// ==============================================================================

Context make_context(int hour = 21) {
    BaseContextOptions options;
    options.hour = hour;
    options.seed = 7;
    Context ctx = create_base_context(HasFactFn{}, options);

    Value facts = Value::make_array();
    facts.push_back(Value("a"));
    facts.push_back(Value("b"));

    ctx.extend("name", Value("Aria")).extend("facts", std::move(facts));
    return ctx;
}

ExprError eval_error(const std::string& expr, const Context& ctx) {
    try {
        eval_expr(expr, ctx);
    } catch (const ExprError& e) {
        return e;
    }
    ADD_FAILURE() << "expression did not throw: " << expr;
    return ExprError(ErrorKind::Parse, "");
}

ErrorKind compile_error_kind(const std::string& expr) {
    try {
        compile_expr(expr);
    } catch (const ExprError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expression compiled: " << expr;
    return ErrorKind::Parse;
}

class ExprCacheTest : public ::testing::Test {
protected:
    void SetUp() override {
        set_cache_capacity(DEFAULT_CACHE_CAPACITY);
        clear_compile_cache();
    }

    void TearDown() override { set_cache_capacity(DEFAULT_CACHE_CAPACITY); }
};

// ==============================================================================
// Литералы и операторы
// ==============================================================================

TEST(ExprTest, Literals_EvaluateToThemselves) {
    Context ctx;
    EXPECT_TRUE(eval_expr("true", ctx));
    EXPECT_FALSE(eval_expr("false", ctx));
    EXPECT_FALSE(eval_expr("null", ctx));
    EXPECT_TRUE(eval_expr("'text'", ctx));
    EXPECT_FALSE(eval_expr("''", ctx));
    EXPECT_FALSE(eval_expr("0", ctx));
    EXPECT_TRUE(eval_expr("0.5", ctx));
}

TEST(ExprTest, ComparisonChain_WorksForEmptyContext) {
    Context ctx;
    EXPECT_TRUE(eval_expr("1 < 2 && 2 < 3", ctx));
    EXPECT_FALSE(eval_expr("1 < 2 && 3 < 2", ctx));
}

TEST(ExprTest, Arithmetic_RespectsPrecedence) {
    Context ctx;
    EXPECT_TRUE(eval_expr("1 + 2 * 3 === 7", ctx));
    EXPECT_TRUE(eval_expr("(1 + 2) * 3 === 9", ctx));
    EXPECT_TRUE(eval_expr("7 % 3 === 1", ctx));
    EXPECT_TRUE(eval_expr("10 - 4 - 3 === 3", ctx));
    EXPECT_TRUE(eval_expr("-2 + +'3' === 1", ctx));
}

TEST(ExprTest, Division_FollowsFloatingPoint) {
    Context ctx;
    EXPECT_TRUE(eval_expr("1 / 0", ctx));
    EXPECT_FALSE(eval_expr("0 / 0", ctx));
    EXPECT_DOUBLE_EQ(eval_value("7 / 2", ctx).as_number(), 3.5);
}

TEST(ExprTest, Plus_ConcatenatesWhenEitherSideIsString) {
    Context ctx;
    EXPECT_EQ(eval_value("'a' + 1", ctx).as_string(), "a1");
    EXPECT_EQ(eval_value("2 + '2'", ctx).as_string(), "22");
    EXPECT_DOUBLE_EQ(eval_value("true + 1", ctx).as_number(), 2);
}

TEST(ExprTest, LooseAndStrictEquality) {
    Context ctx;
    EXPECT_TRUE(eval_expr("1 == '1'", ctx));
    EXPECT_FALSE(eval_expr("1 === '1'", ctx));
    EXPECT_TRUE(eval_expr("true == 1", ctx));
    EXPECT_TRUE(eval_expr("null == null", ctx));
    EXPECT_FALSE(eval_expr("null == 0", ctx));
    EXPECT_TRUE(eval_expr("1 !== '1'", ctx));
    EXPECT_TRUE(eval_expr("'a' != 'b'", ctx));
}

TEST(ExprTest, Relational_ComparesStringsLexicographically) {
    Context ctx;
    EXPECT_TRUE(eval_expr("'b' > 'a'", ctx));
    EXPECT_TRUE(eval_expr("'10' < '9'", ctx));
    EXPECT_FALSE(eval_expr("'10' < 9", ctx));
}

TEST(ExprTest, Logical_ShortCircuitsAndYieldsOperand) {
    Context ctx;
    // Правый операнд не вычисляется: неизвестный идентификатор не ошибка
    EXPECT_FALSE(eval_expr("false && missing", ctx));
    EXPECT_TRUE(eval_expr("true || missing", ctx));
    EXPECT_EQ(eval_value("0 || 'x'", ctx).as_string(), "x");
    EXPECT_DOUBLE_EQ(eval_value("'a' && 5", ctx).as_number(), 5);
}

TEST(ExprTest, Not_NegatesTruthiness) {
    Context ctx;
    EXPECT_TRUE(eval_expr("!0", ctx));
    EXPECT_TRUE(eval_expr("!!'x'", ctx));
    EXPECT_FALSE(eval_expr("!true", ctx));
}

TEST(ExprTest, Ternary_SelectsBranch) {
    Context ctx = make_context(21);
    EXPECT_EQ(eval_value("time.hour > 12 ? 'pm' : 'am'", ctx).as_string(), "pm");
    EXPECT_DOUBLE_EQ(eval_value("false ? 1 : true ? 2 : 3", ctx).as_number(), 2);
}

// ==============================================================================
// Контекст
// ==============================================================================

TEST(ExprTest, Random_ZeroNeverOneAlways) {
    Context ctx = make_context();
    for (int i = 0; i < 200; ++i) {
        EXPECT_FALSE(eval_expr("random(0)", ctx));
        EXPECT_TRUE(eval_expr("random(1)", ctx));
    }
}

TEST(ExprTest, HasFact_DelegatesToInjectedFunction) {
    std::vector<std::string> seen;
    Context ctx = create_base_context([&seen](const std::string& pattern) {
        seen.push_back(pattern);
        return pattern == "x";
    });

    EXPECT_TRUE(eval_expr("hasFact('x')", ctx));
    EXPECT_FALSE(eval_expr("hasFact(\"y\")", ctx));
    EXPECT_EQ(seen, (std::vector<std::string>{"x", "y"}));
}

TEST(ExprTest, Field_ReadsOneLevelOfRecord) {
    EXPECT_TRUE(eval_expr("time.isNight && !time.isDay", make_context(21)));
    EXPECT_TRUE(eval_expr("time.isDay && time.hour === 12", make_context(12)));
}

TEST(ExprTest, Field_MissingFieldIsNull) {
    EXPECT_TRUE(eval_expr("time.minute === null", make_context()));
}

TEST(ExprTest, UnknownIdentifier_FailsClosed) {
    ExprError e = eval_error("foo", Context{});
    EXPECT_EQ(e.kind(), ErrorKind::Evaluation);
    EXPECT_STREQ(e.what(), "Failed to evaluate expression \"foo\": Unknown identifier: foo");
}

TEST(ExprTest, Call_OnNonFunction_IsEvaluationError) {
    ExprError e = eval_error("name()", make_context());
    EXPECT_EQ(e.kind(), ErrorKind::Evaluation);
    EXPECT_NE(std::string(e.what()).find("name is not a function"), std::string::npos);
}

TEST(ExprTest, Field_OnNonRecord_IsEvaluationError) {
    EXPECT_EQ(eval_error("name.first", make_context()).kind(), ErrorKind::Evaluation);
}

// ==============================================================================
// Методы строк и массивов
// ==============================================================================

TEST(ExprTest, StringMethods) {
    Context ctx = make_context();
    EXPECT_TRUE(eval_expr("name.toLowerCase() === 'aria'", ctx));
    EXPECT_TRUE(eval_expr("name.toUpperCase() === 'ARIA'", ctx));
    EXPECT_TRUE(eval_expr("name.length === 4", ctx));
    EXPECT_TRUE(eval_expr("name.includes('ri')", ctx));
    EXPECT_TRUE(eval_expr("name.startsWith('Ar') && name.endsWith('ia')", ctx));
    EXPECT_TRUE(eval_expr("'  x '.trim() === 'x'", ctx));
    EXPECT_TRUE(eval_expr("name[0] === 'A'", ctx));
}

TEST(ExprTest, RegexStringMethods) {
    Context ctx = make_context();
    EXPECT_TRUE(eval_expr("name.match('ri')[0] === 'ri'", ctx));
    EXPECT_TRUE(eval_expr("name.match('zz') === null", ctx));
    EXPECT_TRUE(eval_expr("name.search('ia') === 2", ctx));
    EXPECT_TRUE(eval_expr("name.search('zz') === -1", ctx));
    EXPECT_TRUE(eval_expr("name.replace('A', 'O') === 'Oria'", ctx));
    EXPECT_TRUE(eval_expr("name.split('r').length === 2", ctx));
}

TEST(ExprTest, ArrayMethodsAndIndex) {
    Context ctx = make_context();
    EXPECT_TRUE(eval_expr("facts.length === 2", ctx));
    EXPECT_TRUE(eval_expr("facts[1] === 'b'", ctx));
    EXPECT_TRUE(eval_expr("facts[5] === null", ctx));
    EXPECT_TRUE(eval_expr("facts.includes('a') && !facts.includes('c')", ctx));
    EXPECT_TRUE(eval_expr("facts.join('-') === 'a-b'", ctx));
    EXPECT_TRUE(eval_expr("facts.join() === 'a,b'", ctx));
}

TEST(ExprTest, MethodNotAvailableOnType_IsEvaluationError) {
    EXPECT_EQ(eval_error("facts.toLowerCase()", make_context()).kind(), ErrorKind::Evaluation);
    EXPECT_EQ(eval_error("time.hour.length", make_context()).kind(), ErrorKind::Evaluation);
}

// ==============================================================================
// Ошибки компиляции
// ==============================================================================

TEST(ExprTest, DeepPropertyChain_IsCompileError) {
    EXPECT_EQ(compile_error_kind("time.hour.value"), ErrorKind::Compilation);
    EXPECT_EQ(compile_error_kind("facts[0].name"), ErrorKind::Compilation);
}

TEST(ExprTest, UnknownMethod_IsCompileError) {
    EXPECT_EQ(compile_error_kind("name.exec('a')"), ErrorKind::Compilation);
    EXPECT_EQ(compile_error_kind("name.charAt(0)"), ErrorKind::Compilation);
}

TEST(ExprTest, CallOnNonIdentifier_IsCompileError) {
    EXPECT_EQ(compile_error_kind("random(1)(1)"), ErrorKind::Compilation);
    EXPECT_EQ(compile_error_kind("'x'(1)"), ErrorKind::Compilation);
}

TEST(ExprTest, WrongMethodArity_IsCompileError) {
    EXPECT_EQ(compile_error_kind("name.replace('a')"), ErrorKind::Compilation);
    EXPECT_EQ(compile_error_kind("name.trim(1)"), ErrorKind::Compilation);
}

TEST(ExprTest, SyntaxErrors_AreCompileErrors) {
    for (const char* expr : {"1 +", "(1", "'abc", "a = 1", "()", "1 2", "a ? b", "x.", "1abc"}) {
        EXPECT_EQ(compile_error_kind(expr), ErrorKind::Compilation) << expr;
    }
}

TEST(ExprTest, UnsafeRegexLiteral_RejectedAtCompileTime) {
    EXPECT_EQ(compile_error_kind("name.match('(?:a+)+')"), ErrorKind::RegexSafety);
    EXPECT_EQ(compile_error_kind("name.split('(ab)')"), ErrorKind::RegexSafety);
}

// ==============================================================================
// Пределы вложенности
// ==============================================================================

TEST(ExprTest, DeepParentheses_IsCompileError) {
    // Arrange
    std::string expr = std::string(10000, '(') + "1" + std::string(10000, ')');

    // Act
    ExprError e = eval_error(expr, Context{});

    // Assert
    EXPECT_EQ(e.kind(), ErrorKind::Compilation);
    EXPECT_NE(std::string(e.what()).find("Expression nested too deeply"), std::string::npos);
}

TEST(ExprTest, LongUnaryChain_IsCompileError) {
    ExprError e = eval_error(std::string(10000, '!') + "1", Context{});
    EXPECT_EQ(e.kind(), ErrorKind::Compilation);
    EXPECT_NE(std::string(e.what()).find("Expression nested too deeply"), std::string::npos);
}

TEST(ExprTest, LongOperatorChain_IsCompileError) {
    // Левая цепочка не углубляет рекурсию парсера, но растит высоту AST
    std::string expr = "1";
    for (int i = 0; i < 5000; ++i) {
        expr += "+1";
    }
    EXPECT_EQ(compile_error_kind(expr), ErrorKind::Compilation);
}

TEST(ExprTest, NestingWithinLimits_Evaluates) {
    // Arrange
    std::string parens = std::string(30, '(') + "1" + std::string(30, ')');
    std::string nots = std::string(40, '!') + "1";
    std::string chain = "0";
    for (int i = 0; i < 200; ++i) {
        chain += "+1";
    }

    // Act & Assert
    EXPECT_DOUBLE_EQ(eval_value(parens, Context{}).as_number(), 1);
    EXPECT_TRUE(eval_expr(nots, Context{}));
    EXPECT_DOUBLE_EQ(eval_value(chain, Context{}).as_number(), 200);
}

TEST(ExprTest, LongSubjectForRegexMethod_IsRegexSafetyError) {
    Context ctx;
    ctx.set("text", Value(std::string(regex::MAX_REGEX_INPUT + 1, 'a')));
    ExprError e = eval_error("text.match('a*b')", ctx);
    EXPECT_EQ(e.kind(), ErrorKind::RegexSafety);
    EXPECT_NE(std::string(e.what()).find("input too long"), std::string::npos);
}

// ==============================================================================
// Обёртка ошибок eval_expr
// ==============================================================================

TEST(ExprTest, SanitizerRejection_RethrownUnchanged) {
    ExprError e = eval_error("eval(1)", Context{});
    EXPECT_EQ(e.kind(), ErrorKind::Sanitization);
    EXPECT_STREQ(e.what(), "Dangerous pattern in expression: eval(1)");
}

TEST(ExprTest, CompileError_WrappedWithSameKind) {
    ExprError e = eval_error("1 +", Context{});
    EXPECT_EQ(e.kind(), ErrorKind::Compilation);
    EXPECT_EQ(std::string(e.what()).rfind("Failed to evaluate expression \"1 +\": ", 0), 0u);
}

TEST(ExprTest, UnsafeRuntimePattern_WrappedAsRegexSafety) {
    Context ctx = create_base_context(make_fact_matcher({"tavern"}));
    ExprError e = eval_error("hasFact('(?:a+)+')", ctx);
    EXPECT_EQ(e.kind(), ErrorKind::RegexSafety);
    EXPECT_NE(std::string(e.what()).find("Unsafe regex"), std::string::npos);
}

TEST(ExprTest, ForeignException_WrappedAsEvaluation) {
    Context ctx;
    ctx.set("boom", Value::make_function(
                        [](const std::vector<Value>&) -> Value { throw std::runtime_error("kaput"); }));
    ExprError e = eval_error("boom()", ctx);
    EXPECT_EQ(e.kind(), ErrorKind::Evaluation);
    EXPECT_STREQ(e.what(), "Failed to evaluate expression \"boom()\": kaput");
}

// ==============================================================================
// Кэш компиляции
// ==============================================================================

TEST_F(ExprCacheTest, SecondCompile_IsCacheHitWithoutSanitize) {
    Context ctx = make_context();

    Predicate first = compile_expr("time.hour > 20");
    Predicate second = compile_expr("  time.hour > 20 ");

    CompileStats stats = compile_stats();
    EXPECT_EQ(stats.misses, 1u);
    EXPECT_EQ(stats.hits, 1u);
    EXPECT_EQ(stats.sanitize_calls, 1u);
    EXPECT_EQ(stats.size, 1u);
    EXPECT_EQ(first(ctx), second(ctx));
    EXPECT_EQ(first.root(), second.root());
    EXPECT_EQ(first.source(), "time.hour > 20");
}

TEST_F(ExprCacheTest, FailedCompile_DoesNotTouchCache) {
    EXPECT_THROW(compile_expr("1 +"), ExprError);
    EXPECT_THROW(compile_expr("while"), ExprError);

    CompileStats stats = compile_stats();
    EXPECT_EQ(stats.size, 0u);
    EXPECT_EQ(stats.misses, 2u);
}

TEST_F(ExprCacheTest, Capacity_EvictsLeastRecentlyUsed) {
    set_cache_capacity(2);

    compile_expr("1");
    compile_expr("2");
    compile_expr("1");  // "1" теперь самый свежий
    compile_expr("3");  // вытесняет "2"

    CompileStats before = compile_stats();
    EXPECT_EQ(before.size, 2u);
    EXPECT_EQ(before.capacity, 2u);

    compile_expr("1");
    EXPECT_EQ(compile_stats().hits, before.hits + 1);

    compile_expr("2");
    EXPECT_EQ(compile_stats().misses, before.misses + 1);
}

TEST_F(ExprCacheTest, ZeroCapacity_TreatedAsOne) {
    set_cache_capacity(0);
    EXPECT_EQ(compile_stats().capacity, 1u);
}

TEST_F(ExprCacheTest, Clear_ResetsCounters) {
    compile_expr("true");
    compile_expr("true");
    clear_compile_cache();

    CompileStats stats = compile_stats();
    EXPECT_EQ(stats.hits, 0u);
    EXPECT_EQ(stats.misses, 0u);
    EXPECT_EQ(stats.size, 0u);
}

TEST_F(ExprCacheTest, ConcurrentEvaluation_IsConsistent) {
    Context ctx = make_context();
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&ctx, &failures]() {
            for (int i = 0; i < 100; ++i) {
                if (!eval_expr("name.length === 4 && time.isNight", ctx)) {
                    ++failures;
                }
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(compile_stats().size, 1u);
}

}  // namespace factguard::expr::test
