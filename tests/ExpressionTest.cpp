// ExpressionTest.cpp
#include <gtest/gtest.h>
#include "ExpressionEvaluator.hpp"
#include "Error.hpp"
#include <limits>

namespace {
    class ExpressionTest : public ::testing::Test {
    protected:
        void SetUp() override {
            Error::clear();
            env["x"] = 10LL;
            env["name"] = std::string("Claro");
            env["items"] = make_array({ 1LL, 2LL, 3LL });
        }
        void TearDown() override {
            Error::clear();
        }

        ClaroValue eval(const std::string& expr) {
            return ExpressionEvaluator::evaluate(expr, env, 7);
        }

        std::string eval_str(const std::string& expr) {
            return to_string(eval(expr));
        }

        Environment env;
    };
}

TEST_F(ExpressionTest, IntegerArithmeticFollowsPrecedence) {
    ClaroValue v = eval("1 + 2 * 3 - 4");
    ASSERT_TRUE(std::holds_alternative<long long>(v));
    EXPECT_EQ(std::get<long long>(v), 3);
    EXPECT_EQ(eval_str("(1 + 2) * 3"), "9");
    EXPECT_EQ(eval_str("x % 3"), "1");
    EXPECT_EQ(eval_str("x MOD 4"), "2");
}

TEST_F(ExpressionTest, DivisionAlwaysYieldsFloat) {
    ClaroValue v = eval("10 / 4");
    ASSERT_TRUE(std::holds_alternative<double>(v));
    EXPECT_DOUBLE_EQ(std::get<double>(v), 2.5);
    EXPECT_EQ(eval_str("10 / 2"), "5");
    EXPECT_EQ(eval_str("1 / 3"), "0.333333");
}

TEST_F(ExpressionTest, PowerIsRightAssociativeAndBindsTighterThanNegation) {
    EXPECT_EQ(eval_str("2 ^ 3"), "8");
    EXPECT_EQ(eval_str("2 ** 3 ** 2"), "512");
    EXPECT_EQ(eval_str("-2 ^ 2"), "-4");
    EXPECT_EQ(eval_str("2 ^ -1"), "0.5");
}

TEST_F(ExpressionTest, PlusConcatenatesStringsAndLists) {
    EXPECT_EQ(eval_str("\"Hello, \" + name"), "Hello, Claro");
    EXPECT_EQ(eval_str("'n=' + x"), "n=10");
    EXPECT_EQ(eval_str("items + [4]"), "[1, 2, 3, 4]");
    EXPECT_EQ(eval_str("\"ab\" * 3"), "ababab");
}

TEST_F(ExpressionTest, ComparisonAndLogic) {
    EXPECT_EQ(eval_str("x == 10"), "TRUE");
    EXPECT_EQ(eval_str("x = 10"), "TRUE");
    EXPECT_EQ(eval_str("x <> 10"), "FALSE");
    EXPECT_EQ(eval_str("x != 3 AND x >= 10"), "TRUE");
    EXPECT_EQ(eval_str("x < 3 || x > 9"), "TRUE");
    EXPECT_EQ(eval_str("NOT x == 3"), "TRUE");
    EXPECT_EQ(eval_str("!TRUE"), "FALSE");
    EXPECT_EQ(eval_str("\"abc\" < \"abd\""), "TRUE");
    EXPECT_EQ(eval_str("[1, 2] == [1, 2]"), "TRUE");
}

TEST_F(ExpressionTest, AndOrShortCircuit) {
    EXPECT_EQ(eval_str("FALSE AND undefined_name > 1"), "FALSE");
    EXPECT_EQ(eval_str("TRUE OR 1 / 0"), "TRUE");
    EXPECT_EQ(Error::get(), Error::OK);
}

TEST_F(ExpressionTest, IndexingListsMapsAndStrings) {
    EXPECT_EQ(eval_str("items[0]"), "1");
    EXPECT_EQ(eval_str("items[-1]"), "3");
    EXPECT_EQ(eval_str("name[1]"), "l");
    EXPECT_EQ(eval_str("{name: 1, \"b\": 2}[\"name\"]"), "1");
    EXPECT_EQ(eval_str("[[1, 2], [3, 4]][1][0]"), "3");
}

TEST_F(ExpressionTest, LiteralsPrintInCanonicalForm) {
    EXPECT_EQ(eval_str("3.14"), "3.14");
    EXPECT_EQ(eval_str("TRUE"), "TRUE");
    EXPECT_EQ(eval_str("[1, 'a', 2.5]"), "[1, \"a\", 2.5]");
    EXPECT_EQ(eval_str("{b: 2, a: 1}"), "{\"a\": 1, \"b\": 2}");
    EXPECT_EQ(eval_str("'it\\'s'"), "it's");
}

TEST_F(ExpressionTest, Builtins) {
    EXPECT_EQ(eval_str("LEN(name)"), "5");
    EXPECT_EQ(eval_str("len(items)"), "3");
    EXPECT_EQ(eval_str("STR(42) + \"!\""), "42!");
    EXPECT_EQ(eval_str("INT(\"12\") + 1"), "13");
    EXPECT_EQ(eval_str("INT(3.9)"), "3");
    EXPECT_EQ(eval_str("FLOAT(\"2.5\")"), "2.5");
    EXPECT_EQ(eval_str("UPPER(name)"), "CLARO");
    EXPECT_EQ(eval_str("LOWER(name)"), "claro");
    EXPECT_EQ(eval_str("RANGE(3)"), "[0, 1, 2]");
    EXPECT_EQ(eval_str("RANGE(1, 10, 4)"), "[1, 5, 9]");
    EXPECT_EQ(eval_str("KEYS({b: 1, a: 2})"), "[\"a\", \"b\"]");
    EXPECT_EQ(eval_str("CONTAINS(items, 2)"), "TRUE");
    EXPECT_EQ(eval_str("CONTAINS(name, \"lar\")"), "TRUE");
    EXPECT_EQ(eval_str("FORMAT(\"{} + {} = {}\", 1, 2, 3)"), "1 + 2 = 3");
    EXPECT_EQ(eval_str("ABS(-4)"), "4");
    EXPECT_EQ(eval_str("TYPE(1.5)"), "FLOAT");
    EXPECT_EQ(eval_str("TYPE(items)"), "LIST");
}

TEST_F(ExpressionTest, DivisionByZeroIsAnExpressionError) {
    eval("x / 0");
    EXPECT_EQ(Error::get(), Error::EXPRESSION_ERROR);
    EXPECT_EQ(Error::line(), 7);
    EXPECT_NE(Error::message().find("division by zero"), std::string::npos);
}

TEST_F(ExpressionTest, UndefinedVariableIsAnExpressionError) {
    eval("missing + 1");
    EXPECT_EQ(Error::get(), Error::EXPRESSION_ERROR);
    EXPECT_NE(Error::message().find("missing + 1: undefined variable 'missing'"), std::string::npos);
}

TEST_F(ExpressionTest, OperandTypeErrorsAreTypeMismatches) {
    eval("name - 1");
    EXPECT_EQ(Error::get(), Error::TYPE_MISMATCH);
    Error::clear();
    eval("items < 3");
    EXPECT_EQ(Error::get(), Error::TYPE_MISMATCH);
}

TEST_F(ExpressionTest, MalformedExpressionsAreRejected) {
    const char* bad[] = { "1 +", "(1 + 2", "[1, 2", "1 2", "'open", "1 $ 2", "NOPE(1)", "LEN(1, 2)", "items[5]" };
    for (const char* expr : bad) {
        Error::clear();
        eval(expr);
        EXPECT_EQ(Error::get(), Error::EXPRESSION_ERROR) << expr;
    }
}

TEST_F(ExpressionTest, IntegerOverflowWidensToFloat) {
    ClaroValue sum = eval("9223372036854775807 + 1");
    ASSERT_TRUE(std::holds_alternative<double>(sum));
    EXPECT_DOUBLE_EQ(std::get<double>(sum), 9223372036854775808.0);

    ClaroValue product = eval("4611686018427387904 * -4");
    ASSERT_TRUE(std::holds_alternative<double>(product));
    EXPECT_DOUBLE_EQ(std::get<double>(product), -18446744073709551616.0);

    ClaroValue difference = eval("-9223372036854775807 - 2");
    ASSERT_TRUE(std::holds_alternative<double>(difference));
    EXPECT_EQ(Error::get(), 0);
}

TEST_F(ExpressionTest, SmallestIntegerStaysSafe) {
    env["m"] = std::numeric_limits<long long>::min();
    ClaroValue rem = eval("m % -1");
    ASSERT_TRUE(std::holds_alternative<long long>(rem));
    EXPECT_EQ(std::get<long long>(rem), 0);
    EXPECT_EQ(eval_str("7 % -1"), "0");

    ClaroValue negated = eval("-m");
    ASSERT_TRUE(std::holds_alternative<double>(negated));
    EXPECT_DOUBLE_EQ(std::get<double>(negated), 9223372036854775808.0);

    ClaroValue absolute = eval("ABS(m)");
    ASSERT_TRUE(std::holds_alternative<double>(absolute));
    EXPECT_EQ(Error::get(), 0);
}

TEST_F(ExpressionTest, IntegerPowerUsesSquaring) {
    ClaroValue one = eval("1 ^ 100000000000");
    ASSERT_TRUE(std::holds_alternative<long long>(one));
    EXPECT_EQ(std::get<long long>(one), 1);
    EXPECT_EQ(eval_str("(-1) ^ 100000000001"), "-1");
    EXPECT_EQ(eval_str("2 ^ 62"), "4611686018427387904");

    ClaroValue big = eval("2 ^ 64");
    ASSERT_TRUE(std::holds_alternative<double>(big));
    EXPECT_DOUBLE_EQ(std::get<double>(big), 18446744073709551616.0);
}

TEST_F(ExpressionTest, IntRejectsValuesOutsideTheIntegerRange) {
    eval("INT(\"1e300\")");
    EXPECT_EQ(Error::get(), Error::EXPRESSION_ERROR);
    Error::clear();
    eval("INT(1e300)");
    EXPECT_EQ(Error::get(), Error::EXPRESSION_ERROR);
    Error::clear();
    EXPECT_EQ(eval_str("INT(-3.9)"), "-3");
}

TEST_F(ExpressionTest, RangeStopsAtTheIntegerLimit) {
    ClaroValue v = eval("RANGE(9223372036854775806, 9223372036854775807, 5)");
    ASSERT_TRUE(std::holds_alternative<std::shared_ptr<Array>>(v));
    EXPECT_EQ(std::get<std::shared_ptr<Array>>(v)->data.size(), 1u);
}
