// FunctionTest.cpp
#include "ClaroTestFixture.hpp"
#include "TextIO.hpp"

using Lines = std::vector<std::string>;

TEST_F(ClaroTest, CallAddPrintsSeven) {
    ASSERT_TRUE(run(
        "FUNC add a b\n"
        "PRINT a + b\n"
        "END\n"
        "CALL add 3 4\n"));
    EXPECT_EQ(out(), (Lines{ "7" }));
}

TEST_F(ClaroTest, ParenthesizedAndCommaSeparatedSignatures) {
    ASSERT_TRUE(run(
        "FUNC greet(first, last)\n"
        "PRINT first + \" \" + last\n"
        "END\n"
        "FUNC twice n\n"
        "PRINT n * 2\n"
        "END\n"
        "CALL greet(\"Ada\", \"Lovelace\")\n"
        "CALL greet \"Alan\", \"Turing\"\n"
        "CALL twice(1 + 2)\n"));
    EXPECT_EQ(out(), (Lines{ "Ada Lovelace", "Alan Turing", "6" }));
}

TEST_F(ClaroTest, FunctionBodyIsNotRunAtDefinition) {
    ASSERT_TRUE(run("FUNC f\nPRINT \"body\"\nEND\nPRINT \"defined\"\n"));
    EXPECT_EQ(out(), (Lines{ "defined" }));
    EXPECT_EQ(vm.function_table.count("f"), 1u);
}

TEST_F(ClaroTest, ArityMismatchNeverRunsTheBody) {
    EXPECT_FALSE(run(
        "FUNC add a b\n"
        "PRINT \"ran\"\n"
        "END\n"
        "CALL add 1\n"));
    EXPECT_EQ(Error::get(), Error::ARITY_MISMATCH);
    EXPECT_EQ(Error::line(), 4);
    EXPECT_TRUE(out().empty());
}

TEST_F(ClaroTest, ArityIsCheckedBeforeArgumentsAreEvaluated) {
    EXPECT_FALSE(run("FUNC f a\nEND\nCALL f 1 / 0, 2\n"));
    EXPECT_EQ(Error::get(), Error::ARITY_MISMATCH);
}

TEST_F(ClaroTest, SingleExpressionArgumentNeedsParentheses) {
    ASSERT_TRUE(run(
        "VARIABLE n = 5\n"
        "FUNC show v\n"
        "PRINT v\n"
        "END\n"
        "CALL show(n - 1)\n"));
    EXPECT_EQ(out(), (Lines{ "4" }));
    EXPECT_FALSE(run("CALL show n - 1\n"));
    EXPECT_EQ(Error::get(), Error::ARITY_MISMATCH);
}

TEST_F(ClaroTest, HelpExplainsHowToPassExpressionArguments) {
    std::string console;
    {
        CoutRedirector capture;
        vm.print_help();
        console = capture.getString();
    }
    EXPECT_NE(console.find("CALL f(n - 1)"), std::string::npos);
}

TEST_F(ClaroTest, UndefinedFunctionIsReportedFirst) {
    EXPECT_FALSE(run("CALL nowhere 1 / 0\n"));
    EXPECT_EQ(Error::get(), Error::UNDEFINED_FUNCTION);
    EXPECT_EQ(Error::line(), 1);
}

TEST_F(ClaroTest, FrameVariablesMergeBackIntoCaller) {
    ASSERT_TRUE(run(
        "VARIABLE n = 10\n"
        "FUNC scale n\n"
        "VARIABLE y = n * 2\n"
        "END\n"
        "CALL scale 3\n"
        "PRINT n\n"
        "PRINT y\n"));
    EXPECT_EQ(out(), (Lines{ "3", "6" }));
}

TEST_F(ClaroTest, FailedCallLeavesCallerVariablesUntouched) {
    ASSERT_TRUE(run(
        "VARIABLE x = 1\n"
        "FUNC f\n"
        "VARIABLE x = 2\n"
        "PRINT 1 / 0\n"
        "END\n"
        "TRY\n"
        "CALL f\n"
        "END\n"
        "PRINT x\n"
        "PRINT ERL\n"));
    EXPECT_EQ(out(), (Lines{ "1", "4" }));
}

TEST_F(ClaroTest, RecursionSharesStateThroughMergeOut) {
    ASSERT_TRUE(run(
        "VARIABLE acc = 1\n"
        "FUNC fact k\n"
        "IF k > 1\n"
        "VARIABLE acc = acc * k\n"
        "CALL fact(k - 1)\n"
        "END\n"
        "END\n"
        "CALL fact 5\n"
        "PRINT acc\n"));
    EXPECT_EQ(out(), (Lines{ "120" }));
}

TEST_F(ClaroTest, ReturnSetsRetvalAndLeavesEarly) {
    ASSERT_TRUE(run(
        "FUNC sign n\n"
        "IF n < 0\n"
        "RETURN -1\n"
        "END\n"
        "RETURN 1\n"
        "PRINT \"unreachable\"\n"
        "END\n"
        "CALL sign -5\n"
        "PRINT RETVAL\n"
        "CALL sign 2\n"
        "PRINT RETVAL\n"));
    EXPECT_EQ(out(), (Lines{ "-1", "1" }));
}

TEST_F(ClaroTest, ReturnFromInsideALoop) {
    ASSERT_TRUE(run(
        "FUNC first_even items\n"
        "FOR x IN items\n"
        "IF x % 2 == 0\n"
        "RETURN x\n"
        "END\n"
        "END\n"
        "RETURN -1\n"
        "END\n"
        "CALL first_even [3, 5, 8, 10]\n"
        "PRINT RETVAL\n"));
    EXPECT_EQ(out(), (Lines{ "8" }));
}

TEST_F(ClaroTest, ReturnOutsideFunctionIsInvalid) {
    EXPECT_FALSE(run("RETURN 1\n"));
    EXPECT_EQ(Error::get(), Error::INVALID_STATEMENT);
}

TEST_F(ClaroTest, RecursionLimitIsEnforced) {
    EXPECT_FALSE(run(
        "FUNC down n\n"
        "CALL down(n + 1)\n"
        "END\n"
        "CALL down 0\n"));
    EXPECT_EQ(Error::get(), Error::RECURSION_LIMIT);
    EXPECT_EQ(Error::line(), 2);
    EXPECT_TRUE(vm.call_stack.empty());
}

TEST_F(ClaroTest, BreakCannotEscapeAFunctionBody) {
    EXPECT_FALSE(run(
        "FUNC leave\n"
        "BREAK\n"
        "END\n"
        "FOR i IN [1, 2]\n"
        "CALL leave\n"
        "END\n"));
    EXPECT_EQ(Error::get(), Error::CONTROL_SIGNAL_OUTSIDE_LOOP);
    EXPECT_EQ(Error::line(), 2);
}

TEST_F(ClaroTest, RedefinitionReplacesTheFunction) {
    ASSERT_TRUE(run(
        "FUNC f\nPRINT 1\nEND\n"
        "FUNC f\nPRINT 2\nEND\n"
        "CALL f\n"));
    EXPECT_EQ(out(), (Lines{ "2" }));
}

TEST_F(ClaroTest, MalformedSignaturesAreDefinitionErrors) {
    const char* bad[] = {
        "FUNC\nEND\n",
        "FUNC f a a\nEND\n",
        "FUNC f 1x\nEND\n",
        "FUNC f a\n",
    };
    for (const char* source : bad) {
        Error::clear();
        EXPECT_FALSE(run(source)) << source;
        EXPECT_EQ(Error::get(), Error::FUNCTION_DEFINITION) << source;
    }
}

TEST_F(ClaroTest, NestedBlocksResolveInsideTheBody) {
    ASSERT_TRUE(run(
        "FUNC classify n\n"
        "IF n > 0\n"
        "PRINT \"pos\"\n"
        "ELSE\n"
        "PRINT \"non-pos\"\n"
        "END\n"
        "END\n"
        "CALL classify 1\n"
        "CALL classify 0\n"));
    EXPECT_EQ(out(), (Lines{ "pos", "non-pos" }));
}
