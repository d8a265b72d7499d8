// StatementTest.cpp
#include "ClaroTestFixture.hpp"
#include "TextIO.hpp"
#include <deque>

using Lines = std::vector<std::string>;

TEST_F(ClaroTest, VariableFormsAndSetAlias) {
    ASSERT_TRUE(run(
        "VARIABLE a = 2\n"
        "variable b a * 3\n"
        "SET c = a + b\n"
        "PRINT c\n"));
    EXPECT_EQ(out(), (Lines{ "8" }));
    ASSERT_EQ(vm.variables.count("c"), 1u);
    EXPECT_TRUE(values_equal(vm.variables["c"], ClaroValue(8LL)));
}

TEST_F(ClaroTest, VariableNamesAreCaseSensitive) {
    ASSERT_TRUE(run("VARIABLE Name = 1\nVARIABLE name = 2\nPRINT Name + name\n"));
    EXPECT_EQ(out(), (Lines{ "3" }));
}

TEST_F(ClaroTest, StringStoresTheTextForm) {
    ASSERT_TRUE(run("STRING s = 1 + 2\nPRINT TYPE(s)\nPRINT s + s\n"));
    EXPECT_EQ(out(), (Lines{ "STRING", "33" }));
}

TEST_F(ClaroTest, ListRequiresASequence) {
    ASSERT_TRUE(run("LIST l = [1, 2] + [3]\nPRINT l\nPRINT LEN(l)\n"));
    EXPECT_EQ(out(), (Lines{ "[1, 2, 3]", "3" }));

    EXPECT_FALSE(run("LIST l = 5\n"));
    EXPECT_EQ(Error::get(), Error::TYPE_MISMATCH);
}

TEST_F(ClaroTest, DictWrapsBareEntries) {
    ASSERT_TRUE(run(
        "DICT person = name: \"Ann\", age: 3\n"
        "DICT empty = {}\n"
        "PRINT person[\"name\"]\n"
        "PRINT person\n"
        "PRINT LEN(empty)\n"));
    EXPECT_EQ(out(), (Lines{ "Ann", "{\"age\": 3, \"name\": \"Ann\"}", "0" }));
}

TEST_F(ClaroTest, InputReadsThroughTheLineReader) {
    std::deque<std::string> pending = { "Bob" };
    std::vector<std::string> prompts;
    vm.line_reader = [&](const std::string& prompt) -> std::optional<std::string> {
        prompts.push_back(prompt);
        if (pending.empty()) return std::nullopt;
        std::string line = pending.front();
        pending.pop_front();
        return line;
    };

    ASSERT_TRUE(run(
        "INPUT who \"Name?\"\n"
        "INPUT rest\n"
        "PRINT \"Hi \" + who + rest + \"!\"\n"));
    EXPECT_EQ(out(), (Lines{ "Hi Bob!" }));
    EXPECT_EQ(prompts, (Lines{ "Name? ", "" }));
}

TEST_F(ClaroTest, GetShowsAVariable) {
    ASSERT_TRUE(run("VARIABLE a = 5\nGET a\nGET b\n"));
    EXPECT_EQ(out(), (Lines{ "a = 5", "Variable 'b' is not defined." }));
}

TEST_F(ClaroTest, ConcatJoinsVariables) {
    ASSERT_TRUE(run(
        "STRING a = \"foo\"\n"
        "VARIABLE b = 42\n"
        "CONCAT c a b\n"
        "CONCAT d a undefined\n"
        "PRINT c\n"
        "PRINT d\n"));
    EXPECT_EQ(out(), (Lines{ "foo42", "foo" }));
}

TEST_F(ClaroTest, StackListsActiveCalls) {
    ASSERT_TRUE(run(
        "FUNC inner\n"
        "STACK\n"
        "END\n"
        "FUNC outer\n"
        "CALL inner\n"
        "END\n"
        "CALL outer\n"));
    EXPECT_EQ(out(), (Lines{
        "Call Stack (depth 2):",
        "  outer (called from line 7)",
        "  inner (called from line 5)" }));
}

TEST_F(ClaroTest, TraceDumpsVariablesAndFunctions) {
    ASSERT_TRUE(run(
        "VARIABLE a = 1\n"
        "FUNC f x y\n"
        "PRINT x\n"
        "END\n"
        "TRACE\n"));
    EXPECT_EQ(out(), (Lines{
        "---- TRACE ----",
        "Variables (1): {\"a\":1}",
        "Functions (1):",
        "  f(x, y) with 1 lines",
        "---- END TRACE ----" }));
}

TEST_F(ClaroTest, DebugTracesEachLineToTheConsole) {
    std::string console;
    {
        CoutRedirector capture;
        ASSERT_TRUE(run("DEBUG ON\nPRINT 1\nDEBUG OFF\nPRINT 2\n"));
        console = capture.getString();
    }
    EXPECT_NE(console.find("[DEBUG] line 2: PRINT 1"), std::string::npos);
    EXPECT_NE(console.find("[DEBUG] line 3: DEBUG OFF"), std::string::npos);
    EXPECT_EQ(console.find("[DEBUG] line 4"), std::string::npos);
    EXPECT_EQ(out(), (Lines{ "Debug mode enabled.", "1", "Debug mode disabled.", "2" }));

    EXPECT_FALSE(run("DEBUG MAYBE\n"));
    EXPECT_EQ(Error::get(), Error::MISSING_ARGUMENT);
}

TEST_F(ClaroTest, ExitStopsWithoutError) {
    EXPECT_TRUE(run("PRINT 1\nIF TRUE\nEXIT\nEND\nPRINT 2\n"));
    EXPECT_EQ(out(), (Lines{ "1" }));
}

TEST_F(ClaroTest, CommentsAndRemAreIgnored) {
    ASSERT_TRUE(run("# hash comment\n' quote comment\nREM remark\nCOMMENT note\nPRINT 1\n"));
    EXPECT_EQ(out(), (Lines{ "1" }));
}

TEST_F(ClaroTest, KeywordsAreCaseInsensitive) {
    ASSERT_TRUE(run("print 1\nIf true\nPrint 2\nend\n"));
    EXPECT_EQ(out(), (Lines{ "1", "2" }));
}

TEST_F(ClaroTest, UnknownStatementIsInvalid) {
    EXPECT_FALSE(run("PRINT 1\nSHOUT 2\n"));
    EXPECT_EQ(Error::get(), Error::INVALID_STATEMENT);
    EXPECT_EQ(Error::line(), 2);
    EXPECT_EQ(out(), (Lines{ "1" }));
}

TEST_F(ClaroTest, MissingArgumentsAreReported) {
    const char* bad[] = { "PRINT\n", "VARIABLE\n", "VARIABLE x =\n", "IF\nEND\n", "WHILE\nEND\n", "GET\n", "CONCAT a b\n", "FOR\nEND\n", "INPUT\n" };
    for (const char* source : bad) {
        EXPECT_FALSE(run(source)) << source;
        EXPECT_EQ(Error::get(), Error::MISSING_ARGUMENT) << source;
        EXPECT_EQ(Error::line(), 1) << source;
    }
}

TEST_F(ClaroTest, StrayEndIsSteppedOver) {
    ASSERT_TRUE(run("PRINT 1\nEND\nPRINT 2\n"));
    EXPECT_EQ(out(), (Lines{ "1", "2" }));
}
