// BlockResolverTest.cpp
#include <gtest/gtest.h>
#include "BlockResolver.hpp"
#include "Program.hpp"
#include "Error.hpp"

class BlockResolverTest : public ::testing::Test {
protected:
    void SetUp() override { Error::clear(); }
    void TearDown() override { Error::clear(); }
};

TEST_F(BlockResolverTest, FindCloseSkipsNestedBlocks) {
    LineSequence lines = Program::parse(
        "WHILE TRUE\n"        // 0
        "IF x\n"              // 1
        "FOR i IN y\n"        // 2
        "END\n"               // 3
        "END\n"               // 4
        "TRY\n"               // 5
        "END\n"               // 6
        "END\n");             // 7
    EXPECT_EQ(BlockResolver::find_close(lines, 0), 7u);
    EXPECT_EQ(BlockResolver::find_close(lines, 1), 4u);
    EXPECT_EQ(BlockResolver::find_close(lines, 2), 3u);
    EXPECT_EQ(BlockResolver::find_close(lines, 5), 6u);
}

TEST_F(BlockResolverTest, ElseOnlyMatchesAtTheSameDepth) {
    LineSequence lines = Program::parse(
        "IF a\n"              // 0
        "IF b\n"              // 1
        "ELSE\n"              // 2
        "END\n"               // 3
        "else\n"              // 4
        "END\n");             // 5
    EXPECT_EQ(BlockResolver::find_else_or_close(lines, 0), 4u);
    EXPECT_EQ(BlockResolver::find_else_or_close(lines, 1), 2u);
}

TEST_F(BlockResolverTest, ElseOrCloseFallsBackToEnd) {
    LineSequence lines = Program::parse("IF a\nPRINT 1\nEND\n");
    EXPECT_EQ(BlockResolver::find_else_or_close(lines, 0), 2u);
}

TEST_F(BlockResolverTest, TrySectionsArePartitioned) {
    LineSequence lines = Program::parse(
        "TRY\n"               // 0
        "TRY\n"               // 1
        "CATCH\n"             // 2
        "END\n"               // 3
        "EXCEPT\n"            // 4
        "PRINT 1\n"           // 5
        "FINALLY\n"           // 6
        "END\n");             // 7
    BlockResolver::TrySections sections = BlockResolver::find_try_sections(lines, 0);
    EXPECT_EQ(sections.except_index, 4u);
    EXPECT_EQ(sections.finally_index, 6u);
    EXPECT_EQ(sections.end_index, 7u);
}

TEST_F(BlockResolverTest, MissingSectionsAreNotFound) {
    LineSequence lines = Program::parse("TRY\nPRINT 1\nEND\n");
    BlockResolver::TrySections sections = BlockResolver::find_try_sections(lines, 0);
    EXPECT_EQ(sections.except_index, BlockResolver::NOT_FOUND);
    EXPECT_EQ(sections.finally_index, BlockResolver::NOT_FOUND);
    EXPECT_EQ(sections.end_index, 2u);
}

TEST_F(BlockResolverTest, UnterminatedBlockReportsTheOpeningLine) {
    LineSequence lines = Program::parse("PRINT 0\n\nWHILE TRUE\nIF x\nEND\n");
    EXPECT_EQ(BlockResolver::find_close(lines, 1), BlockResolver::NOT_FOUND);
    EXPECT_EQ(Error::get(), Error::UNTERMINATED_BLOCK);
    EXPECT_EQ(Error::line(), 3);
}

TEST_F(BlockResolverTest, UnterminatedFuncIsADefinitionError) {
    LineSequence lines = Program::parse("FUNC f a\nPRINT a\n");
    EXPECT_EQ(BlockResolver::find_close(lines, 0), BlockResolver::NOT_FOUND);
    EXPECT_EQ(Error::get(), Error::FUNCTION_DEFINITION);
    EXPECT_EQ(Error::line(), 1);
}
