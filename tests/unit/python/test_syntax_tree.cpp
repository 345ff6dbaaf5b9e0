//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/python/syntax_tree.hpp"

#include <gtest/gtest.h>

#include <string>

namespace aua::python
{
    namespace {
        Error parse_err(const std::string_view source, const ParseLimits& limits = {}) {
            auto tree = SyntaxTree::parse(source, limits);
            EXPECT_TRUE(tree.is_err());
            return tree.is_err() ? tree.error() : Error::internal_error("parsed");
        }

        TSNode first_statement(const SyntaxTree& tree) {
            const auto statements = named_children(tree.root());
            EXPECT_FALSE(statements.empty());
            return statements.empty() ? TSNode{} : statements.front();
        }
    }

    TEST(SyntaxTreeTest, ParsesStatementsInOrder) {
        auto tree = SyntaxTree::parse(
            "import numpy as np\n"
            "# comment\n"
            "x = np.zeros(3)\n"
            "def f():\n"
            "    pass\n");
        ASSERT_TRUE(tree.is_ok()) << tree.error().to_string();

        const auto statements = named_children(tree.value().root());
        ASSERT_EQ(statements.size(), 3u);
        EXPECT_EQ(node_type(statements[0]), "import_statement");
        EXPECT_EQ(node_type(statements[1]), "expression_statement");
        EXPECT_EQ(node_type(statements[2]), "function_definition");
        EXPECT_EQ(tree.value().text(field(statements[2], "name")), "f");
    }

    TEST(SyntaxTreeTest, CallPositionsAreOneBased) {
        auto tree = SyntaxTree::parse("\n\nx = 1\nresult = pkg.fn(\n    1)\n");
        ASSERT_TRUE(tree.is_ok());

        const auto statements = named_children(tree.value().root());
        ASSERT_EQ(statements.size(), 2u);
        const TSNode assignment = named_children(statements[1]).front();
        ASSERT_TRUE(is_type(assignment, "assignment"));

        const TSNode call = field(assignment, "right");
        ASSERT_TRUE(is_type(call, "call"));
        EXPECT_EQ(position_of(call).line, 4u);
        EXPECT_EQ(position_of(call).column, 10u);
        EXPECT_EQ(tree.value().text(field(call, "function")), "pkg.fn");
    }

    TEST(SyntaxTreeTest, RepeatedFieldsAreAllReturned) {
        auto tree = SyntaxTree::parse(
            "if a:\n"
            "    pass\n"
            "elif b:\n"
            "    pass\n"
            "else:\n"
            "    pass\n");
        ASSERT_TRUE(tree.is_ok());

        const auto alternatives = field_children(first_statement(tree.value()), "alternative");
        ASSERT_EQ(alternatives.size(), 2u);
        EXPECT_EQ(node_type(alternatives[0]), "elif_clause");
        EXPECT_EQ(node_type(alternatives[1]), "else_clause");
        EXPECT_TRUE(field_children(first_statement(tree.value()), "nothing").empty());
    }

    TEST(SyntaxTreeTest, PositionalAfterKeywordIsError) {
        const auto error = parse_err("f(x=1, 2)\n");
        EXPECT_EQ(error.code(), ErrorCode::ParseError);
        EXPECT_EQ(error.message(), "positional argument follows keyword argument");
        EXPECT_EQ(error.context().value(), "1:8");
    }

    TEST(SyntaxTreeTest, ArgumentsAfterMappingUnpackAreErrors) {
        EXPECT_EQ(parse_err("f(**kw, 1)\n").message(), "positional argument follows keyword argument unpacking");
        EXPECT_EQ(parse_err("f(**kw, *xs)\n").message(),
                  "iterable argument unpacking follows keyword argument unpacking");
        EXPECT_TRUE(SyntaxTree::parse("f(1, *xs, k=2, **kw)\n").is_ok());
    }

    TEST(SyntaxTreeTest, SyntaxErrorsFailTheWholeFile) {
        const auto error = parse_err("ok = 1\nx = = 1\n");
        ASSERT_TRUE(error.context().has_value());
        EXPECT_EQ(error.context()->substr(0, 2), "2:");

        parse_err("def f(:\n    pass\n");
        parse_err("class\n");
        parse_err("if x\n    y\n");
        parse_err("f(1\n");
    }

    TEST(SyntaxTreeTest, InvalidUtf8) {
        const auto error = parse_err("a = 1\nb \xFF\n");
        EXPECT_EQ(error.message(), "invalid UTF-8 in source");
        EXPECT_EQ(error.context().value(), "2:3");
    }

    TEST(SyntaxTreeTest, ByteOrderMarkIsSkipped) {
        auto tree = SyntaxTree::parse("\xEF\xBB\xBFx = f()\n");
        ASSERT_TRUE(tree.is_ok());
        EXPECT_EQ(tree.value().source(), "x = f()\n");
    }

    TEST(SyntaxTreeTest, NestingLimit) {
        std::string deep;
        for (int i = 0; i < 30; ++i) deep += "f(";
        for (int i = 0; i < 30; ++i) deep += ")";
        deep += "\n";

        ParseLimits limits;
        limits.max_nesting_depth = 20;
        const auto error = parse_err(deep, limits);
        EXPECT_EQ(error.message(), "too many nested parentheses or blocks");
        EXPECT_TRUE(SyntaxTree::parse(deep).is_ok());
    }

    TEST(SyntaxTreeTest, OperatorChainsDoNotCountAsNesting) {
        std::string chain = "x = 1";
        for (int i = 0; i < 5000; ++i) chain += " + 1";
        chain += "\n";

        EXPECT_TRUE(SyntaxTree::parse(chain).is_ok());
    }

    TEST(SyntaxTreeTest, DeadlineExceeded) {
        ParseLimits limits;
        limits.deadline = std::chrono::steady_clock::now() - std::chrono::seconds(1);

        const auto error = parse_err("x = 1\n", limits);
        EXPECT_EQ(error.message(), "processing deadline exceeded");
        EXPECT_EQ(error.context().value(), "1:1");
    }

    TEST(SyntaxTreeTest, EmptySource) {
        auto tree = SyntaxTree::parse("");
        ASSERT_TRUE(tree.is_ok());
        EXPECT_TRUE(named_children(tree.value().root()).empty());
    }

    TEST(SyntaxTreeTest, FindInvalidUtf8) {
        EXPECT_EQ(find_invalid_utf8("plain"), std::string_view::npos);
        EXPECT_EQ(find_invalid_utf8("caf\xC3\xA9"), std::string_view::npos);
        EXPECT_EQ(find_invalid_utf8("ab\xC0\x80"), 2u);
        EXPECT_EQ(find_invalid_utf8("\xED\xA0\x80"), 0u);
    }
}
