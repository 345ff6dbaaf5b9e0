//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/usage/value_signature.hpp"
#include "aua/python/syntax_tree.hpp"

#include <gtest/gtest.h>

namespace aua::usage
{
    namespace {
        ValueSignature signature(const std::string& expression) {
            auto tree = python::SyntaxTree::parse("f(" + expression + ")\n");
            EXPECT_TRUE(tree.is_ok()) << expression;
            if (tree.is_err()) {
                return ValueSignature::unknown();
            }
            const TSNode statement = python::named_children(tree.value().root()).front();
            const TSNode call = python::named_children(statement).front();
            const TSNode arguments = python::field(call, "arguments");

            // f(x for x in xs) has no argument list around the generator.
            if (python::is_type(arguments, "generator_expression")) {
                return signature_of(tree.value(), arguments);
            }
            return signature_of(tree.value(), python::named_children(arguments).front());
        }
    }

    TEST(ValueSignatureTest, Constants) {
        EXPECT_EQ(signature("1"), ValueSignature::literal("1"));
        EXPECT_EQ(signature("0x10"), ValueSignature::literal("16"));
        EXPECT_EQ(signature("\"abc\""), ValueSignature::literal("'abc'"));
        EXPECT_EQ(signature("None"), ValueSignature::literal("None"));
        EXPECT_EQ(signature("True"), ValueSignature::literal("True"));
        EXPECT_EQ(signature("2.50"), ValueSignature::literal("2.5"));
    }

    TEST(ValueSignatureTest, SignedNumbers) {
        EXPECT_EQ(signature("-1"), ValueSignature::literal("-1"));
        EXPECT_EQ(signature("+3"), ValueSignature::literal("3"));
        EXPECT_EQ(signature("-0"), ValueSignature::literal("0"));
        EXPECT_EQ(signature("-1.5"), ValueSignature::literal("-1.5"));
    }

    TEST(ValueSignatureTest, Shapes) {
        EXPECT_EQ(signature("[1, 2]"), ValueSignature::shape("list"));
        EXPECT_EQ(signature("(1, 2)"), ValueSignature::shape("tuple"));
        EXPECT_EQ(signature("{'a': 1}"), ValueSignature::shape("dict"));
        EXPECT_EQ(signature("{1}"), ValueSignature::shape("set"));
        EXPECT_EQ(signature("f'{x}'"), ValueSignature::shape("fstring"));
        EXPECT_EQ(signature("lambda v: v"), ValueSignature::shape("lambda"));
        EXPECT_EQ(signature("[i for i in xs]"), ValueSignature::shape("listcomp"));
        EXPECT_EQ(signature("{i for i in xs}"), ValueSignature::shape("setcomp"));
        EXPECT_EQ(signature("{i: i for i in xs}"), ValueSignature::shape("dictcomp"));
        EXPECT_EQ(signature("i for i in xs"), ValueSignature::shape("genexp"));
    }

    TEST(ValueSignatureTest, StringsAreCanonical) {
        EXPECT_EQ(signature("'a' \"b\""), ValueSignature::literal("'ab'"));
        EXPECT_EQ(signature("b'x'"), ValueSignature::literal("b'x'"));
        EXPECT_EQ(signature("'a' f'{x}'"), ValueSignature::shape("fstring"));
        EXPECT_EQ(signature("((1))"), ValueSignature::literal("1"));
        EXPECT_EQ(signature("..."), ValueSignature::literal("Ellipsis"));
    }

    TEST(ValueSignatureTest, ConstantExpressions) {
        EXPECT_EQ(signature("1 + 2"), ValueSignature::shape("expression"));
        EXPECT_EQ(signature("2 ** -1"), ValueSignature::shape("expression"));
        EXPECT_EQ(signature("not True"), ValueSignature::shape("expression"));
    }

    TEST(ValueSignatureTest, NonLiteralsAreUnknown) {
        EXPECT_EQ(signature("x"), ValueSignature::unknown());
        EXPECT_EQ(signature("x + 1"), ValueSignature::unknown());
        EXPECT_EQ(signature("obj.attr"), ValueSignature::unknown());
        EXPECT_EQ(signature("g()"), ValueSignature::unknown());
        EXPECT_EQ(signature("-x"), ValueSignature::unknown());
    }

    TEST(ValueSignatureTest, BucketShapes) {
        EXPECT_EQ(bucket_signature(false, 2), ValueSignature::shape("tuple[2]"));
        EXPECT_EQ(bucket_signature(true, 1), ValueSignature::shape("dict[1]"));
        EXPECT_EQ(bucket_signature(true, 1).key(), "<dict[1]>");
    }
}
