//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/python/literal.hpp"

#include <gtest/gtest.h>

#include <limits>

namespace aua::python
{
    namespace {
        std::string repr_of_string(const std::string_view token) {
            auto literal = decode_string_token(token);
            EXPECT_TRUE(literal.is_ok()) << token;
            if (literal.is_err()) {
                return {};
            }
            return string_repr(literal.value().value, literal.value().is_bytes);
        }

        std::string repr_of_number(const std::string_view token) {
            auto literal = decode_number_token(token);
            EXPECT_TRUE(literal.is_ok()) << token;
            return literal.is_ok() ? literal.value().repr : std::string{};
        }
    }

    TEST(LiteralTest, QuotesNormalizeToSingle) {
        EXPECT_EQ(repr_of_string("\"abc\""), "'abc'");
        EXPECT_EQ(repr_of_string("'abc'"), "'abc'");
        EXPECT_EQ(repr_of_string("'''abc'''"), "'abc'");
    }

    TEST(LiteralTest, QuoteChoiceFollowsContent) {
        EXPECT_EQ(repr_of_string("\"it's\""), "\"it's\"");
        EXPECT_EQ(repr_of_string("'say \"hi\"'"), "'say \"hi\"'");
        EXPECT_EQ(repr_of_string("'both \\' and \"'"), "'both \\' and \"'");
    }

    TEST(LiteralTest, Escapes) {
        EXPECT_EQ(repr_of_string("'a\\tb\\n'"), "'a\\tb\\n'");
        EXPECT_EQ(repr_of_string("'\\x41\\u00e9'"), "'A\xC3\xA9'");
        EXPECT_EQ(repr_of_string("'\\101'"), "'A'");
        EXPECT_EQ(repr_of_string("'\\d'"), "'\\\\d'");
        EXPECT_EQ(repr_of_string("'\\x00'"), "'\\x00'");
    }

    TEST(LiteralTest, RawStringsKeepBackslashes) {
        EXPECT_EQ(repr_of_string("r'\\d+'"), "'\\\\d+'");
    }

    TEST(LiteralTest, Bytes) {
        EXPECT_EQ(repr_of_string("b'abc'"), "b'abc'");
        EXPECT_EQ(repr_of_string("b'\\xff\\n'"), "b'\\xff\\n'");
    }

    TEST(LiteralTest, FormatStringsHaveNoValue) {
        auto literal = decode_string_token("f'{x}'");
        ASSERT_TRUE(literal.is_ok());
        EXPECT_TRUE(literal.value().is_format);
        EXPECT_TRUE(literal.value().value.empty());
    }

    TEST(LiteralTest, TruncatedEscapeIsError) {
        auto literal = decode_string_token("'\\x4'");
        ASSERT_TRUE(literal.is_err());
        EXPECT_EQ(literal.error().code(), ErrorCode::ParseError);
    }

    TEST(LiteralTest, IntegersInEveryBase) {
        EXPECT_EQ(repr_of_number("16"), "16");
        EXPECT_EQ(repr_of_number("0x10"), "16");
        EXPECT_EQ(repr_of_number("0o20"), "16");
        EXPECT_EQ(repr_of_number("0b10000"), "16");
        EXPECT_EQ(repr_of_number("1_000_000"), "1000000");
        EXPECT_EQ(repr_of_number("000"), "0");
    }

    TEST(LiteralTest, LargeIntegers) {
        EXPECT_EQ(repr_of_number("0xFFFFFFFFFFFFFFFFFFFF"), "1208925819614629174706175");
        EXPECT_EQ(repr_of_number("123456789012345678901234567890"), "123456789012345678901234567890");
    }

    TEST(LiteralTest, Floats) {
        EXPECT_EQ(repr_of_number("1.0"), "1.0");
        EXPECT_EQ(repr_of_number("1."), "1.0");
        EXPECT_EQ(repr_of_number(".5"), "0.5");
        EXPECT_EQ(repr_of_number("1e3"), "1000.0");
        EXPECT_EQ(repr_of_number("0.0001"), "0.0001");
        EXPECT_EQ(repr_of_number("1e16"), "1e+16");
        EXPECT_EQ(repr_of_number("1.5e-5"), "1.5e-05");
        EXPECT_EQ(repr_of_number("3.14"), "3.14");
    }

    TEST(LiteralTest, Complex) {
        EXPECT_EQ(repr_of_number("2j"), "2j");
        EXPECT_EQ(repr_of_number("1.5J"), "1.5j");

        auto literal = decode_number_token("2j");
        ASSERT_TRUE(literal.is_ok());
        EXPECT_EQ(literal.value().kind, NumberKind::Complex);
    }

    TEST(LiteralTest, InvalidDigits) {
        EXPECT_TRUE(decode_number_token("0b102").is_err());
        EXPECT_TRUE(decode_number_token("0x").is_err());
    }

    TEST(LiteralTest, FloatReprSpecialValues) {
        EXPECT_EQ(float_repr(0.0), "0.0");
        EXPECT_EQ(float_repr(-2.5), "-2.5");
        EXPECT_EQ(float_repr(std::numeric_limits<double>::infinity()), "inf");
    }
}
