//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/result.hpp"
#include "aua/error.hpp"

#include <gtest/gtest.h>

#include <charconv>
#include <string>
#include <vector>

namespace aua
{
    namespace {
        Result<int, Error> parse_count(const std::string& text) {
            int value = 0;
            const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
            if (ec != std::errc{} || ptr != text.data() + text.size()) {
                return Result<int, Error>::failure(Error::parse_error("not a count", text));
            }
            return Result<int, Error>::success(value);
        }

        Result<int, Error> require_positive(const int value) {
            if (value <= 0) {
                return Result<int, Error>::failure(Error::invalid_argument("count must be positive"));
            }
            return Result<int, Error>::success(value);
        }
    }

    TEST(ResultTest, HoldsValue) {
        auto result = parse_count("42");

        ASSERT_TRUE(result.is_ok());
        EXPECT_FALSE(result.is_err());
        EXPECT_TRUE(static_cast<bool>(result));
        EXPECT_EQ(result.value(), 42);
        EXPECT_THROW((void)result.error(), std::logic_error);
    }

    TEST(ResultTest, HoldsError) {
        auto result = parse_count("4x");

        ASSERT_TRUE(result.is_err());
        EXPECT_FALSE(static_cast<bool>(result));
        EXPECT_EQ(result.error().code(), ErrorCode::ParseError);
        EXPECT_EQ(result.error().context().value(), "4x");
        EXPECT_THROW((void)result.value(), std::logic_error);
    }

    TEST(ResultTest, ValueOr) {
        EXPECT_EQ(parse_count("7").value_or(0), 7);
        EXPECT_EQ(parse_count("seven").value_or(0), 0);
    }

    TEST(ResultTest, MapTransformsOnlyValues) {
        const auto doubled = parse_count("10").map([](const int x) { return x * 2; });
        ASSERT_TRUE(doubled.is_ok());
        EXPECT_EQ(doubled.value(), 20);

        const auto failed = parse_count("").map([](const int x) { return std::to_string(x); });
        ASSERT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().code(), ErrorCode::ParseError);
    }

    TEST(ResultTest, AndThenStopsAtFirstError) {
        EXPECT_EQ(parse_count("3").and_then(require_positive).value(), 3);

        const auto rejected = parse_count("0").and_then(require_positive);
        ASSERT_TRUE(rejected.is_err());
        EXPECT_EQ(rejected.error().code(), ErrorCode::InvalidArgument);

        int calls = 0;
        const auto skipped = parse_count("x").and_then([&calls](const int v) {
            ++calls;
            return require_positive(v);
        });
        EXPECT_TRUE(skipped.is_err());
        EXPECT_EQ(calls, 0);
    }

    TEST(ResultTest, MapErrorAttachesContext) {
        auto failed = Result<int, Error>::failure(Error::config_error("bad table"));
        auto mapped = std::move(failed).map_error([](const Error& e) {
            return e.with_context("aua.toml");
        });
        ASSERT_TRUE(mapped.is_err());
        EXPECT_EQ(mapped.error().context().value(), "aua.toml");

        auto kept = parse_count("3").map_error([](const Error&) {
            return Error::internal_error("unreachable");
        });
        ASSERT_TRUE(kept.is_ok());
        EXPECT_EQ(kept.value(), 3);
    }

    TEST(ResultTest, MovesValueOut) {
        auto names = Result<std::vector<std::string>, Error>::success({"sklearn.svm.SVC", "sklearn.svm.SVR"});
        const auto taken = std::move(names).value();
        EXPECT_EQ(taken.size(), 2u);

        auto joined = Result<std::string, Error>::success("fit").map([](std::string s) { return s + "()"; });
        EXPECT_EQ(joined.value(), "fit()");
    }

    TEST(VoidResultTest, SuccessAndFailure) {
        const auto ok = Result<void, Error>::success();
        EXPECT_TRUE(ok.is_ok());
        EXPECT_THROW((void)ok.error(), std::logic_error);

        const auto failed = Result<void, Error>::failure(Error::checkpoint_error("disk full"));
        ASSERT_TRUE(failed.is_err());
        EXPECT_EQ(failed.error().code(), ErrorCode::CheckpointError);
    }

    TEST(VoidResultTest, AndThenRunsOnlyAfterSuccess) {
        int counter = 0;
        const auto step = [&counter]() {
            ++counter;
            return Result<void, Error>::success();
        };

        EXPECT_TRUE((Result<void, Error>::success().and_then(step).is_ok()));
        EXPECT_EQ(counter, 1);

        EXPECT_TRUE((Result<void, Error>::failure(Error::io_error("not writable")).and_then(step).is_err()));
        EXPECT_EQ(counter, 1);
    }
}
