//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <set>
#include <vector>

namespace aua::string_utils
{
    TEST(StringUtilsTest, Trim) {
        EXPECT_EQ(trim("  sklearn.svm  "), "sklearn.svm");
        EXPECT_EQ(trim("\t\n"), "");
        EXPECT_EQ(trim("vendor/ \r"), "vendor/");
    }

    TEST(StringUtilsTest, JoinAnyContainer) {
        const std::vector<std::string> parts = {"sklearn", "svm", "SVC"};
        EXPECT_EQ(join(parts, "."), "sklearn.svm.SVC");
        EXPECT_EQ(join(std::vector<std::string>{}, "."), "");
        EXPECT_EQ(join(std::set<std::string>{"b", "a"}, ", "), "a, b");
    }

    TEST(StringUtilsTest, StartsWith) {
        EXPECT_TRUE(starts_with("sklearn.svm", "sklearn"));
        EXPECT_FALSE(starts_with("sk", "sklearn"));
        EXPECT_TRUE(starts_with("anything", ""));
    }

    TEST(StringUtilsTest, ToLower) {
        EXPECT_EQ(to_lower(".PY"), ".py");
    }

    TEST(StringUtilsTest, JoinDotted) {
        EXPECT_EQ(join_dotted("pkg", "sub.fn"), "pkg.sub.fn");
        EXPECT_EQ(join_dotted("", "fn"), "fn");
        EXPECT_EQ(join_dotted("pkg", ""), "pkg");
    }

    TEST(StringUtilsTest, DottedPrefix) {
        EXPECT_TRUE(is_dotted_prefix("sklearn", "sklearn"));
        EXPECT_TRUE(is_dotted_prefix("sklearn", "sklearn.svm"));
        EXPECT_FALSE(is_dotted_prefix("sklearn", "sklearnx.svm"));
        EXPECT_FALSE(is_dotted_prefix("sklearn.svm", "sklearn"));
    }

    TEST(StringUtilsTest, LastComponent) {
        EXPECT_EQ(last_component("sklearn.svm.SVC.__init__"), "__init__");
        EXPECT_EQ(last_component("fit"), "fit");
        EXPECT_EQ(last_component(""), "");
    }
}
