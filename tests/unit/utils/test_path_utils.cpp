//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/utils/path_utils.hpp"

#include <gtest/gtest.h>

namespace aua::path_utils
{
    TEST(PathUtilsTest, RelativeGeneric) {
        EXPECT_EQ(relative_generic("/corpus/pkg/mod.py", "/corpus"), "pkg/mod.py");
        EXPECT_EQ(relative_generic("/corpus/top.py", "/corpus"), "top.py");
    }

    TEST(PathUtilsTest, LeadingDirectories) {
        const auto dirs = leading_directories("a/b/c.py");
        ASSERT_EQ(dirs.size(), 2u);
        EXPECT_EQ(dirs[0], "a");
        EXPECT_EQ(dirs[1], "a/b");

        EXPECT_TRUE(leading_directories("top.py").empty());
    }

    TEST(PathUtilsTest, Extension) {
        EXPECT_EQ(get_extension("pkg/Mod.PY"), ".py");
        EXPECT_EQ(get_extension("Makefile"), "");
    }
}
