//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/utils/json_utils.hpp"

#include <gtest/gtest.h>
#include <filesystem>

using namespace aua;
using namespace aua::json_utils;

class JsonUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir = fs::temp_directory_path() / "aua_json_utils_test";
        fs::create_directories(temp_dir);
    }

    void TearDown() override {
        fs::remove_all(temp_dir);
    }

    fs::path temp_dir;
};

TEST_F(JsonUtilsTest, ParseValid) {
    auto parsed = parse(R"({"package": "sklearn", "elements": []})");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value()["package"], "sklearn");
}

TEST_F(JsonUtilsTest, ParseInvalidReportsOrigin) {
    auto parsed = parse("{\"package\": ", "api.json");
    ASSERT_TRUE(parsed.is_err());
    EXPECT_EQ(parsed.error().code(), ErrorCode::ParseError);
    EXPECT_EQ(parsed.error().context().value(), "api.json");
}

TEST_F(JsonUtilsTest, WriteCreatesParentsAndReadsBack) {
    const auto path = temp_dir / "out" / "doc.json";
    json data = {{"schema_version", 1}, {"calls", {{"pkg.fn", 3}}}};

    ASSERT_TRUE(write_file(path, data).is_ok());

    auto loaded = read_file(path);
    ASSERT_TRUE(loaded.is_ok());
    EXPECT_EQ(loaded.value(), data);
}

TEST_F(JsonUtilsTest, ReadMissingFile) {
    auto loaded = read_file(temp_dir / "missing.json");
    ASSERT_TRUE(loaded.is_err());
    EXPECT_EQ(loaded.error().code(), ErrorCode::NotFound);
}

TEST_F(JsonUtilsTest, GetOr) {
    const json obj = {{"name", "fit"}, {"count", 4}, {"flag", nullptr}};

    EXPECT_EQ(get_or<std::string>(obj, "name", ""), "fit");
    EXPECT_EQ(get_or<int>(obj, "count", 0), 4);
    EXPECT_EQ(get_or<int>(obj, "missing", 7), 7);
    EXPECT_EQ(get_or<int>(obj, "name", 9), 9);
    EXPECT_EQ(get_or<bool>(obj, "flag", true), true);
    EXPECT_EQ(get_or<int>(json::array(), "count", 1), 1);
}

TEST_F(JsonUtilsTest, RequireString) {
    const json fn = {{"qname", "sklearn.svm.SVC.fit"}, {"kind", 3}};

    auto qname = require_string(fn, "qname", "no qname");
    ASSERT_TRUE(qname.is_ok());
    EXPECT_EQ(qname.value(), "sklearn.svm.SVC.fit");

    auto kind = require_string(fn, "kind", "kind must be a string", "sklearn.svm.SVC.fit");
    ASSERT_TRUE(kind.is_err());
    EXPECT_EQ(kind.error().code(), ErrorCode::ParseError);
    EXPECT_EQ(kind.error().message(), "kind must be a string");
    EXPECT_EQ(kind.error().context().value(), "sklearn.svm.SVC.fit");

    EXPECT_TRUE(require_string(json::array(), "qname", "no qname").is_err());
}
