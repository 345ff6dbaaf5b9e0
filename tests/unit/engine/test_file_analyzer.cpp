//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/engine/file_analyzer.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <chrono>

using namespace aua;
using namespace aua::engine;

namespace {
    api::ApiDescription demo_api() {
        auto api = api::ApiDescription::from_json(nlohmann::json::parse(R"({
            "package": "demo",
            "modules": ["demo"],
            "functions": [
                {"qname": "demo.fn", "kind": "function",
                 "parameters": [{"name": "a"}, {"name": "x", "default_value": "None"}]}
            ]
        })"));
        EXPECT_TRUE(api.is_ok());
        return std::move(api).value();
    }
}

class FileAnalyzerTest : public ::testing::Test {
protected:
    api::ApiDescription api_ = demo_api();
};

TEST_F(FileAnalyzerTest, AnalyzesCalls) {
    const FileAnalyzer analyzer(api_, {}, true, {});
    const auto result = analyzer.analyze("a.py", "import demo\ndemo.fn(1)\ndemo.fn(2, x=3)\nprint(4)\n");

    EXPECT_EQ(result.outcome, FileOutcome::Analyzed);
    EXPECT_FALSE(result.error.has_value());
    EXPECT_EQ(result.aggregate.call_counts.at("demo.fn"), 2u);
    EXPECT_EQ(result.aggregate.unresolved_calls, 1u);

    const auto& x = result.aggregate.parameter_histograms.at("demo.fn").at("x");
    EXPECT_EQ(x.at(ValueSignature::uses_default()), 1u);
    EXPECT_EQ(x.at(ValueSignature::literal("3")), 1u);

    EXPECT_EQ(result.aggregate.call_files.at("demo.fn"), usage::FileSet{"a.py"});
    const auto& x_files = result.aggregate.value_files.at("demo.fn").at("x");
    EXPECT_EQ(x_files.at(ValueSignature::literal("3")), usage::FileSet{"a.py"});
    EXPECT_FALSE(x_files.contains(ValueSignature::uses_default()));
}

TEST_F(FileAnalyzerTest, RelevanceFilter) {
    const FileAnalyzer filtered(api_, {}, true, {});
    EXPECT_FALSE(filtered.is_relevant("print('hello')\n"));
    EXPECT_TRUE(filtered.is_relevant("import demo\n"));

    const auto skipped = filtered.analyze("b.py", "print('hello')\n");
    EXPECT_EQ(skipped.outcome, FileOutcome::Irrelevant);
    EXPECT_TRUE(skipped.aggregate.empty());

    const FileAnalyzer unfiltered(api_, {}, false, {});
    const auto analyzed = unfiltered.analyze("b.py", "print('hello')\n");
    EXPECT_EQ(analyzed.outcome, FileOutcome::Analyzed);
    EXPECT_EQ(analyzed.aggregate.unresolved_calls, 1u);
}

TEST_F(FileAnalyzerTest, ExtraPackagesMakeFilesRelevant) {
    const FileAnalyzer analyzer(api_, {"legacy_demo_name"}, true, {});
    EXPECT_TRUE(analyzer.is_relevant("import legacy_demo_name\n"));
    EXPECT_FALSE(analyzer.is_relevant("import numpy\n"));
}

TEST_F(FileAnalyzerTest, SyntaxErrorCarriesLocation) {
    const FileAnalyzer analyzer(api_, {}, true, {});
    const auto result = analyzer.analyze("pkg/bad.py", "import demo\nx = = 1\n");

    EXPECT_EQ(result.outcome, FileOutcome::SyntaxError);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->code(), ErrorCode::ParseError);
    ASSERT_TRUE(result.error->context().has_value());
    EXPECT_EQ(result.error->context()->rfind("pkg/bad.py:2:", 0), 0u);
    EXPECT_TRUE(result.aggregate.empty());
}

TEST_F(FileAnalyzerTest, OversizedFileIsRejected) {
    AnalysisLimits limits;
    limits.max_file_bytes = 16;
    const FileAnalyzer analyzer(api_, {}, true, limits);

    const auto result = analyzer.analyze("big.py", "import demo\ndemo.fn(1)\ndemo.fn(2)\n");
    EXPECT_EQ(result.outcome, FileOutcome::SyntaxError);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_NE(result.error->message().find("exceeds"), std::string::npos);
}

TEST_F(FileAnalyzerTest, NestingLimitIsSyntaxError) {
    AnalysisLimits limits;
    limits.max_nesting_depth = 20;
    const FileAnalyzer analyzer(api_, {}, true, limits);

    const std::string deep = "import demo\nx = " + std::string(60, '(') + "1" + std::string(60, ')') + "\n";
    EXPECT_EQ(analyzer.analyze("deep.py", deep).outcome, FileOutcome::SyntaxError);
}

TEST_F(FileAnalyzerTest, WildcardCollisionCountsOnlyAsUnresolved) {
    auto api = api::ApiDescription::from_json(nlohmann::json::parse(R"({
        "package": "demo",
        "modules": ["demo", "demo.a", "demo.b"],
        "functions": [
            {"qname": "demo.a.helper", "parameters": []},
            {"qname": "demo.b.helper", "parameters": []}
        ]
    })"));
    ASSERT_TRUE(api.is_ok());

    const FileAnalyzer analyzer(api.value(), {}, true, {});
    const auto result = analyzer.analyze("star.py", "from demo import *\nhelper()\n");

    EXPECT_EQ(result.outcome, FileOutcome::Analyzed);
    EXPECT_TRUE(result.aggregate.call_counts.empty());
    EXPECT_TRUE(result.aggregate.parameter_histograms.empty());
    EXPECT_EQ(result.aggregate.unresolved_calls, 1u);
    EXPECT_EQ(result.aggregate.unresolved_by_reason.at("ambiguous"), 1u);
}

namespace {
    // Many live imports and many branches: each branch must not copy the
    // alias table.
    std::string branchy_source() {
        std::string source;
        for (int i = 0; i < 3000; ++i) {
            source += "import pkg as a" + std::to_string(i) + "\n";
        }
        source += "import demo\n";
        for (int i = 0; i < 20000; ++i) {
            source += "if x:\n    pass\n";
        }
        source += "demo.fn(1)\n";
        return source;
    }
}

TEST_F(FileAnalyzerTest, ManyBranchesWithManyImports) {
    const FileAnalyzer analyzer(api_, {}, true, {});
    const auto result = analyzer.analyze("branchy.py", branchy_source());

    ASSERT_EQ(result.outcome, FileOutcome::Analyzed);
    EXPECT_EQ(result.aggregate.call_counts.at("demo.fn"), 1u);
}

TEST_F(FileAnalyzerTest, DeadlineIsSyntaxError) {
    AnalysisLimits limits;
    limits.file_timeout = std::chrono::milliseconds(1);
    const FileAnalyzer analyzer(api_, {}, true, limits);

    const auto started = std::chrono::steady_clock::now();
    const auto result = analyzer.analyze("slow.py", branchy_source());
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(result.outcome, FileOutcome::SyntaxError);
    ASSERT_TRUE(result.error.has_value());
    EXPECT_EQ(result.error->message(), "processing deadline exceeded");
    EXPECT_EQ(result.error->context()->rfind("slow.py:", 0), 0u);
    EXPECT_LT(elapsed, std::chrono::seconds(10));
}
