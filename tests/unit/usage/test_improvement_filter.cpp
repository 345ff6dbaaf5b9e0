//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/usage/improvement_filter.hpp"

#include <gtest/gtest.h>

namespace aua::usage
{
    namespace {
        ApiElement element(std::string name, const ElementKind kind) {
            ApiElement e;
            e.qualified_name = std::move(name);
            e.kind = kind;
            return e;
        }

        class ImprovementFilterTest : public ::testing::Test {
        protected:
            void SetUp() override {
                api_.set_metadata("pkg-dist", "pkg", "2.0");
                api_.add_element(element("pkg", ElementKind::Module));
                api_.add_element(element("pkg.A", ElementKind::Class));
                api_.add_element(element("pkg.A.__init__", ElementKind::Method));
                api_.add_element(element("pkg.A.run", ElementKind::Method));
                api_.add_element(element("pkg.B", ElementKind::Class));
                api_.add_element(element("pkg.B.__init__", ElementKind::Method));
                api_.add_element(element("pkg.f", ElementKind::Function));
                api_.add_element(element("pkg.g", ElementKind::Function));

                aggregate_.call_counts = {{"pkg.A.__init__", 3}, {"pkg.f", 1}, {"pkg.g", 5}};
                aggregate_.parameter_histograms["pkg.g"]["x"] = {
                    {ValueSignature::literal("1"), 4},
                    {ValueSignature::literal("2"), 1},
                };
            }

            api::ApiDescription api_;
            PartialAggregate aggregate_;
        };

        ApiElement with_mode_default(std::string name) {
            ApiElement e = element(std::move(name), ElementKind::Function);
            FormalParameter mode;
            mode.name = "mode";
            mode.has_default = true;
            mode.default_value = "'fast'";
            e.parameters.push_back(mode);
            return e;
        }

        std::uint64_t affected_at(const ImprovementReport& report, const std::uint64_t calls,
                                  const std::uint64_t parameters) {
            for (const auto& row : report.affected_files) {
                if (row.call_cutoff == calls && row.parameter_cutoff == parameters) {
                    return row.files;
                }
            }
            ADD_FAILURE() << "no row for " << calls << "/" << parameters;
            return 0;
        }
    }

    TEST_F(ImprovementFilterTest, FlagsCallablesBelowThreshold) {
        const auto report = build_improvement_report(aggregate_, &api_, {.threshold = 2});

        EXPECT_EQ(report.threshold, 2u);
        ASSERT_EQ(report.rarely_called.size(), 3u);
        EXPECT_EQ(report.rarely_called[0].qualified_name, "pkg.A.run");
        EXPECT_EQ(report.rarely_called[0].count, 0u);
        EXPECT_EQ(report.rarely_called[1].qualified_name, "pkg.B.__init__");
        EXPECT_EQ(report.rarely_called[2].qualified_name, "pkg.f");
        EXPECT_EQ(report.rarely_called[2].count, 1u);
    }

    TEST_F(ImprovementFilterTest, CountEqualToThresholdIsKept) {
        const auto report = build_improvement_report(aggregate_, &api_, {.threshold = 3});

        for (const auto& flagged : report.rarely_called) {
            EXPECT_NE(flagged.qualified_name, "pkg.A.__init__");
        }
    }

    TEST_F(ImprovementFilterTest, FlagsRareValues) {
        const auto report = build_improvement_report(aggregate_, &api_, {.threshold = 2});

        ASSERT_EQ(report.rare_values.size(), 1u);
        EXPECT_EQ(report.rare_values[0].qualified_name, "pkg.g");
        EXPECT_EQ(report.rare_values[0].parameter, "x");
        EXPECT_EQ(report.rare_values[0].value, ValueSignature::literal("2"));
        EXPECT_EQ(report.rare_values[0].count, 1u);
    }

    TEST_F(ImprovementFilterTest, ParameterSummaries) {
        const auto report = build_improvement_report(aggregate_, &api_);

        ASSERT_EQ(report.parameters.size(), 1u);
        EXPECT_EQ(report.parameters[0].most_common, ValueSignature::literal("1"));
        EXPECT_EQ(report.parameters[0].most_common_count, 4u);
        EXPECT_EQ(report.parameters[0].deviating, 1u);
    }

    TEST_F(ImprovementFilterTest, ClassUsage) {
        const auto report = build_improvement_report(aggregate_, &api_);

        EXPECT_EQ(report.used_classes, std::vector<std::string>{"pkg.A"});
        EXPECT_EQ(report.unused_classes, std::vector<std::string>{"pkg.B"});
    }

    TEST_F(ImprovementFilterTest, Distributions) {
        const auto report = build_improvement_report(aggregate_, &api_);

        EXPECT_EQ(report.constructors_called_at_most, (std::vector<std::uint64_t>{1, 1, 1, 2}));
        EXPECT_EQ(report.functions_called_at_most, (std::vector<std::uint64_t>{1, 2, 2, 2, 2, 3}));
        EXPECT_EQ(report.parameters_deviating_at_most, (std::vector<std::uint64_t>{0, 1}));
    }

    TEST_F(ImprovementFilterTest, WithoutApiOnlyAggregateElements) {
        const auto report = build_improvement_report(aggregate_, nullptr, {.threshold = 2});

        ASSERT_EQ(report.rarely_called.size(), 1u);
        EXPECT_EQ(report.rarely_called[0].qualified_name, "pkg.f");
        EXPECT_TRUE(report.used_classes.empty());
        EXPECT_TRUE(report.unused_classes.empty());
    }

    TEST_F(ImprovementFilterTest, ExplicitDeclaredDefaultCountsAsDefault) {
        api_.add_element(with_mode_default("pkg.h"));
        aggregate_.call_counts["pkg.h"] = 6;
        aggregate_.parameter_histograms["pkg.h"]["mode"] = {
            {ValueSignature::literal("'fast'"), 2},
            {ValueSignature::literal("'slow'"), 1},
            {ValueSignature::uses_default(), 3},
        };

        const auto report = build_improvement_report(aggregate_, &api_, {.threshold = 2});

        ASSERT_EQ(report.parameters.size(), 2u);
        const auto& mode = report.parameters[1];
        EXPECT_EQ(mode.qualified_name, "pkg.h");
        EXPECT_EQ(mode.most_common, ValueSignature::uses_default());
        EXPECT_EQ(mode.most_common_count, 5u);
        EXPECT_EQ(mode.deviating, 1u);
        for (const auto& flagged : report.rare_values) {
            EXPECT_NE(flagged.value, ValueSignature::literal("'fast'"));
        }

        const auto without_api = build_improvement_report(aggregate_, nullptr);
        EXPECT_EQ(without_api.parameters[1].most_common_count, 3u);
        EXPECT_EQ(without_api.parameters[1].deviating, 3u);
    }

    TEST_F(ImprovementFilterTest, NoAffectedFilesWithoutFileData) {
        EXPECT_TRUE(build_improvement_report(aggregate_, &api_).affected_files.empty());
    }

    TEST_F(ImprovementFilterTest, AffectedFilesByCutoff) {
        aggregate_.call_files = {
            {"pkg.A.__init__", {"d.py"}},
            {"pkg.f", {"a.py"}},
            {"pkg.g", {"a.py", "b.py", "c.py"}},
        };
        aggregate_.value_files["pkg.g"]["x"] = {
            {ValueSignature::literal("1"), {"b.py", "c.py"}},
            {ValueSignature::literal("2"), {"c.py"}},
        };

        const auto report = build_improvement_report(aggregate_, &api_, {.distribution_limit = 5});

        ASSERT_EQ(report.affected_files.size(), 21u);
        EXPECT_EQ(report.affected_files.front().call_cutoff, 0u);
        EXPECT_EQ(report.affected_files.front().parameter_cutoff, 0u);
        EXPECT_EQ(affected_at(report, 0, 0), 0u);
        EXPECT_EQ(affected_at(report, 0, 1), 1u);
        EXPECT_EQ(affected_at(report, 1, 1), 2u);
        EXPECT_EQ(affected_at(report, 2, 5), 2u);
        EXPECT_EQ(affected_at(report, 3, 3), 3u);
        EXPECT_EQ(affected_at(report, 5, 5), 4u);
    }

    TEST_F(ImprovementFilterTest, ExplicitDefaultFilesAreAffected) {
        api_.add_element(with_mode_default("pkg.h"));
        aggregate_.call_counts["pkg.h"] = 15;
        aggregate_.call_files["pkg.h"] = {"e.py", "f.py"};
        aggregate_.parameter_histograms["pkg.h"]["mode"] = {
            {ValueSignature::literal("'fast'"), 2},
            {ValueSignature::literal("'slow'"), 10},
            {ValueSignature::uses_default(), 3},
        };
        aggregate_.value_files["pkg.h"]["mode"] = {
            {ValueSignature::literal("'fast'"), {"e.py"}},
            {ValueSignature::literal("'slow'"), {"f.py"}},
        };

        const auto report = build_improvement_report(aggregate_, &api_, {.distribution_limit = 5});

        EXPECT_EQ(affected_at(report, 0, 4), 0u);
        EXPECT_EQ(affected_at(report, 0, 5), 1u);
        EXPECT_EQ(affected_at(report, 5, 5), 1u);
    }

    TEST(AtMostDistributionTest, LimitCapsLength) {
        const auto table = at_most_distribution({0, 50}, 10);

        ASSERT_EQ(table.size(), 11u);
        EXPECT_EQ(table.front(), 1u);
        EXPECT_EQ(table.back(), 1u);
        EXPECT_TRUE(at_most_distribution({}, 10).empty());
    }

    TEST(FoldDeclaredDefaultTest, MovesExplicitDefaultIntoDefaultBucket) {
        const Histogram histogram = {
            {ValueSignature::literal("None"), 2},
            {ValueSignature::literal("3"), 1},
        };

        const auto folded = fold_declared_default(histogram, ValueSignature::literal("None"));
        EXPECT_EQ(folded, (Histogram{{ValueSignature::literal("3"), 1}, {ValueSignature::uses_default(), 2}}));
        EXPECT_EQ(fold_declared_default(histogram, ValueSignature::literal("0")), histogram);
    }
}
