//
// Created by gregorian-rayne on 10/19/26.
//

#include "aua/aua.hpp"
#include "aua/utils/file_utils.hpp"

#include <gtest/gtest.h>

#include <filesystem>

using namespace aua;
namespace fs = std::filesystem;

namespace {
    constexpr const char* kApiDocument = R"({
            "distribution": "scikit-learn",
            "package": "sklearn",
            "version": "1.5.0",
            "modules": ["sklearn", "sklearn.cluster", "sklearn.linear_model"],
            "classes": ["sklearn.cluster.KMeans", "sklearn.linear_model.Ridge", "sklearn.linear_model.Lasso"],
            "functions": [
                {"qname": "sklearn.cluster.KMeans.__init__",
                 "parameters": [{"name": "self"}, {"name": "n_clusters", "default_value": "8"},
                                {"name": "init", "kind": "keyword_only", "default_value": "'k-means++'"}]},
                {"qname": "sklearn.cluster.KMeans.fit",
                 "parameters": [{"name": "self"}, {"name": "X"}]},
                {"qname": "sklearn.linear_model.Ridge.__init__",
                 "parameters": [{"name": "self"}, {"name": "alpha", "default_value": "1.0"}]},
                {"qname": "sklearn.linear_model.Lasso.__init__",
                 "parameters": [{"name": "self"}, {"name": "alpha", "default_value": "1.0"}]},
                {"qname": "sklearn.cluster.k_means", "kind": "function",
                 "parameters": [{"name": "X"}, {"name": "n_clusters"}]}
            ],
            "aliases": {"sklearn.KMeans": "sklearn.cluster.KMeans"}
        })";
}

class PipelineTest : public ::testing::Test {
protected:
    void SetUp() override {
        temp_dir_ = fs::temp_directory_path() / "aua_pipeline_test";
        fs::remove_all(temp_dir_);
        fs::create_directories(temp_dir_ / "corpus");

        write("api.json", kApiDocument);
        write("corpus/project/cluster.py",
              "from sklearn.cluster import KMeans\n"
              "import sklearn.linear_model as lm\n"
              "\n"
              "model = KMeans(3)\n"
              "model2 = KMeans(n_clusters=3, init='random')\n"
              "ridge = lm.Ridge(alpha=0.5)\n");
        write("corpus/project/alias.py",
              "import sklearn\n"
              "km = sklearn.KMeans()\n"
              "sklearn.cluster.k_means(data, 3)\n");
        write("corpus/project/broken.py",
              "import sklearn\n"
              "def f(:\n");
        write("corpus/project/other.py", "print('no library here')\n");
        write("corpus/vendor/copied.py", "import sklearn\nsklearn.cluster.k_means(x, 2)\n");
    }

    void TearDown() override {
        fs::remove_all(temp_dir_);
    }

    void write(const std::string& relative, const std::string& content) const {
        const auto path = temp_dir_ / relative;
        fs::create_directories(path.parent_path());
        ASSERT_TRUE(file_utils::write_file(path, content).is_ok());
    }

    std::vector<SourceFile> walk() const {
        corpus::WalkOptions options;
        options.root = temp_dir_ / "corpus";
        options.exclusions.add("vendor/");
        auto files = corpus::walk_corpus(options);
        EXPECT_TRUE(files.is_ok());
        return files.is_ok() ? std::move(files).value() : std::vector<SourceFile>{};
    }

    engine::EngineResult run(const api::ApiDescription& api, storage::CheckpointStore* store) const {
        engine::EngineOptions options;
        options.num_threads = 2;
        engine::UsageEngine engine(api, store, options);
        auto result = engine.run(walk());
        EXPECT_TRUE(result.is_ok());
        return result.is_ok() ? std::move(result).value() : engine::EngineResult{};
    }

    fs::path temp_dir_;
};

TEST_F(PipelineTest, ExtractsUsagesFromCorpus) {
    const auto api = api::ApiDescription::load(temp_dir_ / "api.json");
    ASSERT_TRUE(api.is_ok());

    const auto files = walk();
    ASSERT_EQ(files.size(), 4u);

    const auto result = run(api.value(), nullptr);
    const auto& aggregate = result.aggregate;

    EXPECT_EQ(aggregate.call_counts.at("sklearn.cluster.KMeans.__init__"), 3u);
    EXPECT_EQ(aggregate.call_counts.at("sklearn.linear_model.Ridge.__init__"), 1u);
    EXPECT_EQ(aggregate.call_counts.at("sklearn.cluster.k_means"), 1u);
    EXPECT_FALSE(aggregate.call_counts.contains("sklearn.linear_model.Lasso.__init__"));

    const auto& n_clusters = aggregate.parameter_histograms.at("sklearn.cluster.KMeans.__init__").at("n_clusters");
    EXPECT_EQ(n_clusters.at(ValueSignature::literal("3")), 2u);
    EXPECT_EQ(n_clusters.at(ValueSignature::uses_default()), 1u);

    const auto& init = aggregate.parameter_histograms.at("sklearn.cluster.KMeans.__init__").at("init");
    EXPECT_EQ(init.at(ValueSignature::literal("'random'")), 1u);
    EXPECT_EQ(init.at(ValueSignature::uses_default()), 2u);

    EXPECT_EQ(result.summary.analyzed, 2u);
    EXPECT_EQ(result.summary.parse_failures, 1u);
    EXPECT_EQ(result.summary.irrelevant, 1u);
}

TEST_F(PipelineTest, ResumedRunMatchesFreshRun) {
    const auto api = api::ApiDescription::load(temp_dir_ / "api.json");
    ASSERT_TRUE(api.is_ok());

    storage::CheckpointOptions options;
    options.directory = temp_dir_ / "tmp";

    storage::CheckpointStore store(options);
    ASSERT_TRUE(store.open().is_ok());
    const auto first = run(api.value(), &store);

    storage::CheckpointStore reopened(options);
    ASSERT_TRUE(reopened.open().is_ok());
    const auto second = run(api.value(), &reopened);

    EXPECT_EQ(second.summary.resumed, 4u);
    EXPECT_EQ(second.aggregate, first.aggregate);
}

TEST_F(PipelineTest, DocumentsMergeAndFeedTheReport) {
    const auto api = api::ApiDescription::load(temp_dir_ / "api.json");
    ASSERT_TRUE(api.is_ok());
    const auto result = run(api.value(), nullptr);

    export_json::UsagesDocument document;
    document.metadata = {api.value().distribution(), api.value().package(), api.value().version()};
    document.aggregate = result.aggregate;
    document.summary = export_json::summary_to_json(result.summary);

    const auto path = temp_dir_ / "out" / export_json::usages_file_name(document.metadata);
    fs::create_directories(path.parent_path());
    ASSERT_TRUE(export_json::write_usages(path, document).is_ok());
    EXPECT_EQ(path.filename().string(), "scikit-learn__sklearn__1.5.0__usages.json");

    const auto read = export_json::read_usages(path);
    ASSERT_TRUE(read.is_ok());

    // Two batches of the same document merge to doubled counts.
    const auto merged = usage::merge_all({read.value().aggregate, read.value().aggregate});
    EXPECT_EQ(merged.call_counts.at("sklearn.cluster.KMeans.__init__"), 6u);

    const auto report = usage::build_improvement_report(merged, &api.value(), {.threshold = 3});
    std::vector<std::string> rare;
    for (const auto& flagged : report.rarely_called) {
        rare.push_back(flagged.qualified_name);
    }
    EXPECT_EQ(rare, (std::vector<std::string>{
        "sklearn.cluster.KMeans.fit",
        "sklearn.cluster.k_means",
        "sklearn.linear_model.Lasso.__init__",
        "sklearn.linear_model.Ridge.__init__",
    }));
    EXPECT_EQ(report.unused_classes, std::vector<std::string>{"sklearn.linear_model.Lasso"});
}
