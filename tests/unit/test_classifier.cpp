#include <gtest/gtest.h>

#include <cmath>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

#include "classifier/DecisionTree.hpp"
#include "classifier/DefectClassifier.hpp"
#include "classifier/RandomForest.hpp"
#include "classifier/SyntheticCorpus.hpp"
#include "classifier/TfidfVectorizer.hpp"
#include "utils/Logger.hpp"

using namespace CodeRisk;
using namespace CodeRisk::Classifier;

namespace {

const std::string kCleanSnippet =
    "def calculate_sum(numbers: List[int]) -> int:\n"
    "    '''Calculate the sum of numbers.'''\n"
    "    if not numbers:\n"
    "        return 0\n"
    "    return sum(numbers)";

const std::string kDefectiveSnippet =
    "def process(x):\n"
    "    try:\n"
    "        result = eval(x)\n"
    "        exec(x)\n"
    "    except:\n"
    "        pass\n"
    "    return result";

double l2Norm(const FeatureRow &row) {
    double sum = 0.0;
    for (double v : row)
        sum += v * v;
    return std::sqrt(sum);
}

} // namespace

// ---------------------------------------------------------------------------
// TF-IDF
// ---------------------------------------------------------------------------

TEST(TfidfVectorizerTest, AnalyzeBuildsWordNgrams) {
    TfidfVectorizer vectorizer;

    const std::vector<std::string> expected = {
        "hello", "world", "foo", "hello world", "world foo", "hello world foo"};
    EXPECT_EQ(vectorizer.analyze("Hello, World foo"), expected);

    // Single-character tokens are dropped.
    EXPECT_EQ(vectorizer.analyze("a bb = c"), std::vector<std::string>{"bb"});
    EXPECT_TRUE(vectorizer.analyze("").empty());
}

TEST(TfidfVectorizerTest, VocabularyCapPrefersFrequentTermsThenAlphabetical) {
    TfidfVectorizer vectorizer(TfidfOptions{1, 1, 2});
    const auto rows = vectorizer.fitTransform({"aa aa bb", "bb cc", "cc dd"});

    const std::vector<std::string> features = {"aa", "bb"};
    EXPECT_EQ(vectorizer.features(), features);
    ASSERT_EQ(rows.size(), 3u);
    EXPECT_NEAR(l2Norm(rows[0]), 1.0, 1e-12);
    EXPECT_NEAR(l2Norm(rows[1]), 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(l2Norm(rows[2]), 0.0);
}

TEST(TfidfVectorizerTest, SmoothIdfWeights) {
    TfidfVectorizer vectorizer(TfidfOptions{1, 1, 500});
    const auto rows = vectorizer.fitTransform({"aa bb", "aa"});

    ASSERT_EQ(vectorizer.vocabularySize(), 2u);
    ASSERT_EQ(rows[0].size(), 2u);
    EXPECT_NEAR(rows[0][1] / rows[0][0], std::log(1.5) + 1.0, 1e-12);
    EXPECT_DOUBLE_EQ(rows[1][0], 1.0);
    EXPECT_DOUBLE_EQ(rows[1][1], 0.0);

    const auto unseen = vectorizer.transform("zz yy");
    EXPECT_DOUBLE_EQ(l2Norm(unseen), 0.0);
}

// ---------------------------------------------------------------------------
// Trees
// ---------------------------------------------------------------------------

TEST(DecisionTreeTest, SplitsAtMidpoint) {
    const Matrix rows = {{0.0}, {1.0}};
    const std::vector<int> labels = {0, 1};
    std::mt19937 rng(1);

    DecisionTree tree;
    EXPECT_DOUBLE_EQ(tree.predictProbability({0.0}), 0.5);

    tree.fit(rows, labels, {0, 1}, 1, rng);
    EXPECT_EQ(tree.nodeCount(), 3u);
    EXPECT_DOUBLE_EQ(tree.predictProbability({0.0}), 0.0);
    EXPECT_DOUBLE_EQ(tree.predictProbability({0.4}), 0.0);
    EXPECT_DOUBLE_EQ(tree.predictProbability({0.6}), 1.0);
    EXPECT_DOUBLE_EQ(tree.predictProbability({1.0}), 1.0);
}

TEST(DecisionTreeTest, RejectsInconsistentInput) {
    std::mt19937 rng(1);
    DecisionTree tree;

    EXPECT_THROW(tree.fit({{0.0}}, {0, 1}, {0}, 1, rng), std::invalid_argument);
    EXPECT_THROW(tree.fit({{0.0}}, {0}, {}, 1, rng), std::invalid_argument);
}

TEST(RandomForestTest, LearnsSeparableData) {
    Matrix rows;
    std::vector<int> labels;
    for (int i = 0; i < 10; ++i)
    {
        rows.push_back({i / 9.0, 0.5});
        labels.push_back(i >= 5 ? 1 : 0);
    }

    RandomForest forest(ForestOptions{25, 7});
    EXPECT_FALSE(forest.fitted());
    EXPECT_DOUBLE_EQ(forest.predictProbability({0.0, 0.5}), 0.5);

    forest.fit(rows, labels);
    EXPECT_TRUE(forest.fitted());
    EXPECT_EQ(forest.treeCount(), 25u);

    const double low  = forest.predictProbability({0.0, 0.5});
    const double high = forest.predictProbability({1.0, 0.5});
    EXPECT_LT(low, 0.5);
    EXPECT_GT(high, 0.5);

    RandomForest again(ForestOptions{25, 7});
    again.fit(rows, labels);
    EXPECT_DOUBLE_EQ(again.predictProbability({0.3, 0.5}), forest.predictProbability({0.3, 0.5}));
}

TEST(RandomForestTest, RejectsBadTrainingSets) {
    RandomForest forest;
    EXPECT_THROW(forest.fit({}, {}), std::invalid_argument);
    EXPECT_THROW(forest.fit({{1.0}}, {0, 1}), std::invalid_argument);
}

// ---------------------------------------------------------------------------
// Corpus
// ---------------------------------------------------------------------------

TEST(SyntheticCorpusTest, ExemplarsThenAlternatingSamples) {
    const auto corpus = SyntheticCorpus(42, 20).build();

    ASSERT_EQ(corpus.size(), 3u + 4u + 40u);
    for (std::size_t i = 0; i < 3; ++i)
        EXPECT_EQ(corpus[i].label, 0);
    for (std::size_t i = 3; i < 7; ++i)
        EXPECT_EQ(corpus[i].label, 1);
    for (std::size_t i = 7; i < corpus.size(); ++i)
        EXPECT_EQ(corpus[i].label, (i - 7) % 2 == 0 ? 0 : 1);

    EXPECT_EQ(corpus[0].code, kCleanSnippet);
    EXPECT_EQ(corpus[3].code, kDefectiveSnippet);

    for (const auto &sample : corpus)
        EXPECT_EQ(sample.code.find('{' + std::string("name}")), std::string::npos) << sample.code;
}

TEST(SyntheticCorpusTest, SameSeedSameCorpus) {
    const auto a = SyntheticCorpus(7, 5).build();
    const auto b = SyntheticCorpus(7, 5).build();

    ASSERT_EQ(a.size(), b.size());
    for (std::size_t i = 0; i < a.size(); ++i)
    {
        EXPECT_EQ(a[i].code, b[i].code);
        EXPECT_EQ(a[i].label, b[i].label);
    }
}

// ---------------------------------------------------------------------------
// Classifier
// ---------------------------------------------------------------------------

class DefectClassifierTest : public ::testing::Test {
protected:
    static void SetUpTestSuite() {
        Utils::getLogger().setLevel(Utils::LogLevel::ERROR);
        classifier = std::make_unique<DefectClassifier>();
    }

    static void TearDownTestSuite() {
        classifier.reset();
    }

    static std::unique_ptr<DefectClassifier> classifier;
};

std::unique_ptr<DefectClassifier> DefectClassifierTest::classifier;

TEST_F(DefectClassifierTest, TrainsOnSyntheticCorpus) {
    EXPECT_TRUE(classifier->isTrained());
    EXPECT_DOUBLE_EQ(classifier->confidence(), 0.8);
    EXPECT_GT(classifier->vocabularySize(), 0u);
    EXPECT_LE(classifier->vocabularySize(), 500u);
}

TEST_F(DefectClassifierTest, ProbabilitiesStayInUnitInterval) {
    const std::vector<std::string> snippets = {
        "", "x", kCleanSnippet, kDefectiveSnippet, "eval(input())", "\xC3\xA9\xC3\xA9 unicode text"};

    for (const auto &code : snippets)
    {
        const double p = classifier->classify(code);
        EXPECT_GE(p, 0.0) << code;
        EXPECT_LE(p, 1.0) << code;
    }
}

TEST_F(DefectClassifierTest, DefectiveExemplarScoresAboveCleanExemplar) {
    EXPECT_GT(classifier->classify(kDefectiveSnippet), classifier->classify(kCleanSnippet));
}

TEST_F(DefectClassifierTest, RepeatedCallsAgree) {
    EXPECT_DOUBLE_EQ(classifier->classify(kDefectiveSnippet), classifier->classify(kDefectiveSnippet));

    const double before = classifier->classify(kCleanSnippet);
    classifier->initialize();
    EXPECT_DOUBLE_EQ(classifier->classify(kCleanSnippet), before);
}

TEST(DefectClassifierStandaloneTest, SameSeedSameModel) {
    Utils::getLogger().setLevel(Utils::LogLevel::ERROR);

    ClassifierSettings settings;
    settings.nEstimators = 10;
    DefectClassifier a(settings);
    DefectClassifier b(settings);

    for (const std::string code : {"def f():\n    pass", "eval(x)", "return value"})
        EXPECT_DOUBLE_EQ(a.classify(code), b.classify(code)) << code;
}

TEST(DefectClassifierStandaloneTest, SingleClassCorpusIsUntrained) {
    Utils::getLogger().setLevel(Utils::LogLevel::ERROR);

    DefectClassifier classifier(ClassifierSettings{}, {{"def ok():\n    return 1", 0}, {"def fine():\n    return 2", 0}});
    EXPECT_FALSE(classifier.isTrained());
    EXPECT_DOUBLE_EQ(classifier.classify("eval(x)"), 0.5);
    EXPECT_DOUBLE_EQ(classifier.confidence(), 0.5);
}

TEST(DefectClassifierStandaloneTest, EmptyVocabularyIsUntrained) {
    Utils::getLogger().setLevel(Utils::LogLevel::ERROR);

    DefectClassifier classifier(ClassifierSettings{}, {{"a", 0}, {"b = c", 1}});
    EXPECT_FALSE(classifier.isTrained());
    EXPECT_EQ(classifier.vocabularySize(), 0u);
    EXPECT_DOUBLE_EQ(classifier.classify("anything at all"), 0.5);
}
