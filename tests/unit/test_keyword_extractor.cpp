#include <gtest/gtest.h>
#include "pipeline/Errors.hpp"
#include "pipeline/KeywordExtractor.hpp"

#include <algorithm>
#include <cmath>
#include <memory>

using namespace kwe;

class KeywordExtractorTest : public ::testing::Test {
protected:
    // 9 distinct words -> three candidates survive pruning
    const std::string energy =
        "Solar panels and wind turbines. The storage of energy is hard. Batteries are expensive.";

    KeywordExtractor extractor{StopwordSet::from_words({"and", "the", "of", "is", "are"})};
};

// ==========================================
// Configuration errors
// ==========================================

TEST_F(KeywordExtractorTest, RejectsNonPositiveSizes) {
    EXPECT_THROW(extractor.extract(energy, {}, 0, 10), InvalidConfiguration);
    EXPECT_THROW(extractor.extract(energy, {}, 3, 0), InvalidConfiguration);
    EXPECT_THROW(extractor.extract(energy, {}, -1, 10), InvalidConfiguration);
    EXPECT_THROW(extractor.extract("", {}, 3, -5), InvalidConfiguration);
    EXPECT_THROW(extractor.extract_rake(energy, 0), InvalidConfiguration);
}

TEST_F(KeywordExtractorTest, InvalidConfigurationIsAnInvalidArgument) {
    try {
        extractor.extract(energy, {}, 3, 0);
        FAIL() << "expected InvalidConfiguration";
    } catch (const std::invalid_argument& e) {
        EXPECT_NE(std::string(e.what()).find("limit"), std::string::npos);
    }
}

// ==========================================
// Degenerate inputs
// ==========================================

TEST_F(KeywordExtractorTest, EmptyTargetGivesEmptyResult) {
    EXPECT_TRUE(extractor.extract("", {"Some corpus text.", "More text."}, 3, 10).empty());
    EXPECT_TRUE(extractor.extract("  \n\t ", {"Some corpus text."}, 3, 10).empty());
}

TEST_F(KeywordExtractorTest, OnlyStopwordsGivesEmptyResult) {
    EXPECT_TRUE(extractor.extract("The and of is are.", {}, 3, 10).empty());
}

TEST_F(KeywordExtractorTest, LimitLargerThanCandidates) {
    auto kws = extractor.extract(energy, {}, 3, 50);
    ASSERT_EQ(kws.size(), 3u);
}

TEST_F(KeywordExtractorTest, LimitTruncates) {
    EXPECT_EQ(extractor.extract(energy, {}, 3, 2).size(), 2u);
    EXPECT_EQ(extractor.extract(energy, {}, 3, 1).size(), 1u);
}

// ==========================================
// Ranking
// ==========================================

TEST_F(KeywordExtractorTest, EmptyCorpusRanksByRakeThenPosition) {
    auto kws = extractor.extract(energy, {}, 3, 10);
    ASSERT_EQ(kws.size(), 3u);

    EXPECT_EQ(kws[0].text, "Solar panels");
    EXPECT_EQ(kws[1].text, "wind turbines");
    EXPECT_EQ(kws[2].text, "storage");

    EXPECT_DOUBLE_EQ(kws[0].score, 1.0);
    EXPECT_DOUBLE_EQ(kws[0].rake_score, 4.0);
    EXPECT_EQ(kws[0].normalized, "solar panels");
    EXPECT_EQ(kws[0].term_frequency, 1u);
}

TEST_F(KeywordExtractorTest, CorpusDemotesSharedPhrases) {
    auto kws = extractor.extract(energy, {"Solar panels are everywhere.", "Solar panels again."}, 3, 10);
    ASSERT_EQ(kws.size(), 3u);

    EXPECT_EQ(kws[0].normalized, "wind turbines");
    EXPECT_NEAR(kws[0].score, std::log(2.0), 1e-12);
    EXPECT_EQ(kws[1].normalized, "storage");
    EXPECT_NEAR(kws[1].score, std::log(2.0), 1e-12);
    EXPECT_EQ(kws[2].normalized, "solar panels");
    EXPECT_NEAR(kws[2].score, 0.0, 1e-12);
    EXPECT_EQ(kws[2].document_frequency, 2u);
}

TEST_F(KeywordExtractorTest, ScenarioFromDocumentation) {
    KeywordExtractor ex(StopwordSet::from_words({"can", "be", "done", "is"}));
    const std::string doc = "Fast keyword extraction can be done quickly. Keyword extraction is useful.";

    Extraction run = ex.analyze(doc, {}, 3, 10);

    std::vector<std::string> candidates;
    for (const auto& c : run.candidates) candidates.push_back(c.normalized());
    std::vector<std::string> expected = {"fast keyword extraction", "quickly", "keyword extraction", "useful"};
    EXPECT_EQ(candidates, expected);

    ASSERT_EQ(run.scored.size(), 4u);
    EXPECT_EQ(run.scored[1].phrase.normalized(), "keyword extraction");
    EXPECT_GT(run.scored[1].score, run.scored[2].score);

    ASSERT_EQ(run.keywords.size(), 1u);
    EXPECT_EQ(run.keywords[0].text, "Fast keyword extraction");
    EXPECT_DOUBLE_EQ(run.keywords[0].rake_score, 8.0);
}

TEST_F(KeywordExtractorTest, ExtractIsDeterministic) {
    const std::vector<std::string> corpus = {"Wind turbines spin.", "Storage is cheap now.", energy};
    auto a = extractor.extract(energy, corpus, 3, 10);
    auto b = extractor.extract(energy, corpus, 3, 10);

    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].text, b[i].text);
        EXPECT_EQ(a[i].score, b[i].score);
        EXPECT_EQ(a[i].rake_score, b[i].rake_score);
    }
}

TEST_F(KeywordExtractorTest, ThreadsDoNotChangeRanking) {
    std::vector<std::string> corpus;
    for (int i = 0; i < 9; ++i) {
        corpus.push_back(i % 3 == 0 ? "Wind turbines spin." : "Batteries are expensive, storage too.");
    }

    ExtractorOptions opts;
    opts.comparator.threads = 4;
    KeywordExtractor parallel(StopwordSet::from_words({"and", "the", "of", "is", "are"}), opts);

    auto a = extractor.extract(energy, corpus, 3, 10);
    auto b = parallel.extract(energy, corpus, 3, 10);
    ASSERT_EQ(a.size(), b.size());
    for (size_t i = 0; i < a.size(); ++i) {
        EXPECT_EQ(a[i].normalized, b[i].normalized);
        EXPECT_EQ(a[i].score, b[i].score);
        EXPECT_EQ(a[i].document_frequency, b[i].document_frequency);
    }
}

TEST_F(KeywordExtractorTest, RakeOnlyRanking) {
    auto ranked = extractor.extract_rake(energy, 3);
    ASSERT_EQ(ranked.size(), 3u);
    EXPECT_EQ(ranked[0].phrase.normalized(), "solar panels");
    EXPECT_EQ(ranked[1].phrase.normalized(), "wind turbines");
}

TEST_F(KeywordExtractorTest, MaxKeywordSizeDropsLongRuns) {
    // "solar panels" and "wind turbines" need two words
    auto kws = extractor.extract(energy, {}, 1, 10);
    for (const auto& k : kws) {
        EXPECT_EQ(k.normalized.find(' '), std::string::npos) << k.normalized;
    }
}

TEST(KeywordExtractorWindowTest, WindowsNeverExceedMaxKeywordSize) {
    ExtractorOptions opts;
    opts.segmenter.mode = CandidateMode::Window;
    opts.segmenter.window_size = 3;
    KeywordExtractor ex(StopwordSet::from_words({"the"}), opts);

    Extraction run = ex.analyze("The substance consumed daily hospital.", {}, 2, 10);
    // substance consumed, consumed daily, daily hospital
    ASSERT_EQ(run.candidates.size(), 3u);
    ASSERT_FALSE(run.keywords.empty());
    EXPECT_EQ(run.keywords[0].normalized, "substance consumed");
    for (const auto& k : run.keywords) {
        EXPECT_LE(std::count(k.normalized.begin(), k.normalized.end(), ' '), 1) << k.normalized;
    }
    EXPECT_FALSE(ex.extract_rake("The substance consumed daily hospital.", 2).empty());
}

TEST(KeywordExtractorInjectionTest, AcceptsCustomSegmenter) {
    SegmenterOptions sopts;
    sopts.mode = CandidateMode::Flexible;
    sopts.window_size = 2;
    auto seg = std::make_shared<RuleSegmenter>(StopwordSet::from_words({"the"}), sopts);

    KeywordExtractor ex(seg);
    Extraction run = ex.analyze("The substance consumed daily.", {}, 3, 10);
    // substance, consumed, daily, substance consumed, consumed daily
    EXPECT_EQ(run.candidates.size(), 5u);
    EXPECT_EQ(&ex.segmenter(), seg.get());
}
