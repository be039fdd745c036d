#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "corpus/CorpusComparator.hpp"
#include "rake/CandidateScorer.hpp"
#include "rake/CooccurrenceGraph.hpp"
#include "text/Segmenter.hpp"
#include "text/StopwordSet.hpp"

namespace kwe {

struct ExtractorOptions {
    SegmenterOptions segmenter;
    ComparatorOptions comparator;
};

struct RankedKeyword {
    std::string text;        // surface form of the first occurrence
    std::string normalized;  // lowercased words joined by single spaces

    double rake_score = 0.0;
    uint32_t term_frequency = 0;
    uint32_t document_frequency = 0;

    // final weight, tf * log(N / df)
    double score = 0.0;

    size_t first_occurrence = 0;
};

// Every intermediate product of one run, mostly for reports and tests.
struct Extraction {
    std::vector<CandidatePhrase> candidates;
    CooccurrenceGraph graph;
    std::vector<ScoredCandidate> scored;  // unique, unpruned, best first
    std::vector<ScoredCandidate> pruned;
    std::vector<RankedKeyword> keywords;
};

class KeywordExtractor {
public:
    explicit KeywordExtractor(StopwordSet stopwords, ExtractorOptions opts = {});
    KeywordExtractor(std::shared_ptr<const Segmenter> segmenter, ExtractorOptions opts = {});

    // Ranked keywords of `target` against `corpus`, at most `limit` of them.
    // Throws InvalidConfiguration when max_keyword_size or limit is below 1.
    std::vector<RankedKeyword> extract(
        const std::string& target,
        const std::vector<std::string>& corpus,
        int max_keyword_size,
        int limit
    ) const;

    // intra-document ranking only (graph scores after pruning)
    std::vector<ScoredCandidate> extract_rake(const std::string& target, int max_keyword_size) const;

    Extraction analyze(
        const std::string& target,
        const std::vector<std::string>& corpus,
        int max_keyword_size,
        int limit
    ) const;

    const Segmenter& segmenter() const { return *m_segmenter; }
    const ExtractorOptions& options() const { return m_opts; }

private:
    std::shared_ptr<const Segmenter> m_segmenter;
    ExtractorOptions m_opts;
    CorpusComparator m_comparator;
};

}  // namespace kwe
