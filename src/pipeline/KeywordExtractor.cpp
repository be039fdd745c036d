#include "pipeline/KeywordExtractor.hpp"
#include "pipeline/Errors.hpp"

#include <algorithm>

namespace kwe {

static void validate(int max_keyword_size, int limit) {
    if (max_keyword_size < 1) {
        throw InvalidConfiguration("max_keyword_size must be >= 1 (got " + std::to_string(max_keyword_size) + ")");
    }
    if (limit < 1) {
        throw InvalidConfiguration("limit must be >= 1 (got " + std::to_string(limit) + ")");
    }
}

static RankedKeyword to_ranked(const WeightedCandidate& wc) {
    RankedKeyword k;
    k.text = wc.candidate.phrase.surface();
    k.normalized = wc.candidate.phrase.normalized();
    k.rake_score = wc.candidate.score;
    k.term_frequency = wc.term_frequency;
    k.document_frequency = wc.document_frequency;
    k.score = wc.weight;
    k.first_occurrence = wc.candidate.phrase.ordinal();
    return k;
}

KeywordExtractor::KeywordExtractor(StopwordSet stopwords, ExtractorOptions opts)
    : KeywordExtractor(std::make_shared<RuleSegmenter>(std::move(stopwords), opts.segmenter), opts) {}

KeywordExtractor::KeywordExtractor(std::shared_ptr<const Segmenter> segmenter, ExtractorOptions opts)
    : m_segmenter(std::move(segmenter)),
      m_opts(opts),
      m_comparator(m_segmenter, opts.comparator) {}

Extraction KeywordExtractor::analyze(
    const std::string& target,
    const std::vector<std::string>& corpus,
    int max_keyword_size,
    int limit
) const {
    validate(max_keyword_size, limit);

    Extraction ex;
    ex.candidates = m_segmenter->segment(target, (size_t)max_keyword_size);
    ex.graph = CooccurrenceGraph::build(ex.candidates);
    ex.scored = score_candidates(ex.graph, ex.candidates, (size_t)max_keyword_size);
    ex.pruned = prune_candidates(ex.scored, ex.graph);

    if (ex.pruned.empty()) return ex;

    const auto weighted = m_comparator.weigh(ex.pruned, target, corpus);

    ex.keywords.reserve(weighted.size());
    for (const auto& wc : weighted) ex.keywords.push_back(to_ranked(wc));

    std::stable_sort(ex.keywords.begin(), ex.keywords.end(),
                     [](const RankedKeyword& a, const RankedKeyword& b) {
                         if (a.score != b.score) return a.score > b.score;
                         if (a.rake_score != b.rake_score) return a.rake_score > b.rake_score;
                         return a.first_occurrence < b.first_occurrence;
                     });

    if (ex.keywords.size() > (size_t)limit) ex.keywords.resize((size_t)limit);
    return ex;
}

std::vector<RankedKeyword> KeywordExtractor::extract(
    const std::string& target,
    const std::vector<std::string>& corpus,
    int max_keyword_size,
    int limit
) const {
    return analyze(target, corpus, max_keyword_size, limit).keywords;
}

std::vector<ScoredCandidate> KeywordExtractor::extract_rake(const std::string& target, int max_keyword_size) const {
    validate(max_keyword_size, 1);

    const auto candidates = m_segmenter->segment(target, (size_t)max_keyword_size);
    const auto graph = CooccurrenceGraph::build(candidates);
    return prune_candidates(score_candidates(graph, candidates, (size_t)max_keyword_size), graph);
}

}  // namespace kwe
