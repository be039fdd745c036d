#include "rake/CandidateScorer.hpp"
#include <algorithm>
#include <unordered_set>

namespace kwe {

static double phrase_score(const CooccurrenceGraph& graph, const CandidatePhrase& p) {
    double s = 0.0;
    for (const auto& w : p.words()) s += graph.word_score(w);
    return s;
}

std::vector<ScoredCandidate> score_candidates(
    const CooccurrenceGraph& graph,
    const std::vector<CandidatePhrase>& phrases,
    size_t max_keyword_size
) {
    std::vector<ScoredCandidate> out;
    std::unordered_set<std::string> seen;
    seen.reserve(phrases.size() * 2 + 8);

    for (const auto& p : phrases) {
        // oversized runs feed the graph but are never keywords
        if (p.size() > max_keyword_size) continue;
        if (!seen.insert(p.normalized()).second) continue;

        out.push_back(ScoredCandidate{p, phrase_score(graph, p)});
    }

    std::stable_sort(out.begin(), out.end(),
                     [](const ScoredCandidate& a, const ScoredCandidate& b) {
                         if (a.score != b.score) return a.score > b.score;
                         return a.phrase.ordinal() < b.phrase.ordinal();
                     });
    return out;
}

size_t pruning_limit(const CooccurrenceGraph& graph) {
    return graph.distinct_words() / 3;
}

std::vector<ScoredCandidate> prune_candidates(
    const std::vector<ScoredCandidate>& scored,
    const CooccurrenceGraph& graph
) {
    const size_t n = pruning_limit(graph);
    if (n == 0) return scored;

    std::vector<ScoredCandidate> out(scored.begin(), scored.begin() + std::min(n, scored.size()));
    return out;
}

}  // namespace kwe
