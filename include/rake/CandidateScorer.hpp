#pragma once
#include "rake/CandidatePhrase.hpp"
#include "rake/CooccurrenceGraph.hpp"
#include <vector>

namespace kwe {

struct ScoredCandidate {
    CandidatePhrase phrase;
    double score = 0.0; // sum of degree/frequency over the phrase's words
};

// Unique candidates of at most max_keyword_size words, best first.
// Equal scores keep first-occurrence order.
std::vector<ScoredCandidate> score_candidates(
    const CooccurrenceGraph& graph,
    const std::vector<CandidatePhrase>& phrases,
    size_t max_keyword_size
);

// Keep the best floor(D/3) candidates, D = distinct words in the graph.
// With fewer than 3 distinct words nothing is dropped.
std::vector<ScoredCandidate> prune_candidates(
    const std::vector<ScoredCandidate>& scored,
    const CooccurrenceGraph& graph
);

size_t pruning_limit(const CooccurrenceGraph& graph);

}  // namespace kwe
