#pragma once
#include "rake/CandidateScorer.hpp"
#include "text/Segmenter.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kwe {

enum class Containment {
    TokenSequence, // phrase words appear consecutively inside one sentence
    RawSubstring   // phrase text appears in the lowercased raw text at word boundaries
};

struct DocumentFrequencyPolicy {
    bool include_target = false; // count the target as one more corpus document
    Containment containment = Containment::TokenSequence;
};

struct ComparatorOptions {
    DocumentFrequencyPolicy policy;
    size_t threads = 1;
};

struct WeightedCandidate {
    ScoredCandidate candidate;
    uint32_t term_frequency = 0;
    uint32_t document_frequency = 0;
    double weight = 0.0;
};

// TF-IDF re-weighting of a document's candidates against related documents:
//   weight = tf(phrase, target) * log(N / df(phrase))
// df is floored at 1. With an empty corpus the log factor is dropped and the
// weight is the plain term frequency.
class CorpusComparator {
public:
    CorpusComparator(std::shared_ptr<const Segmenter> segmenter, ComparatorOptions opts = {});

    std::vector<WeightedCandidate> weigh(
        const std::vector<ScoredCandidate>& candidates,
        const std::string& target,
        const std::vector<std::string>& corpus
    ) const;

    // documents containing each candidate at least once, in candidate order
    std::vector<uint32_t> document_frequencies(
        const std::vector<ScoredCandidate>& candidates,
        const std::vector<std::string>& corpus
    ) const;

    const ComparatorOptions& options() const { return m_opts; }

private:
    struct DocumentView {
        std::vector<std::vector<std::string>> sentences; // lowercased words per sentence
        std::string lowered;                             // raw text, ASCII-lowercased
    };

    std::shared_ptr<const Segmenter> m_segmenter;
    ComparatorOptions m_opts;

    DocumentView prepare(const std::string& text) const;
    uint32_t count_matches(const DocumentView& doc, const CandidatePhrase& phrase) const;

    std::vector<uint32_t> count_range(
        const std::vector<ScoredCandidate>& candidates,
        const std::vector<std::string>& corpus,
        size_t begin,
        size_t end
    ) const;
};

const char* containment_str(Containment c);
Containment parse_containment(const std::string& s);

}  // namespace kwe
