#pragma once
#include "rake/CandidatePhrase.hpp"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace kwe {

struct WordStats {
    uint32_t frequency = 0; // occurrences across all candidate phrases
    uint32_t degree = 0;    // sum of lengths of the phrases the word occurs in
};

// Word co-occurrence inside candidate phrases. Every ordered pair of word
// positions within one phrase adds 1, self pairs included, so a row always
// sums to the word degree. The diagonal equals the word frequency unless a
// word repeats inside a phrase: "new york new york" adds 4 to (new, new).
class CooccurrenceGraph {
public:
    static CooccurrenceGraph build(const std::vector<CandidatePhrase>& phrases);

    uint32_t frequency(const std::string& word) const;
    uint32_t degree(const std::string& word) const;
    double word_score(const std::string& word) const; // degree / frequency, 0 if unknown
    uint32_t cooccurrence(const std::string& a, const std::string& b) const;

    bool contains(const std::string& word) const { return m_stats.count(word) != 0; }
    size_t distinct_words() const { return m_stats.size(); }
    bool empty() const { return m_stats.empty(); }

    std::vector<std::string> words() const; // sorted
    const std::unordered_map<std::string, WordStats>& stats() const { return m_stats; }

private:
    std::unordered_map<std::string, WordStats> m_stats;
    std::unordered_map<std::string, std::unordered_map<std::string, uint32_t>> m_matrix;
};

}  // namespace kwe
