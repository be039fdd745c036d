#include "rake/CooccurrenceGraph.hpp"
#include <algorithm>

namespace kwe {

CooccurrenceGraph CooccurrenceGraph::build(const std::vector<CandidatePhrase>& phrases) {
    CooccurrenceGraph g;

    for (const auto& p : phrases) {
        const auto& words = p.words();
        const uint32_t len = (uint32_t)words.size();

        for (const auto& w1 : words) {
            WordStats& st = g.m_stats[w1];
            st.frequency += 1;
            st.degree += len;

            auto& row = g.m_matrix[w1];
            for (const auto& w2 : words) row[w2] += 1;
        }
    }

    return g;
}

uint32_t CooccurrenceGraph::frequency(const std::string& word) const {
    auto it = m_stats.find(word);
    return it == m_stats.end() ? 0 : it->second.frequency;
}

uint32_t CooccurrenceGraph::degree(const std::string& word) const {
    auto it = m_stats.find(word);
    return it == m_stats.end() ? 0 : it->second.degree;
}

double CooccurrenceGraph::word_score(const std::string& word) const {
    auto it = m_stats.find(word);
    if (it == m_stats.end() || it->second.frequency == 0) return 0.0;
    return (double)it->second.degree / (double)it->second.frequency;
}

uint32_t CooccurrenceGraph::cooccurrence(const std::string& a, const std::string& b) const {
    auto row = m_matrix.find(a);
    if (row == m_matrix.end()) return 0;
    auto cell = row->second.find(b);
    return cell == row->second.end() ? 0 : cell->second;
}

std::vector<std::string> CooccurrenceGraph::words() const {
    std::vector<std::string> out;
    out.reserve(m_stats.size());
    for (const auto& kv : m_stats) out.push_back(kv.first);
    std::sort(out.begin(), out.end());
    return out;
}

}  // namespace kwe
