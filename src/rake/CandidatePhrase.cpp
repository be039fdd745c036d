#include "rake/CandidatePhrase.hpp"
#include "text/TextUtil.hpp"

namespace kwe {

CandidatePhrase::CandidatePhrase(std::vector<Token> tokens, size_t ordinal)
    : m_ordinal(ordinal) {
    std::vector<std::string> surfaces;
    m_words.reserve(tokens.size());
    surfaces.reserve(tokens.size());

    for (auto& t : tokens) {
        m_words.push_back(std::move(t.word));
        surfaces.push_back(std::move(t.surface));
    }

    m_normalized = textutil::join(m_words);
    m_surface = textutil::join(surfaces);
}

}  // namespace kwe
