#pragma once
#include <string>
#include <vector>

namespace kwe {

struct Token {
    std::string word;     // lowercased
    std::string surface;  // as written in the document
    size_t position = 0;  // index in the document's word stream, stopwords counted
};

// A run of non-stopword tokens. Identity is the normalized word sequence;
// instances are immutable once built.
class CandidatePhrase {
public:
    CandidatePhrase(std::vector<Token> tokens, size_t ordinal);

    const std::vector<std::string>& words() const { return m_words; }
    const std::string& normalized() const { return m_normalized; }
    const std::string& surface() const { return m_surface; }

    // document position of the phrase's first word; orders equal scores
    size_t ordinal() const { return m_ordinal; }
    size_t size() const { return m_words.size(); }

    bool operator==(const CandidatePhrase& o) const { return m_normalized == o.m_normalized; }
    bool operator!=(const CandidatePhrase& o) const { return !(*this == o); }

private:
    std::vector<std::string> m_words;
    std::string m_normalized;
    std::string m_surface;
    size_t m_ordinal = 0;
};

}  // namespace kwe
