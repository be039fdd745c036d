#pragma once
#include "rake/CandidatePhrase.hpp"
#include "text/StopwordSet.hpp"
#include <string>
#include <vector>

namespace kwe {

enum class CandidateMode {
    Chunk,     // every stopword-delimited run is one candidate
    Window,    // runs are cut into windows of min(window_size, max_ngram, len) words
    Flexible   // all n-grams of 1..min(window_size, max_ngram, len) words
};

struct SegmenterOptions {
    CandidateMode mode = CandidateMode::Chunk;
    size_t window_size = 3;        // only used by Window / Flexible
    bool split_on_newline = true;  // a line break always ends a sentence
};

class Segmenter {
public:
    virtual ~Segmenter() = default;

    virtual std::vector<std::string> split_sentences(const std::string& text) const = 0;

    // max_ngram caps n-gram length in Window / Flexible mode; 0 means window_size only
    virtual std::vector<CandidatePhrase> chunk_phrases(const std::vector<std::string>& sentences,
                                                       size_t max_ngram = 0) const = 0;

    // lowercased word tokens of one sentence, stopwords included
    virtual std::vector<Token> tokenize(const std::string& sentence) const = 0;

    std::vector<CandidatePhrase> segment(const std::string& text, size_t max_ngram = 0) const {
        return chunk_phrases(split_sentences(text), max_ngram);
    }
};

class RuleSegmenter final : public Segmenter {
public:
    explicit RuleSegmenter(StopwordSet stopwords, SegmenterOptions opts = {});

    std::vector<std::string> split_sentences(const std::string& text) const override;
    std::vector<CandidatePhrase> chunk_phrases(const std::vector<std::string>& sentences,
                                               size_t max_ngram = 0) const override;
    std::vector<Token> tokenize(const std::string& sentence) const override;

    const StopwordSet& stopwords() const { return m_stopwords; }
    const SegmenterOptions& options() const { return m_opts; }

private:
    StopwordSet m_stopwords;
    SegmenterOptions m_opts;

    void emit_chunk(std::vector<Token>& chunk, size_t max_ngram, std::vector<CandidatePhrase>& out) const;
};

const char* candidate_mode_str(CandidateMode m);
CandidateMode parse_candidate_mode(const std::string& s);

}  // namespace kwe
