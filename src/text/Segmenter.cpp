#include "text/Segmenter.hpp"
#include "pipeline/Errors.hpp"
#include "text/TextUtil.hpp"
#include <algorithm>
#include <cctype>

namespace kwe {

const char* candidate_mode_str(CandidateMode m) {
    switch (m) {
        case CandidateMode::Chunk: return "chunk";
        case CandidateMode::Window: return "window";
        case CandidateMode::Flexible: return "flexible";
        default: return "unknown";
    }
}

CandidateMode parse_candidate_mode(const std::string& s) {
    const std::string lc = textutil::to_lower_ascii(textutil::trim(s));
    if (lc == "chunk") return CandidateMode::Chunk;
    if (lc == "window") return CandidateMode::Window;
    if (lc == "flexible") return CandidateMode::Flexible;
    throw InvalidConfiguration("unknown candidate mode: " + s);
}

RuleSegmenter::RuleSegmenter(StopwordSet stopwords, SegmenterOptions opts)
    : m_stopwords(std::move(stopwords)), m_opts(opts) {
    if (m_opts.window_size < 1) throw InvalidConfiguration("window_size must be >= 1");
}

std::vector<std::string> RuleSegmenter::split_sentences(const std::string& text) const {
    std::vector<std::string> sentences;
    std::string cur;

    auto flush = [&]() {
        std::string t = textutil::trim(cur);
        if (!t.empty()) sentences.push_back(std::move(t));
        cur.clear();
    };

    for (size_t i = 0; i < text.size(); ++i) {
        char ch = text[i];

        if (ch == '\n' && m_opts.split_on_newline) {
            flush();
            continue;
        }

        if (ch == '.' || ch == '!' || ch == '?') {
            // keep "..." / "?!" together with the sentence they close
            size_t j = i;
            while (j < text.size() && (text[j] == '.' || text[j] == '!' || text[j] == '?')) {
                cur.push_back(text[j]);
                ++j;
            }
            // "done.Next" ends a sentence, "U.S.A" and "3.14" do not
            const bool glued = j < text.size() && std::isupper((unsigned char)text[j]) &&
                               i > 0 && std::islower((unsigned char)text[i - 1]);
            if (j == text.size() || std::isspace((unsigned char)text[j]) || glued) flush();
            i = j - 1;
            continue;
        }

        cur.push_back(ch);
    }
    flush();
    return sentences;
}

std::vector<Token> RuleSegmenter::tokenize(const std::string& sentence) const {
    std::vector<Token> out;
    for (auto& w : textutil::tokenize_words(sentence)) {
        if (textutil::is_punctuation_token(w)) continue;
        Token t;
        t.word = textutil::to_lower_ascii(w);
        t.surface = std::move(w);
        out.push_back(std::move(t));
    }
    return out;
}

void RuleSegmenter::emit_chunk(std::vector<Token>& chunk, size_t max_ngram,
                               std::vector<CandidatePhrase>& out) const {
    if (chunk.empty()) return;

    if (m_opts.mode == CandidateMode::Chunk) {
        const size_t first = chunk.front().position;
        out.emplace_back(std::move(chunk), first);
        chunk.clear();
        return;
    }

    size_t cap = m_opts.window_size;
    if (max_ngram > 0) cap = std::min(cap, max_ngram);

    const size_t len = chunk.size();
    const size_t max_n = std::min(cap, len);
    const size_t min_n = (m_opts.mode == CandidateMode::Flexible) ? 1 : max_n;

    for (size_t n = min_n; n <= max_n; ++n) {
        for (size_t i = 0; i + n <= len; ++i) {
            std::vector<Token> gram(chunk.begin() + i, chunk.begin() + i + n);
            out.emplace_back(std::move(gram), chunk[i].position);
        }
    }
    chunk.clear();
}

std::vector<CandidatePhrase> RuleSegmenter::chunk_phrases(const std::vector<std::string>& sentences,
                                                          size_t max_ngram) const {
    std::vector<CandidatePhrase> out;
    std::vector<Token> chunk;
    size_t position = 0;

    for (const auto& s : sentences) {
        for (auto& tok : tokenize(s)) {
            tok.position = position++;
            if (m_stopwords.contains(tok.word)) {
                emit_chunk(chunk, max_ngram, out);
            } else {
                chunk.push_back(std::move(tok));
            }
        }
        emit_chunk(chunk, max_ngram, out);
    }
    return out;
}

}  // namespace kwe
