#include "corpus/CorpusComparator.hpp"
#include "pipeline/Errors.hpp"
#include "text/TextUtil.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <future>

namespace kwe {

const char* containment_str(Containment c) {
    switch (c) {
        case Containment::TokenSequence: return "tokens";
        case Containment::RawSubstring: return "substring";
        default: return "unknown";
    }
}

Containment parse_containment(const std::string& s) {
    const std::string lc = textutil::to_lower_ascii(textutil::trim(s));
    if (lc == "tokens") return Containment::TokenSequence;
    if (lc == "substring") return Containment::RawSubstring;
    throw InvalidConfiguration("unknown containment mode: " + s);
}

static uint32_t count_in_sentence(const std::vector<std::string>& sent, const std::vector<std::string>& words) {
    if (words.empty() || sent.size() < words.size()) return 0;

    uint32_t n = 0;
    for (size_t i = 0; i + words.size() <= sent.size(); ++i) {
        if (std::equal(words.begin(), words.end(), sent.begin() + i)) ++n;
    }
    return n;
}

static uint32_t count_substring(const std::string& lowered, const std::string& phrase) {
    if (phrase.empty()) return 0;

    uint32_t n = 0;
    size_t pos = lowered.find(phrase);
    while (pos != std::string::npos) {
        bool left_ok = !textutil::word_char_before(lowered, pos);
        bool right_ok = !textutil::word_char_at(lowered, pos + phrase.size());
        if (left_ok && right_ok) {
            ++n;
            pos = lowered.find(phrase, pos + phrase.size());
        } else {
            pos = lowered.find(phrase, pos + 1);
        }
    }
    return n;
}

CorpusComparator::CorpusComparator(std::shared_ptr<const Segmenter> segmenter, ComparatorOptions opts)
    : m_segmenter(std::move(segmenter)), m_opts(opts) {
    if (!m_segmenter) throw InvalidConfiguration("comparator needs a segmenter");
    if (m_opts.threads < 1) throw InvalidConfiguration("threads must be >= 1");
}

CorpusComparator::DocumentView CorpusComparator::prepare(const std::string& text) const {
    DocumentView v;
    if (m_opts.policy.containment == Containment::RawSubstring) {
        v.lowered = textutil::to_lower_ascii(text);
        return v;
    }

    for (const auto& s : m_segmenter->split_sentences(text)) {
        std::vector<std::string> words;
        for (auto& t : m_segmenter->tokenize(s)) words.push_back(std::move(t.word));
        v.sentences.push_back(std::move(words));
    }
    return v;
}

uint32_t CorpusComparator::count_matches(const DocumentView& doc, const CandidatePhrase& phrase) const {
    if (m_opts.policy.containment == Containment::RawSubstring) {
        return count_substring(doc.lowered, phrase.normalized());
    }

    uint32_t n = 0;
    for (const auto& sent : doc.sentences) n += count_in_sentence(sent, phrase.words());
    return n;
}

std::vector<uint32_t> CorpusComparator::count_range(
    const std::vector<ScoredCandidate>& candidates,
    const std::vector<std::string>& corpus,
    size_t begin,
    size_t end
) const {
    std::vector<uint32_t> df(candidates.size(), 0);

    for (size_t d = begin; d < end; ++d) {
        const DocumentView view = prepare(corpus[d]);
        for (size_t i = 0; i < candidates.size(); ++i) {
            if (count_matches(view, candidates[i].phrase) > 0) df[i] += 1;
        }
    }
    return df;
}

std::vector<uint32_t> CorpusComparator::document_frequencies(
    const std::vector<ScoredCandidate>& candidates,
    const std::vector<std::string>& corpus
) const {
    const size_t num_threads = std::min(m_opts.threads, std::max<size_t>(corpus.size(), 1));
    if (num_threads <= 1) return count_range(candidates, corpus, 0, corpus.size());

    // map: each task counts its own slice of the corpus; reduce: sum the slices
    const size_t chunk_size = (corpus.size() + num_threads - 1) / num_threads;

    std::vector<std::future<std::vector<uint32_t>>> parts;
    for (size_t begin = 0; begin < corpus.size(); begin += chunk_size) {
        const size_t end = std::min(begin + chunk_size, corpus.size());
        parts.push_back(std::async(std::launch::async, [this, &candidates, &corpus, begin, end]() {
            return count_range(candidates, corpus, begin, end);
        }));
    }

    std::vector<uint32_t> df(candidates.size(), 0);
    for (auto& f : parts) {
        const auto local = f.get();
        for (size_t i = 0; i < df.size(); ++i) df[i] += local[i];
    }
    return df;
}

std::vector<WeightedCandidate> CorpusComparator::weigh(
    const std::vector<ScoredCandidate>& candidates,
    const std::string& target,
    const std::vector<std::string>& corpus
) const {
    std::vector<WeightedCandidate> out;
    out.reserve(candidates.size());

    const DocumentView target_view = prepare(target);
    const std::vector<uint32_t> df = document_frequencies(candidates, corpus);

    const bool with_target = m_opts.policy.include_target;
    const double n_docs = (double)corpus.size() + (with_target ? 1.0 : 0.0);

    for (size_t i = 0; i < candidates.size(); ++i) {
        // every candidate was read out of the target, so it occurs at least once
        const uint32_t tf = std::max<uint32_t>(count_matches(target_view, candidates[i].phrase), 1);
        const uint32_t dfi = std::max<uint32_t>(df[i] + (with_target ? 1 : 0), 1);

        WeightedCandidate wc{candidates[i], tf, dfi, 0.0};

        if (corpus.empty()) {
            wc.weight = (double)wc.term_frequency;
        } else {
            wc.weight = (double)wc.term_frequency * std::log(n_docs / (double)wc.document_frequency);
        }
        out.push_back(std::move(wc));
    }
    return out;
}

}  // namespace kwe
