#include "text/StopwordSet.hpp"
#include "text/TextUtil.hpp"
#include <fstream>
#include <stdexcept>

namespace kwe {

StopwordSet StopwordSet::english() {
    static const std::vector<std::string> words = {
        "i", "me", "my", "myself", "we", "our", "ours", "ourselves", "you", "you're",
        "you've", "you'll", "you'd", "your", "yours", "yourself", "yourselves", "he",
        "him", "his", "himself", "she", "she's", "her", "hers", "herself", "it", "it's",
        "its", "itself", "they", "them", "their", "theirs", "themselves", "what", "which",
        "who", "whom", "this", "that", "that'll", "these", "those", "am", "is", "are",
        "was", "were", "be", "been", "being", "have", "has", "had", "having", "do",
        "does", "did", "doing", "a", "an", "the", "and", "but", "if", "or", "because",
        "as", "until", "while", "of", "at", "by", "for", "with", "about", "against",
        "between", "into", "through", "during", "before", "after", "above", "below",
        "to", "from", "up", "down", "in", "out", "on", "off", "over", "under", "again",
        "further", "then", "once", "here", "there", "when", "where", "why", "how", "all",
        "any", "both", "each", "few", "more", "most", "other", "some", "such", "no",
        "nor", "not", "only", "own", "same", "so", "than", "too", "very", "s", "t",
        "can", "will", "just", "don", "don't", "should", "should've", "now", "d", "ll",
        "m", "o", "re", "ve", "y", "ain", "aren", "aren't", "couldn", "couldn't",
        "didn", "didn't", "doesn", "doesn't", "hadn", "hadn't", "hasn", "hasn't",
        "haven", "haven't", "isn", "isn't", "ma", "mightn", "mightn't", "mustn",
        "mustn't", "needn", "needn't", "shan", "shan't", "shouldn", "shouldn't",
        "wasn", "wasn't", "weren", "weren't", "won", "won't", "wouldn", "wouldn't",
    };
    return from_words(words);
}

StopwordSet StopwordSet::from_words(const std::vector<std::string>& words) {
    StopwordSet s;
    s.m_words.reserve(words.size() * 2);
    for (const auto& w : words) {
        std::string t = textutil::to_lower_ascii(textutil::trim(w));
        if (!t.empty()) s.m_words.insert(std::move(t));
    }
    return s;
}

StopwordSet StopwordSet::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw std::runtime_error("failed to open stopword file: " + path);

    std::vector<std::string> words;
    std::string line;
    while (std::getline(in, line)) {
        std::string t = textutil::trim(line);
        if (t.empty() || t[0] == '#') continue;
        words.push_back(t);
    }
    return from_words(words);
}

bool StopwordSet::contains(const std::string& word) const {
    return m_words.find(textutil::to_lower_ascii(word)) != m_words.end();
}

}  // namespace kwe
