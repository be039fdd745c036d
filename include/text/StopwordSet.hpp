#pragma once
#include <string>
#include <unordered_set>
#include <vector>

namespace kwe {

// Words that delimit candidate phrases. Entries are stored lowercased; the set
// never changes after construction.
class StopwordSet {
public:
    StopwordSet() = default;

    static StopwordSet english();
    static StopwordSet from_words(const std::vector<std::string>& words);
    static StopwordSet load_from_file(const std::string& path); // one word per line, '#' comments

    bool contains(const std::string& word) const;
    size_t size() const { return m_words.size(); }
    bool empty() const { return m_words.empty(); }

private:
    std::unordered_set<std::string> m_words;
};

}  // namespace kwe
