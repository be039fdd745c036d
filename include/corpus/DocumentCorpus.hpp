#pragma once
#include <string>
#include <vector>

namespace kwe {

struct Document {
    std::string id;    // filename stem, e.g., "article_03"
    std::string path;
    std::string text;  // full raw text
};

std::string read_text_file(const std::string& path);

class DocumentCorpus {
public:
    static DocumentCorpus load_from_dir(const std::string& dir, const std::string& extension = ".txt");

    const std::vector<Document>& documents() const { return m_docs; }
    std::vector<std::string> texts() const;

    // drop documents whose path resolves to the given file (the target, usually)
    void exclude(const std::string& path);

    size_t size() const { return m_docs.size(); }
    bool empty() const { return m_docs.empty(); }

private:
    std::vector<Document> m_docs;
};

}  // namespace kwe
