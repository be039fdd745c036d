#include "corpus/DocumentCorpus.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace kwe {

std::string read_text_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error("failed to open: " + path);
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

DocumentCorpus DocumentCorpus::load_from_dir(const std::string& dir, const std::string& extension) {
    DocumentCorpus c;

    fs::path root(dir);
    if (!fs::exists(root)) throw std::runtime_error("dir not found: " + dir);
    if (!fs::is_directory(root)) throw std::runtime_error("not a directory: " + dir);

    for (auto& entry : fs::directory_iterator(root)) {
        if (!entry.is_regular_file()) continue;
        auto p = entry.path();
        if (p.extension() != extension) continue;

        Document d;
        d.id = p.stem().string();
        d.path = p.string();
        d.text = read_text_file(d.path);
        c.m_docs.push_back(std::move(d));
    }

    // directory order is unspecified; keep runs reproducible
    std::sort(c.m_docs.begin(), c.m_docs.end(), [](const Document& a, const Document& b) {
        return a.path < b.path;
    });

    return c;
}

std::vector<std::string> DocumentCorpus::texts() const {
    std::vector<std::string> out;
    out.reserve(m_docs.size());
    for (const auto& d : m_docs) out.push_back(d.text);
    return out;
}

void DocumentCorpus::exclude(const std::string& path) {
    const fs::path target = fs::weakly_canonical(fs::path(path));

    m_docs.erase(std::remove_if(m_docs.begin(), m_docs.end(), [&](const Document& d) {
        return fs::weakly_canonical(fs::path(d.path)) == target;
    }), m_docs.end());
}

}  // namespace kwe
