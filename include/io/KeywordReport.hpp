// include/io/KeywordReport.hpp
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "pipeline/KeywordExtractor.hpp"

namespace kwe {

struct KeywordReport {
    std::string target_path;
    std::string corpus_dir;
    int corpus_docs = 0;

    int max_keyword_size = 0;
    int limit = 0;
    ExtractorOptions options;

    int num_candidates = 0;
    int num_distinct_words = 0;
    int num_pruned = 0;

    std::vector<RankedKeyword> keywords;

    nlohmann::json to_json() const;
    void write_to(const std::filesystem::path& out_path) const;
};

}  // namespace kwe
