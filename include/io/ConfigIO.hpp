#pragma once

#include <string>
#include <vector>

#include "nlohmann/json.hpp"
#include "pipeline/KeywordExtractor.hpp"
#include "text/StopwordSet.hpp"

namespace kwe {

struct RunConfig {
    int max_keyword_size = 3;
    int limit = 10;

    // explicit list wins over stopwords_file; with neither the English list is used
    std::vector<std::string> stopwords;
    bool has_stopword_list = false;
    std::string stopwords_file;

    ExtractorOptions extractor;
};

RunConfig parse_run_config(const nlohmann::json& j, const std::string& where = "config");
RunConfig load_run_config(const std::string& path);

StopwordSet resolve_stopwords(const RunConfig& cfg);

}  // namespace kwe
