#include "io/KeywordReport.hpp"

#include <fstream>
#include <stdexcept>

namespace kwe {

static nlohmann::json keyword_to_json(const RankedKeyword& k) {
    nlohmann::json j;
    j["keyword"] = k.text;
    j["normalized"] = k.normalized;
    j["score"] = k.score;
    j["rake_score"] = k.rake_score;
    j["term_frequency"] = k.term_frequency;
    j["document_frequency"] = k.document_frequency;
    j["first_occurrence"] = k.first_occurrence;
    return j;
}

nlohmann::json KeywordReport::to_json() const {
    nlohmann::json j;
    j["target_path"] = target_path;
    j["corpus_dir"] = corpus_dir;
    j["corpus_docs"] = corpus_docs;

    j["config"] = {
        {"max_keyword_size", max_keyword_size},
        {"limit", limit},
        {"candidate_mode", candidate_mode_str(options.segmenter.mode)},
        {"window_size", options.segmenter.window_size},
        {"split_on_newline", options.segmenter.split_on_newline},
        {"include_target", options.comparator.policy.include_target},
        {"containment", containment_str(options.comparator.policy.containment)},
        {"threads", options.comparator.threads},
    };

    j["stats"] = {
        {"candidates", num_candidates},
        {"distinct_words", num_distinct_words},
        {"pruned", num_pruned},
    };

    nlohmann::json arr = nlohmann::json::array();
    for (const auto& k : keywords) {
        arr.push_back(keyword_to_json(k));
    }
    j["keywords"] = arr;

    return j;
}

void KeywordReport::write_to(const std::filesystem::path& out_path) const {
    if (out_path.has_parent_path()) std::filesystem::create_directories(out_path.parent_path());

    std::ofstream out(out_path);
    if (!out) throw std::runtime_error("Failed to open output file: " + out_path.string());

    out << to_json().dump(2) << "\n";
}

}  // namespace kwe
