#include "io/ConfigIO.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace kwe {

static void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) {
        throw std::runtime_error(where + " must be an object");
    }
}

static int optional_int(const json& j, const char* key, const std::string& where, int def) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_number_integer()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an integer");
    }
    return j.at(key).get<int>();
}

static bool optional_bool(const json& j, const char* key, const std::string& where, bool def) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_boolean()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a boolean");
    }
    return j.at(key).get<bool>();
}

static std::string optional_string(const json& j, const char* key, const std::string& where, const std::string& def) {
    if (!j.contains(key)) return def;
    if (!j.at(key).is_string()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be a string");
    }
    return j.at(key).get<std::string>();
}

static std::vector<std::string> require_string_array(const json& j, const char* key, const std::string& where) {
    const json& arr = j.at(key);
    if (!arr.is_array()) {
        throw std::runtime_error(where + "." + std::string(key) + " must be an array");
    }
    std::vector<std::string> out;
    out.reserve(arr.size());
    for (size_t i = 0; i < arr.size(); ++i) {
        if (!arr.at(i).is_string()) {
            std::ostringstream oss;
            oss << where << "." << key << "[" << i << "] must be a string";
            throw std::runtime_error(oss.str());
        }
        out.push_back(arr.at(i).get<std::string>());
    }
    return out;
}

RunConfig parse_run_config(const json& j, const std::string& where) {
    require_object(j, where);

    RunConfig cfg;
    cfg.max_keyword_size = optional_int(j, "max_keyword_size", where, cfg.max_keyword_size);
    cfg.limit = optional_int(j, "limit", where, cfg.limit);

    if (j.contains("stopwords")) {
        cfg.stopwords = require_string_array(j, "stopwords", where);
        cfg.has_stopword_list = true;
    }
    cfg.stopwords_file = optional_string(j, "stopwords_file", where, "");

    SegmenterOptions& seg = cfg.extractor.segmenter;
    if (j.contains("candidate_mode")) {
        seg.mode = parse_candidate_mode(optional_string(j, "candidate_mode", where, ""));
    }
    const int window = optional_int(j, "window_size", where, (int)seg.window_size);
    if (window < 1) throw std::runtime_error(where + ".window_size must be >= 1");
    seg.window_size = (size_t)window;
    seg.split_on_newline = optional_bool(j, "split_on_newline", where, seg.split_on_newline);

    ComparatorOptions& cmp = cfg.extractor.comparator;
    cmp.policy.include_target = optional_bool(j, "include_target", where, cmp.policy.include_target);
    if (j.contains("containment")) {
        cmp.policy.containment = parse_containment(optional_string(j, "containment", where, ""));
    }
    const int threads = optional_int(j, "threads", where, (int)cmp.threads);
    if (threads < 1) throw std::runtime_error(where + ".threads must be >= 1");
    cmp.threads = (size_t)threads;

    return cfg;
}

RunConfig load_run_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("failed to open config file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }

    return parse_run_config(j);
}

StopwordSet resolve_stopwords(const RunConfig& cfg) {
    if (cfg.has_stopword_list) return StopwordSet::from_words(cfg.stopwords);
    if (!cfg.stopwords_file.empty()) return StopwordSet::load_from_file(cfg.stopwords_file);
    return StopwordSet::english();
}

}  // namespace kwe
