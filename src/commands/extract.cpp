#include "commands/extract.hpp"

#include "corpus/DocumentCorpus.hpp"
#include "io/ConfigIO.hpp"
#include "io/KeywordReport.hpp"
#include "pipeline/Errors.hpp"
#include "pipeline/KeywordExtractor.hpp"
#include "text/Segmenter.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

static std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

static int get_arg_int(int argc, char** argv, const std::string& key, int def) {
    const std::string s = get_arg(argc, argv, key, "");
    if (s.empty()) return def;
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        if (used != s.size()) throw std::invalid_argument(s);
        return v;
    } catch (const std::exception&) {
        throw std::runtime_error(key + " expects an integer, got: " + s);
    }
}

struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
};

static void open_out(std::ofstream& out, const std::string& out_path) {
    fs::path p(out_path);
    if (p.has_parent_path()) fs::create_directories(p.parent_path());
    out.open(p, std::ios::out | std::ios::trunc);
    if (!out) throw std::runtime_error("failed to open output file: " + out_path);
}

// config file first, then command line overrides
static kwe::RunConfig resolve_config(int argc, char** argv) {
    const std::string config_path = get_arg(argc, argv, "--config", "");
    kwe::RunConfig cfg = config_path.empty() ? kwe::RunConfig{} : kwe::load_run_config(config_path);

    cfg.max_keyword_size = get_arg_int(argc, argv, "--max_keyword_size", cfg.max_keyword_size);
    cfg.limit = get_arg_int(argc, argv, "--limit", cfg.limit);

    const std::string stop_file = get_arg(argc, argv, "--stopwords", "");
    if (!stop_file.empty()) {
        cfg.stopwords_file = stop_file;
        cfg.has_stopword_list = false;
    }

    auto& seg = cfg.extractor.segmenter;
    const std::string mode = get_arg(argc, argv, "--mode", "");
    if (!mode.empty()) seg.mode = kwe::parse_candidate_mode(mode);
    const int window = get_arg_int(argc, argv, "--window_size", (int)seg.window_size);
    if (window < 1) throw kwe::InvalidConfiguration("--window_size must be >= 1");
    seg.window_size = (size_t)window;
    if (has_flag(argc, argv, "--no_newline_split")) seg.split_on_newline = false;

    auto& cmp = cfg.extractor.comparator;
    if (has_flag(argc, argv, "--include_target")) cmp.policy.include_target = true;
    const std::string containment = get_arg(argc, argv, "--containment", "");
    if (!containment.empty()) cmp.policy.containment = kwe::parse_containment(containment);
    const int threads = get_arg_int(argc, argv, "--threads", (int)cmp.threads);
    if (threads < 1) throw kwe::InvalidConfiguration("--threads must be >= 1");
    cmp.threads = (size_t)threads;

    return cfg;
}

static void print_keywords(Printer& pr, const std::vector<kwe::RankedKeyword>& kws) {
    pr << "\nKEYWORDS\n";
    for (size_t i = 0; i < kws.size(); ++i) {
        const auto& k = kws[i];
        std::ostringstream line;
        line << std::setw(3) << (i + 1) << ". "
             << std::fixed << std::setprecision(4) << k.score
             << "  " << k.text
             << "  (rake=" << std::setprecision(2) << k.rake_score
             << " tf=" << k.term_frequency
             << " df=" << k.document_frequency << ")\n";
        pr << line.str();
    }
}

int cmd_extract(int argc, char** argv) {
    try {
        const std::string input = get_arg(argc, argv, "--input", "");
        const std::string corpus_dir = get_arg(argc, argv, "--corpus", "");
        const std::string json_path = get_arg(argc, argv, "--json", "");
        const std::string out_path = get_arg(argc, argv, "--out", "");
        const bool verbose = has_flag(argc, argv, "--verbose");

        if (input.empty()) throw std::runtime_error("missing --input <file>");

        const kwe::RunConfig cfg = resolve_config(argc, argv);

        std::ofstream out_file;
        if (!out_path.empty()) open_out(out_file, out_path);
        Printer pr{&std::cout, out_path.empty() ? nullptr : &out_file};

        const std::string target = kwe::read_text_file(input);

        kwe::DocumentCorpus corpus;
        if (!corpus_dir.empty()) {
            corpus = kwe::DocumentCorpus::load_from_dir(corpus_dir);
            // the target is counted through --include_target, never twice
            corpus.exclude(input);
        }
        if (verbose) std::cerr << "[kwe] loaded target (" << target.size() << " bytes), "
                               << corpus.size() << " corpus docs\n";

        const kwe::StopwordSet stopwords = kwe::resolve_stopwords(cfg);
        if (verbose) std::cerr << "[kwe] stopwords: " << stopwords.size() << "\n";

        const kwe::KeywordExtractor extractor(stopwords, cfg.extractor);
        const kwe::Extraction ex = extractor.analyze(target, corpus.texts(), cfg.max_keyword_size, cfg.limit);

        if (verbose) {
            std::cerr << "[kwe] candidates: " << ex.candidates.size()
                      << ", distinct words: " << ex.graph.distinct_words()
                      << ", unique scored: " << ex.scored.size()
                      << ", after pruning: " << ex.pruned.size() << "\n";
        }

        pr << "TARGET: " << input << "\n";
        pr << "CORPUS: " << (corpus_dir.empty() ? "(none)" : corpus_dir) << "\n";
        pr << "CORPUS_DOCS: " << corpus.size() << "\n";
        pr << "MAX_KEYWORD_SIZE: " << cfg.max_keyword_size << "\n";
        pr << "MODE: " << kwe::candidate_mode_str(cfg.extractor.segmenter.mode) << "\n";
        pr << "DF_POLICY: " << kwe::containment_str(cfg.extractor.comparator.policy.containment)
           << (cfg.extractor.comparator.policy.include_target ? " +target" : "") << "\n";
        pr << "CANDIDATES: " << ex.candidates.size() << "\n";
        pr << "KEPT: " << ex.pruned.size() << "\n";

        print_keywords(pr, ex.keywords);

        if (!json_path.empty()) {
            kwe::KeywordReport report;
            report.target_path = input;
            report.corpus_dir = corpus_dir;
            report.corpus_docs = (int)corpus.size();
            report.max_keyword_size = cfg.max_keyword_size;
            report.limit = cfg.limit;
            report.options = cfg.extractor;
            report.num_candidates = (int)ex.candidates.size();
            report.num_distinct_words = (int)ex.graph.distinct_words();
            report.num_pruned = (int)ex.pruned.size();
            report.keywords = ex.keywords;
            report.write_to(json_path);
            pr << "\nOUT_JSON: " << json_path << "\n";
        }

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "extract failed: " << e.what() << "\n";
        return 1;
    }
}

int cmd_rake(int argc, char** argv) {
    try {
        const std::string input = get_arg(argc, argv, "--input", "");
        if (input.empty()) throw std::runtime_error("missing --input <file>");

        const kwe::RunConfig cfg = resolve_config(argc, argv);
        if (cfg.limit < 1) throw kwe::InvalidConfiguration("limit must be >= 1");

        const std::string target = kwe::read_text_file(input);
        const kwe::KeywordExtractor extractor(kwe::resolve_stopwords(cfg), cfg.extractor);
        const auto ranked = extractor.extract_rake(target, cfg.max_keyword_size);

        std::cout << "TARGET: " << input << "\n";
        std::cout << "KEPT: " << ranked.size() << "\n\n";

        const size_t n = std::min(ranked.size(), (size_t)cfg.limit);
        for (size_t i = 0; i < n; ++i) {
            std::cout << std::setw(3) << (i + 1) << ". "
                      << std::fixed << std::setprecision(2) << ranked[i].score
                      << "  " << ranked[i].phrase.surface() << "\n";
        }
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "rake failed: " << e.what() << "\n";
        return 1;
    }
}
