#include "commands/extract.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  kwe extract --input <file> [options]\n"
        << "  kwe rake --input <file> [options]\n"
        << "  kwe help\n";
    return 1;
}

static int print_extract_help() {
    std::cerr
        << "usage:\n"
        << "  kwe extract --input <file> [options]\n"
        << "\n"
        << "inputs:\n"
        << "  --input <path>               target document (required)\n"
        << "  --corpus <dir>               related documents (*.txt); default: none\n"
        << "  --config <path>              JSON config, flags below override it\n"
        << "  --stopwords <path>           one word per line; default: built-in English list\n"
        << "\n"
        << "candidates:\n"
        << "  --max_keyword_size <n>       default: 3\n"
        << "  --limit <n>                  default: 10\n"
        << "  --mode chunk|window|flexible default: chunk\n"
        << "  --window_size <n>            default: 3 (window/flexible only)\n"
        << "  --no_newline_split           let sentences run across line breaks\n"
        << "\n"
        << "corpus weighting:\n"
        << "  --include_target             count the target as a corpus document\n"
        << "  --containment tokens|substring  default: tokens\n"
        << "  --threads <n>                default: 1\n"
        << "\n"
        << "output:\n"
        << "  --json <path>                write a JSON report\n"
        << "  --out <path>                 mirror console output to a file\n"
        << "  --verbose                    stage summaries on stderr\n";
    return 0;
}

static int print_rake_help() {
    std::cerr
        << "usage:\n"
        << "  kwe rake --input <file> [options]\n"
        << "\n"
        << "Ranks the target's candidates without a corpus.\n"
        << "options: --config --stopwords --max_keyword_size --limit --mode --window_size\n";
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help" || cmd == "--help") {
        print_usage();
        return 0;
    }

    if (cmd == "extract" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_extract_help();
    if (cmd == "rake"    && (argc >= 3 && std::string(argv[2]) == "--help")) return print_rake_help();

    if (cmd == "extract") return cmd_extract(argc - 1, argv + 1);
    if (cmd == "rake")    return cmd_rake(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
