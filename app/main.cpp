#include "commands/TaxonomyDump.hpp"
#include "commands/analyze.hpp"
#include "commands/compare.hpp"
#include "commands/CliUtil.hpp"

#include <iostream>
#include <string>

static int print_usage() {
    std::cerr
        << "usage:\n"
        << "  interview-insights analyze [args]\n"
        << "  interview-insights compare [args]\n"
        << "  interview-insights taxonomy dump [--taxonomy <path>] [--out <path>]\n"
        << "  interview-insights help\n";
    return 1;
}

static void print_engine_options() {
    std::cerr
        << "engine:\n"
        << "  --taxonomy <path>            default: builtin taxonomy\n"
        << "  --config <path>              engine config json (decay, confidence, priority, ...)\n"
        << "  --as_of <YYYY-MM-DD>         reference date for recency decay (default: latest record)\n"
        << "  --batch_size <n>             default: 50\n"
        << "  --half_life_days <f>         default: 730\n";
}

static int print_analyze_help() {
    std::cerr
        << "usage:\n"
        << "  interview-insights analyze [options]\n"
        << "\n"
        << "common:\n"
        << "  --records <path>             default: data/sample_records.json\n"
        << "  --company <str>              default: every company in the records file\n"
        << "  --topk <n>                   default: 10\n"
        << "  --out <path>                 optional: mirror console output to a file\n"
        << "  --outdir <dir>               default: out\n"
        << "  --no_write                   do not write <company>_insights.json\n"
        << "\n";
    print_engine_options();
    return 0;
}

static int print_compare_help() {
    std::cerr
        << "usage:\n"
        << "  interview-insights compare [options]\n"
        << "\n"
        << "common:\n"
        << "  --records <path>             default: data/sample_records.json\n"
        << "  --companies <a,b,...>        default: every company in the records file\n"
        << "  --topn <n>                   default: 10\n"
        << "  --out <path>                 optional: mirror console output to a file\n"
        << "  --outdir <dir>               default: out (writes comparison.json)\n"
        << "\n";
    print_engine_options();
    return 0;
}

int main(int argc, char** argv) {
    if (argc < 2) return print_usage();

    const std::string cmd = argv[1];

    if (cmd == "help") {
        return print_usage();
    }

    if (cmd == "taxonomy") {
        if (argc >= 3 && std::string(argv[2]) == "dump") {
            return taxonomyDump(cli::get_arg(argc, argv, "--taxonomy", ""), cli::get_arg(argc, argv, "--out", ""));
        }
        return print_usage();
    }

    // subcommand help
    if (cmd == "analyze" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_analyze_help();
    if (cmd == "compare" && (argc >= 3 && std::string(argv[2]) == "--help")) return print_compare_help();

    if (cmd == "analyze") return cmd_analyze(argc - 1, argv + 1);
    if (cmd == "compare") return cmd_compare(argc - 1, argv + 1);

    std::cerr << "unknown command\n";
    return print_usage();
}
