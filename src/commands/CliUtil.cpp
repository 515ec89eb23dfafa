#include "commands/CliUtil.hpp"

#include <filesystem>
#include <iostream>

#include "core/DateUtil.hpp"
#include "core/Errors.hpp"
#include "io/JsonIO.hpp"

namespace fs = std::filesystem;

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key) {
    for (int i = 0; i < argc; ++i) {
        if (std::string(argv[i]) == key) return true;
    }
    return false;
}

std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def) {
    for (int i = 0; i + 1 < argc; ++i) {
        if (std::string(argv[i]) == key) return std::string(argv[i + 1]);
    }
    return def;
}

bool open_out(std::ofstream& out, const std::string& out_path) {
    if (out_path.empty()) return false;
    try {
        fs::path p(out_path);
        if (p.has_parent_path()) fs::create_directories(p.parent_path());
        out.open(p, std::ios::out | std::ios::trunc);
        return (bool)out;
    } catch (const fs::filesystem_error& e) {
        std::cerr << "[warn] " << e.what() << "\n";
        return false;
    }
}

bool load_engine_inputs(int argc, char** argv, EngineInputs& in) {
    const std::string taxonomy_path = get_arg(argc, argv, "--taxonomy", "");
    const std::string config_path   = get_arg(argc, argv, "--config", "");
    const std::string as_of_s       = get_arg(argc, argv, "--as_of", "");
    const std::string batch_s       = get_arg(argc, argv, "--batch_size", "");
    const std::string half_life_s   = get_arg(argc, argv, "--half_life_days", "");

    try {
        if (taxonomy_path.empty()) {
            in.taxonomy = insights::Taxonomy::builtin();
            in.taxonomy_source = "builtin";
        } else {
            in.taxonomy = insights::load_taxonomy(taxonomy_path);
            in.taxonomy_source = taxonomy_path;
        }

        in.cfg = config_path.empty() ? insights::EngineConfig{} : insights::load_engine_config(config_path);
    } catch (const insights::ConfigurationError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return false;
    }

    if (!batch_s.empty()) {
        try { in.cfg.extractor.batch_size = (size_t)std::stoul(batch_s); }
        catch (const std::exception&) {
            std::cerr << "error: invalid --batch_size\n";
            return false;
        }
    }

    if (!half_life_s.empty()) {
        try { in.cfg.decay.half_life_days = std::stod(half_life_s); }
        catch (const std::exception&) {
            std::cerr << "error: invalid --half_life_days\n";
            return false;
        }
    }

    if (!as_of_s.empty()) {
        auto d = dateutil::parse_date(as_of_s);
        if (!d) {
            std::cerr << "error: invalid --as_of (expected YYYY-MM-DD)\n";
            return false;
        }
        in.cfg.as_of = *d;
    }
    if (in.cfg.as_of) in.as_of = dateutil::format_date(*in.cfg.as_of);

    try {
        insights::validate_config(in.cfg);
    } catch (const insights::ConfigurationError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return false;
    }
    return true;
}

}  // namespace cli
