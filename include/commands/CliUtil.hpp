#pragma once

#include <fstream>
#include <memory>
#include <ostream>
#include <string>

#include "core/EngineConfig.hpp"
#include "topics/Taxonomy.hpp"

namespace cli {

bool has_flag(int argc, char** argv, const std::string& key);
std::string get_arg(int argc, char** argv, const std::string& key, const std::string& def);

// Writes to both streams (second one optional), used to mirror console output into --out.
struct Printer {
    std::ostream* a = nullptr;
    std::ostream* b = nullptr;
    template <typename T>
    Printer& operator<<(const T& v) {
        if (a) (*a) << v;
        if (b) (*b) << v;
        return *this;
    }
    Printer& operator<<(std::ostream& (*manip)(std::ostream&)) {
        if (a) manip(*a);
        if (b) manip(*b);
        return *this;
    }
};

bool open_out(std::ofstream& out, const std::string& out_path);

struct EngineInputs {
    std::shared_ptr<const insights::Taxonomy> taxonomy;
    std::string taxonomy_source;     // path or "builtin"
    insights::EngineConfig cfg;
    std::string as_of;               // as given on the command line / config, "" if unset
};

// --taxonomy, --config, --as_of, --batch_size, --half_life_days.
// Prints "error: ..." and returns false on a bad flag or configuration.
bool load_engine_inputs(int argc, char** argv, EngineInputs& in);

}  // namespace cli
