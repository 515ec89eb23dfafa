#include "commands/TaxonomyDump.hpp"
#include "core/Errors.hpp"
#include "io/JsonIO.hpp"
#include "topics/Taxonomy.hpp"

#include <fstream>
#include <iostream>

int taxonomyDump(const std::string& taxonomyPath, const std::string& outPath) {
    std::shared_ptr<const insights::Taxonomy> tax;
    try {
        tax = taxonomyPath.empty() ? insights::Taxonomy::builtin() : insights::load_taxonomy(taxonomyPath);
    } catch (const insights::ConfigurationError& e) {
        std::cerr << "error: " << e.what() << "\n";
        return 1;
    }

    const std::string text = insights::taxonomy_to_json(*tax).dump(2);

    if (outPath.empty()) {
        std::cout << text << "\n";
        return 0;
    }

    std::ofstream out(outPath);
    if (!out) {
        std::cerr << "error: failed to open output file: " << outPath << "\n";
        return 1;
    }
    out << text << "\n";

    size_t terms = 0;
    for (const auto& c : tax->concepts()) terms += c.terms.size();
    std::cout << "[Taxonomy] " << tax->concepts().size() << " concepts, " << terms << " terms, max phrase "
              << tax->max_phrase_tokens() << " tokens -> " << outPath << "\n";
    return 0;
}
