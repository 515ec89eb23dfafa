#include "io/JsonIO.hpp"

#include <cctype>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <type_traits>

#include "core/DateUtil.hpp"
#include "core/Errors.hpp"

using json = nlohmann::json;

namespace insights {

static json read_json_file(const std::string& path, const char* what) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error(std::string("failed to open ") + what + " file: " + path);
    }

    json j;
    try {
        in >> j;
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("failed to parse JSON: ") + e.what());
    }
    return j;
}

// ---------- records ----------

static std::string optional_string(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return {};
    return it->get<std::string>();
}

Outcome parse_outcome(const std::string& raw) {
    std::string s;
    for (char c : raw) s.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));

    if (s == "success" || s == "offer" || s == "accepted" || s == "selected" || s == "passed") {
        return Outcome::Success;
    }
    if (s == "fail" || s == "failed" || s == "rejected" || s == "reject" || s == "no offer") {
        return Outcome::Fail;
    }
    return Outcome::Unknown;
}

static ExperienceRecord parse_record(const json& j, size_t index) {
    ExperienceRecord r;
    std::ostringstream fallback;
    fallback << "#" << index;

    if (!j.is_object()) {
        r.id = fallback.str();
        return r;
    }

    if (j.contains("id") && j.at("id").is_string()) r.id = j.at("id").get<std::string>();
    else if (j.contains("id") && j.at("id").is_number_integer()) r.id = std::to_string(j.at("id").get<long long>());
    if (r.id.empty()) r.id = fallback.str();

    r.company = optional_string(j, "company");
    r.role = optional_string(j, "role");

    r.raw_text = optional_string(j, "text");
    if (r.raw_text.empty()) r.raw_text = optional_string(j, "raw_text");

    const std::string date = optional_string(j, "date");
    if (!date.empty()) r.date = dateutil::parse_date(date);

    r.outcome = parse_outcome(optional_string(j, "outcome"));
    r.source_platform = optional_string(j, "source_platform");
    r.source_url = optional_string(j, "source_url");
    return r;
}

std::vector<ExperienceRecord> parse_records(const json& root) {
    if (!root.is_array()) {
        throw std::runtime_error("records root must be an array");
    }
    std::vector<ExperienceRecord> out;
    out.reserve(root.size());
    for (size_t i = 0; i < root.size(); ++i) out.push_back(parse_record(root.at(i), i));
    return out;
}

std::vector<ExperienceRecord> load_records(const std::string& path) {
    return parse_records(read_json_file(path, "records"));
}

// ---------- taxonomy ----------

std::shared_ptr<const Taxonomy> parse_taxonomy(const json& root) {
    if (!root.is_object()) throw ConfigurationError("taxonomy root must be an object");
    if (!root.contains("categories") || !root.at("categories").is_object()) {
        throw ConfigurationError("taxonomy missing required object: categories");
    }

    std::vector<CategorySpec> specs;
    const json& categories = root.at("categories");
    for (auto cit = categories.begin(); cit != categories.end(); ++cit) {
        const std::string cat_name = cit.key();
        const json& cat = cit.value();
        const std::string where = "categories." + cat_name;
        const auto category = category_from_name(cat_name);
        if (!category) throw ConfigurationError("unknown category: " + cat_name);
        if (!cat.is_object()) throw ConfigurationError(where + " must be an object");

        CategorySpec spec;
        spec.category = *category;

        if (!cat.contains("weight") || !cat.at("weight").is_number()) {
            throw ConfigurationError(where + ".weight must be a number");
        }
        spec.weight = cat.at("weight").get<double>();

        if (!cat.contains("concepts") || !cat.at("concepts").is_object()) {
            throw ConfigurationError(where + ".concepts must be an object");
        }
        const json& concepts = cat.at("concepts");
        for (auto kit = concepts.begin(); kit != concepts.end(); ++kit) {
            const std::string concept_name = kit.key();
            const json& terms = kit.value();
            if (!terms.is_array()) {
                throw ConfigurationError(where + ".concepts." + concept_name + " must be an array");
            }
            std::vector<std::string> raw;
            for (size_t i = 0; i < terms.size(); ++i) {
                if (!terms.at(i).is_string()) {
                    std::ostringstream oss;
                    oss << where << ".concepts." << concept_name << "[" << i << "] must be a string";
                    throw ConfigurationError(oss.str());
                }
                raw.push_back(terms.at(i).get<std::string>());
            }
            spec.concepts.emplace_back(concept_name, std::move(raw));
        }
        specs.push_back(std::move(spec));
    }

    return Taxonomy::build(specs);
}

std::shared_ptr<const Taxonomy> load_taxonomy(const std::string& path) {
    json j;
    try {
        j = read_json_file(path, "taxonomy");
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(e.what());
    }
    return parse_taxonomy(j);
}

json taxonomy_to_json(const Taxonomy& taxonomy) {
    json cats = json::object();
    for (const auto& c : taxonomy.concepts()) {
        const std::string cat = category_name(c.category);
        if (!cats.contains(cat)) {
            cats[cat] = {{"weight", taxonomy.weight(c.category)}, {"concepts", json::object()}};
        }
        cats[cat]["concepts"][c.name] = c.terms;
    }
    return json{{"categories", cats}};
}

// ---------- engine config ----------

static const json* section(const json& root, const char* name) {
    auto it = root.find(name);
    if (it == root.end()) return nullptr;
    if (!it->is_object()) throw ConfigurationError(std::string(name) + " must be an object");
    return &*it;
}

static void read_number(const json* sec, const char* sec_name, const char* key, double& out) {
    if (!sec || !sec->contains(key)) return;
    const json& v = sec->at(key);
    if (!v.is_number()) throw ConfigurationError(std::string(sec_name) + "." + key + " must be a number");
    out = v.get<double>();
}

template <typename Int>
static void read_integer(const json* sec, const char* sec_name, const char* key, Int& out) {
    if (!sec || !sec->contains(key)) return;
    const json& v = sec->at(key);
    if (!v.is_number_integer() || (std::is_unsigned<Int>::value && v.get<long long>() < 0)) {
        throw ConfigurationError(std::string(sec_name) + "." + key + " must be a non-negative integer");
    }
    out = static_cast<Int>(v.get<long long>());
}

static void read_bool(const json* sec, const char* sec_name, const char* key, bool& out) {
    if (!sec || !sec->contains(key)) return;
    const json& v = sec->at(key);
    if (!v.is_boolean()) throw ConfigurationError(std::string(sec_name) + "." + key + " must be a boolean");
    out = v.get<bool>();
}

EngineConfig parse_engine_config(const json& root, EngineConfig cfg) {
    if (!root.is_object()) throw ConfigurationError("engine config root must be an object");

    if (const json* s = section(root, "decay")) {
        read_number(s, "decay", "half_life_days", cfg.decay.half_life_days);
        read_number(s, "decay", "min_weight", cfg.decay.min_weight);
    }
    if (const json* s = section(root, "confidence")) {
        read_number(s, "confidence", "alpha", cfg.confidence.alpha);
        read_integer(s, "confidence", "min_sample_size", cfg.confidence.min_sample_size);
        read_number(s, "confidence", "tf_saturation", cfg.confidence.tf_saturation);
    }
    if (const json* s = section(root, "difficulty")) {
        read_number(s, "difficulty", "keyword_weight", cfg.difficulty.keyword_weight);
        read_number(s, "difficulty", "rounds_weight", cfg.difficulty.rounds_weight);
        read_number(s, "difficulty", "depth_weight", cfg.difficulty.depth_weight);
        read_number(s, "difficulty", "outcome_weight", cfg.difficulty.outcome_weight);
        read_number(s, "difficulty", "round_saturation", cfg.difficulty.round_saturation);
        read_number(s, "difficulty", "depth_saturation", cfg.difficulty.depth_saturation);
    }
    if (const json* s = section(root, "priority")) {
        read_number(s, "priority", "frequency_weight", cfg.priority.frequency_weight);
        read_number(s, "priority", "difficulty_weight", cfg.priority.difficulty_weight);
        read_number(s, "priority", "success_weight", cfg.priority.success_weight);
        read_number(s, "priority", "trend_weight", cfg.priority.trend_weight);
        read_number(s, "priority", "high_threshold", cfg.priority.high_threshold);
        read_number(s, "priority", "medium_threshold", cfg.priority.medium_threshold);
        read_number(s, "priority", "confidence_influence", cfg.priority.confidence_influence);
    }
    if (const json* s = section(root, "hours")) {
        read_number(s, "hours", "base_hours", cfg.hours.base_hours);
        read_number(s, "hours", "difficulty_hours", cfg.hours.difficulty_hours);
        read_number(s, "hours", "difficulty_exponent", cfg.hours.difficulty_exponent);
        read_number(s, "hours", "breadth_hours", cfg.hours.breadth_hours);
        read_number(s, "hours", "rounding_step", cfg.hours.rounding_step);
    }
    if (const json* s = section(root, "extractor")) {
        read_integer(s, "extractor", "batch_size", cfg.extractor.batch_size);
        read_integer(s, "extractor", "max_token_length", cfg.extractor.max_token_length);
        read_bool(s, "extractor", "include_other_terms", cfg.extractor.include_other_terms);
        read_integer(s, "extractor", "min_other_document_frequency", cfg.extractor.min_other_document_frequency);
        read_integer(s, "extractor", "max_other_topics", cfg.extractor.max_other_topics);
        read_number(s, "extractor", "cooccurrence_jaccard", cfg.extractor.cooccurrence_jaccard);
        read_integer(s, "extractor", "min_cooccurrence_docs", cfg.extractor.min_cooccurrence_docs);
    }
    if (const json* s = section(root, "trend")) {
        read_integer(s, "trend", "bucket_months", cfg.trend.bucket_months);
        read_integer(s, "trend", "min_buckets", cfg.trend.min_buckets);
        read_number(s, "trend", "alpha", cfg.trend.alpha);
    }

    if (root.contains("as_of")) {
        const json& v = root.at("as_of");
        if (!v.is_string()) throw ConfigurationError("as_of must be a date string");
        auto d = dateutil::parse_date(v.get<std::string>());
        if (!d) throw ConfigurationError("as_of is not a valid YYYY-MM-DD date");
        cfg.as_of = *d;
    }

    validate_config(cfg);
    return cfg;
}

EngineConfig load_engine_config(const std::string& path) {
    json j;
    try {
        j = read_json_file(path, "engine config");
    } catch (const std::runtime_error& e) {
        throw ConfigurationError(e.what());
    }
    return parse_engine_config(j);
}

}  // namespace insights
