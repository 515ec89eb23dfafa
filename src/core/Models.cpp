#include "core/Models.hpp"

namespace insights {

const char* outcome_name(Outcome o) {
    switch (o) {
        case Outcome::Success: return "success";
        case Outcome::Fail: return "fail";
        case Outcome::Unknown: return "unknown";
    }
    return "unknown";
}

const char* category_name(Category c) {
    switch (c) {
        case Category::DataStructures: return "data_structures";
        case Category::Algorithms: return "algorithms";
        case Category::SystemDesign: return "system_design";
        case Category::ProgrammingConcepts: return "programming_concepts";
        case Category::Technologies: return "technologies";
        case Category::Behavioral: return "behavioral";
        case Category::Other: return "other";
    }
    return "other";
}

const char* priority_name(PriorityLevel p) {
    switch (p) {
        case PriorityLevel::High: return "HIGH";
        case PriorityLevel::Medium: return "MEDIUM";
        case PriorityLevel::Low: return "LOW";
    }
    return "LOW";
}

const char* direction_name(TrendDirection d) {
    switch (d) {
        case TrendDirection::Rising: return "RISING";
        case TrendDirection::Falling: return "FALLING";
        case TrendDirection::Stable: return "STABLE";
    }
    return "STABLE";
}

std::optional<Category> category_from_name(const std::string& name) {
    static const Category all[] = {
        Category::DataStructures, Category::Algorithms, Category::SystemDesign,
        Category::ProgrammingConcepts, Category::Technologies, Category::Behavioral,
        Category::Other
    };
    for (Category c : all) {
        if (name == category_name(c)) return c;
    }
    return std::nullopt;
}

std::size_t category_index(Category c) {
    return static_cast<std::size_t>(c);
}

}  // namespace insights
