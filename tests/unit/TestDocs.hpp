#pragma once

#include <string>
#include <vector>

#include "core/DateUtil.hpp"
#include "core/Models.hpp"
#include "text/TextUtil.hpp"

namespace testdocs {

inline std::int64_t day(const std::string& ymd) {
    return *dateutil::parse_date(ymd);
}

inline insights::NormalizedDocument doc(const std::string& id,
                                        const std::string& text,
                                        const std::string& date = "2024-06-01",
                                        insights::Outcome outcome = insights::Outcome::Unknown) {
    insights::NormalizedDocument d;
    d.record_id = id;
    d.company = "Acme";
    d.date = day(date);
    d.outcome = outcome;
    d.tokens = textutil::normalize_text(text);
    return d;
}

inline insights::ExperienceRecord record(const std::string& id,
                                         const std::string& company,
                                         const std::string& date,
                                         const std::string& text,
                                         insights::Outcome outcome = insights::Outcome::Unknown) {
    insights::ExperienceRecord r;
    r.id = id;
    r.company = company;
    if (!date.empty()) r.date = dateutil::parse_date(date);
    r.raw_text = text;
    r.outcome = outcome;
    return r;
}

inline const insights::Topic* find_topic(const std::vector<insights::Topic>& topics, const std::string& id) {
    for (const auto& t : topics) {
        if (t.id == id) return &t;
    }
    return nullptr;
}

}  // namespace testdocs
