#pragma once
#include <string>
#include <vector>

#include "core/Models.hpp"

namespace textutil {

// remove HTML tags, decode/drop HTML entities, drop URLs
std::string strip_markup(const std::string& s);

// lowercase, keep letters/digits/+/#, fold Latin-1 accents, turn everything else into spaces, collapse spaces
std::string normalize(const std::string& s);

// split normalized text into tokens, drop junk tokens (no alphanumeric, single letters other than "c")
std::vector<std::string> tokenize(const std::string& normalized);

// synonym folding + phrase merging
std::vector<std::string> normalize_tokens(const std::vector<std::string>& tokens);

bool is_stopword(const std::string& token);
std::vector<std::string> remove_stopwords(const std::vector<std::string>& tokens);

// full pipeline: strip_markup -> normalize -> tokenize -> normalize_tokens -> remove_stopwords
std::vector<std::string> normalize_text(const std::string& raw);

// plural / -ing / -ed suffix stripping, used only to group surface variants
std::string light_stem(const std::string& token);

// non-empty, at most max_len bytes, no control bytes
bool is_well_formed_token(const std::string& token, std::size_t max_len);

insights::NormalizedDocument normalize_record(const insights::ExperienceRecord& record);

}
