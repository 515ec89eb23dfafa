#include "text/TextUtil.hpp"
#include <algorithm>
#include <cctype>
#include <unordered_map>
#include <unordered_set>

namespace textutil {

static bool starts_with_at(const std::string& s, size_t pos, const char* prefix) {
    for (size_t i = 0; prefix[i] != '\0'; ++i) {
        if (pos + i >= s.size()) return false;
        if (std::tolower(static_cast<unsigned char>(s[pos + i])) != prefix[i]) return false;
    }
    return true;
}

static bool is_space(char c) {
    return std::isspace(static_cast<unsigned char>(c)) != 0;
}

static std::string decode_entity(const std::string& body) {
    if (body.size() > 1 && body[0] == '#') {
        int v = 0;
        for (size_t i = 1; i < body.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(body[i]))) return " ";
            v = v * 10 + (body[i] - '0');
            if (v > 0x10FFFF) return " ";
        }
        if (v >= 32 && v < 127) return std::string(1, static_cast<char>(v));
        return " ";
    }
    if (body == "amp") return "&";
    if (body == "lt") return "<";
    if (body == "gt") return ">";
    if (body == "quot") return "\"";
    if (body == "apos") return "'";
    return " ";  // nbsp and friends
}

static bool is_name_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '-' || c == '_' || c == ':' || c == '.';
}

static const std::unordered_set<std::string>& html_tags() {
    static const std::unordered_set<std::string> tags = {
        "a", "abbr", "article", "b", "blockquote", "body", "br", "caption", "center", "code", "col", "dd",
        "del", "details", "div", "dl", "dt", "em", "figure", "font", "footer", "h1", "h2", "h3", "h4",
        "h5", "h6", "head", "header", "hr", "html", "i", "img", "ins", "kbd", "li", "link", "mark", "meta",
        "nav", "ol", "p", "pre", "s", "script", "section", "small", "span", "strike", "strong", "style",
        "sub", "summary", "sup", "table", "tbody", "td", "tfoot", "th", "thead", "title", "tr", "tt", "u",
        "ul", "var",
    };
    return tags;
}

// End (one past '>') of a markup construct starting at s[i] == '<', or npos.
// Accepts known HTML tags with name=value attributes, comments and <!doctype ...>.
// Anything else ("i<n", "a < b and c > d") is prose.
static size_t match_tag(const std::string& s, size_t i) {
    constexpr size_t kMaxTagLength = 512;
    const size_t limit = std::min(s.size(), i + kMaxTagLength);

    if (starts_with_at(s, i, "<!--")) {
        const size_t close = s.find("-->", i + 4);
        return close == std::string::npos ? std::string::npos : close + 3;
    }
    if (starts_with_at(s, i, "<!doctype")) {
        const size_t close = s.find('>', i);
        return (close == std::string::npos || close >= limit) ? std::string::npos : close + 1;
    }

    size_t j = i + 1;
    if (j < limit && s[j] == '/') ++j;
    const size_t name_begin = j;
    while (j < limit && std::isalnum(static_cast<unsigned char>(s[j]))) ++j;
    if (j == name_begin) return std::string::npos;

    std::string name = s.substr(name_begin, j - name_begin);
    for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (!html_tags().count(name)) return std::string::npos;

    // attributes: each is whitespace, name, '=', then a quoted or bare value
    while (j < limit) {
        if (s[j] == '>') return j + 1;
        if (s[j] == '/' && j + 1 < limit && s[j + 1] == '>') return j + 2;
        if (!is_space(s[j])) return std::string::npos;
        while (j < limit && is_space(s[j])) ++j;
        if (j < limit && (s[j] == '>' || s[j] == '/')) continue;

        const size_t attr_begin = j;
        while (j < limit && is_name_char(s[j])) ++j;
        if (j == attr_begin || j >= limit || s[j] != '=') return std::string::npos;
        ++j;
        if (j >= limit) return std::string::npos;

        if (s[j] == '"' || s[j] == '\'') {
            const size_t close = s.find(s[j], j + 1);
            if (close == std::string::npos || close >= limit) return std::string::npos;
            j = close + 1;
        } else {
            const size_t value_begin = j;
            while (j < limit && !is_space(s[j]) && s[j] != '>' && s[j] != '<') ++j;
            if (j == value_begin) return std::string::npos;
        }
    }
    return std::string::npos;
}

std::string strip_markup(const std::string& s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        const bool word_start = (i == 0) || is_space(s[i - 1]) || s[i - 1] == '(' || s[i - 1] == '[';

        // urls run until whitespace
        if (word_start && (starts_with_at(s, i, "http://") || starts_with_at(s, i, "https://") ||
                           starts_with_at(s, i, "www."))) {
            while (i < s.size() && !is_space(s[i])) ++i;
            out.push_back(' ');
            continue;
        }

        if (s[i] == '<') {
            const size_t end = match_tag(s, i);
            if (end != std::string::npos) {
                out.push_back(' ');
                i = end;
                continue;
            }
        }

        // &name; or &#123;
        if (s[i] == '&') {
            size_t j = i + 1;
            while (j < s.size() && j - i <= 8 && (std::isalnum(static_cast<unsigned char>(s[j])) || s[j] == '#')) ++j;
            if (j < s.size() && s[j] == ';' && j > i + 1) {
                out += decode_entity(s.substr(i + 1, j - i - 1));
                i = j + 1;
                continue;
            }
        }

        out.push_back(s[i]);
        ++i;
    }
    return out;
}

// Latin-1 supplement letters (second byte of a 0xC3 sequence) folded to ASCII
static const char* fold_latin1(unsigned char b) {
    if (b >= 0x80 && b <= 0x85) return "a";
    if (b == 0x86) return "ae";
    if (b == 0x87) return "c";
    if (b >= 0x88 && b <= 0x8B) return "e";
    if (b >= 0x8C && b <= 0x8F) return "i";
    if (b == 0x90) return "d";
    if (b == 0x91) return "n";
    if ((b >= 0x92 && b <= 0x96) || b == 0x98) return "o";
    if (b >= 0x99 && b <= 0x9C) return "u";
    if (b == 0x9D) return "y";
    if (b == 0x9F) return "ss";
    if (b >= 0xA0 && b <= 0xA5) return "a";
    if (b == 0xA6) return "ae";
    if (b == 0xA7) return "c";
    if (b >= 0xA8 && b <= 0xAB) return "e";
    if (b >= 0xAC && b <= 0xAF) return "i";
    if (b == 0xB0) return "d";
    if (b == 0xB1) return "n";
    if ((b >= 0xB2 && b <= 0xB6) || b == 0xB8) return "o";
    if (b >= 0xB9 && b <= 0xBC) return "u";
    if (b == 0xBD || b == 0xBF) return "y";
    return nullptr;
}

static size_t utf8_sequence_length(unsigned char lead) {
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 1;  // stray continuation or invalid byte
}

std::string normalize(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    bool prev_space = true;

    auto separator = [&]() {
        if (!prev_space) {
            out.push_back(' ');
            prev_space = true;
        }
    };

    size_t i = 0;
    while (i < s.size()) {
        const unsigned char ch = static_cast<unsigned char>(s[i]);

        if (ch >= 0x80) {
            size_t len = utf8_sequence_length(ch);
            for (size_t k = 1; k < len; ++k) {
                if (i + k >= s.size() || (static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
                    len = k;
                    break;
                }
            }

            const char* folded = nullptr;
            if (ch == 0xC3 && len == 2) folded = fold_latin1(static_cast<unsigned char>(s[i + 1]));

            if (folded) {
                out += folded;
                prev_space = false;
            } else {
                separator();
            }
            i += len;
            continue;
        }

        unsigned char c = static_cast<unsigned char>(std::tolower(ch));

        bool keep =
            (c >= 'a' && c <= 'z') ||
            (c >= '0' && c <= '9') ||
            (c == '+') || (c == '#'); // keeps "c++" and "c#"

        if (keep) {
            out.push_back(static_cast<char>(c));
            prev_space = false;
        } else {
            separator();
        }
        ++i;
    }

    // trim trailing space
    if (!out.empty() && out.back() == ' ') out.pop_back();
    return out;
}

static bool keep_token(const std::string& t) {
    bool has_alnum = false;
    for (char c : t) {
        if (std::isalnum(static_cast<unsigned char>(c))) {
            has_alnum = true;
            break;
        }
    }
    if (!has_alnum) return false;  // "++", "#", "##"

    if (t.size() >= 2) return true;
    // single characters: digits ("round 3") and the C language
    return std::isdigit(static_cast<unsigned char>(t[0])) || t == "c";
}

std::vector<std::string> tokenize(const std::string& normalized) {
    std::vector<std::string> tokens;
    std::string cur;

    for (char c : normalized) {
        if (c == ' ') {
            if (!cur.empty()) {
                if (keep_token(cur)) tokens.push_back(cur);
                cur.clear();
            }
        } else {
            cur.push_back(c);
        }
    }
    if (!cur.empty()) {
        if (keep_token(cur)) tokens.push_back(cur);
    }
    return tokens;
}

std::vector<std::string> normalize_tokens(const std::vector<std::string>& tokens) {
    // single-token synonym folding
    static const std::unordered_map<std::string, std::string> fold = {
        {"algo", "algorithm"},
        {"algos", "algorithms"},
        {"cpp", "c++"},
        {"db", "database"},
        {"dbs", "databases"},
        {"k8s", "kubernetes"},
        {"js", "javascript"},
        {"ts", "typescript"},
        {"py", "python"},
        {"oops", "oop"},
        {"lc", "leetcode"},
        {"serverside", "backend"},
        {"multithreaded", "multithreading"}
    };

    // 2-gram merges for compounds that are written split
    static const std::unordered_map<std::string, std::string> merge = {
        {"back end", "backend"},
        {"front end", "frontend"},
        {"server side", "backend"},
        {"hash map", "hashmap"},
        {"hash maps", "hashmaps"},
        {"hash set", "hashset"},
        {"multi threading", "multithreading"},
        {"multi threaded", "multithreading"},
        {"micro service", "microservice"},
        {"micro services", "microservices"},
        {"no sql", "nosql"},
        {"leet code", "leetcode"},
        {"data base", "database"}
    };

    std::vector<std::string> out;
    out.reserve(tokens.size());

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& t = tokens[i];

        if (i + 1 < tokens.size()) {
            auto m = merge.find(t + " " + tokens[i + 1]);
            if (m != merge.end()) {
                out.push_back(m->second);
                ++i;
                continue;
            }
        }

        auto it = fold.find(t);
        if (it != fold.end()) out.push_back(it->second);
        else out.push_back(t);
    }

    return out;
}

static const std::unordered_set<std::string>& stopwords() {
    // NLTK english list plus report filler, minus the technical whitelist below
    static const std::unordered_set<std::string> words = [] {
        std::unordered_set<std::string> w = {
            "i", "me", "my", "myself", "we", "our", "ours", "ourselves", "you", "your", "yours",
            "yourself", "yourselves", "he", "him", "his", "himself", "she", "her", "hers", "herself",
            "it", "its", "itself", "they", "them", "their", "theirs", "themselves", "what", "which",
            "who", "whom", "this", "that", "these", "those", "am", "is", "are", "was", "were", "be",
            "been", "being", "have", "has", "had", "having", "do", "does", "did", "doing", "a", "an",
            "the", "and", "but", "if", "or", "because", "as", "until", "while", "of", "at", "by",
            "for", "with", "about", "against", "between", "into", "through", "during", "before",
            "after", "above", "below", "to", "from", "up", "down", "in", "out", "on", "off", "over",
            "under", "again", "further", "then", "once", "here", "there", "when", "where", "why",
            "how", "all", "any", "both", "each", "few", "more", "most", "other", "some", "such", "no",
            "nor", "not", "only", "own", "same", "so", "than", "too", "very", "s", "t", "can", "will",
            "just", "don", "should", "now", "d", "ll", "m", "o", "re", "ve", "y", "ain", "aren",
            "couldn", "didn", "doesn", "hadn", "hasn", "haven", "isn", "ma", "mightn", "mustn",
            "needn", "shan", "shouldn", "wasn", "weren", "won", "wouldn",
            // report filler
            "also", "asked", "ask", "asking", "got", "get", "getting", "like", "would", "could",
            "really", "well", "went", "told", "said", "us", "etc", "yes", "ok", "okay", "overall",
            "though", "since", "many", "much", "lot", "bit", "thing", "things", "one", "gave",
            "given", "interviewer", "interviewers", "question", "questions", "experience",
            "everything", "something", "anything", "pretty", "quite", "able", "try", "tried"
        };
        static const char* whitelist[] = {
            "technical", "system", "design", "coding", "code", "round", "rounds", "up", "out",
            "down", "over", "first", "second", "third"
        };
        for (const char* keep : whitelist) w.erase(keep);
        return w;
    }();
    return words;
}

bool is_stopword(const std::string& token) {
    return stopwords().count(token) > 0;
}

std::vector<std::string> remove_stopwords(const std::vector<std::string>& tokens) {
    std::vector<std::string> out;
    out.reserve(tokens.size());
    for (const auto& t : tokens) {
        if (!is_stopword(t)) out.push_back(t);
    }
    return out;
}

std::vector<std::string> normalize_text(const std::string& raw) {
    return remove_stopwords(normalize_tokens(tokenize(normalize(strip_markup(raw)))));
}

static bool ends_with(const std::string& s, const char* suffix, size_t n) {
    return s.size() >= n && s.compare(s.size() - n, n, suffix) == 0;
}

std::string light_stem(const std::string& t) {
    if (t.size() > 4 && ends_with(t, "ies", 3)) return t.substr(0, t.size() - 3) + "y";
    if (ends_with(t, "sses", 4)) return t.substr(0, t.size() - 2);
    if (t.size() > 6 && ends_with(t, "ing", 3)) return t.substr(0, t.size() - 3);
    if (t.size() > 4 && ends_with(t, "ed", 2)) return t.substr(0, t.size() - 2);
    if (t.size() > 3 && ends_with(t, "s", 1) && !ends_with(t, "ss", 2) && !ends_with(t, "us", 2)) {
        return t.substr(0, t.size() - 1);
    }
    return t;
}

bool is_well_formed_token(const std::string& token, std::size_t max_len) {
    if (token.empty() || token.size() > max_len) return false;
    for (unsigned char c : token) {
        if (c < 0x20 || c == 0x7F) return false;
    }
    return true;
}

insights::NormalizedDocument normalize_record(const insights::ExperienceRecord& record) {
    insights::NormalizedDocument doc;
    doc.record_id = record.id;
    doc.company = record.company;
    doc.date = record.date.value_or(0);
    doc.outcome = record.outcome;
    doc.tokens = normalize_text(record.raw_text);
    return doc;
}

}
