#include "topics/Taxonomy.hpp"

#include <algorithm>
#include <cmath>
#include <set>

#include "core/Errors.hpp"
#include "text/TextUtil.hpp"

namespace insights {

static std::string join_tokens(const std::vector<std::string>& toks, std::size_t begin, std::size_t end) {
    std::string out;
    for (std::size_t i = begin; i < end; ++i) {
        if (i > begin) out.push_back(' ');
        out += toks[i];
    }
    return out;
}

static std::size_t count_tokens(const std::string& phrase) {
    return static_cast<std::size_t>(std::count(phrase.begin(), phrase.end(), ' ')) + 1;
}

// Highest category weight wins; on equal weight the earlier (smaller id) concept is kept.
static void insert_term(std::unordered_map<std::string, TermInfo>& table, const std::string& key, const TermInfo& info) {
    auto it = table.find(key);
    if (it == table.end()) {
        table.emplace(key, info);
        return;
    }
    const double best = std::max(it->second.multiplier, info.multiplier);
    if (info.multiplier > it->second.multiplier) it->second = info;
    it->second.multiplier = best;
}

std::shared_ptr<const Taxonomy> Taxonomy::build(const std::vector<CategorySpec>& specs) {
    std::shared_ptr<Taxonomy> tax(new Taxonomy());
    tax->m_weights.fill(1.0);

    std::set<Category> seen_categories;
    for (const auto& spec : specs) {
        if (spec.category == Category::Other) {
            throw ConfigurationError("category 'other' is reserved for unrecognized terms");
        }
        if (!seen_categories.insert(spec.category).second) {
            throw ConfigurationError(std::string("duplicate category: ") + category_name(spec.category));
        }
        if (!std::isfinite(spec.weight) || spec.weight <= 0.0) {
            throw ConfigurationError(std::string("category ") + category_name(spec.category) +
                                     " has a non-positive weight");
        }
        tax->m_weights[category_index(spec.category)] = spec.weight;

        std::set<std::string> seen_concepts;
        for (const auto& [name, raw_terms] : spec.concepts) {
            if (name.empty()) {
                throw ConfigurationError(std::string("empty concept name in category ") + category_name(spec.category));
            }
            ConceptEntry entry;
            entry.name = name;
            entry.category = spec.category;
            entry.id = std::string(category_name(spec.category)) + "." + name;
            if (!seen_concepts.insert(name).second) {
                throw ConfigurationError("duplicate concept: " + entry.id);
            }

            std::set<std::string> seen_terms;
            for (const auto& raw : raw_terms) {
                const auto toks = textutil::normalize_text(raw);
                if (toks.empty()) continue;
                std::string term = join_tokens(toks, 0, toks.size());
                if (seen_terms.insert(term).second) entry.terms.push_back(std::move(term));
            }
            if (entry.terms.empty()) {
                throw ConfigurationError("concept " + entry.id + " has no usable terms");
            }
            entry.canonical = entry.terms.front();
            tax->m_concepts.push_back(std::move(entry));
        }
    }

    if (tax->m_concepts.empty()) {
        throw ConfigurationError("taxonomy defines no concepts");
    }

    std::sort(tax->m_concepts.begin(), tax->m_concepts.end(),
              [](const ConceptEntry& a, const ConceptEntry& b) { return a.id < b.id; });

    tax->m_max_weight = *std::max_element(tax->m_weights.begin(), tax->m_weights.end());

    for (std::size_t ci = 0; ci < tax->m_concepts.size(); ++ci) {
        const auto& c = tax->m_concepts[ci];
        const TermInfo info{ci, c.category, tax->weight(c.category)};

        for (const auto& term : c.terms) {
            insert_term(tax->m_terms, term, info);
            const std::size_t n = count_tokens(term);
            tax->m_max_phrase_tokens = std::max(tax->m_max_phrase_tokens, n);
            if (n == 1) insert_term(tax->m_stems, textutil::light_stem(term), info);
        }
    }

    return tax;
}

const TermInfo* Taxonomy::lookup(const std::string& term) const {
    auto it = m_terms.find(term);
    return it == m_terms.end() ? nullptr : &it->second;
}

const TermInfo* Taxonomy::lookup_stem(const std::string& stem) const {
    auto it = m_stems.find(stem);
    return it == m_stems.end() ? nullptr : &it->second;
}

std::vector<std::string> Taxonomy::resolve_phrases(const std::vector<std::string>& tokens) const {
    std::vector<std::string> out;
    out.reserve(tokens.size());

    std::size_t i = 0;
    while (i < tokens.size()) {
        const std::size_t longest = std::min(m_max_phrase_tokens, tokens.size() - i);
        bool matched = false;

        for (std::size_t n = longest; n >= 2; --n) {
            std::string phrase = join_tokens(tokens, i, i + n);
            if (m_terms.count(phrase)) {
                out.push_back(std::move(phrase));
                i += n;
                matched = true;
                break;
            }
        }
        if (!matched) {
            out.push_back(tokens[i]);
            ++i;
        }
    }
    return out;
}

std::vector<std::size_t> Taxonomy::concepts_in(const std::vector<std::string>& resolved_terms) const {
    std::set<std::size_t> found;
    for (const auto& t : resolved_terms) {
        if (const TermInfo* info = lookup(t)) found.insert(info->concept_index);
    }
    return std::vector<std::size_t>(found.begin(), found.end());
}

std::shared_ptr<const Taxonomy> Taxonomy::builtin() {
    static const std::shared_ptr<const Taxonomy> instance = build(builtin_specs());
    return instance;
}

std::vector<CategorySpec> Taxonomy::builtin_specs() {
    std::vector<CategorySpec> specs;

    specs.push_back({Category::DataStructures, 1.5, {
        {"array", {"array", "arrays", "arraylist", "vector", "2d array", "matrix", "subarray"}},
        {"linked_list", {"linked list", "linkedlist", "singly linked", "doubly linked", "circular linked"}},
        {"stack", {"stack", "stacks", "lifo", "monotonic stack"}},
        {"queue", {"queue", "queues", "fifo", "enqueue", "dequeue", "deque", "circular queue", "priority queue"}},
        {"tree", {"tree", "trees", "binary tree", "bst", "binary search tree", "balanced tree", "avl tree",
                  "red black tree", "segment tree"}},
        {"heap", {"heap", "heaps", "min heap", "max heap", "binary heap", "heapify"}},
        {"hash_table", {"hash table", "hashmap", "hashmaps", "hashtable", "hashset", "hash", "hashing", "dictionary"}},
        {"graph", {"graph", "graphs", "vertices", "adjacency", "directed graph", "undirected graph", "weighted graph"}},
        {"trie", {"trie", "prefix tree", "suffix tree", "radix tree"}},
    }});

    specs.push_back({Category::Algorithms, 1.4, {
        {"sorting", {"sorting", "sort", "merge sort", "quick sort", "quicksort", "heap sort", "bubble sort",
                     "insertion sort", "counting sort"}},
        {"searching", {"binary search", "linear search", "search"}},
        {"graph_traversal", {"dfs", "bfs", "depth first search", "breadth first search", "depth first",
                             "breadth first", "topological sort", "dijkstra", "shortest path", "union find"}},
        {"dynamic_programming", {"dynamic programming", "dp", "memoization", "tabulation", "optimal substructure",
                                 "overlapping subproblems", "knapsack"}},
        {"greedy", {"greedy", "greedy algorithm", "greedy approach", "local optimum"}},
        {"recursion", {"recursion", "recursive", "backtracking", "divide and conquer"}},
        {"two_pointers", {"two pointers", "two pointer", "sliding window", "fast slow pointer"}},
        {"string_algorithms", {"string", "strings", "substring", "string matching", "kmp", "rabin karp",
                               "palindrome", "anagram"}},
    }});

    specs.push_back({Category::SystemDesign, 1.6, {
        {"architecture", {"system design", "architecture", "high level design", "hld", "low level design", "lld"}},
        {"scalability", {"scalability", "scalable", "scaling", "horizontal scaling", "vertical scaling",
                         "scale out", "scale up"}},
        {"load_balancer", {"load balancer", "load balancing", "nginx", "haproxy", "round robin"}},
        {"database", {"database", "databases", "sql", "nosql", "mongodb", "mysql", "postgresql", "cassandra",
                      "dynamodb", "sharding", "replication", "partitioning", "indexing"}},
        {"caching", {"caching", "cache", "redis", "memcached", "cdn", "content delivery network"}},
        {"microservices", {"microservices", "microservice", "api", "apis", "rest api", "service oriented",
                           "distributed systems", "distributed system"}},
        {"messaging", {"message queue", "kafka", "rabbitmq", "pub sub", "message broker", "event driven"}},
        {"consistency", {"consistency", "acid", "cap theorem", "eventual consistency", "strong consistency"}},
    }});

    specs.push_back({Category::ProgrammingConcepts, 1.3, {
        {"oop", {"oop", "object oriented", "inheritance", "polymorphism", "encapsulation", "abstraction"}},
        {"concurrency", {"concurrency", "thread", "threads", "threading", "multithreading", "parallel", "async",
                         "synchronization", "mutex", "semaphore", "deadlock"}},
        {"design_patterns", {"design patterns", "design pattern", "singleton", "factory pattern", "observer pattern",
                             "decorator pattern", "strategy pattern", "builder pattern", "adapter pattern"}},
        {"complexity", {"time complexity", "space complexity", "complexity analysis", "complexity", "asymptotic"}},
    }});

    specs.push_back({Category::Technologies, 1.1, {
        {"languages", {"java", "python", "c++", "c", "c#", "javascript", "typescript", "golang", "rust", "scala",
                       "kotlin"}},
        {"frameworks", {"spring", "django", "react", "angular", "flask", "nodejs"}},
        {"cloud", {"aws", "azure", "gcp", "docker", "kubernetes", "ec2", "s3"}},
        {"databases", {"mysql", "postgresql", "postgres", "mongodb", "cassandra", "dynamodb", "elasticsearch",
                       "sqlite"}},
    }});

    specs.push_back({Category::Behavioral, 1.0, {
        {"behavioral_round", {"behavioral", "behavioural", "behavioral round", "hr round", "culture fit",
                              "star method"}},
        {"leadership", {"leadership", "leadership principles", "ownership", "mentoring"}},
        {"teamwork", {"teamwork", "team player", "collaboration", "conflict", "disagreement"}},
    }});

    return specs;
}

}  // namespace insights
