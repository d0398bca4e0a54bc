/**
 * @file builtin_tools.cpp
 * @brief Built-in tool implementations.
 */

#include "tools/builtin_tools.hpp"

#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace hybrid_router::tools {

namespace {

Result<std::string> text_param(const Json& params) {
    auto it = params.find("text");
    if (it == params.end() || !it->is_string()) {
        return Error{ErrorKind::InvalidParameters, "'text' must be a string"};
    }
    return it->get<std::string>();
}

/// Optional positive integer parameter.
Result<int64_t> positive_param(const Json& params, const char* name, int64_t fallback) {
    auto it = params.find(name);
    if (it == params.end()) return fallback;
    if (!it->is_number_integer() || it->get<int64_t>() <= 0) {
        return Error{ErrorKind::InvalidParameters, std::string{"'"} + name + "' must be a positive integer"};
    }
    return it->get<int64_t>();
}

/// Splits on anything that is not an ASCII letter, digit or apostrophe; bytes >= 0x80 count as letters.
std::vector<std::string> tokenize(std::string_view text) {
    std::vector<std::string> words;
    std::string current;
    for (char ch : text) {
        auto c = static_cast<unsigned char>(ch);
        if (std::isalnum(c) || c == '\'' || c >= 0x80) {
            current += static_cast<char>(c < 0x80 ? std::tolower(c) : c);
        } else if (!current.empty()) {
            words.push_back(std::move(current));
            current.clear();
        }
    }
    if (!current.empty()) words.push_back(std::move(current));
    return words;
}

const std::unordered_set<std::string>& stop_words() {
    static const std::unordered_set<std::string> words{
        "about", "after", "also", "been", "before", "being", "between", "both", "could",
        "does", "each", "from", "have", "here", "into", "just", "more", "most", "only",
        "other", "over", "same", "should", "some", "such", "than", "that", "their", "them",
        "then", "there", "these", "they", "this", "those", "through", "very", "were", "what",
        "when", "where", "which", "while", "will", "with", "would", "your"
    };
    return words;
}

Error cancelled() {
    return Error{ErrorKind::LocalTimeout, "Cancelled"};
}

}  // namespace

Result<Json> calculate_reading_time(const Json& params, std::stop_token /*stop*/) {
    auto text = text_param(params);
    if (!text) return text.error();

    auto wpm_param = positive_param(params, "wpm", 200);
    if (!wpm_param) return wpm_param.error();
    auto wpm = *wpm_param;

    auto words = static_cast<int64_t>(tokenize(*text).size());
    auto minutes = words == 0 ? 0 : std::max<int64_t>(1, (words + wpm - 1) / wpm);
    return Json{{"words", words}, {"minutes", minutes}, {"wpm", wpm}};
}

Result<Json> count_words(const Json& params, std::stop_token /*stop*/) {
    auto text = text_param(params);
    if (!text) return text.error();

    auto lines = text->empty() ? 0 : 1 + std::count(text->begin(), text->end(), '\n');
    return Json{
        {"words", tokenize(*text).size()},
        {"characters", text->size()},
        {"lines", lines}
    };
}

Result<Json> extract_keywords(const Json& params, std::stop_token stop) {
    auto text = text_param(params);
    if (!text) return text.error();

    auto top_param = positive_param(params, "top_n", 10);
    if (!top_param) return top_param.error();
    auto top_n = *top_param;

    std::map<std::string, int64_t> counts;
    size_t seen = 0;
    for (auto& word : tokenize(*text)) {
        if (++seen % 4096 == 0 && stop.stop_requested()) return cancelled();
        if (word.size() < 4 || stop_words().contains(word)) continue;
        counts[std::move(word)] += 1;
    }

    std::vector<std::pair<std::string, int64_t>> ranked(counts.begin(), counts.end());
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (ranked.size() > static_cast<size_t>(top_n)) ranked.resize(static_cast<size_t>(top_n));

    Json keywords = Json::array();
    for (const auto& [word, count] : ranked) {
        keywords.push_back({{"word", word}, {"count", count}});
    }
    return Json{{"keywords", keywords}};
}

Result<Json> build_graph(const Json& params, std::stop_token stop) {
    auto it = params.find("edges");
    if (it == params.end() || !it->is_array()) {
        return Error{ErrorKind::InvalidParameters, "'edges' must be an array of [from, to] pairs"};
    }

    std::map<std::string, std::set<std::string>> adjacency;
    size_t edge_count = 0;
    for (const auto& edge : *it) {
        if (!edge.is_array() || edge.size() != 2 || !edge[0].is_string() || !edge[1].is_string()) {
            return Error{ErrorKind::InvalidParameters, "Each edge must be a pair of strings"};
        }
        auto from = edge[0].get<std::string>();
        auto to = edge[1].get<std::string>();
        adjacency[from].insert(to);
        adjacency[to].insert(from);
        ++edge_count;
    }

    // Connected components by iterative DFS.
    std::unordered_map<std::string, bool> visited;
    int64_t components = 0;
    for (const auto& [node, neighbours] : adjacency) {
        if (visited[node]) continue;
        if (stop.stop_requested()) return cancelled();
        ++components;
        std::vector<std::string> stack{node};
        while (!stack.empty()) {
            auto current = std::move(stack.back());
            stack.pop_back();
            if (visited[current]) continue;
            visited[current] = true;
            for (const auto& next : adjacency[current]) {
                if (!visited[next]) stack.push_back(next);
            }
        }
    }

    Json degree = Json::object();
    Json nodes = Json::array();
    for (const auto& [node, neighbours] : adjacency) {
        nodes.push_back(node);
        degree[node] = neighbours.size();
    }

    return Json{
        {"nodes", nodes},
        {"edge_count", edge_count},
        {"degree", degree},
        {"components", components}
    };
}

void register_builtin_tools(LocalExecutor& executor, Classifier* classifier) {
    struct Builtin {
        const char* name;
        ToolFunction fn;
        Tier tier;
        std::vector<std::string> required;
    };

    std::vector<Builtin> builtins{
        {"calculate_reading_time", calculate_reading_time, Tier::Simple, {"text"}},
        {"count_words", count_words, Tier::Simple, {"text"}},
        {"extract_keywords", extract_keywords, Tier::Medium, {"text"}},
        {"build_graph", build_graph, Tier::Complex, {"edges"}},
    };

    for (auto& b : builtins) {
        executor.register_tool(b.name, std::move(b.fn));
        if (classifier && !classifier->lookup(b.name)) {
            classifier->register_tool(b.name, b.tier, std::move(b.required));
        }
    }
}

}  // namespace hybrid_router::tools
