#include "../include/lexical.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cmath>
#include <set>
#include <unordered_map>

std::vector<std::size_t> rank_lexical(const std::string& query, const std::vector<Chunk>& pool,
                                      std::chrono::steady_clock::time_point deadline, Bm25Params params) {
    auto terms = tokenize_terms(query);
    std::set<std::string> qterms(terms.begin(), terms.end());
    if (qterms.empty() || pool.empty()) return {};

    std::vector<std::unordered_map<std::string, int>> tf(pool.size());
    std::vector<std::size_t> len(pool.size(), 0);
    std::unordered_map<std::string, int> df;
    std::size_t total = 0;
    for (std::size_t i = 0; i < pool.size(); ++i) {
        if (i % 64 == 0 && std::chrono::steady_clock::now() > deadline) {
            throw PipelineError(ErrorKind::Timeout, Stage::Retrieve, "lexical ranking timed out", true);
        }
        auto words = tokenize_terms(pool[i].text);
        len[i] = words.size();
        total += words.size();
        for (const auto& w : words) {
            if (qterms.count(w) && tf[i][w]++ == 0) ++df[w];
        }
    }

    const double n = (double)pool.size();
    const double avg_len = total > 0 ? (double)total / n : 1.0;
    std::vector<std::pair<double, std::size_t>> scored;
    for (std::size_t i = 0; i < pool.size(); ++i) {
        if (tf[i].empty()) continue;
        double score = 0.0;
        for (const auto& kv : tf[i]) {
            double d = df[kv.first];
            double idf = std::log((n - d + 0.5) / (d + 0.5) + 1.0);
            double f = kv.second;
            score += idf * (f * (params.k1 + 1.0)) / (f + params.k1 * (1.0 - params.b + params.b * len[i] / avg_len));
        }
        scored.emplace_back(score, i);
    }
    std::stable_sort(scored.begin(), scored.end(),
                     [](const auto& a, const auto& b) { return a.first > b.first; });

    std::vector<std::size_t> out;
    out.reserve(scored.size());
    for (const auto& s : scored) out.push_back(s.second);
    return out;
}
