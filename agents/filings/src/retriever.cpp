#include "../include/retriever.hpp"
#include "../include/errors.hpp"
#include "../include/lexical.hpp"
#include <algorithm>
#include <chrono>
#include <future>
#include <iostream>
#include <limits>
#include <map>
#include <set>
#include <stdexcept>
#include <unordered_map>

std::vector<FusedEntry> reciprocal_rank_fusion(const std::vector<std::string>& lexical,
                                               const std::vector<std::string>& vector, double k_rrf) {
    std::map<std::string, FusedEntry> acc;
    auto add = [&](const std::vector<std::string>& ranking, bool is_lexical) {
        for (std::size_t r = 0; r < ranking.size(); ++r) {
            auto& e = acc[ranking[r]];
            e.id = ranking[r];
            int& rank = is_lexical ? e.lexical_rank : e.vector_rank;
            if (rank >= 0) continue; // first occurrence wins
            rank = (int)r;
            e.score += 1.0 / (k_rrf + (double)r + 1.0);
        }
    };
    add(lexical, true);
    add(vector, false);

    std::vector<FusedEntry> out;
    out.reserve(acc.size());
    for (auto& kv : acc) out.push_back(std::move(kv.second));
    auto rank_key = [](int r) { return r < 0 ? std::numeric_limits<int>::max() : r; };
    std::sort(out.begin(), out.end(), [&](const FusedEntry& a, const FusedEntry& b) {
        if (a.score != b.score) return a.score > b.score;
        if (a.lexical_rank != b.lexical_rank) return rank_key(a.lexical_rank) < rank_key(b.lexical_rank);
        if (a.vector_rank != b.vector_rank) return rank_key(a.vector_rank) < rank_key(b.vector_rank);
        return a.id < b.id;
    });
    return out;
}

HybridRetriever::HybridRetriever(FactStore& facts, VectorStore& vectors, EmbeddingClient& embedder,
                                 RetrievalOptions opts)
    : facts_(facts), vectors_(vectors), embedder_(embedder), opts_(opts) {
    if (opts_.top_k < 1 || opts_.candidate_pool < 1) throw std::invalid_argument("top_k and candidate_pool must be >= 1");
    if (opts_.k_rrf < 0) throw std::invalid_argument("k_rrf must be >= 0");
}

std::vector<std::string> HybridRetriever::vector_ranking(const std::string& query, const std::vector<Chunk>& pool) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts_.vector_timeout_ms);
    auto qv = embedder_.embed({query});
    if (qv.size() != 1) throw PipelineError(ErrorKind::EmbeddingFailure, Stage::Retrieve, "query embedding missing");

    std::set<std::string> docs;
    std::set<std::string> members;
    for (const auto& c : pool) {
        docs.insert(c.doc_id);
        members.insert(c.key());
    }
    // Every pool member is scored; only the output is capped.
    auto hits = vectors_.nearest(qv[0], (int)pool.size(), std::vector<std::string>(docs.begin(), docs.end()), deadline);

    std::vector<std::string> out;
    for (const auto& h : hits) {
        if ((int)out.size() >= opts_.candidate_pool) break;
        std::string id = h.key.doc_id + "#" + std::to_string(h.key.ordinal);
        if (members.count(id)) out.push_back(std::move(id));
    }
    return out;
}

RetrievalResult HybridRetriever::retrieve(const std::string& query, const std::vector<Chunk>& pool, int top_k) {
    RetrievalResult res;
    if (pool.empty()) return res;
    if (top_k < 1) top_k = opts_.top_k;

    auto lexical_deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(opts_.lexical_timeout_ms);
    auto lex_future = std::async(std::launch::async, [&] {
        std::vector<std::string> ids;
        for (auto i : rank_lexical(query, pool, lexical_deadline)) {
            if ((int)ids.size() >= opts_.candidate_pool) break;
            ids.push_back(pool[i].key());
        }
        return ids;
    });
    auto vec_future = std::async(std::launch::async, [&] { return vector_ranking(query, pool); });

    std::vector<std::string> lexical, vector;
    ErrorKind fail_kind = ErrorKind::Timeout;
    try {
        lexical = lex_future.get();
    } catch (const PipelineError& e) {
        res.lexical_ok = false;
        fail_kind = e.kind();
        res.warnings.push_back(std::string("lexical ranking failed: ") + e.what());
    } catch (const std::exception& e) {
        res.lexical_ok = false;
        res.warnings.push_back(std::string("lexical ranking failed: ") + e.what());
    }
    try {
        vector = vec_future.get();
    } catch (const PipelineError& e) {
        res.vector_ok = false;
        if (res.lexical_ok) fail_kind = e.kind();
        res.warnings.push_back(std::string("vector ranking failed: ") + e.what());
    } catch (const std::exception& e) {
        res.vector_ok = false;
        res.warnings.push_back(std::string("vector ranking failed: ") + e.what());
    }
    for (const auto& w : res.warnings) std::cerr << "[query] " << w << "\n";
    if (!res.lexical_ok && !res.vector_ok) {
        throw PipelineError(fail_kind, Stage::Retrieve, "both rankings failed: " + res.warnings.front());
    }

    std::unordered_map<std::string, const Chunk*> by_id;
    for (const auto& c : pool) by_id.emplace(c.key(), &c);
    for (const auto& f : reciprocal_rank_fusion(lexical, vector, opts_.k_rrf)) {
        if ((int)res.results.size() >= top_k) break;
        auto it = by_id.find(f.id);
        if (it == by_id.end()) continue;
        RankedResult r;
        r.chunk = *it->second;
        r.score = f.score;
        r.lexical_rank = f.lexical_rank;
        r.vector_rank = f.vector_rank;
        res.results.push_back(std::move(r));
    }
    return res;
}

RetrievalResult HybridRetriever::retrieve(const std::string& query, const ChunkFilter& scope, int top_k) {
    return retrieve(query, facts_.load_chunks(scope), top_k);
}
