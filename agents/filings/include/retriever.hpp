#pragma once
#include "config.hpp"
#include "fact_store.hpp"
#include "model_clients.hpp"
#include "vector_store.hpp"
#include <string>
#include <vector>

struct FusedEntry {
    std::string id;
    double score{0.0};
    int lexical_rank{-1};
    int vector_rank{-1};
};

// Reciprocal Rank Fusion: each ranking adds 1 / (k_rrf + r + 1) for an id at
// 0-based rank r. Sorted by score descending; ties go to the better lexical
// rank, then the better vector rank, then the id. Ids absent from a ranking
// rank after every id present in it.
std::vector<FusedEntry> reciprocal_rank_fusion(const std::vector<std::string>& lexical,
                                               const std::vector<std::string>& vector, double k_rrf);

struct RetrievalResult {
    std::vector<RankedResult> results;
    bool lexical_ok{true};
    bool vector_ok{true};
    std::vector<std::string> warnings;
};

// Lexical and vector rankings run concurrently over the same pool, each
// keeping its best candidate_pool ids, and are fused. One failed ranking
// degrades to the other; both failing throws PipelineError(Retrieve).
class HybridRetriever {
public:
    HybridRetriever(FactStore& facts, VectorStore& vectors, EmbeddingClient& embedder, RetrievalOptions opts);

    RetrievalResult retrieve(const std::string& query, const std::vector<Chunk>& pool, int top_k);
    // Pool is every ready chunk matching the filter.
    RetrievalResult retrieve(const std::string& query, const ChunkFilter& scope, int top_k);

    const RetrievalOptions& options() const { return opts_; }

private:
    std::vector<std::string> vector_ranking(const std::string& query, const std::vector<Chunk>& pool);

    FactStore& facts_;
    VectorStore& vectors_;
    EmbeddingClient& embedder_;
    RetrievalOptions opts_;
};
