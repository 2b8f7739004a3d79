#pragma once
#include "models.hpp"
#include <chrono>
#include <string>
#include <vector>

struct Bm25Params {
    double k1{1.2};
    double b{0.75};
};

// Okapi BM25 over the candidate pool. Returns indices into pool, best first;
// chunks sharing no term with the query are left out. Equal scores keep pool
// order. Throws PipelineError(Timeout) once the deadline passes.
std::vector<std::size_t> rank_lexical(const std::string& query, const std::vector<Chunk>& pool,
                                      std::chrono::steady_clock::time_point deadline,
                                      Bm25Params params = {});
