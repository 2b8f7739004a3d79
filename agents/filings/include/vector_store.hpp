#pragma once
#include "models.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

struct VectorHit {
    EmbeddingKey key;
    float score{0.0f}; // cosine similarity
};

// One logical collection keyed by (document id, chunk ordinal).
class VectorStore {
public:
    virtual ~VectorStore() = default;

    virtual void put(const EmbeddingKey& key, const std::vector<float>& vec) = 0;
    virtual void remove(const EmbeddingKey& key) = 0;
    // Idempotent; returns the number of embeddings removed.
    virtual std::size_t remove_document(const std::string& doc_id) = 0;
    // Moves every embedding of `from` to `to`, dropping what `to` held, as one
    // step. Returns the number of embeddings moved.
    virtual std::size_t rename_document(const std::string& from, const std::string& to) = 0;
    virtual std::size_t count(const std::string& doc_id) = 0;
    virtual std::vector<EmbeddingKey> keys() = 0;
    // Best first. doc_ids restricts the search when non-empty. Throws
    // PipelineError(Timeout) once the deadline passes.
    virtual std::vector<VectorHit> nearest(const std::vector<float>& query, int k,
                                           const std::vector<std::string>& doc_ids,
                                           std::chrono::steady_clock::time_point deadline) = 0;
};

class SqliteVectorStore : public VectorStore {
public:
    SqliteVectorStore(const std::string& db_path, int dimensions);
    ~SqliteVectorStore() override;
    SqliteVectorStore(const SqliteVectorStore&) = delete;
    SqliteVectorStore& operator=(const SqliteVectorStore&) = delete;

    void put(const EmbeddingKey& key, const std::vector<float>& vec) override;
    void remove(const EmbeddingKey& key) override;
    std::size_t remove_document(const std::string& doc_id) override;
    std::size_t rename_document(const std::string& from, const std::string& to) override;
    std::size_t count(const std::string& doc_id) override;
    std::vector<EmbeddingKey> keys() override;
    std::vector<VectorHit> nearest(const std::vector<float>& query, int k,
                                   const std::vector<std::string>& doc_ids,
                                   std::chrono::steady_clock::time_point deadline) override;

private:
    std::mutex mtx_;
    sqlite3* db_{nullptr};
    int dims_;
};
