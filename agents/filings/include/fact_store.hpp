#pragma once
#include "models.hpp"
#include "schema.hpp"
#include <nlohmann/json.hpp>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

struct sqlite3;

struct ChunkFilter {
    std::string doc_id;        // empty: any
    std::string entity;        // empty: any
    std::string fiscal_period; // empty: any
    std::string doc_type;      // empty: any
};

struct QueryRows {
    std::vector<std::string> columns;
    std::vector<std::vector<std::string>> rows;
    bool truncated{false};

    int column_index(const std::string& name) const;
};

// Structured (relational) store: documents, chunks, structured records and
// the derived fact rows, plus the monitoring tables. All writes go through
// parameterised statements. Readers only ever see documents in state "ready".
class FactStore {
public:
    explicit FactStore(const std::string& db_path);
    ~FactStore();
    FactStore(const FactStore&) = delete;
    FactStore& operator=(const FactStore&) = delete;

    std::optional<Document> find_document(const std::string& doc_id);
    std::vector<Document> documents();

    // Inserts the document as "pending" with its chunks, records and facts in
    // one local transaction. Throws PipelineError(DuplicateDocument) if the
    // document id is already stored.
    void write_document(const Document& doc, const std::vector<Chunk>& chunks,
                        const std::vector<StructuredRecord>& records);
    // Swaps every row of the document for the new version, left "pending",
    // in one local transaction. Returns the number of old chunks removed.
    std::size_t replace_document(const Document& doc, const std::vector<Chunk>& chunks,
                                 const std::vector<StructuredRecord>& records);
    void mark_ready(const std::string& doc_id);
    // Removes every row of the document. Idempotent; returns chunks removed.
    std::size_t delete_document(const std::string& doc_id);

    std::size_t chunk_count(const std::string& doc_id);
    std::vector<int> chunk_ordinals(const std::string& doc_id);
    std::vector<Chunk> load_chunks(const ChunkFilter& filter);
    std::vector<StructuredRecord> records(const std::string& doc_id);
    std::size_t fact_count(const std::string& doc_id);

    // Executes one read-only statement with bound parameters. Throws
    // PipelineError(ExecuteQuery) on rejection, SQL error or timeout.
    QueryRows run_select(const std::string& sql, const nlohmann::json& params,
                         int row_limit, int timeout_ms);

    // Tables exposed to generated queries.
    static SchemaDescription query_schema();

    template <typename Fn>
    auto with_db(Fn&& fn) -> decltype(fn(static_cast<sqlite3*>(nullptr))) {
        std::lock_guard<std::mutex> lock(mtx_);
        return fn(db_);
    }

private:
    void init();
    void insert_rows(const Document& doc, const std::vector<Chunk>& chunks,
                     const std::vector<StructuredRecord>& records);
    std::size_t delete_rows(const std::string& doc_id);

    std::mutex mtx_;
    sqlite3* db_{nullptr};
};

nlohmann::json record_payload(const StructuredRecord& rec);
