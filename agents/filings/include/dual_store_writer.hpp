#pragma once
#include "config.hpp"
#include "errors.hpp"
#include "fact_store.hpp"
#include "vector_store.hpp"
#include <string>
#include <vector>

class SyncWriteError : public PipelineError {
public:
    SyncWriteError(const std::string& msg, bool embeddings_cleaned, bool previous_kept = false)
        : PipelineError(ErrorKind::SyncWriteFailure, Stage::Write, msg), embeddings_cleaned_(embeddings_cleaned),
          previous_kept_(previous_kept) {}
    bool embeddings_cleaned() const { return embeddings_cleaned_; }
    // A failed replace() that left the stored version untouched; the caller
    // must not roll the document back.
    bool previous_kept() const { return previous_kept_; }

private:
    bool embeddings_cleaned_;
    bool previous_kept_;
};

struct WriteOutcome {
    std::size_t chunks_written{0};
    std::size_t embeddings_written{0};
    std::size_t records_written{0};
};

struct RollbackReport {
    bool clean{false};
    std::size_t chunks_removed{0};
    std::size_t embeddings_removed{0};
    int attempts{0};
    std::string error;
};

struct ReconcileReport {
    std::size_t documents_rolled_back{0};
    std::size_t orphaned_chunks_removed{0};
    std::size_t orphaned_embeddings_removed{0};
    std::vector<std::string> doc_ids;
};

// Persists one document into both stores so that every chunk row has exactly
// one embedding with the same (doc id, ordinal) key. Structured rows are
// written first, then embeddings one by one; the document only becomes
// visible ("ready") once both are complete. There is no shared coordinator:
// failures are undone with compensating deletes.
class DualStoreWriter {
public:
    DualStoreWriter(FactStore& facts, VectorStore& vectors, RetryPolicy rollback_retry);

    // On a vector failure, removes the embeddings already written and throws
    // SyncWriteError; the caller must then call rollback() for the rows.
    // A document id that is already stored raises DuplicateDocument and
    // touches nothing.
    WriteOutcome write(const Document& doc, const std::vector<Chunk>& chunks,
                       const std::vector<StructuredRecord>& records,
                       const std::vector<std::vector<float>>& embeddings);

    // Swaps a stored document for a new version. The new embeddings are
    // staged under a separate id first, so any failure up to the swap of the
    // structured rows keeps the previous version readable (previous_kept).
    // A failure after that point needs rollback() like write().
    WriteOutcome replace(const Document& doc, const std::vector<Chunk>& chunks,
                         const std::vector<StructuredRecord>& records,
                         const std::vector<std::vector<float>>& embeddings);

    // Deletes the document from both stores. Idempotent and retried; clean is
    // false only when the stores could not be emptied for this document.
    RollbackReport rollback(const std::string& doc_id);

    // Rolls back documents whose key sets differ between stores, documents
    // left "pending" for longer than grace_seconds, and embeddings whose
    // document no longer exists.
    ReconcileReport reconcile(int grace_seconds = 3600);

private:
    FactStore& facts_;
    VectorStore& vectors_;
    RetryPolicy retry_;
};
