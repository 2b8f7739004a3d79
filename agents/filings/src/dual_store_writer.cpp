#include "../include/dual_store_writer.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <chrono>
#include <iostream>
#include <map>
#include <set>
#include <thread>

DualStoreWriter::DualStoreWriter(FactStore& facts, VectorStore& vectors, RetryPolicy rollback_retry)
    : facts_(facts), vectors_(vectors), retry_(rollback_retry) {}

namespace {
void check_shape(const std::string& doc_id, const std::vector<Chunk>& chunks,
                 const std::vector<std::vector<float>>& embeddings, bool previous_kept) {
    if (chunks.size() != embeddings.size()) {
        throw SyncWriteError(doc_id + ": " + std::to_string(chunks.size()) + " chunks but " +
                             std::to_string(embeddings.size()) + " embeddings", true, previous_kept);
    }
    for (size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].ordinal != (int)i || chunks[i].doc_id != doc_id) {
            throw SyncWriteError(doc_id + ": chunk ordinals must be contiguous from 0", true, previous_kept);
        }
    }
}
}

WriteOutcome DualStoreWriter::write(const Document& doc, const std::vector<Chunk>& chunks,
                                    const std::vector<StructuredRecord>& records,
                                    const std::vector<std::vector<float>>& embeddings) {
    const std::string doc_id = doc.id.key();
    check_shape(doc_id, chunks, embeddings, false);

    try {
        facts_.write_document(doc, chunks, records);
    } catch (const PipelineError& e) {
        if (e.kind() == ErrorKind::DuplicateDocument) throw;
        throw SyncWriteError(doc_id + ": structured write failed: " + e.what(), true);
    } catch (const std::exception& e) {
        // The local transaction rolled itself back; nothing is persisted.
        throw SyncWriteError(doc_id + ": structured write failed: " + e.what(), true);
    }

    WriteOutcome out;
    out.chunks_written = chunks.size();
    out.records_written = records.size();
    std::vector<EmbeddingKey> written;
    written.reserve(chunks.size());
    try {
        for (size_t i = 0; i < chunks.size(); ++i) {
            EmbeddingKey key{doc_id, chunks[i].ordinal};
            vectors_.put(key, embeddings[i]);
            written.push_back(key);
        }
    } catch (const std::exception& e) {
        std::string reason = e.what();
        std::cerr << "[store] " << doc_id << ": vector write failed after " << written.size() << "/"
                  << chunks.size() << " embeddings: " << reason << "\n";
        bool cleaned = true;
        for (const auto& key : written) {
            try {
                vectors_.remove(key);
            } catch (const std::exception& re) {
                cleaned = false;
                std::cerr << "[store] " << doc_id << ": could not remove embedding " << key.ordinal
                          << ": " << re.what() << "\n";
            }
        }
        throw SyncWriteError(doc_id + ": vector write failed: " + reason, cleaned);
    }
    out.embeddings_written = written.size();

    try {
        facts_.mark_ready(doc_id);
    } catch (const std::exception& e) {
        throw SyncWriteError(doc_id + ": could not publish document: " + e.what(), false);
    }
    return out;
}

WriteOutcome DualStoreWriter::replace(const Document& doc, const std::vector<Chunk>& chunks,
                                      const std::vector<StructuredRecord>& records,
                                      const std::vector<std::vector<float>>& embeddings) {
    const std::string doc_id = doc.id.key();
    const std::string staged = doc_id + "~staged";
    check_shape(doc_id, chunks, embeddings, true);

    auto drop_staged = [&]() {
        try {
            vectors_.remove_document(staged);
            return true;
        } catch (const std::exception& e) {
            std::cerr << "[store] " << doc_id << ": could not remove staged embeddings: " << e.what() << "\n";
            return false;
        }
    };

    try {
        drop_staged();
        for (size_t i = 0; i < chunks.size(); ++i) vectors_.put({staged, chunks[i].ordinal}, embeddings[i]);
    } catch (const std::exception& e) {
        std::cerr << "[store] " << doc_id << ": staging new version failed: " << e.what() << "\n";
        bool cleaned = drop_staged();
        throw SyncWriteError(doc_id + ": vector write failed: " + e.what(), cleaned, true);
    }

    try {
        facts_.replace_document(doc, chunks, records);
    } catch (const std::exception& e) {
        bool cleaned = drop_staged();
        throw SyncWriteError(doc_id + ": structured write failed: " + e.what(), cleaned, true);
    }

    // From here the stored rows are the new version; failures need a rollback.
    try {
        vectors_.rename_document(staged, doc_id);
    } catch (const std::exception& e) {
        bool cleaned = drop_staged();
        throw SyncWriteError(doc_id + ": could not swap embeddings: " + e.what(), cleaned);
    }
    try {
        facts_.mark_ready(doc_id);
    } catch (const std::exception& e) {
        throw SyncWriteError(doc_id + ": could not publish document: " + e.what(), false);
    }

    WriteOutcome out;
    out.chunks_written = chunks.size();
    out.embeddings_written = embeddings.size();
    out.records_written = records.size();
    return out;
}

RollbackReport DualStoreWriter::rollback(const std::string& doc_id) {
    RollbackReport rep;
    int backoff_ms = retry_.initial_backoff_ms;
    for (rep.attempts = 1; rep.attempts <= retry_.max_attempts; ++rep.attempts) {
        try {
            rep.embeddings_removed += vectors_.remove_document(doc_id);
            rep.chunks_removed += facts_.delete_document(doc_id);
            if (vectors_.count(doc_id) == 0 && facts_.chunk_count(doc_id) == 0 && !facts_.find_document(doc_id)) {
                rep.clean = true;
                rep.error.clear();
                return rep;
            }
            rep.error = "rows still present after delete";
        } catch (const std::exception& e) {
            rep.error = e.what();
        }
        std::cerr << "[store] " << doc_id << ": rollback attempt " << rep.attempts << " failed: " << rep.error << "\n";
        if (rep.attempts < retry_.max_attempts) {
            std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
            backoff_ms = std::min(retry_.max_backoff_ms, backoff_ms * 2);
        }
    }
    rep.attempts = retry_.max_attempts;
    return rep;
}

ReconcileReport DualStoreWriter::reconcile(int grace_seconds) {
    ReconcileReport rep;
    std::map<std::string, std::set<int>> vector_keys;
    for (const auto& k : vectors_.keys()) vector_keys[k.doc_id].insert(k.ordinal);

    const auto cutoff = unix_now() - grace_seconds;
    std::set<std::string> known;
    for (const auto& doc : facts_.documents()) {
        const std::string doc_id = doc.id.key();
        known.insert(doc_id);
        auto ords = facts_.chunk_ordinals(doc_id);
        std::set<int> chunk_set(ords.begin(), ords.end());
        const auto& emb_set = vector_keys[doc_id];

        bool stuck = doc.status != "ready" && doc.retrieved_at <= cutoff;
        bool mismatch = doc.status == "ready" && chunk_set != emb_set;
        if (!stuck && !mismatch) continue;

        for (int o : chunk_set) if (!emb_set.count(o)) ++rep.orphaned_chunks_removed;
        for (int o : emb_set) if (!chunk_set.count(o)) ++rep.orphaned_embeddings_removed;
        auto rb = rollback(doc_id);
        if (!rb.clean) {
            std::cerr << "[store] ALERT " << doc_id << ": reconcile could not roll back: " << rb.error << "\n";
            continue;
        }
        ++rep.documents_rolled_back;
        rep.doc_ids.push_back(doc_id);
    }

    for (const auto& kv : vector_keys) {
        if (known.count(kv.first) || kv.second.empty()) continue;
        rep.orphaned_embeddings_removed += vectors_.remove_document(kv.first);
    }
    return rep;
}
