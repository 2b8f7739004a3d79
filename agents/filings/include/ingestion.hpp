#pragma once
#include "acquirer.hpp"
#include "config.hpp"
#include "dual_store_writer.hpp"
#include "errors.hpp"
#include "fact_store.hpp"
#include "model_clients.hpp"
#include "monitor.hpp"
#include "vector_store.hpp"
#include <optional>
#include <string>
#include <vector>

struct IngestRequest {
    std::string locator;
    DocumentId id;
};

struct IngestFailure {
    Stage stage{Stage::Acquire};
    ErrorKind kind{ErrorKind::AcquisitionFailure};
    std::string message;
    bool cleaned_up{true};      // no partial data of this document is left in either store
    bool operator_alert{false}; // rollback failed; orphaned data needs manual cleanup
};

struct IngestResult {
    bool success{false};
    std::string doc_id;
    std::size_t chunks_written{0};
    std::size_t embeddings_written{0};
    std::size_t records_written{0};
    double elapsed_ms{0.0};
    bool degraded{false}; // structured extraction failed, text ingested
    std::vector<std::string> warnings;
    std::optional<IngestFailure> failure;
};

// Runs acquire -> extract text -> extract regions -> chunk -> embed -> write
// for one document at a time. ingest() never throws; every failure comes back
// as an IngestResult naming the stage.
class IngestionOrchestrator {
public:
    // vision and monitor may be null: no structured extraction, no history.
    IngestionOrchestrator(DocumentAcquirer& acquirer, EmbeddingClient& embedder, VisionClient* vision,
                          FactStore& facts, VectorStore& vectors, PipelineMonitor* monitor,
                          IngestOptions opts, double vision_cost_per_region = 0.0);

    IngestResult ingest(const IngestRequest& req);
    // Independent documents run on opts.workers threads; results keep input order.
    std::vector<IngestResult> ingest_batch(const std::vector<IngestRequest>& reqs);

    DualStoreWriter& writer() { return writer_; }

private:
    IngestResult run(const IngestRequest& req);
    void record(const IngestResult& res);

    DocumentAcquirer& acquirer_;
    EmbeddingClient& embedder_;
    VisionClient* vision_;
    FactStore& facts_;
    PipelineMonitor* monitor_;
    IngestOptions opts_;
    double vision_cost_;
    DualStoreWriter writer_;
};
