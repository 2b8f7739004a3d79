#include "../include/ingestion.hpp"
#include "../include/sqlite_util.hpp"
#include "../include/util.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>
#include <algorithm>

namespace {

IngestOptions fast_options() {
    IngestOptions o;
    o.retry = RetryPolicy{3, 1, 4};
    return o;
}

class IngestionTest : public ::testing::Test {
protected:
    IngestionTest() : facts(":memory:"), vectors(embedder.dimensions()), vision(sample_regions()), monitor(facts) {
        acquirer.add("mem://acme-2020", "text/plain", sample_filing());
        acquirer.add("mem://acme-2020-v2", "text/plain", sample_filing() + "Item 9A. Controls and Procedures\nNo changes.\n");
    }

    IngestionOrchestrator make(IngestOptions opts = fast_options()) {
        return IngestionOrchestrator(acquirer, embedder, &vision, facts, vectors, &monitor, opts, 0.01);
    }

    void expect_in_sync(const std::string& doc_id) {
        auto ordinals = facts.chunk_ordinals(doc_id);
        std::vector<int> vector_ordinals;
        for (const auto& k : vectors.keys()) {
            if (k.doc_id == doc_id) vector_ordinals.push_back(k.ordinal);
        }
        std::sort(vector_ordinals.begin(), vector_ordinals.end());
        EXPECT_EQ(ordinals, vector_ordinals);
        EXPECT_EQ(facts.chunk_count(doc_id), vectors.count(doc_id));
    }

    void expect_absent(const std::string& doc_id) {
        EXPECT_FALSE(facts.find_document(doc_id).has_value());
        EXPECT_EQ(facts.chunk_count(doc_id), 0u);
        EXPECT_EQ(facts.fact_count(doc_id), 0u);
        EXPECT_EQ(vectors.count(doc_id), 0u);
    }

    HashingEmbeddingClient embedder;
    FactStore facts;
    FaultyVectorStore vectors;
    MemoryAcquirer acquirer;
    ScriptedVision vision;
    PipelineMonitor monitor;
    DocumentId acme{"ACME", "10-K", "2020"};
};

TEST_F(IngestionTest, SuccessfulIngestKeepsStoresInSync) {
    auto orch = make();
    auto res = orch.ingest({"mem://acme-2020", acme});

    ASSERT_TRUE(res.success) << res.failure->message;
    EXPECT_EQ(res.doc_id, "ACME_10-K_2020");
    EXPECT_EQ(res.chunks_written, 5u); // preamble + items 1, 1A, 7, 8
    EXPECT_EQ(res.embeddings_written, res.chunks_written);
    EXPECT_EQ(res.records_written, 1u);
    EXPECT_FALSE(res.degraded);
    expect_in_sync(res.doc_id);

    auto doc = facts.find_document(res.doc_id);
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->status, "ready");
    EXPECT_EQ(doc->content_sha256, sha256_hex(sample_filing()));
    EXPECT_EQ(facts.fact_count(res.doc_id), 4u);
    EXPECT_EQ(vision.pages, std::vector<int>{2});
}

TEST_F(IngestionTest, ChunksCarrySectionsAndPages) {
    auto orch = make();
    ASSERT_TRUE(orch.ingest({"mem://acme-2020", acme}).success);

    ChunkFilter f;
    f.doc_id = acme.key();
    auto chunks = facts.load_chunks(f);
    ASSERT_EQ(chunks.size(), 5u);
    EXPECT_EQ(chunks[0].section, "Preamble");
    EXPECT_EQ(chunks[2].section, "Item 1A.");
    EXPECT_EQ(chunks[4].section, "Item 8.");
    EXPECT_EQ(chunks[3].page, 1);
    EXPECT_EQ(chunks[4].page, 2);
}

TEST_F(IngestionTest, VectorFailureAfterSomeEmbeddingsRollsBackBothStores) {
    vectors.fail_after = 2;
    auto orch = make();
    auto res = orch.ingest({"mem://acme-2020", acme});

    ASSERT_FALSE(res.success);
    ASSERT_TRUE(res.failure.has_value());
    EXPECT_EQ(res.failure->stage, Stage::Write);
    EXPECT_EQ(res.failure->kind, ErrorKind::SyncWriteFailure);
    EXPECT_TRUE(res.failure->cleaned_up);
    EXPECT_FALSE(res.failure->operator_alert);
    EXPECT_EQ(vectors.puts, 2);
    expect_absent(acme.key());
}

TEST_F(IngestionTest, FailedRollbackRaisesOperatorAlert) {
    vectors.fail_after = 3;
    vectors.fail_removes = true;
    auto orch = make();
    auto res = orch.ingest({"mem://acme-2020", acme});

    ASSERT_FALSE(res.success);
    EXPECT_EQ(res.failure->kind, ErrorKind::SyncWriteFailure);
    EXPECT_FALSE(res.failure->cleaned_up);
    EXPECT_TRUE(res.failure->operator_alert);

    // Not visible to readers even though rows are left behind.
    ChunkFilter f;
    f.doc_id = acme.key();
    EXPECT_TRUE(facts.load_chunks(f).empty());

    vectors.fail_removes = false;
    auto rep = orch.writer().reconcile(0);
    EXPECT_EQ(rep.documents_rolled_back, 1u);
    expect_absent(acme.key());
}

TEST_F(IngestionTest, DuplicateIsRejectedWithoutFetching) {
    auto orch = make();
    ASSERT_TRUE(orch.ingest({"mem://acme-2020", acme}).success);
    int calls = acquirer.calls;
    auto chunks_before = facts.chunk_count(acme.key());

    auto res = orch.ingest({"mem://acme-2020", acme});
    ASSERT_FALSE(res.success);
    EXPECT_EQ(res.failure->kind, ErrorKind::DuplicateDocument);
    EXPECT_TRUE(res.failure->cleaned_up);
    EXPECT_EQ(acquirer.calls, calls);
    EXPECT_EQ(facts.chunk_count(acme.key()), chunks_before);
    expect_in_sync(acme.key());
}

TEST_F(IngestionTest, ReplaceExistingSwapsTheDocument) {
    ASSERT_TRUE(make().ingest({"mem://acme-2020", acme}).success);

    auto opts = fast_options();
    opts.replace_existing = true;
    auto res = make(opts).ingest({"mem://acme-2020-v2", acme});

    ASSERT_TRUE(res.success) << res.failure->message;
    EXPECT_EQ(res.chunks_written, 6u);
    EXPECT_NE(std::find(res.warnings.begin(), res.warnings.end(), "replaced previous version"), res.warnings.end());
    EXPECT_EQ(facts.find_document(acme.key())->source_url, "mem://acme-2020-v2");
    expect_in_sync(acme.key());
}

TEST_F(IngestionTest, FailedReplacementKeepsThePreviousVersion) {
    ASSERT_TRUE(make().ingest({"mem://acme-2020", acme}).success);
    auto chunks_before = facts.chunk_count(acme.key());
    auto facts_before = facts.fact_count(acme.key());

    auto opts = fast_options();
    opts.replace_existing = true;
    vectors.fail_after = vectors.puts + 2;
    auto res = make(opts).ingest({"mem://acme-2020-v2", acme});

    ASSERT_FALSE(res.success);
    EXPECT_EQ(res.failure->kind, ErrorKind::SyncWriteFailure);
    EXPECT_TRUE(res.failure->cleaned_up);
    EXPECT_FALSE(res.failure->operator_alert);
    EXPECT_NE(std::find(res.warnings.begin(), res.warnings.end(), "previous version kept"), res.warnings.end());

    auto doc = facts.find_document(acme.key());
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(doc->status, "ready");
    EXPECT_EQ(doc->source_url, "mem://acme-2020");
    EXPECT_EQ(facts.chunk_count(acme.key()), chunks_before);
    EXPECT_EQ(facts.fact_count(acme.key()), facts_before);
    EXPECT_EQ(vectors.count(acme.key() + "~staged"), 0u);
    expect_in_sync(acme.key());

    ChunkFilter f;
    f.doc_id = acme.key();
    EXPECT_EQ(facts.load_chunks(f).size(), chunks_before);
}

TEST_F(IngestionTest, ReplacementFailingAfterTheSwapIsRolledBack) {
    ASSERT_TRUE(make().ingest({"mem://acme-2020", acme}).success);

    auto opts = fast_options();
    opts.replace_existing = true;
    vectors.fail_renames = true;
    auto res = make(opts).ingest({"mem://acme-2020-v2", acme});

    ASSERT_FALSE(res.success);
    EXPECT_EQ(res.failure->kind, ErrorKind::SyncWriteFailure);
    EXPECT_TRUE(res.failure->cleaned_up);
    EXPECT_EQ(vectors.count(acme.key() + "~staged"), 0u);
    expect_absent(acme.key());
}

TEST_F(IngestionTest, VisionFailureDegradesButIngests) {
    vision.fail = true;
    auto res = make().ingest({"mem://acme-2020", acme});

    ASSERT_TRUE(res.success);
    EXPECT_TRUE(res.degraded);
    EXPECT_EQ(res.records_written, 0u);
    EXPECT_FALSE(res.warnings.empty());
    EXPECT_EQ(vision.calls, 3); // retried up to the attempt limit
    expect_in_sync(acme.key());

    auto errors = monitor.error_history(5);
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors.front().kind, "StructuredExtractionDegraded");
}

TEST_F(IngestionTest, VisionCostIsTracked) {
    ASSERT_TRUE(make().ingest({"mem://acme-2020", acme}).success);
    EXPECT_NEAR(monitor.total_cost(1), 0.01, 1e-9);
}

TEST_F(IngestionTest, BinaryInputIsAnExtractionFailure) {
    acquirer.add("mem://scan", "application/pdf", "%PDF-1.7 ...");
    auto res = make().ingest({"mem://scan", acme});

    ASSERT_FALSE(res.success);
    EXPECT_EQ(res.failure->stage, Stage::ExtractText);
    EXPECT_EQ(res.failure->kind, ErrorKind::ExtractionFailure);
    EXPECT_EQ(acquirer.calls, 1);
    expect_absent(acme.key());
}

TEST_F(IngestionTest, NotFoundIsNotRetried) {
    auto res = make().ingest({"mem://missing", acme});
    ASSERT_FALSE(res.success);
    EXPECT_EQ(res.failure->stage, Stage::Acquire);
    EXPECT_EQ(res.failure->kind, ErrorKind::AcquisitionFailure);
    EXPECT_EQ(acquirer.calls, 1);
}

TEST_F(IngestionTest, RateLimitedAcquisitionIsRetried) {
    acquirer.fail_next("mem://acme-2020", AcquireFailureMode::RateLimited, 2);
    auto res = make().ingest({"mem://acme-2020", acme});
    EXPECT_TRUE(res.success);
    EXPECT_EQ(acquirer.calls, 3);
}

TEST_F(IngestionTest, PersistentTransportFailureFailsTheStage) {
    acquirer.fail_next("mem://acme-2020", AcquireFailureMode::TransportTimeout, 5);
    auto res = make().ingest({"mem://acme-2020", acme});
    ASSERT_FALSE(res.success);
    EXPECT_EQ(res.failure->kind, ErrorKind::AcquisitionFailure);
    EXPECT_EQ(acquirer.calls, 3);
}

TEST_F(IngestionTest, MissingIdentityIsRejected) {
    auto res = make().ingest({"mem://acme-2020", DocumentId{"ACME", "10-K", ""}});
    ASSERT_FALSE(res.success);
    EXPECT_EQ(acquirer.calls, 0);

    res = make().ingest({"  ", acme});
    ASSERT_FALSE(res.success);
    EXPECT_EQ(acquirer.calls, 0);
}

TEST_F(IngestionTest, BatchIngestsIndependentDocumentsInOrder) {
    acquirer.add("mem://bolt-2020", "text/plain", sample_filing("BOLT"));
    acquirer.add("mem://core-2020", "text/plain", sample_filing("CORE"));
    auto opts = fast_options();
    opts.workers = 3;
    auto orch = make(opts);

    std::vector<IngestRequest> reqs = {
        {"mem://acme-2020", acme},
        {"mem://bolt-2020", {"BOLT", "10-K", "2020"}},
        {"mem://missing", {"GONE", "10-K", "2020"}},
        {"mem://core-2020", {"CORE", "10-K", "2020"}},
    };
    auto results = orch.ingest_batch(reqs);
    ASSERT_EQ(results.size(), 4u);
    EXPECT_EQ(results[0].doc_id, "ACME_10-K_2020");
    EXPECT_EQ(results[1].doc_id, "BOLT_10-K_2020");
    EXPECT_EQ(results[3].doc_id, "CORE_10-K_2020");
    EXPECT_TRUE(results[0].success);
    EXPECT_TRUE(results[1].success);
    EXPECT_FALSE(results[2].success);
    EXPECT_TRUE(results[3].success);
    for (const auto& r : results) {
        if (r.success) expect_in_sync(r.doc_id);
    }

    auto m = monitor.metrics("ingestion", 1);
    EXPECT_EQ(m.executions, 4);
    EXPECT_EQ(m.failures, 1);
}

TEST_F(IngestionTest, BatchWorkersShareTheRequestBudget) {
    const std::vector<std::string> names = {"ACME", "BOLT", "CORE", "DUNE", "ECHO", "FORT"};
    std::vector<IngestRequest> reqs;
    for (const auto& n : names) {
        acquirer.add("mem://" + n, "text/plain", sample_filing(n));
        reqs.push_back({"mem://" + n, {n, "10-K", "2020"}});
    }
    const double rate = 20.0;
    const int burst = 2;
    auto start = std::chrono::steady_clock::now();
    auto bucket = std::make_shared<TokenBucket>(rate, burst);
    ThrottledAcquirer throttled(acquirer, bucket);

    auto opts = fast_options();
    opts.workers = 4;
    IngestionOrchestrator orch(throttled, embedder, &vision, facts, vectors, &monitor, opts, 0.01);
    auto results = orch.ingest_batch(reqs);

    for (const auto& r : results) EXPECT_TRUE(r.success) << r.doc_id;
    auto sent = throttled.sent();
    ASSERT_EQ(sent.size(), names.size());
    // Request n (1-based) cannot go out before (n - burst) / rate seconds.
    for (size_t i = burst; i < sent.size(); ++i) {
        std::chrono::duration<double> since = sent[i] - start;
        double floor_s = (double)(i + 1 - burst) / rate;
        EXPECT_GE(since.count(), floor_s * 0.9) << "request " << i + 1;
    }
}

TEST_F(IngestionTest, CorruptChunkIsSkippedOnRead) {
    ASSERT_TRUE(make().ingest({"mem://acme-2020", acme}).success);
    facts.with_db([](sqlite3* db) { sqlite_exec(db, "UPDATE chunks SET text = '' WHERE ordinal = 1;"); });
    facts.with_db([](sqlite3* db) { sqlite_exec(db, "UPDATE chunks SET text = X'00ff' WHERE ordinal = 3;"); });

    ChunkFilter f;
    f.doc_id = acme.key();
    std::vector<Chunk> chunks;
    ASSERT_NO_THROW(chunks = facts.load_chunks(f));
    ASSERT_EQ(chunks.size(), 3u);
    for (const auto& c : chunks) {
        EXPECT_NE(c.ordinal, 1);
        EXPECT_NE(c.ordinal, 3);
    }
}

TEST_F(IngestionTest, ChunkFilterNarrowsByDocumentType) {
    ASSERT_TRUE(make().ingest({"mem://acme-2020", acme}).success);

    ChunkFilter annual;
    annual.doc_type = "10-k";
    EXPECT_EQ(facts.load_chunks(annual).size(), 5u);

    ChunkFilter quarterly;
    quarterly.doc_type = "10-Q";
    EXPECT_TRUE(facts.load_chunks(quarterly).empty());
}

TEST_F(IngestionTest, InvalidChunkOptionsAreRejected) {
    auto opts = fast_options();
    opts.chunker.overlap_tokens = opts.chunker.chunk_tokens;
    EXPECT_THROW(make(opts), std::invalid_argument);
}

TEST_F(IngestionTest, ReconcileRemovesMismatchedAndOrphanedData) {
    auto orch = make();
    ASSERT_TRUE(orch.ingest({"mem://acme-2020", acme}).success);
    vectors.remove({acme.key(), 1});
    vectors.put({"GHOST_10-K_2019", 0}, embedder.embed_one("left behind"));

    Document stuck;
    stuck.id = {"STUCK", "10-Q", "2021"};
    stuck.retrieved_at = unix_now() - 7200;
    facts.write_document(stuck, {}, {});

    auto rep = orch.writer().reconcile(3600);
    EXPECT_EQ(rep.documents_rolled_back, 2u);
    EXPECT_EQ(rep.orphaned_chunks_removed, 1u);
    EXPECT_EQ(rep.orphaned_embeddings_removed, 1u);
    expect_absent(acme.key());
    expect_absent("STUCK_10-Q_2021");
    EXPECT_EQ(vectors.count("GHOST_10-K_2019"), 0u);

    auto again = orch.writer().reconcile(3600);
    EXPECT_EQ(again.documents_rolled_back, 0u);
    EXPECT_EQ(again.orphaned_embeddings_removed, 0u);
}

TEST_F(IngestionTest, RollbackIsIdempotent) {
    auto orch = make();
    ASSERT_TRUE(orch.ingest({"mem://acme-2020", acme}).success);
    auto first = orch.writer().rollback(acme.key());
    EXPECT_TRUE(first.clean);
    EXPECT_EQ(first.chunks_removed, 5u);
    EXPECT_EQ(first.embeddings_removed, 5u);

    auto second = orch.writer().rollback(acme.key());
    EXPECT_TRUE(second.clean);
    EXPECT_EQ(second.chunks_removed, 0u);
    expect_absent(acme.key());
}

}  // namespace
