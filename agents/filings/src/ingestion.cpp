#include "../include/ingestion.hpp"
#include "../include/chunker.hpp"
#include "../include/region_extractor.hpp"
#include "../include/retry.hpp"
#include "../include/text_extractor.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <atomic>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <thread>

namespace {

ErrorKind default_kind(Stage stage) {
    switch (stage) {
        case Stage::Acquire: return ErrorKind::AcquisitionFailure;
        case Stage::Embed: return ErrorKind::EmbeddingFailure;
        case Stage::Write: return ErrorKind::SyncWriteFailure;
        default: return ErrorKind::ExtractionFailure;
    }
}

}  // namespace

IngestionOrchestrator::IngestionOrchestrator(DocumentAcquirer& acquirer, EmbeddingClient& embedder,
                                             VisionClient* vision, FactStore& facts, VectorStore& vectors,
                                             PipelineMonitor* monitor, IngestOptions opts,
                                             double vision_cost_per_region)
    : acquirer_(acquirer), embedder_(embedder), vision_(vision), facts_(facts), monitor_(monitor),
      opts_(std::move(opts)), vision_cost_(vision_cost_per_region), writer_(facts, vectors, opts_.retry) {
    if (opts_.chunker.overlap_chars() >= opts_.chunker.chunk_chars()) {
        throw std::invalid_argument("chunk overlap must be smaller than chunk size");
    }
    if (opts_.workers < 1) throw std::invalid_argument("ingest workers must be >= 1");
}

IngestResult IngestionOrchestrator::ingest(const IngestRequest& req) {
    auto t0 = std::chrono::steady_clock::now();
    IngestResult res = run(req);
    res.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    if (res.success) {
        std::cout << "[ingest] [OK] " << res.doc_id << ": " << res.chunks_written << " chunks, "
                  << res.records_written << " records" << (res.degraded ? " (degraded)" : "") << "\n";
    } else {
        std::cerr << "[ingest] [ERROR] " << res.doc_id << " failed at " << to_string(res.failure->stage)
                  << " (" << to_string(res.failure->kind) << "): " << res.failure->message << "\n";
    }
    record(res);
    return res;
}

IngestResult IngestionOrchestrator::run(const IngestRequest& req) {
    IngestResult res;
    res.doc_id = req.id.key();
    Stage stage = Stage::Acquire;
    auto fail = [&](Stage s, ErrorKind k, const std::string& msg) {
        res.success = false;
        res.failure = IngestFailure{s, k, msg, true, false};
        return res;
    };

    if (!req.id.valid()) return fail(stage, ErrorKind::AcquisitionFailure, "entity, document type and fiscal period are required");
    if (trim(req.locator).empty()) return fail(stage, ErrorKind::AcquisitionFailure, "empty document locator");

    try {
        auto existing = facts_.find_document(res.doc_id);
        if (existing && !opts_.replace_existing) {
            return fail(Stage::Acquire, ErrorKind::DuplicateDocument,
                        res.doc_id + " already ingested (" + existing->status + ")");
        }

        RawDocument raw = with_retry(opts_.retry, "acquire " + req.locator,
                                     [&]{ return acquirer_.fetch(req.locator); });

        stage = Stage::ExtractText;
        ExtractedText text = extract_text(raw);

        stage = Stage::ExtractRegions;
        std::vector<StructuredRecord> records;
        if (opts_.extract_structured && vision_) {
            StructuredRegionExtractor extractor(*vision_, opts_.retry);
            RegionExtraction rx = extractor.extract(res.doc_id, text);
            if (monitor_ && rx.regions_returned > 0) {
                monitor_->record_cost("vision", rx.regions_returned, rx.regions_returned * vision_cost_);
            }
            if (rx.degraded) {
                res.degraded = true;
                res.warnings.push_back("structured extraction degraded: " + rx.degraded_reason);
                if (monitor_) {
                    monitor_->log_error("ingestion", to_string(Stage::ExtractRegions),
                                        to_string(ErrorKind::StructuredExtractionDegraded),
                                        res.doc_id + ": " + rx.degraded_reason);
                }
            }
            records = std::move(rx.records);
        }

        stage = Stage::Chunk;
        const auto& markers = opts_.chunker.section_markers.empty() ? default_section_markers(req.id.doc_type)
                                                                    : opts_.chunker.section_markers;
        std::vector<Chunk> chunks = chunk_document(res.doc_id, text, markers, opts_.chunker);
        if (chunks.empty()) return fail(stage, ErrorKind::ExtractionFailure, "document produced no chunks");

        stage = Stage::Embed;
        std::vector<std::string> texts;
        texts.reserve(chunks.size());
        for (const auto& c : chunks) texts.push_back(c.text);
        auto embeddings = with_retry(opts_.retry, "embed " + res.doc_id, [&]{ return embedder_.embed(texts); });
        if (embeddings.size() != chunks.size()) {
            return fail(stage, ErrorKind::EmbeddingFailure,
                        "embedder returned " + std::to_string(embeddings.size()) + " vectors for " +
                        std::to_string(chunks.size()) + " chunks");
        }

        stage = Stage::Write;
        Document doc;
        doc.id = req.id;
        doc.source_url = raw.locator;
        doc.content_sha256 = sha256_hex(raw.bytes);
        doc.retrieved_at = unix_now();
        try {
            WriteOutcome out = existing ? writer_.replace(doc, chunks, records, embeddings)
                                        : writer_.write(doc, chunks, records, embeddings);
            res.chunks_written = out.chunks_written;
            res.embeddings_written = out.embeddings_written;
            res.records_written = out.records_written;
            if (existing) res.warnings.push_back("replaced previous version");
        } catch (const SyncWriteError& e) {
            if (e.previous_kept()) {
                res = fail(stage, ErrorKind::SyncWriteFailure, e.what());
                res.warnings.push_back("previous version kept");
                res.failure->cleaned_up = e.embeddings_cleaned();
                res.failure->operator_alert = !e.embeddings_cleaned();
                std::cerr << "[store] " << res.doc_id << ": replace failed, previous version kept\n";
                return res;
            }
            auto rb = writer_.rollback(res.doc_id);
            res = fail(stage, ErrorKind::SyncWriteFailure, e.what());
            res.failure->cleaned_up = rb.clean;
            res.failure->operator_alert = !rb.clean;
            if (!rb.clean) {
                std::cerr << "[store] ALERT " << res.doc_id << ": rollback failed after " << rb.attempts
                          << " attempts, orphaned data remains: " << rb.error << "\n";
            } else {
                std::cerr << "[store] " << res.doc_id << ": rolled back " << rb.chunks_removed << " chunks, "
                          << rb.embeddings_removed << " embeddings\n";
            }
            return res;
        }
        res.success = true;
        return res;
    } catch (const PipelineError& e) {
        return fail(e.stage(), e.kind(), e.what());
    } catch (const std::exception& e) {
        return fail(stage, default_kind(stage), e.what());
    }
}

void IngestionOrchestrator::record(const IngestResult& res) {
    if (!monitor_) return;
    nlohmann::json meta = {{"doc_id", res.doc_id},
                           {"chunks", res.chunks_written},
                           {"records", res.records_written},
                           {"degraded", res.degraded}};
    if (res.failure) {
        meta["stage"] = to_string(res.failure->stage);
        meta["cleaned_up"] = res.failure->cleaned_up;
        monitor_->log_error("ingestion", to_string(res.failure->stage), to_string(res.failure->kind),
                            res.doc_id + ": " + res.failure->message);
    }
    monitor_->record_execution("ingestion", res.success, res.elapsed_ms, meta);
}

std::vector<IngestResult> IngestionOrchestrator::ingest_batch(const std::vector<IngestRequest>& reqs) {
    std::vector<IngestResult> results(reqs.size());
    std::atomic<std::size_t> next{0};
    auto worker = [&]() {
        for (std::size_t i = next++; i < reqs.size(); i = next++) results[i] = ingest(reqs[i]);
    };
    std::size_t n = std::min<std::size_t>((std::size_t)opts_.workers, reqs.size());
    std::vector<std::thread> pool;
    for (std::size_t t = 1; t < n; ++t) pool.emplace_back(worker);
    worker();
    for (auto& t : pool) t.join();
    return results;
}
