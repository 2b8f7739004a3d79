#include "../include/acquirer.hpp"
#include "../include/catalog.hpp"
#include "../include/config.hpp"
#include "../include/fact_store.hpp"
#include "../include/http.hpp"
#include "../include/ingestion.hpp"
#include "../include/model_clients.hpp"
#include "../include/monitor.hpp"
#include "../include/query.hpp"
#include "../include/rate_limiter.hpp"
#include "../include/util.hpp"
#include "../include/vector_store.hpp"
#include <filesystem>
#include <iostream>
#include <map>
#include <memory>

static void usage() {
    std::cerr << "filings_cli usage:\n"
              << "  ingest --entity <ticker> --type <10-K|10-Q|8-K> --period <fy> (--url <locator> | --manifest <file>)\n"
              << "         [--replace] [--no-structured]\n"
              << "  ingest-batch --manifest <file> [--workers N] [--replace] [--no-structured]\n"
              << "  query --question \"...\" [--top-k N] [--extractive]\n"
              << "  reconcile [--grace <seconds>]\n"
              << "  stats [--hours N] [--slow-ms N]\n"
              << "common: [--config <file>] [--db <file>] [--vector-db <file>] [--ollama <url>] [--offline]\n";
}

namespace {

struct Args {
    std::string cmd;
    std::map<std::string, std::string> opts;
    bool has(const std::string& k) const { return opts.count(k) > 0; }
    std::string get(const std::string& k, const std::string& def = "") const {
        auto it = opts.find(k);
        return it == opts.end() ? def : it->second;
    }
};

bool parse_args(int argc, char** argv, Args& out) {
    static const std::map<std::string, bool> known = {
        {"--config", true}, {"--db", true}, {"--vector-db", true}, {"--ollama", true}, {"--offline", false},
        {"--entity", true}, {"--type", true}, {"--period", true}, {"--url", true}, {"--manifest", true},
        {"--replace", false}, {"--no-structured", false}, {"--workers", true}, {"--question", true},
        {"--top-k", true}, {"--extractive", false}, {"--grace", true}, {"--hours", true}, {"--slow-ms", true},
    };
    out.cmd = argv[1];
    for (int i = 2; i < argc; ++i) {
        std::string a = argv[i];
        auto it = known.find(a);
        if (it == known.end()) {
            std::cerr << "[cli] unknown option " << a << "\n";
            return false;
        }
        if (it->second) {
            if (i + 1 >= argc) {
                std::cerr << "[cli] " << a << " needs a value\n";
                return false;
            }
            out.opts[a] = argv[++i];
        } else {
            out.opts[a] = "1";
        }
    }
    return true;
}

void ensure_parent_dir(const std::string& path) {
    if (path == ":memory:") return;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent);
}

void print_result(const IngestResult& r) {
    if (r.success) {
        std::cout << "[OK] " << r.doc_id << ": " << r.chunks_written << " chunks, " << r.embeddings_written
                  << " embeddings, " << r.records_written << " structured records in " << (long)r.elapsed_ms << " ms\n";
    } else {
        const auto& f = *r.failure;
        std::cout << "[ERROR] " << r.doc_id << ": " << to_string(f.kind) << " at " << to_string(f.stage) << ": "
                  << f.message << (f.cleaned_up ? " (no partial data left)" : " (ORPHANED DATA, run reconcile)")
                  << "\n";
    }
    for (const auto& w : r.warnings) std::cout << "  [WARN] " << w << "\n";
}

// Wires the stores and model clients for one CLI invocation.
struct Runtime {
    AppConfig cfg;
    std::unique_ptr<FactStore> facts;
    std::unique_ptr<SqliteVectorStore> vectors;
    std::unique_ptr<PipelineMonitor> monitor;
    std::unique_ptr<EmbeddingClient> embedder;

    explicit Runtime(AppConfig c) : cfg(std::move(c)) {
        ensure_parent_dir(cfg.db_path);
        ensure_parent_dir(cfg.vector_db_path);
        facts = std::make_unique<FactStore>(cfg.db_path);
        if (cfg.embed.offline) embedder = std::make_unique<HashingEmbeddingClient>(cfg.embed.dimensions);
        else embedder = std::make_unique<OllamaEmbeddingClient>(cfg.embed);
        vectors = std::make_unique<SqliteVectorStore>(cfg.vector_db_path, embedder->dimensions());
        monitor = std::make_unique<PipelineMonitor>(*facts);
    }
};

int run_ingest(Runtime& rt, const Args& args, bool batch) {
    std::vector<IngestRequest> reqs;
    if (batch) {
        if (!args.has("--manifest")) { usage(); return 2; }
        for (const auto& e : FilingCatalog::load(args.get("--manifest")).entries()) reqs.push_back({e.locator, e.id});
    } else {
        DocumentId id{args.get("--entity"), args.get("--type", "10-K"), args.get("--period")};
        if (!id.valid()) { usage(); return 2; }
        std::string locator = args.get("--url");
        if (locator.empty() && args.has("--manifest")) {
            auto entry = FilingCatalog::load(args.get("--manifest")).find(id.entity, id.doc_type, id.fiscal_period);
            if (!entry) {
                std::cerr << "[cli] " << id.key() << " is not in the manifest\n";
                return 1;
            }
            locator = entry->locator;
            id.entity = entry->id.entity;
        }
        if (locator.empty()) { usage(); return 2; }
        reqs.push_back({locator, id});
    }

    auto limiter = std::make_shared<TokenBucket>(rt.cfg.acquire.qps, rt.cfg.acquire.burst);
    SchemeAcquirer acquirer(std::make_unique<HttpDocumentAcquirer>(rt.cfg.acquire, limiter),
                            std::make_unique<FileDocumentAcquirer>());
    std::unique_ptr<VisionClient> vision;
    if (rt.cfg.vision.enabled && rt.cfg.ingest.extract_structured) {
        vision = std::make_unique<OllamaVisionClient>(rt.cfg.vision);
    }
    IngestionOrchestrator orch(acquirer, *rt.embedder, vision.get(), *rt.facts, *rt.vectors, rt.monitor.get(),
                               rt.cfg.ingest, rt.cfg.vision.cost_per_region_usd);

    auto results = orch.ingest_batch(reqs);
    int failed = 0;
    for (const auto& r : results) {
        print_result(r);
        if (!r.success) ++failed;
    }
    if (batch) std::cout << "[OK] " << results.size() - failed << "/" << results.size() << " filings ingested\n";

    auto budget = rt.monitor->check_budget(rt.cfg.budget_usd, 24);
    if (budget.exceeded) {
        std::cerr << "[WARN] external-call cost $" << budget.total_cost << " over the last 24h exceeds budget $"
                  << budget.budget_limit << "\n";
    }
    return failed == 0 ? 0 : 1;
}

int run_query(Runtime& rt, const Args& args) {
    std::string question = args.get("--question");
    if (trim(question).empty()) { usage(); return 2; }
    if (args.has("--top-k")) rt.cfg.retrieval.top_k = std::stoi(args.get("--top-k"));

    OllamaTextGenerator llm(rt.cfg.llm);
    HeuristicQueryRouter router;
    StructuredQueryGenerator generator(llm, FactStore::query_schema(), rt.cfg.validation);
    HybridRetriever retriever(*rt.facts, *rt.vectors, *rt.embedder, rt.cfg.retrieval);
    AnswerSynthesizer synthesizer(args.has("--extractive") ? nullptr : &llm);
    QueryOrchestrator orch(router, generator, *rt.facts, retriever, synthesizer, rt.monitor.get(), rt.cfg.validation);

    Answer ans = orch.answer(question);
    std::cout << "\n==== Answer ====\n\n" << ans.text << "\n\n";
    std::cout << "confidence: " << to_string(ans.confidence) << "   path: " << to_string(ans.path_used)
              << (ans.fallback_used ? " (fallback)" : "") << "   " << (long)ans.elapsed_ms << " ms\n";
    if (!ans.sql.empty()) std::cout << "query: " << ans.sql << "\n";
    if (!ans.citations.empty()) {
        std::cout << "\n==== Sources ====\n";
        for (const auto& c : ans.citations) {
            std::cout << "[" << c.source << "] " << c.doc_id;
            if (c.page > 0) std::cout << " p." << c.page;
            std::cout << ", " << c.location << "\n";
        }
    }
    for (const auto& w : ans.warnings) std::cout << "[WARN] " << w << "\n";
    return ans.answered ? 0 : 1;
}

int run_reconcile(Runtime& rt, const Args& args) {
    DualStoreWriter writer(*rt.facts, *rt.vectors, rt.cfg.ingest.retry);
    auto rep = writer.reconcile(std::stoi(args.get("--grace", "3600")));
    std::cout << "[OK] rolled back " << rep.documents_rolled_back << " documents; removed "
              << rep.orphaned_chunks_removed << " chunks without embeddings and " << rep.orphaned_embeddings_removed
              << " embeddings without chunks\n";
    for (const auto& id : rep.doc_ids) std::cout << "  " << id << "\n";
    return 0;
}

int run_stats(Runtime& rt, const Args& args) {
    int hours = std::stoi(args.get("--hours", "24"));
    auto summary = rt.monitor->summary(hours);
    auto budget = rt.monitor->check_budget(rt.cfg.budget_usd, hours);
    summary["budget"] = {{"limit_usd", budget.budget_limit},
                         {"exceeded", budget.exceeded},
                         {"services_over_limit", budget.services_over_limit}};
    summary["documents"] = rt.facts->documents().size();
    nlohmann::json slow = nlohmann::json::array();
    for (const auto& m : rt.monitor->bottlenecks(std::stoi(args.get("--slow-ms", "5000")), hours)) {
        slow.push_back({{"pipeline", m.pipeline},
                        {"avg_duration_ms", m.avg_duration_ms},
                        {"p95_duration_ms", m.p95_duration_ms},
                        {"executions", m.executions}});
    }
    summary["bottlenecks"] = slow;
    std::cout << summary.dump(2) << "\n";
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    if (argc < 2) { usage(); return 2; }
    Args args;
    if (!parse_args(argc, argv, args)) { usage(); return 2; }
    try {
        AppConfig cfg = load_config(args.get("--config", getenv_or("FILINGS_CONFIG", "")));
        if (args.has("--db")) cfg.db_path = args.get("--db");
        if (args.has("--vector-db")) cfg.vector_db_path = args.get("--vector-db");
        if (args.has("--ollama")) {
            cfg.embed.ollama_url = cfg.llm.ollama_url = cfg.vision.ollama_url = args.get("--ollama");
        }
        if (args.has("--offline")) cfg.embed.offline = true;
        if (args.has("--replace")) cfg.ingest.replace_existing = true;
        if (args.has("--no-structured")) cfg.ingest.extract_structured = false;
        if (args.has("--workers")) cfg.ingest.workers = std::stoi(args.get("--workers"));
        validate_config(cfg);

        http_global_init();
        Runtime rt(cfg);
        if (args.cmd == "ingest") return run_ingest(rt, args, false);
        if (args.cmd == "ingest-batch") return run_ingest(rt, args, true);
        if (args.cmd == "query") return run_query(rt, args);
        if (args.cmd == "reconcile") return run_reconcile(rt, args);
        if (args.cmd == "stats") return run_stats(rt, args);
        usage();
        return 2;
    } catch (const std::exception& e) {
        std::cerr << "[ERROR] " << e.what() << "\n";
        return 1;
    }
}
