#include "../include/config.hpp"
#include "../include/util.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>

using json = nlohmann::json;

std::vector<std::string> default_section_markers(const std::string& doc_type) {
    if (doc_type == "10-Q") {
        return {"Item 1.", "Item 2.", "Item 3.", "Item 4.", "Item 1A.", "Item 5.", "Item 6."};
    }
    if (doc_type == "8-K") {
        return {"Item 1.01", "Item 2.02", "Item 5.02", "Item 7.01", "Item 8.01", "Item 9.01"};
    }
    return {"Item 1.", "Item 1A.", "Item 1B.", "Item 2.", "Item 3.", "Item 4.", "Item 5.",
            "Item 6.", "Item 7.", "Item 7A.", "Item 8.", "Item 9.", "Item 9A.", "Item 9B.",
            "Item 10.", "Item 11.", "Item 12.", "Item 13.", "Item 14.", "Item 15."};
}

namespace {
template <typename T>
void read_opt(const json& j, const char* key, T& out) {
    if (j.contains(key) && !j.at(key).is_null()) out = j.at(key).get<T>();
}
}

AppConfig load_config(const std::string& json_path) {
    AppConfig cfg;
    if (!json_path.empty()) {
        auto j = json::parse(read_text_file(json_path));
        read_opt(j, "db_path", cfg.db_path);
        read_opt(j, "vector_db_path", cfg.vector_db_path);
        read_opt(j, "budget_usd", cfg.budget_usd);
        if (j.contains("embed")) {
            const auto& e = j["embed"];
            read_opt(e, "ollama_url", cfg.embed.ollama_url);
            read_opt(e, "model", cfg.embed.embed_model);
            read_opt(e, "dimensions", cfg.embed.dimensions);
            read_opt(e, "timeout_ms", cfg.embed.timeout_ms);
            read_opt(e, "batch_size", cfg.embed.batch_size);
            read_opt(e, "offline", cfg.embed.offline);
        }
        if (j.contains("llm")) {
            const auto& l = j["llm"];
            read_opt(l, "ollama_url", cfg.llm.ollama_url);
            read_opt(l, "model", cfg.llm.llm_model);
            read_opt(l, "timeout_ms", cfg.llm.timeout_ms);
        }
        if (j.contains("vision")) {
            const auto& v = j["vision"];
            read_opt(v, "ollama_url", cfg.vision.ollama_url);
            read_opt(v, "model", cfg.vision.vision_model);
            read_opt(v, "timeout_ms", cfg.vision.timeout_ms);
            read_opt(v, "cost_per_region_usd", cfg.vision.cost_per_region_usd);
            read_opt(v, "enabled", cfg.vision.enabled);
        }
        if (j.contains("acquire")) {
            const auto& a = j["acquire"];
            read_opt(a, "user_agent", cfg.acquire.user_agent);
            read_opt(a, "timeout_ms", cfg.acquire.timeout_ms);
            read_opt(a, "qps", cfg.acquire.qps);
            read_opt(a, "burst", cfg.acquire.burst);
        }
        if (j.contains("ingest")) {
            const auto& i = j["ingest"];
            read_opt(i, "extract_structured", cfg.ingest.extract_structured);
            read_opt(i, "replace_existing", cfg.ingest.replace_existing);
            read_opt(i, "workers", cfg.ingest.workers);
            read_opt(i, "chunk_tokens", cfg.ingest.chunker.chunk_tokens);
            read_opt(i, "overlap_tokens", cfg.ingest.chunker.overlap_tokens);
            read_opt(i, "chars_per_token", cfg.ingest.chunker.chars_per_token);
            read_opt(i, "section_markers", cfg.ingest.chunker.section_markers);
            read_opt(i, "max_attempts", cfg.ingest.retry.max_attempts);
            read_opt(i, "initial_backoff_ms", cfg.ingest.retry.initial_backoff_ms);
        }
        if (j.contains("retrieval")) {
            const auto& r = j["retrieval"];
            read_opt(r, "top_k", cfg.retrieval.top_k);
            read_opt(r, "k_rrf", cfg.retrieval.k_rrf);
            read_opt(r, "candidate_pool", cfg.retrieval.candidate_pool);
            read_opt(r, "lexical_timeout_ms", cfg.retrieval.lexical_timeout_ms);
            read_opt(r, "vector_timeout_ms", cfg.retrieval.vector_timeout_ms);
        }
        if (j.contains("validation")) {
            const auto& v = j["validation"];
            read_opt(v, "max_nesting_depth", cfg.validation.max_nesting_depth);
            read_opt(v, "row_limit", cfg.validation.row_limit);
            read_opt(v, "execution_timeout_ms", cfg.validation.execution_timeout_ms);
        }
    }
    apply_env(cfg);
    validate_config(cfg);
    return cfg;
}

void apply_env(AppConfig& cfg) {
    std::string ollama = getenv_or("OLLAMA_URL", "");
    if (!ollama.empty()) {
        cfg.embed.ollama_url = ollama;
        cfg.llm.ollama_url = ollama;
        cfg.vision.ollama_url = ollama;
    }
    cfg.embed.embed_model = getenv_or("FILINGS_EMBED_MODEL", cfg.embed.embed_model);
    cfg.llm.llm_model = getenv_or("FILINGS_LLM_MODEL", cfg.llm.llm_model);
    cfg.vision.vision_model = getenv_or("FILINGS_VISION_MODEL", cfg.vision.vision_model);
    cfg.db_path = getenv_or("FILINGS_DB_PATH", cfg.db_path);
    cfg.vector_db_path = getenv_or("FILINGS_VECTOR_DB_PATH", cfg.vector_db_path);
    std::string qps = getenv_or("FILINGS_QPS", "");
    if (!qps.empty()) cfg.acquire.qps = std::stod(qps);
}

void validate_config(const AppConfig& cfg) {
    const auto& c = cfg.ingest.chunker;
    if (c.chunk_tokens <= 0 || c.chars_per_token <= 0 || c.overlap_tokens < 0) {
        throw std::invalid_argument("chunk size, overlap and chars_per_token must be positive");
    }
    if (c.overlap_tokens >= c.chunk_tokens) {
        throw std::invalid_argument("overlap must be smaller than chunk size");
    }
    if (cfg.acquire.qps <= 0.0 || cfg.acquire.burst <= 0) {
        throw std::invalid_argument("acquire qps and burst must be positive");
    }
    if (cfg.embed.dimensions <= 0 || cfg.embed.batch_size <= 0) {
        throw std::invalid_argument("embedding dimensions and batch size must be positive");
    }
    if (cfg.ingest.retry.max_attempts <= 0) {
        throw std::invalid_argument("retry max_attempts must be at least 1");
    }
    if (cfg.retrieval.top_k <= 0 || cfg.retrieval.k_rrf < 0.0) {
        throw std::invalid_argument("top_k must be positive and k_rrf non-negative");
    }
}
