#pragma once
#include <string>
#include <vector>

struct EmbedConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string embed_model{"all-minilm"};
    int dimensions{384};
    int timeout_ms{60000};
    int batch_size{32};
    bool offline{false}; // use the local hashing embedder instead of the model server
};

struct LlmConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string llm_model{"mistral"};
    int timeout_ms{60000};
};

struct VisionConfig {
    std::string ollama_url{"http://localhost:11434"};
    std::string vision_model{"llava"};
    int timeout_ms{120000};
    double cost_per_region_usd{0.002};
    bool enabled{true};
};

struct AcquireConfig {
    std::string user_agent{"filings-agent admin@example.com"};
    int timeout_ms{30000};
    double qps{8.0};  // shared across all in-flight acquisitions
    int burst{2};
};

struct RetryPolicy {
    int max_attempts{3};
    int initial_backoff_ms{250};
    int max_backoff_ms{4000};
};

struct ChunkerOptions {
    int chunk_tokens{800};
    int overlap_tokens{100};
    int chars_per_token{4};
    std::vector<std::string> section_markers; // empty means the 10-K item list

    std::size_t chunk_chars() const { return (std::size_t)chunk_tokens * (std::size_t)chars_per_token; }
    std::size_t overlap_chars() const { return (std::size_t)overlap_tokens * (std::size_t)chars_per_token; }
};

struct IngestOptions {
    bool extract_structured{true};
    bool replace_existing{false};
    int workers{2}; // parallel documents in ingest_batch
    ChunkerOptions chunker;
    RetryPolicy retry;
};

struct RetrievalOptions {
    int top_k{6};
    double k_rrf{60.0};
    int candidate_pool{200};
    int lexical_timeout_ms{200};
    int vector_timeout_ms{500};
};

struct ValidationOptions {
    int max_nesting_depth{2}; // deeper subqueries are flagged, not rejected
    int row_limit{50};
    int execution_timeout_ms{300};
};

struct AppConfig {
    std::string db_path{"./data/filings.db"};
    std::string vector_db_path{"./data/vectors.db"};
    EmbedConfig embed;
    LlmConfig llm;
    VisionConfig vision;
    AcquireConfig acquire;
    IngestOptions ingest;
    RetrievalOptions retrieval;
    ValidationOptions validation;
    double budget_usd{5.0};
};

std::vector<std::string> default_section_markers(const std::string& doc_type);

// Defaults, then the JSON file (if path is non-empty), then environment.
AppConfig load_config(const std::string& json_path);
void apply_env(AppConfig& cfg);
// Throws std::invalid_argument on inconsistent values.
void validate_config(const AppConfig& cfg);
