#pragma once
#include "config.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

// Language-model capability. Implementations may be a remote API, a local
// model or a canned script in tests; callers validate whatever comes back.
class TextGenerator {
public:
    virtual ~TextGenerator() = default;
    virtual std::string generate(const std::string& system_prompt, const std::string& user_prompt) = 0;
};

// Output order must match input order: keys are assigned by position.
class EmbeddingClient {
public:
    virtual ~EmbeddingClient() = default;
    virtual std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) = 0;
    virtual int dimensions() const = 0;
};

struct PageImage {
    int page_number{1};
    std::string mime;  // "image/png", or "text/html" when the page is markup
    std::string bytes;
};

// Returns a JSON array of regions:
// [{"caption":..., "columns":[...], "rows":[[...]], "confidence":0.9}]
class VisionClient {
public:
    virtual ~VisionClient() = default;
    virtual nlohmann::json extract_regions(const PageImage& page) = 0;
};

class OllamaTextGenerator : public TextGenerator {
public:
    explicit OllamaTextGenerator(LlmConfig cfg) : cfg_(std::move(cfg)) {}
    std::string generate(const std::string& system_prompt, const std::string& user_prompt) override;

private:
    LlmConfig cfg_;
};

class OllamaEmbeddingClient : public EmbeddingClient {
public:
    explicit OllamaEmbeddingClient(EmbedConfig cfg) : cfg_(std::move(cfg)) {}
    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;
    int dimensions() const override { return cfg_.dimensions; }

private:
    EmbedConfig cfg_;
};

// Deterministic local embedder: signed feature hashing of terms and term
// bigrams, L2-normalised. Used offline and in tests.
class HashingEmbeddingClient : public EmbeddingClient {
public:
    explicit HashingEmbeddingClient(int dimensions = 384);
    std::vector<std::vector<float>> embed(const std::vector<std::string>& texts) override;
    int dimensions() const override { return dims_; }

    std::vector<float> embed_one(const std::string& text) const;

private:
    int dims_;
};

class OllamaVisionClient : public VisionClient {
public:
    explicit OllamaVisionClient(VisionConfig cfg) : cfg_(std::move(cfg)) {}
    nlohmann::json extract_regions(const PageImage& page) override;

private:
    VisionConfig cfg_;
};
