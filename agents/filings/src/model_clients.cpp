#include "../include/model_clients.hpp"
#include "../include/errors.hpp"
#include "../include/http.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <stdexcept>

using json = nlohmann::json;

std::string OllamaTextGenerator::generate(const std::string& system_prompt, const std::string& user_prompt) {
    json body = {
        {"model", cfg_.llm_model},
        {"stream", false},
        {"options", {{"temperature", 0.0}}},
        {"messages", json::array({
            json{{"role","system"},{"content",system_prompt}},
            json{{"role","user"},{"content",user_prompt}}
        })}
    };
    auto r = http_post_json(cfg_.ollama_url + "/api/chat", body.dump(), cfg_.timeout_ms);
    if (r.status < 200 || r.status >= 300) {
        throw std::runtime_error("chat failed: status " + std::to_string(r.status));
    }
    auto data = json::parse(r.body);
    if (data.contains("message")) return data["message"].value("content", std::string());
    return {};
}

std::vector<std::vector<float>> OllamaEmbeddingClient::embed(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (size_t start = 0; start < texts.size(); start += (size_t)cfg_.batch_size) {
        size_t end = std::min(texts.size(), start + (size_t)cfg_.batch_size);
        json body = {
            {"model", cfg_.embed_model},
            {"input", std::vector<std::string>(texts.begin() + start, texts.begin() + end)}
        };
        HttpResponse r;
        try {
            r = http_post_json(cfg_.ollama_url + "/api/embed", body.dump(), cfg_.timeout_ms);
        } catch (const HttpTransportError& e) {
            throw PipelineError(e.timed_out() ? ErrorKind::Timeout : ErrorKind::EmbeddingFailure,
                                Stage::Embed, std::string("embedding request failed: ") + e.what(), true);
        }
        if (r.status < 200 || r.status >= 300) {
            throw PipelineError(ErrorKind::EmbeddingFailure, Stage::Embed,
                                "embedding failed: status " + std::to_string(r.status),
                                r.status == 429 || r.status >= 500);
        }
        json data;
        try {
            data = json::parse(r.body);
        } catch (const json::exception& e) {
            throw PipelineError(ErrorKind::EmbeddingFailure, Stage::Embed,
                                std::string("embedding response is not JSON: ") + e.what());
        }
        const auto& batch = data.contains("embeddings") ? data["embeddings"] : json::array();
        if (batch.size() != end - start) {
            throw PipelineError(ErrorKind::EmbeddingFailure, Stage::Embed,
                                "embedding batch returned " + std::to_string(batch.size()) +
                                " vectors for " + std::to_string(end - start) + " inputs");
        }
        for (const auto& v : batch) {
            auto vec = v.get<std::vector<float>>();
            if ((int)vec.size() != cfg_.dimensions) {
                throw PipelineError(ErrorKind::EmbeddingFailure, Stage::Embed,
                                    "embedding has dimension " + std::to_string(vec.size()) +
                                    ", expected " + std::to_string(cfg_.dimensions));
            }
            out.push_back(std::move(vec));
        }
    }
    return out;
}

namespace {
std::uint64_t fnv1a(const std::string& s) {
    std::uint64_t h = 1469598103934665603ULL;
    for (unsigned char c : s) {
        h ^= c;
        h *= 1099511628211ULL;
    }
    return h;
}
}

HashingEmbeddingClient::HashingEmbeddingClient(int dimensions) : dims_(dimensions) {
    if (dimensions <= 0) throw std::invalid_argument("embedding dimensions must be positive");
}

std::vector<float> HashingEmbeddingClient::embed_one(const std::string& text) const {
    std::vector<float> v((size_t)dims_, 0.0f);
    auto terms = tokenize_terms(text);
    auto add = [&](const std::string& feature, float weight) {
        auto h = fnv1a(feature);
        size_t idx = (size_t)(h % (std::uint64_t)dims_);
        v[idx] += ((h >> 63) ? -1.0f : 1.0f) * weight;
    };
    for (size_t i = 0; i < terms.size(); ++i) {
        add(terms[i], 1.0f);
        if (i + 1 < terms.size()) add(terms[i] + " " + terms[i + 1], 0.5f);
    }
    double norm = 0.0;
    for (float x : v) norm += (double)x * x;
    if (norm > 0.0) {
        float inv = (float)(1.0 / std::sqrt(norm));
        for (auto& x : v) x *= inv;
    }
    return v;
}

std::vector<std::vector<float>> HashingEmbeddingClient::embed(const std::vector<std::string>& texts) {
    std::vector<std::vector<float>> out;
    out.reserve(texts.size());
    for (const auto& t : texts) out.push_back(embed_one(t));
    return out;
}

json OllamaVisionClient::extract_regions(const PageImage& page) {
    static const char* kInstruction =
        "Extract every table or structured region on this filing page. Reply with JSON only: "
        "{\"regions\":[{\"caption\":string,\"columns\":[string],\"rows\":[[string]],\"confidence\":number}]}. "
        "Keep numbers exactly as printed. Reply {\"regions\":[]} when there is no table.";
    json body = {
        {"model", cfg_.vision_model},
        {"stream", false},
        {"format", "json"}
    };
    if (page.mime.rfind("image/", 0) == 0) {
        body["prompt"] = kInstruction;
        body["images"] = json::array({base64_encode(page.bytes)});
    } else {
        const size_t kMaxMarkup = 24000;
        body["prompt"] = std::string(kInstruction) + "\n\nPage markup:\n" + page.bytes.substr(0, kMaxMarkup);
    }
    HttpResponse r;
    try {
        r = http_post_json(cfg_.ollama_url + "/api/generate", body.dump(), cfg_.timeout_ms);
    } catch (const HttpTransportError& e) {
        throw PipelineError(e.timed_out() ? ErrorKind::Timeout : ErrorKind::StructuredExtractionDegraded,
                            Stage::ExtractRegions, std::string("vision request failed: ") + e.what(), true);
    }
    if (r.status < 200 || r.status >= 300) {
        throw PipelineError(ErrorKind::StructuredExtractionDegraded, Stage::ExtractRegions,
                            "vision failed: status " + std::to_string(r.status),
                            r.status == 429 || r.status >= 500);
    }
    auto data = json::parse(r.body);
    auto inner = json::parse(strip_code_fences(data.value("response", std::string("{}"))));
    if (inner.is_array()) return inner;
    return inner.value("regions", json::array());
}
