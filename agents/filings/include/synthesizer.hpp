#pragma once
#include "fact_store.hpp"
#include "model_clients.hpp"
#include "retriever.hpp"
#include "sql_generator.hpp"
#include <string>
#include <vector>

enum class Confidence { VeryHigh, High, Medium, Low };

const char* to_string(Confidence c);
// One step down the scale; Low stays Low.
Confidence lower(Confidence c);

struct Citation {
    int source{0};       // 1-based number used in the answer text, e.g. [2]
    std::string doc_id;
    int page{0};         // 0 when unknown
    std::string location; // "table 3, row 4" or "chunk 7, Item 7"
    std::string claim;    // the sentence citing this source
};

struct Synthesis {
    std::string text;
    std::vector<Citation> citations;
    Confidence confidence{Confidence::Low};
    int uncited_claims{0};
    std::vector<std::string> warnings;
};

struct Claim {
    std::string text;
    std::vector<int> sources; // [n] markers found in the sentence
};

// Splits prose into sentences and collects their [n] citation markers.
std::vector<Claim> split_claims(const std::string& text);

// Confidence comes from where the answer came from, never from the model.
Confidence structured_confidence(const QueryRows& rows);
Confidence semantic_confidence(const RetrievalResult& retrieval);

// Turns query rows or ranked chunks into cited prose. With a language model
// the prose is generated and its markers validated; without one, or when the
// model output cites nothing, the answer is assembled from the sources.
class AnswerSynthesizer {
public:
    explicit AnswerSynthesizer(TextGenerator* llm) : llm_(llm) {}

    Synthesis from_rows(const std::string& question, const StructuredQuery& query, const QueryRows& rows,
                        bool fallback_used);
    Synthesis from_chunks(const std::string& question, const RetrievalResult& retrieval, bool fallback_used);

private:
    TextGenerator* llm_;
};
