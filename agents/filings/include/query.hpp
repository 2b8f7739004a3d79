#pragma once
#include "fact_store.hpp"
#include "monitor.hpp"
#include "retriever.hpp"
#include "router.hpp"
#include "sql_generator.hpp"
#include "synthesizer.hpp"
#include <string>
#include <vector>

struct Answer {
    bool answered{false};
    std::string text;
    std::vector<Citation> citations;
    Confidence confidence{Confidence::Low};
    QueryPath path_used{QueryPath::Semantic};
    bool fallback_used{false};
    std::vector<QueryPath> attempted_paths; // at most two, never repeated
    RouteDecision route;
    std::string sql; // structured query that produced the answer, if any
    std::vector<std::string> warnings;
    std::string failure_reason; // set when answered is false
    double elapsed_ms{0.0};
};

// Routes a question, runs the chosen path, and falls back to the other path
// once if the first one fails. answer() never throws.
class QueryOrchestrator {
public:
    QueryOrchestrator(QueryRouter& router, StructuredQueryGenerator& generator, FactStore& facts,
                      HybridRetriever& retriever, AnswerSynthesizer& synthesizer, PipelineMonitor* monitor,
                      ValidationOptions validation);

    Answer answer(const std::string& question);

private:
    Synthesis run_structured(const std::string& question, Answer& ans);
    Synthesis run_semantic(const std::string& question, Answer& ans);

    QueryRouter& router_;
    StructuredQueryGenerator& generator_;
    FactStore& facts_;
    HybridRetriever& retriever_;
    AnswerSynthesizer& synthesizer_;
    PipelineMonitor* monitor_;
    ValidationOptions validation_;
};
