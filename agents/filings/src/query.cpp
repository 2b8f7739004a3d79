#include "../include/query.hpp"
#include "../include/errors.hpp"
#include <chrono>
#include <iostream>

QueryOrchestrator::QueryOrchestrator(QueryRouter& router, StructuredQueryGenerator& generator, FactStore& facts,
                                     HybridRetriever& retriever, AnswerSynthesizer& synthesizer,
                                     PipelineMonitor* monitor, ValidationOptions validation)
    : router_(router), generator_(generator), facts_(facts), retriever_(retriever), synthesizer_(synthesizer),
      monitor_(monitor), validation_(validation) {}

Synthesis QueryOrchestrator::run_structured(const std::string& question, Answer& ans) {
    GeneratedQuery gen = generator_.generate(question, ans.route);
    for (const auto& w : gen.verdict.warnings) ans.warnings.push_back("query: " + w);
    if (!gen.verdict.valid) {
        throw PipelineError(ErrorKind::GenerationInvalid, Stage::GenerateQuery, gen.verdict.summary());
    }
    QueryRows rows = facts_.run_select(gen.query.sql, gen.query.params, validation_.row_limit,
                                       validation_.execution_timeout_ms);
    if (rows.rows.empty()) {
        throw PipelineError(ErrorKind::RetrievalEmpty, Stage::ExecuteQuery, "structured query returned no rows");
    }
    ans.sql = gen.query.sql;
    return synthesizer_.from_rows(question, gen.query, rows, ans.fallback_used);
}

Synthesis QueryOrchestrator::run_semantic(const std::string& question, Answer& ans) {
    ChunkFilter scope;
    scope.entity = ans.route.entity;
    scope.doc_type = ans.route.doc_type;
    if (ans.route.fiscal_periods.size() == 1) scope.fiscal_period = ans.route.fiscal_periods.front();
    const auto& opts = retriever_.options();
    RetrievalResult r = retriever_.retrieve(question, scope, opts.top_k);
    if (r.results.empty() && (!scope.entity.empty() || !scope.fiscal_period.empty() || !scope.doc_type.empty())) {
        ans.warnings.push_back("nothing matched the entity, form or period in the question, searched all filings");
        r = retriever_.retrieve(question, ChunkFilter{}, opts.top_k);
    }
    return synthesizer_.from_chunks(question, r, ans.fallback_used);
}

Answer QueryOrchestrator::answer(const std::string& question) {
    auto t0 = std::chrono::steady_clock::now();
    Answer ans;
    try {
        ans.route = router_.route(question);
    } catch (const std::exception& e) {
        ans.route = RouteDecision{};
        ans.warnings.push_back(std::string("routing failed, using semantic search: ") + e.what());
    }

    std::vector<std::string> reasons;
    QueryPath path = ans.route.path;
    for (int attempt = 0; attempt < 2 && !ans.answered; ++attempt) {
        ans.attempted_paths.push_back(path);
        ans.fallback_used = attempt > 0;
        try {
            Synthesis s = path == QueryPath::Structured ? run_structured(question, ans) : run_semantic(question, ans);
            ans.answered = true;
            ans.path_used = path;
            ans.text = std::move(s.text);
            ans.citations = std::move(s.citations);
            ans.confidence = s.confidence;
            for (auto& w : s.warnings) ans.warnings.push_back(std::move(w));
        } catch (const std::exception& e) {
            std::string stage = "retrieve";
            std::string kind = "error";
            if (auto pe = dynamic_cast<const PipelineError*>(&e)) {
                stage = to_string(pe->stage());
                kind = to_string(pe->kind());
            }
            std::string reason = std::string(to_string(path)) + " path failed at " + stage + " (" + kind + "): " + e.what();
            std::cerr << "[query] " << reason << "\n";
            reasons.push_back(reason);
            ans.warnings.push_back(reason);
            if (monitor_) monitor_->log_error("query", stage, kind, reason);
            path = other_path(path);
        }
    }

    if (!ans.answered) {
        ans.confidence = Confidence::Low;
        ans.failure_reason = reasons.empty() ? "no path attempted" : reasons.front();
        for (std::size_t i = 1; i < reasons.size(); ++i) ans.failure_reason += "; " + reasons[i];
        ans.text = "Unable to answer: " + ans.failure_reason;
    }
    ans.elapsed_ms = std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - t0).count();
    if (monitor_) {
        monitor_->record_execution("query", ans.answered, ans.elapsed_ms,
                                   {{"path", to_string(ans.path_used)},
                                    {"fallback", ans.fallback_used},
                                    {"confidence", to_string(ans.confidence)}});
    }
    return ans;
}
