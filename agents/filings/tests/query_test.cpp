#include "../include/ingestion.hpp"
#include "../include/query.hpp"
#include "../include/synthesizer.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

namespace {

const char* kRevenueQuery =
    R"({"sql": "SELECT entity, row_label, column_label, value_num, value_text, doc_id, page, confidence FROM facts WHERE entity = ? AND row_label = ? AND column_label = ?", "params": ["ACME", "Total revenues", "2020"]})";

bool mentions(const std::vector<std::string>& msgs, const std::string& needle) {
    for (const auto& m : msgs) {
        if (m.find(needle) != std::string::npos) return true;
    }
    return false;
}

TEST(ClaimSplitting, CollectsMarkersPerSentence) {
    auto claims = split_claims("Revenue grew [1][2]. Costs fell. [3]\nMargins held [4].");
    ASSERT_EQ(claims.size(), 3u);
    EXPECT_EQ(claims[0].sources, (std::vector<int>{1, 2}));
    EXPECT_EQ(claims[1].sources, (std::vector<int>{3}));
    EXPECT_EQ(claims[2].sources, (std::vector<int>{4}));
}

TEST(ClaimSplitting, OversizedMarkerCitesNothing) {
    EXPECT_NO_THROW(split_claims("Revenue grew [99999999999]."));
    auto claims = split_claims("Revenue grew [99999999999].");
    ASSERT_EQ(claims.size(), 1u);
    EXPECT_TRUE(claims[0].sources.empty());
}

class FixedRouter : public QueryRouter {
public:
    explicit FixedRouter(QueryPath p) : path_(p) {}
    RouteDecision route(const std::string&) override {
        RouteDecision d;
        d.path = path_;
        return d;
    }

private:
    QueryPath path_;
};

class QueryTest : public ::testing::Test {
protected:
    QueryTest() : facts(":memory:"), vectors(embedder.dimensions()), vision(sample_regions()), monitor(facts) {}

    void ingest_acme() {
        acquirer.add("mem://acme-2020", "text/plain", sample_filing());
        IngestOptions opts;
        opts.retry = RetryPolicy{2, 1, 2};
        IngestionOrchestrator orch(acquirer, embedder, &vision, facts, vectors, nullptr, opts);
        ASSERT_TRUE(orch.ingest({"mem://acme-2020", {"ACME", "10-K", "2020"}}).success);
    }

    Answer ask(const std::string& question, TextGenerator* answer_llm = nullptr, QueryRouter* router = nullptr) {
        HeuristicQueryRouter heuristic;
        StructuredQueryGenerator generator(sql_llm, FactStore::query_schema(), validation);
        HybridRetriever retriever(facts, vectors, embedder, retrieval);
        AnswerSynthesizer synthesizer(answer_llm);
        QueryRouter& chosen = router ? *router : static_cast<QueryRouter&>(heuristic);
        QueryOrchestrator orch(chosen, generator, facts, retriever, synthesizer, &monitor, validation);
        return orch.answer(question);
    }

    HashingEmbeddingClient embedder;
    FactStore facts;
    FaultyVectorStore vectors;
    MemoryAcquirer acquirer;
    ScriptedVision vision;
    PipelineMonitor monitor;
    ScriptedGenerator sql_llm{{kRevenueQuery}};
    ValidationOptions validation;
    RetrievalOptions retrieval;
};

TEST_F(QueryTest, StructuredQuestionIsAnsweredFromFacts) {
    ingest_acme();
    auto ans = ask("What was ACME total revenues in 2020?");

    ASSERT_TRUE(ans.answered) << ans.failure_reason;
    EXPECT_EQ(ans.path_used, QueryPath::Structured);
    EXPECT_FALSE(ans.fallback_used);
    EXPECT_EQ(ans.attempted_paths, std::vector<QueryPath>{QueryPath::Structured});
    EXPECT_NE(ans.text.find("31,536"), std::string::npos);
    EXPECT_EQ(ans.confidence, Confidence::VeryHigh);
    ASSERT_EQ(ans.citations.size(), 1u);
    EXPECT_EQ(ans.citations[0].doc_id, "ACME_10-K_2020");
    EXPECT_EQ(ans.citations[0].page, 2);
    EXPECT_FALSE(ans.sql.empty());
}

TEST_F(QueryTest, GeneratedProseKeepsItsCitations) {
    ingest_acme();
    ScriptedGenerator writer({"ACME reported total revenues of 31,536 million in 2020 [1]."});
    auto ans = ask("What was ACME total revenues in 2020?", &writer);

    ASSERT_TRUE(ans.answered);
    EXPECT_EQ(ans.text, "ACME reported total revenues of 31,536 million in 2020 [1].");
    ASSERT_EQ(ans.citations.size(), 1u);
    EXPECT_EQ(ans.citations[0].source, 1);
    EXPECT_EQ(ans.confidence, Confidence::VeryHigh);
}

TEST_F(QueryTest, UncitedClaimLowersConfidence) {
    ingest_acme();
    ScriptedGenerator writer({"Revenues were 31,536 million [1]. That was a record year."});
    auto ans = ask("What was ACME total revenues in 2020?", &writer);
    ASSERT_TRUE(ans.answered);
    EXPECT_EQ(ans.confidence, Confidence::High);
}

TEST_F(QueryTest, OversizedMarkerInGeneratedProseDoesNotFailTheQuery) {
    ingest_acme();
    ScriptedGenerator writer({"Revenues were 31,536 million [99999999999]."});
    Answer ans;
    ASSERT_NO_THROW(ans = ask("What was ACME total revenues in 2020?", &writer));
    ASSERT_TRUE(ans.answered) << ans.failure_reason;
    for (const auto& c : ans.citations) EXPECT_EQ(c.source, 1);
}

TEST_F(QueryTest, NonexistentColumnFallsBackToSemanticSearch) {
    ingest_acme();
    sql_llm.script({R"({"sql": "SELECT revenue_usd FROM facts WHERE entity = ?", "params": ["ACME"]})"});
    auto ans = ask("What was ACME total revenues in 2020?");

    ASSERT_TRUE(ans.answered) << ans.failure_reason;
    EXPECT_EQ(ans.path_used, QueryPath::Semantic);
    EXPECT_TRUE(ans.fallback_used);
    EXPECT_EQ(ans.attempted_paths, (std::vector<QueryPath>{QueryPath::Structured, QueryPath::Semantic}));
    EXPECT_TRUE(mentions(ans.warnings, "GenerationInvalid"));
    EXPECT_FALSE(ans.citations.empty());
    EXPECT_NE(ans.confidence, Confidence::VeryHigh);
    EXPECT_NE(ans.confidence, Confidence::High);

    auto errors = monitor.error_history(5);
    ASSERT_FALSE(errors.empty());
    EXPECT_EQ(errors.front().kind, "GenerationInvalid");
}

TEST_F(QueryTest, EmptyStructuredResultFallsBack) {
    ingest_acme();
    sql_llm.script({R"({"sql": "SELECT value_num FROM facts WHERE entity = ?", "params": ["NOPE"]})"});
    auto ans = ask("What was ACME total revenues in 2020?");
    ASSERT_TRUE(ans.answered);
    EXPECT_TRUE(ans.fallback_used);
    EXPECT_EQ(ans.path_used, QueryPath::Semantic);
    EXPECT_TRUE(mentions(ans.warnings, "RetrievalEmpty"));
}

TEST_F(QueryTest, SemanticQuestionCitesTheMatchingSection) {
    ingest_acme();
    auto ans = ask("What supply chain risks does ACME describe?");

    ASSERT_TRUE(ans.answered);
    EXPECT_EQ(ans.path_used, QueryPath::Semantic);
    EXPECT_FALSE(ans.fallback_used);
    EXPECT_EQ(sql_llm.calls, 0u);
    ASSERT_FALSE(ans.citations.empty());
    EXPECT_NE(ans.citations[0].location.find("Item 1A"), std::string::npos);
    EXPECT_NE(ans.text.find("Supply chain"), std::string::npos);
}

TEST_F(QueryTest, SemanticScopeFollowsTheFormNamedInTheQuestion) {
    ingest_acme();
    auto annual = ask("What supply chain risks does ACME describe in its 10-K?");
    ASSERT_TRUE(annual.answered);
    EXPECT_FALSE(mentions(annual.warnings, "searched all filings"));
    ASSERT_FALSE(annual.citations.empty());

    // Only a 10-K is stored, so a 10-Q scope matches nothing and is widened.
    auto quarterly = ask("What supply chain risks does ACME describe in its 10-Q?");
    ASSERT_TRUE(quarterly.answered);
    EXPECT_TRUE(mentions(quarterly.warnings, "searched all filings"));
    ASSERT_FALSE(quarterly.citations.empty());
    EXPECT_EQ(quarterly.citations[0].doc_id, "ACME_10-K_2020");
}

TEST_F(QueryTest, NoMatchingTextIsALowConfidenceAnswer) {
    auto ans = ask("What supply chain risks does ACME describe?");
    ASSERT_TRUE(ans.answered);
    EXPECT_EQ(ans.confidence, Confidence::Low);
    EXPECT_TRUE(ans.citations.empty());
    EXPECT_EQ(ans.attempted_paths.size(), 1u);
}

TEST_F(QueryTest, BothPathsFailingIsUnableToAnswerAfterOneFallback) {
    ingest_acme();
    sql_llm.fail = true;
    vectors.fail_nearest = true;
    retrieval.lexical_timeout_ms = -1; // deadline already passed
    auto ans = ask("What was ACME total revenues in 2020?");

    EXPECT_FALSE(ans.answered);
    EXPECT_EQ(ans.confidence, Confidence::Low);
    EXPECT_EQ(ans.attempted_paths, (std::vector<QueryPath>{QueryPath::Structured, QueryPath::Semantic}));
    EXPECT_EQ(sql_llm.calls, 1u);
    EXPECT_EQ(ans.text.rfind("Unable to answer", 0), 0u);
    EXPECT_NE(ans.failure_reason.find("structured path failed"), std::string::npos);
    EXPECT_NE(ans.failure_reason.find("semantic path failed"), std::string::npos);

    auto m = monitor.metrics("query", 1);
    EXPECT_EQ(m.executions, 1);
    EXPECT_EQ(m.failures, 1);
}

TEST_F(QueryTest, SemanticFailureFallsBackToStructured) {
    ingest_acme();
    vectors.fail_nearest = true;
    retrieval.lexical_timeout_ms = -1;
    FixedRouter router(QueryPath::Semantic);
    auto ans = ask("Summarize ACME revenues", nullptr, &router);

    ASSERT_TRUE(ans.answered) << ans.failure_reason;
    EXPECT_EQ(ans.path_used, QueryPath::Structured);
    EXPECT_TRUE(ans.fallback_used);
    EXPECT_EQ(ans.attempted_paths, (std::vector<QueryPath>{QueryPath::Semantic, QueryPath::Structured}));
    // Authoritative rows, one step down for the fallback.
    EXPECT_EQ(ans.confidence, Confidence::High);
}

TEST_F(QueryTest, ConfidenceIgnoresModelSelfReport) {
    ingest_acme();
    ScriptedGenerator writer({"I am 100% certain: revenue was 31,536 [1]. Confidence: very high."});
    sql_llm.script({R"({"sql": "SELECT revenue_usd FROM facts", "params": []})"});
    auto ans = ask("What was ACME total revenues in 2020?", &writer);
    ASSERT_TRUE(ans.answered);
    EXPECT_EQ(ans.path_used, QueryPath::Semantic);
    EXPECT_NE(ans.confidence, Confidence::VeryHigh);
}

}  // namespace
