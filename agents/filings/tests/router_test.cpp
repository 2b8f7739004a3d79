#include "../include/router.hpp"
#include <gtest/gtest.h>

namespace {

TEST(HeuristicQueryRouter, MetricWithPeriodIsStructured) {
    HeuristicQueryRouter router;
    auto d = router.route("What was TSLA's total revenue in 2020?");
    EXPECT_EQ(d.path, QueryPath::Structured);
    EXPECT_EQ(d.entity, "TSLA");
    EXPECT_EQ(d.metric, "revenue");
    EXPECT_EQ(d.fiscal_periods, std::vector<std::string>{"2020"});
}

TEST(HeuristicQueryRouter, ComparisonAcrossYearsIsStructured) {
    HeuristicQueryRouter router;
    auto d = router.route("How much did net income grow between 2019 and FY2020 for ACME?");
    EXPECT_EQ(d.path, QueryPath::Structured);
    EXPECT_EQ(d.metric, "net income");
    EXPECT_EQ(d.fiscal_periods, (std::vector<std::string>{"2019", "2020"}));
    EXPECT_EQ(d.entity, "ACME");
}

TEST(HeuristicQueryRouter, NarrativeQuestionIsSemantic) {
    HeuristicQueryRouter router;
    auto d = router.route("What are the main risk factors described in the TSLA 10-K?");
    EXPECT_EQ(d.path, QueryPath::Semantic);
    EXPECT_EQ(d.entity, "TSLA");
    EXPECT_EQ(d.doc_type, "10-K");
    EXPECT_TRUE(d.metric.empty());
}

TEST(HeuristicQueryRouter, ExplanationOfAMetricIsSemantic) {
    HeuristicQueryRouter router;
    auto d = router.route("Why did revenue decline in 2020?");
    EXPECT_EQ(d.path, QueryPath::Semantic);
    EXPECT_EQ(d.fiscal_periods, std::vector<std::string>{"2020"});
}

TEST(HeuristicQueryRouter, MetricWithoutQuantitativeCueIsSemantic) {
    HeuristicQueryRouter router;
    EXPECT_EQ(router.route("Tell me about debt").path, QueryPath::Semantic);
}

TEST(HeuristicQueryRouter, SameQuestionSameDecision) {
    HeuristicQueryRouter router;
    const std::string q = "Compare ACME revenues in 2019 versus 2020";
    auto a = router.route(q);
    auto b = router.route(q);
    EXPECT_EQ(a.path, b.path);
    EXPECT_EQ(a.signals, b.signals);
}

TEST(Extractors, TickerSkipsCommonCapitals) {
    EXPECT_EQ(extract_ticker("What is the EPS of MSFT in FY 2021?"), "MSFT");
    EXPECT_EQ(extract_ticker("what is the revenue?"), "");
    EXPECT_EQ(extract_doc_type("latest 10-q filing"), "10-Q");
    EXPECT_TRUE(extract_years("no years here, just 123 and 3000").empty());
}

TEST(QueryPathHelpers, OtherPathFlips) {
    EXPECT_EQ(other_path(QueryPath::Structured), QueryPath::Semantic);
    EXPECT_EQ(other_path(QueryPath::Semantic), QueryPath::Structured);
    EXPECT_STREQ(to_string(QueryPath::Structured), "structured");
}

}  // namespace
