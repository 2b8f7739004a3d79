#pragma once
#include <string>
#include <vector>

enum class QueryPath { Structured, Semantic };

const char* to_string(QueryPath p);
inline QueryPath other_path(QueryPath p) {
    return p == QueryPath::Structured ? QueryPath::Semantic : QueryPath::Structured;
}

struct RouteDecision {
    QueryPath path{QueryPath::Semantic};
    std::string entity;                      // ticker, empty if none found
    std::string doc_type;                    // "10-K", "10-Q", "8-K" or empty
    std::vector<std::string> fiscal_periods; // years mentioned, in order
    std::string metric;                      // e.g. "revenue", structured only
    std::vector<std::string> signals;        // why this path was chosen
};

// Classifies a question. Implementations keep no state between calls.
class QueryRouter {
public:
    virtual ~QueryRouter() = default;
    virtual RouteDecision route(const std::string& question) = 0;
};

// Keyword and pattern rules: a named financial metric together with a
// quantitative cue (a year, a number, a comparison, "how much") selects the
// structured path unless the question asks for an explanation.
class HeuristicQueryRouter : public QueryRouter {
public:
    RouteDecision route(const std::string& question) override;
};

std::vector<std::string> extract_years(const std::string& text);
std::string extract_ticker(const std::string& text);
std::string extract_doc_type(const std::string& text);
