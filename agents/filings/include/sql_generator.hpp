#pragma once
#include "config.hpp"
#include "model_clients.hpp"
#include "router.hpp"
#include "schema.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

struct StructuredQuery {
    std::string sql;
    nlohmann::json params = nlohmann::json::array(); // bound positionally to '?'
};

struct ValidationVerdict {
    bool valid{false};
    std::vector<std::string> errors;   // any error rejects the query
    std::vector<std::string> warnings; // reported, never rejecting
    int nesting_depth{0};

    std::string summary() const;
};

struct GeneratedQuery {
    StructuredQuery query;
    ValidationVerdict verdict;
};

// Checks a generated query before it is executed: one read-only SELECT/WITH
// statement, only tables and columns from the schema, no string literals (values
// must be bound parameters), one param per '?'. Subqueries nested deeper than
// max_nesting_depth only produce a warning.
ValidationVerdict validate_structured_query(const StructuredQuery& q, const SchemaDescription& schema,
                                            const ValidationOptions& opts);

// Asks the language model for {"sql": ..., "params": [...]} and validates it.
// Model output that is not such an object comes back as an invalid verdict.
// Throws PipelineError(GenerateQuery) only when the model call itself fails.
class StructuredQueryGenerator {
public:
    StructuredQueryGenerator(TextGenerator& llm, SchemaDescription schema, ValidationOptions opts);

    GeneratedQuery generate(const std::string& question, const RouteDecision& route);
    const SchemaDescription& schema() const { return schema_; }

private:
    std::string build_prompt(const std::string& question, const RouteDecision& route) const;

    TextGenerator& llm_;
    SchemaDescription schema_;
    ValidationOptions opts_;
};
