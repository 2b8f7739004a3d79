#pragma once
#include "fact_store.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>

struct PipelineMetrics {
    std::string pipeline;
    int executions{0};
    int successes{0};
    int failures{0};
    double success_rate{0.0};
    double avg_duration_ms{0.0};
    double p95_duration_ms{0.0};
};

struct BudgetStatus {
    bool exceeded{false};
    double total_cost{0.0};
    double budget_limit{0.0};
    std::vector<std::string> services_over_limit;
};

struct ErrorEntry {
    std::string pipeline;
    std::string stage;
    std::string kind;
    std::string message;
    std::int64_t recorded_at{0};
};

// Execution history, external-call cost and error log, persisted next to the
// filings. Recording never throws: a monitoring failure is logged and the
// pipeline carries on.
class PipelineMonitor {
public:
    explicit PipelineMonitor(FactStore& store) : store_(store) {}

    void record_execution(const std::string& pipeline, bool success, double duration_ms,
                          const nlohmann::json& metadata = nlohmann::json::object());
    void record_cost(const std::string& service, int units, double cost_usd);
    void log_error(const std::string& pipeline, const std::string& stage,
                   const std::string& kind, const std::string& message);

    PipelineMetrics metrics(const std::string& pipeline, int window_hours);
    double total_cost(int window_hours);
    BudgetStatus check_budget(double limit_usd, int window_hours);
    std::vector<ErrorEntry> error_history(int limit);
    // Failed executions over all executions in the window; 0 when idle.
    double error_rate(const std::string& pipeline, int window_hours);
    // Pipelines whose average or p95 duration in the window exceeds
    // threshold_ms, slowest average first.
    std::vector<PipelineMetrics> bottlenecks(int threshold_ms, int window_hours);
    nlohmann::json summary(int window_hours);

private:
    FactStore& store_;
};
