#include "../include/monitor.hpp"
#include "../include/sqlite_util.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cmath>
#include <iostream>

using json = nlohmann::json;

namespace {
std::int64_t window_start(int window_hours) {
    return unix_now() - (std::int64_t)window_hours * 3600;
}
}

void PipelineMonitor::record_execution(const std::string& pipeline, bool success, double duration_ms,
                                       const json& metadata) {
    try {
        store_.with_db([&](sqlite3* db) {
            Stmt st(db,
                "INSERT INTO pipeline_executions (pipeline, status, recorded_at, duration_ms, metadata)\n"
                "VALUES (?, ?, ?, ?, ?);");
            st.bind(1, pipeline).bind(2, std::string(success ? "success" : "failure"))
              .bind(3, unix_now()).bind(4, duration_ms).bind(5, metadata.dump());
            st.run();
        });
    } catch (const std::exception& e) {
        std::cerr << "[monitor] record_execution failed: " << e.what() << "\n";
    }
}

void PipelineMonitor::record_cost(const std::string& service, int units, double cost_usd) {
    if (units < 0 || cost_usd < 0.0) {
        std::cerr << "[monitor] ignoring negative cost for " << service << "\n";
        return;
    }
    try {
        store_.with_db([&](sqlite3* db) {
            Stmt st(db, "INSERT INTO api_costs (service, units, cost_usd, recorded_at) VALUES (?, ?, ?, ?);");
            st.bind(1, service).bind(2, units).bind(3, cost_usd).bind(4, unix_now());
            st.run();
        });
    } catch (const std::exception& e) {
        std::cerr << "[monitor] record_cost failed: " << e.what() << "\n";
    }
}

void PipelineMonitor::log_error(const std::string& pipeline, const std::string& stage,
                                const std::string& kind, const std::string& message) {
    try {
        store_.with_db([&](sqlite3* db) {
            Stmt st(db,
                "INSERT INTO error_log (pipeline, stage, kind, message, recorded_at) VALUES (?, ?, ?, ?, ?);");
            st.bind(1, pipeline).bind(2, stage).bind(3, kind).bind(4, message).bind(5, unix_now());
            st.run();
        });
    } catch (const std::exception& e) {
        std::cerr << "[monitor] log_error failed: " << e.what() << "\n";
    }
}

PipelineMetrics PipelineMonitor::metrics(const std::string& pipeline, int window_hours) {
    PipelineMetrics m;
    m.pipeline = pipeline;
    std::vector<double> durations;
    store_.with_db([&](sqlite3* db) {
        Stmt st(db,
            "SELECT status, duration_ms FROM pipeline_executions\n"
            "WHERE pipeline = ? AND recorded_at >= ?;");
        st.bind(1, pipeline).bind(2, window_start(window_hours));
        while (st.step()) {
            ++m.executions;
            if (st.text(0) == "success") ++m.successes;
            else ++m.failures;
            durations.push_back(st.real(1));
        }
    });
    if (m.executions == 0) return m;
    m.success_rate = (double)m.successes / m.executions;
    double sum = 0.0;
    for (double d : durations) sum += d;
    m.avg_duration_ms = sum / durations.size();
    std::sort(durations.begin(), durations.end());
    // Nearest-rank percentile.
    size_t rank = (size_t)std::ceil(0.95 * durations.size());
    m.p95_duration_ms = durations[std::max<size_t>(rank, 1) - 1];
    return m;
}

double PipelineMonitor::total_cost(int window_hours) {
    return store_.with_db([&](sqlite3* db) {
        Stmt st(db, "SELECT COALESCE(SUM(cost_usd), 0) FROM api_costs WHERE recorded_at >= ?;");
        st.bind(1, window_start(window_hours));
        st.step();
        return st.real(0);
    });
}

BudgetStatus PipelineMonitor::check_budget(double limit_usd, int window_hours) {
    BudgetStatus b;
    b.budget_limit = limit_usd;
    store_.with_db([&](sqlite3* db) {
        Stmt st(db,
            "SELECT service, SUM(cost_usd) FROM api_costs WHERE recorded_at >= ?\n"
            "GROUP BY service ORDER BY service;");
        st.bind(1, window_start(window_hours));
        while (st.step()) {
            double cost = st.real(1);
            b.total_cost += cost;
            if (cost > limit_usd) b.services_over_limit.push_back(st.text(0));
        }
    });
    b.exceeded = b.total_cost > limit_usd;
    return b;
}

std::vector<ErrorEntry> PipelineMonitor::error_history(int limit) {
    std::vector<ErrorEntry> out;
    store_.with_db([&](sqlite3* db) {
        Stmt st(db,
            "SELECT pipeline, stage, kind, message, recorded_at FROM error_log\n"
            "ORDER BY id DESC LIMIT ?;");
        st.bind(1, limit);
        while (st.step()) {
            out.push_back({st.text(0), st.text(1), st.text(2), st.text(3), st.integer(4)});
        }
    });
    return out;
}

double PipelineMonitor::error_rate(const std::string& pipeline, int window_hours) {
    auto m = metrics(pipeline, window_hours);
    return m.executions == 0 ? 0.0 : (double)m.failures / m.executions;
}

std::vector<PipelineMetrics> PipelineMonitor::bottlenecks(int threshold_ms, int window_hours) {
    std::vector<std::string> names;
    store_.with_db([&](sqlite3* db) {
        Stmt st(db, "SELECT DISTINCT pipeline FROM pipeline_executions WHERE recorded_at >= ? ORDER BY pipeline;");
        st.bind(1, window_start(window_hours));
        while (st.step()) names.push_back(st.text(0));
    });
    std::vector<PipelineMetrics> out;
    for (const auto& name : names) {
        auto m = metrics(name, window_hours);
        if (m.avg_duration_ms > threshold_ms || m.p95_duration_ms > threshold_ms) out.push_back(std::move(m));
    }
    std::stable_sort(out.begin(), out.end(), [](const PipelineMetrics& a, const PipelineMetrics& b) {
        return a.avg_duration_ms > b.avg_duration_ms;
    });
    return out;
}

json PipelineMonitor::summary(int window_hours) {
    json pipelines = json::object();
    for (const char* name : {"ingestion", "query"}) {
        auto m = metrics(name, window_hours);
        pipelines[name] = {
            {"executions", m.executions},
            {"success_rate", m.success_rate},
            {"avg_duration_ms", m.avg_duration_ms},
            {"p95_duration_ms", m.p95_duration_ms},
            {"error_rate", m.executions == 0 ? 0.0 : (double)m.failures / m.executions}
        };
    }
    json errors = json::array();
    for (const auto& e : error_history(10)) {
        errors.push_back({{"pipeline", e.pipeline}, {"stage", e.stage}, {"kind", e.kind},
                          {"message", e.message}, {"recorded_at", e.recorded_at}});
    }
    return {
        {"window_hours", window_hours},
        {"pipelines", pipelines},
        {"total_cost_usd", total_cost(window_hours)},
        {"recent_errors", errors}
    };
}
