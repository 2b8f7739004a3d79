#include "../include/router.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <regex>
#include <set>

namespace {

// Longest phrases first so "net income" wins over "income".
const std::vector<std::string>& metric_terms() {
    static const std::vector<std::string> terms = {
        "earnings per share", "operating income", "net income", "gross margin", "gross profit",
        "operating margin", "free cash flow", "cash flow", "total assets", "total liabilities",
        "long-term debt", "research and development", "shareholders equity", "stockholders equity",
        "operating expenses", "cost of revenue", "revenues", "revenue", "sales", "eps", "ebitda",
        "profit", "income", "margin", "assets", "liabilities", "debt", "expenses", "dividends",
        "dividend", "deliveries", "capex", "capital expenditures", "cash",
    };
    return terms;
}

const std::vector<std::string>& quantitative_cues() {
    static const std::vector<std::string> cues = {
        "how much", "how many", "what was", "what were", "total", "increase", "decrease", "growth",
        "grew", "change", "compare", "compared", "versus", " vs", "higher", "lower", "more than",
        "less than", "greater", "percent", "%", "ratio", "average", "sum", "difference", "between",
    };
    return cues;
}

const std::vector<std::string>& explanation_cues() {
    static const std::vector<std::string> cues = {
        "why", "explain", "describe", "discuss", "what risks", "risk factor", "strategy", "outlook",
        "how does", "how did", "summarize", "what factors", "reason",
    };
    return cues;
}

bool contains_word(const std::string& hay, const std::string& needle) {
    std::size_t pos = 0;
    while ((pos = hay.find(needle, pos)) != std::string::npos) {
        bool left = pos == 0 || !std::isalnum((unsigned char)hay[pos - 1]);
        std::size_t end = pos + needle.size();
        bool right = end >= hay.size() || !std::isalnum((unsigned char)hay[end]);
        if (left && right) return true;
        pos = end;
    }
    return false;
}

}  // namespace

const char* to_string(QueryPath p) {
    return p == QueryPath::Structured ? "structured" : "semantic";
}

std::vector<std::string> extract_years(const std::string& text) {
    static const std::regex year_re("\\b(?:FY\\s?)?((?:19|20)\\d{2})\\b", std::regex::icase);
    std::vector<std::string> out;
    for (auto it = std::sregex_iterator(text.begin(), text.end(), year_re); it != std::sregex_iterator(); ++it) {
        std::string y = (*it)[1].str();
        if (std::find(out.begin(), out.end(), y) == out.end()) out.push_back(y);
    }
    return out;
}

std::string extract_ticker(const std::string& text) {
    static const std::set<std::string> not_tickers = {
        "I", "A", "FY", "EPS", "US", "USA", "SEC", "Q", "CEO", "CFO", "GAAP", "EBITDA", "R", "AND", "OR",
        "THE", "WHAT", "HOW", "WHY", "K", "IPO", "AI", "EV", "EVS", "Q1", "Q2", "Q3", "Q4",
    };
    static const std::regex ticker_re("\\$?\\b([A-Z]{1,5})\\b");
    for (auto it = std::sregex_iterator(text.begin(), text.end(), ticker_re); it != std::sregex_iterator(); ++it) {
        std::string t = (*it)[1].str();
        if (!not_tickers.count(t)) return t;
    }
    return {};
}

std::string extract_doc_type(const std::string& text) {
    static const std::regex type_re("\\b(10-K|10-Q|8-K)\\b", std::regex::icase);
    std::smatch m;
    if (!std::regex_search(text, m, type_re)) return {};
    std::string t = m[1].str();
    for (auto& c : t) c = (char)std::toupper((unsigned char)c);
    return t;
}

RouteDecision HeuristicQueryRouter::route(const std::string& question) {
    RouteDecision d;
    const std::string q = to_lower(question);
    d.entity = extract_ticker(question);
    d.doc_type = extract_doc_type(question);
    d.fiscal_periods = extract_years(question);

    for (const auto& m : metric_terms()) {
        if (contains_word(q, m)) {
            d.metric = m;
            break;
        }
    }
    bool quantitative = !d.fiscal_periods.empty();
    if (quantitative) d.signals.push_back("fiscal period");
    if (std::any_of(q.begin(), q.end(), [](unsigned char c) { return std::isdigit(c); }) && d.fiscal_periods.empty()) {
        quantitative = true;
        d.signals.push_back("number");
    }
    for (const auto& cue : quantitative_cues()) {
        if (q.find(cue) != std::string::npos) {
            quantitative = true;
            d.signals.push_back("cue '" + trim(cue) + "'");
            break;
        }
    }
    bool explanatory = false;
    for (const auto& cue : explanation_cues()) {
        if (contains_word(q, cue)) {
            explanatory = true;
            d.signals.push_back("explanation '" + cue + "'");
            break;
        }
    }

    if (!d.metric.empty()) d.signals.push_back("metric '" + d.metric + "'");
    d.path = (!d.metric.empty() && quantitative && !explanatory) ? QueryPath::Structured : QueryPath::Semantic;
    if (d.path == QueryPath::Semantic) d.metric.clear();
    return d;
}
