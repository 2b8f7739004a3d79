#include "../include/sql_generator.hpp"
#include "../include/errors.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <cctype>
#include <map>
#include <set>
#include <sstream>

namespace {

enum class TokKind { Ident, QuotedIdent, String, Number, Param, Punct };

struct Token {
    TokKind kind;
    std::string text;
    std::string upper;
};

std::string upper(std::string s) {
    for (auto& c : s) c = (char)std::toupper((unsigned char)c);
    return s;
}

const std::set<std::string>& keywords() {
    static const std::set<std::string> k = {
        "SELECT", "FROM", "WHERE", "AND", "OR", "NOT", "IN", "IS", "NULL", "AS", "ON", "JOIN", "LEFT",
        "RIGHT", "INNER", "OUTER", "CROSS", "FULL", "NATURAL", "USING", "GROUP", "BY", "ORDER", "HAVING",
        "LIMIT", "OFFSET", "ASC", "DESC", "DISTINCT", "ALL", "UNION", "EXCEPT", "INTERSECT", "CASE",
        "WHEN", "THEN", "ELSE", "END", "BETWEEN", "LIKE", "GLOB", "ESCAPE", "WITH", "RECURSIVE",
        "EXISTS", "CAST", "COLLATE", "NOCASE", "TRUE", "FALSE", "INTEGER", "REAL", "TEXT", "NUMERIC",
        "NULLS", "FIRST", "LAST", "FILTER", "OVER", "PARTITION", "ROWS", "RANGE", "CURRENT_DATE",
        "CURRENT_TIME", "CURRENT_TIMESTAMP",
    };
    return k;
}

const std::set<std::string>& write_keywords() {
    static const std::set<std::string> k = {
        "INSERT", "UPDATE", "DELETE", "DROP", "ALTER", "CREATE", "ATTACH", "DETACH", "PRAGMA",
        "REPLACE", "VACUUM", "REINDEX", "ANALYZE", "BEGIN", "COMMIT", "ROLLBACK", "SAVEPOINT", "RELEASE",
    };
    return k;
}

// Lexes SQL into tokens; problems are appended to errors.
std::vector<Token> lex_sql(const std::string& sql, std::vector<std::string>& errors) {
    std::vector<Token> out;
    std::size_t i = 0;
    const std::size_t n = sql.size();
    auto is_ident = [](char c) { return std::isalnum((unsigned char)c) || c == '_'; };
    while (i < n) {
        char c = sql[i];
        if (std::isspace((unsigned char)c)) { ++i; continue; }
        if ((c == '-' && i + 1 < n && sql[i + 1] == '-') || (c == '/' && i + 1 < n && sql[i + 1] == '*')) {
            errors.push_back("comments are not allowed");
            break;
        }
        if (c == '\'') {
            std::size_t j = i + 1;
            while (j < n) {
                if (sql[j] == '\'' && j + 1 < n && sql[j + 1] == '\'') { j += 2; continue; }
                if (sql[j] == '\'') break;
                ++j;
            }
            out.push_back({TokKind::String, sql.substr(i, j + 1 - i), ""});
            i = j + 1;
            continue;
        }
        if (c == '"' || c == '`' || c == '[') {
            char close = c == '[' ? ']' : c;
            std::size_t j = sql.find(close, i + 1);
            if (j == std::string::npos) {
                errors.push_back("unterminated quoted identifier");
                break;
            }
            std::string name = sql.substr(i + 1, j - i - 1);
            out.push_back({TokKind::QuotedIdent, name, upper(name)});
            i = j + 1;
            continue;
        }
        if (c == '?') {
            if (i + 1 < n && std::isdigit((unsigned char)sql[i + 1])) {
                errors.push_back("numbered parameters are not supported; use '?'");
            }
            out.push_back({TokKind::Param, "?", "?"});
            ++i;
            while (i < n && std::isdigit((unsigned char)sql[i])) ++i;
            continue;
        }
        if ((c == ':' || c == '@' || c == '$') && i + 1 < n && is_ident(sql[i + 1])) {
            errors.push_back("named parameters are not supported; use '?'");
            ++i;
            continue;
        }
        if (std::isdigit((unsigned char)c) || (c == '.' && i + 1 < n && std::isdigit((unsigned char)sql[i + 1]))) {
            std::size_t j = i;
            while (j < n && (std::isalnum((unsigned char)sql[j]) || sql[j] == '.')) ++j;
            out.push_back({TokKind::Number, sql.substr(i, j - i), ""});
            i = j;
            continue;
        }
        if (std::isalpha((unsigned char)c) || c == '_') {
            std::size_t j = i;
            while (j < n && is_ident(sql[j])) ++j;
            std::string word = sql.substr(i, j - i);
            out.push_back({TokKind::Ident, word, upper(word)});
            i = j;
            continue;
        }
        if (std::string("();,.*=<>!+-/%|&~").find(c) != std::string::npos) {
            out.push_back({TokKind::Punct, std::string(1, c), std::string(1, c)});
            ++i;
            continue;
        }
        errors.push_back(std::string("unexpected character '") + c + "'");
        break;
    }
    return out;
}

bool is_name(const Token& t) {
    return t.kind == TokKind::QuotedIdent || (t.kind == TokKind::Ident && !keywords().count(t.upper));
}

bool is_punct(const std::vector<Token>& toks, std::size_t i, const char* p) {
    return i < toks.size() && toks[i].kind == TokKind::Punct && toks[i].text == p;
}

bool is_kw(const std::vector<Token>& toks, std::size_t i, const char* kw) {
    return i < toks.size() && toks[i].kind == TokKind::Ident && toks[i].upper == kw;
}

std::size_t matching_paren(const std::vector<Token>& toks, std::size_t open) {
    int depth = 0;
    for (std::size_t i = open; i < toks.size(); ++i) {
        if (is_punct(toks, i, "(")) ++depth;
        else if (is_punct(toks, i, ")") && --depth == 0) return i;
    }
    return toks.size();
}

}  // namespace

std::string ValidationVerdict::summary() const {
    std::ostringstream os;
    os << (valid ? "valid" : "invalid");
    for (const auto& e : errors) os << "; error: " << e;
    for (const auto& w : warnings) os << "; warning: " << w;
    return os.str();
}

ValidationVerdict validate_structured_query(const StructuredQuery& q, const SchemaDescription& schema,
                                            const ValidationOptions& opts) {
    ValidationVerdict v;
    auto toks = lex_sql(q.sql, v.errors);
    if (toks.empty()) {
        v.errors.push_back("query is empty");
        return v;
    }
    if (!is_kw(toks, 0, "SELECT") && !is_kw(toks, 0, "WITH")) {
        v.errors.push_back("query must start with SELECT or WITH");
    }

    std::size_t placeholders = 0;
    int depth = 0;
    std::vector<bool> select_parens;
    for (std::size_t i = 0; i < toks.size(); ++i) {
        const auto& t = toks[i];
        if (t.kind == TokKind::String) {
            v.errors.push_back("string literal " + t.text + " must be passed as a '?' parameter");
        } else if (t.kind == TokKind::Param) {
            ++placeholders;
        } else if (t.kind == TokKind::Ident && write_keywords().count(t.upper)) {
            v.errors.push_back("statement keyword " + t.upper + " is not allowed");
        } else if (is_punct(toks, i, ";") && i + 1 != toks.size()) {
            v.errors.push_back("only one statement is allowed");
        } else if (is_punct(toks, i, "(")) {
            bool sub = is_kw(toks, i + 1, "SELECT");
            select_parens.push_back(sub);
            if (sub) v.nesting_depth = std::max(v.nesting_depth, ++depth);
        } else if (is_punct(toks, i, ")") && !select_parens.empty()) {
            if (select_parens.back()) --depth;
            select_parens.pop_back();
        }
    }
    if (!q.params.is_array()) {
        v.errors.push_back("params must be an array");
    } else {
        if (q.params.size() != placeholders) {
            v.errors.push_back("query has " + std::to_string(placeholders) + " placeholders but " +
                               std::to_string(q.params.size()) + " params");
        }
        for (const auto& p : q.params) {
            if (p.is_object() || p.is_array()) {
                v.errors.push_back("params must be scalar values");
                break;
            }
        }
    }
    if (v.nesting_depth > opts.max_nesting_depth) {
        v.warnings.push_back("subqueries nested " + std::to_string(v.nesting_depth) + " deep (threshold " +
                             std::to_string(opts.max_nesting_depth) + ")");
    }

    // First pass: names the query defines (CTEs, tables, aliases, column aliases).
    std::set<std::size_t> defined;
    std::set<std::string> ctes;
    std::map<std::string, const TableSchema*> qualifiers; // alias or table -> schema table, null when derived
    std::vector<const TableSchema*> tables;
    std::set<std::string> column_aliases;
    bool derived = false;

    for (std::size_t i = 0; i + 2 < toks.size(); ++i) {
        if (is_name(toks[i]) && is_kw(toks, i + 1, "AS") && is_punct(toks, i + 2, "(") &&
            (i == 0 || is_kw(toks, i - 1, "WITH") || is_kw(toks, i - 1, "RECURSIVE") || is_punct(toks, i - 1, ","))) {
            ctes.insert(toks[i].upper);
            qualifiers[toks[i].upper] = nullptr;
            defined.insert(i);
        }
    }
    auto read_alias = [&](std::size_t& j, const TableSchema* target) {
        if (is_kw(toks, j, "AS")) ++j;
        if (j < toks.size() && is_name(toks[j]) && !is_punct(toks, j + 1, "(")) {
            qualifiers[toks[j].upper] = target;
            defined.insert(j);
            ++j;
        }
    };
    for (std::size_t i = 0; i < toks.size(); ++i) {
        if (is_kw(toks, i, "FROM") || is_kw(toks, i, "JOIN")) {
            std::size_t j = i + 1;
            for (;;) {
                if (is_punct(toks, j, "(")) {
                    derived = true;
                    j = matching_paren(toks, j) + 1;
                    read_alias(j, nullptr);
                } else if (j < toks.size() && is_name(toks[j])) {
                    const Token& name = toks[j];
                    defined.insert(j);
                    const TableSchema* ts = nullptr;
                    if (is_punct(toks, j + 1, ".")) {
                        v.errors.push_back("schema-qualified table " + name.text + " is not allowed");
                        j += 2;
                        if (j < toks.size()) defined.insert(j);
                    } else if (ctes.count(name.upper)) {
                        derived = true;
                        qualifiers[name.upper] = nullptr;
                    } else if ((ts = schema.table(name.text))) {
                        tables.push_back(ts);
                        qualifiers[name.upper] = ts;
                    } else {
                        v.errors.push_back("unknown table " + name.text);
                    }
                    ++j;
                    read_alias(j, ts);
                } else {
                    break;
                }
                if (!is_punct(toks, j, ",")) break;
                ++j;
            }
        } else if (is_kw(toks, i, "AS") && i + 1 < toks.size() && is_name(toks[i + 1]) && !defined.count(i + 1) &&
                   !is_punct(toks, i + 2, "(")) {
            column_aliases.insert(toks[i + 1].upper);
            defined.insert(i + 1);
        }
    }

    // Second pass: every remaining name is a column reference.
    auto any_table_has = [&](const std::string& col, const std::vector<const TableSchema*>& in) {
        return std::any_of(in.begin(), in.end(), [&](const TableSchema* t) { return t->has_column(col); });
    };
    std::vector<const TableSchema*> all_tables;
    for (const auto& t : schema.tables) all_tables.push_back(&t);

    for (std::size_t i = 0; i < toks.size(); ++i) {
        if (defined.count(i) || !is_name(toks[i])) continue;
        const Token& t = toks[i];
        if (t.kind == TokKind::Ident && is_punct(toks, i + 1, "(")) continue; // function call
        if (is_punct(toks, i + 1, ".")) {
            auto it = qualifiers.find(t.upper);
            if (it == qualifiers.end()) {
                v.errors.push_back("unknown table or alias " + t.text);
            } else if (i + 2 < toks.size() && is_name(toks[i + 2]) && it->second &&
                       !it->second->has_column(toks[i + 2].text)) {
                v.errors.push_back("unknown column " + t.text + "." + toks[i + 2].text);
            }
            i += 2;
            continue;
        }
        if (column_aliases.count(t.upper)) continue;
        if (any_table_has(t.text, tables)) continue;
        if (derived && any_table_has(t.text, all_tables)) continue;
        v.errors.push_back("unknown column " + t.text);
    }

    v.valid = v.errors.empty();
    return v;
}

StructuredQueryGenerator::StructuredQueryGenerator(TextGenerator& llm, SchemaDescription schema, ValidationOptions opts)
    : llm_(llm), schema_(std::move(schema)), opts_(opts) {}

std::string StructuredQueryGenerator::build_prompt(const std::string& question, const RouteDecision& route) const {
    std::ostringstream os;
    os << "Schema:\n" << schema_.describe() << "\n";
    if (!route.entity.empty()) os << "Entity ticker: " << route.entity << "\n";
    if (!route.doc_type.empty()) os << "Document type: " << route.doc_type << "\n";
    if (!route.fiscal_periods.empty()) {
        os << "Fiscal periods:";
        for (const auto& p : route.fiscal_periods) os << " " << p;
        os << "\n";
    }
    if (!route.metric.empty()) os << "Metric: " << route.metric << "\n";
    os << "\nQuestion: " << question << "\n";
    return os.str();
}

GeneratedQuery StructuredQueryGenerator::generate(const std::string& question, const RouteDecision& route) {
    static const char* system =
        "You translate questions about company filings into one SQLite SELECT statement.\n"
        "Use only the tables and columns in the schema. Never write string literals: put every value in "
        "params and use a ? placeholder for it. Include doc_id, page and confidence columns from facts when "
        "selecting facts. Use AS for every computed column.\n"
        "Reply with only a JSON object: {\"sql\": \"...\", \"params\": [...]}";

    std::string raw;
    try {
        raw = llm_.generate(system, build_prompt(question, route));
    } catch (const std::exception& e) {
        throw PipelineError(ErrorKind::GenerationInvalid, Stage::GenerateQuery,
                            std::string("query generation failed: ") + e.what(), true);
    }

    GeneratedQuery out;
    std::string body = strip_code_fences(raw);
    auto b = body.find('{');
    auto e = body.rfind('}');
    nlohmann::json j = (b == std::string::npos || e == std::string::npos || e < b)
                           ? nlohmann::json()
                           : nlohmann::json::parse(body.substr(b, e - b + 1), nullptr, false);
    if (!j.is_object() || !j.contains("sql") || !j["sql"].is_string()) {
        out.verdict.errors.push_back("model output is not a {\"sql\", \"params\"} object");
        return out;
    }
    out.query.sql = trim(j["sql"].get<std::string>());
    if (j.contains("params")) out.query.params = j["params"];
    out.verdict = validate_structured_query(out.query, schema_, opts_);
    return out;
}
