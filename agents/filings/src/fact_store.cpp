#include "../include/fact_store.hpp"
#include "../include/errors.hpp"
#include "../include/sqlite_util.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <chrono>
#include <cctype>
#include <iostream>
#include <memory>

using json = nlohmann::json;

int QueryRows::column_index(const std::string& name) const {
    auto want = to_lower(name);
    for (size_t i = 0; i < columns.size(); ++i) {
        if (to_lower(columns[i]) == want) return (int)i;
    }
    return -1;
}

json record_payload(const StructuredRecord& rec) {
    json rows = json::array();
    for (const auto& row : rec.rows) {
        json r = json::array();
        for (const auto& cell : row) {
            if (cell.type == TypedValue::Type::Null) r.push_back(nullptr);
            else r.push_back(cell.text);
        }
        rows.push_back(std::move(r));
    }
    return json{{"columns", rec.columns}, {"rows", rows}};
}

FactStore::FactStore(const std::string& db_path) {
    db_ = sqlite_open(db_path);
    init();
}

FactStore::~FactStore() {
    if (db_) sqlite3_close(db_);
}

void FactStore::init() {
    sqlite_exec(db_, "PRAGMA journal_mode=WAL;");
    sqlite_exec(db_, "PRAGMA foreign_keys=ON;");
    sqlite_exec(db_,
        "CREATE TABLE IF NOT EXISTS documents (\n"
        "  doc_id TEXT PRIMARY KEY,\n"
        "  entity TEXT NOT NULL,\n"
        "  doc_type TEXT NOT NULL,\n"
        "  fiscal_period TEXT NOT NULL,\n"
        "  source_url TEXT,\n"
        "  content_sha256 TEXT,\n"
        "  retrieved_at INTEGER,\n"
        "  status TEXT NOT NULL DEFAULT 'pending'\n"
        ");\n"
        "CREATE TABLE IF NOT EXISTS chunks (\n"
        "  doc_id TEXT NOT NULL REFERENCES documents(doc_id) ON DELETE CASCADE,\n"
        "  ordinal INTEGER NOT NULL,\n"
        "  section TEXT,\n"
        "  text TEXT NOT NULL,\n"
        "  char_begin INTEGER,\n"
        "  char_end INTEGER,\n"
        "  page INTEGER,\n"
        "  PRIMARY KEY (doc_id, ordinal)\n"
        ");\n"
        "CREATE TABLE IF NOT EXISTS structured_records (\n"
        "  doc_id TEXT NOT NULL REFERENCES documents(doc_id) ON DELETE CASCADE,\n"
        "  record_index INTEGER NOT NULL,\n"
        "  page INTEGER,\n"
        "  caption TEXT,\n"
        "  payload TEXT NOT NULL,\n"
        "  confidence REAL,\n"
        "  PRIMARY KEY (doc_id, record_index)\n"
        ");\n"
        "CREATE TABLE IF NOT EXISTS financial_facts (\n"
        "  doc_id TEXT NOT NULL REFERENCES documents(doc_id) ON DELETE CASCADE,\n"
        "  record_index INTEGER NOT NULL,\n"
        "  row_index INTEGER NOT NULL,\n"
        "  page INTEGER,\n"
        "  caption TEXT,\n"
        "  row_label TEXT,\n"
        "  column_label TEXT,\n"
        "  value_num REAL,\n"
        "  value_text TEXT,\n"
        "  confidence REAL\n"
        ");\n"
        "CREATE INDEX IF NOT EXISTS idx_facts_doc ON financial_facts(doc_id);\n"
        "CREATE INDEX IF NOT EXISTS idx_facts_label ON financial_facts(row_label);\n"
        "CREATE VIEW IF NOT EXISTS filings AS\n"
        "  SELECT doc_id, entity, doc_type, fiscal_period, source_url, retrieved_at\n"
        "  FROM documents WHERE status = 'ready';\n"
        "CREATE VIEW IF NOT EXISTS facts AS\n"
        "  SELECT f.doc_id, f.record_index AS record_id, f.row_index, f.page, f.caption,\n"
        "         f.row_label, f.column_label, f.value_num, f.value_text, f.confidence,\n"
        "         d.entity, d.doc_type, d.fiscal_period\n"
        "  FROM financial_facts f JOIN documents d ON d.doc_id = f.doc_id\n"
        "  WHERE d.status = 'ready';\n"
        "CREATE TABLE IF NOT EXISTS pipeline_executions (\n"
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
        "  pipeline TEXT NOT NULL,\n"
        "  status TEXT NOT NULL,\n"
        "  recorded_at INTEGER NOT NULL,\n"
        "  duration_ms REAL NOT NULL,\n"
        "  metadata TEXT\n"
        ");\n"
        "CREATE TABLE IF NOT EXISTS api_costs (\n"
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
        "  service TEXT NOT NULL,\n"
        "  units INTEGER NOT NULL,\n"
        "  cost_usd REAL NOT NULL,\n"
        "  recorded_at INTEGER NOT NULL\n"
        ");\n"
        "CREATE TABLE IF NOT EXISTS error_log (\n"
        "  id INTEGER PRIMARY KEY AUTOINCREMENT,\n"
        "  pipeline TEXT NOT NULL,\n"
        "  stage TEXT,\n"
        "  kind TEXT,\n"
        "  message TEXT,\n"
        "  recorded_at INTEGER NOT NULL\n"
        ");");
}

namespace {
Document read_document(Stmt& st) {
    Document d;
    d.id.entity = st.text(1);
    d.id.doc_type = st.text(2);
    d.id.fiscal_period = st.text(3);
    d.source_url = st.text(4);
    d.content_sha256 = st.text(5);
    d.retrieved_at = st.integer(6);
    d.status = st.text(7);
    return d;
}

const char* kDocumentColumns =
    "SELECT doc_id, entity, doc_type, fiscal_period, source_url, content_sha256, retrieved_at, status FROM documents";
}

std::optional<Document> FactStore::find_document(const std::string& doc_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, (std::string(kDocumentColumns) + " WHERE doc_id = ?;").c_str());
    st.bind(1, doc_id);
    if (!st.step()) return std::nullopt;
    return read_document(st);
}

std::vector<Document> FactStore::documents() {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, (std::string(kDocumentColumns) + " ORDER BY doc_id;").c_str());
    std::vector<Document> out;
    while (st.step()) out.push_back(read_document(st));
    return out;
}

void FactStore::write_document(const Document& doc, const std::vector<Chunk>& chunks,
                               const std::vector<StructuredRecord>& records) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    const std::string doc_id = doc.id.key();

    Stmt exists(db_, "SELECT 1 FROM documents WHERE doc_id = ?;");
    exists.bind(1, doc_id);
    if (exists.step()) {
        throw PipelineError(ErrorKind::DuplicateDocument, Stage::Write, doc_id + " is already stored");
    }
    insert_rows(doc, chunks, records);
    tx.commit();
}

std::size_t FactStore::replace_document(const Document& doc, const std::vector<Chunk>& chunks,
                                        const std::vector<StructuredRecord>& records) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    std::size_t removed = delete_rows(doc.id.key());
    insert_rows(doc, chunks, records);
    tx.commit();
    return removed;
}

void FactStore::insert_rows(const Document& doc, const std::vector<Chunk>& chunks,
                            const std::vector<StructuredRecord>& records) {
    const std::string doc_id = doc.id.key();
    Stmt ins_doc(db_,
        "INSERT INTO documents (doc_id, entity, doc_type, fiscal_period, source_url, content_sha256, retrieved_at, status)\n"
        "VALUES (?, ?, ?, ?, ?, ?, ?, 'pending');");
    ins_doc.bind(1, doc_id).bind(2, doc.id.entity).bind(3, doc.id.doc_type).bind(4, doc.id.fiscal_period)
           .bind(5, doc.source_url).bind(6, doc.content_sha256).bind(7, doc.retrieved_at);
    ins_doc.run();

    Stmt ins_chunk(db_,
        "INSERT INTO chunks (doc_id, ordinal, section, text, char_begin, char_end, page)\n"
        "VALUES (?, ?, ?, ?, ?, ?, ?);");
    for (const auto& c : chunks) {
        ins_chunk.reset();
        ins_chunk.bind(1, doc_id).bind(2, c.ordinal).bind(3, c.section).bind(4, c.text)
                 .bind(5, (std::int64_t)c.char_begin).bind(6, (std::int64_t)c.char_end).bind(7, c.page);
        ins_chunk.run();
    }

    Stmt ins_rec(db_,
        "INSERT INTO structured_records (doc_id, record_index, page, caption, payload, confidence)\n"
        "VALUES (?, ?, ?, ?, ?, ?);");
    Stmt ins_fact(db_,
        "INSERT INTO financial_facts (doc_id, record_index, row_index, page, caption, row_label, column_label,\n"
        "                             value_num, value_text, confidence)\n"
        "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?);");
    for (const auto& r : records) {
        ins_rec.reset();
        ins_rec.bind(1, doc_id).bind(2, r.record_index).bind(3, r.page).bind(4, r.caption)
               .bind(5, record_payload(r).dump()).bind(6, r.confidence);
        ins_rec.run();

        for (size_t ri = 0; ri < r.rows.size(); ++ri) {
            const auto& row = r.rows[ri];
            if (row.empty()) continue;
            std::string label = row[0].type == TypedValue::Type::Text ? trim(row[0].text) : std::string();
            for (size_t ci = label.empty() ? 0 : 1; ci < row.size(); ++ci) {
                if (row[ci].type != TypedValue::Type::Number) continue;
                std::string col = ci < r.columns.size() ? r.columns[ci] : "column " + std::to_string(ci);
                ins_fact.reset();
                ins_fact.bind(1, doc_id).bind(2, r.record_index).bind(3, (int)ri).bind(4, r.page)
                        .bind(5, r.caption).bind(6, label).bind(7, trim(col)).bind(8, row[ci].number)
                        .bind(9, row[ci].text).bind(10, r.confidence);
                ins_fact.run();
            }
        }
    }
}

void FactStore::mark_ready(const std::string& doc_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, "UPDATE documents SET status = 'ready' WHERE doc_id = ?;");
    st.bind(1, doc_id);
    st.run();
    if (sqlite3_changes(db_) != 1) throw std::runtime_error("mark_ready: no document " + doc_id);
}

std::size_t FactStore::delete_document(const std::string& doc_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    std::size_t removed = delete_rows(doc_id);
    tx.commit();
    return removed;
}

std::size_t FactStore::delete_rows(const std::string& doc_id) {
    std::size_t removed = 0;
    {
        Stmt st(db_, "DELETE FROM chunks WHERE doc_id = ?;");
        st.bind(1, doc_id);
        st.run();
        removed = (std::size_t)sqlite3_changes(db_);
    }
    for (const char* sql : {"DELETE FROM financial_facts WHERE doc_id = ?;",
                            "DELETE FROM structured_records WHERE doc_id = ?;",
                            "DELETE FROM documents WHERE doc_id = ?;"}) {
        Stmt st(db_, sql);
        st.bind(1, doc_id);
        st.run();
    }
    return removed;
}

std::size_t FactStore::chunk_count(const std::string& doc_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, "SELECT COUNT(*) FROM chunks WHERE doc_id = ?;");
    st.bind(1, doc_id);
    st.step();
    return (std::size_t)st.integer(0);
}

std::vector<int> FactStore::chunk_ordinals(const std::string& doc_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, "SELECT ordinal FROM chunks WHERE doc_id = ? ORDER BY ordinal;");
    st.bind(1, doc_id);
    std::vector<int> out;
    while (st.step()) out.push_back((int)st.integer(0));
    return out;
}

std::vector<Chunk> FactStore::load_chunks(const ChunkFilter& filter) {
    std::lock_guard<std::mutex> lock(mtx_);
    std::string sql =
        "SELECT c.doc_id, c.ordinal, c.section, c.text, c.char_begin, c.char_end, c.page\n"
        "FROM chunks c JOIN documents d ON d.doc_id = c.doc_id\n"
        "WHERE d.status = 'ready'\n"
        "  AND (?1 = '' OR c.doc_id = ?1)\n"
        "  AND (?2 = '' OR lower(d.entity) = lower(?2))\n"
        "  AND (?3 = '' OR d.fiscal_period = ?3)\n"
        "  AND (?4 = '' OR upper(d.doc_type) = upper(?4))\n"
        "ORDER BY c.doc_id, c.ordinal;";
    Stmt st(db_, sql.c_str());
    st.bind(1, filter.doc_id).bind(2, filter.entity).bind(3, filter.fiscal_period).bind(4, filter.doc_type);
    std::vector<Chunk> out;
    while (st.step()) {
        Chunk c;
        c.doc_id = st.text(0);
        c.ordinal = (int)st.integer(1);
        // A damaged row is left out of retrieval instead of failing the query.
        bool corrupt = sqlite3_column_type(st.get(), 3) != SQLITE_TEXT || trim(st.text(3)).empty() ||
                       st.is_null(4) || st.is_null(5) || st.integer(5) < st.integer(4);
        if (corrupt) {
            std::cerr << "[store] skipping corrupt chunk " << c.key() << "\n";
            continue;
        }
        c.section = st.text(2);
        c.text = st.text(3);
        c.char_begin = (std::size_t)st.integer(4);
        c.char_end = (std::size_t)st.integer(5);
        c.page = (int)st.integer(6);
        out.push_back(std::move(c));
    }
    return out;
}

std::vector<StructuredRecord> FactStore::records(const std::string& doc_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_,
        "SELECT record_index, page, caption, payload, confidence FROM structured_records\n"
        "WHERE doc_id = ? ORDER BY record_index;");
    st.bind(1, doc_id);
    std::vector<StructuredRecord> out;
    while (st.step()) {
        StructuredRecord r;
        r.doc_id = doc_id;
        r.record_index = (int)st.integer(0);
        r.page = (int)st.integer(1);
        r.caption = st.text(2);
        auto payload = json::parse(st.text(3));
        r.columns = payload.value("columns", std::vector<std::string>{});
        for (const auto& row : payload.value("rows", json::array())) {
            std::vector<TypedValue> cells;
            for (const auto& cell : row) {
                cells.push_back(cell.is_null() ? TypedValue{} : TypedValue::parse(cell.get<std::string>()));
            }
            r.rows.push_back(std::move(cells));
        }
        r.confidence = st.real(4);
        out.push_back(std::move(r));
    }
    return out;
}

std::size_t FactStore::fact_count(const std::string& doc_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, "SELECT COUNT(*) FROM financial_facts WHERE doc_id = ?;");
    st.bind(1, doc_id);
    st.step();
    return (std::size_t)st.integer(0);
}

namespace {
struct Deadline {
    std::chrono::steady_clock::time_point at;
};

int progress_cb(void* p) {
    auto* d = static_cast<Deadline*>(p);
    return std::chrono::steady_clock::now() > d->at ? 1 : 0;
}

// Clears the progress handler however run_select exits.
struct ProgressGuard {
    sqlite3* db;
    ~ProgressGuard() { sqlite3_progress_handler(db, 0, nullptr, nullptr); }
};
}

QueryRows FactStore::run_select(const std::string& sql, const json& params, int row_limit, int timeout_ms) {
    std::lock_guard<std::mutex> lock(mtx_);
    sqlite3_stmt* raw = nullptr;
    const char* tail = nullptr;
    if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &raw, &tail) != SQLITE_OK) {
        throw PipelineError(ErrorKind::GenerationInvalid, Stage::ExecuteQuery,
                            std::string("query does not compile: ") + sqlite3_errmsg(db_));
    }
    std::unique_ptr<sqlite3_stmt, int (*)(sqlite3_stmt*)> st(raw, &sqlite3_finalize);
    if (!st) {
        throw PipelineError(ErrorKind::GenerationInvalid, Stage::ExecuteQuery, "query is empty");
    }
    if (tail && !trim(std::string(tail)).empty() && trim(std::string(tail)) != ";") {
        throw PipelineError(ErrorKind::GenerationInvalid, Stage::ExecuteQuery, "only one statement may be executed");
    }
    if (!sqlite3_stmt_readonly(st.get())) {
        throw PipelineError(ErrorKind::GenerationInvalid, Stage::ExecuteQuery, "query is not read-only");
    }
    int expected = sqlite3_bind_parameter_count(st.get());
    if (!params.is_array() || (int)params.size() != expected) {
        throw PipelineError(ErrorKind::GenerationInvalid, Stage::ExecuteQuery,
                            "query expects " + std::to_string(expected) + " parameters");
    }
    for (int i = 0; i < expected; ++i) {
        const auto& p = params[(size_t)i];
        if (p.is_number_integer()) sqlite3_bind_int64(st.get(), i + 1, p.get<std::int64_t>());
        else if (p.is_number()) sqlite3_bind_double(st.get(), i + 1, p.get<double>());
        else if (p.is_null()) sqlite3_bind_null(st.get(), i + 1);
        else {
            std::string s = p.is_string() ? p.get<std::string>() : p.dump();
            sqlite3_bind_text(st.get(), i + 1, s.c_str(), (int)s.size(), SQLITE_TRANSIENT);
        }
    }

    Deadline deadline{std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms)};
    sqlite3_progress_handler(db_, 1000, &progress_cb, &deadline);
    ProgressGuard guard{db_};

    QueryRows out;
    int ncol = sqlite3_column_count(st.get());
    for (int c = 0; c < ncol; ++c) out.columns.push_back(sqlite3_column_name(st.get(), c));
    for (;;) {
        int rc = sqlite3_step(st.get());
        if (rc == SQLITE_DONE) break;
        if (rc == SQLITE_INTERRUPT) {
            throw PipelineError(ErrorKind::Timeout, Stage::ExecuteQuery,
                                "query exceeded " + std::to_string(timeout_ms) + "ms");
        }
        if (rc != SQLITE_ROW) {
            throw PipelineError(ErrorKind::GenerationInvalid, Stage::ExecuteQuery,
                                std::string("query failed: ") + sqlite3_errmsg(db_));
        }
        if ((int)out.rows.size() >= row_limit) {
            out.truncated = true;
            break;
        }
        std::vector<std::string> row;
        for (int c = 0; c < ncol; ++c) {
            auto p = sqlite3_column_text(st.get(), c);
            row.emplace_back(p ? reinterpret_cast<const char*>(p) : "");
        }
        out.rows.push_back(std::move(row));
    }
    return out;
}

SchemaDescription FactStore::query_schema() {
    SchemaDescription s;
    s.tables.push_back({"filings", "one row per ingested filing", {
        {"doc_id", "TEXT", "ENTITY_DOCTYPE_PERIOD, e.g. TSLA_10-K_2020"},
        {"entity", "TEXT", "ticker symbol"},
        {"doc_type", "TEXT", "10-K, 10-Q, 8-K"},
        {"fiscal_period", "TEXT", "fiscal year or quarter, e.g. 2020"},
        {"source_url", "TEXT", ""},
        {"retrieved_at", "INTEGER", "unix seconds"},
    }});
    s.tables.push_back({"facts", "one numeric table cell extracted from a filing", {
        {"doc_id", "TEXT", ""},
        {"record_id", "INTEGER", "table index within the filing"},
        {"row_index", "INTEGER", ""},
        {"page", "INTEGER", ""},
        {"caption", "TEXT", "table caption"},
        {"row_label", "TEXT", "line item, e.g. Total revenues"},
        {"column_label", "TEXT", "column header, usually a period, e.g. 2020"},
        {"value_num", "REAL", "numeric value as printed (units per caption)"},
        {"value_text", "TEXT", "value as printed"},
        {"confidence", "REAL", "extraction confidence 0..1"},
        {"entity", "TEXT", ""},
        {"doc_type", "TEXT", ""},
        {"fiscal_period", "TEXT", ""},
    }});
    return s;
}
