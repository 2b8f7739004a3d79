#include "../include/sqlite_util.hpp"
#include <cstring>
#include <iostream>

void sqlite_exec(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown";
        sqlite3_free(err);
        throw std::runtime_error("SQLite error: " + msg);
    }
}

sqlite3* sqlite_open(const std::string& path) {
    sqlite3* db = nullptr;
    if (sqlite3_open(path.c_str(), &db) != SQLITE_OK) {
        std::string msg = db ? sqlite3_errmsg(db) : "out of memory";
        if (db) sqlite3_close(db);
        throw std::runtime_error("Failed to open SQLite DB " + path + ": " + msg);
    }
    sqlite3_busy_timeout(db, 5000);
    return db;
}

Stmt::Stmt(sqlite3* db, const char* sql) : db_(db) {
    if (sqlite3_prepare_v2(db_, sql, -1, &st_, nullptr) != SQLITE_OK) {
        throw std::runtime_error(std::string("prepare failed: ") + sqlite3_errmsg(db_));
    }
}

Stmt::~Stmt() {
    if (st_) sqlite3_finalize(st_);
}

Stmt& Stmt::bind(int idx, const std::string& v) {
    sqlite3_bind_text(st_, idx, v.c_str(), (int)v.size(), SQLITE_TRANSIENT);
    return *this;
}

Stmt& Stmt::bind(int idx, std::int64_t v) {
    sqlite3_bind_int64(st_, idx, v);
    return *this;
}

Stmt& Stmt::bind(int idx, double v) {
    sqlite3_bind_double(st_, idx, v);
    return *this;
}

Stmt& Stmt::bind_blob(int idx, const std::vector<float>& v) {
    sqlite3_bind_blob(st_, idx, v.data(), (int)(v.size() * sizeof(float)), SQLITE_TRANSIENT);
    return *this;
}

Stmt& Stmt::bind_null(int idx) {
    sqlite3_bind_null(st_, idx);
    return *this;
}

bool Stmt::step() {
    int rc = sqlite3_step(st_);
    if (rc == SQLITE_ROW) return true;
    if (rc == SQLITE_DONE) return false;
    throw std::runtime_error(std::string("SQLite step failed: ") + sqlite3_errmsg(db_));
}

void Stmt::run() {
    while (step()) {}
}

void Stmt::reset() {
    sqlite3_reset(st_);
    sqlite3_clear_bindings(st_);
}

std::string Stmt::text(int col) const {
    auto p = sqlite3_column_text(st_, col);
    return p ? std::string(reinterpret_cast<const char*>(p), (size_t)sqlite3_column_bytes(st_, col)) : std::string();
}

std::int64_t Stmt::integer(int col) const { return sqlite3_column_int64(st_, col); }

double Stmt::real(int col) const { return sqlite3_column_double(st_, col); }

std::vector<float> Stmt::blob_floats(int col) const {
    const void* blob = sqlite3_column_blob(st_, col);
    int bytes = sqlite3_column_bytes(st_, col);
    std::vector<float> vec((size_t)bytes / sizeof(float));
    if (blob && !vec.empty()) std::memcpy(vec.data(), blob, vec.size() * sizeof(float));
    return vec;
}

bool Stmt::is_null(int col) const { return sqlite3_column_type(st_, col) == SQLITE_NULL; }

Transaction::Transaction(sqlite3* db) : db_(db) {
    sqlite_exec(db_, "BEGIN IMMEDIATE;");
}

Transaction::~Transaction() {
    if (done_) return;
    char* err = nullptr;
    if (sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, &err) != SQLITE_OK) {
        std::cerr << "[store] rollback failed: " << (err ? err : "unknown") << "\n";
        sqlite3_free(err);
    }
}

void Transaction::commit() {
    sqlite_exec(db_, "COMMIT;");
    done_ = true;
}
