#pragma once
#include <sqlite3.h>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

void sqlite_exec(sqlite3* db, const std::string& sql);

// Prepared statement owned for the duration of one operation.
class Stmt {
public:
    Stmt(sqlite3* db, const char* sql);
    ~Stmt();
    Stmt(const Stmt&) = delete;
    Stmt& operator=(const Stmt&) = delete;

    Stmt& bind(int idx, const std::string& v);
    Stmt& bind(int idx, std::int64_t v);
    Stmt& bind(int idx, int v) { return bind(idx, (std::int64_t)v); }
    Stmt& bind(int idx, double v);
    Stmt& bind_blob(int idx, const std::vector<float>& v);
    Stmt& bind_null(int idx);

    // true while rows are available; throws on error.
    bool step();
    // For INSERT/UPDATE/DELETE: runs to completion.
    void run();
    void reset();

    std::string text(int col) const;
    std::int64_t integer(int col) const;
    double real(int col) const;
    std::vector<float> blob_floats(int col) const;
    bool is_null(int col) const;

    sqlite3_stmt* get() { return st_; }

private:
    sqlite3* db_;
    sqlite3_stmt* st_{nullptr};
};

// BEGIN IMMEDIATE on construction, ROLLBACK unless commit() was called.
class Transaction {
public:
    explicit Transaction(sqlite3* db);
    ~Transaction();
    void commit();

private:
    sqlite3* db_;
    bool done_{false};
};

sqlite3* sqlite_open(const std::string& path);
