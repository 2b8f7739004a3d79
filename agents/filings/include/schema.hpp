#pragma once
#include <string>
#include <vector>

struct ColumnSchema {
    std::string name;
    std::string type;
    std::string description;
};

struct TableSchema {
    std::string name;
    std::string description;
    std::vector<ColumnSchema> columns;

    bool has_column(const std::string& column) const;
};

// What the structured query generator may reference. Lookups are
// case-insensitive, like SQL identifiers.
struct SchemaDescription {
    std::vector<TableSchema> tables;

    const TableSchema* table(const std::string& name) const;
    // Prompt rendering: one line per table, columns with types and notes.
    std::string describe() const;
};
