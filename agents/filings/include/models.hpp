#pragma once
#include <string>
#include <vector>
#include <cstdint>

// Identity of one filing: entity + document type + fiscal period.
struct DocumentId {
    std::string entity;        // e.g. "TSLA"
    std::string doc_type;      // e.g. "10-K"
    std::string fiscal_period; // e.g. "2020"

    // Stable key used in both stores, e.g. "TSLA_10-K_2020".
    std::string key() const;
    bool valid() const { return !entity.empty() && !doc_type.empty() && !fiscal_period.empty(); }
};

struct Document {
    DocumentId id;
    std::string source_url;
    std::string content_sha256;
    std::int64_t retrieved_at{0}; // unix seconds
    std::string status;           // "pending" | "ready"
};

struct RawDocument {
    std::string locator;
    std::string content_type;
    std::string bytes;
};

struct PageSpan {
    int number{1};          // 1-based
    std::size_t begin{0};   // offset into ExtractedText::text
    std::size_t end{0};
    std::string raw;        // page markup as fetched, used for region detection
};

struct ExtractedText {
    std::string text;
    std::vector<PageSpan> pages;

    int page_at(std::size_t offset) const;
};

struct Chunk {
    std::string doc_id;
    int ordinal{0};
    std::string section;
    std::string text;
    std::size_t char_begin{0};
    std::size_t char_end{0};
    int page{1};

    // "<doc_id>#<ordinal>", the key shared with the vector store.
    std::string key() const { return doc_id + "#" + std::to_string(ordinal); }
};

struct TypedValue {
    enum class Type { Null, Number, Text };
    Type type{Type::Null};
    double number{0.0};
    std::string text;

    static TypedValue parse(const std::string& cell);
};

struct StructuredRecord {
    std::string doc_id;
    int record_index{0};
    int page{1};
    std::string caption;
    std::vector<std::string> columns;
    std::vector<std::vector<TypedValue>> rows;
    double confidence{0.0};
};

struct EmbeddingKey {
    std::string doc_id;
    int ordinal{0};

    bool operator==(const EmbeddingKey& o) const { return doc_id == o.doc_id && ordinal == o.ordinal; }
    bool operator<(const EmbeddingKey& o) const {
        return doc_id < o.doc_id || (doc_id == o.doc_id && ordinal < o.ordinal);
    }
};

struct RankedResult {
    Chunk chunk;
    double score{0.0};
    int lexical_rank{-1}; // 0-based, -1 when absent
    int vector_rank{-1};
};
