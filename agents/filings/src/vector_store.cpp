#include "../include/vector_store.hpp"
#include "../include/errors.hpp"
#include "../include/sqlite_util.hpp"
#include "../include/util.hpp"
#include <algorithm>
#include <unordered_set>

SqliteVectorStore::SqliteVectorStore(const std::string& db_path, int dimensions) : dims_(dimensions) {
    if (dimensions <= 0) throw std::invalid_argument("vector dimensions must be positive");
    db_ = sqlite_open(db_path);
    sqlite_exec(db_, "PRAGMA journal_mode=WAL;");
    sqlite_exec(db_,
        "CREATE TABLE IF NOT EXISTS embeddings (\n"
        "  doc_id TEXT NOT NULL,\n"
        "  ordinal INTEGER NOT NULL,\n"
        "  dim INTEGER NOT NULL,\n"
        "  vector BLOB NOT NULL,\n"
        "  PRIMARY KEY (doc_id, ordinal)\n"
        ");");
}

SqliteVectorStore::~SqliteVectorStore() {
    if (db_) sqlite3_close(db_);
}

void SqliteVectorStore::put(const EmbeddingKey& key, const std::vector<float>& vec) {
    if ((int)vec.size() != dims_) {
        throw std::runtime_error("embedding for " + key.doc_id + "#" + std::to_string(key.ordinal) +
                                 " has dimension " + std::to_string(vec.size()));
    }
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, "INSERT OR REPLACE INTO embeddings (doc_id, ordinal, dim, vector) VALUES (?, ?, ?, ?);");
    st.bind(1, key.doc_id).bind(2, key.ordinal).bind(3, dims_).bind_blob(4, vec);
    st.run();
}

void SqliteVectorStore::remove(const EmbeddingKey& key) {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, "DELETE FROM embeddings WHERE doc_id = ? AND ordinal = ?;");
    st.bind(1, key.doc_id).bind(2, key.ordinal);
    st.run();
}

std::size_t SqliteVectorStore::remove_document(const std::string& doc_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, "DELETE FROM embeddings WHERE doc_id = ?;");
    st.bind(1, doc_id);
    st.run();
    return (std::size_t)sqlite3_changes(db_);
}

std::size_t SqliteVectorStore::rename_document(const std::string& from, const std::string& to) {
    std::lock_guard<std::mutex> lock(mtx_);
    Transaction tx(db_);
    {
        Stmt del(db_, "DELETE FROM embeddings WHERE doc_id = ?;");
        del.bind(1, to);
        del.run();
    }
    Stmt mv(db_, "UPDATE embeddings SET doc_id = ? WHERE doc_id = ?;");
    mv.bind(1, to).bind(2, from);
    mv.run();
    std::size_t moved = (std::size_t)sqlite3_changes(db_);
    tx.commit();
    return moved;
}

std::size_t SqliteVectorStore::count(const std::string& doc_id) {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, "SELECT COUNT(*) FROM embeddings WHERE doc_id = ?;");
    st.bind(1, doc_id);
    st.step();
    return (std::size_t)st.integer(0);
}

std::vector<EmbeddingKey> SqliteVectorStore::keys() {
    std::lock_guard<std::mutex> lock(mtx_);
    Stmt st(db_, "SELECT doc_id, ordinal FROM embeddings ORDER BY doc_id, ordinal;");
    std::vector<EmbeddingKey> out;
    while (st.step()) out.push_back({st.text(0), (int)st.integer(1)});
    return out;
}

std::vector<VectorHit> SqliteVectorStore::nearest(const std::vector<float>& query, int k,
                                                  const std::vector<std::string>& doc_ids,
                                                  std::chrono::steady_clock::time_point deadline) {
    std::unordered_set<std::string> wanted(doc_ids.begin(), doc_ids.end());
    std::vector<VectorHit> out;
    {
        std::lock_guard<std::mutex> lock(mtx_);
        Stmt st(db_, "SELECT doc_id, ordinal, vector FROM embeddings;");
        size_t scanned = 0;
        while (st.step()) {
            if ((++scanned & 0xFF) == 0 && std::chrono::steady_clock::now() > deadline) {
                throw PipelineError(ErrorKind::Timeout, Stage::Retrieve, "vector search exceeded its deadline", true);
            }
            std::string doc = st.text(0);
            if (!wanted.empty() && !wanted.count(doc)) continue;
            float score = cosine_similarity(st.blob_floats(2), query);
            out.push_back({{doc, (int)st.integer(1)}, score});
        }
    }
    // Ties are ordered by key so repeated searches return identical lists.
    auto better = [](const VectorHit& a, const VectorHit& b) {
        if (a.score != b.score) return a.score > b.score;
        return a.key < b.key;
    };
    size_t keep = std::min<size_t>((size_t)std::max(k, 0), out.size());
    std::partial_sort(out.begin(), out.begin() + keep, out.end(), better);
    out.resize(keep);
    return out;
}
