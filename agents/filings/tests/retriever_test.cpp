#include "../include/dual_store_writer.hpp"
#include "../include/lexical.hpp"
#include "../include/retriever.hpp"
#include "fakes.hpp"
#include <gtest/gtest.h>

namespace {

std::vector<std::string> ids(const std::vector<FusedEntry>& fused) {
    std::vector<std::string> out;
    for (const auto& f : fused) out.push_back(f.id);
    return out;
}

TEST(ReciprocalRankFusion, CombinesRanksByPosition) {
    auto fused = reciprocal_rank_fusion({"A", "B", "C"}, {"C", "A", "D"}, 60.0);
    ASSERT_EQ(ids(fused), (std::vector<std::string>{"A", "C", "B", "D"}));
    EXPECT_DOUBLE_EQ(fused[0].score, 1.0 / 61 + 1.0 / 62);
    EXPECT_DOUBLE_EQ(fused[1].score, 1.0 / 63 + 1.0 / 61);
    EXPECT_DOUBLE_EQ(fused[2].score, 1.0 / 62);
    EXPECT_DOUBLE_EQ(fused[3].score, 1.0 / 63);
    EXPECT_EQ(fused[3].lexical_rank, -1);
    EXPECT_EQ(fused[3].vector_rank, 2);
}

TEST(ReciprocalRankFusion, TiesGoToTheBetterLexicalRank) {
    // X and Y both score 1/61 + 1/62.
    auto fused = reciprocal_rank_fusion({"Y", "X"}, {"X", "Y"}, 60.0);
    EXPECT_EQ(ids(fused), (std::vector<std::string>{"Y", "X"}));

    // P appears only lexically at rank 1, Q only in vectors at rank 1.
    fused = reciprocal_rank_fusion({"A", "P"}, {"B", "Q"}, 60.0);
    EXPECT_EQ(ids(fused), (std::vector<std::string>{"A", "B", "P", "Q"}));
}

TEST(ReciprocalRankFusion, IsDeterministic) {
    std::vector<std::string> lexical, vector;
    for (int i = 0; i < 50; ++i) lexical.push_back("c" + std::to_string(i));
    for (int i = 49; i >= 0; i -= 2) vector.push_back("c" + std::to_string(i));
    for (int i = 0; i < 20; ++i) vector.push_back("v" + std::to_string(i));

    auto first = ids(reciprocal_rank_fusion(lexical, vector, 60.0));
    for (int run = 0; run < 20; ++run) {
        EXPECT_EQ(ids(reciprocal_rank_fusion(lexical, vector, 60.0)), first);
    }
}

TEST(ReciprocalRankFusion, EmptyRankingContributesNothing) {
    auto fused = reciprocal_rank_fusion({}, {"B", "A"}, 60.0);
    EXPECT_EQ(ids(fused), (std::vector<std::string>{"B", "A"}));
    EXPECT_TRUE(reciprocal_rank_fusion({}, {}, 60.0).empty());
}

Chunk chunk(const std::string& doc, int ordinal, const std::string& text) {
    Chunk c;
    c.doc_id = doc;
    c.ordinal = ordinal;
    c.text = text;
    c.section = "Item 1.";
    return c;
}

TEST(LexicalRanking, PrefersRareMatchingTerms) {
    std::vector<Chunk> pool = {
        chunk("D", 0, "The company sells vehicles."),
        chunk("D", 1, "Lithium supply constraints may delay vehicle production."),
        chunk("D", 2, "The board approved a dividend."),
    };
    auto far = std::chrono::steady_clock::now() + std::chrono::seconds(5);
    auto ranked = rank_lexical("lithium supply risk", pool, far);
    ASSERT_EQ(ranked.size(), 1u);
    EXPECT_EQ(ranked[0], 1u);

    EXPECT_TRUE(rank_lexical("the of and", pool, far).empty());
}

TEST(LexicalRanking, PassedDeadlineTimesOut) {
    std::vector<Chunk> pool = {chunk("D", 0, "text")};
    auto past = std::chrono::steady_clock::now() - std::chrono::milliseconds(1);
    try {
        rank_lexical("text", pool, past);
        FAIL() << "expected a timeout";
    } catch (const PipelineError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Timeout);
        EXPECT_EQ(e.stage(), Stage::Retrieve);
    }
}

class HybridRetrieverTest : public ::testing::Test {
protected:
    HybridRetrieverTest() : facts(":memory:"), vectors(embedder.dimensions()) {
        pool = {
            chunk("ACME_10-K_2020", 0, "Acme builds electric vehicles and battery storage."),
            chunk("ACME_10-K_2020", 1, "Supply chain disruptions for lithium cells could delay production."),
            chunk("ACME_10-K_2020", 2, "Total revenues increased to 31,536 million in 2020."),
            chunk("ACME_10-K_2020", 3, "The board declared no dividend for the year."),
        };
        for (const auto& c : pool) vectors.put({c.doc_id, c.ordinal}, embedder.embed_one(c.text));
    }

    HashingEmbeddingClient embedder;
    FactStore facts;
    FaultyVectorStore vectors;
    std::vector<Chunk> pool;
};

TEST_F(HybridRetrieverTest, FusesBothRankings) {
    HybridRetriever retriever(facts, vectors, embedder, RetrievalOptions{});
    auto res = retriever.retrieve("lithium supply chain disruptions", pool, 3);

    ASSERT_EQ(res.results.size(), 3u);
    EXPECT_TRUE(res.lexical_ok);
    EXPECT_TRUE(res.vector_ok);
    EXPECT_EQ(res.results[0].chunk.ordinal, 1);
    EXPECT_EQ(res.results[0].lexical_rank, 0);
    EXPECT_EQ(res.results[0].vector_rank, 0);
    for (std::size_t i = 1; i < res.results.size(); ++i) {
        EXPECT_GE(res.results[i - 1].score, res.results[i].score);
    }
}

TEST_F(HybridRetrieverTest, VectorFailureFallsBackToLexical) {
    vectors.fail_nearest = true;
    HybridRetriever retriever(facts, vectors, embedder, RetrievalOptions{});
    auto res = retriever.retrieve("lithium supply", pool, 3);

    EXPECT_FALSE(res.vector_ok);
    EXPECT_TRUE(res.lexical_ok);
    ASSERT_EQ(res.results.size(), 1u);
    EXPECT_EQ(res.results[0].chunk.ordinal, 1);
    EXPECT_EQ(res.results[0].vector_rank, -1);
    EXPECT_FALSE(res.warnings.empty());
}

TEST_F(HybridRetrieverTest, BothRankingsFailingThrows) {
    vectors.fail_nearest = true;
    RetrievalOptions opts;
    opts.lexical_timeout_ms = -1; // deadline already passed
    HybridRetriever retriever(facts, vectors, embedder, opts);
    EXPECT_THROW(retriever.retrieve("lithium supply", pool, 3), PipelineError);
}

TEST_F(HybridRetrieverTest, VectorHitsOutsideThePoolAreIgnored) {
    vectors.put({"OTHER_10-K_2019", 0}, embedder.embed_one("lithium supply chain disruptions"));
    HybridRetriever retriever(facts, vectors, embedder, RetrievalOptions{});
    auto res = retriever.retrieve("lithium supply chain disruptions", pool, 10);
    for (const auto& r : res.results) EXPECT_EQ(r.chunk.doc_id, "ACME_10-K_2020");
    EXPECT_EQ(res.results.size(), pool.size());
}

TEST_F(HybridRetrieverTest, ScopedSearchReachesBeyondTheCandidatePool) {
    DualStoreWriter writer(facts, vectors, RetryPolicy{1, 1, 1});
    auto store = [&](const std::string& entity, const std::vector<std::string>& texts) {
        Document doc;
        doc.id = {entity, "10-K", "2020"};
        std::vector<Chunk> chunks;
        std::vector<std::vector<float>> embeddings;
        for (const auto& t : texts) {
            Chunk c = chunk(doc.id.key(), (int)chunks.size(), t);
            c.char_end = t.size();
            embeddings.push_back(embedder.embed_one(t));
            chunks.push_back(std::move(c));
        }
        writer.write(doc, chunks, {}, embeddings);
    };
    for (int n = 100; n <= 140; ++n) {
        std::string entity = "A" + std::to_string(n);
        std::vector<std::string> texts;
        for (int i = 0; i < 5; ++i) {
            texts.push_back(entity + " reported steady revenue from retail banking, paragraph " + std::to_string(i) + ".");
        }
        store(entity, texts);
    }
    store("ZETA", {"Zeta operates freight terminals.", "Zeta holds helium mining concessions on the lunar surface.",
                   "Zeta pays a quarterly dividend.", "Zeta employs 4,000 people.", "Zeta leases its headquarters."});

    RetrievalOptions opts;
    opts.candidate_pool = 20;
    HybridRetriever retriever(facts, vectors, embedder, opts);
    auto res = retriever.retrieve("helium mining concessions lunar", ChunkFilter{}, 6);

    ASSERT_FALSE(res.results.empty());
    EXPECT_EQ(res.results[0].chunk.doc_id, "ZETA_10-K_2020");
    EXPECT_EQ(res.results[0].chunk.ordinal, 1);
    EXPECT_LE(res.results.size(), 6u);
}

TEST_F(HybridRetrieverTest, EmptyPoolReturnsNothing) {
    HybridRetriever retriever(facts, vectors, embedder, RetrievalOptions{});
    auto res = retriever.retrieve("anything", std::vector<Chunk>{}, 3);
    EXPECT_TRUE(res.results.empty());
}

}  // namespace
