#include <gtest/gtest.h>
#include <docpipe/store/analysis_store.hpp>
#include <docpipe/core/utils.hpp>

using namespace docpipe;

class AnalysisStoreTest : public ::testing::Test {
protected:
    AnalysisRecord make_record(const std::string& content, const std::string& model, int64_t max_tokens) {
        AnalysisRecord r;
        r.file_hash = sha256_hex(content);
        r.model = model;
        r.max_tokens = max_tokens;
        r.analysis.token_count = 1234;
        r.analysis.character_count = 5000;
        r.analysis.word_count = 800;
        r.analysis.model = model;
        r.analysis.provider = "openai";
        r.analysis.category = "flagship";
        r.analysis.context_window = 8192;
        r.analysis.costs.input = 0.037;
        r.analysis.accuracy = "approximation";
        r.analysis.known_model = true;
        r.chunk_count = 3;
        r.stats["totalChunks"] = 3;
        return r;
    }
};

TEST_F(AnalysisStoreTest, StoresAndReusesAnalysis) {
    AnalysisStore store;
    ASSERT_TRUE(store.open(":memory:"));
    ASSERT_TRUE(store.put(make_record("document one", "gpt-4", 6000)));
    EXPECT_EQ(store.count(), 1);

    AnalysisRecord out;
    ASSERT_TRUE(store.get(sha256_hex("document one"), "gpt-4", 6000, out));
    EXPECT_EQ(out.analysis.token_count, 1234u);
    EXPECT_EQ(out.analysis.provider, "openai");
    EXPECT_DOUBLE_EQ(out.analysis.costs.input, 0.037);
    EXPECT_EQ(out.chunk_count, 3);
    EXPECT_EQ(out.stats["totalChunks"], 3);
    EXPECT_EQ(out.access_count, 2);

    ASSERT_TRUE(store.get(sha256_hex("document one"), "gpt-4", 6000, out));
    EXPECT_EQ(out.access_count, 3);
}

TEST_F(AnalysisStoreTest, KeyIncludesModelAndBudget) {
    AnalysisStore store;
    ASSERT_TRUE(store.open(":memory:"));
    ASSERT_TRUE(store.put(make_record("doc", "gpt-4", 6000)));

    AnalysisRecord out;
    EXPECT_FALSE(store.get(sha256_hex("doc"), "gpt-4", 4000, out));
    EXPECT_FALSE(store.get(sha256_hex("doc"), "claude-3-haiku", 6000, out));
    EXPECT_FALSE(store.get(sha256_hex("other"), "gpt-4", 6000, out));
}

TEST_F(AnalysisStoreTest, UpsertKeepsOneRow) {
    AnalysisStore store;
    ASSERT_TRUE(store.open(":memory:"));
    AnalysisRecord r = make_record("doc", "gpt-4", 6000);
    ASSERT_TRUE(store.put(r));
    r.analysis.token_count = 999;
    ASSERT_TRUE(store.put(r));
    EXPECT_EQ(store.count(), 1);

    AnalysisRecord out;
    ASSERT_TRUE(store.get(r.file_hash, "gpt-4", 6000, out));
    EXPECT_EQ(out.analysis.token_count, 999u);
}

TEST_F(AnalysisStoreTest, ExpiredRowsAreInvisibleAndCleaned) {
    AnalysisStore store(0);
    ASSERT_TRUE(store.open(":memory:"));
    ASSERT_TRUE(store.put(make_record("doc", "gpt-4", 6000)));

    AnalysisRecord out;
    EXPECT_FALSE(store.get(sha256_hex("doc"), "gpt-4", 6000, out));
    EXPECT_EQ(store.cleanup_expired(), 1);
    EXPECT_EQ(store.count(), 0);
}

TEST_F(AnalysisStoreTest, ClosedStoreRefusesWork) {
    AnalysisStore store;
    EXPECT_FALSE(store.is_open());
    EXPECT_FALSE(store.put(make_record("doc", "gpt-4", 6000)));
    AnalysisRecord out;
    EXPECT_FALSE(store.get("hash", "gpt-4", 6000, out));
}
