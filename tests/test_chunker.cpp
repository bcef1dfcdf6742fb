#include <gtest/gtest.h>
#include <docpipe/chunk/document_chunker.hpp>
#include <docpipe/tokens/model_registry.hpp>
#include <docpipe/tokens/tokenizer.hpp>
#include <memory>

using namespace docpipe;

class ChunkerTest : public ::testing::Test {
protected:
    void SetUp() override {
        counter_.reset(new TokenCounter(std::make_shared<ModelRegistry>(),
                                        std::make_shared<HeuristicTokenizer>()));
        chunker_.reset(new DocumentChunker(*counter_));
    }

    // Single paragraph of numbered sentences with at least `tokens` tokens
    std::string long_paragraph(size_t tokens) const {
        std::string out;
        size_t n = 0;
        while (counter_->count_tokens(out, "gpt-4") < tokens) {
            for (int i = 0; i < 50; ++i, ++n) {
                out += "Sentence number " + std::to_string(n) +
                       " describes the ingestion pipeline and its token budget. ";
            }
        }
        return out;
    }

    std::string reassemble(const ChunkingResult& r) const {
        std::string out;
        for (size_t i = 0; i < r.chunks.size(); ++i) out += r.chunks[i].body();
        return out;
    }

    std::unique_ptr<TokenCounter> counter_;
    std::unique_ptr<DocumentChunker> chunker_;
};

TEST_F(ChunkerTest, ShortTextIsOneChunk) {
    const std::string text = "A short note that fits easily into one chunk.";
    Result<ChunkingResult> r = chunker_->chunk(text, ChunkerOptions());
    ASSERT_TRUE(r.success) << r.error.message;
    ASSERT_EQ(r.value.chunks.size(), 1u);

    const TextChunk& c = r.value.chunks[0];
    EXPECT_EQ(c.index, 1u);
    EXPECT_EQ(c.text, text);
    EXPECT_FALSE(c.has_overlap);
    EXPECT_EQ(c.sentence_count, 1u);
    EXPECT_EQ(r.value.stats.total_chunks, 1u);
    EXPECT_FALSE(r.value.truncated);
}

TEST_F(ChunkerTest, LongParagraphSplitsUnderBudget) {
    const std::string text = long_paragraph(20000);
    ChunkerOptions opts;
    opts.max_tokens_per_chunk = 6000;
    opts.overlap_tokens = 200;

    Result<ChunkingResult> r = chunker_->chunk(text, opts);
    ASSERT_TRUE(r.success) << r.error.message;
    const std::vector<TextChunk>& chunks = r.value.chunks;
    ASSERT_GE(chunks.size(), 4u);

    for (size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i + 1);
        EXPECT_LE(chunks[i].token_count, 6600u);
        EXPECT_GT(chunks[i].token_count, 0u);
        if (i == 0) {
            EXPECT_FALSE(chunks[i].has_overlap);
        } else {
            EXPECT_TRUE(chunks[i].has_overlap);
            // overlap is a suffix of the previous body
            const std::string prev = chunks[i - 1].body();
            const std::string overlap = chunks[i].text.substr(0, chunks[i].overlap_length);
            ASSERT_LE(overlap.size(), prev.size());
            EXPECT_EQ(prev.substr(prev.size() - overlap.size()), overlap);
            EXPECT_LE(counter_->count_tokens(overlap, "gpt-4"), 200u);
        }
    }
    EXPECT_EQ(reassemble(r.value), text);
    EXPECT_EQ(r.value.effective_overlap_tokens, 200u);
}

TEST_F(ChunkerTest, ParagraphBoundariesArePreferred) {
    std::string para_a = long_paragraph(80);
    std::string para_b = long_paragraph(80);
    std::string text = para_a + "\n\n" + para_b;

    ChunkerOptions opts;
    opts.max_tokens_per_chunk = counter_->count_tokens(para_a + "\n\n", "gpt-4") + 20;
    opts.overlap_tokens = 0;
    if (opts.max_tokens_per_chunk < DocumentChunker::MIN_TOKENS_PER_CHUNK) {
        opts.max_tokens_per_chunk = DocumentChunker::MIN_TOKENS_PER_CHUNK;
    }

    Result<ChunkingResult> r = chunker_->chunk(text, opts);
    ASSERT_TRUE(r.success) << r.error.message;
    EXPECT_EQ(reassemble(r.value), text);
    for (size_t i = 0; i < r.value.chunks.size(); ++i) {
        EXPECT_FALSE(r.value.chunks[i].has_overlap);
    }
}

TEST_F(ChunkerTest, OverlapIsCappedAtQuarterOfBudget) {
    ChunkerOptions opts;
    opts.max_tokens_per_chunk = 400;
    opts.overlap_tokens = 5000;
    Result<ChunkingResult> r = chunker_->chunk(long_paragraph(2000), opts);
    ASSERT_TRUE(r.success) << r.error.message;
    EXPECT_EQ(r.value.effective_overlap_tokens, 100u);
}

TEST_F(ChunkerTest, ChunkCapTruncates) {
    ChunkerOptions opts;
    opts.max_tokens_per_chunk = 100;
    opts.overlap_tokens = 0;
    opts.max_chunks = 100;

    Result<ChunkingResult> r = chunker_->chunk(long_paragraph(15000), opts);
    ASSERT_TRUE(r.success) << r.error.message;
    EXPECT_LE(r.value.chunks.size(), 100u);
    EXPECT_TRUE(r.value.truncated);
}

TEST_F(ChunkerTest, GiantTokenWithoutBreaksIsSliced) {
    // No whitespace or punctuation at all
    std::string blob(60000, 'x');
    ChunkerOptions opts;
    opts.max_tokens_per_chunk = 1000;
    opts.overlap_tokens = 0;

    Result<ChunkingResult> r = chunker_->chunk(blob, opts);
    ASSERT_TRUE(r.success) << r.error.message;
    ASSERT_GT(r.value.chunks.size(), 1u);
    for (size_t i = 0; i < r.value.chunks.size(); ++i) {
        EXPECT_LE(r.value.chunks[i].token_count, 1100u);
    }
}

TEST_F(ChunkerTest, RejectsInvalidParameters) {
    ChunkerOptions opts;
    opts.max_tokens_per_chunk = 50;
    Result<ChunkingResult> r = chunker_->chunk("some text", opts);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error.kind, ErrorKind::CHUNKING);

    opts.max_tokens_per_chunk = 32001;
    EXPECT_FALSE(chunker_->chunk("some text", opts).success);

    std::string error;
    opts.max_tokens_per_chunk = 32000;
    EXPECT_TRUE(DocumentChunker::check_options(opts, error));
}

TEST_F(ChunkerTest, RejectsEmptyAndOversizedInput) {
    Result<ChunkingResult> blank = chunker_->chunk(" \n\t ", ChunkerOptions());
    ASSERT_FALSE(blank.success);
    EXPECT_EQ(blank.error.kind, ErrorKind::CHUNKING);

    ChunkerOptions opts;
    opts.max_document_length = 100;
    Result<ChunkingResult> big = chunker_->chunk(std::string(101, 'a'), opts);
    ASSERT_FALSE(big.success);
    EXPECT_EQ(big.error.kind, ErrorKind::CHUNKING);
}

TEST_F(ChunkerTest, CancelledBeforeStart) {
    CancelToken cancel;
    cancel.cancel();
    Result<ChunkingResult> r = chunker_->chunk(long_paragraph(500), ChunkerOptions(), &cancel);
    ASSERT_FALSE(r.success);
    EXPECT_EQ(r.error.kind, ErrorKind::TIMEOUT);
}

TEST_F(ChunkerTest, StatsSummarizeChunks) {
    ChunkerOptions opts;
    opts.max_tokens_per_chunk = 500;
    opts.overlap_tokens = 50;
    Result<ChunkingResult> r = chunker_->chunk(long_paragraph(3000), opts);
    ASSERT_TRUE(r.success);

    const ChunkingStats& st = r.value.stats;
    EXPECT_EQ(st.total_chunks, r.value.chunks.size());
    EXPECT_LE(st.min_tokens, st.average_tokens);
    EXPECT_LE(st.average_tokens, st.max_tokens);
    EXPECT_GT(st.efficiency, 0.0);

    Json j = r.value.to_json(false);
    EXPECT_EQ(j["chunks"].size(), r.value.chunks.size());
    EXPECT_FALSE(j["chunks"][0].contains("text"));
}
