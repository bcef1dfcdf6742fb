#include <gtest/gtest.h>
#include <docpipe/tokens/bpe_tokenizer.hpp>
#include <docpipe/tokens/model_registry.hpp>
#include <docpipe/tokens/token_counter.hpp>
#include <docpipe/tokens/tokenizer.hpp>
#include <algorithm>
#include <cmath>
#include <memory>

using namespace docpipe;

namespace {

std::string sample_text(size_t approx_chars) {
    const std::string sentence =
        "The quarterly revenue grew by 12 percent while operating costs remained flat. ";
    std::string out;
    while (out.size() < approx_chars) out += sentence;
    return out;
}

} // anonymous namespace

class TokenCounterTest : public ::testing::Test {
protected:
    void SetUp() override {
        counter_.reset(new TokenCounter(std::make_shared<ModelRegistry>(),
                                        std::make_shared<HeuristicTokenizer>()));
    }

    std::unique_ptr<TokenCounter> counter_;
};

TEST_F(TokenCounterTest, EmptyTextIsZero) {
    EXPECT_EQ(counter_->count_tokens("", "gpt-4"), 0u);
    TokenAnalysis a = counter_->analyze("", "gpt-4");
    EXPECT_EQ(a.token_count, 0u);
    EXPECT_EQ(a.character_count, 0u);
}

TEST_F(TokenCounterTest, CountsAreDeterministic) {
    std::string text = sample_text(2000);
    size_t first = counter_->count_tokens(text, "gpt-4");
    EXPECT_GT(first, 0u);
    for (int i = 0; i < 5; ++i) {
        EXPECT_EQ(counter_->count_tokens(text, "gpt-4"), first);
    }
}

TEST_F(TokenCounterTest, AppendingNeverDecreasesCount) {
    HeuristicTokenizer tok;
    const std::string text = "Hello, world! Numbers 12345 and symbols ->> {}[] \n\n  trailing words caf\xC3\xA9";
    size_t previous = 0;
    for (size_t len = 0; len <= text.size(); ++len) {
        size_t c = tok.count(text.substr(0, len));
        EXPECT_GE(c, previous) << "prefix length " << len;
        previous = c;
    }
}

TEST_F(TokenCounterTest, UnknownModelFallsBackToReference) {
    std::string text = sample_text(500);
    TokenAnalysis a = counter_->analyze(text, "  My-Custom-Model ");
    EXPECT_FALSE(a.known_model);
    EXPECT_EQ(a.model, "my-custom-model");
    EXPECT_EQ(a.provider, "unknown");
    EXPECT_EQ(a.context_window, 8192);
    EXPECT_EQ(a.accuracy, "approximation");
    EXPECT_EQ(a.token_count, counter_->count_tokens(text, "gpt-4"));
    EXPECT_DOUBLE_EQ(a.costs.total, 0.0);
}

TEST_F(TokenCounterTest, AliasesResolve) {
    TokenAnalysis a = counter_->analyze("hello there", "Sonnet");
    EXPECT_TRUE(a.known_model);
    EXPECT_EQ(a.model, "claude-3-sonnet");
    EXPECT_EQ(a.provider, "anthropic");
    EXPECT_EQ(a.context_window, 200000);
}

TEST_F(TokenCounterTest, ApproximationRatioScalesReferenceCount) {
    std::string text = sample_text(4000);
    size_t reference = counter_->count_tokens(text, "gpt-4");
    size_t claude = counter_->count_tokens(text, "claude-3-opus");
    size_t gemini = counter_->count_tokens(text, "gemini-1.5-pro");
    EXPECT_EQ(claude, static_cast<size_t>(std::llround(reference * 1.2)));
    EXPECT_EQ(gemini, static_cast<size_t>(std::llround(reference * 0.8)));
}

TEST_F(TokenCounterTest, RatioOverrides) {
    std::map<std::string, double> overrides;
    overrides["sonnet"] = 2.0;
    overrides["not-a-model"] = 3.0;
    overrides["gpt-4o"] = -1.0;
    ModelRegistry registry(overrides);
    EXPECT_DOUBLE_EQ(registry.find("claude-3-sonnet")->approximation_ratio, 2.0);
    EXPECT_DOUBLE_EQ(registry.find("gpt-4o")->approximation_ratio, 1.0);
    EXPECT_EQ(registry.find("not-a-model"), nullptr);
}

TEST_F(TokenCounterTest, CostEstimate) {
    TokenCosts c = counter_->estimate_cost(1000, "gpt-4");
    EXPECT_DOUBLE_EQ(c.input, 0.03);
    EXPECT_DOUBLE_EQ(c.estimated_output, 0.06);
    EXPECT_DOUBLE_EQ(c.total, 0.09);

    TokenCosts unknown = counter_->estimate_cost(1000, "nobody");
    EXPECT_DOUBLE_EQ(unknown.total, 0.0);
}

TEST_F(TokenCounterTest, ContextUtilization) {
    TokenAnalysis small = counter_->analyze("short text", "gpt-3.5-turbo");
    EXPECT_FALSE(small.exceeds_context);

    std::string big = sample_text(40000);
    TokenAnalysis a = counter_->analyze(big, "gpt-3.5-turbo");
    EXPECT_TRUE(a.exceeds_context);
    EXPECT_GT(a.utilization_percent, 100.0);
}

TEST_F(TokenCounterTest, OptimalChunkSize) {
    EXPECT_EQ(counter_->optimal_chunk_size("gpt-4"), 6554);
    EXPECT_EQ(counter_->optimal_chunk_size("gpt-3.5-turbo"), 3277);
    EXPECT_EQ(counter_->optimal_chunk_size("claude-3-haiku"), 160000);
    EXPECT_EQ(counter_->optimal_chunk_size("gpt-4", 0.5), 4096);
    EXPECT_EQ(counter_->optimal_chunk_size("unheard-of"), 6554);
}

TEST_F(TokenCounterTest, SupportedModelsByCategory) {
    std::map<std::string, std::vector<std::string>> grouped = counter_->supported_models();
    ASSERT_TRUE(grouped.count("flagship"));
    ASSERT_TRUE(grouped.count("efficient"));
    const std::vector<std::string>& flagship = grouped["flagship"];
    EXPECT_NE(std::find(flagship.begin(), flagship.end(), "gpt-4"), flagship.end());

    Json stats = counter_->stats();
    EXPECT_EQ(stats["exactTokenizer"], "none");
    EXPECT_GT(stats["modelsSupported"].get<size_t>(), 10u);
}

TEST_F(TokenCounterTest, RecommendationsRejectBadInput) {
    Result<RecommendationSet> empty = counter_->recommend_models("", "balanced");
    ASSERT_FALSE(empty.success);
    EXPECT_EQ(empty.error.kind, ErrorKind::VALIDATION);

    Result<RecommendationSet> huge = counter_->recommend_models(std::string(50001, 'a'), "balanced");
    ASSERT_FALSE(huge.success);
    EXPECT_EQ(huge.error.kind, ErrorKind::VALIDATION);
}

TEST_F(TokenCounterTest, BudgetRecommendationPicksCheapest) {
    Result<RecommendationSet> r = counter_->recommend_models(sample_text(30000), "Budget");
    ASSERT_TRUE(r.success);
    EXPECT_EQ(r.value.use_case, "budget");
    ASSERT_EQ(r.value.candidates.size(), 4u);
    EXPECT_EQ(r.value.recommended, "gemini-1.5-flash");
    for (size_t i = 1; i < r.value.candidates.size(); ++i) {
        const TokenAnalysis& prev = r.value.candidates[i - 1].analysis;
        const TokenAnalysis& cur = r.value.candidates[i].analysis;
        if (prev.exceeds_context == cur.exceeds_context) {
            EXPECT_LE(prev.costs.total, cur.costs.total);
        }
    }
}

TEST_F(TokenCounterTest, ModelsThatFitRankFirst) {
    Result<RecommendationSet> r = counter_->recommend_models(sample_text(45000), "balanced");
    ASSERT_TRUE(r.success);
    bool seen_exceeding = false;
    for (size_t i = 0; i < r.value.candidates.size(); ++i) {
        if (r.value.candidates[i].analysis.exceeds_context) {
            seen_exceeding = true;
        } else {
            EXPECT_FALSE(seen_exceeding) << "fitting model ranked after an exceeding one";
        }
    }
}

// ============================================================================
// BPE
// ============================================================================

TEST(BpeTokenizerTest, MergesByRank) {
    // a=0 b=1 ab=2 (base64 of the raw bytes)
    std::string error;
    std::unique_ptr<BpeTokenizer> tok = BpeTokenizer::load_string("YQ== 0\nYg== 1\nYWI= 2\n", error);
    ASSERT_TRUE(tok) << error;
    EXPECT_EQ(tok->vocab_size(), 3u);
    EXPECT_TRUE(tok->exact());
    EXPECT_EQ(tok->count("ab"), 1u);
    EXPECT_EQ(tok->count("abab"), 2u);
    EXPECT_EQ(tok->count("aba"), 2u);
}

TEST(BpeTokenizerTest, DefaultConstructedTableIsEmpty) {
    BpeTokenizer tok;
    EXPECT_EQ(tok.vocab_size(), 0u);
    EXPECT_EQ(tok.count(""), 0u);
    EXPECT_STREQ(tok.name(), "bpe-tiktoken");
}

TEST(BpeTokenizerTest, RejectsMalformedTables) {
    std::string error;
    EXPECT_FALSE(BpeTokenizer::load_string("", error));
    EXPECT_FALSE(error.empty());
    EXPECT_FALSE(BpeTokenizer::load_string("YQ==\n", error));
    EXPECT_FALSE(BpeTokenizer::load_string("YQ== rank\n", error));
    EXPECT_FALSE(BpeTokenizer::load_file("/nonexistent/cl100k_base.tiktoken", error));
}

TEST(BpeTokenizerTest, ExactModelsUseLoadedEncoding) {
    std::string error;
    std::shared_ptr<BpeTokenizer> bpe = BpeTokenizer::load_string("YQ== 0\nYg== 1\nYWI= 2\n", error);
    ASSERT_TRUE(bpe);
    TokenCounter counter(std::make_shared<ModelRegistry>(), std::make_shared<HeuristicTokenizer>(), bpe);

    EXPECT_EQ(counter.analyze("abab", "gpt-4").accuracy, "exact");
    EXPECT_EQ(counter.analyze("abab", "gpt-4").token_count, 2u);
    EXPECT_EQ(counter.analyze("abab", "claude-3-haiku").accuracy, "approximation");
}
