/*
 * docpipe C++17 - Token Counter
 *
 * Per-model token counting, cost estimation and context-window analysis.
 * Exact-flagged models use the exact tokenizer when one is loaded; every
 * other model scales the reference count by its approximation ratio.
 * Unknown models fall back to the reference tokenizer at ratio 1.0.
 */
#ifndef docpipe_TOKENS_TOKEN_COUNTER_HPP
#define docpipe_TOKENS_TOKEN_COUNTER_HPP

#include <docpipe/core/types.hpp>
#include <docpipe/tokens/model_registry.hpp>
#include <docpipe/tokens/tokenizer.hpp>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace docpipe {

// Counting rule resolved for one model. raw() sums are scaled once so that
// packing many small spans does not accumulate rounding error.
class TokenMeasure {
public:
    TokenMeasure(const Tokenizer* tokenizer, double ratio, bool exact)
        : tokenizer_(tokenizer), ratio_(ratio), exact_(exact) {}

    size_t raw(const std::string& text) const { return tokenizer_->count(text); }
    size_t scale(size_t raw_count) const;
    size_t count(const std::string& text) const { return scale(raw(text)); }

    double ratio() const { return ratio_; }
    bool exact() const { return exact_; }

private:
    const Tokenizer* tokenizer_;
    double ratio_;
    bool exact_;
};

struct TokenCosts {
    double input;
    double estimated_output;    // assumes a reply as long as the input
    double total;

    TokenCosts() : input(0.0), estimated_output(0.0), total(0.0) {}
};

struct TokenAnalysis {
    size_t token_count;
    size_t character_count;
    size_t word_count;
    std::string model;              // canonical id (or the normalized unknown name)
    std::string provider;
    std::string category;
    int64_t context_window;
    bool exceeds_context;
    double utilization_percent;
    TokenCosts costs;
    std::string accuracy;           // "exact" or "approximation"
    bool known_model;

    TokenAnalysis()
        : token_count(0), character_count(0), word_count(0), context_window(8192)
        , exceeds_context(false), utilization_percent(0.0), known_model(false) {}

    Json to_json() const;
    static bool from_json(const Json& j, TokenAnalysis& out);
};

struct ModelRecommendation {
    TokenAnalysis analysis;
    double cost_efficiency;         // tokens per dollar of total cost

    ModelRecommendation() : cost_efficiency(0.0) {}
};

struct RecommendationSet {
    std::string use_case;
    std::string recommended;
    std::vector<ModelRecommendation> candidates;

    Json to_json() const;
};

class TokenCounter {
public:
    TokenCounter(std::shared_ptr<const ModelRegistry> registry,
                 std::shared_ptr<const Tokenizer> reference,
                 std::shared_ptr<const Tokenizer> exact = nullptr);

    TokenMeasure measure_for(const std::string& model) const;

    size_t count_tokens(const std::string& text, const std::string& model) const;
    TokenAnalysis analyze(const std::string& text, const std::string& model) const;
    TokenCosts estimate_cost(size_t tokens, const std::string& model) const;

    // max(1000, window - floor(window * buffer_fraction))
    int64_t optimal_chunk_size(const std::string& model, double buffer_fraction = 0.2) const;

    // Canonical ids grouped by category
    std::map<std::string, std::vector<std::string>> supported_models() const;
    Json stats() const;

    Result<RecommendationSet> recommend_models(const std::string& text, const std::string& use_case) const;

    const ModelRegistry& registry() const { return *registry_; }

private:
    std::shared_ptr<const ModelRegistry> registry_;
    std::shared_ptr<const Tokenizer> reference_;
    std::shared_ptr<const Tokenizer> exact_;
};

} // namespace docpipe

#endif // docpipe_TOKENS_TOKEN_COUNTER_HPP
