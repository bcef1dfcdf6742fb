/*
 * docpipe C++17 - Model Registry
 *
 * Immutable table of model profiles (provider, context window, pricing,
 * tokenizer accuracy) with an alias map for shorthand names. Built once
 * at startup; concurrent readers need no locking.
 */
#ifndef docpipe_TOKENS_MODEL_REGISTRY_HPP
#define docpipe_TOKENS_MODEL_REGISTRY_HPP

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace docpipe {

struct ModelProfile {
    std::string id;                 // canonical model id
    std::string provider;           // "openai", "anthropic", ...
    int64_t context_window;         // tokens per request
    double input_price_per_1k;      // USD per 1K input tokens
    double output_price_per_1k;     // USD per 1K output tokens
    bool exact_tokenizer;           // served by the reference encoding
    double approximation_ratio;     // scale applied to reference counts otherwise
    std::string category;           // "flagship", "balanced", "efficient", "specialized"

    ModelProfile()
        : context_window(8192), input_price_per_1k(0.0), output_price_per_1k(0.0)
        , exact_tokenizer(false), approximation_ratio(1.0) {}
};

class ModelRegistry {
public:
    // Built-in table; `ratio_overrides` replaces approximation ratios by canonical id or alias
    ModelRegistry();
    explicit ModelRegistry(const std::map<std::string, double>& ratio_overrides);

    // Trimmed, lowercased, alias-resolved name (unknown names pass through normalized)
    std::string canonical_name(const std::string& name) const;

    // Profile for a canonical id or alias; null when unknown
    const ModelProfile* find(const std::string& name) const;

    const std::vector<ModelProfile>& models() const { return models_; }
    const std::map<std::string, std::string>& aliases() const { return aliases_; }

    std::vector<std::string> providers() const;
    std::vector<std::string> categories() const;

private:
    void build_defaults();

    std::vector<ModelProfile> models_;
    std::map<std::string, size_t> index_;
    std::map<std::string, std::string> aliases_;    // alias -> canonical id
};

} // namespace docpipe

#endif // docpipe_TOKENS_MODEL_REGISTRY_HPP
