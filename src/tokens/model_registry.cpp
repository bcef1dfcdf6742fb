#include <docpipe/tokens/model_registry.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <set>

namespace docpipe {

namespace {

struct ModelRow {
    const char* id;
    const char* provider;
    int64_t context_window;
    double input_price;
    double output_price;
    bool exact;
    double ratio;
    const char* category;
};

// Ratios are uncalibrated estimates relative to the cl100k reference encoding
const ModelRow MODEL_TABLE[] = {
    {"gpt-4",             "openai",    8192,    0.03,     0.06,    true,  1.0, "flagship"},
    {"gpt-4-turbo",       "openai",    128000,  0.01,     0.03,    true,  1.0, "flagship"},
    {"gpt-4o",            "openai",    128000,  0.0025,   0.01,    true,  1.0, "flagship"},
    {"gpt-4o-mini",       "openai",    128000,  0.00015,  0.0006,  true,  1.0, "efficient"},
    {"gpt-3.5-turbo",     "openai",    4096,    0.0015,   0.002,   true,  1.0, "efficient"},
    {"claude-3-opus",     "anthropic", 200000,  0.015,    0.075,   false, 1.2, "flagship"},
    {"claude-3-sonnet",   "anthropic", 200000,  0.003,    0.015,   false, 1.2, "balanced"},
    {"claude-3-haiku",    "anthropic", 200000,  0.00025,  0.00125, false, 1.2, "efficient"},
    {"claude-3.5-sonnet", "anthropic", 200000,  0.003,    0.015,   false, 1.2, "flagship"},
    {"gemini-1.5-pro",    "google",    2000000, 0.00125,  0.005,   false, 0.8, "flagship"},
    {"gemini-1.5-flash",  "google",    1000000, 0.000075, 0.0003,  false, 0.8, "efficient"},
    {"gemini-pro",        "google",    32768,   0.0005,   0.0015,  false, 0.8, "balanced"},
    {"deepseek-chat",     "deepseek",  32768,   0.00014,  0.00028, false, 1.0, "efficient"},
    {"deepseek-coder",    "deepseek",  16384,   0.00014,  0.00028, false, 1.0, "specialized"},
    {"mistral-large",     "mistral",   32768,   0.004,    0.012,   false, 1.1, "flagship"},
    {"mistral-medium",    "mistral",   32768,   0.00275,  0.0081,  false, 1.1, "balanced"},
    {"llama-3-70b",       "meta",      8192,    0.00059,  0.00079, false, 0.9, "balanced"},
    {"llama-3-8b",        "meta",      8192,    0.00005,  0.00008, false, 0.9, "efficient"},
};

const char* const ALIAS_TABLE[][2] = {
    {"gpt4", "gpt-4"},
    {"gpt-4-0613", "gpt-4"},
    {"gpt-4-turbo-preview", "gpt-4-turbo"},
    {"gpt-4-1106-preview", "gpt-4-turbo"},
    {"gpt-4o-2024-05-13", "gpt-4o"},
    {"gpt3.5", "gpt-3.5-turbo"},
    {"gpt-3.5", "gpt-3.5-turbo"},
    {"gpt-3.5-turbo-0613", "gpt-3.5-turbo"},
    {"claude-opus", "claude-3-opus"},
    {"opus", "claude-3-opus"},
    {"claude-sonnet", "claude-3-sonnet"},
    {"sonnet", "claude-3-sonnet"},
    {"claude-haiku", "claude-3-haiku"},
    {"haiku", "claude-3-haiku"},
    {"claude-3.5", "claude-3.5-sonnet"},
    {"claude-3.5-sonnet-20241022", "claude-3.5-sonnet"},
    {"gemini-pro-1.5", "gemini-1.5-pro"},
    {"gemini-1.5", "gemini-1.5-pro"},
    {"gemini", "gemini-pro"},
    {"gemini-pro-vision", "gemini-pro"},
};

} // anonymous namespace

ModelRegistry::ModelRegistry() {
    build_defaults();
}

ModelRegistry::ModelRegistry(const std::map<std::string, double>& ratio_overrides) {
    build_defaults();

    for (std::map<std::string, double>::const_iterator it = ratio_overrides.begin();
         it != ratio_overrides.end(); ++it) {
        std::map<std::string, size_t>::const_iterator idx = index_.find(canonical_name(it->first));
        if (idx == index_.end()) {
            LOG_WARN("[ModelRegistry] Ratio override for unknown model '%s' ignored", it->first.c_str());
            continue;
        }
        if (it->second <= 0.0) {
            LOG_WARN("[ModelRegistry] Ratio override %.3f for '%s' must be positive, ignored",
                     it->second, it->first.c_str());
            continue;
        }
        models_[idx->second].approximation_ratio = it->second;
        LOG_DEBUG("[ModelRegistry] Ratio for '%s' set to %.3f", models_[idx->second].id.c_str(), it->second);
    }
}

void ModelRegistry::build_defaults() {
    for (size_t i = 0; i < sizeof(MODEL_TABLE) / sizeof(MODEL_TABLE[0]); ++i) {
        const ModelRow& row = MODEL_TABLE[i];
        ModelProfile p;
        p.id = row.id;
        p.provider = row.provider;
        p.context_window = row.context_window;
        p.input_price_per_1k = row.input_price;
        p.output_price_per_1k = row.output_price;
        p.exact_tokenizer = row.exact;
        p.approximation_ratio = row.ratio;
        p.category = row.category;
        index_[p.id] = models_.size();
        models_.push_back(p);
    }
    for (size_t i = 0; i < sizeof(ALIAS_TABLE) / sizeof(ALIAS_TABLE[0]); ++i) {
        aliases_[ALIAS_TABLE[i][0]] = ALIAS_TABLE[i][1];
    }
}

std::string ModelRegistry::canonical_name(const std::string& name) const {
    std::string normalized = to_lower(trim(name));
    std::map<std::string, std::string>::const_iterator it = aliases_.find(normalized);
    return it != aliases_.end() ? it->second : normalized;
}

const ModelProfile* ModelRegistry::find(const std::string& name) const {
    std::map<std::string, size_t>::const_iterator it = index_.find(canonical_name(name));
    return it != index_.end() ? &models_[it->second] : nullptr;
}

std::vector<std::string> ModelRegistry::providers() const {
    std::set<std::string> seen;
    std::vector<std::string> out;
    for (size_t i = 0; i < models_.size(); ++i) {
        if (seen.insert(models_[i].provider).second) out.push_back(models_[i].provider);
    }
    return out;
}

std::vector<std::string> ModelRegistry::categories() const {
    std::set<std::string> seen;
    std::vector<std::string> out;
    for (size_t i = 0; i < models_.size(); ++i) {
        if (seen.insert(models_[i].category).second) out.push_back(models_[i].category);
    }
    return out;
}

} // namespace docpipe
