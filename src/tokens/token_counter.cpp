#include <docpipe/tokens/token_counter.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <algorithm>
#include <cmath>

namespace docpipe {

namespace {

const int64_t DEFAULT_CONTEXT_WINDOW = 8192;
const size_t MAX_RECOMMENDATION_TEXT = 50000;
const char* const RECOMMENDATION_CANDIDATES[] = {
    "gpt-4o-mini", "gpt-4", "claude-3-haiku", "gemini-1.5-flash"
};
const char* const FALLBACK_RECOMMENDATION = "gpt-4o-mini";

double round_to(double value, int places) {
    double scale = std::pow(10.0, places);
    return std::round(value * scale) / scale;
}

} // anonymous namespace

// ============================================================================
// TokenMeasure / serialization
// ============================================================================

size_t TokenMeasure::scale(size_t raw_count) const {
    if (ratio_ == 1.0) return raw_count;
    return static_cast<size_t>(std::llround(static_cast<double>(raw_count) * ratio_));
}

Json TokenAnalysis::to_json() const {
    Json j;
    j["tokenCount"] = token_count;
    j["characterCount"] = character_count;
    j["wordCount"] = word_count;
    j["model"] = model;
    j["provider"] = provider;
    j["category"] = category;
    j["contextWindow"] = context_window;
    j["exceedsContext"] = exceeds_context;
    j["utilizationPercent"] = utilization_percent;
    j["costs"] = {
        {"input", costs.input},
        {"estimatedOutput", costs.estimated_output},
        {"total", costs.total}
    };
    j["accuracy"] = accuracy;
    j["knownModel"] = known_model;
    return j;
}

bool TokenAnalysis::from_json(const Json& j, TokenAnalysis& out) {
    if (!j.is_object() || !j.contains("tokenCount") || !j.contains("model")) {
        return false;
    }
    out.token_count = j.value("tokenCount", static_cast<size_t>(0));
    out.character_count = j.value("characterCount", static_cast<size_t>(0));
    out.word_count = j.value("wordCount", static_cast<size_t>(0));
    out.model = j.value("model", std::string());
    out.provider = j.value("provider", std::string("unknown"));
    out.category = j.value("category", std::string("unknown"));
    out.context_window = j.value("contextWindow", DEFAULT_CONTEXT_WINDOW);
    out.exceeds_context = j.value("exceedsContext", false);
    out.utilization_percent = j.value("utilizationPercent", 0.0);
    if (j.contains("costs") && j["costs"].is_object()) {
        out.costs.input = j["costs"].value("input", 0.0);
        out.costs.estimated_output = j["costs"].value("estimatedOutput", 0.0);
        out.costs.total = j["costs"].value("total", 0.0);
    }
    out.accuracy = j.value("accuracy", std::string("approximation"));
    out.known_model = j.value("knownModel", false);
    return true;
}

Json RecommendationSet::to_json() const {
    Json j;
    j["useCase"] = use_case;
    j["recommended"] = recommended;
    Json list = Json::array();
    for (size_t i = 0; i < candidates.size(); ++i) {
        Json entry = candidates[i].analysis.to_json();
        entry["costEfficiency"] = candidates[i].cost_efficiency;
        list.push_back(entry);
    }
    j["candidates"] = list;
    return j;
}

// ============================================================================
// TokenCounter
// ============================================================================

TokenCounter::TokenCounter(std::shared_ptr<const ModelRegistry> registry,
                           std::shared_ptr<const Tokenizer> reference,
                           std::shared_ptr<const Tokenizer> exact)
    : registry_(registry)
    , reference_(reference)
    , exact_(exact) {
    if (!registry_) registry_ = std::make_shared<ModelRegistry>();
    if (!reference_) reference_ = std::make_shared<HeuristicTokenizer>();
}

TokenMeasure TokenCounter::measure_for(const std::string& model) const {
    const ModelProfile* profile = registry_->find(model);
    if (!profile) {
        LOG_WARN("[TokenCounter] Unknown model '%s', using %s at ratio 1.0",
                 model.c_str(), reference_->name());
        return TokenMeasure(reference_.get(), 1.0, false);
    }
    if (profile->exact_tokenizer) {
        if (exact_) {
            return TokenMeasure(exact_.get(), 1.0, exact_->exact());
        }
        return TokenMeasure(reference_.get(), 1.0, reference_->exact());
    }
    return TokenMeasure(reference_.get(), profile->approximation_ratio, false);
}

size_t TokenCounter::count_tokens(const std::string& text, const std::string& model) const {
    if (text.empty()) return 0;
    return measure_for(model).count(text);
}

TokenCosts TokenCounter::estimate_cost(size_t tokens, const std::string& model) const {
    TokenCosts costs;
    const ModelProfile* profile = registry_->find(model);
    if (!profile) return costs;

    double thousands = static_cast<double>(tokens) / 1000.0;
    costs.input = round_to(thousands * profile->input_price_per_1k, 4);
    costs.estimated_output = round_to(thousands * profile->output_price_per_1k, 4);
    costs.total = round_to(costs.input + costs.estimated_output, 4);
    return costs;
}

TokenAnalysis TokenCounter::analyze(const std::string& text, const std::string& model) const {
    TokenAnalysis a;
    const ModelProfile* profile = registry_->find(model);
    TokenMeasure measure = measure_for(model);

    a.token_count = text.empty() ? 0 : measure.count(text);
    a.character_count = utf8_length(text);
    a.word_count = count_words(text);
    a.known_model = profile != nullptr;
    a.model = profile ? profile->id : registry_->canonical_name(model);
    a.provider = profile ? profile->provider : "unknown";
    a.category = profile ? profile->category : "unknown";
    a.context_window = profile ? profile->context_window : DEFAULT_CONTEXT_WINDOW;
    a.exceeds_context = static_cast<int64_t>(a.token_count) > a.context_window;
    a.utilization_percent = std::round(static_cast<double>(a.token_count) * 100.0 /
                                       static_cast<double>(a.context_window));
    a.costs = estimate_cost(a.token_count, model);
    a.accuracy = measure.exact() ? "exact" : "approximation";
    return a;
}

int64_t TokenCounter::optimal_chunk_size(const std::string& model, double buffer_fraction) const {
    const ModelProfile* profile = registry_->find(model);
    int64_t window = profile ? profile->context_window : DEFAULT_CONTEXT_WINDOW;
    double fraction = clamp(buffer_fraction, 0.0, 0.99);
    int64_t reserved = static_cast<int64_t>(std::floor(static_cast<double>(window) * fraction));
    return std::max<int64_t>(1000, window - reserved);
}

std::map<std::string, std::vector<std::string>> TokenCounter::supported_models() const {
    std::map<std::string, std::vector<std::string>> grouped;
    const std::vector<ModelProfile>& models = registry_->models();
    for (size_t i = 0; i < models.size(); ++i) {
        std::vector<std::string>& ids = grouped[models[i].category];
        if (std::find(ids.begin(), ids.end(), models[i].id) == ids.end()) {
            ids.push_back(models[i].id);
        }
    }
    return grouped;
}

Json TokenCounter::stats() const {
    Json j;
    j["modelsSupported"] = registry_->models().size();
    j["aliases"] = registry_->aliases().size();
    j["providers"] = registry_->providers();
    j["categories"] = registry_->categories();
    j["referenceTokenizer"] = reference_->name();
    j["exactTokenizer"] = exact_ ? exact_->name() : "none";
    return j;
}

Result<RecommendationSet> TokenCounter::recommend_models(const std::string& text,
                                                         const std::string& use_case) const {
    if (text.empty()) {
        return Result<RecommendationSet>::fail(ErrorKind::VALIDATION, "Text is required");
    }
    if (utf8_length(text) > MAX_RECOMMENDATION_TEXT) {
        return Result<RecommendationSet>::fail(ErrorKind::VALIDATION,
            "Text too long for recommendation (max " + std::to_string(MAX_RECOMMENDATION_TEXT) + " characters)");
    }

    RecommendationSet set;
    set.use_case = to_lower(trim(use_case));
    for (size_t i = 0; i < sizeof(RECOMMENDATION_CANDIDATES) / sizeof(RECOMMENDATION_CANDIDATES[0]); ++i) {
        ModelRecommendation rec;
        rec.analysis = analyze(text, RECOMMENDATION_CANDIDATES[i]);
        if (rec.analysis.costs.total > 0.0) {
            rec.cost_efficiency = static_cast<double>(rec.analysis.token_count) / rec.analysis.costs.total;
        }
        set.candidates.push_back(rec);
    }

    const std::string& mode = set.use_case;
    std::stable_sort(set.candidates.begin(), set.candidates.end(),
        [&mode](const ModelRecommendation& a, const ModelRecommendation& b) {
            // Models that fit the whole text always rank first
            if (a.analysis.exceeds_context != b.analysis.exceeds_context) {
                return !a.analysis.exceeds_context;
            }
            if (mode == "budget") {
                return a.analysis.costs.total < b.analysis.costs.total;
            }
            if (mode == "quality") {
                return a.cost_efficiency > b.cost_efficiency;
            }
            return a.analysis.utilization_percent < b.analysis.utilization_percent;
        });

    set.recommended = set.candidates.empty() ? FALLBACK_RECOMMENDATION : set.candidates[0].analysis.model;
    return Result<RecommendationSet>::ok(set);
}

} // namespace docpipe
