/*
 * docpipe C++17 - Application Implementation
 *
 * Parses the command line, wires configuration into the pipeline and
 * prints the processing result as JSON on stdout. Logs go to stderr.
 */
#include <docpipe/core/application.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <docpipe/tokens/bpe_tokenizer.hpp>
#include <docpipe/tokens/model_registry.hpp>
#include <docpipe/tokens/tokenizer.hpp>

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <map>

namespace docpipe {

// ============================================================================
// Utility Functions
// ============================================================================

namespace {

void print_usage(const char* prog) {
    std::cout << AppInfo::NAME << " - secure document ingestion and token-aware chunking\n\n"
              << "Usage: " << prog << " [options] <file>\n"
              << "       " << prog << " --models\n\n"
              << "Options:\n"
              << "  --config <file>       JSON configuration file\n"
              << "  --model <id>          Model profile for token counting (default from config)\n"
              << "  --max-tokens <n>      Chunk budget, 100..32000 (default 6000)\n"
              << "  --mime <type>         Declared MIME type (default from file extension)\n"
              << "  --no-text             Omit extracted and chunk text from the output\n"
              << "  --models              List supported models by category\n"
              << "  --recommend <case>    Recommend models for the document (budget|quality|general)\n"
              << "  -h, --help            Show this help message\n"
              << "  -v, --version         Show version\n\n"
              << "Example:\n"
              << "  " << prog << " --model claude-3-sonnet --max-tokens 4000 report.pdf\n";
}

void print_version() {
    std::cout << AppInfo::NAME << " v" << AppInfo::VERSION << "\n";
}

void print_error(const ProcessingError& error) {
    Json j;
    j["success"] = false;
    j["error"] = error.to_json();
    std::cout << j.dump(2) << std::endl;
}

bool parse_int(const char* s, int64_t& out) {
    if (!s || !*s) return false;
    char* end = nullptr;
    long long v = std::strtoll(s, &end, 10);
    if (*end != '\0') return false;
    out = static_cast<int64_t>(v);
    return true;
}

// Reads at most max_bytes + 1 so oversized files still reach the validator
bool read_input(const std::string& path, size_t max_bytes, std::string& out) {
    std::ifstream in(path.c_str(), std::ios::binary);
    if (!in) return false;
    out.resize(max_bytes + 1);
    in.read(&out[0], static_cast<std::streamsize>(out.size()));
    out.resize(static_cast<size_t>(in.gcount()));
    return !in.bad();
}

std::string base_name(const std::string& path) {
    size_t slash = path.rfind('/');
    return slash == std::string::npos ? path : path.substr(slash + 1);
}

} // anonymous namespace

std::string mime_type_for_path(const std::string& path) {
    std::string lower = to_lower(path);
    if (ends_with(lower, ".pdf")) return format_mime_type(DocumentFormat::PDF);
    if (ends_with(lower, ".docx")) return format_mime_type(DocumentFormat::DOCX);
    if (ends_with(lower, ".xlsx")) return format_mime_type(DocumentFormat::XLSX);
    if (ends_with(lower, ".pptx")) return format_mime_type(DocumentFormat::PPTX);
    if (ends_with(lower, ".txt")) return format_mime_type(DocumentFormat::TEXT);
    return "";
}

// ============================================================================
// Application Implementation
// ============================================================================

Application& Application::instance() {
    static Application app;
    return app;
}

Application::Application()
    : max_tokens_(-1)
    , include_text_(true)
    , list_models_(false)
    , recommend_(false)
    , exit_code_(EXIT_OK)
{}

bool Application::parse_args(int argc, char* argv[]) {
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        bool has_value = i + 1 < argc;

        if (strcmp(arg, "-h") == 0 || strcmp(arg, "--help") == 0) {
            print_usage(argv[0]);
            exit_code_ = EXIT_OK;
            return false;
        }
        if (strcmp(arg, "-v") == 0 || strcmp(arg, "--version") == 0) {
            print_version();
            exit_code_ = EXIT_OK;
            return false;
        }
        if (strcmp(arg, "--models") == 0) {
            list_models_ = true;
            continue;
        }
        if (strcmp(arg, "--no-text") == 0) {
            include_text_ = false;
            continue;
        }
        if (strcmp(arg, "--config") == 0 && has_value) {
            config_file_ = argv[++i];
            continue;
        }
        if (strcmp(arg, "--model") == 0 && has_value) {
            model_ = argv[++i];
            continue;
        }
        if (strcmp(arg, "--mime") == 0 && has_value) {
            mime_type_ = argv[++i];
            continue;
        }
        if (strcmp(arg, "--recommend") == 0 && has_value) {
            recommend_ = true;
            use_case_ = argv[++i];
            continue;
        }
        if (strcmp(arg, "--max-tokens") == 0 && has_value) {
            if (!parse_int(argv[++i], max_tokens_) || max_tokens_ < 0) {
                std::cerr << "Invalid --max-tokens value: " << argv[i] << "\n";
                exit_code_ = EXIT_USAGE;
                return false;
            }
            continue;
        }
        if (arg[0] == '-') {
            std::cerr << "Unknown or incomplete option: " << arg << "\n\n";
            print_usage(argv[0]);
            exit_code_ = EXIT_USAGE;
            return false;
        }
        if (!input_file_.empty()) {
            std::cerr << "Only one input file may be given\n";
            exit_code_ = EXIT_USAGE;
            return false;
        }
        input_file_ = arg;
    }

    if (!list_models_ && input_file_.empty()) {
        print_usage(argv[0]);
        exit_code_ = EXIT_USAGE;
        return false;
    }
    return true;
}

void Application::setup_logging() {
    Logger::instance().set_level(parse_log_level(config_.get_string("log_level", "info")));
}

bool Application::setup_tokens() {
    std::map<std::string, double> ratios;
    const Json* overrides = config_.get_object("tokens.ratios");
    if (overrides) {
        for (Json::const_iterator it = overrides->begin(); it != overrides->end(); ++it) {
            if (it.value().is_number()) {
                ratios[it.key()] = it.value().get<double>();
            } else {
                LOG_WARN("[App] Ignoring non-numeric ratio for '%s'", it.key().c_str());
            }
        }
    }
    std::shared_ptr<const ModelRegistry> registry = std::make_shared<ModelRegistry>(ratios);

    std::shared_ptr<const Tokenizer> exact;
    std::string ranks_file = config_.get_string("tokens.bpe_ranks_file", "");
    if (!ranks_file.empty()) {
        std::string error;
        std::unique_ptr<BpeTokenizer> bpe = BpeTokenizer::load_file(ranks_file, error);
        if (!bpe) {
            LOG_ERROR("[App] Failed to load BPE ranks from %s: %s", ranks_file.c_str(), error.c_str());
            return false;
        }
        LOG_INFO("[App] Loaded BPE ranks: %zu tokens", bpe->vocab_size());
        exact = std::shared_ptr<const Tokenizer>(std::move(bpe));
    }

    counter_ = std::make_shared<TokenCounter>(registry,
        std::make_shared<HeuristicTokenizer>(), exact);
    return true;
}

bool Application::setup_store() {
    std::string path = config_.get_string("store.path", "");
    if (path.empty()) return true;

    std::shared_ptr<AnalysisStore> store = std::make_shared<AnalysisStore>(
        config_.get_int("store.ttl_ms", 6LL * 60 * 60 * 1000));
    if (!store->open(path)) {
        // The pipeline is complete without persistence
        LOG_WARN("[App] Analysis store unavailable, continuing without it");
        return true;
    }
    store->cleanup_expired();
    store_ = store;
    return true;
}

bool Application::setup_pipeline() {
    PipelineConfig pipeline = PipelineConfig::from_config(config_);
    coordinator_.reset(new ProcessingCoordinator(pipeline, counter_, store_));
    return coordinator_->init();
}

bool Application::init(int argc, char* argv[]) {
    if (!parse_args(argc, argv)) {
        return false;
    }

    if (!config_file_.empty()) {
        if (!config_.load_file(config_file_)) {
            std::cerr << "Failed to load config from " << config_file_ << "\n";
            exit_code_ = EXIT_USAGE;
            return false;
        }
    }
    setup_logging();
    LOG_DEBUG("%s v%s starting", AppInfo::NAME, AppInfo::VERSION);

    if (!setup_tokens()) {
        exit_code_ = EXIT_JOB_FAILED;
        return false;
    }
    if (list_models_) {
        return true;
    }
    if (!setup_store() || !setup_pipeline()) {
        exit_code_ = EXIT_JOB_FAILED;
        return false;
    }
    return true;
}

int Application::run() {
    return list_models_ ? run_list_models() : run_document();
}

int Application::run_list_models() {
    Json j;
    j["models"] = counter_->supported_models();
    j["stats"] = counter_->stats();
    std::cout << j.dump(2) << std::endl;
    return EXIT_OK;
}

int Application::run_document() {
    const PipelineConfig& pipeline = coordinator_->config();

    SourceDocument doc;
    doc.name = base_name(input_file_);
    doc.mime_type = mime_type_.empty() ? mime_type_for_path(input_file_) : mime_type_;
    if (!read_input(input_file_, pipeline.max_file_size, doc.bytes)) {
        std::cerr << "Cannot read " << input_file_ << "\n";
        return EXIT_USAGE;
    }

    ProcessingOptions options;
    options.model = model_.empty() ? pipeline.default_model : model_;
    options.max_tokens_per_chunk = max_tokens_ >= 0 ? static_cast<size_t>(max_tokens_)
                                                    : pipeline.default_max_tokens;
    options.overlap_tokens = pipeline.default_overlap_tokens;
    options.include_text = include_text_;

    Result<ProcessingResult> result = coordinator_->process(doc, options);
    if (!result.success) {
        print_error(result.error);
        return EXIT_JOB_FAILED;
    }

    if (recommend_) {
        Result<RecommendationSet> rec = counter_->recommend_models(result.value.extraction.text, use_case_);
        if (!rec.success) {
            rec.error.job_id = result.value.job_id;
            print_error(rec.error);
            return EXIT_JOB_FAILED;
        }
        Json j;
        j["success"] = true;
        j["jobId"] = result.value.job_id;
        j["recommendations"] = rec.value.to_json();
        std::cout << j.dump(2) << std::endl;
        return EXIT_OK;
    }

    Json j = result.value.to_json(include_text_);
    j["success"] = true;
    std::cout << j.dump(2) << std::endl;
    return EXIT_OK;
}

void Application::shutdown() {
    if (coordinator_) {
        coordinator_->shutdown();
        LOG_DEBUG("[App] Coordinator stats: %s", coordinator_->stats().to_json().dump().c_str());
        coordinator_.reset();
    }
    if (store_) {
        store_->close();
        store_.reset();
    }
}

} // namespace docpipe
