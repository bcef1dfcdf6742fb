/*
 * docpipe C++17 - Processing coordinator implementation
 */
#include <docpipe/processing/coordinator.hpp>
#include <docpipe/core/logger.hpp>
#include <docpipe/core/utils.hpp>
#include <algorithm>
#include <cstdio>
#include <unistd.h>

namespace docpipe {

namespace {

struct ExtractionOutput {
    Result<ExtractionResult> result;
    bool from_cache;

    ExtractionOutput() : from_cache(false) {}
};

struct AnalysisOutput {
    Result<ChunkingResult> chunking;
    TokenAnalysis analysis;
};

ValidationPolicy make_policy(const PipelineConfig& config) {
    ValidationPolicy policy;
    policy.max_file_size = config.max_file_size;
    return policy;
}

size_t read_rss_bytes() {
    FILE* f = fopen("/proc/self/statm", "r");
    if (!f) return 0;
    unsigned long size = 0, resident = 0;
    int n = fscanf(f, "%lu %lu", &size, &resident);
    fclose(f);
    if (n != 2) return 0;
    return static_cast<size_t>(resident) * static_cast<size_t>(sysconf(_SC_PAGESIZE));
}

template<typename T>
Result<T> fail_job(const std::string& job_id, ProcessingError error) {
    error.job_id = job_id;
    return Result<T>::fail(error);
}

template<typename T>
Result<T> fail_job(const std::string& job_id, ErrorKind kind, const std::string& message) {
    return Result<T>::fail(ProcessingError(kind, message, job_id));
}

} // anonymous namespace

// ============================================================================
// Configuration / serialization
// ============================================================================

PipelineConfig PipelineConfig::from_config(const Config& cfg) {
    PipelineConfig c;
    c.max_concurrent_jobs = static_cast<size_t>(std::max<int64_t>(1,
        cfg.get_int("pipeline.max_concurrent_jobs", static_cast<int64_t>(c.max_concurrent_jobs))));
    c.job_timeout_ms = cfg.get_int("pipeline.job_timeout_ms", c.job_timeout_ms);
    c.extraction_timeout_ms = cfg.get_int("pipeline.extraction_timeout_ms", c.extraction_timeout_ms);
    c.chunking_timeout_ms = cfg.get_int("pipeline.chunking_timeout_ms", c.chunking_timeout_ms);
    c.max_file_size = static_cast<size_t>(std::max<int64_t>(1,
        cfg.get_int("pipeline.max_file_size", static_cast<int64_t>(c.max_file_size))));
    c.temp_dir = cfg.get_string("pipeline.temp_dir", c.temp_dir);
    c.temp_ttl_ms = cfg.get_int("pipeline.temp_ttl_ms", c.temp_ttl_ms);
    c.sweep_interval_ms = std::max<int64_t>(1000, cfg.get_int("pipeline.sweep_interval_ms", c.sweep_interval_ms));
    c.cache_capacity = static_cast<size_t>(std::max<int64_t>(1,
        cfg.get_int("cache.capacity", static_cast<int64_t>(c.cache_capacity))));
    c.cache_ttl_ms = cfg.get_int("cache.ttl_ms", c.cache_ttl_ms);
    c.default_max_tokens = static_cast<size_t>(std::max<int64_t>(0,
        cfg.get_int("chunker.default_max_tokens", static_cast<int64_t>(c.default_max_tokens))));
    c.default_overlap_tokens = static_cast<size_t>(std::max<int64_t>(0,
        cfg.get_int("chunker.overlap_tokens", static_cast<int64_t>(c.default_overlap_tokens))));
    c.default_model = cfg.get_string("tokens.default_model", c.default_model);
    return c;
}

Json ProcessingResult::to_json(bool include_text) const {
    Json j;
    j["jobId"] = job_id;
    j["fileName"] = file_name;
    j["format"] = format_name(extraction.format);

    Json ex;
    if (include_text) ex["text"] = extraction.text;
    ex["metadata"] = extraction.metadata;
    ex["truncated"] = extraction.truncated;
    ex["fromCache"] = extraction_from_cache;
    j["extraction"] = ex;

    j["analysis"] = analysis.to_json();
    j["analysisFromStore"] = analysis_from_store;
    j["chunking"] = chunking.to_json(include_text);
    j["elapsedMs"] = elapsed_ms;
    return j;
}

Json CoordinatorStats::to_json() const {
    Json j;
    j["activeJobs"] = active_jobs;
    j["maxConcurrentJobs"] = max_concurrent_jobs;
    j["uptimeMs"] = uptime_ms;
    j["memoryRssBytes"] = memory_rss_bytes;
    j["completed"] = completed;
    j["failed"] = failed;
    j["rejected"] = rejected;
    j["timedOut"] = timed_out;
    j["tempFiles"] = temp_files;
    j["cache"] = cache.to_json();
    return j;
}

// ============================================================================
// JobSlot
// ============================================================================

JobSlot::JobSlot(std::atomic<size_t>& active, size_t ceiling) : active_(active), acquired_(false) {
    size_t current = active_.load();
    while (current < ceiling) {
        if (active_.compare_exchange_weak(current, current + 1)) {
            acquired_ = true;
            break;
        }
    }
}

JobSlot::~JobSlot() {
    if (acquired_) active_.fetch_sub(1);
}

// ============================================================================
// ProcessingCoordinator
// ============================================================================

ProcessingCoordinator::ProcessingCoordinator(const PipelineConfig& config,
                                             std::shared_ptr<const TokenCounter> counter,
                                             std::shared_ptr<AnalysisStore> store)
    : config_(config)
    , counter_(counter)
    , store_(store)
    , validator_(make_policy(config))
    , temp_store_(config.temp_dir)
    , cache_(config.cache_capacity, config.cache_ttl_ms)
    , chunker_(*counter)
    , active_(0), completed_(0), failed_(0), rejected_(0), timed_out_(0)
    , started_at_(monotonic_ms())
    , stopping_(false) {}

ProcessingCoordinator::~ProcessingCoordinator() {
    shutdown();
}

bool ProcessingCoordinator::init() {
    if (!temp_store_.init()) {
        return false;
    }
    temp_store_.sweep(config_.temp_ttl_ms);

    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    stopping_ = false;
    if (!sweeper_.joinable()) {
        sweeper_ = std::thread(&ProcessingCoordinator::sweeper_loop, this);
    }
    LOG_INFO("[Coordinator] Ready: max %zu concurrent jobs, job timeout %lld ms",
             config_.max_concurrent_jobs, static_cast<long long>(config_.job_timeout_ms));
    return true;
}

void ProcessingCoordinator::shutdown() {
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        stopping_ = true;
    }
    sweeper_cv_.notify_all();
    if (sweeper_.joinable()) {
        sweeper_.join();
    }
    runner_.join_all();
    temp_store_.sweep(config_.temp_ttl_ms);
}

void ProcessingCoordinator::sweeper_loop() {
    std::unique_lock<std::mutex> lock(sweeper_mutex_);
    while (!stopping_) {
        sweeper_cv_.wait_for(lock, std::chrono::milliseconds(config_.sweep_interval_ms),
                             [this]() { return stopping_; });
        if (stopping_) break;
        lock.unlock();
        sweep_expired();
        lock.lock();
    }
}

size_t ProcessingCoordinator::sweep_expired() {
    size_t removed = temp_store_.sweep(config_.temp_ttl_ms);
    cache_.purge_expired();
    runner_.reap();
    if (store_) store_->cleanup_expired();
    return removed;
}

CoordinatorStats ProcessingCoordinator::stats() const {
    CoordinatorStats s;
    s.active_jobs = active_.load();
    s.max_concurrent_jobs = config_.max_concurrent_jobs;
    s.uptime_ms = monotonic_ms() - started_at_;
    s.memory_rss_bytes = read_rss_bytes();
    s.completed = completed_.load();
    s.failed = failed_.load();
    s.rejected = rejected_.load();
    s.timed_out = timed_out_.load();
    s.temp_files = temp_store_.count();
    s.cache = cache_.stats();
    return s;
}

Result<ProcessingResult> ProcessingCoordinator::process(const SourceDocument& doc,
                                                        const ProcessingOptions& options) {
    const int64_t start = monotonic_ms();
    const std::string job_id = generate_uuid();

    JobSlot slot(active_, config_.max_concurrent_jobs);
    if (!slot.acquired()) {
        rejected_++;
        LOG_WARN("[Coordinator] Job %s rejected: %zu jobs in flight",
                 job_id.c_str(), config_.max_concurrent_jobs);
        return fail_job<ProcessingResult>(job_id, ErrorKind::CAPACITY, "Server busy, try again later");
    }

    LOG_INFO("[Coordinator] Job %s started: '%s' (%zu bytes, %s)", job_id.c_str(),
             sanitize_file_name(doc.name).c_str(), doc.size(), doc.mime_type.c_str());

    Result<ProcessingResult> r = run_job(job_id, doc, options, start + config_.job_timeout_ms);
    const int64_t elapsed = monotonic_ms() - start;

    if (r.success) {
        completed_++;
        r.value.elapsed_ms = elapsed;
        LOG_INFO("[Coordinator] Job %s completed in %lld ms: %zu chunks", job_id.c_str(),
                 static_cast<long long>(elapsed), r.value.chunking.chunks.size());
    } else if (r.error.kind == ErrorKind::TIMEOUT) {
        timed_out_++;
        LOG_WARN("[Coordinator] Job %s timed out after %lld ms: %s", job_id.c_str(),
                 static_cast<long long>(elapsed), r.error.message.c_str());
    } else {
        failed_++;
        LOG_WARN("[Coordinator] Job %s failed (%s): %s", job_id.c_str(),
                 error_kind_name(r.error.kind), r.error.message.c_str());
    }
    return r;
}

Result<ProcessingResult> ProcessingCoordinator::run_job(const std::string& job_id,
                                                        const SourceDocument& doc,
                                                        const ProcessingOptions& options,
                                                        int64_t deadline) {
    ChunkerOptions chunk_options;
    chunk_options.max_tokens_per_chunk = options.max_tokens_per_chunk;
    chunk_options.overlap_tokens = options.overlap_tokens;
    chunk_options.model = options.model;

    std::string error;
    if (!DocumentChunker::check_options(chunk_options, error)) {
        return fail_job<ProcessingResult>(job_id, ErrorKind::CHUNKING, error);
    }

    Result<DocumentFormat> validated = validator_.validate(doc);
    if (!validated.success) {
        return fail_job<ProcessingResult>(job_id, validated.error);
    }
    const DocumentFormat format = validated.value;
    const std::string file_hash = sha256_hex(doc.bytes);

    std::string temp_path;
    if (!temp_store_.create(job_id, doc.bytes, temp_path)) {
        return fail_job<ProcessingResult>(job_id, ErrorKind::EXTRACTION, "Failed to stage document");
    }
    TempFileGuard guard(temp_store_, temp_path);

    ProcessingResult result;
    result.job_id = job_id;
    result.file_name = sanitize_file_name(doc.name);

    Result<ExtractionResult> extracted = extract_step(job_id, temp_path,
        ExtractionCache::key_for_hash(file_hash, format), format, deadline, result.extraction_from_cache);
    if (!extracted.success) {
        return fail_job<ProcessingResult>(job_id, extracted.error);
    }
    result.extraction = extracted.value;

    Result<std::string> clean = sanitizer_.sanitize(result.extraction.text);
    if (!clean.success) {
        return fail_job<ProcessingResult>(job_id, clean.error);
    }
    if (trim(clean.value).empty()) {
        return fail_job<ProcessingResult>(job_id, ErrorKind::EXTRACTION, "No text left after sanitization");
    }
    result.extraction.text = clean.value;

    // Analysis reuse by content hash
    const std::string model = counter_->registry().canonical_name(options.model);
    AnalysisRecord stored;
    const bool have_stored = store_ && store_->get(file_hash, model,
        static_cast<int64_t>(options.max_tokens_per_chunk), stored);

    const int64_t remaining = deadline - monotonic_ms();
    if (remaining <= 0) {
        return fail_job<ProcessingResult>(job_id, ErrorKind::TIMEOUT, "Job deadline exceeded before chunking");
    }
    const int64_t timeout = std::min(config_.chunking_timeout_ms, remaining);

    std::shared_ptr<const std::string> text = std::make_shared<std::string>(result.extraction.text);
    std::shared_ptr<const TokenCounter> counter = counter_;
    const DocumentChunker* chunker = &chunker_;
    std::function<AnalysisOutput(const CancelToken&)> work =
        [text, counter, chunker, chunk_options, model, have_stored](const CancelToken& cancel) {
            AnalysisOutput out;
            if (!have_stored) out.analysis = counter->analyze(*text, model);
            out.chunking = chunker->chunk(*text, chunk_options, &cancel);
            return out;
        };

    AnalysisOutput analysis;
    DeadlineOutcome outcome = runner_.run(timeout, work, analysis, error);
    if (outcome == DeadlineOutcome::TIMED_OUT) {
        return fail_job<ProcessingResult>(job_id, ErrorKind::TIMEOUT,
            "Chunking timed out after " + std::to_string(timeout) + " ms");
    }
    if (outcome == DeadlineOutcome::FAILED) {
        return fail_job<ProcessingResult>(job_id, ErrorKind::CHUNKING, "Chunking failed: " + error);
    }
    if (!analysis.chunking.success) {
        return fail_job<ProcessingResult>(job_id, analysis.chunking.error);
    }

    result.chunking = analysis.chunking.value;
    if (have_stored) {
        result.analysis = stored.analysis;
        result.analysis_from_store = true;
    } else {
        result.analysis = analysis.analysis;
        if (store_) {
            AnalysisRecord record;
            record.file_hash = file_hash;
            record.model = model;
            record.max_tokens = static_cast<int64_t>(options.max_tokens_per_chunk);
            record.analysis = result.analysis;
            record.chunk_count = static_cast<int64_t>(result.chunking.chunks.size());
            record.stats = result.chunking.stats.to_json();
            if (!store_->put(record)) {
                LOG_WARN("[Coordinator] Job %s: analysis not persisted", job_id.c_str());
            }
        }
    }
    return Result<ProcessingResult>::ok(result);
}

Result<ExtractionResult> ProcessingCoordinator::extract_step(const std::string& job_id,
                                                             const std::string& temp_path,
                                                             const std::string& cache_key,
                                                             DocumentFormat format,
                                                             int64_t deadline,
                                                             bool& from_cache) {
    const int64_t remaining = deadline - monotonic_ms();
    if (remaining <= 0) {
        return fail_job<ExtractionResult>(job_id, ErrorKind::TIMEOUT, "Job deadline exceeded before extraction");
    }
    const int64_t timeout = std::min(config_.extraction_timeout_ms, remaining);

    ExtractFunction hook = extract_fn_;
    std::function<ExtractionOutput(const CancelToken&)> work =
        [this, temp_path, cache_key, format, hook](const CancelToken& cancel) {
            ExtractionOutput out;
            ExtractionResult cached;
            if (cache_.get(cache_key, cached)) {
                out.result = Result<ExtractionResult>::ok(cached);
                out.from_cache = true;
                return out;
            }

            std::string bytes;
            if (!temp_store_.read(temp_path, bytes)) {
                out.result = Result<ExtractionResult>::fail(ErrorKind::EXTRACTION, "Failed to read staged document");
                return out;
            }
            out.result = hook ? hook(bytes, format, cancel)
                              : extract_document(bytes, format, limits_, cancel);
            if (out.result.success && !cancel.cancelled()) {
                cache_.put(cache_key, out.result.value);
            }
            return out;
        };

    ExtractionOutput output;
    std::string error;
    DeadlineOutcome outcome = runner_.run(timeout, work, output, error);
    if (outcome == DeadlineOutcome::TIMED_OUT) {
        return fail_job<ExtractionResult>(job_id, ErrorKind::TIMEOUT,
            "Extraction timed out after " + std::to_string(timeout) + " ms");
    }
    if (outcome == DeadlineOutcome::FAILED) {
        return fail_job<ExtractionResult>(job_id, ErrorKind::EXTRACTION, "Extraction failed: " + error);
    }
    from_cache = output.from_cache;
    if (from_cache) {
        LOG_DEBUG("[Coordinator] Job %s: extraction served from cache", job_id.c_str());
    }
    return output.result;
}

} // namespace docpipe
