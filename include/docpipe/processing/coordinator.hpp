/*
 * docpipe C++17 - Processing coordinator
 *
 * Runs one document through validate -> extract -> sanitize -> analyze
 * -> chunk. Admits a bounded number of concurrent jobs (excess jobs are
 * rejected, never queued), enforces a job deadline plus per-step
 * deadlines, and owns one private temp file per job.
 */
#ifndef docpipe_PROCESSING_COORDINATOR_HPP
#define docpipe_PROCESSING_COORDINATOR_HPP

#include <docpipe/chunk/document_chunker.hpp>
#include <docpipe/core/config.hpp>
#include <docpipe/core/temp_store.hpp>
#include <docpipe/core/types.hpp>
#include <docpipe/extract/extraction_cache.hpp>
#include <docpipe/extract/extractor.hpp>
#include <docpipe/processing/deadline.hpp>
#include <docpipe/security/sanitizer.hpp>
#include <docpipe/security/validator.hpp>
#include <docpipe/store/analysis_store.hpp>
#include <docpipe/tokens/token_counter.hpp>
#include <atomic>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace docpipe {

struct PipelineConfig {
    size_t max_concurrent_jobs;         // admission ceiling
    int64_t job_timeout_ms;             // end-to-end deadline
    int64_t extraction_timeout_ms;
    int64_t chunking_timeout_ms;        // analysis + chunking
    size_t max_file_size;               // bytes
    std::string temp_dir;               // empty = <tmp>/docpipe_secure_temp
    int64_t temp_ttl_ms;
    int64_t sweep_interval_ms;
    size_t cache_capacity;
    int64_t cache_ttl_ms;
    size_t default_max_tokens;
    size_t default_overlap_tokens;
    std::string default_model;

    PipelineConfig()
        : max_concurrent_jobs(10)
        , job_timeout_ms(5 * 60 * 1000)
        , extraction_timeout_ms(60 * 1000)
        , chunking_timeout_ms(30 * 1000)
        , max_file_size(50 * 1024 * 1024)
        , temp_ttl_ms(30 * 60 * 1000)
        , sweep_interval_ms(5 * 60 * 1000)
        , cache_capacity(100)
        , cache_ttl_ms(30 * 60 * 1000)
        , default_max_tokens(6000)
        , default_overlap_tokens(200)
        , default_model("gpt-4") {}

    static PipelineConfig from_config(const Config& cfg);
};

struct ProcessingOptions {
    std::string model;
    size_t max_tokens_per_chunk;
    size_t overlap_tokens;
    bool include_text;          // full text in serialized output

    ProcessingOptions()
        : model("gpt-4"), max_tokens_per_chunk(6000), overlap_tokens(200), include_text(true) {}
};

struct ProcessingResult {
    std::string job_id;
    std::string file_name;              // sanitized
    ExtractionResult extraction;
    TokenAnalysis analysis;
    ChunkingResult chunking;
    int64_t elapsed_ms;
    bool extraction_from_cache;
    bool analysis_from_store;

    ProcessingResult() : elapsed_ms(0), extraction_from_cache(false), analysis_from_store(false) {}

    Json to_json(bool include_text) const;
};

struct CoordinatorStats {
    size_t active_jobs;
    size_t max_concurrent_jobs;
    int64_t uptime_ms;
    size_t memory_rss_bytes;
    uint64_t completed;
    uint64_t failed;
    uint64_t rejected;
    uint64_t timed_out;
    size_t temp_files;
    CacheStats cache;

    CoordinatorStats()
        : active_jobs(0), max_concurrent_jobs(0), uptime_ms(0), memory_rss_bytes(0)
        , completed(0), failed(0), rejected(0), timed_out(0), temp_files(0) {}

    Json to_json() const;
};

// Holds one admission slot for its lifetime
class JobSlot {
public:
    JobSlot(std::atomic<size_t>& active, size_t ceiling);
    ~JobSlot();

    bool acquired() const { return acquired_; }

private:
    JobSlot(const JobSlot&);
    JobSlot& operator=(const JobSlot&);

    std::atomic<size_t>& active_;
    bool acquired_;
};

class ProcessingCoordinator {
public:
    typedef std::function<Result<ExtractionResult>(const std::string& bytes,
                                                   DocumentFormat format,
                                                   const CancelToken& cancel)> ExtractFunction;

    // store may be null; the pipeline is complete without it
    ProcessingCoordinator(const PipelineConfig& config,
                          std::shared_ptr<const TokenCounter> counter,
                          std::shared_ptr<AnalysisStore> store = nullptr);
    ~ProcessingCoordinator();

    // Temp directory and background sweeper
    bool init();
    void shutdown();

    Result<ProcessingResult> process(const SourceDocument& doc, const ProcessingOptions& options);

    // Replaces the built-in extractors; used to inject slow or failing extraction
    void set_extract_function(ExtractFunction fn) { extract_fn_ = fn; }

    size_t sweep_expired();

    CoordinatorStats stats() const;
    size_t active_jobs() const { return active_.load(); }
    const PipelineConfig& config() const { return config_; }
    const TempStore& temp_store() const { return temp_store_; }

private:
    ProcessingCoordinator(const ProcessingCoordinator&);
    ProcessingCoordinator& operator=(const ProcessingCoordinator&);

    Result<ProcessingResult> run_job(const std::string& job_id, const SourceDocument& doc,
                                     const ProcessingOptions& options, int64_t deadline);
    Result<ExtractionResult> extract_step(const std::string& job_id, const std::string& temp_path,
                                          const std::string& cache_key, DocumentFormat format,
                                          int64_t deadline, bool& from_cache);
    void sweeper_loop();

    PipelineConfig config_;
    std::shared_ptr<const TokenCounter> counter_;
    std::shared_ptr<AnalysisStore> store_;
    Validator validator_;
    ContentSanitizer sanitizer_;
    ExtractionLimits limits_;
    TempStore temp_store_;
    ExtractionCache cache_;
    DocumentChunker chunker_;
    ExtractFunction extract_fn_;

    std::atomic<size_t> active_;
    std::atomic<uint64_t> completed_;
    std::atomic<uint64_t> failed_;
    std::atomic<uint64_t> rejected_;
    std::atomic<uint64_t> timed_out_;
    int64_t started_at_;

    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool stopping_;
    std::thread sweeper_;

    // Last member: destroyed first, so parked workers finish while the
    // members they reference are still alive
    DeadlineRunner runner_;
};

} // namespace docpipe

#endif // docpipe_PROCESSING_COORDINATOR_HPP
