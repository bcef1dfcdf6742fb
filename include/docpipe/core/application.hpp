/*
 * docpipe C++17 - Command line application
 *
 * Singleton owning the configuration, token counter, optional analysis
 * store and the processing coordinator for one CLI invocation.
 */
#ifndef docpipe_CORE_APPLICATION_HPP
#define docpipe_CORE_APPLICATION_HPP

#include <docpipe/core/config.hpp>
#include <docpipe/processing/coordinator.hpp>
#include <docpipe/store/analysis_store.hpp>
#include <docpipe/tokens/token_counter.hpp>
#include <memory>
#include <string>

namespace docpipe {

struct AppInfo {
    static constexpr const char* NAME = "docpipe";
    static constexpr const char* VERSION = "1.0.0";
};

// Exit codes
enum {
    EXIT_OK = 0,
    EXIT_JOB_FAILED = 1,
    EXIT_USAGE = 2
};

// MIME type for a file name's extension, empty when unknown
std::string mime_type_for_path(const std::string& path);

class Application {
public:
    static Application& instance();

    // False when the process should exit right away with exit_code()
    bool init(int argc, char* argv[]);
    int run();
    void shutdown();

    int exit_code() const { return exit_code_; }

    const Config& config() const { return config_; }

private:
    Application();
    Application(const Application&);
    Application& operator=(const Application&);

    bool parse_args(int argc, char* argv[]);
    void setup_logging();
    bool setup_tokens();
    bool setup_store();
    bool setup_pipeline();

    int run_list_models();
    int run_document();

    Config config_;
    std::string config_file_;
    std::string input_file_;
    std::string mime_type_;
    std::string model_;
    std::string use_case_;
    int64_t max_tokens_;
    bool include_text_;
    bool list_models_;
    bool recommend_;
    int exit_code_;

    std::shared_ptr<const TokenCounter> counter_;
    std::shared_ptr<AnalysisStore> store_;
    std::unique_ptr<ProcessingCoordinator> coordinator_;
};

} // namespace docpipe

#endif // docpipe_CORE_APPLICATION_HPP
