/*
 * docpipe C++17 - Document ingestion and chunking CLI
 *
 * Usage:
 *   ./docpipe [--config cfg.json] [--model m] [--max-tokens n] <file>
 */
#include <docpipe/core/application.hpp>

int main(int argc, char* argv[]) {
    auto& app = docpipe::Application::instance();

    if (!app.init(argc, argv)) {
        return app.exit_code();
    }

    int result = app.run();
    app.shutdown();

    return result;
}
