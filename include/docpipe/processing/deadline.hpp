/*
 * docpipe C++17 - Deadline runner
 *
 * Races a unit of work on a worker thread against a timer. On timeout the
 * worker's CancelToken is set and the thread is parked until it notices;
 * parked threads are joined by reap() or when the runner is destroyed.
 *
 * Work functions may outlive the call that started them, so they must
 * capture what they use by value (or own it through shared_ptr).
 */
#ifndef docpipe_PROCESSING_DEADLINE_HPP
#define docpipe_PROCESSING_DEADLINE_HPP

#include <docpipe/core/types.hpp>
#include <atomic>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace docpipe {

enum class DeadlineOutcome {
    COMPLETED,
    TIMED_OUT,
    FAILED          // the work threw
};

class DeadlineRunner {
public:
    DeadlineRunner() {}
    ~DeadlineRunner() { join_all(); }

    template<typename T>
    DeadlineOutcome run(int64_t timeout_ms,
                        const std::function<T(const CancelToken&)>& work,
                        T& out,
                        std::string& error);

    // Join parked workers that have finished
    size_t reap();
    size_t parked() const;

    void join_all();

private:
    DeadlineRunner(const DeadlineRunner&);
    DeadlineRunner& operator=(const DeadlineRunner&);

    struct Parked {
        std::thread thread;
        std::shared_ptr<std::atomic<bool> > done;
    };

    void park(std::thread thread, std::shared_ptr<std::atomic<bool> > done);

    mutable std::mutex mutex_;
    std::vector<Parked> parked_;
};

template<typename T>
DeadlineOutcome DeadlineRunner::run(int64_t timeout_ms,
                                    const std::function<T(const CancelToken&)>& work,
                                    T& out,
                                    std::string& error) {
    reap();

    std::shared_ptr<CancelToken> token = std::make_shared<CancelToken>();
    std::shared_ptr<std::promise<T> > promise = std::make_shared<std::promise<T> >();
    std::shared_ptr<std::atomic<bool> > done = std::make_shared<std::atomic<bool> >(false);
    std::future<T> future = promise->get_future();

    std::function<T(const CancelToken&)> fn = work;
    std::thread worker([fn, token, promise, done]() {
        try {
            promise->set_value(fn(*token));
        } catch (...) {
            // Forwarded to the waiting caller through the future
            promise->set_exception(std::current_exception());
        }
        done->store(true);
    });

    if (timeout_ms < 0) timeout_ms = 0;
    if (future.wait_for(std::chrono::milliseconds(timeout_ms)) != std::future_status::ready) {
        token->cancel();
        park(std::move(worker), done);
        error = "deadline of " + std::to_string(timeout_ms) + " ms exceeded";
        return DeadlineOutcome::TIMED_OUT;
    }

    worker.join();
    try {
        out = future.get();
    } catch (const std::exception& e) {
        error = e.what();
        return DeadlineOutcome::FAILED;
    } catch (...) {
        error = "unknown exception";
        return DeadlineOutcome::FAILED;
    }
    return DeadlineOutcome::COMPLETED;
}

} // namespace docpipe

#endif // docpipe_PROCESSING_DEADLINE_HPP
