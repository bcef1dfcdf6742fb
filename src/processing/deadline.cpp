#include <docpipe/processing/deadline.hpp>
#include <docpipe/core/logger.hpp>

namespace docpipe {

void DeadlineRunner::park(std::thread thread, std::shared_ptr<std::atomic<bool> > done) {
    std::lock_guard<std::mutex> lock(mutex_);
    Parked p;
    p.thread = std::move(thread);
    p.done = done;
    parked_.push_back(std::move(p));
    LOG_DEBUG("[Deadline] Worker parked after timeout (%zu parked)", parked_.size());
}

size_t DeadlineRunner::reap() {
    std::vector<Parked> finished;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::vector<Parked>::iterator it = parked_.begin(); it != parked_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(*it));
                it = parked_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (size_t i = 0; i < finished.size(); ++i) {
        finished[i].thread.join();
    }
    return finished.size();
}

size_t DeadlineRunner::parked() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return parked_.size();
}

void DeadlineRunner::join_all() {
    std::vector<Parked> all;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        all.swap(parked_);
    }
    if (!all.empty()) {
        LOG_INFO("[Deadline] Waiting for %zu cancelled workers", all.size());
    }
    for (size_t i = 0; i < all.size(); ++i) {
        if (all[i].thread.joinable()) all[i].thread.join();
    }
}

} // namespace docpipe
