#include <gtest/gtest.h>
#include <docpipe/processing/deadline.hpp>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace docpipe;

TEST(DeadlineRunnerTest, CompletesWithinDeadline) {
    DeadlineRunner runner;
    int out = 0;
    std::string error;
    std::function<int(const CancelToken&)> work = [](const CancelToken&) { return 42; };

    EXPECT_EQ(runner.run<int>(1000, work, out, error), DeadlineOutcome::COMPLETED);
    EXPECT_EQ(out, 42);
    EXPECT_TRUE(error.empty());
    EXPECT_EQ(runner.parked(), 0u);
}

TEST(DeadlineRunnerTest, ThrowingWorkReportsFailure) {
    DeadlineRunner runner;
    int out = 7;
    std::string error;
    std::function<int(const CancelToken&)> work = [](const CancelToken&) -> int {
        throw std::runtime_error("bad input");
    };

    EXPECT_EQ(runner.run<int>(1000, work, out, error), DeadlineOutcome::FAILED);
    EXPECT_EQ(error, "bad input");
    EXPECT_EQ(out, 7);
}

TEST(DeadlineRunnerTest, TimeoutCancelsAndParksWorker) {
    DeadlineRunner runner;
    std::shared_ptr<std::atomic<bool> > saw_cancel = std::make_shared<std::atomic<bool> >(false);
    std::function<int(const CancelToken&)> work = [saw_cancel](const CancelToken& cancel) {
        while (!cancel.cancelled()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(2));
        }
        saw_cancel->store(true);
        return 0;
    };

    int out = 0;
    std::string error;
    EXPECT_EQ(runner.run<int>(20, work, out, error), DeadlineOutcome::TIMED_OUT);
    EXPECT_NE(error.find("20 ms"), std::string::npos);

    runner.join_all();
    EXPECT_TRUE(saw_cancel->load());
    EXPECT_EQ(runner.parked(), 0u);
}

TEST(DeadlineRunnerTest, ReapJoinsFinishedWorkers) {
    DeadlineRunner runner;
    std::function<int(const CancelToken&)> work = [](const CancelToken&) {
        std::this_thread::sleep_for(std::chrono::milliseconds(60));
        return 1;
    };

    int out = 0;
    std::string error;
    EXPECT_EQ(runner.run<int>(5, work, out, error), DeadlineOutcome::TIMED_OUT);
    EXPECT_EQ(runner.parked(), 1u);

    std::this_thread::sleep_for(std::chrono::milliseconds(150));
    EXPECT_EQ(runner.reap(), 1u);
    EXPECT_EQ(runner.parked(), 0u);
}
