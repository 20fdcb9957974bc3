#include <gtest/gtest.h>
#include "executor/ExecutorPool.hpp"
#include "executor/TaskExecutor.hpp"
#include "executor/errors.hpp"
#include "support/TempTree.hpp"

#include <chrono>
#include <thread>
#include <vector>

using namespace md::executor;
using namespace md::types;
using md::test::TempTree;
using namespace std::chrono_literals;

namespace {

template <typename Pred>
bool eventually(Pred pred, const std::chrono::milliseconds timeout = 5s) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(10ms);
    }
    return pred();
}

}

class ExecutorPoolTest : public ::testing::Test {
protected:
    TempTree tree;

    void SetUp() override {
        tree.write("ref/notes.txt", "one\ntwo\nthree\n");
        tree.write("a/notes.txt", "one\ntwo\nthree\n");
        tree.write("b/notes.txt", "one\n2\nthree\nfour\n");
    }

    ComparisonRequest request(const std::string& label) const {
        return {tree.path("ref/notes.txt"), tree.path(label), "notes.txt", label, false, std::nullopt};
    }

    static ExecutorOptions worker() { return {MD_TEST_WORKER_BINARY, 8}; }
};

TEST_F(ExecutorPoolTest, ClampSizeStaysWithinBounds) {
    EXPECT_EQ(ExecutorPool::clampSize(0, 8), 1u);
    EXPECT_EQ(ExecutorPool::clampSize(3, 8), 3u);
    EXPECT_EQ(ExecutorPool::clampSize(64, 8), 8u);
    EXPECT_EQ(ExecutorPool::clampSize(4, 0), 1u);
}

TEST_F(ExecutorPoolTest, RunsComparisonsInWorkerProcesses) {
    ExecutorPool pool(worker(), 2);
    EXPECT_EQ(pool.size(), 2u);
    EXPECT_EQ(pool.liveExecutors(), 2u);

    auto fa = pool.submit(request("a"));
    auto fb = pool.submit(request("b"));
    auto fc = pool.submit(request("c"));

    const auto a = fa.get();
    EXPECT_TRUE(a.exists);
    EXPECT_EQ(a.counts, (DiffCounts{0, 0}));

    const auto b = fb.get();
    EXPECT_TRUE(b.exists);
    EXPECT_EQ(b.counts, (DiffCounts{2, 1}));
    EXPECT_EQ(b.label, "b");

    const auto c = fc.get();
    EXPECT_FALSE(c.exists);

    EXPECT_EQ(pool.restarts(), 0u);
}

TEST_F(ExecutorPoolTest, ManyTasksOnFewerExecutors) {
    ExecutorPool pool(worker(), 3);
    std::vector<std::future<ComparisonResult>> futures;
    for (int i = 0; i < 24; ++i) futures.push_back(pool.submit(request(i % 2 ? "a" : "b")));

    for (int i = 0; i < 24; ++i) {
        const auto r = futures[i].get();
        EXPECT_EQ(r.totalChangedLines, i % 2 ? 0u : 3u);
    }
}

TEST_F(ExecutorPoolTest, CrashedExecutorFailsTaskAndIsReplaced) {
    ExecutorPool pool({"/bin/true", 8}, 1);

    auto f = pool.submit(request("a"));
    EXPECT_THROW(f.get(), ExecutorError);
    EXPECT_TRUE(eventually([&] { return pool.restarts() >= 1; }));
}

TEST_F(ExecutorPoolTest, MalformedResponseIsAnExecutorFault) {
    // cat echoes the compare request back, which is not a valid response
    ExecutorPool pool({"/bin/cat", 8}, 1);

    auto f = pool.submit(request("a"));
    EXPECT_THROW(f.get(), ExecutorError);
    EXPECT_TRUE(eventually([&] { return pool.restarts() >= 1; }));
}

TEST_F(ExecutorPoolTest, MissingBinaryFailsTasksWithoutHanging) {
    ExecutorPool pool({tree.path("no-such-worker"), 8}, 1);
    auto f = pool.submit(request("a"));
    EXPECT_THROW(f.get(), ExecutorError);
}

TEST_F(ExecutorPoolTest, OneExecutorServesSequentialTasks) {
    ExecutorPool pool(worker(), 1);
    EXPECT_EQ(pool.submit(request("b")).get().totalChangedLines, 3u);
    EXPECT_EQ(pool.submit(request("a")).get().totalChangedLines, 0u);
}

TEST_F(ExecutorPoolTest, SubmitAfterShutdownIsRejected) {
    ExecutorPool pool(worker(), 2);
    pool.shutdown();
    EXPECT_TRUE(pool.isClosed());
    EXPECT_EQ(pool.liveExecutors(), 0u);
    EXPECT_THROW((void)pool.submit(request("a")), PoolClosedError);
}

TEST_F(ExecutorPoolTest, ShutdownIsIdempotentAndAbandonsQueuedWork) {
    const auto silent = tree.write("silent-worker.sh", "#!/bin/sh\nexec sleep 3600\n");
    std::filesystem::permissions(silent, std::filesystem::perms::owner_all);

    ExecutorPool pool({silent, 8}, 1);
    auto first = pool.submit(request("a"));
    auto queued = pool.submit(request("b"));
    EXPECT_TRUE(eventually([&] { return pool.queueDepth() == 1; }));

    pool.shutdown();
    pool.shutdown();
    EXPECT_EQ(pool.queueDepth(), 0u);

    EXPECT_THROW(queued.get(), std::future_error);
    EXPECT_ANY_THROW(first.get());
}

TEST(TaskExecutorTest, ExecuteBeforeStartThrows) {
    TaskExecutor executor(MD_TEST_WORKER_BINARY, 0);
    EXPECT_THROW((void)executor.execute(1, ComparisonRequest{}), ExecutorError);
}
