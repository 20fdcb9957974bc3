#include <gtest/gtest.h>
#include "watch/ReferenceWatcher.hpp"
#include "support/FakeDispatcher.hpp"
#include "support/TempTree.hpp"

#include <atomic>
#include <thread>

using namespace md::watch;
using namespace md::run;
using namespace md::config;
using namespace md::types;
using md::test::FakeDispatcher;
using md::test::TempTree;
using namespace std::chrono_literals;

namespace {

class CountingListener final : public RunListener {
public:
    std::atomic<int> published_{0};
    std::mutex mutex;
    std::optional<RunReport> last;

    void published(const RunReport& report) override {
        std::scoped_lock lock(mutex);
        last = report;
        ++published_;
    }
    void noMatchingGroup(const std::filesystem::path&) override {}
    void failed(const std::string&) override {}
};

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

class ReferenceWatcherTest : public ::testing::Test {
protected:
    TempTree tree;
    std::shared_ptr<CountingListener> listener = std::make_shared<CountingListener>();
    std::shared_ptr<RunCoordinator> coordinator;
    std::filesystem::path reference;

    void SetUp() override {
        reference = tree.write("a/f.txt", "1\n2\n");
        tree.write("b/f.txt", "1\n2\n");

        std::vector<DiffGroup> groups{DiffGroup{"g", false, {{"a", tree.path("a")}, {"b", tree.path("b")}}}};
        coordinator = std::make_shared<RunCoordinator>(
            std::make_shared<md::cache::ResultCache>(16),
            [](unsigned int) { return std::make_shared<FakeDispatcher>(); },
            [groups] { return groups; },
            6, listener);

        ASSERT_EQ(coordinator->run({std::nullopt, reference}).status, RunStatus::Completed);
        ASSERT_EQ(listener->published_.load(), 1);
    }

    static void touch(const std::filesystem::path& p) {
        std::filesystem::last_write_time(p, std::filesystem::last_write_time(p) + 2s);
    }
};

TEST_F(ReferenceWatcherTest, IdleWhenNothingChanges) {
    ReferenceWatcher watcher(coordinator, 10ms);
    watcher.start();
    std::this_thread::sleep_for(150ms);
    watcher.stop();

    EXPECT_EQ(watcher.triggeredRuns(), 0u);
    EXPECT_EQ(listener->published_.load(), 1);
}

TEST_F(ReferenceWatcherTest, TargetChangeTriggersFreshRun) {
    ReferenceWatcher watcher(coordinator, 10ms);
    watcher.start();
    std::this_thread::sleep_for(50ms);  // let the first snapshot settle

    tree.write("b/f.txt", "1\n2\n3\n");
    touch(tree.path("b/f.txt"));

    EXPECT_TRUE(eventually([&] { return listener->published_.load() >= 2; }));
    watcher.stop();

    EXPECT_GE(watcher.triggeredRuns(), 1u);
    std::scoped_lock lock(listener->mutex);
    ASSERT_TRUE(listener->last.has_value());
    ASSERT_EQ(listener->last->results.size(), 1u);
    EXPECT_EQ(listener->last->results[0].counts, (DiffCounts{1, 0}));
}

TEST_F(ReferenceWatcherTest, ReferenceChangeTriggersFreshRun) {
    ReferenceWatcher watcher(coordinator, 10ms);
    watcher.start();
    std::this_thread::sleep_for(50ms);  // let the first snapshot settle

    tree.write("a/f.txt", "1\n");
    touch(reference);

    EXPECT_TRUE(eventually([&] { return listener->published_.load() >= 2; }));
    watcher.stop();

    std::scoped_lock lock(listener->mutex);
    EXPECT_EQ(listener->last->results[0].counts, (DiffCounts{1, 0}));
}

TEST_F(ReferenceWatcherTest, StopIsIdempotent) {
    ReferenceWatcher watcher(coordinator, 10ms);
    watcher.start();
    EXPECT_TRUE(watcher.isRunning());
    watcher.stop();
    watcher.stop();
    EXPECT_FALSE(watcher.isRunning());
}

TEST_F(ReferenceWatcherTest, RejectsNonPositivePollInterval) {
    EXPECT_THROW(ReferenceWatcher(coordinator, 0ms), std::invalid_argument);
    EXPECT_THROW(ReferenceWatcher(coordinator, -5ms), std::invalid_argument);
}
