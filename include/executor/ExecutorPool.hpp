#pragma once

#include "executor/ComparisonTask.hpp"
#include "executor/Dispatcher.hpp"

#include <atomic>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <queue>
#include <thread>
#include <vector>

namespace md::executor {

class TaskExecutor;

struct ExecutorOptions {
    std::filesystem::path workerBinary;
    unsigned int maxPoolSize = 8;
};

// Fixed set of worker processes fed from one FIFO queue. Each executor is
// driven by its own slot thread; a crashed executor fails the task it held
// and is replaced unless the pool is closing.
class ExecutorPool final : public Dispatcher {
public:
    ExecutorPool(ExecutorOptions options, unsigned int requestedSize);
    ~ExecutorPool() override;

    ExecutorPool(const ExecutorPool&) = delete;
    ExecutorPool& operator=(const ExecutorPool&) = delete;

    std::future<types::ComparisonResult> submit(types::ComparisonRequest request) override;

    void shutdown() override;

    [[nodiscard]] static unsigned int clampSize(unsigned int requested, unsigned int ceiling);

    [[nodiscard]] unsigned int size() const noexcept { return size_; }
    [[nodiscard]] unsigned int liveExecutors() const;
    [[nodiscard]] size_t queueDepth() const;
    [[nodiscard]] uint64_t restarts() const noexcept { return restarts_.load(); }
    [[nodiscard]] bool isClosed() const noexcept { return closed_.load(); }

private:
    ExecutorOptions options_;
    unsigned int size_;

    std::vector<std::thread> threads_;
    std::vector<std::shared_ptr<TaskExecutor>> executors_;  // one per slot, guarded by mutex

    std::condition_variable cv;
    mutable std::mutex mutex;
    std::queue<std::shared_ptr<ComparisonTask>> queue;

    std::mutex shutdownMutex_;
    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> nextTaskId_{1};
    std::atomic<uint64_t> restarts_{0};

    std::shared_ptr<TaskExecutor> spawnExecutor(unsigned int slot) const;
    void replaceExecutor(unsigned int slot);
    void slotLoop(unsigned int slot);
};

}
