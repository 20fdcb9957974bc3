#include "executor/ExecutorPool.hpp"
#include "executor/TaskExecutor.hpp"
#include "executor/errors.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <fmt/core.h>

using namespace md::executor;
using namespace md::types;
using namespace md::logging;

ExecutorPool::ExecutorPool(ExecutorOptions options, const unsigned int requestedSize)
    : options_(std::move(options)), size_(clampSize(requestedSize, options_.maxPoolSize)) {
    executors_.resize(size_);
    for (unsigned int slot = 0; slot < size_; ++slot) executors_[slot] = spawnExecutor(slot);
    for (unsigned int slot = 0; slot < size_; ++slot) threads_.emplace_back([this, slot] { slotLoop(slot); });

    LogRegistry::executor()->debug("[ExecutorPool] Started {} executors (requested {}) using {}",
                                   size_, requestedSize, options_.workerBinary.string());
}

ExecutorPool::~ExecutorPool() {
    shutdown();
}

unsigned int ExecutorPool::clampSize(const unsigned int requested, const unsigned int ceiling) {
    return std::clamp(requested, 1u, std::max(1u, ceiling));
}

std::future<ComparisonResult> ExecutorPool::submit(ComparisonRequest request) {
    auto task = std::make_shared<ComparisonTask>(nextTaskId_.fetch_add(1), std::move(request));
    auto future = task->promise.get_future();
    {
        std::scoped_lock lock(mutex);
        if (closed_.load()) throw PoolClosedError();
        queue.push(std::move(task));
    }
    cv.notify_one();
    return future;
}

void ExecutorPool::shutdown() {
    std::scoped_lock guard(shutdownMutex_);
    if (closed_.exchange(true) && threads_.empty()) return;

    {
        std::scoped_lock lock(mutex);
        // Queued tasks are abandoned; their futures observe broken_promise.
        std::queue<std::shared_ptr<ComparisonTask>> empty;
        std::swap(queue, empty);
        for (const auto& e : executors_) if (e) e->interrupt();
    }
    cv.notify_all();

    for (auto& t : threads_)
        if (t.joinable() && t.get_id() != std::this_thread::get_id()) t.join();
    threads_.clear();

    std::vector<std::shared_ptr<TaskExecutor>> remaining;
    {
        std::scoped_lock lock(mutex);
        remaining.swap(executors_);
    }
    for (const auto& e : remaining) if (e) e->terminate();

    LogRegistry::executor()->debug("[ExecutorPool] Shut down ({} restarts)", restarts_.load());
}

unsigned int ExecutorPool::liveExecutors() const {
    std::scoped_lock lock(mutex);
    return static_cast<unsigned int>(std::ranges::count_if(executors_, [](const auto& e) { return e && e->pid() > 0; }));
}

size_t ExecutorPool::queueDepth() const {
    std::scoped_lock lock(mutex);
    return queue.size();
}

std::shared_ptr<TaskExecutor> ExecutorPool::spawnExecutor(const unsigned int slot) const {
    try {
        auto executor = std::make_shared<TaskExecutor>(options_.workerBinary, slot);
        executor->start();
        return executor;
    } catch (const ExecutorError& e) {
        LogRegistry::executor()->error("[ExecutorPool] Could not start executor {}: {}", slot, e.what());
        return nullptr;
    }
}

void ExecutorPool::replaceExecutor(const unsigned int slot) {
    std::shared_ptr<TaskExecutor> old;
    {
        std::scoped_lock lock(mutex);
        if (closed_.load()) return;
        old = std::move(executors_[slot]);
    }
    if (old) old->terminate();

    auto fresh = spawnExecutor(slot);
    {
        std::scoped_lock lock(mutex);
        if (!closed_.load()) {
            executors_[slot] = fresh;
            if (fresh) {
                restarts_.fetch_add(1);
                LogRegistry::executor()->info("[ExecutorPool] Replaced executor {} (pid {})", slot, fresh->pid());
            }
            return;
        }
    }
    if (fresh) fresh->terminate();
}

void ExecutorPool::slotLoop(const unsigned int slot) {
    while (true) {
        std::shared_ptr<ComparisonTask> task;
        std::shared_ptr<TaskExecutor> executor;
        {
            std::unique_lock lock(mutex);
            cv.wait(lock, [this] { return closed_.load() || !queue.empty(); });
            if (closed_.load()) return;

            task = std::move(queue.front());
            queue.pop();
            executor = executors_[slot];
        }

        if (!executor) {
            replaceExecutor(slot);
            std::scoped_lock lock(mutex);
            executor = slot < executors_.size() ? executors_[slot] : nullptr;
        }
        if (!executor) {
            task->promise.set_exception(std::make_exception_ptr(
                ExecutorError(fmt::format("No executor available in slot {}", slot))));
            continue;
        }

        try {
            task->promise.set_value(executor->execute(task->id, task->request));
        } catch (const ComparisonError&) {
            task->promise.set_exception(std::current_exception());
        } catch (const std::exception& e) {
            // In-flight work is abandoned on shutdown; the task's future sees broken_promise.
            if (closed_.load()) return;

            LogRegistry::executor()->warn("[ExecutorPool] Executor {} failed: {}", slot, e.what());
            task->promise.set_exception(std::current_exception());
            replaceExecutor(slot);
        }
    }
}
