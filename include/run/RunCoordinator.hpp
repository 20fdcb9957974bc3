#pragma once

#include "run/GroupResolver.hpp"
#include "run/RunReport.hpp"
#include "executor/Dispatcher.hpp"
#include "executor/ExecutorPool.hpp"
#include "cache/ResultCache.hpp"
#include "concurrency/CancellationToken.hpp"

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

namespace md::run {

// Orchestrates diff runs: one reference read per run, cache first, misses fanned
// out to a per-run dispatcher. Only the newest run ever publishes.
class RunCoordinator {
public:
    using DispatcherFactory = std::function<std::shared_ptr<executor::Dispatcher>(unsigned int size)>;
    using GroupsProvider = std::function<std::vector<config::DiffGroup>()>;

    RunCoordinator(std::shared_ptr<cache::ResultCache> cache,
                   DispatcherFactory dispatcherFactory,
                   GroupsProvider groups,
                   unsigned int maxWorkersPerRun = 6,
                   std::shared_ptr<RunListener> listener = nullptr);

    RunCoordinator(const RunCoordinator&) = delete;
    RunCoordinator& operator=(const RunCoordinator&) = delete;

    // Blocks until the run settles. Starting a run supersedes and cancels the previous one.
    RunOutcome run(const RunRequest& request,
                   const std::shared_ptr<concurrency::CancellationToken>& externalToken = nullptr);

    // Cancels the active run, if any. Its results are never published.
    void cancel();

    [[nodiscard]] uint64_t currentRunId() const noexcept { return currentRunId_.load(); }

    [[nodiscard]] std::optional<RunReport> lastReport() const;

    [[nodiscard]] const std::shared_ptr<cache::ResultCache>& cache() const noexcept { return cache_; }

    [[nodiscard]] static unsigned int poolSizeFor(std::size_t targets, unsigned int maxWorkersPerRun,
                                                  unsigned int cores);

    static DispatcherFactory executorPoolFactory(executor::ExecutorOptions options);

private:
    static constexpr auto WAIT_SLICE = std::chrono::milliseconds(20);

    std::shared_ptr<cache::ResultCache> cache_;
    DispatcherFactory dispatcherFactory_;
    GroupsProvider groups_;
    unsigned int maxWorkersPerRun_;
    std::shared_ptr<RunListener> listener_;

    std::atomic<uint64_t> currentRunId_{0};

    std::mutex tokenMutex_;
    std::shared_ptr<concurrency::CancellationToken> activeToken_;

    // Serializes listener callbacks. Never held by lastReport().
    std::mutex notifyMutex_;

    mutable std::mutex publishMutex_;
    std::optional<RunReport> lastReport_;

    [[nodiscard]] bool isStale(uint64_t runId) const noexcept { return runId != currentRunId_.load(); }

    std::filesystem::path resolveReference(const RunRequest& request) const;

    // nullopt when the run was cancelled or superseded before every target settled.
    std::optional<std::vector<types::ComparisonResult>> compareTargets(
        uint64_t runId, const GroupMatch& match, const std::filesystem::path& reference,
        const std::shared_ptr<concurrency::CancellationToken>& token,
        const std::shared_ptr<concurrency::CancellationToken>& externalToken);

    bool publish(uint64_t runId, const RunReport& report, bool matched);

    // Empties the published results of a run that failed after committing them.
    void retract(uint64_t runId);

    RunStatus interruptedStatus(uint64_t runId) const noexcept;
};

}
