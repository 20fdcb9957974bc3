#pragma once

#include "concurrency/AsyncService.hpp"
#include "run/RunCoordinator.hpp"

#include <atomic>
#include <chrono>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace md::watch {

// Re-runs the last published comparison whenever the reference or one of its
// targets changes on disk. Runs may overlap; only the newest one publishes.
class ReferenceWatcher final : public concurrency::AsyncService {
public:
    ReferenceWatcher(std::shared_ptr<run::RunCoordinator> coordinator,
                     std::chrono::milliseconds pollInterval,
                     std::optional<std::string> group = std::nullopt);

    ~ReferenceWatcher() override;

    // Also cancels the active run and waits for triggered runs to settle.
    void stop() override;

    [[nodiscard]] uint64_t triggeredRuns() const noexcept { return triggered_.load(); }

protected:
    void runLoop() override;

private:
    using Snapshot = std::map<std::filesystem::path, int64_t>;

    std::shared_ptr<run::RunCoordinator> coordinator_;
    std::chrono::milliseconds pollInterval_;
    std::optional<std::string> group_;

    std::vector<std::future<run::RunOutcome>> inflight_;
    std::atomic<uint64_t> triggered_{0};

    [[nodiscard]] Snapshot snapshot(const std::optional<run::RunReport>& report) const;

    void trigger(const std::filesystem::path& reference);
    void reap(bool wait);
};

}
