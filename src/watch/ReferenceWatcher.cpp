#include "watch/ReferenceWatcher.hpp"
#include "logging/LogRegistry.hpp"
#include "util/fsPath.hpp"

#include <algorithm>
#include <stdexcept>

using namespace md::watch;
using namespace md::run;
using namespace md::logging;

ReferenceWatcher::ReferenceWatcher(std::shared_ptr<RunCoordinator> coordinator,
                                   const std::chrono::milliseconds pollInterval,
                                   std::optional<std::string> group)
    : AsyncService("ReferenceWatcher"),
      coordinator_(std::move(coordinator)),
      pollInterval_(pollInterval),
      group_(std::move(group)) {
    if (!coordinator_) throw std::invalid_argument("ReferenceWatcher requires a coordinator");
    if (pollInterval_ <= std::chrono::milliseconds::zero())
        throw std::invalid_argument("ReferenceWatcher poll interval must be positive");
}

ReferenceWatcher::~ReferenceWatcher() {
    stop();
}

void ReferenceWatcher::stop() {
    AsyncService::stop();
    coordinator_->cancel();
    reap(true);
}

ReferenceWatcher::Snapshot ReferenceWatcher::snapshot(const std::optional<RunReport>& report) const {
    Snapshot snap;
    if (!report || report->reference.empty()) return snap;

    snap.emplace(report->reference, util::modTime(report->reference));
    for (const auto& r : report->results)
        snap.emplace(r.resolvedTargetPath, util::modTime(r.resolvedTargetPath));
    return snap;
}

void ReferenceWatcher::runLoop() {
    auto report = coordinator_->lastReport();
    auto last = snapshot(report);

    while (sleepFor(pollInterval_)) {
        reap(false);

        report = coordinator_->lastReport();
        auto current = snapshot(report);

        // A new report brings a new target set; adopt it without re-running.
        const bool sameTargets = current.size() == last.size() &&
            std::equal(current.begin(), current.end(), last.begin(),
                       [](const auto& a, const auto& b) { return a.first == b.first; });

        if (sameTargets && current != last) {
            for (const auto& [path, mtime] : current) {
                if (last.at(path) != mtime) {
                    LogRegistry::watch()->debug("[ReferenceWatcher] {} changed", path.string());
                    break;
                }
            }
            trigger(report->reference);
        }

        last = std::move(current);
    }
}

void ReferenceWatcher::trigger(const std::filesystem::path& reference) {
    triggered_.fetch_add(1);
    RunRequest request{group_, reference};
    inflight_.push_back(std::async(std::launch::async, [coordinator = coordinator_, request] {
        return coordinator->run(request);
    }));
}

void ReferenceWatcher::reap(const bool wait) {
    std::erase_if(inflight_, [wait](std::future<RunOutcome>& f) {
        if (!wait && f.wait_for(std::chrono::seconds(0)) != std::future_status::ready) return false;
        const auto outcome = f.get();
        LogRegistry::watch()->debug("[ReferenceWatcher] Run {} {}", outcome.report.runId, to_string(outcome.status));
        return true;
    });
}
