#include "run/RunCoordinator.hpp"
#include "executor/errors.hpp"
#include "logging/LogRegistry.hpp"
#include "util/fsPath.hpp"
#include "util/text.hpp"

#include <algorithm>
#include <future>
#include <stdexcept>
#include <thread>
#include <utility>

using namespace md::run;
using namespace md::cache;
using namespace md::concurrency;
using namespace md::executor;
using namespace md::types;
using namespace md::logging;

namespace {

struct PendingComparison {
    std::size_t index;
    CacheKeyParts key;
    std::future<ComparisonResult> future;
};

bool interrupted(const CancellationToken& token, const std::shared_ptr<CancellationToken>& external) {
    return token.isCancelled() || (external && external->isCancelled());
}

}

RunCoordinator::RunCoordinator(std::shared_ptr<ResultCache> cache,
                               DispatcherFactory dispatcherFactory,
                               GroupsProvider groups,
                               const unsigned int maxWorkersPerRun,
                               std::shared_ptr<RunListener> listener)
    : cache_(std::move(cache)),
      dispatcherFactory_(std::move(dispatcherFactory)),
      groups_(std::move(groups)),
      maxWorkersPerRun_(maxWorkersPerRun),
      listener_(std::move(listener)) {
    if (!cache_) throw std::invalid_argument("RunCoordinator requires a result cache");
    if (!dispatcherFactory_) throw std::invalid_argument("RunCoordinator requires a dispatcher factory");
    if (!groups_) throw std::invalid_argument("RunCoordinator requires a groups provider");
}

unsigned int RunCoordinator::poolSizeFor(const std::size_t targets, const unsigned int maxWorkersPerRun,
                                         const unsigned int cores) {
    const unsigned int byCores = std::max(1u, cores > 0 ? cores - 1 : 1u);
    const auto byTargets = static_cast<unsigned int>(std::min<std::size_t>(maxWorkersPerRun, targets));
    return std::min(byCores, std::max(1u, byTargets));
}

RunCoordinator::DispatcherFactory RunCoordinator::executorPoolFactory(ExecutorOptions options) {
    return [options = std::move(options)](const unsigned int size) -> std::shared_ptr<Dispatcher> {
        return std::make_shared<ExecutorPool>(options, size);
    };
}

std::optional<RunReport> RunCoordinator::lastReport() const {
    std::scoped_lock lock(publishMutex_);
    return lastReport_;
}

void RunCoordinator::cancel() {
    std::shared_ptr<CancellationToken> token;
    {
        std::scoped_lock lock(tokenMutex_);
        token = activeToken_;
    }
    if (token) token->cancel();
}

std::filesystem::path RunCoordinator::resolveReference(const RunRequest& request) const {
    if (request.reference && !request.reference->empty()) return request.reference->lexically_normal();
    if (const auto last = lastReport(); last && !last->reference.empty()) return last->reference;
    throw std::runtime_error("No reference file");
}

RunStatus RunCoordinator::interruptedStatus(const uint64_t runId) const noexcept {
    return isStale(runId) ? RunStatus::Superseded : RunStatus::Cancelled;
}

bool RunCoordinator::publish(const uint64_t runId, const RunReport& report, const bool matched) {
    std::scoped_lock notify(notifyMutex_);
    {
        std::scoped_lock lock(publishMutex_);
        if (isStale(runId)) return false;
        lastReport_ = report;
    }

    if (listener_) {
        if (matched) listener_->published(report);
        else listener_->noMatchingGroup(report.reference);
    }
    return true;
}

void RunCoordinator::retract(const uint64_t runId) {
    std::scoped_lock lock(publishMutex_);
    if (lastReport_ && lastReport_->runId == runId) lastReport_->results.clear();
}

RunOutcome RunCoordinator::run(const RunRequest& request, const std::shared_ptr<CancellationToken>& externalToken) {
    const uint64_t runId = currentRunId_.fetch_add(1) + 1;

    const auto token = CancellationToken::create();
    std::shared_ptr<CancellationToken> previous;
    {
        std::scoped_lock lock(tokenMutex_);
        previous = std::exchange(activeToken_, token);
    }
    if (previous) previous->cancel();

    RunOutcome outcome;
    outcome.report.runId = runId;

    try {
        const auto reference = resolveReference(request);
        outcome.report.reference = reference;
        LogRegistry::coordinator()->debug("[RunCoordinator] Run {} started for {}", runId, reference.string());

        const GroupResolver resolver(groups_());
        const auto match = resolver.resolve(reference, request.group);

        if (!match) {
            if (!publish(runId, outcome.report, false)) {
                outcome.status = RunStatus::Superseded;
                return outcome;
            }
            LogRegistry::coordinator()->info("[RunCoordinator] No matching group for {}", reference.string());
            outcome.status = RunStatus::NoMatchingGroup;
            return outcome;
        }

        outcome.report.group = match->group;
        outcome.report.project = match->project;

        auto results = compareTargets(runId, *match, reference, token, externalToken);
        if (!results || isStale(runId) || interrupted(*token, externalToken)) {
            outcome.status = interruptedStatus(runId);
            LogRegistry::coordinator()->debug("[RunCoordinator] Run {} {}", runId, to_string(outcome.status));
            return outcome;
        }

        std::ranges::stable_sort(*results, [](const ComparisonResult& a, const ComparisonResult& b) {
            if (a.exists != b.exists) return a.exists;
            return a.totalChangedLines < b.totalChangedLines;
        });
        std::erase_if(*results, [&](const ComparisonResult& r) {
            return util::samePath(r.resolvedTargetPath, reference);
        });

        outcome.report.results = std::move(*results);

        if (!publish(runId, outcome.report, true)) {
            outcome.status = RunStatus::Superseded;
            outcome.report.results.clear();
            return outcome;
        }

        outcome.status = RunStatus::Completed;
        LogRegistry::coordinator()->info("[RunCoordinator] Run {} published {} results for {} (group '{}', cache hit ratio {:.2f})",
                                         runId, outcome.report.results.size(), reference.string(),
                                         match->group.name, cache_->stats().hitRatio());
    } catch (const std::exception& e) {
        outcome.report.results.clear();
        retract(runId);
        if (isStale(runId)) {
            outcome.status = RunStatus::Superseded;
            return outcome;
        }

        outcome.status = RunStatus::Failed;
        outcome.error = e.what();
        LogRegistry::coordinator()->error("[RunCoordinator] Run {} failed: {}", runId, e.what());
        if (listener_) {
            try {
                listener_->failed(outcome.error);
            } catch (const std::exception& notifyError) {
                LogRegistry::coordinator()->error("[RunCoordinator] Failure listener threw: {}", notifyError.what());
            }
        }
    }

    return outcome;
}

std::optional<std::vector<ComparisonResult>> RunCoordinator::compareTargets(
    const uint64_t runId, const GroupMatch& match, const std::filesystem::path& reference,
    const std::shared_ptr<CancellationToken>& token, const std::shared_ptr<CancellationToken>& externalToken) {
    const auto& workspaces = match.group.workspaces;
    const bool ignoreWhitespace = match.group.ignore_whitespace;

    const auto baseMtime = util::modTime(reference);
    std::optional<std::string> baseContent;
    if (baseMtime >= 0) {
        try {
            baseContent = util::sanitizeUtf8(util::readFile(reference));
        } catch (const std::exception& e) {
            // Workers retry the read and report per target.
            LogRegistry::coordinator()->warn("[RunCoordinator] Could not preload {}: {}", reference.string(), e.what());
        }
    }

    std::vector<std::optional<ComparisonResult>> slots(workspaces.size());
    std::vector<PendingComparison> pending;
    std::shared_ptr<Dispatcher> dispatcher;
    CancellationToken::Subscription runSubscription, externalSubscription;
    std::size_t cacheHits = 0;

    const auto closeDispatcher = [&] {
        runSubscription.reset();
        externalSubscription.reset();
        if (dispatcher) dispatcher->shutdown();
    };

    bool settled = true;
    try {
        for (std::size_t i = 0; i < workspaces.size(); ++i) {
            if (interrupted(*token, externalToken) || isStale(runId)) {
                settled = false;
                break;
            }

            const auto& ws = workspaces[i];
            const auto resolved = ws.path / match.relativePath;

            if (util::samePath(resolved, reference)) {
                slots[i] = ComparisonResult::identical(ws.name, resolved, ws.path);
                continue;
            }

            const auto compareMtime = util::modTime(resolved);
            if (compareMtime < 0) {
                slots[i] = ComparisonResult::missing(ws.name, resolved, ws.path);
                continue;
            }
            if (baseMtime < 0) {
                slots[i] = ComparisonResult(ws.name, {}, resolved, true, ws.path);
                continue;
            }

            CacheKeyParts key{reference, baseMtime, resolved, compareMtime, ignoreWhitespace};
            if (auto hit = cache_->get(key, LookupContext{ws.name, ws.path})) {
                slots[i] = std::move(*hit);
                ++cacheHits;
                continue;
            }

            if (!dispatcher) {
                const auto size = poolSizeFor(workspaces.size(), maxWorkersPerRun_, std::thread::hardware_concurrency());
                dispatcher = dispatcherFactory_(size);
                if (!dispatcher) throw std::runtime_error("Dispatcher factory returned no dispatcher");

                const auto shutdownOnCancel = [weak = std::weak_ptr<Dispatcher>(dispatcher)] {
                    if (const auto d = weak.lock()) d->shutdown();
                };
                runSubscription = token->subscribe(shutdownOnCancel);
                if (externalToken) externalSubscription = externalToken->subscribe(shutdownOnCancel);
            }

            ComparisonRequest request{reference, ws.path, match.relativePath, ws.name, ignoreWhitespace, baseContent};
            try {
                pending.push_back({i, std::move(key), dispatcher->submit(std::move(request))});
            } catch (const PoolClosedError&) {
                if (!interrupted(*token, externalToken)) throw;
                settled = false;
                break;
            }
        }

        for (auto& p : pending) {
            if (!settled) break;
            while (p.future.wait_for(WAIT_SLICE) != std::future_status::ready) {
                if (interrupted(*token, externalToken) || isStale(runId)) {
                    settled = false;
                    break;
                }
            }
        }
    } catch (...) {
        closeDispatcher();
        throw;
    }

    closeDispatcher();

    if (!settled || interrupted(*token, externalToken) || isStale(runId)) return std::nullopt;

    for (auto& p : pending) {
        const auto& ws = workspaces[p.index];
        try {
            auto result = p.future.get();
            cache_->set(p.key, result);
            slots[p.index] = std::move(result);
        } catch (const std::exception& e) {
            LogRegistry::coordinator()->warn("[RunCoordinator] Comparison against '{}' failed: {}", ws.name, e.what());
            slots[p.index] = ComparisonResult::missing(ws.name, p.key.comparePath, ws.path);
        }
    }

    LogRegistry::coordinator()->debug("[RunCoordinator] Run {}: {} targets, {} cache hits, {} dispatched",
                                      runId, workspaces.size(), cacheHits, pending.size());

    std::vector<ComparisonResult> results;
    results.reserve(slots.size());
    for (auto& slot : slots)
        if (slot) results.push_back(std::move(*slot));
    return results;
}
