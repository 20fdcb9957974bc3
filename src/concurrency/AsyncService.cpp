#include "concurrency/AsyncService.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>

using namespace md::concurrency;
using namespace md::logging;

AsyncService::AsyncService(const std::string& serviceName)
    : serviceName_(serviceName) {}

AsyncService::~AsyncService() {
    // Derived loops must be stopped by the derived destructor; this only reaps the thread.
    interruptFlag_.store(true, std::memory_order_release);
    if (worker_.joinable() && std::this_thread::get_id() != worker_.get_id()) worker_.join();
}

void AsyncService::start() {
    if (isRunning()) return;
    if (worker_.joinable()) worker_.join();

    interruptFlag_.store(false, std::memory_order_release);
    running_.store(true, std::memory_order_release);

    worker_ = std::thread([this] {
        try {
            runLoop();
        } catch (const std::exception& e) {
            LogRegistry::multidiff()->error("[{}] Service error: {}", serviceName_, e.what());
        }

        running_.store(false, std::memory_order_release);
    });

    LogRegistry::multidiff()->info("[{}] Service started.", serviceName_);
}

void AsyncService::stop() {
    if (!worker_.joinable()) return;

    LogRegistry::multidiff()->info("[{}] Stopping service...", serviceName_);
    interruptFlag_.store(true, std::memory_order_release);

    if (std::this_thread::get_id() != worker_.get_id()) worker_.join();

    running_.store(false, std::memory_order_release);
    // Leave interruptFlag_ true until next start() resets it
    LogRegistry::multidiff()->info("[{}] Service stopped.", serviceName_);
}

void AsyncService::restart() {
    LogRegistry::multidiff()->info("[{}] Restarting service...", serviceName_);
    stop();
    start();
}

bool AsyncService::sleepFor(const std::chrono::milliseconds duration) const {
    constexpr auto slice = std::chrono::milliseconds(25);
    const auto deadline = std::chrono::steady_clock::now() + duration;
    while (!interruptFlag_.load(std::memory_order_acquire)) {
        const auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        std::this_thread::sleep_for(std::min<std::chrono::steady_clock::duration>(slice, deadline - now));
    }
    return false;
}
