#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace md::concurrency {

// Cooperative cancellation. Callbacks run once, on the thread that calls cancel(),
// or immediately when subscribing to a token that is already cancelled.
class CancellationToken : public std::enable_shared_from_this<CancellationToken> {
public:
    using Callback = std::function<void()>;

    // Unsubscribes on destruction.
    class Subscription {
    public:
        Subscription() = default;
        Subscription(std::weak_ptr<CancellationToken> token, uint64_t id) : token_(std::move(token)), id_(id) {}
        ~Subscription() { reset(); }

        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;
        Subscription(Subscription&& other) noexcept { *this = std::move(other); }
        Subscription& operator=(Subscription&& other) noexcept;

        void reset();

    private:
        std::weak_ptr<CancellationToken> token_;
        uint64_t id_{0};
    };

    static std::shared_ptr<CancellationToken> create() { return std::shared_ptr<CancellationToken>(new CancellationToken); }

    void cancel();

    [[nodiscard]] bool isCancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

    [[nodiscard]] Subscription subscribe(Callback cb);

private:
    CancellationToken() = default;

    void unsubscribe(uint64_t id);

    std::atomic<bool> cancelled_{false};
    std::mutex mutex_;
    std::map<uint64_t, Callback> callbacks_;
    uint64_t nextId_{1};
};

}
