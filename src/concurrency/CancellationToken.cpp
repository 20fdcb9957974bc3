#include "concurrency/CancellationToken.hpp"

using namespace md::concurrency;

CancellationToken::Subscription& CancellationToken::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        reset();
        token_ = std::move(other.token_);
        id_ = other.id_;
        other.id_ = 0;
    }
    return *this;
}

void CancellationToken::Subscription::reset() {
    if (id_ == 0) return;
    if (const auto token = token_.lock()) token->unsubscribe(id_);
    token_.reset();
    id_ = 0;
}

void CancellationToken::cancel() {
    std::map<uint64_t, Callback> toRun;
    {
        std::scoped_lock lock(mutex_);
        if (cancelled_.exchange(true, std::memory_order_acq_rel)) return;
        toRun.swap(callbacks_);
    }
    for (auto& [id, cb] : toRun) cb();
}

CancellationToken::Subscription CancellationToken::subscribe(Callback cb) {
    {
        std::scoped_lock lock(mutex_);
        if (!isCancelled()) {
            const auto id = nextId_++;
            callbacks_.emplace(id, std::move(cb));
            return {weak_from_this(), id};
        }
    }
    cb();
    return {};
}

void CancellationToken::unsubscribe(const uint64_t id) {
    std::scoped_lock lock(mutex_);
    callbacks_.erase(id);
}
