#pragma once

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

namespace md::concurrency {

class AsyncService {
public:
    explicit AsyncService(const std::string& serviceName);

    virtual ~AsyncService();

    virtual void start();

    virtual void stop();

    virtual void restart();

    [[nodiscard]] bool isRunning() const { return running_.load(); }

protected:
    std::string serviceName_;
    std::atomic<bool> running_{false};
    std::atomic<bool> interruptFlag_{false};
    std::thread worker_;

    virtual void runLoop() = 0;

    // Sleeps in short slices; returns false as soon as the service is interrupted.
    bool sleepFor(std::chrono::milliseconds duration) const;
};

}
