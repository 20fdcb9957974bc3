#pragma once

#include "types/Comparison.hpp"

#include <filesystem>
#include <mutex>
#include <sys/types.h>

namespace md::executor {

// One isolated worker process, reached over a socketpair with length-prefixed
// JSON frames. Not thread-safe except for interrupt().
class TaskExecutor {
public:
    TaskExecutor(std::filesystem::path workerBinary, unsigned int slot);
    ~TaskExecutor();

    TaskExecutor(const TaskExecutor&) = delete;
    TaskExecutor& operator=(const TaskExecutor&) = delete;

    // fork/exec of the worker binary. Throws ExecutorError.
    void start();

    // Sends one compare request and waits for its answer.
    // Throws ExecutorError if the process or channel fails (the executor is then unusable),
    // ComparisonError if the worker reports a failure for this request only.
    types::ComparisonResult execute(uint64_t taskId, const types::ComparisonRequest& request);

    // Kills the process so a blocked execute() returns. Safe from any thread.
    void interrupt() noexcept;

    // Kills and reaps the process and closes the channel.
    void terminate() noexcept;

    [[nodiscard]] pid_t pid() const;
    [[nodiscard]] unsigned int slot() const noexcept { return slot_; }

private:
    std::filesystem::path workerBinary_;
    unsigned int slot_;

    mutable std::mutex procMutex_;
    pid_t pid_{-1};
    int fd_{-1};
};

}
