#include "executor/TaskExecutor.hpp"
#include "executor/errors.hpp"
#include "protocol/FrameIO.hpp"
#include "protocol/Message.hpp"
#include "logging/LogRegistry.hpp"

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/wait.h>
#include <csignal>
#include <cerrno>
#include <cstring>
#include <unistd.h>

using namespace md::executor;
using namespace md::types;
using namespace md::protocol;
using namespace md::logging;

TaskExecutor::TaskExecutor(std::filesystem::path workerBinary, const unsigned int slot)
    : workerBinary_(std::move(workerBinary)), slot_(slot) {}

TaskExecutor::~TaskExecutor() {
    terminate();
}

void TaskExecutor::start() {
    std::scoped_lock lock(procMutex_);
    if (pid_ > 0) return;

    int sv[2];
    if (::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sv) == -1)
        throw ExecutorError(fmt::format("Failed to create executor channel: {}", std::strerror(errno)));

    // argv must be built before fork; the child may only call async-signal-safe functions.
    const std::string binary = workerBinary_.string();
    const std::string slotArg = std::to_string(slot_);
    const char* argv[] = {binary.c_str(), "--slot", slotArg.c_str(), nullptr};

    const pid_t pid = ::fork();
    if (pid < 0) {
        ::close(sv[0]);
        ::close(sv[1]);
        throw ExecutorError(fmt::format("Failed to fork executor: {}", std::strerror(errno)));
    }

    if (pid == 0) {
        // Child: the worker talks over stdin/stdout; dup2 clears CLOEXEC on the copies.
        ::dup2(sv[1], STDIN_FILENO);
        ::dup2(sv[1], STDOUT_FILENO);
        ::execv(argv[0], const_cast<char* const*>(argv));
        _exit(127); // exec failed
    }

    ::close(sv[1]);
    pid_ = pid;
    fd_ = sv[0];

    LogRegistry::executor()->debug("[TaskExecutor] Slot {} started worker pid {}", slot_, pid_);
}

ComparisonResult TaskExecutor::execute(const uint64_t taskId, const ComparisonRequest& request) {
    int fd;
    {
        std::scoped_lock lock(procMutex_);
        if (pid_ <= 0 || fd_ < 0) throw ExecutorError(fmt::format("Executor {} is not running", slot_));
        fd = fd_;
    }

    ResponseMessage response;
    try {
        FrameIO::send_json(fd, encode(CompareMessage{taskId, request}));
        response = decodeResponse(FrameIO::recv_json(fd));
    } catch (const ProtocolError& e) {
        throw ExecutorError(fmt::format("Executor {} failed on task {}: {}", slot_, taskId, e.what()));
    }

    if (responseId(response) != taskId)
        throw ExecutorError(fmt::format("Executor {} answered task {} while running task {}",
                                        slot_, responseId(response), taskId));

    if (const auto* err = std::get_if<ErrorMessage>(&response)) throw ComparisonError(err->message);
    return std::get<ResultMessage>(response).result;
}

void TaskExecutor::interrupt() noexcept {
    std::scoped_lock lock(procMutex_);
    if (pid_ > 0) ::kill(pid_, SIGKILL);
}

void TaskExecutor::terminate() noexcept {
    std::scoped_lock lock(procMutex_);
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
    if (pid_ <= 0) return;

    ::kill(pid_, SIGKILL);
    int status = 0;
    while (::waitpid(pid_, &status, 0) == -1 && errno == EINTR) {}
    LogRegistry::executor()->debug("[TaskExecutor] Slot {} reaped worker pid {}", slot_, pid_);
    pid_ = -1;
}

pid_t TaskExecutor::pid() const {
    std::scoped_lock lock(procMutex_);
    return pid_;
}
