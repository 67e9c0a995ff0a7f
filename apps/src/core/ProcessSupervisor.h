#pragma once

#include "ApiError.h"
#include "ProcessOutput.h"
#include "Result.h"
#include "SynchronizedQueue.h"
#include <functional>
#include <memory>
#include <optional>
#include <sys/types.h>
#include <thread>

namespace NixBlitz {

/**
 * @brief Output of one supervised child process, in arrival order.
 *
 * Stdout and stderr are drained by two independent reader threads so a chatty stream
 * cannot stall the other; per-stream line order is preserved. The stream ends with
 * exactly one ProcessCompleted, or with exactly one ProcessError if the spawn failed.
 */
class ProcessStream {
public:
    ~ProcessStream();

    ProcessStream(const ProcessStream&) = delete;
    ProcessStream& operator=(const ProcessStream&) = delete;

    // Blocks for the next item; std::nullopt once the stream is exhausted.
    std::optional<ProcessOutput> next();

    pid_t pid() const { return pid_; }

private:
    friend class ProcessSupervisor;

    ProcessStream() = default;

    void startReaders(int stdoutFd, int stderrFd);
    void readLines(int fd, bool isStderr);

    pid_t pid_ = -1;
    SynchronizedQueue<ProcessOutput> queue_;
    std::thread waiter_;
};

class ProcessSupervisor {
public:
    using OutputCallback = std::function<void(const ProcessOutput&)>;

    // Never throws; spawn failures are delivered through the stream.
    static std::unique_ptr<ProcessStream> spawn(const CommandLine& command);

    /**
     * @brief Run a command to completion, forwarding every item to onOutput.
     * @return The completion record, or an ApiError if the command could not be started.
     */
    static Result<ProcessCompleted, ApiError> runToCompletion(
        const CommandLine& command, const OutputCallback& onOutput = {});
};

} // namespace NixBlitz
