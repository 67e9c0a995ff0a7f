#include "ProcessSupervisor.h"
#include "LoggingChannels.h"
#include <array>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/wait.h>
#include <unistd.h>

namespace NixBlitz {

namespace {

constexpr size_t kReadChunk = 4096;

void closeFd(int& fd)
{
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

struct PipePair {
    int readEnd = -1;
    int writeEnd = -1;

    ~PipePair()
    {
        closeFd(readEnd);
        closeFd(writeEnd);
    }

    bool open()
    {
        int fds[2];
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            return false;
        }
        readEnd = fds[0];
        writeEnd = fds[1];
        return true;
    }

    // Hands the read end to the caller; the destructor no longer owns it.
    int releaseRead()
    {
        const int fd = readEnd;
        readEnd = -1;
        return fd;
    }
};

} // namespace

std::string CommandLine::toString() const
{
    std::string out = program;
    for (const auto& arg : args) {
        out += ' ';
        if (arg.find_first_of(" \t\"'") != std::string::npos) {
            out += '\'' + arg + '\'';
        }
        else {
            out += arg;
        }
    }
    return out;
}

std::string ProcessCompleted::describe() const
{
    if (termSignal != 0) {
        return "signal " + std::to_string(termSignal);
    }
    return std::to_string(exitCode);
}

ProcessStream::~ProcessStream()
{
    if (waiter_.joinable()) {
        waiter_.join();
    }
}

std::optional<ProcessOutput> ProcessStream::next()
{
    return queue_.waitPop();
}

void ProcessStream::startReaders(int stdoutFd, int stderrFd)
{
    waiter_ = std::thread([this, stdoutFd, stderrFd] {
        std::thread outReader(&ProcessStream::readLines, this, stdoutFd, false);
        std::thread errReader(&ProcessStream::readLines, this, stderrFd, true);
        outReader.join();
        errReader.join();

        int status = 0;
        pid_t result = -1;
        do {
            result = ::waitpid(pid_, &status, 0);
        } while (result < 0 && errno == EINTR);

        ProcessCompleted completed;
        if (result < 0) {
            LOG_ERROR(Process, "waitpid({}) failed: {}", pid_, std::strerror(errno));
            completed.exitCode = -1;
        }
        else if (WIFSIGNALED(status)) {
            completed.exitCode = -1;
            completed.termSignal = WTERMSIG(status);
        }
        else {
            completed.exitCode = WEXITSTATUS(status);
        }

        LOG_INFO(Process, "Process {} exited ({})", pid_, completed.describe());
        queue_.push(completed);
        queue_.close();
    });
}

void ProcessStream::readLines(int fd, bool isStderr)
{
    std::array<char, kReadChunk> buffer;
    std::string pending;

    const auto emit = [this, isStderr](std::string line) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (isStderr) {
            LOG_INFO(Process, "[STDERR] {}", line);
            queue_.push(ProcessStderr{ std::move(line) });
        }
        else {
            LOG_INFO(Process, "[STDOUT] {}", line);
            queue_.push(ProcessStdout{ std::move(line) });
        }
    };

    while (true) {
        const ssize_t n = ::read(fd, buffer.data(), buffer.size());
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            LOG_WARN(Process, "Read from child pipe failed: {}", std::strerror(errno));
            break;
        }
        if (n == 0) {
            break;
        }

        pending.append(buffer.data(), static_cast<size_t>(n));
        size_t start = 0;
        size_t newline = 0;
        while ((newline = pending.find('\n', start)) != std::string::npos) {
            emit(pending.substr(start, newline - start));
            start = newline + 1;
        }
        pending.erase(0, start);
    }

    if (!pending.empty()) {
        emit(std::move(pending));
    }
    ::close(fd);
}

std::unique_ptr<ProcessStream> ProcessSupervisor::spawn(const CommandLine& command)
{
    std::unique_ptr<ProcessStream> stream(new ProcessStream());
    const std::string commandText = command.toString();

    const auto fail = [&](const std::string& reason) {
        const std::string message = "Failed to spawn command '" + commandText + "': " + reason;
        LOG_ERROR(Process, "{}", message);
        stream->queue_.push(ProcessError{ message });
        stream->queue_.close();
        return std::move(stream);
    };

    PipePair outPipe;
    PipePair errPipe;
    PipePair execPipe;
    if (!outPipe.open() || !errPipe.open() || !execPipe.open()) {
        return fail(std::string("pipe: ") + std::strerror(errno));
    }

    // Build argv before fork; the child must not allocate.
    std::vector<std::string> argStorage;
    argStorage.reserve(command.args.size() + 1);
    argStorage.push_back(command.program);
    argStorage.insert(argStorage.end(), command.args.begin(), command.args.end());
    std::vector<char*> argv;
    for (auto& arg : argStorage) {
        argv.push_back(arg.data());
    }
    argv.push_back(nullptr);

    LOG_INFO(Process, "Running: {}", commandText);

    const pid_t pid = ::fork();
    if (pid < 0) {
        return fail(std::string("fork: ") + std::strerror(errno));
    }

    if (pid == 0) {
        // Child process. dup2 clears O_CLOEXEC on the target descriptors.
        ::dup2(outPipe.writeEnd, STDOUT_FILENO);
        ::dup2(errPipe.writeEnd, STDERR_FILENO);
        const int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }

        ::execvp(argv[0], argv.data());

        const int execErrno = errno;
        [[maybe_unused]] const ssize_t written =
            ::write(execPipe.writeEnd, &execErrno, sizeof(execErrno));
        ::_exit(127);
    }

    // Parent process.
    closeFd(outPipe.writeEnd);
    closeFd(errPipe.writeEnd);
    closeFd(execPipe.writeEnd);

    // The exec pipe closes without data once execvp succeeds.
    int childErrno = 0;
    ssize_t n = 0;
    do {
        n = ::read(execPipe.readEnd, &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        int status = 0;
        while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
        }
        return fail(std::strerror(childErrno));
    }

    stream->pid_ = pid;
    stream->startReaders(outPipe.releaseRead(), errPipe.releaseRead());
    return stream;
}

Result<ProcessCompleted, ApiError> ProcessSupervisor::runToCompletion(
    const CommandLine& command, const OutputCallback& onOutput)
{
    auto stream = spawn(command);

    std::optional<ProcessCompleted> completed;
    std::optional<std::string> spawnError;
    while (auto item = stream->next()) {
        if (onOutput) {
            onOutput(item.value());
        }
        if (const auto* done = std::get_if<ProcessCompleted>(&item.value())) {
            completed = *done;
        }
        else if (const auto* error = std::get_if<ProcessError>(&item.value())) {
            spawnError = error->message;
        }
    }

    if (spawnError.has_value()) {
        return Result<ProcessCompleted, ApiError>::error(ApiError(spawnError.value()));
    }
    if (!completed.has_value()) {
        return Result<ProcessCompleted, ApiError>::error(
            ApiError("Process ended without an exit status: " + command.toString()));
    }
    return Result<ProcessCompleted, ApiError>::okay(completed.value());
}

} // namespace NixBlitz
