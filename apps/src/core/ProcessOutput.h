#pragma once

#include <string>
#include <variant>
#include <vector>

namespace NixBlitz {

struct CommandLine {
    std::string program;
    std::vector<std::string> args;

    // Shell-like rendering for logs and error messages.
    std::string toString() const;
};

struct ProcessStdout {
    std::string line;
};

struct ProcessStderr {
    std::string line;
};

struct ProcessCompleted {
    int exitCode = 0;
    // Set when the child was terminated by a signal; exitCode is then -1.
    int termSignal = 0;

    bool success() const { return termSignal == 0 && exitCode == 0; }
    std::string describe() const;
};

// The process could not be started. No ProcessCompleted follows.
struct ProcessError {
    std::string message;
};

using ProcessOutput = std::variant<ProcessStdout, ProcessStderr, ProcessCompleted, ProcessError>;

} // namespace NixBlitz
