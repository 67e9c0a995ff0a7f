#pragma once

#include <atomic>

namespace NixBlitz {

// Exit flag shared by the engine main loops.
class StateMachineBase {
public:
    virtual ~StateMachineBase() = default;

    bool shouldExit() const { return shouldExit_.load(); }
    void setShouldExit(bool value) { shouldExit_.store(value); }

private:
    std::atomic<bool> shouldExit_{ false };
};

} // namespace NixBlitz
