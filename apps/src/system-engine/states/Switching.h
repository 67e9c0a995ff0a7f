#pragma once

#include "StateForward.h"

namespace NixBlitz {
namespace System {
namespace State {

// The switch command runs on a worker thread, which leaves this state when it exits.
struct Switching {
    void onEnter(SystemEngine& engine);

    bool operator==(const Switching&) const = default;
    static constexpr const char* name() { return "Switching"; }
};

} // namespace State
} // namespace System
} // namespace NixBlitz
