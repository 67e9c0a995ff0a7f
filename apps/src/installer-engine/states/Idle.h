#pragma once

#include "StateForward.h"

namespace NixBlitz {
namespace Installer {
namespace State {

// Waiting for the first system check. Only the engine-wide commands apply.
struct Idle {
    void onEnter(InstallerEngine& engine);

    bool operator==(const Idle&) const = default;
    static constexpr const char* name() { return "Idle"; }
};

} // namespace State
} // namespace Installer
} // namespace NixBlitz
