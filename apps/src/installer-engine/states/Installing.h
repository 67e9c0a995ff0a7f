#pragma once

#include "StateForward.h"
#include "installer-engine/InstallSteps.h"
#include <vector>

namespace NixBlitz {
namespace Installer {
namespace State {

/**
 * A build is running on a worker thread. The worker updates the steps in place through
 * the state store and moves to InstallSucceeded or InstallFailed when the process exits.
 */
struct Installing {
    std::vector<InstallStep> steps;

    void onEnter(InstallerEngine& engine);

    bool operator==(const Installing&) const = default;
    static constexpr const char* name() { return "Installing"; }
};

} // namespace State
} // namespace Installer
} // namespace NixBlitz
