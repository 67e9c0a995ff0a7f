#pragma once

#include "StateForward.h"
#include "installer-engine/InstallSteps.h"
#include <vector>

namespace NixBlitz {
namespace Installer {
namespace State {

struct InstallSucceeded {
    std::vector<InstallStep> steps;

    bool operator==(const InstallSucceeded&) const = default;
    static constexpr const char* name() { return "InstallSucceeded"; }
};

} // namespace State
} // namespace Installer
} // namespace NixBlitz
