#pragma once

#include "StateForward.h"
#include <string>

namespace NixBlitz {
namespace Installer {
namespace State {

struct InstallFailed {
    std::string message;

    bool operator==(const InstallFailed&) const = default;
    static constexpr const char* name() { return "InstallFailed"; }
};

} // namespace State
} // namespace Installer
} // namespace NixBlitz
