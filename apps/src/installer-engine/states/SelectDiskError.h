#pragma once

#include "StateForward.h"
#include "installer-engine/api/ClientCommand.h"
#include <string>

namespace NixBlitz {
namespace Installer {
namespace State {

struct SelectDiskError {
    std::string message;

    Any onEvent(const InstallApi::UpdateConfigFinished& cmd, InstallerEngine& engine);
    Any onEvent(const InstallApi::UpdateConfig& cmd, InstallerEngine& engine);

    bool operator==(const SelectDiskError&) const = default;
    static constexpr const char* name() { return "SelectDiskError"; }
};

} // namespace State
} // namespace Installer
} // namespace NixBlitz
