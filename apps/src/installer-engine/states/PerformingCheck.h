#pragma once

#include "StateForward.h"

namespace NixBlitz {
namespace Installer {
namespace State {

struct PerformingCheck {
    bool operator==(const PerformingCheck&) const = default;
    static constexpr const char* name() { return "PerformingCheck"; }
};

} // namespace State
} // namespace Installer
} // namespace NixBlitz
