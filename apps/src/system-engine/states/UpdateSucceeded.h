#pragma once

#include "StateForward.h"

namespace NixBlitz {
namespace System {
namespace State {

struct UpdateSucceeded {
    bool operator==(const UpdateSucceeded&) const = default;
    static constexpr const char* name() { return "UpdateSucceeded"; }
};

} // namespace State
} // namespace System
} // namespace NixBlitz
