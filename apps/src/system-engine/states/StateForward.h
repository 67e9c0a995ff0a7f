#pragma once

namespace NixBlitz {
namespace System {

class SystemEngine;

namespace State {

struct Idle;
struct Switching;
struct UpdateFailed;
struct UpdateSucceeded;

class Any;

} // namespace State
} // namespace System
} // namespace NixBlitz
