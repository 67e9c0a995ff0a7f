#pragma once

namespace NixBlitz {
namespace Installer {

class InstallerEngine;

namespace State {

struct Idle;
struct InstallFailed;
struct InstallSucceeded;
struct Installing;
struct PerformingCheck;
struct PreInstallConfirm;
struct SelectDiskError;
struct SelectInstallDisk;
struct SystemCheckCompleted;
struct UpdateConfig;

class Any;

} // namespace State
} // namespace Installer
} // namespace NixBlitz
