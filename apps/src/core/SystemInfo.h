#pragma once

#include "ApiError.h"
#include "Result.h"
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace NixBlitz {

struct Cpu {
    std::string name;
    float cpu_usage = 0.0f;
    // MHz.
    uint64_t frequency = 0;
    std::string vendor_id;
    std::string brand;

    bool operator==(const Cpu&) const = default;
};

struct SystemSummary {
    // Bytes.
    uint64_t total_memory = 0;
    uint64_t used_memory = 0;
    uint64_t total_swap = 0;
    uint64_t used_swap = 0;

    std::string os_name;
    std::string os_version;
    std::string kernel_version;
    std::string hostname;

    std::vector<Cpu> cpus;

    bool operator==(const SystemSummary&) const = default;
};

enum class ProcessStatus {
    Idle,
    Run,
    Sleep,
    Stop,
    Zombie,
    Tracing,
    Dead,
    Wakekill,
    Waking,
    Parked,
    LockBlocked,
    UninterruptibleDiskSleep,
    Unknown
};

struct ProcessInfo {
    uint32_t pid = 0;
    std::string name;
    std::vector<std::string> command;
    float cpu_usage = 0.0f;
    // Bytes.
    uint64_t memory = 0;
    uint64_t virtual_memory = 0;
    ProcessStatus status = ProcessStatus::Unknown;
    std::optional<uint32_t> parent_pid;
    std::optional<std::string> user_id;
    // Seconds since the Unix epoch.
    uint64_t start_time = 0;
    // Seconds.
    uint64_t run_time = 0;

    bool operator==(const ProcessInfo&) const = default;
};

struct ProcessList {
    std::vector<ProcessInfo> processes;

    bool operator==(const ProcessList&) const = default;
};

struct CheckResult {
    SystemSummary summary;
    bool is_compatible = false;
    std::vector<std::string> issues;

    bool operator==(const CheckResult&) const = default;
};

struct DiskInfo {
    std::string name;
    std::string path;
    uint64_t size_bytes = 0;
    std::vector<std::string> mount_points;
    bool is_removable = false;
    bool is_live_system = false;

    bool operator==(const DiskInfo&) const = default;
};

struct PreInstallConfirmData {
    std::vector<std::string> apps;
    std::string disk;

    bool operator==(const PreInstallConfirmData&) const = default;
};

void to_json(nlohmann::json& j, const Cpu& cpu);
void from_json(const nlohmann::json& j, Cpu& cpu);
void to_json(nlohmann::json& j, const SystemSummary& summary);
void from_json(const nlohmann::json& j, SystemSummary& summary);
void to_json(nlohmann::json& j, const ProcessInfo& process);
void from_json(const nlohmann::json& j, ProcessInfo& process);
void to_json(nlohmann::json& j, const ProcessList& list);
void from_json(const nlohmann::json& j, ProcessList& list);
void to_json(nlohmann::json& j, const CheckResult& result);
void from_json(const nlohmann::json& j, CheckResult& result);
void to_json(nlohmann::json& j, const DiskInfo& disk);
void from_json(const nlohmann::json& j, DiskInfo& disk);
void to_json(nlohmann::json& j, const PreInstallConfirmData& data);
void from_json(const nlohmann::json& j, PreInstallConfirmData& data);

namespace SystemInfo {

constexpr uint64_t kMinRamMb = 8192;
constexpr size_t kMinCpuCores = 4;

// Reads /proc/meminfo, /proc/cpuinfo, /etc/os-release and uname().
SystemSummary collectSummary();

// Walks /proc/<pid>.
ProcessList collectProcesses();

// Hardware requirements for an installation target.
CheckResult performSystemCheck(const SystemSummary& summary);

// Block devices of type "disk", from `lsblk -J -b`.
Result<std::vector<DiskInfo>, ApiError> listDisks();

Result<std::vector<DiskInfo>, ApiError> parseLsblkJson(const std::string& text);

} // namespace SystemInfo
} // namespace NixBlitz
