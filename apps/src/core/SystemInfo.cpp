#include "SystemInfo.h"
#include "LoggingChannels.h"
#include "ProcessSupervisor.h"
#include "ReflectSerializer.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <sys/utsname.h>
#include <thread>
#include <unistd.h>

namespace NixBlitz {

void to_json(nlohmann::json& j, const Cpu& cpu)
{
    j = ReflectSerializer::to_json(cpu);
}

void from_json(const nlohmann::json& j, Cpu& cpu)
{
    ReflectSerializer::from_json_into(j, cpu);
}

void to_json(nlohmann::json& j, const SystemSummary& summary)
{
    j = ReflectSerializer::to_json(summary);
}

void from_json(const nlohmann::json& j, SystemSummary& summary)
{
    ReflectSerializer::from_json_into(j, summary);
}

void to_json(nlohmann::json& j, const ProcessInfo& process)
{
    j = ReflectSerializer::to_json(process);
}

void from_json(const nlohmann::json& j, ProcessInfo& process)
{
    ReflectSerializer::from_json_into(j, process);
}

void to_json(nlohmann::json& j, const ProcessList& list)
{
    j = ReflectSerializer::to_json(list);
}

void from_json(const nlohmann::json& j, ProcessList& list)
{
    ReflectSerializer::from_json_into(j, list);
}

void to_json(nlohmann::json& j, const CheckResult& result)
{
    j = ReflectSerializer::to_json(result);
}

void from_json(const nlohmann::json& j, CheckResult& result)
{
    ReflectSerializer::from_json_into(j, result);
}

void to_json(nlohmann::json& j, const DiskInfo& disk)
{
    j = ReflectSerializer::to_json(disk);
}

void from_json(const nlohmann::json& j, DiskInfo& disk)
{
    ReflectSerializer::from_json_into(j, disk);
}

void to_json(nlohmann::json& j, const PreInstallConfirmData& data)
{
    j = ReflectSerializer::to_json(data);
}

void from_json(const nlohmann::json& j, PreInstallConfirmData& data)
{
    ReflectSerializer::from_json_into(j, data);
}

namespace SystemInfo {

namespace {

constexpr auto kCpuSampleInterval = std::chrono::milliseconds(200);

struct CpuSnapshot {
    uint64_t user = 0;
    uint64_t nice = 0;
    uint64_t system = 0;
    uint64_t idle = 0;
    uint64_t iowait = 0;
    uint64_t irq = 0;
    uint64_t softirq = 0;
    uint64_t steal = 0;

    uint64_t totalActive() const { return user + nice + system + irq + softirq + steal; }
    uint64_t total() const { return totalActive() + idle + iowait; }
};

// Per-core lines of /proc/stat ("cpu0", "cpu1", ...).
std::vector<CpuSnapshot> readCoreSnapshots()
{
    std::vector<CpuSnapshot> cores;
    std::ifstream stat("/proc/stat");
    if (!stat.is_open()) {
        return cores;
    }

    std::string line;
    while (std::getline(stat, line)) {
        if (line.compare(0, 3, "cpu") != 0) {
            continue;
        }

        std::istringstream iss(line);
        std::string label;
        CpuSnapshot snap;
        iss >> label >> snap.user >> snap.nice >> snap.system >> snap.idle >> snap.iowait
            >> snap.irq >> snap.softirq >> snap.steal;
        if (!iss || label.size() <= 3) {
            continue;
        }

        const bool numeric = std::all_of(label.begin() + 3, label.end(), [](char c) {
            return std::isdigit(static_cast<unsigned char>(c)) != 0;
        });
        if (numeric) {
            cores.push_back(snap);
        }
    }
    return cores;
}

std::string trim(const std::string& text)
{
    const auto begin = text.find_first_not_of(" \t\"");
    if (begin == std::string::npos) {
        return "";
    }
    const auto end = text.find_last_not_of(" \t\"");
    return text.substr(begin, end - begin + 1);
}

// "key : value" lines as found in /proc/cpuinfo and /proc/<pid>/status.
bool splitField(const std::string& line, char separator, std::string& key, std::string& value)
{
    const auto pos = line.find(separator);
    if (pos == std::string::npos) {
        return false;
    }
    key = trim(line.substr(0, pos));
    value = trim(line.substr(pos + 1));
    return true;
}

void readMemInfo(SystemSummary& summary)
{
    std::ifstream meminfo("/proc/meminfo");
    if (!meminfo.is_open()) {
        LOG_WARN(System, "Cannot read /proc/meminfo");
        return;
    }

    uint64_t memTotal = 0;
    uint64_t memAvailable = 0;
    uint64_t swapTotal = 0;
    uint64_t swapFree = 0;

    std::string line;
    while (std::getline(meminfo, line)) {
        std::istringstream iss(line);
        std::string label;
        uint64_t kb = 0;
        iss >> label >> kb;
        if (label == "MemTotal:") {
            memTotal = kb;
        }
        else if (label == "MemAvailable:") {
            memAvailable = kb;
        }
        else if (label == "SwapTotal:") {
            swapTotal = kb;
        }
        else if (label == "SwapFree:") {
            swapFree = kb;
        }
    }

    summary.total_memory = memTotal * 1024;
    summary.used_memory = (memTotal - std::min(memAvailable, memTotal)) * 1024;
    summary.total_swap = swapTotal * 1024;
    summary.used_swap = (swapTotal - std::min(swapFree, swapTotal)) * 1024;
}

void readCpuInfo(SystemSummary& summary)
{
    std::ifstream cpuinfo("/proc/cpuinfo");
    if (!cpuinfo.is_open()) {
        LOG_WARN(System, "Cannot read /proc/cpuinfo");
        return;
    }

    std::string line;
    std::string key;
    std::string value;
    while (std::getline(cpuinfo, line)) {
        if (!splitField(line, ':', key, value)) {
            continue;
        }
        if (key == "processor") {
            Cpu cpu;
            cpu.name = "cpu" + value;
            summary.cpus.push_back(cpu);
            continue;
        }
        if (summary.cpus.empty()) {
            continue;
        }

        Cpu& cpu = summary.cpus.back();
        if (key == "model name" || key == "Model") {
            cpu.brand = value;
        }
        else if (key == "vendor_id" || key == "CPU implementer") {
            cpu.vendor_id = value;
        }
        else if (key == "cpu MHz") {
            try {
                cpu.frequency = static_cast<uint64_t>(std::stod(value));
            }
            catch (const std::exception& e) {
                LOG_DEBUG(System, "Unparseable cpu MHz '{}': {}", value, e.what());
            }
        }
    }

    // Some ARM kernels list a single "Model" line after all processors.
    if (!summary.cpus.empty()) {
        const std::string brand = summary.cpus.back().brand;
        for (auto& cpu : summary.cpus) {
            if (cpu.brand.empty()) {
                cpu.brand = brand;
            }
        }
    }
}

void sampleCpuUsage(SystemSummary& summary)
{
    const auto before = readCoreSnapshots();
    std::this_thread::sleep_for(kCpuSampleInterval);
    const auto after = readCoreSnapshots();

    const size_t count = std::min({ before.size(), after.size(), summary.cpus.size() });
    for (size_t i = 0; i < count; ++i) {
        const uint64_t totalDelta = after[i].total() - before[i].total();
        const uint64_t activeDelta = after[i].totalActive() - before[i].totalActive();
        if (totalDelta > 0) {
            summary.cpus[i].cpu_usage = static_cast<float>(
                static_cast<double>(activeDelta) / static_cast<double>(totalDelta) * 100.0);
        }
    }
}

void readOsRelease(SystemSummary& summary)
{
    std::ifstream release("/etc/os-release");
    if (!release.is_open()) {
        return;
    }

    std::string line;
    std::string key;
    std::string value;
    while (std::getline(release, line)) {
        if (!splitField(line, '=', key, value)) {
            continue;
        }
        if (key == "NAME") {
            summary.os_name = value;
        }
        else if (key == "VERSION_ID") {
            summary.os_version = value;
        }
    }
}

ProcessStatus statusFromCode(char code)
{
    switch (code) {
        case 'R':
            return ProcessStatus::Run;
        case 'S':
            return ProcessStatus::Sleep;
        case 'D':
            return ProcessStatus::UninterruptibleDiskSleep;
        case 'Z':
            return ProcessStatus::Zombie;
        case 'T':
            return ProcessStatus::Stop;
        case 't':
            return ProcessStatus::Tracing;
        case 'X':
        case 'x':
            return ProcessStatus::Dead;
        case 'K':
            return ProcessStatus::Wakekill;
        case 'W':
            return ProcessStatus::Waking;
        case 'P':
            return ProcessStatus::Parked;
        case 'I':
            return ProcessStatus::Idle;
        default:
            return ProcessStatus::Unknown;
    }
}

uint64_t readBootTime()
{
    std::ifstream stat("/proc/stat");
    std::string line;
    while (std::getline(stat, line)) {
        if (line.compare(0, 6, "btime ") == 0) {
            return std::stoull(line.substr(6));
        }
    }
    return 0;
}

std::optional<ProcessInfo> readProcess(
    const std::filesystem::path& dir, uint32_t pid, uint64_t bootTime, uint64_t now)
{
    std::ifstream statFile(dir / "stat");
    std::string stat;
    if (!statFile.is_open() || !std::getline(statFile, stat)) {
        return std::nullopt;
    }

    // The command name is parenthesised and may itself contain spaces or ')'.
    const auto open = stat.find('(');
    const auto close = stat.rfind(')');
    if (open == std::string::npos || close == std::string::npos || close < open) {
        return std::nullopt;
    }

    ProcessInfo info;
    info.pid = pid;
    info.name = stat.substr(open + 1, close - open - 1);

    // Fields after the name start at field 3 (state).
    std::istringstream rest(stat.substr(close + 2));
    std::vector<std::string> fields;
    std::string field;
    while (rest >> field) {
        fields.push_back(field);
    }
    if (fields.size() < 22) {
        return std::nullopt;
    }

    const long ticks = ::sysconf(_SC_CLK_TCK);
    const long pageSize = ::sysconf(_SC_PAGESIZE);
    try {
        info.status = statusFromCode(fields[0].empty() ? '?' : fields[0][0]);
        const uint32_t ppid = static_cast<uint32_t>(std::stoul(fields[1]));
        if (ppid != 0) {
            info.parent_pid = ppid;
        }
        const uint64_t cpuTicks = std::stoull(fields[11]) + std::stoull(fields[12]);
        const uint64_t startTicks = std::stoull(fields[19]);
        info.virtual_memory = std::stoull(fields[20]);
        info.memory = std::stoull(fields[21]) * static_cast<uint64_t>(pageSize);

        if (ticks > 0) {
            info.start_time = bootTime + startTicks / static_cast<uint64_t>(ticks);
            info.run_time = now > info.start_time ? now - info.start_time : 0;
            if (info.run_time > 0) {
                const double cpuSeconds =
                    static_cast<double>(cpuTicks) / static_cast<double>(ticks);
                info.cpu_usage = static_cast<float>(
                    cpuSeconds / static_cast<double>(info.run_time) * 100.0);
            }
        }
    }
    catch (const std::exception& e) {
        LOG_DEBUG(System, "Skipping pid {}: {}", pid, e.what());
        return std::nullopt;
    }

    std::ifstream cmdline(dir / "cmdline", std::ios::binary);
    std::string arg;
    while (std::getline(cmdline, arg, '\0')) {
        info.command.push_back(arg);
    }

    std::ifstream status(dir / "status");
    std::string line;
    std::string key;
    std::string value;
    while (std::getline(status, line)) {
        if (splitField(line, ':', key, value) && key == "Uid") {
            std::istringstream uids(value);
            std::string realUid;
            if (uids >> realUid) {
                info.user_id = realUid;
            }
            break;
        }
    }

    return info;
}

bool isLiveMount(const std::string& mountPoint)
{
    return mountPoint == "/" || mountPoint == "/iso" || mountPoint == "/nix/.ro-store"
        || mountPoint == "/boot";
}

bool jsonFlag(const nlohmann::json& value)
{
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        return text == "1" || text == "true";
    }
    if (value.is_number_integer()) {
        return value.get<int>() != 0;
    }
    return false;
}

uint64_t jsonSize(const nlohmann::json& value)
{
    if (value.is_number_unsigned() || value.is_number_integer()) {
        return value.get<uint64_t>();
    }
    if (value.is_string()) {
        return std::stoull(value.get<std::string>());
    }
    return 0;
}

void collectMountPoints(const nlohmann::json& device, std::vector<std::string>& out)
{
    for (const char* key : { "mountpoint", "mountpoints" }) {
        if (!device.contains(key)) {
            continue;
        }
        const auto& value = device.at(key);
        if (value.is_string()) {
            out.push_back(value.get<std::string>());
        }
        else if (value.is_array()) {
            for (const auto& entry : value) {
                if (entry.is_string()) {
                    out.push_back(entry.get<std::string>());
                }
            }
        }
    }

    if (device.contains("children") && device.at("children").is_array()) {
        for (const auto& child : device.at("children")) {
            collectMountPoints(child, out);
        }
    }
}

} // namespace

SystemSummary collectSummary()
{
    SystemSummary summary;
    readMemInfo(summary);
    readCpuInfo(summary);
    sampleCpuUsage(summary);
    readOsRelease(summary);

    struct utsname uts;
    if (::uname(&uts) == 0) {
        summary.kernel_version = uts.release;
        summary.hostname = uts.nodename;
    }

    LOG_DEBUG(
        System,
        "Collected summary: {} MB RAM, {} cpus, {} {}",
        summary.total_memory / 1024 / 1024,
        summary.cpus.size(),
        summary.os_name,
        summary.os_version);
    return summary;
}

ProcessList collectProcesses()
{
    ProcessList list;
    const uint64_t bootTime = readBootTime();
    const uint64_t now = static_cast<uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(
            std::chrono::system_clock::now().time_since_epoch())
            .count());

    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator("/proc", ec)) {
        const std::string name = entry.path().filename().string();
        if (name.empty() || !std::all_of(name.begin(), name.end(), [](char c) {
                return std::isdigit(static_cast<unsigned char>(c)) != 0;
            })) {
            continue;
        }

        const auto pid = static_cast<uint32_t>(std::stoul(name));
        // Processes can exit while we walk the directory.
        if (auto info = readProcess(entry.path(), pid, bootTime, now)) {
            list.processes.push_back(std::move(info.value()));
        }
    }
    if (ec) {
        LOG_WARN(System, "Cannot list /proc: {}", ec.message());
    }

    std::sort(
        list.processes.begin(), list.processes.end(), [](const auto& a, const auto& b) {
            return a.pid < b.pid;
        });
    return list;
}

CheckResult performSystemCheck(const SystemSummary& summary)
{
    CheckResult result;
    result.summary = summary;

    const uint64_t totalMb = summary.total_memory / 1024 / 1024;
    if (totalMb < kMinRamMb) {
        result.issues.push_back(
            "Insufficient RAM: " + std::to_string(totalMb) + " MB found, "
            + std::to_string(kMinRamMb) + " MB required.");
    }

    if (summary.cpus.size() < kMinCpuCores) {
        result.issues.push_back(
            "Insufficient CPU cores: " + std::to_string(summary.cpus.size()) + " found, "
            + std::to_string(kMinCpuCores) + " required.");
    }

    result.is_compatible = result.issues.empty();
    return result;
}

Result<std::vector<DiskInfo>, ApiError> parseLsblkJson(const std::string& text)
{
    using ResultType = Result<std::vector<DiskInfo>, ApiError>;

    try {
        const auto root = nlohmann::json::parse(text);
        if (!root.contains("blockdevices") || !root.at("blockdevices").is_array()) {
            return ResultType::error(ApiError("lsblk output has no blockdevices array"));
        }

        std::vector<DiskInfo> disks;
        for (const auto& device : root.at("blockdevices")) {
            if (device.value("type", std::string()) != "disk") {
                continue;
            }

            DiskInfo disk;
            disk.name = device.value("name", std::string());
            disk.path = device.value("path", "/dev/" + disk.name);
            if (device.contains("size")) {
                disk.size_bytes = jsonSize(device.at("size"));
            }
            if (device.contains("rm")) {
                disk.is_removable = jsonFlag(device.at("rm"));
            }
            collectMountPoints(device, disk.mount_points);
            disk.is_live_system =
                std::any_of(disk.mount_points.begin(), disk.mount_points.end(), isLiveMount);
            disks.push_back(std::move(disk));
        }
        return ResultType::okay(std::move(disks));
    }
    catch (const std::exception& e) {
        return ResultType::error(
            ApiError(std::string("Failed to parse lsblk output: ") + e.what()));
    }
}

Result<std::vector<DiskInfo>, ApiError> listDisks()
{
    const CommandLine command{ "lsblk", { "-J", "-b", "-o", "NAME,PATH,SIZE,TYPE,RM,MOUNTPOINT" } };

    std::string stdoutText;
    std::string stderrText;
    auto run = ProcessSupervisor::runToCompletion(command, [&](const ProcessOutput& output) {
        if (const auto* line = std::get_if<ProcessStdout>(&output)) {
            stdoutText += line->line;
            stdoutText += '\n';
        }
        else if (const auto* line = std::get_if<ProcessStderr>(&output)) {
            stderrText += line->line;
        }
    });

    if (run.isError()) {
        return Result<std::vector<DiskInfo>, ApiError>::error(run.errorValue());
    }
    if (!run.value().success()) {
        return Result<std::vector<DiskInfo>, ApiError>::error(ApiError(
            "lsblk failed with exit code " + run.value().describe() + ": " + stderrText));
    }
    return parseLsblkJson(stdoutText);
}

} // namespace SystemInfo
} // namespace NixBlitz
