#include "core/SystemInfo.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <algorithm>
#include <unistd.h>

using namespace NixBlitz;

namespace {

SystemSummary summaryWith(uint64_t memoryMb, size_t cores)
{
    SystemSummary summary;
    summary.total_memory = memoryMb * 1024 * 1024;
    summary.cpus.resize(cores);
    return summary;
}

} // namespace

TEST(SystemCheckTest, MeetsRequirements)
{
    const auto result = SystemInfo::performSystemCheck(summaryWith(16384, 8));

    EXPECT_TRUE(result.is_compatible);
    EXPECT_TRUE(result.issues.empty());
    EXPECT_EQ(result.summary.cpus.size(), 8u);
}

TEST(SystemCheckTest, ExactMinimumPasses)
{
    const auto result = SystemInfo::performSystemCheck(
        summaryWith(SystemInfo::kMinRamMb, SystemInfo::kMinCpuCores));

    EXPECT_TRUE(result.is_compatible);
}

TEST(SystemCheckTest, ReportsEveryShortfall)
{
    const auto result = SystemInfo::performSystemCheck(summaryWith(2048, 1));

    EXPECT_FALSE(result.is_compatible);
    ASSERT_EQ(result.issues.size(), 2u);
    EXPECT_EQ(result.issues[0], "Insufficient RAM: 2048 MB found, 8192 MB required.");
    EXPECT_EQ(result.issues[1], "Insufficient CPU cores: 1 found, 4 required.");
}

TEST(LsblkParserTest, KeepsOnlyDisksAndDetectsLiveMedium)
{
    const std::string output = R"({
        "blockdevices": [
            {"name": "loop0", "path": "/dev/loop0", "size": 1000, "type": "loop", "rm": false,
             "mountpoint": "/nix/.ro-store"},
            {"name": "sda", "path": "/dev/sda", "size": 32010928128, "type": "disk", "rm": true,
             "mountpoint": null,
             "children": [
                {"name": "sda1", "path": "/dev/sda1", "size": 1000, "type": "part", "rm": true,
                 "mountpoint": "/iso"}
             ]},
            {"name": "nvme0n1", "path": "/dev/nvme0n1", "size": "1000204886016", "type": "disk",
             "rm": "0", "mountpoint": null}
        ]
    })";

    const auto result = SystemInfo::parseLsblkJson(output);

    ASSERT_TRUE(result.isValue()) << result.errorValue().message;
    const auto& disks = result.value();
    ASSERT_EQ(disks.size(), 2u);

    EXPECT_EQ(disks[0].name, "sda");
    EXPECT_EQ(disks[0].path, "/dev/sda");
    EXPECT_EQ(disks[0].size_bytes, 32010928128ull);
    EXPECT_TRUE(disks[0].is_removable);
    EXPECT_EQ(disks[0].mount_points, std::vector<std::string>{ "/iso" });
    EXPECT_TRUE(disks[0].is_live_system);

    EXPECT_EQ(disks[1].path, "/dev/nvme0n1");
    EXPECT_EQ(disks[1].size_bytes, 1000204886016ull);
    EXPECT_FALSE(disks[1].is_removable);
    EXPECT_TRUE(disks[1].mount_points.empty());
    EXPECT_FALSE(disks[1].is_live_system);
}

TEST(LsblkParserTest, PathDefaultsFromName)
{
    const auto result = SystemInfo::parseLsblkJson(
        R"({"blockdevices": [{"name": "vda", "size": 10, "type": "disk", "rm": 0}]})");

    ASSERT_TRUE(result.isValue());
    ASSERT_EQ(result.value().size(), 1u);
    EXPECT_EQ(result.value()[0].path, "/dev/vda");
}

TEST(LsblkParserTest, RejectsMalformedOutput)
{
    const auto garbage = SystemInfo::parseLsblkJson("lsblk: command not found");
    ASSERT_TRUE(garbage.isError());
    EXPECT_EQ(garbage.errorValue().message.rfind("Failed to parse lsblk output: ", 0), 0u);

    EXPECT_TRUE(SystemInfo::parseLsblkJson(R"({"devices": []})").isError());
}

TEST(SystemInfoTest, SummarySerializesWithFieldNames)
{
    SystemSummary summary = summaryWith(8192, 1);
    summary.hostname = "nixblitz";
    summary.cpus[0].brand = "Test CPU";

    const nlohmann::json j = summary;

    EXPECT_EQ(j["hostname"], "nixblitz");
    EXPECT_EQ(j["total_memory"], 8192ull * 1024 * 1024);
    EXPECT_EQ(j["cpus"][0]["brand"], "Test CPU");
    EXPECT_EQ(j.get<SystemSummary>(), summary);
}

TEST(SystemInfoTest, CollectSummaryReadsThisMachine)
{
    const auto summary = SystemInfo::collectSummary();

    EXPECT_GT(summary.total_memory, 0u);
    EXPECT_FALSE(summary.cpus.empty());
    EXPECT_FALSE(summary.kernel_version.empty());
}

TEST(SystemInfoTest, CollectProcessesFindsSelf)
{
    const auto list = SystemInfo::collectProcesses();

    const auto self = static_cast<uint32_t>(::getpid());
    const bool found = std::any_of(list.processes.begin(), list.processes.end(),
        [self](const ProcessInfo& process) { return process.pid == self; });
    EXPECT_TRUE(found);
}
