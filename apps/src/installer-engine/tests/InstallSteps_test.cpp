#include "installer-engine/InstallSteps.h"
#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using namespace NixBlitz;
using namespace NixBlitz::Installer;

TEST(InstallStepsTest, InitialStepsAreAllWaitingInOrder)
{
    const auto steps = initialInstallSteps();

    ASSERT_EQ(steps.size(), kStepOrder.size());
    for (size_t i = 0; i < steps.size(); ++i) {
        EXPECT_EQ(steps[i].name, kStepOrder[i]);
        EXPECT_TRUE(std::holds_alternative<StepWaiting>(steps[i].status));
    }
}

TEST(InstallStepsTest, OnlyForwardMovesAreLegal)
{
    EXPECT_TRUE(isLegalStepMove(StepWaiting{}, StepInProgress{}));
    EXPECT_TRUE(isLegalStepMove(StepInProgress{}, StepDone{}));
    EXPECT_TRUE(isLegalStepMove(StepInProgress{}, StepFailed{ "boom" }));

    EXPECT_FALSE(isLegalStepMove(StepWaiting{}, StepDone{}));
    EXPECT_FALSE(isLegalStepMove(StepDone{}, StepInProgress{}));
    EXPECT_FALSE(isLegalStepMove(StepFailed{ "boom" }, StepDone{}));
    EXPECT_FALSE(isLegalStepMove(StepInProgress{}, StepWaiting{}));
}

TEST(StepTrackerTest, BeginStartsFirstStep)
{
    StepTracker tracker;

    const auto updates = tracker.begin();

    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].name, StepName::Deps);
    EXPECT_EQ(tracker.current().value_or(StepName::Bootloader), StepName::Deps);
}

TEST(StepTrackerTest, LandmarkAdvancesToMatchingStep)
{
    StepTracker tracker;
    tracker.begin();

    const auto updates = tracker.observeLine("these 12 derivations will be built:");

    ASSERT_EQ(updates.size(), 2u);
    EXPECT_EQ(updates[0].name, StepName::Deps);
    EXPECT_TRUE(std::holds_alternative<StepDone>(updates[0].status));
    EXPECT_EQ(updates[1].name, StepName::Build);
    EXPECT_TRUE(std::holds_alternative<StepInProgress>(updates[1].status));
    EXPECT_EQ(tracker.current().value_or(StepName::Bootloader), StepName::Build);
}

TEST(StepTrackerTest, UnrelatedAndEarlierLandmarksAreIgnored)
{
    StepTracker tracker;
    tracker.begin();
    tracker.observeLine("+ sgdisk --zap-all /dev/sda");

    EXPECT_TRUE(tracker.observeLine("building '/nix/store/abc-foo.drv'...").empty());
    EXPECT_TRUE(tracker.observeLine("unpacking 'github:NixOS/nixpkgs'").empty());
    EXPECT_EQ(tracker.current().value_or(StepName::Bootloader), StepName::Disk);
}

TEST(StepTrackerTest, SkippedStepsAreCompleted)
{
    StepTracker tracker;
    tracker.begin();

    const auto updates = tracker.observeLine("Copying store paths to /mnt");

    // Deps finishes, Build, Disk and Mount pass through InProgress to Done, Copy starts.
    ASSERT_EQ(updates.size(), 8u);
    EXPECT_EQ(updates[0].name, StepName::Deps);
    EXPECT_TRUE(std::holds_alternative<StepDone>(updates[0].status));
    EXPECT_EQ(updates[1].name, StepName::Build);
    EXPECT_TRUE(std::holds_alternative<StepInProgress>(updates[1].status));
    EXPECT_EQ(updates[2].name, StepName::Build);
    EXPECT_TRUE(std::holds_alternative<StepDone>(updates[2].status));
    EXPECT_EQ(updates.back().name, StepName::Copy);
    for (const auto& step : tracker.steps()) {
        if (step.name < StepName::Copy) {
            EXPECT_TRUE(std::holds_alternative<StepDone>(step.status));
        }
    }
    EXPECT_TRUE(std::holds_alternative<StepWaiting>(tracker.steps().back().status));
}

TEST(StepTrackerTest, FinishAllCompletesRemainingSteps)
{
    StepTracker tracker;
    tracker.begin();
    tracker.observeLine("mount /dev/disk/by-partlabel/disk-main-root /mnt");

    const auto updates = tracker.finishAll();

    ASSERT_EQ(updates.size(), 5u);
    EXPECT_EQ(updates[0].name, StepName::Mount);
    EXPECT_EQ(updates[1].name, StepName::Copy);
    EXPECT_TRUE(std::holds_alternative<StepInProgress>(updates[1].status));
    EXPECT_EQ(updates[2].name, StepName::Copy);
    EXPECT_TRUE(std::holds_alternative<StepDone>(updates[2].status));
    EXPECT_EQ(updates[4].name, StepName::Bootloader);
    for (const auto& step : tracker.steps()) {
        EXPECT_TRUE(std::holds_alternative<StepDone>(step.status));
    }
    EXPECT_FALSE(tracker.current().has_value());
}

TEST(StepTrackerTest, CachedBuildStillReportsBuildInProgress)
{
    StepTracker tracker;
    tracker.begin();

    // No "derivations will be built" line when everything is already in the store.
    const auto updates = tracker.observeLine("+ sgdisk --zap-all /dev/sda");

    std::vector<std::string> buildStatuses;
    for (const auto& step : updates) {
        if (step.name == StepName::Build) {
            buildStatuses.push_back(statusName(step.status));
        }
    }
    EXPECT_EQ(buildStatuses, (std::vector<std::string>{ "InProgress", "Done" }));
}

TEST(StepTrackerTest, FailCurrentMarksActiveStep)
{
    StepTracker tracker;
    tracker.begin();
    tracker.observeLine("these 3 derivations will be built:");

    const auto updates = tracker.failCurrent("exit code 1");

    ASSERT_EQ(updates.size(), 1u);
    EXPECT_EQ(updates[0].name, StepName::Build);
    const auto* failed = std::get_if<StepFailed>(&updates[0].status);
    ASSERT_NE(failed, nullptr);
    EXPECT_EQ(failed->reason, "exit code 1");
    EXPECT_TRUE(tracker.failCurrent("again").empty());
}

TEST(StepTrackerTest, IllegalSetStatusIsRejected)
{
    StepTracker tracker;

    const auto result = tracker.setStatus(StepName::Copy, StepDone{});

    ASSERT_TRUE(result.isError());
    EXPECT_TRUE(std::holds_alternative<StepWaiting>(tracker.steps()[4].status));
}

TEST(InstallStepsTest, StepSerializesNameAndTaggedStatus)
{
    const InstallStep step{ .name = StepName::Bootloader, .status = StepFailed{ "no EFI" } };

    const nlohmann::json j = step;

    EXPECT_EQ(j["name"], "Bootloader");
    EXPECT_EQ(j["status"], nlohmann::json({ { "Failed", "no EFI" } }));
    EXPECT_EQ(j.get<InstallStep>(), step);

    const nlohmann::json waiting = InstallStep{ .name = StepName::Deps };
    EXPECT_EQ(waiting["status"], "Waiting");
}
