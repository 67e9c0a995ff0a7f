#include "core/Project.h"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace NixBlitz;

class ProjectTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        dir = std::filesystem::temp_directory_path()
            / ("nixblitz-project-test-" + std::to_string(::getpid()));
        std::filesystem::create_directories(dir / "src/btc");
        std::filesystem::create_directories(dir / "src/blitz");
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);
    }

    void writeJson(const std::string& relativePath, const nlohmann::json& content)
    {
        std::ofstream out(dir / relativePath);
        out << content.dump(2);
    }

    nlohmann::json readJson(const std::string& relativePath)
    {
        std::ifstream in(dir / relativePath);
        return nlohmann::json::parse(in);
    }

    std::filesystem::path dir;
};

TEST_F(ProjectTest, EmptyProjectHasOnlyNixOS)
{
    const auto apps = Project(dir).enabledApps();

    ASSERT_TRUE(apps.isValue());
    EXPECT_EQ(apps.value(), std::vector<std::string>{ "NixOS" });
}

TEST_F(ProjectTest, EnabledAppsFollowEnableOption)
{
    writeJson("src/btc/bitcoind.json", { { "enable", { { "value", true } } } });
    writeJson("src/btc/lnd.json", { { "enable", { { "value", false } } } });
    writeJson("src/blitz/api.json", { { "enable", true } });

    const auto apps = Project(dir).enabledApps();

    ASSERT_TRUE(apps.isValue());
    EXPECT_EQ(apps.value(), (std::vector<std::string>{ "NixOS", "Bitcoin", "Blitz API" }));
}

TEST_F(ProjectTest, InvalidAppFileIsAnError)
{
    std::ofstream(dir / "src/btc/cln.json") << "{ not json";

    const auto apps = Project(dir).enabledApps();

    EXPECT_TRUE(apps.isError());
}

TEST_F(ProjectTest, MarkChangesAppliedClearsPendingFlags)
{
    writeJson(
        "src/btc/bitcoind.json",
        {
            { "enable", { { "value", true }, { "original", false }, { "dirty", true } } },
            { "rpc_port", { { "value", 8332 }, { "original", 8332 }, { "applied", true } } },
        });

    const auto result = Project(dir).markChangesApplied();

    ASSERT_TRUE(result.isValue());
    const auto json = readJson("src/btc/bitcoind.json");
    EXPECT_EQ(json["enable"]["original"], true);
    EXPECT_EQ(json["enable"]["dirty"], false);
    EXPECT_EQ(json["rpc_port"]["applied"], false);
    EXPECT_EQ(json["rpc_port"]["value"], 8332);
}
