#include "core/EngineEnvironment.h"
#include "system-engine/SystemConfig.h"

#include <gtest/gtest.h>

#include <cstdlib>

using namespace NixBlitz;

class EngineEnvironmentTest : public ::testing::Test {
protected:
    void TearDown() override
    {
        for (const char* name : { "NIXBLITZ_WORK_DIR", "NIXBLITZ_DEMO", "IP", "PORT" }) {
            ::unsetenv(name);
        }
    }
};

TEST_F(EngineEnvironmentTest, UnsetVariablesKeepConfig)
{
    System::SystemConfig config;
    config.work_dir = "/from/file";

    applyEnvironmentOverrides(config);

    EXPECT_EQ(config.work_dir, "/from/file");
    EXPECT_EQ(config.port, 3000);
    EXPECT_FALSE(config.demo);
}

TEST_F(EngineEnvironmentTest, VariablesOverrideConfig)
{
    ::setenv("NIXBLITZ_WORK_DIR", "/home/admin/nixblitz", 1);
    ::setenv("NIXBLITZ_DEMO", "1", 1);
    ::setenv("IP", "0.0.0.0", 1);
    ::setenv("PORT", "3100", 1);
    System::SystemConfig config;

    applyEnvironmentOverrides(config);

    EXPECT_EQ(config.work_dir, "/home/admin/nixblitz");
    EXPECT_TRUE(config.demo);
    EXPECT_EQ(config.bind_address, "0.0.0.0");
    EXPECT_EQ(config.port, 3100);
}

TEST_F(EngineEnvironmentTest, InvalidPortIsIgnored)
{
    System::SystemConfig config;

    ::setenv("PORT", "http", 1);
    applyEnvironmentOverrides(config);
    EXPECT_EQ(config.port, 3000);

    ::setenv("PORT", "70000", 1);
    applyEnvironmentOverrides(config);
    EXPECT_EQ(config.port, 3000);
}
