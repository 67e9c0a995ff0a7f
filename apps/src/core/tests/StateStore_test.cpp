#include "core/StateStore.h"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace NixBlitz;

TEST(StateStoreTest, ReplaceRunsCommitWithNewValue)
{
    StateStore<std::string> store("Idle");
    std::vector<std::string> committed;

    store.replace("Switching", [&committed](const std::string& s) { committed.push_back(s); });

    EXPECT_EQ(store.read(), "Switching");
    EXPECT_EQ(committed, std::vector<std::string>{ "Switching" });
}

TEST(StateStoreTest, UpdateCommitsOnlyWhenChanged)
{
    StateStore<int> store(1);
    int commits = 0;
    const auto onCommit = [&commits](const int&) { ++commits; };

    EXPECT_FALSE(store.update([](int&) { return false; }, onCommit));
    EXPECT_TRUE(store.update(
        [](int& value) {
            value = 2;
            return true;
        },
        onCommit));

    EXPECT_EQ(store.read(), 2);
    EXPECT_EQ(commits, 1);
}

TEST(StateStoreTest, ReadWithFunctionSeesConsistentValue)
{
    StateStore<std::string> store("Idle");

    const auto length = store.read([](const std::string& s) { return s.size(); });

    EXPECT_EQ(length, 4u);
}

TEST(StateStoreTest, ConcurrentUpdatesAreNotLost)
{
    StateStore<int> store(0);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&store] {
            for (int i = 0; i < 1000; ++i) {
                store.update([](int& value) {
                    ++value;
                    return true;
                });
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(store.read(), 4000);
}
