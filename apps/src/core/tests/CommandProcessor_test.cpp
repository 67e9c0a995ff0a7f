#include "core/CommandProcessor.h"

#include <gtest/gtest.h>

#include <string>
#include <thread>
#include <vector>

using namespace NixBlitz;

namespace {

struct TestCommand {
    std::string text;
};

std::string getCommandName(const TestCommand& command)
{
    return command.text;
}

struct RecordingEngine {
    void handleEvent(const TestCommand& command) { handled.push_back(command.text); }

    std::vector<std::string> handled;
};

} // namespace

TEST(CommandProcessorTest, DrainHandlesCommandsInArrivalOrder)
{
    CommandProcessor<TestCommand> processor;
    RecordingEngine engine;

    processor.enqueue(TestCommand{ "first" });
    processor.enqueue(TestCommand{ "second" });
    processor.drainInto(engine);

    EXPECT_EQ(engine.handled, (std::vector<std::string>{ "first", "second" }));

    processor.drainInto(engine);
    EXPECT_EQ(engine.handled.size(), 2u);
}

TEST(CommandProcessorTest, CommandsFromOtherThreadsAllArrive)
{
    CommandProcessor<TestCommand> processor;
    RecordingEngine engine;

    std::vector<std::thread> sessions;
    for (int session = 0; session < 4; ++session) {
        sessions.emplace_back([&processor, session] {
            for (int i = 0; i < 25; ++i) {
                processor.enqueue(TestCommand{ std::to_string(session) });
            }
        });
    }
    for (auto& thread : sessions) {
        thread.join();
    }
    processor.drainInto(engine);

    EXPECT_EQ(engine.handled.size(), 100u);
}

TEST(CommandProcessorTest, ClosedProcessorDropsNewCommands)
{
    CommandProcessor<TestCommand> processor;
    RecordingEngine engine;

    processor.enqueue(TestCommand{ "kept" });
    processor.close();
    processor.enqueue(TestCommand{ "dropped" });
    processor.drainInto(engine);

    EXPECT_EQ(engine.handled, (std::vector<std::string>{ "kept" }));
}
