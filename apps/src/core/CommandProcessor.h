#pragma once

#include "LoggingChannels.h"
#include "SynchronizedQueue.h"

namespace NixBlitz {

/**
 * @brief Serializes commands from every observer session onto the engine thread.
 *
 * Sessions call enqueue() from their own threads; the main loop calls drainInto(), which
 * hands each queued command to Engine::handleEvent in arrival order. After close(), new
 * commands are dropped.
 */
template <typename Command>
class CommandProcessor {
public:
    void enqueue(Command command)
    {
        LOG_DEBUG(State, "Enqueuing command: {}", getCommandName(command));
        queue_.push(std::move(command));
    }

    template <typename Engine>
    void drainInto(Engine& engine)
    {
        while (auto command = queue_.tryPop()) {
            LOG_DEBUG(State, "Processing command: {}", getCommandName(command.value()));
            engine.handleEvent(command.value());
        }
    }

    void close() { queue_.close(); }

private:
    SynchronizedQueue<Command> queue_;
};

} // namespace NixBlitz
