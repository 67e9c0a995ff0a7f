#pragma once

#include "Connection.h"
#include "core/ApiError.h"
#include "core/EventBus.h"
#include "core/LoggingChannels.h"
#include "core/Result.h"
#include "core/StateStore.h"
#include <atomic>
#include <concepts>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <type_traits>
#include <utility>
#include <variant>

namespace NixBlitz {
namespace Network {

/**
 * @brief Wire vocabulary of one engine, as needed by an observer session.
 */
template <typename P>
concept ObserverProtocol = requires(
    const typename P::State& state, const typename P::Event& event, const std::string& text) {
    { P::snapshotEvent(state) } -> std::same_as<typename P::Event>;
    { P::encode(event) } -> std::convertible_to<std::string>;
    { P::decode(text) } -> std::same_as<Result<typename P::Command, ApiError>>;
};

/**
 * @brief One connected observer.
 *
 * start() snapshots the state and subscribes to the bus under the state store lock, so the
 * snapshot is followed by exactly the events published after it. The snapshot goes out
 * first as a StateChanged event, then an outbound thread forwards bus events until the
 * subscription closes or a write fails. Inbound frames are decoded on the transport's
 * thread and handed to the command sink; undecodable frames are logged and dropped.
 */
template <ObserverProtocol Protocol>
class ObserverSession : public std::enable_shared_from_this<ObserverSession<Protocol>> {
public:
    using State = typename Protocol::State;
    using Event = typename Protocol::Event;
    using Command = typename Protocol::Command;
    using CommandSink = std::function<void(Command)>;
    using EndedCallback = std::function<void(const std::string& connectionId)>;

    ObserverSession(
        std::shared_ptr<Connection> connection,
        StateStore<State>& store,
        EventBus<Event>& bus,
        CommandSink commandSink,
        EndedCallback onEnded = {})
        : connection_(std::move(connection)),
          store_(store),
          bus_(bus),
          commandSink_(std::move(commandSink)),
          onEnded_(std::move(onEnded))
    {}

    ~ObserverSession()
    {
        onEnded_ = nullptr;
        close();
    }

    ObserverSession(const ObserverSession&) = delete;
    ObserverSession& operator=(const ObserverSession&) = delete;

    void start()
    {
        std::weak_ptr<ObserverSession> weak = this->weak_from_this();
        connection_->setHandlers(
            [weak](const std::string& text) {
                if (auto self = weak.lock()) {
                    self->handleText(text);
                }
            },
            [weak]() {
                if (auto self = weak.lock()) {
                    self->close();
                }
            });

        std::optional<State> snapshot;
        subscription_ = store_.read([this, &snapshot](const State& current) {
            snapshot = current;
            return bus_.subscribe();
        });

        if (!send(Protocol::snapshotEvent(snapshot.value()))) {
            close();
            return;
        }

        LOG_INFO(Network, "{}: observer session started", connection_->id());
        // The thread keeps the session alive until the loop has fully unwound.
        outbound_ = std::thread([self = this->shared_from_this()] { self->outboundLoop(); });
    }

    void handleText(const std::string& text)
    {
        if (closed_.load()) {
            return;
        }

        auto command = Protocol::decode(text);
        if (command.isError()) {
            LOG_WARN(
                Network,
                "{}: dropping undecodable message: {}",
                connection_->id(),
                command.errorValue().message);
            return;
        }

        LOG_DEBUG(Network, "{}: received {}", connection_->id(), text);
        commandSink_(std::move(command.value()));
    }

    // Ends both directions. Safe to call from any thread, more than once.
    void close()
    {
        if (closed_.exchange(true)) {
            return;
        }

        if (subscription_) {
            subscription_->close();
        }
        connection_->clearHandlers();
        connection_->close();

        if (outbound_.joinable()) {
            if (outbound_.get_id() == std::this_thread::get_id()) {
                outbound_.detach();
            }
            else {
                outbound_.join();
            }
        }

        LOG_INFO(Network, "{}: observer session ended", connection_->id());
        if (onEnded_) {
            onEnded_(connection_->id());
        }
    }

    bool isClosed() const { return closed_.load(); }

    std::string id() const { return connection_->id(); }

private:
    void outboundLoop()
    {
        while (true) {
            auto item = subscription_->receive();
            if (std::holds_alternative<Closed>(item)) {
                break;
            }
            if (const auto* lagged = std::get_if<Lagged>(&item)) {
                LOG_WARN(
                    Network,
                    "{}: observer lagged, {} events skipped",
                    connection_->id(),
                    lagged->skipped);
                continue;
            }
            if (!send(std::get<Event>(item))) {
                break;
            }
        }

        if (!closed_.load()) {
            // The write side failed; tear down the inbound side too.
            close();
        }
    }

    bool send(const Event& event)
    {
        std::string text;
        try {
            text = Protocol::encode(event);
        }
        catch (const std::exception& e) {
            LOG_ERROR(Network, "{}: failed to encode event: {}", connection_->id(), e.what());
            return false;
        }

        auto result = connection_->sendText(text);
        if (result.isError()) {
            LOG_WARN(Network, "{}: write failed: {}", connection_->id(), result.errorValue());
            return false;
        }
        return true;
    }

    std::shared_ptr<Connection> connection_;
    StateStore<State>& store_;
    EventBus<Event>& bus_;
    CommandSink commandSink_;
    EndedCallback onEnded_;
    std::shared_ptr<Subscription<Event>> subscription_;
    std::thread outbound_;
    std::atomic<bool> closed_{ false };
};

} // namespace Network
} // namespace NixBlitz
