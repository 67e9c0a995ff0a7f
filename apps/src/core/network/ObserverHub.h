#pragma once

#include "ObserverSession.h"
#include "WebSocketServer.h"
#include "core/EventBus.h"
#include "core/LoggingChannels.h"
#include "core/StateStore.h"
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace NixBlitz {
namespace Network {

/**
 * @brief Accepts observers and keeps one ObserverSession per connection.
 *
 * Connections may come from the WebSocket listener or be attached directly (tests, local
 * tools). Commands from every session go to the same sink.
 */
template <ObserverProtocol Protocol>
class ObserverHub {
public:
    using Session = ObserverSession<Protocol>;

    ObserverHub(
        StateStore<typename Protocol::State>& store,
        EventBus<typename Protocol::Event>& bus,
        typename Session::CommandSink commandSink)
        : store_(store), bus_(bus), commandSink_(std::move(commandSink))
    {}

    ~ObserverHub() { stop(); }

    ObserverHub(const ObserverHub&) = delete;
    ObserverHub& operator=(const ObserverHub&) = delete;

    Result<std::monostate, std::string> listen(uint16_t port, const std::string& bindAddress)
    {
        return server_.listen(port, bindAddress, [this](std::shared_ptr<Connection> connection) {
            attach(std::move(connection));
        });
    }

    void attach(std::shared_ptr<Connection> connection)
    {
        auto session = std::make_shared<Session>(
            connection, store_, bus_, commandSink_, [this](const std::string& id) {
                std::lock_guard<std::mutex> lock(mutex_);
                sessions_.erase(id);
            });

        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions_[connection->id()] = session;
        }
        session->start();
    }

    void stop()
    {
        server_.stop();

        std::map<std::string, std::shared_ptr<Session>> sessions;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sessions.swap(sessions_);
        }
        for (auto& [id, session] : sessions) {
            session->close();
        }
    }

    size_t sessionCount() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return sessions_.size();
    }

private:
    StateStore<typename Protocol::State>& store_;
    EventBus<typename Protocol::Event>& bus_;
    typename Session::CommandSink commandSink_;
    WebSocketServer server_;
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<Session>> sessions_;
};

} // namespace Network
} // namespace NixBlitz
