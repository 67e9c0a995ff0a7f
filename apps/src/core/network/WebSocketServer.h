#pragma once

#include "Connection.h"
#include "core/Result.h"
#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <rtc/rtc.hpp>
#include <string>
#include <variant>

namespace NixBlitz {
namespace Network {

/**
 * @brief Connection backed by a libdatachannel WebSocket.
 *
 * The socket's callbacks only hold a weak reference back to this object, so dropping the
 * last shared_ptr releases it even while the socket is still open.
 */
class RtcConnection : public Connection, public std::enable_shared_from_this<RtcConnection> {
public:
    RtcConnection(std::shared_ptr<rtc::WebSocket> ws, std::string id);

    Result<std::monostate, std::string> sendText(const std::string& message) override;
    void close() override;
    bool isOpen() const override;
    std::string id() const override { return id_; }
    void setHandlers(TextHandler onText, ClosedHandler onClosed) override;
    void clearHandlers() override;

    // Wires the socket callbacks. Called once by the server after construction.
    void attach();

private:
    void dispatchText(const std::string& text);
    void dispatchClosed();

    std::shared_ptr<rtc::WebSocket> ws_;
    const std::string id_;
    mutable std::mutex handlersMutex_;
    TextHandler onText_;
    ClosedHandler onClosed_;
};

/**
 * @brief Plain WebSocket listener (ws://, no TLS).
 *
 * Every client that completes the handshake is handed to the connect callback as an
 * RtcConnection. Binary frames are ignored; the protocol is JSON text only.
 */
class WebSocketServer {
public:
    using ConnectCallback = std::function<void(std::shared_ptr<Connection>)>;

    WebSocketServer() = default;
    ~WebSocketServer();

    WebSocketServer(const WebSocketServer&) = delete;
    WebSocketServer& operator=(const WebSocketServer&) = delete;

    Result<std::monostate, std::string> listen(
        uint16_t port, const std::string& bindAddress, ConnectCallback onConnect);

    void stop();

    bool isListening() const { return server_ != nullptr; }

private:
    void onClientConnected(std::shared_ptr<rtc::WebSocket> ws);

    std::unique_ptr<rtc::WebSocketServer> server_;
    ConnectCallback onConnect_;
    std::atomic<uint64_t> nextConnectionId_{ 1 };
};

} // namespace Network
} // namespace NixBlitz
