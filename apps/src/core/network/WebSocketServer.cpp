#include "WebSocketServer.h"
#include "core/LoggingChannels.h"

namespace NixBlitz {
namespace Network {

RtcConnection::RtcConnection(std::shared_ptr<rtc::WebSocket> ws, std::string id)
    : ws_(std::move(ws)), id_(std::move(id))
{}

void RtcConnection::attach()
{
    std::weak_ptr<RtcConnection> weak = weak_from_this();

    ws_->onMessage([weak](std::variant<rtc::binary, rtc::string> data) {
        auto self = weak.lock();
        if (!self) {
            return;
        }
        if (std::holds_alternative<rtc::string>(data)) {
            self->dispatchText(std::get<rtc::string>(data));
        }
        else {
            LOG_WARN(Network, "{}: ignoring binary frame", self->id_);
        }
    });

    ws_->onClosed([weak]() {
        if (auto self = weak.lock()) {
            LOG_INFO(Network, "{}: client disconnected", self->id_);
            self->dispatchClosed();
        }
    });

    ws_->onError([weak](std::string error) {
        if (auto self = weak.lock()) {
            LOG_ERROR(Network, "{}: client error: {}", self->id_, error);
        }
    });
}

Result<std::monostate, std::string> RtcConnection::sendText(const std::string& message)
{
    if (!ws_ || !ws_->isOpen()) {
        return Result<std::monostate, std::string>::error("Connection closed");
    }

    try {
        if (!ws_->send(message)) {
            return Result<std::monostate, std::string>::error("Send buffer full");
        }
    }
    catch (const std::exception& e) {
        return Result<std::monostate, std::string>::error(std::string("Send failed: ") + e.what());
    }

    LOG_TRACE(Network, "{}: sent {} bytes", id_, message.size());
    return Result<std::monostate, std::string>::okay(std::monostate{});
}

void RtcConnection::close()
{
    if (ws_ && ws_->isOpen()) {
        ws_->close();
    }
}

bool RtcConnection::isOpen() const
{
    return ws_ && ws_->isOpen();
}

void RtcConnection::setHandlers(TextHandler onText, ClosedHandler onClosed)
{
    std::lock_guard<std::mutex> lock(handlersMutex_);
    onText_ = std::move(onText);
    onClosed_ = std::move(onClosed);
}

void RtcConnection::clearHandlers()
{
    std::lock_guard<std::mutex> lock(handlersMutex_);
    onText_ = nullptr;
    onClosed_ = nullptr;
}

void RtcConnection::dispatchText(const std::string& text)
{
    TextHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handler = onText_;
    }
    if (handler) {
        handler(text);
    }
}

void RtcConnection::dispatchClosed()
{
    ClosedHandler handler;
    {
        std::lock_guard<std::mutex> lock(handlersMutex_);
        handler = onClosed_;
    }
    if (handler) {
        handler();
    }
}

WebSocketServer::~WebSocketServer()
{
    stop();
}

Result<std::monostate, std::string> WebSocketServer::listen(
    uint16_t port, const std::string& bindAddress, ConnectCallback onConnect)
{
    try {
        LOG_INFO(Network, "Starting server on {}:{}", bindAddress, port);

        rtc::WebSocketServerConfiguration config;
        config.port = port;
        config.bindAddress = bindAddress;
        config.enableTls = false;
        config.maxMessageSize = 1024 * 1024;

        onConnect_ = std::move(onConnect);
        server_ = std::make_unique<rtc::WebSocketServer>(config);
        server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) { onClientConnected(ws); });

        LOG_INFO(Network, "Listening on ws://{}:{}/ws", bindAddress, port);
        return Result<std::monostate, std::string>::okay(std::monostate{});
    }
    catch (const std::exception& e) {
        server_.reset();
        return Result<std::monostate, std::string>::error(
            std::string("Failed to start server: ") + e.what());
    }
}

void WebSocketServer::stop()
{
    if (!server_) {
        return;
    }

    server_->onClient([](std::shared_ptr<rtc::WebSocket>) {});
    server_->stop();
    server_.reset();
    LOG_INFO(Network, "Server stopped");
}

void WebSocketServer::onClientConnected(std::shared_ptr<rtc::WebSocket> ws)
{
    const std::string id = "ws-" + std::to_string(nextConnectionId_.fetch_add(1));

    ws->onOpen([this, ws, id]() {
        const auto remote = ws->remoteAddress();
        LOG_INFO(Network, "{}: client connected from {}", id, remote.value_or("unknown"));

        auto connection = std::make_shared<RtcConnection>(ws, id);
        connection->attach();
        if (onConnect_) {
            onConnect_(connection);
        }
    });
}

} // namespace Network
} // namespace NixBlitz
