#pragma once

#include "core/Result.h"
#include <functional>
#include <string>
#include <variant>

namespace NixBlitz {
namespace Network {

/**
 * @brief One observer's transport, as seen by a session.
 *
 * Allows dependency injection of fake connections for testing.
 */
class Connection {
public:
    using TextHandler = std::function<void(const std::string&)>;
    using ClosedHandler = std::function<void()>;

    virtual ~Connection() = default;

    virtual Result<std::monostate, std::string> sendText(const std::string& message) = 0;
    virtual void close() = 0;
    virtual bool isOpen() const = 0;

    // Stable label for logs ("ws-3").
    virtual std::string id() const = 0;

    // Inbound text frames and the close notification. Set once, before traffic starts.
    virtual void setHandlers(TextHandler onText, ClosedHandler onClosed) = 0;

    // Drops the handlers so no callback outlives the session.
    virtual void clearHandlers() = 0;
};

} // namespace Network
} // namespace NixBlitz
