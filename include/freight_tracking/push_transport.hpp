// === Push Transport ==========================================================
//
// Minimal bidirectional text-frame connection to the upstream tracking
// source. The subscription hub owns exactly one and drives it from its worker
// thread.

#pragma once

#include <functional>
#include <memory>
#include <string>
#include <string_view>

namespace freight_tracking {

/** @brief Callbacks a transport invokes from its own I/O thread. */
struct TransportHandlers final {
    std::function<void(std::string_view)> on_message{};  /**< One inbound text frame. */
    std::function<void(std::string_view)> on_close{};    /**< Established connection lost; argument is the reason. */
};

class PushTransport {
  public:
    virtual ~PushTransport() = default;

    /** @brief Handlers used by the next connect(); earlier connections keep theirs. */
    virtual void set_handlers(TransportHandlers handlers) = 0;

    /**
     * @brief Open the connection, blocking until it is usable.
     *
     * Throws ConnectionError on failure. Inbound frames are delivered to
     * on_message until the connection closes.
     */
    virtual void connect() = 0;

    /** @brief Queue one text frame; throws ConnectionError when not connected. */
    virtual void send(const std::string& frame) = 0;

    /** @brief Close the current connection, if any. on_close is not invoked. */
    virtual void close() = 0;
};

using PushTransportPtr = std::shared_ptr<PushTransport>;

}  // namespace freight_tracking
