// === WebSocket Transport =====================================================
//
// PushTransport over a plain `ws://` WebSocket using Boost.Beast. Each
// connection runs its own io_context on a dedicated I/O thread; writes are
// serialized through that context.

#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "freight_tracking/logging.hpp"
#include "freight_tracking/push_transport.hpp"

namespace freight_tracking {

/** @brief Parsed `ws://host[:port][/path]` endpoint. */
struct WebSocketEndpoint final {
    std::string host{};
    std::uint16_t port{80};
    std::string target{"/"};
};

/** @brief Parse a `ws://` URL; throws std::invalid_argument otherwise. */
[[nodiscard]] WebSocketEndpoint parse_websocket_url(const std::string& url);

class WebSocketTransport final : public PushTransport {
  public:
    explicit WebSocketTransport(const std::string& url);
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;

    void set_handlers(TransportHandlers handlers) override;
    void connect() override;
    void send(const std::string& frame) override;
    void close() override;

    [[nodiscard]] const WebSocketEndpoint& endpoint() const noexcept { return endpoint_; }

  private:
    class Connection;

    WebSocketEndpoint endpoint_;
    std::mutex mutex_;
    TransportHandlers handlers_;
    std::shared_ptr<Connection> connection_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace freight_tracking
