#include "freight_tracking/websocket_transport.hpp"

#include <atomic>
#include <deque>
#include <exception>
#include <regex>
#include <stdexcept>
#include <thread>
#include <utility>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>
#include <fmt/format.h>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/version.hpp"

namespace freight_tracking {

namespace {

namespace asio = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;
using tcp = asio::ip::tcp;

}  // namespace

WebSocketEndpoint parse_websocket_url(const std::string& url) {
    static const std::regex k_url_pattern(R"(^ws://([^/:]+)(?::(\d{1,5}))?(/.*)?$)");

    std::smatch match;
    if (!std::regex_match(url, match, k_url_pattern)) {
        throw std::invalid_argument(fmt::format("Unsupported upstream URL '{}'; expected ws://host[:port][/path]", url));
    }

    WebSocketEndpoint endpoint{};
    endpoint.host = match[1].str();
    if (match[2].matched) {
        const unsigned long port = std::stoul(match[2].str());
        if (port == 0 || port > 65535) {
            throw std::invalid_argument(fmt::format("Port out of range in '{}'", url));
        }
        endpoint.port = static_cast<std::uint16_t>(port);
    }
    if (match[3].matched) {
        endpoint.target = match[3].str();
    }
    return endpoint;
}

// One live WebSocket session. Async operations run on io_thread_ only; the
// I/O thread holds a reference so the session outlives it even when
// shutdown() is called from a handler on that thread.
class WebSocketTransport::Connection final : public std::enable_shared_from_this<Connection> {
  public:
    Connection(TransportHandlers handlers, std::shared_ptr<spdlog::logger> logger)
        : handlers_(std::move(handlers)),
          stream_(io_context_),
          logger_(std::move(logger)) {}

    ~Connection() { shutdown(); }

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    void open(const WebSocketEndpoint& endpoint) {
        beast::error_code error;
        tcp::resolver resolver(io_context_);
        const auto results = resolver.resolve(endpoint.host, std::to_string(endpoint.port), error);
        if (error) {
            throw ConnectionError(fmt::format("Resolving {} failed: {}", endpoint.host, error.message()));
        }

        asio::connect(beast::get_lowest_layer(stream_).socket(), results, error);
        if (error) {
            throw ConnectionError(
                fmt::format("Connecting to {}:{} failed: {}", endpoint.host, endpoint.port, error.message()));
        }

        stream_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        stream_.set_option(websocket::stream_base::decorator([](websocket::request_type& request) {
            request.set(beast::http::field::user_agent, fmt::format("freight-tracking/{}", k_version));
        }));
        stream_.handshake(fmt::format("{}:{}", endpoint.host, endpoint.port), endpoint.target, error);
        if (error) {
            throw ConnectionError(fmt::format("WebSocket handshake with {}{} failed: {}",
                                              endpoint.host,
                                              endpoint.target,
                                              error.message()));
        }
        stream_.text(true);
        flag_open_.store(true);

        asio::post(io_context_, [this] { read_next(); });
        io_thread_ = std::thread([self = shared_from_this()] { self->io_context_.run(); });
    }

    void write(std::string frame) {
        if (!flag_open_.load()) {
            throw ConnectionError("WebSocket is not open");
        }
        asio::post(io_context_, [this, frame = std::move(frame)]() mutable {
            list_outbound_.push_back(std::move(frame));
            if (list_outbound_.size() == 1) {
                write_next();
            }
        });
    }

    void shutdown() {
        if (flag_closing_.exchange(true)) {
            return;
        }
        flag_open_.store(false);
        if (!io_thread_.joinable()) {
            return;
        }
        asio::post(io_context_, [this] {
            if (stream_.is_open()) {
                stream_.async_close(websocket::close_code::normal, [](beast::error_code) {});
            } else {
                beast::error_code ignored;
                beast::get_lowest_layer(stream_).socket().close(ignored);
            }
        });
        if (io_thread_.get_id() == std::this_thread::get_id()) {
            io_thread_.detach();
        } else {
            io_thread_.join();
        }
    }

  private:
    void read_next() {
        stream_.async_read(buffer_, [this](beast::error_code error, std::size_t) {
            if (error) {
                handle_read_error(error);
                return;
            }
            const std::string frame = beast::buffers_to_string(buffer_.data());
            buffer_.consume(buffer_.size());
            if (handlers_.on_message) {
                try {
                    handlers_.on_message(frame);
                } catch (const std::exception& handler_error) {
                    logger_->error(R"({{"component":"websocket_transport","event":"handler_failed","error":"{}"}})",
                                   handler_error.what());
                }
            }
            read_next();
        });
    }

    void write_next() {
        stream_.async_write(asio::buffer(list_outbound_.front()), [this](beast::error_code error, std::size_t) {
            if (error) {
                // The pending read observes the same failure and reports the drop.
                logger_->warn(R"({{"component":"websocket_transport","event":"write_failed","error":"{}"}})",
                              error.message());
                list_outbound_.clear();
                return;
            }
            list_outbound_.pop_front();
            if (!list_outbound_.empty()) {
                write_next();
            }
        });
    }

    void handle_read_error(const beast::error_code& error) {
        flag_open_.store(false);
        if (flag_closing_.load()) {
            return;
        }
        logger_->warn(R"({{"component":"websocket_transport","event":"connection_lost","error":"{}"}})",
                      error.message());
        if (handlers_.on_close) {
            try {
                handlers_.on_close(error.message());
            } catch (const std::exception& handler_error) {
                logger_->error(R"({{"component":"websocket_transport","event":"handler_failed","error":"{}"}})",
                               handler_error.what());
            }
        }
    }

    TransportHandlers handlers_;
    asio::io_context io_context_;
    websocket::stream<beast::tcp_stream> stream_;
    beast::flat_buffer buffer_;
    std::deque<std::string> list_outbound_;
    std::atomic<bool> flag_open_{false};
    std::atomic<bool> flag_closing_{false};
    std::thread io_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

WebSocketTransport::WebSocketTransport(const std::string& url)
    : endpoint_(parse_websocket_url(url)),
      logger_(get_logger()) {}

WebSocketTransport::~WebSocketTransport() {
    close();
}

void WebSocketTransport::set_handlers(TransportHandlers handlers) {
    std::lock_guard lock(mutex_);
    handlers_ = std::move(handlers);
}

void WebSocketTransport::connect() {
    std::shared_ptr<Connection> previous;
    TransportHandlers handlers;
    {
        std::lock_guard lock(mutex_);
        previous = std::move(connection_);
        handlers = handlers_;
    }
    if (previous != nullptr) {
        previous->shutdown();
    }

    auto connection = std::make_shared<Connection>(std::move(handlers), logger_);
    connection->open(endpoint_);
    {
        std::lock_guard lock(mutex_);
        connection_ = connection;
    }
    logger_->info(R"({{"component":"websocket_transport","event":"connected","host":"{}","port":{},"target":"{}"}})",
                  endpoint_.host,
                  endpoint_.port,
                  endpoint_.target);
}

void WebSocketTransport::send(const std::string& frame) {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard lock(mutex_);
        connection = connection_;
    }
    if (connection == nullptr) {
        throw ConnectionError("WebSocket is not connected");
    }
    connection->write(frame);
}

void WebSocketTransport::close() {
    std::shared_ptr<Connection> connection;
    {
        std::lock_guard lock(mutex_);
        connection = std::move(connection_);
    }
    if (connection != nullptr) {
        connection->shutdown();
    }
}

}  // namespace freight_tracking
