// === Subscription Hub ========================================================
//
// Multiplexes any number of per-entity and per-load subscriptions over one
// upstream push connection. A single worker thread owns the connection: it
// connects lazily on the first subscription, sends subscribe/unsubscribe
// control frames as keys gain their first or lose their last listener,
// reconnects with capped exponential backoff, and dispatches inbound events
// to listeners in receive order.

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_set>

#include "freight_tracking/errors.hpp"
#include "freight_tracking/listener_table.hpp"
#include "freight_tracking/logging.hpp"
#include "freight_tracking/position_cache.hpp"
#include "freight_tracking/push_transport.hpp"
#include "freight_tracking/wire_codec.hpp"

namespace freight_tracking {

/** @brief Upstream connection state. */
enum class HubState {
    Disconnected,
    Connecting,
    Connected,
    Failed
};

[[nodiscard]] std::string_view to_string(HubState state) noexcept;

/** @brief Reconnect policy. */
struct HubConfig final {
    int max_retries{5};                     /**< Failed attempts tolerated before FAILED. */
    Milliseconds reconnect_base{1'000};     /**< Delay after the first failure. */
    Milliseconds reconnect_cap{5'000};      /**< Upper bound on any delay. */
};

/** @brief Delay before retry number @p attempt (1-based): `min(base * 2^(attempt-1), cap)`. */
[[nodiscard]] Milliseconds reconnect_delay(const HubConfig& config, int attempt);

using PositionListener = std::function<void(const PositionSample&)>;
using LoadStatusListener = std::function<void(const LoadStatusEvent&)>;
using ErrorListener = std::function<void(const TrackingError&)>;
/** @brief Removes exactly one listener; safe to call more than once. */
using Unsubscribe = std::function<void()>;

class SubscriptionHub final : public std::enable_shared_from_this<SubscriptionHub> {
  public:
    static std::shared_ptr<SubscriptionHub> create(PushTransportPtr transport,
                                                   std::shared_ptr<PositionCache> cache,
                                                   HubConfig config = {});
    ~SubscriptionHub();

    SubscriptionHub(const SubscriptionHub&) = delete;
    SubscriptionHub& operator=(const SubscriptionHub&) = delete;

    /** @brief Start the worker thread. Subscriptions made earlier are honoured. */
    void start();
    /** @brief Stop the worker and close the transport. Listeners stay registered. */
    void stop();

    /**
     * @brief Listen for position updates of one entity.
     *
     * The first listener of a key triggers an upstream subscribe once the
     * connection is up. Never blocks on the network.
     */
    [[nodiscard]] Unsubscribe subscribe(const std::string& entity_id,
                                        EntityType entity_type,
                                        PositionListener on_update,
                                        ErrorListener on_error = {});

    /** @brief Listen for status changes of one load. Same rules as subscribe(). */
    [[nodiscard]] Unsubscribe subscribe_load_status(const std::string& load_id,
                                                    LoadStatusListener on_status,
                                                    ErrorListener on_error = {});

    [[nodiscard]] HubState state() const;
    /** @brief Block until the hub reaches @p state or @p timeout elapses. */
    bool wait_for_state(HubState state, Milliseconds timeout) const;
    /** @brief Block until every queued event has been handled or @p timeout elapses. */
    bool wait_until_idle(Milliseconds timeout) const;

    [[nodiscard]] std::size_t listener_count(const EntityKey& entity) const;
    [[nodiscard]] std::size_t load_listener_count(const std::string& load_id) const;

  private:
    enum class ChannelKind {
        Position,
        LoadStatus
    };

    struct HubEvent final {
        enum class Kind {
            ChannelActivated,
            ChannelReleased,
            Message,
            Closed
        };

        Kind kind{Kind::Message};
        ChannelKind channel_kind{ChannelKind::Position};
        EntityKey entity{};
        std::string load_id{};
        std::uint64_t generation{};
        std::string text{};  /**< Frame for Message, reason for Closed. */
    };

    using PositionTable = ListenerTable<EntityKey, PositionListener, ErrorListener, EntityKeyHash>;
    using LoadTable = ListenerTable<std::string, LoadStatusListener, ErrorListener>;

    SubscriptionHub(PushTransportPtr transport, std::shared_ptr<PositionCache> cache, HubConfig config);

    void enqueue(HubEvent event);
    void set_state(HubState state);
    void run_worker();
    void handle_event(const HubEvent& event);
    void handle_channel_activated(const HubEvent& event);
    void handle_channel_released(const HubEvent& event);
    void handle_message(const HubEvent& event);
    void handle_closed(const HubEvent& event);
    void attempt_connect();
    void handle_connect_failure(const std::string& reason);
    void resubscribe_all();
    bool send_control(ChannelKind kind, const EntityKey& entity, const std::string& load_id, ControlOp op);
    void dispatch_position(const PositionUpdateEvent& update);
    void dispatch_load_status(const LoadStatusEvent& status);
    void notify_errors(const TrackingError& error);
    void schedule_connect(std::chrono::steady_clock::time_point when);
    [[nodiscard]] bool has_any_listeners() const;

    PushTransportPtr transport_;
    std::shared_ptr<PositionCache> cache_;
    HubConfig config_;
    std::shared_ptr<spdlog::logger> logger_;

    // Guarded by mutex_.
    mutable std::mutex mutex_;
    mutable std::condition_variable cv_;
    HubState state_{HubState::Disconnected};
    PositionTable table_positions_;
    LoadTable table_loads_;
    std::deque<HubEvent> queue_events_;
    std::optional<std::chrono::steady_clock::time_point> next_connect_at_;
    bool flag_running_{false};
    bool flag_handling_{false};
    std::thread worker_thread_;

    // Worker thread only.
    std::uint64_t connection_generation_{0};
    int failed_attempts_{0};
    std::unordered_set<EntityKey, EntityKeyHash> set_upstream_entities_;
    std::unordered_set<std::string> set_upstream_loads_;
};

using SubscriptionHubPtr = std::shared_ptr<SubscriptionHub>;

}  // namespace freight_tracking
