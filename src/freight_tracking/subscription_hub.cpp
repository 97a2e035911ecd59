#include "freight_tracking/subscription_hub.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include <fmt/format.h>

namespace freight_tracking {

namespace {

using SteadyClock = std::chrono::steady_clock;

}  // namespace

std::string_view to_string(HubState state) noexcept {
    switch (state) {
        case HubState::Disconnected:
            return "DISCONNECTED";
        case HubState::Connecting:
            return "CONNECTING";
        case HubState::Connected:
            return "CONNECTED";
        case HubState::Failed:
            return "FAILED";
    }
    return "UNKNOWN";
}

Milliseconds reconnect_delay(const HubConfig& config, int attempt) {
    Milliseconds delay = config.reconnect_base;
    for (int step = 1; step < attempt && delay < config.reconnect_cap; ++step) {
        delay *= 2;
    }
    return std::min(delay, config.reconnect_cap);
}

std::shared_ptr<SubscriptionHub> SubscriptionHub::create(PushTransportPtr transport,
                                                         std::shared_ptr<PositionCache> cache,
                                                         HubConfig config) {
    return std::shared_ptr<SubscriptionHub>(new SubscriptionHub(std::move(transport), std::move(cache), config));
}

SubscriptionHub::SubscriptionHub(PushTransportPtr transport, std::shared_ptr<PositionCache> cache, HubConfig config)
    : transport_(std::move(transport)),
      cache_(std::move(cache)),
      config_(config),
      logger_(get_logger()) {
    if (transport_ == nullptr || cache_ == nullptr) {
        throw std::invalid_argument("SubscriptionHub requires a transport and a position cache");
    }
    if (config_.max_retries < 0) {
        throw std::invalid_argument("SubscriptionHub max_retries must be non-negative");
    }
    if (config_.reconnect_base <= Milliseconds::zero() || config_.reconnect_cap < config_.reconnect_base) {
        throw std::invalid_argument("SubscriptionHub backoff requires 0 < base <= cap");
    }
}

SubscriptionHub::~SubscriptionHub() {
    stop();
}

void SubscriptionHub::start() {
    std::lock_guard lock(mutex_);
    if (flag_running_) {
        return;
    }
    flag_running_ = true;
    // Listeners that outlived a stop() get a fresh connection.
    failed_attempts_ = 0;
    set_upstream_entities_.clear();
    set_upstream_loads_.clear();
    if (!table_positions_.empty() || !table_loads_.empty()) {
        next_connect_at_ = SteadyClock::now();
    } else {
        next_connect_at_.reset();
    }
    worker_thread_ = std::thread(&SubscriptionHub::run_worker, this);
    logger_->info(R"({"component":"subscription_hub","event":"started"})");
}

void SubscriptionHub::stop() {
    {
        std::lock_guard lock(mutex_);
        if (!flag_running_) {
            return;
        }
        flag_running_ = false;
    }
    cv_.notify_all();
    if (worker_thread_.joinable()) {
        if (worker_thread_.get_id() == std::this_thread::get_id()) {
            worker_thread_.detach();
        } else {
            worker_thread_.join();
        }
    }
    transport_->close();
    set_state(HubState::Disconnected);
    logger_->info(R"({"component":"subscription_hub","event":"stopped"})");
}

Unsubscribe SubscriptionHub::subscribe(const std::string& entity_id,
                                       EntityType entity_type,
                                       PositionListener on_update,
                                       ErrorListener on_error) {
    if (entity_id.empty()) {
        throw ValidationError("Subscription requires an entity id");
    }
    if (!on_update) {
        throw std::invalid_argument("Subscription requires an update listener");
    }

    const EntityKey entity{entity_type, entity_id};
    auto entry = std::make_shared<PositionTable::Entry>();
    entry->on_event = std::move(on_update);
    entry->on_error = std::move(on_error);

    {
        std::lock_guard lock(mutex_);
        const bool first = table_positions_.add(entity, entry);
        if (first || state_ == HubState::Failed) {
            HubEvent event{};
            event.kind = HubEvent::Kind::ChannelActivated;
            event.channel_kind = ChannelKind::Position;
            event.entity = entity;
            queue_events_.push_back(std::move(event));
        }
    }
    cv_.notify_all();

    return [weak_hub = weak_from_this(), entity, entry]() {
        if (!entry->flag_active.exchange(false)) {
            return;
        }
        const std::shared_ptr<SubscriptionHub> hub = weak_hub.lock();
        if (hub == nullptr) {
            return;
        }
        {
            std::lock_guard lock(hub->mutex_);
            if (!hub->table_positions_.remove(entity, entry)) {
                return;
            }
            HubEvent event{};
            event.kind = HubEvent::Kind::ChannelReleased;
            event.channel_kind = ChannelKind::Position;
            event.entity = entity;
            hub->queue_events_.push_back(std::move(event));
        }
        hub->cv_.notify_all();
    };
}

Unsubscribe SubscriptionHub::subscribe_load_status(const std::string& load_id,
                                                   LoadStatusListener on_status,
                                                   ErrorListener on_error) {
    if (load_id.empty()) {
        throw ValidationError("Load status subscription requires a load id");
    }
    if (!on_status) {
        throw std::invalid_argument("Load status subscription requires a status listener");
    }

    auto entry = std::make_shared<LoadTable::Entry>();
    entry->on_event = std::move(on_status);
    entry->on_error = std::move(on_error);

    {
        std::lock_guard lock(mutex_);
        const bool first = table_loads_.add(load_id, entry);
        if (first || state_ == HubState::Failed) {
            HubEvent event{};
            event.kind = HubEvent::Kind::ChannelActivated;
            event.channel_kind = ChannelKind::LoadStatus;
            event.load_id = load_id;
            queue_events_.push_back(std::move(event));
        }
    }
    cv_.notify_all();

    return [weak_hub = weak_from_this(), load_id, entry]() {
        if (!entry->flag_active.exchange(false)) {
            return;
        }
        const std::shared_ptr<SubscriptionHub> hub = weak_hub.lock();
        if (hub == nullptr) {
            return;
        }
        {
            std::lock_guard lock(hub->mutex_);
            if (!hub->table_loads_.remove(load_id, entry)) {
                return;
            }
            HubEvent event{};
            event.kind = HubEvent::Kind::ChannelReleased;
            event.channel_kind = ChannelKind::LoadStatus;
            event.load_id = load_id;
            hub->queue_events_.push_back(std::move(event));
        }
        hub->cv_.notify_all();
    };
}

HubState SubscriptionHub::state() const {
    std::lock_guard lock(mutex_);
    return state_;
}

bool SubscriptionHub::wait_for_state(HubState state, Milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this, state] { return state_ == state; });
}

bool SubscriptionHub::wait_until_idle(Milliseconds timeout) const {
    std::unique_lock lock(mutex_);
    return cv_.wait_for(lock, timeout, [this] {
        const bool connect_due = next_connect_at_.has_value() && *next_connect_at_ <= SteadyClock::now();
        return queue_events_.empty() && !flag_handling_ && !connect_due;
    });
}

std::size_t SubscriptionHub::listener_count(const EntityKey& entity) const {
    std::lock_guard lock(mutex_);
    return table_positions_.count(entity);
}

std::size_t SubscriptionHub::load_listener_count(const std::string& load_id) const {
    std::lock_guard lock(mutex_);
    return table_loads_.count(load_id);
}

void SubscriptionHub::enqueue(HubEvent event) {
    {
        std::lock_guard lock(mutex_);
        queue_events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

void SubscriptionHub::set_state(HubState state) {
    {
        std::lock_guard lock(mutex_);
        if (state_ == state) {
            return;
        }
        state_ = state;
    }
    cv_.notify_all();
    logger_->info(R"({{"component":"subscription_hub","event":"state","state":"{}"}})", to_string(state));
}

void SubscriptionHub::run_worker() {
    std::unique_lock lock(mutex_);
    while (flag_running_) {
        if (!queue_events_.empty()) {
            HubEvent event = std::move(queue_events_.front());
            queue_events_.pop_front();
            flag_handling_ = true;
            lock.unlock();
            try {
                handle_event(event);
            } catch (const std::exception& error) {
                logger_->error(R"({{"component":"subscription_hub","event":"handler_error","error":"{}"}})",
                               error.what());
            }
            lock.lock();
            flag_handling_ = false;
            cv_.notify_all();
            continue;
        }

        if (next_connect_at_.has_value()) {
            if (SteadyClock::now() >= *next_connect_at_) {
                next_connect_at_.reset();
                flag_handling_ = true;
                lock.unlock();
                attempt_connect();
                lock.lock();
                flag_handling_ = false;
                cv_.notify_all();
                continue;
            }
            cv_.wait_until(lock, *next_connect_at_);
            continue;
        }

        cv_.wait(lock);
    }
}

void SubscriptionHub::handle_event(const HubEvent& event) {
    switch (event.kind) {
        case HubEvent::Kind::ChannelActivated:
            handle_channel_activated(event);
            break;
        case HubEvent::Kind::ChannelReleased:
            handle_channel_released(event);
            break;
        case HubEvent::Kind::Message:
            handle_message(event);
            break;
        case HubEvent::Kind::Closed:
            handle_closed(event);
            break;
    }
}

void SubscriptionHub::handle_channel_activated(const HubEvent& event) {
    bool still_wanted = false;
    HubState current = HubState::Disconnected;
    bool connect_pending = false;
    {
        std::lock_guard lock(mutex_);
        still_wanted = event.channel_kind == ChannelKind::Position ? table_positions_.contains(event.entity)
                                                                   : table_loads_.contains(event.load_id);
        current = state_;
        connect_pending = next_connect_at_.has_value();
    }
    if (!still_wanted) {
        return;
    }

    switch (current) {
        case HubState::Failed:
            logger_->info(R"({{"component":"subscription_hub","event":"retry_reset","after_attempts":{}}})",
                          failed_attempts_);
            failed_attempts_ = 0;
            set_state(HubState::Connecting);
            schedule_connect(SteadyClock::now());
            break;
        case HubState::Disconnected:
            if (!connect_pending) {
                schedule_connect(SteadyClock::now());
            }
            break;
        case HubState::Connecting:
            // Picked up by resubscribe_all() once the connection opens.
            break;
        case HubState::Connected: {
            const bool already = event.channel_kind == ChannelKind::Position
                                     ? set_upstream_entities_.contains(event.entity)
                                     : set_upstream_loads_.contains(event.load_id);
            if (already) {
                break;
            }
            if (send_control(event.channel_kind, event.entity, event.load_id, ControlOp::Subscribe)) {
                if (event.channel_kind == ChannelKind::Position) {
                    set_upstream_entities_.insert(event.entity);
                } else {
                    set_upstream_loads_.insert(event.load_id);
                }
            }
            break;
        }
    }
}

void SubscriptionHub::handle_channel_released(const HubEvent& event) {
    {
        std::lock_guard lock(mutex_);
        const bool wanted_again = event.channel_kind == ChannelKind::Position ? table_positions_.contains(event.entity)
                                                                              : table_loads_.contains(event.load_id);
        if (wanted_again) {
            return;
        }
    }

    const std::size_t erased = event.channel_kind == ChannelKind::Position
                                   ? set_upstream_entities_.erase(event.entity)
                                   : set_upstream_loads_.erase(event.load_id);
    if (erased == 0 || state() != HubState::Connected) {
        return;
    }
    send_control(event.channel_kind, event.entity, event.load_id, ControlOp::Unsubscribe);
}

void SubscriptionHub::handle_message(const HubEvent& event) {
    if (event.generation != connection_generation_ || state() != HubState::Connected) {
        logger_->debug(R"({"component":"subscription_hub","event":"stale_frame_dropped"})");
        return;
    }

    InboundEvent inbound;
    try {
        inbound = decode_inbound(event.text);
    } catch (const ValidationError& error) {
        logger_->warn(R"({{"component":"subscription_hub","event":"malformed_frame","error":"{}"}})", error.what());
        return;
    }

    std::visit(
        [this](const auto& decoded) {
            using Decoded = std::decay_t<decltype(decoded)>;
            if constexpr (std::is_same_v<Decoded, PositionUpdateEvent>) {
                cache_->put(decoded.entity.entity_id, decoded.entity.entity_type, decoded.sample);
                if (set_upstream_entities_.contains(decoded.entity)) {
                    dispatch_position(decoded);
                }
            } else {
                if (set_upstream_loads_.contains(decoded.load_id)) {
                    dispatch_load_status(decoded);
                }
            }
        },
        inbound);
}

void SubscriptionHub::handle_closed(const HubEvent& event) {
    if (event.generation != connection_generation_ || state() != HubState::Connected) {
        return;
    }
    logger_->warn(R"({{"component":"subscription_hub","event":"connection_lost","reason":"{}"}})", event.text);
    set_upstream_entities_.clear();
    set_upstream_loads_.clear();
    set_state(HubState::Disconnected);
    notify_errors(ConnectionError(fmt::format("Upstream connection lost: {}", event.text)));

    if (has_any_listeners()) {
        schedule_connect(SteadyClock::now());
    }
}

void SubscriptionHub::attempt_connect() {
    set_state(HubState::Connecting);
    const std::uint64_t generation = ++connection_generation_;
    set_upstream_entities_.clear();
    set_upstream_loads_.clear();

    const std::weak_ptr<SubscriptionHub> weak_hub = weak_from_this();
    TransportHandlers handlers{};
    handlers.on_message = [weak_hub, generation](std::string_view frame) {
        if (const auto hub = weak_hub.lock()) {
            HubEvent event{};
            event.kind = HubEvent::Kind::Message;
            event.generation = generation;
            event.text = std::string(frame);
            hub->enqueue(std::move(event));
        }
    };
    handlers.on_close = [weak_hub, generation](std::string_view reason) {
        if (const auto hub = weak_hub.lock()) {
            HubEvent event{};
            event.kind = HubEvent::Kind::Closed;
            event.generation = generation;
            event.text = std::string(reason);
            hub->enqueue(std::move(event));
        }
    };
    transport_->set_handlers(std::move(handlers));

    try {
        transport_->connect();
    } catch (const std::exception& error) {
        handle_connect_failure(error.what());
        return;
    }

    failed_attempts_ = 0;
    set_state(HubState::Connected);
    resubscribe_all();
}

void SubscriptionHub::handle_connect_failure(const std::string& reason) {
    ++failed_attempts_;
    if (!has_any_listeners()) {
        logger_->info(R"({{"component":"subscription_hub","event":"retry_abandoned","attempts":{},"error":"{}"}})",
                      failed_attempts_,
                      reason);
        failed_attempts_ = 0;
        set_state(HubState::Disconnected);
        return;
    }
    if (failed_attempts_ > config_.max_retries) {
        logger_->error(R"({{"component":"subscription_hub","event":"gave_up","attempts":{},"error":"{}"}})",
                       failed_attempts_,
                       reason);
        set_state(HubState::Failed);
        notify_errors(ConnectionError(
            fmt::format("Upstream connection failed after {} attempts: {}", failed_attempts_, reason)));
        return;
    }

    const Milliseconds delay = reconnect_delay(config_, failed_attempts_);
    logger_->warn(R"({{"component":"subscription_hub","event":"connect_failed","attempt":{},"retry_in_ms":{},"error":"{}"}})",
                  failed_attempts_,
                  delay.count(),
                  reason);
    schedule_connect(SteadyClock::now() + delay);
    notify_errors(ConnectionError(fmt::format("Upstream connection attempt {} failed: {}", failed_attempts_, reason)));
}

void SubscriptionHub::resubscribe_all() {
    std::vector<EntityKey> list_entities;
    std::vector<std::string> list_loads;
    {
        std::lock_guard lock(mutex_);
        list_entities = table_positions_.keys();
        list_loads = table_loads_.keys();
    }

    const std::string no_load{};
    for (const EntityKey& entity : list_entities) {
        if (send_control(ChannelKind::Position, entity, no_load, ControlOp::Subscribe)) {
            set_upstream_entities_.insert(entity);
        }
    }
    const EntityKey no_entity{};
    for (const std::string& load_id : list_loads) {
        if (send_control(ChannelKind::LoadStatus, no_entity, load_id, ControlOp::Subscribe)) {
            set_upstream_loads_.insert(load_id);
        }
    }
    logger_->info(R"({{"component":"subscription_hub","event":"resubscribed","entities":{},"loads":{}}})",
                  set_upstream_entities_.size(),
                  set_upstream_loads_.size());
}

bool SubscriptionHub::send_control(ChannelKind kind, const EntityKey& entity, const std::string& load_id, ControlOp op) {
    const std::string frame = kind == ChannelKind::Position ? encode_subscription_control(op, entity)
                                                            : encode_load_status_control(op, load_id);
    try {
        transport_->send(frame);
        return true;
    } catch (const std::exception& error) {
        logger_->warn(R"({{"component":"subscription_hub","event":"send_failed","frame":{},"error":"{}"}})",
                      frame,
                      error.what());
        return false;
    }
}

void SubscriptionHub::dispatch_position(const PositionUpdateEvent& update) {
    std::vector<PositionTable::EntryPtr> list_entries;
    {
        std::lock_guard lock(mutex_);
        list_entries = table_positions_.snapshot(update.entity);
    }
    for (const PositionTable::EntryPtr& entry : list_entries) {
        if (!entry->flag_active.load()) {
            continue;
        }
        try {
            entry->on_event(update.sample);
        } catch (const std::exception& error) {
            logger_->error(R"({{"component":"subscription_hub","event":"listener_failed","key":"{}","error":"{}"}})",
                           to_subscription_key(update.entity),
                           error.what());
        } catch (...) {
            logger_->error(R"({{"component":"subscription_hub","event":"listener_failed","key":"{}","error":"unknown"}})",
                           to_subscription_key(update.entity));
        }
    }
}

void SubscriptionHub::dispatch_load_status(const LoadStatusEvent& status) {
    std::vector<LoadTable::EntryPtr> list_entries;
    {
        std::lock_guard lock(mutex_);
        list_entries = table_loads_.snapshot(status.load_id);
    }
    for (const LoadTable::EntryPtr& entry : list_entries) {
        if (!entry->flag_active.load()) {
            continue;
        }
        try {
            entry->on_event(status);
        } catch (const std::exception& error) {
            logger_->error(R"({{"component":"subscription_hub","event":"listener_failed","load_id":"{}","error":"{}"}})",
                           status.load_id,
                           error.what());
        } catch (...) {
            logger_->error(R"({{"component":"subscription_hub","event":"listener_failed","load_id":"{}","error":"unknown"}})",
                           status.load_id);
        }
    }
}

void SubscriptionHub::notify_errors(const TrackingError& error) {
    std::vector<PositionTable::EntryPtr> list_positions;
    std::vector<LoadTable::EntryPtr> list_loads;
    {
        std::lock_guard lock(mutex_);
        list_positions = table_positions_.all();
        list_loads = table_loads_.all();
    }

    const auto notify = [this, &error](const auto& entry) {
        if (!entry->flag_active.load() || !entry->on_error) {
            return;
        }
        try {
            entry->on_error(error);
        } catch (const std::exception& listener_error) {
            logger_->error(R"({{"component":"subscription_hub","event":"error_listener_failed","error":"{}"}})",
                           listener_error.what());
        } catch (...) {
            logger_->error(R"({"component":"subscription_hub","event":"error_listener_failed","error":"unknown"})");
        }
    };
    for (const auto& entry : list_positions) {
        notify(entry);
    }
    for (const auto& entry : list_loads) {
        notify(entry);
    }
}

void SubscriptionHub::schedule_connect(std::chrono::steady_clock::time_point when) {
    {
        std::lock_guard lock(mutex_);
        next_connect_at_ = when;
    }
    cv_.notify_all();
}

bool SubscriptionHub::has_any_listeners() const {
    std::lock_guard lock(mutex_);
    return !table_positions_.empty() || !table_loads_.empty();
}

}  // namespace freight_tracking
