#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "freight_tracking/clock.hpp"
#include "freight_tracking/configuration.hpp"
#include "freight_tracking/errors.hpp"
#include "freight_tracking/eta_engine.hpp"
#include "freight_tracking/logging.hpp"
#include "freight_tracking/partitioned_position_store.hpp"
#include "freight_tracking/position_cache.hpp"
#include "freight_tracking/subscription_hub.hpp"
#include "freight_tracking/tracking_facade.hpp"
#include "freight_tracking/trajectory_engine.hpp"
#include "freight_tracking/version.hpp"
#include "freight_tracking/websocket_transport.hpp"

namespace {
std::atomic<bool> should_terminate{false};

constexpr std::chrono::hours k_maintenance_interval{24};

void handle_signal(int) {
    should_terminate.store(true);
}
}  // namespace

int main() {
    using namespace freight_tracking;

    std::signal(SIGINT, handle_signal);
    std::signal(SIGTERM, handle_signal);

    try {
        const Configuration configuration = ConfigurationLoader::load();
        set_log_level(configuration.log_level);
        auto logger = get_logger();
        logger->info("tracking_service {} starting", k_version);

        const ClockPtr clock = default_clock();
        auto store = std::make_shared<PartitionedPositionStore>(
            PartitionedStoreConfig{configuration.unique_source_log}, clock);
        auto cache = std::make_shared<PositionCache>(configuration.position_ttl, clock);
        auto trajectories = std::make_shared<TrajectoryEngine>(store, configuration.trajectory_ttl, clock);

        EtaConfig eta_config{};
        eta_config.min_speed_kmh = configuration.min_speed_kmh;
        eta_config.store_timeout = configuration.store_timeout;
        auto eta = std::make_shared<EtaEngine>(store, cache, nullptr, eta_config, clock);

        auto transport = std::make_shared<WebSocketTransport>(configuration.upstream_url);
        auto hub = SubscriptionHub::create(transport, cache, configuration.hub);

        FacadeConfig facade_config{};
        facade_config.store_timeout = configuration.store_timeout;
        facade_config.retention_months = configuration.retention_months;
        TrackingFacade facade{store, cache, trajectories, eta, hub, nullptr, facade_config, clock};

        facade.run_partition_maintenance(clock->now());
        auto next_maintenance = std::chrono::steady_clock::now() + k_maintenance_interval;

        hub->start();
        std::vector<Unsubscribe> list_unsubscribes;
        for (const EntityKey& entity : configuration.watched_entities) {
            store->register_entity(entity);
            list_unsubscribes.push_back(facade.subscribe(
                entity.entity_id,
                entity.entity_type,
                [&facade, logger](const PositionSample& sample) {
                    try {
                        (void)facade.ingest(sample);
                    } catch (const TrackingError& error) {
                        logger->warn("Dropping pushed sample for {}: {}", sample.entity_id, error.what());
                    }
                },
                [logger, key = to_subscription_key(entity)](const TrackingError& error) {
                    logger->warn("Upstream issue for {}: {}", key, error.what());
                }));
        }
        logger->info("Following {} entities via {}", list_unsubscribes.size(), configuration.upstream_url);

        while (!should_terminate.load()) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
            if (std::chrono::steady_clock::now() >= next_maintenance) {
                facade.run_partition_maintenance(clock->now());
                cache->purge_expired();
                trajectories->purge_expired();
                next_maintenance += k_maintenance_interval;
            }
        }

        logger->info("Shutting down tracking_service");
        for (const Unsubscribe& unsubscribe : list_unsubscribes) {
            unsubscribe();
        }
        hub->stop();
    } catch (const std::exception& exc) {
        try {
            auto logger = get_logger();
            logger->critical("Fatal error: {}", exc.what());
        } catch (const std::exception&) {
            std::cerr << "Fatal error before logger initialization: " << exc.what() << '\n';
        }
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
