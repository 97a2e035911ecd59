#include "freight_tracking/partition_calendar.hpp"

#include <chrono>

#include <fmt/format.h>

namespace freight_tracking {

namespace {

std::chrono::year_month to_year_month(TimePoint instant) {
    const std::chrono::year_month_day calendar_date{std::chrono::floor<std::chrono::days>(instant)};
    return std::chrono::year_month{calendar_date.year(), calendar_date.month()};
}

TimePoint first_instant_of(std::chrono::year_month year_month) {
    return std::chrono::time_point_cast<Milliseconds>(std::chrono::sys_days{year_month / std::chrono::day{1}});
}

std::string sql_timestamp(TimePoint instant) {
    const std::chrono::year_month_day calendar_date{std::chrono::floor<std::chrono::days>(instant)};
    return fmt::format("{:04}-{:02}-{:02} 00:00:00+00",
                       static_cast<int>(calendar_date.year()),
                       static_cast<unsigned>(calendar_date.month()),
                       static_cast<unsigned>(calendar_date.day()));
}

}  // namespace

TimePoint month_start(TimePoint instant) {
    return first_instant_of(to_year_month(instant));
}

TimePoint add_months(TimePoint month_start_instant, int months) {
    return first_instant_of(to_year_month(month_start_instant) + std::chrono::months{months});
}

MonthPartition make_month_partition(TimePoint instant, std::string_view parent_table) {
    const std::chrono::year_month year_month = to_year_month(instant);
    MonthPartition partition{};
    partition.name = fmt::format("{}_y{:04}m{:02}",
                                 parent_table,
                                 static_cast<int>(year_month.year()),
                                 static_cast<unsigned>(year_month.month()));
    partition.range_start = first_instant_of(year_month);
    partition.range_end = first_instant_of(year_month + std::chrono::months{1});
    return partition;
}

std::string schema_ddl(bool unique_source_log, std::string_view parent_table) {
    std::string ddl = fmt::format(
        "CREATE TABLE IF NOT EXISTS {0} (\n"
        "    id BIGSERIAL,\n"
        "    entity_id VARCHAR(64) NOT NULL,\n"
        "    entity_type VARCHAR(16) NOT NULL,\n"
        "    latitude NUMERIC(9, 6) NOT NULL CHECK (latitude BETWEEN -90 AND 90),\n"
        "    longitude NUMERIC(9, 6) NOT NULL CHECK (longitude BETWEEN -180 AND 180),\n"
        "    heading NUMERIC(5, 2) CHECK (heading >= 0 AND heading < 360),\n"
        "    speed NUMERIC(6, 2) CHECK (speed >= 0),\n"
        "    accuracy NUMERIC(8, 2) CHECK (accuracy >= 0),\n"
        "    source VARCHAR(16) NOT NULL,\n"
        "    source_log_id VARCHAR(64),\n"
        "    recorded_at TIMESTAMPTZ NOT NULL,\n"
        "    created_at TIMESTAMPTZ NOT NULL DEFAULT now(),\n"
        "    location GEOGRAPHY(POINT, 4326) GENERATED ALWAYS AS "
        "(ST_SetSRID(ST_MakePoint(longitude, latitude), 4326)::geography) STORED,\n"
        "    CHECK (recorded_at <= created_at),\n"
        "    PRIMARY KEY (id, recorded_at)\n"
        ") PARTITION BY RANGE (recorded_at);\n"
        "CREATE INDEX IF NOT EXISTS idx_{0}_entity_time ON {0} (entity_id, recorded_at DESC);\n"
        "CREATE INDEX IF NOT EXISTS idx_{0}_location ON {0} USING GIST (location);\n",
        parent_table);
    if (unique_source_log) {
        ddl += fmt::format(
            "CREATE UNIQUE INDEX IF NOT EXISTS uq_{0}_source_log ON {0} (entity_id, recorded_at, source_log_id);\n",
            parent_table);
    }
    return ddl;
}

std::string partition_ddl(const MonthPartition& partition, std::string_view parent_table) {
    return fmt::format("CREATE TABLE IF NOT EXISTS {} PARTITION OF {} FOR VALUES FROM ('{}') TO ('{}');",
                       partition.name,
                       parent_table,
                       sql_timestamp(partition.range_start),
                       sql_timestamp(partition.range_end));
}

std::string partition_drop_ddl(const MonthPartition& partition) {
    return fmt::format("DROP TABLE IF EXISTS {};", partition.name);
}

}  // namespace freight_tracking
