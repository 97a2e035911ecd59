// === Partition Calendar ======================================================
//
// Calendar-month partitioning of position history. Computes UTC month
// boundaries, partition names, and the PostgreSQL DDL that materializes the
// same layout in a database.

#pragma once

#include <string>
#include <string_view>

#include "freight_tracking/types.hpp"

namespace freight_tracking {

inline constexpr std::string_view k_position_history_table{"position_history"};

/** @brief One month slice covering `[range_start, range_end)`. */
struct MonthPartition final {
    std::string name{};       /**< Physical table name, e.g. `position_history_y2026m10`. */
    TimePoint range_start{};  /**< First instant of the month (UTC). */
    TimePoint range_end{};    /**< First instant of the following month. */

    [[nodiscard]] bool contains(TimePoint instant) const noexcept {
        return instant >= range_start && instant < range_end;
    }

    friend bool operator==(const MonthPartition&, const MonthPartition&) = default;
};

/** @brief First instant of the UTC calendar month containing @p instant. */
[[nodiscard]] TimePoint month_start(TimePoint instant);
/** @brief Shift a month start by @p months (may be negative). */
[[nodiscard]] TimePoint add_months(TimePoint month_start_instant, int months);
/** @brief Partition descriptor for the month containing @p instant. */
[[nodiscard]] MonthPartition make_month_partition(TimePoint instant,
                                                  std::string_view parent_table = k_position_history_table);

/** @brief Parent table, generated geography column, and its indexes. */
[[nodiscard]] std::string schema_ddl(bool unique_source_log, std::string_view parent_table = k_position_history_table);
/** @brief `CREATE TABLE ... PARTITION OF` for @p partition. */
[[nodiscard]] std::string partition_ddl(const MonthPartition& partition,
                                        std::string_view parent_table = k_position_history_table);
/** @brief `DROP TABLE` for a pruned partition. */
[[nodiscard]] std::string partition_drop_ddl(const MonthPartition& partition);

}  // namespace freight_tracking
