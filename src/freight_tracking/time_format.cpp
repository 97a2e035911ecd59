#include "freight_tracking/time_format.hpp"

#include <chrono>
#include <regex>

#include <fmt/format.h>

#include "freight_tracking/errors.hpp"

namespace freight_tracking {

std::string format_iso8601(TimePoint instant) {
    const auto day_point = std::chrono::floor<std::chrono::days>(instant);
    const std::chrono::year_month_day calendar_date{day_point};
    const std::chrono::hh_mm_ss time_of_day{instant - day_point};

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:03}Z",
                       static_cast<int>(calendar_date.year()),
                       static_cast<unsigned>(calendar_date.month()),
                       static_cast<unsigned>(calendar_date.day()),
                       time_of_day.hours().count(),
                       time_of_day.minutes().count(),
                       time_of_day.seconds().count(),
                       time_of_day.subseconds().count());
}

TimePoint parse_iso8601(std::string_view text) {
    static const std::regex iso_regex(
        R"((\d{4})-(\d{2})-(\d{2}))"
        R"((?:[T ](\d{2}):(\d{2}):(\d{2}))?)"
        R"((?:\.(\d{1,9}))?)"
        R"((?:Z|([+-])(\d{2}):?(\d{2}))?)");

    const std::string input{text};
    std::smatch match;
    if (!std::regex_match(input, match, iso_regex)) {
        throw ValidationError(fmt::format("Invalid ISO-8601 timestamp '{}'", text));
    }

    const std::chrono::year_month_day calendar_date{
        std::chrono::year{std::stoi(match[1].str())},
        std::chrono::month{static_cast<unsigned>(std::stoi(match[2].str()))},
        std::chrono::day{static_cast<unsigned>(std::stoi(match[3].str()))}};
    if (!calendar_date.ok()) {
        throw ValidationError(fmt::format("Invalid calendar date in '{}'", text));
    }

    TimePoint instant = std::chrono::time_point_cast<Milliseconds>(std::chrono::sys_days{calendar_date});
    if (match[4].matched) {
        const int hours = std::stoi(match[4].str());
        const int minutes = std::stoi(match[5].str());
        const int seconds = std::stoi(match[6].str());
        if (hours > 23 || minutes > 59 || seconds > 60) {
            throw ValidationError(fmt::format("Invalid time of day in '{}'", text));
        }
        instant += std::chrono::hours{hours} + std::chrono::minutes{minutes} + std::chrono::seconds{seconds};
    }
    if (match[7].matched) {
        std::string fraction = match[7].str();
        fraction.resize(3, '0');
        instant += Milliseconds{std::stoi(fraction)};
    }
    if (match[8].matched) {
        const auto offset = std::chrono::hours{std::stoi(match[9].str())} + std::chrono::minutes{std::stoi(match[10].str())};
        // A positive offset means local time is ahead of UTC.
        instant += match[8].str() == "-" ? offset : -offset;
    }
    return instant;
}

}  // namespace freight_tracking
