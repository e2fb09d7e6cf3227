#pragma once

#include <string>
#include <chrono>
#include <cstdint>

namespace util {
    std::string generate_uuid();
    std::string current_iso8601();
    std::string iso8601_from_ms(int64_t timestamp_ms);
    int64_t current_timestamp_ms();

    // First instant of the calendar month (UTC) containing timestamp_ms.
    int64_t utc_month_start_ms(int64_t timestamp_ms);

    std::string to_lower(const std::string& str);
}
