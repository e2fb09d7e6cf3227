#include "util.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>
#include <ctime>
#include <random>

namespace util {

namespace {

// Days since 1970-01-01 for a proleptic Gregorian date.
int64_t days_from_civil(int64_t y, unsigned m, unsigned d) {
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

std::tm gmtime_safe(std::time_t t) {
    std::tm out{};
    gmtime_r(&t, &out);
    return out;
}

} // namespace

std::string generate_uuid() {
    thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);
    std::uniform_int_distribution<> dis2(8, 11);

    std::stringstream ss;
    ss << std::hex;
    for (int i = 0; i < 8; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 4; i++) ss << dis(gen);
    ss << "-4";
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    ss << dis2(gen);
    for (int i = 0; i < 3; i++) ss << dis(gen);
    ss << "-";
    for (int i = 0; i < 12; i++) ss << dis(gen);
    return ss.str();
}

std::string current_iso8601() {
    return iso8601_from_ms(current_timestamp_ms());
}

std::string iso8601_from_ms(int64_t timestamp_ms) {
    std::tm tm = gmtime_safe(static_cast<std::time_t>(timestamp_ms / 1000));
    std::ostringstream ss;
    ss << std::put_time(&tm, "%FT%TZ");
    return ss.str();
}

int64_t current_timestamp_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t utc_month_start_ms(int64_t timestamp_ms) {
    int64_t secs = timestamp_ms / 1000;
    if (timestamp_ms < 0 && timestamp_ms % 1000 != 0) secs -= 1;

    std::tm tm = gmtime_safe(static_cast<std::time_t>(secs));
    int64_t days = days_from_civil(tm.tm_year + 1900,
                                   static_cast<unsigned>(tm.tm_mon + 1), 1);
    return days * 86400LL * 1000LL;
}

std::string to_lower(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace util
