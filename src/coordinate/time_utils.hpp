#ifndef COMMPLAN_COORDINATE_TIME_UTILS_HPP
#define COMMPLAN_COORDINATE_TIME_UTILS_HPP

#include <string>

namespace commplan {

/**
 * @brief UTC time conversions used at the I/O boundary
 *
 * The engine measures time as double seconds since the Unix epoch.
 * These helpers convert to and from ISO-8601 text and operator-facing
 * clock strings.
 */
class TimeUtils {
public:
    static constexpr double SECONDS_PER_DAY = 86400.0;
    static constexpr double SECONDS_PER_MINUTE = 60.0;

    /**
     * @brief Parse an ISO-8601 timestamp
     *
     * Accepts "YYYY-MM-DD", "YYYY-MM-DDTHH:MM[:SS[.fff]]" with a space or 'T'
     * separator and an optional "Z" or "+HH:MM"/"-HH:MM" offset. Timestamps
     * without an offset are taken as UTC.
     *
     * @return Seconds since 1970-01-01T00:00:00Z
     * @throws std::invalid_argument on malformed input
     */
    static double parse_iso8601(const std::string& text);

    /**
     * @brief Format seconds since the epoch as "YYYY-MM-DDTHH:MM:SSZ"
     * (rounded to the nearest second)
     */
    static std::string to_iso8601(double epoch_seconds);

    /// Format as "HH:MMZ" for operator advisories
    static std::string to_hhmm_z(double epoch_seconds);

    /// Days since the epoch for a proleptic Gregorian civil date
    static long long days_from_civil(int year, int month, int day);

    /// Current wall-clock time, seconds since the epoch
    static double now();
};

} // namespace commplan

#endif // COMMPLAN_COORDINATE_TIME_UTILS_HPP
