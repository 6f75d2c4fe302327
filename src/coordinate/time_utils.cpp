#include "coordinate/time_utils.hpp"
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace commplan {

namespace {

// Reads exactly `width` digits at pos
int read_digits(const std::string& s, std::size_t& pos, int width) {
    if (pos + static_cast<std::size_t>(width) > s.size()) {
        throw std::invalid_argument("Truncated timestamp: " + s);
    }
    int value = 0;
    for (int i = 0; i < width; ++i) {
        char c = s[pos++];
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid digit in timestamp: " + s);
        }
        value = value * 10 + (c - '0');
    }
    return value;
}

void expect_char(const std::string& s, std::size_t& pos, char c) {
    if (pos >= s.size() || s[pos] != c) {
        throw std::invalid_argument(std::string("Expected '") + c + "' in timestamp: " + s);
    }
    ++pos;
}

// Inverse of days_from_civil (H. Hinnant's algorithm)
void civil_from_days(long long z, int& y, int& m, int& d) {
    z += 719468;
    const long long era = (z >= 0 ? z : z - 146096) / 146097;
    const long long doe = z - era * 146097;
    const long long yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const long long doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const long long mp = (5 * doy + 2) / 153;
    d = static_cast<int>(doy - (153 * mp + 2) / 5 + 1);
    m = static_cast<int>(mp < 10 ? mp + 3 : mp - 9);
    y = static_cast<int>(yoe + era * 400 + (m <= 2 ? 1 : 0));
}

} // anonymous namespace

long long TimeUtils::days_from_civil(int year, int month, int day) {
    const long long y = year - (month <= 2 ? 1 : 0);
    const long long era = (y >= 0 ? y : y - 399) / 400;
    const long long yoe = y - era * 400;
    const long long mp = month > 2 ? month - 3 : month + 9;
    const long long doy = (153 * mp + 2) / 5 + day - 1;
    const long long doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + doe - 719468;
}

double TimeUtils::parse_iso8601(const std::string& text) {
    std::size_t pos = 0;
    const int year = read_digits(text, pos, 4);
    expect_char(text, pos, '-');
    const int month = read_digits(text, pos, 2);
    expect_char(text, pos, '-');
    const int day = read_digits(text, pos, 2);

    if (month < 1 || month > 12 || day < 1 || day > 31) {
        throw std::invalid_argument("Date out of range: " + text);
    }

    int hour = 0, minute = 0;
    double second = 0.0;
    double offset_seconds = 0.0;

    if (pos < text.size() && (text[pos] == 'T' || text[pos] == 't' || text[pos] == ' ')) {
        ++pos;
        hour = read_digits(text, pos, 2);
        expect_char(text, pos, ':');
        minute = read_digits(text, pos, 2);
        if (pos < text.size() && text[pos] == ':') {
            ++pos;
            second = read_digits(text, pos, 2);
            if (pos < text.size() && (text[pos] == '.' || text[pos] == ',')) {
                ++pos;
                double scale = 0.1;
                bool any = false;
                while (pos < text.size() && text[pos] >= '0' && text[pos] <= '9') {
                    second += (text[pos] - '0') * scale;
                    scale *= 0.1;
                    ++pos;
                    any = true;
                }
                if (!any) throw std::invalid_argument("Empty fraction in timestamp: " + text);
            }
        }
        if (hour > 23 || minute > 59 || second >= 61.0) {
            throw std::invalid_argument("Time out of range: " + text);
        }

        if (pos < text.size()) {
            char z = text[pos];
            if (z == 'Z' || z == 'z') {
                ++pos;
            } else if (z == '+' || z == '-') {
                ++pos;
                const int oh = read_digits(text, pos, 2);
                if (pos < text.size() && text[pos] == ':') ++pos;
                const int om = read_digits(text, pos, 2);
                offset_seconds = (oh * 3600.0 + om * 60.0) * (z == '+' ? 1.0 : -1.0);
            }
        }
    }

    if (pos != text.size()) {
        throw std::invalid_argument("Trailing characters in timestamp: " + text);
    }

    const double days = static_cast<double>(days_from_civil(year, month, day));
    return days * SECONDS_PER_DAY + hour * 3600.0 + minute * 60.0 + second - offset_seconds;
}

std::string TimeUtils::to_iso8601(double epoch_seconds) {
    const long long total = static_cast<long long>(std::llround(epoch_seconds));
    long long days = total / 86400;
    long long rem = total % 86400;
    if (rem < 0) {
        rem += 86400;
        days -= 1;
    }

    int y, m, d;
    civil_from_days(days, y, m, d);

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(4) << y << "-"
        << std::setw(2) << m << "-"
        << std::setw(2) << d << "T"
        << std::setw(2) << rem / 3600 << ":"
        << std::setw(2) << (rem % 3600) / 60 << ":"
        << std::setw(2) << rem % 60 << "Z";
    return oss.str();
}

std::string TimeUtils::to_hhmm_z(double epoch_seconds) {
    long long secs = static_cast<long long>(std::floor(epoch_seconds));
    long long rem = secs % 86400;
    if (rem < 0) rem += 86400;

    std::ostringstream oss;
    oss << std::setfill('0')
        << std::setw(2) << rem / 3600 << ":"
        << std::setw(2) << (rem % 3600) / 60 << "Z";
    return oss.str();
}

double TimeUtils::now() {
    using namespace std::chrono;
    return duration<double>(system_clock::now().time_since_epoch()).count();
}

} // namespace commplan
