#include "vfd/timestamp.hpp"
#include <cctype>
#include <cerrno>
#include <cmath>
#include <cstdio>
#include <cstdlib>

namespace vfd{

// days since 1970-01-01 for a civil date (Howard Hinnant's algorithm)
int64_t days_from_civil(int64_t y, unsigned m, unsigned d){
    y -= m <= 2;
    const int64_t era = (y >= 0 ? y : y - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(y - era * 400);            // [0, 399]
    const unsigned doy = (153 * (m + (m > 2 ? -3 : 9)) + 2) / 5 + d - 1;  // [0, 365]
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;           // [0, 146096]
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civil_from_days(int64_t z, int64_t& y, unsigned& m, unsigned& d){
    z += 719468;
    const int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(z - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    d = doy - (153 * mp + 2) / 5 + 1;
    m = mp < 10 ? mp + 3 : mp - 9;
    y = static_cast<int64_t>(yoe) + era * 400 + (m <= 2);
}

namespace {

//reads exactly n digits at pos, advances pos
bool read_digits(const std::string& s, size_t& pos, size_t n, int& out){
    if (pos + n > s.size()) return false;
    int v = 0;
    for (size_t i = 0; i < n; ++i){
        char c = s[pos + i];
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        v = v * 10 + (c - '0');
    }
    pos += n;
    out = v;
    return true;
}

bool expect(const std::string& s, size_t& pos, char c){
    if (pos < s.size() && s[pos] == c) {++pos; return true;}
    return false;
}

std::string trim(const std::string& s){
    size_t b = 0, e = s.size();
    while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
    while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
    return s.substr(b, e - b);
}

//half of INT64_MAX in microseconds, so the difference of any two timestamps still fits
constexpr double kMaxEpochSeconds = 4.6e12;

std::optional<Timestamp> epoch_seconds_to_us(double secs){
    if (!std::isfinite(secs) || std::fabs(secs) > kMaxEpochSeconds) return std::nullopt;
    return static_cast<Timestamp>(std::llround(secs * double(kUsPerSecond)));
}

std::optional<double> parse_number(const std::string& s){
    if (s.empty()) return std::nullopt;
    const char* begin = s.c_str();
    char* end = nullptr;
    errno = 0;
    double v = std::strtod(begin, &end);
    if (end == begin || *end != '\0' || errno == ERANGE) return std::nullopt;
    if (!std::isfinite(v)) return std::nullopt;
    return v;
}

std::optional<Timestamp> parse_calendar(const std::string& s){
    size_t pos = 0;
    int year = 0, month = 0, day = 0;
    if (!read_digits(s, pos, 4, year)) return std::nullopt;
    if (!expect(s, pos, '-')) return std::nullopt;
    if (!read_digits(s, pos, 2, month)) return std::nullopt;
    if (!expect(s, pos, '-')) return std::nullopt;
    if (!read_digits(s, pos, 2, day)) return std::nullopt;
    if (month < 1 || month > 12 || day < 1 || day > 31) return std::nullopt;

    //day must exist in that month, 2024-02-30 does not roll over into march
    const int64_t days = days_from_civil(year, unsigned(month), unsigned(day));
    int64_t cy = 0; unsigned cm = 0, cd = 0;
    civil_from_days(days, cy, cm, cd);
    if (cy != year || cm != unsigned(month) || cd != unsigned(day)) return std::nullopt;

    int hour = 0, minute = 0, second = 0;
    int64_t frac_us = 0;
    if (pos < s.size()){
        if (s[pos] != ' ' && s[pos] != 'T') return std::nullopt;
        ++pos;
        if (!read_digits(s, pos, 2, hour)) return std::nullopt;
        if (!expect(s, pos, ':')) return std::nullopt;
        if (!read_digits(s, pos, 2, minute)) return std::nullopt;
        if (expect(s, pos, ':')){
            if (!read_digits(s, pos, 2, second)) return std::nullopt;
            if (expect(s, pos, '.')){
                //up to microseconds, extra digits are truncated
                int64_t scale = 100000;
                size_t ndig = 0;
                while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))){
                    if (scale > 0) {frac_us += (s[pos] - '0') * scale; scale /= 10;}
                    ++pos; ++ndig;
                }
                if (ndig == 0) return std::nullopt;
            }
        }
        expect(s, pos, 'Z');
        if (pos != s.size()) return std::nullopt;
        if (hour > 23 || minute > 59 || second > 60) return std::nullopt;
    }

    const int64_t secs = days * 86400 + hour * 3600 + minute * 60 + second;
    return secs * kUsPerSecond + frac_us;
}

} // namespace

std::optional<Timestamp> parse_timestamp(const std::string& text){
    const std::string s = trim(text);
    if (s.empty()) return std::nullopt;

    //calendar form first so "2024-01-02" is not read as a number
    if (s.size() >= 10 && s[4] == '-') return parse_calendar(s);

    auto secs = parse_number(s);
    if (!secs) return std::nullopt;
    return epoch_seconds_to_us(*secs);
}

std::optional<Timestamp> cell_to_timestamp(const Cell& c){
    switch (c.kind){
        case Cell::Kind::Time:   return c.t_us;
        case Cell::Kind::Text:   return parse_timestamp(c.text);
        case Cell::Kind::Number: return epoch_seconds_to_us(c.num);
        default:                 return std::nullopt;
    }
}

std::optional<double> cell_to_number(const Cell& c){
    switch (c.kind){
        case Cell::Kind::Number:
            if (!std::isfinite(c.num)) return std::nullopt;    //NaN cells count as null
            return c.num;
        case Cell::Kind::Text:   return parse_number(trim(c.text));
        default:                 return std::nullopt;
    }
}

std::string format_timestamp(Timestamp t_us){
    //floor division so pre-epoch times land on the right second
    int64_t secs = t_us / kUsPerSecond;
    if (t_us % kUsPerSecond < 0) --secs;
    int64_t days = secs / 86400;
    int64_t rem = secs % 86400;
    if (rem < 0) {rem += 86400; --days;}

    int64_t y = 0; unsigned m = 0, d = 0;
    civil_from_days(days, y, m, d);

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%04lld-%02u-%02u %02d:%02d:%02d",
                  static_cast<long long>(y), m, d,
                  int(rem / 3600), int((rem % 3600) / 60), int(rem % 60));
    return std::string(buf);
}

} // namespace vfd
