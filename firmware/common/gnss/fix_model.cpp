#include "fix_model.hh"

#include <cstdio>

#include "unit_conversions.hh"

namespace {

const uint8_t kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};

const char* const kMonthNames[] = {"January", "February", "March",     "April",   "May",      "June",
                                   "July",    "August",   "September", "October", "November", "December"};

const char* const kCompassDirections[] = {"N", "NNE", "NE", "ENE", "E", "ESE", "SE", "SSE",
                                          "S", "SSW", "SW", "WSW", "W", "WNW", "NW", "NNW"};

// snprintf wrapper that reports truncation as a failure.
size_t CheckedLength(int written, size_t max_len) {
    return (written > 0 && written < static_cast<int>(max_len)) ? static_cast<size_t>(written) : 0;
}

const char* DaySuffix(uint8_t day) {
    switch (day) {
        case 1:
        case 21:
        case 31:
            return "st";
        case 2:
        case 22:
            return "nd";
        case 3:
        case 23:
            return "rd";
        default:
            return "th";
    }
}

}  // namespace

bool FixModel::IsLeapYear(uint16_t year) { return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0); }

uint8_t FixModel::DaysInMonth(uint8_t month, uint16_t year) {
    if (month < 1 || month > 12) {
        return 0;
    }
    if (month == 2 && IsLeapYear(year)) {
        return 29;
    }
    return kDaysInMonth[month - 1];
}

size_t FixModel::FormatTime(int utc_offset_hours, char* buffer, size_t max_len) const {
    if (!buffer || max_len == 0) return 0;

    int hour = (static_cast<int>(timestamp.hour) + utc_offset_hours) % kHoursPerDay;
    if (hour < 0) hour += kHoursPerDay;

    int written = snprintf(buffer, max_len, "%02d:%02u:%02d", hour, timestamp.minute,
                           static_cast<int>(timestamp.second));
    return CheckedLength(written, max_len);
}

size_t FixModel::FormatDate(int utc_offset_hours, char* buffer, size_t max_len) const {
    if (!buffer || max_len == 0) return 0;

    if (!date.IsSet()) {
        return CheckedLength(snprintf(buffer, max_len, "----.--.--"), max_len);
    }

    int day = date.day;
    int month = date.month;
    int year = kCenturyBase + date.year;
    int local_hour = static_cast<int>(timestamp.hour) + utc_offset_hours;

    if (local_hour < 0) {
        // Previous day.
        day--;
        if (day < 1) {
            month--;
            if (month < 1) {
                month = 12;
                year--;
            }
            day = DaysInMonth(month, year);
        }
    } else if (local_hour >= kHoursPerDay) {
        // Next day.
        day++;
        if (day > DaysInMonth(month, year)) {
            day = 1;
            month++;
            if (month > 12) {
                month = 1;
                year++;
            }
        }
    }

    int written = snprintf(buffer, max_len, "%04d-%02d-%02d", year, month, day);
    return CheckedLength(written, max_len);
}

size_t FixModel::FormatDateShort(DateFormat format, char* buffer, size_t max_len) const {
    if (!buffer || max_len == 0) return 0;

    int written = 0;
    switch (format) {
        case kDateDMY:
            written = snprintf(buffer, max_len, "%02u/%02u/%02u", date.day, date.month, date.year);
            break;
        case kDateLong:
            if (date.month < 1 || date.month > 12) {
                return 0;
            }
            written = snprintf(buffer, max_len, "%s %u%s, %d", kMonthNames[date.month - 1], date.day,
                               DaySuffix(date.day), kCenturyBase + date.year);
            break;
        case kDateMDY:
        default:
            written = snprintf(buffer, max_len, "%02u/%02u/%02u", date.month, date.day, date.year);
            break;
    }
    return CheckedLength(written, max_len);
}

const char* FixModel::GetFixTypeString() const {
    switch (fix_type) {
        case k3DFix:
            return "3D";
        case k2DFix:
            return "2D";
        default:
            return "None";
    }
}

const char* FixModel::GetCompassDirection() const {
    // Each of the 16 points covers 22.5 degrees centered on its heading.
    int index = static_cast<int>((course_deg + 11.25) / 22.5) % 16;
    if (index < 0) index += 16;
    return kCompassDirections[index];
}

double FixModel::GetSpeedKph() const { return KnotsToKph(speed_knots); }

double FixModel::GetSpeedMph() const { return KnotsToMph(speed_knots); }

int32_t FixModel::TimeSinceFixMs(uint32_t now_ms) const {
    if (!has_fix_time) {
        return -1;
    }
    return static_cast<int32_t>(now_ms - last_fix_time_ms);
}

const FixModel::SatelliteInfo* FixModel::FindSatellite(uint8_t prn) const {
    for (uint16_t i = 0; i < num_satellites; i++) {
        if (satellites[i].prn == prn) {
            return &satellites[i];
        }
    }
    return nullptr;
}
