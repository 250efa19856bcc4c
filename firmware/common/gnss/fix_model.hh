#ifndef FIX_MODEL_HH_
#define FIX_MODEL_HH_

#include <cstddef>
#include <cstdint>

/**
 * Latest validated GNSS state for one receiver session.
 *
 * Fields are grouped by the NMEA sentence that owns them. A sentence type only ever writes its own group:
 * - RMC: timestamp, date, latitude, longitude, speed, course, valid.
 * - GGA: timestamp, satellites_in_use, fix_stat, hdop, and (with a fix) latitude, longitude, altitude.
 * - GSA: fix_type, satellites_used, pdop, hdop, vdop.
 * - GSV: satellites_in_view and the satellite table.
 *
 * The model is never cleared once populated: after signal loss it keeps serving the last good values.
 */
struct FixModel {
    // Values match the GSA fix mode field.
    enum FixType : uint8_t { kNoFix = 1, k2DFix = 2, k3DFix = 3 };

    enum DateFormat : uint8_t {
        kDateMDY = 0,  // MM/DD/YY
        kDateDMY = 1,  // DD/MM/YY
        kDateLong = 2  // January 1st, 2014
    };

    static constexpr uint16_t kMaxSatellitesUsed = 12;
    static constexpr uint16_t kMaxSatellites = 32;
    static constexpr int16_t kSatelliteFieldMissing = -1;
    static constexpr uint16_t kCenturyBase = 2000;

    struct Timestamp {
        uint8_t hour = 0;
        uint8_t minute = 0;
        float second = 0.0f;
    };

    struct Date {
        uint8_t day = 0;
        uint8_t month = 0;
        uint8_t year = 0;  // Two digits.

        bool IsSet() const { return day != 0 || month != 0 || year != 0; }
    };

    struct Coordinate {
        uint16_t degrees = 0;
        double minutes = 0.0;
        char hemisphere = 'N';

        bool operator==(const Coordinate& other) const {
            return degrees == other.degrees && minutes == other.minutes && hemisphere == other.hemisphere;
        }
        bool operator!=(const Coordinate& other) const { return !(*this == other); }
    };

    struct SatelliteInfo {
        uint8_t prn = 0;
        int16_t elevation_deg = kSatelliteFieldMissing;
        int16_t azimuth_deg = kSatelliteFieldMissing;
        int16_t snr_db = kSatelliteFieldMissing;
    };

    // RMC / GGA.
    Timestamp timestamp;
    Date date;
    Coordinate latitude = {0, 0.0, 'N'};
    Coordinate longitude = {0, 0.0, 'W'};
    bool valid = false;
    bool has_ever_had_fix = false;
    double speed_knots = 0.0;
    double course_deg = 0.0;

    // GGA.
    uint8_t fix_stat = 0;
    uint8_t satellites_in_use = 0;
    float hdop = 0.0f;
    float altitude_m = 0.0f;
    float geoid_height_m = 0.0f;

    // GSA.
    FixType fix_type = kNoFix;
    uint8_t satellites_used[kMaxSatellitesUsed] = {0};
    uint8_t num_satellites_used = 0;
    float pdop = 0.0f;
    float vdop = 0.0f;

    // GSV.
    uint8_t satellites_in_view = 0;
    uint8_t total_sv_sentences = 0;
    uint8_t last_sv_sentence = 0;
    SatelliteInfo satellites[kMaxSatellites];
    uint8_t num_satellites = 0;

    // Refreshed by any sentence that reports a usable fix.
    bool has_fix_time = false;
    uint32_t last_fix_time_ms = 0;

    // Diagnostics.
    uint32_t clean_sentences = 0;
    uint32_t crc_fails = 0;
    uint32_t parsed_sentences = 0;

    static bool IsLeapYear(uint16_t year);
    static uint8_t DaysInMonth(uint8_t month, uint16_t year);

    /**
     * Write the UTC time shifted by a whole number of hours as "HH:MM:SS".
     * @param[in] utc_offset_hours Local offset from UTC, e.g. -5 for EST.
     * @param[out] buffer Destination buffer.
     * @param[in] max_len Size of the destination buffer.
     * @retval Number of characters written, 0 if the buffer was too small.
     */
    size_t FormatTime(int utc_offset_hours, char* buffer, size_t max_len) const;

    /**
     * Write the date as "YYYY-MM-DD", rolling the day, month and year over when the offset moves the local time
     * across midnight. Writes "----.--.--" if no date has been received.
     */
    size_t FormatDate(int utc_offset_hours, char* buffer, size_t max_len) const;

    /**
     * Write the UTC date in one of the short formats or the long English format.
     */
    size_t FormatDateShort(DateFormat format, char* buffer, size_t max_len) const;

    const char* GetFixTypeString() const;
    const char* GetCompassDirection() const;
    double GetSpeedKph() const;
    double GetSpeedMph() const;

    /**
     * Milliseconds since a sentence last reported a fix, or -1 if none has.
     */
    int32_t TimeSinceFixMs(uint32_t now_ms) const;

    /**
     * True once every sentence of a multi-part GSV group has been received.
     */
    bool SatelliteDataComplete() const {
        return total_sv_sentences > 0 && total_sv_sentences == last_sv_sentence;
    }

    const SatelliteInfo* FindSatellite(uint8_t prn) const;
};

#endif  // FIX_MODEL_HH_
