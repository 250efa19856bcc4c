#include "geodetic_deriver.hh"

#include <cmath>
#include <cstdio>
#include <cstring>

#include "unit_conversions.hh"

namespace {

// Maidenhead grid: fields, squares and subsquares per axis.
constexpr double kLonFieldWidthDeg = 20.0;
constexpr double kLatFieldWidthDeg = 10.0;
constexpr double kLonSquareWidthDeg = 2.0;
constexpr double kLatSquareWidthDeg = 1.0;
constexpr double kLonSubsquaresPerDeg = 12.0;  // 5' wide
constexpr double kLatSubsquaresPerDeg = 24.0;  // 2.5' tall
constexpr int kMaidenheadFieldsPerAxis = 18;
constexpr int kMaidenheadSquaresPerField = 10;
constexpr int kMaidenheadSubsquaresPerSquare = 24;

constexpr double kUTMZoneWidthDeg = 6.0;
constexpr int kUTMMaxZone = 60;
constexpr double kUTMMinBandLatDeg = -80.0;
constexpr double kUTMMaxBandLatDeg = 84.0;
constexpr double kUTMBandHeightDeg = 8.0;
constexpr int kUTMNumBands = 20;

// Finite latitude within [-90, 90] and longitude within [-180, 180].
bool IsValidPosition(double latitude_deg, double longitude_deg) {
    return std::isfinite(latitude_deg) && std::isfinite(longitude_deg) && fabs(latitude_deg) <= 90.0 &&
           fabs(longitude_deg) <= 180.0;
}

int ClampIndex(double value, int max_index) {
    int index = static_cast<int>(floor(value));
    if (index < 0) return 0;
    if (index > max_index) return max_index;
    return index;
}

}  // namespace

double GeodeticDeriver::ToDecimalDegrees(const FixModel::Coordinate& coordinate) {
    double decimal = DegMinToDecimalDeg(coordinate.degrees, coordinate.minutes);
    if (coordinate.hemisphere == 'S' || coordinate.hemisphere == 'W') {
        decimal = -decimal;
    }
    return decimal;
}

double GeodeticDeriver::GetDecimal(const FixModel::Coordinate& coordinate, DecimalCache& cache) {
    if (!cache.populated || cache.key != coordinate) {
        cache.key = coordinate;
        cache.value = ToDecimalDegrees(coordinate);
        cache.populated = true;
        decimal_compute_count_++;
    }
    return cache.value;
}

double GeodeticDeriver::GetLatitudeDecimal() { return GetDecimal(fix_.latitude, latitude_cache_); }

double GeodeticDeriver::GetLongitudeDecimal() { return GetDecimal(fix_.longitude, longitude_cache_); }

bool GeodeticDeriver::ComputeMaidenhead(double latitude_deg, double longitude_deg, char* buffer, size_t max_len) {
    if (!buffer || max_len < kMaidenheadLen + 1u) return false;
    if (!IsValidPosition(latitude_deg, longitude_deg)) return false;

    // Shift both axes so they start at zero.
    double lon = longitude_deg + 180.0;
    double lat = latitude_deg + 90.0;

    int lon_field = ClampIndex(lon / kLonFieldWidthDeg, kMaidenheadFieldsPerAxis - 1);
    int lat_field = ClampIndex(lat / kLatFieldWidthDeg, kMaidenheadFieldsPerAxis - 1);
    lon -= lon_field * kLonFieldWidthDeg;
    lat -= lat_field * kLatFieldWidthDeg;

    int lon_square = ClampIndex(lon / kLonSquareWidthDeg, kMaidenheadSquaresPerField - 1);
    int lat_square = ClampIndex(lat / kLatSquareWidthDeg, kMaidenheadSquaresPerField - 1);
    lon -= lon_square * kLonSquareWidthDeg;
    lat -= lat_square * kLatSquareWidthDeg;

    int lon_subsquare = ClampIndex(lon * kLonSubsquaresPerDeg, kMaidenheadSubsquaresPerSquare - 1);
    int lat_subsquare = ClampIndex(lat * kLatSubsquaresPerDeg, kMaidenheadSubsquaresPerSquare - 1);

    buffer[0] = static_cast<char>('A' + lon_field);
    buffer[1] = static_cast<char>('A' + lat_field);
    buffer[2] = static_cast<char>('0' + lon_square);
    buffer[3] = static_cast<char>('0' + lat_square);
    buffer[4] = static_cast<char>('a' + lon_subsquare);
    buffer[5] = static_cast<char>('a' + lat_subsquare);
    buffer[6] = '\0';
    return true;
}

uint8_t GeodeticDeriver::GetUTMZone(double longitude_deg) {
    int zone = static_cast<int>(floor((longitude_deg + 180.0) / kUTMZoneWidthDeg)) + 1;
    if (zone < 1) return 1;
    if (zone > kUTMMaxZone) return kUTMMaxZone;  // +180 belongs to zone 60.
    return static_cast<uint8_t>(zone);
}

char GeodeticDeriver::GetUTMBand(double latitude_deg) {
    if (latitude_deg > kUTMMaxBandLatDeg) return 'X';
    if (latitude_deg < kUTMMinBandLatDeg) return 'C';
    // Band X is 12 degrees tall, so 84 itself still maps to it.
    int index = ClampIndex((latitude_deg - kUTMMinBandLatDeg) / kUTMBandHeightDeg, kUTMNumBands - 1);
    return kUTMBandLetters[index];
}

bool GeodeticDeriver::ComputeUTM(double latitude_deg, double longitude_deg, char* buffer, size_t max_len) {
    if (!buffer || max_len == 0) return false;
    if (!IsValidPosition(latitude_deg, longitude_deg)) return false;

    const double a = kWGS84SemiMajorAxisM;
    const double f = kWGS84Flattening;
    const double e2 = 2.0 * f - f * f;
    const double e4 = e2 * e2;
    const double e6 = e4 * e2;
    const double ep2 = e2 / (1.0 - e2);
    const double k0 = kUTMScaleFactor;

    uint8_t zone = GetUTMZone(longitude_deg);
    double central_meridian_deg = (zone - 1) * kUTMZoneWidthDeg - 180.0 + kUTMZoneWidthDeg / 2.0;

    double phi = DegToRad(latitude_deg);
    double sin_phi = sin(phi);
    double cos_phi = cos(phi);
    double tan_phi = tan(phi);

    double N = a / sqrt(1.0 - e2 * sin_phi * sin_phi);
    double T = tan_phi * tan_phi;
    double C = ep2 * cos_phi * cos_phi;
    double A = cos_phi * DegToRad(longitude_deg - central_meridian_deg);

    // Meridional arc.
    double M = a * ((1.0 - e2 / 4.0 - 3.0 * e4 / 64.0 - 5.0 * e6 / 256.0) * phi -
                    (3.0 * e2 / 8.0 + 3.0 * e4 / 32.0 + 45.0 * e6 / 1024.0) * sin(2.0 * phi) +
                    (15.0 * e4 / 256.0 + 45.0 * e6 / 1024.0) * sin(4.0 * phi) - (35.0 * e6 / 3072.0) * sin(6.0 * phi));

    double A2 = A * A;
    double A3 = A2 * A;
    double A4 = A3 * A;
    double A5 = A4 * A;
    double A6 = A5 * A;

    double easting = k0 * N * (A + (1.0 - T + C) * A3 / 6.0 + (5.0 - 18.0 * T + T * T + 72.0 * C - 58.0 * ep2) * A5 / 120.0) +
                     kUTMFalseEastingM;
    double northing =
        k0 * (M + N * tan_phi *
                      (A2 / 2.0 + (5.0 - T + 9.0 * C + 4.0 * C * C) * A4 / 24.0 +
                       (61.0 - 58.0 * T + T * T + 600.0 * C - 330.0 * ep2) * A6 / 720.0));
    if (latitude_deg < 0.0) {
        northing += kUTMFalseNorthingSouthM;
    }

    int written = snprintf(buffer, max_len, "%u%c %06ldE %07ldN", zone, GetUTMBand(latitude_deg),
                           static_cast<long>(easting), static_cast<long>(northing));
    return written > 0 && written < static_cast<int>(max_len);
}

const char* GeodeticDeriver::GetMaidenhead() {
    if (!fix_.has_ever_had_fix) {
        return kMaidenheadPlaceholder;
    }

    double latitude_deg = GetLatitudeDecimal();
    double longitude_deg = GetLongitudeDecimal();
    if (!maidenhead_key_.populated || maidenhead_key_.latitude_deg != latitude_deg ||
        maidenhead_key_.longitude_deg != longitude_deg) {
        if (!ComputeMaidenhead(latitude_deg, longitude_deg, maidenhead_, sizeof(maidenhead_))) {
            return kMaidenheadPlaceholder;
        }
        maidenhead_key_.latitude_deg = latitude_deg;
        maidenhead_key_.longitude_deg = longitude_deg;
        maidenhead_key_.populated = true;
        maidenhead_compute_count_++;
    }
    return maidenhead_;
}

const char* GeodeticDeriver::GetUTM() {
    if (!fix_.has_ever_had_fix) {
        return kUTMPlaceholder;
    }

    double latitude_deg = GetLatitudeDecimal();
    double longitude_deg = GetLongitudeDecimal();
    if (!utm_key_.populated || utm_key_.latitude_deg != latitude_deg || utm_key_.longitude_deg != longitude_deg) {
        if (!ComputeUTM(latitude_deg, longitude_deg, utm_, sizeof(utm_))) {
            return kUTMPlaceholder;
        }
        utm_key_.latitude_deg = latitude_deg;
        utm_key_.longitude_deg = longitude_deg;
        utm_key_.populated = true;
        utm_compute_count_++;
    }
    return utm_;
}

size_t GeodeticDeriver::FormatCoordinate(const FixModel::Coordinate& coordinate, double decimal_deg,
                                         CoordinateFormat format, char* buffer, size_t max_len) const {
    if (!buffer || max_len == 0) return 0;

    int written = 0;
    switch (format) {
        case kDegreesDecimalMinutes:
            written = snprintf(buffer, max_len, "%u %.3f' %c", coordinate.degrees, coordinate.minutes,
                               coordinate.hemisphere);
            break;
        case kDegreesMinutesSeconds: {
            unsigned whole_minutes = static_cast<unsigned>(coordinate.minutes);
            double seconds = (coordinate.minutes - whole_minutes) * kSecPerMin;
            written = snprintf(buffer, max_len, "%u %u' %.1f\" %c", coordinate.degrees, whole_minutes, seconds,
                               coordinate.hemisphere);
            break;
        }
        case kDecimal:
        default:
            written = snprintf(buffer, max_len, "%.4f %c", fabs(decimal_deg), coordinate.hemisphere);
            break;
    }
    return (written > 0 && written < static_cast<int>(max_len)) ? written : 0;
}

size_t GeodeticDeriver::FormatLatitude(CoordinateFormat format, char* buffer, size_t max_len) {
    return FormatCoordinate(fix_.latitude, GetLatitudeDecimal(), format, buffer, max_len);
}

size_t GeodeticDeriver::FormatLongitude(CoordinateFormat format, char* buffer, size_t max_len) {
    return FormatCoordinate(fix_.longitude, GetLongitudeDecimal(), format, buffer, max_len);
}
