#ifndef UNIT_CONVERSIONS_HH_
#define UNIT_CONVERSIONS_HH_

#include <cstdint>

static const int kSecPerMin = 60;
static const int kHoursPerDay = 24;
static const int kMinutesPerDegree = 60;

// ==============================================================================
// Speed Conversions
// ==============================================================================
// NMEA reports speed over ground in knots. The clock shows km/h or mph.
constexpr double kKnotsToKph = 1.852;
constexpr double kKnotsToMph = 1.151;

inline double KnotsToKph(double knots) { return knots * kKnotsToKph; }

inline double KnotsToMph(double knots) { return knots * kKnotsToMph; }

// ==============================================================================
// Angle Conversions
// ==============================================================================
constexpr double kPi = 3.14159265358979323846;
constexpr double kDegToRad = kPi / 180.0;

inline double DegToRad(double deg) { return deg * kDegToRad; }

// NMEA coordinates arrive as whole degrees plus decimal minutes.
inline double DegMinToDecimalDeg(int degrees, double minutes) {
    return degrees + minutes / kMinutesPerDegree;
}

#endif
