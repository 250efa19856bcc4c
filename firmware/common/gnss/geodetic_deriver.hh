#ifndef GEODETIC_DERIVER_HH_
#define GEODETIC_DERIVER_HH_

#include <cstddef>
#include <cstdint>

#include "fix_model.hh"

/**
 * Display oriented coordinate representations derived from a FixModel.
 *
 * Holds a read-only reference to the FixModel and caches every result against the source value it was computed
 * from, so repeated reads between fixes cost a comparison instead of the trigonometry:
 * - Decimal degrees are recomputed when the raw (degrees, minutes, hemisphere) tuple of that axis changes.
 * - The Maidenhead locator and UTM string are recomputed when the decimal (latitude, longitude) pair changes.
 */
class GeodeticDeriver {
   public:
    enum CoordinateFormat : uint8_t {
        kDecimal = 0,                // 40.7128 N
        kDegreesDecimalMinutes = 1,  // 40 42.768' N
        kDegreesMinutesSeconds = 2   // 40 42' 46.1" N
    };

    static constexpr uint16_t kMaidenheadLen = 6;
    static constexpr uint16_t kUTMMaxLen = 24;
    static constexpr const char* kMaidenheadPlaceholder = "------";
    static constexpr const char* kUTMPlaceholder = "--- ------E -------N";

    // WGS84 ellipsoid.
    static constexpr double kWGS84SemiMajorAxisM = 6378137.0;
    static constexpr double kWGS84Flattening = 1.0 / 298.257223563;
    static constexpr double kUTMScaleFactor = 0.9996;
    static constexpr double kUTMFalseEastingM = 500000.0;
    static constexpr double kUTMFalseNorthingSouthM = 10000000.0;
    static constexpr const char* kUTMBandLetters = "CDEFGHJKLMNPQRSTUVWX";

    explicit GeodeticDeriver(const FixModel& fix) : fix_(fix) {}

    /**
     * Latitude in signed decimal degrees, positive north.
     */
    double GetLatitudeDecimal();

    /**
     * Longitude in signed decimal degrees, positive east.
     */
    double GetLongitudeDecimal();

    /**
     * 6 character Maidenhead grid locator (e.g. "FN20xr"), or "------" until the receiver has had a fix.
     * @retval Pointer to an internal buffer that stays valid until the next call.
     */
    const char* GetMaidenhead();

    /**
     * UTM coordinate string such as "18T 583959E 4507350N", or a placeholder until the receiver has had a fix.
     * @retval Pointer to an internal buffer that stays valid until the next call.
     */
    const char* GetUTM();

    size_t FormatLatitude(CoordinateFormat format, char* buffer, size_t max_len);
    size_t FormatLongitude(CoordinateFormat format, char* buffer, size_t max_len);

    /**
     * Stateless conversions, exposed for reuse and testing.
     */
    static double ToDecimalDegrees(const FixModel::Coordinate& coordinate);
    static bool ComputeMaidenhead(double latitude_deg, double longitude_deg, char* buffer, size_t max_len);
    static bool ComputeUTM(double latitude_deg, double longitude_deg, char* buffer, size_t max_len);
    static uint8_t GetUTMZone(double longitude_deg);
    static char GetUTMBand(double latitude_deg);

    uint32_t GetDecimalComputeCount() const { return decimal_compute_count_; }
    uint32_t GetMaidenheadComputeCount() const { return maidenhead_compute_count_; }
    uint32_t GetUTMComputeCount() const { return utm_compute_count_; }

   private:
    struct DecimalCache {
        bool populated = false;
        FixModel::Coordinate key;
        double value = 0.0;
    };

    struct PairCache {
        bool populated = false;
        double latitude_deg = 0.0;
        double longitude_deg = 0.0;
    };

    double GetDecimal(const FixModel::Coordinate& coordinate, DecimalCache& cache);
    size_t FormatCoordinate(const FixModel::Coordinate& coordinate, double decimal_deg, CoordinateFormat format,
                            char* buffer, size_t max_len) const;

    const FixModel& fix_;

    DecimalCache latitude_cache_;
    DecimalCache longitude_cache_;

    PairCache maidenhead_key_;
    char maidenhead_[kMaidenheadLen + 1] = {0};

    PairCache utm_key_;
    char utm_[kUTMMaxLen + 1] = {0};

    uint32_t decimal_compute_count_ = 0;
    uint32_t maidenhead_compute_count_ = 0;
    uint32_t utm_compute_count_ = 0;
};

#endif  // GEODETIC_DERIVER_HH_
