#ifndef GPS_CLOCK_RECEIVER_HH_
#define GPS_CLOCK_RECEIVER_HH_

#include <cstddef>
#include <cstdint>

#include "fix_model.hh"
#include "geodetic_deriver.hh"
#include "gps_settings.hh"
#include "nmea_sentence_stream.hh"

/**
 * GPS Clock Receiver - one receiver session for the clock.
 *
 * Responsibilities:
 * - Open the GNSS UART and drain it every polling cycle
 * - Own the FixModel, the sentence stream that mutates it and the geodetic deriver that reads it
 * - Provide display-ready strings and numbers to the display, timezone and status collaborators
 * - Log fix acquisition / loss transitions
 *
 * Runs entirely inside the main polling loop. Not thread safe.
 */
class GPSClockReceiver {
   public:
    static constexpr size_t kUARTReadBufferSize = 256;
    static constexpr size_t kTimeStrLen = 9;    // HH:MM:SS
    static constexpr size_t kDateStrLen = 11;   // YYYY-MM-DD
    static constexpr size_t kCoordStrLen = 24;  // 40 42' 46.1" N
    static constexpr const char* kTimePlaceholder = "--:--:--";

    struct Statistics {
        uint32_t bytes_received = 0;
        uint32_t sentences_decoded = 0;
        uint32_t fix_acquisitions = 0;
        uint32_t fix_losses = 0;
    };

    GPSClockReceiver();
    // The stream and deriver reference fix_, so a copy would alias the original's model.
    GPSClockReceiver(const GPSClockReceiver&) = delete;
    GPSClockReceiver& operator=(const GPSClockReceiver&) = delete;

    /**
     * Apply settings and open the receiver UART.
     * @param settings GPS and clock settings
     * @return true if initialization successful
     */
    bool Initialize(const GPSSettings& settings);

    /**
     * Drain every byte waiting in the UART and feed it to the parser. Call once per polling cycle, often enough that
     * the UART FIFO never overflows.
     * @return Number of sentences decoded
     */
    size_t Update();

    /**
     * Feed bytes received by other means (host replay, tests).
     * @param buffer Data buffer
     * @param length Data length in bytes
     * @return Number of sentences decoded
     */
    size_t ProcessData(const uint8_t* buffer, size_t length);

    /**
     * Local time "HH:MM:SS" for the given UTC offset.
     * @return Pointer to an internal buffer, valid until the next call.
     */
    const char* TimeString(int utc_offset_hours);

    /**
     * Local date "YYYY-MM-DD" for the given UTC offset, rolled over across midnight.
     * @return Pointer to an internal buffer, valid until the next call.
     */
    const char* DateString(int utc_offset_hours);

    const char* LatitudeString();
    const char* LongitudeString();

    bool HasFix() const { return fix_.valid; }
    bool HasEverHadFix() const { return fix_.has_ever_had_fix; }
    // Time keeps running from the receiver's RTC after the first fix, even without a current fix.
    bool TimeIsValid() const { return fix_.has_ever_had_fix; }
    const char* FixTypeString() const { return fix_.GetFixTypeString(); }
    uint8_t SatellitesInUse() const { return fix_.satellites_in_use; }
    uint8_t SatellitesInView() const { return fix_.satellites_in_view; }

    double LatitudeDecimal() { return deriver_.GetLatitudeDecimal(); }
    double LongitudeDecimal() { return deriver_.GetLongitudeDecimal(); }
    const char* Maidenhead() { return deriver_.GetMaidenhead(); }
    const char* UTM() { return deriver_.GetUTM(); }

    const FixModel& GetFixModel() const { return fix_; }
    const GeodeticDeriver& GetDeriver() const { return deriver_; }
    const GPSSettings& GetSettings() const { return settings_; }
    Statistics GetStatistics() const { return stats_; }

    /**
     * Print a one line summary of the clock state to the console.
     */
    void LogStatus(int utc_offset_hours);

    size_t GetDiagnostics(char* buffer, size_t max_len) const;

   private:
    bool InitializeUART();
    void CheckFixTransition();

    GPSSettings settings_;
    bool initialized_ = false;

    FixModel fix_;
    NMEASentenceStream stream_;
    GeodeticDeriver deriver_;

    bool had_fix_ = false;
    Statistics stats_;

    uint8_t uart_buffer_[kUARTReadBufferSize];

    char time_str_[kTimeStrLen + 1] = {0};
    char date_str_[kDateStrLen + 1] = {0};
    char latitude_str_[kCoordStrLen + 1] = {0};
    char longitude_str_[kCoordStrLen + 1] = {0};
};

#endif  // GPS_CLOCK_RECEIVER_HH_
