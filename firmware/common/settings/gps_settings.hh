#ifndef GPS_SETTINGS_HH_
#define GPS_SETTINGS_HH_

#include <cstdint>

#include "console_log.hh"
#include "geodetic_deriver.hh"

/**
 * GPS receiver and clock settings.
 * Defaults match a BN-220 class receiver on UART1 at 9600 baud.
 */
struct GPSSettings {
    // Constants
    static constexpr uint32_t kMinUARTBaud = 4800;
    static constexpr uint32_t kMaxUARTBaud = 921600;
    static constexpr int8_t kMinUTCOffsetHours = -12;
    static constexpr int8_t kMaxUTCOffsetHours = 14;

    // UART configuration
    uint8_t gps_uart_id = 1;
    uint32_t gps_uart_baud = 9600;
    uint8_t gps_uart_tx_pin = 4;  // To receiver RX.
    uint8_t gps_uart_rx_pin = 5;  // From receiver TX.

    // Parser behaviour
    bool atomic_sentence_updates = true;  // Commit a sentence's fields only if the whole sentence decodes.

    // Clock presentation
    int8_t utc_offset_hours = 0;  // Supplied by the timezone collaborator; used for the status print only.
    GeodeticDeriver::CoordinateFormat coordinate_format = GeodeticDeriver::kDecimal;
    uint16_t status_interval_ms = 200;  // Matches the display refresh throttle.
    uint16_t diagnostics_interval_ms = 10000;

    // Diagnostics/debug
    ConsoleLog::LogLevel log_level = ConsoleLog::kInfo;
    bool gps_raw_output = false;  // Echo raw NMEA bytes to the console.

    GPSSettings() {}

    /**
     * Check that the settings can be applied to the hardware.
     */
    bool IsValid() const {
        return gps_uart_baud >= kMinUARTBaud && gps_uart_baud <= kMaxUARTBaud && gps_uart_id <= 1 &&
               utc_offset_hours >= kMinUTCOffsetHours && utc_offset_hours <= kMaxUTCOffsetHours &&
               gps_uart_tx_pin != gps_uart_rx_pin;
    }

    /**
     * Get human-readable coordinate format string
     */
    const char* GetCoordinateFormatString() const {
        switch (coordinate_format) {
            case GeodeticDeriver::kDecimal:
                return "DD";
            case GeodeticDeriver::kDegreesDecimalMinutes:
                return "DDM";
            case GeodeticDeriver::kDegreesMinutesSeconds:
                return "DMS";
            default:
                return "UNKNOWN";
        }
    }

    const char* GetLogLevelString() const { return ConsoleLog::GetLevelString(log_level); }
};

#endif  // GPS_SETTINGS_HH_
