#include "gps_clock_receiver.hh"

#include <cinttypes>
#include <cstdio>
#include <cstring>

#include "console_log.hh"

#ifdef ON_EMBEDDED_DEVICE
#include "hardware/gpio.h"
#include "hardware/uart.h"
#include "pico/stdlib.h"
#endif

GPSClockReceiver::GPSClockReceiver() : stream_(fix_), deriver_(fix_) {}

bool GPSClockReceiver::Initialize(const GPSSettings& settings) {
    if (!settings.IsValid()) {
        CONSOLE_ERROR("GPSClockReceiver::Initialize",
                      "Rejected invalid settings: uart%u at %" PRIu32 " baud, TX=%u RX=%u, UTC offset %d.",
                      settings.gps_uart_id, settings.gps_uart_baud, settings.gps_uart_tx_pin,
                      settings.gps_uart_rx_pin, settings.utc_offset_hours);
        return false;
    }

    settings_ = settings;
    ConsoleLog::SetLevel(settings_.log_level);
    stream_.SetAtomicSentenceUpdates(settings_.atomic_sentence_updates);
    stats_ = Statistics();

    if (!InitializeUART()) {
        CONSOLE_ERROR("GPSClockReceiver::Initialize", "Failed to initialize GNSS UART%u.", settings_.gps_uart_id);
        return false;
    }

    initialized_ = true;
    CONSOLE_INFO("GPSClockReceiver::Initialize", "Receiver ready: %s sentence updates, coordinates as %s.",
                 settings_.atomic_sentence_updates ? "atomic" : "partial", settings_.GetCoordinateFormatString());
    return true;
}

bool GPSClockReceiver::InitializeUART() {
#ifdef ON_EMBEDDED_DEVICE
    uart_inst_t* uart = settings_.gps_uart_id == 0 ? uart0 : uart1;

    gpio_set_function(settings_.gps_uart_tx_pin, GPIO_FUNC_UART);
    gpio_set_function(settings_.gps_uart_rx_pin, GPIO_FUNC_UART);

    uint actual_baud = uart_init(uart, settings_.gps_uart_baud);
    if (actual_baud == 0) {
        return false;
    }
    uart_set_translate_crlf(uart, false);
    uart_set_fifo_enabled(uart, true);

    CONSOLE_INFO("GPSClockReceiver::InitializeUART", "GNSS UART%u initialized at %u baud (TX=%u, RX=%u).",
                 settings_.gps_uart_id, actual_baud, settings_.gps_uart_tx_pin, settings_.gps_uart_rx_pin);
#else
    CONSOLE_INFO("GPSClockReceiver::InitializeUART", "UART initialization (simulated) at %" PRIu32 " baud.",
                 settings_.gps_uart_baud);
#endif
    return true;
}

size_t GPSClockReceiver::Update() {
    if (!initialized_) {
        return 0;
    }

    size_t sentences_decoded = 0;
#ifdef ON_EMBEDDED_DEVICE
    uart_inst_t* uart = settings_.gps_uart_id == 0 ? uart0 : uart1;

    // Keep reading until the FIFO is empty so it cannot overflow between polling cycles.
    while (uart_is_readable(uart)) {
        size_t num_bytes = 0;
        while (uart_is_readable(uart) && num_bytes < sizeof(uart_buffer_)) {
            uart_buffer_[num_bytes++] = static_cast<uint8_t>(uart_getc(uart));
        }
        sentences_decoded += ProcessData(uart_buffer_, num_bytes);
    }
#else
    // Simulation mode - no UART data
#endif
    return sentences_decoded;
}

size_t GPSClockReceiver::ProcessData(const uint8_t* buffer, size_t length) {
    if (!buffer || length == 0) {
        return 0;
    }

    stats_.bytes_received += length;
    if (settings_.gps_raw_output) {
        CONSOLE_INFO("GPSClockReceiver::ProcessData", "GNSS ASCII [%zu bytes]: %.*s", length,
                     static_cast<int>(length), reinterpret_cast<const char*>(buffer));
    }

    size_t sentences_decoded = stream_.ParseData(buffer, length);
    stats_.sentences_decoded += sentences_decoded;
    CheckFixTransition();
    return sentences_decoded;
}

void GPSClockReceiver::CheckFixTransition() {
    if (fix_.valid && !had_fix_) {
        stats_.fix_acquisitions++;
        CONSOLE_INFO("GPSClockReceiver::CheckFixTransition", "Fix acquired at %.6f, %.6f (%s).",
                     deriver_.GetLatitudeDecimal(), deriver_.GetLongitudeDecimal(), deriver_.GetMaidenhead());
    } else if (!fix_.valid && had_fix_) {
        stats_.fix_losses++;
        CONSOLE_WARNING("GPSClockReceiver::CheckFixTransition", "Signal lost, holding last time.");
    }
    had_fix_ = fix_.valid;
}

const char* GPSClockReceiver::TimeString(int utc_offset_hours) {
    if (fix_.FormatTime(utc_offset_hours, time_str_, sizeof(time_str_)) == 0) {
        return kTimePlaceholder;
    }
    return time_str_;
}

const char* GPSClockReceiver::DateString(int utc_offset_hours) {
    if (fix_.FormatDate(utc_offset_hours, date_str_, sizeof(date_str_)) == 0) {
        date_str_[0] = '\0';
    }
    return date_str_;
}

const char* GPSClockReceiver::LatitudeString() {
    if (deriver_.FormatLatitude(settings_.coordinate_format, latitude_str_, sizeof(latitude_str_)) == 0) {
        latitude_str_[0] = '\0';
    }
    return latitude_str_;
}

const char* GPSClockReceiver::LongitudeString() {
    if (deriver_.FormatLongitude(settings_.coordinate_format, longitude_str_, sizeof(longitude_str_)) == 0) {
        longitude_str_[0] = '\0';
    }
    return longitude_str_;
}

void GPSClockReceiver::LogStatus(int utc_offset_hours) {
    if (!TimeIsValid()) {
        CONSOLE_INFO("GPSClockReceiver::LogStatus", "%s Acquiring satellites... Sat:%u/%u", kTimePlaceholder,
                     SatellitesInUse(), SatellitesInView());
        return;
    }
    CONSOLE_INFO("GPSClockReceiver::LogStatus", "%s %s Sat:%u/%u Fix:%s %s %s %s %s%s", TimeString(utc_offset_hours),
                 DateString(utc_offset_hours), SatellitesInUse(), SatellitesInView(), FixTypeString(),
                 LatitudeString(), LongitudeString(), Maidenhead(), UTM(), HasFix() ? "" : " Signal lost");
}

size_t GPSClockReceiver::GetDiagnostics(char* buffer, size_t max_len) const {
    if (!buffer || max_len == 0) return 0;

    size_t written = stream_.GetDiagnostics(buffer, max_len);
    if (written == 0) {
        return 0;
    }

    int more = snprintf(buffer + written, max_len - written,
                        "GPS Clock Receiver:\n"
                        "  Bytes received: %" PRIu32
                        "\n"
                        "  Fix acquisitions/losses: %" PRIu32 "/%" PRIu32 "\n",
                        stats_.bytes_received, stats_.fix_acquisitions, stats_.fix_losses);
    if (more <= 0 || more >= static_cast<int>(max_len - written)) {
        return 0;
    }
    return written + more;
}
