#include "console_log.hh"
#include "gnss/gps_clock_receiver.hh"
#include "gps_settings.hh"
#include "pico/binary_info.h"
#include "pico/stdlib.h"

const uint32_t kPollingIntervalMs = 10;
const uint32_t kStartupBannerDelayMs = 2000;  // Give USB CDC time to enumerate.

GPSSettings gps_settings;
GPSClockReceiver gps_clock_receiver;

int main() {
    bi_decl(bi_program_description("GPS Clock"));

    stdio_init_all();
    sleep_ms(kStartupBannerDelayMs);

    if (!gps_clock_receiver.Initialize(gps_settings)) {
        CONSOLE_ERROR("main", "GPS receiver initialization failed, halting.");
        while (true) {
            sleep_ms(1000);
        }
    }

    uint32_t last_status_ms = to_ms_since_boot(get_absolute_time());
    uint32_t last_diagnostics_ms = last_status_ms;
    char diagnostics[512];

    while (true) {
        // Drain the UART every iteration.
        gps_clock_receiver.Update();

        uint32_t now_ms = to_ms_since_boot(get_absolute_time());
        if (now_ms - last_status_ms >= gps_settings.status_interval_ms) {
            gps_clock_receiver.LogStatus(gps_settings.utc_offset_hours);
            last_status_ms = now_ms;
        }
        if (now_ms - last_diagnostics_ms >= gps_settings.diagnostics_interval_ms) {
            if (gps_clock_receiver.GetDiagnostics(diagnostics, sizeof(diagnostics)) > 0) {
                CONSOLE_INFO("main", "%s", diagnostics);
            } else {
                CONSOLE_WARNING("main", "Diagnostics did not fit in %zu bytes.", sizeof(diagnostics));
            }
            last_diagnostics_ms = now_ms;
        }

        sleep_ms(kPollingIntervalMs);
    }
}
