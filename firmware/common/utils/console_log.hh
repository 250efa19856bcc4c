#ifndef CONSOLE_LOG_HH_
#define CONSOLE_LOG_HH_

#include <cstdarg>
#include <cstdint>

/**
 * Leveled console output shared by the firmware and the host build.
 *
 * On the RP2040, printf() is routed to the Pico stdio backends (UART / USB CDC), so the same calls work on the
 * target and on the host. Messages are printed as "[tag] message". A sink callback can be installed to capture
 * lines instead (used by host tests).
 */
class ConsoleLog {
   public:
    enum LogLevel : uint8_t { kSilent = 0, kErrors = 1, kWarnings = 2, kInfo = 3 };

    static constexpr uint16_t kMaxLineLen = 512;  // Fits a full diagnostics dump.

    using SinkCallback = void (*)(LogLevel level, const char* line);

    static void SetLevel(LogLevel level) { level_ = level; }
    static LogLevel GetLevel() { return level_; }

    /**
     * Install a sink that receives formatted lines instead of stdout/stderr. Pass nullptr to restore the default.
     */
    static void SetSink(SinkCallback sink) { sink_ = sink; }

    static const char* GetLevelString(LogLevel level);

    /**
     * Format and emit a message if it passes the current log level.
     * @param[in] level Severity of the message.
     * @param[in] tag Name of the calling function, e.g. "GPSClockReceiver::Initialize".
     * @param[in] format printf style format string.
     * @retval Number of characters emitted, 0 if filtered out.
     */
    static int Printf(LogLevel level, const char* tag, const char* format, ...)
        __attribute__((format(printf, 3, 4)));
    static int VPrintf(LogLevel level, const char* tag, const char* format, va_list args);

   private:
    static LogLevel level_;
    static SinkCallback sink_;
};

#define CONSOLE_INFO(tag, ...) ConsoleLog::Printf(ConsoleLog::kInfo, tag, __VA_ARGS__)
#define CONSOLE_WARNING(tag, ...) ConsoleLog::Printf(ConsoleLog::kWarnings, tag, __VA_ARGS__)
#define CONSOLE_ERROR(tag, ...) ConsoleLog::Printf(ConsoleLog::kErrors, tag, __VA_ARGS__)

#endif  // CONSOLE_LOG_HH_
