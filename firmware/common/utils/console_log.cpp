#include "console_log.hh"

#include <cstdio>
#include <cstring>

ConsoleLog::LogLevel ConsoleLog::level_ = ConsoleLog::kInfo;
ConsoleLog::SinkCallback ConsoleLog::sink_ = nullptr;

const char* ConsoleLog::GetLevelString(LogLevel level) {
    switch (level) {
        case kSilent:
            return "SILENT";
        case kErrors:
            return "ERROR";
        case kWarnings:
            return "WARNING";
        case kInfo:
            return "INFO";
        default:
            return "UNKNOWN";
    }
}

int ConsoleLog::Printf(LogLevel level, const char* tag, const char* format, ...) {
    va_list args;
    va_start(args, format);
    int written = VPrintf(level, tag, format, args);
    va_end(args);
    return written;
}

int ConsoleLog::VPrintf(LogLevel level, const char* tag, const char* format, va_list args) {
    if (level == kSilent || level > level_ || !format) {
        return 0;
    }

    char line[kMaxLineLen];
    int prefix_len = snprintf(line, sizeof(line), "[%s] ", tag ? tag : "");
    if (prefix_len < 0 || prefix_len >= static_cast<int>(sizeof(line))) {
        return 0;
    }
    int body_len = vsnprintf(line + prefix_len, sizeof(line) - prefix_len, format, args);
    if (body_len < 0) {
        return 0;
    }

    // Messages are written with or without a trailing newline; normalize to exactly one.
    size_t len = strlen(line);
    while (len > 0 && (line[len - 1] == '\n' || line[len - 1] == '\r')) {
        line[--len] = '\0';
    }

    if (sink_) {
        sink_(level, line);
        return static_cast<int>(len);
    }

#ifdef ON_EMBEDDED_DEVICE
    printf("%s\r\n", line);
#else
    if (level == kErrors) {
        fprintf(stderr, "%s\n", line);
    } else {
        printf("%s\n", line);
    }
#endif
    return static_cast<int>(len);
}
