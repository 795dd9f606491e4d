/**
 * Hydrolink - Debug Output
 * Printf-style logging routed to a pluggable line sink
 */

#ifndef LOG_H
#define LOG_H

// Receives one formatted message (may contain trailing newline)
typedef void (*LogSink)(const char* message);

// Install the output sink (Serial on the hub, capture buffer in tests)
// Passing nullptr silences all output
void logSetSink(LogSink sink);

// Format and forward to the current sink
// Messages longer than the internal buffer are truncated
void logPrintf(const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 1, 2)))
#endif
    ;

#endif // LOG_H
