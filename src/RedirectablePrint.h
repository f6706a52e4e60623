#pragma once

#include <Print.h>
#include <stdarg.h>
#include <stdint.h>

/**
 * A Printable that can be switched to squirt its bytes to a different sink.
 * This class is mostly useful to allow debug printing to be redirected away from Serial
 * to some other transport if we switch Serial usage (on the fly) to some other purpose.
 */
class RedirectablePrint : public Print
{
    Print *dest;

    volatile bool inDebugPrint = false;

    /// Print ANSI colour escapes around the level tag
    bool color = true;

  public:
    explicit RedirectablePrint(Print *_dest) : dest(_dest) {}

    void setColor(bool enabled) { color = enabled; }

    virtual size_t write(uint8_t c);

    /**
     * Log one line at the given level (one of the SH1107_LOG_LEVEL_* tags).
     *
     * A newline is appended to format. Messages below the configured level are dropped.
     */
    void log(const char *logLevel, const char *format, ...) __attribute__((format(printf, 3, 4)));

    /** like printf but va_list based */
    size_t vprintf(const char *logLevel, const char *format, va_list arg);

  protected:
    /// False if logLevel is filtered out by the current configuration
    virtual bool isLevelEnabled(const char *logLevel) const;

    virtual void log_to_serial(const char *logLevel, const char *format, va_list arg);
};
