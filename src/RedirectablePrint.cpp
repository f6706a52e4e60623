#include "RedirectablePrint.h"
#include "configuration.h"
#include <cctype>
#include <cstring>
#include <memory>

#ifdef ARCH_PORTDUINO
#include "platform/portduino/PortduinoGlue.h"
#endif

size_t RedirectablePrint::write(uint8_t c)
{
    dest->write(c);

    return 1; // We always claim one was written, rather than trusting what the
              // serial port said (which could be zero)
}

size_t RedirectablePrint::vprintf(const char *logLevel, const char *format, va_list arg)
{
    va_list copy;
#if ARCH_PORTDUINO
    static char printBuf[512];
#else
    static char printBuf[160];
#endif

    va_copy(copy, arg);
    size_t len = vsnprintf(printBuf, sizeof(printBuf), format, copy);
    va_end(copy);

    // If the resulting string is longer than sizeof(printBuf)-1 characters, the remaining characters are still counted for the
    // return value

    if (len > sizeof(printBuf) - 1) {
        len = sizeof(printBuf) - 1;
        printBuf[sizeof(printBuf) - 2] = '\n';
    }
    for (size_t f = 0; f < len; f++) {
        if (!std::isprint(static_cast<unsigned char>(printBuf[f])) && printBuf[f] != '\n')
            printBuf[f] = '#';
    }
    return Print::write(printBuf, len);
}

bool RedirectablePrint::isLevelEnabled(const char *logLevel) const
{
#ifdef ARCH_PORTDUINO
    int level = sh1107_config.logoutputlevel;
    if (strcmp(logLevel, SH1107_LOG_LEVEL_TRACE) == 0)
        return level >= level_trace;
    if (strcmp(logLevel, SH1107_LOG_LEVEL_DEBUG) == 0)
        return level >= level_debug;
    if (strcmp(logLevel, SH1107_LOG_LEVEL_INFO) == 0)
        return level >= level_info;
    if (strcmp(logLevel, SH1107_LOG_LEVEL_WARN) == 0)
        return level >= level_warn;
#else
    (void)logLevel;
#endif
    return true;
}

void RedirectablePrint::log_to_serial(const char *logLevel, const char *format, va_list arg)
{
    // include the header
    if (color) {
        if (strcmp(logLevel, SH1107_LOG_LEVEL_DEBUG) == 0)
            Print::write("\u001b[34m", 5);
        if (strcmp(logLevel, SH1107_LOG_LEVEL_INFO) == 0)
            Print::write("\u001b[32m", 5);
        if (strcmp(logLevel, SH1107_LOG_LEVEL_WARN) == 0)
            Print::write("\u001b[33m", 5);
        if (strcmp(logLevel, SH1107_LOG_LEVEL_ERROR) == 0 || strcmp(logLevel, SH1107_LOG_LEVEL_CRIT) == 0)
            Print::write("\u001b[31m", 5);
        if (strcmp(logLevel, SH1107_LOG_LEVEL_TRACE) == 0)
            Print::write("\u001b[35m", 5);
    }
    print(logLevel);
    if (color)
        Print::write("\u001b[0m", 4);

    char uptime[16];
    snprintf(uptime, sizeof(uptime), " | %lu ", (unsigned long)(millis() / 1000));
    print(uptime);

    vprintf(logLevel, format, arg);
}

void RedirectablePrint::log(const char *logLevel, const char *format, ...)
{
    if (!isLevelEnabled(logLevel))
        return;

    // append \n to format
    size_t len = strlen(format);
    std::unique_ptr<char[]> newFormat(new char[len + 2]);
    strcpy(newFormat.get(), format);
    newFormat[len] = '\n';
    newFormat[len + 1] = '\0';

    if (!inDebugPrint) {
        inDebugPrint = true;

        va_list arg;
        va_start(arg, format);
        log_to_serial(logLevel, newFormat.get(), arg);
        va_end(arg);

        inDebugPrint = false;
    }
}
