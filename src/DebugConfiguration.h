#pragma once

// -----------------------------------------------------------------------------
// DEBUG
// -----------------------------------------------------------------------------

#define SERIAL_BAUD 115200 // Serial debug baud rate

#define SH1107_LOG_LEVEL_DEBUG "DEBUG"
#define SH1107_LOG_LEVEL_INFO "INFO "
#define SH1107_LOG_LEVEL_WARN "WARN "
#define SH1107_LOG_LEVEL_ERROR "ERROR"
#define SH1107_LOG_LEVEL_CRIT "CRIT "
#define SH1107_LOG_LEVEL_TRACE "TRACE"

#include "SerialConsole.h"

#define DEBUG_PORT (*console) // Serial debug port

#if defined(DEBUG_PORT) && !defined(DEBUG_MUTE)
#define LOG_DEBUG(...) DEBUG_PORT.log(SH1107_LOG_LEVEL_DEBUG, __VA_ARGS__)
#define LOG_INFO(...) DEBUG_PORT.log(SH1107_LOG_LEVEL_INFO, __VA_ARGS__)
#define LOG_WARN(...) DEBUG_PORT.log(SH1107_LOG_LEVEL_WARN, __VA_ARGS__)
#define LOG_ERROR(...) DEBUG_PORT.log(SH1107_LOG_LEVEL_ERROR, __VA_ARGS__)
#define LOG_CRIT(...) DEBUG_PORT.log(SH1107_LOG_LEVEL_CRIT, __VA_ARGS__)
#define LOG_TRACE(...) DEBUG_PORT.log(SH1107_LOG_LEVEL_TRACE, __VA_ARGS__)
#else
#define LOG_DEBUG(...)
#define LOG_INFO(...)
#define LOG_WARN(...)
#define LOG_ERROR(...)
#define LOG_CRIT(...)
#define LOG_TRACE(...)
#endif
