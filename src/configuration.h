/*

SH1107 OLED display driver

Compile time configuration. Boards override these with -D flags, on Linux hosts most of them can also be set
at runtime from config.yaml (see platform/portduino/PortduinoGlue.h).

*/

#pragma once

#include <Arduino.h>

// -----------------------------------------------------------------------------
// Version
// -----------------------------------------------------------------------------

// If app version is not specified we assume we are not being invoked by the build script
#ifndef APP_VERSION
#error APP_VERSION must be set by the build environment
#endif

/// Convert a preprocessor name into a quoted string
#define xstr(s) ystr(s)
#define ystr(s) #s

/// Convert a preprocessor name into a quoted string and if that string is empty use "unset"
#define optstr(s) (xstr(s)[0] ? xstr(s) : "unset")

// -----------------------------------------------------------------------------
// SH1107
// -----------------------------------------------------------------------------

// Most modules answer on 0x3C, the datasheet's other address is 0x3D
#ifndef SH1107_I2C_ADDRESS
#define SH1107_I2C_ADDRESS 0x3C
#endif

// Display RAM bytes per I2C page write
#ifndef SH1107_I2C_CHUNK_LEN
#define SH1107_I2C_CHUNK_LEN 64
#endif

#ifndef SH1107_SPI_FREQUENCY
#define SH1107_SPI_FREQUENCY 8000000
#endif

#ifndef SH1107_DEFAULT_CONTRAST
#define SH1107_DEFAULT_CONTRAST 0x7F
#endif

// Pins, -1 = not wired
#ifndef SH1107_DC
#define SH1107_DC -1
#endif
#ifndef SH1107_CS
#define SH1107_CS -1
#endif
#ifndef SH1107_RESET
#define SH1107_RESET -1
#endif

#include "DebugConfiguration.h"
