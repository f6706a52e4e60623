#pragma once

#include "RedirectablePrint.h"

/**
 * Debug log output on the serial port.
 */
class SerialConsole : public RedirectablePrint
{
  public:
    SerialConsole();

    virtual size_t write(uint8_t c) override
    {
        if (c == '\n') // prefix any newlines with carriage return
            RedirectablePrint::write('\r');
        return RedirectablePrint::write(c);
    }
};

/// Create the console if it does not exist yet
void consoleInit();

extern SerialConsole *console;
