#include "SerialConsole.h"
#include "configuration.h"

#ifdef ARCH_PORTDUINO
#include "platform/portduino/PortduinoGlue.h"
#endif

#define Port Serial

SerialConsole *console;

void consoleInit()
{
    if (console)
        return;
    console = new SerialConsole();
}

SerialConsole::SerialConsole() : RedirectablePrint(&Port)
{
    Port.begin(SERIAL_BAUD);
#ifdef ARCH_PORTDUINO
    setColor(!sh1107_config.ascii_logs);
#endif
}
