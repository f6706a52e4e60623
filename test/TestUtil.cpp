#include "SerialConsole.h"

#include "TestUtil.h"

#ifdef ARCH_PORTDUINO
#include "platform/portduino/PortduinoGlue.h"
#endif

void initializeTestEnvironment()
{
#ifdef ARCH_PORTDUINO
    // Failure paths log at warn/error, keep them visible but skip the debug chatter
    sh1107_config.logoutputlevel = level_info;
#endif
    consoleInit();
}
