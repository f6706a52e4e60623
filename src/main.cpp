#include "configuration.h"

#include "sh1107/Builder.h"
#include "sh1107/hal/ArduinoOutputPin.h"
#include "sh1107/hal/HardwareSpiBus.h"
#include "sh1107/hal/TwoWireBus.h"

#include <SPI.h>
#include <Wire.h>
#include <vector>

#ifdef ARCH_PORTDUINO
#include "platform/portduino/PortduinoGlue.h"
#endif

using namespace sh1107;

/// 8x8 squares. Each display RAM byte is a column of 8 pixels, so one page row of bytes is one square high.
static std::vector<uint8_t> checkerboard(uint8_t width, uint8_t height)
{
    std::vector<uint8_t> buf((size_t)width * height / 8);
    for (size_t page = 0; page < (size_t)height / 8; page++)
        for (size_t col = 0; col < width; col++)
            buf[page * width + col] = ((col / 8 + page) & 1) ? 0xFF : 0x00;
    return buf;
}

static bool pulseReset(int pin)
{
    if (pin < 0)
        return true;
    ArduinoOutputPin reset(pin);
    if (!reset.setLow())
        return false;
    delay(10);
    if (!reset.setHigh())
        return false;
    delay(10);
    return true;
}

static void logFailure(const char *what, const InterfaceError<WireError, Infallible> &e)
{
    LOG_ERROR("%s: I2C %s", what, wireErrorName(e.commError()));
}

template <typename CommE, typename PinE> static void logFailure(const char *what, const InterfaceError<CommE, PinE> &e)
{
    LOG_ERROR("%s: %s failure", what, e.isComm() ? "bus" : "pin");
}

template <typename DI> static bool runDemo(DisplayProperties<DI> display, uint8_t contrast)
{
    auto r = display.initDisplay();
    if (!r) {
        logFailure("Display init failed", r.error());
        return false;
    }

    r = display.setContrast(contrast);
    if (!r) {
        logFailure("Set contrast failed", r.error());
        return false;
    }

    std::vector<uint8_t> frame = checkerboard(displayWidth(display.getSize()), displayHeight(display.getSize()));
    r = display.draw(frame.data(), frame.size());
    if (!r) {
        logFailure("Draw failed", r.error());
        return false;
    }

    auto dims = display.getDimensions();
    LOG_INFO("Drew %ux%u checkerboard (%u bytes)", dims.first, dims.second, (unsigned)frame.size());
    return true;
}

template <typename DC> static bool runSpi(const Builder &builder, HardwareSpiBus bus, DC dc, int csPin, uint8_t contrast)
{
    if (csPin < 0)
        return runDemo(builder.connectSpi(bus, dc, NoOutputPin()), contrast);
    return runDemo(builder.connectSpi(bus, dc, ArduinoOutputPin(csPin)), contrast);
}

void setup()
{
    consoleInit();
    LOG_INFO("SH1107 demo %s", optstr(APP_VERSION));

    Builder builder;
    int dcPin = SH1107_DC;
    int csPin = SH1107_CS;
    int resetPin = SH1107_RESET;
    uint8_t contrast = SH1107_DEFAULT_CONTRAST;
    bool useSpi = false;
    uint32_t spiSpeed = SH1107_SPI_FREQUENCY;

#ifdef ARCH_PORTDUINO
    if (!builderFromConfig(builder))
        exit(EXIT_FAILURE);
    useSpi = sh1107_config.bus == bus_spi;
    spiSpeed = sh1107_config.spiSpeed;
    contrast = (uint8_t)sh1107_config.displayContrast;
    dcPin = sh1107_config.displayDC.enabled ? sh1107_config.displayDC.pin : -1;
    csPin = sh1107_config.displayCS.enabled ? sh1107_config.displayCS.pin : -1;
    resetPin = sh1107_config.displayReset.enabled ? sh1107_config.displayReset.pin : -1;

    if (sh1107_config.i2cdev != "") {
        LOG_INFO("Use %s as I2C device", sh1107_config.i2cdev.c_str());
        Wire.begin(sh1107_config.i2cdev.c_str());
    } else {
        Wire.begin();
    }
#else
    Wire.begin();
    SPI.begin();
#endif

    if (!pulseReset(resetPin))
        LOG_WARN("SH1107 reset on pin %d failed", resetPin);

    bool ok;
    if (useSpi) {
        LOG_INFO("SH1107 on SPI at %u Hz", (unsigned)spiSpeed);
        HardwareSpiBus bus(&SPI, spiSpeed);
        if (dcPin < 0)
            ok = runSpi(builder, bus, NoOutputPin(), csPin, contrast);
        else
            ok = runSpi(builder, bus, ArduinoOutputPin(dcPin), csPin, contrast);
    } else {
        LOG_INFO("SH1107 on I2C address 0x%02x", builder.getI2cAddr());
        ok = runDemo(builder.connectI2c(TwoWireBus(&Wire)), contrast);
    }

#ifdef ARCH_PORTDUINO
    if (!ok)
        exit(EXIT_FAILURE);
#else
    if (!ok)
        LOG_CRIT("SH1107 demo failed");
#endif
}

void loop()
{
    delay(1000);
}
