#pragma once

#include "configuration.h"
#include "sh1107/Error.h"

#include <SPI.h>

namespace sh1107
{

/**
 * Byte stream bus capability on top of an Arduino SPIClass.
 *
 * Chip select is not touched here, SpiInterface frames each write itself. The SPIClass must be begun before use and
 * outlive this object.
 */
class HardwareSpiBus
{
  public:
    typedef Infallible Error;

    explicit HardwareSpiBus(SPIClass *spi, uint32_t frequency = SH1107_SPI_FREQUENCY)
        : spi(spi), settings(frequency, MSBFIRST, SPI_MODE0)
    {
    }

    Result<Error> write(const uint8_t *buf, size_t len);

  private:
    SPIClass *spi;
    SPISettings settings;
};

} // namespace sh1107
