#include "sh1107/hal/HardwareSpiBus.h"

namespace sh1107
{

Result<Infallible> HardwareSpiBus::write(const uint8_t *buf, size_t len)
{
    spi->beginTransaction(settings);
    for (size_t i = 0; i < len; i++)
        spi->transfer(buf[i]);
    spi->endTransaction();

    return Result<Infallible>::ok();
}

} // namespace sh1107
