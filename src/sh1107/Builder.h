#pragma once

#include "configuration.h"
#include "sh1107/DisplayGeometry.h"
#include "sh1107/DisplayProperties.h"
#include "sh1107/NoOutputPin.h"
#include "sh1107/interface/I2cInterface.h"
#include "sh1107/interface/SpiInterface.h"

namespace sh1107
{

/**
 * Picks the panel options and binds them to a bus.
 *
 * Defaults are a 128x64 panel, no rotation, and I2C address 0x3C (the other address in the datasheet is 0x3D).
 *
 *     TwoWireBus bus(&Wire);
 *     auto display = Builder().withSize(DisplaySize::Display128x128).withI2cAddr(0x3D).connectI2c(bus);
 *     display.initDisplay();
 */
class Builder
{
  public:
    Builder() : displaySize(DisplaySize::Display128x64), rotation(DisplayRotation::Rotate0), i2cAddr(SH1107_I2C_ADDRESS)
    {
    }

    Builder withSize(DisplaySize size) const
    {
        Builder b = *this;
        b.displaySize = size;
        return b;
    }

    /// Ignored for SPI
    Builder withI2cAddr(uint8_t addr) const
    {
        Builder b = *this;
        b.i2cAddr = addr;
        return b;
    }

    Builder withRotation(DisplayRotation rot) const
    {
        Builder b = *this;
        b.rotation = rot;
        return b;
    }

    DisplaySize getSize() const { return displaySize; }
    DisplayRotation getRotation() const { return rotation; }
    uint8_t getI2cAddr() const { return i2cAddr; }

    template <typename I2C> DisplayProperties<I2cInterface<I2C>> connectI2c(I2C i2c) const
    {
        return DisplayProperties<I2cInterface<I2C>>(I2cInterface<I2C>(i2c, i2cAddr), displaySize, rotation);
    }

    /// If chip select is not wired pass a NoOutputPin for cs
    template <typename SPI, typename DC, typename CS>
    DisplayProperties<SpiInterface<SPI, DC, CS>> connectSpi(SPI spi, DC dc, CS cs) const
    {
        return DisplayProperties<SpiInterface<SPI, DC, CS>>(SpiInterface<SPI, DC, CS>(spi, dc, cs), displaySize,
                                                            rotation);
    }

  private:
    DisplaySize displaySize;
    DisplayRotation rotation;
    uint8_t i2cAddr;
};

} // namespace sh1107
