#pragma once

#include "DebugConfiguration.h"
#include "sh1107/interface/DisplayInterface.h"

namespace sh1107
{

/**
 * SH1107 over 4-wire SPI.
 *
 * SPI provides `typedef ... Error; Result<Error> write(const uint8_t *buf, size_t len);`, DC and CS provide
 * `typedef ... Error; Result<Error> setLow(); Result<Error> setHigh();` (see HardwareSpiBus and ArduinoOutputPin).
 * Use NoOutputPin for CS when chip select is hard wired.
 *
 * Every send is framed as CS low, write, CS high. Nothing is rolled back on failure: if the write fails CS stays low.
 */
template <typename SPI, typename DC, typename CS>
class SpiInterface : public DisplayInterface<InterfaceError<typename SPI::Error, typename CS::Error>>
{
  public:
    typedef InterfaceError<typename SPI::Error, typename CS::Error> Error;

    SpiInterface(SPI spi, DC dc, CS cs) : spi(spi), dc(dc), cs(cs) {}

    /// Deselect the panel
    Result<Error> init() override
    {
        auto r = cs.setHigh();
        if (!r) {
            LOG_WARN("SH1107 SPI chip select release failed");
            return Result<Error>::err(Error::pin(r.error()));
        }
        return Result<Error>::ok();
    }

    Result<Error> sendCommands(const uint8_t *cmds, size_t len) override { return transfer(cmds, len); }

    // The DC line is not driven here, the panel is expected to decode commands and data from the bus framing alone.
    Result<Error> sendData(const uint8_t *buf, size_t len) override { return transfer(buf, len); }

  private:
    Result<Error> transfer(const uint8_t *buf, size_t len)
    {
        auto p = cs.setLow();
        if (!p) {
            LOG_WARN("SH1107 SPI chip select failed");
            return Result<Error>::err(Error::pin(p.error()));
        }

        auto w = spi.write(buf, len);
        if (!w) {
            LOG_WARN("SH1107 SPI write of %u bytes failed", (unsigned)len);
            return Result<Error>::err(Error::comm(w.error()));
        }

        p = cs.setHigh();
        if (!p) {
            LOG_WARN("SH1107 SPI chip select release failed");
            return Result<Error>::err(Error::pin(p.error()));
        }
        return Result<Error>::ok();
    }

    SPI spi;
    DC dc;
    CS cs;
};

} // namespace sh1107
