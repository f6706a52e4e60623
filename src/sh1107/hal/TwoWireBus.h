#pragma once

#include "DebugConfiguration.h"
#include "sh1107/Error.h"

#include <Wire.h>

namespace sh1107
{

/// Why an I2C transaction failed, the codes returned by TwoWire::endTransmission()
enum class WireError : uint8_t {
    DataTooLong = 1, // did not fit in the transmit buffer
    NackAddress = 2,
    NackData = 3,
    Other = 4,
    Timeout = 5,
    ShortWrite = 0x10 // TwoWire::write() queued fewer bytes than asked
};

const char *wireErrorName(WireError e);

/// Map a non-zero endTransmission() status, unknown codes become Other
WireError wireErrorFromStatus(uint8_t status);

/**
 * Addressed bus capability on top of an Arduino TwoWire (or anything with the same
 * beginTransmission / write / endTransmission calls).
 *
 * The wire is not owned, it must be begun (Wire.begin()) before the first write and outlive this object.
 */
template <typename W> class BasicTwoWireBus
{
  public:
    typedef WireError Error;

    explicit BasicTwoWireBus(W *wire) : wire(wire) {}

    /// One complete transaction: start, address, buf, stop. Nothing is sent if buf does not fit the wire buffer.
    Result<Error> write(uint8_t address, const uint8_t *buf, size_t len)
    {
        wire->beginTransmission(address);
        size_t queued = wire->write(buf, len);
        if (queued != len) {
            LOG_DEBUG("I2C write to 0x%02x queued %u of %u bytes", address, (unsigned)queued, (unsigned)len);
            return Result<Error>::err(WireError::ShortWrite);
        }

        uint8_t status = wire->endTransmission();
        if (status != 0) {
            WireError e = wireErrorFromStatus(status);
            LOG_DEBUG("I2C write to 0x%02x: %s (%u)", address, wireErrorName(e), status);
            return Result<Error>::err(e);
        }
        return Result<Error>::ok();
    }

  private:
    W *wire;
};

typedef BasicTwoWireBus<TwoWire> TwoWireBus;

} // namespace sh1107
