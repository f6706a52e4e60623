#pragma once

#include "DebugConfiguration.h"
#include "configuration.h"
#include "sh1107/Command.h"
#include "sh1107/interface/DisplayInterface.h"

#include <string.h>

namespace sh1107
{

/// Control byte: the following bytes are commands
#define SH1107_I2C_CONTROL_CMD 0x00
/// Control byte: the following bytes are display RAM data
#define SH1107_I2C_CONTROL_DATA 0x40

/**
 * SH1107 over I2C.
 *
 * I2C is any bus type providing
 *
 *     typedef ... Error;
 *     Result<Error> write(uint8_t address, const uint8_t *buf, size_t len);
 *
 * (see TwoWireBus for the Arduino one). Every write is one complete bus transaction to the configured address.
 */
template <typename I2C> class I2cInterface : public DisplayInterface<InterfaceError<typename I2C::Error, Infallible>>
{
  public:
    typedef InterfaceError<typename I2C::Error, Infallible> Error;

    /// Bytes of display RAM sent per page write
    static constexpr size_t CHUNK_LEN = SH1107_I2C_CHUNK_LEN;

    I2cInterface(I2C i2c, uint8_t addr) : i2c(i2c), addr(addr) {}

    uint8_t address() const { return addr; }

    Result<Error> init() override { return Result<Error>::ok(); }

    Result<Error> sendCommands(const uint8_t *cmds, size_t len) override
    {
        // Prefix the commands with the command control byte
        uint8_t writebuf[EncodedCommand::MAX_LEN + 1];
        if (len > EncodedCommand::MAX_LEN) {
            LOG_ERROR("SH1107 command sequence of %u bytes truncated", (unsigned)len);
            len = EncodedCommand::MAX_LEN;
        }
        writebuf[0] = SH1107_I2C_CONTROL_CMD;
        if (len)
            memcpy(writebuf + 1, cmds, len);

        auto r = i2c.write(addr, writebuf, len + 1);
        if (!r) {
            LOG_WARN("SH1107 command write to 0x%02x failed", addr);
            return Result<Error>::err(Error::comm(r.error()));
        }
        return Result<Error>::ok();
    }

    /**
     * Send display RAM, CHUNK_LEN bytes per page starting at page 0 column 0. The last chunk may be short.
     *
     * A failed write aborts the remaining pages; pages already written stay written.
     * The page byte is not limited to the 16 real pages: past 16 chunks it counts on (and wraps after 256).
     */
    Result<Error> sendData(const uint8_t *buf, size_t len) override
    {
        if (len == 0)
            return Result<Error>::ok();

        uint8_t page = static_cast<uint8_t>(Page::Page0);

        uint8_t writebuf[CHUNK_LEN + 1];
        writebuf[0] = SH1107_I2C_CONTROL_DATA;

        for (size_t offset = 0; offset < len; offset += CHUNK_LEN) {
            size_t chunkLen = (len - offset > CHUNK_LEN) ? CHUNK_LEN : (len - offset);
            memcpy(writebuf + 1, buf + offset, chunkLen);

            const uint8_t pageSelect[] = {
                SH1107_I2C_CONTROL_CMD,
                page, // Page address
                0x00, // Lower column address
                0x10  // Upper column address (always zero, base is 10h)
            };

            auto r = i2c.write(addr, pageSelect, sizeof(pageSelect));
            if (!r) {
                LOG_WARN("SH1107 page %u select at 0x%02x failed", page, addr);
                return Result<Error>::err(Error::comm(r.error()));
            }

            r = i2c.write(addr, writebuf, chunkLen + 1);
            if (!r) {
                LOG_WARN("SH1107 page %u data write at 0x%02x failed", page, addr);
                return Result<Error>::err(Error::comm(r.error()));
            }

            page++;
        }

        return Result<Error>::ok();
    }

  private:
    I2C i2c;
    uint8_t addr;
};

} // namespace sh1107
