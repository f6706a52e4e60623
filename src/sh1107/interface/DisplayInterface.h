#pragma once

#include "sh1107/Error.h"

#include <stddef.h>
#include <stdint.h>

namespace sh1107
{

/**
 * A transport that can deliver command and data bytes to an SH1107.
 *
 * Implementations exist for I2C (I2cInterface) and 4-wire SPI (SpiInterface). All calls are synchronous, take
 * exclusive use of the underlying bus for their duration and never retry: the first failure is returned as is.
 */
template <typename E> class DisplayInterface
{
  public:
    typedef E Error;

    virtual ~DisplayInterface() {}

    /// One-time setup, call exactly once before anything else is sent
    virtual Result<E> init() = 0;

    /// Send a short (at most 7 byte) sequence of command bytes
    virtual Result<E> sendCommands(const uint8_t *cmds, size_t len) = 0;

    /// Send an arbitrary length buffer of display RAM bytes
    virtual Result<E> sendData(const uint8_t *buf, size_t len) = 0;
};

} // namespace sh1107
