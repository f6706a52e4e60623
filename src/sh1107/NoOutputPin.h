#pragma once

#include "sh1107/Error.h"

namespace sh1107
{

/**
 * Represents an unused output pin, e.g. a chip select that is tied low on the board.
 * Setting it always succeeds and does nothing.
 */
class NoOutputPin
{
  public:
    typedef Infallible Error;

    Result<Error> setLow() { return Result<Error>::ok(); }
    Result<Error> setHigh() { return Result<Error>::ok(); }
};

} // namespace sh1107
