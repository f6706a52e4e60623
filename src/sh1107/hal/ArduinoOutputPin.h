#pragma once

#include "sh1107/Error.h"

#include <Arduino.h>

namespace sh1107
{

/**
 * A physical GPIO used as an output (DC, CS or reset line).
 */
class ArduinoOutputPin
{
  public:
    typedef Infallible Error;

    explicit ArduinoOutputPin(uint32_t num) : num(num) { pinMode(num, OUTPUT); }

    Result<Error> setLow() { return set(LOW); }
    Result<Error> setHigh() { return set(HIGH); }

    uint32_t pinNumber() const { return num; }

  private:
    Result<Error> set(uint8_t value)
    {
        digitalWrite(num, value);
        return Result<Error>::ok();
    }

    uint32_t num;
};

} // namespace sh1107
