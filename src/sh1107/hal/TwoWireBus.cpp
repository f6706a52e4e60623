#include "sh1107/hal/TwoWireBus.h"

namespace sh1107
{

const char *wireErrorName(WireError e)
{
    switch (e) {
    case WireError::DataTooLong:
        return "data too long";
    case WireError::NackAddress:
        return "NACK on address";
    case WireError::NackData:
        return "NACK on data";
    case WireError::Timeout:
        return "timeout";
    case WireError::ShortWrite:
        return "short write";
    default:
        return "other error";
    }
}

WireError wireErrorFromStatus(uint8_t status)
{
    if (status >= 1 && status <= 5)
        return static_cast<WireError>(status);
    return WireError::Other;
}

} // namespace sh1107
