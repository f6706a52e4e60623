#pragma once

#include <stdint.h>

namespace sh1107
{

/// Supported panel sizes, width x height in the unrotated orientation
enum class DisplaySize : uint8_t { Display64x128, Display128x64, Display128x128 };

/// Display rotation, clockwise
enum class DisplayRotation : uint8_t { Rotate0, Rotate90, Rotate180, Rotate270 };

inline uint8_t displayWidth(DisplaySize size)
{
    return size == DisplaySize::Display64x128 ? 64 : 128;
}

inline uint8_t displayHeight(DisplaySize size)
{
    return size == DisplaySize::Display128x64 ? 64 : 128;
}

/// Rotation in degrees, for logs and config files
inline uint16_t rotationDegrees(DisplayRotation rot)
{
    switch (rot) {
    case DisplayRotation::Rotate90:
        return 90;
    case DisplayRotation::Rotate180:
        return 180;
    case DisplayRotation::Rotate270:
        return 270;
    default:
        return 0;
    }
}

/// Parse 0/90/180/270, false for anything else
bool rotationFromDegrees(int degrees, DisplayRotation &out);

/// Find the size matching a width/height pair, false if the panel is not supported
bool sizeFromDimensions(int width, int height, DisplaySize &out);

} // namespace sh1107
