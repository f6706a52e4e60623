#include "sh1107/DisplayGeometry.h"

namespace sh1107
{

bool rotationFromDegrees(int degrees, DisplayRotation &out)
{
    switch (degrees) {
    case 0:
        out = DisplayRotation::Rotate0;
        return true;
    case 90:
        out = DisplayRotation::Rotate90;
        return true;
    case 180:
        out = DisplayRotation::Rotate180;
        return true;
    case 270:
        out = DisplayRotation::Rotate270;
        return true;
    default:
        return false;
    }
}

bool sizeFromDimensions(int width, int height, DisplaySize &out)
{
    static const DisplaySize sizes[] = {DisplaySize::Display64x128, DisplaySize::Display128x64,
                                        DisplaySize::Display128x128};

    for (DisplaySize s : sizes) {
        if (displayWidth(s) == width && displayHeight(s) == height) {
            out = s;
            return true;
        }
    }
    return false;
}

} // namespace sh1107
