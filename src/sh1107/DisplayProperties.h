#pragma once

#include "DebugConfiguration.h"
#include "configuration.h"
#include "sh1107/Command.h"
#include "sh1107/DisplayGeometry.h"

#include <stddef.h>
#include <utility>

namespace sh1107
{

/**
 * A display interface together with the panel geometry.
 *
 * This is what the Builder hands out. It knows the SH1107 power on sequence and the geometry dependent commands, and
 * otherwise passes display RAM straight through to the interface without looking at it.
 */
template <typename DI> class DisplayProperties
{
  public:
    typedef typename DI::Error Error;

    DisplayProperties(DI iface, DisplaySize size, DisplayRotation rotation)
        : iface(iface), size(size), rotation(rotation)
    {
    }

    /**
     * Initialise the interface and bring the panel up: clocks, multiplex, charge pump, scan direction for the current
     * rotation, contrast and finally display on. Stops at the first failure.
     */
    Result<Error> initDisplay()
    {
        LOG_INFO("Init SH1107 %ux%u, rotation %u", displayWidth(size), displayHeight(size), rotationDegrees(rotation));

        auto r = iface.init();
        if (!r)
            return r;

        const Command powerUp[] = {
            Command::displayOn(false),
            Command::displayClockDiv(0x8, 0x0),
            Command::multiplex(displayHeight(size) - 1),
            Command::displayOffset(0),
            Command::startLine(0),
            Command::chargePump(true),
            Command::memAddressMode(0), // page addressing
        };
        r = sendAll(powerUp, sizeof(powerUp) / sizeof(powerUp[0]));
        if (!r)
            return r;

        r = setRotation(rotation);
        if (!r)
            return r;

        const Command finish[] = {
            Command::comPinConfig(true),
            Command::contrast(SH1107_DEFAULT_CONTRAST),
            Command::preChargePeriod(0xF, 0x1),
            Command::vcomhDeselect(VcomhLevel::V077),
            Command::allOn(false),
            Command::invert(false),
            Command::displayOn(true),
        };
        return sendAll(finish, sizeof(finish) / sizeof(finish[0]));
    }

    /// 180 and 270 flip both the segment and the COM scan direction, 0 and 90 use the normal directions
    Result<Error> setRotation(DisplayRotation rot)
    {
        rotation = rot;
        bool flipped = (rot == DisplayRotation::Rotate180 || rot == DisplayRotation::Rotate270);

        auto r = Command::segmentRemap(flipped).send(iface);
        if (!r)
            return r;
        return Command::reverseComDir(flipped).send(iface);
    }

    Result<Error> setContrast(uint8_t level) { return Command::contrast(level).send(iface); }

    Result<Error> setInvert(bool inverted) { return Command::invert(inverted).send(iface); }

    Result<Error> displayOn(bool on) { return Command::displayOn(on).send(iface); }

    /// Send a buffer of display RAM as is
    Result<Error> draw(const uint8_t *buffer, size_t len) { return iface.sendData(buffer, len); }

    /// Width and height as seen by the user, swapped for 90 and 270 degree rotations
    std::pair<uint8_t, uint8_t> getDimensions() const
    {
        if (rotation == DisplayRotation::Rotate90 || rotation == DisplayRotation::Rotate270)
            return std::make_pair(displayHeight(size), displayWidth(size));
        return std::make_pair(displayWidth(size), displayHeight(size));
    }

    /// Bytes needed for one full frame of display RAM
    size_t frameBufferSize() const { return (size_t)displayWidth(size) * displayHeight(size) / 8; }

    DisplaySize getSize() const { return size; }
    DisplayRotation getRotation() const { return rotation; }

    DI &getInterface() { return iface; }

  private:
    Result<Error> sendAll(const Command *cmds, size_t count)
    {
        for (size_t i = 0; i < count; i++) {
            auto r = cmds[i].send(iface);
            if (!r) {
                LOG_ERROR("SH1107 init aborted at command %u", (unsigned)i);
                return r;
            }
        }
        return Result<Error>::ok();
    }

    DI iface;
    DisplaySize size;
    DisplayRotation rotation;
};

} // namespace sh1107
