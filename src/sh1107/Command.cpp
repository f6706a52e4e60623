#include "sh1107/Command.h"
#include "DebugConfiguration.h"

#include <stdexcept>
#include <string.h>

namespace sh1107
{

bool pageFromRow(uint8_t row, Page &out)
{
    uint8_t page = row / 8;
    if (page >= SH1107_NUM_PAGES)
        return false;

    out = static_cast<Page>(page);
    return true;
}

Page pageFrom(uint8_t row)
{
    Page page;
    if (!pageFromRow(row, page)) {
        LOG_CRIT("Row %u is past the last display page", row);
        throw std::out_of_range("Page too high");
    }
    return page;
}

EncodedCommand Command::encode() const
{
    EncodedCommand out;
    memset(out.bytes, 0, sizeof(out.bytes));

    switch (cmdType) {
    case Contrast:
        out.bytes[0] = 0x81;
        out.bytes[1] = arg0;
        out.len = 2;
        break;
    case AllOn:
        out.bytes[0] = 0xA4 | arg0;
        out.len = 1;
        break;
    case Invert:
        out.bytes[0] = 0xA6 | arg0;
        out.len = 1;
        break;
    case DisplayOn:
        out.bytes[0] = 0xAE | arg0;
        out.len = 1;
        break;
    case ColumnAddressLow:
        out.bytes[0] = 0xF & arg0;
        out.len = 1;
        break;
    case ColumnAddressHigh:
        out.bytes[0] = 0x10 | (0xF & arg0);
        out.len = 1;
        break;
    case MemAddressMode:
        out.bytes[0] = 0x20 | arg0;
        out.len = 1;
        break;
    case PageAddress:
        out.bytes[0] = 0xB0 | arg0;
        out.len = 1;
        break;
    case StartLine:
        // SH1107 takes the start line as a two byte command, not the 0x40 | line form of the SSD1306
        out.bytes[0] = 0xDC;
        out.bytes[1] = arg0;
        out.len = 2;
        break;
    case SegmentRemap:
        out.bytes[0] = 0xA0 | arg0;
        out.len = 1;
        break;
    case Multiplex:
        out.bytes[0] = 0xA8;
        out.bytes[1] = arg0;
        out.len = 2;
        break;
    case ReverseComDir:
        out.bytes[0] = 0xC0 | (arg0 << 3);
        out.len = 1;
        break;
    case DisplayOffset:
        out.bytes[0] = 0xD3;
        out.bytes[1] = arg0;
        out.len = 2;
        break;
    case ComPinConfig:
        out.bytes[0] = 0xDA;
        out.bytes[1] = 0x02 | (arg0 << 4);
        out.len = 2;
        break;
    case DisplayClockDiv:
        out.bytes[0] = 0xD5;
        out.bytes[1] = ((0xF & arg0) << 4) | (0xF & arg1);
        out.len = 2;
        break;
    case PreChargePeriod:
        out.bytes[0] = 0xD9;
        out.bytes[1] = ((0xF & arg0) << 4) | (0xF & arg1);
        out.len = 2;
        break;
    case VcomhDeselect:
        out.bytes[0] = 0xDB;
        out.bytes[1] = arg0;
        out.len = 2;
        break;
    case Noop:
        out.bytes[0] = 0xE3;
        out.len = 1;
        break;
    case ChargePump:
        out.bytes[0] = 0xAD;
        out.bytes[1] = 0x8A | arg0;
        out.len = 2;
        break;
    }

    return out;
}

} // namespace sh1107
