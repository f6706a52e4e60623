#pragma once

#include "sh1107/interface/DisplayInterface.h"

#include <stddef.h>
#include <stdint.h>

namespace sh1107
{

/// Display RAM page, a band of 8 rows
enum class Page : uint8_t {
    Page0 = 0,
    Page1 = 1,
    Page2 = 2,
    Page3 = 3,
    Page4 = 4,
    Page5 = 5,
    Page6 = 6,
    Page7 = 7,
    Page8 = 8,
    Page9 = 9,
    Page10 = 10,
    Page11 = 11,
    Page12 = 12,
    Page13 = 13,
    Page14 = 14,
    Page15 = 15
};

#define SH1107_NUM_PAGES 16

/**
 * Page holding a given row (row / 8).
 *
 * Returns false and leaves out untouched if the row is past the last page (row >= 128).
 */
bool pageFromRow(uint8_t row, Page &out);

/**
 * Page holding a given row. Rows past the last page are a programming error: this logs and throws std::out_of_range.
 * Use pageFromRow() where the row comes from outside.
 */
Page pageFrom(uint8_t row);

/// Frame interval used by the scroll setup commands
enum class NFrames : uint8_t {
    F2 = 0b111,
    F3 = 0b100,
    F4 = 0b101,
    F5 = 0b000,
    F25 = 0b110,
    F64 = 0b001,
    F128 = 0b010,
    F256 = 0b011
};

/// VCOMH deselect level, the literal register value
enum class VcomhLevel : uint8_t {
    V065 = 0x22, // 0.65 * Vcc
    V077 = 0x35, // 0.77 * Vcc
    V083 = 0x3E, // 0.83 * Vcc
    Auto = 0x40
};

/// Wire form of a command. Only the first len bytes are ever sent.
struct EncodedCommand {
    static constexpr size_t MAX_LEN = 7;

    uint8_t bytes[MAX_LEN];
    size_t len;
};

/**
 * One SH1107 controller command with its parameters.
 *
 * Built with the named constructors below, e.g. Command::contrast(0x7F).send(iface). Numeric parameters are passed
 * through unchecked apart from the nibble masks the encoding applies.
 */
class Command
{
  public:
    enum Type : uint8_t {
        Contrast,
        AllOn,
        Invert,
        DisplayOn,
        ColumnAddressLow,
        ColumnAddressHigh,
        MemAddressMode,
        PageAddress,
        StartLine,
        SegmentRemap,
        Multiplex,
        ReverseComDir,
        DisplayOffset,
        ComPinConfig,
        DisplayClockDiv,
        PreChargePeriod,
        VcomhDeselect,
        Noop,
        ChargePump
    };

    /// Higher number is higher contrast. Default = 0x7F
    static Command contrast(uint8_t level) { return Command(Contrast, level); }

    /// If set all pixels are lit, otherwise display RAM is shown
    static Command allOn(bool on) { return Command(AllOn, on); }

    static Command invert(bool inverted) { return Command(Invert, inverted); }

    static Command displayOn(bool on) { return Command(DisplayOn, on); }

    /// Lower 4 bits of the column address
    static Command columnAddressLow(uint8_t addr) { return Command(ColumnAddressLow, addr); }

    /// Upper 4 bits of the column address
    static Command columnAddressHigh(uint8_t addr) { return Command(ColumnAddressHigh, addr); }

    static Command memAddressMode(uint8_t mode) { return Command(MemAddressMode, mode); }

    static Command pageAddress(Page page) { return Command(PageAddress, static_cast<uint8_t>(page)); }

    static Command startLine(uint8_t line) { return Command(StartLine, line); }

    /// Reverse columns from 127-0
    static Command segmentRemap(bool remap) { return Command(SegmentRemap, remap); }

    /// Multiplex ratio (MUX-1)
    static Command multiplex(uint8_t ratio) { return Command(Multiplex, ratio); }

    /// Scan from COM[n-1] to COM0 (where n is the mux ratio)
    static Command reverseComDir(bool reverse) { return Command(ReverseComDir, reverse); }

    /// Vertical shift
    static Command displayOffset(uint8_t offset) { return Command(DisplayOffset, offset); }

    /// false = sequential, true = alternative COM pin configuration
    static Command comPinConfig(bool alternative) { return Command(ComPinConfig, alternative); }

    /// fosc: oscillator frequency, higher is faster. div: divide ratio - 1
    static Command displayClockDiv(uint8_t fosc, uint8_t div) { return Command(DisplayClockDiv, fosc, div); }

    /// Phase 1 (discharge) and phase 2 (precharge) periods
    static Command preChargePeriod(uint8_t discharge, uint8_t precharge)
    {
        return Command(PreChargePeriod, discharge, precharge);
    }

    static Command vcomhDeselect(VcomhLevel level) { return Command(VcomhDeselect, static_cast<uint8_t>(level)); }

    static Command noop() { return Command(Noop); }

    static Command chargePump(bool enable) { return Command(ChargePump, enable); }

    Type type() const { return cmdType; }

    /// The exact bytes the controller expects for this command
    EncodedCommand encode() const;

    /// Encode and hand the bytes to a display interface
    template <typename E> Result<E> send(DisplayInterface<E> &iface) const
    {
        EncodedCommand enc = encode();
        return iface.sendCommands(enc.bytes, enc.len);
    }

  private:
    Command(Type type, uint8_t arg0 = 0, uint8_t arg1 = 0) : cmdType(type), arg0(arg0), arg1(arg1) {}

    Type cmdType;
    uint8_t arg0;
    uint8_t arg1;
};

inline EncodedCommand encode(const Command &cmd)
{
    return cmd.encode();
}

} // namespace sh1107
