// address latch incrementer

#include "AddressLatch.h"

uint16
AddressLatch::incDec(uint16 value, incdec_t op, window_t window) noexcept
{
    int delta;
    switch (op) {
        case ID_INC: delta = +1; break;
        case ID_DEC: delta = -1; break;
        case ID_NONE:
        default:
            return value;
    }

    uint16 mask;
    switch (window) {
        case WIN_7:  mask = 0x007F; break;
        case WIN_6:  mask = 0x003F; break;
        case WIN_16:
        default:     mask = 0xFFFF; break;
    }

    const uint16 moved = static_cast<uint16>((value + delta) & mask);
    return static_cast<uint16>((value & ~mask) | moved);
}


uint16
AddressLatch::incDec(incdec_t op, window_t window) const noexcept
{
    return incDec(m_value, op, window);
}

// vim: ts=8:et:sw=4:smarttab
