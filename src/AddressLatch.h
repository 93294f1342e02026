// The address latch is the only thing that drives the external address pins.
// It is loaded from a register pair (or the refresh/IM2 vector address) and
// keeps driving that value until the next load.
//
// An incrementer/decrementer hangs off the latch output.  Its result never
// goes back into the latch; the control matrix writes it to whatever register
// pair needs it (PC after a fetch, SP around a push, R after a refresh, ...).
// For the refresh path the carry chain can be cut so that only the low seven
// bits wrap, leaving bit 7 of R and all of I alone.

#ifndef _INCLUDE_ADDRESSLATCH_H_
#define _INCLUDE_ADDRESSLATCH_H_

#include "z80cycle.h"

class AddressLatch
{
public:
    enum incdec_t : uint8 { ID_NONE, ID_INC, ID_DEC };

    // carry chain limits
    enum window_t : uint8 {
        WIN_16,         // full 16 bit increment
        WIN_7,          // refresh counter: bits 6:0 wrap, 15:7 untouched
        WIN_6           // bits 5:0 wrap, 15:6 untouched
    };

    AddressLatch() : m_value(0x0000) { };

    void   load(uint16 value) noexcept { m_value = value; }
    uint16 value() const noexcept      { return m_value; }

    // output of the incrementer for the value held in the latch
    uint16 incDec(incdec_t op, window_t window=WIN_16) const noexcept;

    // same logic, for an arbitrary input (used by the unit tests)
    static uint16 incDec(uint16 value, incdec_t op, window_t window) noexcept;

private:
    uint16 m_value;
};

#endif // _INCLUDE_ADDRESSLATCH_H_

// vim: ts=8:et:sw=4:smarttab
