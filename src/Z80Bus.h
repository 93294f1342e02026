// This is the boundary of the core: the pins of the chip, and the abstract
// collaborator that sits on the other side of them.
//
// All strobes are kept in their logical sense: true means asserted.  On the
// real part most of them are active low (/M1, /MREQ, /IORQ, /RD, /WR, /RFSH,
// /HALT, /BUSAK, /RESET, /BUSRQ, /WAIT, /INT, /NMI); translating the polarity
// is the job of whatever board wiring sits outside the core.
//
// The core calls Z80Bus::busEdge() after every clock half-cycle, once its own
// outputs have settled.  The collaborator looks at the outputs and may:
//    + drive pins.data, but only while rd is asserted and the cpu isn't
//      driving the bus itself (data_oe == false)
//    + commit a write, but only while wr is asserted
//    + change any of the input pins, which the core samples at the edges
//      described in CpuZ80.h

#ifndef _INCLUDE_Z80BUS_H_
#define _INCLUDE_Z80BUS_H_

#include "z80cycle.h"

struct z80pins_t {
    // ---- outputs ----
    uint16 addr;        // address bus
    uint8  data;        // data bus (output when data_oe, otherwise input)
    bool   data_oe;     // cpu is driving the data bus
    bool   m1;          // opcode fetch or interrupt acknowledge in progress
    bool   mreq;        // memory request
    bool   iorq;        // I/O request (or interrupt acknowledge, with m1)
    bool   rd;          // read enable
    bool   wr;          // write enable
    bool   rfsh;        // refresh address is on the low address bits
    bool   halt;        // cpu is executing HALT
    bool   busak;       // bus has been granted to another master
    bool   bus_float;   // addr/data/control outputs are tri-stated

    // ---- inputs ----
    bool   reset;       // asynchronous reset
    bool   busrq;       // another master wants the bus
    bool   wait;        // stretch the current bus cycle
    bool   intr;        // maskable interrupt request (level)
    bool   nmi;         // non-maskable interrupt request (edge)
};

// put every pin in its idle state
inline void
clearPins(z80pins_t &pins) noexcept
{
    pins = z80pins_t();
    pins.data = 0xFF;   // pull-ups on a floating bus
}

// the external collaborator of the core
class Z80Bus
{
public:
    // interface class destructors must be virtual
    virtual ~Z80Bus() {};

    // called after every half clock with the settled outputs.
    // rising is true after the rising edge, false after the falling edge.
    virtual void busEdge(z80pins_t &pins, bool rising) = 0;
};

#endif // _INCLUDE_Z80BUS_H_

// vim: ts=8:et:sw=4:smarttab
