// The sequencer is the (M,T) counter pair of the timing generator.
//
// M counts machine cycles within an instruction (M1 is always the opcode
// fetch or interrupt acknowledge), T counts clock periods within a machine
// cycle.  At each falling edge the control logic picks one of four moves,
// which take effect at the next rising edge:
//
//      NX_HOLD   stay on the same T (wait states)
//      NX_T      next T of the same machine cycle
//      NX_M      T1 of the next machine cycle
//      NX_M1     M1/T1: a new opcode fetch
//
// Legal states are M1..M6 and T1..T6.  Moving past either limit is a design
// fault, reported through advance()'s return value.

#ifndef _INCLUDE_SEQUENCER_H_
#define _INCLUDE_SEQUENCER_H_

#include "z80cycle.h"

class Sequencer
{
public:
    enum next_t : uint8 { NX_HOLD, NX_T, NX_M, NX_M1 };

    static const int MAX_M = 6;
    static const int MAX_T = 6;

    Sequencer() { reset(); }

    // back to M1/T1
    void reset() noexcept;

    int  m() const noexcept       { return m_m; }
    int  t() const noexcept       { return m_t; }

    // number of consecutive holds on the current T
    int  waits() const noexcept   { return m_waits; }

    // true if the last advance() entered a new T, rather than holding
    bool entered() const noexcept { return m_waits == 0; }

    // apply a move; returns false if it left the legal state space
    bool advance(next_t next) noexcept;

private:
    int m_m;
    int m_t;
    int m_waits;
};

#endif // _INCLUDE_SEQUENCER_H_

// vim: ts=8:et:sw=4:smarttab
