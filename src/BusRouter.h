// The internal data bus of the chip is split into three segments joined by
// two pass gates:
//
//      pins/data latch        ALU           register file
//         SEG_DB  ---[SW_DB_ALU]--- SEG_ALU ---[SW_ALU_REG]--- SEG_REG
//
// In every sub-cycle each segment has at most one driver.  A transfer is
// evaluated in two passes:
//    1) propose(): sources place tagged values on the segments they drive
//    2) commit():  closed switches merge segments into nets, each net takes
//                  the value of its single driver (or floats high)
// Consumers only read after the commit, so a value proposed in a sub-cycle is
// visible to every consumer on the same net in that same sub-cycle, no matter
// in which order the control matrix lists them.
//
// Two drivers on one net, a proposal after the commit, or a read before it
// are design faults; they are latched here and reported by the core.

#ifndef _INCLUDE_BUSROUTER_H_
#define _INCLUDE_BUSROUTER_H_

#include "z80cycle.h"

class BusRouter
{
public:
    enum seg_t : uint8 { SEG_DB, SEG_ALU, SEG_REG, NUM_SEGS };

    enum src_t : uint8 {
        SRC_NONE,       // nobody: the segment floats
        SRC_DLATCH,     // data pin latch
        SRC_ALU,        // ALU result latch
        SRC_REGS,       // register file read port
        SRC_CONST       // constant generator (forced bytes)
    };

    enum { SW_DB_ALU = 0x1, SW_ALU_REG = 0x2 };

    BusRouter();

    // start of a sub-cycle: all segments float, all switches open
    void beginPhase() noexcept;

    // first pass
    void propose(seg_t seg, src_t src, uint8 value) noexcept;
    void connect(int switches) noexcept { m_switches |= switches; }

    // second pass
    void commit() noexcept;

    // valid only after commit()
    uint8 read(seg_t seg) noexcept;
    src_t driver(seg_t seg) const noexcept { return m_net_src[seg]; }

    // a complete single-source transfer: propose on 'from', close the
    // switches between 'from' and 'to', commit, and return what 'to' sees
    uint8 route(src_t src, uint8 value, seg_t from, seg_t to) noexcept;

    bool fault() const noexcept { return m_fault; }
    void clearFault() noexcept  { m_fault = false; }

    // switches needed to join two segments
    static int pathBetween(seg_t a, seg_t b) noexcept;

private:
    struct segval_t {
        src_t src;
        uint8 value;
    };

    segval_t m_seg[NUM_SEGS];       // proposals
    uint8    m_net_val[NUM_SEGS];   // committed values
    src_t    m_net_src[NUM_SEGS];   // committed drivers
    int      m_switches;            // closed switches this sub-cycle
    bool     m_committed;           // second pass done
    bool     m_fault;               // sticky design fault
};

#endif // _INCLUDE_BUSROUTER_H_

// vim: ts=8:et:sw=4:smarttab
