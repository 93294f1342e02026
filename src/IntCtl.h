// Interrupt controller: the two enable flops, the interrupt mode, the NMI
// edge latch, and the arbitration made at each instruction boundary.
//
//   + NMI is edge triggered: a low-to-high transition of the (logical) nmi
//     pin seen at any rising clock edge latches a request, which stays
//     pending until it is serviced.
//   + INT is a level.  It is looked at once per instruction, at the final
//     falling edge, and is ignored while IFF1 is clear, or for the one
//     instruction that follows EI.
//   + NMI wins over INT.

#ifndef _INCLUDE_INTCTL_H_
#define _INCLUDE_INTCTL_H_

#include "z80cycle.h"

class IntCtl
{
public:
    enum svc_t : uint8 { SVC_NONE, SVC_NMI, SVC_INT };

    IntCtl() { reset(); }

    void reset() noexcept;

    // sample the nmi pin at a rising edge
    void sampleNmi(bool level) noexcept;

    // decide what the next M1 will be.  called at the end of every
    // instruction; accepting a request updates the enable flops.
    svc_t arbitrate(bool int_level) noexcept;

    // instruction side effects
    void ei() noexcept   { m_iff1 = m_iff2 = true; m_ei_shadow = true; }
    void di() noexcept   { m_iff1 = m_iff2 = false; }
    void retn() noexcept { m_iff1 = m_iff2; }

    bool iff1() const noexcept        { return m_iff1; }
    bool iff2() const noexcept        { return m_iff2; }
    int  mode() const noexcept        { return m_mode; }
    void setMode(int mode) noexcept   { m_mode = mode; }
    bool nmiPending() const noexcept  { return m_nmi_latched; }

    // debug port
    void setIff(bool iff1, bool iff2) noexcept { m_iff1 = iff1; m_iff2 = iff2; }

private:
    bool m_iff1;
    bool m_iff2;
    int  m_mode;            // 0, 1 or 2
    bool m_nmi_prev;        // nmi pin at the previous rising edge
    bool m_nmi_latched;     // edge seen, not yet serviced
    bool m_ei_shadow;       // the last instruction was EI
};

#endif // _INCLUDE_INTCTL_H_

// vim: ts=8:et:sw=4:smarttab
