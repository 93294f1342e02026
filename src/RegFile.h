// The register file holds every programmer visible register pair plus the
// internal WZ pair.  AF, BC, DE and HL exist twice (main and alternate bank);
// which physical copy answers to a name is decided by three bank flops:
//
//    af bank      toggled by EX AF,AF'
//    bc/de/hl     toggled by EXX
//    de<->hl      one flop per bank, toggled by EX DE,HL
//
// None of the exchanges move data; they only rename.  That is how the real
// part does it, and it is what lets them fit in a single M1 cycle without
// exceeding the write port.
//
// There is a single write port.  In one sub-cycle (half clock) it can take
// either one 16 bit write or two independent 8 bit writes.  Anything beyond
// that is a design fault of the control matrix, which is latched and
// reported by the core after the sub-cycle.

#ifndef _INCLUDE_REGFILE_H_
#define _INCLUDE_REGFILE_H_

#include "z80cycle.h"

class RegFile
{
public:
    // register pair names, as the control matrix selects them
    enum rp_t : uint8 {
        RP_BC, RP_DE, RP_HL, RP_AF,
        RP_IX, RP_IY, RP_SP, RP_PC,
        RP_IR, RP_WZ,
        NUM_RP
    };

    // 8 bit register names; each is one half of some pair
    enum reg8_t : uint8 {
        R8_B, R8_C, R8_D, R8_E, R8_H, R8_L, R8_F, R8_A,
        R8_IXH, R8_IXL, R8_IYH, R8_IYL,
        R8_SPH, R8_SPL, R8_PCH, R8_PCL,
        R8_I,   R8_R,   R8_W,   R8_Z,
        NUM_R8
    };

    RegFile();

    // put the bank flops in their power-on position
    void resetBanks() noexcept;

    // start of a new sub-cycle: the write budget refills
    void beginPhase() noexcept { m_halves = 0; }

    // ---- read ports (not budgeted) ----
    uint16 read16(rp_t rp) const noexcept;
    uint8  read8(reg8_t r) const noexcept;

    // ---- write port ----
    void write16(rp_t rp, uint16 value) noexcept;
    void write8(reg8_t r, uint8 value) noexcept;

    // ---- bank flops ----
    void exAf()   noexcept { m_af_bank ^= 1; }
    void exx()    noexcept { m_bank ^= 1; }
    void exDeHl() noexcept { m_dehl_swap[m_bank] = !m_dehl_swap[m_bank]; }

    // ---- debug port ----
    // these bypass the write budget and reach the inactive bank as well.
    // they exist for loading and inspecting state, never for execution.
    uint16 peek(rp_t rp, bool alternate=false) const noexcept;
    void   poke(rp_t rp, uint16 value, bool alternate=false) noexcept;

    // true if the write port was overrun since the last clearFault()
    bool portOverrun() const noexcept { return m_overrun; }
    void clearFault() noexcept { m_overrun = false; }

    // which pair an 8 bit register lives in, and which half
    static rp_t pairOf(reg8_t r) noexcept;
    static bool isHigh(reg8_t r) noexcept;

    // and the other way around
    static reg8_t highOf(rp_t rp) noexcept;
    static reg8_t lowOf(rp_t rp) noexcept;

private:
    // physical storage slots
    enum {
        SLOT_AF0, SLOT_AF1,
        SLOT_BC0, SLOT_DE0, SLOT_HL0,
        SLOT_BC1, SLOT_DE1, SLOT_HL1,
        SLOT_IX, SLOT_IY, SLOT_SP, SLOT_PC, SLOT_IR, SLOT_WZ,
        NUM_SLOTS
    };

    // map a pair name to its physical slot given the bank flops
    int slotOf(rp_t rp, bool alternate) const noexcept;

    // account for 'halves' 8 bit write slots used this sub-cycle
    void charge(int halves) noexcept;

    uint16 m_slot[NUM_SLOTS];
    int    m_af_bank;           // which AF slot is active
    int    m_bank;              // which BC/DE/HL group is active
    bool   m_dehl_swap[2];      // per bank: DE and HL names swapped
    int    m_halves;            // write slots used in this sub-cycle
    bool   m_overrun;           // sticky write port overrun
};

#endif // _INCLUDE_REGFILE_H_

// vim: ts=8:et:sw=4:smarttab
