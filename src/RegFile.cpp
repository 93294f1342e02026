// register file: storage, bank renaming, and the single write port

#include "RegFile.h"

// ------------------------------------------------------------------------
//  8 bit register to pair mapping
// ------------------------------------------------------------------------

static const RegFile::rp_t r8_pair[RegFile::NUM_R8] = {
    RegFile::RP_BC, RegFile::RP_BC,     // B, C
    RegFile::RP_DE, RegFile::RP_DE,     // D, E
    RegFile::RP_HL, RegFile::RP_HL,     // H, L
    RegFile::RP_AF, RegFile::RP_AF,     // F, A
    RegFile::RP_IX, RegFile::RP_IX,     // IXH, IXL
    RegFile::RP_IY, RegFile::RP_IY,     // IYH, IYL
    RegFile::RP_SP, RegFile::RP_SP,     // SPH, SPL
    RegFile::RP_PC, RegFile::RP_PC,     // PCH, PCL
    RegFile::RP_IR, RegFile::RP_IR,     // I, R
    RegFile::RP_WZ, RegFile::RP_WZ,     // W, Z
};

static const bool r8_high[RegFile::NUM_R8] = {
    true,  false,       // B, C
    true,  false,       // D, E
    true,  false,       // H, L
    false, true,        // F, A
    true,  false,       // IXH, IXL
    true,  false,       // IYH, IYL
    true,  false,       // SPH, SPL
    true,  false,       // PCH, PCL
    true,  false,       // I, R
    true,  false,       // W, Z
};


RegFile::rp_t
RegFile::pairOf(reg8_t r) noexcept
{
    assert(r < NUM_R8);
    return r8_pair[r];
}


bool
RegFile::isHigh(reg8_t r) noexcept
{
    assert(r < NUM_R8);
    return r8_high[r];
}


// pair to halves, in rp_t order
static const RegFile::reg8_t rp_high[RegFile::NUM_RP] = {
    RegFile::R8_B,   RegFile::R8_D,   RegFile::R8_H,   RegFile::R8_A,
    RegFile::R8_IXH, RegFile::R8_IYH, RegFile::R8_SPH, RegFile::R8_PCH,
    RegFile::R8_I,   RegFile::R8_W
};

static const RegFile::reg8_t rp_low[RegFile::NUM_RP] = {
    RegFile::R8_C,   RegFile::R8_E,   RegFile::R8_L,   RegFile::R8_F,
    RegFile::R8_IXL, RegFile::R8_IYL, RegFile::R8_SPL, RegFile::R8_PCL,
    RegFile::R8_R,   RegFile::R8_Z
};


RegFile::reg8_t
RegFile::highOf(rp_t rp) noexcept
{
    assert(rp < NUM_RP);
    return rp_high[rp];
}


RegFile::reg8_t
RegFile::lowOf(rp_t rp) noexcept
{
    assert(rp < NUM_RP);
    return rp_low[rp];
}

// ------------------------------------------------------------------------
//  public interface
// ------------------------------------------------------------------------

RegFile::RegFile() :
    m_af_bank(0),
    m_bank(0),
    m_halves(0),
    m_overrun(false)
{
    for (auto &s : m_slot) {
        s = 0xFFFF;
    }
    resetBanks();
}


void
RegFile::resetBanks() noexcept
{
    m_af_bank      = 0;
    m_bank         = 0;
    m_dehl_swap[0] = false;
    m_dehl_swap[1] = false;
}


int
RegFile::slotOf(rp_t rp, bool alternate) const noexcept
{
    const int af_bank = m_af_bank ^ (alternate ? 1 : 0);
    const int bank    = m_bank    ^ (alternate ? 1 : 0);
    const int group   = (bank == 0) ? SLOT_BC0 : SLOT_BC1;

    switch (rp) {
        case RP_AF: return (af_bank == 0) ? SLOT_AF0 : SLOT_AF1;
        case RP_BC: return group + 0;
        case RP_DE: return group + (m_dehl_swap[bank] ? 2 : 1);
        case RP_HL: return group + (m_dehl_swap[bank] ? 1 : 2);
        case RP_IX: return SLOT_IX;
        case RP_IY: return SLOT_IY;
        case RP_SP: return SLOT_SP;
        case RP_PC: return SLOT_PC;
        case RP_IR: return SLOT_IR;
        case RP_WZ: return SLOT_WZ;
        default:
            assert(false);
            return SLOT_WZ;
    }
}


uint16
RegFile::read16(rp_t rp) const noexcept
{
    return m_slot[slotOf(rp, false)];
}


uint8
RegFile::read8(reg8_t r) const noexcept
{
    const uint16 v = read16(pairOf(r));
    return static_cast<uint8>(isHigh(r) ? (v >> 8) : (v & 0xFF));
}


void
RegFile::charge(int halves) noexcept
{
    m_halves += halves;
#if CHECK_DATAPATH_RULES
    if (m_halves > 2) {
        m_overrun = true;
    }
#endif
}


void
RegFile::write16(rp_t rp, uint16 value) noexcept
{
    charge(2);
    m_slot[slotOf(rp, false)] = value;
}


void
RegFile::write8(reg8_t r, uint8 value) noexcept
{
    charge(1);
    uint16 &s = m_slot[slotOf(pairOf(r), false)];
    if (isHigh(r)) {
        s = static_cast<uint16>((s & 0x00FF) | (value << 8));
    } else {
        s = static_cast<uint16>((s & 0xFF00) | value);
    }
}


uint16
RegFile::peek(rp_t rp, bool alternate) const noexcept
{
    return m_slot[slotOf(rp, alternate)];
}


void
RegFile::poke(rp_t rp, uint16 value, bool alternate) noexcept
{
    m_slot[slotOf(rp, alternate)] = value;
}

// vim: ts=8:et:sw=4:smarttab
