// This is the timing side of the Z80 core:  the clock edges, the pins, the
// reset network, wait states, bus requests, interrupt acceptance, and the
// M1 cycle, which is the same for every instruction.  What happens in the
// remaining machine cycles is up to the control matrix in CpuZ80_Execute.cpp.
//
// Every sub-cycle follows the same pattern:
//
//    1. the register file write budget and the internal bus refill
//    2. the sequencer applies the move chosen at the previous edge
//    3. fixed actions of the (M,T) state, then control matrix actions
//    4. datapath rule check
//    5. the bus collaborator sees the new pins

#include "CpuZ80.h"
#include "Ui.h"
#include "host.h"

#include <cstdarg>

// ------------------------------------------------------------------------
// public members
// ------------------------------------------------------------------------

CpuZ80::CpuZ80(Z80Bus &bus, const CoreCfgState &cfg) :
    m_bus(bus),
    m_cfg(cfg),
    m_prefix(Pla::NO_PREFIX),
    m_dec(Pla::decode(0x00, Pla::NO_PREFIX)),
    m_opcode(0x00),
    m_dlatch(0xFF),
    m_dout(0xFF),
    m_next(Sequencer::NX_M1),
    m_jump_rp(RegFile::RP_PC),
    m_svc(IntCtl::SVC_NONE),
    m_first_m1(true),
    m_im0(false),
    m_halted(false),
    m_lowflags(0),
    m_insn_pc(0x0000),
    m_insn_start(true),
    m_boundary(false),
    m_busreq(false),
    m_status(CPU_RUNNING),
    m_tstates(0),
    m_m1count(0),
    m_icount(0)
{
    clearPins(m_pins);
    m_wb.valid = false;
    m_wb.reg   = RegFile::R8_A;
    m_wb.value = 0xFF;
    m_cyc.kind     = MC_FETCH;
    m_cyc.tlen     = 4;
    m_cyc.autowait = 0;
    m_cyc.addr_rp  = RegFile::RP_PC;
    m_cyc.addr     = 0x0000;
    m_cyc.post_rp  = RegFile::RP_PC;
    m_cyc.postop   = AddressLatch::ID_INC;
#if HAVE_OP_HISTOGRAM
    m_histogram.fill(0);
#endif
    powerOn();
}


CpuZ80::~CpuZ80()
{
#if HAVE_OP_HISTOGRAM
    dbglog("instruction class histogram:\n");
    for (int op=0; op < Pla::NUM_OPS; op++) {
        if (m_histogram[op] > 0) {
            dbglog("%-12s %10llu\n", Pla::opName(static_cast<Pla::op_t>(op)),
                   (unsigned long long)m_histogram[op]);
        }
    }
#endif
}


// assert reset for one full clock, then let go
void
CpuZ80::reset()
{
    m_pins.reset = true;
    tick();
    m_pins.reset = false;
}


// run until the end of an instruction
int
CpuZ80::stepInstruction()
{
    // more than any instruction takes; it only trips when WAIT or BUSRQ
    // is held for a very long time
    const int max_ticks = 100000;

    if (m_status != CPU_RUNNING) {
        return -1;
    }

    const uint64 start = m_tstates;
    for (int n=0; n < max_ticks; n++) {
        tick();
        if (m_status != CPU_RUNNING) {
            return -1;
        }
        if (m_boundary) {
            return static_cast<int>(m_tstates - start);
        }
    }

    return -1;
}


z80regs_t
CpuZ80::state() const noexcept
{
    z80regs_t s;
    s.af     = m_regs.peek(RegFile::RP_AF);
    s.bc     = m_regs.peek(RegFile::RP_BC);
    s.de     = m_regs.peek(RegFile::RP_DE);
    s.hl     = m_regs.peek(RegFile::RP_HL);
    s.af_alt = m_regs.peek(RegFile::RP_AF, true);
    s.bc_alt = m_regs.peek(RegFile::RP_BC, true);
    s.de_alt = m_regs.peek(RegFile::RP_DE, true);
    s.hl_alt = m_regs.peek(RegFile::RP_HL, true);
    s.ix     = m_regs.peek(RegFile::RP_IX);
    s.iy     = m_regs.peek(RegFile::RP_IY);
    s.sp     = m_regs.peek(RegFile::RP_SP);
    s.pc     = m_regs.peek(RegFile::RP_PC);
    s.wz     = m_regs.peek(RegFile::RP_WZ);
    const uint16 ir = m_regs.peek(RegFile::RP_IR);
    s.i      = static_cast<uint8>(ir >> 8);
    s.r      = static_cast<uint8>(ir);

    // a result still waiting for the next rising edge
    if (m_wb.valid) {
        uint16 *pair = nullptr;
        switch (RegFile::pairOf(m_wb.reg)) {
            case RegFile::RP_AF: pair = &s.af; break;
            case RegFile::RP_BC: pair = &s.bc; break;
            case RegFile::RP_DE: pair = &s.de; break;
            case RegFile::RP_HL: pair = &s.hl; break;
            case RegFile::RP_IX: pair = &s.ix; break;
            case RegFile::RP_IY: pair = &s.iy; break;
            case RegFile::RP_SP: pair = &s.sp; break;
            case RegFile::RP_PC: pair = &s.pc; break;
            case RegFile::RP_WZ: pair = &s.wz; break;
            default: break;
        }
        if (pair != nullptr) {
            if (RegFile::isHigh(m_wb.reg)) {
                *pair = static_cast<uint16>((*pair & 0x00FF) | (m_wb.value << 8));
            } else {
                *pair = static_cast<uint16>((*pair & 0xFF00) | m_wb.value);
            }
        }
    }

    // a jump still waiting for the next opcode fetch
    if (m_jump_rp != RegFile::RP_PC) {
        s.pc = m_regs.peek(static_cast<RegFile::rp_t>(m_jump_rp));
    }

    s.iff1   = m_ictl.iff1();
    s.iff2   = m_ictl.iff2();
    s.im     = m_ictl.mode();
    s.halted = m_halted;
    return s;
}


void
CpuZ80::setState(const z80regs_t &regs) noexcept
{
    m_regs.resetBanks();
    m_regs.poke(RegFile::RP_AF, regs.af);
    m_regs.poke(RegFile::RP_BC, regs.bc);
    m_regs.poke(RegFile::RP_DE, regs.de);
    m_regs.poke(RegFile::RP_HL, regs.hl);
    m_regs.poke(RegFile::RP_AF, regs.af_alt, true);
    m_regs.poke(RegFile::RP_BC, regs.bc_alt, true);
    m_regs.poke(RegFile::RP_DE, regs.de_alt, true);
    m_regs.poke(RegFile::RP_HL, regs.hl_alt, true);
    m_regs.poke(RegFile::RP_IX, regs.ix);
    m_regs.poke(RegFile::RP_IY, regs.iy);
    m_regs.poke(RegFile::RP_SP, regs.sp);
    m_regs.poke(RegFile::RP_PC, regs.pc);
    m_regs.poke(RegFile::RP_WZ, regs.wz);
    m_regs.poke(RegFile::RP_IR, static_cast<uint16>((regs.i << 8) | regs.r));

    m_ictl.setIff(regs.iff1, regs.iff2);
    m_ictl.setMode(regs.im);
    m_halted     = regs.halted;
    m_pins.halt  = regs.halted;
    m_wb.valid   = false;
    m_jump_rp    = RegFile::RP_PC;
}


// ------------------------------------------------------------------------
// clock edges
// ------------------------------------------------------------------------

void
CpuZ80::clockRise()
{
    m_regs.beginPhase();
    m_route.beginPhase();

    if (m_pins.reset) {
        resetRise();
        m_bus.busEdge(m_pins, true);
        return;
    }
    if (m_status != CPU_RUNNING) {
        return;
    }

    m_tstates++;
    m_boundary = false;
    m_ictl.sampleNmi(m_pins.nmi);
    commitWriteBack();

    // bus request handshake
    if (m_pins.busak) {
        if (m_pins.busrq) {
            endPhase(true);
            return;
        }
        // released: pick up where we left off on this same edge
        m_pins.busak     = false;
        m_pins.bus_float = false;
    } else if (m_busreq) {
        m_busreq = false;
        dropStrobes();
        m_pins.busak     = true;
        m_pins.bus_float = true;
        endPhase(true);
        return;
    }

    if (!m_seq.advance(m_next)) {
        designFault("sequencer stepped to M%d T%d during %s",
                    m_seq.m(), m_seq.t(), Pla::opName(m_dec.op));
        return;
    }

    const int m = m_seq.m();
    const int t = m_seq.t();
    if (m_seq.entered()) {
        if (m == 1) {
            m1Rise(t);
        } else {
            cycleRise(m, t);
        }
        if (t > 1) {
            execRise(m, t);
        }
    }

    if (t > m_cyc.tlen) {
        designFault("%s has no T%d in M%d", Pla::opName(m_dec.op), t, m);
        return;
    }

    endPhase(true);
}


void
CpuZ80::clockFall()
{
    m_regs.beginPhase();
    m_route.beginPhase();

    if (m_pins.reset) {
        resetFall();
        m_bus.busEdge(m_pins, false);
        return;
    }
    if (m_status != CPU_RUNNING) {
        return;
    }

    if (m_pins.busak) {
        endPhase(false);
        return;
    }

    const int m = m_seq.m();
    const int t = m_seq.t();

    if ((t == 2) && isBusCycle(m_cyc.kind) && holdT2()) {
        m_next = Sequencer::NX_HOLD;
        endPhase(false);
        return;
    }

    if (m == 1) {
        m1Fall(t);
    } else {
        cycleFall(t);
    }

    // the matrix may stretch the current cycle, so look at tlen afterward
    const cont_t cont = execFall(m, t);
    if (t >= m_cyc.tlen) {
        endMachineCycle(cont);
    } else {
        m_next = Sequencer::NX_T;
    }

    endPhase(false);
}


// ------------------------------------------------------------------------
// reset
// ------------------------------------------------------------------------

void
CpuZ80::powerOn()
{
    m_regs.beginPhase();
    resetRise();
    m_regs.beginPhase();
    resetFall();
    m_regs.beginPhase();
    m_tstates = 0;
    m_m1count = 0;
    m_icount  = 0;
}


// the first half of reset: PC and the sequencer
void
CpuZ80::resetRise()
{
    m_regs.write16(RegFile::RP_PC, 0x0000);
    m_seq.reset();
    m_next = Sequencer::NX_M1;      // M1/T1 again at the first live edge

    dropStrobes();
    m_pins.halt      = false;
    m_pins.busak     = false;
    m_pins.bus_float = false;
    m_pins.data_oe   = false;
    m_busreq   = false;
    m_boundary = false;

    m_cyc.kind     = MC_FETCH;
    m_cyc.tlen     = 4;
    m_cyc.autowait = 0;

    m_status = CPU_RUNNING;
    m_fault_msg.clear();
    m_regs.clearFault();
    m_route.clearFault();
}


// the second half of reset: I, R, the interrupt state, and the registers
// reset doesn't define
void
CpuZ80::resetFall()
{
    m_regs.write16(RegFile::RP_IR, 0x0000);
    m_opcode = 0x00;
    m_ictl.reset();

    m_halted     = false;
    m_prefix     = Pla::NO_PREFIX;
    m_dec        = Pla::decode(0x00, Pla::NO_PREFIX);
    m_svc        = IntCtl::SVC_NONE;
    m_first_m1   = true;
    m_insn_start = true;
    m_im0        = false;
    m_wb.valid   = false;
    m_jump_rp    = RegFile::RP_PC;

    loadResetValues();
}


// this is the reset network, not the write port, so it isn't budgeted
void
CpuZ80::loadResetValues()
{
    m_regs.resetBanks();
    m_regs.poke(RegFile::RP_AF, m_cfg.getResetValue(CoreCfgState::RST_AF));
    m_regs.poke(RegFile::RP_BC, m_cfg.getResetValue(CoreCfgState::RST_BC));
    m_regs.poke(RegFile::RP_DE, m_cfg.getResetValue(CoreCfgState::RST_DE));
    m_regs.poke(RegFile::RP_HL, m_cfg.getResetValue(CoreCfgState::RST_HL));
    m_regs.poke(RegFile::RP_AF, m_cfg.getResetValue(CoreCfgState::RST_AF_ALT), true);
    m_regs.poke(RegFile::RP_BC, m_cfg.getResetValue(CoreCfgState::RST_BC_ALT), true);
    m_regs.poke(RegFile::RP_DE, m_cfg.getResetValue(CoreCfgState::RST_DE_ALT), true);
    m_regs.poke(RegFile::RP_HL, m_cfg.getResetValue(CoreCfgState::RST_HL_ALT), true);
    m_regs.poke(RegFile::RP_IX, m_cfg.getResetValue(CoreCfgState::RST_IX));
    m_regs.poke(RegFile::RP_IY, m_cfg.getResetValue(CoreCfgState::RST_IY));
    m_regs.poke(RegFile::RP_SP, m_cfg.getResetValue(CoreCfgState::RST_SP));
}


// ------------------------------------------------------------------------
// M1: opcode fetch, or interrupt acknowledge
// ------------------------------------------------------------------------

void
CpuZ80::m1Rise(int t)
{
    switch (t) {

    case 1: {
        m_pins.rfsh = false;
        m_pins.mreq = false;

        if (m_insn_start) {
            m_insn_start = false;
            if ((m_svc != IntCtl::SVC_NONE) && m_halted) {
                m_halted    = false;
                m_pins.halt = false;
            }
        }

        const bool ack = m_first_m1 && (m_svc == IntCtl::SVC_INT);
        const bool hold_pc = m_halted || m_im0
                          || (m_first_m1 && (m_svc != IntCtl::SVC_NONE));
        m_cyc.kind     = (ack) ? MC_INTACK : MC_FETCH;
        m_cyc.tlen     = 4;                 // until the opcode is decoded
        m_cyc.autowait = (ack) ? 2 : 0;
        m_cyc.addr_rp  = m_jump_rp;
        m_cyc.post_rp  = RegFile::RP_PC;
        m_cyc.postop   = (hold_pc) ? AddressLatch::ID_NONE : AddressLatch::ID_INC;

        m_latch.load(reg16(m_jump_rp));
        m_pins.addr = m_latch.value();
        m_pins.m1   = true;
        if (m_first_m1) {
            m_insn_pc = m_latch.value();
        }
        break;
    }

    case 2:
        // PC is written even when it doesn't advance, to complete a jump
        m_regs.write16(RegFile::RP_PC, m_latch.incDec(m_cyc.postop));
        m_jump_rp = RegFile::RP_PC;
        break;

    case 3: {
        const bool service = m_first_m1 && (m_svc != IntCtl::SVC_NONE);
        Pla::prefix_t pf = m_prefix;
        uint8 op = m_pins.data;

        if (service && (m_svc == IntCtl::SVC_NMI)) {
            op = 0x00;
            pf.svc = Pla::SVC_NMI;
        } else if (service) {
            switch (m_ictl.mode()) {
                case 0:
                    m_im0 = true;       // the board supplied an opcode
                    break;
                case 1:
                    op = 0xFF;          // RST 38
                    break;
                default:
                    m_dlatch = op;      // the vector
                    op = 0x00;
                    pf.svc = Pla::SVC_IM2;
                    break;
            }
        } else if (m_halted) {
            op = 0x00;
        }

        m_opcode = op;
        m_dec = Pla::decode(op, pf);
        m_cyc.tlen = m_dec.m1_len;
        m_m1count++;

        // accumulator prep latch
        const uint8 acc = m_route.route(BusRouter::SRC_REGS,
                                        m_regs.read8(RegFile::R8_A),
                                        BusRouter::SEG_REG, BusRouter::SEG_ALU);
        m_alu.prepare(acc);

        // refresh address
        m_pins.m1   = false;
        m_pins.mreq = false;
        m_pins.rd   = false;
        m_pins.iorq = false;
        m_latch.load(m_regs.read16(RegFile::RP_IR));
        m_pins.addr = m_latch.value();
        m_pins.rfsh = true;
        break;
    }

    case 4:
        // only the low seven bits of R count
        m_regs.write8(RegFile::R8_R, static_cast<uint8>(
                        m_latch.incDec(AddressLatch::ID_INC, AddressLatch::WIN_7)));
        break;

    default:
        m_pins.rfsh = false;
        break;
    }
}


void
CpuZ80::m1Fall(int t)
{
    switch (t) {
        case 1:
            if (m_cyc.kind == MC_FETCH) {
                m_pins.mreq = true;
                m_pins.rd   = true;
            }
            break;
        case 3:
            m_pins.mreq = true;     // refresh strobe
            break;
        case 4:
            m_pins.mreq = false;
            break;
        default:
            break;
    }
}


// ------------------------------------------------------------------------
// M2 and later
// ------------------------------------------------------------------------

void
CpuZ80::cycleRise(int m, int t)
{
    switch (t) {

    case 1:
        m_pins.rfsh = false;
        m_pins.m1   = false;
        execEnter(m);
        if (m_cyc.kind != MC_INTERNAL) {
            const uint16 a = (m_cyc.addr_rp == ADDR_ABS) ? m_cyc.addr
                                                         : reg16(m_cyc.addr_rp);
            m_latch.load(a);
            m_pins.addr = a;
        }
        break;

    case 2:
        if ((m_cyc.post_rp != NO_RP) &&
            (m_cyc.postop != AddressLatch::ID_NONE) &&
            !(m_im0 && (m_cyc.post_rp == RegFile::RP_PC))) {
            m_regs.write16(static_cast<RegFile::rp_t>(m_cyc.post_rp),
                           m_latch.incDec(m_cyc.postop));
        }
        if (m_cyc.kind == MC_IORD) {
            m_pins.iorq = true;
            m_pins.rd   = true;
        } else if (m_cyc.kind == MC_IOWR) {
            m_pins.iorq = true;
            m_pins.wr   = true;
        }
        break;

    default:
        break;
    }
}


void
CpuZ80::cycleFall(int t)
{
    switch (m_cyc.kind) {

    case MC_MEMRD:
        if (t == 1) {
            m_pins.mreq = true;
            m_pins.rd   = true;
        } else if (t == 3) {
            m_dlatch    = m_pins.data;
            m_pins.mreq = false;
            m_pins.rd   = false;
        }
        break;

    case MC_MEMWR:
        if (t == 1) {
            m_pins.mreq    = true;
            m_pins.data_oe = true;
            m_pins.data    = m_dout;
        } else if (t == 3) {
            m_pins.mreq    = false;
            m_pins.wr      = false;
            m_pins.data_oe = false;
        }
        break;

    case MC_IORD:
        if (t == 3) {
            m_dlatch    = m_pins.data;
            m_pins.iorq = false;
            m_pins.rd   = false;
        }
        break;

    case MC_IOWR:
        if (t == 1) {
            m_pins.data_oe = true;
            m_pins.data    = m_dout;
        } else if (t == 3) {
            m_pins.iorq    = false;
            m_pins.wr      = false;
            m_pins.data_oe = false;
        }
        break;

    default:
        break;
    }
}


// fall of T2 (or of a wait state) in a bus cycle.  returns true to hold.
bool
CpuZ80::holdT2()
{
    if (m_seq.entered()) {
        // strobes that go active at the first fall of T2, waits or not
        if (m_cyc.kind == MC_MEMWR) {
            m_pins.wr = true;
        } else if (m_cyc.kind == MC_INTACK) {
            m_pins.iorq = true;
        }
    }

    if (m_cyc.autowait > 0) {
        m_cyc.autowait--;
        return true;
    }

    return m_pins.wait;
}


bool
CpuZ80::isBusCycle(mcycle_t kind) noexcept
{
    return (kind != MC_INTERNAL);
}


// ------------------------------------------------------------------------
// cycle and instruction boundaries
// ------------------------------------------------------------------------

void
CpuZ80::endMachineCycle(cont_t cont)
{
    m_busreq = m_pins.busrq;

    switch (cont) {
        case CONT_NEXT_M:
            m_next = Sequencer::NX_M;
            break;
        case CONT_PREFIX:
            m_next = Sequencer::NX_M1;
            m_first_m1 = false;
            break;
        case CONT_END:
            m_next = Sequencer::NX_M1;
            endInstruction();
            break;
        case CONT_STAY:
        default:
            designFault("%s (opcode %02X) has no continuation at M%d T%d",
                        Pla::opName(m_dec.op), m_opcode, m_seq.m(), m_seq.t());
            break;
    }
}


void
CpuZ80::endInstruction()
{
    m_boundary = true;
    m_icount++;
#if HAVE_OP_HISTOGRAM
    m_histogram[m_dec.op]++;
#endif

    if (m_cfg.traceEnabled()) {
        traceInstruction();
    }

    m_prefix     = Pla::NO_PREFIX;
    m_im0        = false;
    m_first_m1   = true;
    m_insn_start = true;
    m_svc        = m_ictl.arbitrate(m_pins.intr);
}


void
CpuZ80::commitWriteBack()
{
    if (!m_wb.valid) {
        return;
    }
    m_wb.valid = false;
    const uint8 v = m_route.route(BusRouter::SRC_ALU, m_wb.value,
                                  BusRouter::SEG_ALU, BusRouter::SEG_REG);
    m_regs.write8(m_wb.reg, v);
}


void
CpuZ80::dropStrobes() noexcept
{
    m_pins.m1      = false;
    m_pins.mreq    = false;
    m_pins.iorq    = false;
    m_pins.rd      = false;
    m_pins.wr      = false;
    m_pins.rfsh    = false;
    m_pins.data_oe = false;
}


void
CpuZ80::endPhase(bool rising)
{
#if CHECK_DATAPATH_RULES
    if (m_route.fault()) {
        designFault("internal bus misuse at M%d T%d during %s",
                    m_seq.m(), m_seq.t(), Pla::opName(m_dec.op));
    } else if (m_regs.portOverrun()) {
        designFault("register write port overrun at M%d T%d during %s",
                    m_seq.m(), m_seq.t(), Pla::opName(m_dec.op));
    }
#endif
    if (m_status != CPU_RUNNING) {
        return;
    }
    m_bus.busEdge(m_pins, rising);
}


// a bug in the control matrix, not in the program being run.  report it
// once and stop; only reset gets the core going again.
void
CpuZ80::designFault(const char *fmt, ...)
{
    if (m_status != CPU_RUNNING) {
        return;
    }

    char buff[200];
    va_list args;
    va_start(args, fmt);
    vsnprintf(&buff[0], sizeof(buff), fmt, args);
    va_end(args);

    m_fault_msg = &buff[0];
    m_status = CPU_HALTED;

    dbglog("design fault at T-state %llu, PC=%04X: %s\n",
           (unsigned long long)m_tstates, m_insn_pc, &buff[0]);
    UI_error("Z80 core design fault: %s", &buff[0]);
}


void
CpuZ80::traceInstruction()
{
    const z80regs_t s = state();
    dbglog("%04X: %02X %-12s AF=%04X BC=%04X DE=%04X HL=%04X "
           "IX=%04X IY=%04X SP=%04X PC=%04X T=%llu\n",
           m_insn_pc, m_opcode, Pla::opName(m_dec.op),
           s.af, s.bc, s.de, s.hl, s.ix, s.iy, s.sp, s.pc,
           (unsigned long long)m_tstates);
}

// vim: ts=8:et:sw=4:smarttab
