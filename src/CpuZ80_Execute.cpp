// The control matrix: for each instruction class, what happens at each
// (M,T) state past the opcode fetch.
//
// execEnter() runs at the T1 rise of M2 and later and describes the machine
// cycle: its kind, its length, where the address comes from, and what the
// incrementer does with it at T2.  execRise() and execFall() hold the
// per-edge register transfers.  execFall() also says how the machine cycle
// ends; the core only listens to that at the last T state.
//
// The matrix has to live within the datapath rules that the core checks
// after every sub-cycle:
//
//    - the register file takes at most two byte writes per sub-cycle
//    - each internal bus segment has one driver per sub-cycle, and data
//      crosses the segments in one round per sub-cycle
//
// That is why many results are parked in the write-back latch, which is
// committed at the next rising edge, and why jumps only name the pair the
// next opcode fetch takes its address from.
//
// Memory operand cycles of the indexed forms are shifted by two: M2 reads
// the displacement and M3 is the 5 T cycle that adds it to IX/IY, leaving
// the effective address in WZ.

#include "CpuZ80.h"

namespace {

const AddressLatch::incdec_t INC = AddressLatch::ID_INC;
const AddressLatch::incdec_t DEC = AddressLatch::ID_DEC;

// true for the classes that may carry the (IX+d) prologue
bool
hasIndexPrologue(Pla::op_t op) noexcept
{
    switch (op) {
        case Pla::OP_INC_M:
        case Pla::OP_DEC_M:
        case Pla::OP_LD_R_M:
        case Pla::OP_LD_M_R:
        case Pla::OP_ALU_M:
            return true;
        default:
            return false;
    }
}

// CB operations that change the flags
bool
cbSetsFlags(uint8 alu) noexcept
{
    return (alu != Alu::ALU_RES) && (alu != Alu::ALU_SET);
}

} // namespace


// ------------------------------------------------------------------------
// machine cycle set up
// ------------------------------------------------------------------------

void
CpuZ80::execEnter(int m)
{
    const Pla::op_t op = m_dec.op;

    if (m_dec.indexed && hasIndexPrologue(op) && (m <= 3)) {
        enterIndexed(m);
        return;
    }

    // machine cycle number as if there were no displacement
    const int s = m - ((m_dec.indexed) ? 2 : 0);
    const RegFile::rp_t rp = static_cast<RegFile::rp_t>(m_dec.rp);

    switch (op) {

    case Pla::OP_LD_RP_NN:
    case Pla::OP_LD_R_N:
    case Pla::OP_ALU_N:
    case Pla::OP_JP:
    case Pla::OP_JP_CC:
        readPc();
        break;

    case Pla::OP_LD_IND_A:
        busCycle(MC_MEMWR, 3, rp);
        driveData(BusRouter::SRC_REGS, reg8(RegFile::R8_A));
        break;

    case Pla::OP_LD_A_IND:
        busCycle(MC_MEMRD, 3, rp, RegFile::RP_WZ, INC);
        break;

    case Pla::OP_INC_M:
    case Pla::OP_DEC_M:
    case Pla::OP_CB_M:
        if (s == 2) {
            busCycle(MC_MEMRD, 4, memRp());
        } else {
            busCycle(MC_MEMWR, 3, memRp());
            if (m_dec.r != Pla::NO_REG) {
                driveDataCopy(m_alu.result(), static_cast<RegFile::reg8_t>(m_dec.r));
            } else {
                driveData(BusRouter::SRC_ALU, m_alu.result());
            }
        }
        break;

    case Pla::OP_CB_BIT_M:
        busCycle(MC_MEMRD, 4, memRp());
        break;

    case Pla::OP_LD_M_N:
        if (m_dec.indexed) {
            // d, then n overlapped with the address add, then the write
            if (m == 2) {
                readPc();
            } else if (m == 3) {
                readPc(5);
            } else {
                busCycle(MC_MEMWR, 3, RegFile::RP_WZ);
                driveData(BusRouter::SRC_ALU, m_alu.result());
            }
        } else if (m == 2) {
            readPc();
        } else {
            busCycle(MC_MEMWR, 3, RegFile::RP_HL);
            driveData(BusRouter::SRC_ALU, m_alu.result());
        }
        break;

    case Pla::OP_ADD_HL:
    case Pla::OP_ADC_HL:
    case Pla::OP_SBC_HL:
        internalCycle((m == 2) ? 4 : 3);
        break;

    case Pla::OP_DJNZ:
    case Pla::OP_JR:
    case Pla::OP_JR_CC:
        if (m == 2) {
            readPc();
        } else {
            internalCycle(5);
        }
        break;

    case Pla::OP_LD_NN_RP:
        if (m <= 3) {
            readPc();
        } else if (m == 4) {
            busCycle(MC_MEMWR, 3, RegFile::RP_WZ, RegFile::RP_WZ, INC);
            driveData(BusRouter::SRC_REGS, reg8(RegFile::lowOf(rp)));
        } else {
            busCycle(MC_MEMWR, 3, RegFile::RP_WZ);
            driveData(BusRouter::SRC_REGS, reg8(RegFile::highOf(rp)));
        }
        break;

    case Pla::OP_LD_RP_NNI:
        if (m <= 3) {
            readPc();
        } else if (m == 4) {
            busCycle(MC_MEMRD, 3, RegFile::RP_WZ, RegFile::RP_WZ, INC);
        } else {
            busCycle(MC_MEMRD, 3, RegFile::RP_WZ);
        }
        break;

    case Pla::OP_LD_NN_A:
        if (m <= 3) {
            readPc();
        } else {
            busCycle(MC_MEMWR, 3, RegFile::RP_WZ);
            driveData(BusRouter::SRC_REGS, reg8(RegFile::R8_A));
        }
        break;

    case Pla::OP_LD_A_NN:
        if (m <= 3) {
            readPc();
        } else {
            busCycle(MC_MEMRD, 3, RegFile::RP_WZ, RegFile::RP_WZ, INC);
        }
        break;

    case Pla::OP_LD_R_M:
    case Pla::OP_ALU_M:
        busCycle(MC_MEMRD, 3, memRp());
        break;

    case Pla::OP_LD_M_R:
        busCycle(MC_MEMWR, 3, memRp());
        driveData(BusRouter::SRC_REGS, reg8(m_dec.r2));
        break;

    case Pla::OP_RET_CC:
    case Pla::OP_RET:
    case Pla::OP_RETN:
    case Pla::OP_POP:
        busCycle(MC_MEMRD, 3, RegFile::RP_SP, RegFile::RP_SP, INC);
        break;

    case Pla::OP_PUSH:
        if (m == 2) {
            busCycle(MC_MEMWR, 3, RegFile::RP_SP, RegFile::RP_SP, DEC);
            driveData(BusRouter::SRC_REGS, reg8(RegFile::highOf(rp)));
        } else {
            busCycle(MC_MEMWR, 3, RegFile::RP_SP);
            driveData(BusRouter::SRC_REGS, reg8(RegFile::lowOf(rp)));
        }
        break;

    case Pla::OP_CALL:
    case Pla::OP_CALL_CC:
        if (m <= 3) {
            readPc();       // M3 grows to 4 T when the call is taken
        } else if (m == 4) {
            busCycle(MC_MEMWR, 3, RegFile::RP_SP, RegFile::RP_SP, DEC);
            driveData(BusRouter::SRC_REGS, reg8(RegFile::R8_PCH));
        } else {
            busCycle(MC_MEMWR, 3, RegFile::RP_SP);
            driveData(BusRouter::SRC_REGS, reg8(RegFile::R8_PCL));
        }
        break;

    case Pla::OP_RST:
    case Pla::OP_NMI:
    case Pla::OP_IM2:
        if (m == 2) {
            busCycle(MC_MEMWR, 3, RegFile::RP_SP, RegFile::RP_SP, DEC);
            driveData(BusRouter::SRC_REGS, reg8(RegFile::R8_PCH));
        } else if (m == 3) {
            busCycle(MC_MEMWR, 3, RegFile::RP_SP);
            driveData(BusRouter::SRC_REGS, reg8(RegFile::R8_PCL));
        } else if (m == 4) {
            // IM2 only: fetch the service routine address from the table
            busCycle(MC_MEMRD, 3, RegFile::RP_WZ, RegFile::RP_WZ, INC);
        } else {
            busCycle(MC_MEMRD, 3, RegFile::RP_WZ);
        }
        break;

    case Pla::OP_OUT_N_A:
        if (m == 2) {
            readPc();
        } else {
            const uint8 a = reg8(RegFile::R8_A);
            busCycleAbs(MC_IOWR, 3, static_cast<uint16>((a << 8) | reg8(RegFile::R8_Z)));
            driveData(BusRouter::SRC_REGS, a);
        }
        break;

    case Pla::OP_IN_A_N:
        if (m == 2) {
            readPc();
        } else {
            const uint8 a = reg8(RegFile::R8_A);
            busCycleAbs(MC_IORD, 3, static_cast<uint16>((a << 8) | reg8(RegFile::R8_Z)),
                        RegFile::RP_WZ, INC);
        }
        break;

    case Pla::OP_EX_SP_RP:
        switch (m) {
            case 2:
                busCycle(MC_MEMRD, 3, RegFile::RP_SP, RegFile::RP_SP, INC);
                break;
            case 3:
                busCycle(MC_MEMRD, 4, RegFile::RP_SP);
                break;
            case 4:
                busCycle(MC_MEMWR, 3, RegFile::RP_SP, RegFile::RP_SP, DEC);
                driveData(BusRouter::SRC_REGS, reg8(RegFile::highOf(rp)));
                break;
            default:
                busCycle(MC_MEMWR, 5, RegFile::RP_SP);
                driveData(BusRouter::SRC_REGS, reg8(RegFile::lowOf(rp)));
                break;
        }
        break;

    case Pla::OP_PREFIX_CB:
        // DD CB / FD CB: displacement, then the opcode, which takes 5 T
        // because the displacement add overlaps it
        readPc((m == 2) ? 3 : 5);
        break;

    case Pla::OP_IN_R_C:
        busCycle(MC_IORD, 3, RegFile::RP_BC, RegFile::RP_WZ, INC);
        break;

    case Pla::OP_OUT_C_R:
        busCycle(MC_IOWR, 3, RegFile::RP_BC, RegFile::RP_WZ, INC);
        if (m_dec.r2 == Pla::NO_REG) {
            driveData(BusRouter::SRC_CONST, 0x00);
        } else {
            driveData(BusRouter::SRC_REGS, reg8(m_dec.r2));
        }
        break;

    case Pla::OP_RRD:
    case Pla::OP_RLD:
        if (m == 2) {
            busCycle(MC_MEMRD, 3, RegFile::RP_HL, RegFile::RP_WZ, INC);
        } else if (m == 3) {
            internalCycle(4);
        } else {
            busCycle(MC_MEMWR, 3, RegFile::RP_HL);
            driveData(BusRouter::SRC_ALU, m_alu.result());
        }
        break;

    case Pla::OP_BLOCK_LD:
    case Pla::OP_BLOCK_CP:
    case Pla::OP_BLOCK_IN:
    case Pla::OP_BLOCK_OUT:
        enterBlock(m);
        break;

    default:
        internalCycle(3);
        designFault("%s has no machine cycle M%d", Pla::opName(op), m);
        break;
    }
}


void
CpuZ80::enterIndexed(int m)
{
    if (m == 2) {
        readPc();           // displacement
    } else {
        internalCycle(5);   // IX+d -> WZ
    }
}


void
CpuZ80::enterBlock(int m)
{
    const AddressLatch::incdec_t dir = (m_dec.dec) ? DEC : INC;

    if (m == 4) {
        // repeat: back up PC to the ED prefix
        internalCycle(5);
        return;
    }

    switch (m_dec.op) {

    case Pla::OP_BLOCK_LD:
        if (m == 2) {
            busCycle(MC_MEMRD, 3, RegFile::RP_HL, RegFile::RP_HL, dir);
        } else {
            busCycle(MC_MEMWR, 5, RegFile::RP_DE, RegFile::RP_DE, dir);
            driveData(BusRouter::SRC_DLATCH, m_dlatch);
        }
        break;

    case Pla::OP_BLOCK_CP:
        if (m == 2) {
            busCycle(MC_MEMRD, 3, RegFile::RP_HL, RegFile::RP_HL, dir);
        } else {
            internalCycle(5);
            m_latch.load(reg16(RegFile::RP_BC));
            m_pins.addr = m_latch.value();
        }
        break;

    case Pla::OP_BLOCK_IN:
        if (m == 2) {
            busCycle(MC_IORD, 3, RegFile::RP_BC, RegFile::RP_WZ, dir);
        } else {
            busCycle(MC_MEMWR, 3, RegFile::RP_HL, RegFile::RP_HL, dir);
            driveData(BusRouter::SRC_DLATCH, m_dlatch);
        }
        break;

    case Pla::OP_BLOCK_OUT:
    default:
        if (m == 2) {
            busCycle(MC_MEMRD, 3, RegFile::RP_HL, RegFile::RP_HL, dir);
        } else {
            busCycle(MC_IOWR, 3, RegFile::RP_BC, RegFile::RP_WZ, dir);
            driveData(BusRouter::SRC_DLATCH, m_dlatch);
        }
        break;
    }
}


// ------------------------------------------------------------------------
// rising edges past T1
// ------------------------------------------------------------------------

void
CpuZ80::execRise(int m, int t)
{
    const Pla::op_t op = m_dec.op;

    if ((m == 1) && (t == 5)) {
        switch (op) {
            case Pla::OP_INC_RP:
            case Pla::OP_DEC_RP:
            case Pla::OP_LD_SP_RP:
                m_latch.load(reg16(m_dec.rp));
                m_pins.addr = m_latch.value();
                break;
            case Pla::OP_PUSH:
            case Pla::OP_RST:
            case Pla::OP_NMI:
            case Pla::OP_IM2:
                m_latch.load(reg16(RegFile::RP_SP));
                m_pins.addr = m_latch.value();
                break;
            default:
                break;
        }
        return;
    }

    if ((m == 3) && (t == 4)) {
        if ((op == Pla::OP_CALL) || (op == Pla::OP_CALL_CC)) {
            m_latch.load(reg16(RegFile::RP_SP));
            m_pins.addr = m_latch.value();
        } else if (op == Pla::OP_BLOCK_LD) {
            m_latch.load(reg16(RegFile::RP_BC));
            m_pins.addr = m_latch.value();
        }
    }
}


// ------------------------------------------------------------------------
// falling edges
// ------------------------------------------------------------------------

CpuZ80::cont_t
CpuZ80::execFall(int m, int t)
{
    const Pla::op_t op = m_dec.op;
    const Alu::op_t alu = static_cast<Alu::op_t>(m_dec.alu);
    const RegFile::rp_t rp = static_cast<RegFile::rp_t>(m_dec.rp);

    // the end of a 4 T M1 for everything that needs more machine cycles
    const bool m1_end = (m == 1) && (t == m_dec.m1_len);

    if (m_dec.indexed && hasIndexPrologue(op) && (m == 2 || m == 3)) {
        return fallIndexed(m, t);
    }
    const int s = m - ((m_dec.indexed) ? 2 : 0);

    switch (op) {

    case Pla::OP_NOP:
    case Pla::OP_ED_NOP:
        if (m1_end) { return CONT_END; }
        break;

    case Pla::OP_HALT:
        if (m1_end) {
            m_halted    = true;
            m_pins.halt = true;
            return CONT_END;
        }
        break;

    case Pla::OP_LD_RP_NN:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) {
            dataToReg(RegFile::lowOf(rp));
            return CONT_NEXT_M;
        }
        if (m == 3 && t == 3) {
            dataToReg(RegFile::highOf(rp));
            return CONT_END;
        }
        break;

    case Pla::OP_LD_IND_A:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) {
            const uint8 a = reg8(RegFile::R8_A);
            m_regs.write16(RegFile::RP_WZ, static_cast<uint16>(
                                (a << 8) | ((reg16(rp) + 1) & 0xFF)));
            return CONT_END;
        }
        break;

    case Pla::OP_LD_A_IND:
    case Pla::OP_LD_A_NN:
        if (m1_end) { return CONT_NEXT_M; }
        if ((op == Pla::OP_LD_A_NN) && (m <= 3) && (t == 3)) {
            return readAddress(m);
        }
        if (t == 3) {
            dataToReg(RegFile::R8_A);
            return CONT_END;
        }
        break;

    case Pla::OP_INC_RP:
    case Pla::OP_DEC_RP:
        if (m == 1 && t == 6) {
            m_regs.write16(rp, m_latch.incDec((op == Pla::OP_INC_RP) ? INC : DEC));
            return CONT_END;
        }
        break;

    case Pla::OP_LD_SP_RP:
        if (m == 1 && t == 6) {
            m_regs.write16(RegFile::RP_SP, m_latch.value());
            return CONT_END;
        }
        break;

    case Pla::OP_INC_R:
    case Pla::OP_DEC_R:
        if (m1_end) {
            const Alu::result_t res = Alu::exec(alu, reg8(m_dec.r), 0, flags());
            setFlags(res.flags);
            writeBack(static_cast<RegFile::reg8_t>(m_dec.r), res.value);
            return CONT_END;
        }
        break;

    case Pla::OP_INC_M:
    case Pla::OP_DEC_M:
    case Pla::OP_CB_M:
        if (m1_end) { return CONT_NEXT_M; }
        if (s == 2 && t == 4) {
            const uint8 v = dataToAlu();
            const Alu::result_t res = Alu::exec(alu, v, 0, flags(), m_dec.n);
            if (cbSetsFlags(alu)) {
                setFlags(res.flags);
            }
            m_alu.setResult(res.value);
            return CONT_NEXT_M;
        }
        if (s == 3 && t == 3) { return CONT_END; }
        break;

    case Pla::OP_CB_BIT_M:
        if (m1_end) { return CONT_NEXT_M; }
        if (t == 4) {
            // the flag donor is the high byte of the address
            const uint8 v = dataToAlu();
            const Alu::result_t res = Alu::exec(Alu::ALU_BIT, v, reg8(RegFile::R8_W),
                                                flags(), m_dec.n);
            setFlags(res.flags);
            return CONT_END;
        }
        break;

    case Pla::OP_LD_R_N:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) {
            dataToReg(static_cast<RegFile::reg8_t>(m_dec.r));
            return CONT_END;
        }
        break;

    case Pla::OP_LD_M_N:
        if (m1_end) { return CONT_NEXT_M; }
        if (!m_dec.indexed) {
            if (m == 2 && t == 3) {
                m_alu.setResult(dataToAlu());
                return CONT_NEXT_M;
            }
            if (m == 3 && t == 3) { return CONT_END; }
        } else {
            if (m == 2 && t == 3) {
                dataToReg(RegFile::R8_Z);
                return CONT_NEXT_M;
            }
            if (m == 3 && t == 5) {
                m_alu.setResult(dataToAlu());
                m_regs.write16(RegFile::RP_WZ, indexAddress());
                return CONT_NEXT_M;
            }
            if (m == 4 && t == 3) { return CONT_END; }
        }
        break;

    case Pla::OP_ALU_A:
        if (m1_end) {
            const Alu::result_t res = Alu::exec(alu, m_alu.acc(), 0, flags());
            setFlags(res.flags);
            if ((alu != Alu::ALU_SCF) && (alu != Alu::ALU_CCF)) {
                writeBack(RegFile::R8_A, res.value);
            }
            return CONT_END;
        }
        break;

    case Pla::OP_EX_AF:
        if (m1_end) {
            m_regs.exAf();
            return CONT_END;
        }
        break;

    case Pla::OP_EXX:
        if (m1_end) {
            m_regs.exx();
            return CONT_END;
        }
        break;

    case Pla::OP_EX_DE_HL:
        if (m1_end) {
            m_regs.exDeHl();
            return CONT_END;
        }
        break;

    case Pla::OP_DI:
        if (m1_end) {
            m_ictl.di();
            return CONT_END;
        }
        break;

    case Pla::OP_EI:
        if (m1_end) {
            m_ictl.ei();
            return CONT_END;
        }
        break;

    case Pla::OP_IM:
        if (m1_end) {
            m_ictl.setMode(m_dec.n);
            return CONT_END;
        }
        break;

    case Pla::OP_ADD_HL:
    case Pla::OP_ADC_HL:
    case Pla::OP_SBC_HL:
        return fallAddHl(m, t);

    case Pla::OP_DJNZ:
        if (m1_end) {
            writeBack(RegFile::R8_B, static_cast<uint8>(reg8(RegFile::R8_B) - 1));
            return CONT_NEXT_M;
        }
        if (m == 2 && t == 3) {
            dataToReg(RegFile::R8_Z);
            return (reg8(RegFile::R8_B) != 0) ? CONT_NEXT_M : CONT_END;
        }
        if (m == 3 && t == 5) { return relativeJump(); }
        break;

    case Pla::OP_JR:
    case Pla::OP_JR_CC:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) {
            dataToReg(RegFile::R8_Z);
            if (op == Pla::OP_JR) {
                return CONT_NEXT_M;
            }
            return condition(m_dec.cc) ? CONT_NEXT_M : CONT_END;
        }
        if (m == 3 && t == 5) { return relativeJump(); }
        break;

    case Pla::OP_LD_NN_RP:
        if (m1_end) { return CONT_NEXT_M; }
        if ((m <= 3) && (t == 3)) { return readAddress(m); }
        if (m == 4 && t == 3) { return CONT_NEXT_M; }
        if (m == 5 && t == 3) { return CONT_END; }
        break;

    case Pla::OP_LD_RP_NNI:
        if (m1_end) { return CONT_NEXT_M; }
        if ((m <= 3) && (t == 3)) { return readAddress(m); }
        if (m == 4 && t == 3) {
            dataToReg(RegFile::lowOf(rp));
            return CONT_NEXT_M;
        }
        if (m == 5 && t == 3) {
            dataToReg(RegFile::highOf(rp));
            return CONT_END;
        }
        break;

    case Pla::OP_LD_NN_A:
        if (m1_end) { return CONT_NEXT_M; }
        if ((m <= 3) && (t == 3)) { return readAddress(m); }
        if (m == 4 && t == 3) {
            const uint8 a = reg8(RegFile::R8_A);
            m_regs.write16(RegFile::RP_WZ, static_cast<uint16>(
                                (a << 8) | ((reg16(RegFile::RP_WZ) + 1) & 0xFF)));
            return CONT_END;
        }
        break;

    case Pla::OP_LD_R_R:
        if (m1_end) {
            regToReg(static_cast<RegFile::reg8_t>(m_dec.r),
                     static_cast<RegFile::reg8_t>(m_dec.r2));
            return CONT_END;
        }
        break;

    case Pla::OP_LD_R_M:
        if (m1_end) { return CONT_NEXT_M; }
        if (s == 2 && t == 3) {
            dataToReg(static_cast<RegFile::reg8_t>(m_dec.r));
            return CONT_END;
        }
        break;

    case Pla::OP_LD_M_R:
        if (m1_end) { return CONT_NEXT_M; }
        if (s == 2 && t == 3) { return CONT_END; }
        break;

    case Pla::OP_ALU_R:
        if (m1_end) {
            accumulate(alu, reg8(m_dec.r2));
            return CONT_END;
        }
        break;

    case Pla::OP_ALU_M:
    case Pla::OP_ALU_N:
        if (m1_end) { return CONT_NEXT_M; }
        if (s == 2 && t == 3) {
            accumulate(alu, dataToAlu());
            return CONT_END;
        }
        break;

    case Pla::OP_RET_CC:
        if (m1_end) {
            return condition(m_dec.cc) ? CONT_NEXT_M : CONT_END;
        }
        return fallReturn(m, t);

    case Pla::OP_RET:
    case Pla::OP_RETN:
        if (m1_end) { return CONT_NEXT_M; }
        return fallReturn(m, t);

    case Pla::OP_POP:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) {
            dataToReg(RegFile::lowOf(rp));
            return CONT_NEXT_M;
        }
        if (m == 3 && t == 3) {
            dataToReg(RegFile::highOf(rp));
            return CONT_END;
        }
        break;

    case Pla::OP_PUSH:
        if (m1_end) {
            m_regs.write16(RegFile::RP_SP, m_latch.incDec(DEC));
            return CONT_NEXT_M;
        }
        if (m == 2 && t == 3) { return CONT_NEXT_M; }
        if (m == 3 && t == 3) { return CONT_END; }
        break;

    case Pla::OP_JP:
    case Pla::OP_JP_CC:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) { return readAddress(m); }
        if (m == 3 && t == 3) {
            dataToReg(RegFile::R8_W);
            if ((op == Pla::OP_JP) || condition(m_dec.cc)) {
                m_jump_rp = RegFile::RP_WZ;
            }
            return CONT_END;
        }
        break;

    case Pla::OP_CALL:
    case Pla::OP_CALL_CC:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) { return readAddress(m); }
        if (m == 3 && t == 3) {
            dataToReg(RegFile::R8_W);
            const bool taken = (op == Pla::OP_CALL) || condition(m_dec.cc);
            if (taken) {
                m_cyc.tlen = 4;
                return CONT_STAY;
            }
            return CONT_END;
        }
        if (m == 3 && t == 4) {
            m_regs.write16(RegFile::RP_SP, m_latch.incDec(DEC));
            return CONT_NEXT_M;
        }
        if (m == 4 && t == 3) { return CONT_NEXT_M; }
        if (m == 5 && t == 3) {
            m_jump_rp = RegFile::RP_WZ;
            return CONT_END;
        }
        break;

    case Pla::OP_RST:
    case Pla::OP_NMI:
        if (m1_end) {
            m_regs.write16(RegFile::RP_SP, m_latch.incDec(DEC));
            return CONT_NEXT_M;
        }
        if (m == 2 && t == 3) { return CONT_NEXT_M; }
        if (m == 3 && t == 3) {
            const uint16 target = static_cast<uint16>((op == Pla::OP_NMI) ? 0x0066 : (m_dec.n * 8));
            m_regs.write16(RegFile::RP_WZ, target);
            m_jump_rp = RegFile::RP_WZ;
            return CONT_END;
        }
        break;

    case Pla::OP_IM2:
        if (m == 1 && t == 4) {
            dataToReg(RegFile::R8_Z);       // the vector
            return CONT_STAY;
        }
        if (m1_end) {
            m_regs.write16(RegFile::RP_SP, m_latch.incDec(DEC));
            return CONT_NEXT_M;
        }
        if (m == 2 && t == 3) { return CONT_NEXT_M; }
        if (m == 3 && t == 3) {
            regToReg(RegFile::R8_W, RegFile::R8_I);
            return CONT_NEXT_M;
        }
        if (m == 4 && t == 3) {
            dataToReg(RegFile::R8_PCL);
            return CONT_NEXT_M;
        }
        if (m == 5 && t == 3) {
            const uint8 hi = m_route.route(BusRouter::SRC_DLATCH, m_dlatch,
                                           BusRouter::SEG_DB, BusRouter::SEG_REG);
            m_regs.write16(RegFile::RP_WZ, static_cast<uint16>(
                                (hi << 8) | reg8(RegFile::R8_PCL)));
            m_jump_rp = RegFile::RP_WZ;
            return CONT_END;
        }
        break;

    case Pla::OP_OUT_N_A:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) {
            dataToReg(RegFile::R8_Z);
            return CONT_NEXT_M;
        }
        if (m == 3 && t == 3) {
            const uint8 a = reg8(RegFile::R8_A);
            m_regs.write16(RegFile::RP_WZ, static_cast<uint16>(
                                (a << 8) | ((reg8(RegFile::R8_Z) + 1) & 0xFF)));
            return CONT_END;
        }
        break;

    case Pla::OP_IN_A_N:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) {
            dataToReg(RegFile::R8_Z);
            return CONT_NEXT_M;
        }
        if (m == 3 && t == 3) {
            dataToReg(RegFile::R8_A);
            return CONT_END;
        }
        break;

    case Pla::OP_EX_SP_RP:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) {
            dataToReg(RegFile::R8_Z);
            return CONT_NEXT_M;
        }
        if (m == 3 && t == 3) {
            dataToReg(RegFile::R8_W);
            return CONT_STAY;
        }
        if (m == 3 && t == 4) { return CONT_NEXT_M; }
        if (m == 4 && t == 3) { return CONT_NEXT_M; }
        if (m == 5 && t == 5) {
            m_regs.write16(rp, reg16(RegFile::RP_WZ));
            return CONT_END;
        }
        break;

    case Pla::OP_JP_RP:
        if (m1_end) {
            m_jump_rp = m_dec.rp;
            return CONT_END;
        }
        break;

    case Pla::OP_PREFIX_DD:
    case Pla::OP_PREFIX_FD:
    case Pla::OP_PREFIX_ED:
        if (m1_end) {
            m_prefix.idx   = (op == Pla::OP_PREFIX_DD) ? Pla::IDX_IX
                           : (op == Pla::OP_PREFIX_FD) ? Pla::IDX_IY
                                                       : Pla::IDX_HL;
            m_prefix.table = (op == Pla::OP_PREFIX_ED) ? Pla::TBL_ED : Pla::TBL_MAIN;
            return CONT_PREFIX;
        }
        break;

    case Pla::OP_PREFIX_CB:
        if (m1_end) {
            m_prefix.table = Pla::TBL_CB;
            // DD CB d op reads the displacement before the opcode
            return (m_prefix.idx == Pla::IDX_HL) ? CONT_PREFIX : CONT_NEXT_M;
        }
        if (m == 2 && t == 3) {
            dataToReg(RegFile::R8_Z);
            return CONT_NEXT_M;
        }
        if (m == 3 && t == 5) {
            // the opcode goes to the instruction register, not the internal
            // bus, and R doesn't count it
            m_opcode = m_dlatch;
            m_dec = Pla::decode(m_opcode, m_prefix);
            m_regs.write16(RegFile::RP_WZ, indexAddress());
            return CONT_NEXT_M;
        }
        break;

    case Pla::OP_CB_R:
        if (m1_end) {
            const Alu::result_t res = Alu::exec(alu, reg8(m_dec.r), 0, flags(), m_dec.n);
            if (cbSetsFlags(alu)) {
                setFlags(res.flags);
            }
            writeBack(static_cast<RegFile::reg8_t>(m_dec.r), res.value);
            return CONT_END;
        }
        break;

    case Pla::OP_CB_BIT_R: {
        if (m1_end) {
            const uint8 v = reg8(m_dec.r);
            setFlags(Alu::exec(Alu::ALU_BIT, v, v, flags(), m_dec.n).flags);
            return CONT_END;
        }
        break;
    }

    case Pla::OP_IN_R_C:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) {
            const uint8 v = (m_dec.r != Pla::NO_REG)
                          ? dataToReg(static_cast<RegFile::reg8_t>(m_dec.r))
                          : dataToAlu();
            setFlags(Alu::inFlags(flags(), v));
            return CONT_END;
        }
        break;

    case Pla::OP_OUT_C_R:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) { return CONT_END; }
        break;

    case Pla::OP_LD_I_A:
    case Pla::OP_LD_R_A:
        if (m1_end) {
            regToReg((op == Pla::OP_LD_I_A) ? RegFile::R8_I : RegFile::R8_R,
                     RegFile::R8_A);
            return CONT_END;
        }
        break;

    case Pla::OP_LD_A_I:
    case Pla::OP_LD_A_R:
        if (m1_end) {
            const uint8 v = regToReg(RegFile::R8_A,
                                     (op == Pla::OP_LD_A_I) ? RegFile::R8_I : RegFile::R8_R);
            setFlags(Alu::ldAirFlags(flags(), v, m_ictl.iff2()));
            return CONT_END;
        }
        break;

    case Pla::OP_RRD:
    case Pla::OP_RLD:
        if (m1_end) { return CONT_NEXT_M; }
        if (m == 2 && t == 3) {
            m_alu.setResult(dataToAlu());
            return CONT_NEXT_M;
        }
        if (m == 3 && t == 2) {
            uint8 mem = 0;
            const Alu::result_t res = Alu::rotateDigit(op == Pla::OP_RLD, m_alu.acc(),
                                                       m_alu.result(), flags(), &mem);
            setFlags(res.flags);
            writeBack(RegFile::R8_A, res.value);
            m_alu.setResult(mem);
            return CONT_STAY;
        }
        if (m == 3 && t == 4) { return CONT_NEXT_M; }
        if (m == 4 && t == 3) { return CONT_END; }
        break;

    case Pla::OP_BLOCK_LD:
    case Pla::OP_BLOCK_CP:
    case Pla::OP_BLOCK_IN:
    case Pla::OP_BLOCK_OUT:
        return fallBlock(m, t);

    default:
        break;
    }

    return CONT_STAY;
}


// M2: displacement into Z.  M3: WZ = IX/IY + d.
CpuZ80::cont_t
CpuZ80::fallIndexed(int m, int t)
{
    if (m == 2 && t == 3) {
        dataToReg(RegFile::R8_Z);
        return CONT_NEXT_M;
    }
    if (m == 3 && t == 5) {
        m_regs.write16(RegFile::RP_WZ, indexAddress());
        return CONT_NEXT_M;
    }
    return CONT_STAY;
}


// ADD HL,rp; ADC HL,rp; SBC HL,rp.  the low byte in M2, the high byte in
// M3, each result parked in the write-back latch.
CpuZ80::cont_t
CpuZ80::fallAddHl(int m, int t)
{
    const Pla::op_t op = m_dec.op;
    const RegFile::rp_t dst = static_cast<RegFile::rp_t>(m_dec.rp);
    const RegFile::rp_t src = static_cast<RegFile::rp_t>(m_dec.rp2);

    if ((m == 1) && (t == m_dec.m1_len)) {
        return CONT_NEXT_M;
    }

    if (m == 2 && t == 1) {
        m_regs.write16(RegFile::RP_WZ, static_cast<uint16>(reg16(dst) + 1));
        return CONT_STAY;
    }

    if (m == 2 && t == 4) {
        const Alu::op_t lo_op = (op == Pla::OP_ADD_HL) ? Alu::ALU_ADD
                              : (op == Pla::OP_ADC_HL) ? Alu::ALU_ADC
                                                       : Alu::ALU_SBC;
        const Alu::result_t lo = Alu::exec(lo_op, reg8(RegFile::lowOf(dst)),
                                           reg8(RegFile::lowOf(src)), flags());
        m_lowflags = lo.flags;
        writeBack(RegFile::lowOf(dst), lo.value);
        return CONT_NEXT_M;
    }

    if (m == 3 && t == 3) {
        const Alu::op_t hi_op = (op == Pla::OP_SBC_HL) ? Alu::ALU_SBC : Alu::ALU_ADC;
        const Alu::result_t hi = Alu::exec(hi_op, reg8(RegFile::highOf(dst)),
                                           reg8(RegFile::highOf(src)), m_lowflags);
        uint8 f;
        if (op == Pla::OP_ADD_HL) {
            // S, Z and P/V are not affected
            f = static_cast<uint8>(
                    (flags() & (Alu::SF | Alu::ZF | Alu::PF)) |
                    (hi.flags & (Alu::YF | Alu::XF | Alu::HF | Alu::CF)));
        } else {
            // zero means all sixteen bits are zero
            f = static_cast<uint8>(hi.flags & ~Alu::ZF);
            if ((hi.flags & Alu::ZF) && (m_lowflags & Alu::ZF)) {
                f |= Alu::ZF;
            }
        }
        setFlags(f);
        writeBack(RegFile::highOf(dst), hi.value);
        return CONT_END;
    }

    return CONT_STAY;
}


// RET, RET cc, RETN: pop into WZ and jump through it
CpuZ80::cont_t
CpuZ80::fallReturn(int m, int t)
{
    if (m == 2 && t == 3) {
        dataToReg(RegFile::R8_Z);
        return CONT_NEXT_M;
    }
    if (m == 3 && t == 3) {
        dataToReg(RegFile::R8_W);
        m_jump_rp = RegFile::RP_WZ;
        if (m_dec.op == Pla::OP_RETN) {
            m_ictl.retn();
        }
        return CONT_END;
    }
    return CONT_STAY;
}


CpuZ80::cont_t
CpuZ80::fallBlock(int m, int t)
{
    const Pla::op_t op = m_dec.op;

    if ((m == 1) && (t == m_dec.m1_len)) {
        if (op == Pla::OP_BLOCK_OUT) {
            writeBack(RegFile::R8_B, static_cast<uint8>(reg8(RegFile::R8_B) - 1));
        }
        return CONT_NEXT_M;
    }

    // the repeat cycle backs PC up to the ED prefix
    if (m == 4) {
        if (t == 4) {
            m_regs.write16(RegFile::RP_WZ, static_cast<uint16>(m_insn_pc + 1));
        } else if (t == 5) {
            m_regs.write16(RegFile::RP_PC, m_insn_pc);
            return CONT_END;
        }
        return CONT_STAY;
    }

    switch (op) {

    case Pla::OP_BLOCK_LD:
        if (m == 2 && t == 3) { return CONT_NEXT_M; }
        if (m == 3 && t == 4) {
            m_regs.write16(RegFile::RP_BC, m_latch.incDec(DEC));
        } else if (m == 3 && t == 5) {
            const bool bc_nz = (reg16(RegFile::RP_BC) != 0);
            setFlags(Alu::ldiFlags(flags(), reg8(RegFile::R8_A), m_dlatch, bc_nz));
            return (m_dec.repeat && bc_nz) ? CONT_NEXT_M : CONT_END;
        }
        break;

    case Pla::OP_BLOCK_CP:
        if (m == 2 && t == 3) {
            m_alu.setResult(dataToAlu());
            return CONT_NEXT_M;
        }
        if (m == 3 && t == 2) {
            m_regs.write16(RegFile::RP_BC, m_latch.incDec(DEC));
        } else if (m == 3 && t == 3) {
            const uint16 wz = reg16(RegFile::RP_WZ);
            m_regs.write16(RegFile::RP_WZ, static_cast<uint16>(
                                (m_dec.dec) ? (wz - 1) : (wz + 1)));
        } else if (m == 3 && t == 5) {
            const bool bc_nz = (reg16(RegFile::RP_BC) != 0);
            const uint8 f = Alu::cpiFlags(flags(), reg8(RegFile::R8_A),
                                          m_alu.result(), bc_nz);
            setFlags(f);
            const bool again = m_dec.repeat && bc_nz && !(f & Alu::ZF);
            return (again) ? CONT_NEXT_M : CONT_END;
        }
        break;

    case Pla::OP_BLOCK_IN:
        if (m == 2 && t == 3) { return CONT_NEXT_M; }
        if (m == 3 && t == 3) {
            const uint8 b = static_cast<uint8>(reg8(RegFile::R8_B) - 1);
            const uint8 c = reg8(RegFile::R8_C);
            const int k = m_dlatch + ((m_dec.dec ? (c - 1) : (c + 1)) & 0xFF);
            setFlags(Alu::ioBlockFlags(b, m_dlatch, k));
            writeBack(RegFile::R8_B, b);
            return (m_dec.repeat && (b != 0)) ? CONT_NEXT_M : CONT_END;
        }
        break;

    case Pla::OP_BLOCK_OUT:
    default:
        if (m == 2 && t == 3) { return CONT_NEXT_M; }
        if (m == 3 && t == 3) {
            // L has already stepped
            const uint8 b = reg8(RegFile::R8_B);
            const int k = m_dlatch + reg8(RegFile::R8_L);
            setFlags(Alu::ioBlockFlags(b, m_dlatch, k));
            return (m_dec.repeat && (b != 0)) ? CONT_NEXT_M : CONT_END;
        }
        break;
    }

    return CONT_STAY;
}


// ------------------------------------------------------------------------
// shared pieces of the matrix
// ------------------------------------------------------------------------

// the two operand bytes of a 16 bit address, low one into Z
CpuZ80::cont_t
CpuZ80::readAddress(int m)
{
    dataToReg((m == 2) ? RegFile::R8_Z : RegFile::R8_W);
    return CONT_NEXT_M;
}


// the 5 T cycle of JR and DJNZ: WZ = PC + d, and jump through it
CpuZ80::cont_t
CpuZ80::relativeJump()
{
    const int8 d = static_cast<int8>(reg8(RegFile::R8_Z));
    m_regs.write16(RegFile::RP_WZ, static_cast<uint16>(reg16(RegFile::RP_PC) + d));
    m_jump_rp = RegFile::RP_WZ;
    return CONT_END;
}


// IX+d or IY+d, with d in Z
uint16
CpuZ80::indexAddress() const noexcept
{
    const RegFile::rp_t idx = (m_prefix.idx == Pla::IDX_IY) ? RegFile::RP_IY
                                                            : RegFile::RP_IX;
    const int8 d = static_cast<int8>(reg8(RegFile::R8_Z));
    return static_cast<uint16>(reg16(idx) + d);
}


// an accumulator ALU operation; CP only changes the flags
void
CpuZ80::accumulate(Alu::op_t op, uint8 operand)
{
    const Alu::result_t res = Alu::exec(op, m_alu.acc(), operand, flags());
    setFlags(res.flags);
    if (op != Alu::ALU_CP) {
        writeBack(RegFile::R8_A, res.value);
    }
}


// ------------------------------------------------------------------------
// machine cycle helpers
// ------------------------------------------------------------------------

void
CpuZ80::busCycle(mcycle_t kind, int tlen, uint8 addr_rp,
                 uint8 post_rp, AddressLatch::incdec_t op)
{
    m_cyc.kind     = kind;
    m_cyc.tlen     = tlen;
    m_cyc.autowait = (kind == MC_IORD || kind == MC_IOWR) ? 1 : 0;
    m_cyc.addr_rp  = addr_rp;
    m_cyc.addr     = 0x0000;
    m_cyc.post_rp  = post_rp;
    m_cyc.postop   = op;
}


void
CpuZ80::busCycleAbs(mcycle_t kind, int tlen, uint16 addr,
                    uint8 post_rp, AddressLatch::incdec_t op)
{
    busCycle(kind, tlen, ADDR_ABS, post_rp, op);
    m_cyc.addr = addr;
}


void
CpuZ80::internalCycle(int tlen)
{
    busCycle(MC_INTERNAL, tlen, ADDR_ABS);
}


// operand byte at PC, PC advancing
void
CpuZ80::readPc(int tlen)
{
    busCycle(MC_MEMRD, tlen, RegFile::RP_PC, RegFile::RP_PC, INC);
}


// ------------------------------------------------------------------------
// datapath helpers
// ------------------------------------------------------------------------

// put a byte in the data output latch
void
CpuZ80::driveData(BusRouter::src_t src, uint8 value)
{
    const BusRouter::seg_t from = (src == BusRouter::SRC_REGS) ? BusRouter::SEG_REG
                                : (src == BusRouter::SRC_ALU)  ? BusRouter::SEG_ALU
                                                               : BusRouter::SEG_DB;
    m_dout = m_route.route(src, value, from, BusRouter::SEG_DB);
}


// the ALU result to the data output latch and to a register, in one round
void
CpuZ80::driveDataCopy(uint8 value, RegFile::reg8_t copy)
{
    m_route.propose(BusRouter::SEG_ALU, BusRouter::SRC_ALU, value);
    m_route.connect(BusRouter::SW_DB_ALU | BusRouter::SW_ALU_REG);
    m_route.commit();
    m_dout = m_route.read(BusRouter::SEG_DB);
    m_regs.write8(copy, m_route.read(BusRouter::SEG_REG));
}


uint8
CpuZ80::dataToReg(RegFile::reg8_t r)
{
    const uint8 v = m_route.route(BusRouter::SRC_DLATCH, m_dlatch,
                                  BusRouter::SEG_DB, BusRouter::SEG_REG);
    m_regs.write8(r, v);
    return v;
}


uint8
CpuZ80::dataToAlu()
{
    return m_route.route(BusRouter::SRC_DLATCH, m_dlatch,
                         BusRouter::SEG_DB, BusRouter::SEG_ALU);
}


uint8
CpuZ80::regToReg(RegFile::reg8_t dst, RegFile::reg8_t src)
{
    const uint8 v = m_route.route(BusRouter::SRC_REGS, m_regs.read8(src),
                                  BusRouter::SEG_REG, BusRouter::SEG_REG);
    m_regs.write8(dst, v);
    return v;
}


void
CpuZ80::writeBack(RegFile::reg8_t r, uint8 value) noexcept
{
    m_wb.valid = true;
    m_wb.reg   = r;
    m_wb.value = value;
}


void
CpuZ80::setFlags(uint8 f)
{
    m_regs.write8(RegFile::R8_F, f);
}


uint8
CpuZ80::flags() const noexcept
{
    return m_regs.read8(RegFile::R8_F);
}


uint8
CpuZ80::reg8(uint8 r) const noexcept
{
    return m_regs.read8(static_cast<RegFile::reg8_t>(r));
}


uint16
CpuZ80::reg16(uint8 rp) const noexcept
{
    return m_regs.read16(static_cast<RegFile::rp_t>(rp));
}


// NZ Z NC C PO PE P M
bool
CpuZ80::condition(int cc) const noexcept
{
    const uint8 f = flags();
    switch (cc & 7) {
        case 0:  return !(f & Alu::ZF);
        case 1:  return  (f & Alu::ZF) != 0;
        case 2:  return !(f & Alu::CF);
        case 3:  return  (f & Alu::CF) != 0;
        case 4:  return !(f & Alu::PF);
        case 5:  return  (f & Alu::PF) != 0;
        case 6:  return !(f & Alu::SF);
        default: return  (f & Alu::SF) != 0;
    }
}


// the pair addressing the memory operand: HL, or WZ holding IX/IY + d
uint8
CpuZ80::memRp() const noexcept
{
    return (m_dec.indexed) ? static_cast<uint8>(RegFile::RP_WZ)
                           : static_cast<uint8>(RegFile::RP_HL);
}

// vim: ts=8:et:sw=4:smarttab
