// Opcode decode.
//
// The opcode byte is split the usual way:
//
//      7 6 | 5 4 3 | 2 1 0
//       x  |   y   |   z          y = p:q  (p = y>>1, q = y&1)
//
// and each table is a short case analysis on those fields.

#include "Pla.h"
#include "Alu.h"
#include "RegFile.h"

namespace Pla
{

namespace {

// opcode register field -> register file name, with the DD/FD substitution
// of H and L.  field 6 is the memory operand and has no register.
uint8
reg8(int field, index_t idx) noexcept
{
    static const uint8 plain[8] = {
        RegFile::R8_B, RegFile::R8_C, RegFile::R8_D, RegFile::R8_E,
        RegFile::R8_H, RegFile::R8_L, NO_REG,        RegFile::R8_A
    };
    if (field == 4 && idx == IDX_IX) { return RegFile::R8_IXH; }
    if (field == 5 && idx == IDX_IX) { return RegFile::R8_IXL; }
    if (field == 4 && idx == IDX_IY) { return RegFile::R8_IYH; }
    if (field == 5 && idx == IDX_IY) { return RegFile::R8_IYL; }
    return plain[field & 7];
}

// the pair HL stands for
uint8
hlPair(index_t idx) noexcept
{
    switch (idx) {
        case IDX_IX: return RegFile::RP_IX;
        case IDX_IY: return RegFile::RP_IY;
        case IDX_HL:
        default:     return RegFile::RP_HL;
    }
}

// register pair field, SP flavor (LD rp,nn; INC rp; ADD HL,rp; ...)
uint8
rpSp(int p, index_t idx) noexcept
{
    switch (p & 3) {
        case 0:  return RegFile::RP_BC;
        case 1:  return RegFile::RP_DE;
        case 2:  return hlPair(idx);
        default: return RegFile::RP_SP;
    }
}

// register pair field, AF flavor (PUSH/POP)
uint8
rpAf(int p, index_t idx) noexcept
{
    return ((p & 3) == 3) ? static_cast<uint8>(RegFile::RP_AF) : rpSp(p, idx);
}

decoded_t
blank(op_t op) noexcept
{
    decoded_t d;
    d.op      = op;
    d.r       = NO_REG;
    d.r2      = NO_REG;
    d.rp      = RegFile::RP_HL;
    d.rp2     = RegFile::RP_HL;
    d.alu     = Alu::ALU_ADD;
    d.cc      = 0;
    d.n       = 0;
    d.m1_len  = 4;
    d.indexed = false;
    d.dec     = false;
    d.repeat  = false;
    return d;
}


decoded_t
decodeMain(uint8 op, index_t idx) noexcept
{
    const int x = op >> 6;
    const int y = (op >> 3) & 7;
    const int z = op & 7;
    const int p = y >> 1;
    const int q = y & 1;
    const bool ix = (idx != IDX_HL);

    decoded_t d = blank(OP_NOP);

    switch (x) {

    case 0:
        switch (z) {
        case 0:
            switch (y) {
                case 0:  d.op = OP_NOP; break;
                case 1:  d.op = OP_EX_AF; break;
                case 2:  d.op = OP_DJNZ; d.m1_len = 5; break;
                case 3:  d.op = OP_JR; break;
                default: d.op = OP_JR_CC; d.cc = y - 4; break;
            }
            break;
        case 1:
            if (q == 0) {
                d.op = OP_LD_RP_NN;
                d.rp = rpSp(p, idx);
            } else {
                d.op  = OP_ADD_HL;
                d.rp  = hlPair(idx);
                d.rp2 = rpSp(p, idx);
            }
            break;
        case 2:
            switch (p) {
                case 0:
                case 1:
                    d.op = (q == 0) ? OP_LD_IND_A : OP_LD_A_IND;
                    d.rp = (p == 0) ? RegFile::RP_BC : RegFile::RP_DE;
                    break;
                case 2:
                    d.op = (q == 0) ? OP_LD_NN_RP : OP_LD_RP_NNI;
                    d.rp = hlPair(idx);
                    break;
                default:
                    d.op = (q == 0) ? OP_LD_NN_A : OP_LD_A_NN;
                    break;
            }
            break;
        case 3:
            d.op = (q == 0) ? OP_INC_RP : OP_DEC_RP;
            d.rp = rpSp(p, idx);
            d.m1_len = 6;
            break;
        case 4:
        case 5:
            if (y == 6) {
                d.op = (z == 4) ? OP_INC_M : OP_DEC_M;
                d.indexed = ix;
            } else {
                d.op = (z == 4) ? OP_INC_R : OP_DEC_R;
                d.r  = reg8(y, idx);
            }
            d.alu = (z == 4) ? Alu::ALU_INC : Alu::ALU_DEC;
            break;
        case 6:
            if (y == 6) {
                d.op = OP_LD_M_N;
                d.indexed = ix;
            } else {
                d.op = OP_LD_R_N;
                d.r  = reg8(y, idx);
            }
            break;
        default:
            d.op  = OP_ALU_A;
            d.alu = Alu::ALU_RLCA + y;
            break;
        }
        break;

    case 1:
        if (y == 6 && z == 6) {
            d.op = OP_HALT;
        } else if (y == 6) {
            // LD (HL),r: with an index prefix, r is never substituted
            d.op = OP_LD_M_R;
            d.r2 = reg8(z, IDX_HL);
            d.indexed = ix;
        } else if (z == 6) {
            d.op = OP_LD_R_M;
            d.r  = reg8(y, IDX_HL);
            d.indexed = ix;
        } else {
            d.op = OP_LD_R_R;
            d.r  = reg8(y, idx);
            d.r2 = reg8(z, idx);
        }
        break;

    case 2:
        d.alu = static_cast<uint8>(y);  // ALU_ADD..ALU_CP
        if (z == 6) {
            d.op = OP_ALU_M;
            d.indexed = ix;
        } else {
            d.op = OP_ALU_R;
            d.r2 = reg8(z, idx);
        }
        break;

    default:
        switch (z) {
        case 0:
            d.op = OP_RET_CC;
            d.cc = y;
            d.m1_len = 5;
            break;
        case 1:
            if (q == 0) {
                d.op = OP_POP;
                d.rp = rpAf(p, idx);
            } else {
                switch (p) {
                    case 0: d.op = OP_RET; break;
                    case 1: d.op = OP_EXX; break;
                    case 2: d.op = OP_JP_RP; d.rp = hlPair(idx); break;
                    default:
                        d.op = OP_LD_SP_RP;
                        d.rp = hlPair(idx);
                        d.m1_len = 6;
                        break;
                }
            }
            break;
        case 2:
            d.op = OP_JP_CC;
            d.cc = y;
            break;
        case 3:
            switch (y) {
                case 0: d.op = OP_JP; break;
                case 1: d.op = OP_PREFIX_CB; break;
                case 2: d.op = OP_OUT_N_A; break;
                case 3: d.op = OP_IN_A_N; break;
                case 4: d.op = OP_EX_SP_RP; d.rp = hlPair(idx); break;
                case 5: d.op = OP_EX_DE_HL; break;
                case 6: d.op = OP_DI; break;
                default: d.op = OP_EI; break;
            }
            break;
        case 4:
            d.op = OP_CALL_CC;
            d.cc = y;
            break;
        case 5:
            if (q == 0) {
                d.op = OP_PUSH;
                d.rp = rpAf(p, idx);
                d.m1_len = 5;
            } else {
                switch (p) {
                    case 0: d.op = OP_CALL; break;
                    case 1: d.op = OP_PREFIX_DD; break;
                    case 2: d.op = OP_PREFIX_ED; break;
                    default: d.op = OP_PREFIX_FD; break;
                }
            }
            break;
        case 6:
            d.op  = OP_ALU_N;
            d.alu = static_cast<uint8>(y);
            break;
        default:
            d.op = OP_RST;
            d.n  = static_cast<uint8>(y);
            d.m1_len = 5;
            break;
        }
        break;
    }

    return d;
}


decoded_t
decodeCb(uint8 op, index_t idx) noexcept
{
    const int x = op >> 6;
    const int y = (op >> 3) & 7;
    const int z = op & 7;

    decoded_t d = blank(OP_NOP);
    d.n = static_cast<uint8>(y);
    switch (x) {
        case 0:  d.alu = Alu::ALU_RLC + y; break;
        case 1:  d.alu = Alu::ALU_BIT; break;
        case 2:  d.alu = Alu::ALU_RES; break;
        default: d.alu = Alu::ALU_SET; break;
    }

    if (idx != IDX_HL) {
        // DD CB d op: always (IX+d); a register field other than 6 gets a
        // copy of the result.  H and L are never substituted here.
        d.indexed = true;
        if (x == 1) {
            d.op = OP_CB_BIT_M;
        } else {
            d.op = OP_CB_M;
            d.r  = reg8(z, IDX_HL);
        }
        return d;
    }

    if (z == 6) {
        d.op = (x == 1) ? OP_CB_BIT_M : OP_CB_M;
    } else {
        d.op = (x == 1) ? OP_CB_BIT_R : OP_CB_R;
        d.r  = reg8(z, IDX_HL);
    }
    return d;
}


decoded_t
decodeEd(uint8 op) noexcept
{
    const int x = op >> 6;
    const int y = (op >> 3) & 7;
    const int z = op & 7;
    const int p = y >> 1;
    const int q = y & 1;

    decoded_t d = blank(OP_ED_NOP);

    if (x == 1) {
        switch (z) {
        case 0:
            d.op = OP_IN_R_C;
            d.r  = reg8(y, IDX_HL);     // NO_REG for ED 70
            break;
        case 1:
            d.op = OP_OUT_C_R;
            d.r2 = reg8(y, IDX_HL);     // NO_REG for ED 71
            break;
        case 2:
            d.op  = (q == 0) ? OP_SBC_HL : OP_ADC_HL;
            d.rp  = RegFile::RP_HL;
            d.rp2 = rpSp(p, IDX_HL);
            break;
        case 3:
            d.op = (q == 0) ? OP_LD_NN_RP : OP_LD_RP_NNI;
            d.rp = rpSp(p, IDX_HL);
            break;
        case 4:
            d.op  = OP_ALU_A;
            d.alu = Alu::ALU_NEG;
            break;
        case 5:
            d.op = OP_RETN;
            break;
        case 6: {
            static const uint8 im[8] = { 0, 0, 1, 2, 0, 0, 1, 2 };
            d.op = OP_IM;
            d.n  = im[y];
            break;
        }
        default:
            switch (y) {
                case 0: d.op = OP_LD_I_A; d.m1_len = 5; break;
                case 1: d.op = OP_LD_R_A; d.m1_len = 5; break;
                case 2: d.op = OP_LD_A_I; d.m1_len = 5; break;
                case 3: d.op = OP_LD_A_R; d.m1_len = 5; break;
                case 4: d.op = OP_RRD; break;
                case 5: d.op = OP_RLD; break;
                default: d.op = OP_ED_NOP; break;
            }
            break;
        }
        return d;
    }

    if (x == 2 && z <= 3 && y >= 4) {
        static const op_t block[4] = {
            OP_BLOCK_LD, OP_BLOCK_CP, OP_BLOCK_IN, OP_BLOCK_OUT
        };
        d.op     = block[z];
        d.dec    = (y & 1) != 0;
        d.repeat = (y & 2) != 0;
        if (z >= 2) {
            d.m1_len = 5;
        }
        return d;
    }

    return d;   // everything else is an 8 T no-op
}

} // namespace


decoded_t
decode(uint8 opcode, const prefix_t &prefix) noexcept
{
    switch (prefix.svc) {
        case SVC_NMI: {
            decoded_t d = blank(OP_NMI);
            d.m1_len = 5;
            return d;
        }
        case SVC_IM2: {
            decoded_t d = blank(OP_IM2);
            d.m1_len = 5;
            return d;
        }
        case SVC_NONE:
        default:
            break;
    }

    switch (prefix.table) {
        case TBL_CB: return decodeCb(opcode, prefix.idx);
        case TBL_ED: return decodeEd(opcode);
        case TBL_MAIN:
        default:     return decodeMain(opcode, prefix.idx);
    }
}


const char *
opName(op_t op) noexcept
{
    static const char *names[NUM_OPS] = {
        "NOP", "LD rp,nn", "LD (rp),A", "LD A,(rp)", "INC rp", "DEC rp",
        "INC r", "DEC r", "INC (HL)", "DEC (HL)", "LD r,n", "LD (HL),n",
        "ALU A", "EX AF,AF'", "ADD HL,rp", "DJNZ", "JR", "JR cc",
        "LD (nn),rp", "LD rp,(nn)", "LD (nn),A", "LD A,(nn)", "HALT",
        "LD r,r", "LD r,(HL)", "LD (HL),r", "ALU r", "ALU (HL)", "ALU n",
        "RET cc", "RET", "POP", "PUSH", "JP cc", "JP", "CALL cc", "CALL",
        "RST", "OUT (n),A", "IN A,(n)", "EXX", "EX (SP),HL", "JP (HL)",
        "EX DE,HL", "DI", "EI", "LD SP,HL",
        "prefix CB", "prefix ED", "prefix DD", "prefix FD",
        "CB op r", "BIT n,r", "CB op (HL)", "BIT n,(HL)",
        "IN r,(C)", "OUT (C),r", "ADC HL,rp", "SBC HL,rp", "RETN", "IM",
        "LD I,A", "LD R,A", "LD A,I", "LD A,R", "RRD", "RLD",
        "LDI", "CPI", "INI", "OUTI", "ED nop",
        "NMI", "IM2"
    };
    return (op < NUM_OPS) ? names[op] : "???";
}

} // namespace Pla

// vim: ts=8:et:sw=4:smarttab
