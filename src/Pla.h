// The decode PLA maps an opcode byte, qualified by the prefix state the
// sequencer has accumulated, onto an instruction class plus the operand
// fields the control matrix needs.  It is a pure function: every one of the
// 256 opcodes, under every prefix state, yields a valid entry.
//
// Register fields are already resolved to register file names, including
// the H/L -> IXH/IXL/IYH/IYL substitution made by a DD/FD prefix, and the
// (HL) -> (IX+d)/(IY+d) substitution, which is reported in 'indexed'.

#ifndef _INCLUDE_PLA_H_
#define _INCLUDE_PLA_H_

#include "z80cycle.h"

namespace Pla
{

// which register an HL reference means
enum index_t : uint8 { IDX_HL, IDX_IX, IDX_IY };

// which opcode table is active
enum table_t : uint8 { TBL_MAIN, TBL_CB, TBL_ED };

// interrupt service sequences ride on the fetch of a forced opcode
enum service_t : uint8 { SVC_NONE, SVC_NMI, SVC_IM2 };

struct prefix_t {
    index_t   idx;
    table_t   table;
    service_t svc;
};

// a prefix state with nothing pending
constexpr prefix_t NO_PREFIX = { IDX_HL, TBL_MAIN, SVC_NONE };

// instruction classes
enum op_t : uint8 {
    // ---- main table ----
    OP_NOP,
    OP_LD_RP_NN,        // LD rp,nn
    OP_LD_IND_A,        // LD (BC),A / LD (DE),A
    OP_LD_A_IND,        // LD A,(BC) / LD A,(DE)
    OP_INC_RP, OP_DEC_RP,
    OP_INC_R,  OP_DEC_R,
    OP_INC_M,  OP_DEC_M,
    OP_LD_R_N,
    OP_LD_M_N,
    OP_ALU_A,           // RLCA..CCF, NEG: accumulator-only ALU ops
    OP_EX_AF,
    OP_ADD_HL,          // ADD HL,rp (HL may be IX/IY)
    OP_DJNZ,
    OP_JR, OP_JR_CC,
    OP_LD_NN_RP,        // LD (nn),rp
    OP_LD_RP_NNI,       // LD rp,(nn)
    OP_LD_NN_A, OP_LD_A_NN,
    OP_HALT,
    OP_LD_R_R,
    OP_LD_R_M,
    OP_LD_M_R,
    OP_ALU_R, OP_ALU_M, OP_ALU_N,
    OP_RET_CC, OP_RET,
    OP_POP, OP_PUSH,
    OP_JP_CC, OP_JP,
    OP_CALL_CC, OP_CALL,
    OP_RST,
    OP_OUT_N_A, OP_IN_A_N,
    OP_EXX,
    OP_EX_SP_RP,
    OP_JP_RP,
    OP_EX_DE_HL,
    OP_DI, OP_EI,
    OP_LD_SP_RP,
    OP_PREFIX_CB, OP_PREFIX_ED, OP_PREFIX_DD, OP_PREFIX_FD,
    // ---- CB table ----
    OP_CB_R,            // rotate/shift/RES/SET on a register
    OP_CB_BIT_R,
    OP_CB_M,            // rotate/shift/RES/SET on (HL)/(IX+d), optional copy to r
    OP_CB_BIT_M,
    // ---- ED table ----
    OP_IN_R_C,          // IN r,(C); r == NO_REG for IN F,(C)
    OP_OUT_C_R,         // OUT (C),r; r == NO_REG for OUT (C),0
    OP_ADC_HL, OP_SBC_HL,
    OP_RETN,            // RETN and RETI
    OP_IM,
    OP_LD_I_A, OP_LD_R_A, OP_LD_A_I, OP_LD_A_R,
    OP_RRD, OP_RLD,
    OP_BLOCK_LD, OP_BLOCK_CP, OP_BLOCK_IN, OP_BLOCK_OUT,
    OP_ED_NOP,
    // ---- interrupt service ----
    OP_NMI,
    OP_IM2,
    NUM_OPS
};

// register field value meaning "none"
constexpr uint8 NO_REG = 0xFF;

struct decoded_t {
    op_t  op;
    uint8 r;            // destination 8b register (RegFile::reg8_t) or NO_REG
    uint8 r2;           // source 8b register or NO_REG
    uint8 rp;           // register pair (RegFile::rp_t)
    uint8 rp2;          // second register pair (ADD HL,rp source)
    uint8 alu;          // Alu::op_t
    uint8 cc;           // condition code, 0..7 = NZ Z NC C PO PE P M
    uint8 n;            // bit number, RST address/8, interrupt mode
    uint8 m1_len;       // T states of the M1 cycle that fetched the opcode
    bool  indexed;      // memory operand is (IX+d)/(IY+d)
    bool  dec;          // block op walks downward
    bool  repeat;       // block op repeats
};

// the decode function
decoded_t decode(uint8 opcode, const prefix_t &prefix) noexcept;

// mnemonic of an instruction class, for traces and test messages
const char *opName(op_t op) noexcept;

} // namespace Pla

#endif // _INCLUDE_PLA_H_

// vim: ts=8:et:sw=4:smarttab
