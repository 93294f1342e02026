// The ALU is an 8 bit unit.  16 bit arithmetic (ADD/ADC/SBC HL,rr) is done
// in two passes, low byte then high byte, chaining the carry through the
// flag result of the first pass.
//
// Every operation returns the new value and a full flag byte.  Bits 5 and 3
// of the flag byte (YF, XF) are undocumented but deterministic: for most
// operations they are copies of the result, but some operation classes take
// them from a different "flag donor" byte:
//
//      CP              the operand, not the result
//      BIT n,r         the register being tested
//      BIT n,(HL)      the high byte of the internal WZ register
//      SCF/CCF         the accumulator
//      LDI/LDD         bits 3 and 1 of (A + transferred byte)
//      CPI/CPD         bits 3 and 1 of (A - byte - H)
//      ADD/ADC/SBC HL  the high byte of the result
//
// The ALU also has two latches:  the accumulator/flag prep latch loaded
// during T3 of every opcode fetch, and the result latch that can drive the
// internal data bus.

#ifndef _INCLUDE_ALU_H_
#define _INCLUDE_ALU_H_

#include "z80cycle.h"

class Alu
{
public:
    enum op_t : uint8 {
        // the eight accumulator operations, in opcode order
        ALU_ADD, ALU_ADC, ALU_SUB, ALU_SBC, ALU_AND, ALU_XOR, ALU_OR, ALU_CP,
        // the eight CB shifts/rotates, in opcode order
        ALU_RLC, ALU_RRC, ALU_RL,  ALU_RR,  ALU_SLA, ALU_SRA, ALU_SLL, ALU_SRL,
        // the eight 00-3F column 7 accumulator operations, in opcode order
        ALU_RLCA, ALU_RRCA, ALU_RLA, ALU_RRA, ALU_DAA, ALU_CPL, ALU_SCF, ALU_CCF,
        // everything else
        ALU_NEG, ALU_INC, ALU_DEC, ALU_BIT, ALU_RES, ALU_SET,
        NUM_ALU_OPS
    };

    // flag register bits
    enum : uint8 {
        SF = 0x80, ZF = 0x40, YF = 0x20, HF = 0x10,
        XF = 0x08, PF = 0x04, NF = 0x02, CF = 0x01
    };

    struct result_t {
        uint8 value;
        uint8 flags;
    };

    Alu() : m_acc(0xFF), m_result(0xFF) { };

    // run one operation.
    //   binary ops (ALU_ADD..ALU_CP): a is the accumulator, b the operand.
    //   unary ops: a is the operand, b is ignored.
    //   ALU_BIT/ALU_RES/ALU_SET: n is the bit number; for ALU_BIT, b is the
    //   flag donor for bits 5 and 3.
    //   f is the incoming flag byte (carry in, and flags left untouched).
    //   ALU_RES and ALU_SET return f unchanged.
    static result_t exec(op_t op, uint8 a, uint8 b, uint8 f, int n=0) noexcept;

    // flags of the block instructions
    static uint8 ldiFlags(uint8 f, uint8 a, uint8 value, bool bc_nz) noexcept;
    static uint8 cpiFlags(uint8 f, uint8 a, uint8 value, bool bc_nz) noexcept;
    static uint8 ioBlockFlags(uint8 b, uint8 value, int k) noexcept;

    // flags of LD A,I / LD A,R
    static uint8 ldAirFlags(uint8 f, uint8 value, bool iff2) noexcept;

    // flags of IN r,(C)
    static uint8 inFlags(uint8 f, uint8 value) noexcept;

    // RLD (left=true) and RRD.  returns the new accumulator and flags;
    // *mem gets the byte to write back.
    static result_t rotateDigit(bool left, uint8 a, uint8 m, uint8 f,
                                uint8 *mem) noexcept;

    // true if v has an even number of one bits
    static bool parity(uint8 v) noexcept;

    // ---- latches ----
    void  prepare(uint8 acc) noexcept              { m_acc = acc; }
    uint8 acc() const noexcept                     { return m_acc; }
    void  setResult(uint8 v) noexcept              { m_result = v; }
    uint8 result() const noexcept                  { return m_result; }

private:
    uint8 m_acc;        // accumulator prep latch
    uint8 m_result;     // result latch
};

#endif // _INCLUDE_ALU_H_

// vim: ts=8:et:sw=4:smarttab
