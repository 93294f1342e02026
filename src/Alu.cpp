// 8 bit ALU and flag generation

#include "Alu.h"

namespace {

// sign, zero, and the two undocumented bits, all from the same byte
inline uint8
szxy(uint8 v) noexcept
{
    uint8 f = v & (Alu::SF | Alu::YF | Alu::XF);
    if (v == 0) {
        f |= Alu::ZF;
    }
    return f;
}

// same, plus parity into PF
inline uint8
szxyp(uint8 v) noexcept
{
    return szxy(v) | (Alu::parity(v) ? Alu::PF : 0);
}

Alu::result_t
add8(uint8 a, uint8 b, int cin) noexcept
{
    const int r  = a + b + cin;
    const uint8 r8 = static_cast<uint8>(r);
    uint8 f = szxy(r8);
    f |= (a ^ b ^ r) & Alu::HF;
    if (((a ^ r) & (b ^ r) & 0x80) != 0) {
        f |= Alu::PF;   // overflow
    }
    if (r & 0x100) {
        f |= Alu::CF;
    }
    return { r8, f };
}

Alu::result_t
sub8(uint8 a, uint8 b, int cin) noexcept
{
    const int r  = a - b - cin;
    const uint8 r8 = static_cast<uint8>(r);
    uint8 f = szxy(r8) | Alu::NF;
    f |= (a ^ b ^ r) & Alu::HF;
    if (((a ^ b) & (a ^ r) & 0x80) != 0) {
        f |= Alu::PF;   // overflow
    }
    if (r & 0x100) {
        f |= Alu::CF;   // borrow
    }
    return { r8, f };
}

// CB table shifts and rotates
Alu::result_t
shift(Alu::op_t op, uint8 v, uint8 f) noexcept
{
    const int cin = f & Alu::CF;
    int r, c;
    switch (op) {
        case Alu::ALU_RLC: r = (v << 1) | (v >> 7);   c = v >> 7; break;
        case Alu::ALU_RRC: r = (v >> 1) | (v << 7);   c = v & 1;  break;
        case Alu::ALU_RL:  r = (v << 1) | cin;        c = v >> 7; break;
        case Alu::ALU_RR:  r = (v >> 1) | (cin << 7); c = v & 1;  break;
        case Alu::ALU_SLA: r = (v << 1);              c = v >> 7; break;
        case Alu::ALU_SRA: r = (v >> 1) | (v & 0x80); c = v & 1;  break;
        case Alu::ALU_SLL: r = (v << 1) | 1;          c = v >> 7; break;
        case Alu::ALU_SRL:
        default:           r = (v >> 1);              c = v & 1;  break;
    }
    const uint8 r8 = static_cast<uint8>(r);
    return { r8, static_cast<uint8>(szxyp(r8) | (c ? Alu::CF : 0)) };
}

// the four single byte accumulator rotates leave S, Z and P alone
Alu::result_t
rotateAcc(Alu::op_t op, uint8 a, uint8 f) noexcept
{
    const int cin = f & Alu::CF;
    int r, c;
    switch (op) {
        case Alu::ALU_RLCA: r = (a << 1) | (a >> 7);   c = a >> 7; break;
        case Alu::ALU_RRCA: r = (a >> 1) | (a << 7);   c = a & 1;  break;
        case Alu::ALU_RLA:  r = (a << 1) | cin;        c = a >> 7; break;
        case Alu::ALU_RRA:
        default:            r = (a >> 1) | (cin << 7); c = a & 1;  break;
    }
    const uint8 r8 = static_cast<uint8>(r);
    uint8 nf = (f & (Alu::SF | Alu::ZF | Alu::PF))
             | (r8 & (Alu::YF | Alu::XF))
             | (c ? Alu::CF : 0);
    return { r8, nf };
}

Alu::result_t
daa(uint8 a, uint8 f) noexcept
{
    uint8 diff = 0;
    bool carry = (f & Alu::CF) != 0;
    if ((f & Alu::HF) || ((a & 0x0F) > 9)) {
        diff = 0x06;
    }
    if (carry || (a > 0x99)) {
        diff |= 0x60;
        carry = true;
    }

    uint8 r;
    bool half;
    if (f & Alu::NF) {
        r = static_cast<uint8>(a - diff);
        half = (f & Alu::HF) && ((a & 0x0F) < 6);
    } else {
        r = static_cast<uint8>(a + diff);
        half = (a & 0x0F) > 9;
    }

    uint8 nf = szxyp(r) | (f & Alu::NF);
    if (half)  { nf |= Alu::HF; }
    if (carry) { nf |= Alu::CF; }
    return { r, nf };
}

} // namespace


bool
Alu::parity(uint8 v) noexcept
{
    v ^= v >> 4;
    v ^= v >> 2;
    v ^= v >> 1;
    return (v & 1) == 0;
}


Alu::result_t
Alu::exec(op_t op, uint8 a, uint8 b, uint8 f, int n) noexcept
{
    const int cin = f & CF;

    switch (op) {

        case ALU_ADD: return add8(a, b, 0);
        case ALU_ADC: return add8(a, b, cin);
        case ALU_SUB: return sub8(a, b, 0);
        case ALU_SBC: return sub8(a, b, cin);

        case ALU_AND: {
            const uint8 r = a & b;
            return { r, static_cast<uint8>(szxyp(r) | HF) };
        }
        case ALU_XOR: {
            const uint8 r = a ^ b;
            return { r, szxyp(r) };
        }
        case ALU_OR: {
            const uint8 r = a | b;
            return { r, szxyp(r) };
        }

        case ALU_CP: {
            // the result is thrown away; bits 5/3 come from the operand
            result_t res = sub8(a, b, 0);
            res.flags = (res.flags & ~(YF | XF)) | (b & (YF | XF));
            res.value = a;
            return res;
        }

        case ALU_RLC: case ALU_RRC: case ALU_RL:  case ALU_RR:
        case ALU_SLA: case ALU_SRA: case ALU_SLL: case ALU_SRL:
            return shift(op, a, f);

        case ALU_RLCA: case ALU_RRCA: case ALU_RLA: case ALU_RRA:
            return rotateAcc(op, a, f);

        case ALU_DAA:
            return daa(a, f);

        case ALU_CPL: {
            const uint8 r = ~a;
            uint8 nf = (f & (SF | ZF | PF | CF)) | HF | NF | (r & (YF | XF));
            return { r, nf };
        }

        case ALU_SCF: {
            uint8 nf = (f & (SF | ZF | PF)) | CF | (a & (YF | XF));
            return { a, nf };
        }

        case ALU_CCF: {
            uint8 nf = (f & (SF | ZF | PF)) | (a & (YF | XF));
            if (f & CF) {
                nf |= HF;       // H gets the old carry
            } else {
                nf |= CF;
            }
            return { a, nf };
        }

        case ALU_NEG:
            return sub8(0, a, 0);

        case ALU_INC: {
            const uint8 r = a + 1;
            uint8 nf = (f & CF) | szxy(r);
            if (r == 0x80)         { nf |= PF; }
            if ((r & 0x0F) == 0)   { nf |= HF; }
            return { r, nf };
        }

        case ALU_DEC: {
            const uint8 r = a - 1;
            uint8 nf = (f & CF) | szxy(r) | NF;
            if (r == 0x7F)            { nf |= PF; }
            if ((r & 0x0F) == 0x0F)   { nf |= HF; }
            return { r, nf };
        }

        case ALU_BIT: {
            const uint8 r = a & (1 << n);
            uint8 nf = (f & CF) | HF | (b & (YF | XF));
            if (r == 0) {
                nf |= ZF | PF;
            } else if (n == 7) {
                nf |= SF;
            }
            return { a, nf };
        }

        case ALU_RES:
            return { static_cast<uint8>(a & ~(1 << n)), f };

        case ALU_SET:
            return { static_cast<uint8>(a | (1 << n)), f };

        default:
            break;
    }

    assert(false);
    return { a, f };
}


// LDI/LDD/LDIR/LDDR.  PV reports BC != 0 after the decrement.
uint8
Alu::ldiFlags(uint8 f, uint8 a, uint8 value, bool bc_nz) noexcept
{
    const uint8 n = a + value;
    uint8 nf = (f & (SF | ZF | CF)) | (n & XF);
    if (n & 0x02) { nf |= YF; }
    if (bc_nz)    { nf |= PF; }
    return nf;
}


// CPI/CPD/CPIR/CPDR.  carry is preserved.
uint8
Alu::cpiFlags(uint8 f, uint8 a, uint8 value, bool bc_nz) noexcept
{
    const uint8 r = a - value;
    const uint8 h = (a ^ value ^ r) & HF;
    const uint8 n = r - (h ? 1 : 0);
    uint8 nf = (f & CF) | NF | h | (r & SF) | (n & XF);
    if (r == 0)   { nf |= ZF; }
    if (n & 0x02) { nf |= YF; }
    if (bc_nz)    { nf |= PF; }
    return nf;
}


// INI/IND/OUTI/OUTD and the repeating forms.  b is the already decremented
// B, value the byte that was moved, k the sum of value and either C+1, C-1
// (input forms) or the updated L (output forms).
uint8
Alu::ioBlockFlags(uint8 b, uint8 value, int k) noexcept
{
    uint8 nf = szxy(b);
    if (value & 0x80) {
        nf |= NF;
    }
    if (k > 0xFF) {
        nf |= HF | CF;
    }
    if (parity(static_cast<uint8>((k & 7) ^ b))) {
        nf |= PF;
    }
    return nf;
}


uint8
Alu::ldAirFlags(uint8 f, uint8 value, bool iff2) noexcept
{
    return (f & CF) | szxy(value) | (iff2 ? PF : 0);
}


uint8
Alu::inFlags(uint8 f, uint8 value) noexcept
{
    return (f & CF) | szxyp(value);
}


Alu::result_t
Alu::rotateDigit(bool left, uint8 a, uint8 m, uint8 f, uint8 *mem) noexcept
{
    uint8 na;
    if (left) {
        *mem = static_cast<uint8>((m << 4) | (a & 0x0F));
        na   = static_cast<uint8>((a & 0xF0) | (m >> 4));
    } else {
        *mem = static_cast<uint8>((a << 4) | (m >> 4));
        na   = static_cast<uint8>((a & 0xF0) | (m & 0x0F));
    }
    return { na, static_cast<uint8>((f & CF) | szxyp(na)) };
}

// vim: ts=8:et:sw=4:smarttab
