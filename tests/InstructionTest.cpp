// register, memory and flag results of individual instructions, including
// the undocumented flag bits and WZ

#include "Harness.h"

#include <gtest/gtest.h>

namespace {

// flags cleared, everything else as reset left it
z80regs_t
cleanRegs(Harness &h)
{
    z80regs_t r = h.regs();
    r.af = 0x0000;
    r.wz = 0x0000;
    r.sp = 0x8000;
    return r;
}

uint8 hi(uint16 w) { return static_cast<uint8>(w >> 8); }
uint8 lo(uint16 w) { return static_cast<uint8>(w); }

} // namespace


TEST(InstructionTest, AddHlHalfCarryFromBit11)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.hl = 0x0FFF;
    r.bc = 0x0001;
    h.setRegs(r);
    h.load(0x0000, { 0x09 });           // ADD HL,BC

    EXPECT_EQ(h.step(), 11);
    r = h.regs();
    EXPECT_EQ(r.hl, 0x1000);
    EXPECT_EQ(lo(r.af), 0x10);
    EXPECT_EQ(r.wz, 0x1000);
}


TEST(InstructionTest, SbcHlToZero)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.hl = 0x1234;
    r.de = 0x1234;
    h.setRegs(r);
    h.load(0x0000, { 0xED, 0x52 });     // SBC HL,DE

    EXPECT_EQ(h.step(), 15);
    r = h.regs();
    EXPECT_EQ(r.hl, 0x0000);
    EXPECT_EQ(lo(r.af), 0x42);
}


TEST(InstructionTest, AdcHlOverflow)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.hl = 0x7FFF;
    r.bc = 0x0001;
    h.setRegs(r);
    h.load(0x0000, { 0xED, 0x4A });     // ADC HL,BC

    EXPECT_EQ(h.step(), 15);
    r = h.regs();
    EXPECT_EQ(r.hl, 0x8000);
    EXPECT_EQ(lo(r.af), 0x94);
}


TEST(InstructionTest, IncKeepsCarry)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.af = 0xFF01;
    h.setRegs(r);
    h.load(0x0000, { 0x3C });           // INC A

    EXPECT_EQ(h.step(), 4);
    EXPECT_EQ(h.regs().af, 0x0051);
}


TEST(InstructionTest, DaaAfterAdd)
{
    Harness h;
    h.setRegs(cleanRegs(h));
    h.load(0x0000, { 0x3E, 0x15,        // LD A,15
                     0xC6, 0x27,        // ADD A,27
                     0x27 });           // DAA

    EXPECT_EQ(h.steps(3), 7 + 7 + 4);
    EXPECT_EQ(h.regs().af, 0x4214);
}


TEST(InstructionTest, Neg)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.af = 0x0100;
    h.setRegs(r);
    h.load(0x0000, { 0xED, 0x44 });     // NEG

    EXPECT_EQ(h.step(), 8);
    EXPECT_EQ(h.regs().af, 0xFFBB);
}


TEST(InstructionTest, LdAR)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.r = 0xFF;
    h.setRegs(r);
    h.load(0x0000, { 0xED, 0x5F });     // LD A,R

    EXPECT_EQ(h.step(), 9);
    r = h.regs();
    // bit 7 of R is left alone by the refresh counter
    EXPECT_EQ(r.r, 0x81);
    EXPECT_EQ(hi(r.af), 0x81);
    EXPECT_EQ(lo(r.af), 0x80);
}


TEST(InstructionTest, LdAICopiesIff2)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.i = 0x80;
    r.iff2 = true;
    h.setRegs(r);
    h.load(0x0000, { 0xED, 0x57 });     // LD A,I

    EXPECT_EQ(h.step(), 9);
    EXPECT_EQ(h.regs().af, 0x8084);
}


TEST(InstructionTest, LdIndirectBcSetsWz)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.af = 0x5500;
    r.bc = 0x30FF;
    h.setRegs(r);
    h.load(0x0000, { 0x02 });           // LD (BC),A

    EXPECT_EQ(h.step(), 7);
    EXPECT_EQ(h.bus().peek(0x30FF), 0x55);
    EXPECT_EQ(h.regs().wz, 0x5500);
}


TEST(InstructionTest, LdNnHl)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.hl = 0xBEEF;
    h.setRegs(r);
    h.load(0x0000, { 0x22, 0x00, 0x40 });   // LD (4000),HL

    EXPECT_EQ(h.step(), 16);
    EXPECT_EQ(h.bus().peek(0x4000), 0xEF);
    EXPECT_EQ(h.bus().peek(0x4001), 0xBE);
    EXPECT_EQ(h.regs().wz, 0x4001);
}


TEST(InstructionTest, Ldi)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.hl = 0x4000;
    r.de = 0x5000;
    r.bc = 0x0002;
    h.setRegs(r);
    h.bus().poke(0x4000, 0x5A);
    h.load(0x0000, { 0xED, 0xA0 });     // LDI

    EXPECT_EQ(h.step(), 16);
    r = h.regs();
    EXPECT_EQ(h.bus().peek(0x5000), 0x5A);
    EXPECT_EQ(r.hl, 0x4001);
    EXPECT_EQ(r.de, 0x5001);
    EXPECT_EQ(r.bc, 0x0001);
    // Y and X come from bits 1 and 3 of A plus the byte moved
    EXPECT_EQ(lo(r.af), 0x2C);
}


TEST(InstructionTest, CpirStopsOnMatch)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.af = 0x3300;
    r.hl = 0x4000;
    r.bc = 0x0004;
    h.setRegs(r);
    h.load(0x4000, { 0x11, 0x22, 0x33 });
    h.load(0x0000, { 0xED, 0xB1 });     // CPIR

    EXPECT_EQ(h.step(), 21);
    EXPECT_EQ(h.regs().pc, 0x0000);
    EXPECT_EQ(h.step(), 21);
    EXPECT_EQ(h.step(), 16);

    r = h.regs();
    EXPECT_EQ(r.pc, 0x0002);
    EXPECT_EQ(r.hl, 0x4003);
    EXPECT_EQ(r.bc, 0x0001);
    EXPECT_EQ(lo(r.af), 0x46);
    EXPECT_EQ(r.wz, 0x0002);
}


TEST(InstructionTest, Rld)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.af = 0x7A00;
    r.hl = 0x4000;
    h.setRegs(r);
    h.bus().poke(0x4000, 0x31);
    h.load(0x0000, { 0xED, 0x6F });     // RLD

    EXPECT_EQ(h.step(), 18);
    r = h.regs();
    EXPECT_EQ(h.bus().peek(0x4000), 0x1A);
    EXPECT_EQ(r.af, 0x7320);
    EXPECT_EQ(r.wz, 0x4001);
}


TEST(InstructionTest, ExSpHl)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.hl = 0xABCD;
    h.setRegs(r);
    h.load(0x8000, { 0x34, 0x12 });
    h.load(0x0000, { 0xE3 });           // EX (SP),HL

    EXPECT_EQ(h.step(), 19);
    r = h.regs();
    EXPECT_EQ(r.hl, 0x1234);
    EXPECT_EQ(r.wz, 0x1234);
    EXPECT_EQ(r.sp, 0x8000);
    EXPECT_EQ(h.bus().peek(0x8000), 0xCD);
    EXPECT_EQ(h.bus().peek(0x8001), 0xAB);
}


TEST(InstructionTest, CallAndReturn)
{
    Harness h;
    h.setRegs(cleanRegs(h));
    h.load(0x0000, { 0xCD, 0x00, 0x20 });   // CALL 2000
    h.load(0x2000, { 0xC9 });               // RET

    EXPECT_EQ(h.step(), 17);
    z80regs_t r = h.regs();
    EXPECT_EQ(r.pc, 0x2000);
    EXPECT_EQ(r.wz, 0x2000);
    EXPECT_EQ(r.sp, 0x7FFE);
    EXPECT_EQ(h.bus().peek(0x7FFE), 0x03);
    EXPECT_EQ(h.bus().peek(0x7FFF), 0x00);

    EXPECT_EQ(h.step(), 10);
    r = h.regs();
    EXPECT_EQ(r.pc, 0x0003);
    EXPECT_EQ(r.wz, 0x0003);
    EXPECT_EQ(r.sp, 0x8000);
}


TEST(InstructionTest, DjnzLoop)
{
    Harness h;
    h.setRegs(cleanRegs(h));
    h.load(0x0000, { 0x06, 0x03,        // LD B,3
                     0x10, 0xFE });     // DJNZ $

    EXPECT_EQ(h.step(), 7);
    EXPECT_EQ(h.step(), 13);
    EXPECT_EQ(h.regs().pc, 0x0002);
    EXPECT_EQ(h.step(), 13);
    EXPECT_EQ(h.step(), 8);
    const z80regs_t r = h.regs();
    EXPECT_EQ(r.pc, 0x0004);
    EXPECT_EQ(hi(r.bc), 0x00);
}


TEST(InstructionTest, PushPop)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.bc = 0x1357;
    h.setRegs(r);
    h.load(0x0000, { 0xC5, 0xE1 });     // PUSH BC; POP HL

    EXPECT_EQ(h.step(), 11);
    EXPECT_EQ(h.regs().sp, 0x7FFE);
    EXPECT_EQ(h.step(), 10);
    r = h.regs();
    EXPECT_EQ(r.hl, 0x1357);
    EXPECT_EQ(r.sp, 0x8000);
}


TEST(InstructionTest, ExchangesSwapBanks)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.af = 0x1111;  r.af_alt = 0x2222;
    r.bc = 0x3333;  r.bc_alt = 0x4444;
    r.de = 0x5555;  r.de_alt = 0x6666;
    r.hl = 0x7777;  r.hl_alt = 0x8888;
    h.setRegs(r);
    h.load(0x0000, { 0x08, 0xD9, 0xEB });   // EX AF,AF'; EXX; EX DE,HL

    EXPECT_EQ(h.steps(3), 12);
    r = h.regs();
    EXPECT_EQ(r.af, 0x2222);
    EXPECT_EQ(r.af_alt, 0x1111);
    EXPECT_EQ(r.bc, 0x4444);
    EXPECT_EQ(r.bc_alt, 0x3333);
    EXPECT_EQ(r.de, 0x8888);
    EXPECT_EQ(r.hl, 0x6666);
    EXPECT_EQ(r.de_alt, 0x5555);
    EXPECT_EQ(r.hl_alt, 0x7777);
}


TEST(InstructionTest, InRegisterFromC)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.bc = 0x1234;
    h.setRegs(r);
    h.bus().setInPort(0x34, 0x80);
    h.load(0x0000, { 0xED, 0x78 });     // IN A,(C)

    EXPECT_EQ(h.step(), 12);
    r = h.regs();
    EXPECT_EQ(r.af, 0x8080);
    EXPECT_EQ(r.wz, 0x1235);
}


TEST(InstructionTest, BitIndexedTakesXyFromAddress)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.ix = 0x2800;
    h.setRegs(r);
    h.bus().poke(0x2800, 0x01);
    h.load(0x0000, { 0xDD, 0xCB, 0x00, 0x46 });     // BIT 0,(IX+0)

    EXPECT_EQ(h.step(), 20);
    r = h.regs();
    EXPECT_EQ(lo(r.af), 0x38);
    EXPECT_EQ(r.wz, 0x2800);
}


// BIT n,(HL) has no address of its own to show, so X and Y come from
// whatever W holds
TEST(InstructionTest, BitMemoryTakesXyFromW)
{
    const uint16 wzs[] = { 0x2800, 0x0000 };
    for (const uint16 wz : wzs) {
        Harness h;
        z80regs_t r = cleanRegs(h);
        r.hl = 0x4000;
        r.wz = wz;
        h.setRegs(r);
        h.bus().poke(0x4000, 0x01);
        h.load(0x0000, { 0xCB, 0x46 }); // BIT 0,(HL)

        EXPECT_EQ(h.step(), 12);
        EXPECT_EQ(lo(h.regs().af), (wz) ? 0x38 : 0x10);
    }
}


TEST(InstructionTest, AddHlTakesXyFromHighByte)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.hl = 0x2700;
    r.bc = 0x0100;
    h.setRegs(r);
    h.load(0x0000, { 0x09 });           // ADD HL,BC

    EXPECT_EQ(h.step(), 11);
    r = h.regs();
    EXPECT_EQ(r.hl, 0x2800);
    EXPECT_EQ(lo(r.af), 0x28);
}


TEST(InstructionTest, IndexedRotateCopiesToRegister)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.ix = 0x3000;
    r.bc = 0x0000;
    h.setRegs(r);
    h.bus().poke(0x3005, 0x81);
    h.load(0x0000, { 0xDD, 0xCB, 0x05, 0x00 });     // RLC (IX+5),B

    EXPECT_EQ(h.step(), 23);
    r = h.regs();
    EXPECT_EQ(h.bus().peek(0x3005), 0x03);
    EXPECT_EQ(hi(r.bc), 0x03);
    EXPECT_EQ(lo(r.af), 0x05);
}


TEST(InstructionTest, IndexedLoadWithNegativeDisplacement)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.iy = 0x4010;
    h.setRegs(r);
    h.bus().poke(0x4000, 0xA5);
    h.load(0x0000, { 0xFD, 0x46, 0xF0 });   // LD B,(IY-16)

    EXPECT_EQ(h.step(), 19);
    r = h.regs();
    EXPECT_EQ(hi(r.bc), 0xA5);
    EXPECT_EQ(r.wz, 0x4000);
}


TEST(InstructionTest, IndexRegisterHalves)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.ix = 0x1234;
    r.hl = 0x5678;
    h.setRegs(r);
    h.load(0x0000, { 0xDD, 0x26, 0x42,      // LD IXH,42
                     0xDD, 0x7C });         // LD A,IXH

    EXPECT_EQ(h.step(), 11);
    EXPECT_EQ(h.regs().ix, 0x4234);
    EXPECT_EQ(h.step(), 8);
    r = h.regs();
    EXPECT_EQ(hi(r.af), 0x42);
    EXPECT_EQ(r.hl, 0x5678);
}


TEST(InstructionTest, IndexedLoadUsesRealH)
{
    Harness h;
    z80regs_t r = cleanRegs(h);
    r.ix = 0x3000;
    r.hl = 0x0000;
    h.setRegs(r);
    h.bus().poke(0x3002, 0x77);
    h.load(0x0000, { 0xDD, 0x66, 0x02 });   // LD H,(IX+2)

    EXPECT_EQ(h.step(), 19);
    r = h.regs();
    EXPECT_EQ(r.hl, 0x7700);
    EXPECT_EQ(r.ix, 0x3000);
}


TEST(InstructionTest, JrSetsWz)
{
    Harness h;
    h.setRegs(cleanRegs(h));
    h.load(0x0000, { 0x18, 0x02 });     // JR +2

    EXPECT_EQ(h.step(), 12);
    const z80regs_t r = h.regs();
    EXPECT_EQ(r.pc, 0x0004);
    EXPECT_EQ(r.wz, 0x0004);
}

// vim: ts=8:et:sw=4:smarttab
