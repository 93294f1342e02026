// maskable and non-maskable interrupt service sequences

#include "Harness.h"

#include <gtest/gtest.h>

namespace {

// enable interrupts in the given mode, with SP somewhere harmless
void
enableInts(Harness &h, int mode, uint16 pc=0x0100)
{
    z80regs_t r = h.regs();
    r.iff1 = true;
    r.iff2 = true;
    r.im   = mode;
    r.sp   = 0x8000;
    r.pc   = pc;
    h.setRegs(r);
}

uint16
stackWord(Harness &h, uint16 addr)
{
    return static_cast<uint16>(h.bus().peek(addr) | (h.bus().peek(addr + 1) << 8));
}

} // namespace


TEST(InterruptTest, Mode1)
{
    Harness h;
    enableInts(h, 1);
    h.bus().setInt(true);

    EXPECT_EQ(h.step(), 4);             // the NOP at 0100 sees INT at its end
    EXPECT_EQ(h.step(), 13);            // acknowledge + RST 38

    const z80regs_t r = h.regs();
    EXPECT_EQ(r.pc, 0x0038);
    EXPECT_EQ(r.sp, 0x7FFE);
    EXPECT_EQ(stackWord(h, 0x7FFE), 0x0101);
    EXPECT_FALSE(r.iff1);
    EXPECT_FALSE(r.iff2);
    EXPECT_EQ(h.bus().intAcks(), 1);
    EXPECT_FALSE(h.bus().intPending());
}


TEST(InterruptTest, Mode0ExecutesTheSuppliedOpcode)
{
    Harness h;
    enableInts(h, 0);
    h.bus().setIntVector(0xFF);         // RST 38 from a floating bus
    h.bus().setInt(true);

    EXPECT_EQ(h.step(), 4);
    EXPECT_EQ(h.step(), 13);
    EXPECT_EQ(h.regs().pc, 0x0038);
    EXPECT_EQ(stackWord(h, 0x7FFE), 0x0101);
}


TEST(InterruptTest, Mode0OtherRestart)
{
    Harness h;
    enableInts(h, 0);
    h.bus().setIntVector(0xD7);         // RST 10
    h.bus().setInt(true);

    h.step();
    EXPECT_EQ(h.step(), 13);
    EXPECT_EQ(h.regs().pc, 0x0010);
    EXPECT_EQ(stackWord(h, 0x7FFE), 0x0101);
}


TEST(InterruptTest, Mode2VectorTable)
{
    Harness h;
    enableInts(h, 2);
    z80regs_t r = h.regs();
    r.i = 0x90;
    h.setRegs(r);
    h.bus().load(0x9020, { 0x34, 0x12 });
    h.bus().setIntVector(0x20);
    h.bus().setInt(true);

    EXPECT_EQ(h.step(), 4);
    EXPECT_EQ(h.step(), 19);

    r = h.regs();
    EXPECT_EQ(r.pc, 0x1234);
    EXPECT_EQ(r.wz, 0x1234);
    EXPECT_EQ(r.sp, 0x7FFE);
    EXPECT_EQ(stackWord(h, 0x7FFE), 0x0101);
    EXPECT_FALSE(r.iff1);
}


TEST(InterruptTest, AcknowledgeCycleHasTwoWaits)
{
    Harness h;
    enableInts(h, 1);
    h.bus().setInt(true);
    h.step();

    CpuZ80 &cpu = h.cpu();
    const z80pins_t &p = h.pins();

    cpu.tick();                         // T1
    EXPECT_TRUE(p.m1);
    EXPECT_FALSE(p.mreq);
    EXPECT_FALSE(p.iorq);
    cpu.clockRise();                    // T2
    EXPECT_FALSE(p.iorq);
    cpu.clockFall();
    EXPECT_TRUE(p.iorq);                // IORQ with M1 from the T2 fall
    EXPECT_FALSE(p.mreq);
    cpu.tick();                         // TW
    EXPECT_EQ(cpu.tstate(), 2);
    cpu.tick();                         // TW
    EXPECT_EQ(cpu.tstate(), 2);
    cpu.clockRise();                    // T3
    EXPECT_EQ(cpu.tstate(), 3);
    EXPECT_TRUE(p.rfsh);
    EXPECT_FALSE(p.iorq);
}


TEST(InterruptTest, Nmi)
{
    Harness h;
    enableInts(h, 1);
    h.bus().setNmi(true);

    EXPECT_EQ(h.step(), 4);
    EXPECT_EQ(h.step(), 11);

    const z80regs_t r = h.regs();
    EXPECT_EQ(r.pc, 0x0066);
    EXPECT_EQ(stackWord(h, 0x7FFE), 0x0101);
    EXPECT_FALSE(r.iff1);
    EXPECT_TRUE(r.iff2);
    EXPECT_EQ(h.bus().intAcks(), 0);

    // the line is still high, but NMI is edge triggered
    EXPECT_EQ(h.step(), 4);
    EXPECT_EQ(h.regs().pc, 0x0067);
}


TEST(InterruptTest, NmiIgnoresDisable)
{
    Harness h;
    z80regs_t r = h.regs();
    r.sp = 0x8000;
    h.setRegs(r);
    h.bus().setNmi(true);
    h.step();
    EXPECT_EQ(h.step(), 11);
    EXPECT_EQ(h.regs().pc, 0x0066);
}


TEST(InterruptTest, RetnRestoresIff1)
{
    Harness h;
    enableInts(h, 1);
    h.bus().load(0x0066, { 0xED, 0x45 });   // RETN
    h.bus().setNmi(true);
    h.step();
    h.step();
    EXPECT_FALSE(h.regs().iff1);

    EXPECT_EQ(h.step(), 14);
    const z80regs_t r = h.regs();
    EXPECT_EQ(r.pc, 0x0101);
    EXPECT_EQ(r.sp, 0x8000);
    EXPECT_TRUE(r.iff1);
}


TEST(InterruptTest, NmiWinsOverInt)
{
    Harness h;
    enableInts(h, 1);
    h.bus().setInt(true);
    h.bus().setNmi(true);
    h.step();
    EXPECT_EQ(h.step(), 11);
    EXPECT_EQ(h.regs().pc, 0x0066);
    EXPECT_TRUE(h.bus().intPending());
}


TEST(InterruptTest, EiDelaysAcceptance)
{
    Harness h;
    z80regs_t r = h.regs();
    r.sp = 0x8000;
    r.im = 1;
    h.setRegs(r);
    h.load(0x0000, { 0xFB, 0x00, 0x00 });   // EI; NOP; NOP
    h.bus().setInt(true);

    EXPECT_EQ(h.step(), 4);             // EI
    EXPECT_EQ(h.step(), 4);             // NOP runs before the interrupt
    EXPECT_EQ(h.regs().pc, 0x0002);
    EXPECT_EQ(h.step(), 13);
    EXPECT_EQ(h.regs().pc, 0x0038);
    EXPECT_EQ(stackWord(h, 0x7FFE), 0x0002);
}


TEST(InterruptTest, DiBlocksInt)
{
    Harness h;
    enableInts(h, 1, 0x0000);
    h.load(0x0000, { 0xF3, 0x00, 0x00 });   // DI; NOP; NOP
    h.bus().setInt(true);
    EXPECT_EQ(h.steps(3), 12);
    EXPECT_EQ(h.regs().pc, 0x0003);
    EXPECT_EQ(h.bus().intAcks(), 0);
}


TEST(InterruptTest, HaltExitsOnInterrupt)
{
    Harness h;
    enableInts(h, 1, 0x0000);
    h.load(0x0000, { 0x76 });           // HALT
    EXPECT_EQ(h.step(), 4);
    EXPECT_TRUE(h.regs().halted);
    EXPECT_EQ(h.steps(5), 20);
    EXPECT_EQ(h.regs().pc, 0x0001);

    h.bus().setInt(true);
    EXPECT_EQ(h.step(), 4);             // one more halted cycle sees INT
    EXPECT_EQ(h.step(), 13);

    const z80regs_t r = h.regs();
    EXPECT_FALSE(r.halted);
    EXPECT_FALSE(h.pins().halt);
    EXPECT_EQ(r.pc, 0x0038);
    EXPECT_EQ(stackWord(h, 0x7FFE), 0x0001);
}


TEST(InterruptTest, PeriodicIntFromTimer)
{
    Harness h;
    enableInts(h, 1);
    h.load(0x0100, { 0x18, 0xFE });         // JR $
    h.load(0x0038, { 0xFB, 0xED, 0x4D });   // EI; RETI
    // 250 ns clock, interrupt every 100 us = every 400 T states
    h.bus().startIntTimer(100, 250);

    while (h.cpu().tstates() < 2000) {
        ASSERT_GT(h.step(), 0);
    }
    EXPECT_GE(h.bus().intAcks(), 4);
    EXPECT_LE(h.bus().intAcks(), 5);
}

// vim: ts=8:et:sw=4:smarttab
