// pin level behavior: strobe timing, refresh, wait states, bus requests,
// reset

#include "Harness.h"

#include <gtest/gtest.h>

namespace {

// the outputs of the core, as a board would see them
struct outputs_t {
    uint16 addr;
    uint8  data;
    bool   data_oe, m1, mreq, iorq, rd, wr, rfsh, halt, busak;

    bool operator==(const outputs_t &rhs) const
    {
        return addr == rhs.addr && data == rhs.data && data_oe == rhs.data_oe
            && m1 == rhs.m1 && mreq == rhs.mreq && iorq == rhs.iorq
            && rd == rhs.rd && wr == rhs.wr && rfsh == rhs.rfsh
            && halt == rhs.halt && busak == rhs.busak;
    }
};

// sits between the core and a FlatBus, recording the outputs after every
// half clock.  a state equal to the one before it is not recorded, so wait
// states leave no mark unless something moves while they are held.
class TraceBus : public Z80Bus
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(TraceBus);

    explicit TraceBus(FlatBus &board) : m_board(board) { }

    void busEdge(z80pins_t &pins, bool rising) override
    {
        m_board.busEdge(pins, rising);
        const outputs_t o = { pins.addr, pins.data, pins.data_oe, pins.m1,
                              pins.mreq, pins.iorq, pins.rd, pins.wr,
                              pins.rfsh, pins.halt, pins.busak };
        if (m_trace.empty() || !(m_trace.back() == o)) {
            m_trace.push_back(o);
        }
    }

    std::vector<outputs_t> m_trace;

private:
    FlatBus &m_board;
};

struct traced_t {
    std::vector<outputs_t> trace;
    z80regs_t              regs;
    int                    tstates;
    uint8                  mem_hl, mem_de, mem_stack;
    uint8                  out_port;
};

// run one instruction with 'waits' wait states on its first cycle of kind
traced_t
runTraced(const std::vector<uint8> &prog, FlatBus::cycle_t kind, int waits)
{
    CoreCfgState cfg;
    cfg.setDefaults();
    FlatBus board;
    TraceBus bus(board);
    CpuZ80 cpu(bus, cfg);
    cpu.reset();

    z80regs_t r = cpu.state();
    r.af = 0x5A00;
    r.bc = 0x1234;
    r.de = 0x6000;
    r.hl = 0x5000;
    r.sp = 0x8000;
    cpu.setState(r);
    board.poke(0x5000, 0xC3);
    board.setInPort(0x20, 0x99);
    board.load(0x0000, prog);
    if (waits > 0) {
        board.armWait(kind, waits);
    }

    bus.m_trace.clear();
    traced_t res;
    res.tstates   = cpu.stepInstruction();
    res.trace     = bus.m_trace;
    res.regs      = cpu.state();
    res.mem_hl    = board.peek(0x5000);
    res.mem_de    = board.peek(0x6000);
    res.mem_stack = board.peek(0x7FFE);
    res.out_port  = board.outPort(0x20);
    return res;
}

void
expectSameRegs(const z80regs_t &a, const z80regs_t &b)
{
    EXPECT_EQ(a.af, b.af);
    EXPECT_EQ(a.bc, b.bc);
    EXPECT_EQ(a.de, b.de);
    EXPECT_EQ(a.hl, b.hl);
    EXPECT_EQ(a.ix, b.ix);
    EXPECT_EQ(a.iy, b.iy);
    EXPECT_EQ(a.sp, b.sp);
    EXPECT_EQ(a.pc, b.pc);
    EXPECT_EQ(a.wz, b.wz);
    EXPECT_EQ(a.i, b.i);
    EXPECT_EQ(a.r, b.r);
}

} // namespace

TEST(PinTest, OpcodeFetchAndRefresh)
{
    Harness h;
    z80regs_t r = h.regs();
    r.i = 0x12;
    r.r = 0x34;
    h.setRegs(r);
    h.load(0x0000, { 0x00 });
    CpuZ80 &cpu = h.cpu();
    const z80pins_t &p = h.pins();

    // T1
    cpu.clockRise();
    EXPECT_TRUE(p.m1);
    EXPECT_EQ(p.addr, 0x0000);
    EXPECT_FALSE(p.mreq);
    EXPECT_FALSE(p.rd);
    cpu.clockFall();
    EXPECT_TRUE(p.m1);
    EXPECT_TRUE(p.mreq);
    EXPECT_TRUE(p.rd);

    // T2
    cpu.clockRise();
    EXPECT_TRUE(p.mreq);
    EXPECT_TRUE(p.rd);
    cpu.clockFall();

    // T3: refresh address is I:R
    cpu.clockRise();
    EXPECT_FALSE(p.m1);
    EXPECT_FALSE(p.mreq);
    EXPECT_FALSE(p.rd);
    EXPECT_TRUE(p.rfsh);
    EXPECT_EQ(p.addr, 0x1234);
    cpu.clockFall();
    EXPECT_TRUE(p.mreq);
    EXPECT_TRUE(p.rfsh);

    // T4
    cpu.clockRise();
    EXPECT_TRUE(p.mreq);
    cpu.clockFall();
    EXPECT_FALSE(p.mreq);
    EXPECT_TRUE(cpu.atBoundary());

    EXPECT_EQ(h.regs().r, 0x35);
    EXPECT_EQ(h.regs().pc, 0x0001);

    // next M1 ends the refresh
    cpu.clockRise();
    EXPECT_FALSE(p.rfsh);
    EXPECT_TRUE(p.m1);
    EXPECT_EQ(p.addr, 0x0001);
}


TEST(PinTest, MemoryReadCycle)
{
    Harness h;
    z80regs_t r = h.regs();
    r.hl = 0x4000;
    h.setRegs(r);
    h.load(0x0000, { 0x7E });           // LD A,(HL)
    h.bus().poke(0x4000, 0x99);
    CpuZ80 &cpu = h.cpu();
    const z80pins_t &p = h.pins();

    for (int i=0; i < 4; i++) {
        cpu.tick();
    }

    // M2 T1
    cpu.clockRise();
    EXPECT_EQ(p.addr, 0x4000);
    EXPECT_FALSE(p.m1);
    EXPECT_FALSE(p.rfsh);
    EXPECT_FALSE(p.mreq);
    cpu.clockFall();
    EXPECT_TRUE(p.mreq);
    EXPECT_TRUE(p.rd);
    EXPECT_FALSE(p.wr);

    // T2, T3
    cpu.tick();
    cpu.clockRise();
    EXPECT_TRUE(p.rd);
    EXPECT_EQ(p.data, 0x99);
    cpu.clockFall();
    EXPECT_FALSE(p.mreq);
    EXPECT_FALSE(p.rd);
    EXPECT_TRUE(cpu.atBoundary());
    EXPECT_EQ(h.regs().af >> 8, 0x99);
    EXPECT_EQ(cpu.tstates(), 7u);
}


TEST(PinTest, MemoryWriteCycle)
{
    Harness h;
    z80regs_t r = h.regs();
    r.hl = 0x2000;
    r.af = 0x5A00;
    h.setRegs(r);
    h.load(0x0000, { 0x77 });           // LD (HL),A
    CpuZ80 &cpu = h.cpu();
    const z80pins_t &p = h.pins();

    for (int i=0; i < 4; i++) {
        cpu.tick();
    }

    // M2 T1: address, then MREQ and the data
    cpu.clockRise();
    EXPECT_EQ(p.addr, 0x2000);
    cpu.clockFall();
    EXPECT_TRUE(p.mreq);
    EXPECT_TRUE(p.data_oe);
    EXPECT_EQ(p.data, 0x5A);
    EXPECT_FALSE(p.wr);
    EXPECT_FALSE(p.rd);

    // T2: WR at the falling edge
    cpu.clockRise();
    EXPECT_FALSE(p.wr);
    cpu.clockFall();
    EXPECT_TRUE(p.wr);

    // T3
    cpu.clockRise();
    EXPECT_TRUE(p.wr);
    cpu.clockFall();
    EXPECT_FALSE(p.wr);
    EXPECT_FALSE(p.mreq);
    EXPECT_FALSE(p.data_oe);

    EXPECT_EQ(h.bus().peek(0x2000), 0x5A);
}


TEST(PinTest, IoWriteCycle)
{
    Harness h;
    z80regs_t r = h.regs();
    r.af = 0x7700;
    h.setRegs(r);
    h.load(0x0000, { 0xD3, 0x10 });     // OUT (10),A
    CpuZ80 &cpu = h.cpu();
    const z80pins_t &p = h.pins();

    for (int i=0; i < 7; i++) {
        cpu.tick();
    }

    // M3 T1
    cpu.clockRise();
    EXPECT_EQ(p.addr, 0x7710);
    EXPECT_FALSE(p.iorq);
    cpu.clockFall();
    EXPECT_TRUE(p.data_oe);
    EXPECT_EQ(p.data, 0x77);
    EXPECT_FALSE(p.mreq);

    // T2: IORQ and WR together
    cpu.clockRise();
    EXPECT_TRUE(p.iorq);
    EXPECT_TRUE(p.wr);
    cpu.clockFall();

    // the automatic wait state
    cpu.clockRise();
    EXPECT_EQ(cpu.tstate(), 2);
    cpu.clockFall();

    // T3
    cpu.clockRise();
    EXPECT_EQ(cpu.tstate(), 3);
    EXPECT_TRUE(p.iorq);
    cpu.clockFall();
    EXPECT_FALSE(p.iorq);
    EXPECT_FALSE(p.wr);
    EXPECT_TRUE(cpu.atBoundary());
    EXPECT_EQ(cpu.tstates(), 11u);

    EXPECT_EQ(h.bus().outPort(0x10), 0x77);
    ASSERT_EQ(h.bus().outLog().size(), 1u);
    EXPECT_EQ(h.bus().outLog()[0].addr, 0x7710);
    EXPECT_EQ(h.bus().outLog()[0].data, 0x77);
}


TEST(PinTest, IoReadPutsAOnHighAddress)
{
    Harness h;
    z80regs_t r = h.regs();
    r.af = 0x0100;
    h.setRegs(r);
    h.bus().setInPort(0x20, 0x99);
    h.load(0x0000, { 0xDB, 0x20 });     // IN A,(20)
    EXPECT_EQ(h.step(), 11);
    EXPECT_EQ(h.regs().af >> 8, 0x99);
    EXPECT_EQ(h.regs().wz, 0x0121);
}


TEST(PinTest, WaitStretchesMemoryRead)
{
    Harness h;
    h.load(0x0000, { 0x3A, 0x00, 0x20 });   // LD A,(nn)
    h.bus().armWait(FlatBus::CYC_MEMRD, 2);
    EXPECT_EQ(h.step(), 15);
}


TEST(PinTest, WaitStretchesFetch)
{
    Harness h;
    h.bus().armWait(FlatBus::CYC_FETCH, 3);
    EXPECT_EQ(h.step(), 7);
    EXPECT_EQ(h.step(), 4);
}


TEST(PinTest, WaitStretchesWrite)
{
    Harness h;
    z80regs_t r = h.regs();
    r.hl = 0x2000;
    h.setRegs(r);
    h.load(0x0000, { 0x77 });
    h.bus().armWait(FlatBus::CYC_MEMWR, 1);
    EXPECT_EQ(h.step(), 8);
}


TEST(PinTest, WaitAddsToAutomaticIoWait)
{
    Harness h;
    h.load(0x0000, { 0xD3, 0x10 });
    h.bus().armWait(FlatBus::CYC_IOWR, 2);
    EXPECT_EQ(h.step(), 13);
}


TEST(PinTest, BusRequestGrantedAtCycleEnd)
{
    Harness h;
    CpuZ80 &cpu = h.cpu();
    z80pins_t &p = h.pins();

    EXPECT_EQ(h.step(), 4);
    p.busrq = true;

    // the request is sampled at the end of the next machine cycle
    for (int i=0; i < 4; i++) {
        cpu.tick();
        EXPECT_FALSE(p.busak);
    }
    cpu.tick();
    EXPECT_TRUE(p.busak);
    EXPECT_TRUE(p.bus_float);
    EXPECT_FALSE(p.m1);
    EXPECT_FALSE(p.mreq);
    EXPECT_FALSE(p.rd);

    // time keeps passing while the bus is away
    const uint64 t0 = cpu.tstates();
    for (int i=0; i < 10; i++) {
        cpu.tick();
        EXPECT_TRUE(p.busak);
    }
    EXPECT_EQ(cpu.tstates(), t0 + 10);

    p.busrq = false;
    EXPECT_EQ(h.step(), 4);
    EXPECT_FALSE(p.busak);
    EXPECT_FALSE(p.bus_float);
    EXPECT_EQ(h.regs().pc, 0x0003);
}


TEST(PinTest, ResetRestartsAtZero)
{
    Harness h;
    h.load(0x0000, { 0xFB,              // EI
                     0xED, 0x5E,        // IM 2
                     0x3E, 0x12,        // LD A,12
                     0xED, 0x47,        // LD I,A
                     0x00 });
    EXPECT_GT(h.steps(4), 0);
    z80regs_t r = h.regs();
    EXPECT_TRUE(r.iff1);
    EXPECT_EQ(r.im, 2);
    EXPECT_EQ(r.i, 0x12);

    const uint64 t = h.cpu().tstates();
    h.cpu().reset();
    r = h.regs();
    EXPECT_EQ(r.pc, 0x0000);
    EXPECT_EQ(r.i, 0x00);
    EXPECT_EQ(r.r, 0x00);
    EXPECT_FALSE(r.iff1);
    EXPECT_FALSE(r.iff2);
    EXPECT_EQ(r.im, 0);
    EXPECT_FALSE(r.halted);
    EXPECT_EQ(r.sp, 0xFFFF);
    EXPECT_EQ(h.cpu().tstates(), t);

    EXPECT_EQ(h.step(), 4);     // the EI at 0 again
    EXPECT_EQ(h.regs().pc, 0x0001);
}


TEST(PinTest, ResetValuesComeFromConfiguration)
{
    CoreCfgState cfg;
    cfg.setDefaults();
    cfg.setResetValue(CoreCfgState::RST_SP, 0xDFF0);
    cfg.setResetValue(CoreCfgState::RST_AF, 0x0044);
    FlatBus bus;
    CpuZ80 cpu(bus, cfg);
    cpu.reset();
    EXPECT_EQ(cpu.state().sp, 0xDFF0);
    EXPECT_EQ(cpu.state().af, 0x0044);
    EXPECT_EQ(cpu.state().bc, 0xFFFF);
}


TEST(PinTest, HaltPin)
{
    Harness h;
    h.load(0x0000, { 0x76 });
    EXPECT_EQ(h.step(), 4);
    EXPECT_TRUE(h.pins().halt);
    EXPECT_TRUE(h.regs().halted);

    // halted, the core keeps fetching at the same address
    for (int i=0; i < 3; i++) {
        EXPECT_EQ(h.step(), 4);
        EXPECT_EQ(h.regs().pc, 0x0001);
    }
}


// while WAIT holds a cycle nothing on the outputs moves, and the cycle
// carries on exactly as it would have without the wait states
TEST(PinTest, WaitStatesOnlyStretch)
{
    struct {
        std::vector<uint8> prog;
        FlatBus::cycle_t   kind;
        const char        *name;
    } cases[] = {
        { { 0x00 },             FlatBus::CYC_FETCH, "NOP" },
        { { 0x77 },             FlatBus::CYC_MEMWR, "LD (HL),A" },
        { { 0x7E },             FlatBus::CYC_MEMRD, "LD A,(HL)" },
        { { 0xDB, 0x20 },       FlatBus::CYC_IORD,  "IN A,(20)" },
        { { 0xD3, 0x20 },       FlatBus::CYC_IOWR,  "OUT (20),A" },
        { { 0xC5 },             FlatBus::CYC_MEMWR, "PUSH BC" },
        { { 0xED, 0xA0 },       FlatBus::CYC_MEMRD, "LDI" },
    };

    for (const auto &c : cases) {
        SCOPED_TRACE(c.name);
        const traced_t plain = runTraced(c.prog, c.kind, 0);
        for (int waits=1; waits <= 3; waits++) {
            const traced_t held = runTraced(c.prog, c.kind, waits);
            EXPECT_EQ(held.tstates, plain.tstates + waits);
            EXPECT_TRUE(held.trace == plain.trace);
            expectSameRegs(held.regs, plain.regs);
            EXPECT_EQ(held.mem_hl, plain.mem_hl);
            EXPECT_EQ(held.mem_de, plain.mem_de);
            EXPECT_EQ(held.mem_stack, plain.mem_stack);
            EXPECT_EQ(held.out_port, plain.out_port);
        }
    }
}

// vim: ts=8:et:sw=4:smarttab
