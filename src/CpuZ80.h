// This is the class interface for the cycle accurate Z80 core.
//
// The core is driven one clock half at a time.  clockRise() and clockFall()
// each do the work of one sub-cycle, then hand the pins to the Z80Bus
// collaborator so it can react to the new outputs and drive the inputs the
// core samples at the next edge.
//
// Inside, the work is split the way the silicon splits it:
//
//    Sequencer      (M,T) position within the instruction
//    Pla            opcode -> instruction class and operand fields
//    control matrix per (class, M, T) actions: CpuZ80_Execute.cpp
//    Alu            8 bit ALU and flags
//    RegFile        register pairs behind one budgeted write port
//    AddressLatch   drives the address pins, plus its incrementer
//    BusRouter      the three segment internal data bus
//    IntCtl         NMI latch, IFF1/IFF2, IM, boundary arbitration
//
// Input sampling points:
//    reset    every edge; registers are cleared across one rise and one fall
//    wait     the fall of T2 (and of each wait state) of bus cycles
//    nmi      every rise (edge detect)
//    intr     the final fall of each instruction
//    busrq    the final fall of each machine cycle
//    data     T3 rise for opcode fetch and interrupt acknowledge,
//             T3 fall for memory and I/O reads

#ifndef _INCLUDE_CPUZ80_H_
#define _INCLUDE_CPUZ80_H_

#include "z80cycle.h"
#include "AddressLatch.h"
#include "Alu.h"
#include "BusRouter.h"
#include "CoreCfgState.h"
#include "IntCtl.h"
#include "Pla.h"
#include "RegFile.h"
#include "Sequencer.h"
#include "Z80Bus.h"

// architectural state, as seen between instructions
struct z80regs_t {
    uint16 af, bc, de, hl;
    uint16 af_alt, bc_alt, de_alt, hl_alt;
    uint16 ix, iy, sp, pc;
    uint16 wz;          // internal, but it leaks into flags
    uint8  i, r;
    bool   iff1, iff2;
    int    im;
    bool   halted;
};

class CpuZ80
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(CpuZ80);

    // the core keeps a reference to the bus; it must outlive the core
    CpuZ80(Z80Bus &bus, const CoreCfgState &cfg);
    ~CpuZ80();

    // indicates if cpu is running or stopped on a design fault
    enum { CPU_RUNNING=0, CPU_HALTED=1 };
    int status() const noexcept { return m_status; }

    // description of the design fault that stopped the core, if any
    const std::string &faultMsg() const noexcept { return m_fault_msg; }

    // ---- clocking ----

    void clockRise();
    void clockFall();

    // one full clock period
    void tick() { clockRise(); clockFall(); }

    // hold the reset pin for one clock period, then release it
    void reset();

    // run to the end of the current (or next) instruction.  returns the
    // number of T states that took, wait states included, or -1 if the
    // core stopped on a design fault or hit the safety limit.
    int stepInstruction();

    // ---- pins ----

    z80pins_t       &pins() noexcept       { return m_pins; }
    const z80pins_t &pins() const noexcept { return m_pins; }

    // ---- inspection ----

    // architectural registers, with in-flight results applied
    z80regs_t state() const noexcept;

    // load registers; only legal at an instruction boundary
    void setState(const z80regs_t &regs) noexcept;

    uint64 tstates() const noexcept  { return m_tstates; }
    uint64 m1Count() const noexcept  { return m_m1count; }
    uint64 instructions() const noexcept { return m_icount; }

    int  mcycle() const noexcept     { return m_seq.m(); }
    int  tstate() const noexcept     { return m_seq.t(); }

    // true right after the final fall of an instruction
    bool atBoundary() const noexcept { return m_boundary; }

    // the most recently decoded opcode
    uint8 opcode() const noexcept                    { return m_opcode; }
    const Pla::decoded_t &decoded() const noexcept   { return m_dec; }

#if HAVE_OP_HISTOGRAM
    // how many times each instruction class has retired
    uint64 opCount(Pla::op_t op) const noexcept { return m_histogram[op]; }
#endif

private:
    // ---- machine cycles ----

    enum mcycle_t : uint8 {
        MC_FETCH, MC_INTACK,
        MC_MEMRD, MC_MEMWR,
        MC_IORD,  MC_IOWR,
        MC_INTERNAL
    };

    // what the control matrix asks of the current machine cycle
    struct cyclectl_t {
        mcycle_t  kind;
        int       tlen;         // T states, not counting waits
        int       autowait;     // automatic wait states still to insert
        uint8     addr_rp;      // register pair driving the address, or ADDR_ABS
        uint16    addr;         // the address, when addr_rp == ADDR_ABS
        uint8     post_rp;      // pair receiving the incrementer output at T2
        AddressLatch::incdec_t postop;
    };

    static const uint8 ADDR_ABS = 0xFF;
    static const uint8 NO_RP    = 0xFF;

    // how the control matrix ends a machine cycle
    enum cont_t : uint8 {
        CONT_STAY,      // not finished (only legal before the last T)
        CONT_NEXT_M,    // on to the next machine cycle
        CONT_PREFIX,    // a prefix byte: fetch another opcode
        CONT_END        // the instruction is complete
    };

    // pending ALU write-back, committed at the next rising edge
    struct writeback_t {
        bool            valid;
        RegFile::reg8_t reg;
        uint8           value;
    };

    // ---- CpuZ80.cpp: timing and pins ----

    void powerOn();
    void resetRise();
    void resetFall();
    void loadResetValues();

    void m1Rise(int t);
    void m1Fall(int t);
    void cycleRise(int m, int t);
    void cycleFall(int t);

    // wait state logic at the fall of T2; true means hold
    bool holdT2();

    void endMachineCycle(cont_t cont);
    void endInstruction();
    void commitWriteBack();
    void dropStrobes() noexcept;

    // check the datapath rules at the end of a sub-cycle, then let the
    // bus collaborator see the pins
    void endPhase(bool rising);
    void designFault(const char *fmt, ...);

    void traceInstruction();

    static bool isBusCycle(mcycle_t kind) noexcept;

    // ---- CpuZ80_Execute.cpp: the control matrix ----

    // T1 rise of M2 and later: set up m_cyc
    void execEnter(int m);
    // rising edge actions past T1
    void execRise(int m, int t);
    // falling edge actions; the return value matters at the last T
    cont_t execFall(int m, int t);

    // per-class pieces of the above
    void enterIndexed(int m);
    cont_t fallIndexed(int m, int t);
    cont_t fallBlock(int m, int t);
    void enterBlock(int m);
    cont_t fallAddHl(int m, int t);
    cont_t fallReturn(int m, int t);

    // shared pieces
    cont_t readAddress(int m);
    cont_t relativeJump();
    uint16 indexAddress() const noexcept;
    void   accumulate(Alu::op_t op, uint8 operand);

    // machine cycle set up helpers
    void busCycle(mcycle_t kind, int tlen, uint8 addr_rp,
                  uint8 post_rp=NO_RP,
                  AddressLatch::incdec_t op=AddressLatch::ID_NONE);
    void busCycleAbs(mcycle_t kind, int tlen, uint16 addr,
                     uint8 post_rp=NO_RP,
                     AddressLatch::incdec_t op=AddressLatch::ID_NONE);
    void internalCycle(int tlen);
    void readPc(int tlen=3);

    // datapath helpers
    void  driveData(BusRouter::src_t src, uint8 value);
    void  driveDataCopy(uint8 value, RegFile::reg8_t copy);
    uint8 dataToReg(RegFile::reg8_t r);
    uint8 dataToAlu();
    uint8 regToReg(RegFile::reg8_t dst, RegFile::reg8_t src);
    void  writeBack(RegFile::reg8_t r, uint8 value) noexcept;
    void  setFlags(uint8 f);
    uint8 flags() const noexcept;
    uint8 reg8(uint8 r) const noexcept;
    uint16 reg16(uint8 rp) const noexcept;
    bool  condition(int cc) const noexcept;
    uint8 memRp() const noexcept;

    // ---- collaborators and datapath ----

    Z80Bus             &m_bus;
    const CoreCfgState  m_cfg;
    z80pins_t           m_pins;

    RegFile             m_regs;
    AddressLatch        m_latch;
    BusRouter           m_route;
    Alu                 m_alu;
    Sequencer           m_seq;
    IntCtl              m_ictl;

    // ---- instruction state ----

    Pla::prefix_t       m_prefix;       // prefix state for the next decode
    Pla::decoded_t      m_dec;          // current instruction
    uint8               m_opcode;       // instruction register
    uint8               m_dlatch;       // data pin input latch
    uint8               m_dout;         // data pin output latch
    cyclectl_t          m_cyc;          // current machine cycle
    Sequencer::next_t   m_next;         // move for the next rising edge
    writeback_t         m_wb;
    uint8               m_jump_rp;      // pair the next fetch address comes from
    IntCtl::svc_t       m_svc;          // what the current instruction services
    bool                m_first_m1;     // the current M1 started the instruction
    bool                m_im0;          // executing an IM0 supplied opcode
    bool                m_halted;       // HALT executed, waiting for interrupt
    uint8               m_lowflags;     // flags from the low half of 16 bit ops
    uint16              m_insn_pc;      // address of the instruction's first byte
    bool                m_insn_start;   // the next M1 starts an instruction
    bool                m_boundary;     // last fall ended an instruction
    bool                m_busreq;       // grant the bus at the next rise

    int                 m_status;
    std::string         m_fault_msg;

    uint64              m_tstates;
    uint64              m_m1count;
    uint64              m_icount;

#if HAVE_OP_HISTOGRAM
    std::array<uint64, Pla::NUM_OPS> m_histogram;
#endif
};

#endif // _INCLUDE_CPUZ80_H_

// vim: ts=8:et:sw=4:smarttab
