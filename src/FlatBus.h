// FlatBus is the simplest board a Z80 can sit on:  64 KB of RAM with no
// decode, 256 input and output ports, and a single interrupting device.
// It is what the runner and the tests plug into the core.
//
// Besides supplying memory and ports it can:
//    + hold WAIT for N wait states on the next cycle of a given kind
//    + raise INT, either on request or periodically off the scheduler;
//      the request is withdrawn when the cpu acknowledges it
//    + drive NMI
//    + keep a log of every output cycle
//
// FlatBus owns the wait, intr and nmi inputs and rewrites them at every
// edge.  reset and busrq are left to whoever drives the board.

#ifndef _INCLUDE_FLATBUS_H_
#define _INCLUDE_FLATBUS_H_

#include "z80cycle.h"
#include "Scheduler.h"
#include "Z80Bus.h"

class FlatBus : public Z80Bus
{
public:
    CANT_ASSIGN_OR_COPY_CLASS(FlatBus);

    // the bus cycles the board can tell apart from the strobes
    enum cycle_t {
        CYC_NONE, CYC_FETCH, CYC_MEMRD, CYC_MEMWR,
        CYC_IORD, CYC_IOWR, CYC_INTACK,
        NUM_CYCLE_KINDS
    };

    // one output cycle, as seen on the pins
    struct iowrite_t {
        uint16 addr;
        uint8  data;
    };

    FlatBus();
    ~FlatBus() override;

    void busEdge(z80pins_t &pins, bool rising) override;

    // ---- memory ----
    uint8 peek(uint16 addr) const noexcept       { return m_mem[addr]; }
    void  poke(uint16 addr, uint8 v) noexcept    { m_mem[addr] = v; }
    void  fill(uint8 v) noexcept                 { m_mem.fill(v); }

    // copy bytes into memory, wrapping at the top of the address space
    void  load(uint16 addr, const std::vector<uint8> &bytes) noexcept;

    // load a binary image file.  returns false, after a UI_error(), if the
    // file can't be read or doesn't fit.
    bool  loadImage(const std::string &path, int addr);

    // ---- ports ----
    void  setInPort(uint8 port, uint8 v) noexcept { m_in[port] = v; }
    uint8 outPort(uint8 port) const noexcept      { return m_out[port]; }

    const std::vector<iowrite_t> &outLog() const noexcept { return m_out_log; }
    void  clearOutLog() noexcept                          { m_out_log.clear(); }

    // ---- interrupts ----
    // byte returned during interrupt acknowledge: the IM2 vector, or the
    // opcode executed in IM0
    void  setIntVector(uint8 v) noexcept { m_int_vector = v; }
    void  setInt(bool level) noexcept    { m_int = level; }
    bool  intPending() const noexcept    { return m_int; }
    void  setNmi(bool level) noexcept    { m_nmi = level; }
    int   intAcks() const noexcept       { return m_int_acks; }

    // raise INT every period_us of simulated time; 0 stops it.
    // clock_ns is how much time each clock period represents.
    void  startIntTimer(int period_us, int clock_ns);

    // ---- wait states ----
    // insert n wait states into the next cycle of the given kind
    void  armWait(cycle_t kind, int n) noexcept;

    // classify a bus cycle from the strobes; CYC_NONE between cycles and
    // during refresh
    static cycle_t cycleOf(const z80pins_t &pins) noexcept;

private:
    void intTimerFired();

    std::array<uint8, MEMORY_SIZE>  m_mem;
    std::array<uint8, NUM_IOPORTS>  m_in;
    std::array<uint8, NUM_IOPORTS>  m_out;
    std::vector<iowrite_t>          m_out_log;

    uint8   m_int_vector = 0xFF;
    bool    m_int = false;
    bool    m_nmi = false;
    int     m_int_acks = 0;

    // wait insertion
    std::array<int, NUM_CYCLE_KINDS> m_wait_armed;
    int     m_wait_falls = 0;       // falling edges left to hold WAIT
    cycle_t m_cycle = CYC_NONE;     // cycle currently on the pins

    // timed interrupt source
    Scheduler               m_sched;
    std::shared_ptr<Timer>  m_int_timer;
    int                     m_int_period_us = 0;
    int                     m_clock_ns = 250;
};

#endif // _INCLUDE_FLATBUS_H_

// vim: ts=8:et:sw=4:smarttab
