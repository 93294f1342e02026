// This class manages the core configuration state:
//    + set the state to some reasonable default
//    + read the state from the ini file
//    + save the state to the ini file
//    + copy state
//    + compare two sets of state for (in)equality
//    + report if the state is valid
//
// The reset sequence of the real part only defines PC, I, R, the interrupt
// flops and the interrupt mode.  Everything else comes up holding whatever
// the silicon happened to hold, so the values used here are configuration,
// not architecture.  The remaining state describes the board around the core:
// the memory image to load, the clock period, and the interrupt sources.

#ifndef _INCLUDE_CORE_CONFIG_STATE_H_
#define _INCLUDE_CORE_CONFIG_STATE_H_

#include "z80cycle.h"

class CoreCfgState
{
public:
    // register pairs whose reset value is configurable
    enum reset_reg_t {
        RST_AF, RST_BC, RST_DE, RST_HL,
        RST_AF_ALT, RST_BC_ALT, RST_DE_ALT, RST_HL_ALT,
        RST_IX, RST_IY, RST_SP,
        NUM_RESET_REGS
    };

    CoreCfgState();

    CoreCfgState(const CoreCfgState &obj) = default;             // copy
    CoreCfgState &operator=(const CoreCfgState &rhs) = default;  // assign

    // compare two configurations for equality
    bool operator==(const CoreCfgState &rhs) const;
    bool operator!=(const CoreCfgState &rhs) const;

    // initialized with a reasonable default state
    void setDefaults();

    // load/save a configuration from/to the .ini file
    void loadIni();
    void saveIni() const;

    // set/get the value a register pair takes at reset
    void   setResetValue(reset_reg_t reg, uint16 value) noexcept;
    uint16 getResetValue(reset_reg_t reg) const noexcept;

    // ini key of each reset register
    static const char *resetRegName(reset_reg_t reg) noexcept;

    // set/get the memory image loaded before the first clock
    void setImagePath(const std::string &path);
    const std::string &getImagePath() const noexcept;
    void setLoadAddr(int addr) noexcept;
    int  getLoadAddr() const noexcept;

    // set/get the clock period, in ns
    void setClockPeriodNs(int ns) noexcept;
    int  getClockPeriodNs() const noexcept;

    // set/get the period of the board's maskable interrupt, in us; 0=none
    void setIntPeriodUs(int us) noexcept;
    int  getIntPeriodUs() const noexcept;

    // set/get the byte the board returns during interrupt acknowledge
    void setIntVector(int vec) noexcept;
    int  getIntVector() const noexcept;

    // per-instruction trace to the debug log
    void setTraceEnabled(bool trace) noexcept;
    bool traceEnabled() const noexcept;

    // returns true if the current configuration is valid and consistent.
    // if warn is true, errors produce a UI_error() explanation
    bool configOk(bool warn) const;

private:
    // just for debugging -- make sure we don't attempt to use such a config
    bool m_initialized = false;

    std::array<uint16, NUM_RESET_REGS> m_reset_val;

    std::string m_image_path;               // binary loaded at reset, or empty
    int  m_load_addr       = 0x0000;        // where the image goes
    int  m_clock_ns        = 250;           // 4 MHz
    int  m_int_period_us   = 0;             // no periodic interrupt
    int  m_int_vector      = 0xFF;          // floating bus: RST 38 in IM0
    bool m_trace           = false;
};

#endif // _INCLUDE_CORE_CONFIG_STATE_H_

// vim: ts=8:et:sw=4:smarttab
