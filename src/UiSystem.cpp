// z80run: load a binary image into a flat 64 KB board, reset the core, and
// clock it until HALT with interrupts disabled, or until the T-state limit.
//
//    z80run -i prog.bin [-a 0x100] [-c z80cycle.ini] [-n 5000000] [-t] [-l log]

// ============================================================================
// headers
// ============================================================================

#include "UiSystem.h"
#include "CoreCfgState.h"
#include "CpuZ80.h"
#include "FlatBus.h"
#include "Ui.h"
#include "host.h"

#include "wx/cmdline.h"         // req'd by wxCmdLineParser

// ============================================================================
// implementation
// ============================================================================

IMPLEMENT_APP_CONSOLE(TheApp)

bool
TheApp::OnInit()
{
    // must call base class version to get command line processing
    // if false, the app terminates
    if (!wxAppConsole::OnInit()) {
        return false;
    }

    host::initialize(m_ini_path);

    if (!m_log_path.empty() && !dbglog_open(m_log_path)) {
        UI_warn("Couldn't open log file '%s'", m_log_path.c_str());
    }

    return true;
}


int
TheApp::OnRun()
{
    CoreCfgState cfg;
    cfg.loadIni();
    if (!m_image_path.empty()) {
        cfg.setImagePath(m_image_path);
    }
    if (m_load_addr >= 0) {
        cfg.setLoadAddr(static_cast<int>(m_load_addr));
    }
    if (m_trace) {
        cfg.setTraceEnabled(true);
    }
    if (!cfg.configOk(true)) {
        return 2;
    }
    if (cfg.getImagePath().empty()) {
        UI_error("No image file given; use -i <file> or the memory/image ini key");
        return 2;
    }
    if (m_save_ini) {
        cfg.saveIni();
    }

    FlatBus bus;
    if (!bus.loadImage(cfg.getImagePath(), cfg.getLoadAddr())) {
        return 2;
    }
    bus.setIntVector(static_cast<uint8>(cfg.getIntVector()));
    bus.startIntTimer(cfg.getIntPeriodUs(), cfg.getClockPeriodNs());

    CpuZ80 cpu(bus, cfg);
    cpu.reset();

    // a program that doesn't start at 0 gets a jump there
    if (cfg.getLoadAddr() != 0) {
        z80regs_t regs = cpu.state();
        regs.pc = static_cast<uint16>(cfg.getLoadAddr());
        cpu.setState(regs);
    }

    const int64 start_ms = host::getTimeMs();
    while (cpu.tstates() < static_cast<uint64>(m_max_tstates)) {
        if (cpu.stepInstruction() < 0) {
            break;
        }
        const z80regs_t s = cpu.state();
        if (s.halted && !s.iff1) {
            break;
        }
    }
    const int64 elapsed_ms = host::getTimeMs() - start_ms;

    const z80regs_t s = cpu.state();
    wxPrintf("AF=%04X BC=%04X DE=%04X HL=%04X  AF'=%04X BC'=%04X DE'=%04X HL'=%04X\n",
             s.af, s.bc, s.de, s.hl, s.af_alt, s.bc_alt, s.de_alt, s.hl_alt);
    wxPrintf("IX=%04X IY=%04X SP=%04X PC=%04X WZ=%04X I=%02X R=%02X IFF1=%d IFF2=%d IM=%d%s\n",
             s.ix, s.iy, s.sp, s.pc, s.wz, s.i, s.r,
             s.iff1 ? 1 : 0, s.iff2 ? 1 : 0, s.im, s.halted ? " HALT" : "");
    wxPrintf("%llu T-states, %llu instructions, %llu M1 cycles\n",
             (unsigned long long)cpu.tstates(),
             (unsigned long long)cpu.instructions(),
             (unsigned long long)cpu.m1Count());

    if (s.halted && !s.iff1) {
        UI_info("Halted at %04X after %llu T-states", s.pc,
                (unsigned long long)cpu.tstates());
    } else if (cpu.status() == CpuZ80::CPU_RUNNING) {
        UI_info("T-state limit of %ld reached at %04X", m_max_tstates, s.pc);
    }

    if (elapsed_ms > 0) {
        const float mhz = static_cast<float>(cpu.tstates()) / (1000.0f * elapsed_ms);
        UI_setSimTime(cpu.tstates(), mhz);
    }

    for (auto &w : bus.outLog()) {
        dbglog("OUT (%04X) <- %02X\n", w.addr, w.data);
    }

    if (cpu.status() != CpuZ80::CPU_RUNNING) {
        UI_error("Stopped: %s", cpu.faultMsg().c_str());
        return 1;
    }
    return 0;
}


int
TheApp::OnExit()
{
    dbglog_close();
    host::terminate();      // saves the ini
    return wxAppConsole::OnExit();
}


void
TheApp::OnInitCmdLine(wxCmdLineParser& parser)
{
    wxAppConsole::OnInitCmdLine(parser);

    parser.AddOption("i", "image", "binary image to load",    wxCMD_LINE_VAL_STRING);
    parser.AddOption("a", "addr",  "load address (and start PC)", wxCMD_LINE_VAL_NUMBER);
    parser.AddOption("c", "ini",   "configuration file",      wxCMD_LINE_VAL_STRING);
    parser.AddOption("n", "tstates", "maximum T-states to run", wxCMD_LINE_VAL_NUMBER);
    parser.AddOption("l", "log",   "debug log file",          wxCMD_LINE_VAL_STRING);
    parser.AddSwitch("t", "trace", "trace every instruction to the debug log");
    parser.AddSwitch("s", "save",  "write the effective configuration to the ini");
}


bool
TheApp::OnCmdLineParsed(wxCmdLineParser& parser)
{
    const bool ok = wxAppConsole::OnCmdLineParsed(parser);
    if (!ok) {
        return false;
    }

    wxString str;
    long val;
    if (parser.Found("i", &str)) {
        m_image_path = host::asAbsolutePath(str.ToStdString());
    }
    if (parser.Found("c", &str)) {
        m_ini_path = str.ToStdString();
    }
    if (parser.Found("l", &str)) {
        m_log_path = str.ToStdString();
    } else {
        m_log_path = DEFAULT_LOG_NAME;
    }
    if (parser.Found("a", &val)) {
        if ((val < 0) || (val > 0xFFFF)) {
            UI_error("Load address %ld is outside the address space", val);
            return false;
        }
        m_load_addr = val;
    }
    if (parser.Found("n", &val)) {
        if (val <= 0) {
            UI_error("The T-state limit must be positive");
            return false;
        }
        m_max_tstates = val;
    }
    m_trace    = parser.Found("t");
    m_save_ini = parser.Found("s");

    return true;
}

// vim: ts=8:et:sw=4:smarttab
