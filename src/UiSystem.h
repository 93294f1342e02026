// TheApp is where the runner first "wakes up", in the OnInit() function.
// There is no event loop to speak of: once the command line has been parsed
// and the board built, OnRun() clocks the core until it halts, runs out of
// its T-state allowance, or stops on a design fault, then reports the final
// register state.

#ifndef _INCLUDE_UI_SYSTEM_H_
#define _INCLUDE_UI_SYSTEM_H_

#include "z80cycle.h"

#include "wx/app.h"

class wxCmdLineParser;

class TheApp : public wxAppConsole
{
public:
    TheApp() = default;
    CANT_ASSIGN_CLASS(TheApp);

private:
    // if OnInit() returns false, the application terminates
    bool OnInit() override;

    // the whole simulation run; the return value is the exit code
    int OnRun() override;

    // like the name says
    int OnExit() override;

    // set the command line parsing options
    void OnInitCmdLine(wxCmdLineParser& parser) override;

    // after the command line has been parsed, decode what it finds
    bool OnCmdLineParsed(wxCmdLineParser& parser) override;

    // ---- options from the command line ----
    std::string m_ini_path  = DEFAULT_INI_NAME;
    std::string m_log_path;
    std::string m_image_path;       // overrides the ini when not empty
    long        m_load_addr = -1;   // overrides the ini when >= 0
    long        m_max_tstates = 1000000;
    bool        m_trace     = false;
    bool        m_save_ini  = false;
};

#endif // _INCLUDE_UI_SYSTEM_H_

// vim: ts=8:et:sw=4:smarttab
