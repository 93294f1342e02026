// ============================================================================
// headers
// ============================================================================

#include "Ui.h"                 // for UI_error(), UI_warn()
#include "host.h"

#include "wx/filename.h"        // for wxFileName
#include "wx/fileconf.h"        // for configuration state object
#include "wx/stopwatch.h"       // for wxStopWatch
#include "wx/string.h"

#include <cstdarg>              // for var args
#include <fstream>

// ============================================================================
// module state
// ============================================================================

static std::unique_ptr<wxFileConfig> config;     // configuration file object
static std::unique_ptr<wxStopWatch>  stopwatch;  // time program started

// everything this program saves lives below this path
static const char *config_root = "/z80cycle/config-0/";

// ============================================================================
// file-local functions
// ============================================================================

// check the ini file format revision
static void
checkConfigVersion()
{
    std::string subgroup("..");
    std::string foo;

    const bool b = host::configReadStr(subgroup, "configversion", &foo);
    if (b && (foo != "1")) {
        UI_warn("Configuration file version '%s' found.\n"
                 "Version '1' expected.\n"
                 "Attempting to read the config file anyway.\n", foo.c_str());
    }
}

// ------------------------------------------------------------------------
//  a small logging facility, not in the host namespace
// ------------------------------------------------------------------------

static std::ofstream dbg_ofs;

bool
dbglog_open(const std::string &logname)
{
    dbglog_close();     // only one log at a time
    dbg_ofs.open(logname.c_str(), std::ofstream::out | std::ofstream::trunc);
    if (!dbg_ofs.good()) {
        UI_error("Error opening '%s' for logging.\n", logname.c_str());
        return false;
    }
    return true;
}


void
dbglog_close()
{
    if (dbg_ofs.is_open()) {
        dbg_ofs.close();
    }
    dbg_ofs.clear();
}


void
dbglog(const char *fmt, ...)
{
    if (!dbg_ofs.is_open()) {
        return;
    }

    char buff[1000];
    va_list args;

    va_start(args, fmt);
    vsnprintf(&buff[0], sizeof(buff), fmt, args);
    va_end(args);

    if (dbg_ofs.good()) {
        dbg_ofs << &buff[0];
        // this is useful if we are getting assert()s, causing
        // the last buffered block to not appear in the log.
        dbg_ofs.flush();
    }
}


// ============================================================================
// "public" functions
// ============================================================================

void
host::initialize(const std::string &ini_path)
{
    wxFileName fn(ini_path);
    fn.MakeAbsolute();

    config = std::make_unique<wxFileConfig>(
                wxEmptyString,                  // appName
                wxEmptyString,                  // vendorName
                fn.GetFullPath(),               // localFilename
                wxEmptyString,                  // globalFilename
                wxCONFIG_USE_LOCAL_FILE
             );

    // needed so we can compute a time difference to get ms later
    stopwatch = std::make_unique<wxStopWatch>();
    stopwatch->Start(0);

    checkConfigVersion();
}


// host is a kind of singleton, and as such it isn't owned and thus isn't
// destroyed by going out of scope.  Instead, the runner calls this at exit.
void
host::terminate()
{
    if (config) {
        host::configWriteStr("..", "configversion", "1");
        (void)configFlush();
    }
    config    = nullptr;
    stopwatch = nullptr;

    dbglog_close();       // turn off logging
}


// make sure the name is put in normalized format
std::string
host::asAbsolutePath(const std::string &name)
{
    wxFileName fn(name);
    fn.MakeAbsolute();
    std::string rv(fn.GetFullPath());
    return rv;
}


// ----------------------------------------------------------------------------
// Application configuration storage
// ----------------------------------------------------------------------------

// fetch an association from the configuration file
bool
host::configReadStr(const std::string &subgroup,
                    const std::string &key,
                    std::string *val,
                    const std::string *defaultval)
{
    assert(val != nullptr);
    assert(config != nullptr);
    wxString wxval;
    config->SetPath(config_root + subgroup);
    bool b = config->Read(key, &wxval);
    if (!b && (defaultval != nullptr)) {
        *val = *defaultval;
    } else {
        *val = wxval.ToStdString();
    }
    return b;
}


bool
host::configReadInt(const std::string &subgroup,
                    const std::string &key,
                    int *val,
                    const int defaultval)
{
    assert(val != nullptr);
    std::string valstr;
    bool b = configReadStr(subgroup, key, &valstr);
    long v = 0;
    if (b) {
        wxString wxv(valstr);
        b = wxv.ToLong(&v, 0);  // 0 means allow hex and octal notation too
    }
    *val = (b) ? (int)v : defaultval;
    return b;
}


void
host::configReadBool(const std::string &subgroup,
                     const std::string &key,
                     bool *val,
                     const bool defaultval)
{
    assert(val != nullptr);
    int v = 0;
    const bool b = configReadInt(subgroup, key, &v, ((defaultval) ? 1:0));
    if (b && (v >= 0) && (v <= 1)) {
        *val = (v==1);
    } else {
        *val = defaultval;
    }
}


// send a string association to the configuration file
void
host::configWriteStr(const std::string &subgroup,
                     const std::string &key,
                     const std::string &val)
{
    assert(config != nullptr);
    wxString wxKey(key);
    wxString wxVal(val);
    config->SetPath(config_root + subgroup);
    if (!config->Write(wxKey, wxVal)) {
        UI_warn("Couldn't save configuration key '%s/%s'",
                subgroup.c_str(), key.c_str());
    }
}


// send an integer association to the configuration file
void
host::configWriteInt(const std::string &subgroup,
                     const std::string &key,
                     const int val)
{
    wxString foo;
    foo.Printf("%d", val);
    configWriteStr(subgroup, key, foo.ToStdString());
}


void
host::configWriteHex(const std::string &subgroup,
                     const std::string &key,
                     const int val,
                     const int digits)
{
    wxString foo;
    foo.Printf("0x%0*X", digits, val);
    configWriteStr(subgroup, key, foo.ToStdString());
}


// send a boolean association to the configuration file
void
host::configWriteBool(const std::string &subgroup,
                      const std::string &key,
                      const bool val)
{
    const int foo = (val) ? 1 : 0;
    configWriteInt(subgroup, key, foo);
}


bool
host::configFlush()
{
    if (!config) {
        return false;
    }
    if (!config->Flush()) {
        UI_error("Couldn't write the configuration file");
        return false;
    }
    return true;
}

// ----------------------------------------------------------------------------
// real time functions
// ----------------------------------------------------------------------------

// return the time in milliseconds as a 64b signed integer
int64
host::getTimeMs()
{
    // NB: wxLongLong can't be mapped directly to "long long" type,
    //     thus the following gyrations
    const wxLongLong x_time_us = stopwatch->TimeInMicro();
    const uint32 x_low     = x_time_us.GetLo();
    const  int32 x_high    = x_time_us.GetHi();
    const  int64 x_time_ms = (((int64)x_high << 32) | x_low) / 1000;
    return x_time_ms;
}

// vim: ts=8:et:sw=4:smarttab
