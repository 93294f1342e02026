// This module encapsulates non-gui, host-dependent services:
//    configuration persistence
//    debug logging
//    real time functions
//
// The configuration is kept in an .ini file, with data stored hierarchically.
// There are a few global ini values that describe the ini file format
// revision.  Beneath that is one set of core configuration state; the
// registers the reset sequence leaves undefined, the memory image to load,
// and the board level choices (clock period, interrupt timing).
//
// All the config* functions take as a first parameter the "subgroup", which
// is a concatenation of the ini storage path up until a final set of state.
// The "key" is the final level of lookup.  There is nothing special about it;
// the interface could have required the caller to send the subgroup+key, but
// this way seemed to save a bit of code at the call point.

#ifndef _INCLUDE_HOST_H_
#define _INCLUDE_HOST_H_

#include "z80cycle.h"

namespace host
{
    // must be called at time 0 to initialize things.
    // ini_path names the configuration file; it is created on save if it
    // doesn't exist yet.
    void initialize(const std::string &ini_path = DEFAULT_INI_NAME);

    // this should be called at the end of the world to really free resources.
    void terminate();

    // ---- read or write an entry in the configuration file ----
    // the configRead* functions take a defaultval; this is the value returned
    // if the key for that subgroup isn't found in the config file.

    bool configReadStr(  const std::string &subgroup,
                         const std::string &key,
                         std::string *val,
                         const std::string *defaultval = nullptr);

    void configWriteStr( const std::string &subgroup,
                         const std::string &key,
                         const std::string &val);

    bool configReadInt(  const std::string &subgroup,
                         const std::string &key,
                         int *val,
                         const int defaultval = 0);

    void configWriteInt( const std::string &subgroup,
                         const std::string &key,
                         const int val);

    // integers written in 0x hex notation, for addresses and register values
    void configWriteHex( const std::string &subgroup,
                         const std::string &key,
                         const int val,
                         const int digits);

    void configReadBool( const std::string &subgroup,
                         const std::string &key,
                         bool *val,
                         const bool defaultval = false);

    void configWriteBool(const std::string &subgroup,
                         const std::string &key,
                         const bool val);

    // force pending writes out to the ini file.  returns false on failure.
    bool configFlush();

    // ---- time functions ----

    // return the time in milliseconds as a 64b signed integer
    int64 getTimeMs();

    // ---- file path functions ----

    // make sure the name is put in normalized format
    std::string asAbsolutePath(const std::string &name);
};

// ------------------------------------------------------------------------
//  a small logging facility, not in the host namespace
// ------------------------------------------------------------------------

// open (truncating) the debug log.  returns false if it can't be opened.
bool dbglog_open(const std::string &logname);

// close the debug log, if it is open
void dbglog_close();

// printf-style logging; a no-op if the log isn't open
void dbglog(const char *fmt, ...);

#endif // _INCLUDE_HOST_H_

// vim: ts=8:et:sw=4:smarttab
