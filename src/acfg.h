#ifndef _ACFG_H
#define _ACFG_H

#include "actypes.h"

extern "C"
{
struct timeval;
}

namespace dlbr
{

namespace cfg
{

// listening socket and public identity
extern mstring bindaddr, baseurl;
extern int port;

// remote chunk service
extern mstring upstreamurl, cafile, capath, dnsresconf;
extern int chunksize, maxsessions, sessionwait, fetchtimeout, fetchretries, retrybackoff, dnscachetime;

// link table
extern mstring linktable;
extern int linkrescan, linklifetime;

// client side
extern int sendwindow, nettimeout, maxdlspeed;

// process
extern mstring logdir, pidfile;
extern int debug, foreground;

/**
 * @brief Apply one setting, either "Key: value" (config file style) or "Key=value" (command line style)
 * @param sLine Input line
 * @param pErrorMsg Optional receiver of the problem description
 * @return True if the key is known and the value was accepted
 */
DLBR_API bool SetOption(string_view sLine, mstring* pErrorMsg = nullptr);

/**
 * @brief Read a configuration file, ignoring comments and empty lines.
 * @return Empty string on success, otherwise a description of the first problem
 */
DLBR_API mstring ReadConfigFile(cmstring& path);

/**
 * @brief Validate values after all inputs were processed and calculate derived values.
 * @return Empty string if the configuration is usable, otherwise the problem description
 */
DLBR_API mstring PostProcConfig();

//! Print the current settings in config file format
DLBR_API mstring DumpConfig();

const struct timeval * GetNetworkTimeout();
const struct timeval * GetFetchTimeout();

}

}

#endif
