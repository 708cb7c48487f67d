#ifndef ACLOGGER_H_
#define ACLOGGER_H_

#include "actypes.h"

namespace dlbr
{
namespace cfg
{
extern int debug;
}

namespace log
{

enum ETypeFlags : int
{
	LOG_FLUSH = 1,
	LOG_MORE = 2,
	LOG_DEBUG = 4
};

//! True when the transfer log is active
extern bool logIsEnabled;
//! Prepended to the messages printed to stderr
extern LPCSTR g_szLogPrefix;

/**
 * @brief Open the log files in cfg::logdir, or attach to stderr if not configured.
 * @return Empty string on success, error description otherwise
 */
mstring open();
void close(bool bReopen);
void flush();

/**
 * @brief transfer writes one record into the transfer log
 * @param bytesOut Amount of body and head bytes sent to the client
 * @param client Client identification (host name or address)
 * @param path Requested resource, with optional status note
 * @param bError True if the transfer did not complete successfully
 */
void transfer(off_t bytesOut, cmstring& client, cmstring& path, bool bError);
void err(string_view msg);
void misc(string_view msg, char cLogType = 'M');
void dbg(string_view msg);

}
}

#endif /* ACLOGGER_H_ */
