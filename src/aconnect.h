#ifndef ACONNECT_H
#define ACONNECT_H

#include "fileio.h"

#include <functional>

namespace dlbr
{

using tComError = unsigned;

//! Nature of a connection fault, bit flags
enum eTransErrors : tComError
{
	TRANS_DNS_NOTFOUND = 0x1,
	TRANS_TIMEOUT = 0x2,
	// set on success when an idle stream was reused
	TRANS_WAS_USED = 0x4,
	TRANS_INTERNAL_ERROR = 0x8,
	TRANS_FAULTY_SSL_PEER = 0x10
};

/**
 * @brief Short living object used to establish TCP connection to a target
 *
 * Tries the resolved addresses one after another, starting the next
 * candidate in parallel when the previous one does not answer quickly.
 */
struct DLBR_API aconnector
{
	struct DLBR_API tConnResult
	{
		unique_fd fd;
		std::string sError;
		tComError flags;
	};

	using tCallback = std::function<void (tConnResult)>;

	/**
	 * @brief Start connection asynchronously and report result via callback
	 * @param timeout Seconds, -1 for NetworkTimeout, 0 for no limit
	 * @return Cancellation handle, the callback is not invoked after its destruction
	 *
	 * Thread context: main thread
	 */
	static TFinalAction Connect(cmstring& target, uint16_t port, tCallback cbReport, int timeout = -1);
};
}
#endif // ACONNECT_H
