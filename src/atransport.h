#ifndef ATRANSPORT_H
#define ATRANSPORT_H

#include "acsmartptr.h"
#include "actemplates.h"
#include "aevutil.h"
#include "ahttpurl.h"
#include "aconnect.h"

namespace dlbr
{

struct tConnContext;
class acres;

/**
  * A transport represents an established stream to the remote chunk service.
  * It handles connection setup, the TLS handshake and internal crypto overlay setup,
  * and keeps idle streams for reuse.
  */
class DLBR_API atransport : public tLintRefcounted
{
protected:
	unique_bufferevent m_buf;
	bool m_bIsSslStream = false;
	tHttpUrl m_url;
	friend struct tConnContext;

public:
	atransport() =default;
	virtual ~atransport() =default;
	struct tResult
	{
		lint_ptr<atransport> strm;
		mstring err;
		tComError flags;
		tResult(tComError flags, string_view errMsg);
		tResult(tComError flags, lint_ptr<atransport>);
	};
	using tCallBack = std::function<void(tResult)>;

	struct TConnectParms
	{
		bool noCache; // always build a new connection
		int timeoutSeconds; // timeout value, -1 for config default, 0 to disable timeout

		TConnectParms() : noCache(false), timeoutSeconds(-1) {}

		TConnectParms& SetNoCache(bool val) { noCache = val; return *this; }
	};

	/**
	 * @brief Create a new stream or pick a cached one
	 * @return Cancellation handle, the callback is not invoked after its destruction
	 */
	static TFinalAction Create(tHttpUrl, const tCallBack&, acres& res, TConnectParms extHints = TConnectParms());

	/**
	 * @brief Return an item to cache for reuse by others, or destroy if not cacheable
	 */
	static void Return(lint_ptr<atransport>& stream);

	bufferevent *GetBufferEvent() { return *m_buf; }
};

}

#endif // ATRANSPORT_H
