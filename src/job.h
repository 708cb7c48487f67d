#ifndef _JOB_H
#define _JOB_H

#include "config.h"
#include "acbuf.h"
#include "aevutil.h"
#include "actemplates.h"
#include "linkreg.h"
#include "rangeneg.h"
#include "sessionpool.h"
#include "chunksrc.h"
#include "debug.h"

#include <memory>

namespace dlbr
{

class IConnBase;
class header;
class acres;
class tStreamAssembler;

extern uint_fast32_t g_genJobId;

/**
 * One request on a client connection, from the parsed head until the last body byte.
 */
class job
{
public:

	enum eJobResult : short
	{
		R_DONE = 0, R_DISCON = 2, R_WILLNOTIFY
	};
	job(IConnBase& parent);

	~job();

	void Prepare(const header &h, acres& res);
	void PrepareFatalError(int code, string_view errorKind);
	/**
	 * @brief Push the response forward as far as possible
	 * @return R_DONE if finished and the next job may start, R_WILLNOTIFY if waiting
	 * for a notification through IConnBase::poke, R_DISCON to drop the connection
	 */
	eJobResult Resume(bufferevent* be);

	uint_fast32_t GetId() { return IFDEBUGELSE(m_id, 0); }

SUTPRIVATE:

	typedef enum : short
	{
		STATE_RESOLVING,
		STATE_NEGOTIATING,
		STATE_WAIT_PERMIT,
		STATE_WAIT_FIRST_DATA,
		STATE_STREAMING,
		STATE_DONE,
		STATE_DISCO_ASAP,
		// only the prepared head buffer is sent, then finish
		STATE_SEND_BUF_ONLY
	} eActivity;

	IConnBase& m_parent;
	acres* m_res = nullptr;
#ifdef DEBUG
	uint_fast32_t m_id = g_genJobId++;
#endif
	bool m_bIsHttp11 = true;
	bool m_bIsHeadOnly = false;
	bool m_bPermitTimedOut = false;

	enum EKeepAliveMode : uint8_t
	{
		CLOSE = 'c',
		KEEP,
		UNSPECIFIED
	} m_keepAlive = UNSPECIFIED;

	eActivity m_activity = STATE_RESOLVING;
	/**
	 * @brief m_preHeadBuf collects header data which shall be sent out ASAP.
	 *
	 * Initialized by GetBufFmter, invalidated after sending the contents.
	 */
	unique_eb m_preHeadBuf;
	mstring m_sPath;
	tFileDescPtr m_desc;
	tRangeVerdict m_range;
	int m_nStatus = 0;
	EFetchError m_fetchError = EFetchError::NONE;

	TFinalAction m_permitSub;
	tPermit m_permit;
	unique_event m_permitTimer;
	std::unique_ptr<tStreamAssembler> m_assembler;

	off_t m_nAllDataCount = 0;
	off_t m_nBodySent = 0;

	job(const job&) = delete;
	job& operator=(const job&) = delete;

	inline bool ParseRoute(const header& h, mstring& token);
	inline void StartRemote();
	inline void StopRemote();
	inline void CookResponseHeader();
	void SetErrorResponse(int code, string_view errorKind);
	inline void HandleFetchError();
	inline void AppendMetaHeaders();
	inline void PrependStatusLine(int code);
	static void cbPermitTimeout(evutil_socket_t, short, void*);
	/**
	 * @brief GetBufFmter prepares the formatting buffer
	 * @return Format object usable for convenient data adding, which is sent ASAP in the next operation cycles
	 */
	inline ebstream GetBufFmter();
};

//! Standard reason phrase for the status codes used here
string_view GetStatusMessage(int code);

}

#endif
