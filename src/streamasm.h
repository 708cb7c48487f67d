#ifndef STREAMASM_H
#define STREAMASM_H

#include "chunksrc.h"
#include "rangeneg.h"

namespace dlbr
{

struct tAssemblerParams
{
	// failed attempts in a row until the stream is given up
	unsigned fetchRetries = 4;
	// base of the exponential backoff between attempts
	unsigned retryBackoffMs = 250;
	// limit for a single fetch step
	unsigned fetchTimeoutMs = 30000;

	static tAssemblerParams FromConfig();
};

//! Aligned region of the remote file which covers an interval
struct tChunkWindow
{
	off_t alignedStart = 0, alignedEnd = -1;
	static tChunkWindow Cover(const tByteInterval& iv, off_t granularity, off_t totalSize);
};

/**
 * Pulls the chunks of an interval from a chunk source and exposes exactly the
 * bytes of the interval, in order.
 *
 * At most one chunk is requested while the previous one waits for the consumer
 * in the ready slot. Transient failures are retried with exponential backoff
 * by reopening the source at the aligned position of the first missing byte.
 *
 * The notification callback is invoked (from the event loop) after every state
 * change, it may destroy this object.
 */
class DLBR_API tStreamAssembler
{
public:
	tStreamAssembler(IChunkSource& src, cmstring& handle, const tByteInterval& iv, off_t totalSize,
			const tAssemblerParams& params, tAction notify);
	~tStreamAssembler();

	//! Open the source and request the first chunk
	void Start();

	bool HasData() const { return m_ready.valid() && evbuffer_get_length(*m_ready); }
	//! Move the ready bytes into the target buffer, and request the next chunk. @return Moved byte count or -1 on error
	ssize_t MoveTo(evbuffer* target);
	//! All bytes of the interval were handed over
	bool IsDone() const { return !m_bFailed && m_nextPos > m_iv.end && !HasData(); }
	bool IsFailed() const { return m_bFailed; }
	EFetchError GetErrorKind() const { return m_errKind; }
	cmstring& GetErrorMessage() const { return m_errMsg; }
	off_t GetEmitted() const { return m_emitted; }

	// diagnostics
	unsigned GetNextCalls() const { return m_nNextCalls; }
	unsigned GetRetries() const { return m_nRetries; }

	static unsigned GetBackoffMs(unsigned baseMs, unsigned attempt);

SUTPRIVATE:
	IChunkSource& m_src;
	mstring m_handle;
	tByteInterval m_iv;
	off_t m_totalSize;
	tChunkWindow m_window;
	tAssemblerParams m_params;
	tAction m_notify;

	lint_ptr<IChunkCursor> m_cursor;
	TFinalAction m_pendingNext;
	unique_event m_fetchTimer, m_backoffTimer;
	unique_eb m_ready;

	// position of the next chunk delivered by the current cursor
	off_t m_cursorPos = 0;
	// first byte not yet put into the ready slot
	off_t m_nextPos = 0;
	off_t m_emitted = 0;
	unsigned m_attempt = 0;
	bool m_bFailed = false;
	EFetchError m_errKind = EFetchError::NONE;
	mstring m_errMsg;

	unsigned m_nNextCalls = 0, m_nOpenCalls = 0, m_nRetries = 0;

	void Open();
	void Pull();
	void OnEvent(tChunkEvent&& ev);
	void OnFetchTimeout();
	void Retry(mstring&& why);
	void Fail(EFetchError kind, mstring&& why);
	void Notify();
	static void cbFetchTimeout(evutil_socket_t, short, void*);
	static void cbBackoff(evutil_socket_t, short, void*);
};

}

#endif // STREAMASM_H
