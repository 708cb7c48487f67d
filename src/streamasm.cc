#include "streamasm.h"
#include "evabase.h"
#include "acfg.h"
#include "meta.h"
#include "debug.h"

using namespace std;

#define BACKOFF_CAP_MS 8000

namespace dlbr
{

tAssemblerParams tAssemblerParams::FromConfig()
{
	tAssemblerParams ret;
	ret.fetchRetries = max(cfg::fetchretries, 1);
	ret.retryBackoffMs = max(cfg::retrybackoff, 0);
	ret.fetchTimeoutMs = unsigned(max(cfg::fetchtimeout, 1)) * 1000;
	return ret;
}

tChunkWindow tChunkWindow::Cover(const tByteInterval &iv, off_t granularity, off_t totalSize)
{
	tChunkWindow ret;
	if (iv.length() <= 0 || granularity <= 0)
		return ret;
	ret.alignedStart = iv.start / granularity * granularity;
	ret.alignedEnd = min((iv.end / granularity + 1) * granularity - 1, totalSize - 1);
	return ret;
}

unsigned tStreamAssembler::GetBackoffMs(unsigned baseMs, unsigned attempt)
{
	if (attempt == 0)
		return 0;
	unsigned long ret = baseMs;
	for (unsigned i = 1; i < attempt && ret < BACKOFF_CAP_MS; ++i)
		ret *= 2;
	return unsigned(min(ret, (unsigned long) BACKOFF_CAP_MS));
}

tStreamAssembler::tStreamAssembler(IChunkSource &src, cmstring &handle, const tByteInterval &iv,
		off_t totalSize, const tAssemblerParams &params, tAction notify) :
		m_src(src), m_handle(handle), m_iv(iv), m_totalSize(totalSize),
		m_window(tChunkWindow::Cover(iv, src.GetGranularity(), totalSize)),
		m_params(params), m_notify(move(notify)),
		m_nextPos(iv.start)
{
	m_ready = make_eb();
	m_fetchTimer.reset(evtimer_new(evabase::base, cbFetchTimeout, this));
	m_backoffTimer.reset(evtimer_new(evabase::base, cbBackoff, this));
	CHECK_ALLOCATED(m_fetchTimer.valid() && m_backoffTimer.valid());
}

tStreamAssembler::~tStreamAssembler()
{
	// withdraw the pending request before the cursor goes away
	m_pendingNext.reset();
}

void tStreamAssembler::Start()
{
	LOGSTARTFUNCx(m_handle, m_iv.start, m_iv.end);
	if (m_iv.length() <= 0)
		return;
	Open();
	Pull();
}

void tStreamAssembler::Open()
{
	auto g = m_src.GetGranularity();
	auto offset = m_nextPos / g * g;
	m_cursorPos = offset;
	++m_nOpenCalls;
	m_cursor = m_src.Fetch(m_handle, offset, m_window.alignedEnd - offset + 1);
}

void tStreamAssembler::Pull()
{
	if (m_bFailed || m_pendingNext || !m_cursor || HasData() || m_nextPos > m_iv.end)
		return;
	++m_nNextCalls;
	auto tmout = MsecToTimeval(m_params.fetchTimeoutMs);
	event_add(*m_fetchTimer, &tmout);
	m_pendingNext = m_cursor->Next([this](tChunkEvent&& ev)
	{
		OnEvent(move(ev));
	});
}

void tStreamAssembler::OnEvent(tChunkEvent &&ev)
{
	LOGSTARTFUNC;
	// request is completed, nothing to cancel anymore
	m_pendingNext.release();
	event_del(*m_fetchTimer);

	switch (ev.error)
	{
	case EFetchError::NONE:
		break;
	case EFetchError::REMOTE_UNAVAILABLE:
		return Retry(move(ev.message));
	default:
		return Fail(ev.error, move(ev.message));
	}

	if (ev.IsEnd())
		return Fail(EFetchError::INTERRUPTED, "Premature end of remote data at " + offttos(m_cursorPos));

	auto len = off_t(evbuffer_get_length(*ev.data));
	auto chunkStart = m_cursorPos;
	m_cursorPos += len;

	// overlap after reopening, or the leading part of the first chunk
	auto skip = max(off_t(0), m_nextPos - chunkStart);
	if (skip >= len)
		return Pull();
	auto take = min(m_cursorPos - 1, m_iv.end) - (chunkStart + skip) + 1;
	if (skip)
		evbuffer_drain(*ev.data, skip);
	if (eb_move_range(*ev.data, *m_ready, take) != take)
		return Fail(EFetchError::INTERRUPTED, "Out of memory");
	m_nextPos += take;
	m_attempt = 0;

	// all there, the source is not needed anymore
	if (m_nextPos > m_iv.end)
		m_cursor.reset();

	Notify();
}

ssize_t tStreamAssembler::MoveTo(evbuffer *target)
{
	auto n = eb_move_range(*m_ready, target, evbuffer_get_length(*m_ready));
	if (n > 0)
		m_emitted += n;
	Pull();
	return n;
}

void tStreamAssembler::cbFetchTimeout(evutil_socket_t, short, void *arg)
{
	((tStreamAssembler*)arg)->OnFetchTimeout();
}

void tStreamAssembler::OnFetchTimeout()
{
	LOGSTARTFUNC;
	m_pendingNext.reset();
	Retry("Fetch timeout");
}

void tStreamAssembler::Retry(mstring &&why)
{
	LOGSTARTFUNCx(why, m_attempt);
	// the current request is gone, either way
	m_pendingNext.reset();
	m_cursor.reset();
	if (++m_attempt >= m_params.fetchRetries)
		return Fail(EFetchError::REMOTE_UNAVAILABLE, move(why));
	++m_nRetries;
	auto delay = MsecToTimeval(GetBackoffMs(m_params.retryBackoffMs, m_attempt));
	USRDBG("Fetching " << m_handle << " at " << m_nextPos << " failed (" << why
			<< "), retry in " << GetBackoffMs(m_params.retryBackoffMs, m_attempt) << " ms");
	event_add(*m_backoffTimer, &delay);
}

void tStreamAssembler::cbBackoff(evutil_socket_t, short, void *arg)
{
	auto me = (tStreamAssembler*)arg;
	me->Open();
	me->Pull();
}

void tStreamAssembler::Fail(EFetchError kind, mstring &&why)
{
	LOGSTARTFUNCx(why);
	m_pendingNext.reset();
	m_cursor.reset();
	event_del(*m_fetchTimer);
	event_del(*m_backoffTimer);
	m_bFailed = true;
	m_errKind = kind;
	m_errMsg = move(why);
	Notify();
}

void tStreamAssembler::Notify()
{
	// the consumer may destroy us from the callback
	auto notify = m_notify;
	notify();
}

}
