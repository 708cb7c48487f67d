#include "httpchunksrc.h"
#include "atransport.h"
#include "evabase.h"
#include "header.h"
#include "acfg.h"
#include "meta.h"
#include "astrop.h"
#include "debug.h"

#include <event2/bufferevent.h>

using namespace std;

namespace dlbr
{

static mstring FormatHostHeader(const tHttpUrl& url)
{
	mstring ret;
	bool isV6 = url.sHost.find(':') != stmiss;
	if (isV6)
		ret += '[';
	ret += url.sHost;
	if (isV6)
		ret += ']';
	if (url.GetPort() != url.GetDefaultPortForProto())
	{
		ret += ':';
		ret += ltos(url.GetPort());
	}
	return ret;
}

class tHttpChunkCursor : public IChunkCursor
{
	tHttpChunkSource& m_src;
	mstring m_handle;
	// next position to fetch and the last position of the whole range
	off_t m_pos, m_end;

	lint_ptr<atransport> m_strm;
	TFinalAction m_connecting;
	tReceiver m_receiver;
	// incremented with each request, identifies stale deliveries
	unsigned m_nGen = 0;

	header m_head;
	bool m_bHeadSeen = false;
	// request sent, response not completely consumed
	bool m_bInFlight = false;
	// the connection is not clean after the current exchange
	bool m_bNoReuse = false;
	// the transport came from a previous exchange
	bool m_bReused = false;
	bool m_bRetriedStale = false;
	bool m_bGotResponseData = false;
	// body is delimited by the connection end
	bool m_bUntilClose = false;
	// no more data after the current chunk
	bool m_bEof = false;
	off_t m_reqLen = 0, m_bodyRemaining = 0;
	unique_eb m_body;

public:
	tHttpChunkCursor(tHttpChunkSource& src, cmstring& handle, off_t offset, off_t maxLength) :
		m_src(src), m_handle(handle), m_pos(offset), m_end(offset + maxLength - 1)
	{
	}

	~tHttpChunkCursor()
	{
		m_connecting.reset();
		DropTransport();
	}

	TFinalAction Next(tReceiver rcvr) override
	{
		LOGSTARTFUNCx(m_handle, m_pos);
		m_receiver = move(rcvr);
		auto gen = ++m_nGen;

		if (m_bEof || m_pos > m_end)
		{
			evabase::Post([pin = as_lptr(this), gen]()
			{
				if (pin->m_nGen == gen && pin->m_receiver)
					pin->Deliver(tChunkEvent());
			});
		}
		else
		{
			m_reqLen = min(m_src.GetGranularity(), m_end - m_pos + 1);
			m_bRetriedStale = false;
			if (m_strm)
			{
				m_bReused = true;
				SendRequest();
			}
			else
				Connect(false);
		}
		return TFinalAction([pin = as_lptr(this), gen]()
		{
			if (pin->m_nGen == gen)
				pin->Cancel();
		});
	}

private:

	void Cancel()
	{
		++m_nGen;
		m_receiver = tReceiver();
		m_connecting.reset();
		// a half consumed response cannot be recovered
		if (m_bInFlight)
		{
			m_bNoReuse = true;
			DropTransport();
		}
	}

	void DropTransport()
	{
		if (!m_strm)
			return;
		if (m_strm->GetBufferEvent())
		{
			bufferevent_setcb(m_strm->GetBufferEvent(), nullptr, nullptr, nullptr, nullptr);
			bufferevent_disable(m_strm->GetBufferEvent(), EV_READ | EV_WRITE);
		}
		if (m_bInFlight || m_bNoReuse)
			m_strm.reset();
		else
			atransport::Return(m_strm);
		m_bInFlight = false;
		m_bNoReuse = false;
	}

	void Connect(bool noCache)
	{
		m_bReused = false;
		m_connecting = atransport::Create(m_src.GetBaseUrl(),
				[this](atransport::tResult res)
				{
					OnConnected(move(res));
				},
				m_src.GetResources(),
				atransport::TConnectParms().SetNoCache(noCache));
	}

	void OnConnected(atransport::tResult res)
	{
		LOGSTARTFUNCx(res.err, res.flags);
		m_connecting.release();
		if (!res.strm)
			return Fail(EFetchError::REMOTE_UNAVAILABLE, res.err.empty() ? mstring("Connection failed") : res.err);
		m_strm = move(res.strm);
		m_bReused = res.flags & TRANS_WAS_USED;
		SendRequest();
	}

	void SendRequest()
	{
		auto bev = m_strm->GetBufferEvent();
		m_head.clear();
		m_bHeadSeen = m_bGotResponseData = m_bUntilClose = m_bNoReuse = false;
		m_bInFlight = true;
		m_body = make_eb();

		bufferevent_setcb(bev, cbRead, nullptr, cbEvent, this);
		auto tmout = cfg::GetNetworkTimeout();
		bufferevent_set_timeouts(bev, tmout, tmout);

		auto& url = m_src.GetBaseUrl();
		ebstream req(bev);
		req << "GET " << m_src.MakeRemotePath(m_handle) << " HTTP/1.1\r\nHost: " << FormatHostHeader(url)
				<< "\r\nRange: bytes=" << m_pos << '-' << (m_pos + m_reqLen - 1)
				<< "\r\nUser-Agent: " DLBR_SERVER_ID "\r\n";
		if (!m_src.GetAuthHeader().empty())
			req << "Authorization: Basic " << m_src.GetAuthHeader() << svRN;
		req << "Connection: keep-alive\r\n\r\n";
		LOG("Requesting " << m_handle << " at " << m_pos << ", length " << m_reqLen);
		bufferevent_enable(bev, EV_READ | EV_WRITE);
	}

	static void cbRead(bufferevent*, void* ctx)
	{
		((tHttpChunkCursor*)ctx)->OnRead();
	}

	static void cbEvent(bufferevent*, short what, void* ctx)
	{
		((tHttpChunkCursor*)ctx)->OnStreamEvent(what);
	}

	void OnRead()
	{
		auto input = bereceiver(m_strm->GetBufferEvent());
		if (evbuffer_get_length(input))
			m_bGotResponseData = true;

		if (!m_bHeadSeen)
		{
			auto hlen = m_head.Load(input);
			if (hlen == 0)
				return;
			if (hlen < 0 || m_head.type != header::ANSWER)
			{
				m_bNoReuse = true;
				return Fail(EFetchError::REMOTE_UNAVAILABLE, "Malformed response from the remote service");
			}
			evbuffer_drain(input, hlen);
			m_bHeadSeen = true;
			if (!OnHead())
				return;
		}

		if (m_bUntilClose)
			m_bodyRemaining -= eb_move_range(input, *m_body, min(m_bodyRemaining, off_t(evbuffer_get_length(input))));
		else if (m_bodyRemaining > 0)
			m_bodyRemaining -= eb_move_range(input, *m_body, m_bodyRemaining);

		if (m_bodyRemaining <= 0)
			return Complete();
	}

	/**
	 * @brief Evaluate the response head and prepare the body reception
	 * @return false if the exchange is finished already
	 */
	bool OnHead()
	{
		auto st = m_head.getStatus();
		LOG("Remote status: " << st.code << " " << st.msg);

		if (m_head.proto == header::HTTP_10)
			m_bNoReuse = true;
		if (m_head.h[header::CONNECTION] && CaseEqual(m_head.h[header::CONNECTION], "close"sv))
			m_bNoReuse = true;

		auto te = m_head.h[header::TRANSFER_ENCODING];
		if (te && !CaseEqual(te, "identity"sv))
		{
			m_bNoReuse = true;
			Fail(EFetchError::REMOTE_UNAVAILABLE, "Unsupported transfer encoding from the remote service");
			return false;
		}
		off_t contLen = -1;
		if (m_head.h[header::CONTENT_LENGTH])
			contLen = atoofft(m_head.h[header::CONTENT_LENGTH], -1);

		switch (st.code)
		{
		case 206:
		{
			off_t from(-1), to(-1), total(-1);
			if (!m_head.h[header::CONTENT_RANGE]
				|| !ParseContentRange(m_head.h[header::CONTENT_RANGE], from, to, total)
				|| from != m_pos
				|| to - from + 1 > m_reqLen
				|| (contLen >= 0 && contLen != to - from + 1))
			{
				m_bNoReuse = true;
				Fail(EFetchError::REMOTE_UNAVAILABLE, "Unexpected range from the remote service");
				return false;
			}
			m_bodyRemaining = to - from + 1;
			if (m_bodyRemaining < m_reqLen)
				m_bEof = true;
			return true;
		}
		case 200:
			// range not supported remotely, only usable for the start of the file
			if (m_pos != 0)
			{
				m_bNoReuse = true;
				Fail(EFetchError::REMOTE_UNAVAILABLE, "Remote service ignores range requests");
				return false;
			}
			// the rest of the body is not consumed
			m_bNoReuse = true;
			if (contLen < 0)
			{
				m_bUntilClose = true;
				m_bodyRemaining = m_reqLen;
			}
			else
			{
				m_bodyRemaining = min(contLen, m_reqLen);
				if (contLen <= m_reqLen)
					m_bEof = true;
			}
			return true;
		case 416:
			m_bNoReuse = true;
			m_bEof = true;
			m_bodyRemaining = 0;
			return true;
		case 408:
		case 429:
			m_bNoReuse = true;
			Fail(EFetchError::REMOTE_UNAVAILABLE, "Remote service busy: " + st.msg);
			return false;
		default:
			m_bNoReuse = true;
			if (st.code >= 400 && st.code < 500)
				Fail(EFetchError::HANDLE_INVALID, "Remote service rejected the handle: " + ltos(st.code) + " " + st.msg);
			else
				Fail(EFetchError::REMOTE_UNAVAILABLE, "Remote service failure: " + ltos(st.code) + " " + st.msg);
			return false;
		}
	}

	void OnStreamEvent(short what)
	{
		LOGSTARTFUNCx(what);
		m_bNoReuse = true;
		if (m_bHeadSeen && m_bUntilClose && (what & BEV_EVENT_EOF))
		{
			// body delimited by the connection end, nothing more to come
			auto input = bereceiver(m_strm->GetBufferEvent());
			eb_move_range(input, *m_body, min(m_bodyRemaining, off_t(evbuffer_get_length(input))));
			m_bEof = true;
			return Complete();
		}
		if (!m_bGotResponseData && m_bReused && !m_bRetriedStale)
		{
			// the remote side closed the idle connection meanwhile
			LOG("Stale connection, reconnecting");
			m_bRetriedStale = true;
			DropTransport();
			return Connect(true);
		}
		if (what & BEV_EVENT_TIMEOUT)
			return Fail(EFetchError::REMOTE_UNAVAILABLE, "Timeout while receiving remote data");
		Fail(EFetchError::REMOTE_UNAVAILABLE, "Connection to the remote service lost");
	}

	void Complete()
	{
		if (m_bNoReuse)
			DropTransport();
		else
		{
			auto bev = m_strm->GetBufferEvent();
			bufferevent_setcb(bev, nullptr, nullptr, nullptr, nullptr);
			bufferevent_disable(bev, EV_READ | EV_WRITE);
		}
		m_bInFlight = false;

		tChunkEvent ev;
		auto len = off_t(evbuffer_get_length(*m_body));
		if (len > 0)
		{
			ev.data = move(m_body);
			m_pos += len;
		}
		else
			m_bEof = true;
		Deliver(move(ev));
	}

	void Fail(EFetchError err, mstring msg)
	{
		LOGSTARTFUNCx(int(err), msg);
		m_bNoReuse = true;
		DropTransport();
		tChunkEvent ev;
		ev.error = err;
		ev.message = move(msg);
		Deliver(move(ev));
	}

	void Deliver(tChunkEvent&& ev)
	{
		// the receiver might release the last reference
		auto pin = as_lptr(this);
		auto rcvr = move(m_receiver);
		m_receiver = tReceiver();
		++m_nGen;
		if (rcvr)
			rcvr(move(ev));
	}
};

tHttpChunkSource::tHttpChunkSource(acres &res, const tHttpUrl &baseUrl, off_t granularity) :
		m_res(res), m_base(baseUrl), m_granularity(granularity)
{
	if (!m_base.sUserPass.empty())
		m_authHeader = EncodeBase64Auth(m_base.sUserPass);
}

lint_ptr<IChunkCursor> tHttpChunkSource::Fetch(cmstring &handle, off_t offset, off_t maxLength)
{
	return static_lptr_cast<IChunkCursor>(make_lptr<tHttpChunkCursor>(*this, handle, offset, maxLength));
}

mstring tHttpChunkSource::MakeRemotePath(cmstring &handle) const
{
	auto ret = m_base.sPath;
	if (!endsWith(ret, "/"sv))
		ret += '/';
	UrlEscapeAppend(handle, ret, false);
	return ret;
}

}
