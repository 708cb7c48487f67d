#include "job.h"

#include "debug.h"
#include "meta.h"
#include "acfg.h"
#include "acres.h"
#include "conn.h"
#include "header.h"
#include "httpdate.h"
#include "ahttpurl.h"
#include "astrop.h"
#include "streamasm.h"
#include "evabase.h"
#include "aevutil.h"

#include <algorithm>

#include <event2/buffer.h>

using namespace std;

namespace dlbr
{

uint_fast32_t g_genJobId = 0;

static const string miscError(" [HTTP error, code: ");

string_view GetStatusMessage(int code)
{
	switch (code)
	{
	case 200: return "OK"sv;
	case 206: return "Partial Content"sv;
	case 400: return "Bad Request"sv;
	case 404: return "Not Found"sv;
	case 405: return "Method Not Allowed"sv;
	case 410: return "Gone"sv;
	case 416: return "Range Not Satisfiable"sv;
	case 500: return "Internal Server Error"sv;
	case 502: return "Bad Gateway"sv;
	case 503: return "Service Unavailable"sv;
	default: return "Unknown"sv;
	}
}

job::job(IConnBase& parent) : m_parent(parent)
{
}

job::~job()
{
	LOGSTART("job::~job");

	// stop remote activity before the record is written
	StopRemote();

	// a client which went away early is not a failure of ours
	bool bErr = m_nStatus >= 400 || m_fetchError != EFetchError::NONE;

	auto repName = m_sPath.empty() ? mstring("-") : m_sPath;
	if (m_nStatus >= 400)
		repName += miscError + ltos(m_nStatus) + ']';
	else if (m_fetchError != EFetchError::NONE)
		repName += mstring(" [") + mstring(GetFetchErrorName(m_fetchError)) + ']';
	log::transfer(m_nAllDataCount, m_parent.getClientName(), repName, bErr);
}

inline ebstream job::GetBufFmter()
{
	if (!m_preHeadBuf.valid())
		m_preHeadBuf = make_eb();
	return ebstream(*m_preHeadBuf);
}

inline void job::PrependStatusLine(int code)
{
	m_nStatus = code;
	GetBufFmter() << (m_bIsHttp11 ? "HTTP/1.1 "sv : "HTTP/1.0 "sv)
			<< code << ' ' << GetStatusMessage(code) << svRN;
}

inline void job::AppendMetaHeaders()
{
	auto SB = GetBufFmter();

	if(m_keepAlive == KEEP)
		SB << "Connection: Keep-Alive\r\n"sv;
	else if(m_keepAlive == CLOSE)
		SB << "Connection: close\r\n"sv;
#ifdef DEBUG
	static atomic_int genHeadId(0);
	SB << "X-Debug: "sv << int(genHeadId++) << svRN;
#endif
	SB << "Date: "sv << tHttpDate(GetTime()).view()
	   << "\r\nServer: " DLBR_SERVER_ID "\r\n\r\n"sv;
}

void job::SetErrorResponse(int code, string_view errorKind)
{
	LOGSTARTFUNCx(code, errorKind);

	if (m_preHeadBuf.valid())
		ebstream(*m_preHeadBuf).clear();

	m_activity = STATE_SEND_BUF_ONLY;

	tSS body;
	if (code != 416)
		body << "{\"error\":\""sv << errorKind << "\"}"sv;

	PrependStatusLine(code);
	auto SB = GetBufFmter();
	SB << "Content-Length: "sv << body.size() << svRN;
	if (code == 416)
		SB << "Content-Range: bytes */"sv << (m_desc ? m_desc->totalSize : off_t(0)) << svRN;
	else
		SB << "Content-Type: application/json\r\n"sv;
	if (code == 405)
		SB << "Allow: GET, HEAD\r\n"sv;
	AppendMetaHeaders();
	if (!m_bIsHeadOnly)
		SB << body.view();
}

void job::PrepareFatalError(int code, string_view errorKind)
{
	LOGSTARTFUNCx(code);
	m_keepAlive = CLOSE;
	SetErrorResponse(code, errorKind);
}

inline bool job::ParseRoute(const header &h, mstring &token)
{
	auto url = h.getRequestUrl();
	string_view path;
	tHttpUrl absUrl;
	if (startsWith(url, "/"sv))
		path = url;
	else if (absUrl.SetHttpUrl(url, false))
		path = absUrl.sPath;
	else
		return false;
	m_sPath = mstring(path);

	auto qpos = path.find('?');
	if (qpos != stmiss)
		path = path.substr(0, qpos);
	if (path == "/health"sv)
		return false;

	string_view segs[2];
	unsigned n = 0;
	for (auto seg: tSplitWalk(path, "/"sv))
	{
		if (n == 2)
			break;
		segs[n++] = seg;
	}
	string_view rawToken;
	if (n == 1)
		rawToken = segs[0];
	else if (n == 2 && segs[0] == "dl"sv)
		rawToken = segs[1];
	else
		return false;
	token.clear();
	return UrlUnescapeAppend(rawToken, token) && IsValidToken(token);
}

void job::Prepare(const header &h, acres &res)
{
	LOGSTARTFUNCx(h.getRequestUrl());

	m_res = &res;
	m_bIsHttp11 = h.proto == header::HTTP_11;
	m_bIsHeadOnly = h.type == header::HEAD;

	auto conn = h.h[header::CONNECTION];
	if (conn)
	{
		if (CaseEqual(conn, "close"sv))
			m_keepAlive = CLOSE;
		else if (CaseEqual(conn, "keep-alive"sv))
			m_keepAlive = KEEP;
	}

	if (h.type != header::GET && h.type != header::HEAD)
	{
		m_sPath = mstring(h.getRequestUrl());
		// a request body might follow, not worth parsing
		m_keepAlive = CLOSE;
		return SetErrorResponse(405, "method_not_allowed"sv);
	}

	m_activity = STATE_RESOLVING;
	mstring token;
	if (!ParseRoute(h, token))
	{
		string_view path(m_sPath);
		auto qpos = path.find('?');
		if (qpos != stmiss)
			path = path.substr(0, qpos);
		if (path == "/health"sv)
		{
			PrependStatusLine(200);
			auto SB = GetBufFmter();
			SB << "Content-Length: 2\r\nContent-Type: text/plain\r\n"sv;
			AppendMetaHeaders();
			if (!m_bIsHeadOnly)
				SB << "OK"sv;
			m_activity = STATE_SEND_BUF_ONLY;
			return;
		}
		return SetErrorResponse(404, "not_found"sv);
	}

	auto found = res.GetLinkRegistry().Resolve(token, GetTime());
	switch (found.state)
	{
	case ELinkState::NOT_FOUND:
		return SetErrorResponse(404, "not_found"sv);
	case ELinkState::EXPIRED:
		return SetErrorResponse(410, "expired"sv);
	case ELinkState::FOUND:
		break;
	}
	m_desc = move(found.desc);

	m_activity = STATE_NEGOTIATING;
	m_range = NegotiateRange(h.h[header::RANGE], m_desc->totalSize);
	if (m_range.kind == tRangeVerdict::UNSATISFIABLE)
		return SetErrorResponse(416, "range_unsatisfiable"sv);

	if (m_bIsHeadOnly || m_range.iv.length() <= 0)
	{
		CookResponseHeader();
		m_activity = STATE_SEND_BUF_ONLY;
		return;
	}
	m_activity = STATE_WAIT_PERMIT;
}

inline void job::CookResponseHeader()
{
	LOGSTARTFUNC;

	bool partial = m_range.kind == tRangeVerdict::PARTIAL;
	PrependStatusLine(partial ? 206 : 200);
	auto SB = GetBufFmter();
	SB << "Content-Type: "sv << m_desc->mimeType
	   << "\r\nContent-Length: "sv << max(off_t(0), m_range.iv.length())
	   << "\r\nAccept-Ranges: bytes\r\n"sv;
	if (partial)
	{
		SB << "Content-Range: bytes "sv << m_range.iv.start << '-' << m_range.iv.end
		   << '/' << m_desc->totalSize << svRN;
	}
	if (!m_desc->fileName.empty())
	{
		mstring safeName;
		for (auto c: m_desc->fileName)
		{
			auto uc = (unsigned char) c;
			if (c == '"' || c == '\\')
				safeName += '\\';
			if (uc >= 0x20 && uc != 0x7f)
				safeName += c;
		}
		SB << "Content-Disposition: attachment; filename=\""sv << safeName << "\"\r\n"sv;
	}
	AppendMetaHeaders();
}

void job::cbPermitTimeout(evutil_socket_t, short, void *arg)
{
	auto me = (job*) arg;
	me->m_bPermitTimedOut = true;
	me->m_permitSub.reset();
	me->m_parent.poke(me->GetId());
}

inline void job::StartRemote()
{
	LOGSTARTFUNC;
	m_permitTimer.reset();
	m_assembler = make_unique<tStreamAssembler>(m_res->GetChunkSource(), m_desc->handle, m_range.iv,
			m_desc->totalSize, tAssemblerParams::FromConfig(), [this]()
	{
		m_parent.poke(GetId());
	});
	m_activity = STATE_WAIT_FIRST_DATA;
	m_assembler->Start();
}

inline void job::StopRemote()
{
	m_permitSub.reset();
	m_permitTimer.reset();
	// the assembler withdraws its fetch, then the session is returned
	m_assembler.reset();
	m_permit.reset();
}

inline void job::HandleFetchError()
{
	LOGSTARTFUNC;
	m_fetchError = m_assembler->GetErrorKind();
	auto msg = m_assembler->GetErrorMessage();
	StopRemote();

	// response ongoing, can only reject the client now
	if (m_activity == STATE_STREAMING)
	{
		log::err(tSS() << "Transfer of " << m_sPath << " interrupted after "
				<< m_nBodySent << " bytes: " << msg);
		m_activity = STATE_DISCO_ASAP;
		return;
	}

	log::err(tSS() << "Remote failure for " << m_sPath << ": " << msg);
	switch (m_fetchError)
	{
	case EFetchError::HANDLE_INVALID:
		return SetErrorResponse(502, GetFetchErrorName(m_fetchError));
	case EFetchError::INTERRUPTED:
		return SetErrorResponse(500, GetFetchErrorName(m_fetchError));
	default:
		return SetErrorResponse(503, GetFetchErrorName(EFetchError::REMOTE_UNAVAILABLE));
	}
}

job::eJobResult job::Resume(bufferevent* be)
{
	LOGSTARTFUNC;

	// use this return helper for better tracking, actually the caller should never return
	auto return_discon = [&](int IFDEBUG(line))
	{
		LOG("EXPLICIT DISCONNECT " << line);
		m_activity = STATE_DISCO_ASAP;
		return R_DISCON;
	};
	auto fin_stream_good = [&]()
	{
		LOG("CLEAN JOB FINISH");
		StopRemote();
		if(m_keepAlive == KEEP)
			return m_activity = STATE_DONE, R_DONE;
		if(m_keepAlive == CLOSE)
			return return_discon(__LINE__);
		// unspecified?
		if (m_bIsHttp11)
			return m_activity = STATE_DONE, R_DONE;
		return return_discon(__LINE__);
	};

	if (AC_UNLIKELY(!be))
		return return_discon(__LINE__); // shouldn't be here

	do
	{
		LOG(int(m_activity));

		if (m_preHeadBuf.valid())
		{
			ldbg("prebuf sending: " << evbuffer_get_length(*m_preHeadBuf));
			auto len = evbuffer_get_length(*m_preHeadBuf);
			if (0 != evbuffer_add_buffer(besender(be), *m_preHeadBuf))
				return return_discon(__LINE__);
			m_preHeadBuf.reset();
			m_nAllDataCount += len;

			if (m_activity == STATE_SEND_BUF_ONLY)
				return fin_stream_good();
		}

		switch (m_activity)
		{
		case STATE_DONE:
		case STATE_SEND_BUF_ONLY:
			return fin_stream_good();
		case STATE_RESOLVING:
		case STATE_NEGOTIATING:
		case STATE_DISCO_ASAP:
			return return_discon(__LINE__);
		case STATE_WAIT_PERMIT:
		{
			if (m_permit.valid())
			{
				StartRemote();
				continue;
			}
			if (m_bPermitTimedOut)
			{
				StopRemote();
				log::err(tSS() << "No remote session available for " << m_sPath);
				SetErrorResponse(503, GetFetchErrorName(EFetchError::REMOTE_UNAVAILABLE));
				continue;
			}
			if (m_permitSub)
				return R_WILLNOTIFY;

			m_permitTimer.reset(evtimer_new(evabase::base, cbPermitTimeout, this));
			CHECK_ALLOCATED(m_permitTimer.get());
			timeval tmout { max(cfg::sessionwait, 0), 0 };
			event_add(*m_permitTimer, &tmout);
			m_permitSub = m_res->GetSessionPool().Acquire([this](tPermit&& p)
			{
				m_permit = move(p);
				m_permitSub.release();
				m_permitTimer.reset();
				m_parent.poke(GetId());
			});
			return R_WILLNOTIFY;
		}
		case STATE_WAIT_FIRST_DATA:
		{
			if (m_assembler->IsFailed())
			{
				HandleFetchError();
				continue;
			}
			if (!m_assembler->HasData() && !m_assembler->IsDone())
				return R_WILLNOTIFY;
			CookResponseHeader();
			m_activity = STATE_STREAMING;
			continue;
		}
		case STATE_STREAMING:
		{
			if (m_assembler->IsFailed())
			{
				HandleFetchError();
				continue;
			}
			if (off_t(evbuffer_get_length(besender(be))) > cfg::sendwindow)
				return R_WILLNOTIFY;
			if (m_assembler->HasData())
			{
				auto n = m_assembler->MoveTo(besender(be));
				if (n < 0)
					return return_discon(__LINE__);
				m_nAllDataCount += n;
				m_nBodySent += n;
				continue;
			}
			if (m_assembler->IsDone())
			{
				ASSERT(m_nBodySent == m_range.iv.length());
				return fin_stream_good();
			}
			return R_WILLNOTIFY;
		}
		}
	} while(true);

	return return_discon(__LINE__);
}

}
