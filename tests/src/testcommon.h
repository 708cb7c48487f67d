#ifndef TESTCOMMON_H
#define TESTCOMMON_H

#include "main.h"
#include "acres.h"
#include "aclock.h"
#include "ac3rdparty.h"
#include "chunksrc.h"
#include "linkreg.h"
#include "sessionpool.h"
#include "conn.h"
#include "header.h"
#include "evabase.h"
#include "meta.h"

#include <deque>
#include <algorithm>

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>

namespace dlbr
{

//! Deterministic remote content, the same byte for the same position
inline char ContentAt(off_t pos)
{
	return char('A' + (pos * 7 + pos / 251) % 26);
}

inline mstring ContentRange(off_t from, off_t len)
{
	mstring ret;
	for (off_t i = from; i < from + len; ++i)
		ret += ContentAt(i);
	return ret;
}

/**
 * In-process chunk source with accounting and failure injection.
 * Deliveries run from the event loop, or when Flush() is called if held.
 */
struct tFakeChunkSource : public IChunkSource
{
	off_t granularity = 256;
	// amount of data the remote side really has
	off_t contentSize = 1000;

	// the next N requests fail with a transient error
	unsigned transientFailures = 0;
	// every request fails with this, unless NONE
	EFetchError fatal = EFetchError::NONE;
	// keep requests pending until Flush()
	bool hold = false;

	unsigned fetches = 0, nextCalls = 0, cancels = 0, inFlight = 0, peakInFlight = 0, delivered = 0;
	std::vector<off_t> fetchOffsets;
	std::deque<tAction> held;

	off_t GetGranularity() const override { return granularity; }
	lint_ptr<IChunkCursor> Fetch(cmstring& handle, off_t offset, off_t maxLength) override;

	unsigned Flush()
	{
		auto todo = move(held);
		held.clear();
		for (auto& act: todo)
			act();
		return todo.size();
	}
};

class tFakeCursor : public IChunkCursor
{
	tFakeChunkSource& m_src;
	off_t m_pos, m_end;
public:
	tFakeCursor(tFakeChunkSource& src, off_t offset, off_t maxLength)
	: m_src(src), m_pos(offset), m_end(offset + maxLength - 1)
	{
	}

	TFinalAction Next(tReceiver rcvr) override
	{
		auto& s = m_src;
		s.nextCalls++;
		s.inFlight++;
		s.peakInFlight = std::max(s.peakInFlight, s.inFlight);
		// 0: pending, 1: delivered, 2: canceled
		auto state = std::make_shared<int>(0);
		tAction run = [pin = as_lptr(this), state, rcvr]()
		{
			pin->Deliver(*state, rcvr);
		};
		if (s.hold)
			s.held.emplace_back(move(run));
		else
			evabase::Post(move(run));
		return TFinalAction([&s, state]()
		{
			if (*state != 0)
				return;
			*state = 2;
			s.cancels++;
			s.inFlight--;
		});
	}

	void Deliver(int& state, const tReceiver& rcvr)
	{
		if (state != 0)
			return;
		state = 1;
		m_src.inFlight--;
		tChunkEvent ev;
		if (m_src.fatal != EFetchError::NONE)
		{
			ev.error = m_src.fatal;
			ev.message = "injected failure";
		}
		else if (m_src.transientFailures)
		{
			m_src.transientFailures--;
			ev.error = EFetchError::REMOTE_UNAVAILABLE;
			ev.message = "injected transient failure";
		}
		else if (m_pos <= m_end && m_pos < m_src.contentSize)
		{
			auto len = std::min({m_src.granularity, m_end - m_pos + 1, m_src.contentSize - m_pos});
			ev.data = make_eb();
			auto s = ContentRange(m_pos, len);
			evbuffer_add(*ev.data, s.data(), s.size());
			m_pos += len;
			m_src.delivered++;
		}
		rcvr(move(ev));
	}
};

inline lint_ptr<IChunkCursor> tFakeChunkSource::Fetch(cmstring&, off_t offset, off_t maxLength)
{
	fetches++;
	fetchOffsets.push_back(offset);
	return static_lptr_cast<IChunkCursor>(make_lptr<tFakeCursor>(*this, offset, maxLength));
}

/**
 * Shared resources with test doubles.
 */
class tTestRes : public acres
{
public:
	std::unique_ptr<tBeatNotifier> beat;
	tSslConfig ssl;
	tLinkTable links;
	// replaces links when set
	ILinkRegistry* registry = nullptr;
	tFakeChunkSource source;
	lint_ptr<tSessionPool> pool;

	explicit tTestRes(unsigned sessions = 2) : pool(make_lptr<tSessionPool>(sessions))
	{
		beat = tBeatNotifier::Create(timeval { 30, 0 });
	}
	tBeatNotifier& GetIdleCheckBeat() override { return *beat; }
	tSslConfig& GetSslConfig() override { return ssl; }
	ILinkRegistry& GetLinkRegistry() override { return registry ? *registry : links; }
	IChunkSource& GetChunkSource() override { return source; }
	tSessionPool& GetSessionPool() override { return *pool; }

	//! Publish a file of the given size under the token
	void AddFile(cmstring& token, off_t size, cmstring& name = "file.bin", time_t expiresAt = 0)
	{
		tFileDesc d;
		d.handle = "h-" + token;
		d.totalSize = size;
		d.mimeType = "application/octet-stream";
		d.fileName = name;
		d.createdAt = GetTime();
		d.expiresAt = expiresAt;
		links.Insert(token, d);
	}
};

/**
 * Client side of a socket pair served by StartServing.
 */
struct tTestClient
{
	int fd = -1;
	lint_ptr<IConnBase> conn;
	bool released = false;
	bool closed = false;
	mstring received;

	explicit tTestClient(acres& res)
	{
		int sv[2];
		if (socketpair(AF_UNIX, SOCK_STREAM, 0, sv))
			throw std::runtime_error("socketpair failed");
		fd = sv[1];
		fcntl(fd, F_SETFL, fcntl(fd, F_GETFL) | O_NONBLOCK);
		conn = StartServing(unique_fd(sv[0]), "testclient", res, [this](IConnBase*)
		{
			released = true;
			conn.reset();
		});
	}
	~tTestClient()
	{
		Disconnect();
		// let the server side settle
		pushEventsUntil(2, [this]() { return released; });
		conn.reset();
	}
	void Disconnect()
	{
		if (fd != -1)
			close(fd);
		fd = -1;
	}
	void Send(string_view req)
	{
		ASSERT_EQ(ssize_t(req.size()), write(fd, req.data(), req.size()));
	}
	//! Pull the available data from the socket
	void Read()
	{
		if (fd == -1)
			return;
		char buf[8192];
		while (true)
		{
			auto n = read(fd, buf, sizeof(buf));
			if (n > 0)
			{
				received.append(buf, n);
				continue;
			}
			if (n == 0)
				closed = true;
			break;
		}
	}
	bool ReadUntil(const std::function<bool()>& done, int secs = 5)
	{
		return pushEventsUntil(secs, [&]() { Read(); return done() || closed; }) && done();
	}
	//! Wait for one complete response (head and body), return it and remove it from the input
	mstring TakeResponse(bool headRequest = false, int secs = 5)
	{
		size_t total = 0;
		auto complete = [&]()
		{
			header h;
			auto hlen = h.Load(received);
			if (hlen <= 0)
				return false;
			off_t clen = 0;
			if (!headRequest && h.h[header::CONTENT_LENGTH])
				clen = atoll(h.h[header::CONTENT_LENGTH]);
			total = hlen + clen;
			return received.size() >= total;
		};
		if (!ReadUntil(complete, secs))
			return mstring();
		auto ret = received.substr(0, total);
		received.erase(0, total);
		return ret;
	}
};

//! Split a raw response into head and body
inline std::pair<mstring, mstring> SplitResponse(cmstring& resp)
{
	auto pos = resp.find("\r\n\r\n");
	if (pos == stmiss)
		return { resp, mstring() };
	return { resp.substr(0, pos + 4), resp.substr(pos + 4) };
}

//! Head without the lines which vary between responses, for comparisons
inline mstring StripDate(cmstring& head)
{
	mstring ret;
	for (auto line: tSplitWalk(head, "\r\n"sv))
	{
		if (startsWith(line, "Date:"sv) || startsWith(line, "X-Debug:"sv))
			continue;
		ret += line;
		ret += '\n';
	}
	return ret;
}

}

#endif // TESTCOMMON_H
