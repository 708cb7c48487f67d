#include "debug.h"
#include "acfg.h"
#include "meta.h"
#include "fileio.h"

#include <mutex>
#include <iostream>
#include <atomic>
#include <thread>

using namespace std;

namespace dlbr
{
namespace log
{

bool logIsEnabled = false;
LPCSTR g_szLogPrefix = "dlbridge";

static std::mutex mx;
static FILE *fErr = nullptr, *fTransfer = nullptr;

static void closeOne(FILE*& f)
{
	if (f && f != stderr)
		fclose(f);
	f = nullptr;
}

static void writeRecord(FILE* f, string_view line)
{
	if (!f)
		return;
	fwrite(line.data(), 1, line.size(), f);
	fputc('\n', f);
	if (cfg::debug & LOG_FLUSH)
		fflush(f);
}

mstring open()
{
	lock_guard<std::mutex> g(mx);
	closeOne(fErr);
	closeOne(fTransfer);
	logIsEnabled = false;

	if (cfg::logdir.empty())
	{
		fErr = stderr;
		return se;
	}
	mkdirhier(cfg::logdir);
	auto errPath = cfg::logdir + "/dlbridge.err";
	auto transPath = cfg::logdir + "/dlbridge.log";
	fErr = fopen(errPath.c_str(), "a");
	if (!fErr)
	{
		auto msg = tErrnoFmter("Cannot open error log " + errPath + ": ");
		fErr = stderr;
		return msg;
	}
	fTransfer = fopen(transPath.c_str(), "a");
	if (!fTransfer)
		return tErrnoFmter("Cannot open transfer log " + transPath + ": ");
	logIsEnabled = true;
	return se;
}

void close(bool bReopen)
{
	{
		lock_guard<std::mutex> g(mx);
		closeOne(fErr);
		closeOne(fTransfer);
		logIsEnabled = false;
	}
	if (bReopen)
	{
		auto msg = open();
		if (!msg.empty())
			err(msg);
	}
}

void flush()
{
	lock_guard<std::mutex> g(mx);
	if (fErr)
		fflush(fErr);
	if (fTransfer)
		fflush(fTransfer);
}

void transfer(off_t bytesOut, cmstring& client, cmstring& path, bool bError)
{
	if (!logIsEnabled)
		return;
	tSS line(200);
	line << GetTime() << (bError ? "|E|"sv : "|O|"sv) << bytesOut << '|' << client << '|' << path;
	lock_guard<std::mutex> g(mx);
	writeRecord(fTransfer, line);
}

void misc(string_view msg, char cLogType)
{
	if (!logIsEnabled)
		return;
	tSS line(100 + msg.size());
	line << GetTime() << '|' << cLogType << '|' << msg;
	lock_guard<std::mutex> g(mx);
	writeRecord(fTransfer, line);
}

void err(string_view msg)
{
	tSS line(100 + msg.size());
	lock_guard<std::mutex> g(mx);
	if (!fErr || fErr == stderr)
	{
		line << g_szLogPrefix << ": "sv << msg;
		writeRecord(stderr, line);
		return;
	}
	line << GetTime() << '|' << msg;
	writeRecord(fErr, line);
}

void dbg(string_view msg)
{
	if (cfg::debug & LOG_DEBUG)
		err(msg);
}

}

#ifdef DEBUG

static atomic_uint g_nLogLevel(0);

t_logger::t_logger(const char *szFuncName, const void *ptr)
{
	m_szName = szFuncName;
	m_id = uintptr_t(ptr);
	m_nLevel = g_nLogLevel++;
	tSS fmt;
	fmt << ">> "sv << m_szName << " ["sv << tSS::imode::hex << m_id << "]"sv;
	Write(fmt);
}

t_logger::~t_logger()
{
	tSS fmt;
	fmt << "<< "sv << m_szName;
	Write(fmt);
	g_nLogLevel--;
}

void t_logger::Write(const tSS& msg)
{
	if (!(cfg::debug & log::LOG_DEBUG))
		return;
	tSS line;
	for (unsigned i = 0; i < m_nLevel; ++i)
		line << "  "sv;
	line << msg.view();
	log::err(line);
}

#endif

}
