#include "acfg.h"
#include "meta.h"
#include "debug.h"
#include "ahttpurl.h"

#include <fstream>

#include <sys/time.h>

using namespace std;

namespace dlbr
{

namespace cfg
{

mstring bindaddr, baseurl("http://localhost:8080"), upstreamurl, cafile, capath,
dnsresconf("/etc/resolv.conf"), linktable, logdir, pidfile;

int port = 8080, chunksize = 1024 * 1024, maxsessions = 8, sessionwait = 15,
fetchtimeout = 30, fetchretries = 4, retrybackoff = 250, dnscachetime = 1800,
linkrescan = 5, linklifetime = 7 * 24 * 3600,
sendwindow = -1, nettimeout = 60, maxdlspeed = 0,
debug = 0, foreground = 0;

struct MapNameToString
{
	const char *name; mstring *ptr;
};

struct MapNameToInt
{
	const char *name; int *ptr;
	// accept K/M/G suffixes
	bool isSize;
};

MapNameToString n2sTbl[] =
{
		{ "BindAddress", &bindaddr },
		{ "BaseUrl", &baseurl },
		{ "UpstreamUrl", &upstreamurl },
		{ "CaFile", &cafile },
		{ "CaPath", &capath },
		{ "DnsResolvConf", &dnsresconf },
		{ "LinkTable", &linktable },
		{ "LogDir", &logdir },
		{ "PidFile", &pidfile }
};

MapNameToInt n2iTbl[] =
{
		{ "Port", &port, false },
		{ "ChunkSize", &chunksize, true },
		{ "MaxRemoteSessions", &maxsessions, false },
		{ "SessionWaitTimeout", &sessionwait, false },
		{ "FetchTimeout", &fetchtimeout, false },
		{ "FetchRetries", &fetchretries, false },
		{ "RetryBackoff", &retrybackoff, false },
		{ "DnsCacheSeconds", &dnscachetime, false },
		{ "LinkRescanInterval", &linkrescan, false },
		{ "DefaultLinkLifetime", &linklifetime, false },
		{ "SendWindow", &sendwindow, true },
		{ "NetworkTimeout", &nettimeout, false },
		{ "MaxDlSpeed", &maxdlspeed, false },
		{ "Debug", &debug, false },
		{ "ForeGround", &foreground, false }
};

static bool ParseOptionLine(string_view sLine, string_view &key, string_view &val)
{
	auto posCol = sLine.find(':');
	auto posEq = sLine.find('=');
	if (posEq == stmiss && posCol == stmiss)
		return false;
	// whatever comes first
	auto pos = min(posEq, posCol);
	key = sLine.substr(0, pos);
	val = sLine.substr(pos + 1);
	trimBoth(key);
	trimBoth(val);
	return !key.empty();
}

bool SetOption(string_view sLine, mstring* pErrorMsg)
{
	string_view key, value;
	auto report = [pErrorMsg](string_view msg)
	{
		if (pErrorMsg)
			*pErrorMsg = mstring(msg);
		return false;
	};

	if (!ParseOptionLine(sLine, key, value))
		return report("Not a configuration directive: "s + mstring(sLine));

	for (auto& el: n2sTbl)
	{
		if (!CaseEqual(key, el.name))
			continue;
		*el.ptr = value;
		return true;
	}
	for (auto& el: n2iTbl)
	{
		if (!CaseEqual(key, el.name))
			continue;
		auto n = el.isSize ? strsizeToOfft(value, MIN_VAL(off_t)) : atoofft(value, MIN_VAL(off_t));
		if (n == MIN_VAL(off_t) || n > MAX_VAL(int) || n < MIN_VAL(int))
			return report("Invalid number for "s + el.name + ": " + mstring(value));
		*el.ptr = int(n);
		return true;
	}
	return report("Unknown option: "s + mstring(key));
}

mstring ReadConfigFile(cmstring &path)
{
	ifstream in(path);
	if (!in.is_open())
		return tErrnoFmter("Cannot open " + path + ": ");
	mstring line, err;
	unsigned lineNo = 0;
	while (getline(in, line))
	{
		++lineNo;
		auto posComment = line.find('#');
		if (posComment != stmiss)
			line.erase(posComment);
		trimBoth(line);
		if (line.empty())
			continue;
		if (!SetOption(line, &err))
			return path + ":" + to_string(lineNo) + ": " + err;
	}
	if (in.bad())
		return tErrnoFmter("Error reading " + path + ": ");
	return se;
}

mstring PostProcConfig()
{
	if (port < 0 || port > MAX_VAL(uint16_t))
		return "Port must be in range 0..65535";
	if (chunksize <= 0)
		return "ChunkSize must be positive";
	if (maxsessions <= 0)
		return "MaxRemoteSessions must be positive";
	if (fetchretries <= 0)
		return "FetchRetries must be at least 1";
	if (fetchtimeout <= 0 || nettimeout <= 0)
		return "Timeout values must be positive";
	if (retrybackoff < 0 || sessionwait < 0 || linkrescan < 0 || maxdlspeed < 0)
		return "Negative values are not permitted here";

	trimBack(baseurl, "/"sv);
	if (!upstreamurl.empty())
	{
		tHttpUrl test;
		if (!test.SetHttpUrl(upstreamurl))
			return "Invalid UpstreamUrl: " + upstreamurl;
	}
	if (!logdir.empty())
		trimBack(logdir, "/"sv);
	return se;
}

mstring DumpConfig()
{
	tSS out;
	for (const auto& el: n2sTbl)
		out << el.name << ": "sv << *el.ptr << '\n';
	for (const auto& el: n2iTbl)
		out << el.name << ": "sv << *el.ptr << '\n';
	return out.str();
}

const timeval * GetNetworkTimeout()
{
	static timeval t { 0, 0 };
	t.tv_sec = nettimeout;
	return &t;
}

const timeval * GetFetchTimeout()
{
	static timeval t { 0, 0 };
	t.tv_sec = fetchtimeout;
	return &t;
}

}

}
