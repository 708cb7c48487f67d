#include "debug.h"
#include "meta.h"
#include "acfg.h"
#include "astrop.h"
#include "fileio.h"
#include "linkreg.h"
#include "httpdate.h"

#include <algorithm>
#include <iostream>
#include <deque>
#include <utility>
#include <vector>

#include <cstring>

using namespace std;

namespace dlbr
{

using tCsDeq = std::deque<LPCSTR>;

enum : int
{
	EXIT_OK = 0,
	EXIT_USAGE = 1,
	EXIT_CONFIG = 2,
	EXIT_IO = 3
};

auto szHelp = R"(
USAGE: dlbridge-tool command parameter... [options]

command := { issue, revoke, list, purge, cfgdump }
parameter := (specific to command, or -h for extra help)
options := (see dlbridge options)
Standard options :=
-h|--help (before or after command type to get command specific help)
-c configfile
)";
auto szHelpIssue = R"(
USAGE: dlbridge-tool issue handle size name [mimetype] [lifetimeSeconds]
Size suffix can be k,K,m,M,g,G (binary multipliers).
Lifetime 0 means the link never expires, default is DefaultLinkLifetime.
)";

int fin(int retCode, string_view what)
{
	auto& chan = (retCode ? cerr : cout);
	chan << what;
	if (what.empty() || what.back() > '\r')
		chan << endl;
	else
		chan.flush();
	exit(retCode);
	return EXIT_FAILURE;
}

mstring RequireTable()
{
	if (cfg::linktable.empty())
		fin(EXIT_CONFIG, "LinkTable is not configured");
	return cfg::linktable;
}

int do_issue(tCsDeq& parms)
{
	auto path = RequireTable();
	tFileDesc desc;
	desc.handle = parms[0];
	desc.totalSize = strsizeToOfft(parms[1], -1);
	if (desc.totalSize < 0)
		return fin(EXIT_USAGE, "Invalid size: "s + parms[1]);
	desc.fileName = parms[2];
	desc.mimeType = parms.size() > 3 ? parms[3] : "application/octet-stream";
	off_t lifetime = cfg::linklifetime;
	if (parms.size() > 4)
	{
		lifetime = atoofft(parms[4], -1);
		if (lifetime < 0)
			return fin(EXIT_USAGE, "Invalid lifetime: "s + parms[4]);
	}
	desc.createdAt = GetTime();
	desc.expiresAt = lifetime ? desc.createdAt + lifetime : 0;

	auto token = GenerateToken();
	if (token.empty())
		return fin(EXIT_IO, "Cannot generate a random token");
	auto err = AppendLinkRecord(path, token, desc);
	if (!err.empty())
		return fin(err == "Invalid link data" ? EXIT_USAGE : EXIT_IO, err);

	cout << BuildLinkUrl(cfg::baseurl, token, desc.fileName) << endl
		 << offttosH(desc.totalSize) << endl;
	return EXIT_OK;
}

using tRecordList = vector<pair<mstring, tFileDesc>>;

int load_all(cmstring& path, tRecordList& out)
{
	auto err = LoadLinkRecords(path, [&](mstring&& token, tFileDesc&& desc)
	{
		out.emplace_back(move(token), move(desc));
	});
	if (!err.empty())
		fin(EXIT_IO, err);
	return EXIT_OK;
}

int store_all(cmstring& path, const tRecordList& recs)
{
	tSS buf;
	buf << "# dlbridge link table\n";
	for (const auto& r: recs)
		buf << FormatLinkRecord(r.first, r.second);
	auto err = ReplaceFileContents(path, buf.view());
	if (!err.empty())
		return fin(EXIT_IO, err);
	return EXIT_OK;
}

int do_revoke(tCsDeq& parms)
{
	auto path = RequireTable();
	string_view token(parms.front());
	tRecordList recs;
	load_all(path, recs);
	auto n = recs.size();
	recs.erase(remove_if(recs.begin(), recs.end(), [&](const auto& r) { return r.first == token; }), recs.end());
	if (recs.size() == n)
		return fin(EXIT_USAGE, "Unknown token: "s + parms.front());
	return store_all(path, recs);
}

int do_purge()
{
	auto path = RequireTable();
	tRecordList recs;
	load_all(path, recs);
	auto now = GetTime();
	auto n = recs.size();
	recs.erase(remove_if(recs.begin(), recs.end(), [&](const auto& r) { return r.second.IsExpired(now); }), recs.end());
	cout << "Removed " << (n - recs.size()) << " expired record(s)" << endl;
	if (n == recs.size())
		return EXIT_OK;
	return store_all(path, recs);
}

int do_list()
{
	auto path = RequireTable();
	tRecordList recs;
	load_all(path, recs);
	auto now = GetTime();
	for (const auto& r: recs)
	{
		cout << r.first << '\t' << (r.second.IsExpired(now) ? "expired" : "live")
			 << '\t' << r.second.handle << '\t' << offttosH(r.second.totalSize) << '\t'
			 << (r.second.expiresAt ? tHttpDate(r.second.expiresAt).view() : "never"sv) << '\t'
			 << BuildLinkUrl(cfg::baseurl, r.first, r.second.fileName) << endl;
	}
	return EXIT_OK;
}

}

int main(int argc, const char **argv)
{
	using namespace dlbr;

	log::g_szLogPrefix = "dlbridge-tool";

	LPCSTR mode = nullptr, szCfgFile = nullptr;
	LPCSTR *posMode(nullptr);
	tCsDeq xargs;
	bool wantCfgFile = false, subHelp = false;

	const char **argFirst = argv+1, **argEnd = argv+argc;
	// pick and process early/urgent options
	for (auto p = argFirst; p < argEnd; ++p)
	{
		if (wantCfgFile)
		{
			wantCfgFile = false;
			szCfgFile = *p;
		}
		else if (!strcmp(*p, "-c"))
			wantCfgFile = true;
		else
			continue;
		// blank it, it was consumed
		*p = nullptr;
	}

	if (wantCfgFile)
		fin(EXIT_USAGE, "-c requires a valid configuration file");
	if (szCfgFile)
	{
		auto err = cfg::ReadConfigFile(szCfgFile);
		if (!err.empty())
			fin(EXIT_CONFIG, err);
	}

	// apply global options, collect mode name and its options
	for (auto p = argFirst; p < argEnd; ++p)
	{
		if (!*p || !**p)
			continue;
		if (!strncmp(*p, "-h", 2) || !strcmp(*p, "--help"))
		{
			if (!posMode ||  p < posMode)
				fin(EXIT_OK, szHelp);
			subHelp = true;
		}
		else if (!mode && strpbrk(*p, "=:"))
		{
			mstring err;
			if (!cfg::SetOption(*p, &err))
				fin(EXIT_CONFIG, "Bad option "s + *p + ": " + err);
		}
		else if (!mode)
		{
			mode = *p;
			posMode = p;
		}
		else
			xargs.emplace_back(*p);
	}
	auto cfgErr = cfg::PostProcConfig();
	if (!cfgErr.empty())
		fin(EXIT_CONFIG, cfgErr);

	// diagnostics go to the terminal
	cfg::logdir.clear();
	log::open();

	if (!mode)
		return fin(EXIT_USAGE, szHelp);

#define MODE(x) (strcmp(x, mode) == 0)
#define CHECKARGS(n, m, mode, shelp) if (subHelp) fin(EXIT_OK, shelp); \
	if (int(xargs.size()) < n) fin(EXIT_USAGE, "Insufficient options for command " mode); \
	if (xargs.size() > m) fin(EXIT_USAGE, "Too many options for command " mode);

	if (MODE("issue"))
	{
		CHECKARGS(3, 5, "issue", szHelpIssue);
		return do_issue(xargs);
	}
	if (MODE("revoke"))
	{
		CHECKARGS(1, 1, "revoke", "USAGE: ... revoke token"sv);
		return do_revoke(xargs);
	}
	if (MODE("list"))
	{
		CHECKARGS(0, 0, "list", "USAGE: ... list"sv);
		return do_list();
	}
	if (MODE("purge"))
	{
		CHECKARGS(0, 0, "purge", "USAGE: ... purge"sv);
		return do_purge();
	}
	if (MODE("cfgdump"))
	{
		cout << cfg::DumpConfig();
		return EXIT_OK;
	}
	cerr << endl << "Unknown command: " << mode << endl;
	return fin(EXIT_USAGE, szHelp);
}
