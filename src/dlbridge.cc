#include "debug.h"
#include "acbuf.h"
#include "aclogger.h"
#include "config.h"
#include "meta.h"
#include "acfg.h"
#include "fileio.h"
#include "conserver.h"
#include "ac3rdparty.h"
#include "acres.h"
#include "evabase.h"
#include "aevutil.h"

#include <iostream>
#include <list>
#include <memory>
#include <vector>

#include <cstdlib>
#include <cstring>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>
#include <signal.h>
#include <errno.h>

using namespace std;

namespace dlbr
{

static void usage(int nRetCode=0);
void term_handler(evutil_socket_t fd, short what, void *arg);
void log_handler(evutil_socket_t fd, short what, void *arg);
void noop_handler(evutil_socket_t fd, short what, void *arg);

inline bool fork_away()
{
	return !daemon(0,0);
}

void parse_options(int argc, const char **argv)
{
	bool bExtraVerb=false;
	LPCSTR szCfgFile=nullptr;
	std::vector<LPCSTR> cmdvars;

	for (auto p=argv+1; p<argv+argc; p++)
	{
		if (!strncmp(*p, "--", 2))
			break;
		if (!strncmp(*p, "-h", 2))
			usage();
		else if (!strncmp(*p, "-v", 2))
			bExtraVerb = true;
		else if (!strcmp(*p, "-c"))
		{
			++p;
			if (p < argv + argc)
				szCfgFile = *p;
			else
				usage(2);
		}
		else if(**p) // not empty
			cmdvars.emplace_back(*p);
	}

	if(szCfgFile)
	{
		auto err = cfg::ReadConfigFile(szCfgFile);
		if (!err.empty())
		{
			cerr << err << endl;
			exit(EXIT_FAILURE);
		}
	}

	for(auto& keyval : cmdvars)
	{
		mstring err;
		if(!cfg::SetOption(keyval, &err))
		{
			cerr << "Bad option " << keyval << ": " << err << endl;
			usage(EXIT_FAILURE);
		}
	}

	auto err = cfg::PostProcConfig();
	if (err.empty() && cfg::upstreamurl.empty())
		err = "UpstreamUrl is not set";
	if (!err.empty())
	{
		cerr << "Configuration error: " << err << endl;
		exit(EXIT_FAILURE);
	}

	if(bExtraVerb)
		cfg::debug |= (log::LOG_DEBUG|log::LOG_MORE);
}

struct sigMapping
{
	int snum;
	decltype(term_handler) &cb;
}
const sigMap[] =
{
{SIGTERM, term_handler},
{SIGINT, term_handler},
{SIGQUIT, term_handler},
{SIGHUP, log_handler},
{SIGUSR1, log_handler},
{SIGPIPE, noop_handler},
#ifdef SIGXFSZ
{SIGXFSZ, noop_handler},
#endif
};

std::list<unique_event> sigEvents;

static void usage(int retCode)
{
	auto& chan = retCode ? cerr : cout;
	chan << "Usage: dlbridge [options] [ -c configfile ] <var=value ...>\n\n"
		"Options:\n"
		"-h: this help message\n"
		"-c: configuration file\n"
		"-v: extra verbosity in logging\n"
		"\n"
		"Most interesting variables:\n"
		"ForeGround: Don't detach (default: 0)\n"
		"Port: TCP port number (default: 8080)\n"
		"UpstreamUrl: base URL of the remote chunk service\n"
		"LinkTable: /path/to/link/table\n"
		"LogDir: /directory/for/logfiles\n"
		"\n"
		"See dlbridge-tool cfgdump for all directives.\n\n";
	chan.flush();
	exit(retCode);
}

void log_handler(evutil_socket_t, short, void*)
{
	log::close(true);
}

void noop_handler(evutil_socket_t, short, void*)
{
}

void term_handler(evutil_socket_t signum, short, void*)
{
	DBGQLOG("caught signal " << signum);
	switch (signum) {
	case (SIGTERM):
	case (SIGINT):
	case (SIGQUIT):
		log::misc("Shutdown requested"sv);
		evabase::SignalStop();
		break;
	default:
		return;
	}
}

std::unique_ptr<acres> sharedResources;
lint_ptr<conserver> g_server;

void daemon_init()
{
	auto lerr = log::open();
	if (!lerr.empty())
	{
		cerr
				<< "Problem creating log files in "
				<< cfg::logdir
				<< ". " << lerr << ".\n";

		exit(EXIT_FAILURE);
	}

	for(auto& el: sigMap)
	{
		sigEvents.emplace_back(event_new(evabase::base, el.snum, EV_SIGNAL|EV_PERSIST, el.cb, 0));
		if (!sigEvents.back().valid() || 0 != event_add(sigEvents.back().get(), nullptr))
		{
			cerr << "Cannot setup signal handling" << endl;
			exit(EXIT_FAILURE);
		}
	}

	sharedResources.reset(acres::Create());

	g_server = conserver::Create(*sharedResources);
	if (!g_server || !g_server->Setup())
	{
		cerr
				<< "No listening socket(s) could be created/prepared. "
				   "Check the network, check or unset the BindAddress directive.\n";
		exit(EXIT_FAILURE);
	}

	if (!cfg::foreground && !fork_away())
	{
		tErrnoFmter ef("Failed to change to daemon mode");
		cerr << ef << endl;
		exit(43);
	}

	if (!cfg::pidfile.empty())
	{
		mkbasedir(cfg::pidfile);
		auto err = ReplaceFileContents(cfg::pidfile, ltos(getpid()));
		if (!err.empty())
			log::err("Cannot write pid file: " + err);
	}
	log::misc(mstring("Started " DLBR_SERVER_ID ", serving from ") + cfg::upstreamurl);
}

void daemon_deinit()
{
	if (!cfg::pidfile.empty())
		unlink(cfg::pidfile.c_str());
	if (g_server)
		g_server->Abandon();
	g_server.reset();
	sharedResources.reset();
	log::close(false);
}

}

int main(int argc, const char **argv)
{
	using namespace dlbr;

	ac3rdparty_init();
	atexit(ac3rdparty_deinit);

	auto eBase = evabase::Create();

	parse_options(argc, argv);

	daemon_init();

	auto ret = eBase->MainLoop();

	daemon_deinit();

	sigEvents.clear();

	return ret;
}
