#include "gtest/gtest.h"
#include "acfg.h"
#include "astrop.h"
#include "fileio.h"
#include "streamasm.h"
#include "acbuf.h"
#include "meta.h"

#include <sys/time.h>
#include <unistd.h>

using namespace dlbr;
using namespace std;

// restores the global settings after each test
class cfgtest : public ::testing::Test
{
	mstring m_saved;
protected:
	void SetUp() override { m_saved = cfg::DumpConfig(); }
	void TearDown() override
	{
		for (auto line: tSplitWalk(m_saved, "\n"sv))
			ASSERT_TRUE(cfg::SetOption(line)) << line;
	}
};

TEST_F(cfgtest, set_option)
{
	mstring err;
	EXPECT_TRUE(cfg::SetOption("Port: 3142", &err));
	EXPECT_EQ(3142, cfg::port);
	EXPECT_TRUE(cfg::SetOption("port=4000", &err));
	EXPECT_EQ(4000, cfg::port);
	EXPECT_TRUE(cfg::SetOption("UpstreamUrl = http://chunks.local:9000/store", &err));
	EXPECT_EQ("http://chunks.local:9000/store", cfg::upstreamurl);
	EXPECT_TRUE(cfg::SetOption("ChunkSize: 4M", &err));
	EXPECT_EQ(4 * 1024 * 1024, cfg::chunksize);
	EXPECT_TRUE(cfg::SetOption("SendWindow=64k", &err));
	EXPECT_EQ(64 * 1024, cfg::sendwindow);

	EXPECT_FALSE(cfg::SetOption("NoSuchThing: 1", &err));
	EXPECT_EQ("Unknown option: NoSuchThing", err);
	EXPECT_FALSE(cfg::SetOption("Port: many", &err));
	EXPECT_EQ("Invalid number for Port: many", err);
	EXPECT_FALSE(cfg::SetOption("Port: 99999999999", &err));
	EXPECT_FALSE(cfg::SetOption("just words", &err));
	EXPECT_FALSE(cfg::SetOption("=5", nullptr));
}

TEST_F(cfgtest, read_file)
{
	mstring path(tSS() << "/tmp/dlbridge_ut_cfg_" << getpid() << ".conf");
	ASSERT_EQ(se, ReplaceFileContents(path,
			"# comment line\n\nPort: 9999\nMaxRemoteSessions: 3 # trailing comment\n"
			"FetchRetries: 7\n"));
	EXPECT_EQ(se, cfg::ReadConfigFile(path));
	EXPECT_EQ(9999, cfg::port);
	EXPECT_EQ(3, cfg::maxsessions);
	EXPECT_EQ(7, cfg::fetchretries);

	ASSERT_EQ(se, ReplaceFileContents(path, "Port: 1\nBogus: 2\n"));
	EXPECT_EQ(path + ":2: Unknown option: Bogus", cfg::ReadConfigFile(path));
	unlink(path.c_str());

	EXPECT_NE(se, cfg::ReadConfigFile(path));
}

TEST_F(cfgtest, postproc)
{
	EXPECT_EQ(se, cfg::PostProcConfig());
	cfg::baseurl = "https://dl.example.org///";
	EXPECT_EQ(se, cfg::PostProcConfig());
	EXPECT_EQ("https://dl.example.org", cfg::baseurl);

	cfg::port = 70000;
	EXPECT_NE(se, cfg::PostProcConfig());
	cfg::port = 8080;
	cfg::fetchretries = 0;
	EXPECT_NE(se, cfg::PostProcConfig());
	cfg::fetchretries = 4;
	cfg::upstreamurl = "ftp://nope";
	EXPECT_NE(se, cfg::PostProcConfig());
	cfg::upstreamurl.clear();
	cfg::retrybackoff = -1;
	EXPECT_NE(se, cfg::PostProcConfig());
}

TEST_F(cfgtest, assembler_params)
{
	cfg::fetchretries = 5;
	cfg::retrybackoff = 100;
	cfg::fetchtimeout = 12;
	auto p = tAssemblerParams::FromConfig();
	EXPECT_EQ(5u, p.fetchRetries);
	EXPECT_EQ(100u, p.retryBackoffMs);
	EXPECT_EQ(12000u, p.fetchTimeoutMs);

	cfg::nettimeout = 33;
	EXPECT_EQ(33, cfg::GetNetworkTimeout()->tv_sec);
	EXPECT_EQ(12, cfg::GetFetchTimeout()->tv_sec);
}

TEST_F(cfgtest, dump)
{
	cfg::port = 1234;
	auto dump = cfg::DumpConfig();
	EXPECT_NE(stmiss, dump.find("Port: 1234\n"));
	EXPECT_NE(stmiss, dump.find("UpstreamUrl: "));
}
