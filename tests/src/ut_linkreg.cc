#include "gtest/gtest.h"
#include "linkreg.h"
#include "acfg.h"
#include "fileio.h"
#include "meta.h"
#include "acbuf.h"

#include <atomic>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace dlbr;
using namespace std;

static tFileDesc mkDesc(cmstring& handle, off_t size, time_t expiresAt = 0, cmstring& name = "")
{
	tFileDesc d;
	d.handle = handle;
	d.totalSize = size;
	d.fileName = name;
	d.createdAt = 1000;
	d.expiresAt = expiresAt;
	return d;
}

struct tTempTable
{
	mstring path;
	tTempTable() : path(tSS() << "/tmp/dlbridge_ut_links_" << getpid() << ".tsv") {}
	~tTempTable() { unlink(path.c_str()); }
};

TEST(linkreg, token_syntax)
{
	EXPECT_TRUE(IsValidToken("abc123"));
	EXPECT_TRUE(IsValidToken("A-b_C"));
	EXPECT_FALSE(IsValidToken(""));
	EXPECT_FALSE(IsValidToken("a/b"));
	EXPECT_FALSE(IsValidToken("a b"));
	EXPECT_FALSE(IsValidToken("..%2f"));
	EXPECT_FALSE(IsValidToken(mstring(129, 'x')));
	EXPECT_TRUE(IsValidToken(mstring(128, 'x')));
}

TEST(linkreg, lookup_states)
{
	tLinkTable t;
	ASSERT_TRUE(t.Insert("live", mkDesc("h1", 10)));
	ASSERT_TRUE(t.Insert("old", mkDesc("h2", 20, 5000)));
	// duplicates and bad tokens are refused
	EXPECT_FALSE(t.Insert("live", mkDesc("h3", 30)));
	EXPECT_FALSE(t.Insert("no/pe", mkDesc("h3", 30)));
	EXPECT_FALSE(t.Insert("neg", mkDesc("h3", -1)));

	auto r = t.Resolve("live", 4000);
	ASSERT_EQ(ELinkState::FOUND, r.state);
	EXPECT_EQ("h1", r.desc->handle);
	EXPECT_EQ("application/octet-stream", r.desc->mimeType);

	EXPECT_EQ(ELinkState::FOUND, t.Resolve("old", 4999).state);
	r = t.Resolve("old", 5000);
	EXPECT_EQ(ELinkState::EXPIRED, r.state);
	ASSERT_TRUE(r.desc);
	EXPECT_EQ("h2", r.desc->handle);

	EXPECT_EQ(ELinkState::NOT_FOUND, t.Resolve("missing", 4000).state);
	EXPECT_EQ(ELinkState::NOT_FOUND, t.Resolve("", 4000).state);
	EXPECT_EQ(ELinkState::NOT_FOUND, t.Resolve("../etc", 4000).state);
}

TEST(linkreg, revoke_and_purge)
{
	tLinkTable t;
	t.Insert("a", mkDesc("h1", 1));
	t.Insert("b", mkDesc("h2", 1, 100));
	t.Insert("c", mkDesc("h3", 1, 200));
	EXPECT_EQ(3u, t.size());

	// a descriptor obtained before revocation stays usable
	auto held = t.Resolve("a", 0).desc;
	EXPECT_TRUE(t.Revoke("a"));
	EXPECT_FALSE(t.Revoke("a"));
	EXPECT_EQ(ELinkState::NOT_FOUND, t.Resolve("a", 0).state);
	ASSERT_TRUE(held);
	EXPECT_EQ("h1", held->handle);

	EXPECT_EQ(1u, t.Purge(150));
	EXPECT_EQ(1u, t.size());
	// housekeeping keeps expired entries distinguishable from unknown ones
	t.Maintain(1000);
	EXPECT_EQ(1u, t.size());
	EXPECT_EQ(ELinkState::EXPIRED, t.Resolve("c", 1000).state);
	EXPECT_EQ(1u, t.Purge(1000));
	EXPECT_EQ(0u, t.size());
}

TEST(linkreg, record_format)
{
	auto d = mkDesc("remote/handle 1", 123456, 99999, "My File\t(1).tar.gz");
	d.mimeType = "application/gzip";
	auto line = FormatLinkRecord("tok", d);
	EXPECT_EQ("tok\tremote/handle 1\t123456\tapplication/gzip\t1000\t99999\tMy%20File%09%281%29.tar.gz\n", line);

	mstring token;
	tFileDesc back;
	ASSERT_TRUE(ParseLinkRecord(line, token, back));
	EXPECT_EQ("tok", token);
	EXPECT_EQ(d.handle, back.handle);
	EXPECT_EQ(d.totalSize, back.totalSize);
	EXPECT_EQ(d.mimeType, back.mimeType);
	EXPECT_EQ(d.fileName, back.fileName);
	EXPECT_EQ(d.createdAt, back.createdAt);
	EXPECT_EQ(d.expiresAt, back.expiresAt);

	// empty name and mime are fine
	ASSERT_TRUE(ParseLinkRecord("t2\th\t0\t\t0\t0\t", token, back));
	EXPECT_EQ("t2", token);
	EXPECT_EQ(0, back.totalSize);
	EXPECT_TRUE(back.fileName.empty());

	EXPECT_FALSE(ParseLinkRecord("t2\th\t0\t\t0\t0", token, back));
	EXPECT_FALSE(ParseLinkRecord("t2\th\t-5\t\t0\t0\tx", token, back));
	EXPECT_FALSE(ParseLinkRecord("t2\th\tabc\t\t0\t0\tx", token, back));
	EXPECT_FALSE(ParseLinkRecord("t/2\th\t5\t\t0\t0\tx", token, back));
	EXPECT_FALSE(ParseLinkRecord("t2\t\t5\t\t0\t0\tx", token, back));
	EXPECT_FALSE(ParseLinkRecord("t2\th\t5\t\t0\t0\tx\textra", token, back));
}

TEST(linkreg, table_file_reload)
{
	tTempTable tmp;
	auto oldRescan = cfg::linkrescan;
	cfg::linkrescan = 0;

	tFileDesc d = mkDesc("h1", 10, 0, "one.bin");
	ASSERT_EQ(se, AppendLinkRecord(tmp.path, "first", d));
	d.expiresAt = 10;
	ASSERT_EQ(se, AppendLinkRecord(tmp.path, "gone", d));

	tLinkTableFile reg(tmp.path);
	auto r = reg.Resolve("first", 100);
	ASSERT_EQ(ELinkState::FOUND, r.state);
	EXPECT_EQ("one.bin", r.desc->fileName);
	// expired records are loaded and reported as such
	r = reg.Resolve("gone", 100);
	EXPECT_EQ(ELinkState::EXPIRED, r.state);
	ASSERT_TRUE(r.desc);
	EXPECT_EQ("h1", r.desc->handle);

	// replaced contents, with a comment and a broken line
	mstring contents = "# header\n\nbroken line\n" + FormatLinkRecord("second", mkDesc("h2", 20));
	ASSERT_EQ(se, ReplaceFileContents(tmp.path, contents));
	EXPECT_EQ(ELinkState::FOUND, reg.Resolve("second", 100).state);
	EXPECT_EQ(ELinkState::NOT_FOUND, reg.Resolve("first", 100).state);

	// a vanished file keeps the last known state
	unlink(tmp.path.c_str());
	EXPECT_EQ(ELinkState::FOUND, reg.Resolve("second", 100).state);

	cfg::linkrescan = oldRescan;
}

TEST(linkreg, table_file_keeps_expired)
{
	tTempTable tmp;
	auto oldRescan = cfg::linkrescan;
	cfg::linkrescan = 0;

	ASSERT_EQ(se, AppendLinkRecord(tmp.path, "tok", mkDesc("h1", 10, 50)));
	tLinkTableFile reg(tmp.path);
	EXPECT_EQ(ELinkState::FOUND, reg.Resolve("tok", 40).state);
	reg.Maintain(60);
	EXPECT_EQ(ELinkState::EXPIRED, reg.Resolve("tok", 60).state);
	reg.Maintain(100);
	EXPECT_EQ(ELinkState::EXPIRED, reg.Resolve("tok", 100).state);

	// a fresh load of the same file
	tLinkTableFile later(tmp.path);
	EXPECT_EQ(ELinkState::EXPIRED, later.Resolve("tok", 100).state);

	cfg::linkrescan = oldRescan;
}

TEST(linkreg, table_file_rescan_interval)
{
	tTempTable tmp;
	auto oldRescan = cfg::linkrescan;
	cfg::linkrescan = 60;

	ASSERT_EQ(se, AppendLinkRecord(tmp.path, "first", mkDesc("h1", 10)));
	tLinkTableFile reg(tmp.path);
	EXPECT_EQ(ELinkState::FOUND, reg.Resolve("first", 1000).state);
	ASSERT_EQ(se, AppendLinkRecord(tmp.path, "later", mkDesc("h2", 10)));
	// not looked at before the interval passed
	EXPECT_EQ(ELinkState::NOT_FOUND, reg.Resolve("later", 1030).state);
	EXPECT_EQ(ELinkState::FOUND, reg.Resolve("later", 1061).state);

	cfg::linkrescan = oldRescan;
}

TEST(linkreg, bad_append)
{
	tTempTable tmp;
	EXPECT_NE(se, AppendLinkRecord(tmp.path, "bad token", mkDesc("h", 1)));
	EXPECT_NE(se, AppendLinkRecord(tmp.path, "tok", mkDesc("", 1)));
	EXPECT_NE(se, AppendLinkRecord(tmp.path, "tok", mkDesc("a\tb", 1)));
	EXPECT_NE(se, LoadLinkRecords(tmp.path + ".missing", [](mstring&&, tFileDesc&&) {}));
}

TEST(linkreg, token_generation)
{
	auto a = GenerateToken(), b = GenerateToken();
	ASSERT_EQ(24u, a.size());
	EXPECT_TRUE(IsValidToken(a));
	EXPECT_NE(a, b);
	for (auto c: a)
		EXPECT_TRUE(isdigit((unsigned char) c) || (c >= 'a' && c <= 'f')) << a;
}

TEST(linkreg, link_url)
{
	EXPECT_EQ("https://dl.example.org/abc", BuildLinkUrl("https://dl.example.org/", "abc", ""));
	EXPECT_EQ("https://dl.example.org/dl/abc/report%202024.pdf",
			BuildLinkUrl("https://dl.example.org", "abc", "report 2024.pdf"));
	EXPECT_EQ("http://h:8080/sub/dl/t/a%2Fb", BuildLinkUrl("http://h:8080/sub//", "t", "a/b"));
}

TEST(linkreg, concurrent_readers_and_writer)
{
	tLinkTable t;
	ASSERT_TRUE(t.Insert("stable", mkDesc("h0", 42)));
	atomic<bool> stop(false);
	atomic<unsigned> bad(0);
	vector<thread> readers;
	for (int i = 0; i < 4; ++i)
	{
		readers.emplace_back([&]()
		{
			while (!stop)
			{
				auto r = t.Resolve("stable", 0);
				if (r.state != ELinkState::FOUND || r.desc->totalSize != 42)
					bad++;
				// a published token is either absent or complete
				r = t.Resolve("t7", 0);
				if (r.state == ELinkState::FOUND && r.desc->handle != "h-t7")
					bad++;
			}
		});
	}
	for (int round = 0; round < 200; ++round)
	{
		for (int k = 0; k < 10; ++k)
			t.Insert((tSS() << 't' << k).str(), mkDesc((tSS() << "h-t" << k).str(), k));
		for (int k = 0; k < 10; ++k)
			t.Revoke(tSS() << 't' << k);
	}
	stop = true;
	for (auto& th: readers)
		th.join();
	EXPECT_EQ(0u, bad.load());
	EXPECT_EQ(1u, t.size());
}
