#include "gtest/gtest.h"
#include "caddrinfo.h"
#include "gmock/gmock.h"
#include "main.h"

#define TESTTARGET "localhost"

using namespace dlbr;

static CAddrInfoPtr resolve(cmstring& host, uint16_t port)
{
	CAddrInfoPtr result;
	bool fin(false);
	CAddrInfo::Resolve(host, port, [&](CAddrInfoPtr res) { fin = true; result = res; });
	// never reported inline
	EXPECT_FALSE(fin);
	pushEvents(3, &fin);
	return result;
}

TEST(caddrinfo, numeric)
{
	auto result = resolve("127.0.0.1", 8080);
	ASSERT_TRUE(result);
	// address configuration filtering might hide loopback in restricted sandboxes
	if (!result->getError().empty())
		return;
	ASSERT_EQ(1u, result->getTargets().size());
	EXPECT_EQ("127.0.0.1:8080", mstring(result->getTargets().front()));
}

TEST(caddrinfo, test_query_inited)
{
	auto result = resolve(TESTTARGET, 443);
	ASSERT_TRUE(result);
	EXPECT_EQ(result->getError(), "");
	EXPECT_LT(0, result->getTargets().size());

	// served from the cache now
	auto again = resolve(TESTTARGET, 443);
	ASSERT_TRUE(again);
	EXPECT_EQ(result->getTargets().size(), again->getTargets().size());
}

TEST(caddrinfo, bad_name)
{
	auto result = resolve("no such host.invalid", 80);
	ASSERT_TRUE(result);
	EXPECT_NE(result->getError(), "");
	EXPECT_TRUE(result->getTargets().empty());
}
