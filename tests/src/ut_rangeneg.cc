#include "gtest/gtest.h"
#include "rangeneg.h"

using namespace dlbr;
using namespace std;

#define EXPECT_RANGE(hdr, total, xkind, xstart, xend) \
	{ \
		auto v = NegotiateRange(hdr, total); \
		EXPECT_EQ(tRangeVerdict::xkind, v.kind) << hdr; \
		if (v.kind != tRangeVerdict::UNSATISFIABLE) \
		{ \
			EXPECT_EQ(xstart, v.iv.start) << hdr; \
			EXPECT_EQ(xend, v.iv.end) << hdr; \
		} \
	}

TEST(rangeneg, absent)
{
	auto v = NegotiateRange(nullptr, 1000);
	EXPECT_EQ(tRangeVerdict::FULL, v.kind);
	EXPECT_EQ(0, v.iv.start);
	EXPECT_EQ(999, v.iv.end);
	EXPECT_EQ(1000, v.iv.length());

	v = NegotiateRange(nullptr, 0);
	EXPECT_EQ(tRangeVerdict::FULL, v.kind);
	EXPECT_EQ(0, v.iv.length());
}

TEST(rangeneg, closed)
{
	EXPECT_RANGE("bytes=0-0", 1000, PARTIAL, 0, 0);
	EXPECT_RANGE("bytes=300-700", 1000, PARTIAL, 300, 700);
	EXPECT_RANGE("bytes=0-999", 1000, PARTIAL, 0, 999);
	// end beyond the content is clamped
	EXPECT_RANGE("bytes=900-5000", 1000, PARTIAL, 900, 999);
	EXPECT_RANGE("bytes=900-99999999999999999999999", 1000, PARTIAL, 900, 999);
	EXPECT_RANGE(" bytes = 10 - 20 ", 1000, PARTIAL, 10, 20);
	EXPECT_RANGE("Bytes=10-20", 1000, PARTIAL, 10, 20);
}

TEST(rangeneg, open_end)
{
	EXPECT_RANGE("bytes=500-", 1000, PARTIAL, 500, 999);
	EXPECT_RANGE("bytes=999-", 1000, PARTIAL, 999, 999);
	EXPECT_RANGE("bytes=1000-", 1000, UNSATISFIABLE, 0, 0);
}

TEST(rangeneg, suffix)
{
	EXPECT_RANGE("bytes=-100", 1000, PARTIAL, 900, 999);
	EXPECT_RANGE("bytes=-1", 1000, PARTIAL, 999, 999);
	// longer than the content means everything
	EXPECT_RANGE("bytes=-5000", 1000, PARTIAL, 0, 999);
	EXPECT_RANGE("bytes=-1000", 1000, PARTIAL, 0, 999);
	EXPECT_RANGE("bytes=-0", 1000, UNSATISFIABLE, 0, 0);
	EXPECT_RANGE("bytes=-10", 0, UNSATISFIABLE, 0, 0);
}

TEST(rangeneg, unsatisfiable)
{
	EXPECT_RANGE("bytes=1000-1001", 1000, UNSATISFIABLE, 0, 0);
	EXPECT_RANGE("bytes=700-300", 1000, UNSATISFIABLE, 0, 0);
	EXPECT_RANGE("bytes=0-0", 0, UNSATISFIABLE, 0, 0);
	EXPECT_RANGE("bytes=99999999999999999999999-", 1000, UNSATISFIABLE, 0, 0);
	// multiple ranges are not served
	EXPECT_RANGE("bytes=0-10,20-30", 1000, UNSATISFIABLE, 0, 0);
}

TEST(rangeneg, ignored_garbage)
{
	EXPECT_RANGE("items=0-10", 1000, FULL, 0, 999);
	EXPECT_RANGE("bytes", 1000, FULL, 0, 999);
	EXPECT_RANGE("bytes=abc", 1000, FULL, 0, 999);
	EXPECT_RANGE("bytes=a-b", 1000, FULL, 0, 999);
	EXPECT_RANGE("bytes=-", 1000, FULL, 0, 999);
	EXPECT_RANGE("bytes=+5-10", 1000, FULL, 0, 999);
	EXPECT_RANGE("", 1000, FULL, 0, 999);
}
