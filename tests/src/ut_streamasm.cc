#include "testcommon.h"
#include "streamasm.h"

#include "gmock/gmock.h"

using namespace dlbr;
using namespace std;

namespace
{

struct tAsmHarness
{
	tFakeChunkSource src;
	tAssemblerParams params;
	unique_ptr<tStreamAssembler> asmb;
	unique_eb out = make_eb();
	// consume data as soon as it arrives
	bool autoConsume = true;
	unsigned notifications = 0;

	tAsmHarness()
	{
		params.fetchRetries = 4;
		params.retryBackoffMs = 1;
		params.fetchTimeoutMs = 5000;
	}

	void Start(off_t from, off_t to, off_t total)
	{
		asmb.reset(new tStreamAssembler(src, "file-handle", tByteInterval { from, to }, total, params,
				[this]()
		{
			notifications++;
			if (autoConsume && asmb->HasData())
				asmb->MoveTo(*out);
		}));
		asmb->Start();
	}
	bool Finished(int secs = 5)
	{
		return pushEventsUntil(secs, [this]() { return asmb->IsDone() || asmb->IsFailed(); });
	}
	mstring Output()
	{
		mstring ret;
		ret.resize(evbuffer_get_length(*out));
		evbuffer_copyout(*out, &ret[0], ret.size());
		return ret;
	}
};

}

TEST(streamasm, window_cover)
{
	auto w = tChunkWindow::Cover(tByteInterval { 300, 700 }, 256, 1000);
	EXPECT_EQ(256, w.alignedStart);
	EXPECT_EQ(767, w.alignedEnd);

	w = tChunkWindow::Cover(tByteInterval { 0, 999 }, 256, 1000);
	EXPECT_EQ(0, w.alignedStart);
	EXPECT_EQ(999, w.alignedEnd);

	w = tChunkWindow::Cover(tByteInterval { 512, 512 }, 256, 1000);
	EXPECT_EQ(512, w.alignedStart);
	EXPECT_EQ(767, w.alignedEnd);

	w = tChunkWindow::Cover(tByteInterval { 0, -1 }, 256, 0);
	EXPECT_EQ(-1, w.alignedEnd);
}

TEST(streamasm, backoff)
{
	EXPECT_EQ(0u, tStreamAssembler::GetBackoffMs(250, 0));
	EXPECT_EQ(250u, tStreamAssembler::GetBackoffMs(250, 1));
	EXPECT_EQ(500u, tStreamAssembler::GetBackoffMs(250, 2));
	EXPECT_EQ(1000u, tStreamAssembler::GetBackoffMs(250, 3));
	EXPECT_EQ(8000u, tStreamAssembler::GetBackoffMs(250, 10));
	EXPECT_EQ(8000u, tStreamAssembler::GetBackoffMs(250, 1000));
}

TEST(streamasm, exact_slice)
{
	tAsmHarness h;
	h.Start(300, 700, 1000);
	ASSERT_TRUE(h.Finished());
	ASSERT_TRUE(h.asmb->IsDone());
	EXPECT_EQ(401, h.asmb->GetEmitted());
	EXPECT_EQ(ContentRange(300, 401), h.Output());
	// two aligned chunks, one open call
	EXPECT_EQ(1u, h.src.fetches);
	EXPECT_EQ(2u, h.src.nextCalls);
	EXPECT_EQ(2u, h.asmb->GetNextCalls());
	EXPECT_THAT(h.src.fetchOffsets, testing::ElementsAre(256));
	EXPECT_EQ(1u, h.src.peakInFlight);
}

TEST(streamasm, whole_file)
{
	tAsmHarness h;
	h.Start(0, 999, 1000);
	ASSERT_TRUE(h.Finished());
	ASSERT_TRUE(h.asmb->IsDone());
	EXPECT_EQ(ContentRange(0, 1000), h.Output());
	EXPECT_EQ(4u, h.src.nextCalls);
}

TEST(streamasm, single_byte)
{
	tAsmHarness h;
	h.Start(999, 999, 1000);
	ASSERT_TRUE(h.Finished());
	ASSERT_TRUE(h.asmb->IsDone());
	EXPECT_EQ(ContentRange(999, 1), h.Output());
	EXPECT_EQ(1u, h.src.nextCalls);
}

TEST(streamasm, backpressure)
{
	tAsmHarness h;
	h.autoConsume = false;
	h.Start(0, 999, 1000);
	ASSERT_TRUE(pushEventsUntil(5, [&]() { return h.asmb->HasData(); }));
	// nothing more is requested while the ready slot is full
	pushEvents(1, nullptr);
	EXPECT_EQ(1u, h.src.nextCalls);
	EXPECT_EQ(256, h.asmb->MoveTo(*h.out));
	ASSERT_TRUE(pushEventsUntil(5, [&]() { return h.asmb->HasData(); }));
	EXPECT_EQ(2u, h.src.nextCalls);
	h.autoConsume = true;
	h.asmb->MoveTo(*h.out);
	ASSERT_TRUE(h.Finished());
	EXPECT_EQ(ContentRange(0, 1000), h.Output());
	EXPECT_EQ(1u, h.src.peakInFlight);
}

TEST(streamasm, transient_failures_recovered)
{
	tAsmHarness h;
	h.src.transientFailures = 3;
	h.Start(300, 700, 1000);
	ASSERT_TRUE(h.Finished());
	ASSERT_TRUE(h.asmb->IsDone());
	EXPECT_EQ(ContentRange(300, 401), h.Output());
	EXPECT_EQ(3u, h.asmb->GetRetries());
	EXPECT_EQ(4u, h.src.fetches);
	EXPECT_THAT(h.src.fetchOffsets, testing::ElementsAre(256, 256, 256, 256));
}

TEST(streamasm, transient_failures_exhausted)
{
	tAsmHarness h;
	h.src.transientFailures = 4;
	h.Start(300, 700, 1000);
	ASSERT_TRUE(h.Finished());
	ASSERT_TRUE(h.asmb->IsFailed());
	EXPECT_EQ(EFetchError::REMOTE_UNAVAILABLE, h.asmb->GetErrorKind());
	EXPECT_EQ(0, h.asmb->GetEmitted());
}

TEST(streamasm, resume_after_midstream_failure)
{
	tAsmHarness h;
	h.src.hold = true;
	h.Start(300, 999, 1000);
	EXPECT_EQ(1u, h.src.Flush());
	ASSERT_TRUE(pushEventsUntil(5, [&]() { return h.asmb->GetEmitted() == 212; }));
	// the next chunk fails, then the source is reopened at the aligned position
	h.src.transientFailures = 1;
	h.src.hold = false;
	EXPECT_EQ(1u, h.src.Flush());
	ASSERT_TRUE(h.Finished());
	ASSERT_TRUE(h.asmb->IsDone());
	EXPECT_EQ(ContentRange(300, 700), h.Output());
	EXPECT_THAT(h.src.fetchOffsets, testing::ElementsAre(256, 512));
}

TEST(streamasm, fatal_error)
{
	tAsmHarness h;
	h.src.fatal = EFetchError::HANDLE_INVALID;
	h.Start(0, 999, 1000);
	ASSERT_TRUE(h.Finished());
	ASSERT_TRUE(h.asmb->IsFailed());
	EXPECT_EQ(EFetchError::HANDLE_INVALID, h.asmb->GetErrorKind());
	EXPECT_EQ(1u, h.src.fetches);
	EXPECT_EQ(0u, h.asmb->GetRetries());
}

TEST(streamasm, premature_end)
{
	tAsmHarness h;
	h.src.contentSize = 600;
	h.Start(300, 700, 1000);
	ASSERT_TRUE(h.Finished());
	ASSERT_TRUE(h.asmb->IsFailed());
	EXPECT_EQ(EFetchError::INTERRUPTED, h.asmb->GetErrorKind());
	// what was there is passed through
	EXPECT_EQ(300, h.asmb->GetEmitted());
	EXPECT_EQ(ContentRange(300, 300), h.Output());
}

TEST(streamasm, fetch_timeout)
{
	tAsmHarness h;
	h.src.hold = true;
	h.params.fetchRetries = 2;
	h.params.fetchTimeoutMs = 50;
	h.Start(0, 999, 1000);
	ASSERT_TRUE(h.Finished());
	ASSERT_TRUE(h.asmb->IsFailed());
	EXPECT_EQ(EFetchError::REMOTE_UNAVAILABLE, h.asmb->GetErrorKind());
	EXPECT_EQ(2u, h.src.cancels);
	EXPECT_EQ(0u, h.src.inFlight);
	// stale deliveries are not reported anymore
	h.src.Flush();
	EXPECT_EQ(0, h.asmb->GetEmitted());
}

TEST(streamasm, destruction_cancels)
{
	tAsmHarness h;
	h.src.hold = true;
	h.Start(0, 999, 1000);
	EXPECT_EQ(1u, h.src.inFlight);
	h.asmb.reset();
	EXPECT_EQ(1u, h.src.cancels);
	EXPECT_EQ(0u, h.src.inFlight);
	h.src.Flush();
	EXPECT_EQ(0u, h.src.delivered);
}

TEST(streamasm, consumer_releases_from_callback)
{
	tFakeChunkSource src;
	tAssemblerParams params;
	params.retryBackoffMs = 1;
	unique_eb out = make_eb();
	unique_ptr<tStreamAssembler> asmb;
	unsigned released = 0;
	auto consumer = [&]()
	{
		if (asmb && asmb->HasData())
			asmb->MoveTo(*out);
		if (asmb && (asmb->IsDone() || asmb->IsFailed()))
		{
			asmb.reset();
			released++;
		}
	};

	asmb.reset(new tStreamAssembler(src, "file-handle", tByteInterval { 0, 599 }, 1000, params, consumer));
	asmb->Start();
	ASSERT_TRUE(pushEventsUntil(5, [&]() { return released == 1; }));
	EXPECT_FALSE(asmb);
	EXPECT_EQ(600u, evbuffer_get_length(*out));

	// same from the failure report
	src.fatal = EFetchError::HANDLE_INVALID;
	asmb.reset(new tStreamAssembler(src, "file-handle", tByteInterval { 0, 599 }, 1000, params, consumer));
	asmb->Start();
	ASSERT_TRUE(pushEventsUntil(5, [&]() { return released == 2; }));
	EXPECT_FALSE(asmb);
	EXPECT_EQ(0u, src.inFlight);
}
