#include "gtest/gtest.h"
#include "acres.h"
#include "evabase.h"
#include "ac3rdparty.h"
#include "aclogger.h"
#include "main.h"

#include <event2/event.h>

#include <stdlib.h>
#include <locale.h>

using namespace dlbr;

void pushEvents(int secTimeout, bool* abortVar)
{
	for(auto dateEnd = time(0) + secTimeout;
		time(0) < dateEnd
		&& (abortVar == nullptr || !*abortVar)
		&& ! evabase::GetGlobal().IsShuttingDown()
		;)
	{
		event_base_loop(evabase::base, EVLOOP_NONBLOCK | EVLOOP_ONCE);
	}
}

bool pushEventsUntil(int secTimeout, const std::function<bool()>& done)
{
	for(auto dateEnd = time(0) + secTimeout; time(0) < dateEnd;)
	{
		if (done())
			return true;
		event_base_loop(evabase::base, EVLOOP_NONBLOCK | EVLOOP_ONCE);
	}
	return done();
}

int main(int argc, char **argv)
{
	setlocale(LC_ALL, "C");
	ac3rdparty_init();
	log::open();
	auto p = dlbr::evabase::Create();

	::testing::InitGoogleTest(&argc, argv);
	auto r = RUN_ALL_TESTS();
	p->SignalStop();
	pushEvents(2, nullptr);
	ac3rdparty_deinit();
	return r;
}
