#include "gtest/gtest.h"
#include "acres.h"
#include "evabase.h"

#include <functional>

using namespace dlbr;
using namespace std;

//! Run the event loop until the timeout passes or abortVar becomes true
void pushEvents(int secTimeout, bool* abortVar);
//! Run the event loop until the condition is met, return its last result
bool pushEventsUntil(int secTimeout, const std::function<bool()>& done);
