#include "PollClock.hh"

#include <chrono>
#include <thread>

namespace flashkit {

uint64_t RealTimeClock::getTime()
{
	using namespace std::chrono;
	uint64_t now = duration_cast<microseconds>(
		steady_clock::now().time_since_epoch()).count();

	// A timeout must never be computed from a time point in the past,
	// so never return a value less than a previously returned value.
	if (now < lastTime) return lastTime;
	lastTime = now;
	return now;
}

void RealTimeClock::sleep(uint64_t us)
{
	if (us == 0) {
		std::this_thread::yield();
	} else {
		std::this_thread::sleep_for(std::chrono::microseconds(us));
	}
}

} // namespace flashkit
