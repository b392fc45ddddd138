#ifndef POLLCLOCK_HH
#define POLLCLOCK_HH

#include <cstdint>

namespace flashkit {

/** Time source for the bounded polling loops of the flash driver.
  * Abstract so that tests can run the timeout paths without waiting.
  */
class PollClock
{
public:
	/** Get current (real) time in us. Absolute value has no meaning.
	  */
	[[nodiscard]] virtual uint64_t getTime() = 0;

	/** Sleep for the specified amount of time (in us). It is possible
	  * that this method sleeps longer or shorter than the requested time.
	  */
	virtual void sleep(uint64_t us) = 0;

protected:
	PollClock() = default;
	~PollClock() = default;
};

class RealTimeClock final : public PollClock
{
public:
	[[nodiscard]] uint64_t getTime() override;
	void sleep(uint64_t us) override;

private:
	uint64_t lastTime = 0;
};

} // namespace flashkit

#endif
