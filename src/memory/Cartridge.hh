#ifndef CARTRIDGE_HH
#define CARTRIDGE_HH

#include "BankMap.hh"
#include "CapacityProber.hh"
#include "FlashProgress.hh"
#include "MX29GL128.hh"
#include "RomHeader.hh"

#include <cstdint>
#include <functional>
#include <span>
#include <vector>

namespace flashkit {

class DeviceSession;
class PollClock;

/** The flash cartridge as a whole: the operations the front end offers,
  * built on the bank mapper, the flash driver and the capacity prober.
  * Progress of the long operations is logged through the session's
  * CliComm, 'progress' callbacks additionally receive the raw counts.
  */
class Cartridge
{
public:
	using DumpSink = std::function<void(std::span<const uint8_t>)>;

	Cartridge(DeviceSession& session, PollClock& clock, const FlashTimeouts& timeouts = {});

	[[nodiscard]] CapacityReport detectCapacity();

	void eraseAll();

	/** Pad the image to a multiple of 512kB, erase the whole chip, program
	  * and verify.
	  */
	void writeRom(std::span<const uint8_t> image, const ProgressCallback& progress = {});

	/** Dump the ROM. A 'sizeHint' of 0 means: detect the size first. The
	  * trimmed dump is passed to 'sink'. Returns the number of bytes dumped.
	  */
	size_t readRom(uint32_t sizeHint, const DumpSink& sink,
	               const ProgressCallback& progress = {});

	/** Throw RamUnavailableException on a cartridge without RAM. */
	[[nodiscard]] std::vector<uint8_t> readRam();
	void writeRam(std::span<const uint8_t> data);

	[[nodiscard]] RomHeader readHeader();

	[[nodiscard]] BankMap& getBankMap() { return bankMap; }

private:
	DeviceSession& session;
	BankMap bankMap;
	MX29GL128 flash;
	CapacityProber prober;
};

} // namespace flashkit

#endif
