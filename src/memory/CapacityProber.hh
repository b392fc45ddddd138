#ifndef CAPACITYPROBER_HH
#define CAPACITYPROBER_HH

#include "FlashProgress.hh"

#include <cstdint>
#include <vector>

namespace flashkit {

class BankMap;

struct CapacityReport
{
	uint32_t romSize = 0;  // bytes
	bool ramPresent = false;
	uint32_t ramSize = 0;  // bytes of battery-backed RAM
};

/** Determines how much ROM and RAM an unknown cartridge has.
  *
  * ROM size is found by mirroring: a chip (or programmed image) smaller
  * than the address range it is decoded in repeats itself, so the first
  * power-of-two offset that reads back the same data as the base is the
  * size. RAM size is found the same way, but by writing: once a write
  * beyond the end of the RAM aliases back onto the first cell, the RAM
  * has wrapped.
  *
  * The RAM is 8 bits wide and sits on the odd (low) byte lane of the RAM
  * window at 0x200000, so only low bytes are meaningful.
  */
class CapacityProber
{
public:
	static constexpr uint32_t RAM_CTRL   = 0xA13000;
	static constexpr uint16_t RAM_ENABLE = 0xFFFF;
	static constexpr uint16_t ROM_ENABLE = 0x0000;
	static constexpr uint32_t RAM_BASE   = 0x200000;
	static constexpr uint32_t MAX_RAM_SPAN = 0x100000;
	static constexpr uint32_t PROBE_BLOCK  = 256;
	static constexpr uint32_t FIRST_PROBE  = 0x8000;  // 32kB
	static constexpr uint32_t READ_BLOCK   = 0x8000;

	explicit CapacityProber(BankMap& bankMap);

	/** Switch the 0x200000 window to RAM or back to ROM. */
	void selectRam();
	void selectRom();

	/** Write/readback test of the first RAM cell. The original value is
	  * always restored. Leaves the RAM window enabled.
	  */
	[[nodiscard]] bool ramAvailable();

	/** Size of the RAM in bytes, 0 when there is none. */
	[[nodiscard]] uint32_t ramSize();

	/** Length of the image starting at console address 'base', found by
	  * doubling a probe offset from 32kB until the data mirrors or 'maxLen'
	  * is reached. Returns 0 if the image already mirrors at 32kB.
	  */
	[[nodiscard]] uint32_t checkRomSize(uint32_t base, uint32_t maxLen);

	/** Size of the ROM, up to the 8MB of the flash chip. Leaves the
	  * default bank layout and the ROM window selected.
	  */
	[[nodiscard]] uint32_t romSize();

	/** Read the first 'sizeHint' bytes of the chip and drop the trailing
	  * 0xFF bytes (unprogrammed flash).
	  */
	[[nodiscard]] std::vector<uint8_t> readRom(uint32_t sizeHint,
	                                           const ProgressCallback& progress = {});

	[[nodiscard]] CapacityReport detect();

private:
	[[nodiscard]] std::vector<uint8_t> readBlock(uint32_t address);
	[[nodiscard]] uint32_t probeUpperHalf();
	void mapUpperBanks(unsigned firstPage);

private:
	BankMap& bankMap;
};

} // namespace flashkit

#endif
