#ifndef BANKMAP_HH
#define BANKMAP_HH

#include <array>
#include <cstdint>
#include <optional>

namespace flashkit {

class DeviceSession;

/** Model of the CPLD bank mapper on the cartridge.
  *
  * The console sees 4MB of cartridge space as 8 windows ('banks') of 512kB.
  * Bank 0 is hard-wired to page 0 of the flash chip, banks 1-7 each have a
  * byte register (at 0xA130F3, 0xA130F5, ..., 0xA130FF) that selects which
  * 512kB page of the 8MB chip appears in that window.
  *
  * Sequential operations on the chip only ever move bank 1 (see
  * translate() and WindowCursor). The cached page numbers are updated
  * after the register write, so a failed write never leaves the cache
  * claiming a mapping the hardware doesn't have.
  */
class BankMap
{
public:
	static constexpr unsigned NUM_BANKS  = 8;
	static constexpr unsigned NUM_PAGES  = 16;
	static constexpr uint32_t BANK_SIZE  = 0x80000;              // 512kB
	static constexpr uint32_t CHIP_SIZE  = NUM_PAGES * BANK_SIZE; // 8MB
	static constexpr uint32_t SPACE_SIZE = NUM_BANKS * BANK_SIZE; // 4MB
	static constexpr uint32_t BANK_REG_BASE = 0xA130F1;

	/** Result of translate(). */
	struct Translation {
		unsigned windowIndex;         // 512kB page of the chip
		uint32_t unlockBase;          // base for the flash unlock cycles
		uint32_t address;             // console address to access
		std::optional<unsigned> bank; // bank to re-point, if any
	};

	explicit BankMap(DeviceSession& session);

	/** Make chip page 'page' visible through bank 'bank'.
	  * Throws InvalidArgumentException for bank 0, a bank > 7 or a page > 15.
	  */
	void mapPage(unsigned bank, unsigned page);

	[[nodiscard]] unsigned getPage(unsigned bank) const;

	/** Pure computation, doesn't touch the hardware. Offsets within the
	  * first 512kB are accessed through the fixed bank 0, all others
	  * through bank 1.
	  */
	[[nodiscard]] static Translation translate(uint32_t logicalOffset);

	/** Re-read all bank registers. On a link failure all cached pages
	  * are reset to 0.
	  */
	void refreshFromHardware();

	/** Map bank b onto page b (b = 1..7): the console then sees the first
	  * 4MB of the chip linearly.
	  */
	void restoreDefaultLayout();

	[[nodiscard]] DeviceSession& getSession() const { return session; }

	[[nodiscard]] static constexpr uint32_t getRegisterAddress(unsigned bank) {
		return BANK_REG_BASE + 2 * bank;
	}

private:
	DeviceSession& session;
	std::array<uint8_t, NUM_BANKS> pages = {};
};

/** Tracks the window bank 1 points at during one sequential operation.
  * Bank 1 is only re-pointed when an access moves into a different
  * window; the first access through bank 1 always re-points it.
  */
class WindowCursor
{
public:
	explicit WindowCursor(BankMap& bankMap_) : bankMap(bankMap_) {}

	/** Translate 'logicalOffset' and, if needed, re-point bank 1. */
	BankMap::Translation select(uint32_t logicalOffset);

private:
	BankMap& bankMap;
	std::optional<unsigned> current;
};

} // namespace flashkit

#endif
