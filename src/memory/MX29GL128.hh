#ifndef MX29GL128_HH
#define MX29GL128_HH

#include "FlashProgress.hh"

#include <cstdint>
#include <span>

namespace flashkit {

class BankMap;
class WindowCursor;
class PollClock;

/** Completion polling limits, all in microseconds. */
struct FlashTimeouts
{
	uint64_t erase = 10'000'000;
	uint64_t write = 5'000'000;
	uint64_t pollInterval = 100;
};

/** Driver for the Macronix MX29GL128E (16MB part, used in 8MB/word mode on
  * the cartridge) behind the bank mapper.
  *
  * All offsets are linear offsets in the flash chip (0 .. 8MB). Each public
  * operation uses its own WindowCursor, so bank 1 is re-pointed on the
  * first access and afterwards only when a window boundary is crossed.
  *
  * Completion is detected with DQ7 data polling: during an erase DQ7 reads
  * 0 until the sector is erased, during programming DQ7 reads the
  * complement of the programmed bit until the write is done.
  */
class MX29GL128
{
public:
	static constexpr uint32_t SECTOR_SIZE = 0x20000; // 128kB
	static constexpr unsigned NUM_SECTORS = 64;
	static constexpr uint32_t BUFFER_SIZE = 64;      // 32 words

	static constexpr uint16_t CMD_UNLOCK1   = 0xAA;
	static constexpr uint16_t CMD_UNLOCK2   = 0x55;
	static constexpr uint16_t CMD_ERASE     = 0x80;
	static constexpr uint16_t CMD_SECTOR    = 0x30;
	static constexpr uint16_t CMD_PROGRAM   = 0xA0;
	static constexpr uint16_t CMD_BUFFER    = 0x25;
	static constexpr uint16_t CMD_CONFIRM   = 0x29;
	static constexpr uint16_t CMD_RESET     = 0xF0;
	static constexpr uint32_t UNLOCK_ADDR1  = 0x555 * 2;
	static constexpr uint32_t UNLOCK_ADDR2  = 0x2AA * 2;
	static constexpr uint16_t DQ7 = 0x80;

	MX29GL128(BankMap& bankMap, PollClock& clock, const FlashTimeouts& timeouts = {});

	/** Return the chip to array-read mode. */
	void resetToRead();

	/** Erase one 128kB sector. Throws EraseTimeoutException. */
	void eraseSector(unsigned sector);

	/** Erase sectors 0..63 in order, reporting progress. */
	void eraseAllSectors(const ProgressCallback& progress = {});

	/** Program 1 to 32 words through the write buffer. The data must not
	  * cross a 64-byte boundary of the chip.
	  * Throws InvalidArgumentException (before touching the hardware) or
	  * BufferWriteTimeoutException.
	  */
	void writeBuffer(std::span<const uint8_t> data, uint32_t offset);

	/** Program a single word. Throws WordWriteTimeoutException. */
	void writeWord(uint32_t offset, uint16_t value);

	/** Program a whole image starting at offset 0. The chip must have
	  * been erased. Progress is reported at least every 4kB.
	  */
	void writeRom(std::span<const uint8_t> image, const ProgressCallback& progress = {});

	/** Compare the chip contents against 'image'. Throws
	  * VerifyMismatchException on the first difference. Progress is
	  * reported at least every 8kB.
	  */
	void verifyRom(std::span<const uint8_t> image, const ProgressCallback& progress = {});

	[[nodiscard]] const FlashTimeouts& getTimeouts() const { return timeouts; }

private:
	void unlock(uint32_t unlockBase);
	void eraseSector(WindowCursor& cursor, unsigned sector);
	void writeBuffer(WindowCursor& cursor, std::span<const uint8_t> data, uint32_t offset);
	void writeWord(WindowCursor& cursor, uint32_t offset, uint16_t value);
	template<typename Predicate>
	[[nodiscard]] bool poll(uint64_t timeout, Predicate done);

private:
	BankMap& bankMap;
	PollClock& clock;
	const FlashTimeouts timeouts;
};

} // namespace flashkit

#endif
