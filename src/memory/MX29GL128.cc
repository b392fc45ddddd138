#include "MX29GL128.hh"
#include "BankMap.hh"
#include "DeviceSession.hh"
#include "FlashException.hh"
#include "PollClock.hh"

#include "narrow.hh"
#include "xrange.hh"

#include <algorithm>
#include <array>

namespace flashkit {

static constexpr uint32_t WRITE_REPORT_STEP  = 0x1000;
static constexpr uint32_t VERIFY_REPORT_STEP = 0x2000;
static constexpr uint32_t VERIFY_CHUNK       = 0x1000;

[[nodiscard]] static constexpr uint16_t makeWord(uint8_t hi, uint8_t lo)
{
	return narrow_cast<uint16_t>((hi << 8) | lo);
}

MX29GL128::MX29GL128(BankMap& bankMap_, PollClock& clock_, const FlashTimeouts& timeouts_)
	: bankMap(bankMap_), clock(clock_), timeouts(timeouts_)
{
}

template<typename Predicate>
bool MX29GL128::poll(uint64_t timeout, Predicate done)
{
	auto start = clock.getTime();
	while (true) {
		if (done()) return true;
		if ((clock.getTime() - start) >= timeout) return false;
		clock.sleep(timeouts.pollInterval);
	}
}

void MX29GL128::unlock(uint32_t unlockBase)
{
	auto& session = bankMap.getSession();
	session.writeWord(unlockBase + UNLOCK_ADDR1, CMD_UNLOCK1);
	session.writeWord(unlockBase + UNLOCK_ADDR2, CMD_UNLOCK2);
}

void MX29GL128::resetToRead()
{
	bankMap.getSession().writeWord(0, CMD_RESET);
}

void MX29GL128::eraseSector(unsigned sector)
{
	WindowCursor cursor(bankMap);
	eraseSector(cursor, sector);
}

void MX29GL128::eraseSector(WindowCursor& cursor, unsigned sector)
{
	if (sector >= NUM_SECTORS) {
		throw InvalidArgumentException("Invalid sector: ", sector);
	}
	auto t = cursor.select(sector * SECTOR_SIZE);
	auto& session = bankMap.getSession();

	unlock(t.unlockBase);
	session.writeWord(t.unlockBase + UNLOCK_ADDR1, CMD_ERASE);
	unlock(t.unlockBase);
	session.writeWord(t.address, CMD_SECTOR);

	if (!poll(timeouts.erase, [&] { return (session.readWord(t.address) & DQ7) != 0; })) {
		throw EraseTimeoutException(sector * SECTOR_SIZE);
	}
}

void MX29GL128::eraseAllSectors(const ProgressCallback& progress)
{
	resetToRead();
	WindowCursor cursor(bankMap);
	for (auto sector : xrange(NUM_SECTORS)) {
		eraseSector(cursor, sector);
		if (progress) progress((sector + 1) * SECTOR_SIZE, NUM_SECTORS * SECTOR_SIZE);
	}
}

void MX29GL128::writeBuffer(std::span<const uint8_t> data, uint32_t offset)
{
	WindowCursor cursor(bankMap);
	writeBuffer(cursor, data, offset);
}

void MX29GL128::writeBuffer(WindowCursor& cursor, std::span<const uint8_t> data, uint32_t offset)
{
	if (data.empty() || (data.size() > BUFFER_SIZE) || (data.size() & 1)) {
		throw InvalidArgumentException(
			"Buffered write needs 2 to ", BUFFER_SIZE, " bytes (even), got ", data.size());
	}
	if (offset & 1) {
		throw InvalidArgumentException("Unaligned buffered write at 0x", hex_string<6>(offset));
	}
	if ((offset / BUFFER_SIZE) != ((offset + data.size() - 1) / BUFFER_SIZE)) {
		throw InvalidArgumentException(
			"Buffered write at 0x", hex_string<6>(offset), " crosses a write-buffer boundary");
	}
	auto t = cursor.select(offset);
	auto& session = bankMap.getSession();
	uint32_t sectorBase = t.address & ~(SECTOR_SIZE - 1);
	auto wordCount = narrow<uint16_t>(data.size() / 2);

	unlock(t.unlockBase);
	session.writeWord(sectorBase, CMD_BUFFER);
	session.writeWord(sectorBase, narrow<uint16_t>(wordCount - 1));
	uint16_t lastWord = 0;
	for (auto i : xrange(wordCount)) {
		lastWord = makeWord(data[2 * i], data[2 * i + 1]);
		session.writeWord(t.address + 2 * i, lastWord);
	}
	session.writeWord(sectorBase, CMD_CONFIRM);

	uint32_t lastAddr = t.address + 2 * (wordCount - 1);
	if (!poll(timeouts.write, [&] {
		return (session.readWord(lastAddr) & DQ7) == (lastWord & DQ7);
	})) {
		throw BufferWriteTimeoutException(offset + 2 * (wordCount - 1));
	}
}

void MX29GL128::writeWord(uint32_t offset, uint16_t value)
{
	WindowCursor cursor(bankMap);
	writeWord(cursor, offset, value);
}

void MX29GL128::writeWord(WindowCursor& cursor, uint32_t offset, uint16_t value)
{
	if (offset & 1) {
		throw InvalidArgumentException("Unaligned word write at 0x", hex_string<6>(offset));
	}
	auto t = cursor.select(offset);
	auto& session = bankMap.getSession();

	unlock(t.unlockBase);
	session.writeWord(t.unlockBase + UNLOCK_ADDR1, CMD_PROGRAM);
	session.writeWord(t.address, value);

	if (!poll(timeouts.write, [&] {
		return (session.readWord(t.address) & DQ7) == (value & DQ7);
	})) {
		throw WordWriteTimeoutException(offset);
	}
}

void MX29GL128::writeRom(std::span<const uint8_t> image, const ProgressCallback& progress)
{
	if (image.size() > BankMap::CHIP_SIZE) {
		throw InvalidArgumentException("Image of ", image.size(),
		                               " bytes doesn't fit in the flash chip");
	}
	auto total = narrow<uint32_t>(image.size());
	WindowCursor cursor(bankMap);
	uint32_t offset = 0;
	uint32_t lastReport = 0;
	while (offset < total) {
		uint32_t remainingInWindow = BankMap::BANK_SIZE - (offset % BankMap::BANK_SIZE);
		uint32_t len = std::min({BUFFER_SIZE, remainingInWindow, total - offset});
		if ((len == BUFFER_SIZE) && ((offset % BUFFER_SIZE) == 0)) {
			writeBuffer(cursor, image.subspan(offset, len), offset);
		} else {
			for (uint32_t i = 0; i < len; i += 2) {
				uint8_t hi = image[offset + i];
				uint8_t lo = (i + 1 < len) ? image[offset + i + 1] : 0xFF;
				writeWord(cursor, offset + i, makeWord(hi, lo));
			}
		}
		offset += len;
		if (progress && (((offset - lastReport) >= WRITE_REPORT_STEP) || (offset == total))) {
			progress(offset, total);
			lastReport = offset;
		}
	}
}

void MX29GL128::verifyRom(std::span<const uint8_t> image, const ProgressCallback& progress)
{
	if (image.size() > BankMap::CHIP_SIZE) {
		throw InvalidArgumentException("Image of ", image.size(),
		                               " bytes doesn't fit in the flash chip");
	}
	auto total = narrow<uint32_t>(image.size());
	auto& session = bankMap.getSession();
	WindowCursor cursor(bankMap);
	std::array<uint8_t, VERIFY_CHUNK> buf;
	uint32_t offset = 0;
	uint32_t lastReport = 0;
	while (offset < total) {
		uint32_t remainingInWindow = BankMap::BANK_SIZE - (offset % BankMap::BANK_SIZE);
		uint32_t len = std::min({VERIFY_CHUNK, remainingInWindow, total - offset});
		auto t = cursor.select(offset);
		// the link transfers whole words
		uint32_t readLen = (len + 1) & ~1u;
		session.read(t.address, std::span{buf}.first(readLen));
		for (auto i : xrange(len)) {
			if (buf[i] != image[offset + i]) {
				throw VerifyMismatchException(offset + i, image[offset + i], buf[i]);
			}
		}
		offset += len;
		if (progress && (((offset - lastReport) >= VERIFY_REPORT_STEP) || (offset == total))) {
			progress(offset, total);
			lastReport = offset;
		}
	}
}

} // namespace flashkit
