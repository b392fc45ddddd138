#include "CapacityProber.hh"
#include "BankMap.hh"
#include "DeviceSession.hh"
#include "FlashkitException.hh"

#include "narrow.hh"
#include "xrange.hh"

#include <algorithm>
#include <span>

namespace flashkit {

CapacityProber::CapacityProber(BankMap& bankMap_)
	: bankMap(bankMap_)
{
}

void CapacityProber::selectRam()
{
	bankMap.getSession().writeWord(RAM_CTRL, RAM_ENABLE);
}

void CapacityProber::selectRom()
{
	bankMap.getSession().writeWord(RAM_CTRL, ROM_ENABLE);
}

std::vector<uint8_t> CapacityProber::readBlock(uint32_t address)
{
	std::vector<uint8_t> result(PROBE_BLOCK);
	bankMap.getSession().read(address, result);
	return result;
}

bool CapacityProber::ramAvailable()
{
	auto& session = bankMap.getSession();
	selectRam();

	uint16_t original = session.readWord(RAM_BASE);
	auto toggled = narrow_cast<uint16_t>(~original);
	session.writeWord(RAM_BASE, toggled);
	uint16_t readBack = session.readWord(RAM_BASE);
	session.writeWord(RAM_BASE, original);

	return (readBack & 0xFF) == (toggled & 0xFF);
}

uint32_t CapacityProber::ramSize()
{
	if (!ramAvailable()) return 0;

	auto& session = bankMap.getSession();
	uint16_t first = session.readWord(RAM_BASE);
	uint32_t size = 256;
	while (size < MAX_RAM_SPAN) {
		uint32_t address = RAM_BASE + size;
		uint16_t original = session.readWord(address);
		auto toggled = narrow_cast<uint16_t>(~original);
		session.writeWord(address, toggled);
		uint16_t readBack = session.readWord(address);
		uint16_t firstNow = session.readWord(RAM_BASE);
		session.writeWord(address, original);

		if ((readBack & 0xFF) != (toggled & 0xFF)) break; // no RAM here
		if ((firstNow & 0xFF) != (first & 0xFF)) break;   // wrapped onto the first cell
		size *= 2;
	}
	// one RAM byte per word
	return size / 2;
}

uint32_t CapacityProber::checkRomSize(uint32_t base, uint32_t maxLen)
{
	auto reference = readBlock(base);
	uint32_t len = FIRST_PROBE;
	while (len < maxLen) {
		if (readBlock(base + len) == reference) {
			return (len == FIRST_PROBE) ? 0 : len;
		}
		len *= 2;
	}
	return len;
}

void CapacityProber::mapUpperBanks(unsigned firstPage)
{
	for (auto i : xrange(4u)) {
		bankMap.mapPage(4 + i, firstPage + i);
	}
}

uint32_t CapacityProber::probeUpperHalf()
{
	constexpr uint32_t HALF = BankMap::SPACE_SIZE / 2; // console 2MB, banks 4-7

	// chip 4MB-6MB in banks 4-7
	mapUpperBanks(8);
	auto chipStart = readBlock(0);
	auto upperStart = readBlock(HALF);
	if (upperStart == chipStart) {
		// the chip decodes only 4MB, upper half is a mirror
		return BankMap::SPACE_SIZE;
	}

	auto upper = checkRomSize(HALF, HALF);
	if (upper == 0) return BankMap::SPACE_SIZE;
	if (upper < HALF) return BankMap::SPACE_SIZE + upper;

	// chip 6MB-8MB in banks 4-7, compare against chip 4MB
	mapUpperBanks(12);
	auto topStart = readBlock(HALF);
	return (topStart == upperStart) ? BankMap::SPACE_SIZE + HALF
	                                : BankMap::CHIP_SIZE;
}

uint32_t CapacityProber::romSize()
{
	bankMap.restoreDefaultLayout();

	// When the RAM window shows something else than the ROM behind it,
	// there is ROM above 2MB.
	bool extraRom = true;
	if (ramAvailable()) {
		selectRom();
		auto romView = readBlock(RAM_BASE);
		selectRam();
		auto ramView = readBlock(RAM_BASE);
		extraRom = romView != ramView;
	}
	selectRom();

	uint32_t maxLen = extraRom ? BankMap::SPACE_SIZE : BankMap::SPACE_SIZE / 2;
	uint32_t size = checkRomSize(0, maxLen);
	if (size == BankMap::SPACE_SIZE) {
		size = probeUpperHalf();
	}

	bankMap.restoreDefaultLayout();
	selectRom();
	return size;
}

std::vector<uint8_t> CapacityProber::readRom(uint32_t sizeHint, const ProgressCallback& progress)
{
	if (sizeHint > BankMap::CHIP_SIZE) {
		throw InvalidArgumentException("Read size 0x", hex_string<6>(sizeHint),
		                               " exceeds the flash chip");
	}
	auto& session = bankMap.getSession();
	selectRom();

	// the link transfers whole words
	std::vector<uint8_t> result((sizeHint + 1) & ~1u);
	auto total = narrow<uint32_t>(result.size());
	WindowCursor cursor(bankMap);
	uint32_t offset = 0;
	while (offset < total) {
		uint32_t remainingInWindow = BankMap::BANK_SIZE - (offset % BankMap::BANK_SIZE);
		uint32_t len = std::min({READ_BLOCK, remainingInWindow, total - offset});
		auto t = cursor.select(offset);
		session.read(t.address, std::span{result}.subspan(offset, len));
		offset += len;
		if (progress) progress(offset, total);
	}
	result.resize(sizeHint);

	auto last = std::find_if(result.rbegin(), result.rend(), [](uint8_t b) { return b != 0xFF; });
	result.erase(last.base(), result.end());
	return result;
}

CapacityReport CapacityProber::detect()
{
	CapacityReport report;
	report.ramSize = ramSize();
	report.ramPresent = report.ramSize != 0;
	report.romSize = romSize();
	return report;
}

} // namespace flashkit
