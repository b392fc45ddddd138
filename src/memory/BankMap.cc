#include "BankMap.hh"
#include "DeviceSession.hh"
#include "LinkException.hh"
#include "CliComm.hh"

#include "narrow.hh"
#include "xrange.hh"

#include <array>

namespace flashkit {

BankMap::BankMap(DeviceSession& session_)
	: session(session_)
{
	refreshFromHardware();
}

void BankMap::mapPage(unsigned bank, unsigned page)
{
	if (bank == 0) {
		throw InvalidArgumentException("Bank 0 is fixed to page 0");
	}
	if (bank >= NUM_BANKS) {
		throw InvalidArgumentException("Invalid bank: ", bank);
	}
	if (page >= NUM_PAGES) {
		throw InvalidArgumentException("Invalid page: ", page);
	}
	session.writeByte(getRegisterAddress(bank), narrow<uint8_t>(page));
	pages[bank] = narrow<uint8_t>(page);
}

unsigned BankMap::getPage(unsigned bank) const
{
	if (bank >= NUM_BANKS) {
		throw InvalidArgumentException("Invalid bank: ", bank);
	}
	return pages[bank];
}

BankMap::Translation BankMap::translate(uint32_t logicalOffset)
{
	if (logicalOffset >= CHIP_SIZE) {
		throw InvalidArgumentException(
			"Offset 0x", hex_string<6>(logicalOffset), " is outside the flash chip");
	}
	auto windowIndex = logicalOffset / BANK_SIZE;
	auto inWindow    = logicalOffset % BANK_SIZE;
	if (windowIndex == 0) {
		return {0, 0, inWindow, std::nullopt};
	}
	return {windowIndex, BANK_SIZE, BANK_SIZE + inWindow, 1u};
}

void BankMap::refreshFromHardware()
{
	std::array<uint8_t, NUM_BANKS> fresh = {};
	try {
		for (auto bank : xrange(1u, NUM_BANKS)) {
			// registers sit at odd addresses, the low byte of the word
			auto word = session.readWord(getRegisterAddress(bank) & ~1u);
			fresh[bank] = narrow_cast<uint8_t>(word & (NUM_PAGES - 1));
		}
	} catch (FlashkitException& e) {
		session.getCliComm().printWarning(
			"Could not read bank registers: ", e.getMessage());
		fresh = {};
	}
	pages = fresh;
}

void BankMap::restoreDefaultLayout()
{
	for (auto bank : xrange(1u, NUM_BANKS)) {
		mapPage(bank, bank);
	}
}

BankMap::Translation WindowCursor::select(uint32_t logicalOffset)
{
	auto t = BankMap::translate(logicalOffset);
	if (t.bank && (current != t.windowIndex)) {
		bankMap.mapPage(*t.bank, t.windowIndex);
		current = t.windowIndex;
	}
	return t;
}

} // namespace flashkit
