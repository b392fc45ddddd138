#include "Cartridge.hh"
#include "CliComm.hh"
#include "DeviceSession.hh"
#include "FlashException.hh"

#include "narrow.hh"

#include <algorithm>

namespace flashkit {

Cartridge::Cartridge(DeviceSession& session_, PollClock& clock, const FlashTimeouts& timeouts)
	: session(session_)
	, bankMap(session)
	, flash(bankMap, clock, timeouts)
	, prober(bankMap)
{
}

CapacityReport Cartridge::detectCapacity()
{
	return prober.detect();
}

void Cartridge::eraseAll()
{
	auto& cliComm = session.getCliComm();
	cliComm.printInfo("Erasing flash...");
	prober.selectRom();
	flash.eraseAllSectors([&](size_t done, size_t total) {
		cliComm.printProgress("Erasing", float(done) / float(total));
	});
	flash.resetToRead();
	bankMap.restoreDefaultLayout();
	cliComm.printInfo("Erase done");
}

void Cartridge::writeRom(std::span<const uint8_t> image, const ProgressCallback& progress)
{
	if (image.empty()) {
		throw InvalidArgumentException("Empty ROM image");
	}
	if (image.size() > BankMap::CHIP_SIZE) {
		throw InvalidArgumentException("ROM image of ", image.size(),
		                               " bytes doesn't fit in the flash chip");
	}
	auto paddedSize = (image.size() + BankMap::BANK_SIZE - 1) & ~size_t(BankMap::BANK_SIZE - 1);
	std::vector<uint8_t> padded(paddedSize, 0xFF);
	std::ranges::copy(image, padded.begin());

	eraseAll();

	auto& cliComm = session.getCliComm();
	cliComm.printInfo("Writing ", paddedSize / 1024, "kB...");
	flash.writeRom(padded, [&](size_t done, size_t total) {
		cliComm.printProgress("Writing", float(done) / float(total));
		if (progress) progress(done, total);
	});
	flash.resetToRead();

	cliComm.printInfo("Verifying...");
	flash.verifyRom(padded, [&](size_t done, size_t total) {
		cliComm.printProgress("Verifying", float(done) / float(total));
		if (progress) progress(done, total);
	});
	bankMap.restoreDefaultLayout();
	cliComm.printInfo("Write done");
}

size_t Cartridge::readRom(uint32_t sizeHint, const DumpSink& sink, const ProgressCallback& progress)
{
	auto& cliComm = session.getCliComm();
	if (sizeHint == 0) {
		sizeHint = prober.romSize();
		cliComm.printInfo("ROM size: ", sizeHint / 1024, "kB");
	}
	auto dump = prober.readRom(sizeHint, [&](size_t done, size_t total) {
		cliComm.printProgress("Reading", float(done) / float(total));
		if (progress) progress(done, total);
	});
	bankMap.restoreDefaultLayout();
	sink(dump);
	return dump.size();
}

std::vector<uint8_t> Cartridge::readRam()
{
	auto size = prober.ramSize();
	if (size == 0) {
		prober.selectRom();
		throw RamUnavailableException();
	}
	// one RAM byte on the low lane of every word
	std::vector<uint8_t> result(2 * size);
	prober.selectRam();
	session.read(CapacityProber::RAM_BASE, result);
	prober.selectRom();
	return result;
}

void Cartridge::writeRam(std::span<const uint8_t> data)
{
	auto size = prober.ramSize();
	if (size == 0) {
		prober.selectRom();
		throw RamUnavailableException();
	}
	auto copyLen = std::min<size_t>(data.size(), 2 * size) & ~size_t(1);
	auto toWrite = data.first(copyLen);

	prober.selectRam();
	session.write(CapacityProber::RAM_BASE, toWrite);

	std::vector<uint8_t> readBack(copyLen);
	session.read(CapacityProber::RAM_BASE, readBack);
	prober.selectRom();

	for (size_t i = 1; i < copyLen; i += 2) {
		if (readBack[i] != toWrite[i]) {
			throw VerifyMismatchException(narrow<uint32_t>(i), toWrite[i], readBack[i]);
		}
	}
}

RomHeader Cartridge::readHeader()
{
	std::vector<uint8_t> header(RomHeader::SIZE);
	prober.selectRom();
	session.read(0, header);
	return RomHeader::parse(header);
}

} // namespace flashkit
