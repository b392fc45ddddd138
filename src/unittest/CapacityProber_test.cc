#include "catch.hpp"
#include "CapacityProber.hh"
#include "BankMap.hh"
#include "DeviceSession.hh"
#include "FakeCartridge.hh"
#include "FlashkitException.hh"

#include <algorithm>
#include <vector>

using namespace flashkit;

// Every 32kB block differs from every other block of the first 8MB.
static std::vector<uint8_t> makeRom(size_t size)
{
	std::vector<uint8_t> result(size);
	for (size_t i = 0; i < size; ++i) {
		result[i] = uint8_t((i & 0xFF) ^ ((i >> 15) * 37));
	}
	return result;
}

namespace {
struct Fixture {
	LogCollector log;
	FakeCartridge cart;
	DeviceSession session{cart, log};
	BankMap bankMap{session};
	CapacityProber prober{bankMap};
};
}

TEST_CASE("CapacityProber: ROM size by mirroring")
{
	Fixture f;

	SECTION("blank chip") {
		CHECK(f.prober.checkRomSize(0, 0x400000) == 0);
		CHECK(f.prober.romSize() == 0);
	}
	SECTION("1MB") {
		f.cart.setMirrorSize(0x100000);
		f.cart.fillChip(makeRom(0x100000));
		CHECK(f.prober.romSize() == 0x100000);
	}
	SECTION("2MB") {
		f.cart.setMirrorSize(0x200000);
		f.cart.fillChip(makeRom(0x200000));
		CHECK(f.prober.romSize() == 0x200000);
	}
	SECTION("4MB") {
		f.cart.setMirrorSize(0x400000);
		f.cart.fillChip(makeRom(0x400000));
		CHECK(f.prober.romSize() == 0x400000);
	}
	SECTION("5MB") {
		auto rom = makeRom(0x800000);
		// 4MB-5MB programmed, 5MB-6MB repeats it
		std::copy_n(rom.begin() + 0x400000, 0x100000, rom.begin() + 0x500000);
		f.cart.fillChip(rom);
		CHECK(f.prober.romSize() == 0x500000);
	}
	SECTION("6MB") {
		auto rom = makeRom(0x800000);
		std::copy_n(rom.begin() + 0x400000, 0x200000, rom.begin() + 0x600000);
		f.cart.fillChip(rom);
		CHECK(f.prober.romSize() == 0x600000);
	}
	SECTION("8MB") {
		f.cart.fillChip(makeRom(0x800000));
		CHECK(f.prober.romSize() == 0x800000);
	}

	// always leaves the default layout with ROM selected
	for (unsigned bank = 1; bank < 8; ++bank) {
		CHECK(f.cart.getBankPage(bank) == bank);
	}
	CHECK(!f.cart.isRamEnabled());
}

TEST_CASE("CapacityProber: ROM size with RAM present")
{
	Fixture f;
	f.cart.setRamSize(0x2000);
	f.cart.setMirrorSize(0x200000);
	f.cart.fillChip(makeRom(0x200000));
	CHECK(f.prober.romSize() == 0x200000);
	CHECK(!f.cart.isRamEnabled());
}

TEST_CASE("CapacityProber: RAM size")
{
	Fixture f;

	SECTION("no RAM") {
		CHECK(!f.prober.ramAvailable());
		CHECK(f.prober.ramSize() == 0);
	}
	SECTION("8kB") {
		f.cart.setRamSize(0x2000);
		std::vector<uint8_t> before(f.cart.getRam().begin(), f.cart.getRam().end());
		CHECK(f.prober.ramAvailable());
		CHECK(f.prober.ramSize() == 0x2000);
		// probing restores every cell it touched
		CHECK(std::ranges::equal(f.cart.getRam(), before));
	}
	SECTION("32kB") {
		f.cart.setRamSize(0x8000);
		CHECK(f.prober.ramSize() == 0x8000);
	}
}

TEST_CASE("CapacityProber: readRom")
{
	Fixture f;

	SECTION("trailing 0xFF is trimmed") {
		std::vector<uint8_t> data;
		for (uint8_t c = 0x30; c < 0x40; ++c) data.push_back(c);
		f.cart.fillChip(data);
		auto dump = f.prober.readRom(uint32_t(data.size() + 10000));
		CHECK(dump == data);
	}
	SECTION("odd size") {
		std::vector<uint8_t> data(0x20, 0x42);
		f.cart.fillChip(data);
		auto dump = f.prober.readRom(0x11);
		CHECK(dump.size() == 0x11);
	}
	SECTION("across windows") {
		auto rom = makeRom(0x180000);
		f.cart.fillChip(rom);
		size_t lastDone = 0;
		auto dump = f.prober.readRom(0x180000, [&](size_t done, size_t total) {
			CHECK(total == 0x180000);
			CHECK(done > lastDone);
			lastDone = done;
		});
		CHECK(dump == rom);
		CHECK(lastDone == 0x180000);
	}
	SECTION("beyond the chip") {
		CHECK_THROWS_AS(f.prober.readRom(0x800001), InvalidArgumentException);
	}
}

TEST_CASE("CapacityProber: detect")
{
	Fixture f;
	f.cart.setRamSize(0x2000);
	f.cart.setMirrorSize(0x100000);
	f.cart.fillChip(makeRom(0x100000));

	auto report = f.prober.detect();
	CHECK(report.romSize == 0x100000);
	CHECK(report.ramPresent);
	CHECK(report.ramSize == 0x2000);
}
