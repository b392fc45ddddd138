#include "catch.hpp"
#include "Cartridge.hh"
#include "DeviceSession.hh"
#include "FakeCartridge.hh"
#include "FlashException.hh"

#include <algorithm>
#include <cstring>
#include <vector>

using namespace flashkit;

static constexpr FlashTimeouts fastTimeouts{.erase = 5000, .write = 5000, .pollInterval = 10};

namespace {
struct Fixture {
	LogCollector log;
	FakeCartridge cart;
	FakeClock clock{1};
	DeviceSession session{cart, log};
	Cartridge cartridge{session, clock, fastTimeouts};
};
}

TEST_CASE("Cartridge: writeRom")
{
	Fixture f;
	std::vector<uint8_t> old(0x1000, 0x00);
	f.cart.fillChip(old, 0x600000);

	std::vector<uint8_t> image(1000);
	for (size_t i = 0; i < image.size(); ++i) image[i] = uint8_t(i * 3);
	f.cartridge.writeRom(image);

	auto chip = f.cart.getChip();
	CHECK(std::equal(image.begin(), image.end(), chip.begin()));
	CHECK(std::all_of(chip.begin() + image.size(), chip.begin() + 0x80000,
	                  [](uint8_t b) { return b == 0xFF; }));
	CHECK(chip[0x600000] == 0xFF); // whole chip was erased
	CHECK(f.cart.getNumErased() == 64);
	CHECK(f.cart.getNumBufferPrograms() == 0x80000 / 64); // padded to 512kB
	CHECK(f.log.contains("Write done"));
	CHECK(f.log.count(CliComm::LogLevel::PROGRESS) > 0);
	for (unsigned bank = 1; bank < 8; ++bank) {
		CHECK(f.cart.getBankPage(bank) == bank);
	}
}

TEST_CASE("Cartridge: writeRom rejects bad images")
{
	Fixture f;
	f.cart.clearLog();
	CHECK_THROWS_AS(f.cartridge.writeRom({}), InvalidArgumentException);
	std::vector<uint8_t> huge(0x800001, 0);
	CHECK_THROWS_AS(f.cartridge.writeRom(huge), InvalidArgumentException);
	CHECK(f.cart.getNumAccesses() == 0);
}

TEST_CASE("Cartridge: readRom")
{
	Fixture f;
	std::vector<uint8_t> rom(0x100000);
	for (size_t i = 0; i < rom.size(); ++i) {
		rom[i] = uint8_t((i & 0xFF) ^ ((i >> 15) * 37));
	}
	f.cart.setMirrorSize(0x100000);
	f.cart.fillChip(rom);

	SECTION("detected size") {
		std::vector<uint8_t> dump;
		auto n = f.cartridge.readRom(0, [&](std::span<const uint8_t> d) {
			dump.assign(d.begin(), d.end());
		});
		CHECK(n == rom.size());
		CHECK(dump == rom);
		CHECK(f.log.contains("ROM size: 1024kB"));
	}
	SECTION("explicit size") {
		size_t got = 0;
		auto n = f.cartridge.readRom(0x1FFE, [&](std::span<const uint8_t> d) { got = d.size(); });
		CHECK(n == 0x1FFE);
		CHECK(got == 0x1FFE);
	}
}

TEST_CASE("Cartridge: RAM")
{
	Fixture f;

	SECTION("no RAM") {
		CHECK_THROWS_AS(f.cartridge.readRam(), RamUnavailableException);
		std::vector<uint8_t> data(16);
		CHECK_THROWS_AS(f.cartridge.writeRam(data), RamUnavailableException);
		CHECK(!f.cart.isRamEnabled());
	}
	SECTION("read") {
		f.cart.setRamSize(0x2000);
		auto dump = f.cartridge.readRam();
		REQUIRE(dump.size() == 0x4000);
		auto ram = f.cart.getRam();
		for (size_t i = 0; i < ram.size(); ++i) {
			CHECK(dump[2 * i + 0] == 0xFF);
			CHECK(dump[2 * i + 1] == ram[i]);
		}
		CHECK(!f.cart.isRamEnabled());
	}
	SECTION("write, truncated to the RAM size") {
		f.cart.setRamSize(0x2000);
		std::vector<uint8_t> data(0x4000 + 10);
		for (size_t i = 0; i < data.size(); ++i) data[i] = uint8_t(i / 2 + 1);
		f.cartridge.writeRam(data);
		auto ram = f.cart.getRam();
		for (size_t i = 0; i < ram.size(); ++i) {
			CHECK(ram[i] == data[2 * i + 1]);
		}
		CHECK(!f.cart.isRamEnabled());
	}
	SECTION("write, verify mismatch") {
		f.cart.setRamSize(0x2000);
		f.cart.setRamWriteFault(5); // low byte of the 6th word
		std::vector<uint8_t> data(0x100);
		for (size_t i = 0; i < data.size(); ++i) data[i] = uint8_t(i * 3);
		try {
			f.cartridge.writeRam(data);
			FAIL("expected a verify mismatch");
		} catch (VerifyMismatchException& e) {
			CHECK(e.getOffset() == 11);
			CHECK(e.getExpected() == data[11]);
			CHECK(e.getActual() == uint8_t(~data[11]));
		}
		CHECK(!f.cart.isRamEnabled());
	}
}

TEST_CASE("Cartridge: readHeader")
{
	Fixture f;
	std::vector<uint8_t> header(0x200, ' ');
	const char* name = "SONIC THE HEDGEHOG";
	std::memcpy(&header[0x120], name, strlen(name));
	header[0x1F0] = 'J';
	header[0x1F1] = 'U';
	header[0x1F2] = 'E';
	f.cart.fillChip(header);

	auto h = f.cartridge.readHeader();
	CHECK(h.getName() == "SONIC THE HEDGEHOG");
	CHECK(h.displayName() == "SONIC THE HEDGEHOG (W)");
}
