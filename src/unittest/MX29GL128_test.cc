#include "catch.hpp"
#include "MX29GL128.hh"
#include "BankMap.hh"
#include "DeviceSession.hh"
#include "FakeCartridge.hh"
#include "FlashException.hh"

#include <algorithm>
#include <vector>

using namespace flashkit;

static constexpr FlashTimeouts fastTimeouts{.erase = 5000, .write = 5000, .pollInterval = 10};

static std::vector<uint8_t> makeImage(size_t size)
{
	std::vector<uint8_t> result(size);
	for (size_t i = 0; i < size; ++i) result[i] = uint8_t(i * 13 + (i >> 9));
	return result;
}

namespace {
struct Fixture {
	LogCollector log;
	FakeCartridge cart;
	FakeClock clock{1};
	DeviceSession session{cart, log};
	BankMap bankMap{session};
	MX29GL128 flash{bankMap, clock, fastTimeouts};
};
}

TEST_CASE("MX29GL128: erase sector")
{
	Fixture f;
	std::vector<uint8_t> zeros(2 * MX29GL128::SECTOR_SIZE, 0x00);
	f.cart.fillChip(zeros, 0x80000);

	f.flash.eraseSector(5); // 0xA0000, second sector of window 1
	auto chip = f.cart.getChip();
	CHECK(chip[0x80000] == 0x00);
	CHECK(chip[0x9FFFF] == 0x00);
	CHECK(chip[0xA0000] == 0xFF);
	CHECK(chip[0xBFFFF] == 0xFF);
	CHECK(f.cart.getNumErased() == 1);
	CHECK(f.cart.getBankPage(1) == 1);

	CHECK_THROWS_AS(f.flash.eraseSector(64), InvalidArgumentException);
}

TEST_CASE("MX29GL128: erase all sectors reports progress")
{
	Fixture f;
	std::vector<std::pair<size_t, size_t>> reports;
	f.flash.eraseAllSectors([&](size_t done, size_t total) { reports.emplace_back(done, total); });
	CHECK(f.cart.getNumErased() == 64);
	REQUIRE(reports.size() == 64);
	CHECK(reports.front().first == MX29GL128::SECTOR_SIZE);
	CHECK(reports.back().first == 0x800000);
	CHECK(reports.back().second == 0x800000);
	// one cursor: bank 1 walks through pages 1..15 once each
	CHECK(f.cart.getNumBankWrites(1) == 15);
}

TEST_CASE("MX29GL128: buffered write")
{
	Fixture f;
	auto data = makeImage(64);
	f.flash.writeBuffer(data, 0x80040);
	auto chip = f.cart.getChip();
	for (size_t i = 0; i < data.size(); ++i) {
		CHECK(chip[0x80040 + i] == data[i]);
	}
	CHECK(chip[0x8003F] == 0xFF);
	CHECK(chip[0x80080] == 0xFF);
	CHECK(f.cart.getNumBufferPrograms() == 1);

	SECTION("partial buffer") {
		auto small = makeImage(6);
		f.flash.writeBuffer(small, 0x10);
		CHECK(f.cart.getChip()[0x10] == small[0]);
		CHECK(f.cart.getChip()[0x15] == small[5]);
	}
}

TEST_CASE("MX29GL128: erase, buffered write and read back")
{
	Fixture f;
	std::vector<uint8_t> zeros(MX29GL128::SECTOR_SIZE, 0x00);
	f.cart.fillChip(zeros, 0x80000);

	f.flash.eraseSector(4); // 0x80000, first sector of window 1
	auto data = makeImage(64);
	f.flash.writeBuffer(data, 0x80040);

	// bank 1 now shows page 1, so console and chip addresses coincide
	REQUIRE(f.cart.getBankPage(1) == 1);
	std::vector<uint8_t> readBack(0x100);
	f.session.read(0x80000, readBack);
	for (size_t i = 0; i < readBack.size(); ++i) {
		bool written = (0x40 <= i) && (i < 0x80);
		CHECK(readBack[i] == (written ? data[i - 0x40] : 0xFF));
	}
	CHECK(f.cart.getChip()[0xA0000] == 0x00); // next sector untouched
}

TEST_CASE("MX29GL128: malformed buffered writes are rejected up front")
{
	Fixture f;
	f.cart.clearLog();
	CHECK_THROWS_AS(f.flash.writeBuffer(makeImage(63), 0), InvalidArgumentException);
	CHECK_THROWS_AS(f.flash.writeBuffer(makeImage(65), 0), InvalidArgumentException);
	CHECK_THROWS_AS(f.flash.writeBuffer(makeImage(66), 0), InvalidArgumentException);
	CHECK_THROWS_AS(f.flash.writeBuffer({}, 0), InvalidArgumentException);
	CHECK_THROWS_AS(f.flash.writeBuffer(makeImage(4), 1), InvalidArgumentException);
	CHECK_THROWS_AS(f.flash.writeBuffer(makeImage(4), 62), InvalidArgumentException);
	CHECK(f.cart.getNumAccesses() == 0);
}

TEST_CASE("MX29GL128: word write")
{
	Fixture f;
	f.flash.writeWord(0x200, 0x1234);
	CHECK(f.cart.getChip()[0x200] == 0x12);
	CHECK(f.cart.getChip()[0x201] == 0x34);
	CHECK(f.cart.getNumWordPrograms() == 1);

	// programming only clears bits
	f.flash.writeWord(0x200, 0xFF00);
	CHECK(f.cart.getChip()[0x200] == 0x12);
	CHECK(f.cart.getChip()[0x201] == 0x00);

	CHECK_THROWS_AS(f.flash.writeWord(0x201, 0), InvalidArgumentException);
}

TEST_CASE("MX29GL128: timeouts")
{
	Fixture f;
	f.cart.setNeverReady(true);

	SECTION("erase") {
		try {
			f.flash.eraseSector(2);
			FAIL("expected a timeout");
		} catch (EraseTimeoutException& e) {
			CHECK(e.getAddress() == 0x40000);
		}
	}
	SECTION("buffer write") {
		try {
			f.flash.writeBuffer(makeImage(8), 0x100);
			FAIL("expected a timeout");
		} catch (BufferWriteTimeoutException& e) {
			CHECK(e.getAddress() == 0x106);
		}
	}
	SECTION("word write") {
		CHECK_THROWS_AS(f.flash.writeWord(0x300, 0x0000), WordWriteTimeoutException);
	}
	CHECK(f.clock.getNumSleeps() > 0);
}

TEST_CASE("MX29GL128: write and verify an image")
{
	Fixture f;
	auto image = makeImage(0x80000 + 0x1000 + 0x23); // ends with an odd tail
	std::vector<std::pair<size_t, size_t>> reports;
	f.flash.writeRom(image, [&](size_t done, size_t total) { reports.emplace_back(done, total); });

	auto chip = f.cart.getChip();
	CHECK(std::equal(image.begin(), image.end(), chip.begin()));
	CHECK(chip[image.size()] == 0xFF);
	CHECK(f.cart.getNumWordPrograms() == 18); // 0x23 byte tail
	REQUIRE(!reports.empty());
	CHECK(reports.back().first == image.size());
	CHECK(reports.back().second == image.size());
	size_t prev = 0;
	for (const auto& r : reports) {
		CHECK(r.first - prev <= 0x1000 + 64);
		prev = r.first;
	}

	f.flash.resetToRead();
	CHECK_NOTHROW(f.flash.verifyRom(image));

	SECTION("mismatch") {
		std::vector<uint8_t> bad = {uint8_t(~image[0x80123])};
		f.cart.fillChip(bad, 0x80123);
		try {
			f.flash.verifyRom(image);
			FAIL("expected a mismatch");
		} catch (VerifyMismatchException& e) {
			CHECK(e.getOffset() == 0x80123);
			CHECK(e.getExpected() == image[0x80123]);
			CHECK(e.getActual() == bad[0]);
		}
	}
}

TEST_CASE("MX29GL128: verify reports progress at least every 8kB")
{
	Fixture f;
	auto image = makeImage(0x80000 + 0x3001);
	f.cart.fillChip(image);
	std::vector<std::pair<size_t, size_t>> reports;
	f.flash.verifyRom(image, [&](size_t done, size_t total) { reports.emplace_back(done, total); });

	REQUIRE(!reports.empty());
	size_t prev = 0;
	for (const auto& r : reports) {
		CHECK(r.first > prev);
		CHECK(r.first - prev <= 0x2000);
		CHECK(r.second == image.size());
		prev = r.first;
	}
	CHECK(reports.back().first == image.size());
}

TEST_CASE("MX29GL128: image larger than the chip")
{
	Fixture f;
	std::vector<uint8_t> huge(0x800002, 0x00);
	f.cart.clearLog();
	CHECK_THROWS_AS(f.flash.writeRom(huge), InvalidArgumentException);
	CHECK_THROWS_AS(f.flash.verifyRom(huge), InvalidArgumentException);
	CHECK(f.cart.getNumAccesses() == 0);
}
