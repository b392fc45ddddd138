#include "catch.hpp"
#include "BankMap.hh"
#include "DeviceSession.hh"
#include "FakeCartridge.hh"
#include "FlashkitException.hh"

using namespace flashkit;

TEST_CASE("BankMap: translate")
{
	SECTION("first window goes through the fixed bank") {
		auto t = BankMap::translate(0x1234);
		CHECK(t.windowIndex == 0);
		CHECK(t.unlockBase == 0);
		CHECK(t.address == 0x1234);
		CHECK(!t.bank);
	}
	SECTION("other windows go through bank 1") {
		auto t = BankMap::translate(0x080000);
		CHECK(t.windowIndex == 1);
		CHECK(t.unlockBase == 0x80000);
		CHECK(t.address == 0x80000);
		REQUIRE(t.bank);
		CHECK(*t.bank == 1);

		auto t2 = BankMap::translate(0x7FFFFE);
		CHECK(t2.windowIndex == 15);
		CHECK(t2.address == 0xFFFFE);
		CHECK(*t2.bank == 1);
	}
	SECTION("out of range") {
		CHECK_THROWS_AS(BankMap::translate(0x800000), InvalidArgumentException);
	}
}

TEST_CASE("BankMap: register addresses")
{
	CHECK(BankMap::getRegisterAddress(1) == 0xA130F3);
	CHECK(BankMap::getRegisterAddress(7) == 0xA130FF);
}

TEST_CASE("BankMap: mapPage")
{
	LogCollector log;
	FakeCartridge cart;
	cart.setBankPage(3, 9);
	DeviceSession session(cart, log);
	BankMap bankMap(session);

	SECTION("cache is initialized from the hardware") {
		CHECK(bankMap.getPage(0) == 0);
		CHECK(bankMap.getPage(3) == 9);
	}
	SECTION("mapping updates hardware and cache") {
		bankMap.mapPage(2, 13);
		CHECK(cart.getBankPage(2) == 13);
		CHECK(bankMap.getPage(2) == 13);
		CHECK(cart.getWrites().back().address == 0xA130F5);
		CHECK(cart.getWrites().back().byte);
	}
	SECTION("invalid arguments don't touch the hardware") {
		cart.clearLog();
		CHECK_THROWS_AS(bankMap.mapPage(0, 1), InvalidArgumentException);
		CHECK_THROWS_AS(bankMap.mapPage(8, 1), InvalidArgumentException);
		CHECK_THROWS_AS(bankMap.mapPage(1, 16), InvalidArgumentException);
		CHECK_THROWS_AS(bankMap.getPage(8), InvalidArgumentException);
		CHECK(cart.getNumAccesses() == 0);
		CHECK(bankMap.getPage(1) == 0);
	}
	SECTION("default layout") {
		bankMap.restoreDefaultLayout();
		for (unsigned bank = 1; bank < 8; ++bank) {
			CHECK(cart.getBankPage(bank) == bank);
			CHECK(bankMap.getPage(bank) == bank);
		}
	}
}

TEST_CASE("BankMap: refresh failure resets the cache")
{
	LogCollector log;
	FakeCartridge cart;
	cart.setBankPage(5, 7);
	DeviceSession session(cart, log);
	BankMap bankMap(session);
	CHECK(bankMap.getPage(5) == 7);

	cart.setFailRegisterReads(true);
	bankMap.refreshFromHardware();
	CHECK(bankMap.getPage(5) == 0);
	CHECK(log.count(CliComm::LogLevel::WARNING) == 1);
}

TEST_CASE("WindowCursor: bank 1 only moves on a window change")
{
	LogCollector log;
	FakeCartridge cart;
	DeviceSession session(cart, log);
	BankMap bankMap(session);
	WindowCursor cursor(bankMap);

	cart.clearLog();
	cursor.select(0x100);             // fixed bank
	CHECK(cart.getNumBankWrites(1) == 0);
	cursor.select(0x80000);
	cursor.select(0x80002);
	cursor.select(0xFFFFE);
	CHECK(cart.getNumBankWrites(1) == 1);
	CHECK(cart.getBankPage(1) == 1);
	auto t = cursor.select(0x100000);
	CHECK(cart.getNumBankWrites(1) == 2);
	CHECK(cart.getBankPage(1) == 2);
	CHECK(t.address == 0x80000);
}
