#include "catch.hpp"
#include "Programmer.hh"
#include "CommandException.hh"
#include "FakeCartridge.hh"
#include "RomFile.hh"
#include "TclObject.hh"

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace flashkit;

namespace {
struct Fixture {
	Fixture() {
		// create the link now, so that the test can set up the cartridge
		(void)programmer.getLink();
	}

	[[nodiscard]] TclObject execute(const std::string& command) {
		return programmer.getInterpreter().execute(command);
	}

	LogCollector log;
	FakeClock clock{1};
	FakeCartridge* cart = nullptr;
	unsigned numLinks = 0;
	Programmer programmer{log, clock, [this](const std::string& /*port*/) {
		auto result = std::make_unique<FakeCartridge>();
		cart = result.get();
		++numLinks;
		return result;
	}};
};
}

static std::string tempFile(const char* name)
{
	return (std::filesystem::temp_directory_path() / name).string();
}

TEST_CASE("Programmer: flash_info")
{
	Fixture f;
	std::vector<uint8_t> rom(0x100000);
	for (size_t i = 0; i < rom.size(); ++i) rom[i] = uint8_t((i & 0xFF) ^ ((i >> 15) * 37));
	f.cart->setMirrorSize(0x100000);
	f.cart->fillChip(rom);
	f.cart->setRamSize(0x2000);

	auto result = f.execute("flash_info");
	auto& interp = f.programmer.getInterpreter();
	CHECK(result.getDictValue(interp, "rom_size").getInt(interp) == 0x100000);
	CHECK(result.getDictValue(interp, "ram_size").getInt(interp) == 0x2000);
	CHECK(result.getDictValue(interp, "ram_present").getString() == "1");
	CHECK(result.getDictValue(interp, "name").getString() == "Unknown");
	CHECK(f.log.contains("Connected to: fake"));
	CHECK(f.log.contains("ROM size: 1024kB"));
	CHECK(!f.cart->isConnected());
}

TEST_CASE("Programmer: flash_bank")
{
	Fixture f;
	CHECK(f.execute("flash_bank 2 11") == "11");
	CHECK(f.cart->getBankPage(2) == 11);
	CHECK(f.execute("flash_bank 2") == "11");
	CHECK(f.execute("flash_bank") == "0 0 11 0 0 0 0 0");

	CHECK_THROWS_AS(f.execute("flash_bank 0 1"), CommandException);
	CHECK_THROWS_AS(f.execute("flash_bank 1 16"), CommandException);
	CHECK_THROWS_AS(f.execute("flash_bank -1 2"), CommandException);
	CHECK_THROWS_AS(f.execute("flash_bank 1 2 3"), CommandException);
}

TEST_CASE("Programmer: flash_bank rejects bad arguments before connecting")
{
	Fixture f;
	f.cart->clearLog();
	CHECK_THROWS_AS(f.execute("flash_bank -1 2"), CommandException);
	CHECK_THROWS_AS(f.execute("flash_bank 3 -2"), CommandException);
	CHECK_THROWS_AS(f.execute("flash_bank 8"), CommandException);
	CHECK_THROWS_AS(f.execute("flash_bank 2 16"), CommandException);
	CHECK_THROWS_AS(f.execute("flash_bank 0 1"), CommandException);
	CHECK_THROWS_AS(f.execute("flash_bank x"), CommandException);
	CHECK(f.cart->getNumAccesses() == 0);
	CHECK(!f.log.contains("Connected to"));
}

TEST_CASE("Programmer: device not connected")
{
	Fixture f;
	f.cart->setFailConnect(true);
	CHECK_THROWS_AS(f.execute("flash_erase"), CommandException);
	CHECK(f.log.contains("Device not detected"));
	CHECK(f.cart->getNumErased() == 0);
}

TEST_CASE("Programmer: write and read back a ROM file")
{
	Fixture f;
	std::vector<uint8_t> image(0x1000);
	for (size_t i = 0; i < image.size(); ++i) image[i] = uint8_t(i ^ 0x5A);
	auto romName = tempFile("flashkit_test_write.bin");
	auto dumpName = tempFile("flashkit_test_dump.bin");
	RomFile::save(romName, image);

	auto crc = f.execute("flash_write_rom " + romName);
	CHECK(crc.getString().size() == 8);
	CHECK(f.log.contains("Write done"));
	CHECK(f.cart->getNumErased() == 64);

	auto result = f.execute("flash_read_rom " + dumpName + " 4k");
	CHECK(result == dumpName);
	CHECK(RomFile::load(dumpName) == image);

	std::filesystem::remove(romName);
	std::filesystem::remove(dumpName);

	CHECK_THROWS_AS(f.execute("flash_write_rom " + romName), CommandException);
	CHECK_THROWS_AS(f.execute("flash_read_rom " + dumpName + " lots"), CommandException);
}

TEST_CASE("Programmer: RAM files")
{
	Fixture f;
	f.cart->setRamSize(0x2000);
	auto ramName = tempFile("flashkit_test.srm");

	auto result = f.execute("flash_read_ram " + ramName);
	CHECK(result == ramName);
	auto dump = RomFile::load(ramName);
	REQUIRE(dump.size() == 0x4000);
	CHECK(dump[1] == f.cart->getRam()[0]);

	for (size_t i = 1; i < dump.size(); i += 2) dump[i] = uint8_t(i);
	RomFile::save(ramName, dump);
	CHECK(f.execute("flash_write_ram " + ramName).getString().size() == 8);
	CHECK(f.cart->getRam()[5] == uint8_t(11));

	std::filesystem::remove(ramName);
}

TEST_CASE("Programmer: scripts")
{
	Fixture f;
	auto& interp = f.programmer.getInterpreter();
	CHECK(interp.execute("info commands flash_info") == "flash_info");
	CHECK(interp.execute("info commands flash_format") == "");

	auto script = tempFile("flashkit_test.tcl");
	{
		std::ofstream out(script);
		out << "flash_bank 4 12\n"
		       "flash_bank 5 13\n"
		       "flash_bank\n";
	}
	CHECK(interp.execute("source " + script) == "0 0 0 0 12 13 0 0");
	std::filesystem::remove(script);
	CHECK_THROWS_AS(interp.execute("source " + script), CommandException);
}

TEST_CASE("Programmer: help")
{
	Fixture f;
	auto text = std::string(f.execute("help").getString());
	CHECK(text.find("flash_write_rom") != std::string::npos);
	CHECK(text.find("flash_bank") != std::string::npos);
}

TEST_CASE("Programmer: changing the port creates a new link")
{
	Fixture f;
	CHECK(f.numLinks == 1);
	(void)f.programmer.getLink();
	CHECK(f.numLinks == 1);
	f.programmer.getSettingsConfig().setValueForSetting("port", "/dev/ttyACM3");
	(void)f.programmer.getLink();
	CHECK(f.numLinks == 2);
}

TEST_CASE("Programmer: run")
{
	Fixture f;
	std::vector<std::vector<TclObject>> actions;
	actions.push_back({TclObject("flash_bank"), TclObject("3"), TclObject("7")});
	CHECK(f.programmer.run(actions) == 0);
	CHECK(f.cart->getBankPage(3) == 7);
	CHECK(f.log.contains("7"));

	actions.push_back({TclObject("no_such_command")});
	actions.push_back({TclObject("flash_bank"), TclObject("3"), TclObject("8")});
	CHECK(f.programmer.run(actions) == 1);
	CHECK(f.log.count(CliComm::LogLevel::LOGLEVEL_ERROR) == 1);
	CHECK(f.cart->getBankPage(3) == 7); // stops at the first error
}
