#include "FlashCommands.hh"
#include "Cartridge.hh"
#include "CliComm.hh"
#include "CommandException.hh"
#include "DeviceSession.hh"
#include "Interpreter.hh"
#include "LinkException.hh"
#include "Programmer.hh"
#include "RomFile.hh"
#include "TclObject.hh"

#include "StringOp.hh"
#include "strCat.hh"

#include <optional>

namespace flashkit {

FlashCommands::FlashCommands(Interpreter& interpreter, Programmer& programmer_)
	: programmer(programmer_)
	, infoCmd    (interpreter, *this)
	, eraseCmd   (interpreter, *this)
	, writeRomCmd(interpreter, *this)
	, readRomCmd (interpreter, *this)
	, readRamCmd (interpreter, *this)
	, writeRamCmd(interpreter, *this)
	, bankCmd    (interpreter, *this)
	, helpCmd    (interpreter, *this)
{
}

void FlashCommands::withCartridge(const std::function<void(Cartridge&)>& action)
{
	auto& settings = programmer.getSettingsConfig();
	DeviceSession session(programmer.getLink(), programmer.getCliComm(),
	                      settings.getDelay());
	if (!session.isConnected()) {
		throw NotConnectedException();
	}
	programmer.getCliComm().printInfo("Connected to: ", session.getPortName());
	Cartridge cartridge(session, programmer.getClock(), settings.getTimeouts());
	action(cartridge);
}

[[nodiscard]] static std::string formatCrc(uint32_t crc)
{
	return strCat(hex_string<8>(crc));
}

[[nodiscard]] static std::string formatSize(uint32_t bytes)
{
	if ((bytes >= 1024) && ((bytes % 1024) == 0)) {
		return strCat(bytes / 1024, "kB");
	}
	return strCat(bytes, " bytes");
}

[[nodiscard]] static uint32_t parseSize(const TclObject& obj)
{
	auto size = StringOp::stringToSize(obj.getString());
	if (!size) {
		throw CommandException("Invalid size: ", obj.getString());
	}
	return *size;
}


// flash_info

FlashCommands::InfoCmd::InfoCmd(Interpreter& interpreter, FlashCommands& parent_)
	: Command(interpreter, "flash_info"), parent(parent_)
{
}

void FlashCommands::InfoCmd::execute(std::span<const TclObject> tokens, TclObject& result)
{
	checkNumArgs(tokens, 1, "");
	parent.withCartridge([&](Cartridge& cartridge) {
		auto report = cartridge.detectCapacity();
		auto header = cartridge.readHeader();
		auto& cliComm = parent.programmer.getCliComm();
		cliComm.printInfo("ROM name: ", header.displayName());
		cliComm.printInfo("ROM size: ", formatSize(report.romSize));
		if (report.ramPresent) {
			cliComm.printInfo("RAM size: ", formatSize(report.ramSize));
		} else {
			cliComm.printInfo("RAM not detected");
		}
		result = makeTclDict(
			"name",        header.getName(),
			"region",      std::string(1, header.getRegion()),
			"rom_size",    report.romSize,
			"ram_present", report.ramPresent,
			"ram_size",    report.ramSize);
	});
}

std::string FlashCommands::InfoCmd::help() const
{
	return "flash_info                 show name, ROM size and RAM size of the cartridge";
}


// flash_erase

FlashCommands::EraseCmd::EraseCmd(Interpreter& interpreter, FlashCommands& parent_)
	: Command(interpreter, "flash_erase"), parent(parent_)
{
}

void FlashCommands::EraseCmd::execute(std::span<const TclObject> tokens, TclObject& /*result*/)
{
	checkNumArgs(tokens, 1, "");
	parent.withCartridge([](Cartridge& cartridge) {
		cartridge.eraseAll();
	});
}

std::string FlashCommands::EraseCmd::help() const
{
	return "flash_erase                erase the whole flash chip";
}


// flash_write_rom

FlashCommands::WriteRomCmd::WriteRomCmd(Interpreter& interpreter, FlashCommands& parent_)
	: Command(interpreter, "flash_write_rom"), parent(parent_)
{
}

void FlashCommands::WriteRomCmd::execute(std::span<const TclObject> tokens, TclObject& result)
{
	checkNumArgs(tokens, 2, "filename");
	auto filename = std::string(tokens[1].getString());
	auto image = RomFile::load(filename);
	auto& cliComm = parent.programmer.getCliComm();
	cliComm.printInfo("ROM file: ", filename, " (", formatSize(uint32_t(image.size())), ')');

	parent.withCartridge([&](Cartridge& cartridge) {
		cartridge.writeRom(image);
	});
	auto crc = formatCrc(RomFile::crc32(image));
	cliComm.printInfo("CRC32: ", crc);
	result = crc;
}

std::string FlashCommands::WriteRomCmd::help() const
{
	return "flash_write_rom <file>     erase, program and verify a ROM image";
}


// flash_read_rom

FlashCommands::ReadRomCmd::ReadRomCmd(Interpreter& interpreter, FlashCommands& parent_)
	: Command(interpreter, "flash_read_rom"), parent(parent_)
{
}

void FlashCommands::ReadRomCmd::execute(std::span<const TclObject> tokens, TclObject& result)
{
	checkNumArgs(tokens, Between{1, 3}, "?filename? ?size?");
	std::string filename = (tokens.size() > 1) ? std::string(tokens[1].getString()) : std::string{};
	uint32_t size = (tokens.size() > 2) ? parseSize(tokens[2]) : 0;

	auto& cliComm = parent.programmer.getCliComm();
	parent.withCartridge([&](Cartridge& cartridge) {
		if (filename.empty()) {
			filename = cartridge.readHeader().displayName() + ".bin";
		}
		cartridge.readRom(size, [&](std::span<const uint8_t> dump) {
			RomFile::save(filename, dump);
			cliComm.printInfo("Dumped ", formatSize(uint32_t(dump.size())),
			                  " to ", filename, ", CRC32: ", formatCrc(RomFile::crc32(dump)));
		});
	});
	result = filename;
}

std::string FlashCommands::ReadRomCmd::help() const
{
	return "flash_read_rom ?file? ?size? dump the ROM (size is detected when omitted)";
}


// flash_read_ram

FlashCommands::ReadRamCmd::ReadRamCmd(Interpreter& interpreter, FlashCommands& parent_)
	: Command(interpreter, "flash_read_ram"), parent(parent_)
{
}

void FlashCommands::ReadRamCmd::execute(std::span<const TclObject> tokens, TclObject& result)
{
	checkNumArgs(tokens, Between{1, 2}, "?filename?");
	std::string filename = (tokens.size() > 1) ? std::string(tokens[1].getString()) : std::string{};

	auto& cliComm = parent.programmer.getCliComm();
	parent.withCartridge([&](Cartridge& cartridge) {
		if (filename.empty()) {
			filename = cartridge.readHeader().displayName() + ".srm";
		}
		auto ram = cartridge.readRam();
		RomFile::save(filename, ram);
		cliComm.printInfo("Dumped ", formatSize(uint32_t(ram.size())),
		                  " to ", filename, ", CRC32: ", formatCrc(RomFile::crc32(ram)));
	});
	result = filename;
}

std::string FlashCommands::ReadRamCmd::help() const
{
	return "flash_read_ram ?file?      dump the battery backed RAM";
}


// flash_write_ram

FlashCommands::WriteRamCmd::WriteRamCmd(Interpreter& interpreter, FlashCommands& parent_)
	: Command(interpreter, "flash_write_ram"), parent(parent_)
{
}

void FlashCommands::WriteRamCmd::execute(std::span<const TclObject> tokens, TclObject& result)
{
	checkNumArgs(tokens, 2, "filename");
	auto filename = std::string(tokens[1].getString());
	auto data = RomFile::load(filename);

	parent.withCartridge([&](Cartridge& cartridge) {
		cartridge.writeRam(data);
	});
	auto crc = formatCrc(RomFile::crc32(data));
	parent.programmer.getCliComm().printInfo("RAM written, CRC32: ", crc);
	result = crc;
}

std::string FlashCommands::WriteRamCmd::help() const
{
	return "flash_write_ram <file>     write and verify the battery backed RAM";
}


// flash_bank

FlashCommands::BankCmd::BankCmd(Interpreter& interpreter, FlashCommands& parent_)
	: Command(interpreter, "flash_bank"), parent(parent_)
{
}

static unsigned parseBankArg(Interpreter& interp, const TclObject& token,
                             unsigned limit, const char* what)
{
	int value = token.getInt(interp);
	if ((value < 0) || (unsigned(value) >= limit)) {
		throw CommandException("Invalid ", what, ": ", value,
		                       " (must be 0-", limit - 1, ')');
	}
	return unsigned(value);
}

void FlashCommands::BankCmd::execute(std::span<const TclObject> tokens, TclObject& result)
{
	checkNumArgs(tokens, Between{1, 3}, "?bank? ?page?");
	// validate before touching the hardware
	auto& interp = getInterpreter();
	std::optional<unsigned> bank, page;
	if (tokens.size() >= 2) {
		bank = parseBankArg(interp, tokens[1], BankMap::NUM_BANKS, "bank");
	}
	if (tokens.size() == 3) {
		page = parseBankArg(interp, tokens[2], BankMap::NUM_PAGES, "page");
		if (*bank == 0) {
			throw CommandException("Bank 0 is fixed to page 0");
		}
	}
	parent.withCartridge([&](Cartridge& cartridge) {
		auto& bankMap = cartridge.getBankMap();
		if (page) {
			bankMap.mapPage(*bank, *page);
			result = bankMap.getPage(*bank);
		} else if (bank) {
			result = bankMap.getPage(*bank);
		} else {
			std::string pages;
			for (unsigned b = 0; b < BankMap::NUM_BANKS; ++b) {
				if (b) pages += ' ';
				strAppend(pages, bankMap.getPage(b));
			}
			result = pages;
		}
	});
}

std::string FlashCommands::BankCmd::help() const
{
	return "flash_bank ?bank? ?page?   show or change the bank to page mapping";
}


// help

FlashCommands::HelpCmd::HelpCmd(Interpreter& interpreter, FlashCommands& parent_)
	: Command(interpreter, "help"), parent(parent_)
{
}

void FlashCommands::HelpCmd::execute(std::span<const TclObject> tokens, TclObject& result)
{
	checkNumArgs(tokens, 1, "");
	std::string text;
	for (const Command* cmd : {static_cast<const Command*>(&parent.infoCmd),
	                           static_cast<const Command*>(&parent.eraseCmd),
	                           static_cast<const Command*>(&parent.writeRomCmd),
	                           static_cast<const Command*>(&parent.readRomCmd),
	                           static_cast<const Command*>(&parent.readRamCmd),
	                           static_cast<const Command*>(&parent.writeRamCmd),
	                           static_cast<const Command*>(&parent.bankCmd)}) {
		strAppend(text, cmd->help(), '\n');
	}
	result = text;
}

std::string FlashCommands::HelpCmd::help() const
{
	return "help                       show this text";
}

} // namespace flashkit
