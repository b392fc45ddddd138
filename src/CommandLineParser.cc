#include "CommandLineParser.hh"

#include "ConfigException.hh"
#include "FileException.hh"
#include "FileOperations.hh"
#include "FlashkitException.hh"
#include "Programmer.hh"
#include "SettingsConfig.hh"
#include "Version.hh"

#include "StringOp.hh"
#include "strCat.hh"

#include <algorithm>
#include <iostream>
#include <map>
#include <utility>

namespace flashkit {

CommandLineParser::CommandLineParser(Programmer& programmer_)
	: programmer(programmer_)
	, helpOption(*this)
	, versionOption(*this)
	, settingOption(*this)
	, portOption (*this, "port",  "Serial port of the programmer, or 'auto'")
	, delayOption(*this, "delay", "Delay in ms between bus cycles")
	, infoOption    (*this, "flash_info",      0, "Show cartridge name, ROM and RAM size")
	, eraseOption   (*this, "flash_erase",     0, "Erase the whole flash chip")
	, writeRomOption(*this, "flash_write_rom", 1, "Erase, program and verify a ROM image")
	, readRomOption (*this, "flash_read_rom",  1, "Dump the ROM to a file (see also -size)")
	, readRamOption (*this, "flash_read_ram",  1, "Dump the battery backed RAM to a file")
	, writeRamOption(*this, "flash_write_ram", 1, "Write a file to the battery backed RAM")
	, scriptOption  (*this, "source",          1, "Run a Tcl script")
	, commandOption (*this, "eval",            1, "Run a Tcl command (see also -script)")
	, sizeOption(*this)
{
	using enum Phase;
	registerOption("-h",          helpOption,    BEFORE_SETTINGS, 1);
	registerOption("--help",      helpOption,    BEFORE_SETTINGS, 1);
	registerOption("-v",          versionOption, BEFORE_SETTINGS, 1);
	registerOption("--version",   versionOption, BEFORE_SETTINGS, 1);
	registerOption("-setting",    settingOption, BEFORE_SETTINGS);

	registerOption("-port",       portOption);
	registerOption("-delay",      delayOption);
	registerOption("-info",       infoOption, LAST, 1);
	registerOption("-erase",      eraseOption, LAST, 1);
	registerOption("-write-rom",  writeRomOption);
	registerOption("-read-rom",   readRomOption);
	registerOption("-size",       sizeOption);
	registerOption("-read-ram",   readRamOption);
	registerOption("-write-ram",  writeRamOption);
	registerOption("-script",     scriptOption);
	registerOption("-command",    commandOption);

	// At this point all options must be registered
	std::ranges::sort(options, {}, &OptionData::name);
}

void CommandLineParser::registerOption(
	std::string_view str, CLIOption& cliOption, Phase phase, unsigned length)
{
	options.push_back(OptionData{str, &cliOption, phase, length});
}

const CommandLineParser::OptionData* CommandLineParser::findOption(std::string_view name) const
{
	auto it = std::ranges::lower_bound(options, name, {}, &OptionData::name);
	return ((it != options.end()) && (it->name == name)) ? &*it : nullptr;
}

bool CommandLineParser::parseOption(
	const std::string& arg, std::span<std::string>& cmdLine, Phase phase)
{
	if (const auto* o = findOption(arg)) {
		if (o->phase == phase) {
			try {
				o->option->parseOption(arg, cmdLine);
				return true;
			} catch (FlashkitException& e) {
				throw FatalError(std::move(e).getMessage());
			}
		}
	}
	return false; // unknown, or handled in another phase
}

void CommandLineParser::addAction(std::vector<TclObject> words)
{
	actions.push_back(std::move(words));
}

void CommandLineParser::parse(std::span<char*> argv)
{
	parseStatus = Status::RUN;

	std::vector<std::string> cmdLineBuf;
	for (auto* a : argv.subspan(std::min<size_t>(1, argv.size()))) {
		cmdLineBuf.emplace_back(a);
	}
	std::span<std::string> cmdLine(cmdLineBuf);
	std::vector<std::string> backupCmdLine;

	using enum Phase;
	for (Phase phase = BEFORE_SETTINGS;
	     (phase <= LAST) && (parseStatus != Status::EXIT);
	     phase = static_cast<Phase>(std::to_underlying(phase) + 1)) {
		switch (phase) {
		case LOAD_SETTINGS:
			if (!haveSettings) {
				// Load the default settings file in case the user
				// didn't specify one.
				auto& settingsConfig = programmer.getSettingsConfig();
				auto filename = SettingsConfig::getDefaultFilename();
				try {
					settingsConfig.loadSetting(filename);
				} catch (FileException&) {
					// settings.xml not found, use the defaults
				} catch (ConfigException& e) {
					throw FatalError("Error in default settings: ",
					                 e.getMessage());
				}
				haveSettings = true;
			}
			break;
		default:
			// iterate over all arguments
			while (!cmdLine.empty()) {
				std::string arg = std::move(cmdLine.front());
				cmdLine = cmdLine.subspan(1);
				if (!parseOption(arg, cmdLine, phase)) {
					// keep for a later phase, together with its parameters
					backupCmdLine.push_back(arg);
					if (const auto* o = findOption(arg)) {
						for (unsigned i = 0; i < o->length - 1; ++i) {
							if (cmdLine.empty()) break;
							backupCmdLine.push_back(std::move(cmdLine.front()));
							cmdLine = cmdLine.subspan(1);
						}
					}
				}
			}
			std::swap(backupCmdLine, cmdLineBuf);
			backupCmdLine.clear();
			cmdLine = cmdLineBuf;
			break;
		}
	}
	if (!cmdLine.empty() && (parseStatus != Status::EXIT)) {
		throw FatalError(
			"Error parsing command line: ", cmdLine.front(), "\n"
			"Use \"flashkit -h\" to see a list of available options");
	}
}


// Help option

static std::string formatSet(std::span<const std::string_view> inputSet, std::string::size_type columns)
{
	std::string outString;
	std::string::size_type totalLength = 0; // ignore the starting spaces for now
	for (const auto& temp : inputSet) {
		if (totalLength == 0) {
			// first element ?
			strAppend(outString, "    ", temp);
			totalLength = temp.size();
		} else {
			outString += ", ";
			if ((totalLength + temp.size()) > columns) {
				strAppend(outString, "\n    ", temp);
				totalLength = temp.size();
			} else {
				strAppend(outString, temp);
				totalLength += 2 + temp.size();
			}
		}
	}
	if (totalLength < columns) {
		outString.append(columns - totalLength, ' ');
	}
	return outString;
}

void CommandLineParser::HelpOption::parseOption(
	const std::string& /*option*/, std::span<std::string>& /*cmdLine*/)
{
	const auto& fullVersion = Version::full();
	std::cout << fullVersion << '\n'
	          << std::string(fullVersion.size(), '=') << "\n"
	             "\n"
	             "usage: flashkit [options]\n"
	             "  actions are executed in the order they are given\n"
	             "\n"
	             "  this is the list of supported options:\n";

	// items grouped per common help-text
	std::map<std::string_view, std::vector<std::string_view>> itemMap;
	for (const auto& option : parser.options) {
		auto helpText = option.option->optionHelp();
		if (!helpText.empty()) {
			itemMap[helpText].push_back(option.name);
		}
	}
	std::vector<std::string> printSet;
	for (const auto& [helpText, names] : itemMap) {
		printSet.push_back(strCat(formatSet(names, 15), ' ', helpText));
	}
	std::ranges::sort(printSet);
	for (const auto& s : printSet) {
		std::cout << s << '\n';
	}

	parser.parseStatus = CommandLineParser::Status::EXIT;
}

std::string_view CommandLineParser::HelpOption::optionHelp() const
{
	return "Shows this text";
}


// Version option

void CommandLineParser::VersionOption::parseOption(
	const std::string& /*option*/, std::span<std::string>& /*cmdLine*/)
{
	std::cout << Version::full() << '\n';
	parser.parseStatus = CommandLineParser::Status::EXIT;
}

std::string_view CommandLineParser::VersionOption::optionHelp() const
{
	return "Prints version info";
}


// Setting option

void CommandLineParser::SettingOption::parseOption(
	const std::string& option, std::span<std::string>& cmdLine)
{
	if (parser.haveSettings) {
		throw FatalError("Only one setting option allowed");
	}
	auto filename = FileOperations::expandTilde(getArgument(option, cmdLine));
	try {
		parser.programmer.getSettingsConfig().loadSetting(filename);
	} catch (FileException& e) {
		throw FatalError(std::move(e).getMessage());
	} catch (ConfigException& e) {
		throw FatalError("Error in settings file \"", filename, "\": ",
		                 e.getMessage());
	}
	parser.haveSettings = true;
}

std::string_view CommandLineParser::SettingOption::optionHelp() const
{
	return "Load an alternative settings file";
}


// -port, -delay

void CommandLineParser::SettingOverrideOption::parseOption(
	const std::string& option, std::span<std::string>& cmdLine)
{
	auto value = getArgument(option, cmdLine);
	parser.programmer.getSettingsConfig().setValueForSetting(setting, value);
}


// actions

void CommandLineParser::ActionOption::parseOption(
	const std::string& option, std::span<std::string>& cmdLine)
{
	std::vector<TclObject> words;
	words.emplace_back(command);
	for (unsigned i = 0; i < numArgs; ++i) {
		words.emplace_back(getArgument(option, cmdLine));
	}
	parser.addAction(std::move(words));
}


// -size

void CommandLineParser::SizeOption::parseOption(
	const std::string& option, std::span<std::string>& cmdLine)
{
	auto value = getArgument(option, cmdLine);
	if (!StringOp::stringToSize(value)) {
		throw FatalError("Invalid size: ", value);
	}
	if (parser.actions.empty() ||
	    (parser.actions.back().front() != parser.readRomOption.command)) {
		throw FatalError("-size must follow -read-rom");
	}
	parser.actions.back().emplace_back(value);
}

std::string_view CommandLineParser::SizeOption::optionHelp() const
{
	return "Number of bytes to dump with -read-rom, e.g. 2M";
}

} // namespace flashkit
