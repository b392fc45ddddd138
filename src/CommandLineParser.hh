#ifndef COMMANDLINEPARSER_HH
#define COMMANDLINEPARSER_HH

#include "CLIOption.hh"
#include "TclObject.hh"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace flashkit {

class Programmer;

class CommandLineParser
{
public:
	enum class Status : uint8_t { UNPARSED, RUN, EXIT };
	enum class Phase : uint8_t {
		BEFORE_SETTINGS,   // --help, --version, -setting
		LOAD_SETTINGS,     // loads settings.xml
		LAST,              // all the rest
	};

	explicit CommandLineParser(Programmer& programmer);
	void registerOption(std::string_view str, CLIOption& cliOption,
		Phase phase = Phase::LAST, unsigned length = 2);
	void parse(std::span<char*> argv);
	[[nodiscard]] Status getParseStatus() const { return parseStatus; }

	/** The actions requested on the command line, in order, each as a
	  * Tcl command split into words.
	  */
	[[nodiscard]] const auto& getActions() const { return actions; }

private:
	struct OptionData {
		std::string_view name;
		CLIOption* option;
		Phase phase;
		unsigned length; // length in parameters
	};

	[[nodiscard]] bool parseOption(const std::string& arg,
	                 std::span<std::string>& cmdLine, Phase phase);
	[[nodiscard]] const OptionData* findOption(std::string_view name) const;
	void addAction(std::vector<TclObject> words);

private:
	std::vector<OptionData> options;
	std::vector<std::vector<TclObject>> actions;

	Programmer& programmer;

	struct HelpOption final : CLIOption {
		explicit HelpOption(CommandLineParser& parser_) : parser(parser_) {}
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		CommandLineParser& parser;
	} helpOption;

	struct VersionOption final : CLIOption {
		explicit VersionOption(CommandLineParser& parser_) : parser(parser_) {}
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		CommandLineParser& parser;
	} versionOption;

	struct SettingOption final : CLIOption {
		explicit SettingOption(CommandLineParser& parser_) : parser(parser_) {}
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		CommandLineParser& parser;
	} settingOption;

	/** -port and -delay: override a setting for this run. */
	struct SettingOverrideOption final : CLIOption {
		SettingOverrideOption(CommandLineParser& parser_, std::string_view setting_,
		                      std::string_view help_)
			: parser(parser_), setting(setting_), help(help_) {}
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override { return help; }
		CommandLineParser& parser;
		std::string_view setting;
		std::string_view help;
	} portOption, delayOption;

	/** Options that run one of the flash_* commands. */
	struct ActionOption final : CLIOption {
		ActionOption(CommandLineParser& parser_, std::string_view command_,
		             unsigned numArgs_, std::string_view help_)
			: parser(parser_), command(command_), numArgs(numArgs_), help(help_) {}
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override { return help; }
		CommandLineParser& parser;
		std::string_view command;
		unsigned numArgs;
		std::string_view help;
	} infoOption, eraseOption, writeRomOption, readRomOption,
	  readRamOption, writeRamOption, scriptOption, commandOption;

	/** -size modifies the preceding -read-rom. */
	struct SizeOption final : CLIOption {
		explicit SizeOption(CommandLineParser& parser_) : parser(parser_) {}
		void parseOption(const std::string& option, std::span<std::string>& cmdLine) override;
		[[nodiscard]] std::string_view optionHelp() const override;
		CommandLineParser& parser;
	} sizeOption;

	Status parseStatus = Status::UNPARSED;
	bool haveSettings = false;
};

} // namespace flashkit

#endif
