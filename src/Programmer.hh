#ifndef PROGRAMMER_HH
#define PROGRAMMER_HH

#include "FlashCommands.hh"
#include "Interpreter.hh"
#include "PollClock.hh"
#include "SettingsConfig.hh"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace flashkit {

class CliComm;
class FlashkitLink;
class TclObject;

/** Owns the long-lived objects of the application: settings, the Tcl
  * interpreter with the flash commands and the link to the programmer.
  */
class Programmer
{
public:
	using LinkFactory = std::function<std::unique_ptr<FlashkitLink>(const std::string& port)>;

	/** The default link factory creates a SerialFlashkitLink. */
	Programmer(CliComm& cliComm, PollClock& clock, LinkFactory linkFactory = {});
	~Programmer();

	[[nodiscard]] CliComm& getCliComm() { return cliComm; }
	[[nodiscard]] PollClock& getClock() { return clock; }
	[[nodiscard]] SettingsConfig& getSettingsConfig() { return settingsConfig; }
	[[nodiscard]] Interpreter& getInterpreter() { return interpreter; }

	/** The link for the currently configured port. Created on first use,
	  * re-created when the 'port' setting changed.
	  */
	[[nodiscard]] FlashkitLink& getLink();

	/** Run the startup actions in order. Returns the process exit code. */
	int run(const std::vector<std::vector<TclObject>>& actions);

private:
	CliComm& cliComm;
	PollClock& clock;
	LinkFactory linkFactory;
	SettingsConfig settingsConfig;
	std::unique_ptr<FlashkitLink> link;
	std::string linkPort;

	// must be destroyed before the interpreter
	Interpreter interpreter;
	FlashCommands flashCommands;
};

} // namespace flashkit

#endif
