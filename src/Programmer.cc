#include "Programmer.hh"
#include "CliComm.hh"
#include "CommandException.hh"
#include "FlashkitLink.hh"
#include "SerialFlashkitLink.hh"
#include "TclObject.hh"

#include <memory>
#include <utility>

namespace flashkit {

Programmer::Programmer(CliComm& cliComm_, PollClock& clock_, LinkFactory linkFactory_)
	: cliComm(cliComm_)
	, clock(clock_)
	, linkFactory(std::move(linkFactory_))
	, settingsConfig(cliComm)
	, flashCommands(interpreter, *this)
{
	if (!linkFactory) {
		linkFactory = [](const std::string& port) {
			return std::make_unique<SerialFlashkitLink>(port);
		};
	}
}

Programmer::~Programmer() = default;

FlashkitLink& Programmer::getLink()
{
	const auto& port = settingsConfig.getPort();
	if (!link || (port != linkPort)) {
		link = linkFactory(port);
		linkPort = port;
	}
	return *link;
}

int Programmer::run(const std::vector<std::vector<TclObject>>& actions)
{
	for (const auto& words : actions) {
		try {
			auto result = interpreter.executeCommand(words);
			if (auto str = result.getString(); !str.empty()) {
				cliComm.printInfo(str);
			}
		} catch (CommandException& e) {
			cliComm.printError(e.getMessage());
			return 1;
		}
	}
	return 0;
}

} // namespace flashkit
