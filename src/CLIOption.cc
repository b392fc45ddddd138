#include "CLIOption.hh"
#include "FlashkitException.hh"
#include <utility>

namespace flashkit {

std::string CLIOption::getArgument(const std::string& option, std::span<std::string>& cmdLine)
{
	if (cmdLine.empty()) {
		throw FatalError("Missing argument for option \"", option, '\"');
	}
	std::string argument = std::move(cmdLine.front());
	cmdLine = cmdLine.subspan(1);
	return argument;
}

} // namespace flashkit
