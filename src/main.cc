/*
 *  flashkit - programmer for MX29GL128 flash cartridges
 *
 */

#include "CommandLineParser.hh"
#include "FlashkitException.hh"
#include "Interpreter.hh"
#include "PollClock.hh"
#include "Programmer.hh"
#include "StdioMessages.hh"

#include <iostream>
#include <span>

namespace flashkit {

static int main(int argc, char **argv)
{
	int exitCode = 0;
	try {
		Interpreter::init(argv[0]);
		StdioMessages messages;
		RealTimeClock clock;
		Programmer programmer(messages, clock);
		CommandLineParser parser(programmer);
		parser.parse(std::span(argv, size_t(argc)));
		if (parser.getParseStatus() != CommandLineParser::Status::EXIT) {
			if (parser.getActions().empty()) {
				std::cerr << "Nothing to do. Use \"flashkit -h\" to see a list of available options\n";
				exitCode = 1;
			} else {
				exitCode = programmer.run(parser.getActions());
			}
		}
	} catch (FatalError& e) {
		std::cerr << "Fatal error: " << e.getMessage() << '\n';
		exitCode = 1;
	} catch (FlashkitException& e) {
		std::cerr << "Uncaught exception: " << e.getMessage() << '\n';
		exitCode = 1;
	}
	return exitCode;
}

} // namespace flashkit

// Enter the flashkit namespace.
int main(int argc, char **argv)
{
	return flashkit::main(argc, argv);
}
