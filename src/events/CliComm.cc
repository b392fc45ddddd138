#include "CliComm.hh"

namespace flashkit {

void CliComm::printInfo(std::string_view message)
{
	log(LogLevel::INFO, message);
}

void CliComm::printWarning(std::string_view message)
{
	log(LogLevel::WARNING, message);
}

void CliComm::printError(std::string_view message)
{
	log(LogLevel::LOGLEVEL_ERROR, message);
}

void CliComm::printProgress(std::string_view message, float fraction)
{
	log(LogLevel::PROGRESS, message, fraction);
}

} // namespace flashkit
