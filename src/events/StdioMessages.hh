#ifndef STDIOMESSAGES_HH
#define STDIOMESSAGES_HH

#include "CliComm.hh"

namespace flashkit {

class StdioMessages final : public CliComm
{
public:
	void log(LogLevel level, std::string_view message, float fraction) override;

private:
	int lastPercent = -1;
};

} // namespace flashkit

#endif
