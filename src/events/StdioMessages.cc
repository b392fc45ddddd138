#include "StdioMessages.hh"

#include <algorithm>
#include <iostream>

namespace flashkit {

void StdioMessages::log(LogLevel level, std::string_view message, float fraction)
{
	if (level == LogLevel::PROGRESS) {
		// only print when the percentage changes, progress is reported
		// every few kilobytes
		int percent = (fraction < 0.0f) ? -1 : int(100.0f * std::min(fraction, 1.0f));
		if (percent == lastPercent && percent != 100) return;
		lastPercent = (percent == 100) ? -1 : percent;
	}

	auto& out = (level == LogLevel::INFO) ? std::cout : std::cerr;
	out << toString(level) << ": " << message;
	if (level == LogLevel::PROGRESS && fraction >= 0.0f) {
		out << "... " << int(100.0f * std::min(fraction, 1.0f)) << '%';
	}
	out << '\n' << std::flush;
}

} // namespace flashkit
