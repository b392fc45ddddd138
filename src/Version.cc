#include "Version.hh"
#include "strCat.hh"

#ifndef FLASHKIT_VERSION
#define FLASHKIT_VERSION "unknown"
#endif

namespace flashkit {

const char* const Version::VERSION = FLASHKIT_VERSION;

std::string Version::full()
{
	return strCat("flashkit ", VERSION);
}

} // namespace flashkit
